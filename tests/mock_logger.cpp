/*
 * Copyright (C) Canonical, Ltd.
 *
 * This program is free software; you can redistribute it and/or modify
 * it under the terms of the GNU General Public License as published by
 * the Free Software Foundation; version 3.
 *
 * This program is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 * GNU General Public License for more details.
 *
 * You should have received a copy of the GNU General Public License
 * along with this program.  If not, see <http://www.gnu.org/licenses/>.
 *
 */

#include "mock_logger.h"

#include <type_traits>

namespace wvl = weaver::logging;
namespace wvt = weaver::test;
using namespace testing;

static_assert(!std::is_copy_assignable_v<wvt::MockLogger>);
static_assert(!std::is_copy_constructible_v<wvt::MockLogger>);

wvt::MockLogger::MockLogger(const PrivatePass&, const wvl::Level logging_level) : Logger{logging_level}
{
}

auto wvt::MockLogger::inject(const wvl::Level logging_level) -> Scope
{
    return Scope{logging_level};
}

wvt::MockLogger::Scope::Scope(const wvl::Level logging_level)
    : mock_logger{std::make_shared<testing::NiceMock<MockLogger>>(pass, logging_level)}
{
    wvl::set_logger(mock_logger);
}

wvt::MockLogger::Scope::~Scope()
{
    if (wvl::get_logger() == mock_logger.get() && mock_logger.use_count() == 2)
        wvl::set_logger(nullptr); // only reset if we are the last scope with the registered logger
}

void wvt::MockLogger::expect_log(wvl::Level lvl, const std::string& substr, const Cardinality& times)
{
    EXPECT_CALL(*this, log(lvl, _, make_cstring_matcher(HasSubstr(substr)))).Times(times);
}

void wvt::MockLogger::screen_logs(wvl::Level lvl)
{
    for (auto i = 0; i <= wvl::enum_type(wvl::Level::trace); ++i)
    {
        auto times = i <= wvl::enum_type(lvl) ? Exactly(0) : AnyNumber();
        EXPECT_CALL(*this, log(wvl::level_from(i), _, _)).Times(times);
    }
}
