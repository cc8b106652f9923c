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

#ifndef WEAVER_MOCK_LOGGER_H
#define WEAVER_MOCK_LOGGER_H

#include "common.h"

#include <weaver/logging/log.h>
#include <weaver/logging/logger.h>
#include <weaver/private_pass_provider.h>

namespace weaver
{
namespace test
{
class MockLogger : public weaver::logging::Logger, public PrivatePassProvider<MockLogger>
{
public:
    MockLogger(const PrivatePass&, const weaver::logging::Level logging_level);

    MOCK_METHOD(void, log,
                (weaver::logging::Level level, weaver::logging::CString category,
                 weaver::logging::CString message),
                (const, override));

    class Scope
    {
    public:
        ~Scope();
        std::shared_ptr<testing::NiceMock<MockLogger>> mock_logger;

    private:
        Scope(const weaver::logging::Level logging_level);
        friend class MockLogger;
    };

    // only one at a time, please
    [[nodiscard]] static Scope inject(const weaver::logging::Level logging_level = weaver::logging::Level::error);

    template <typename Matcher>
    static auto make_cstring_matcher(const Matcher& matcher);

    void expect_log(weaver::logging::Level lvl, const std::string& substr,
                    const testing::Cardinality& times = testing::Exactly(1));

    // Reject logs with severity `lvl` or higher (lower integer), accept the rest
    void screen_logs(weaver::logging::Level lvl = weaver::logging::Level::trace);
};
} // namespace test
} // namespace weaver

template <typename Matcher>
auto weaver::test::MockLogger::make_cstring_matcher(const Matcher& matcher)
{
    return testing::Property(&weaver::logging::CString::c_str, matcher);
}

#endif // WEAVER_MOCK_LOGGER_H
