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

#include "common.h"
#include "mock_utils.h"
#include "temp_dir.h"

#include <weaver/utils.h>

#include <QFile>

#include <string>
#include <thread>

namespace wv = weaver;
namespace wvt = weaver::test;

using namespace testing;
using namespace std::chrono_literals;

namespace
{
void make_file_with_content(const QString& file_name, const std::string& content)
{
    QFile file{file_name};
    ASSERT_TRUE(file.open(QIODevice::WriteOnly));
    file.write(content.data(), static_cast<qint64>(content.size()));
}
} // namespace

TEST(Utils, trimEndActuallyTrimsEnd)
{
    std::string s{"I'm a great\n\t string \n \f \n \r \t   \v"};
    wv::utils::trim_end(s);

    EXPECT_THAT(s, StrEq("I'm a great\n\t string"));
}

TEST(Utils, trimActuallyTrimsBothEnds)
{
    std::string s{" \n 1234\n"};
    wv::utils::trim(s);

    EXPECT_THAT(s, StrEq("1234"));
}

TEST(Utils, trimBeginAcceptsCustomFilter)
{
    std::string s{"0001234"};
    wv::utils::trim_begin(s, [](unsigned char c) { return c == '0'; });

    EXPECT_THAT(s, StrEq("1234"));
}

TEST(Utils, tryActionActuallyTimesOut)
{
    bool on_timeout_called{false};
    auto on_timeout = [&on_timeout_called] { on_timeout_called = true; };
    auto retry_action = [] { return wv::utils::TimeoutAction::retry; };
    wv::utils::try_action_for(on_timeout, std::chrono::milliseconds(1), retry_action);

    EXPECT_TRUE(on_timeout_called);
}

TEST(Utils, tryActionDoesNotTimeout)
{
    bool on_timeout_called{false};
    auto on_timeout = [&on_timeout_called] { on_timeout_called = true; };

    bool action_called{false};
    auto successful_action = [&action_called] {
        action_called = true;
        return wv::utils::TimeoutAction::done;
    };
    wv::utils::try_action_for(on_timeout, std::chrono::seconds(1), successful_action);

    EXPECT_FALSE(on_timeout_called);
    EXPECT_TRUE(action_called);
}

TEST(Utils, tryActionSleepsPollIntervalBetweenAttempts)
{
    auto [mock_utils, guard] = wvt::MockUtils::inject<NiceMock>();
    EXPECT_CALL(*mock_utils, sleep_for(std::chrono::milliseconds{wv::poll_interval})).Times(2);

    auto attempts = 0;
    auto action = [&attempts] {
        return ++attempts < 3 ? wv::utils::TimeoutAction::retry : wv::utils::TimeoutAction::done;
    };
    wv::utils::try_action_for([] { FAIL() << "should not time out"; }, 50s, action);

    EXPECT_EQ(attempts, 3);
}

TEST(Utils, tryActionSleepsNoLongerThanShortTimeout)
{
    auto [mock_utils, guard] = wvt::MockUtils::inject<NiceMock>();
    EXPECT_CALL(*mock_utils, sleep_for(std::chrono::milliseconds{20ms}))
        .Times(AtLeast(1))
        .WillRepeatedly(Invoke([](const std::chrono::milliseconds& ms) { std::this_thread::sleep_for(ms); }));

    bool timed_out{false};
    wv::utils::try_action_for([&timed_out] { timed_out = true; }, 20ms,
                              [] { return wv::utils::TimeoutAction::retry; });

    EXPECT_TRUE(timed_out);
}

TEST(Utils, contentsOfActuallyReadsContents)
{
    wvt::TempDir temp_dir;
    auto file_name = temp_dir.path() + "/test-file";
    std::string expected_content{"just a bit of test content here"};
    make_file_with_content(file_name, expected_content);

    auto content = WV_UTILS.contents_of(file_name);
    EXPECT_THAT(content, StrEq(expected_content));
}

TEST(Utils, contentsOfThrowsOnMissingFile)
{
    EXPECT_THROW(WV_UTILS.contents_of("this-file-does-not-exist"), std::runtime_error);
}

TEST(Utils, contentsOfEmptyContentsOnEmptyFile)
{
    wvt::TempDir temp_dir;
    auto file_name = temp_dir.path() + "/empty_test_file";
    make_file_with_content(file_name, "");

    auto content = WV_UTILS.contents_of(file_name);
    EXPECT_TRUE(content.empty());
}

TEST(Utils, runCmdForStatusReportsExitCode)
{
    EXPECT_TRUE(WV_UTILS.run_cmd_for_status("true", {}));
    EXPECT_FALSE(WV_UTILS.run_cmd_for_status("false", {}));
}

TEST(Utils, runCmdForStatusFailsOnMissingProgram)
{
    EXPECT_FALSE(WV_UTILS.run_cmd_for_status("this-program-does-not-exist", {}));
}
