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

#include <weaver/process/basic_process.h>
#include <weaver/process/process_factory.h>
#include <weaver/process/simple_process_spec.h>

#include <optional>

namespace wv = weaver;

using namespace testing;

namespace
{
constexpr auto timeout = 30000;
}

TEST(BasicProcess, executeMissingCommandFailsToStart)
{
    wv::BasicProcess process{wv::simple_process_spec("a_missing_command")};
    const auto outcome = process.execute(timeout);

    EXPECT_FALSE(outcome.succeeded());
    EXPECT_FALSE(outcome.exit_code);

    ASSERT_TRUE(outcome.error);
    EXPECT_EQ(outcome.error->kind, QProcess::FailedToStart);
    EXPECT_THAT(outcome.failure_message().toStdString(), HasSubstr("a_missing_command"));
}

TEST(BasicProcess, executeReportsZeroExitCodeAsSuccess)
{
    wv::BasicProcess process{wv::simple_process_spec("true")};
    const auto outcome = process.execute(timeout);

    EXPECT_TRUE(outcome.succeeded());
    EXPECT_EQ(outcome.exit_code, 0);
    EXPECT_EQ(outcome.failure_message(), QString{});
    EXPECT_FALSE(outcome.error);
}

TEST(BasicProcess, executeReportsNonZeroExitCode)
{
    wv::BasicProcess process{wv::simple_process_spec("sh", {"-c", "exit 7"})};
    const auto outcome = process.execute(timeout);

    EXPECT_FALSE(outcome.succeeded());
    EXPECT_EQ(outcome.exit_code, 7);
    EXPECT_EQ(outcome.failure_message(), "exited with code 7");
    EXPECT_FALSE(outcome.error);
}

TEST(BasicProcess, executeTimesOut)
{
    wv::BasicProcess process{wv::simple_process_spec("sleep", {"5"})};
    const auto outcome = process.execute(100);

    EXPECT_FALSE(outcome.exit_code);
    ASSERT_TRUE(outcome.error);
    EXPECT_EQ(outcome.error->kind, QProcess::Timedout);
    EXPECT_TRUE(process.running());

    process.kill();
    EXPECT_TRUE(process.wait_for_finished(timeout));
}

TEST(BasicProcess, keepsPidAfterExit)
{
    wv::BasicProcess process{wv::simple_process_spec("sleep", {"5"})};
    EXPECT_EQ(process.process_id(), 0);

    process.start();
    ASSERT_TRUE(process.wait_for_started(timeout));
    const auto pid = process.process_id();
    EXPECT_GT(pid, 0);
    EXPECT_TRUE(process.running());

    process.kill();
    EXPECT_TRUE(process.wait_for_finished(timeout));
    EXPECT_FALSE(process.running());
    EXPECT_EQ(process.process_id(), pid);
}

TEST(BasicProcess, finishedSignalCarriesOutcome)
{
    wv::BasicProcess process{wv::simple_process_spec("sh", {"-c", "exit 3"})};

    std::optional<wv::ProcessOutcome> reported;
    QObject::connect(&process, &wv::Process::finished,
                     [&reported](const wv::ProcessOutcome& outcome) { reported = outcome; });

    process.start();
    ASSERT_TRUE(process.wait_for_finished(timeout));

    ASSERT_TRUE(reported);
    EXPECT_EQ(reported->exit_code, 3);
}

TEST(BasicProcess, standardErrorIsKeptUntilRead)
{
    wv::BasicProcess process{wv::simple_process_spec("sh", {"-c", "echo oops >&2; exit 1"})};
    const auto outcome = process.execute(timeout);

    EXPECT_EQ(outcome.exit_code, 1);
    EXPECT_EQ(process.read_all_standard_error(), "oops\n");
    EXPECT_EQ(process.read_all_standard_error(), "");
}

TEST(BasicProcess, factoryCreatesProcessWithGivenArguments)
{
    auto process = WV_PROCFACTORY.create_process("echo", {"one", "two"});

    EXPECT_EQ(process->program(), "echo");
    EXPECT_EQ(process->arguments(), QStringList({"one", "two"}));

    EXPECT_TRUE(process->execute(timeout).succeeded());
    EXPECT_EQ(process->read_all_standard_output(), "one two\n");
}
