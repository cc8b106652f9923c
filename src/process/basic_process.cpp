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

#include <weaver/format.h>
#include <weaver/logging/log.h>
#include <weaver/process/basic_process.h>

#include <utility>

#include <unistd.h>

namespace wv = weaver;
namespace wvl = weaver::logging;

wv::BasicProcess::BasicProcess(std::unique_ptr<ProcessSpec> spec) : spec{std::move(spec)}
{
    child.setProgram(this->spec->program());
    child.setArguments(this->spec->arguments());
    child.setChildProcessModifier([this] { setup_child_process(); });

    QObject::connect(&child, &QProcess::started, this, [this] {
        pid = child.processId();
        wvl::debug(program().toStdString(), "started as {}: {}", pid, arguments());
    });
    QObject::connect(&child, &QProcess::finished, this, [this](int exit_code, QProcess::ExitStatus exit_status) {
        collect_standard_error();
        emit finished(outcome_of(exit_code, exit_status));
    });
    QObject::connect(&child, &QProcess::errorOccurred, this,
                     [this](QProcess::ProcessError error) { emit error_occurred(error, current_error().message); });
    QObject::connect(&child, &QProcess::readyReadStandardError, this, [this] { collect_standard_error(); });
}

wv::BasicProcess::~BasicProcess()
{
    if (child.state() != QProcess::NotRunning)
    {
        child.kill();
        child.waitForFinished();
    }
}

QString wv::BasicProcess::program() const
{
    return child.program();
}

QStringList wv::BasicProcess::arguments() const
{
    return child.arguments();
}

qint64 wv::BasicProcess::process_id() const
{
    return pid;
}

void wv::BasicProcess::start()
{
    child.start();
}

void wv::BasicProcess::kill()
{
    child.kill();
}

bool wv::BasicProcess::running() const
{
    return child.state() == QProcess::Running;
}

bool wv::BasicProcess::wait_for_started(int msecs)
{
    return child.waitForStarted(msecs);
}

bool wv::BasicProcess::wait_for_finished(int msecs)
{
    return child.waitForFinished(msecs);
}

wv::ProcessOutcome wv::BasicProcess::execute(int msecs)
{
    start();

    if (child.waitForStarted(msecs) && child.waitForFinished(msecs))
        return outcome_of(child.exitCode(), child.exitStatus());

    ProcessOutcome outcome;
    outcome.error = current_error();
    wvl::error(program().toStdString(), "{}", outcome.error->message);

    return outcome;
}

QByteArray wv::BasicProcess::read_all_standard_output()
{
    return child.readAllStandardOutput();
}

QByteArray wv::BasicProcess::read_all_standard_error()
{
    collect_standard_error();
    return std::exchange(standard_error, {});
}

void wv::BasicProcess::setup_child_process()
{
    // between fork and exec: no allocations, no exceptions
    if (spec->start_new_session())
        ::setsid();
}

wv::ProcessOutcome wv::BasicProcess::outcome_of(int exit_code, QProcess::ExitStatus exit_status) const
{
    ProcessOutcome outcome;
    if (exit_status == QProcess::NormalExit)
        outcome.exit_code = exit_code;
    else
        outcome.error = current_error();

    return outcome;
}

wv::ProcessOutcome::Error wv::BasicProcess::current_error() const
{
    return {child.error(), QStringLiteral("%1: %2").arg(program(), child.errorString())};
}

void wv::BasicProcess::collect_standard_error()
{
    const auto data = child.readAllStandardError();
    if (data.isEmpty())
        return;

    wvl::log(spec->error_log_level(), qUtf8Printable(program()), qUtf8Printable(data));
    standard_error.append(data);
}
