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

#include "qemu_session_process_spec.h"

#include <weaver/exceptions/not_ready_exception.h>
#include <weaver/exceptions/termination_failed_exception.h>
#include <weaver/format.h>
#include <weaver/logging/log.h>
#include <weaver/platform.h>
#include <weaver/process/process_factory.h>
#include <weaver/process_supervisor.h>
#include <weaver/session_config.h>
#include <weaver/top_catch_all.h>
#include <weaver/utils.h>

#include <QDir>

#include <csignal>
#include <stdexcept>

namespace wv = weaver;
namespace wvl = weaver::logging;
namespace wvu = weaver::utils;

wv::ProcessSupervisor::ProcessSupervisor(const std::string& session_name, const wv::Path& workspace)
    : session_name{session_name}, workspace_path{workspace}
{
}

wv::ProcessSupervisor::~ProcessSupervisor()
{
    top_catch_all(session_name, [this] {
        if (process && process->running())
        {
            wvl::warn(session_name, "Hypervisor still running on destruction, killing it");
            process->kill();
            process->wait_for_finished(reap_timeout);
        }
    });
}

void wv::ProcessSupervisor::launch(const SessionConfig& config, const EndpointLayout& layout)
{
    if (process && process->running())
        throw std::logic_error{fmt::format("[{}] hypervisor already launched", session_name)};

    pid.reset();
    process = WV_PROCFACTORY.create_process(std::make_unique<QemuSessionProcessSpec>(config, layout));

    QObject::connect(process.get(), &Process::error_occurred,
                     [this](QProcess::ProcessError, const QString& error_string) {
                         wvl::error(session_name, "Hypervisor error: {}", error_string);
                     });
    QObject::connect(process.get(), &Process::finished, [this](const ProcessOutcome& outcome) {
        if (outcome.succeeded())
            wvl::info(session_name, "Hypervisor exited");
        else
            wvl::info(session_name, "Hypervisor stopped: {}", outcome.failure_message());
    });

    wvl::info(session_name, "Launching: {} {}", process->program(), process->arguments());
    process->start();
}

qint64 wv::ProcessSupervisor::discover_identity(const wv::Path& identity_file, std::chrono::milliseconds timeout)
{
    std::optional<qint64> discovered;

    auto try_read = [&identity_file, &discovered] {
        std::string contents;
        try
        {
            contents = WV_UTILS.contents_of(identity_file);
        }
        catch (const std::runtime_error&)
        {
            return wvu::TimeoutAction::retry; // not created yet
        }

        auto ok = false;
        const auto value = QString::fromStdString(wvu::trim(contents)).toLongLong(&ok);
        if (!ok || value <= 0)
            return wvu::TimeoutAction::retry;

        discovered = value;
        return wvu::TimeoutAction::done;
    };

    // The pid may have been written after the last attempt
    auto on_timeout = [this, &identity_file, timeout, &try_read] {
        if (try_read() == wvu::TimeoutAction::done)
            return;

        wvl::error(session_name, "No pid in {} after {}ms", identity_file, timeout.count());
        throw NotReadyException{identity_file, timeout};
    };

    wvu::try_action_for(on_timeout, timeout, try_read);

    pid = discovered;
    wvl::debug(session_name, "Hypervisor pid: {}", *pid);

    return *pid;
}

void wv::ProcessSupervisor::terminate(std::chrono::milliseconds timeout)
{
    const auto target = tracked_pid();

    if (target <= 0 || !WV_PLATFORM.process_exists(target))
    {
        wvl::debug(session_name, "Hypervisor already gone");
        reap();
        return;
    }

    auto on_timeout = [this, target, timeout] {
        if (!WV_PLATFORM.process_exists(target))
            return;

        wvl::error(session_name, "Hypervisor {} did not exit within {}ms", target, timeout.count());
        throw TerminationFailedException{session_name, target, timeout};
    };

    auto try_interrupt = [this, target] {
        if (!WV_PLATFORM.process_exists(target))
            return wvu::TimeoutAction::done;

        wvl::debug(session_name, "Interrupting hypervisor {}", target);
        if (!WV_PLATFORM.send_signal(target, SIGINT))
            wvl::debug(session_name, "Could not interrupt {}, checking again", target);

        return wvu::TimeoutAction::retry;
    };

    wvu::try_action_for(on_timeout, timeout, try_interrupt);

    wvl::info(session_name, "Hypervisor {} terminated", target);
    reap();
}

void wv::ProcessSupervisor::cleanup()
{
    QDir dir{workspace_path};
    if (!dir.exists())
        return;

    if (!dir.removeRecursively())
        wvl::warn(session_name, "Could not remove all of {}", workspace_path);
    else
        wvl::debug(session_name, "Removed {}", workspace_path);
}

bool wv::ProcessSupervisor::launched() const
{
    return process != nullptr;
}

std::optional<qint64> wv::ProcessSupervisor::identity() const
{
    return pid;
}

const wv::Path& wv::ProcessSupervisor::workspace() const
{
    return workspace_path;
}

qint64 wv::ProcessSupervisor::tracked_pid() const
{
    if (pid)
        return *pid;

    return process ? process->process_id() : 0;
}

void wv::ProcessSupervisor::reap()
{
    if (process)
    {
        if (!process->wait_for_finished(reap_timeout) && process->running())
            wvl::warn(session_name, "Hypervisor process handle still running after termination");

        process.reset();
    }
    pid.reset();
}
