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

#ifndef WEAVER_PROCESS_SUPERVISOR_H
#define WEAVER_PROCESS_SUPERVISOR_H

#include <weaver/constants.h>
#include <weaver/control/control_endpoint.h>
#include <weaver/disabled_copy_move.h>
#include <weaver/path.h>
#include <weaver/process/process.h>

#include <chrono>
#include <optional>
#include <string>

namespace weaver
{
struct SessionConfig;

class ProcessSupervisor : private DisabledCopyMove
{
public:
    ProcessSupervisor(const std::string& session_name, const Path& workspace);
    ~ProcessSupervisor();

    // Starts the hypervisor and returns right away, without waiting for it to get anywhere
    void launch(const SessionConfig& config, const EndpointLayout& layout);

    /**
     * Wait for the hypervisor to write its pid to @p identity_file.
     *
     * @throws NotReadyException if no pid showed up within @p timeout
     */
    qint64 discover_identity(const Path& identity_file, std::chrono::milliseconds timeout = identity_timeout);

    /**
     * Interrupt the hypervisor, repeating the signal every second until it is gone.
     *
     * @throws TerminationFailedException if it survived @p timeout
     */
    void terminate(std::chrono::milliseconds timeout = termination_timeout);

    // Removes the workspace and everything in it. Idempotent.
    void cleanup();

    bool launched() const;
    std::optional<qint64> identity() const;
    const Path& workspace() const;

private:
    qint64 tracked_pid() const;
    void reap();

    const std::string session_name;
    const Path workspace_path;
    Process::UPtr process;
    std::optional<qint64> pid;
};
} // namespace weaver

#endif // WEAVER_PROCESS_SUPERVISOR_H
