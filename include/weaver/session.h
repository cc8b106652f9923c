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

#ifndef WEAVER_SESSION_H
#define WEAVER_SESSION_H

#include <weaver/constants.h>
#include <weaver/control/control_channel.h>
#include <weaver/control/control_endpoint.h>
#include <weaver/disabled_copy_move.h>
#include <weaver/network/bridge.h>
#include <weaver/path.h>
#include <weaver/process_supervisor.h>
#include <weaver/session_config.h>
#include <weaver/snapshot_coordinator.h>

#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace weaver
{
class NetworkProvisioner;

/**
 * One hypervisor run with the disks, adapters and consoles of a SessionConfig.
 *
 * The workspace is allocated on construction and removed on destruction. In between, the session can be
 * started and stopped any number of times, with fresh consoles on every start.
 */
class Session : private DisabledCopyMove
{
public:
    struct Timeouts
    {
        std::chrono::milliseconds connect = connect_timeout;
        std::chrono::milliseconds identity = identity_timeout;
        std::chrono::milliseconds termination = termination_timeout;
        std::chrono::milliseconds dialogue = dialogue_timeout;
    };

    // Keeps a session running for its own lifetime
    class Running : private DisabledCopyMove
    {
    public:
        explicit Running(Session& session);
        ~Running();

        Session& operator*() const;
        Session* operator->() const;

    private:
        Session& session;
    };

    Session(SessionConfig config, NetworkProvisioner& provisioner);
    Session(SessionConfig config, NetworkProvisioner& provisioner, const Timeouts& timeouts);
    ~Session();

    // Everything acquired so far is released again if any step fails
    void start();

    // Terminates the hypervisor and releases everything start() acquired. Idempotent.
    void stop();

    bool running() const;

    void take_snapshot(const QString& name);
    void delete_snapshot(const QString& name);
    [[nodiscard]] SnapshotResult goto_snapshot(const QString& name);
    std::vector<QString> snapshots();
    bool has_snapshot(const QString& name);

    ControlChannel& monitor();
    ControlChannel& serial(std::size_t index = 0);
    std::size_t serial_count() const;

    const std::string& name() const;
    const Path& workspace() const;
    std::optional<qint64> identity() const;
    const SessionConfig& config() const;

private:
    void prepare_disks();
    void create_bridges();
    Path create_identity_file();
    void attach_consoles(const EndpointLayout& layout);
    void teardown();
    void ensure_running(const char* action) const;

    SessionConfig session_config;
    NetworkProvisioner& provisioner;
    const Timeouts timeouts;
    const Path workspace_path;
    const std::string session_name;
    ProcessSupervisor supervisor;
    std::vector<std::size_t> layered_disks; // disks with an ephemeral layer pushed by this run
    std::vector<Bridge::UPtr> adapter_bridges;
    std::optional<Path> identity_file;
    ControlChannel::UPtr monitor_channel;
    std::vector<ControlChannel::UPtr> serial_channels;
    std::unique_ptr<SnapshotCoordinator> coordinator;
    bool is_running = false;
};
} // namespace weaver

#endif // WEAVER_SESSION_H
