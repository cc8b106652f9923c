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

#include <weaver/control/local_socket_control_channel.h>
#include <weaver/exceptions/internal_timeout_exception.h>
#include <weaver/exceptions/io_failure_exception.h>
#include <weaver/exceptions/termination_failed_exception.h>
#include <weaver/format.h>
#include <weaver/logging/log.h>
#include <weaver/network/network_provisioner.h>
#include <weaver/platform.h>
#include <weaver/session.h>
#include <weaver/top_catch_all.h>

#include <scope_guard.hpp>

#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QTemporaryDir>
#include <QTemporaryFile>

#include <algorithm>
#include <exception>
#include <stdexcept>

namespace wv = weaver;
namespace wvl = weaver::logging;

namespace
{
wv::Path create_workspace()
{
    const auto root = WV_PLATFORM.workspace_root();
    if (!QDir{}.mkpath(root))
        throw wv::IOFailureException{"Cannot create workspace root {}", root};

    QTemporaryDir dir{QDir{root}.filePath(wv::workspace_template)};
    if (!dir.isValid())
        throw wv::IOFailureException{"Cannot create a session workspace in {}: {}", root, dir.errorString()};

    dir.setAutoRemove(false);
    return dir.path();
}
} // namespace

wv::Session::Running::Running(Session& session) : session{session}
{
    session.start();
}

wv::Session::Running::~Running()
{
    top_catch_all(session.name(), [this] { session.stop(); });
}

wv::Session& wv::Session::Running::operator*() const
{
    return session;
}

wv::Session* wv::Session::Running::operator->() const
{
    return &session;
}

wv::Session::Session(SessionConfig config, NetworkProvisioner& provisioner)
    : Session{std::move(config), provisioner, Timeouts{}}
{
}

wv::Session::Session(SessionConfig config, NetworkProvisioner& provisioner, const Timeouts& timeouts)
    : session_config{std::move(config)},
      provisioner{provisioner},
      timeouts{timeouts},
      workspace_path{create_workspace()},
      session_name{QFileInfo{workspace_path}.fileName().toStdString()},
      supervisor{session_name, workspace_path}
{
    wvl::debug(session_name, "Workspace: {}", workspace_path);
}

wv::Session::~Session()
{
    top_catch_all(session_name, [this] {
        if (is_running || supervisor.launched())
            stop();
    });
    top_catch_all(session_name, [this] { supervisor.cleanup(); });
}

void wv::Session::start()
{
    if (is_running)
        throw std::logic_error{fmt::format("[{}] session already running", session_name)};

    validate(session_config);
    wvl::info(session_name, "Starting session");

    auto rollback = sg::make_scope_guard([this]() noexcept {
        wvl::warn(session_name, "Session failed to start, releasing what was acquired");
        top_catch_all(session_name, [this] { teardown(); });
    });

    prepare_disks();
    create_bridges();

    identity_file = create_identity_file();
    const auto layout = make_endpoint_layout(workspace_path, session_config.extra_serials, *identity_file);

    supervisor.launch(session_config, layout);
    attach_consoles(layout);
    supervisor.discover_identity(*identity_file, timeouts.identity);

    coordinator =
        std::make_unique<SnapshotCoordinator>(*monitor_channel, session_config.settle_delay, timeouts.dialogue);
    is_running = true;
    rollback.dismiss();

    wvl::info(session_name, "Session running, hypervisor pid {}", *supervisor.identity());
}

void wv::Session::stop()
{
    if (!is_running && !supervisor.launched() && !monitor_channel && layered_disks.empty() &&
        adapter_bridges.empty())
        return;

    wvl::info(session_name, "Stopping session");
    teardown();
}

bool wv::Session::running() const
{
    return is_running;
}

void wv::Session::take_snapshot(const QString& name)
{
    ensure_running("take a snapshot");
    coordinator->take_snapshot(name);
}

void wv::Session::delete_snapshot(const QString& name)
{
    ensure_running("delete a snapshot");
    coordinator->delete_snapshot(name);
}

wv::SnapshotResult wv::Session::goto_snapshot(const QString& name)
{
    ensure_running("go to a snapshot");
    return coordinator->goto_snapshot(name);
}

std::vector<QString> wv::Session::snapshots()
{
    ensure_running("list snapshots");
    return coordinator->list_snapshots();
}

bool wv::Session::has_snapshot(const QString& name)
{
    const auto names = snapshots();
    return std::find(names.cbegin(), names.cend(), name) != names.cend();
}

wv::ControlChannel& wv::Session::monitor()
{
    ensure_running("use the monitor");
    return *monitor_channel;
}

wv::ControlChannel& wv::Session::serial(std::size_t index)
{
    ensure_running("use a serial console");
    if (index >= serial_channels.size())
        throw std::out_of_range{fmt::format("[{}] no serial console {}, there are {}", session_name, index,
                                            serial_channels.size())};

    return *serial_channels[index];
}

std::size_t wv::Session::serial_count() const
{
    return serial_channels.size();
}

const std::string& wv::Session::name() const
{
    return session_name;
}

const wv::Path& wv::Session::workspace() const
{
    return workspace_path;
}

std::optional<qint64> wv::Session::identity() const
{
    return supervisor.identity();
}

const wv::SessionConfig& wv::Session::config() const
{
    return session_config;
}

void wv::Session::prepare_disks()
{
    for (std::size_t i = 0; i < session_config.disks.size(); ++i)
    {
        auto& disk = session_config.disks[i];

        if (session_config.preserve_pristine_backing && disk.depth() == 1)
            disk.restore_or_create_backing_snapshot(pristine_snapshot_tag);

        if (session_config.ephemeral)
        {
            disk.push_layer(workspace_path);
            layered_disks.push_back(i);
        }
    }
}

void wv::Session::create_bridges()
{
    for (const auto& adapter : session_config.adapters)
        adapter_bridges.push_back(
            std::make_unique<Bridge>(Bridge::Kind::managed, adapter.bridge_name(), provisioner));
}

wv::Path wv::Session::create_identity_file()
{
    QTemporaryFile file{QDir{workspace_path}.filePath(identity_file_template)};
    file.setAutoRemove(false);
    if (!file.open())
        throw IOFailureException{"Cannot create a pid file in {}: {}", workspace_path, file.errorString()};

    return file.fileName();
}

void wv::Session::attach_consoles(const EndpointLayout& layout)
{
    auto monitor = std::make_unique<LocalSocketControlChannel>(layout.monitor.socket_path, monitor_prompt,
                                                               layout.monitor.log_path);
    monitor->connect(timeouts.connect);
    monitor_channel = std::move(monitor);

    if (!monitor_channel->await_prompt(timeouts.dialogue))
        throw InternalTimeoutException{fmt::format("get a prompt from {}", layout.monitor.socket_path),
                                       timeouts.dialogue};

    for (const auto& endpoint : layout.serials)
    {
        auto serial = std::make_unique<LocalSocketControlChannel>(endpoint.socket_path, session_config.serial_prompt,
                                                                  endpoint.log_path);
        serial->connect(timeouts.connect);
        serial_channels.push_back(std::move(serial));
    }
}

// terminate, close consoles, release network, drop ephemeral layers
void wv::Session::teardown()
{
    is_running = false;
    coordinator.reset();

    std::exception_ptr termination_failure;
    try
    {
        supervisor.terminate(timeouts.termination);
    }
    catch (const TerminationFailedException&)
    {
        termination_failure = std::current_exception();
    }

    for (auto& serial : serial_channels)
        serial->close();
    serial_channels.clear();

    if (monitor_channel)
    {
        monitor_channel->close();
        monitor_channel.reset();
    }

    for (auto& bridge : adapter_bridges)
        bridge->release();
    adapter_bridges.clear();

    for (auto it = layered_disks.rbegin(); it != layered_disks.rend(); ++it)
    {
        if (auto layer = session_config.disks[*it].pop_layer(); layer && !QFile::remove(*layer))
            wvl::warn(session_name, "Could not remove layer {}", *layer);
    }
    layered_disks.clear();

    if (identity_file)
    {
        if (QFile::exists(*identity_file) && !QFile::remove(*identity_file))
            wvl::debug(session_name, "Could not remove {}", *identity_file);
        identity_file.reset();
    }

    if (termination_failure)
        std::rethrow_exception(termination_failure);

    wvl::info(session_name, "Session stopped");
}

void wv::Session::ensure_running(const char* action) const
{
    if (!is_running)
        throw std::logic_error{fmt::format("[{}] cannot {}: session is not running", session_name, action)};
}
