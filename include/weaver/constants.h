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

#ifndef WEAVER_CONSTANTS_H
#define WEAVER_CONSTANTS_H

#include <chrono>

using namespace std::chrono_literals;

namespace weaver
{
constexpr auto default_qemu_system = "qemu-system-x86_64";
constexpr auto qemu_system_env_var = "WEAVER_QEMU_SYSTEM";
constexpr auto workspace_root_env_var = "WEAVER_WORKSPACE_ROOT";
constexpr auto workspace_template = "weaver-XXXXXX";

constexpr auto default_cpu_count = 1;
constexpr auto default_memory_size = "1024M";
constexpr auto default_drive_interface = "ide";
constexpr auto default_drive_media = "disk";
constexpr auto default_nic_model = "e1000";

constexpr auto monitor_prompt = "(qemu)";
constexpr auto default_serial_prompt = "login:";
constexpr auto monitor_socket_name = "monitor.sock";
constexpr auto monitor_log_name = "monitor.sock.log";
constexpr auto pristine_snapshot_tag = "preboot";
constexpr auto identity_file_template = "pidfile_XXXXXX.pid";

// Retry policies: fixed interval, fixed ceiling
constexpr auto poll_interval = 1s;
constexpr auto identity_timeout = 5s;
constexpr auto termination_timeout = 5s;
constexpr auto connect_timeout = 50s;

constexpr auto dialogue_timeout = 10min;
constexpr auto drain_timeout = 1s;
constexpr auto default_settle_delay = 1s;
constexpr auto console_read_window = 10240;

constexpr int qemu_img_timeout = 300000; // unit: ms
constexpr int reap_timeout = 5000;       // unit: ms
} // namespace weaver

#endif // WEAVER_CONSTANTS_H
