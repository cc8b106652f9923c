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

#ifndef WEAVER_SESSION_CONFIG_H
#define WEAVER_SESSION_CONFIG_H

#include <weaver/constants.h>
#include <weaver/disk_descriptor.h>
#include <weaver/memory_size.h>
#include <weaver/network/network_adapter.h>
#include <weaver/path.h>

#include <QString>
#include <QStringList>

#include <chrono>
#include <optional>
#include <vector>

namespace weaver
{
struct SessionConfig
{
    int num_cores = default_cpu_count;
    MemorySize mem_size{default_memory_size};
    std::vector<DiskDescriptor> disks;
    std::vector<NetworkAdapter> adapters;
    std::optional<Path> kernel;
    std::optional<QString> kernel_append; // only meaningful with a kernel
    std::optional<QString> boot_order;
    int extra_serials = 0;
    QString serial_prompt{default_serial_prompt}; // what await_prompt waits for on serial consoles
    bool ephemeral = true; // push a fresh layer on every disk for each run, drop it at stop
    bool enable_kvm = true;
    bool preserve_pristine_backing = true;
    QStringList extra_arguments; // appended verbatim to the launch command
    std::chrono::milliseconds settle_delay = default_settle_delay;
};

// Throws InvalidSessionConfigException on values the hypervisor could not make sense of
void validate(const SessionConfig& config);
} // namespace weaver

#endif // WEAVER_SESSION_CONFIG_H
