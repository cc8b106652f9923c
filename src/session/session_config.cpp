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

#include <weaver/exceptions/invalid_session_config_exception.h>
#include <weaver/format.h>
#include <weaver/session_config.h>

namespace wv = weaver;

void wv::validate(const SessionConfig& config)
{
    if (config.num_cores < 1)
        throw InvalidSessionConfigException{"Invalid number of CPUs: {}", config.num_cores};

    if (config.mem_size.in_megabytes() < 1)
        throw InvalidSessionConfigException{"Memory size must be at least 1M, got {} bytes",
                                            config.mem_size.in_bytes()};

    if (config.extra_serials < 0)
        throw InvalidSessionConfigException{"Invalid number of extra serial consoles: {}", config.extra_serials};

    if (config.kernel_append && !config.kernel)
        throw InvalidSessionConfigException{"Kernel arguments given without a kernel"};

    if (config.settle_delay < std::chrono::milliseconds::zero())
        throw InvalidSessionConfigException{"Invalid settle delay: {}ms", config.settle_delay.count()};

    for (const auto& disk : config.disks)
        if (disk.backing_file().isEmpty())
            throw InvalidSessionConfigException{"Disk without an image path"};
}
