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

#ifndef WEAVER_CONTROL_ENDPOINT_H
#define WEAVER_CONTROL_ENDPOINT_H

#include <weaver/path.h>

#include <vector>

namespace weaver
{
struct ControlEndpoint
{
    Path socket_path;
    Path log_path; // transcript of everything sent and received
};

// Where the hypervisor of one session listens, within the session's workspace
struct EndpointLayout
{
    ControlEndpoint monitor;
    std::vector<ControlEndpoint> serials; // the first one is the primary console
    Path identity_file;
};

EndpointLayout make_endpoint_layout(const Path& workspace, int extra_serials, const Path& identity_file);
} // namespace weaver

#endif // WEAVER_CONTROL_ENDPOINT_H
