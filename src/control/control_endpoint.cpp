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

#include <weaver/constants.h>
#include <weaver/control/control_endpoint.h>

#include <QDir>

namespace wv = weaver;

wv::EndpointLayout wv::make_endpoint_layout(const wv::Path& workspace, int extra_serials,
                                            const wv::Path& identity_file)
{
    const QDir dir{workspace};

    EndpointLayout layout{{dir.filePath(monitor_socket_name), dir.filePath(monitor_log_name)}, {}, identity_file};
    for (auto i = 0; i <= extra_serials; ++i)
        layout.serials.push_back({dir.filePath(QStringLiteral("serial_%1.sock").arg(i)),
                                  dir.filePath(QStringLiteral("serial_%1.log").arg(i))});

    return layout;
}
