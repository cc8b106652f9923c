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

#ifndef WEAVER_NETWORK_PROVISIONER_H
#define WEAVER_NETWORK_PROVISIONER_H

#include <weaver/disabled_copy_move.h>

#include <QString>

#include <memory>

namespace weaver
{
// A veth pair: one end enslaved to each of two bridges
struct VethLink
{
    QString first;
    QString second;
};

inline bool operator==(const VethLink& a, const VethLink& b)
{
    return a.first == b.first && a.second == b.second;
}

class NetworkProvisioner : private DisabledCopyMove
{
public:
    using UPtr = std::unique_ptr<NetworkProvisioner>;

    virtual ~NetworkProvisioner() = default;

    virtual void create_bridge(const QString& name) = 0;
    virtual void delete_bridge(const QString& name) = 0;
    virtual VethLink add_link(const QString& bridge_a, const QString& bridge_b) = 0;
    virtual void release_link(const VethLink& link) = 0;

protected:
    NetworkProvisioner() = default;
};
} // namespace weaver

#endif // WEAVER_NETWORK_PROVISIONER_H
