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

#ifndef WEAVER_BRIDGE_H
#define WEAVER_BRIDGE_H

#include <weaver/disabled_copy_move.h>
#include <weaver/network/network_provisioner.h>

#include <QString>

#include <memory>
#include <vector>

namespace weaver
{
class IdAllocator;
class NetworkAdapter;

/**
 * A host bridge that machines' adapters and other bridges can be linked to.
 *
 * | kind          | name       | created on construction | deleted on release |
 * |---------------|------------|-------------------------|--------------------|
 * | managed       | br-wNNN    | yes                     | yes                |
 * | static_named  | br-s-NNN   | yes                     | yes                |
 * | host_existing | given      | no                      | no                 |
 *
 * Links made through a bridge are released with it, whatever its kind.
 */
class Bridge : private DisabledCopyMove
{
public:
    using UPtr = std::unique_ptr<Bridge>;

    enum class Kind
    {
        managed,
        static_named,
        host_existing
    };

    Bridge(Kind kind, const QString& name, NetworkProvisioner& provisioner);
    ~Bridge();

    VethLink link_to(const NetworkAdapter& adapter);
    VethLink link_to(const Bridge& other);

    // Idempotent
    void release();

    Kind kind() const;
    const QString& name() const;
    const std::vector<VethLink>& links() const;

private:
    VethLink link_to(const QString& other_bridge);

    const Kind bridge_kind;
    const QString bridge_name;
    NetworkProvisioner& provisioner;
    std::vector<VethLink> veth_links;
    bool released = false;
};

Bridge::UPtr make_managed_bridge(NetworkProvisioner& provisioner, IdAllocator& ids);
Bridge::UPtr make_static_bridge(NetworkProvisioner& provisioner, IdAllocator& ids);
Bridge::UPtr make_host_bridge(NetworkProvisioner& provisioner, const QString& host_bridge_name);
} // namespace weaver

#endif // WEAVER_BRIDGE_H
