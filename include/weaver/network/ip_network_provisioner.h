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

#ifndef WEAVER_IP_NETWORK_PROVISIONER_H
#define WEAVER_IP_NETWORK_PROVISIONER_H

#include <weaver/network/network_provisioner.h>

namespace weaver
{
class IdAllocator;

// Provisions bridges and veth links with iproute2. Needs CAP_NET_ADMIN.
class IpNetworkProvisioner : public NetworkProvisioner
{
public:
    explicit IpNetworkProvisioner(IdAllocator& ids);

    void create_bridge(const QString& name) override;
    void delete_bridge(const QString& name) override;
    VethLink add_link(const QString& bridge_a, const QString& bridge_b) override;
    void release_link(const VethLink& link) override;

private:
    IdAllocator& ids;
};
} // namespace weaver

#endif // WEAVER_IP_NETWORK_PROVISIONER_H
