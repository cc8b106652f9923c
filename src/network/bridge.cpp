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

#include <weaver/format.h>
#include <weaver/logging/log.h>
#include <weaver/network/bridge.h>
#include <weaver/network/id_allocator.h>
#include <weaver/network/network_adapter.h>
#include <weaver/top_catch_all.h>

#include <stdexcept>

namespace wv = weaver;
namespace wvl = weaver::logging;

namespace
{
constexpr auto category = "network";
}

wv::Bridge::Bridge(Kind kind, const QString& name, NetworkProvisioner& provisioner)
    : bridge_kind{kind}, bridge_name{name}, provisioner{provisioner}
{
    if (bridge_kind != Kind::host_existing)
    {
        wvl::debug(category, "Creating bridge {}", bridge_name);
        provisioner.create_bridge(bridge_name);
    }
}

wv::Bridge::~Bridge()
{
    top_catch_all(category, [this] { release(); });
}

wv::VethLink wv::Bridge::link_to(const NetworkAdapter& adapter)
{
    return link_to(adapter.bridge_name());
}

wv::VethLink wv::Bridge::link_to(const Bridge& other)
{
    return link_to(other.name());
}

wv::VethLink wv::Bridge::link_to(const QString& other_bridge)
{
    if (released)
        throw std::logic_error{fmt::format("Bridge {} was already released", bridge_name)};

    veth_links.push_back(provisioner.add_link(bridge_name, other_bridge));
    wvl::debug(category, "Linked {} to {} through {}/{}", bridge_name, other_bridge, veth_links.back().first,
               veth_links.back().second);

    return veth_links.back();
}

void wv::Bridge::release()
{
    if (released)
        return;

    released = true;
    for (const auto& link : veth_links)
        provisioner.release_link(link);
    veth_links.clear();

    if (bridge_kind != Kind::host_existing)
    {
        wvl::debug(category, "Deleting bridge {}", bridge_name);
        provisioner.delete_bridge(bridge_name);
    }
}

wv::Bridge::Kind wv::Bridge::kind() const
{
    return bridge_kind;
}

const QString& wv::Bridge::name() const
{
    return bridge_name;
}

const std::vector<wv::VethLink>& wv::Bridge::links() const
{
    return veth_links;
}

wv::Bridge::UPtr wv::make_managed_bridge(NetworkProvisioner& provisioner, IdAllocator& ids)
{
    return std::make_unique<Bridge>(Bridge::Kind::managed, ids.next_managed_bridge_name(), provisioner);
}

wv::Bridge::UPtr wv::make_static_bridge(NetworkProvisioner& provisioner, IdAllocator& ids)
{
    return std::make_unique<Bridge>(Bridge::Kind::static_named, ids.next_static_bridge_name(), provisioner);
}

wv::Bridge::UPtr wv::make_host_bridge(NetworkProvisioner& provisioner, const QString& host_bridge_name)
{
    return std::make_unique<Bridge>(Bridge::Kind::host_existing, host_bridge_name, provisioner);
}
