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
#include <weaver/network/id_allocator.h>
#include <weaver/network/ip_network_provisioner.h>
#include <weaver/top_catch_all.h>
#include <weaver/utils.h>

#include <scope_guard.hpp>

#include <stdexcept>

namespace wv = weaver;
namespace wvl = weaver::logging;

namespace
{
constexpr auto category = "network";

void run_ip(const QStringList& args)
{
    wvl::debug(category, "ip {}", args);
    if (!WV_UTILS.run_cmd_for_status("ip", args))
        throw std::runtime_error(fmt::format("Failed to run: ip {}", args));
}

// Teardown carries on past failures
void run_ip_on_teardown(const QStringList& args)
{
    wvl::debug(category, "ip {}", args);
    if (!WV_UTILS.run_cmd_for_status("ip", args))
        wvl::warn(category, "Failed to run: ip {}", args);
}

bool link_exists(const QString& name)
{
    return WV_UTILS.run_cmd_for_status("ip", {"link", "show", name});
}
} // namespace

wv::IpNetworkProvisioner::IpNetworkProvisioner(IdAllocator& ids) : ids{ids}
{
}

void wv::IpNetworkProvisioner::create_bridge(const QString& name)
{
    if (!link_exists(name))
        run_ip({"link", "add", name, "type", "bridge"});

    run_ip({"link", "set", name, "up"});
}

void wv::IpNetworkProvisioner::delete_bridge(const QString& name)
{
    if (!link_exists(name))
        return;

    run_ip_on_teardown({"link", "set", name, "down"});
    run_ip_on_teardown({"link", "delete", name});
}

wv::VethLink wv::IpNetworkProvisioner::add_link(const QString& bridge_a, const QString& bridge_b)
{
    VethLink link{ids.next_veth_name(), ids.next_veth_name()};

    run_ip({"link", "add", link.first, "type", "veth", "peer", "name", link.second});
    auto rollback = sg::make_scope_guard([&link]() noexcept {
        top_catch_all(category, [&link] { run_ip_on_teardown({"link", "delete", link.first}); });
    });

    run_ip({"link", "set", link.first, "master", bridge_a});
    run_ip({"link", "set", link.second, "master", bridge_b});
    run_ip({"link", "set", link.first, "up"});
    run_ip({"link", "set", link.second, "up"});

    rollback.dismiss();
    return link;
}

void wv::IpNetworkProvisioner::release_link(const VethLink& link)
{
    run_ip_on_teardown({"link", "set", link.first, "down"});
    run_ip_on_teardown({"link", "set", link.second, "down"});
    // deleting one end of a veth pair removes both
    run_ip_on_teardown({"link", "delete", link.first});
}
