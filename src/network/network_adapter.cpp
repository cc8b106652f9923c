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

#include <weaver/logging/log.h>
#include <weaver/format.h>
#include <weaver/network/network_adapter.h>

#include <QRegularExpression>

namespace wv = weaver;
namespace wvl = weaver::logging;

namespace
{
constexpr auto category = "network";
constexpr auto uid_length = 6;
} // namespace

wv::NetworkAdapter::NetworkAdapter(const QString& mac_address, const QString& model)
    : mac{mac_address}, nic_model{model}
{
}

const QString& wv::NetworkAdapter::mac_address() const
{
    return mac;
}

const QString& wv::NetworkAdapter::model() const
{
    return nic_model;
}

QString wv::NetworkAdapter::uid() const
{
    auto compact = mac;
    return compact.remove(':').right(uid_length);
}

QString wv::NetworkAdapter::bridge_name() const
{
    return QStringLiteral("br-%1").arg(uid());
}

bool wv::operator==(const NetworkAdapter& a, const NetworkAdapter& b)
{
    return a.mac_address() == b.mac_address() && a.model() == b.model();
}

std::vector<wv::NetworkAdapter> wv::adapters_from_mac_list(const QStringList& mac_list)
{
    static const QRegularExpression colon_mac{"^([0-9a-fA-F]{2}:){5}[0-9a-fA-F]{2}$"};
    static const QRegularExpression compact_mac{"^[0-9a-fA-F]{12}$"};

    std::vector<NetworkAdapter> adapters;
    for (const auto& mac : mac_list)
    {
        if (colon_mac.match(mac).hasMatch())
        {
            adapters.emplace_back(mac.toUpper());
        }
        else if (compact_mac.match(mac).hasMatch())
        {
            QStringList octets;
            for (auto i = 0; i < mac.size(); i += 2)
                octets << mac.mid(i, 2);
            adapters.emplace_back(octets.join(':').toUpper());
        }
        else
        {
            wvl::warn(category, "Ignoring invalid MAC address: {}", mac);
        }
    }

    return adapters;
}
