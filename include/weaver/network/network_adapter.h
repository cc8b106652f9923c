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

#ifndef WEAVER_NETWORK_ADAPTER_H
#define WEAVER_NETWORK_ADAPTER_H

#include <weaver/constants.h>

#include <QString>
#include <QStringList>

#include <vector>

namespace weaver
{
// A NIC of the machine, plugged into a bridge of its own named after the NIC's MAC
class NetworkAdapter
{
public:
    explicit NetworkAdapter(const QString& mac_address, const QString& model = default_nic_model);

    const QString& mac_address() const;
    const QString& model() const;
    QString uid() const; // last 6 hex digits of the MAC
    QString bridge_name() const;

private:
    QString mac;
    QString nic_model;
};

bool operator==(const NetworkAdapter& a, const NetworkAdapter& b);

// Accepts colon separated or compact MAC addresses. Invalid entries are skipped.
std::vector<NetworkAdapter> adapters_from_mac_list(const QStringList& mac_list);
} // namespace weaver

#endif // WEAVER_NETWORK_ADAPTER_H
