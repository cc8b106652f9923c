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

#ifndef WEAVER_ID_ALLOCATOR_H
#define WEAVER_ID_ALLOCATOR_H

#include <QString>

#include <mutex>

namespace weaver
{
// Hands out unique bridge and veth interface names. Safe to share between sessions created concurrently.
class IdAllocator
{
public:
    IdAllocator() = default;

    QString next_managed_bridge_name(); // br-w000, br-w001, ...
    QString next_static_bridge_name();  // br-s-000, br-s-001, ...
    QString next_veth_name();           // wveth000, wveth001, ...

private:
    std::mutex mutex;
    int bridge_counter = 0; // shared by both bridge flavours
    int veth_counter = 0;
};
} // namespace weaver

#endif // WEAVER_ID_ALLOCATOR_H
