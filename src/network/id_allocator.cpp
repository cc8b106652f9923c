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

#include <weaver/network/id_allocator.h>

namespace wv = weaver;

namespace
{
QString numbered(const char* prefix, int number)
{
    return QStringLiteral("%1%2").arg(prefix).arg(number, 3, 10, QChar('0'));
}
} // namespace

QString wv::IdAllocator::next_managed_bridge_name()
{
    std::lock_guard<std::mutex> lock{mutex};
    return numbered("br-w", bridge_counter++);
}

QString wv::IdAllocator::next_static_bridge_name()
{
    std::lock_guard<std::mutex> lock{mutex};
    return numbered("br-s-", bridge_counter++);
}

QString wv::IdAllocator::next_veth_name()
{
    std::lock_guard<std::mutex> lock{mutex};
    return numbered("wveth", veth_counter++);
}
