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

#ifndef WEAVER_MEMORY_SIZE_H
#define WEAVER_MEMORY_SIZE_H

#include <QString>

#include <string>

namespace weaver
{
// Guest memory, parsed from strings such as "512M", "2GiB" or "1048576"
class MemorySize
{
public:
    MemorySize() noexcept = default;
    explicit MemorySize(const std::string& val);

    long long in_bytes() const noexcept;
    long long in_megabytes() const noexcept; // floored
    long long in_gigabytes() const noexcept; // floored

    // Value for qemu's -m option, in whole mebibytes
    QString as_qemu_argument() const;

    friend bool operator==(const MemorySize& a, const MemorySize& b) noexcept
    {
        return a.bytes == b.bytes;
    }

    friend bool operator!=(const MemorySize& a, const MemorySize& b) noexcept
    {
        return !(a == b);
    }

private:
    long long bytes = 0;
};
} // namespace weaver

#endif // WEAVER_MEMORY_SIZE_H
