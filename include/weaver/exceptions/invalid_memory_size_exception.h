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

#ifndef WEAVER_INVALID_MEMORY_SIZE_EXCEPTION_H
#define WEAVER_INVALID_MEMORY_SIZE_EXCEPTION_H

#include <fmt/format.h>

#include <stdexcept>
#include <string>

namespace weaver
{
class InvalidMemorySizeException : public std::runtime_error
{
public:
    InvalidMemorySizeException(const std::string& val)
        : runtime_error(fmt::format("{} is not a valid memory size - need a non-negative integer (in base 10) "
                                    "optionally followed by K, M, G or T (e.g. 1234B, 512M, 2GiB)",
                                    val))
    {
    }
};
} // namespace weaver
#endif // WEAVER_INVALID_MEMORY_SIZE_EXCEPTION_H
