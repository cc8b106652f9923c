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

#ifndef WEAVER_NOT_READY_EXCEPTION_H
#define WEAVER_NOT_READY_EXCEPTION_H

#include <weaver/format.h>

#include <chrono>
#include <stdexcept>

namespace weaver
{
class NotReadyException : public std::runtime_error
{
public:
    NotReadyException(const QString& identity_file, std::chrono::milliseconds timeout)
        : std::runtime_error{
              fmt::format("No process identity found in {} within {}ms", identity_file, timeout.count())}
    {
    }
};
} // namespace weaver

#endif // WEAVER_NOT_READY_EXCEPTION_H
