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

#ifndef WEAVER_TERMINATION_FAILED_EXCEPTION_H
#define WEAVER_TERMINATION_FAILED_EXCEPTION_H

#include <weaver/format.h>

#include <chrono>
#include <stdexcept>
#include <string>

namespace weaver
{
class TerminationFailedException : public std::runtime_error
{
public:
    TerminationFailedException(const std::string& session_name, qint64 pid, std::chrono::milliseconds timeout)
        : std::runtime_error{fmt::format("[{}] process {} still exists {}ms after being interrupted, it may be leaked",
                                         session_name, pid, timeout.count())},
          pid{pid}
    {
    }

    qint64 process_id() const
    {
        return pid;
    }

private:
    const qint64 pid;
};
} // namespace weaver

#endif // WEAVER_TERMINATION_FAILED_EXCEPTION_H
