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

#ifndef WEAVER_CONNECTION_TIMEOUT_EXCEPTION_H
#define WEAVER_CONNECTION_TIMEOUT_EXCEPTION_H

#include <weaver/format.h>

#include <QLocalSocket>

#include <chrono>
#include <stdexcept>
#include <string>

namespace weaver
{
class ConnectionTimeoutException : public std::runtime_error
{
public:
    ConnectionTimeoutException(const QString& socket_path, std::chrono::milliseconds timeout,
                               QLocalSocket::LocalSocketError last_error, const QString& last_error_string)
        : std::runtime_error{fmt::format("Could not connect to {} within {}ms: {}", socket_path, timeout.count(),
                                         last_error_string)},
          last_error{last_error}
    {
    }

    QLocalSocket::LocalSocketError get_error() const
    {
        return last_error;
    }

private:
    const QLocalSocket::LocalSocketError last_error;
};
} // namespace weaver
#endif // WEAVER_CONNECTION_TIMEOUT_EXCEPTION_H
