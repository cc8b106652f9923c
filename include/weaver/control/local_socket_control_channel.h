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

#ifndef WEAVER_LOCAL_SOCKET_CONTROL_CHANNEL_H
#define WEAVER_LOCAL_SOCKET_CONTROL_CHANNEL_H

#include <weaver/constants.h>
#include <weaver/control/control_channel.h>
#include <weaver/path.h>

#include <QByteArray>
#include <QFile>
#include <QLocalSocket>

#include <chrono>
#include <memory>

namespace weaver
{
/**
 * Connect to the unix socket at @p socket_path, retrying every second while nobody listens there yet.
 *
 * @throws ConnectionTimeoutException if no connection was established within @p timeout
 */
std::unique_ptr<QLocalSocket> connect_local_socket(const Path& socket_path,
                                                   std::chrono::milliseconds timeout = connect_timeout);

class LocalSocketControlChannel final : public ControlChannel
{
public:
    // Disconnected channel, to be connected with connect()
    LocalSocketControlChannel(const Path& socket_path, const QString& prompt, const Path& log_path);
    // Attaches to an already connected socket
    LocalSocketControlChannel(std::unique_ptr<QLocalSocket> socket, const QString& prompt, const Path& log_path);
    ~LocalSocketControlChannel() override;

    void connect(std::chrono::milliseconds timeout = connect_timeout);

    void send_line(const QString& line) override;
    std::optional<QString> await_prompt(std::chrono::milliseconds timeout) override;
    std::optional<QString> expect(const QString& marker, std::chrono::milliseconds timeout) override;

    State state() const override;
    void close() override;

    Path log_path() const;

private:
    void attach(std::unique_ptr<QLocalSocket> connected);
    void ensure_attached(const char* action) const;
    void transcribe(const QByteArray& data);

    const Path socket_path;
    const QByteArray prompt;
    QFile transcript;
    std::unique_ptr<QLocalSocket> socket;
    QByteArray buffer;
    State current_state{State::disconnected};
};
} // namespace weaver

#endif // WEAVER_LOCAL_SOCKET_CONTROL_CHANNEL_H
