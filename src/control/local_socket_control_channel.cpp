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

#include <weaver/control/local_socket_control_channel.h>
#include <weaver/exceptions/connection_timeout_exception.h>
#include <weaver/format.h>
#include <weaver/logging/log.h>
#include <weaver/top_catch_all.h>
#include <weaver/utils.h>

#include <stdexcept>

namespace wv = weaver;
namespace wvl = weaver::logging;
namespace wvu = weaver::utils;

using namespace std::chrono;

std::unique_ptr<QLocalSocket> wv::connect_local_socket(const wv::Path& socket_path, milliseconds timeout)
{
    auto socket = std::make_unique<QLocalSocket>();
    const auto category = socket_path.toStdString();
    auto last_error = QLocalSocket::UnknownSocketError;
    QString last_error_string;

    auto on_timeout = [&] {
        wvl::debug(category, "Giving up after {}ms", timeout.count());
        throw ConnectionTimeoutException{socket_path, timeout, last_error, last_error_string};
    };

    auto try_connect = [&] {
        socket->connectToServer(socket_path);
        if (socket->state() == QLocalSocket::ConnectedState || socket->waitForConnected(100))
            return wvu::TimeoutAction::done;

        last_error = socket->error();
        last_error_string = socket->errorString();
        wvl::trace(category, "Not connected yet: {}", last_error_string);
        socket->abort();
        return wvu::TimeoutAction::retry;
    };

    wvu::try_action_for(on_timeout, timeout, try_connect);
    wvl::debug(category, "Connected");

    return socket;
}

wv::LocalSocketControlChannel::LocalSocketControlChannel(const wv::Path& socket_path, const QString& prompt,
                                                         const wv::Path& log_path)
    : socket_path{socket_path}, prompt{prompt.toUtf8()}, transcript{log_path}
{
}

wv::LocalSocketControlChannel::LocalSocketControlChannel(std::unique_ptr<QLocalSocket> socket, const QString& prompt,
                                                         const wv::Path& log_path)
    : socket_path{socket->fullServerName()}, prompt{prompt.toUtf8()}, transcript{log_path}
{
    attach(std::move(socket));
}

wv::LocalSocketControlChannel::~LocalSocketControlChannel()
{
    top_catch_all(socket_path.toStdString(), [this] { close(); });
}

void wv::LocalSocketControlChannel::connect(milliseconds timeout)
{
    if (current_state != State::disconnected)
        throw std::logic_error{fmt::format("Cannot connect to {} twice", socket_path)};

    current_state = State::connecting;
    try
    {
        attach(connect_local_socket(socket_path, timeout));
    }
    catch (...)
    {
        current_state = State::closed;
        throw;
    }
}

void wv::LocalSocketControlChannel::send_line(const QString& line)
{
    ensure_attached("send to");

    auto data = line.toUtf8() + '\n';
    wvl::trace(socket_path.toStdString(), "> {}", line);
    transcribe(data);

    if (socket->write(data) != data.size() || !socket->waitForBytesWritten())
        throw std::runtime_error{fmt::format("Failed to write to {}: {}", socket_path, socket->errorString())};

    current_state = State::awaiting_response;
}

std::optional<QString> wv::LocalSocketControlChannel::await_prompt(milliseconds timeout)
{
    return expect(QString::fromUtf8(prompt), timeout);
}

std::optional<QString> wv::LocalSocketControlChannel::expect(const QString& marker, milliseconds timeout)
{
    ensure_attached("read from");

    const auto needle = marker.toUtf8();
    const auto deadline = steady_clock::now() + timeout;

    while (true)
    {
        if (const auto pos = buffer.indexOf(needle); pos >= 0)
        {
            auto response = QString::fromUtf8(buffer.left(pos));
            buffer.remove(0, pos + needle.size());
            current_state = State::attached;
            return response;
        }

        const auto remaining = duration_cast<milliseconds>(deadline - steady_clock::now());
        if (remaining <= 0ms)
            return std::nullopt;

        if (socket->bytesAvailable() == 0 && !socket->waitForReadyRead(static_cast<int>(remaining.count())))
        {
            if (socket->state() != QLocalSocket::ConnectedState)
                throw std::runtime_error{fmt::format("Connection to {} lost while waiting for \"{}\": {}",
                                                     socket_path, marker, socket->errorString())};
            continue;
        }

        while (socket->bytesAvailable() > 0)
        {
            auto data = socket->read(console_read_window);
            wvl::trace(socket_path.toStdString(), "< {}", data);
            transcribe(data);
            buffer.append(data);
        }
    }
}

wv::ControlChannel::State wv::LocalSocketControlChannel::state() const
{
    return current_state;
}

void wv::LocalSocketControlChannel::close()
{
    if (current_state == State::closed)
        return;

    current_state = State::closed;
    if (socket)
    {
        socket->abort();
        socket.reset();
    }
    transcript.close();
    wvl::debug(socket_path.toStdString(), "Closed");
}

wv::Path wv::LocalSocketControlChannel::log_path() const
{
    return transcript.fileName();
}

void wv::LocalSocketControlChannel::attach(std::unique_ptr<QLocalSocket> connected)
{
    socket = std::move(connected);
    if (!transcript.open(QIODevice::WriteOnly | QIODevice::Append))
        wvl::warn(socket_path.toStdString(), "Cannot open transcript {}: {}", transcript.fileName(),
                  transcript.errorString());

    current_state = State::attached;
}

void wv::LocalSocketControlChannel::ensure_attached(const char* action) const
{
    if (current_state != State::attached && current_state != State::awaiting_response)
        throw std::logic_error{fmt::format("Cannot {} {}: channel is not attached", action, socket_path)};
}

void wv::LocalSocketControlChannel::transcribe(const QByteArray& data)
{
    if (transcript.isOpen())
    {
        transcript.write(data);
        transcript.flush();
    }
}
