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

#ifndef WEAVER_CONTROL_CHANNEL_H
#define WEAVER_CONTROL_CHANNEL_H

#include <weaver/disabled_copy_move.h>

#include <QString>

#include <chrono>
#include <memory>
#include <optional>

namespace weaver
{
// A line-oriented, prompt-delimited text console. One dialogue at a time: callers must not interleave sends
// from several threads.
class ControlChannel : private DisabledCopyMove
{
public:
    using UPtr = std::unique_ptr<ControlChannel>;

    enum class State
    {
        disconnected,
        connecting,
        attached,
        awaiting_response,
        closed
    };

    virtual ~ControlChannel() = default;

    // Writes one line, without waiting for any answer
    virtual void send_line(const QString& line) = 0;

    // The text received before the prompt, or nullopt if the prompt did not show up in time
    virtual std::optional<QString> await_prompt(std::chrono::milliseconds timeout) = 0;

    // Like await_prompt, for an arbitrary marker
    virtual std::optional<QString> expect(const QString& marker, std::chrono::milliseconds timeout) = 0;

    virtual State state() const = 0;
    virtual void close() = 0;

protected:
    ControlChannel() = default;
};
} // namespace weaver

#endif // WEAVER_CONTROL_CHANNEL_H
