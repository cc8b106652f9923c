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

#ifndef WEAVER_PROCESS_H
#define WEAVER_PROCESS_H

#include <QByteArray>
#include <QObject>
#include <QProcess>
#include <QStringList>

#include <memory>
#include <optional>

namespace weaver
{
// How a child process ended, or why it never did
struct ProcessOutcome
{
    struct Error
    {
        QProcess::ProcessError kind; // FailedToStart, Crashed, Timedout, ...
        QString message;
    };

    std::optional<int> exit_code; // set whenever the child exited on its own, zero or not
    std::optional<Error> error;

    bool succeeded() const
    {
        return !error && exit_code == 0;
    }

    QString failure_message() const;
};

// A child process. Its pid stays available after it has exited.
class Process : public QObject
{
    Q_OBJECT
public:
    using UPtr = std::unique_ptr<Process>;

    virtual QString program() const = 0;
    virtual QStringList arguments() const = 0;
    virtual qint64 process_id() const = 0; // 0 until started

    virtual void start() = 0;
    virtual void kill() = 0;
    virtual bool running() const = 0;

    virtual bool wait_for_started(int msecs) = 0;
    virtual bool wait_for_finished(int msecs) = 0; // false on timeout, or if the child never started

    // Start the child and block until it exits or @p msecs run out
    virtual ProcessOutcome execute(int msecs) = 0;

    virtual QByteArray read_all_standard_output() = 0;
    virtual QByteArray read_all_standard_error() = 0;

signals:
    void finished(weaver::ProcessOutcome outcome);
    void error_occurred(QProcess::ProcessError error, QString message);

protected:
    // Runs in the child between fork and exec: async-signal-safe calls only
    virtual void setup_child_process() = 0;
};
} // namespace weaver

Q_DECLARE_METATYPE(weaver::ProcessOutcome)

#endif // WEAVER_PROCESS_H
