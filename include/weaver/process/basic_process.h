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

#ifndef WEAVER_BASIC_PROCESS_H
#define WEAVER_BASIC_PROCESS_H

#include <weaver/process/process.h>
#include <weaver/process/process_spec.h>

#include <memory>

namespace weaver
{
class BasicProcess : public Process
{
    Q_OBJECT
public:
    explicit BasicProcess(std::unique_ptr<ProcessSpec> spec);
    ~BasicProcess() override;

    QString program() const override;
    QStringList arguments() const override;
    qint64 process_id() const override;

    void start() override;
    void kill() override;
    bool running() const override;

    bool wait_for_started(int msecs) override;
    bool wait_for_finished(int msecs) override;

    ProcessOutcome execute(int msecs) override;

    QByteArray read_all_standard_output() override;
    QByteArray read_all_standard_error() override;

protected:
    void setup_child_process() override;

private:
    ProcessOutcome outcome_of(int exit_code, QProcess::ExitStatus exit_status) const;
    ProcessOutcome::Error current_error() const;
    void collect_standard_error();

    const std::unique_ptr<ProcessSpec> spec;
    QProcess child;
    QByteArray standard_error; // everything the child wrote to stderr and nobody read yet
    qint64 pid = 0;
};
} // namespace weaver

#endif // WEAVER_BASIC_PROCESS_H
