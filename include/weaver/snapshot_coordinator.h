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

#ifndef WEAVER_SNAPSHOT_COORDINATOR_H
#define WEAVER_SNAPSHOT_COORDINATOR_H

#include <weaver/constants.h>

#include <QString>

#include <chrono>
#include <optional>
#include <vector>

namespace weaver
{
class ControlChannel;

struct SnapshotResult
{
    enum class Error
    {
        snapshot_not_found
    };

    bool succeeded() const
    {
        return !error;
    }

    std::optional<Error> error;
    QString response; // what the monitor answered to the failed step
};

/**
 * Drives snapshot dialogues over the monitor of a running hypervisor.
 *
 * Every command is followed by waiting for the monitor prompt. Phases that change the machine's state are
 * also followed by a settle delay, for devices that acknowledge before they are done.
 */
class SnapshotCoordinator
{
public:
    SnapshotCoordinator(ControlChannel& monitor,
                        std::chrono::milliseconds settle_delay = default_settle_delay,
                        std::chrono::milliseconds dialogue_timeout = weaver::dialogue_timeout);

    // stop, savevm, cont
    void take_snapshot(const QString& name);

    // Deleting a snapshot that does not exist has no effect
    void delete_snapshot(const QString& name);

    // stop, loadvm, cont. When the snapshot is missing, the machine is left paused.
    [[nodiscard]] SnapshotResult goto_snapshot(const QString& name);

    std::vector<QString> list_snapshots();

private:
    QString converse(const QString& command, const char* step);
    void settle() const;

    ControlChannel& monitor;
    const std::chrono::milliseconds settle_delay;
    const std::chrono::milliseconds dialogue_timeout;
};
} // namespace weaver

#endif // WEAVER_SNAPSHOT_COORDINATOR_H
