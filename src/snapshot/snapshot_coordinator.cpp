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

#include <weaver/control/control_channel.h>
#include <weaver/exceptions/internal_timeout_exception.h>
#include <weaver/format.h>
#include <weaver/logging/log.h>
#include <weaver/snapshot_coordinator.h>
#include <weaver/utils.h>

#include <QStringList>

#include <array>

namespace wv = weaver;
namespace wvl = weaver::logging;

namespace
{
constexpr auto category = "snapshot";
constexpr auto no_snapshots_sentinel = "There is no snapshot available.";
constexpr auto list_header = "List of snapshots present on all disks:";
constexpr auto column_header_start = "ID";
constexpr std::array snapshot_missing_markers{"does not have the requested snapshot",
                                              "does not exist in one or more devices"};

// The monitor echoes each command back, so the first line of a response is the command itself
QStringList response_lines(const QString& response)
{
    auto lines = response.split('\n');
    for (auto& line : lines)
        line = line.trimmed();

    if (!lines.isEmpty())
        lines.removeFirst();

    return lines;
}

// Rows start with "--" for snapshots on every disk, or a numeric id
bool is_snapshot_row(const QStringList& columns)
{
    if (columns.size() < 2)
        return false;

    auto numeric = false;
    columns.first().toULongLong(&numeric);
    return numeric || columns.first() == "--";
}

bool reports_missing_snapshot(const QStringList& lines)
{
    for (const auto& line : lines)
        for (const auto* marker : snapshot_missing_markers)
            if (line.contains(marker))
                return true;

    return false;
}
} // namespace

wv::SnapshotCoordinator::SnapshotCoordinator(ControlChannel& monitor, std::chrono::milliseconds settle_delay,
                                             std::chrono::milliseconds dialogue_timeout)
    : monitor{monitor}, settle_delay{settle_delay}, dialogue_timeout{dialogue_timeout}
{
}

void wv::SnapshotCoordinator::take_snapshot(const QString& name)
{
    wvl::info(category, "Taking snapshot: {}", name);

    // Whatever the monitor printed since the last dialogue is of no interest
    if (!monitor.await_prompt(drain_timeout))
        wvl::trace(category, "Nothing to drain before taking {}", name);

    converse("stop", "pause the machine");
    settle();

    converse(QStringLiteral("savevm %1").arg(name), "save the snapshot");
    settle();

    converse("cont", "resume the machine");
    settle();
}

void wv::SnapshotCoordinator::delete_snapshot(const QString& name)
{
    wvl::info(category, "Deleting snapshot: {}", name);

    auto response = converse(QStringLiteral("delvm %1").arg(name), "delete the snapshot");
    wvl::debug(category, "delvm {} answered: {}", name, response.trimmed());
}

wv::SnapshotResult wv::SnapshotCoordinator::goto_snapshot(const QString& name)
{
    wvl::info(category, "Going to snapshot: {}", name);

    converse("stop", "pause the machine");

    auto response = converse(QStringLiteral("loadvm %1").arg(name), "load the snapshot");
    if (reports_missing_snapshot(response_lines(response)))
    {
        wvl::warn(category, "Snapshot {} not found, the machine stays paused", name);
        return {SnapshotResult::Error::snapshot_not_found, response};
    }

    converse("cont", "resume the machine");

    return {};
}

std::vector<QString> wv::SnapshotCoordinator::list_snapshots()
{
    auto lines = response_lines(converse("info snapshots", "list snapshots"));

    std::vector<QString> names;
    if (lines.contains(no_snapshots_sentinel))
        return names;

    for (const auto& line : lines)
    {
        if (line.isEmpty() || line == list_header || line.startsWith(column_header_start))
            continue;

        // Any further section lists snapshots missing from some disks, which cannot be loaded
        if (line.endsWith(':'))
            break;

        const auto columns = line.split(' ', Qt::SkipEmptyParts);
        if (is_snapshot_row(columns))
            names.push_back(columns[1]);
        else
            wvl::debug(category, "Skipping unexpected snapshot listing line: {}", line);
    }

    return names;
}

QString wv::SnapshotCoordinator::converse(const QString& command, const char* step)
{
    monitor.send_line(command);

    auto response = monitor.await_prompt(dialogue_timeout);
    if (!response)
        throw InternalTimeoutException{fmt::format("{} ({})", step, command), dialogue_timeout};

    return *response;
}

void wv::SnapshotCoordinator::settle() const
{
    if (settle_delay > std::chrono::milliseconds::zero())
        WV_UTILS.sleep_for(settle_delay);
}
