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

#ifndef WEAVER_DISK_DESCRIPTOR_H
#define WEAVER_DISK_DESCRIPTOR_H

#include <weaver/path.h>

#include <QString>
#include <QStringList>

#include <optional>
#include <vector>

namespace weaver
{
struct DriveDescriptor
{
    QString interface; // empty to leave the bus up to the hypervisor
    QString media;
    std::optional<int> index;
    Path file;
};

/**
 * A disk as the hypervisor sees it: a backing image with a stack of copy-on-write qcow2 layers on top.
 *
 * The stack never empties. Its first element is the backing image and the hypervisor only ever writes
 * to the top layer.
 */
class DiskDescriptor
{
public:
    explicit DiskDescriptor(const Path& backing_file, const QString& interface = "ide",
                            const QString& media = "disk", std::optional<int> index = std::nullopt,
                            std::optional<QString> format = std::nullopt);

    /**
     * Create a new layer backed by the current top one, inside @p workspace.
     *
     * @return The path of the new layer
     * @throws IOFailureException if the image could not be created
     */
    Path push_layer(const Path& workspace);

    /**
     * Remove the top layer from the stack. The file itself is left for the caller to dispose of.
     *
     * @return The removed layer, or nullopt if only the backing image remains
     */
    std::optional<Path> pop_layer();

    DriveDescriptor render_descriptor() const;
    QString to_drive_string() const;

    // Snapshots recorded in the top layer. Snapshots in lower layers are not visible here.
    std::vector<QString> list_snapshots() const;
    bool has_snapshot(const QString& tag) const;

    // Roll the backing image back to snapshot @p tag, or record it there if it does not exist yet.
    // Only safe while no layer sits on top of the backing image.
    void restore_or_create_backing_snapshot(const QString& tag);

    const Path& backing_file() const;
    const Path& top() const;
    const std::vector<Path>& layers() const;
    std::size_t depth() const;

private:
    QString backing_format();

    std::vector<Path> layer_paths;
    QString interface;
    QString media;
    std::optional<int> index;
    std::optional<QString> format;
};
} // namespace weaver

#endif // WEAVER_DISK_DESCRIPTOR_H
