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

#include <weaver/disk_descriptor.h>
#include <weaver/exceptions/io_failure_exception.h>
#include <weaver/format.h>
#include <weaver/logging/log.h>

#include "qemu_img_utils.h"

#include <QDir>
#include <QFile>
#include <QTemporaryFile>

#include <algorithm>
#include <stdexcept>

namespace wv = weaver;
namespace wvl = weaver::logging;

namespace
{
constexpr auto category = "disk";
constexpr auto layer_template = "drive_XXXXXX.qcow2";
constexpr auto layer_format = "qcow2";
constexpr auto snapshot_list_header_lines = 2;
} // namespace

wv::DiskDescriptor::DiskDescriptor(const wv::Path& backing_file, const QString& interface, const QString& media,
                                   std::optional<int> index, std::optional<QString> format)
    : layer_paths{backing_file}, interface{interface}, media{media}, index{index}, format{std::move(format)}
{
}

wv::Path wv::DiskDescriptor::push_layer(const wv::Path& workspace)
{
    QTemporaryFile layer_file{QDir{workspace}.filePath(layer_template)};
    layer_file.setAutoRemove(false);
    if (!layer_file.open())
        throw IOFailureException{"Cannot create a layer file in {}: {}", workspace, layer_file.errorString()};

    const auto layer_path = layer_file.fileName();
    layer_file.close();

    const auto top_format = depth() == 1 ? backing_format() : QString{layer_format};
    try
    {
        backend::create_overlay_image(top(), top_format, layer_path);
    }
    catch (const IOFailureException&)
    {
        if (!QFile::remove(layer_path))
            wvl::warn(category, "Could not remove {}", layer_path);
        throw;
    }

    layer_paths.push_back(layer_path);
    wvl::debug(category, "Pushed layer {} on top of {}", layer_path, layer_paths[layer_paths.size() - 2]);

    return layer_path;
}

std::optional<wv::Path> wv::DiskDescriptor::pop_layer()
{
    if (depth() == 1)
        return std::nullopt;

    auto popped = layer_paths.back();
    layer_paths.pop_back();
    wvl::debug(category, "Popped layer {}, {} is on top now", popped, top());

    return popped;
}

wv::DriveDescriptor wv::DiskDescriptor::render_descriptor() const
{
    return {interface, media, index, top()};
}

QString wv::DiskDescriptor::to_drive_string() const
{
    const auto descriptor = render_descriptor();

    QStringList clauses;
    if (!descriptor.interface.isEmpty())
        clauses << QStringLiteral("if=%1").arg(descriptor.interface);
    clauses << QStringLiteral("file=%1").arg(descriptor.file);
    if (!descriptor.media.isEmpty())
        clauses << QStringLiteral("media=%1").arg(descriptor.media);
    if (descriptor.index)
        clauses << QStringLiteral("index=%1").arg(*descriptor.index);

    return clauses.join(',');
}

std::vector<QString> wv::DiskDescriptor::list_snapshots() const
{
    const auto output = QString{backend::snapshot_list_output(top())};
    const auto lines = output.split('\n', Qt::SkipEmptyParts);

    std::vector<QString> tags;
    for (auto i = snapshot_list_header_lines; i < lines.size(); ++i)
    {
        const auto columns = lines[i].split(' ', Qt::SkipEmptyParts);
        if (columns.size() >= 2)
            tags.push_back(columns[1]);
    }

    return tags;
}

bool wv::DiskDescriptor::has_snapshot(const QString& tag) const
{
    const auto tags = list_snapshots();
    return std::find(tags.cbegin(), tags.cend(), tag) != tags.cend();
}

void wv::DiskDescriptor::restore_or_create_backing_snapshot(const QString& tag)
{
    if (depth() != 1)
        throw std::logic_error{fmt::format("Cannot touch snapshots of {}: {} layers on top of it", backing_file(),
                                           depth() - 1)};

    if (has_snapshot(tag))
    {
        wvl::debug(category, "Applying snapshot {} to {}", tag, backing_file());
        backend::apply_snapshot(backing_file(), tag);
    }
    else
    {
        wvl::debug(category, "Creating snapshot {} of {}", tag, backing_file());
        backend::create_snapshot(backing_file(), tag);
    }
}

const wv::Path& wv::DiskDescriptor::backing_file() const
{
    return layer_paths.front();
}

const wv::Path& wv::DiskDescriptor::top() const
{
    return layer_paths.back();
}

const std::vector<wv::Path>& wv::DiskDescriptor::layers() const
{
    return layer_paths;
}

std::size_t wv::DiskDescriptor::depth() const
{
    return layer_paths.size();
}

QString wv::DiskDescriptor::backing_format()
{
    if (!format)
        format = backend::image_format(backing_file());

    return *format;
}
