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

#ifndef WEAVER_QEMU_IMG_UTILS_H
#define WEAVER_QEMU_IMG_UTILS_H

#include <weaver/path.h>
#include <weaver/process/process.h>

#include <QByteArray>
#include <QString>

#include <memory>
#include <optional>
#include <string>

namespace weaver
{
class QemuImgProcessSpec;

namespace backend
{
Process::UPtr checked_exec_qemu_img(std::unique_ptr<QemuImgProcessSpec> spec,
                                    const std::string& custom_error_prefix = "Internal error",
                                    std::optional<int> timeout = std::nullopt);
QString image_format(const Path& image_path);
void create_overlay_image(const Path& backing_path, const QString& backing_format, const Path& overlay_path);
QByteArray snapshot_list_output(const Path& image_path);
void apply_snapshot(const Path& image_path, const QString& tag);
void create_snapshot(const Path& image_path, const QString& tag);
} // namespace backend
} // namespace weaver

#endif // WEAVER_QEMU_IMG_UTILS_H
