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

#include "qemu_img_utils.h"

#include <weaver/constants.h>
#include <weaver/exceptions/io_failure_exception.h>
#include <weaver/format.h>
#include <weaver/logging/log.h>
#include <weaver/process/process_factory.h>
#include <weaver/process/qemuimg_process_spec.h>

#include <QJsonDocument>
#include <QJsonObject>

namespace wv = weaver;
namespace wvl = weaver::logging;

namespace
{
constexpr auto category = "qemu-img";
}

auto wv::backend::checked_exec_qemu_img(std::unique_ptr<wv::QemuImgProcessSpec> spec,
                                        const std::string& custom_error_prefix,
                                        std::optional<int> timeout) -> Process::UPtr
{
    wvl::debug(category, "Running: qemu-img {}", spec->arguments());
    auto process = WV_PROCFACTORY.create_process(std::move(spec));

    const auto outcome = process->execute(timeout.value_or(qemu_img_timeout));
    if (!outcome.succeeded())
    {
        throw IOFailureException{"{}: qemu-img failed ({}) with output:\n{}",
                                 custom_error_prefix,
                                 outcome.failure_message(),
                                 process->read_all_standard_error()};
    }

    return process;
}

QString wv::backend::image_format(const wv::Path& image_path)
{
    auto process = checked_exec_qemu_img(
        std::make_unique<wv::QemuImgProcessSpec>(QStringList{"info", "--output=json", image_path}, image_path),
        fmt::format("Cannot read image format of {}", image_path));

    auto image_info = process->read_all_standard_output();
    auto image_record = QJsonDocument::fromJson(image_info, nullptr).object();
    auto format = image_record["format"].toString();

    if (format.isEmpty())
        throw IOFailureException{"Cannot read image format of {}: unexpected qemu-img output:\n{}", image_path,
                                 image_info};

    return format;
}

void wv::backend::create_overlay_image(const wv::Path& backing_path, const QString& backing_format,
                                       const wv::Path& overlay_path)
{
    checked_exec_qemu_img(
        std::make_unique<wv::QemuImgProcessSpec>(
            QStringList{"create", "-f", "qcow2", "-b", backing_path, "-F", backing_format, overlay_path},
            backing_path, overlay_path),
        fmt::format("Cannot create layer on top of {}", backing_path));
}

QByteArray wv::backend::snapshot_list_output(const wv::Path& image_path)
{
    auto process = checked_exec_qemu_img(
        std::make_unique<wv::QemuImgProcessSpec>(QStringList{"snapshot", "-l", image_path}, image_path),
        fmt::format("Cannot list snapshots of {}", image_path));
    return process->read_all_standard_output();
}

void wv::backend::apply_snapshot(const wv::Path& image_path, const QString& tag)
{
    checked_exec_qemu_img(
        std::make_unique<wv::QemuImgProcessSpec>(QStringList{"snapshot", "-a", tag, image_path}, image_path),
        fmt::format("Cannot apply snapshot {} to {}", tag, image_path));
}

void wv::backend::create_snapshot(const wv::Path& image_path, const QString& tag)
{
    checked_exec_qemu_img(
        std::make_unique<wv::QemuImgProcessSpec>(QStringList{"snapshot", "-c", tag, image_path}, image_path),
        fmt::format("Cannot create snapshot {} of {}", tag, image_path));
}
