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

#include <weaver/exceptions/invalid_memory_size_exception.h>
#include <weaver/exceptions/invalid_session_config_exception.h>
#include <weaver/format.h>
#include <weaver/logging/log.h>
#include <weaver/session_config_yaml.h>

namespace wv = weaver;
namespace wvl = weaver::logging;

namespace
{
constexpr auto category = "session-config";
constexpr auto bad_conversion_template = "Cannot convert '{}' in session configuration";

template <typename T>
T read(const YAML::Node& node, const std::string& key)
{
    try
    {
        return node[key].as<T>();
    }
    catch (const YAML::BadConversion&)
    {
        throw wv::InvalidSessionConfigException{bad_conversion_template, key};
    }
}

QString read_string(const YAML::Node& node, const std::string& key)
{
    return QString::fromStdString(read<std::string>(node, key));
}

QStringList read_string_list(const YAML::Node& node, const std::string& key)
{
    QStringList list;
    for (const auto& entry : read<std::vector<std::string>>(node, key))
        list << QString::fromStdString(entry);

    return list;
}

wv::DiskDescriptor disk_from_yaml(const YAML::Node& disk_node)
{
    if (!disk_node.IsMap() || !disk_node["path"])
        throw wv::InvalidSessionConfigException{"Every disk needs a 'path'"};

    auto path = read_string(disk_node, "path");
    auto interface = disk_node["interface"] ? read_string(disk_node, "interface") : QString{wv::default_drive_interface};
    auto media = disk_node["media"] ? read_string(disk_node, "media") : QString{wv::default_drive_media};

    std::optional<int> index;
    if (disk_node["index"])
        index = read<int>(disk_node, "index");

    std::optional<QString> format;
    if (disk_node["format"])
        format = read_string(disk_node, "format");

    return wv::DiskDescriptor{path, interface, media, index, format};
}
} // namespace

wv::SessionConfig wv::session_config_from_yaml(const YAML::Node& node)
{
    SessionConfig config;

    if (!node || node.IsNull())
        return config;

    if (!node.IsMap())
        throw InvalidSessionConfigException{"Session configuration must be a map"};

    if (node["cpus"])
        config.num_cores = read<int>(node, "cpus");

    if (node["memory"])
    {
        const auto memory = read<std::string>(node, "memory");
        try
        {
            config.mem_size = MemorySize{memory};
        }
        catch (const InvalidMemorySizeException& e)
        {
            throw InvalidSessionConfigException{"Invalid memory size in session configuration: {}", e.what()};
        }
    }

    if (const auto disks = node["disks"])
    {
        if (!disks.IsSequence())
            throw InvalidSessionConfigException{"'disks' must be a list"};

        for (const auto& disk : disks)
            config.disks.push_back(disk_from_yaml(disk));
    }

    if (node["adapters"])
    {
        const auto macs = read_string_list(node, "adapters");
        config.adapters = adapters_from_mac_list(macs);
        if (config.adapters.size() != static_cast<std::size_t>(macs.size()))
            throw InvalidSessionConfigException{"Invalid MAC address in 'adapters': {}", macs};
    }

    if (node["kernel"])
        config.kernel = read_string(node, "kernel");

    if (node["kernel-append"])
        config.kernel_append = read_string(node, "kernel-append");

    if (node["boot-order"])
        config.boot_order = read_string(node, "boot-order");

    if (node["extra-serials"])
        config.extra_serials = read<int>(node, "extra-serials");

    if (node["serial-prompt"])
        config.serial_prompt = read_string(node, "serial-prompt");

    if (node["ephemeral"])
        config.ephemeral = read<bool>(node, "ephemeral");

    if (node["enable-kvm"])
        config.enable_kvm = read<bool>(node, "enable-kvm");

    if (node["preserve-pristine-backing"])
        config.preserve_pristine_backing = read<bool>(node, "preserve-pristine-backing");

    if (node["qemu-args"])
        config.extra_arguments = read_string_list(node, "qemu-args");

    if (node["settle-delay-ms"])
        config.settle_delay = std::chrono::milliseconds{read<int>(node, "settle-delay-ms")};

    validate(config);

    return config;
}

wv::SessionConfig wv::load_session_config(const wv::Path& file_path)
{
    YAML::Node node;

    try
    {
        node = YAML::LoadFile(file_path.toStdString());
    }
    catch (const YAML::BadFile&)
    {
        throw InvalidSessionConfigException{"Wrong file '{}'", file_path};
    }
    catch (const YAML::ParserException& e)
    {
        throw InvalidSessionConfigException{"Cannot parse '{}': {}", file_path, e.what()};
    }

    wvl::debug(category, "Loaded session configuration from {}", file_path);
    return session_config_from_yaml(node);
}
