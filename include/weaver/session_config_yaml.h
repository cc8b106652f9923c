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

#ifndef WEAVER_SESSION_CONFIG_YAML_H
#define WEAVER_SESSION_CONFIG_YAML_H

#include <weaver/path.h>
#include <weaver/session_config.h>

#include <yaml-cpp/yaml.h>

namespace weaver
{
/**
 * Read a session description such as:
 *
 *     cpus: 2
 *     memory: 2G
 *     disks:
 *       - path: /images/base.qcow2
 *         interface: virtio
 *     adapters: [52:54:00:12:34:56]
 *     extra-serials: 1
 *
 * Missing keys keep their defaults. Throws InvalidSessionConfigException on malformed input.
 */
SessionConfig session_config_from_yaml(const YAML::Node& node);
SessionConfig load_session_config(const Path& file_path);
} // namespace weaver

#endif // WEAVER_SESSION_CONFIG_YAML_H
