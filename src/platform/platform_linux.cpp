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

#include <weaver/constants.h>
#include <weaver/format.h>
#include <weaver/logging/log.h>
#include <weaver/platform.h>

#include <QDir>
#include <QFile>
#include <QStandardPaths>

#include <cerrno>
#include <cstring>
#include <signal.h>
#include <sys/types.h>

namespace wv = weaver;
namespace wvl = weaver::logging;

namespace
{
constexpr auto category = "platform";

// /proc/<pid>/stat holds "pid (comm) state ...", where comm may contain spaces and parentheses
char process_state(qint64 pid)
{
    QFile stat_file{QStringLiteral("/proc/%1/stat").arg(pid)};
    if (!stat_file.open(QIODevice::ReadOnly))
        return '\0';

    const auto contents = stat_file.readAll();
    const auto comm_end = contents.lastIndexOf(')');
    if (comm_end < 0 || comm_end + 2 >= contents.size())
        return '\0';

    return contents.at(comm_end + 2);
}
} // namespace

wv::platform::Platform::Platform(const Singleton::PrivatePass& pass) noexcept : Singleton::Singleton{pass}
{
}

bool wv::platform::Platform::process_exists(qint64 pid) const
{
    if (pid <= 0)
        return false;

    if (::kill(static_cast<pid_t>(pid), 0) != 0 && errno == ESRCH)
        return false;

    const auto state = process_state(pid);
    return state != '\0' && state != 'Z' && state != 'X';
}

bool wv::platform::Platform::send_signal(qint64 pid, int signal) const
{
    if (::kill(static_cast<pid_t>(pid), signal) == 0)
        return true;

    wvl::debug(category, "Failed to send signal {} to process {}: {}", signal, pid, std::strerror(errno));
    return false;
}

QString wv::platform::Platform::qemu_system_binary() const
{
    const auto from_env = qEnvironmentVariable(qemu_system_env_var);
    return from_env.isEmpty() ? QString{default_qemu_system} : from_env;
}

wv::Path wv::platform::Platform::workspace_root() const
{
    const auto from_env = qEnvironmentVariable(workspace_root_env_var);
    return from_env.isEmpty() ? QDir::tempPath() : from_env;
}
