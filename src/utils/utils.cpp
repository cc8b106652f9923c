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

#include <weaver/format.h>
#include <weaver/utils.h>

#include <QProcess>

#include <fstream>
#include <sstream>
#include <stdexcept>

namespace wv = weaver;

wv::Utils::Utils(const Singleton<Utils>::PrivatePass& pass) noexcept : Singleton<Utils>::Singleton{pass}
{
}

bool wv::Utils::run_cmd_for_status(const QString& cmd, const QStringList& args, const int timeout) const
{
    QProcess proc;
    proc.setProgram(cmd);
    proc.setArguments(args);

    proc.start();
    if (!proc.waitForFinished(timeout))
        return false;

    return proc.exitStatus() == QProcess::NormalExit && proc.exitCode() == 0;
}

std::string wv::Utils::contents_of(const wv::Path& file_path) const
{
    const std::string name{file_path.toStdString()};
    std::ifstream in(name, std::ios::in | std::ios::binary);
    if (!in)
        throw std::runtime_error(fmt::format("failed to open file '{}'", name));

    std::stringstream stream;
    stream << in.rdbuf();
    return stream.str();
}

void wv::Utils::sleep_for(const std::chrono::milliseconds& ms) const
{
    std::this_thread::sleep_for(ms);
}
