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

#ifndef WEAVER_PLATFORM_H
#define WEAVER_PLATFORM_H

#include <weaver/path.h>
#include <weaver/singleton.h>

#include <QString>

#define WV_PLATFORM weaver::platform::Platform::instance()

namespace weaver
{
namespace platform
{
class Platform : public Singleton<Platform>
{
public:
    Platform(const Singleton::PrivatePass&) noexcept;

    // Whether pid names a live process. Processes that already exited but were not reaped yet do not count.
    virtual bool process_exists(qint64 pid) const;
    virtual bool send_signal(qint64 pid, int signal) const;

    virtual QString qemu_system_binary() const;
    virtual weaver::Path workspace_root() const;
};
} // namespace platform
} // namespace weaver

#endif // WEAVER_PLATFORM_H
