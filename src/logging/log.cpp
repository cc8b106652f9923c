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

#include <weaver/logging/log.h>
#include <weaver/logging/standard_logger.h>

#include <QByteArray>
#include <QString>
#include <QtGlobal>

#include <cstring>
#include <mutex>
#include <shared_mutex>

namespace wvl = weaver::logging;

namespace
{
struct Registry
{
    std::shared_mutex mutex;
    std::shared_ptr<wvl::Logger> logger;
};

Registry& registry()
{
    static Registry instance;
    return instance;
}

// Used until a logger is installed
const wvl::Logger& fallback_logger()
{
    static const wvl::StandardLogger instance{wvl::Level::warning};
    return instance;
}

wvl::Level level_of(QtMsgType type) noexcept
{
    switch (type)
    {
    case QtDebugMsg:
        return wvl::Level::debug;
    case QtInfoMsg:
        return wvl::Level::info;
    case QtWarningMsg:
        return wvl::Level::warning;
    default:
        return wvl::Level::error;
    }
}

// Qt's catch-all category is "default"; named ones (e.g. qt.network.localsocket) are kept
std::string category_of(const QMessageLogContext& context)
{
    if (!context.category || std::strcmp(context.category, "default") == 0)
        return "qt";

    return context.category;
}

void forward_qt_message(QtMsgType type, const QMessageLogContext& context, const QString& message)
{
    const QByteArray text = message.toLocal8Bit();
    wvl::log(level_of(type), category_of(context), text.constData());
}
} // namespace

void wvl::log(Level level, CString category, CString message)
{
    auto& reg = registry();
    std::shared_lock lock{reg.mutex};

    const Logger& target = reg.logger ? *reg.logger : fallback_logger();
    target.log(level, category, message);
}

wvl::Level wvl::get_logging_level()
{
    auto& reg = registry();
    std::shared_lock lock{reg.mutex};

    return reg.logger ? reg.logger->get_logging_level() : Level::warning;
}

void wvl::set_logger(std::shared_ptr<Logger> logger)
{
    auto& reg = registry();
    std::unique_lock lock{reg.mutex};

    reg.logger = std::move(logger);
    qInstallMessageHandler(reg.logger ? forward_qt_message : nullptr);
}

auto wvl::get_logger() -> Logger*
{
    return registry().logger.get();
}
