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

#ifndef WEAVER_FORMATTED_EXCEPTION_BASE_H
#define WEAVER_FORMATTED_EXCEPTION_BASE_H

#include <fmt/format.h>

#include <stdexcept>
#include <string>
#include <type_traits>

namespace weaver
{

/**
 * Exception base that formats its message with fmt.
 *
 * Derived exception types inherit the constructors. A broken format string never escapes as a second
 * exception from the constructor: the message then describes the formatting problem instead.
 *
 * @tparam BaseExceptionType Must derive from std::exception and be constructible from a std::string.
 */
template <typename BaseExceptionType = std::runtime_error>
struct FormattedExceptionBase : public BaseExceptionType
{
    static_assert(std::is_constructible<BaseExceptionType, std::string>::value,
                  "BaseExceptionType must be constructible with (std::string)");
    static_assert(std::is_base_of<std::exception, BaseExceptionType>::value,
                  "BaseExceptionType must derive from std::exception");

    template <typename... Args>
    FormattedExceptionBase(fmt::format_string<Args...> fmt, Args&&... args)
        : BaseExceptionType(failsafe_format(fmt, std::forward<Args>(args)...))
    {
    }

private:
    template <typename... Args>
    static std::string failsafe_format(fmt::format_string<Args...> fmt, Args&&... args)
    try
    {
        return fmt::format(fmt, std::forward<Args>(args)...);
    }
    catch (const std::exception& e)
    {
        return fmt::format("[Error while formatting the exception string]\nFormat string: `{}`\nFormat error: `{}`",
                           fmt.get(), e.what());
    }
};

} // namespace weaver

#endif // WEAVER_FORMATTED_EXCEPTION_BASE_H
