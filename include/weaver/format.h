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

#pragma once

#include <fmt/format.h>
#include <fmt/ostream.h>
#include <fmt/ranges.h>

#include <QByteArray>
#include <QString>
#include <QStringList>

namespace fmt
{
template <>
struct formatter<QByteArray>
{
    template <typename ParseContext>
    constexpr auto parse(ParseContext& ctx)
    {
        return ctx.begin();
    }

    template <typename FormatContext>
    auto format(const QByteArray& a, FormatContext& ctx) const
    {
        return format_to(ctx.out(), "{}", std::string_view{a.constData(), static_cast<size_t>(a.size())});
    }
};

template <>
struct formatter<QString>
{
    template <typename ParseContext>
    constexpr auto parse(ParseContext& ctx)
    {
        return ctx.begin();
    }

    template <typename FormatContext>
    auto format(const QString& a, FormatContext& ctx) const
    {
        return format_to(ctx.out(), "{}", a.toStdString());
    }
};

// Space-joined, the way the arguments would read on a shell
template <>
struct formatter<QStringList>
{
    template <typename ParseContext>
    constexpr auto parse(ParseContext& ctx)
    {
        return ctx.begin();
    }

    template <typename FormatContext>
    auto format(const QStringList& list, FormatContext& ctx) const
    {
        return format_to(ctx.out(), "{}", list.join(' ').toStdString());
    }
};
} // namespace fmt
