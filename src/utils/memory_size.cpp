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
#include <weaver/memory_size.h>

#include <QRegularExpression>

#include <limits>

namespace wv = weaver;

namespace
{
constexpr auto mebibyte_shift = 20;
constexpr auto gibibyte_shift = 30;

int shift_for(QChar unit)
{
    switch (unit.toUpper().toLatin1())
    {
    case 'K':
        return 10;
    case 'M':
        return mebibyte_shift;
    case 'G':
        return gibibyte_shift;
    case 'T':
        return 40;
    default:
        return 0;
    }
}

long long parse_bytes(const std::string& text)
{
    static const QRegularExpression format{
        QRegularExpression::anchoredPattern(R"(\s*(\d+)\s*(?:([KMGT])(?:i?B)?|B)?\s*)"),
        QRegularExpression::CaseInsensitiveOption};

    const auto match = format.match(QString::fromStdString(text));
    if (!match.hasMatch())
        throw wv::InvalidMemorySizeException{text};

    bool ok = false;
    const auto amount = match.captured(1).toLongLong(&ok);
    const auto unit = match.captured(2);
    const auto shift = unit.isEmpty() ? 0 : shift_for(unit.front());

    if (!ok || amount > (std::numeric_limits<long long>::max() >> shift))
        throw wv::InvalidMemorySizeException{text};

    return amount << shift;
}
} // namespace

wv::MemorySize::MemorySize(const std::string& val) : bytes{parse_bytes(val)}
{
}

long long wv::MemorySize::in_bytes() const noexcept
{
    return bytes;
}

long long wv::MemorySize::in_megabytes() const noexcept
{
    return bytes >> mebibyte_shift;
}

long long wv::MemorySize::in_gigabytes() const noexcept
{
    return bytes >> gibibyte_shift;
}

QString wv::MemorySize::as_qemu_argument() const
{
    return QStringLiteral("%1M").arg(in_megabytes());
}
