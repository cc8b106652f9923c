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

#ifndef WEAVER_STANDARD_LOGGER_H
#define WEAVER_STANDARD_LOGGER_H

#include <weaver/logging/logger.h>

#include <iosfwd>

namespace weaver
{
namespace logging
{
class StandardLogger : public Logger
{
public:
    /**
     * Construct a StandardLogger writing to std::cerr.
     *
     * @param [in] level Level of the logger.
     * The log calls with level below this will be filtered out.
     */
    StandardLogger(Level level);

    /**
     * Construct a StandardLogger writing to the given stream.
     *
     * @param [in] level Level of the logger. The log calls
     * with level below this will be filtered out.
     * @param [in] target ostream to write the output to
     */
    StandardLogger(Level level, std::ostream& target);

    void log(Level level, CString category, CString message) const override;

private:
    std::ostream& target; // < Target ostream to write the log messages.
};
} // namespace logging
} // namespace weaver
#endif // WEAVER_STANDARD_LOGGER_H
