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

#ifndef WEAVER_IO_FAILURE_EXCEPTION_H
#define WEAVER_IO_FAILURE_EXCEPTION_H

#include <weaver/exceptions/formatted_exception_base.h>

namespace weaver
{
// A disk image tool invocation, or the file handling around it, failed
class IOFailureException : public FormattedExceptionBase<>
{
public:
    using FormattedExceptionBase::FormattedExceptionBase;
};
} // namespace weaver

#endif // WEAVER_IO_FAILURE_EXCEPTION_H
