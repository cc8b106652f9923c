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

#include <weaver/process/basic_process.h>
#include <weaver/process/process_factory.h>
#include <weaver/process/simple_process_spec.h>

namespace wv = weaver;

wv::ProcessFactory::ProcessFactory(const Singleton<ProcessFactory>::PrivatePass& pass)
    : Singleton<ProcessFactory>::Singleton{pass}
{
}

std::unique_ptr<wv::Process> wv::ProcessFactory::create_process(std::unique_ptr<wv::ProcessSpec>&& process_spec) const
{
    return std::make_unique<BasicProcess>(std::move(process_spec));
}

std::unique_ptr<wv::Process> wv::ProcessFactory::create_process(const QString& command,
                                                                const QStringList& arguments) const
{
    return create_process(simple_process_spec(command, arguments));
}
