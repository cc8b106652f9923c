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

#include "common.h"
#include "mock_platform.h"

#include <src/supervisor/qemu_session_process_spec.h>

#include <weaver/control/control_endpoint.h>
#include <weaver/session_config.h>

namespace wv = weaver;
namespace wvt = weaver::test;

using namespace testing;

namespace
{
struct TestSessionProcessSpec : public Test
{
    TestSessionProcessSpec()
    {
        ON_CALL(mock_platform, qemu_system_binary).WillByDefault(Return("/usr/bin/qemu-system-x86_64"));
    }

    wv::SessionConfig config;
    const wv::EndpointLayout layout{wv::make_endpoint_layout("/ws", 0, "/ws/pidfile_abc.pid")};
    wvt::MockPlatform::GuardedMock guarded_mock_platform = wvt::MockPlatform::inject<NiceMock>();
    wvt::MockPlatform& mock_platform = *guarded_mock_platform.first;
};
} // namespace

TEST_F(TestSessionProcessSpec, programComesFromPlatform)
{
    wv::QemuSessionProcessSpec spec{config, layout};

    EXPECT_EQ(spec.program(), "/usr/bin/qemu-system-x86_64");
}

TEST_F(TestSessionProcessSpec, startsInSessionOfItsOwn)
{
    wv::QemuSessionProcessSpec spec{config, layout};

    EXPECT_TRUE(spec.start_new_session());
}

TEST_F(TestSessionProcessSpec, minimalLaunchCommand)
{
    wv::QemuSessionProcessSpec spec{config, layout};

    const QStringList expected{"-enable-kvm", "-nographic", "-smp", "1", "-m", "1024M", "-pidfile",
                               "/ws/pidfile_abc.pid", "-serial", "unix:/ws/serial_0.sock,server=on,wait=off",
                               "-monitor", "unix:/ws/monitor.sock,server=on"};

    EXPECT_EQ(spec.arguments(), expected);
}

TEST_F(TestSessionProcessSpec, fullLaunchCommandKeepsOrder)
{
    config.num_cores = 2;
    config.mem_size = wv::MemorySize{"2G"};
    config.disks.emplace_back("/images/base.img");
    config.adapters.emplace_back("52:54:00:AB:CD:EF");
    config.boot_order = "c";
    config.kernel = "/boot/vmlinuz";
    config.kernel_append = "console=ttyS0";
    config.extra_arguments = QStringList{"-cpu", "host"};
    const auto two_serials = wv::make_endpoint_layout("/ws", 1, "/ws/pidfile_abc.pid");

    wv::QemuSessionProcessSpec spec{config, two_serials};

    const QStringList expected{"-enable-kvm", "-nographic", "-smp", "2", "-m", "2048M", "-drive",
                               "if=ide,file=/images/base.img,media=disk", "-netdev", "bridge,id=br-ABCDEF,br=br-ABCDEF",
                               "-device", "e1000,netdev=br-ABCDEF,mac=52:54:00:AB:CD:EF", "-pidfile",
                               "/ws/pidfile_abc.pid", "-serial", "unix:/ws/serial_0.sock,server=on,wait=off", "-serial",
                               "unix:/ws/serial_1.sock,server=on,wait=off", "-monitor", "unix:/ws/monitor.sock,server=on",
                               "-boot", "c", "-kernel", "/boot/vmlinuz", "-append", "console=ttyS0", "-cpu", "host"};

    EXPECT_EQ(spec.arguments(), expected);
}

TEST_F(TestSessionProcessSpec, kvmCanBeDisabled)
{
    config.enable_kvm = false;

    wv::QemuSessionProcessSpec spec{config, layout};

    EXPECT_THAT(spec.arguments(), Not(Contains(QString{"-enable-kvm"})));
}

TEST_F(TestSessionProcessSpec, kernelArgumentsNeedKernel)
{
    config.kernel_append = "console=ttyS0";

    wv::QemuSessionProcessSpec spec{config, layout};

    EXPECT_THAT(spec.arguments(), Not(Contains(QString{"-append"})));
}
