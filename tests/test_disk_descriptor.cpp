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
#include "mock_logger.h"
#include "mock_process_factory.h"
#include "temp_dir.h"

#include <weaver/disk_descriptor.h>
#include <weaver/exceptions/io_failure_exception.h>

#include <QDir>
#include <QFile>

namespace wv = weaver;
namespace wvl = weaver::logging;
namespace wvt = weaver::test;

using namespace testing;

namespace
{
constexpr auto snapshot_list = "Snapshot list:\n"
                               "ID        TAG               VM SIZE                DATE     VM CLOCK     ICOUNT\n"
                               "1         preboot               0 B 2024-05-01 10:00:00 00:00:00.000          0\n"
                               "2         installed             0 B 2024-05-01 10:05:00 00:00:00.000          0\n";

struct TestDiskDescriptor : public Test
{
    TestDiskDescriptor()
    {
        process_factory->register_callback([this](wvt::MockProcess* process) {
            const auto args = process->arguments();
            if (args.startsWith("info"))
                ON_CALL(*process, read_all_standard_output).WillByDefault(Return(image_info));
            else if (args.startsWith("snapshot") && args.contains("-l"))
                ON_CALL(*process, read_all_standard_output).WillByDefault(Return(snapshots));
            else if (args.startsWith("create") && fail_create)
            {
                wv::ProcessOutcome failure;
                failure.exit_code = 1;
                ON_CALL(*process, execute).WillByDefault(Return(failure));
                ON_CALL(*process, read_all_standard_error).WillByDefault(Return("Could not open backing file"));
            }
        });
    }

    QStringList arguments_of(std::size_t index)
    {
        const auto processes = process_factory->process_list();
        EXPECT_GT(processes.size(), index);
        return processes.size() > index ? processes[index].arguments : QStringList{};
    }

    wvt::TempDir workspace;
    QByteArray image_info{R"({"virtual-size": 10737418240, "filename": "base.img", "format": "raw"})"};
    QByteArray snapshots{snapshot_list};
    bool fail_create = false;
    std::unique_ptr<wvt::MockProcessFactory::Scope> process_factory = wvt::MockProcessFactory::Inject();
    wvt::MockLogger::Scope logger_scope = wvt::MockLogger::inject(wvl::Level::debug);
};
} // namespace

TEST_F(TestDiskDescriptor, freshDescriptorHasOnlyBackingImage)
{
    wv::DiskDescriptor disk{"/images/base.img"};

    EXPECT_EQ(disk.depth(), 1u);
    EXPECT_EQ(disk.top(), "/images/base.img");
    EXPECT_EQ(disk.backing_file(), "/images/base.img");
}

TEST_F(TestDiskDescriptor, rendersDefaultDriveString)
{
    wv::DiskDescriptor disk{"/images/base.img"};

    EXPECT_EQ(disk.to_drive_string(), "if=ide,file=/images/base.img,media=disk");
}

TEST_F(TestDiskDescriptor, rendersIndexAndOmitsEmptyInterface)
{
    wv::DiskDescriptor disk{"/images/seed.iso", "", "cdrom", 2};

    EXPECT_EQ(disk.to_drive_string(), "file=/images/seed.iso,media=cdrom,index=2");

    const auto descriptor = disk.render_descriptor();
    EXPECT_EQ(descriptor.media, "cdrom");
    EXPECT_EQ(descriptor.index, 2);
}

TEST_F(TestDiskDescriptor, pushLayerStacksOverlayBackedByPreviousTop)
{
    wv::DiskDescriptor disk{"/images/base.img"};

    const auto layer = disk.push_layer(workspace.path());

    EXPECT_EQ(disk.depth(), 2u);
    EXPECT_EQ(disk.top(), layer);
    EXPECT_TRUE(layer.startsWith(workspace.path()));
    EXPECT_TRUE(layer.endsWith(".qcow2"));
    EXPECT_EQ(disk.to_drive_string(), QStringLiteral("if=ide,file=%1,media=disk").arg(layer));

    EXPECT_THAT(arguments_of(0), ElementsAre("info", "--output=json", "/images/base.img"));
    EXPECT_THAT(arguments_of(1), ElementsAre("create", "-f", "qcow2", "-b", "/images/base.img", "-F", "raw", layer));
}

TEST_F(TestDiskDescriptor, knownFormatSkipsImageInfo)
{
    wv::DiskDescriptor disk{"/images/base.qcow2", "virtio", "disk", std::nullopt, QString{"qcow2"}};

    disk.push_layer(workspace.path());

    const auto processes = process_factory->process_list();
    ASSERT_EQ(processes.size(), 1u);
    EXPECT_EQ(processes[0].arguments.first(), "create");
}

TEST_F(TestDiskDescriptor, upperLayersAreBackedAsQcow2)
{
    wv::DiskDescriptor disk{"/images/base.img"};

    const auto first = disk.push_layer(workspace.path());
    const auto second = disk.push_layer(workspace.path());

    EXPECT_NE(first, second);
    EXPECT_EQ(disk.depth(), 3u);
    EXPECT_THAT(arguments_of(2), ElementsAre("create", "-f", "qcow2", "-b", first, "-F", "qcow2", second));
}

TEST_F(TestDiskDescriptor, popLayerRestoresPreviousTop)
{
    wv::DiskDescriptor disk{"/images/base.img"};
    const auto layer = disk.push_layer(workspace.path());

    EXPECT_EQ(disk.pop_layer(), layer);
    EXPECT_EQ(disk.top(), "/images/base.img");
    EXPECT_TRUE(QFile::exists(layer));
}

TEST_F(TestDiskDescriptor, popLayerNeverRemovesBackingImage)
{
    wv::DiskDescriptor disk{"/images/base.img"};

    EXPECT_EQ(disk.pop_layer(), std::nullopt);
    EXPECT_EQ(disk.depth(), 1u);
}

TEST_F(TestDiskDescriptor, failedPushLeavesStackAndWorkspaceUntouched)
{
    fail_create = true;
    wv::DiskDescriptor disk{"/images/base.img", "ide", "disk", std::nullopt, QString{"raw"}};

    WV_EXPECT_THROW_THAT(disk.push_layer(workspace.path()), wv::IOFailureException,
                         wvt::match_what(HasSubstr("Could not open backing file")));

    EXPECT_EQ(disk.depth(), 1u);
    EXPECT_THAT(QDir{workspace.path()}.entryList(QDir::Files), IsEmpty());
}

TEST_F(TestDiskDescriptor, listsSnapshotsOfTopLayer)
{
    wv::DiskDescriptor disk{"/images/base.img"};

    EXPECT_THAT(disk.list_snapshots(), ElementsAre("preboot", "installed"));
    EXPECT_TRUE(disk.has_snapshot("installed"));
    EXPECT_FALSE(disk.has_snapshot("missing"));
    EXPECT_THAT(arguments_of(0), ElementsAre("snapshot", "-l", "/images/base.img"));
}

TEST_F(TestDiskDescriptor, imageWithoutSnapshotsListsNothing)
{
    snapshots.clear();
    wv::DiskDescriptor disk{"/images/base.img"};

    EXPECT_THAT(disk.list_snapshots(), IsEmpty());
}

TEST_F(TestDiskDescriptor, existingBackingSnapshotIsApplied)
{
    wv::DiskDescriptor disk{"/images/base.img"};

    disk.restore_or_create_backing_snapshot("preboot");

    EXPECT_THAT(arguments_of(1), ElementsAre("snapshot", "-a", "preboot", "/images/base.img"));
}

TEST_F(TestDiskDescriptor, missingBackingSnapshotIsCreated)
{
    snapshots.clear();
    wv::DiskDescriptor disk{"/images/base.img"};

    disk.restore_or_create_backing_snapshot("preboot");

    EXPECT_THAT(arguments_of(1), ElementsAre("snapshot", "-c", "preboot", "/images/base.img"));
}

TEST_F(TestDiskDescriptor, backingSnapshotIsOffLimitsUnderLayers)
{
    wv::DiskDescriptor disk{"/images/base.img", "ide", "disk", std::nullopt, QString{"raw"}};
    disk.push_layer(workspace.path());

    EXPECT_THROW(disk.restore_or_create_backing_snapshot("preboot"), std::logic_error);
}
