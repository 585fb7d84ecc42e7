#include <gtest/gtest.h>

#include "speed/StorageVolumes.h"

TEST(StorageVolumesTest, LinuxNeedsUsbBlockDeviceOnRemovableMount)
{
    EXPECT_TRUE(StorageVolumes::isUsbStorageCandidate("Linux", "/dev/sdb1", "/media/alice/STICK", "/"));
    EXPECT_TRUE(StorageVolumes::isUsbStorageCandidate("Linux", "/dev/sdc", "/run/media/bob/DATA", "/"));
    EXPECT_TRUE(StorageVolumes::isUsbStorageCandidate("Linux", "/dev/sdd1", "/mnt/usb", "/"));

    EXPECT_FALSE(StorageVolumes::isUsbStorageCandidate("Linux", "/dev/sda1", "/", "/"));
    EXPECT_FALSE(StorageVolumes::isUsbStorageCandidate("Linux", "/dev/nvme0n1p2", "/media/alice/disk", "/"));
    EXPECT_FALSE(StorageVolumes::isUsbStorageCandidate("Linux", "tmpfs", "/mnt/tmp", "/"));
}

TEST(StorageVolumesTest, MacOsUsesVisibleVolumes)
{
    EXPECT_TRUE(StorageVolumes::isUsbStorageCandidate("macOS", "/dev/disk4s1", "/Volumes/STICK", "/"));
    EXPECT_FALSE(StorageVolumes::isUsbStorageCandidate("macOS", "/dev/disk1s1", "/", "/"));
    EXPECT_FALSE(StorageVolumes::isUsbStorageCandidate("macOS", "/dev/disk5s1", "/Volumes/.timemachine", "/"));
}

TEST(StorageVolumesTest, WindowsSkipsSystemDrive)
{
    EXPECT_TRUE(StorageVolumes::isUsbStorageCandidate("Windows", "\\\\?\\Volume{1}", "E:/", "C:/"));
    EXPECT_FALSE(StorageVolumes::isUsbStorageCandidate("Windows", "\\\\?\\Volume{0}", "c:/", "C:/"));
}

TEST(StorageVolumesTest, UnknownPlatformHasNoCandidates)
{
    EXPECT_FALSE(StorageVolumes::isUsbStorageCandidate("Unknown", "/dev/sdb1", "/media/alice/STICK", "/"));
}

TEST(StorageVolumesTest, TestableVolumesAreWritableDirectories)
{
    const QList<StorageVolume> volumes = StorageVolumes::testableVolumes();
    for (const auto &volume : volumes) {
        EXPECT_FALSE(volume.rootPath.isEmpty());
        EXPECT_FALSE(volume.displayName.isEmpty());
    }
}
