#include "test_support.h"
#include "devicelister.h"
#include <filesystem>

using namespace MediaVault;
using MediaVault::Testing::TempDirTest;

namespace fs = std::filesystem;

class DeviceListerTest : public TempDirTest {
};

TEST_F(DeviceListerTest, FindsDcimOrInternalStorage) {
    writeFile("camera/DCIM/100CANON/IMG_0001.JPG", "a");
    writeFile("phone/Internal Storage/DCIM/Camera/VID_0001.mp4", "b");
    fs::create_directories(pathFor("empty"));

    EXPECT_EQ(DirectoryDeviceLister::findMediaRoot(pathFor("camera")),
              (fs::path(pathFor("camera")) / "DCIM").string());
    EXPECT_EQ(DirectoryDeviceLister::findMediaRoot(pathFor("phone")),
              (fs::path(pathFor("phone")) / "Internal Storage/DCIM").string());
    EXPECT_TRUE(DirectoryDeviceLister::findMediaRoot(pathFor("empty")).empty());
}

TEST_F(DeviceListerTest, DescribeDerivesStableIdentifier) {
    writeFile("camera/DCIM/IMG_0001.JPG", "a");

    DeviceInfo first = DirectoryDeviceLister::describe(pathFor("camera"));
    DeviceInfo second = DirectoryDeviceLister::describe(pathFor("camera"));
    DeviceInfo renamed = DirectoryDeviceLister::describe(pathFor("camera"), "Travel camera");

    EXPECT_EQ(first.name, "camera");
    EXPECT_EQ(first.deviceId.size(), 16u);
    EXPECT_EQ(first.deviceId, second.deviceId);
    EXPECT_NE(first.deviceId, renamed.deviceId);
    EXPECT_EQ(renamed.name, "Travel camera");
}

TEST_F(DeviceListerTest, ListsSupportedMediaSortedByPath) {
    writeFile("camera/DCIM/101CANON/IMG_0002.JPG", "second");
    writeFile("camera/DCIM/100CANON/IMG_0001.JPG", "first");
    writeFile("camera/DCIM/100CANON/MVI_0003.MOV", "movie");
    writeFile("camera/DCIM/100CANON/notes.txt", "ignored");
    writeFile("camera/MISC/IMG_9999.JPG", "outside DCIM");

    DirectoryDeviceLister lister;
    auto files = lister.listCandidateFiles(DirectoryDeviceLister::describe(pathFor("camera")));

    ASSERT_EQ(files.size(), 3u);
    EXPECT_EQ(fs::path(files[0].path).filename().string(), "IMG_0001.JPG");
    EXPECT_EQ(fs::path(files[1].path).filename().string(), "MVI_0003.MOV");
    EXPECT_EQ(fs::path(files[2].path).filename().string(), "IMG_0002.JPG");
    EXPECT_EQ(files[0].size, 5);
    EXPECT_GT(files[0].mtime, 0);
}

TEST_F(DeviceListerTest, DeviceWithoutDcimListsNothing) {
    writeFile("stick/photos/IMG_0001.JPG", "a");

    DirectoryDeviceLister lister;
    EXPECT_TRUE(lister.listCandidateFiles(DirectoryDeviceLister::describe(pathFor("stick"))).empty());
}
