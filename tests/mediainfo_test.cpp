#include "test_support.h"
#include "mediainfo.h"
#include <ctime>

using namespace MediaVault;
using MediaVault::Testing::TempDirTest;
using MediaVault::Testing::makeExifJpeg;
using MediaVault::Testing::jpegWithExif;

class MediaInfoTest : public TempDirTest {
};

TEST_F(MediaInfoTest, ClassifiesByExtension) {
    EXPECT_EQ(MediaInfo::extensionOf("DCIM/100APPLE/IMG_0001.JPG"), ".jpg");
    EXPECT_EQ(MediaInfo::extensionOf("no_extension"), "");
    EXPECT_EQ(MediaInfo::extensionOf("dir.d/file"), "");

    EXPECT_TRUE(MediaInfo::isPhoto("IMG_0001.HEIC"));
    EXPECT_TRUE(MediaInfo::isVideo("clip.MOV"));
    EXPECT_FALSE(MediaInfo::isSupportedMedia("notes.txt"));

    EXPECT_EQ(MediaInfo::mediaKindFor("clip.mp4"), MediaKind::Video);
    EXPECT_EQ(MediaInfo::mediaKindFor("photo.png"), MediaKind::Photo);
}

TEST_F(MediaInfoTest, MapsMimeTypes) {
    EXPECT_EQ(MediaInfo::mimeTypeFor("a.jpeg"), "image/jpeg");
    EXPECT_EQ(MediaInfo::mimeTypeFor("a.MOV"), "video/quicktime");
    EXPECT_EQ(MediaInfo::mimeTypeFor("a.xyz"), "application/octet-stream");
}

TEST_F(MediaInfoTest, MonthBucketNames) {
    EXPECT_EQ(MediaInfo::monthBucketName(1), "01_January");
    EXPECT_EQ(MediaInfo::monthBucketName(12), "12_December");
    EXPECT_EQ(MediaInfo::monthBucketName(0), "");
    EXPECT_EQ(MediaInfo::monthBucketName(13), "");
}

TEST_F(MediaInfoTest, ParsesExifDateTime) {
    std::tm expected{};
    expected.tm_year = 2021 - 1900;
    expected.tm_mon = 2;
    expected.tm_mday = 15;
    expected.tm_hour = 10;
    expected.tm_min = 20;
    expected.tm_sec = 30;
    expected.tm_isdst = -1;

    EXPECT_EQ(MediaInfo::parseExifDateTime("2021:03:15 10:20:30"),
              static_cast<int64_t>(std::mktime(&expected)));
    EXPECT_EQ(MediaInfo::parseExifDateTime("0000:00:00 00:00:00"), 0);
    EXPECT_EQ(MediaInfo::parseExifDateTime("garbage"), 0);
}

TEST_F(MediaInfoTest, ReadsCaptureTimeFromExif) {
    std::string path = writeFile("IMG_0001.JPG", makeExifJpeg("2021:03:15 10:20:30"));
    EXPECT_EQ(MediaInfo::readExifCaptureTime(path), MediaInfo::parseExifDateTime("2021:03:15 10:20:30"));

    // El contenido ensamblado de una subida no tiene extensión
    std::string assembled = writeFile("session_assembled", makeExifJpeg("2019:12:01 08:00:00"));
    EXPECT_EQ(MediaInfo::readExifCaptureTime(assembled), MediaInfo::parseExifDateTime("2019:12:01 08:00:00"));
}

TEST_F(MediaInfoTest, MissingExifYieldsZero) {
    EXPECT_EQ(MediaInfo::readExifCaptureTime(writeFile("plain.jpg", "not a jpeg")), 0);
    EXPECT_EQ(MediaInfo::readExifCaptureTime(pathFor("missing.jpg")), 0);
}

TEST_F(MediaInfoTest, OutOfRangeIfdOffsetsAreIgnored) {
    // Cabecera "II*\0" con IFD0 en 0xFFFFFFFF
    std::string wrapped("II\x2A\x00\xFF\xFF\xFF\xFF", 8);
    EXPECT_EQ(MediaInfo::readExifCaptureTime(writeFile("wrapped.jpg", jpegWithExif(wrapped))), 0);

    // IFD0 válido cuyo puntero ExifIFD apunta a 0xFFFFFFF8
    std::string tiff("II\x2A\x00\x08\x00\x00\x00", 8);
    tiff += std::string("\x01\x00", 2);
    tiff += std::string("\x69\x87\x04\x00\x01\x00\x00\x00\xF8\xFF\xFF\xFF", 12);
    tiff += std::string(4, '\0');
    EXPECT_EQ(MediaInfo::readExifCaptureTime(writeFile("exif_pointer.jpg", jpegWithExif(tiff))), 0);
}
