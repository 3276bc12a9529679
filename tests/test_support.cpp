#include "test_support.h"
#include "logger.h"
#include <fstream>
#include <sstream>
#include <random>
#include <atomic>
#include <unistd.h>

namespace fs = std::filesystem;

namespace MediaVault {
namespace Testing {

namespace {

std::atomic<unsigned> g_dirCounter{0};

void putU16(std::string& out, uint16_t value) {
    out.push_back(static_cast<char>(value & 0xFF));
    out.push_back(static_cast<char>((value >> 8) & 0xFF));
}

void putU32(std::string& out, uint32_t value) {
    putU16(out, static_cast<uint16_t>(value & 0xFFFF));
    putU16(out, static_cast<uint16_t>((value >> 16) & 0xFFFF));
}

} // namespace

void TempDirTest::SetUp() {
    Logger::instance().setConsoleOutput(false);

    const ::testing::TestInfo* info = ::testing::UnitTest::GetInstance()->current_test_info();
    std::random_device rd;
    std::ostringstream name;
    name << "mediavault_" << info->test_suite_name() << "_" << info->name() << "_"
         << ::getpid() << "_" << g_dirCounter.fetch_add(1) << "_" << rd();

    m_root = fs::temp_directory_path() / name.str();
    fs::create_directories(m_root);
}

void TempDirTest::TearDown() {
    std::error_code ec;
    fs::remove_all(m_root, ec);
}

std::string TempDirTest::pathFor(const std::string& relative) const {
    return (m_root / relative).string();
}

std::string TempDirTest::writeFile(const std::string& relative, const std::string& content) const {
    fs::path target = m_root / relative;
    fs::create_directories(target.parent_path());

    std::ofstream out(target, std::ios::binary | std::ios::trunc);
    out.write(content.data(), static_cast<std::streamsize>(content.size()));
    out.close();
    return target.string();
}

std::string TempDirTest::readFile(const std::string& path) {
    std::ifstream in(path, std::ios::binary);
    std::ostringstream ss;
    ss << in.rdbuf();
    return ss.str();
}

std::string patternBytes(size_t size, unsigned seed) {
    std::mt19937 generator(seed);
    std::string data(size, '\0');
    for (size_t i = 0; i < size; ++i) {
        data[i] = static_cast<char>(generator() & 0xFF);
    }
    return data;
}

std::string makeExifJpeg(const std::string& dateTimeOriginal) {
    // TIFF little endian: IFD0 -> ExifIFD -> DateTimeOriginal (ASCII, 20 bytes)
    const uint32_t ifd0Offset = 8;
    const uint32_t exifIfdOffset = ifd0Offset + 2 + 12 + 4;
    const uint32_t valueOffset = exifIfdOffset + 2 + 12 + 4;

    std::string value = dateTimeOriginal;
    value.resize(19, ' ');
    value.push_back('\0');

    std::string tiff = "II";
    putU16(tiff, 42);
    putU32(tiff, ifd0Offset);

    putU16(tiff, 1);
    putU16(tiff, 0x8769);
    putU16(tiff, 4);
    putU32(tiff, 1);
    putU32(tiff, exifIfdOffset);
    putU32(tiff, 0);

    putU16(tiff, 1);
    putU16(tiff, 0x9003);
    putU16(tiff, 2);
    putU32(tiff, static_cast<uint32_t>(value.size()));
    putU32(tiff, valueOffset);
    putU32(tiff, 0);

    tiff += value;
    return jpegWithExif(tiff);
}

std::string jpegWithExif(const std::string& tiff) {
    std::string segment = std::string("Exif\0\0", 6) + tiff;
    size_t length = segment.size() + 2;

    std::string jpeg;
    jpeg.push_back(static_cast<char>(0xFF));
    jpeg.push_back(static_cast<char>(0xD8));
    jpeg.push_back(static_cast<char>(0xFF));
    jpeg.push_back(static_cast<char>(0xE1));
    jpeg.push_back(static_cast<char>((length >> 8) & 0xFF));
    jpeg.push_back(static_cast<char>(length & 0xFF));
    jpeg += segment;
    jpeg.push_back(static_cast<char>(0xFF));
    jpeg.push_back(static_cast<char>(0xD9));
    return jpeg;
}

} // namespace Testing
} // namespace MediaVault
