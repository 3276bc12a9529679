#include "mediainfo.h"
#include "logger.h"
#include <fstream>
#include <algorithm>
#include <cctype>
#include <cstdio>
#include <ctime>
#include <set>
#include <map>
#include <vector>

namespace MediaVault {

namespace {

const std::set<std::string> PHOTO_EXTENSIONS = {
    ".jpg", ".jpeg", ".png", ".heic", ".heif", ".gif", ".bmp", ".webp",
    ".tiff", ".raw", ".cr2", ".nef", ".dng"
};

const std::set<std::string> VIDEO_EXTENSIONS = {
    ".mp4", ".mov", ".avi", ".mkv", ".m4v", ".mpg", ".mpeg", ".wmv", ".flv", ".webm"
};

const std::map<std::string, std::string> MIME_TYPES = {
    {".jpg", "image/jpeg"}, {".jpeg", "image/jpeg"}, {".png", "image/png"},
    {".heic", "image/heic"}, {".heif", "image/heif"}, {".gif", "image/gif"},
    {".bmp", "image/bmp"}, {".webp", "image/webp"}, {".tiff", "image/tiff"},
    {".dng", "image/x-adobe-dng"}, {".cr2", "image/x-canon-cr2"},
    {".nef", "image/x-nikon-nef"},
    {".mp4", "video/mp4"}, {".m4v", "video/x-m4v"}, {".mov", "video/quicktime"},
    {".avi", "video/x-msvideo"}, {".mkv", "video/x-matroska"},
    {".mpg", "video/mpeg"}, {".mpeg", "video/mpeg"}, {".wmv", "video/x-ms-wmv"},
    {".flv", "video/x-flv"}, {".webm", "video/webm"}
};

const char* const MONTH_NAMES[] = {
    "January", "February", "March", "April", "May", "June",
    "July", "August", "September", "October", "November", "December"
};

const uint16_t TAG_DATETIME = 0x0132;
const uint16_t TAG_EXIF_IFD = 0x8769;
const uint16_t TAG_DATETIME_ORIGINAL = 0x9003;

// Lector de la estructura TIFF contenida en el segmento APP1
class TiffReader {
public:
    explicit TiffReader(const std::string& data) : m_data(data), m_littleEndian(true) {}

    bool parseHeader(uint32_t& firstIfd) {
        if (m_data.size() < 8) return false;
        if (m_data[0] == 'I' && m_data[1] == 'I') {
            m_littleEndian = true;
        } else if (m_data[0] == 'M' && m_data[1] == 'M') {
            m_littleEndian = false;
        } else {
            return false;
        }
        if (u16(2) != 42) return false;
        firstIfd = u32(4);
        return true;
    }

    // Busca una etiqueta en el IFD; devuelve false si no existe
    bool findTag(uint32_t ifdOffset, uint16_t tag, uint16_t& type,
                 uint32_t& count, uint32_t& valueOffset) const {
        // Aritmética en size_t: un offset cercano a 0xFFFFFFFF no debe desbordar
        size_t base = static_cast<size_t>(ifdOffset);
        if (base + 2 > m_data.size()) return false;
        uint16_t entries = u16(base);

        for (uint16_t i = 0; i < entries; ++i) {
            size_t entry = base + 2 + static_cast<size_t>(i) * 12;
            if (entry + 12 > m_data.size()) return false;
            if (u16(entry) == tag) {
                type = u16(entry + 2);
                count = u32(entry + 4);
                valueOffset = u32(entry + 8);
                return true;
            }
        }
        return false;
    }

    std::string readAscii(uint32_t ifdOffset, uint16_t tag) const {
        uint16_t type = 0;
        uint32_t count = 0;
        uint32_t offset = 0;
        if (!findTag(ifdOffset, tag, type, count, offset) || type != 2 || count < 19) {
            return "";
        }
        if (static_cast<size_t>(offset) + count > m_data.size()) {
            return "";
        }
        std::string value = m_data.substr(offset, count);
        size_t nul = value.find('\0');
        return nul == std::string::npos ? value : value.substr(0, nul);
    }

    uint16_t u16(size_t pos) const {
        unsigned char a = static_cast<unsigned char>(m_data[pos]);
        unsigned char b = static_cast<unsigned char>(m_data[pos + 1]);
        return m_littleEndian ? static_cast<uint16_t>(a | (b << 8))
                              : static_cast<uint16_t>((a << 8) | b);
    }

    uint32_t u32(size_t pos) const {
        uint32_t hi = u16(pos);
        uint32_t lo = u16(pos + 2);
        return m_littleEndian ? (lo << 16) | hi : (hi << 16) | lo;
    }

private:
    const std::string& m_data;
    bool m_littleEndian;
};

// Extrae el payload TIFF del segmento APP1 "Exif\0\0"; vacío si no existe
std::string readExifSegment(const std::string& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        return "";
    }

    unsigned char soi[2];
    if (!file.read(reinterpret_cast<char*>(soi), 2) || soi[0] != 0xFF || soi[1] != 0xD8) {
        return "";
    }

    while (file) {
        unsigned char marker[2];
        if (!file.read(reinterpret_cast<char*>(marker), 2) || marker[0] != 0xFF) {
            return "";
        }
        // Inicio de datos de imagen: ya no hay más metadatos
        if (marker[1] == 0xDA || marker[1] == 0xD9) {
            return "";
        }

        unsigned char lenBytes[2];
        if (!file.read(reinterpret_cast<char*>(lenBytes), 2)) {
            return "";
        }
        int length = (lenBytes[0] << 8) | lenBytes[1];
        if (length < 2) {
            return "";
        }

        if (marker[1] == 0xE1) {
            std::string segment(static_cast<size_t>(length - 2), '\0');
            if (!file.read(&segment[0], static_cast<std::streamsize>(segment.size()))) {
                return "";
            }
            if (segment.compare(0, 6, std::string("Exif\0\0", 6)) == 0) {
                return segment.substr(6);
            }
        } else {
            file.seekg(length - 2, std::ios::cur);
        }
    }

    return "";
}

} // namespace

std::string MediaInfo::extensionOf(const std::string& fileName) {
    size_t slash = fileName.find_last_of("/\\");
    size_t dotPos = fileName.find_last_of('.');
    if (dotPos == std::string::npos || (slash != std::string::npos && dotPos < slash)) {
        return "";
    }

    std::string ext = fileName.substr(dotPos);
    std::transform(ext.begin(), ext.end(), ext.begin(), ::tolower);
    return ext;
}

bool MediaInfo::isPhoto(const std::string& fileName) {
    return PHOTO_EXTENSIONS.count(extensionOf(fileName)) > 0;
}

bool MediaInfo::isVideo(const std::string& fileName) {
    return VIDEO_EXTENSIONS.count(extensionOf(fileName)) > 0;
}

bool MediaInfo::isSupportedMedia(const std::string& fileName) {
    return isPhoto(fileName) || isVideo(fileName);
}

MediaKind MediaInfo::mediaKindFor(const std::string& fileName) {
    return isVideo(fileName) ? MediaKind::Video : MediaKind::Photo;
}

std::string MediaInfo::mimeTypeFor(const std::string& fileName) {
    auto it = MIME_TYPES.find(extensionOf(fileName));
    return it != MIME_TYPES.end() ? it->second : "application/octet-stream";
}

int64_t MediaInfo::parseExifDateTime(const std::string& value) {
    int year = 0, month = 0, day = 0, hour = 0, minute = 0, second = 0;
    if (std::sscanf(value.c_str(), "%d:%d:%d %d:%d:%d",
                    &year, &month, &day, &hour, &minute, &second) != 6) {
        return 0;
    }
    if (year < 1970 || month < 1 || month > 12 || day < 1 || day > 31 ||
        hour > 23 || minute > 59 || second > 60) {
        return 0;
    }

    std::tm tm{};
    tm.tm_year = year - 1900;
    tm.tm_mon = month - 1;
    tm.tm_mday = day;
    tm.tm_hour = hour;
    tm.tm_min = minute;
    tm.tm_sec = second;
    tm.tm_isdst = -1;

    std::time_t t = std::mktime(&tm);
    return t < 0 ? 0 : static_cast<int64_t>(t);
}

int64_t MediaInfo::readExifCaptureTime(const std::string& path) {
    std::string tiff = readExifSegment(path);
    if (tiff.empty()) {
        return 0;
    }

    TiffReader reader(tiff);
    uint32_t ifd0 = 0;
    if (!reader.parseHeader(ifd0)) {
        LOG_DEBUG("Malformed EXIF header in " + path);
        return 0;
    }

    std::string dateTime;

    uint16_t type = 0;
    uint32_t count = 0;
    uint32_t exifIfd = 0;
    if (reader.findTag(ifd0, TAG_EXIF_IFD, type, count, exifIfd)) {
        dateTime = reader.readAscii(exifIfd, TAG_DATETIME_ORIGINAL);
    }
    if (dateTime.empty()) {
        dateTime = reader.readAscii(ifd0, TAG_DATETIME);
    }

    int64_t captureTime = parseExifDateTime(dateTime);
    if (captureTime != 0) {
        LOG_DEBUG("EXIF capture time for " + path + ": " + dateTime);
    }
    return captureTime;
}

std::string MediaInfo::monthBucketName(int month) {
    if (month < 1 || month > 12) {
        return "";
    }
    char prefix[4];
    std::snprintf(prefix, sizeof(prefix), "%02d", month);
    return std::string(prefix) + "_" + MONTH_NAMES[month - 1];
}

} // namespace MediaVault
