#ifndef MEDIAINFO_H
#define MEDIAINFO_H

#include <string>
#include <cstdint>
#include "database.h"

namespace MediaVault {

/**
 * @brief Clasificación de archivos multimedia y metadatos embebidos
 */
class MediaInfo {
public:
    // Extensión en minúsculas incluyendo el punto (".jpg"), vacía si no hay
    static std::string extensionOf(const std::string& fileName);

    static bool isPhoto(const std::string& fileName);
    static bool isVideo(const std::string& fileName);
    static bool isSupportedMedia(const std::string& fileName);

    static MediaKind mediaKindFor(const std::string& fileName);
    static std::string mimeTypeFor(const std::string& fileName);

    // DateTimeOriginal (o DateTime) del bloque EXIF de un JPEG; 0 si no hay.
    // No depende de la extensión: el contenido ensamblado no la tiene
    static int64_t readExifCaptureTime(const std::string& path);

    // Convierte "YYYY:MM:DD HH:MM:SS" a epoch en hora local; 0 si es inválida
    static int64_t parseExifDateTime(const std::string& value);

    // "01_January" .. "12_December"
    static std::string monthBucketName(int month);
};

} // namespace MediaVault

#endif // MEDIAINFO_H
