#ifndef TEST_SUPPORT_H
#define TEST_SUPPORT_H

#include <gtest/gtest.h>
#include <filesystem>
#include <string>

namespace MediaVault {
namespace Testing {

/**
 * @brief Fixture base: un directorio temporal único por test
 *
 * Se crea en SetUp y se elimina completo en TearDown.
 */
class TempDirTest : public ::testing::Test {
protected:
    void SetUp() override;
    void TearDown() override;

    std::string pathFor(const std::string& relative) const;

    // Crea los directorios intermedios; devuelve la ruta completa
    std::string writeFile(const std::string& relative, const std::string& content) const;

    static std::string readFile(const std::string& path);

    std::filesystem::path m_root;
};

// Contenido determinista de `size` bytes
std::string patternBytes(size_t size, unsigned seed = 1);

// JPEG mínimo con un bloque EXIF que contiene DateTimeOriginal
std::string makeExifJpeg(const std::string& dateTimeOriginal);

// Envuelve un payload TIFF arbitrario en un segmento APP1 "Exif"
std::string jpegWithExif(const std::string& tiff);

} // namespace Testing
} // namespace MediaVault

#endif // TEST_SUPPORT_H
