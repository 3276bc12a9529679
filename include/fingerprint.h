#ifndef FINGERPRINT_H
#define FINGERPRINT_H

#include <string>
#include <istream>
#include <cstdint>

namespace MediaVault {

enum class HashMode {
    Full,   // SHA-256 de todo el contenido
    Fast    // SHA-256 de tamaño + muestras cabeza/medio/cola
};

std::string hashModeToString(HashMode mode);

/**
 * @brief Calcula huellas de contenido (SHA-256, hex en minúsculas)
 *
 * El modo rápido mezcla primero el tamaño en decimal ASCII y luego los
 * primeros S bytes; si el tamaño supera 3*S añade los S bytes centrados en
 * la mitad y los últimos S bytes. Dos archivos que solo difieren fuera de
 * las muestras producen la misma huella en modo rápido.
 *
 * Las funciones devuelven una cadena vacía si el origen no se puede leer.
 */
class FingerprintEngine {
public:
    explicit FingerprintEngine(HashMode mode = HashMode::Full,
                               int64_t sampleSize = 1024 * 1024);

    std::string fingerprintFile(const std::string& path) const;
    std::string fingerprintBytes(const std::string& data) const;
    std::string fingerprintStream(std::istream& in, int64_t size) const;

    // Re-verificación con el mismo modo y tamaño de muestra
    bool verifyFile(const std::string& path, const std::string& expected) const;

    static std::string sha256Hex(const std::string& data);

    HashMode mode() const { return m_mode; }
    int64_t sampleSize() const { return m_sampleSize; }

    static constexpr size_t READ_BUFFER_SIZE = 8192;
    static constexpr size_t DIGEST_HEX_LENGTH = 64;

private:
    std::string hashFull(std::istream& in) const;
    std::string hashSampled(std::istream& in, int64_t size) const;

    HashMode m_mode;
    int64_t m_sampleSize;
};

} // namespace MediaVault

#endif // FINGERPRINT_H
