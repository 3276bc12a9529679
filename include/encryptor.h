#ifndef ENCRYPTOR_H
#define ENCRYPTOR_H

#include <string>
#include <vector>
#include <istream>
#include <ostream>
#include <mutex>
#include <cstdint>

namespace MediaVault {

/**
 * @brief Cifrado en reposo con una clave estática de proceso
 *
 * Formato: "MVE1" | tamaño de bloque (u32 BE) | registros.
 * Cada registro: longitud del texto plano (u32 BE) | IV (12) |
 * texto cifrado | tag GCM (16). El AAD de cada registro es su índice y la
 * marca de último registro, por lo que cada bloque se descifra de forma
 * independiente y un archivo truncado o reordenado se rechaza.
 */
class Encryptor {
public:
    Encryptor();
    ~Encryptor();

    Encryptor(const Encryptor&) = delete;
    Encryptor& operator=(const Encryptor&) = delete;

    /**
     * @brief Carga la clave desde keyPath o la genera una única vez
     * @return true si hay una clave válida cargada
     */
    bool loadOrCreateKey(const std::string& keyPath);
    bool setKey(const std::vector<unsigned char>& key);
    bool hasKey() const { return m_hasKey; }

    // Cifra y descifra una muestra para comprobar la clave
    bool verifyKey();

    bool encryptStream(std::istream& in, std::ostream& out);
    bool decryptStream(std::istream& in, std::ostream& out);

    bool encryptBytes(const std::string& plain, std::string& cipher);
    bool decryptBytes(const std::string& cipher, std::string& plain);

    // Escriben a un archivo temporal y renombran al terminar
    bool encryptFile(const std::string& inputPath, const std::string& outputPath);
    bool decryptFile(const std::string& inputPath, const std::string& outputPath);

    std::string lastError() const;

    static constexpr size_t KEY_SIZE = 32;
    static constexpr size_t IV_SIZE = 12;
    static constexpr size_t TAG_SIZE = 16;
    static constexpr uint32_t CHUNK_SIZE = 64 * 1024;

private:
    void encryptRecord(const std::vector<unsigned char>& plain, size_t length,
                       uint64_t index, bool last, std::ostream& out);
    bool decryptRecord(std::istream& in, uint64_t index, uint32_t maxChunk,
                       std::ostream& out, bool& last);
    bool transformFile(const std::string& inputPath, const std::string& outputPath, bool encrypt);
    void setError(const std::string& message);

    static std::string toHex(const std::vector<unsigned char>& data);
    static bool fromHex(const std::string& hex, std::vector<unsigned char>& out);

    std::vector<unsigned char> m_key;
    bool m_hasKey;
    mutable std::mutex m_errorMutex;
    std::string m_lastError;
};

} // namespace MediaVault

#endif // ENCRYPTOR_H
