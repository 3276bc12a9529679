#include "encryptor.h"
#include "logger.h"
#include <fstream>
#include <sstream>
#include <iomanip>
#include <filesystem>
#include <memory>
#include <stdexcept>
#include <cctype>
#include <openssl/evp.h>
#include <openssl/rand.h>
#include <openssl/crypto.h>

namespace fs = std::filesystem;

namespace MediaVault {

namespace {

const char MAGIC[4] = {'M', 'V', 'E', '1'};

struct CipherContextDeleter {
    void operator()(EVP_CIPHER_CTX* ctx) const { EVP_CIPHER_CTX_free(ctx); }
};

using CipherContext = std::unique_ptr<EVP_CIPHER_CTX, CipherContextDeleter>;

void writeU32(std::ostream& out, uint32_t value) {
    char bytes[4] = {
        static_cast<char>((value >> 24) & 0xFF), static_cast<char>((value >> 16) & 0xFF),
        static_cast<char>((value >> 8) & 0xFF), static_cast<char>(value & 0xFF)
    };
    out.write(bytes, 4);
}

bool readU32(std::istream& in, uint32_t& value) {
    unsigned char bytes[4];
    if (!in.read(reinterpret_cast<char*>(bytes), 4)) {
        return false;
    }
    value = (static_cast<uint32_t>(bytes[0]) << 24) | (static_cast<uint32_t>(bytes[1]) << 16) |
            (static_cast<uint32_t>(bytes[2]) << 8) | static_cast<uint32_t>(bytes[3]);
    return true;
}

// AAD = índice (u64 BE) | marca de último registro
std::vector<unsigned char> recordAad(uint64_t index, bool last) {
    std::vector<unsigned char> aad(9);
    for (int i = 0; i < 8; ++i) {
        aad[i] = static_cast<unsigned char>((index >> (56 - 8 * i)) & 0xFF);
    }
    aad[8] = last ? 1 : 0;
    return aad;
}

// Lee hasta llenar el buffer o llegar a EOF
size_t readFull(std::istream& in, std::vector<unsigned char>& buffer) {
    in.read(reinterpret_cast<char*>(buffer.data()), static_cast<std::streamsize>(buffer.size()));
    return static_cast<size_t>(in.gcount());
}

} // namespace

Encryptor::Encryptor() : m_hasKey(false) {
}

Encryptor::~Encryptor() {
    if (!m_key.empty()) {
        OPENSSL_cleanse(m_key.data(), m_key.size());
    }
}

void Encryptor::setError(const std::string& message) {
    {
        std::lock_guard<std::mutex> lock(m_errorMutex);
        m_lastError = message;
    }
    LOG_ERROR(message);
}

std::string Encryptor::lastError() const {
    std::lock_guard<std::mutex> lock(m_errorMutex);
    return m_lastError;
}

std::string Encryptor::toHex(const std::vector<unsigned char>& data) {
    std::stringstream ss;
    for (unsigned char byte : data) {
        ss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(byte);
    }
    return ss.str();
}

bool Encryptor::fromHex(const std::string& hex, std::vector<unsigned char>& out) {
    out.clear();
    if (hex.length() % 2 != 0) {
        return false;
    }
    for (size_t i = 0; i < hex.length(); i += 2) {
        if (!std::isxdigit(static_cast<unsigned char>(hex[i])) ||
            !std::isxdigit(static_cast<unsigned char>(hex[i + 1]))) {
            return false;
        }
        out.push_back(static_cast<unsigned char>(std::stoi(hex.substr(i, 2), nullptr, 16)));
    }
    return true;
}

bool Encryptor::setKey(const std::vector<unsigned char>& key) {
    if (key.size() != KEY_SIZE) {
        setError("Invalid key size: " + std::to_string(key.size()));
        return false;
    }
    m_key = key;
    m_hasKey = true;
    return true;
}

bool Encryptor::loadOrCreateKey(const std::string& keyPath) {
    std::error_code ec;

    if (fs::exists(keyPath, ec)) {
        std::ifstream file(keyPath);
        if (!file.is_open()) {
            setError("Cannot open encryption key: " + keyPath);
            return false;
        }

        std::string hex;
        std::getline(file, hex);
        while (!hex.empty() && std::isspace(static_cast<unsigned char>(hex.back()))) {
            hex.pop_back();
        }

        std::vector<unsigned char> key;
        if (!fromHex(hex, key) || key.size() != KEY_SIZE) {
            setError("Malformed encryption key file: " + keyPath);
            return false;
        }

        LOG_INFO("Encryption key loaded from " + keyPath);
        return setKey(key);
    }

    std::vector<unsigned char> key(KEY_SIZE);
    if (RAND_bytes(key.data(), static_cast<int>(KEY_SIZE)) != 1) {
        setError("RAND_bytes failed while generating encryption key");
        return false;
    }

    fs::path parent = fs::path(keyPath).parent_path();
    if (!parent.empty()) {
        fs::create_directories(parent, ec);
        if (ec) {
            setError("Cannot create key directory " + parent.string() + ": " + ec.message());
            return false;
        }
    }

    {
        std::ofstream file(keyPath, std::ios::trunc);
        if (!file.is_open()) {
            setError("Cannot write encryption key: " + keyPath);
            return false;
        }
        file << toHex(key) << "\n";
        if (!file) {
            setError("Failed writing encryption key: " + keyPath);
            return false;
        }
    }

    fs::permissions(keyPath, fs::perms::owner_read | fs::perms::owner_write,
                    fs::perm_options::replace, ec);
    if (ec) {
        LOG_WARNING("Could not restrict key file permissions: " + ec.message());
    }

    LOG_INFO("Generated new encryption key at " + keyPath);
    bool ok = setKey(key);
    OPENSSL_cleanse(key.data(), key.size());
    return ok;
}

bool Encryptor::verifyKey() {
    std::string sample = "media-vault-key-check";
    std::string cipher;
    std::string plain;

    if (!encryptBytes(sample, cipher) || !decryptBytes(cipher, plain)) {
        return false;
    }
    if (plain != sample) {
        setError("Encryption key self-test mismatch");
        return false;
    }
    return true;
}

void Encryptor::encryptRecord(const std::vector<unsigned char>& plain, size_t length,
                              uint64_t index, bool last, std::ostream& out) {
    unsigned char iv[IV_SIZE];
    if (RAND_bytes(iv, static_cast<int>(IV_SIZE)) != 1) {
        throw std::runtime_error("RAND_bytes failed");
    }

    CipherContext ctx(EVP_CIPHER_CTX_new());
    if (!ctx) {
        throw std::runtime_error("EVP_CIPHER_CTX_new failed");
    }

    if (EVP_EncryptInit_ex(ctx.get(), EVP_aes_256_gcm(), nullptr, nullptr, nullptr) != 1 ||
        EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_IVLEN, static_cast<int>(IV_SIZE), nullptr) != 1 ||
        EVP_EncryptInit_ex(ctx.get(), nullptr, nullptr, m_key.data(), iv) != 1) {
        throw std::runtime_error("EVP_EncryptInit_ex failed");
    }

    int len = 0;
    std::vector<unsigned char> aad = recordAad(index, last);
    if (EVP_EncryptUpdate(ctx.get(), nullptr, &len, aad.data(), static_cast<int>(aad.size())) != 1) {
        throw std::runtime_error("EVP_EncryptUpdate (AAD) failed");
    }

    std::vector<unsigned char> cipher(length + EVP_MAX_BLOCK_LENGTH);
    int total = 0;
    if (length > 0) {
        if (EVP_EncryptUpdate(ctx.get(), cipher.data(), &len, plain.data(), static_cast<int>(length)) != 1) {
            throw std::runtime_error("EVP_EncryptUpdate failed");
        }
        total = len;
    }
    if (EVP_EncryptFinal_ex(ctx.get(), cipher.data() + total, &len) != 1) {
        throw std::runtime_error("EVP_EncryptFinal_ex failed");
    }
    total += len;

    unsigned char tag[TAG_SIZE];
    if (EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_GET_TAG, static_cast<int>(TAG_SIZE), tag) != 1) {
        throw std::runtime_error("EVP_CTRL_GCM_GET_TAG failed");
    }

    writeU32(out, static_cast<uint32_t>(total));
    out.write(reinterpret_cast<const char*>(iv), IV_SIZE);
    out.write(reinterpret_cast<const char*>(cipher.data()), total);
    out.write(reinterpret_cast<const char*>(tag), TAG_SIZE);

    if (!out) {
        throw std::runtime_error("write failed");
    }
}

bool Encryptor::encryptStream(std::istream& in, std::ostream& out) {
    if (!m_hasKey) {
        setError("Encryption key not loaded");
        return false;
    }

    try {
        out.write(MAGIC, sizeof(MAGIC));
        writeU32(out, CHUNK_SIZE);

        std::vector<unsigned char> current(CHUNK_SIZE);
        std::vector<unsigned char> next(CHUNK_SIZE);

        size_t currentLen = readFull(in, current);
        uint64_t index = 0;

        // Se lee un bloque por adelantado para saber cuál es el último
        while (true) {
            size_t nextLen = (currentLen == CHUNK_SIZE) ? readFull(in, next) : 0;
            bool last = nextLen == 0;

            encryptRecord(current, currentLen, index++, last, out);

            if (last) {
                break;
            }
            std::swap(current, next);
            currentLen = nextLen;
        }

        if (in.bad()) {
            throw std::runtime_error("read error");
        }
        out.flush();
        return static_cast<bool>(out);
    } catch (const std::exception& e) {
        setError("Encryption failed: " + std::string(e.what()));
        return false;
    }
}

bool Encryptor::decryptRecord(std::istream& in, uint64_t index, uint32_t maxChunk,
                              std::ostream& out, bool& last) {
    uint32_t length = 0;
    if (!readU32(in, length)) {
        throw std::runtime_error("truncated ciphertext (missing final record)");
    }
    if (length > maxChunk) {
        throw std::runtime_error("record length exceeds chunk size");
    }

    unsigned char iv[IV_SIZE];
    std::vector<unsigned char> cipher(length);
    unsigned char tag[TAG_SIZE];

    if (!in.read(reinterpret_cast<char*>(iv), IV_SIZE) ||
        (length > 0 && !in.read(reinterpret_cast<char*>(cipher.data()), length)) ||
        !in.read(reinterpret_cast<char*>(tag), TAG_SIZE)) {
        throw std::runtime_error("truncated record " + std::to_string(index));
    }

    // El último registro es el que va seguido de EOF
    last = in.peek() == std::char_traits<char>::eof();
    in.clear(in.rdstate() & ~std::ios::eofbit);

    CipherContext ctx(EVP_CIPHER_CTX_new());
    if (!ctx) {
        throw std::runtime_error("EVP_CIPHER_CTX_new failed");
    }

    if (EVP_DecryptInit_ex(ctx.get(), EVP_aes_256_gcm(), nullptr, nullptr, nullptr) != 1 ||
        EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_IVLEN, static_cast<int>(IV_SIZE), nullptr) != 1 ||
        EVP_DecryptInit_ex(ctx.get(), nullptr, nullptr, m_key.data(), iv) != 1) {
        throw std::runtime_error("EVP_DecryptInit_ex failed");
    }

    int len = 0;
    std::vector<unsigned char> aad = recordAad(index, last);
    if (EVP_DecryptUpdate(ctx.get(), nullptr, &len, aad.data(), static_cast<int>(aad.size())) != 1) {
        throw std::runtime_error("EVP_DecryptUpdate (AAD) failed");
    }

    std::vector<unsigned char> plain(length + EVP_MAX_BLOCK_LENGTH);
    int total = 0;
    if (length > 0) {
        if (EVP_DecryptUpdate(ctx.get(), plain.data(), &len, cipher.data(), static_cast<int>(length)) != 1) {
            throw std::runtime_error("EVP_DecryptUpdate failed");
        }
        total = len;
    }

    if (EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_TAG, static_cast<int>(TAG_SIZE), tag) != 1) {
        throw std::runtime_error("EVP_CTRL_GCM_SET_TAG failed");
    }
    if (EVP_DecryptFinal_ex(ctx.get(), plain.data() + total, &len) != 1) {
        throw std::runtime_error("authentication failed for record " + std::to_string(index) +
                                 " (wrong key or corrupted data)");
    }
    total += len;

    out.write(reinterpret_cast<const char*>(plain.data()), total);
    OPENSSL_cleanse(plain.data(), plain.size());
    return static_cast<bool>(out);
}

bool Encryptor::decryptStream(std::istream& in, std::ostream& out) {
    if (!m_hasKey) {
        setError("Encryption key not loaded");
        return false;
    }

    try {
        char magic[4];
        if (!in.read(magic, sizeof(magic)) || std::string(magic, 4) != std::string(MAGIC, 4)) {
            throw std::runtime_error("invalid header, expected 'MVE1'");
        }

        uint32_t chunkSize = 0;
        if (!readU32(in, chunkSize) || chunkSize == 0) {
            throw std::runtime_error("invalid chunk size in header");
        }

        bool last = false;
        for (uint64_t index = 0; !last; ++index) {
            if (!decryptRecord(in, index, chunkSize, out, last)) {
                throw std::runtime_error("write failed");
            }
        }

        out.flush();
        return static_cast<bool>(out);
    } catch (const std::exception& e) {
        setError("Decryption failed: " + std::string(e.what()));
        return false;
    }
}

bool Encryptor::encryptBytes(const std::string& plain, std::string& cipher) {
    std::istringstream in(plain);
    std::ostringstream out;
    if (!encryptStream(in, out)) {
        return false;
    }
    cipher = out.str();
    return true;
}

bool Encryptor::decryptBytes(const std::string& cipher, std::string& plain) {
    std::istringstream in(cipher);
    std::ostringstream out;
    if (!decryptStream(in, out)) {
        return false;
    }
    plain = out.str();
    return true;
}

bool Encryptor::transformFile(const std::string& inputPath, const std::string& outputPath, bool encrypt) {
    std::ifstream in(inputPath, std::ios::binary);
    if (!in.is_open()) {
        setError("Cannot open input file: " + inputPath);
        return false;
    }

    std::error_code ec;
    fs::path parent = fs::path(outputPath).parent_path();
    if (!parent.empty()) {
        fs::create_directories(parent, ec);
        if (ec) {
            setError("Cannot create output directory " + parent.string() + ": " + ec.message());
            return false;
        }
    }

    std::string partPath = outputPath + ".part";
    bool ok = false;
    {
        std::ofstream out(partPath, std::ios::binary | std::ios::trunc);
        if (!out.is_open()) {
            setError("Cannot open output file: " + partPath);
            return false;
        }
        ok = encrypt ? encryptStream(in, out) : decryptStream(in, out);
    }

    if (ok) {
        fs::rename(partPath, outputPath, ec);
        if (ec) {
            setError("Cannot move " + partPath + " to " + outputPath + ": " + ec.message());
            ok = false;
        }
    }

    if (!ok) {
        fs::remove(partPath, ec);
    }
    return ok;
}

bool Encryptor::encryptFile(const std::string& inputPath, const std::string& outputPath) {
    LOG_DEBUG("Encrypting " + inputPath + " -> " + outputPath);
    return transformFile(inputPath, outputPath, true);
}

bool Encryptor::decryptFile(const std::string& inputPath, const std::string& outputPath) {
    LOG_DEBUG("Decrypting " + inputPath + " -> " + outputPath);
    return transformFile(inputPath, outputPath, false);
}

} // namespace MediaVault
