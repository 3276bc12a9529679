#include "fingerprint.h"
#include "logger.h"
#include <fstream>
#include <sstream>
#include <iomanip>
#include <memory>
#include <vector>
#include <stdexcept>
#include <algorithm>
#include <openssl/evp.h>

namespace MediaVault {

namespace {

struct DigestContextDeleter {
    void operator()(EVP_MD_CTX* ctx) const { EVP_MD_CTX_free(ctx); }
};

using DigestContext = std::unique_ptr<EVP_MD_CTX, DigestContextDeleter>;

DigestContext newSha256Context() {
    DigestContext ctx(EVP_MD_CTX_new());
    if (!ctx || EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr) != 1) {
        throw std::runtime_error("EVP_DigestInit_ex failed");
    }
    return ctx;
}

void digestUpdate(EVP_MD_CTX* ctx, const char* data, size_t len) {
    if (len > 0 && EVP_DigestUpdate(ctx, data, len) != 1) {
        throw std::runtime_error("EVP_DigestUpdate failed");
    }
}

std::string digestFinalHex(EVP_MD_CTX* ctx) {
    unsigned char hash[EVP_MAX_MD_SIZE];
    unsigned int hashLen = 0;
    if (EVP_DigestFinal_ex(ctx, hash, &hashLen) != 1) {
        throw std::runtime_error("EVP_DigestFinal_ex failed");
    }

    std::stringstream ss;
    for (unsigned int i = 0; i < hashLen; ++i) {
        ss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(hash[i]);
    }
    return ss.str();
}

// Lee hasta `count` bytes desde `offset` en bloques acotados
void digestRange(EVP_MD_CTX* ctx, std::istream& in, int64_t offset, int64_t count) {
    in.clear();
    in.seekg(static_cast<std::streamoff>(offset), std::ios::beg);
    if (in.fail()) {
        throw std::runtime_error("seek error at offset " + std::to_string(offset));
    }

    std::vector<char> buffer(FingerprintEngine::READ_BUFFER_SIZE);
    int64_t remaining = count;

    while (remaining > 0) {
        std::streamsize toRead = static_cast<std::streamsize>(
            std::min<int64_t>(remaining, static_cast<int64_t>(buffer.size())));
        in.read(buffer.data(), toRead);
        std::streamsize got = in.gcount();
        if (got <= 0) {
            break;
        }
        digestUpdate(ctx, buffer.data(), static_cast<size_t>(got));
        remaining -= got;
    }

    if (in.bad()) {
        throw std::runtime_error("read error");
    }
}

} // namespace

std::string hashModeToString(HashMode mode) {
    return mode == HashMode::Fast ? "fast" : "full";
}

FingerprintEngine::FingerprintEngine(HashMode mode, int64_t sampleSize)
    : m_mode(mode)
    , m_sampleSize(sampleSize > 0 ? sampleSize : 1024 * 1024)
{
}

std::string FingerprintEngine::fingerprintFile(const std::string& path) const {
    std::ifstream file(path, std::ios::binary | std::ios::ate);
    if (!file.is_open()) {
        LOG_ERROR("Cannot open file for hashing: " + path);
        return "";
    }

    std::streamoff size = file.tellg();
    if (size < 0) {
        LOG_ERROR("Cannot determine size of: " + path);
        return "";
    }
    file.seekg(0, std::ios::beg);

    std::string fingerprint = fingerprintStream(file, static_cast<int64_t>(size));
    if (fingerprint.empty()) {
        LOG_ERROR("Failed to hash file: " + path);
    }
    return fingerprint;
}

std::string FingerprintEngine::fingerprintBytes(const std::string& data) const {
    std::istringstream in(data);
    return fingerprintStream(in, static_cast<int64_t>(data.size()));
}

std::string FingerprintEngine::fingerprintStream(std::istream& in, int64_t size) const {
    try {
        if (m_mode == HashMode::Fast) {
            return hashSampled(in, size);
        }
        return hashFull(in);
    } catch (const std::exception& e) {
        LOG_ERROR("Fingerprint computation failed: " + std::string(e.what()));
        return "";
    }
}

std::string FingerprintEngine::hashFull(std::istream& in) const {
    DigestContext ctx = newSha256Context();
    std::vector<char> buffer(READ_BUFFER_SIZE);

    while (in) {
        in.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
        std::streamsize got = in.gcount();
        if (got > 0) {
            digestUpdate(ctx.get(), buffer.data(), static_cast<size_t>(got));
        }
    }

    if (in.bad()) {
        throw std::runtime_error("read error");
    }

    return digestFinalHex(ctx.get());
}

std::string FingerprintEngine::hashSampled(std::istream& in, int64_t size) const {
    DigestContext ctx = newSha256Context();

    std::string sizeText = std::to_string(size);
    digestUpdate(ctx.get(), sizeText.data(), sizeText.size());

    // Cabeza
    digestRange(ctx.get(), in, 0, std::min(m_sampleSize, size));

    if (size > 3 * m_sampleSize) {
        // Medio
        digestRange(ctx.get(), in, size / 2 - m_sampleSize / 2, m_sampleSize);
        // Cola
        digestRange(ctx.get(), in, std::max<int64_t>(0, size - m_sampleSize), m_sampleSize);
    }

    return digestFinalHex(ctx.get());
}

bool FingerprintEngine::verifyFile(const std::string& path, const std::string& expected) const {
    if (expected.empty()) {
        return false;
    }
    std::string actual = fingerprintFile(path);
    if (actual.empty()) {
        return false;
    }
    if (actual != expected) {
        LOG_WARNING("Fingerprint mismatch for " + path + ": expected " + expected + ", got " + actual);
        return false;
    }
    return true;
}

std::string FingerprintEngine::sha256Hex(const std::string& data) {
    try {
        DigestContext ctx = newSha256Context();
        digestUpdate(ctx.get(), data.data(), data.size());
        return digestFinalHex(ctx.get());
    } catch (const std::exception& e) {
        LOG_ERROR("SHA-256 failed: " + std::string(e.what()));
        return "";
    }
}

} // namespace MediaVault
