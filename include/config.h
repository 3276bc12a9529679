#ifndef CONFIG_H
#define CONFIG_H

#include <string>
#include <vector>
#include <map>
#include <cstdint>

namespace MediaVault {

/**
 * @brief Configuración global de la aplicación
 *
 * Se carga desde un archivo .env (KEY=VALUE) y luego se sobreescribe con
 * variables de entorno. Los componentes reciben sus opciones ya resueltas,
 * no consultan este singleton directamente.
 */
class Config {
public:
    static Config& instance();

    // Recarga desde un archivo concreto (vacío = rutas por defecto)
    void reload(const std::string& envPath = "");

    // Storage
    std::string backupRoot() const { return m_backupRoot; }
    std::string encryptedRoot() const { return m_encryptedRoot; }
    std::string tempRoot() const { return m_tempRoot; }
    std::string databasePath() const { return m_databasePath; }
    std::string keyPath() const { return m_keyPath; }

    // Deduplication
    bool useFastHash() const { return m_useFastHash; }
    int64_t fastHashSampleSize() const { return m_fastHashSampleSize; }

    // Encryption
    bool encryptOriginals() const { return m_encryptOriginals; }

    // Upload protocol
    int64_t uploadChunkSize() const { return m_uploadChunkSize; }
    int64_t maxUploadSize() const { return m_maxUploadSize; }
    int sessionRetentionHours() const { return m_sessionRetentionHours; }
    int completedSessionRetentionDays() const { return m_completedSessionRetentionDays; }

    // Performance
    int maxConcurrentIngestions() const { return m_maxConcurrentIngestions; }

    // Logging
    std::string logLevel() const { return m_logLevel; }
    std::string logPath() const { return m_logPath; }

    // Validation
    bool isValid() const;
    std::string validationError() const { return m_validationError; }
    std::string loadedFrom() const { return m_loadedFrom; }

    // Constants
    static constexpr int64_t DEFAULT_FAST_HASH_SAMPLE_SIZE = 1024 * 1024; // 1MB
    static constexpr int64_t DEFAULT_UPLOAD_CHUNK_SIZE = 10 * 1024 * 1024; // 10MB
    static constexpr int64_t DEFAULT_MAX_UPLOAD_SIZE = 5LL * 1024 * 1024 * 1024; // 5GB
    static constexpr int DEFAULT_SESSION_RETENTION_HOURS = 24;
    static constexpr int DEFAULT_COMPLETED_SESSION_RETENTION_DAYS = 7;
    static constexpr int DEFAULT_MAX_CONCURRENT_INGESTIONS = 1;

private:
    Config();
    ~Config() = default;
    Config(const Config&) = delete;
    Config& operator=(const Config&) = delete;

    void setDefaults();
    void loadFromFile(const std::string& envPath);
    void loadFromEnvironment();
    void apply(const std::map<std::string, std::string>& values);
    void validateConfiguration();

    std::map<std::string, std::string> parseEnvFile(const std::string& path) const;
    std::string parseEnvValue(const std::string& value) const;
    std::string trim(const std::string& str) const;
    bool parseBool(const std::string& value) const;

    // Storage
    std::string m_backupRoot;
    std::string m_encryptedRoot;
    std::string m_tempRoot;
    std::string m_databasePath;
    std::string m_keyPath;

    // Deduplication
    bool m_useFastHash;
    int64_t m_fastHashSampleSize;

    // Encryption
    bool m_encryptOriginals;

    // Upload protocol
    int64_t m_uploadChunkSize;
    int64_t m_maxUploadSize;
    int m_sessionRetentionHours;
    int m_completedSessionRetentionDays;

    // Performance
    int m_maxConcurrentIngestions;

    // Logging
    std::string m_logLevel;
    std::string m_logPath;

    // Validation
    std::string m_validationError;
    std::string m_loadedFrom;
};

} // namespace MediaVault

#endif // CONFIG_H
