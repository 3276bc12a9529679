#include "config.h"
#include "logger.h"
#include <fstream>
#include <sstream>
#include <algorithm>
#include <cstdlib>
#include <stdexcept>

namespace MediaVault {

namespace {

// Claves reconocidas, en el orden en que se aplican
const char* const CONFIG_KEYS[] = {
    "BACKUP_ROOT", "ENCRYPTED_ROOT", "TEMP_ROOT", "DB_PATH", "KEY_PATH",
    "USE_FAST_HASH", "FAST_HASH_SAMPLE_SIZE", "ENCRYPT_ORIGINALS",
    "UPLOAD_CHUNK_SIZE", "MAX_UPLOAD_SIZE", "SESSION_RETENTION_HOURS",
    "COMPLETED_SESSION_RETENTION_DAYS", "MAX_CONCURRENT_INGESTIONS",
    "LOG_LEVEL", "LOG_PATH"
};

} // namespace

Config& Config::instance() {
    static Config instance;
    return instance;
}

Config::Config() {
    reload();
}

void Config::reload(const std::string& envPath) {
    setDefaults();
    loadFromFile(envPath);
    loadFromEnvironment();
    validateConfiguration();
}

void Config::setDefaults() {
    m_backupRoot = "./MediaVault";
    m_encryptedRoot = m_backupRoot + "/encrypted";
    m_tempRoot = m_backupRoot + "/temp_uploads";
    m_databasePath = m_backupRoot + "/backup_metadata.db";
    m_keyPath = m_backupRoot + "/.encryption_key";
    m_useFastHash = false;
    m_fastHashSampleSize = DEFAULT_FAST_HASH_SAMPLE_SIZE;
    m_encryptOriginals = false;
    m_uploadChunkSize = DEFAULT_UPLOAD_CHUNK_SIZE;
    m_maxUploadSize = DEFAULT_MAX_UPLOAD_SIZE;
    m_sessionRetentionHours = DEFAULT_SESSION_RETENTION_HOURS;
    m_completedSessionRetentionDays = DEFAULT_COMPLETED_SESSION_RETENTION_DAYS;
    m_maxConcurrentIngestions = DEFAULT_MAX_CONCURRENT_INGESTIONS;
    m_logLevel = "INFO";
    m_logPath = m_backupRoot + "/logs/media_vault.log";
    m_validationError.clear();
    m_loadedFrom.clear();
}

std::string Config::trim(const std::string& str) const {
    size_t start = str.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) return "";

    size_t end = str.find_last_not_of(" \t\r\n");
    return str.substr(start, end - start + 1);
}

std::string Config::parseEnvValue(const std::string& value) const {
    std::string result = trim(value);

    // Remover comillas simples o dobles
    if (result.length() >= 2) {
        if ((result.front() == '\'' && result.back() == '\'') ||
            (result.front() == '"' && result.back() == '"')) {
            result = result.substr(1, result.length() - 2);
        }
    }

    return result;
}

bool Config::parseBool(const std::string& value) const {
    std::string lower = value;
    std::transform(lower.begin(), lower.end(), lower.begin(), ::tolower);
    return lower == "1" || lower == "true" || lower == "yes" || lower == "on";
}

std::map<std::string, std::string> Config::parseEnvFile(const std::string& path) const {
    std::map<std::string, std::string> values;

    std::ifstream file(path);
    if (!file.is_open()) {
        return values;
    }

    std::string line;
    while (std::getline(file, line)) {
        line = trim(line);

        // Ignorar líneas vacías y comentarios
        if (line.empty() || line[0] == '#') {
            continue;
        }

        size_t equalPos = line.find('=');
        if (equalPos == std::string::npos) {
            continue;
        }

        std::string key = trim(line.substr(0, equalPos));
        values[key] = parseEnvValue(line.substr(equalPos + 1));
    }

    return values;
}

void Config::loadFromFile(const std::string& envPath) {
    std::vector<std::string> possiblePaths;
    if (!envPath.empty()) {
        possiblePaths.push_back(envPath);
    } else {
        possiblePaths = {".env", "../.env"};
    }

    for (const auto& path : possiblePaths) {
        std::ifstream envFile(path);
        if (!envFile.is_open()) {
            continue;
        }
        envFile.close();

        apply(parseEnvFile(path));
        m_loadedFrom = path;
        LOG_DEBUG("Configuration loaded from " + path);
        return;
    }

    LOG_DEBUG(".env file not found, using defaults and environment");
}

void Config::loadFromEnvironment() {
    std::map<std::string, std::string> values;

    for (const char* key : CONFIG_KEYS) {
        const char* value = std::getenv(key);
        if (value && *value) {
            values[key] = value;
        }
    }

    apply(values);
}

void Config::apply(const std::map<std::string, std::string>& values) {
    auto get = [&values](const char* key) -> std::string {
        auto it = values.find(key);
        return it != values.end() ? it->second : std::string();
    };

    std::string value;

    try {
        // BACKUP_ROOT arrastra las rutas derivadas salvo que se indiquen explícitamente
        if (!(value = get("BACKUP_ROOT")).empty()) {
            m_backupRoot = value;
            m_encryptedRoot = m_backupRoot + "/encrypted";
            m_tempRoot = m_backupRoot + "/temp_uploads";
            m_databasePath = m_backupRoot + "/backup_metadata.db";
            m_keyPath = m_backupRoot + "/.encryption_key";
            m_logPath = m_backupRoot + "/logs/media_vault.log";
        }
        if (!(value = get("ENCRYPTED_ROOT")).empty()) m_encryptedRoot = value;
        if (!(value = get("TEMP_ROOT")).empty()) m_tempRoot = value;
        if (!(value = get("DB_PATH")).empty()) m_databasePath = value;
        if (!(value = get("KEY_PATH")).empty()) m_keyPath = value;
        if (!(value = get("USE_FAST_HASH")).empty()) m_useFastHash = parseBool(value);
        if (!(value = get("FAST_HASH_SAMPLE_SIZE")).empty()) m_fastHashSampleSize = std::stoll(value);
        if (!(value = get("ENCRYPT_ORIGINALS")).empty()) m_encryptOriginals = parseBool(value);
        if (!(value = get("UPLOAD_CHUNK_SIZE")).empty()) m_uploadChunkSize = std::stoll(value);
        if (!(value = get("MAX_UPLOAD_SIZE")).empty()) m_maxUploadSize = std::stoll(value);
        if (!(value = get("SESSION_RETENTION_HOURS")).empty()) m_sessionRetentionHours = std::stoi(value);
        if (!(value = get("COMPLETED_SESSION_RETENTION_DAYS")).empty()) m_completedSessionRetentionDays = std::stoi(value);
        if (!(value = get("MAX_CONCURRENT_INGESTIONS")).empty()) m_maxConcurrentIngestions = std::stoi(value);
        if (!(value = get("LOG_LEVEL")).empty()) m_logLevel = value;
        if (!(value = get("LOG_PATH")).empty()) m_logPath = value;
    } catch (const std::exception& e) {
        m_validationError = "Invalid numeric value '" + value + "': " + e.what();
    }
}

void Config::validateConfiguration() {
    // Un error de parseo previo tiene prioridad
    if (!m_validationError.empty()) {
        LOG_ERROR("Configuration invalid: " + m_validationError);
        return;
    }

    if (m_backupRoot.empty()) {
        m_validationError = "BACKUP_ROOT is required";
    } else if (m_fastHashSampleSize <= 0) {
        m_validationError = "Invalid FAST_HASH_SAMPLE_SIZE";
    } else if (m_uploadChunkSize <= 0) {
        m_validationError = "Invalid UPLOAD_CHUNK_SIZE";
    } else if (m_maxUploadSize <= 0) {
        m_validationError = "Invalid MAX_UPLOAD_SIZE";
    } else if (m_sessionRetentionHours <= 0) {
        m_validationError = "Invalid SESSION_RETENTION_HOURS";
    } else if (m_completedSessionRetentionDays < 0) {
        m_validationError = "Invalid COMPLETED_SESSION_RETENTION_DAYS";
    } else if (m_maxConcurrentIngestions < 1) {
        m_validationError = "Invalid MAX_CONCURRENT_INGESTIONS";
    }

    if (!m_validationError.empty()) {
        LOG_ERROR("Configuration invalid: " + m_validationError);
        return;
    }

    if (m_useFastHash) {
        LOG_WARNING("USE_FAST_HASH is enabled: fingerprints sample head/middle/tail of " +
                    std::to_string(m_fastHashSampleSize) + " bytes plus size. "
                    "Files differing only outside the samples will be treated as duplicates.");
    }
}

bool Config::isValid() const {
    return m_validationError.empty();
}

} // namespace MediaVault
