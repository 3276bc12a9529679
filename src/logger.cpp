#include "logger.h"
#include <filesystem>
#include <iomanip>
#include <algorithm>

namespace MediaVault {

Logger& Logger::instance() {
    static Logger instance;
    return instance;
}

Logger::Logger() : m_minLevel(LogLevel::LOG_INFO), m_console(true) {
    // El archivo se abre cuando la configuración indica LOG_PATH (setLogFile)
}

Logger::~Logger() {
    if (m_logFile.is_open()) {
        m_logFile << "[" << getCurrentTimestamp() << "] [INFO] Log session ended" << std::endl;
        m_logFile.close();
    }
}

bool Logger::setLogFile(const std::string& filename) {
    std::lock_guard<std::mutex> lock(m_mutex);

    if (m_logFile.is_open()) {
        m_logFile.close();
    }

    std::error_code ec;
    std::filesystem::path parent = std::filesystem::path(filename).parent_path();
    if (!parent.empty()) {
        std::filesystem::create_directories(parent, ec);
    }

    m_logFilename = filename;
    m_logFile.open(filename, std::ios::out | std::ios::app);

    if (!m_logFile.is_open()) {
        std::cerr << "Failed to open log file: " << filename << std::endl;
        return false;
    }

    m_logFile << "[" << getCurrentTimestamp() << "] [INFO] "
              << "MediaVault - Log session started" << std::endl;
    return true;
}

void Logger::setLogLevel(LogLevel level) {
    m_minLevel = level;
}

void Logger::setConsoleOutput(bool enabled) {
    m_console = enabled;
}

std::string Logger::logFile() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_logFilename;
}

LogLevel Logger::parseLevel(const std::string& name) {
    std::string upper = name;
    std::transform(upper.begin(), upper.end(), upper.begin(), ::toupper);

    if (upper == "DEBUG") return LogLevel::LOG_DEBUG;
    if (upper == "WARNING" || upper == "WARN") return LogLevel::LOG_WARNING;
    if (upper == "ERROR") return LogLevel::LOG_ERROR;
    if (upper == "CRITICAL") return LogLevel::LOG_CRITICAL;
    return LogLevel::LOG_INFO;
}

std::string Logger::getCurrentTimestamp() const {
    auto now = std::time(nullptr);
    std::tm tm{};
    localtime_r(&now, &tm);

    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y-%m-%d %H:%M:%S");
    return oss.str();
}

std::string Logger::levelToString(LogLevel level) const {
    switch (level) {
        case LogLevel::LOG_DEBUG: return "DEBUG";
        case LogLevel::LOG_INFO: return "INFO";
        case LogLevel::LOG_WARNING: return "WARNING";
        case LogLevel::LOG_ERROR: return "ERROR";
        case LogLevel::LOG_CRITICAL: return "CRITICAL";
    }
    return "UNKNOWN";
}

void Logger::log(LogLevel level, const std::string& message) {
    if (level < m_minLevel.load()) {
        return;
    }

    std::lock_guard<std::mutex> lock(m_mutex);

    std::string logLine = "[" + getCurrentTimestamp() + "] [" + levelToString(level) + "] " + message;

    // Escribir a archivo
    if (m_logFile.is_open()) {
        m_logFile << logLine << std::endl;
        m_logFile.flush();
    }

    if (!m_console) {
        return;
    }

    if (level >= LogLevel::LOG_WARNING) {
        std::cerr << logLine << std::endl;
    } else {
        std::cout << logLine << std::endl;
    }
}

void Logger::debug(const std::string& message) {
    log(LogLevel::LOG_DEBUG, message);
}

void Logger::info(const std::string& message) {
    log(LogLevel::LOG_INFO, message);
}

void Logger::warning(const std::string& message) {
    log(LogLevel::LOG_WARNING, message);
}

void Logger::error(const std::string& message) {
    log(LogLevel::LOG_ERROR, message);
}

void Logger::critical(const std::string& message) {
    log(LogLevel::LOG_CRITICAL, message);
}

} // namespace MediaVault
