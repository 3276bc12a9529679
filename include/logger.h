#ifndef LOGGER_H
#define LOGGER_H

#include <string>
#include <fstream>
#include <mutex>
#include <atomic>
#include <ctime>
#include <sstream>
#include <iostream>

namespace MediaVault {

enum class LogLevel {
    LOG_DEBUG,
    LOG_INFO,
    LOG_WARNING,
    LOG_ERROR,
    LOG_CRITICAL
};

class Logger {
public:
    static Logger& instance();

    void log(LogLevel level, const std::string& message);
    void debug(const std::string& message);
    void info(const std::string& message);
    void warning(const std::string& message);
    void error(const std::string& message);
    void critical(const std::string& message);

    // Abre (o cambia) el archivo de log; crea el directorio padre si hace falta
    bool setLogFile(const std::string& filename);
    void setLogLevel(LogLevel level);
    void setConsoleOutput(bool enabled);

    std::string logFile() const;

    static LogLevel parseLevel(const std::string& name);

private:
    Logger();
    ~Logger();
    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    std::string getCurrentTimestamp() const;
    std::string levelToString(LogLevel level) const;

    std::ofstream m_logFile;
    std::atomic<LogLevel> m_minLevel;
    std::atomic<bool> m_console;
    mutable std::mutex m_mutex;
    std::string m_logFilename;
};

// Conmutador de logs en código fuente
// El build define MEDIA_VAULT_LOGS=1; sin definir, los logs quedan desactivados
#ifndef MEDIA_VAULT_LOGS
#define MEDIA_VAULT_LOGS_ON 1
#define MEDIA_VAULT_LOGS_OFF 0
#define MEDIA_VAULT_LOGS MEDIA_VAULT_LOGS_OFF
#endif

// Macros para facilitar el uso (no-op si los logs están OFF)
#if MEDIA_VAULT_LOGS
#define LOG_DEBUG(msg) MediaVault::Logger::instance().debug(msg)
#define LOG_INFO(msg) MediaVault::Logger::instance().info(msg)
#define LOG_WARNING(msg) MediaVault::Logger::instance().warning(msg)
#define LOG_ERROR(msg) MediaVault::Logger::instance().error(msg)
#define LOG_CRITICAL(msg) MediaVault::Logger::instance().critical(msg)
#else
#define LOG_DEBUG(msg) do { (void)0; } while(0)
#define LOG_INFO(msg) do { (void)0; } while(0)
#define LOG_WARNING(msg) do { (void)0; } while(0)
#define LOG_ERROR(msg) do { (void)0; } while(0)
#define LOG_CRITICAL(msg) do { (void)0; } while(0)
#endif

} // namespace MediaVault

#endif // LOGGER_H
