#ifndef DATABASE_H
#define DATABASE_H

#include <string>
#include <vector>
#include <mutex>
#include <thread>
#include <unordered_map>
#include <cstdint>
#include <sqlite3.h>

namespace MediaVault {

enum class MediaKind {
    Photo,
    Video
};

enum class IngestMethod {
    LocalCable,
    NetworkUpload
};

enum class SessionStatus {
    InProgress,
    Completed,
    Failed,
    Paused
};

enum class SyncKind {
    Manual,
    Scheduled
};

enum class SyncStatus {
    InProgress,
    Success,
    Partial,
    Failed
};

// Resultado de una búsqueda: distingue "no existe" de "la BD falló"
enum class LookupResult {
    Found,
    NotFound,
    Error
};

// Una fila por contenido distinto (fingerprint único)
struct FileRecord {
    int64_t id = 0;
    std::string fingerprint;
    std::string originalFilename;
    int64_t fileSize = 0;
    MediaKind mediaKind = MediaKind::Photo;
    std::string mimeType;
    int64_t captureTime = 0;      // epoch; 0 = sin fecha de captura
    int year = 0;
    int month = 0;
    std::string backupPath;
    std::string encryptedPath;
    bool isEncrypted = false;
    int64_t createdAt = 0;
    int64_t lastVerified = 0;     // 0 = nunca verificado
    std::string sourceDevice;
    IngestMethod ingestMethod = IngestMethod::LocalCable;
    std::string uploadSessionId;
};

struct UploadSession {
    std::string sessionId;
    std::string fileName;
    int64_t fileSize = 0;
    std::string fingerprint;
    int64_t receivedBytes = 0;
    int64_t totalChunks = 0;
    int64_t receivedChunks = 0;
    SessionStatus status = SessionStatus::InProgress;
    std::string tempPath;
    int64_t createdAt = 0;
    int64_t updatedAt = 0;
    int64_t completedAt = 0;
    std::string errorMessage;
    int retryCount = 0;
};

struct SyncRecord {
    int64_t id = 0;
    SyncKind kind = SyncKind::Manual;
    SyncStatus status = SyncStatus::InProgress;
    int64_t filesProcessed = 0;
    int64_t filesBackedUp = 0;
    int64_t filesSkipped = 0;
    int64_t filesFailed = 0;
    int64_t totalBytes = 0;
    int64_t startedAt = 0;
    int64_t completedAt = 0;
    int64_t durationSeconds = 0;
    std::string sourceDevice;
    std::string destinationPath;
    std::string errorMessage;
};

struct SyncStatistics {
    int64_t totalSyncs = 0;
    int64_t successfulSyncs = 0;
    int64_t totalFilesBackedUp = 0;
};

std::string mediaKindToString(MediaKind kind);
MediaKind stringToMediaKind(const std::string& str);
std::string ingestMethodToString(IngestMethod method);
IngestMethod stringToIngestMethod(const std::string& str);
std::string sessionStatusToString(SessionStatus status);
SessionStatus stringToSessionStatus(const std::string& str);
std::string syncKindToString(SyncKind kind);
SyncKind stringToSyncKind(const std::string& str);
std::string syncStatusToString(SyncStatus status);
SyncStatus stringToSyncStatus(const std::string& str);

/**
 * @brief Manejo de base de datos SQLite
 *
 * Fuente de verdad única para archivos respaldados, sesiones de subida y
 * ejecuciones de backup. Cada operación de lectura-modificación-escritura
 * se ejecuta en su propia transacción corta.
 */
class Database {
public:
    Database();
    ~Database();

    bool initialize(const std::string& dbPath);
    void close();
    bool isOpen() const;
    bool setupTables();

    static int64_t now();

    // File records
    bool insertFileRecord(const FileRecord& record, bool* duplicate = nullptr);
    LookupResult getFileByFingerprint(const std::string& fingerprint, FileRecord& record);
    std::vector<FileRecord> getFilesByMonth(int year, int month);
    std::vector<FileRecord> getFilesInRange(int64_t fromEpoch, int64_t toEpoch);
    std::vector<FileRecord> getAllFiles();
    bool updateLastVerified(const std::string& fingerprint, int64_t verifiedAt);
    bool deleteFileRecord(const std::string& fingerprint);
    int64_t getTotalFilesCount();
    int64_t getTotalStorageUsed();

    // Upload sessions
    bool createUploadSession(const UploadSession& session);
    LookupResult getUploadSession(const std::string& sessionId, UploadSession& session);
    bool recordReceivedChunk(const std::string& sessionId, int64_t chunkIndex,
                             int64_t chunkSize, bool& inserted);
    bool removeReceivedChunk(const std::string& sessionId, int64_t chunkIndex);
    bool getReceivedChunks(const std::string& sessionId, std::vector<int64_t>& chunks);
    bool updateSessionStatus(const std::string& sessionId, SessionStatus status);
    bool completeUploadSession(const std::string& sessionId, const std::string& fingerprint);
    bool failUploadSession(const std::string& sessionId, const std::string& errorMessage);
    bool incrementSessionRetry(const std::string& sessionId);
    std::vector<UploadSession> getIncompleteSessions();
    std::vector<UploadSession> getStaleSessions(int64_t cutoffEpoch);
    int purgeTerminalSessions(int64_t cutoffEpoch);
    bool markAllActiveSessionsAsPaused();

    // Sync history
    bool createSyncRecord(SyncRecord& record);
    bool updateSyncRecord(const SyncRecord& record);
    std::vector<SyncRecord> getRecentSyncs(int limit = 10);
    bool getSyncStatistics(SyncStatistics& stats);

    // Último error registrado por el hilo que llama
    std::string lastError() const;

private:
    sqlite3* m_db;
    std::string m_dbPath;
    mutable std::mutex m_mutex;
    mutable std::mutex m_errorsMutex;
    mutable std::unordered_map<std::thread::id, std::string> m_threadErrors;

    bool executeQuery(const std::string& query);
    std::string getLastError() const;
    void recordError(const std::string& message) const;
    void reportSqliteError(const std::string& context) const;

    std::vector<FileRecord> queryFiles(const std::string& sql,
                                       const std::vector<int64_t>& params);
    std::vector<UploadSession> querySessions(const std::string& sql,
                                             const std::vector<int64_t>& params);
    static FileRecord readFileRow(sqlite3_stmt* stmt);
    static UploadSession readSessionRow(sqlite3_stmt* stmt);
    static SyncRecord readSyncRow(sqlite3_stmt* stmt);
};

} // namespace MediaVault

#endif // DATABASE_H
