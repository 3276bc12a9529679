#include "database.h"
#include "logger.h"
#include <iostream>
#include <filesystem>
#include <chrono>
#include <thread>

namespace MediaVault {

namespace {

const char* FILE_COLUMNS =
    "id, fingerprint, original_filename, file_size, media_kind, mime_type, "
    "capture_time, year, month, backup_path, encrypted_path, is_encrypted, "
    "created_at, last_verified, source_device, ingest_method, upload_session_id";

const char* SESSION_COLUMNS =
    "session_id, filename, file_size, fingerprint, received_bytes, total_chunks, "
    "received_chunks, status, temp_path, created_at, updated_at, completed_at, "
    "error_message, retry_count";

const char* SYNC_COLUMNS =
    "id, sync_type, status, files_processed, files_backed_up, files_skipped, "
    "files_failed, total_size_bytes, started_at, completed_at, duration_seconds, "
    "source_device, destination_path, error_message";

std::string columnText(sqlite3_stmt* stmt, int column) {
    const char* text = reinterpret_cast<const char*>(sqlite3_column_text(stmt, column));
    return text ? text : "";
}

void bindOptionalText(sqlite3_stmt* stmt, int index, const std::string& value) {
    if (value.empty()) {
        sqlite3_bind_null(stmt, index);
    } else {
        sqlite3_bind_text(stmt, index, value.c_str(), -1, SQLITE_TRANSIENT);
    }
}

void bindOptionalInt64(sqlite3_stmt* stmt, int index, int64_t value) {
    if (value == 0) {
        sqlite3_bind_null(stmt, index);
    } else {
        sqlite3_bind_int64(stmt, index, value);
    }
}

} // namespace

// ============================================================================
// Conversión de enums
// ============================================================================

std::string mediaKindToString(MediaKind kind) {
    return kind == MediaKind::Video ? "video" : "photo";
}

MediaKind stringToMediaKind(const std::string& str) {
    return str == "video" ? MediaKind::Video : MediaKind::Photo;
}

std::string ingestMethodToString(IngestMethod method) {
    return method == IngestMethod::NetworkUpload ? "network_upload" : "local_cable";
}

IngestMethod stringToIngestMethod(const std::string& str) {
    return str == "network_upload" ? IngestMethod::NetworkUpload : IngestMethod::LocalCable;
}

std::string sessionStatusToString(SessionStatus status) {
    switch (status) {
        case SessionStatus::InProgress: return "in_progress";
        case SessionStatus::Completed: return "completed";
        case SessionStatus::Failed: return "failed";
        case SessionStatus::Paused: return "paused";
    }
    return "in_progress";
}

SessionStatus stringToSessionStatus(const std::string& str) {
    if (str == "completed") return SessionStatus::Completed;
    if (str == "failed") return SessionStatus::Failed;
    if (str == "paused") return SessionStatus::Paused;
    return SessionStatus::InProgress;
}

std::string syncKindToString(SyncKind kind) {
    return kind == SyncKind::Scheduled ? "scheduled" : "manual";
}

SyncKind stringToSyncKind(const std::string& str) {
    return str == "scheduled" ? SyncKind::Scheduled : SyncKind::Manual;
}

std::string syncStatusToString(SyncStatus status) {
    switch (status) {
        case SyncStatus::InProgress: return "in_progress";
        case SyncStatus::Success: return "success";
        case SyncStatus::Partial: return "partial";
        case SyncStatus::Failed: return "failed";
    }
    return "in_progress";
}

SyncStatus stringToSyncStatus(const std::string& str) {
    if (str == "success") return SyncStatus::Success;
    if (str == "partial") return SyncStatus::Partial;
    if (str == "failed") return SyncStatus::Failed;
    return SyncStatus::InProgress;
}

// ============================================================================
// Database
// ============================================================================

Database::Database() : m_db(nullptr) {
}

Database::~Database() {
    close();
}

int64_t Database::now() {
    return std::chrono::duration_cast<std::chrono::seconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
}

bool Database::initialize(const std::string& dbPath) {
    std::lock_guard<std::mutex> lock(m_mutex);

    m_dbPath = dbPath;

    LOG_INFO("Initializing database at: " + dbPath);

    // Crear directorio si no existe
    try {
        std::filesystem::path dbDir = std::filesystem::path(dbPath).parent_path();

        if (!dbDir.empty() && !std::filesystem::exists(dbDir)) {
            LOG_INFO("Creating database directory: " + dbDir.string());
            std::filesystem::create_directories(dbDir);
        }
    } catch (const std::exception& e) {
        LOG_ERROR("Failed to create database directory: " + std::string(e.what()));
        return false;
    }

    int rc = sqlite3_open(dbPath.c_str(), &m_db);
    if (rc != SQLITE_OK) {
        reportSqliteError("Failed to open database");
        sqlite3_close(m_db);
        m_db = nullptr;
        return false;
    }

    LOG_INFO("Database opened successfully: " + dbPath);

    sqlite3_busy_timeout(m_db, 5000);

    const char* pragmas[] = {
        "PRAGMA foreign_keys = ON",
        "PRAGMA journal_mode = WAL",
        "PRAGMA synchronous = NORMAL"
    };

    for (const char* pragma : pragmas) {
        char* errMsg = nullptr;
        rc = sqlite3_exec(m_db, pragma, nullptr, nullptr, &errMsg);
        if (rc != SQLITE_OK) {
            LOG_WARNING("Failed to apply pragma '" + std::string(pragma) + "': " +
                        std::string(errMsg ? errMsg : "unknown"));
            sqlite3_free(errMsg);
        }
    }

    bool tablesCreated = setupTables();
    if (tablesCreated) {
        LOG_INFO("Database tables created successfully");
    } else {
        LOG_ERROR("Failed to create database tables");
    }

    return tablesCreated;
}

void Database::close() {
    if (m_db) {
        sqlite3_close(m_db);
        m_db = nullptr;
    }
}

bool Database::isOpen() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_db != nullptr;
}

bool Database::setupTables() {
    LOG_DEBUG("Creating database tables...");

    std::string createFilesTable =
        "CREATE TABLE IF NOT EXISTS backed_up_files ("
        "id INTEGER PRIMARY KEY AUTOINCREMENT,"
        "fingerprint TEXT NOT NULL UNIQUE,"
        "original_filename TEXT NOT NULL,"
        "file_size INTEGER NOT NULL,"
        "media_kind TEXT NOT NULL,"
        "mime_type TEXT,"
        "capture_time INTEGER,"
        "year INTEGER NOT NULL,"
        "month INTEGER NOT NULL,"
        "backup_path TEXT NOT NULL,"
        "encrypted_path TEXT,"
        "is_encrypted INTEGER DEFAULT 0,"
        "created_at INTEGER NOT NULL,"
        "last_verified INTEGER,"
        "source_device TEXT,"
        "ingest_method TEXT,"
        "upload_session_id TEXT);";

    std::string createSessionsTable =
        "CREATE TABLE IF NOT EXISTS upload_sessions ("
        "session_id TEXT PRIMARY KEY,"
        "filename TEXT NOT NULL,"
        "file_size INTEGER NOT NULL,"
        "fingerprint TEXT,"
        "received_bytes INTEGER DEFAULT 0,"
        "total_chunks INTEGER NOT NULL,"
        "received_chunks INTEGER DEFAULT 0,"
        "status TEXT DEFAULT 'in_progress',"
        "temp_path TEXT,"
        "created_at INTEGER NOT NULL,"
        "updated_at INTEGER NOT NULL,"
        "completed_at INTEGER,"
        "error_message TEXT,"
        "retry_count INTEGER DEFAULT 0);";

    std::string createSessionChunksTable =
        "CREATE TABLE IF NOT EXISTS session_chunks ("
        "session_id TEXT NOT NULL,"
        "chunk_index INTEGER NOT NULL,"
        "chunk_size INTEGER NOT NULL,"
        "received_at INTEGER NOT NULL,"
        "PRIMARY KEY (session_id, chunk_index),"
        "FOREIGN KEY (session_id) REFERENCES upload_sessions(session_id) ON DELETE CASCADE);";

    std::string createSyncTable =
        "CREATE TABLE IF NOT EXISTS sync_history ("
        "id INTEGER PRIMARY KEY AUTOINCREMENT,"
        "sync_type TEXT NOT NULL,"
        "status TEXT NOT NULL,"
        "files_processed INTEGER DEFAULT 0,"
        "files_backed_up INTEGER DEFAULT 0,"
        "files_skipped INTEGER DEFAULT 0,"
        "files_failed INTEGER DEFAULT 0,"
        "total_size_bytes INTEGER DEFAULT 0,"
        "started_at INTEGER NOT NULL,"
        "completed_at INTEGER,"
        "duration_seconds INTEGER,"
        "source_device TEXT,"
        "destination_path TEXT,"
        "error_message TEXT);";

    const char* indexes[] = {
        "CREATE INDEX IF NOT EXISTS idx_year_month ON backed_up_files(year, month)",
        "CREATE INDEX IF NOT EXISTS idx_capture_time ON backed_up_files(capture_time)",
        "CREATE INDEX IF NOT EXISTS idx_session_status ON upload_sessions(status, updated_at)",
        "CREATE INDEX IF NOT EXISTS idx_sync_date ON sync_history(started_at)"
    };

    if (!executeQuery(createFilesTable)) {
        LOG_ERROR("Failed to create backed_up_files table");
        return false;
    }
    if (!executeQuery(createSessionsTable)) {
        LOG_ERROR("Failed to create upload_sessions table");
        return false;
    }
    if (!executeQuery(createSessionChunksTable)) {
        LOG_ERROR("Failed to create session_chunks table");
        return false;
    }
    if (!executeQuery(createSyncTable)) {
        LOG_ERROR("Failed to create sync_history table");
        return false;
    }

    for (const char* index : indexes) {
        if (!executeQuery(index)) {
            return false;
        }
    }

    return true;
}

bool Database::executeQuery(const std::string& query) {
    if (!m_db) {
        recordError("Database not initialized");
        return false;
    }

    char* errMsg = nullptr;
    int rc = sqlite3_exec(m_db, query.c_str(), nullptr, nullptr, &errMsg);

    if (rc != SQLITE_OK) {
        recordError("SQL error: " + std::string(errMsg ? errMsg : "unknown"));
        sqlite3_free(errMsg);
        return false;
    }

    return true;
}

std::string Database::getLastError() const {
    if (m_db) {
        return sqlite3_errmsg(m_db);
    }
    return "Database not initialized";
}

// El mensaje se guarda por hilo: otro hilo no puede pisarlo antes de leerlo
void Database::recordError(const std::string& message) const {
    {
        std::lock_guard<std::mutex> lock(m_errorsMutex);
        m_threadErrors[std::this_thread::get_id()] = message;
    }
    LOG_ERROR(message);
}

void Database::reportSqliteError(const std::string& context) const {
    recordError(context + ": " + getLastError());
}

std::string Database::lastError() const {
    std::lock_guard<std::mutex> lock(m_errorsMutex);
    auto it = m_threadErrors.find(std::this_thread::get_id());
    if (it == m_threadErrors.end()) {
        return "Unknown database error";
    }
    return it->second;
}

// ============================================================================
// File records
// ============================================================================

FileRecord Database::readFileRow(sqlite3_stmt* stmt) {
    FileRecord record;
    record.id = sqlite3_column_int64(stmt, 0);
    record.fingerprint = columnText(stmt, 1);
    record.originalFilename = columnText(stmt, 2);
    record.fileSize = sqlite3_column_int64(stmt, 3);
    record.mediaKind = stringToMediaKind(columnText(stmt, 4));
    record.mimeType = columnText(stmt, 5);
    record.captureTime = sqlite3_column_int64(stmt, 6);
    record.year = sqlite3_column_int(stmt, 7);
    record.month = sqlite3_column_int(stmt, 8);
    record.backupPath = columnText(stmt, 9);
    record.encryptedPath = columnText(stmt, 10);
    record.isEncrypted = sqlite3_column_int(stmt, 11) != 0;
    record.createdAt = sqlite3_column_int64(stmt, 12);
    record.lastVerified = sqlite3_column_int64(stmt, 13);
    record.sourceDevice = columnText(stmt, 14);
    record.ingestMethod = stringToIngestMethod(columnText(stmt, 15));
    record.uploadSessionId = columnText(stmt, 16);
    return record;
}

bool Database::insertFileRecord(const FileRecord& record, bool* duplicate) {
    std::lock_guard<std::mutex> lock(m_mutex);

    if (duplicate) {
        *duplicate = false;
    }

    if (!m_db) {
        recordError("Database not initialized");
        return false;
    }

    const char* insertSQL = R"(
        INSERT INTO backed_up_files (fingerprint, original_filename, file_size, media_kind,
                                     mime_type, capture_time, year, month, backup_path,
                                     encrypted_path, is_encrypted, created_at, last_verified,
                                     source_device, ingest_method, upload_session_id)
        VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?)
    )";

    sqlite3_stmt* stmt;
    int rc = sqlite3_prepare_v2(m_db, insertSQL, -1, &stmt, nullptr);
    if (rc != SQLITE_OK) {
        reportSqliteError("Failed to prepare file insert");
        return false;
    }

    std::string kind = mediaKindToString(record.mediaKind);
    std::string method = ingestMethodToString(record.ingestMethod);

    sqlite3_bind_text(stmt, 1, record.fingerprint.c_str(), -1, SQLITE_STATIC);
    sqlite3_bind_text(stmt, 2, record.originalFilename.c_str(), -1, SQLITE_STATIC);
    sqlite3_bind_int64(stmt, 3, record.fileSize);
    sqlite3_bind_text(stmt, 4, kind.c_str(), -1, SQLITE_STATIC);
    bindOptionalText(stmt, 5, record.mimeType);
    bindOptionalInt64(stmt, 6, record.captureTime);
    sqlite3_bind_int(stmt, 7, record.year);
    sqlite3_bind_int(stmt, 8, record.month);
    sqlite3_bind_text(stmt, 9, record.backupPath.c_str(), -1, SQLITE_STATIC);
    bindOptionalText(stmt, 10, record.encryptedPath);
    sqlite3_bind_int(stmt, 11, record.isEncrypted ? 1 : 0);
    sqlite3_bind_int64(stmt, 12, record.createdAt != 0 ? record.createdAt : now());
    bindOptionalInt64(stmt, 13, record.lastVerified);
    bindOptionalText(stmt, 14, record.sourceDevice);
    sqlite3_bind_text(stmt, 15, method.c_str(), -1, SQLITE_STATIC);
    bindOptionalText(stmt, 16, record.uploadSessionId);

    rc = sqlite3_step(stmt);
    int extended = sqlite3_extended_errcode(m_db);
    sqlite3_finalize(stmt);

    if (rc != SQLITE_DONE) {
        // UNIQUE(fingerprint): otro ingest ya reclamó este contenido
        if (extended == SQLITE_CONSTRAINT_UNIQUE) {
            if (duplicate) {
                *duplicate = true;
            }
            LOG_WARNING("File record already exists for fingerprint: " + record.fingerprint);
            return false;
        }
        reportSqliteError("Failed to insert file record");
        return false;
    }

    LOG_DEBUG("File record saved: " + record.originalFilename + " (" + record.fingerprint + ")");
    return true;
}

LookupResult Database::getFileByFingerprint(const std::string& fingerprint, FileRecord& record) {
    std::lock_guard<std::mutex> lock(m_mutex);

    if (!m_db) {
        recordError("Database not initialized");
        return LookupResult::Error;
    }

    std::string selectSQL = std::string("SELECT ") + FILE_COLUMNS +
                            " FROM backed_up_files WHERE fingerprint = ?";

    sqlite3_stmt* stmt;
    int rc = sqlite3_prepare_v2(m_db, selectSQL.c_str(), -1, &stmt, nullptr);
    if (rc != SQLITE_OK) {
        reportSqliteError("Failed to prepare fingerprint lookup");
        return LookupResult::Error;
    }

    sqlite3_bind_text(stmt, 1, fingerprint.c_str(), -1, SQLITE_STATIC);

    rc = sqlite3_step(stmt);
    LookupResult result = LookupResult::NotFound;

    if (rc == SQLITE_ROW) {
        record = readFileRow(stmt);
        result = LookupResult::Found;
    } else if (rc != SQLITE_DONE) {
        reportSqliteError("Fingerprint lookup failed");
        result = LookupResult::Error;
    }

    sqlite3_finalize(stmt);
    return result;
}

std::vector<FileRecord> Database::queryFiles(const std::string& sql,
                                             const std::vector<int64_t>& params) {
    std::vector<FileRecord> files;

    if (!m_db) {
        recordError("Database not initialized");
        return files;
    }

    sqlite3_stmt* stmt;
    int rc = sqlite3_prepare_v2(m_db, sql.c_str(), -1, &stmt, nullptr);
    if (rc != SQLITE_OK) {
        reportSqliteError("Failed to prepare file query");
        return files;
    }

    for (size_t i = 0; i < params.size(); ++i) {
        sqlite3_bind_int64(stmt, static_cast<int>(i + 1), params[i]);
    }

    while (sqlite3_step(stmt) == SQLITE_ROW) {
        files.push_back(readFileRow(stmt));
    }

    sqlite3_finalize(stmt);
    return files;
}

std::vector<FileRecord> Database::getFilesByMonth(int year, int month) {
    std::lock_guard<std::mutex> lock(m_mutex);
    return queryFiles(std::string("SELECT ") + FILE_COLUMNS +
                      " FROM backed_up_files WHERE year = ? AND month = ? ORDER BY id",
                      {year, month});
}

std::vector<FileRecord> Database::getFilesInRange(int64_t fromEpoch, int64_t toEpoch) {
    std::lock_guard<std::mutex> lock(m_mutex);
    // Sin fecha de captura se usa la fecha de ingesta
    return queryFiles(std::string("SELECT ") + FILE_COLUMNS +
                      " FROM backed_up_files"
                      " WHERE COALESCE(capture_time, created_at) BETWEEN ? AND ?"
                      " ORDER BY COALESCE(capture_time, created_at)",
                      {fromEpoch, toEpoch});
}

std::vector<FileRecord> Database::getAllFiles() {
    std::lock_guard<std::mutex> lock(m_mutex);
    return queryFiles(std::string("SELECT ") + FILE_COLUMNS +
                      " FROM backed_up_files ORDER BY id", {});
}

bool Database::updateLastVerified(const std::string& fingerprint, int64_t verifiedAt) {
    std::lock_guard<std::mutex> lock(m_mutex);

    if (!m_db) {
        recordError("Database not initialized");
        return false;
    }

    const char* updateSQL = "UPDATE backed_up_files SET last_verified = ? WHERE fingerprint = ?";
    sqlite3_stmt* stmt;

    int rc = sqlite3_prepare_v2(m_db, updateSQL, -1, &stmt, nullptr);
    if (rc != SQLITE_OK) {
        reportSqliteError("Failed to prepare last_verified update");
        return false;
    }

    sqlite3_bind_int64(stmt, 1, verifiedAt);
    sqlite3_bind_text(stmt, 2, fingerprint.c_str(), -1, SQLITE_STATIC);

    rc = sqlite3_step(stmt);
    sqlite3_finalize(stmt);

    if (rc != SQLITE_DONE) {
        reportSqliteError("Failed to update last_verified");
        return false;
    }

    return sqlite3_changes(m_db) > 0;
}

bool Database::deleteFileRecord(const std::string& fingerprint) {
    std::lock_guard<std::mutex> lock(m_mutex);

    if (!m_db) {
        recordError("Database not initialized");
        return false;
    }

    const char* deleteSQL = "DELETE FROM backed_up_files WHERE fingerprint = ?";
    sqlite3_stmt* stmt;

    int rc = sqlite3_prepare_v2(m_db, deleteSQL, -1, &stmt, nullptr);
    if (rc != SQLITE_OK) {
        reportSqliteError("Failed to prepare delete file query");
        return false;
    }

    sqlite3_bind_text(stmt, 1, fingerprint.c_str(), -1, SQLITE_STATIC);
    rc = sqlite3_step(stmt);
    sqlite3_finalize(stmt);

    if (rc != SQLITE_DONE) {
        reportSqliteError("Failed to delete file record");
        return false;
    }

    LOG_INFO("Deleted file record: " + fingerprint);
    return sqlite3_changes(m_db) > 0;
}

int64_t Database::getTotalFilesCount() {
    std::lock_guard<std::mutex> lock(m_mutex);

    if (!m_db) {
        return 0;
    }

    sqlite3_stmt* stmt;
    int rc = sqlite3_prepare_v2(m_db, "SELECT COUNT(*) FROM backed_up_files", -1, &stmt, nullptr);
    if (rc != SQLITE_OK) {
        return 0;
    }

    int64_t count = 0;
    if (sqlite3_step(stmt) == SQLITE_ROW) {
        count = sqlite3_column_int64(stmt, 0);
    }

    sqlite3_finalize(stmt);
    return count;
}

int64_t Database::getTotalStorageUsed() {
    std::lock_guard<std::mutex> lock(m_mutex);

    if (!m_db) {
        return 0;
    }

    sqlite3_stmt* stmt;
    int rc = sqlite3_prepare_v2(m_db, "SELECT COALESCE(SUM(file_size), 0) FROM backed_up_files",
                                -1, &stmt, nullptr);
    if (rc != SQLITE_OK) {
        return 0;
    }

    int64_t totalSize = 0;
    if (sqlite3_step(stmt) == SQLITE_ROW) {
        totalSize = sqlite3_column_int64(stmt, 0);
    }

    sqlite3_finalize(stmt);
    return totalSize;
}

// ============================================================================
// Upload sessions
// ============================================================================

UploadSession Database::readSessionRow(sqlite3_stmt* stmt) {
    UploadSession session;
    session.sessionId = columnText(stmt, 0);
    session.fileName = columnText(stmt, 1);
    session.fileSize = sqlite3_column_int64(stmt, 2);
    session.fingerprint = columnText(stmt, 3);
    session.receivedBytes = sqlite3_column_int64(stmt, 4);
    session.totalChunks = sqlite3_column_int64(stmt, 5);
    session.receivedChunks = sqlite3_column_int64(stmt, 6);
    session.status = stringToSessionStatus(columnText(stmt, 7));
    session.tempPath = columnText(stmt, 8);
    session.createdAt = sqlite3_column_int64(stmt, 9);
    session.updatedAt = sqlite3_column_int64(stmt, 10);
    session.completedAt = sqlite3_column_int64(stmt, 11);
    session.errorMessage = columnText(stmt, 12);
    session.retryCount = sqlite3_column_int(stmt, 13);
    return session;
}

bool Database::createUploadSession(const UploadSession& session) {
    std::lock_guard<std::mutex> lock(m_mutex);

    if (!m_db) {
        recordError("Database not initialized");
        return false;
    }

    const char* insertSQL = R"(
        INSERT INTO upload_sessions (session_id, filename, file_size, total_chunks,
                                     status, temp_path, created_at, updated_at)
        VALUES (?, ?, ?, ?, ?, ?, ?, ?)
    )";

    sqlite3_stmt* stmt;
    int rc = sqlite3_prepare_v2(m_db, insertSQL, -1, &stmt, nullptr);
    if (rc != SQLITE_OK) {
        reportSqliteError("Failed to prepare session insert");
        return false;
    }

    int64_t timestamp = now();
    std::string status = sessionStatusToString(session.status);

    sqlite3_bind_text(stmt, 1, session.sessionId.c_str(), -1, SQLITE_STATIC);
    sqlite3_bind_text(stmt, 2, session.fileName.c_str(), -1, SQLITE_STATIC);
    sqlite3_bind_int64(stmt, 3, session.fileSize);
    sqlite3_bind_int64(stmt, 4, session.totalChunks);
    sqlite3_bind_text(stmt, 5, status.c_str(), -1, SQLITE_STATIC);
    bindOptionalText(stmt, 6, session.tempPath);
    sqlite3_bind_int64(stmt, 7, timestamp);
    sqlite3_bind_int64(stmt, 8, timestamp);

    rc = sqlite3_step(stmt);
    sqlite3_finalize(stmt);

    if (rc != SQLITE_DONE) {
        reportSqliteError("Failed to create upload session");
        return false;
    }

    LOG_INFO("Upload session registered in DB: " + session.sessionId + " (" +
             session.fileName + ", " + std::to_string(session.totalChunks) + " chunks)");
    return true;
}

LookupResult Database::getUploadSession(const std::string& sessionId, UploadSession& session) {
    std::lock_guard<std::mutex> lock(m_mutex);

    if (!m_db) {
        recordError("Database not initialized");
        return LookupResult::Error;
    }

    std::string selectSQL = std::string("SELECT ") + SESSION_COLUMNS +
                            " FROM upload_sessions WHERE session_id = ?";

    sqlite3_stmt* stmt;
    int rc = sqlite3_prepare_v2(m_db, selectSQL.c_str(), -1, &stmt, nullptr);
    if (rc != SQLITE_OK) {
        reportSqliteError("Failed to prepare session lookup");
        return LookupResult::Error;
    }

    sqlite3_bind_text(stmt, 1, sessionId.c_str(), -1, SQLITE_STATIC);

    rc = sqlite3_step(stmt);
    LookupResult result = LookupResult::NotFound;

    if (rc == SQLITE_ROW) {
        session = readSessionRow(stmt);
        result = LookupResult::Found;
    } else if (rc != SQLITE_DONE) {
        reportSqliteError("Session lookup failed");
        result = LookupResult::Error;
    }

    sqlite3_finalize(stmt);
    return result;
}

bool Database::recordReceivedChunk(const std::string& sessionId, int64_t chunkIndex,
                                   int64_t chunkSize, bool& inserted) {
    std::lock_guard<std::mutex> lock(m_mutex);

    inserted = false;

    if (!m_db) {
        recordError("Database not initialized");
        return false;
    }

    int rc = sqlite3_exec(m_db, "BEGIN IMMEDIATE TRANSACTION", nullptr, nullptr, nullptr);
    if (rc != SQLITE_OK) {
        reportSqliteError("Failed to begin transaction");
        return false;
    }

    int64_t timestamp = now();
    sqlite3_stmt* stmt = nullptr;

    const char* insertSQL =
        "INSERT OR IGNORE INTO session_chunks (session_id, chunk_index, chunk_size, received_at) "
        "VALUES (?, ?, ?, ?)";

    rc = sqlite3_prepare_v2(m_db, insertSQL, -1, &stmt, nullptr);
    if (rc != SQLITE_OK) {
        reportSqliteError("Failed to prepare chunk insert");
        sqlite3_exec(m_db, "ROLLBACK", nullptr, nullptr, nullptr);
        return false;
    }

    sqlite3_bind_text(stmt, 1, sessionId.c_str(), -1, SQLITE_STATIC);
    sqlite3_bind_int64(stmt, 2, chunkIndex);
    sqlite3_bind_int64(stmt, 3, chunkSize);
    sqlite3_bind_int64(stmt, 4, timestamp);

    rc = sqlite3_step(stmt);
    sqlite3_finalize(stmt);
    stmt = nullptr;

    if (rc != SQLITE_DONE) {
        reportSqliteError("Failed to record chunk " + std::to_string(chunkIndex));
        sqlite3_exec(m_db, "ROLLBACK", nullptr, nullptr, nullptr);
        return false;
    }

    inserted = sqlite3_changes(m_db) == 1;

    if (inserted) {
        // Un chunk nuevo reanuda una sesión pausada
        const char* updateSQL = R"(
            UPDATE upload_sessions
            SET received_bytes = received_bytes + ?,
                received_chunks = received_chunks + 1,
                status = CASE WHEN status = 'paused' THEN 'in_progress' ELSE status END,
                updated_at = ?
            WHERE session_id = ? AND received_bytes + ? <= file_size
        )";

        rc = sqlite3_prepare_v2(m_db, updateSQL, -1, &stmt, nullptr);
        if (rc != SQLITE_OK) {
            reportSqliteError("Failed to prepare session progress update");
            sqlite3_exec(m_db, "ROLLBACK", nullptr, nullptr, nullptr);
            inserted = false;
            return false;
        }

        sqlite3_bind_int64(stmt, 1, chunkSize);
        sqlite3_bind_int64(stmt, 2, timestamp);
        sqlite3_bind_text(stmt, 3, sessionId.c_str(), -1, SQLITE_STATIC);
        sqlite3_bind_int64(stmt, 4, chunkSize);

        rc = sqlite3_step(stmt);
        sqlite3_finalize(stmt);

        if (rc != SQLITE_DONE) {
            reportSqliteError("Failed to update session progress");
            sqlite3_exec(m_db, "ROLLBACK", nullptr, nullptr, nullptr);
            inserted = false;
            return false;
        }

        // Los bytes recibidos nunca superan el tamaño declarado
        if (sqlite3_changes(m_db) == 0) {
            sqlite3_exec(m_db, "ROLLBACK", nullptr, nullptr, nullptr);
            recordError("Chunk " + std::to_string(chunkIndex) + " exceeds declared size of session " +
                        sessionId);
            inserted = false;
            return false;
        }
    }

    rc = sqlite3_exec(m_db, "COMMIT", nullptr, nullptr, nullptr);
    if (rc != SQLITE_OK) {
        reportSqliteError("Failed to commit chunk transaction");
        sqlite3_exec(m_db, "ROLLBACK", nullptr, nullptr, nullptr);
        inserted = false;
        return false;
    }

    return true;
}

bool Database::removeReceivedChunk(const std::string& sessionId, int64_t chunkIndex) {
    std::lock_guard<std::mutex> lock(m_mutex);

    if (!m_db) {
        recordError("Database not initialized");
        return false;
    }

    int rc = sqlite3_exec(m_db, "BEGIN IMMEDIATE TRANSACTION", nullptr, nullptr, nullptr);
    if (rc != SQLITE_OK) {
        reportSqliteError("Failed to begin transaction");
        return false;
    }

    sqlite3_stmt* stmt = nullptr;
    const char* selectSQL =
        "SELECT chunk_size FROM session_chunks WHERE session_id = ? AND chunk_index = ?";

    rc = sqlite3_prepare_v2(m_db, selectSQL, -1, &stmt, nullptr);
    if (rc != SQLITE_OK) {
        reportSqliteError("Failed to prepare chunk lookup");
        sqlite3_exec(m_db, "ROLLBACK", nullptr, nullptr, nullptr);
        return false;
    }

    sqlite3_bind_text(stmt, 1, sessionId.c_str(), -1, SQLITE_STATIC);
    sqlite3_bind_int64(stmt, 2, chunkIndex);

    rc = sqlite3_step(stmt);
    if (rc != SQLITE_ROW) {
        sqlite3_finalize(stmt);
        sqlite3_exec(m_db, "ROLLBACK", nullptr, nullptr, nullptr);
        return rc == SQLITE_DONE;
    }

    int64_t chunkSize = sqlite3_column_int64(stmt, 0);
    sqlite3_finalize(stmt);

    const char* statements[] = {
        "DELETE FROM session_chunks WHERE session_id = ?1 AND chunk_index = ?2",
        "UPDATE upload_sessions SET received_bytes = received_bytes - ?3, "
        "received_chunks = received_chunks - 1, updated_at = ?4 WHERE session_id = ?1"
    };

    for (const char* sql : statements) {
        rc = sqlite3_prepare_v2(m_db, sql, -1, &stmt, nullptr);
        if (rc != SQLITE_OK) {
            reportSqliteError("Failed to prepare chunk removal");
            sqlite3_exec(m_db, "ROLLBACK", nullptr, nullptr, nullptr);
            return false;
        }

        sqlite3_bind_text(stmt, 1, sessionId.c_str(), -1, SQLITE_STATIC);
        sqlite3_bind_int64(stmt, 2, chunkIndex);
        sqlite3_bind_int64(stmt, 3, chunkSize);
        sqlite3_bind_int64(stmt, 4, now());

        rc = sqlite3_step(stmt);
        sqlite3_finalize(stmt);

        if (rc != SQLITE_DONE) {
            reportSqliteError("Failed to remove chunk " + std::to_string(chunkIndex));
            sqlite3_exec(m_db, "ROLLBACK", nullptr, nullptr, nullptr);
            return false;
        }
    }

    rc = sqlite3_exec(m_db, "COMMIT", nullptr, nullptr, nullptr);
    if (rc != SQLITE_OK) {
        reportSqliteError("Failed to commit chunk removal");
        sqlite3_exec(m_db, "ROLLBACK", nullptr, nullptr, nullptr);
        return false;
    }

    LOG_DEBUG("Removed chunk " + std::to_string(chunkIndex) + " from session " + sessionId);
    return true;
}

bool Database::getReceivedChunks(const std::string& sessionId, std::vector<int64_t>& chunks) {
    std::lock_guard<std::mutex> lock(m_mutex);

    chunks.clear();

    if (!m_db) {
        recordError("Database not initialized");
        return false;
    }

    const char* querySQL =
        "SELECT chunk_index FROM session_chunks WHERE session_id = ? ORDER BY chunk_index";
    sqlite3_stmt* stmt;

    int rc = sqlite3_prepare_v2(m_db, querySQL, -1, &stmt, nullptr);
    if (rc != SQLITE_OK) {
        reportSqliteError("Failed to prepare received chunks query");
        return false;
    }

    sqlite3_bind_text(stmt, 1, sessionId.c_str(), -1, SQLITE_STATIC);

    while ((rc = sqlite3_step(stmt)) == SQLITE_ROW) {
        chunks.push_back(sqlite3_column_int64(stmt, 0));
    }

    sqlite3_finalize(stmt);

    if (rc != SQLITE_DONE) {
        reportSqliteError("Failed to read received chunks");
        return false;
    }

    return true;
}

bool Database::updateSessionStatus(const std::string& sessionId, SessionStatus status) {
    std::lock_guard<std::mutex> lock(m_mutex);

    if (!m_db) {
        recordError("Database not initialized");
        return false;
    }

    const char* updateSQL =
        "UPDATE upload_sessions SET status = ?, updated_at = ? WHERE session_id = ?";
    sqlite3_stmt* stmt;

    int rc = sqlite3_prepare_v2(m_db, updateSQL, -1, &stmt, nullptr);
    if (rc != SQLITE_OK) {
        reportSqliteError("Failed to prepare session status update");
        return false;
    }

    std::string state = sessionStatusToString(status);
    sqlite3_bind_text(stmt, 1, state.c_str(), -1, SQLITE_STATIC);
    sqlite3_bind_int64(stmt, 2, now());
    sqlite3_bind_text(stmt, 3, sessionId.c_str(), -1, SQLITE_STATIC);

    rc = sqlite3_step(stmt);
    sqlite3_finalize(stmt);

    if (rc != SQLITE_DONE) {
        reportSqliteError("Failed to update session status");
        return false;
    }

    LOG_DEBUG("Updated session " + sessionId + " status to: " + state);
    return true;
}

bool Database::completeUploadSession(const std::string& sessionId, const std::string& fingerprint) {
    std::lock_guard<std::mutex> lock(m_mutex);

    if (!m_db) {
        recordError("Database not initialized");
        return false;
    }

    // Solo una sesión en curso con todos los chunks registrados pasa a completed
    const char* updateSQL = R"(
        UPDATE upload_sessions
        SET status = 'completed', fingerprint = ?, completed_at = ?, updated_at = ?,
            error_message = NULL
        WHERE session_id = ? AND received_chunks = total_chunks AND status = 'in_progress'
    )";
    sqlite3_stmt* stmt;

    int rc = sqlite3_prepare_v2(m_db, updateSQL, -1, &stmt, nullptr);
    if (rc != SQLITE_OK) {
        reportSqliteError("Failed to prepare session completion");
        return false;
    }

    int64_t timestamp = now();
    sqlite3_bind_text(stmt, 1, fingerprint.c_str(), -1, SQLITE_STATIC);
    sqlite3_bind_int64(stmt, 2, timestamp);
    sqlite3_bind_int64(stmt, 3, timestamp);
    sqlite3_bind_text(stmt, 4, sessionId.c_str(), -1, SQLITE_STATIC);

    rc = sqlite3_step(stmt);
    sqlite3_finalize(stmt);

    if (rc != SQLITE_DONE) {
        reportSqliteError("Failed to complete upload session");
        return false;
    }

    if (sqlite3_changes(m_db) == 0) {
        recordError("Upload session not completable (not in progress, missing chunks or unknown): " +
                    sessionId);
        return false;
    }

    LOG_INFO("Upload session completed: " + sessionId);
    return true;
}

bool Database::failUploadSession(const std::string& sessionId, const std::string& errorMessage) {
    std::lock_guard<std::mutex> lock(m_mutex);

    if (!m_db) {
        recordError("Database not initialized");
        return false;
    }

    const char* updateSQL =
        "UPDATE upload_sessions SET status = 'failed', error_message = ?, updated_at = ? "
        "WHERE session_id = ?";
    sqlite3_stmt* stmt;

    int rc = sqlite3_prepare_v2(m_db, updateSQL, -1, &stmt, nullptr);
    if (rc != SQLITE_OK) {
        reportSqliteError("Failed to prepare session failure update");
        return false;
    }

    sqlite3_bind_text(stmt, 1, errorMessage.c_str(), -1, SQLITE_STATIC);
    sqlite3_bind_int64(stmt, 2, now());
    sqlite3_bind_text(stmt, 3, sessionId.c_str(), -1, SQLITE_STATIC);

    rc = sqlite3_step(stmt);
    sqlite3_finalize(stmt);

    if (rc != SQLITE_DONE) {
        reportSqliteError("Failed to mark session as failed");
        return false;
    }

    LOG_INFO("Upload session " + sessionId + " marked failed: " + errorMessage);
    return true;
}

bool Database::incrementSessionRetry(const std::string& sessionId) {
    std::lock_guard<std::mutex> lock(m_mutex);

    if (!m_db) {
        recordError("Database not initialized");
        return false;
    }

    const char* updateSQL =
        "UPDATE upload_sessions SET retry_count = retry_count + 1, updated_at = ? "
        "WHERE session_id = ?";
    sqlite3_stmt* stmt;

    int rc = sqlite3_prepare_v2(m_db, updateSQL, -1, &stmt, nullptr);
    if (rc != SQLITE_OK) {
        reportSqliteError("Failed to prepare retry update");
        return false;
    }

    sqlite3_bind_int64(stmt, 1, now());
    sqlite3_bind_text(stmt, 2, sessionId.c_str(), -1, SQLITE_STATIC);

    rc = sqlite3_step(stmt);
    sqlite3_finalize(stmt);

    return rc == SQLITE_DONE;
}

std::vector<UploadSession> Database::querySessions(const std::string& sql,
                                                   const std::vector<int64_t>& params) {
    std::vector<UploadSession> sessions;

    if (!m_db) {
        recordError("Database not initialized");
        return sessions;
    }

    sqlite3_stmt* stmt;
    int rc = sqlite3_prepare_v2(m_db, sql.c_str(), -1, &stmt, nullptr);
    if (rc != SQLITE_OK) {
        reportSqliteError("Failed to prepare session query");
        return sessions;
    }

    for (size_t i = 0; i < params.size(); ++i) {
        sqlite3_bind_int64(stmt, static_cast<int>(i + 1), params[i]);
    }

    while (sqlite3_step(stmt) == SQLITE_ROW) {
        sessions.push_back(readSessionRow(stmt));
    }

    sqlite3_finalize(stmt);
    return sessions;
}

std::vector<UploadSession> Database::getIncompleteSessions() {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto sessions = querySessions(std::string("SELECT ") + SESSION_COLUMNS +
                                  " FROM upload_sessions WHERE status IN ('in_progress', 'paused')"
                                  " ORDER BY created_at", {});
    LOG_DEBUG("Found " + std::to_string(sessions.size()) + " incomplete upload sessions");
    return sessions;
}

std::vector<UploadSession> Database::getStaleSessions(int64_t cutoffEpoch) {
    std::lock_guard<std::mutex> lock(m_mutex);
    return querySessions(std::string("SELECT ") + SESSION_COLUMNS +
                         " FROM upload_sessions WHERE status IN ('in_progress', 'paused')"
                         " AND updated_at <= ? ORDER BY updated_at", {cutoffEpoch});
}

int Database::purgeTerminalSessions(int64_t cutoffEpoch) {
    std::lock_guard<std::mutex> lock(m_mutex);

    if (!m_db) {
        recordError("Database not initialized");
        return 0;
    }

    // CASCADE elimina también session_chunks
    const char* deleteSQL =
        "DELETE FROM upload_sessions WHERE status IN ('completed', 'failed') AND updated_at <= ?";
    sqlite3_stmt* stmt;

    int rc = sqlite3_prepare_v2(m_db, deleteSQL, -1, &stmt, nullptr);
    if (rc != SQLITE_OK) {
        reportSqliteError("Failed to prepare session purge");
        return 0;
    }

    sqlite3_bind_int64(stmt, 1, cutoffEpoch);
    rc = sqlite3_step(stmt);
    sqlite3_finalize(stmt);

    if (rc != SQLITE_DONE) {
        reportSqliteError("Failed to purge terminal sessions");
        return 0;
    }

    int purged = sqlite3_changes(m_db);
    if (purged > 0) {
        LOG_INFO("Purged " + std::to_string(purged) + " terminal upload sessions");
    }
    return purged;
}

bool Database::markAllActiveSessionsAsPaused() {
    std::lock_guard<std::mutex> lock(m_mutex);

    std::string updateSQL =
        "UPDATE upload_sessions SET status = 'paused', updated_at = " +
        std::to_string(now()) + " WHERE status = 'in_progress'";

    if (!executeQuery(updateSQL)) {
        return false;
    }

    int paused = sqlite3_changes(m_db);
    if (paused > 0) {
        LOG_INFO("Paused " + std::to_string(paused) + " active upload sessions");
    }
    return true;
}

// ============================================================================
// Sync history
// ============================================================================

SyncRecord Database::readSyncRow(sqlite3_stmt* stmt) {
    SyncRecord record;
    record.id = sqlite3_column_int64(stmt, 0);
    record.kind = stringToSyncKind(columnText(stmt, 1));
    record.status = stringToSyncStatus(columnText(stmt, 2));
    record.filesProcessed = sqlite3_column_int64(stmt, 3);
    record.filesBackedUp = sqlite3_column_int64(stmt, 4);
    record.filesSkipped = sqlite3_column_int64(stmt, 5);
    record.filesFailed = sqlite3_column_int64(stmt, 6);
    record.totalBytes = sqlite3_column_int64(stmt, 7);
    record.startedAt = sqlite3_column_int64(stmt, 8);
    record.completedAt = sqlite3_column_int64(stmt, 9);
    record.durationSeconds = sqlite3_column_int64(stmt, 10);
    record.sourceDevice = columnText(stmt, 11);
    record.destinationPath = columnText(stmt, 12);
    record.errorMessage = columnText(stmt, 13);
    return record;
}

bool Database::createSyncRecord(SyncRecord& record) {
    std::lock_guard<std::mutex> lock(m_mutex);

    if (!m_db) {
        recordError("Database not initialized");
        return false;
    }

    const char* insertSQL = R"(
        INSERT INTO sync_history (sync_type, status, started_at, source_device, destination_path)
        VALUES (?, ?, ?, ?, ?)
    )";

    sqlite3_stmt* stmt;
    int rc = sqlite3_prepare_v2(m_db, insertSQL, -1, &stmt, nullptr);
    if (rc != SQLITE_OK) {
        reportSqliteError("Failed to prepare sync record insert");
        return false;
    }

    if (record.startedAt == 0) {
        record.startedAt = now();
    }

    std::string kind = syncKindToString(record.kind);
    std::string status = syncStatusToString(record.status);

    sqlite3_bind_text(stmt, 1, kind.c_str(), -1, SQLITE_STATIC);
    sqlite3_bind_text(stmt, 2, status.c_str(), -1, SQLITE_STATIC);
    sqlite3_bind_int64(stmt, 3, record.startedAt);
    bindOptionalText(stmt, 4, record.sourceDevice);
    bindOptionalText(stmt, 5, record.destinationPath);

    rc = sqlite3_step(stmt);
    sqlite3_finalize(stmt);

    if (rc != SQLITE_DONE) {
        reportSqliteError("Failed to create sync record");
        return false;
    }

    record.id = sqlite3_last_insert_rowid(m_db);
    return true;
}

bool Database::updateSyncRecord(const SyncRecord& record) {
    std::lock_guard<std::mutex> lock(m_mutex);

    if (!m_db) {
        recordError("Database not initialized");
        return false;
    }

    // Un registro terminal es inmutable
    const char* updateSQL = R"(
        UPDATE sync_history
        SET status = ?, files_processed = ?, files_backed_up = ?, files_skipped = ?,
            files_failed = ?, total_size_bytes = ?, completed_at = ?, duration_seconds = ?,
            error_message = ?
        WHERE id = ? AND status = 'in_progress'
    )";

    sqlite3_stmt* stmt;
    int rc = sqlite3_prepare_v2(m_db, updateSQL, -1, &stmt, nullptr);
    if (rc != SQLITE_OK) {
        reportSqliteError("Failed to prepare sync record update");
        return false;
    }

    std::string status = syncStatusToString(record.status);

    sqlite3_bind_text(stmt, 1, status.c_str(), -1, SQLITE_STATIC);
    sqlite3_bind_int64(stmt, 2, record.filesProcessed);
    sqlite3_bind_int64(stmt, 3, record.filesBackedUp);
    sqlite3_bind_int64(stmt, 4, record.filesSkipped);
    sqlite3_bind_int64(stmt, 5, record.filesFailed);
    sqlite3_bind_int64(stmt, 6, record.totalBytes);
    bindOptionalInt64(stmt, 7, record.completedAt);
    sqlite3_bind_int64(stmt, 8, record.durationSeconds);
    bindOptionalText(stmt, 9, record.errorMessage);
    sqlite3_bind_int64(stmt, 10, record.id);

    rc = sqlite3_step(stmt);
    sqlite3_finalize(stmt);

    if (rc != SQLITE_DONE) {
        reportSqliteError("Failed to update sync record");
        return false;
    }

    if (sqlite3_changes(m_db) == 0) {
        LOG_WARNING("Sync record " + std::to_string(record.id) + " is terminal or missing, not updated");
        return false;
    }

    return true;
}

std::vector<SyncRecord> Database::getRecentSyncs(int limit) {
    std::lock_guard<std::mutex> lock(m_mutex);

    std::vector<SyncRecord> records;

    if (!m_db) {
        recordError("Database not initialized");
        return records;
    }

    std::string selectSQL = std::string("SELECT ") + SYNC_COLUMNS +
                            " FROM sync_history ORDER BY started_at DESC, id DESC LIMIT ?";
    sqlite3_stmt* stmt;

    int rc = sqlite3_prepare_v2(m_db, selectSQL.c_str(), -1, &stmt, nullptr);
    if (rc != SQLITE_OK) {
        reportSqliteError("Failed to prepare sync history query");
        return records;
    }

    sqlite3_bind_int(stmt, 1, limit);

    while (sqlite3_step(stmt) == SQLITE_ROW) {
        records.push_back(readSyncRow(stmt));
    }

    sqlite3_finalize(stmt);
    return records;
}

bool Database::getSyncStatistics(SyncStatistics& stats) {
    std::lock_guard<std::mutex> lock(m_mutex);

    if (!m_db) {
        recordError("Database not initialized");
        return false;
    }

    const char* statsSQL = R"(
        SELECT COUNT(*),
               COALESCE(SUM(CASE WHEN status = 'success' THEN 1 ELSE 0 END), 0),
               COALESCE(SUM(files_backed_up), 0)
        FROM sync_history
    )";

    sqlite3_stmt* stmt;
    int rc = sqlite3_prepare_v2(m_db, statsSQL, -1, &stmt, nullptr);
    if (rc != SQLITE_OK) {
        reportSqliteError("Failed to prepare sync statistics query");
        return false;
    }

    bool ok = false;
    if (sqlite3_step(stmt) == SQLITE_ROW) {
        stats.totalSyncs = sqlite3_column_int64(stmt, 0);
        stats.successfulSyncs = sqlite3_column_int64(stmt, 1);
        stats.totalFilesBackedUp = sqlite3_column_int64(stmt, 2);
        ok = true;
    }

    sqlite3_finalize(stmt);
    return ok;
}

} // namespace MediaVault
