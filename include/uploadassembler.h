#ifndef UPLOADASSEMBLER_H
#define UPLOADASSEMBLER_H

#include <string>
#include <vector>
#include <map>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <functional>
#include <cstdint>
#include "database.h"
#include "errors.h"
#include "fingerprint.h"

namespace MediaVault {

struct AssemblerOptions {
    std::string tempRoot;
    int64_t maxUploadSize = 5LL * 1024 * 1024 * 1024;
    int64_t chunkSize = 10 * 1024 * 1024;   // tamaño anunciado a los clientes
};

struct ChunkRequest {
    std::string sessionId;
    int64_t chunkIndex = 0;
    int64_t totalChunks = 0;
    std::string fileName;
    int64_t declaredSize = 0;
};

struct ChunkResult {
    bool success = false;
    bool duplicate = false;       // el índice ya estaba registrado
    int64_t chunkIndex = 0;
    int64_t receivedChunks = 0;
    int64_t totalChunks = 0;
    double progressPercent = 0.0;
    IngestError error = IngestError::None;
    std::string errorMessage;
};

// Contenido ensamblado que se entrega al pipeline de ingesta
struct AssembledFile {
    std::string sessionId;
    std::string fileName;
    std::string path;
    std::string fingerprint;
    int64_t size = 0;
};

struct HandoffResult {
    bool success = false;
    bool skipped = false;
    std::string destination;
    IngestError error = IngestError::None;
    std::string errorMessage;
};

using AssembledHandler = std::function<HandoffResult(const AssembledFile&)>;

struct FinalizeResult {
    bool success = false;
    bool alreadyCompleted = false;
    bool skipped = false;
    std::string sessionId;
    std::string fileName;
    std::string fingerprint;
    std::string destination;
    std::vector<int64_t> missingChunks;
    IngestError error = IngestError::None;
    std::string errorMessage;
};

struct SessionStatusInfo {
    bool exists = false;
    std::string sessionId;
    std::string fileName;
    int64_t fileSize = 0;
    int64_t totalChunks = 0;
    int64_t receivedChunks = 0;
    int64_t receivedBytes = 0;
    SessionStatus status = SessionStatus::InProgress;
    double progressPercent = 0.0;
    std::vector<int64_t> missingChunks;
    std::string fingerprint;
    std::string errorMessage;
};

struct ReconcileReport {
    int pausedSessions = 0;
    int removedArtifacts = 0;
    int forgottenChunks = 0;
};

/**
 * @brief Recepción de archivos por chunks con sesiones persistentes
 *
 * La base de datos es la única fuente de verdad del estado de cada sesión.
 * Cada chunk se escribe en <temp>/<sesión>_chunk_<i> antes de registrarse,
 * de modo que tras un reinicio los índices registrados tienen su artefacto.
 * Los chunks de una misma sesión se aceptan en paralelo; finalize, cancel y
 * el barrido de sesiones toman el lock exclusivo de la sesión.
 */
class UploadAssembler {
public:
    UploadAssembler(Database* database, const FingerprintEngine& fingerprints,
                    const AssemblerOptions& options);
    ~UploadAssembler();

    ChunkResult submitChunk(const ChunkRequest& request, const std::string& bytes);

    /**
     * @brief Ensambla la sesión y entrega el contenido al handler
     *
     * Una segunda llamada sobre una sesión ya completada devuelve el mismo
     * resultado sin reprocesar. Si la entrega falló, la siguiente llamada la
     * reintenta con el artefacto ensamblado conservado.
     */
    FinalizeResult finalize(const std::string& sessionId, const AssembledHandler& handler);

    bool cancel(const std::string& sessionId, IngestError* error = nullptr);
    bool pause(const std::string& sessionId);
    bool resume(const std::string& sessionId);

    SessionStatusInfo getSessionStatus(const std::string& sessionId);

    // Sesiones activas sin actividad en `retentionHours` pasan a failed "expired"
    int sweepStaleSessions(int retentionHours);
    int purgeTerminalSessions(int retentionDays);

    // Arranque: pausa sesiones activas y alinea artefactos con la BD
    ReconcileReport reconcile();

    std::string chunkPath(const std::string& sessionId, int64_t chunkIndex) const;
    std::string assembledPath(const std::string& sessionId) const;

    static bool isValidSessionId(const std::string& sessionId);

private:
    std::shared_ptr<std::shared_mutex> sessionLock(const std::string& sessionId);
    void pruneSessionLocks();

    bool writeChunkArtifact(const std::string& path, const std::string& bytes, std::string& error);
    bool assembleChunks(const UploadSession& session, std::string& error);
    int removeSessionArtifacts(const std::string& sessionId);
    int removeOrphanArtifacts(bool startup);
    bool failSession(const std::string& sessionId, const std::string& reason);
    FinalizeResult handOff(const UploadSession& session, const AssembledHandler& handler);

    // Chunks necesarios para `declaredSize` bytes con el tamaño de chunk configurado
    int64_t maxChunksFor(int64_t declaredSize) const;

    static std::vector<int64_t> missingIndices(int64_t totalChunks,
                                               const std::vector<int64_t>& received);

    Database* m_database;
    const FingerprintEngine& m_fingerprints;
    AssemblerOptions m_options;

    std::map<std::string, std::shared_ptr<std::shared_mutex>> m_sessionLocks;
    std::mutex m_locksMutex;
};

} // namespace MediaVault

#endif // UPLOADASSEMBLER_H
