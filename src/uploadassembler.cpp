#include "uploadassembler.h"
#include "logger.h"
#include <fstream>
#include <filesystem>
#include <algorithm>
#include <cctype>
#include <atomic>
#include <set>
#include <thread>
#include <sstream>
#include <system_error>

namespace fs = std::filesystem;

namespace MediaVault {

namespace {

const size_t COPY_BUFFER_SIZE = 1024 * 1024;
const char* const CHUNK_INFIX = "_chunk_";
const char* const ASSEMBLED_SUFFIX = "_assembled";
const size_t MAX_SESSION_ID_LENGTH = 128;

std::atomic<uint64_t> g_tempCounter{0};

// Nombre único para escrituras en curso: <destino>.tmp-<hilo>-<contador>
std::string uniqueTempPath(const std::string& path) {
    std::ostringstream ss;
    ss << path << ".tmp-" << std::hash<std::thread::id>{}(std::this_thread::get_id())
       << "-" << g_tempCounter.fetch_add(1);
    return ss.str();
}

double percentOf(int64_t done, int64_t total) {
    return total > 0 ? (static_cast<double>(done) / static_cast<double>(total)) * 100.0 : 0.0;
}

bool endsWith(const std::string& value, const std::string& suffix) {
    return value.size() >= suffix.size() &&
           value.compare(value.size() - suffix.size(), suffix.size(), suffix) == 0;
}

// Descompone <sesión>_chunk_<i> o <sesión>_assembled[.part]; chunkIndex = -1 para el ensamblado
bool parseArtifactName(const std::string& name, std::string& sessionId, int64_t& chunkIndex) {
    std::string base = endsWith(name, ".part") ? name.substr(0, name.size() - 5) : name;
    const std::string assembled(ASSEMBLED_SUFFIX);
    const std::string infix(CHUNK_INFIX);

    if (endsWith(base, assembled)) {
        sessionId = base.substr(0, base.size() - assembled.size());
        chunkIndex = -1;
        return !sessionId.empty();
    }
    if (base.size() != name.size()) {
        return false;
    }

    size_t pos = base.rfind(infix);
    if (pos == std::string::npos || pos == 0) {
        return false;
    }
    std::string digits = base.substr(pos + infix.size());
    if (digits.empty() || digits.size() > 18 ||
        !std::all_of(digits.begin(), digits.end(), [](char c) {
            return std::isdigit(static_cast<unsigned char>(c)) != 0;
        })) {
        return false;
    }

    sessionId = base.substr(0, pos);
    chunkIndex = std::stoll(digits);
    return true;
}

} // namespace

UploadAssembler::UploadAssembler(Database* database, const FingerprintEngine& fingerprints,
                                 const AssemblerOptions& options)
    : m_database(database)
    , m_fingerprints(fingerprints)
    , m_options(options)
{
    if (m_options.chunkSize <= 0) {
        m_options.chunkSize = AssemblerOptions().chunkSize;
    }

    std::error_code ec;
    fs::create_directories(m_options.tempRoot, ec);
    if (ec) {
        LOG_ERROR("Cannot create temp upload directory " + m_options.tempRoot + ": " + ec.message());
    }
}

UploadAssembler::~UploadAssembler() {
}

bool UploadAssembler::isValidSessionId(const std::string& sessionId) {
    if (sessionId.empty() || sessionId.size() > MAX_SESSION_ID_LENGTH) {
        return false;
    }
    return std::all_of(sessionId.begin(), sessionId.end(), [](char c) {
        return std::isalnum(static_cast<unsigned char>(c)) || c == '-' || c == '_';
    });
}

std::string UploadAssembler::chunkPath(const std::string& sessionId, int64_t chunkIndex) const {
    return (fs::path(m_options.tempRoot) / (sessionId + CHUNK_INFIX + std::to_string(chunkIndex))).string();
}

std::string UploadAssembler::assembledPath(const std::string& sessionId) const {
    return (fs::path(m_options.tempRoot) / (sessionId + ASSEMBLED_SUFFIX)).string();
}

std::shared_ptr<std::shared_mutex> UploadAssembler::sessionLock(const std::string& sessionId) {
    std::lock_guard<std::mutex> lock(m_locksMutex);
    auto& entry = m_sessionLocks[sessionId];
    if (!entry) {
        entry = std::make_shared<std::shared_mutex>();
    }
    return entry;
}

void UploadAssembler::pruneSessionLocks() {
    std::lock_guard<std::mutex> lock(m_locksMutex);
    for (auto it = m_sessionLocks.begin(); it != m_sessionLocks.end();) {
        // Solo el mapa lo referencia: nadie lo está usando
        if (it->second.use_count() == 1) {
            it = m_sessionLocks.erase(it);
        } else {
            ++it;
        }
    }
}

int64_t UploadAssembler::maxChunksFor(int64_t declaredSize) const {
    if (declaredSize <= 0) {
        return 1;
    }
    return (declaredSize + m_options.chunkSize - 1) / m_options.chunkSize;
}

std::vector<int64_t> UploadAssembler::missingIndices(int64_t totalChunks,
                                                     const std::vector<int64_t>& received) {
    std::set<int64_t> have(received.begin(), received.end());
    std::vector<int64_t> missing;
    for (int64_t i = 0; i < totalChunks; ++i) {
        if (have.find(i) == have.end()) {
            missing.push_back(i);
        }
    }
    return missing;
}

// ============================================================================
// Chunks
// ============================================================================

bool UploadAssembler::writeChunkArtifact(const std::string& path, const std::string& bytes,
                                         std::string& error) {
    std::string tempPath = uniqueTempPath(path);
    {
        std::ofstream out(tempPath, std::ios::binary | std::ios::trunc);
        if (!out.is_open()) {
            error = "Cannot open chunk file: " + tempPath;
            return false;
        }
        out.write(bytes.data(), static_cast<std::streamsize>(bytes.size()));
        out.flush();
        if (!out) {
            error = "Failed writing chunk file: " + tempPath;
            out.close();
            std::error_code ignored;
            fs::remove(tempPath, ignored);
            return false;
        }
    }

    std::error_code ec;
    fs::rename(tempPath, path, ec);
    if (ec) {
        error = "Cannot move chunk into place " + path + ": " + ec.message();
        std::error_code ignored;
        fs::remove(tempPath, ignored);
        return false;
    }
    return true;
}

ChunkResult UploadAssembler::submitChunk(const ChunkRequest& request, const std::string& bytes) {
    ChunkResult result;
    result.chunkIndex = request.chunkIndex;
    result.totalChunks = request.totalChunks;

    if (!isValidSessionId(request.sessionId)) {
        result.error = IngestError::InvalidRequest;
        result.errorMessage = "Invalid session id";
        return result;
    }
    if (request.totalChunks <= 0 || request.chunkIndex < 0 || request.chunkIndex >= request.totalChunks) {
        result.error = IngestError::InvalidRequest;
        result.errorMessage = "Chunk index " + std::to_string(request.chunkIndex) +
                              " out of range for " + std::to_string(request.totalChunks) + " chunks";
        return result;
    }
    if (request.declaredSize < 0 || request.declaredSize > m_options.maxUploadSize) {
        result.error = IngestError::InvalidRequest;
        result.errorMessage = "Declared size " + std::to_string(request.declaredSize) +
                              " exceeds maximum upload size " + std::to_string(m_options.maxUploadSize);
        return result;
    }
    if (request.totalChunks > maxChunksFor(request.declaredSize)) {
        result.error = IngestError::InvalidRequest;
        result.errorMessage = std::to_string(request.totalChunks) + " chunks declared for " +
                              std::to_string(request.declaredSize) + " bytes, at most " +
                              std::to_string(maxChunksFor(request.declaredSize)) + " expected";
        return result;
    }
    if (static_cast<int64_t>(bytes.size()) > m_options.chunkSize) {
        result.error = IngestError::InvalidRequest;
        result.errorMessage = "Chunk of " + std::to_string(bytes.size()) + " bytes exceeds chunk size " +
                              std::to_string(m_options.chunkSize);
        return result;
    }
    if (fs::path(request.fileName).filename().string().empty()) {
        result.error = IngestError::InvalidRequest;
        result.errorMessage = "Missing file name";
        return result;
    }
    if (!m_database) {
        result.error = IngestError::StorageFailure;
        result.errorMessage = "Metadata store not available";
        return result;
    }

    auto lock = sessionLock(request.sessionId);
    std::shared_lock<std::shared_mutex> guard(*lock);

    UploadSession session;
    LookupResult lookup = m_database->getUploadSession(request.sessionId, session);

    if (lookup == LookupResult::Error) {
        result.error = IngestError::StorageFailure;
        result.errorMessage = "Session lookup failed: " + m_database->lastError();
        return result;
    }

    if (lookup == LookupResult::NotFound) {
        session = UploadSession();
        session.sessionId = request.sessionId;
        session.fileName = fs::path(request.fileName).filename().string();
        session.fileSize = request.declaredSize;
        session.totalChunks = request.totalChunks;
        session.status = SessionStatus::InProgress;
        session.tempPath = m_options.tempRoot;

        if (!m_database->createUploadSession(session)) {
            // Otro chunk de la misma sesión pudo crearla en paralelo
            if (m_database->getUploadSession(request.sessionId, session) != LookupResult::Found) {
                result.error = IngestError::StorageFailure;
                result.errorMessage = "Cannot create upload session: " + m_database->lastError();
                return result;
            }
        }
    }

    if (session.totalChunks != request.totalChunks) {
        result.error = IngestError::InvalidRequest;
        result.errorMessage = "Session " + request.sessionId + " expects " +
                              std::to_string(session.totalChunks) + " chunks, got " +
                              std::to_string(request.totalChunks);
        return result;
    }

    if (session.status == SessionStatus::Failed) {
        result.error = IngestError::InvalidRequest;
        result.errorMessage = "Session " + request.sessionId + " is closed (" +
                              session.errorMessage + "), start a new session";
        return result;
    }

    if (session.status == SessionStatus::Completed) {
        result.success = true;
        result.duplicate = true;
        result.receivedChunks = session.receivedChunks;
        result.progressPercent = 100.0;
        return result;
    }

    std::vector<int64_t> received;
    if (!m_database->getReceivedChunks(request.sessionId, received)) {
        result.error = IngestError::StorageFailure;
        result.errorMessage = "Cannot read received chunks: " + m_database->lastError();
        return result;
    }

    if (std::find(received.begin(), received.end(), request.chunkIndex) != received.end()) {
        LOG_DEBUG("Chunk " + std::to_string(request.chunkIndex) + " already received for session " +
                  request.sessionId);
        result.success = true;
        result.duplicate = true;
        result.receivedChunks = static_cast<int64_t>(received.size());
        result.progressPercent = percentOf(result.receivedChunks, session.totalChunks);
        return result;
    }

    int64_t chunkBytes = static_cast<int64_t>(bytes.size());
    if (session.receivedBytes + chunkBytes > session.fileSize) {
        result.error = IngestError::InvalidRequest;
        result.errorMessage = "Chunk " + std::to_string(request.chunkIndex) + " would exceed declared size " +
                              std::to_string(session.fileSize) + " of session " + request.sessionId;
        return result;
    }

    std::string writeError;
    if (!writeChunkArtifact(chunkPath(request.sessionId, request.chunkIndex), bytes, writeError)) {
        LOG_ERROR(writeError);
        result.error = IngestError::StorageFailure;
        result.errorMessage = writeError;
        return result;
    }

    bool inserted = false;
    if (!m_database->recordReceivedChunk(request.sessionId, request.chunkIndex, chunkBytes, inserted)) {
        std::string reason = m_database->lastError();
        // Chunks concurrentes pueden rebasar juntos el tamaño declarado
        UploadSession current;
        bool overflow = m_database->getUploadSession(request.sessionId, current) == LookupResult::Found &&
                        current.receivedBytes + chunkBytes > current.fileSize;
        result.error = overflow ? IngestError::InvalidRequest : IngestError::StorageFailure;
        result.errorMessage = "Cannot record chunk: " + reason;
        return result;
    }

    result.success = true;
    result.duplicate = !inserted;

    UploadSession updated;
    if (m_database->getUploadSession(request.sessionId, updated) == LookupResult::Found) {
        result.receivedChunks = updated.receivedChunks;
    } else {
        result.receivedChunks = static_cast<int64_t>(received.size()) + (inserted ? 1 : 0);
    }
    result.progressPercent = percentOf(result.receivedChunks, session.totalChunks);

    LOG_DEBUG("Chunk " + std::to_string(request.chunkIndex + 1) + "/" +
              std::to_string(session.totalChunks) + " received for session " + request.sessionId);
    return result;
}

// ============================================================================
// Finalize
// ============================================================================

bool UploadAssembler::assembleChunks(const UploadSession& session, std::string& error) {
    std::string target = assembledPath(session.sessionId);
    std::string partPath = target + ".part";
    std::vector<int64_t> consumed;
    bool ok = true;

    {
        std::ofstream out(partPath, std::ios::binary | std::ios::trunc);
        if (!out.is_open()) {
            error = "Cannot create assembled file: " + partPath;
            return false;
        }

        std::vector<char> buffer(COPY_BUFFER_SIZE);

        for (int64_t i = 0; i < session.totalChunks && ok; ++i) {
            std::string piece = chunkPath(session.sessionId, i);
            std::ifstream in(piece, std::ios::binary);
            if (!in.is_open()) {
                error = "Chunk artifact missing: " + piece;
                consumed.push_back(i);
                ok = false;
                break;
            }

            while (in) {
                in.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
                std::streamsize got = in.gcount();
                if (got > 0) {
                    out.write(buffer.data(), got);
                }
            }

            if (in.bad() || !out) {
                error = "I/O error while appending chunk " + std::to_string(i);
                ok = false;
                break;
            }
            in.close();

            // Se libera espacio temporal a medida que se consume cada chunk
            std::error_code ec;
            fs::remove(piece, ec);
            consumed.push_back(i);
        }

        out.flush();
        if (!out) {
            error = "Failed writing assembled file: " + partPath;
            ok = false;
        }
    }

    std::error_code ec;
    if (ok) {
        fs::rename(partPath, target, ec);
        if (ec) {
            error = "Cannot move assembled file into place: " + ec.message();
            ok = false;
        }
    }

    if (!ok) {
        fs::remove(partPath, ec);
        // Los chunks consumidos ya no existen: el cliente debe reenviarlos
        for (int64_t index : consumed) {
            std::error_code ignored;
            fs::remove(chunkPath(session.sessionId, index), ignored);
            m_database->removeReceivedChunk(session.sessionId, index);
        }
    }

    return ok;
}

FinalizeResult UploadAssembler::handOff(const UploadSession& session, const AssembledHandler& handler) {
    FinalizeResult result;
    result.sessionId = session.sessionId;
    result.fileName = session.fileName;
    result.fingerprint = session.fingerprint;

    if (!handler) {
        result.error = IngestError::InvalidRequest;
        result.errorMessage = "No ingestion handler configured";
        return result;
    }

    AssembledFile file;
    file.sessionId = session.sessionId;
    file.fileName = session.fileName;
    file.path = assembledPath(session.sessionId);
    file.fingerprint = session.fingerprint;

    std::error_code ec;
    file.size = static_cast<int64_t>(fs::file_size(file.path, ec));
    if (ec) {
        file.size = 0;
    }

    HandoffResult handoff = handler(file);

    if (!handoff.success) {
        // El artefacto ensamblado se conserva para reintentar
        LOG_ERROR("Ingestion of session " + session.sessionId + " failed: " + handoff.errorMessage);
        result.error = handoff.error;
        result.errorMessage = handoff.errorMessage;
        return result;
    }

    fs::remove(file.path, ec);
    if (ec) {
        LOG_WARNING("Cannot remove assembled file " + file.path + ": " + ec.message());
    }

    result.success = true;
    result.skipped = handoff.skipped;
    result.destination = handoff.destination;
    LOG_INFO("Upload finalized for session " + session.sessionId + " -> " + result.destination +
             (result.skipped ? " (duplicate)" : ""));
    return result;
}

FinalizeResult UploadAssembler::finalize(const std::string& sessionId, const AssembledHandler& handler) {
    FinalizeResult result;
    result.sessionId = sessionId;

    if (!isValidSessionId(sessionId)) {
        result.error = IngestError::UnknownSession;
        result.errorMessage = "Invalid session id";
        return result;
    }
    if (!m_database) {
        result.error = IngestError::StorageFailure;
        result.errorMessage = "Metadata store not available";
        return result;
    }

    auto lock = sessionLock(sessionId);
    std::unique_lock<std::shared_mutex> guard(*lock);

    UploadSession session;
    LookupResult lookup = m_database->getUploadSession(sessionId, session);
    if (lookup == LookupResult::Error) {
        result.error = IngestError::StorageFailure;
        result.errorMessage = "Session lookup failed: " + m_database->lastError();
        return result;
    }
    if (lookup == LookupResult::NotFound) {
        result.error = IngestError::UnknownSession;
        result.errorMessage = "Session " + sessionId + " not found";
        return result;
    }

    result.fileName = session.fileName;
    std::error_code ec;

    if (session.status == SessionStatus::Failed) {
        result.error = IngestError::InvalidRequest;
        result.errorMessage = "Session " + sessionId + " failed (" + session.errorMessage +
                              "), start a new session";
        return result;
    }

    if (session.status == SessionStatus::Completed) {
        result.fingerprint = session.fingerprint;

        FileRecord record;
        LookupResult recordLookup = m_database->getFileByFingerprint(session.fingerprint, record);
        if (recordLookup == LookupResult::Found) {
            result.success = true;
            result.alreadyCompleted = true;
            result.destination = record.backupPath;
            result.skipped = record.uploadSessionId != sessionId;
            return result;
        }
        if (recordLookup == LookupResult::Error) {
            result.error = IngestError::StorageFailure;
            result.errorMessage = "Fingerprint lookup failed: " + m_database->lastError();
            return result;
        }

        // Completada pero sin registro: la entrega anterior falló
        if (!fs::exists(assembledPath(sessionId), ec)) {
            result.error = IngestError::StorageFailure;
            result.errorMessage = "Assembled content for session " + sessionId +
                                  " is no longer available, start a new session";
            return result;
        }

        LOG_INFO("Retrying ingestion for completed session " + sessionId);
        m_database->incrementSessionRetry(sessionId);
        return handOff(session, handler);
    }

    std::vector<int64_t> received;
    if (!m_database->getReceivedChunks(sessionId, received)) {
        result.error = IngestError::StorageFailure;
        result.errorMessage = "Cannot read received chunks: " + m_database->lastError();
        return result;
    }

    std::vector<int64_t> missing = missingIndices(session.totalChunks, received);
    bool alreadyAssembled = missing.empty() && fs::exists(assembledPath(sessionId), ec);

    if (missing.empty() && !alreadyAssembled) {
        // Un índice registrado sin artefacto se olvida para que se reenvíe
        for (int64_t index : received) {
            if (!fs::exists(chunkPath(sessionId, index), ec)) {
                LOG_WARNING("Chunk " + std::to_string(index) + " of session " + sessionId +
                            " recorded but missing on disk");
                m_database->removeReceivedChunk(sessionId, index);
                missing.push_back(index);
            }
        }
        std::sort(missing.begin(), missing.end());
    }

    if (!missing.empty()) {
        result.error = IngestError::IncompleteTransfer;
        result.missingChunks = missing;
        result.errorMessage = "Missing " + std::to_string(missing.size()) + " of " +
                              std::to_string(session.totalChunks) + " chunks";
        LOG_INFO("Finalize rejected for session " + sessionId + ": " + result.errorMessage);
        return result;
    }

    // Una sesión pausada (por ejemplo tras reconcile) se reanuda antes de completarse
    if (session.status == SessionStatus::Paused) {
        LOG_INFO("Resuming paused session " + sessionId + " for finalize");
        if (!m_database->updateSessionStatus(sessionId, SessionStatus::InProgress)) {
            result.error = IngestError::StorageFailure;
            result.errorMessage = "Cannot resume session: " + m_database->lastError();
            return result;
        }
        session.status = SessionStatus::InProgress;
    }

    if (!alreadyAssembled) {
        std::string assembleError;
        if (!assembleChunks(session, assembleError)) {
            LOG_ERROR("Assembly failed for session " + sessionId + ": " + assembleError);
            result.error = IngestError::StorageFailure;
            result.errorMessage = assembleError;
            return result;
        }
    }

    int64_t assembledSize = static_cast<int64_t>(fs::file_size(assembledPath(sessionId), ec));
    if (!ec && assembledSize != session.fileSize) {
        LOG_WARNING("Session " + sessionId + " declared " + std::to_string(session.fileSize) +
                    " bytes but assembled " + std::to_string(assembledSize));
    }

    std::string fingerprint = m_fingerprints.fingerprintFile(assembledPath(sessionId));
    if (fingerprint.empty()) {
        result.error = IngestError::HashFailure;
        result.errorMessage = "Cannot fingerprint assembled content";
        return result;
    }

    if (!m_database->completeUploadSession(sessionId, fingerprint)) {
        result.error = IngestError::StorageFailure;
        result.errorMessage = "Cannot mark session complete: " + m_database->lastError();
        return result;
    }

    session.fingerprint = fingerprint;
    session.status = SessionStatus::Completed;
    return handOff(session, handler);
}

// ============================================================================
// Control de sesiones
// ============================================================================

int UploadAssembler::removeSessionArtifacts(const std::string& sessionId) {
    int removed = 0;
    std::error_code ec;

    fs::directory_iterator it(m_options.tempRoot, ec);
    if (ec) {
        LOG_WARNING("Cannot list temp directory: " + ec.message());
        return 0;
    }

    for (; it != fs::directory_iterator(); it.increment(ec)) {
        if (ec) {
            break;
        }
        const fs::directory_entry& entry = *it;
        std::string owner;
        int64_t index = -1;
        // Comparación exacta: "a" no debe tocar los artefactos de "a_chunk_9"
        if (parseArtifactName(entry.path().filename().string(), owner, index) && owner == sessionId) {
            std::error_code removeEc;
            if (fs::remove(entry.path(), removeEc)) {
                ++removed;
            }
        }
    }

    return removed;
}

bool UploadAssembler::failSession(const std::string& sessionId, const std::string& reason) {
    int removed = removeSessionArtifacts(sessionId);
    LOG_INFO("Session " + sessionId + " closed (" + reason + "), removed " +
             std::to_string(removed) + " artifacts");
    return m_database->failUploadSession(sessionId, reason);
}

bool UploadAssembler::cancel(const std::string& sessionId, IngestError* error) {
    auto setError = [error](IngestError value) {
        if (error) {
            *error = value;
        }
    };
    setError(IngestError::None);

    if (!isValidSessionId(sessionId) || !m_database) {
        setError(IngestError::UnknownSession);
        return false;
    }

    auto lock = sessionLock(sessionId);
    std::unique_lock<std::shared_mutex> guard(*lock);

    UploadSession session;
    LookupResult lookup = m_database->getUploadSession(sessionId, session);
    if (lookup != LookupResult::Found) {
        setError(lookup == LookupResult::NotFound ? IngestError::UnknownSession
                                                  : IngestError::StorageFailure);
        return false;
    }

    if (session.status == SessionStatus::Completed) {
        LOG_WARNING("Cannot cancel completed session " + sessionId);
        setError(IngestError::InvalidRequest);
        return false;
    }
    if (session.status == SessionStatus::Failed) {
        return true;
    }

    if (!failSession(sessionId, "cancelled")) {
        setError(IngestError::StorageFailure);
        return false;
    }
    return true;
}

bool UploadAssembler::pause(const std::string& sessionId) {
    if (!isValidSessionId(sessionId) || !m_database) {
        return false;
    }

    auto lock = sessionLock(sessionId);
    std::unique_lock<std::shared_mutex> guard(*lock);

    UploadSession session;
    if (m_database->getUploadSession(sessionId, session) != LookupResult::Found ||
        session.status != SessionStatus::InProgress) {
        return false;
    }

    LOG_INFO("Pausing upload session: " + sessionId);
    return m_database->updateSessionStatus(sessionId, SessionStatus::Paused);
}

bool UploadAssembler::resume(const std::string& sessionId) {
    if (!isValidSessionId(sessionId) || !m_database) {
        return false;
    }

    auto lock = sessionLock(sessionId);
    std::unique_lock<std::shared_mutex> guard(*lock);

    UploadSession session;
    if (m_database->getUploadSession(sessionId, session) != LookupResult::Found ||
        session.status != SessionStatus::Paused) {
        return false;
    }

    LOG_INFO("Resuming upload session: " + sessionId);
    return m_database->updateSessionStatus(sessionId, SessionStatus::InProgress);
}

SessionStatusInfo UploadAssembler::getSessionStatus(const std::string& sessionId) {
    SessionStatusInfo info;
    info.sessionId = sessionId;

    if (!isValidSessionId(sessionId) || !m_database) {
        return info;
    }

    UploadSession session;
    if (m_database->getUploadSession(sessionId, session) != LookupResult::Found) {
        return info;
    }

    info.exists = true;
    info.fileName = session.fileName;
    info.fileSize = session.fileSize;
    info.totalChunks = session.totalChunks;
    info.receivedChunks = session.receivedChunks;
    info.receivedBytes = session.receivedBytes;
    info.status = session.status;
    info.fingerprint = session.fingerprint;
    info.errorMessage = session.errorMessage;
    info.progressPercent = percentOf(session.receivedChunks, session.totalChunks);

    if (session.status == SessionStatus::InProgress || session.status == SessionStatus::Paused) {
        std::vector<int64_t> received;
        if (m_database->getReceivedChunks(sessionId, received)) {
            info.missingChunks = missingIndices(session.totalChunks, received);
        }
    }

    return info;
}

// ============================================================================
// Mantenimiento
// ============================================================================

int UploadAssembler::sweepStaleSessions(int retentionHours) {
    if (!m_database) {
        return 0;
    }

    int64_t cutoff = Database::now() - static_cast<int64_t>(retentionHours) * 3600;
    std::vector<UploadSession> stale = m_database->getStaleSessions(cutoff);
    int expired = 0;

    for (const auto& candidate : stale) {
        auto lock = sessionLock(candidate.sessionId);
        std::unique_lock<std::shared_mutex> guard(*lock);

        // Puede haber recibido un chunk desde la consulta
        UploadSession session;
        if (m_database->getUploadSession(candidate.sessionId, session) != LookupResult::Found) {
            continue;
        }
        bool active = session.status == SessionStatus::InProgress ||
                      session.status == SessionStatus::Paused;
        if (!active || session.updatedAt > cutoff) {
            continue;
        }

        if (failSession(session.sessionId, "expired")) {
            ++expired;
        }
    }

    if (expired > 0) {
        LOG_INFO("Expired " + std::to_string(expired) + " stale upload sessions");
    }
    return expired;
}

int UploadAssembler::purgeTerminalSessions(int retentionDays) {
    if (!m_database) {
        return 0;
    }

    int64_t cutoff = Database::now() - static_cast<int64_t>(retentionDays) * 86400;
    int purged = m_database->purgeTerminalSessions(cutoff);

    if (purged > 0) {
        removeOrphanArtifacts(false);
        pruneSessionLocks();
    }
    return purged;
}

int UploadAssembler::removeOrphanArtifacts(bool startup) {
    int removed = 0;
    std::error_code ec;

    fs::directory_iterator it(m_options.tempRoot, ec);
    if (ec) {
        LOG_WARNING("Cannot list temp directory: " + ec.message());
        return 0;
    }

    // Estado por sesión consultado una sola vez
    std::map<std::string, LookupResult> lookups;
    std::map<std::string, UploadSession> sessions;
    std::map<std::string, std::set<int64_t>> receivedBySession;

    auto lookupSession = [&](const std::string& id) -> LookupResult {
        auto found = lookups.find(id);
        if (found != lookups.end()) {
            return found->second;
        }
        UploadSession session;
        LookupResult lookup = m_database->getUploadSession(id, session);
        lookups[id] = lookup;
        if (lookup == LookupResult::Found) {
            sessions[id] = session;
            std::vector<int64_t> received;
            m_database->getReceivedChunks(id, received);
            receivedBySession[id] = std::set<int64_t>(received.begin(), received.end());
        }
        return lookup;
    };

    std::vector<fs::path> toRemove;

    for (; it != fs::directory_iterator(); it.increment(ec)) {
        if (ec) {
            LOG_WARNING("Error while listing temp directory: " + ec.message());
            break;
        }
        const fs::directory_entry& entry = *it;
        std::error_code entryEc;
        if (!entry.is_regular_file(entryEc)) {
            continue;
        }

        std::string name = entry.path().filename().string();

        // Escrituras interrumpidas: solo se tocan cuando no hay actividad
        if (name.find(".tmp-") != std::string::npos || endsWith(name, ".part")) {
            if (startup) {
                toRemove.push_back(entry.path());
            }
            continue;
        }

        std::string sessionId;
        int64_t chunkIndex = -1;
        if (!parseArtifactName(name, sessionId, chunkIndex)) {
            continue;
        }

        LookupResult lookup = lookupSession(sessionId);
        if (lookup == LookupResult::Error) {
            continue;
        }

        bool orphan = lookup == LookupResult::NotFound ||
                      sessions[sessionId].status == SessionStatus::Failed;

        if (!orphan && chunkIndex >= 0) {
            // Chunk de una sesión completada o nunca registrado
            orphan = sessions[sessionId].status == SessionStatus::Completed ||
                     (startup && receivedBySession[sessionId].count(chunkIndex) == 0);
        }

        if (orphan) {
            toRemove.push_back(entry.path());
        }
    }

    for (const auto& path : toRemove) {
        std::error_code removeEc;
        if (fs::remove(path, removeEc)) {
            ++removed;
            LOG_DEBUG("Removed orphan upload artifact: " + path.filename().string());
        }
    }

    return removed;
}

ReconcileReport UploadAssembler::reconcile() {
    ReconcileReport report;

    if (!m_database) {
        return report;
    }

    std::vector<UploadSession> active = m_database->getIncompleteSessions();
    for (const auto& session : active) {
        if (session.status == SessionStatus::InProgress) {
            ++report.pausedSessions;
        }
    }
    m_database->markAllActiveSessionsAsPaused();

    report.removedArtifacts = removeOrphanArtifacts(true);

    // Índices registrados cuyo artefacto ya no existe
    std::error_code ec;
    for (const auto& session : active) {
        if (fs::exists(assembledPath(session.sessionId), ec)) {
            continue;
        }

        std::vector<int64_t> received;
        if (!m_database->getReceivedChunks(session.sessionId, received)) {
            continue;
        }

        for (int64_t index : received) {
            if (!fs::exists(chunkPath(session.sessionId, index), ec)) {
                if (m_database->removeReceivedChunk(session.sessionId, index)) {
                    ++report.forgottenChunks;
                }
            }
        }
    }

    LOG_INFO("Upload reconciliation: paused " + std::to_string(report.pausedSessions) +
             " sessions, removed " + std::to_string(report.removedArtifacts) +
             " artifacts, forgot " + std::to_string(report.forgottenChunks) + " chunks");
    return report;
}

} // namespace MediaVault
