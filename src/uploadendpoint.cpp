#include "uploadendpoint.h"
#include "logger.h"

namespace MediaVault {

using nlohmann::json;

UploadEndpoint::UploadEndpoint(UploadAssembler& assembler, IngestionCoordinator& coordinator,
                               const EndpointOptions& options)
    : m_assembler(assembler)
    , m_coordinator(coordinator)
    , m_options(options)
{
}

json UploadEndpoint::errorResponse(IngestError error, const std::string& message) {
    json j;
    j["success"] = false;
    j["error"] = ingestErrorToString(error);
    j["message"] = message;
    return j;
}

json UploadEndpoint::handleChunk(const json& metadata, const std::string& bytes) {
    ChunkRequest request;

    try {
        request.sessionId = metadata.at("session_id").get<std::string>();
        request.chunkIndex = metadata.at("chunk_index").get<int64_t>();
        request.totalChunks = metadata.at("total_chunks").get<int64_t>();
        request.fileName = metadata.at("filename").get<std::string>();
        request.declaredSize = metadata.at("file_size").get<int64_t>();
    } catch (const json::exception& e) {
        LOG_WARNING("Malformed chunk request: " + std::string(e.what()));
        return errorResponse(IngestError::InvalidRequest, "Malformed chunk request: " + std::string(e.what()));
    }

    if (static_cast<int64_t>(bytes.size()) > m_options.chunkSize) {
        return errorResponse(IngestError::InvalidRequest,
                             "Chunk of " + std::to_string(bytes.size()) + " bytes exceeds chunk size " +
                             std::to_string(m_options.chunkSize));
    }

    ChunkResult result = m_assembler.submitChunk(request, bytes);
    if (!result.success) {
        return errorResponse(result.error, result.errorMessage);
    }

    json j;
    j["success"] = true;
    j["chunk_index"] = result.chunkIndex;
    j["uploaded_chunks"] = result.receivedChunks;
    j["total_chunks"] = result.totalChunks;
    j["progress_percentage"] = result.progressPercent;
    if (result.duplicate) {
        j["message"] = "Chunk already uploaded";
    }
    return j;
}

json UploadEndpoint::handleFinalize(const std::string& sessionId) {
    FinalizeResult result = m_coordinator.finalizeUpload(m_assembler, sessionId, m_options.deviceId);

    if (!result.success) {
        json j = errorResponse(result.error, result.errorMessage);
        j["session_id"] = sessionId;
        if (result.error == IngestError::IncompleteTransfer) {
            j["missing_chunks"] = result.missingChunks;
        }
        return j;
    }

    json j;
    j["success"] = true;
    j["session_id"] = sessionId;
    j["filename"] = result.fileName;
    j["fingerprint"] = result.fingerprint;
    j["destination"] = result.destination;
    j["skipped"] = result.skipped;
    return j;
}

json UploadEndpoint::handleStatus(const std::string& sessionId) {
    SessionStatusInfo info = m_assembler.getSessionStatus(sessionId);

    json j;
    j["exists"] = info.exists;
    if (!info.exists) {
        return j;
    }

    j["session_id"] = info.sessionId;
    j["filename"] = info.fileName;
    j["file_size"] = info.fileSize;
    j["total_chunks"] = info.totalChunks;
    j["uploaded_chunks"] = info.receivedChunks;
    j["uploaded_bytes"] = info.receivedBytes;
    j["status"] = sessionStatusToString(info.status);
    j["progress_percentage"] = info.progressPercent;
    j["missing_chunks"] = info.missingChunks;
    if (!info.fingerprint.empty()) {
        j["fingerprint"] = info.fingerprint;
    }
    if (!info.errorMessage.empty()) {
        j["error_message"] = info.errorMessage;
    }
    return j;
}

json UploadEndpoint::handleCancel(const std::string& sessionId) {
    IngestError error = IngestError::None;
    if (!m_assembler.cancel(sessionId, &error)) {
        return errorResponse(error, "Cannot cancel session " + sessionId);
    }

    json j;
    j["success"] = true;
    j["session_id"] = sessionId;
    return j;
}

json UploadEndpoint::handleConfig() const {
    json j;
    j["chunk_size"] = m_options.chunkSize;
    j["max_upload_size"] = m_options.maxUploadSize;
    return j;
}

} // namespace MediaVault
