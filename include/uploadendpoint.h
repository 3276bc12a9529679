#ifndef UPLOADENDPOINT_H
#define UPLOADENDPOINT_H

#include <string>
#include <nlohmann/json.hpp>
#include "uploadassembler.h"
#include "ingestioncoordinator.h"

namespace MediaVault {

struct EndpointOptions {
    int64_t chunkSize = 10 * 1024 * 1024;
    int64_t maxUploadSize = 5LL * 1024 * 1024 * 1024;
    std::string deviceId = "network_upload";
};

/**
 * @brief Traduce las peticiones del transporte HTTP a JSON y viceversa
 *
 * El transporte entrega los metadatos del chunk como JSON junto con los
 * bytes crudos; las respuestas siguen la forma {success: bool, ...}.
 */
class UploadEndpoint {
public:
    UploadEndpoint(UploadAssembler& assembler, IngestionCoordinator& coordinator,
                   const EndpointOptions& options);

    // {session_id, chunk_index, total_chunks, filename, file_size}
    nlohmann::json handleChunk(const nlohmann::json& metadata, const std::string& bytes);
    nlohmann::json handleFinalize(const std::string& sessionId);
    nlohmann::json handleStatus(const std::string& sessionId);
    nlohmann::json handleCancel(const std::string& sessionId);

    // Parámetros anunciados a los clientes
    nlohmann::json handleConfig() const;

private:
    static nlohmann::json errorResponse(IngestError error, const std::string& message);

    UploadAssembler& m_assembler;
    IngestionCoordinator& m_coordinator;
    EndpointOptions m_options;
};

} // namespace MediaVault

#endif // UPLOADENDPOINT_H
