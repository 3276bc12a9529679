#include "errors.h"

namespace MediaVault {

std::string ingestErrorToString(IngestError error) {
    switch (error) {
        case IngestError::None: return "none";
        case IngestError::HashFailure: return "hash_failure";
        case IngestError::IntegrityFailure: return "integrity_failure";
        case IngestError::IncompleteTransfer: return "incomplete_transfer";
        case IngestError::UnknownSession: return "unknown_session";
        case IngestError::StorageFailure: return "storage_failure";
        case IngestError::EncryptionFailure: return "encryption_failure";
        case IngestError::InvalidRequest: return "invalid_request";
    }
    return "unknown";
}

} // namespace MediaVault
