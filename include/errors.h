#ifndef ERRORS_H
#define ERRORS_H

#include <string>

namespace MediaVault {

// Códigos de error del pipeline de ingesta y del protocolo de subida
enum class IngestError {
    None,
    HashFailure,         // origen ilegible
    IntegrityFailure,    // el hash de la copia no coincide
    IncompleteTransfer,  // finalize antes de recibir todos los chunks
    UnknownSession,      // chunk/finalize de una sesión inexistente
    StorageFailure,      // base de datos o disco no disponible
    EncryptionFailure,
    InvalidRequest       // parámetros de chunk inválidos o sesión cerrada
};

std::string ingestErrorToString(IngestError error);

} // namespace MediaVault

#endif // ERRORS_H
