#ifndef PLACEMENTRESOLVER_H
#define PLACEMENTRESOLVER_H

#include <string>
#include <cstdint>
#include "database.h"

namespace MediaVault {

enum class Resolution {
    Existing,   // el contenido ya está respaldado
    New,        // destino calculado y directorio creado
    Failed      // la BD o el disco no están disponibles
};

struct PlacementDecision {
    Resolution resolution = Resolution::Failed;
    FileRecord existing;
    std::string destinationPath;
    int64_t captureTime = 0;
    int64_t effectiveTime = 0;
    int year = 0;
    int month = 0;
    std::string errorMessage;
};

/**
 * @brief Decide si un contenido ya existe y dónde colocarlo si es nuevo
 *
 * Destino: <root>/<año>/<MM_Mes>/<nombre>. Si el nombre ya está ocupado se
 * añade _1, _2, ... antes de la extensión. La comprobación de colisión no es
 * atómica; la copia posterior nunca sobrescribe y el coordinador reintenta
 * la resolución si pierde la carrera.
 */
class PlacementResolver {
public:
    PlacementResolver(Database* database, const std::string& backupRoot);

    PlacementDecision resolve(const std::string& fingerprint,
                              const std::string& sourcePath,
                              const std::string& declaredName) const;

    // Fecha efectiva: EXIF (fotos) -> mtime -> ahora
    int64_t effectiveDate(const std::string& sourcePath, const std::string& declaredName,
                          int64_t& captureTime) const;

    std::string bucketDirectory(int year, int month) const;
    // Primer nombre libre; vacío con `error` si no se puede comprobar el destino
    static std::string resolveCollision(const std::string& directory, const std::string& fileName,
                                        std::string& error);

    const std::string& backupRoot() const { return m_backupRoot; }

private:
    Database* m_database;
    std::string m_backupRoot;
};

} // namespace MediaVault

#endif // PLACEMENTRESOLVER_H
