#ifndef DEVICELISTER_H
#define DEVICELISTER_H

#include <string>
#include <vector>
#include <cstdint>

namespace MediaVault {

struct DeviceInfo {
    std::string deviceId;
    std::string name;
    std::string mountPath;
    std::string mediaRoot;   // DCIM dentro del punto de montaje
};

struct CandidateFile {
    std::string path;
    int64_t size = 0;
    int64_t mtime = 0;
};

/**
 * @brief Enumera los archivos candidatos de un dispositivo
 */
class DeviceLister {
public:
    virtual ~DeviceLister() = default;
    virtual std::vector<CandidateFile> listCandidateFiles(const DeviceInfo& device) = 0;
};

/**
 * @brief Dispositivo montado como directorio (cámara, teléfono por cable)
 *
 * Recorre el árbol DCIM y devuelve los archivos multimedia soportados,
 * ordenados por ruta.
 */
class DirectoryDeviceLister : public DeviceLister {
public:
    std::vector<CandidateFile> listCandidateFiles(const DeviceInfo& device) override;

    // DCIM o "Internal Storage/DCIM"; vacío si el montaje no tiene ninguno
    static std::string findMediaRoot(const std::string& mountPath);

    // Identificador estable: 16 hex de SHA-256(montaje + nombre)
    static DeviceInfo describe(const std::string& mountPath, const std::string& name = "");
};

} // namespace MediaVault

#endif // DEVICELISTER_H
