#ifndef INGESTIONCOORDINATOR_H
#define INGESTIONCOORDINATOR_H

#include <string>
#include <vector>
#include <set>
#include <mutex>
#include <condition_variable>
#include <functional>
#include <chrono>
#include <cstdint>
#include "database.h"
#include "errors.h"
#include "fingerprint.h"
#include "placementresolver.h"
#include "encryptor.h"
#include "devicelister.h"
#include "cancellation.h"
#include "uploadassembler.h"

namespace MediaVault {

struct IngestResult {
    bool success = false;
    bool skipped = false;
    std::string fingerprint;
    std::string destination;
    std::string encryptedPath;
    int64_t bytes = 0;
    IngestError error = IngestError::None;
    std::string errorMessage;
};

enum class BackupStatus {
    Idle,
    Running,
    Completed,
    CompletedWithErrors,
    Stopped,
    Failed
};

std::string backupStatusToString(BackupStatus status);

struct BackupProgress {
    int64_t totalFiles = 0;
    int64_t processedFiles = 0;
    int64_t backedUpFiles = 0;
    int64_t skippedFiles = 0;
    int64_t failedFiles = 0;
    int64_t totalBytes = 0;
    int64_t processedBytes = 0;
    std::string currentFile;
    BackupStatus status = BackupStatus::Idle;
    std::chrono::steady_clock::time_point startTime;
    std::chrono::steady_clock::time_point endTime;

    double percentage() const;
    // Segundos restantes estimados; -1 si aún no se puede estimar
    int64_t estimatedSecondsRemaining() const;
};

struct BackupFailure {
    std::string path;
    IngestError error = IngestError::None;
    std::string message;
};

struct BackupReport {
    BackupProgress progress;
    std::vector<BackupFailure> failures;
    int64_t syncId = 0;
    std::string errorMessage;
};

struct VerifyResult {
    bool ok = false;
    IngestError error = IngestError::None;
    std::string message;
};

struct VerifySummary {
    int64_t checked = 0;
    int64_t passed = 0;
    std::vector<std::string> failedFingerprints;
};

struct BackupStatistics {
    int64_t totalFiles = 0;
    int64_t totalBytes = 0;
    SyncStatistics syncs;
};

struct CoordinatorOptions {
    std::string backupRoot;
    std::string encryptedRoot;
    bool encryptOriginals = false;
    int maxConcurrentIngestions = 1;
};

using ProgressCallback = std::function<void(const BackupProgress&)>;

/**
 * @brief Punto de entrada único del pipeline de ingesta
 *
 * fingerprint -> deduplicación -> copia -> re-verificación -> cifrado
 * opcional -> registro. El escaneo de dispositivos y las subidas por red
 * convergen aquí. Con varias ingestas concurrentes, cada fingerprint se
 * reclama en memoria y la restricción UNIQUE de la BD resuelve cualquier
 * carrera restante.
 */
class IngestionCoordinator {
public:
    IngestionCoordinator(Database* database, const FingerprintEngine& fingerprints,
                         const PlacementResolver& resolver, Encryptor* encryptor,
                         const CoordinatorOptions& options);
    virtual ~IngestionCoordinator();

    IngestResult ingest(const std::string& sourcePath, const std::string& declaredName,
                        const std::string& originDevice, IngestMethod method,
                        const std::string& knownFingerprint = "",
                        const std::string& uploadSessionId = "");

    BackupReport runBackup(DeviceLister& lister, const DeviceInfo& device, SyncKind kind,
                           const CancellationToken& token,
                           const ProgressCallback& progressCallback = nullptr);

    FinalizeResult finalizeUpload(UploadAssembler& assembler, const std::string& sessionId,
                                  const std::string& originDevice);

    VerifyResult verify(const std::string& fingerprint);
    VerifySummary verifyAll();

    bool restore(const std::string& fingerprint, const std::string& destination,
                 std::string& errorMessage);

    BackupStatistics statistics();

protected:
    // Copia sin sobrescribir conservando la fecha de modificación
    virtual bool copyToDestination(const std::string& source, const std::string& destination,
                                   bool& alreadyExists, std::string& errorMessage);

private:
    IngestResult ingestClaimed(const std::string& sourcePath, const std::string& declaredName,
                               const std::string& originDevice, IngestMethod method,
                               const std::string& fingerprint, const std::string& uploadSessionId);
    std::string encryptedPathFor(const std::string& destination) const;
    void discardCopies(const std::string& destination, const std::string& encryptedPath);

    void claimFingerprint(const std::string& fingerprint);
    void releaseFingerprint(const std::string& fingerprint);

    // Reclamo exclusivo del fingerprint; se libera al destruirse, también ante excepciones
    class FingerprintClaim {
    public:
        FingerprintClaim(IngestionCoordinator& owner, const std::string& fingerprint);
        ~FingerprintClaim();

        FingerprintClaim(const FingerprintClaim&) = delete;
        FingerprintClaim& operator=(const FingerprintClaim&) = delete;

    private:
        IngestionCoordinator& m_owner;
        std::string m_fingerprint;
    };

    Database* m_database;
    const FingerprintEngine& m_fingerprints;
    const PlacementResolver& m_resolver;
    Encryptor* m_encryptor;
    CoordinatorOptions m_options;

    std::set<std::string> m_inFlight;
    std::mutex m_claimsMutex;
    std::condition_variable m_claimsCv;

    static constexpr int MAX_PLACEMENT_ATTEMPTS = 3;
};

} // namespace MediaVault

#endif // INGESTIONCOORDINATOR_H
