#include "ingestioncoordinator.h"
#include "mediainfo.h"
#include "logger.h"
#include <filesystem>
#include <future>
#include <algorithm>
#include <system_error>

namespace fs = std::filesystem;

namespace MediaVault {

std::string backupStatusToString(BackupStatus status) {
    switch (status) {
        case BackupStatus::Idle: return "idle";
        case BackupStatus::Running: return "running";
        case BackupStatus::Completed: return "completed";
        case BackupStatus::CompletedWithErrors: return "completed_with_errors";
        case BackupStatus::Stopped: return "stopped";
        case BackupStatus::Failed: return "failed";
    }
    return "idle";
}

double BackupProgress::percentage() const {
    if (totalFiles == 0) {
        return 0.0;
    }
    return (static_cast<double>(processedFiles) / static_cast<double>(totalFiles)) * 100.0;
}

int64_t BackupProgress::estimatedSecondsRemaining() const {
    if (processedFiles == 0 || status != BackupStatus::Running) {
        return -1;
    }

    double elapsed = std::chrono::duration<double>(std::chrono::steady_clock::now() - startTime).count();
    if (elapsed <= 0.0) {
        return -1;
    }

    double rate = static_cast<double>(processedFiles) / elapsed;
    return static_cast<int64_t>(static_cast<double>(totalFiles - processedFiles) / rate);
}

IngestionCoordinator::IngestionCoordinator(Database* database, const FingerprintEngine& fingerprints,
                                           const PlacementResolver& resolver, Encryptor* encryptor,
                                           const CoordinatorOptions& options)
    : m_database(database)
    , m_fingerprints(fingerprints)
    , m_resolver(resolver)
    , m_encryptor(encryptor)
    , m_options(options)
{
    if (m_options.maxConcurrentIngestions < 1) {
        m_options.maxConcurrentIngestions = 1;
    }
}

IngestionCoordinator::~IngestionCoordinator() {
}

// ============================================================================
// Reclamo por fingerprint
// ============================================================================

void IngestionCoordinator::claimFingerprint(const std::string& fingerprint) {
    std::unique_lock<std::mutex> lock(m_claimsMutex);
    m_claimsCv.wait(lock, [this, &fingerprint]() {
        return m_inFlight.find(fingerprint) == m_inFlight.end();
    });
    m_inFlight.insert(fingerprint);
}

void IngestionCoordinator::releaseFingerprint(const std::string& fingerprint) {
    {
        std::lock_guard<std::mutex> lock(m_claimsMutex);
        m_inFlight.erase(fingerprint);
    }
    m_claimsCv.notify_all();
}

IngestionCoordinator::FingerprintClaim::FingerprintClaim(IngestionCoordinator& owner,
                                                         const std::string& fingerprint)
    : m_owner(owner)
    , m_fingerprint(fingerprint)
{
    m_owner.claimFingerprint(m_fingerprint);
}

IngestionCoordinator::FingerprintClaim::~FingerprintClaim() {
    m_owner.releaseFingerprint(m_fingerprint);
}

// ============================================================================
// Ingesta de un archivo
// ============================================================================

bool IngestionCoordinator::copyToDestination(const std::string& source, const std::string& destination,
                                             bool& alreadyExists, std::string& errorMessage) {
    alreadyExists = false;
    std::error_code ec;

    // copy_options::none falla si el destino existe: nunca se sobrescribe
    fs::copy_file(source, destination, fs::copy_options::none, ec);
    if (ec) {
        alreadyExists = ec == std::errc::file_exists;
        errorMessage = "Copy to " + destination + " failed: " + ec.message();
        return false;
    }

    auto mtime = fs::last_write_time(source, ec);
    if (!ec) {
        fs::last_write_time(destination, mtime, ec);
    }
    if (ec) {
        LOG_WARNING("Could not preserve modification time on " + destination + ": " + ec.message());
    }
    return true;
}

std::string IngestionCoordinator::encryptedPathFor(const std::string& destination) const {
    std::error_code ec;
    fs::path relative = fs::relative(destination, m_options.backupRoot, ec);
    if (ec || relative.empty() || *relative.begin() == "..") {
        relative = fs::path(destination).filename();
    }
    return (fs::path(m_options.encryptedRoot) / relative).string() + ".enc";
}

void IngestionCoordinator::discardCopies(const std::string& destination, const std::string& encryptedPath) {
    std::error_code ec;
    if (!destination.empty()) {
        fs::remove(destination, ec);
    }
    if (!encryptedPath.empty()) {
        fs::remove(encryptedPath, ec);
    }
}

IngestResult IngestionCoordinator::ingest(const std::string& sourcePath, const std::string& declaredName,
                                          const std::string& originDevice, IngestMethod method,
                                          const std::string& knownFingerprint,
                                          const std::string& uploadSessionId) {
    IngestResult result;

    std::string fingerprint = knownFingerprint;
    if (fingerprint.empty()) {
        fingerprint = m_fingerprints.fingerprintFile(sourcePath);
    }
    if (fingerprint.empty()) {
        result.error = IngestError::HashFailure;
        result.errorMessage = "Cannot read source " + sourcePath;
        LOG_ERROR(result.errorMessage);
        return result;
    }

    FingerprintClaim claim(*this, fingerprint);
    return ingestClaimed(sourcePath, declaredName, originDevice, method, fingerprint, uploadSessionId);
}

IngestResult IngestionCoordinator::ingestClaimed(const std::string& sourcePath, const std::string& declaredName,
                                                 const std::string& originDevice, IngestMethod method,
                                                 const std::string& fingerprint,
                                                 const std::string& uploadSessionId) {
    IngestResult result;
    result.fingerprint = fingerprint;

    std::error_code ec;
    result.bytes = static_cast<int64_t>(fs::file_size(sourcePath, ec));
    if (ec) {
        result.error = IngestError::HashFailure;
        result.errorMessage = "Cannot stat source " + sourcePath + ": " + ec.message();
        return result;
    }

    std::string name = declaredName.empty() ? fs::path(sourcePath).filename().string() : declaredName;

    PlacementDecision decision;
    bool copied = false;

    for (int attempt = 0; attempt < MAX_PLACEMENT_ATTEMPTS && !copied; ++attempt) {
        decision = m_resolver.resolve(fingerprint, sourcePath, name);

        if (decision.resolution == Resolution::Failed) {
            result.error = IngestError::StorageFailure;
            result.errorMessage = decision.errorMessage;
            LOG_ERROR("Placement failed for " + name + ": " + decision.errorMessage);
            return result;
        }

        if (decision.resolution == Resolution::Existing) {
            LOG_INFO("File " + name + " already backed up, skipping");
            result.success = true;
            result.skipped = true;
            result.destination = decision.existing.backupPath;
            return result;
        }

        bool alreadyExists = false;
        std::string copyError;
        copied = copyToDestination(sourcePath, decision.destinationPath, alreadyExists, copyError);

        if (!copied && !alreadyExists) {
            result.error = IngestError::StorageFailure;
            result.errorMessage = copyError;
            LOG_ERROR(copyError);
            return result;
        }
        if (!copied) {
            // Otro ingest ocupó el nombre entre la comprobación y la copia
            LOG_DEBUG("Destination taken, resolving again: " + decision.destinationPath);
        }
    }

    if (!copied) {
        result.error = IngestError::StorageFailure;
        result.errorMessage = "Could not find a free destination for " + name;
        return result;
    }

    result.destination = decision.destinationPath;

    if (!m_fingerprints.verifyFile(decision.destinationPath, fingerprint)) {
        // La copia se deja en su sitio para inspección manual
        result.error = IngestError::IntegrityFailure;
        result.errorMessage = "Integrity check failed after copy: " + decision.destinationPath;
        LOG_ERROR(result.errorMessage);
        return result;
    }

    if (m_options.encryptOriginals) {
        if (!m_encryptor || !m_encryptor->hasKey()) {
            discardCopies(decision.destinationPath, "");
            result.error = IngestError::EncryptionFailure;
            result.errorMessage = "Encryption enabled but no key is loaded";
            LOG_ERROR(result.errorMessage);
            return result;
        }

        std::string encryptedPath = encryptedPathFor(decision.destinationPath);
        if (!m_encryptor->encryptFile(decision.destinationPath, encryptedPath)) {
            discardCopies(decision.destinationPath, "");
            result.error = IngestError::EncryptionFailure;
            result.errorMessage = m_encryptor->lastError();
            return result;
        }
        result.encryptedPath = encryptedPath;
    }

    FileRecord record;
    record.fingerprint = fingerprint;
    record.originalFilename = name;
    record.fileSize = result.bytes;
    record.mediaKind = MediaInfo::mediaKindFor(name);
    record.mimeType = MediaInfo::mimeTypeFor(name);
    record.captureTime = decision.captureTime;
    record.year = decision.year;
    record.month = decision.month;
    record.backupPath = decision.destinationPath;
    record.encryptedPath = result.encryptedPath;
    record.isEncrypted = !result.encryptedPath.empty();
    record.createdAt = Database::now();
    record.sourceDevice = originDevice;
    record.ingestMethod = method;
    record.uploadSessionId = uploadSessionId;

    bool duplicate = false;
    if (!m_database->insertFileRecord(record, &duplicate)) {
        discardCopies(decision.destinationPath, result.encryptedPath);

        if (duplicate) {
            // Otro proceso registró el mismo contenido primero
            FileRecord existing;
            if (m_database->getFileByFingerprint(fingerprint, existing) == LookupResult::Found) {
                result.success = true;
                result.skipped = true;
                result.destination = existing.backupPath;
                result.encryptedPath.clear();
                return result;
            }
        }

        result.error = IngestError::StorageFailure;
        result.errorMessage = "Cannot record " + name + ": " + m_database->lastError();
        result.destination.clear();
        result.encryptedPath.clear();
        return result;
    }

    result.success = true;
    LOG_INFO("Successfully backed up " + name + " -> " + decision.destinationPath);
    return result;
}

// ============================================================================
// Backup de dispositivo
// ============================================================================

BackupReport IngestionCoordinator::runBackup(DeviceLister& lister, const DeviceInfo& device, SyncKind kind,
                                             const CancellationToken& token,
                                             const ProgressCallback& progressCallback) {
    BackupReport report;
    BackupProgress& progress = report.progress;
    progress.status = BackupStatus::Running;
    progress.startTime = std::chrono::steady_clock::now();

    auto notify = [&progress, &progressCallback]() {
        if (progressCallback) {
            progressCallback(progress);
        }
    };

    SyncRecord sync;
    sync.kind = kind;
    sync.status = SyncStatus::InProgress;
    sync.sourceDevice = device.deviceId;
    sync.destinationPath = m_options.backupRoot;

    if (!m_database->createSyncRecord(sync)) {
        progress.status = BackupStatus::Failed;
        progress.endTime = std::chrono::steady_clock::now();
        report.errorMessage = "Cannot create sync record: " + m_database->lastError();
        LOG_ERROR(report.errorMessage);
        notify();
        return report;
    }
    report.syncId = sync.id;

    bool stopped = false;

    try {
        std::vector<CandidateFile> files = lister.listCandidateFiles(device);

        progress.totalFiles = static_cast<int64_t>(files.size());
        for (const auto& file : files) {
            progress.totalBytes += file.size;
        }
        LOG_INFO("Found " + std::to_string(files.size()) + " files to backup from " + device.name);
        notify();

        auto account = [&](const CandidateFile& file, const IngestResult& result) {
            progress.processedFiles++;
            progress.processedBytes += file.size;

            if (result.success) {
                if (result.skipped) {
                    progress.skippedFiles++;
                } else {
                    progress.backedUpFiles++;
                }
            } else {
                progress.failedFiles++;
                report.failures.push_back({file.path, result.error, result.errorMessage});
                LOG_ERROR("Failed to backup " + file.path + ": " + result.errorMessage);
            }
            notify();
        };

        size_t batchSize = static_cast<size_t>(m_options.maxConcurrentIngestions);
        size_t next = 0;

        while (next < files.size()) {
            // La parada se comprueba entre archivos, nunca a mitad de una copia
            if (token.isCancelled()) {
                LOG_INFO("Backup stopped by user");
                stopped = true;
                break;
            }

            size_t end = std::min(files.size(), next + batchSize);

            if (batchSize == 1) {
                const CandidateFile& file = files[next];
                progress.currentFile = fs::path(file.path).filename().string();
                notify();
                account(file, ingest(file.path, progress.currentFile, device.deviceId,
                                     IngestMethod::LocalCable));
            } else {
                std::vector<std::future<IngestResult>> futures;
                for (size_t i = next; i < end; ++i) {
                    const CandidateFile& file = files[i];
                    futures.push_back(std::async(std::launch::async, [this, &file, &device]() {
                        return ingest(file.path, fs::path(file.path).filename().string(),
                                      device.deviceId, IngestMethod::LocalCable);
                    }));
                }

                for (size_t i = next; i < end; ++i) {
                    progress.currentFile = fs::path(files[i].path).filename().string();
                    account(files[i], futures[i - next].get());
                }
            }

            next = end;
        }

        if (stopped) {
            progress.status = BackupStatus::Stopped;
        } else if (progress.failedFiles > 0) {
            progress.status = BackupStatus::CompletedWithErrors;
        } else {
            progress.status = BackupStatus::Completed;
        }

        sync.status = (progress.failedFiles == 0 && !stopped) ? SyncStatus::Success : SyncStatus::Partial;
        if (progress.failedFiles > 0) {
            sync.errorMessage = std::to_string(progress.failedFiles) + " files failed";
        } else if (stopped) {
            sync.errorMessage = "Stopped by user";
        }
    } catch (const std::exception& e) {
        LOG_ERROR("Backup failed: " + std::string(e.what()));
        progress.status = BackupStatus::Failed;
        report.errorMessage = e.what();
        sync.status = SyncStatus::Failed;
        sync.errorMessage = e.what();
    }

    progress.endTime = std::chrono::steady_clock::now();
    progress.currentFile.clear();

    sync.filesProcessed = progress.processedFiles;
    sync.filesBackedUp = progress.backedUpFiles;
    sync.filesSkipped = progress.skippedFiles;
    sync.filesFailed = progress.failedFiles;
    sync.totalBytes = progress.processedBytes;
    sync.completedAt = Database::now();
    sync.durationSeconds = std::chrono::duration_cast<std::chrono::seconds>(
        progress.endTime - progress.startTime).count();

    if (!m_database->updateSyncRecord(sync)) {
        LOG_ERROR("Failed to update sync record " + std::to_string(sync.id));
    }

    notify();
    LOG_INFO("Backup " + backupStatusToString(progress.status) + ": " +
             std::to_string(progress.backedUpFiles) + " new files, " +
             std::to_string(progress.skippedFiles) + " skipped, " +
             std::to_string(progress.failedFiles) + " failed");
    return report;
}

// ============================================================================
// Subidas por red
// ============================================================================

FinalizeResult IngestionCoordinator::finalizeUpload(UploadAssembler& assembler, const std::string& sessionId,
                                                    const std::string& originDevice) {
    return assembler.finalize(sessionId, [this, &originDevice](const AssembledFile& file) {
        IngestResult ingested = ingest(file.path, file.fileName, originDevice,
                                       IngestMethod::NetworkUpload, file.fingerprint, file.sessionId);

        HandoffResult handoff;
        handoff.success = ingested.success;
        handoff.skipped = ingested.skipped;
        handoff.destination = ingested.destination;
        handoff.error = ingested.error;
        handoff.errorMessage = ingested.errorMessage;
        return handoff;
    });
}

// ============================================================================
// Verificación, restauración y estadísticas
// ============================================================================

VerifyResult IngestionCoordinator::verify(const std::string& fingerprint) {
    VerifyResult result;

    FileRecord record;
    LookupResult lookup = m_database->getFileByFingerprint(fingerprint, record);
    if (lookup == LookupResult::Error) {
        result.error = IngestError::StorageFailure;
        result.message = "Fingerprint lookup failed: " + m_database->lastError();
        return result;
    }
    if (lookup == LookupResult::NotFound) {
        result.error = IngestError::InvalidRequest;
        result.message = "No backup with fingerprint " + fingerprint;
        return result;
    }

    std::error_code ec;
    if (!fs::exists(record.backupPath, ec)) {
        result.error = IngestError::IntegrityFailure;
        result.message = "Backup file missing: " + record.backupPath;
        LOG_WARNING(result.message);
        return result;
    }

    if (!m_fingerprints.verifyFile(record.backupPath, fingerprint)) {
        result.error = IngestError::IntegrityFailure;
        result.message = "Backup file does not match its fingerprint: " + record.backupPath;
        return result;
    }

    if (!m_database->updateLastVerified(fingerprint, Database::now())) {
        LOG_WARNING("Could not update last_verified for " + fingerprint);
    }

    result.ok = true;
    return result;
}

VerifySummary IngestionCoordinator::verifyAll() {
    VerifySummary summary;

    for (const auto& record : m_database->getAllFiles()) {
        summary.checked++;
        if (verify(record.fingerprint).ok) {
            summary.passed++;
        } else {
            summary.failedFingerprints.push_back(record.fingerprint);
        }
    }

    LOG_INFO("Verified " + std::to_string(summary.checked) + " backups, " +
             std::to_string(summary.failedFingerprints.size()) + " failed");
    return summary;
}

bool IngestionCoordinator::restore(const std::string& fingerprint, const std::string& destination,
                                   std::string& errorMessage) {
    FileRecord record;
    LookupResult lookup = m_database->getFileByFingerprint(fingerprint, record);
    if (lookup != LookupResult::Found) {
        errorMessage = lookup == LookupResult::Error ? "Fingerprint lookup failed: " + m_database->lastError()
                                                     : "No backup with fingerprint " + fingerprint;
        return false;
    }

    std::error_code ec;
    fs::path target(destination);
    if (fs::is_directory(target, ec)) {
        target /= record.originalFilename;
    }
    if (fs::exists(target, ec)) {
        errorMessage = "Restore target already exists: " + target.string();
        return false;
    }
    if (target.has_parent_path()) {
        fs::create_directories(target.parent_path(), ec);
    }

    if (fs::exists(record.backupPath, ec)) {
        bool alreadyExists = false;
        if (!copyToDestination(record.backupPath, target.string(), alreadyExists, errorMessage)) {
            return false;
        }
    } else if (record.isEncrypted && fs::exists(record.encryptedPath, ec)) {
        if (!m_encryptor || !m_encryptor->hasKey()) {
            errorMessage = "Encrypted copy available but no key is loaded";
            return false;
        }
        if (!m_encryptor->decryptFile(record.encryptedPath, target.string())) {
            errorMessage = m_encryptor->lastError();
            return false;
        }
    } else {
        errorMessage = "No stored copy of " + record.originalFilename + " is available";
        return false;
    }

    if (!m_fingerprints.verifyFile(target.string(), fingerprint)) {
        errorMessage = "Restored file does not match its fingerprint: " + target.string();
        return false;
    }

    LOG_INFO("Restored " + record.originalFilename + " to " + target.string());
    return true;
}

BackupStatistics IngestionCoordinator::statistics() {
    BackupStatistics stats;
    stats.totalFiles = m_database->getTotalFilesCount();
    stats.totalBytes = m_database->getTotalStorageUsed();
    if (!m_database->getSyncStatistics(stats.syncs)) {
        LOG_WARNING("Could not read sync statistics");
    }
    return stats;
}

} // namespace MediaVault
