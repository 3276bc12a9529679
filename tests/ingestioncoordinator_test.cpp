#include "test_support.h"
#include "ingestioncoordinator.h"
#include <filesystem>
#include <fstream>
#include <memory>
#include <stdexcept>

using namespace MediaVault;
using MediaVault::Testing::TempDirTest;
using MediaVault::Testing::patternBytes;
using MediaVault::Testing::makeExifJpeg;

namespace fs = std::filesystem;

namespace {

// Corrompe un bit de cada copia para simular un fallo del medio destino
class BitFlippingCoordinator : public IngestionCoordinator {
public:
    using IngestionCoordinator::IngestionCoordinator;

protected:
    bool copyToDestination(const std::string& source, const std::string& destination,
                           bool& alreadyExists, std::string& errorMessage) override {
        if (!IngestionCoordinator::copyToDestination(source, destination, alreadyExists, errorMessage)) {
            return false;
        }
        std::fstream file(destination, std::ios::in | std::ios::out | std::ios::binary);
        char byte = 0;
        file.seekg(0);
        file.read(&byte, 1);
        byte = static_cast<char>(byte ^ 0x01);
        file.seekp(0);
        file.write(&byte, 1);
        return true;
    }
};

// La primera copia lanza una excepción; las siguientes funcionan
class ThrowingOnceCoordinator : public IngestionCoordinator {
public:
    using IngestionCoordinator::IngestionCoordinator;

protected:
    bool copyToDestination(const std::string& source, const std::string& destination,
                           bool& alreadyExists, std::string& errorMessage) override {
        if (!m_thrown) {
            m_thrown = true;
            throw std::runtime_error("copy interrupted");
        }
        return IngestionCoordinator::copyToDestination(source, destination, alreadyExists, errorMessage);
    }

private:
    bool m_thrown = false;
};

} // namespace

class IngestionCoordinatorTest : public TempDirTest {
protected:
    void SetUp() override {
        TempDirTest::SetUp();
        ASSERT_TRUE(m_db.initialize(pathFor("meta/backup_metadata.db")));
        m_resolver.reset(new PlacementResolver(&m_db, pathFor("vault")));
        ASSERT_TRUE(m_encryptor.setKey(std::vector<unsigned char>(Encryptor::KEY_SIZE, 0x11)));
    }

    void TearDown() override {
        m_db.close();
        TempDirTest::TearDown();
    }

    CoordinatorOptions options(bool encrypt = false, int workers = 1) {
        CoordinatorOptions opts;
        opts.backupRoot = pathFor("vault");
        opts.encryptedRoot = pathFor("encrypted");
        opts.encryptOriginals = encrypt;
        opts.maxConcurrentIngestions = workers;
        return opts;
    }

    std::unique_ptr<IngestionCoordinator> coordinator(bool encrypt = false, int workers = 1) {
        return std::unique_ptr<IngestionCoordinator>(
            new IngestionCoordinator(&m_db, m_fingerprints, *m_resolver, &m_encryptor,
                                     options(encrypt, workers)));
    }

    size_t filesUnder(const std::string& relative) const {
        size_t count = 0;
        std::error_code ec;
        for (fs::recursive_directory_iterator it(pathFor(relative), ec), end; !ec && it != end; it.increment(ec)) {
            if (it->is_regular_file()) {
                ++count;
            }
        }
        return count;
    }

    Database m_db;
    FingerprintEngine m_fingerprints;
    std::unique_ptr<PlacementResolver> m_resolver;
    Encryptor m_encryptor;
};

TEST_F(IngestionCoordinatorTest, IngestsNewFile) {
    std::string content = makeExifJpeg("2021:03:15 10:20:30") + patternBytes(5000);
    std::string source = writeFile("device/DCIM/IMG_0001.JPG", content);

    auto pipeline = coordinator();
    IngestResult result = pipeline->ingest(source, "IMG_0001.JPG", "camera-1", IngestMethod::LocalCable);

    ASSERT_TRUE(result.success) << result.errorMessage;
    EXPECT_FALSE(result.skipped);
    EXPECT_EQ(result.fingerprint, FingerprintEngine::sha256Hex(content));
    EXPECT_EQ(result.destination,
              (fs::path(pathFor("vault")) / "2021" / "03_March" / "IMG_0001.JPG").string());
    EXPECT_EQ(readFile(result.destination), content);
    EXPECT_EQ(fs::last_write_time(result.destination), fs::last_write_time(source));

    FileRecord record;
    ASSERT_EQ(m_db.getFileByFingerprint(result.fingerprint, record), LookupResult::Found);
    EXPECT_EQ(record.backupPath, result.destination);
    EXPECT_EQ(record.fileSize, static_cast<int64_t>(content.size()));
    EXPECT_EQ(record.mimeType, "image/jpeg");
    EXPECT_EQ(record.sourceDevice, "camera-1");
    EXPECT_EQ(record.ingestMethod, IngestMethod::LocalCable);
    EXPECT_EQ(record.year, 2021);
    EXPECT_EQ(record.month, 3);
    EXPECT_FALSE(record.isEncrypted);
}

TEST_F(IngestionCoordinatorTest, SecondIngestOfSameContentIsSkipped) {
    std::string content = patternBytes(3000);
    std::string source = writeFile("device/IMG_0001.JPG", content);
    std::string renamed = writeFile("other/holiday.jpg", content);

    auto pipeline = coordinator();
    IngestResult first = pipeline->ingest(source, "IMG_0001.JPG", "camera", IngestMethod::LocalCable);
    IngestResult again = pipeline->ingest(source, "IMG_0001.JPG", "camera", IngestMethod::LocalCable);
    IngestResult copy = pipeline->ingest(renamed, "holiday.jpg", "phone", IngestMethod::NetworkUpload);

    ASSERT_TRUE(first.success);
    ASSERT_TRUE(again.success);
    ASSERT_TRUE(copy.success);
    EXPECT_TRUE(again.skipped);
    EXPECT_TRUE(copy.skipped);
    EXPECT_EQ(again.destination, first.destination);
    EXPECT_EQ(copy.destination, first.destination);

    EXPECT_EQ(m_db.getTotalFilesCount(), 1);
    EXPECT_EQ(filesUnder("vault"), 1u);
}

TEST_F(IngestionCoordinatorTest, DifferentContentWithSameNameGetsSuffix) {
    std::string first = writeFile("cam1/IMG_0001.JPG", makeExifJpeg("2021:03:15 10:20:30") + "A");
    std::string second = writeFile("cam2/IMG_0001.JPG", makeExifJpeg("2021:03:20 09:00:00") + "B");

    auto pipeline = coordinator();
    IngestResult a = pipeline->ingest(first, "IMG_0001.JPG", "cam1", IngestMethod::LocalCable);
    IngestResult b = pipeline->ingest(second, "IMG_0001.JPG", "cam2", IngestMethod::LocalCable);

    ASSERT_TRUE(a.success);
    ASSERT_TRUE(b.success);
    EXPECT_EQ(fs::path(a.destination).filename().string(), "IMG_0001.JPG");
    EXPECT_EQ(fs::path(b.destination).filename().string(), "IMG_0001_1.JPG");
    EXPECT_EQ(m_db.getTotalFilesCount(), 2);
}

TEST_F(IngestionCoordinatorTest, CorruptedCopyIsIntegrityFailure) {
    std::string source = writeFile("device/IMG_0001.JPG", patternBytes(2048));

    BitFlippingCoordinator pipeline(&m_db, m_fingerprints, *m_resolver, &m_encryptor, options());
    IngestResult result = pipeline.ingest(source, "IMG_0001.JPG", "camera", IngestMethod::LocalCable);

    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.error, IngestError::IntegrityFailure);
    EXPECT_EQ(m_db.getTotalFilesCount(), 0);

    // La copia defectuosa queda para inspección
    ASSERT_FALSE(result.destination.empty());
    EXPECT_TRUE(fs::exists(result.destination));
}

TEST_F(IngestionCoordinatorTest, ExceptionDuringIngestReleasesFingerprint) {
    std::string source = writeFile("camera/DCIM/IMG_0005.JPG", patternBytes(3000, 21));

    ThrowingOnceCoordinator pipeline(&m_db, m_fingerprints, *m_resolver, &m_encryptor, options());
    EXPECT_THROW(pipeline.ingest(source, "IMG_0005.JPG", "camera", IngestMethod::LocalCable),
                 std::runtime_error);

    // El mismo contenido vuelve a poder reclamarse sin bloquear
    IngestResult retried = pipeline.ingest(source, "IMG_0005.JPG", "camera", IngestMethod::LocalCable);
    ASSERT_TRUE(retried.success) << retried.errorMessage;
    EXPECT_EQ(m_db.getTotalFilesCount(), 1);
}

TEST_F(IngestionCoordinatorTest, UnreadableSourceIsHashFailure) {
    auto pipeline = coordinator();
    IngestResult result = pipeline->ingest(pathFor("device/missing.jpg"), "missing.jpg", "camera",
                                           IngestMethod::LocalCable);
    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.error, IngestError::HashFailure);
}

TEST_F(IngestionCoordinatorTest, EncryptsOriginalsWhenEnabled) {
    std::string content = patternBytes(Encryptor::CHUNK_SIZE + 100);
    std::string source = writeFile("device/VID_0001.mp4", content);

    auto pipeline = coordinator(true);
    IngestResult result = pipeline->ingest(source, "VID_0001.mp4", "camera", IngestMethod::LocalCable);

    ASSERT_TRUE(result.success) << result.errorMessage;
    ASSERT_FALSE(result.encryptedPath.empty());
    EXPECT_EQ(result.encryptedPath.compare(0, pathFor("encrypted").size(), pathFor("encrypted")), 0);
    EXPECT_EQ(fs::path(result.encryptedPath).extension().string(), ".enc");

    std::string decrypted;
    ASSERT_TRUE(m_encryptor.decryptBytes(readFile(result.encryptedPath), decrypted));
    EXPECT_EQ(decrypted, content);

    FileRecord record;
    ASSERT_EQ(m_db.getFileByFingerprint(result.fingerprint, record), LookupResult::Found);
    EXPECT_TRUE(record.isEncrypted);
    EXPECT_EQ(record.encryptedPath, result.encryptedPath);
    EXPECT_EQ(record.mediaKind, MediaKind::Video);
}

TEST_F(IngestionCoordinatorTest, MissingKeyIsEncryptionFailure) {
    std::string source = writeFile("device/IMG_0001.JPG", patternBytes(100));
    Encryptor keyless;

    IngestionCoordinator pipeline(&m_db, m_fingerprints, *m_resolver, &keyless, options(true));
    IngestResult result = pipeline.ingest(source, "IMG_0001.JPG", "camera", IngestMethod::LocalCable);

    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.error, IngestError::EncryptionFailure);
    EXPECT_EQ(m_db.getTotalFilesCount(), 0);
    EXPECT_EQ(filesUnder("vault"), 0u);
}

TEST_F(IngestionCoordinatorTest, BackupRunCountsNewAndSkippedFiles) {
    std::string shared = patternBytes(1500, 3);
    writeFile("camera/DCIM/100/IMG_0001.JPG", shared);
    writeFile("camera/DCIM/100/IMG_0002.JPG", patternBytes(1500, 4));
    writeFile("camera/DCIM/101/IMG_0001.JPG", shared);
    writeFile("camera/DCIM/101/readme.txt", "ignored");

    DeviceInfo device = DirectoryDeviceLister::describe(pathFor("camera"));
    DirectoryDeviceLister lister;
    CancellationToken token;
    auto pipeline = coordinator();

    int notifications = 0;
    BackupReport report = pipeline->runBackup(lister, device, SyncKind::Manual, token,
                                              [&notifications](const BackupProgress&) { ++notifications; });

    EXPECT_EQ(report.progress.status, BackupStatus::Completed);
    EXPECT_EQ(report.progress.totalFiles, 3);
    EXPECT_EQ(report.progress.backedUpFiles, 2);
    EXPECT_EQ(report.progress.skippedFiles, 1);
    EXPECT_EQ(report.progress.failedFiles, 0);
    EXPECT_DOUBLE_EQ(report.progress.percentage(), 100.0);
    EXPECT_GT(notifications, 0);

    BackupReport rerun = pipeline->runBackup(lister, device, SyncKind::Scheduled, token);
    EXPECT_EQ(rerun.progress.backedUpFiles, 0);
    EXPECT_EQ(rerun.progress.skippedFiles, 3);
    EXPECT_EQ(filesUnder("vault"), 2u);

    auto syncs = m_db.getRecentSyncs(10);
    ASSERT_EQ(syncs.size(), 2u);
    for (const auto& sync : syncs) {
        EXPECT_EQ(sync.status, SyncStatus::Success);
        EXPECT_EQ(sync.sourceDevice, device.deviceId);
    }

    BackupStatistics stats = pipeline->statistics();
    EXPECT_EQ(stats.totalFiles, 2);
    EXPECT_EQ(stats.totalBytes, 3000);
    EXPECT_EQ(stats.syncs.totalSyncs, 2);
    EXPECT_EQ(stats.syncs.successfulSyncs, 2);
    EXPECT_EQ(stats.syncs.totalFilesBackedUp, 2);
}

TEST_F(IngestionCoordinatorTest, ParallelBackupKeepsOneCopyPerContent) {
    for (int i = 0; i < 12; ++i) {
        // Tres contenidos distintos repetidos bajo nombres diferentes
        writeFile("camera/DCIM/IMG_" + std::to_string(1000 + i) + ".JPG", patternBytes(4000, i % 3));
    }

    DeviceInfo device = DirectoryDeviceLister::describe(pathFor("camera"));
    DirectoryDeviceLister lister;
    CancellationToken token;
    auto pipeline = coordinator(false, 4);

    BackupReport report = pipeline->runBackup(lister, device, SyncKind::Manual, token);

    EXPECT_EQ(report.progress.status, BackupStatus::Completed);
    EXPECT_EQ(report.progress.backedUpFiles, 3);
    EXPECT_EQ(report.progress.skippedFiles, 9);
    EXPECT_EQ(m_db.getTotalFilesCount(), 3);
    EXPECT_EQ(filesUnder("vault"), 3u);
}

TEST_F(IngestionCoordinatorTest, StoppedBackupRecordsPartialRun) {
    writeFile("camera/DCIM/IMG_0001.JPG", patternBytes(100));

    DeviceInfo device = DirectoryDeviceLister::describe(pathFor("camera"));
    DirectoryDeviceLister lister;
    CancellationToken token;
    token.cancel();

    BackupReport report = coordinator()->runBackup(lister, device, SyncKind::Manual, token);
    EXPECT_EQ(report.progress.status, BackupStatus::Stopped);
    EXPECT_EQ(report.progress.processedFiles, 0);

    auto syncs = m_db.getRecentSyncs(1);
    ASSERT_EQ(syncs.size(), 1u);
    EXPECT_EQ(syncs[0].status, SyncStatus::Partial);
}

TEST_F(IngestionCoordinatorTest, FailedFilesAreReportedWithoutStoppingTheRun) {
    writeFile("camera/DCIM/IMG_0001.JPG", patternBytes(100, 1));
    writeFile("camera/DCIM/IMG_0002.JPG", patternBytes(100, 2));

    DeviceInfo device = DirectoryDeviceLister::describe(pathFor("camera"));
    DirectoryDeviceLister lister;
    CancellationToken token;

    BitFlippingCoordinator pipeline(&m_db, m_fingerprints, *m_resolver, &m_encryptor, options());
    BackupReport report = pipeline.runBackup(lister, device, SyncKind::Manual, token);

    EXPECT_EQ(report.progress.status, BackupStatus::CompletedWithErrors);
    EXPECT_EQ(report.progress.failedFiles, 2);
    ASSERT_EQ(report.failures.size(), 2u);
    EXPECT_EQ(report.failures[0].error, IngestError::IntegrityFailure);

    auto syncs = m_db.getRecentSyncs(1);
    ASSERT_EQ(syncs.size(), 1u);
    EXPECT_EQ(syncs[0].status, SyncStatus::Partial);
}

TEST_F(IngestionCoordinatorTest, UploadedContentConvergesWithDeviceBackup) {
    std::string content = patternBytes(2500, 9);
    std::string source = writeFile("camera/DCIM/IMG_0042.JPG", content);

    UploadAssembler assembler(&m_db, m_fingerprints, AssemblerOptions{pathFor("temp"), 1024 * 1024, 1000});
    auto pipeline = coordinator();

    for (int64_t i = 0; i < 3; ++i) {
        ChunkRequest request;
        request.sessionId = "phone-upload-1";
        request.chunkIndex = i;
        request.totalChunks = 3;
        request.fileName = "IMG_0042.JPG";
        request.declaredSize = static_cast<int64_t>(content.size());
        ASSERT_TRUE(assembler.submitChunk(request, content.substr(i * 1000, 1000)).success);
    }

    FinalizeResult uploaded = pipeline->finalizeUpload(assembler, "phone-upload-1", "network_upload");
    ASSERT_TRUE(uploaded.success) << uploaded.errorMessage;
    EXPECT_FALSE(uploaded.skipped);
    EXPECT_EQ(readFile(uploaded.destination), content);
    EXPECT_EQ(fs::path(uploaded.destination).filename().string(), "IMG_0042.JPG");

    FileRecord record;
    ASSERT_EQ(m_db.getFileByFingerprint(uploaded.fingerprint, record), LookupResult::Found);
    EXPECT_EQ(record.ingestMethod, IngestMethod::NetworkUpload);
    EXPECT_EQ(record.uploadSessionId, "phone-upload-1");

    IngestResult cable = pipeline->ingest(source, "IMG_0042.JPG", "camera", IngestMethod::LocalCable);
    ASSERT_TRUE(cable.success);
    EXPECT_TRUE(cable.skipped);
    EXPECT_EQ(cable.destination, uploaded.destination);

    FinalizeResult repeated = pipeline->finalizeUpload(assembler, "phone-upload-1", "network_upload");
    ASSERT_TRUE(repeated.success);
    EXPECT_TRUE(repeated.alreadyCompleted);
    EXPECT_EQ(m_db.getTotalFilesCount(), 1);
}

TEST_F(IngestionCoordinatorTest, VerifyDetectsDamagedBackups) {
    auto pipeline = coordinator();
    IngestResult good = pipeline->ingest(writeFile("d/a.jpg", patternBytes(500, 1)), "a.jpg", "d",
                                         IngestMethod::LocalCable);
    IngestResult damaged = pipeline->ingest(writeFile("d/b.jpg", patternBytes(500, 2)), "b.jpg", "d",
                                            IngestMethod::LocalCable);
    IngestResult removed = pipeline->ingest(writeFile("d/c.jpg", patternBytes(500, 3)), "c.jpg", "d",
                                            IngestMethod::LocalCable);
    ASSERT_TRUE(good.success && damaged.success && removed.success);

    {
        std::ofstream out(damaged.destination, std::ios::binary | std::ios::trunc);
        out << "overwritten";
    }
    fs::remove(removed.destination);

    VerifyResult ok = pipeline->verify(good.fingerprint);
    EXPECT_TRUE(ok.ok);
    FileRecord record;
    ASSERT_EQ(m_db.getFileByFingerprint(good.fingerprint, record), LookupResult::Found);
    EXPECT_GT(record.lastVerified, 0);

    EXPECT_EQ(pipeline->verify(damaged.fingerprint).error, IngestError::IntegrityFailure);
    EXPECT_EQ(pipeline->verify(removed.fingerprint).error, IngestError::IntegrityFailure);
    EXPECT_EQ(pipeline->verify("0000").error, IngestError::InvalidRequest);

    VerifySummary summary = pipeline->verifyAll();
    EXPECT_EQ(summary.checked, 3);
    EXPECT_EQ(summary.passed, 1);
    EXPECT_EQ(summary.failedFingerprints.size(), 2u);
}

TEST_F(IngestionCoordinatorTest, RestoresFromCopyOrEncryptedCopy) {
    std::string content = patternBytes(Encryptor::CHUNK_SIZE + 7);
    auto pipeline = coordinator(true);
    IngestResult result = pipeline->ingest(writeFile("d/IMG_0001.JPG", content), "IMG_0001.JPG", "d",
                                           IngestMethod::LocalCable);
    ASSERT_TRUE(result.success) << result.errorMessage;

    fs::create_directories(pathFor("restore"));
    std::string error;
    ASSERT_TRUE(pipeline->restore(result.fingerprint, pathFor("restore"), error)) << error;
    EXPECT_EQ(readFile(pathFor("restore/IMG_0001.JPG")), content);

    EXPECT_FALSE(pipeline->restore(result.fingerprint, pathFor("restore"), error));

    fs::remove(result.destination);
    ASSERT_TRUE(pipeline->restore(result.fingerprint, pathFor("from_encrypted/IMG_0001.JPG"), error)) << error;
    EXPECT_EQ(readFile(pathFor("from_encrypted/IMG_0001.JPG")), content);

    EXPECT_FALSE(pipeline->restore("0000", pathFor("restore/none.jpg"), error));
}
