#include "test_support.h"
#include "database.h"
#include <thread>

using namespace MediaVault;
using MediaVault::Testing::TempDirTest;

class DatabaseTest : public TempDirTest {
protected:
    void SetUp() override {
        TempDirTest::SetUp();
        ASSERT_TRUE(m_db.initialize(pathFor("meta/backup_metadata.db")));
    }

    void TearDown() override {
        m_db.close();
        TempDirTest::TearDown();
    }

    static FileRecord makeRecord(const std::string& fingerprint, const std::string& name) {
        FileRecord record;
        record.fingerprint = fingerprint;
        record.originalFilename = name;
        record.fileSize = 1234;
        record.mediaKind = MediaKind::Photo;
        record.mimeType = "image/jpeg";
        record.year = 2023;
        record.month = 7;
        record.backupPath = "/vault/2023/07_July/" + name;
        record.sourceDevice = "camera";
        record.ingestMethod = IngestMethod::LocalCable;
        return record;
    }

    UploadSession makeSession(const std::string& id, int64_t totalChunks) {
        UploadSession session;
        session.sessionId = id;
        session.fileName = "clip.mp4";
        session.fileSize = totalChunks * 10;
        session.totalChunks = totalChunks;
        session.tempPath = pathFor("temp");
        return session;
    }

    Database m_db;
};

TEST_F(DatabaseTest, InsertAndLookupByFingerprint) {
    ASSERT_TRUE(m_db.insertFileRecord(makeRecord("aa11", "IMG_0001.JPG")));

    FileRecord found;
    ASSERT_EQ(m_db.getFileByFingerprint("aa11", found), LookupResult::Found);
    EXPECT_EQ(found.originalFilename, "IMG_0001.JPG");
    EXPECT_EQ(found.fileSize, 1234);
    EXPECT_EQ(found.mediaKind, MediaKind::Photo);
    EXPECT_EQ(found.captureTime, 0);
    EXPECT_EQ(found.lastVerified, 0);
    EXPECT_GT(found.createdAt, 0);

    FileRecord missing;
    EXPECT_EQ(m_db.getFileByFingerprint("ffff", missing), LookupResult::NotFound);
}

TEST_F(DatabaseTest, FingerprintIsUnique) {
    ASSERT_TRUE(m_db.insertFileRecord(makeRecord("aa11", "IMG_0001.JPG")));

    bool duplicate = false;
    EXPECT_FALSE(m_db.insertFileRecord(makeRecord("aa11", "IMG_0001_copy.JPG"), &duplicate));
    EXPECT_TRUE(duplicate);
    EXPECT_EQ(m_db.getTotalFilesCount(), 1);
    EXPECT_EQ(m_db.getTotalStorageUsed(), 1234);
}

TEST_F(DatabaseTest, QueriesByMonthAndVerification) {
    FileRecord july = makeRecord("aa11", "a.jpg");
    FileRecord august = makeRecord("bb22", "b.jpg");
    august.month = 8;
    ASSERT_TRUE(m_db.insertFileRecord(july));
    ASSERT_TRUE(m_db.insertFileRecord(august));

    auto files = m_db.getFilesByMonth(2023, 7);
    ASSERT_EQ(files.size(), 1u);
    EXPECT_EQ(files[0].fingerprint, "aa11");

    ASSERT_TRUE(m_db.updateLastVerified("bb22", 1700000000));
    FileRecord verified;
    ASSERT_EQ(m_db.getFileByFingerprint("bb22", verified), LookupResult::Found);
    EXPECT_EQ(verified.lastVerified, 1700000000);

    ASSERT_TRUE(m_db.deleteFileRecord("aa11"));
    EXPECT_EQ(m_db.getAllFiles().size(), 1u);
}

TEST_F(DatabaseTest, ChunkRecordingIsIdempotent) {
    ASSERT_TRUE(m_db.createUploadSession(makeSession("sess-1", 3)));

    bool inserted = false;
    ASSERT_TRUE(m_db.recordReceivedChunk("sess-1", 1, 10, inserted));
    EXPECT_TRUE(inserted);
    ASSERT_TRUE(m_db.recordReceivedChunk("sess-1", 1, 10, inserted));
    EXPECT_FALSE(inserted);

    UploadSession session;
    ASSERT_EQ(m_db.getUploadSession("sess-1", session), LookupResult::Found);
    EXPECT_EQ(session.receivedChunks, 1);
    EXPECT_EQ(session.receivedBytes, 10);
    EXPECT_EQ(session.status, SessionStatus::InProgress);

    std::vector<int64_t> chunks;
    ASSERT_TRUE(m_db.getReceivedChunks("sess-1", chunks));
    EXPECT_EQ(chunks, std::vector<int64_t>({1}));
}

TEST_F(DatabaseTest, SessionCompletesOnlyWithAllChunks) {
    ASSERT_TRUE(m_db.createUploadSession(makeSession("sess-2", 2)));

    bool inserted = false;
    ASSERT_TRUE(m_db.recordReceivedChunk("sess-2", 0, 10, inserted));
    EXPECT_FALSE(m_db.completeUploadSession("sess-2", "cafe"));

    ASSERT_TRUE(m_db.recordReceivedChunk("sess-2", 1, 10, inserted));
    ASSERT_TRUE(m_db.completeUploadSession("sess-2", "cafe"));

    UploadSession session;
    ASSERT_EQ(m_db.getUploadSession("sess-2", session), LookupResult::Found);
    EXPECT_EQ(session.status, SessionStatus::Completed);
    EXPECT_EQ(session.fingerprint, "cafe");
    EXPECT_GT(session.completedAt, 0);
}

TEST_F(DatabaseTest, PausedSessionResumesOnNewChunk) {
    ASSERT_TRUE(m_db.createUploadSession(makeSession("sess-3", 2)));
    ASSERT_TRUE(m_db.markAllActiveSessionsAsPaused());

    UploadSession session;
    ASSERT_EQ(m_db.getUploadSession("sess-3", session), LookupResult::Found);
    EXPECT_EQ(session.status, SessionStatus::Paused);

    bool inserted = false;
    ASSERT_TRUE(m_db.recordReceivedChunk("sess-3", 0, 10, inserted));
    ASSERT_EQ(m_db.getUploadSession("sess-3", session), LookupResult::Found);
    EXPECT_EQ(session.status, SessionStatus::InProgress);
}

TEST_F(DatabaseTest, PurgeRemovesTerminalSessionsAndTheirChunks) {
    ASSERT_TRUE(m_db.createUploadSession(makeSession("done", 1)));
    ASSERT_TRUE(m_db.createUploadSession(makeSession("active", 2)));

    bool inserted = false;
    ASSERT_TRUE(m_db.recordReceivedChunk("done", 0, 10, inserted));
    ASSERT_TRUE(m_db.completeUploadSession("done", "beef"));
    ASSERT_TRUE(m_db.recordReceivedChunk("active", 0, 10, inserted));

    EXPECT_EQ(m_db.purgeTerminalSessions(Database::now() + 1), 1);

    UploadSession session;
    EXPECT_EQ(m_db.getUploadSession("done", session), LookupResult::NotFound);
    EXPECT_EQ(m_db.getUploadSession("active", session), LookupResult::Found);

    std::vector<int64_t> chunks;
    ASSERT_TRUE(m_db.getReceivedChunks("done", chunks));
    EXPECT_TRUE(chunks.empty());
}

TEST_F(DatabaseTest, StaleSessionsExcludeTerminalOnes) {
    ASSERT_TRUE(m_db.createUploadSession(makeSession("stale", 2)));
    ASSERT_TRUE(m_db.createUploadSession(makeSession("closed", 2)));
    ASSERT_TRUE(m_db.failUploadSession("closed", "cancelled"));

    auto stale = m_db.getStaleSessions(Database::now() + 1);
    ASSERT_EQ(stale.size(), 1u);
    EXPECT_EQ(stale[0].sessionId, "stale");

    EXPECT_TRUE(m_db.getStaleSessions(Database::now() - 3600).empty());
}

TEST_F(DatabaseTest, SyncHistoryAndStatistics) {
    SyncRecord first;
    first.kind = SyncKind::Manual;
    first.sourceDevice = "camera";
    ASSERT_TRUE(m_db.createSyncRecord(first));
    EXPECT_GT(first.id, 0);

    first.status = SyncStatus::Success;
    first.filesBackedUp = 5;
    first.filesProcessed = 6;
    first.filesSkipped = 1;
    ASSERT_TRUE(m_db.updateSyncRecord(first));

    SyncRecord second;
    second.kind = SyncKind::Scheduled;
    ASSERT_TRUE(m_db.createSyncRecord(second));
    second.status = SyncStatus::Partial;
    second.filesBackedUp = 2;
    second.filesFailed = 1;
    ASSERT_TRUE(m_db.updateSyncRecord(second));

    SyncStatistics stats;
    ASSERT_TRUE(m_db.getSyncStatistics(stats));
    EXPECT_EQ(stats.totalSyncs, 2);
    EXPECT_EQ(stats.successfulSyncs, 1);
    EXPECT_EQ(stats.totalFilesBackedUp, 7);

    auto recent = m_db.getRecentSyncs(10);
    ASSERT_EQ(recent.size(), 2u);
}

TEST_F(DatabaseTest, PausedSessionIsNotCompletable) {
    ASSERT_TRUE(m_db.createUploadSession(makeSession("sess-4", 1)));

    bool inserted = false;
    ASSERT_TRUE(m_db.recordReceivedChunk("sess-4", 0, 10, inserted));
    ASSERT_TRUE(m_db.updateSessionStatus("sess-4", SessionStatus::Paused));
    EXPECT_FALSE(m_db.completeUploadSession("sess-4", "cafe"));

    ASSERT_TRUE(m_db.updateSessionStatus("sess-4", SessionStatus::InProgress));
    EXPECT_TRUE(m_db.completeUploadSession("sess-4", "cafe"));
}

TEST_F(DatabaseTest, ReceivedBytesBoundedByFileSize) {
    ASSERT_TRUE(m_db.createUploadSession(makeSession("sess-5", 2)));

    bool inserted = false;
    ASSERT_TRUE(m_db.recordReceivedChunk("sess-5", 0, 15, inserted));
    EXPECT_FALSE(m_db.recordReceivedChunk("sess-5", 1, 10, inserted));
    EXPECT_FALSE(inserted);
    EXPECT_NE(m_db.lastError().find("exceeds declared size"), std::string::npos);

    std::vector<int64_t> chunks;
    ASSERT_TRUE(m_db.getReceivedChunks("sess-5", chunks));
    EXPECT_EQ(chunks, std::vector<int64_t>({0}));

    UploadSession session;
    ASSERT_EQ(m_db.getUploadSession("sess-5", session), LookupResult::Found);
    EXPECT_EQ(session.receivedBytes, 15);
}

TEST_F(DatabaseTest, LastErrorBelongsToCallingThread) {
    ASSERT_TRUE(m_db.createUploadSession(makeSession("sess-6", 1)));

    EXPECT_FALSE(m_db.completeUploadSession("ghost", "cafe"));
    EXPECT_NE(m_db.lastError().find("not completable"), std::string::npos);

    std::string otherError;
    std::thread other([this, &otherError]() {
        if (!m_db.createUploadSession(makeSession("sess-6", 1))) {
            otherError = m_db.lastError();
        }
    });
    other.join();

    EXPECT_NE(otherError.find("UNIQUE"), std::string::npos) << otherError;
    EXPECT_NE(m_db.lastError().find("not completable"), std::string::npos) << m_db.lastError();
}
