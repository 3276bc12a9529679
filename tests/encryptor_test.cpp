#include "test_support.h"
#include "encryptor.h"
#include <filesystem>

using namespace MediaVault;
using MediaVault::Testing::TempDirTest;
using MediaVault::Testing::patternBytes;

namespace fs = std::filesystem;

class EncryptorTest : public TempDirTest {
protected:
    void SetUp() override {
        TempDirTest::SetUp();
        ASSERT_TRUE(m_encryptor.setKey(std::vector<unsigned char>(Encryptor::KEY_SIZE, 0x42)));
    }

    Encryptor m_encryptor;
};

TEST_F(EncryptorTest, RoundTripsAcrossChunkBoundaries) {
    const size_t sizes[] = {0, 1, Encryptor::CHUNK_SIZE - 1, Encryptor::CHUNK_SIZE,
                            Encryptor::CHUNK_SIZE * 2 + 123};

    for (size_t size : sizes) {
        std::string plain = patternBytes(size, static_cast<unsigned>(size) + 3);
        std::string cipher;
        std::string decrypted;

        ASSERT_TRUE(m_encryptor.encryptBytes(plain, cipher)) << size;
        EXPECT_EQ(cipher.compare(0, 4, "MVE1"), 0);
        ASSERT_TRUE(m_encryptor.decryptBytes(cipher, decrypted)) << m_encryptor.lastError();
        EXPECT_EQ(decrypted, plain) << size;
    }
}

TEST_F(EncryptorTest, SamePlaintextEncryptsDifferently) {
    std::string first;
    std::string second;
    ASSERT_TRUE(m_encryptor.encryptBytes("identical", first));
    ASSERT_TRUE(m_encryptor.encryptBytes("identical", second));
    EXPECT_NE(first, second);
}

TEST_F(EncryptorTest, RejectsTamperedCiphertext) {
    std::string plain = patternBytes(1000);
    std::string cipher;
    ASSERT_TRUE(m_encryptor.encryptBytes(plain, cipher));

    std::string tampered = cipher;
    tampered[tampered.size() / 2] = static_cast<char>(tampered[tampered.size() / 2] ^ 0x01);

    std::string decrypted;
    EXPECT_FALSE(m_encryptor.decryptBytes(tampered, decrypted));
    EXPECT_FALSE(m_encryptor.lastError().empty());
}

TEST_F(EncryptorTest, RejectsTruncatedCiphertext) {
    std::string plain = patternBytes(Encryptor::CHUNK_SIZE * 2 + 10);
    std::string cipher;
    ASSERT_TRUE(m_encryptor.encryptBytes(plain, cipher));

    // Se elimina el último registro completo
    size_t lastRecord = 4 + 4 + 2 * (4 + Encryptor::IV_SIZE + Encryptor::CHUNK_SIZE + Encryptor::TAG_SIZE);
    std::string decrypted;
    EXPECT_FALSE(m_encryptor.decryptBytes(cipher.substr(0, lastRecord), decrypted));
}

TEST_F(EncryptorTest, WrongKeyCannotDecrypt) {
    std::string cipher;
    ASSERT_TRUE(m_encryptor.encryptBytes("secret photo", cipher));

    Encryptor other;
    ASSERT_TRUE(other.setKey(std::vector<unsigned char>(Encryptor::KEY_SIZE, 0x24)));
    std::string decrypted;
    EXPECT_FALSE(other.decryptBytes(cipher, decrypted));
}

TEST_F(EncryptorTest, KeyIsGeneratedOnceAndReloaded) {
    std::string keyPath = pathFor("keys/.encryption_key");

    Encryptor first;
    ASSERT_TRUE(first.loadOrCreateKey(keyPath));
    EXPECT_TRUE(first.verifyKey());

    auto perms = fs::status(keyPath).permissions();
    EXPECT_EQ(perms & fs::perms::all, fs::perms::owner_read | fs::perms::owner_write);

    std::string hex = readFile(keyPath);
    EXPECT_EQ(hex.size(), Encryptor::KEY_SIZE * 2 + 1);

    std::string cipher;
    ASSERT_TRUE(first.encryptBytes("payload", cipher));

    Encryptor second;
    ASSERT_TRUE(second.loadOrCreateKey(keyPath));
    EXPECT_EQ(readFile(keyPath), hex);

    std::string decrypted;
    ASSERT_TRUE(second.decryptBytes(cipher, decrypted));
    EXPECT_EQ(decrypted, "payload");
}

TEST_F(EncryptorTest, MalformedKeyFileIsRejected) {
    Encryptor encryptor;
    EXPECT_FALSE(encryptor.loadOrCreateKey(writeFile(".encryption_key", "not-hex\n")));
    EXPECT_FALSE(encryptor.hasKey());

    std::string cipher;
    EXPECT_FALSE(encryptor.encryptBytes("x", cipher));
}

TEST_F(EncryptorTest, EncryptsAndDecryptsFiles) {
    std::string plain = patternBytes(Encryptor::CHUNK_SIZE + 5);
    std::string source = writeFile("IMG_0001.JPG", plain);
    std::string encrypted = pathFor("encrypted/2021/03_March/IMG_0001.JPG.enc");
    std::string restored = pathFor("restored/IMG_0001.JPG");

    ASSERT_TRUE(m_encryptor.encryptFile(source, encrypted)) << m_encryptor.lastError();
    EXPECT_NE(readFile(encrypted), plain);

    ASSERT_TRUE(m_encryptor.decryptFile(encrypted, restored)) << m_encryptor.lastError();
    EXPECT_EQ(readFile(restored), plain);

    EXPECT_FALSE(m_encryptor.decryptFile(source, pathFor("garbage.out")));
    EXPECT_FALSE(fs::exists(pathFor("garbage.out")));
}
