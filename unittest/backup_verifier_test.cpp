#include <gtest/gtest.h>
#include "backup/backup_verifier.hpp"
#include "test_support.hpp"

class BackupVerifierTest : public ::testing::Test {
protected:
    TempDir dir_{"verify"};
    BackupVerifier verifier_;
};

TEST_F(BackupVerifierTest, ValidArchive) {
    std::string path = dir_.archive("cpmove-alice.tar.gz",
                                    {"cpmove-alice/homedir/public_html/index.html", "cpmove-alice/mysql/alice_wp.sql"});
    VerificationResult result = verifier_.verify(path);
    EXPECT_TRUE(result.success) << result.errorMessage;
    EXPECT_GE(result.entryCount, 2u);

    std::vector<std::string> entries;
    std::string error;
    ASSERT_TRUE(verifier_.listEntries(path, entries, error)) << error;
    bool found = false;
    for (const auto& entry : entries) {
        if (entry.find("mysql/alice_wp.sql") != std::string::npos) {
            found = true;
        }
    }
    EXPECT_TRUE(found);
}

TEST_F(BackupVerifierTest, MissingFile) {
    VerificationResult result = verifier_.verify(dir_.sub("nothing.tar.gz"));
    EXPECT_FALSE(result.success);
    EXPECT_NE(result.errorMessage.find("Archive not found"), std::string::npos);
}

// Test that random bytes and truncated archives are rejected
TEST_F(BackupVerifierTest, CorruptArchives) {
    EXPECT_FALSE(verifier_.verify(dir_.file("garbage.tar.gz", std::string(2048, 'x'))).success);
    EXPECT_FALSE(verifier_.verify(dir_.file("empty.tar.gz", "")).success);

    std::string good = dir_.archive("good.tar.gz", {"a/file1", "a/file2"});
    std::string content = TempDir::read(good);
    std::string truncated = dir_.file("truncated.tar.gz", content.substr(0, content.size() / 2));
    EXPECT_FALSE(verifier_.verify(truncated).success);

    std::vector<std::string> entries;
    std::string error;
    EXPECT_FALSE(verifier_.listEntries(dir_.sub("nothing.tar"), entries, error));
    EXPECT_FALSE(error.empty());
}
