#include <gtest/gtest.h>
#include "manifest/manifest.hpp"
#include "test_support.hpp"

class ManifestTest : public ::testing::Test {
protected:
    ManifestEntry entry(const std::string& account, const std::string& file, const std::string& db = "") {
        ManifestEntry e;
        e.manifestId = "sched1";
        e.account = account;
        e.file = file;
        e.dbFile = db;
        e.size = 100;
        e.destinationId = "local1";
        e.retention = 2;
        return e;
    }

    TempDir dir_{"manifest"};
    Manifest manifest_{dir_.sub("manifests")};
};

TEST_F(ManifestTest, AppendAndRead) {
    EXPECT_FALSE(manifest_.hasManifest("sched1"));
    ASSERT_TRUE(manifest_.addEntry(entry("alice", "a1.tar.gz", "db1.tar.gz"))) << manifest_.getLastError();
    ASSERT_TRUE(manifest_.addEntry(entry("bob", "b1.tar.gz")));
    EXPECT_TRUE(manifest_.hasManifest("sched1"));

    auto entries = manifest_.readEntries("sched1");
    ASSERT_EQ(entries.size(), 2u);
    EXPECT_EQ(entries[0].account, "alice");
    EXPECT_EQ(entries[0].dbFile, "db1.tar.gz");
    EXPECT_FALSE(entries[0].createdAt.empty());
    EXPECT_EQ(entries[1].dbFile, "");
    EXPECT_EQ(entries[1].destinationId, "local1");

    std::string raw = TempDir::read(manifest_.pathFor("sched1"));
    EXPECT_NE(raw.find("\"db_file\":null"), std::string::npos);
}

// Test that manual runs share one manifest
TEST_F(ManifestTest, ManualIdAndSanitising) {
    ManifestEntry e = entry("alice", "a.tar.gz");
    e.manifestId.clear();
    ASSERT_TRUE(manifest_.addEntry(e));
    EXPECT_EQ(manifest_.readEntries(Manifest::MANUAL_ID).size(), 1u);
    EXPECT_EQ(manifest_.pathFor("../x"), dir_.sub("manifests") + "/x.jsonl");
}

// Test that retention keeps the newest entries per account
TEST_F(ManifestTest, ExpiredEntries) {
    for (const char* f : {"a1", "a2", "a3", "a4"}) {
        manifest_.addEntry(entry("alice", f));
    }
    manifest_.addEntry(entry("bob", "b1"));

    auto expired = manifest_.getExpiredEntries("sched1", "alice", 2);
    ASSERT_EQ(expired.size(), 2u);
    EXPECT_EQ(expired[0].file, "a1");
    EXPECT_EQ(expired[1].file, "a2");

    EXPECT_TRUE(manifest_.getExpiredEntries("sched1", "bob", 2).empty());
    EXPECT_TRUE(manifest_.getExpiredEntries("sched1", "alice", 0).empty());
    EXPECT_TRUE(manifest_.getExpiredEntries("missing", "alice", 1).empty());
}

TEST_F(ManifestTest, RemoveEntriesRewritesFile) {
    manifest_.addEntry(entry("alice", "a1"));
    manifest_.addEntry(entry("alice", "a2"));
    manifest_.addEntry(entry("bob", "b1"));

    ASSERT_TRUE(manifest_.removeEntries("sched1", {"a1", "b1"})) << manifest_.getLastError();
    auto entries = manifest_.readEntries("sched1");
    ASSERT_EQ(entries.size(), 1u);
    EXPECT_EQ(entries[0].file, "a2");

    ASSERT_TRUE(manifest_.addEntry(entry("alice", "a3")));
    EXPECT_EQ(manifest_.readEntries("sched1").size(), 2u);
}

TEST_F(ManifestTest, CorruptLinesAreSkipped) {
    manifest_.addEntry(entry("alice", "a1"));
    {
        std::ofstream out(manifest_.pathFor("sched1"), std::ios::app);
        out << "{broken\n";
    }
    manifest_.addEntry(entry("alice", "a2"));
    auto entries = manifest_.readEntries("sched1");
    ASSERT_EQ(entries.size(), 2u);
    EXPECT_EQ(entries[1].file, "a2");
}
