#include <gtest/gtest.h>
#include "common/job_manager.hpp"
#include "fakes.hpp"

class JobManagerTest : public ::testing::Test {
protected:
    ManifestEntry entry(const std::string& account, const std::string& file, const std::string& db = "") {
        ManifestEntry e;
        e.manifestId = "nightly";
        e.account = account;
        e.file = file;
        e.dbFile = db;
        e.destinationId = "remote1";
        e.retention = 2;
        return e;
    }

    TempDir dir_{"jobmgr"};
    FakeEngine engine_{dir_};
};

TEST_F(JobManagerTest, IncompleteContext) {
    EngineContext context = engine_.context;
    context.notifier.reset();
    JobManager manager(context);
    EXPECT_FALSE(manager.initialize());
    EXPECT_EQ(manager.getLastError(), "Engine context is incomplete");

    BackupRequest request;
    request.accounts = {"alice"};
    request.destinationId = "local1";
    BackupJobResult result = manager.runBackup(request);
    EXPECT_EQ(result.message, "Job manager not initialized");
    EXPECT_EQ(result.code, ErrorCode::InternalError);
    EXPECT_EQ(manager.runRestore(RestoreRequest()).code, ErrorCode::InternalError);
    EXPECT_FALSE(manager.previewBackup("x.tar.gz").success);
}

// Test that the production wiring produces a complete engine
TEST_F(JobManagerTest, BuildsDefaultContext) {
    AppConfig config = engine_.context.config;
    JobManager manager(config);
    EXPECT_TRUE(manager.context().isComplete());
    ASSERT_TRUE(manager.initialize()) << manager.getLastError();
    EXPECT_TRUE(manager.requestCancel("backup_1"));
    EXPECT_TRUE(std::filesystem::exists(dir_.sub("cancel/backup_1.cancel")));
}

TEST_F(JobManagerTest, LoadsDestinationsFile) {
    dir_.file("etc/destinations.json",
              R"([{"id": "disk", "name": "Disk", "type": "local", "path": ")" + dir_.sub("store") + R"("}])");
    JobManager manager(engine_.context);
    ASSERT_TRUE(manager.initialize()) << manager.getLastError();

    std::vector<BackupListing> backups;
    EXPECT_TRUE(manager.listBackups("disk", "", backups));
    EXPECT_FALSE(manager.listBackups("local1", "", backups));
    EXPECT_EQ(manager.getLastError(), "Invalid destination");
}

TEST_F(JobManagerTest, MalformedDestinationsFile) {
    dir_.file("etc/destinations.json", "{not json");
    JobManager manager(engine_.context);
    EXPECT_FALSE(manager.initialize());
    EXPECT_NE(manager.getLastError().find("Invalid destinations file"), std::string::npos);
}

TEST_F(JobManagerTest, RunsJobsAndReadsLogs) {
    JobManager manager(engine_.context);
    ASSERT_TRUE(manager.initialize());

    BackupRequest request;
    request.accounts = {"alice"};
    request.destinationId = "local1";
    EXPECT_TRUE(manager.runBackup(request).success);

    request.destinationId = "off";
    EXPECT_FALSE(manager.runBackup(request).success);
    EXPECT_EQ(manager.getLastError(), "Destination is disabled");

    LogQuery query;
    query.isRoot = true;
    LogPage page = manager.getLogs(query);
    ASSERT_EQ(page.logs.size(), 2u);
    EXPECT_EQ(page.logs[0].status, "error");
    EXPECT_EQ(page.logs[1].status, "success");
}

TEST_F(JobManagerTest, CancelNeedsMarkerStore) {
    JobManager fakeBacked(engine_.context);
    EXPECT_FALSE(fakeBacked.requestCancel("job_1"));
    EXPECT_FALSE(fakeBacked.getLastError().empty());

    EngineContext context = engine_.context;
    auto store = std::make_shared<FileCancellationStore>(dir_.sub("cancel"));
    context.cancellation = store;
    JobManager manager(context);
    ASSERT_TRUE(manager.requestCancel("job_1"));
    EXPECT_TRUE(store->isCancelled("job_1"));
    EXPECT_FALSE(manager.requestCancel("/"));
}

// Test that pruning keeps the newest archives per account and drops companions
TEST_F(JobManagerTest, PruneSchedule) {
    auto& manifest = *engine_.context.manifest;
    auto& files = engine_.remoteTransport->files;
    for (const char* name : {"a1", "a2", "a3"}) {
        files[std::string("alice/") + name] = "x";
    }
    files["alice/d1"] = "x";
    files["bob/b1"] = "x";
    manifest.addEntry(entry("alice", "a1", "d1"));
    manifest.addEntry(entry("bob", "b1"));
    manifest.addEntry(entry("alice", "a2"));
    manifest.addEntry(entry("alice", "a3"));

    JobManager manager(engine_.context);
    ASSERT_TRUE(manager.initialize());
    PruneResult result = manager.pruneSchedule("nightly", "remote1", 2);

    EXPECT_TRUE(result.success);
    EXPECT_EQ(result.removed, std::vector<std::string>({"a1"}));
    EXPECT_EQ(engine_.remoteTransport->removed, std::vector<std::string>({"alice/a1", "alice/d1"}));
    EXPECT_EQ(files.count("alice/a2"), 1u);
    EXPECT_EQ(files.count("bob/b1"), 1u);
    EXPECT_EQ(manifest.readEntries("nightly").size(), 3u);

    auto ops = engine_.operations();
    ASSERT_EQ(ops.size(), 1u);
    EXPECT_EQ(ops[0].type, "prune_remote");
    EXPECT_EQ(ops[0].status, "success");
    EXPECT_EQ(ops[0].account, "Destination: backup.example.com, Retention: 2, Schedule: nightly");
    EXPECT_EQ(ops[0].message, "Deleted:\na1");
    EXPECT_EQ(ops[0].requestor, "cron");

    // Nothing left to prune, nothing recorded
    EXPECT_TRUE(manager.pruneSchedule("nightly", "remote1", 2).removed.empty());
    EXPECT_EQ(engine_.operations().size(), 1u);

    EXPECT_TRUE(manager.pruneSchedule("nightly", "remote1", 0).removed.empty());
    EXPECT_FALSE(manager.pruneSchedule("nightly", "nope", 2).success);
}

TEST_F(JobManagerTest, PruneReportsMissingFiles) {
    engine_.context.manifest->addEntry(entry("alice", "gone"));
    engine_.context.manifest->addEntry(entry("alice", "a2"));
    engine_.context.manifest->addEntry(entry("alice", "a3"));

    JobManager manager(engine_.context);
    ASSERT_TRUE(manager.initialize());
    PruneResult result = manager.pruneSchedule("nightly", "remote1", 2);

    EXPECT_FALSE(result.success);
    EXPECT_TRUE(result.removed.empty());
    ASSERT_EQ(result.errors.size(), 1u);
    EXPECT_EQ(result.errors[0].rfind("gone: ", 0), 0u);
    EXPECT_EQ(engine_.context.manifest->readEntries("nightly").size(), 3u);
    EXPECT_TRUE(engine_.operations().empty());
}

TEST_F(JobManagerTest, PruneLocalIsAudited) {
    auto& manifest = *engine_.context.manifest;
    engine_.localTransport->files["alice/a1"] = "x";
    engine_.localTransport->files["alice/a2"] = "x";
    for (const char* name : {"a1", "a2"}) {
        ManifestEntry e = entry("alice", name);
        e.destinationId = "local1";
        manifest.addEntry(e);
    }

    JobManager manager(engine_.context);
    ASSERT_TRUE(manager.initialize());
    PruneResult result = manager.pruneSchedule("nightly", "local1", 1);

    ASSERT_TRUE(result.success);
    auto ops = engine_.operations();
    ASSERT_EQ(ops.size(), 1u);
    EXPECT_EQ(ops[0].type, "prune_local");
    EXPECT_EQ(ops[0].account, "Destination: Local Disk, Retention: 1, Schedule: nightly");
}
