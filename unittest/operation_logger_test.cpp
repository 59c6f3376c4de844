#include <gtest/gtest.h>
#include "oplog/operation_logger.hpp"
#include "test_support.hpp"

class OperationLoggerTest : public ::testing::Test {
protected:
    void log(const std::string& user, const std::string& type, std::vector<std::string> items,
             bool success, const std::string& message = "done") {
        OperationLogEvent event;
        event.user = user;
        event.type = type;
        event.items = std::move(items);
        event.success = success;
        event.message = message;
        ASSERT_TRUE(logger_.logEvent(event));
    }

    TempDir dir_{"oplog"};
    FileOperationLogger logger_{dir_.sub("logs/operations.log")};
};

TEST_F(OperationLoggerTest, MissingFileGivesEmptyPage) {
    LogQuery query;
    query.isRoot = true;
    query.page = 3;
    LogPage page = logger_.getLogs(query);
    EXPECT_TRUE(page.logs.empty());
    EXPECT_EQ(page.totalPages, 0);
    EXPECT_EQ(page.currentPage, 3);
}

// Test that entries come back newest first with defaults filled in
TEST_F(OperationLoggerTest, NewestFirst) {
    log("root", "backup_local", {"alice"}, true, "first");
    log("root", "restore_local", {"bob"}, false, "second");

    LogQuery query;
    query.user = "root";
    query.isRoot = true;
    LogPage page = logger_.getLogs(query);
    ASSERT_EQ(page.logs.size(), 2u);
    EXPECT_EQ(page.logs[0].message, "second");
    EXPECT_EQ(page.logs[0].status, "error");
    EXPECT_EQ(page.logs[0].requestor, "cron");
    EXPECT_FALSE(page.logs[0].timestamp.empty());
    EXPECT_EQ(page.logs[1].status, "success");
    EXPECT_EQ(page.totalPages, 1);
}

TEST_F(OperationLoggerTest, NonRootSeesOwnEntries) {
    log("root", "backup_local", {"alice"}, true);
    log("reseller", "backup_local", {"carol"}, true);
    log("", "system", {}, true);

    LogQuery query;
    query.user = "reseller";
    LogPage page = logger_.getLogs(query);
    ASSERT_EQ(page.logs.size(), 2u);
    EXPECT_EQ(page.logs[0].type, "system");
    EXPECT_EQ(page.logs[1].account, "carol");
    EXPECT_EQ(page.accounts, std::vector<std::string>({"carol"}));
}

TEST_F(OperationLoggerTest, FiltersAndPaging) {
    for (int i = 0; i < 5; i++) {
        log("root", "backup_remote", {"acct" + std::to_string(i)}, i % 2 == 0);
    }
    log("root", "restore_local", {"Alice", "bob"}, true);

    LogQuery query;
    query.isRoot = true;
    query.filter = "error";
    EXPECT_EQ(logger_.getLogs(query).logs.size(), 2u);

    query.filter = "restore_local";
    LogPage restores = logger_.getLogs(query);
    ASSERT_EQ(restores.logs.size(), 1u);
    EXPECT_EQ(restores.logs[0].account, "Alice, bob");

    query.filter = "all";
    query.accountFilter = "alice";
    EXPECT_EQ(logger_.getLogs(query).logs.size(), 1u);

    query.accountFilter.clear();
    query.limit = 4;
    query.page = 2;
    LogPage second = logger_.getLogs(query);
    EXPECT_EQ(second.totalPages, 2);
    ASSERT_EQ(second.logs.size(), 2u);
    EXPECT_EQ(second.logs[1].account, "acct0");
    EXPECT_EQ(second.accounts.size(), 7u);
    EXPECT_EQ(second.accounts.front(), "Alice");
}

TEST_F(OperationLoggerTest, CorruptLinesAreSkipped) {
    log("root", "backup_local", {"alice"}, true);
    {
        std::ofstream out(logger_.path(), std::ios::app);
        out << "not json\n\n";
    }
    log("root", "backup_local", {"bob"}, true);

    LogQuery query;
    query.isRoot = true;
    EXPECT_EQ(logger_.getLogs(query).logs.size(), 2u);
}

TEST_F(OperationLoggerTest, JobIdRoundTrip) {
    OperationLogEvent event;
    event.user = "root";
    event.type = "backup_local";
    event.jobId = "backup_123";
    ASSERT_TRUE(logger_.logEvent(event));

    LogQuery query;
    query.isRoot = true;
    LogPage page = logger_.getLogs(query);
    ASSERT_EQ(page.logs.size(), 1u);
    EXPECT_EQ(page.logs[0].jobId, "backup_123");

    struct stat st;
    ASSERT_EQ(stat(logger_.path().c_str(), &st), 0);
    EXPECT_EQ(st.st_mode & 0777, 0644u);
}
