#include <gtest/gtest.h>
#include "common/archive_name.hpp"
#include "tools/archive_tool.hpp"
#include "tools/database_tool.hpp"
#include "tools/restore_tool.hpp"
#include "test_support.hpp"

namespace {

// Sets $account and $dir from the last two arguments
const char* LAST_TWO_ARGS =
    "for a in \"$@\"; do account=\"$dir\"; dir=\"$a\"; done\n";

} // namespace

class ToolsTest : public ::testing::Test {
protected:
    LineCallback collector() {
        return [this](StreamKind stream, const std::string& line) {
            (stream == StreamKind::Stdout ? out_ : err_).push_back(line);
        };
    }

    TempDir dir_{"tools"};
    std::vector<std::string> out_;
    std::vector<std::string> err_;
};

// Test archive tool argument order for the common preference combinations
TEST_F(ToolsTest, PkgAcctArguments) {
    PkgAcctTool tool("/scripts/pkgacct");
    UserConfig options;
    auto argv = tool.buildArguments("alice", "/backup/alice", options);
    std::vector<std::string> expected = {"/scripts/pkgacct", "--compress", "--dbbackup=all", "alice", "/backup/alice"};
    EXPECT_EQ(argv, expected);

    options.compressionOption = "nocompress";
    options.incremental = true;
    options.skipFlags["homedir"] = true;
    options.skipFlags["ssl"] = true;
    options.skipFlags["logs"] = false;
    options.dbBackupType = "skip";
    argv = tool.buildArguments("alice", "/t", options);
    expected = {"/scripts/pkgacct", "--nocompress", "--incremental", "--skiphomedir", "--skipssl",
                "--skipmysql", "alice", "/t"};
    EXPECT_EQ(argv, expected);

    UserConfig hot;
    hot.dbBackupMethod = "mariadb-backup";
    hot.dbBackupType = "skip";
    argv = tool.buildArguments("bob", "/t", hot);
    expected = {"/scripts/pkgacct", "--compress", "--dbbackup=schema", "bob", "/t"};
    EXPECT_EQ(argv, expected);
}

TEST_F(ToolsTest, PkgAcctExpectedArtifact) {
    UserConfig options;
    EXPECT_EQ(PkgAcctTool::expectedArtifact("alice", "/t", options), "/t/cpmove-alice.tar.gz");
    options.compressionOption = "nocompress";
    EXPECT_EQ(PkgAcctTool::expectedArtifact("alice", "/t", options), "/t/cpmove-alice.tar");
}

TEST_F(ToolsTest, PkgAcctSuccessStreamsOutput) {
    std::string script = dir_.script("pkgacct.sh", std::string(LAST_TWO_ARGS) +
        "echo \"packaging $account\"\n"
        "echo 'warning: quota' 1>&2\n"
        "echo data > \"$dir/cpmove-$account.tar.gz\"\n");
    std::string target = dir_.mkdir("out");

    PkgAcctTool tool(script);
    ArchiveToolResult result = tool.createArchive("alice", target, UserConfig(), collector());
    ASSERT_TRUE(result.success) << result.message;
    EXPECT_EQ(result.path, target + "/cpmove-alice.tar.gz");
    EXPECT_TRUE(std::filesystem::is_regular_file(result.path));
    ASSERT_EQ(out_.size(), 1u);
    EXPECT_EQ(out_[0], "packaging alice");
    ASSERT_EQ(err_.size(), 1u);
    EXPECT_EQ(err_[0], "warning: quota");
}

// Test a failing tool removes its directory-style leftovers
TEST_F(ToolsTest, PkgAcctFailureCleansWorkDir) {
    std::string script = dir_.script("pkgacct.sh", std::string(LAST_TWO_ARGS) +
        "mkdir -p \"$dir/cpmove-$account/homedir\"\n"
        "exit 4\n");
    std::string target = dir_.mkdir("out");

    PkgAcctTool tool(script);
    ArchiveToolResult result = tool.createArchive("alice", target, UserConfig(), collector());
    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.code, ErrorCode::ArchiveToolFailed);
    EXPECT_EQ(result.message, "pkgacct failed (exit code 4)");
    EXPECT_FALSE(std::filesystem::exists(target + "/cpmove-alice"));
}

TEST_F(ToolsTest, PkgAcctSpawnFailure) {
    PkgAcctTool tool(dir_.sub("missing-pkgacct"));
    ArchiveToolResult result = tool.createArchive("alice", dir_.path(), UserConfig(), collector());
    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.code, ErrorCode::ProcessSpawnFailed);
}

// Test restore tool flags and archive-last ordering
TEST_F(ToolsTest, RestorePkgArguments) {
    RestorePkgTool tool("/scripts/restorepkg");
    RestoreOptions options;
    auto argv = tool.buildArguments("/tmp/a.tar.gz", options);
    std::vector<std::string> expected = {"/scripts/restorepkg", "--skipaccount", "/tmp/a.tar.gz"};
    EXPECT_EQ(argv, expected);

    options.mail = false;
    options.dns = false;
    options.subdomains = false;
    options.force = true;
    options.newUser = "alice2";
    options.ip = "10.0.0.5";
    argv = tool.buildArguments("/tmp/a.tar.gz", options);
    expected = {"/scripts/restorepkg", "--disable=Mail,MailRouting,ZoneFile", "--skipaccount", "--force",
                "--newuser=alice2", "--ip=10.0.0.5", "/tmp/a.tar.gz"};
    EXPECT_EQ(argv, expected);

    options.addonDomains = false;
    options.homedir = false;
    argv = tool.buildArguments("/tmp/a.tar.gz", options);
    EXPECT_EQ(argv[1], "--disable=Homedir,Mail,MailRouting,ZoneFile,Domains");
}

TEST_F(ToolsTest, RestorePkgExitCodes) {
    std::string ok = dir_.script("restore_ok.sh", "echo restoring; cat >/dev/null; exit 0\n");
    RestorePkgTool good(ok);
    RestoreToolResult result = good.restoreArchive("/tmp/a.tar.gz", RestoreOptions(), collector());
    EXPECT_TRUE(result.success);
    EXPECT_EQ(result.exitCode, 0);

    std::string bad = dir_.script("restore_bad.sh", "echo 'account exists' 1>&2; exit 2\n");
    RestorePkgTool failing(bad);
    result = failing.restoreArchive("/tmp/a.tar.gz", RestoreOptions(), collector());
    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.exitCode, 2);
    EXPECT_EQ(result.code, ErrorCode::RestoreToolFailed);
    EXPECT_EQ(result.message, "Restore failed (exit code 2)");
    ASSERT_EQ(err_.size(), 1u);
    EXPECT_EQ(err_[0], "account exists");
}

TEST_F(ToolsTest, HotCopyBackupOutcomes) {
    std::string args = dir_.sub("db_args.txt");
    std::string tool = dir_.script("db.sh",
        "echo \"$@\" > '" + args + "'\n"
        "for a in \"$@\"; do case \"$a\" in --output=*) out=\"${a#--output=}\" ;; --account=*) acct=\"${a#--account=}\" ;; esac; done\n"
        "case \"$acct\" in\n"
        "  withdb) echo dump > \"$out\" ;;\n"
        "  nodb) ;;\n"
        "  broken) echo partial > \"$out\"; exit 1 ;;\n"
        "esac\n");
    std::string target = dir_.mkdir("db");
    UserConfig options;
    options.dbBackupMethod = "mariadb-backup";
    HotCopyDatabaseTool db(tool);

    DatabaseBackupResult withDb = db.backupDatabases("withdb", target, options, 0, collector());
    ASSERT_TRUE(withDb.success) << withDb.message;
    EXPECT_FALSE(withDb.skipped);
    EXPECT_EQ(withDb.archivePath, target + "/" + archive_name::buildDatabaseName("withdb", 0));
    EXPECT_NE(TempDir::read(args).find("--method=mariadb-backup --account=withdb --output="), std::string::npos);

    DatabaseBackupResult noDb = db.backupDatabases("nodb", target, options, 0, collector());
    EXPECT_TRUE(noDb.success);
    EXPECT_TRUE(noDb.skipped);
    EXPECT_TRUE(noDb.archivePath.empty());

    DatabaseBackupResult broken = db.backupDatabases("broken", target, options, 0, collector());
    EXPECT_FALSE(broken.success);
    EXPECT_FALSE(broken.skipped);
    EXPECT_EQ(broken.code, ErrorCode::DatabaseBackupFailed);
    EXPECT_FALSE(std::filesystem::exists(target + "/" + archive_name::buildDatabaseName("broken", 0)));
}

TEST_F(ToolsTest, HotCopyRestore) {
    std::string tool = dir_.script("dbrestore.sh",
        "for a in \"$@\"; do case \"$a\" in --archive=*) ar=\"${a#--archive=}\" ;; esac; done\n"
        "test -f \"$ar\" || exit 3\n");
    HotCopyDatabaseTool db(tool);

    std::string archive = dir_.file("db.tar.gz", "x");
    EXPECT_TRUE(db.restoreDatabases("alice", archive, "mariadb-backup", collector()).success);

    DatabaseRestoreResult failed = db.restoreDatabases("alice", dir_.sub("absent"), "auto", collector());
    EXPECT_FALSE(failed.success);
    EXPECT_EQ(failed.code, ErrorCode::DatabaseRestoreFailed);
    EXPECT_EQ(failed.message, "exit code 3");
}
