#include "main/cli.hpp"
#include "common/logger.hpp"
#include "common/utils.hpp"
#include <algorithm>
#include <set>
#include <stdexcept>

namespace {

// Options that never take a value
const std::set<std::string>& switches() {
    static const std::set<std::string> names = {
        "no-homedir", "no-mysql", "no-mail", "no-ssl", "no-cron", "no-dns",
        "no-subdomains", "no-addon-domains", "force", "root", "help"
    };
    return names;
}

} // namespace

bool CommandArgs::has(const std::string& name) const {
    return values.count(name) > 0 || std::find(flags.begin(), flags.end(), name) != flags.end();
}

std::string CommandArgs::get(const std::string& name, const std::string& fallback) const {
    auto it = values.find(name);
    return it == values.end() ? fallback : it->second;
}

AcctVaultCLI::AcctVaultCLI(std::shared_ptr<JobManager> jobManager, std::ostream& out, std::ostream& err)
    : jobManager_(std::move(jobManager)), out_(out), err_(err) {}

void AcctVaultCLI::printUsage(std::ostream& out) {
    out << "Usage: acctvault [--config PATH] <command> [options]\n"
        << "Commands:\n"
        << "  backup   --accounts a,b --destination ID [--user U] [--job-id J]\n"
        << "           [--schedule-id S] [--retention N] [--requestor R]\n"
        << "  restore  --archive REF --destination ID [--user U] [--no-homedir] [--no-mysql]\n"
        << "           [--no-mail] [--no-ssl] [--no-cron] [--no-dns] [--no-subdomains]\n"
        << "           [--no-addon-domains] [--force] [--newuser N] [--ip IP] [--restore-id R]\n"
        << "  cancel   --job-id J\n"
        << "  list     --destination ID [--account A]\n"
        << "  logs     [--user U] [--root] [--page P] [--limit L] [--filter F] [--account A]\n"
        << "  preview  --archive PATH\n"
        << "  prune    --schedule-id S --destination ID [--retention N]\n"
        << "\n"
        << "Options:\n"
        << "  -h, --help       Show this help message\n"
        << "  --config PATH    Settings file (default /etc/acctvault/config.json)\n";
}

bool AcctVaultCLI::parseArguments(int argc, char** argv, int start, CommandArgs& args, std::string& error) {
    for (int i = start; i < argc; i++) {
        std::string arg = argv[i];
        if (arg == "-h") {
            args.flags.push_back("help");
            continue;
        }
        if (!utils::startsWith(arg, "--") || arg.size() == 2) {
            error = "Unexpected argument: " + arg;
            return false;
        }

        std::string name = arg.substr(2);
        std::string::size_type eq = name.find('=');
        if (eq != std::string::npos) {
            args.values[name.substr(0, eq)] = name.substr(eq + 1);
        } else if (switches().count(name)) {
            args.flags.push_back(name);
        } else if (i + 1 < argc) {
            args.values[name] = argv[++i];
        } else {
            error = "Missing value for --" + name;
            return false;
        }
    }
    return true;
}

int AcctVaultCLI::run(const std::string& command, const CommandArgs& args) {
    if (args.has("help")) {
        printUsage(out_);
        return 0;
    }

    try {
        if (command == "backup") {
            return handleBackup(args);
        } else if (command == "restore") {
            return handleRestore(args);
        } else if (command == "cancel") {
            return handleCancel(args);
        } else if (command == "list") {
            return handleList(args);
        } else if (command == "logs") {
            return handleLogs(args);
        } else if (command == "preview") {
            return handlePreview(args);
        } else if (command == "prune") {
            return handlePrune(args);
        }
    } catch (const std::exception& e) {
        err_ << "Error: " << e.what() << std::endl;
        Logger::error("Command " + command + " failed: " + e.what());
        return 1;
    }

    err_ << "Error: Unknown command: " << command << std::endl;
    printUsage(err_);
    return 1;
}

bool AcctVaultCLI::requireOption(const CommandArgs& args, const std::string& name) {
    if (args.get(name).empty()) {
        err_ << "Error: --" << name << " is required" << std::endl;
        return false;
    }
    return true;
}

bool AcctVaultCLI::parseNumber(const CommandArgs& args, const std::string& name, int fallback, int& value) {
    value = fallback;
    std::string text = args.get(name);
    if (text.empty()) {
        return true;
    }
    try {
        size_t used = 0;
        value = std::stoi(text, &used);
        if (used != text.size()) {
            throw std::invalid_argument(text);
        }
    } catch (const std::exception&) {
        err_ << "Error: --" << name << " expects a number, got '" << text << "'" << std::endl;
        return false;
    }
    return true;
}

int AcctVaultCLI::handleBackup(const CommandArgs& args) {
    if (!requireOption(args, "accounts") || !requireOption(args, "destination")) {
        return 1;
    }

    BackupRequest request;
    request.accounts = utils::split(args.get("accounts"), ',');
    request.destinationId = args.get("destination");
    request.user = args.get("user", "root");
    request.jobId = args.get("job-id");
    request.scheduleId = args.get("schedule-id");
    request.requestor = args.get("requestor", "cron");
    if (!parseNumber(args, "retention", 30, request.retention)) {
        return 1;
    }

    BackupJobResult result = jobManager_->runBackup(request, [this](int completed, int total) {
        out_ << "Progress: " << completed << "/" << total << std::endl;
    });

    for (const auto& account : result.results) {
        out_ << "  " << account.account << ": " << (account.success ? "OK" : "FAILED") << " - "
             << account.message;
        if (account.success && !account.file.empty()) {
            out_ << " [" << account.file << ", " << utils::formatSize(account.size) << "]";
        }
        out_ << std::endl;
    }
    out_ << result.message << std::endl;
    for (const auto& error : result.errors) {
        err_ << "  " << error << std::endl;
    }
    out_ << "Backup ID: " << result.backupId << std::endl;
    out_ << "Log: " << result.logPath << std::endl;
    return result.success ? 0 : 1;
}

int AcctVaultCLI::handleRestore(const CommandArgs& args) {
    if (!requireOption(args, "archive") || !requireOption(args, "destination")) {
        return 1;
    }

    RestoreRequest request;
    request.archive = args.get("archive");
    request.destinationId = args.get("destination");
    request.user = args.get("user", "root");
    request.restoreId = args.get("restore-id");
    request.requestor = args.get("requestor", "cron");

    RestoreOptions& options = request.options;
    options.homedir = !args.has("no-homedir");
    options.mysql = !args.has("no-mysql");
    options.mail = !args.has("no-mail");
    options.ssl = !args.has("no-ssl");
    options.cron = !args.has("no-cron");
    options.dns = !args.has("no-dns");
    options.subdomains = !args.has("no-subdomains");
    options.addonDomains = !args.has("no-addon-domains");
    options.force = args.has("force");
    options.newUser = args.get("newuser");
    options.ip = args.get("ip");

    RestoreJobResult result = jobManager_->runRestore(request);
    (result.success ? out_ : err_) << result.message << std::endl;
    if (result.exitCode != 0) {
        out_ << "Exit code: " << result.exitCode << std::endl;
    }
    out_ << "Restore ID: " << result.restoreId << std::endl;
    out_ << "Log: " << result.logPath << std::endl;
    return result.success ? 0 : 1;
}

int AcctVaultCLI::handleCancel(const CommandArgs& args) {
    if (!requireOption(args, "job-id")) {
        return 1;
    }
    if (!jobManager_->requestCancel(args.get("job-id"))) {
        err_ << "Error: " << jobManager_->getLastError() << std::endl;
        return 1;
    }
    out_ << "Cancellation requested for " << args.get("job-id") << std::endl;
    return 0;
}

int AcctVaultCLI::handleList(const CommandArgs& args) {
    if (!requireOption(args, "destination")) {
        return 1;
    }
    std::vector<BackupListing> backups;
    if (!jobManager_->listBackups(args.get("destination"), args.get("account"), backups)) {
        err_ << "Error: " << jobManager_->getLastError() << std::endl;
        return 1;
    }
    for (const auto& backup : backups) {
        out_ << backup.date << "  " << backup.account << "  " << utils::formatSize(backup.size)
             << "  " << backup.path << std::endl;
    }
    out_ << backups.size() << " backup(s)" << std::endl;
    return 0;
}

int AcctVaultCLI::handleLogs(const CommandArgs& args) {
    LogQuery query;
    query.user = args.get("user", "root");
    query.isRoot = args.has("root") || query.user == "root";
    query.filter = args.get("filter", "all");
    query.accountFilter = args.get("account");
    if (!parseNumber(args, "page", 1, query.page) || !parseNumber(args, "limit", 50, query.limit)) {
        return 1;
    }

    LogPage page = jobManager_->getLogs(query);
    for (const auto& record : page.logs) {
        std::string message = record.message;
        std::replace(message.begin(), message.end(), '\n', ' ');
        out_ << record.timestamp << "  " << record.type << "  " << record.status << "  "
             << record.account << "  " << record.user << "@" << record.requestor << "  " << message
             << std::endl;
    }
    out_ << "Page " << page.currentPage << " of " << page.totalPages << std::endl;
    return 0;
}

int AcctVaultCLI::handlePreview(const CommandArgs& args) {
    if (!requireOption(args, "archive")) {
        return 1;
    }
    BackupPreview preview = jobManager_->previewBackup(args.get("archive"));
    if (!preview.success) {
        err_ << "Error: " << preview.message << std::endl;
        return 1;
    }

    auto yesNo = [](bool value) { return value ? "yes" : "no"; };
    out_ << "Account: " << (preview.account.empty() ? std::string("unknown") : preview.account) << std::endl
         << "Size: " << utils::formatSize(preview.size) << std::endl
         << "Files: " << preview.totalFiles << std::endl
         << "Home directory: " << yesNo(preview.hasHomedir) << std::endl
         << "MySQL: " << yesNo(preview.hasMysql) << std::endl
         << "PostgreSQL: " << yesNo(preview.hasPgsql) << std::endl
         << "Email: " << yesNo(preview.hasEmail) << std::endl
         << "SSL: " << yesNo(preview.hasSsl) << std::endl
         << "DNS zones: " << yesNo(preview.hasDnsZones) << std::endl;
    for (const auto& file : preview.sampleFiles) {
        out_ << "  " << file << std::endl;
    }
    return 0;
}

int AcctVaultCLI::handlePrune(const CommandArgs& args) {
    if (!requireOption(args, "schedule-id") || !requireOption(args, "destination")) {
        return 1;
    }
    int retention = 30;
    if (!parseNumber(args, "retention", 30, retention)) {
        return 1;
    }

    PruneResult result = jobManager_->pruneSchedule(args.get("schedule-id"), args.get("destination"), retention);
    for (const auto& file : result.removed) {
        out_ << "Removed " << file << std::endl;
    }
    for (const auto& error : result.errors) {
        err_ << "Error: " << error << std::endl;
    }
    return result.success ? 0 : 1;
}
