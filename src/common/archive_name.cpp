#include "common/archive_name.hpp"
#include "common/utils.hpp"
#include <regex>

namespace archive_name {

namespace {

const std::regex& backupPattern() {
    static const std::regex pattern(
        "^backup-(\\d{2})\\.(\\d{2})\\.(\\d{4})_(\\d{2})-(\\d{2})-(\\d{2})_([a-z0-9_]+)\\.tar(\\.gz)?$",
        std::regex::icase);
    return pattern;
}

} // namespace

std::string buildBackupName(const std::string& account, std::time_t when) {
    return "backup-" + utils::formatTime(when, "%m.%d.%Y_%H-%M-%S") + "_" + account + ".tar.gz";
}

std::string buildDatabaseName(const std::string& account, std::time_t when) {
    return "db-backup-" + account + "_" + utils::formatTime(when, "%Y-%m-%d_%H-%M-%S") + ".tar.gz";
}

std::optional<std::string> parseAccount(const std::string& filename) {
    std::smatch matches;
    std::string base = baseName(filename);
    if (std::regex_match(base, matches, backupPattern())) {
        return matches[7].str();
    }
    return std::nullopt;
}

std::optional<std::string> parseDisplayDate(const std::string& filename) {
    std::smatch matches;
    std::string base = baseName(filename);
    if (!std::regex_match(base, matches, backupPattern())) {
        return std::nullopt;
    }
    return matches[1].str() + "." + matches[2].str() + "." + matches[3].str() + " " +
           matches[4].str() + ":" + matches[5].str() + ":" + matches[6].str();
}

std::optional<std::string> companionDatabasePath(const std::string& backupPath) {
    std::smatch matches;
    std::string base = baseName(backupPath);
    if (!std::regex_match(base, matches, backupPattern())) {
        return std::nullopt;
    }

    std::string timestamp = matches[3].str() + "-" + matches[1].str() + "-" + matches[2].str() + "_" +
                            matches[4].str() + "-" + matches[5].str() + "-" + matches[6].str();
    std::string name = "db-backup-" + matches[7].str() + "_" + timestamp + ".tar.gz";

    std::string dir = dirName(backupPath);
    if (dir.empty()) {
        return name;
    }
    return dir == "/" ? dir + name : dir + "/" + name;
}

std::string baseName(const std::string& path) {
    size_t pos = path.find_last_of('/');
    return pos == std::string::npos ? path : path.substr(pos + 1);
}

std::string dirName(const std::string& path) {
    size_t pos = path.find_last_of('/');
    if (pos == std::string::npos) {
        return "";
    }
    return pos == 0 ? "/" : path.substr(0, pos);
}

} // namespace archive_name
