#pragma once

#include <string>
#include <optional>
#include <ctime>

// Canonical archive names:
//   backup-MM.DD.YYYY_HH-MM-SS_{account}.tar.gz
//   db-backup-{account}_YYYY-MM-DD_HH-MM-SS.tar.gz
namespace archive_name {

std::string buildBackupName(const std::string& account, std::time_t when);
std::string buildDatabaseName(const std::string& account, std::time_t when);

// Accepts a bare filename or a path; only the last component is matched.
std::optional<std::string> parseAccount(const std::string& filename);

// "MM.DD.YYYY HH:MM:SS" taken from a canonical backup name
std::optional<std::string> parseDisplayDate(const std::string& filename);

// Companion database archive path living beside the given backup archive
std::optional<std::string> companionDatabasePath(const std::string& backupPath);

std::string baseName(const std::string& path);
std::string dirName(const std::string& path);

} // namespace archive_name
