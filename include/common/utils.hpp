#pragma once

#include <string>
#include <vector>
#include <ctime>
#include <cstdint>

namespace utils {

// Base-1024 size, e.g. 1572864 -> "1.5 MB". Negative input clamps to "0 B".
std::string formatSize(int64_t bytes);

// Whole-second duration: "45s", "2m 30s", "1h", "1h 15m".
std::string formatDuration(double seconds);

// strftime in local time
std::string formatTime(std::time_t when, const char* format);
std::string currentTimestamp();

std::string toLower(const std::string& str);
std::string trim(const std::string& str);
std::vector<std::string> split(const std::string& str, char delimiter);
std::string join(const std::vector<std::string>& parts, const std::string& separator);
bool containsIgnoreCase(const std::string& haystack, const std::string& needle);
bool startsWith(const std::string& str, const std::string& prefix);

// Keeps [A-Za-z0-9_-] only, for names used as file names
std::string sanitizeName(const std::string& name);

// Lowercase hex SHA-256 of a file; false with error filled on failure
bool sha256File(const std::string& path, std::string& hexDigest, std::string& error);

} // namespace utils
