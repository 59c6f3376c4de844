#include "common/utils.hpp"
#include <openssl/evp.h>
#include <algorithm>
#include <cctype>
#include <cmath>
#include <fstream>
#include <iomanip>
#include <sstream>

namespace utils {

std::string formatSize(int64_t bytes) {
    static const char* units[] = {"B", "KB", "MB", "GB", "TB"};
    const int unitCount = 5;

    double value = bytes > 0 ? static_cast<double>(bytes) : 0.0;
    int pow = 0;
    while (value >= 1024.0 && pow < unitCount - 1) {
        value /= 1024.0;
        ++pow;
    }

    double rounded = std::round(value * 100.0) / 100.0;
    std::ostringstream ss;
    ss << std::fixed << std::setprecision(2) << rounded;
    std::string text = ss.str();

    // Drop trailing zeros and a dangling decimal point
    text.erase(text.find_last_not_of('0') + 1);
    if (!text.empty() && text.back() == '.') {
        text.pop_back();
    }
    return text + " " + units[pow];
}

std::string formatDuration(double seconds) {
    long total = seconds > 0 ? static_cast<long>(std::llround(seconds)) : 0;

    if (total < 60) {
        return std::to_string(total) + "s";
    }
    if (total < 3600) {
        long mins = total / 60;
        long secs = total % 60;
        return secs > 0 ? std::to_string(mins) + "m " + std::to_string(secs) + "s"
                        : std::to_string(mins) + "m";
    }
    long hours = total / 3600;
    long mins = (total % 3600) / 60;
    return mins > 0 ? std::to_string(hours) + "h " + std::to_string(mins) + "m"
                    : std::to_string(hours) + "h";
}

std::string formatTime(std::time_t when, const char* format) {
    std::tm tmBuf{};
    localtime_r(&when, &tmBuf);
    std::ostringstream ss;
    ss << std::put_time(&tmBuf, format);
    return ss.str();
}

std::string currentTimestamp() {
    return formatTime(std::time(nullptr), "%Y-%m-%d %H:%M:%S");
}

std::string toLower(const std::string& str) {
    std::string result = str;
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return result;
}

std::string trim(const std::string& str) {
    const char* whitespace = " \t\r\n";
    size_t start = str.find_first_not_of(whitespace);
    if (start == std::string::npos) {
        return "";
    }
    size_t end = str.find_last_not_of(whitespace);
    return str.substr(start, end - start + 1);
}

std::vector<std::string> split(const std::string& str, char delimiter) {
    std::vector<std::string> parts;
    std::stringstream ss(str);
    std::string item;
    while (std::getline(ss, item, delimiter)) {
        item = trim(item);
        if (!item.empty()) {
            parts.push_back(item);
        }
    }
    return parts;
}

std::string join(const std::vector<std::string>& parts, const std::string& separator) {
    std::string result;
    for (size_t i = 0; i < parts.size(); ++i) {
        if (i > 0) {
            result += separator;
        }
        result += parts[i];
    }
    return result;
}

bool containsIgnoreCase(const std::string& haystack, const std::string& needle) {
    return toLower(haystack).find(toLower(needle)) != std::string::npos;
}

bool startsWith(const std::string& str, const std::string& prefix) {
    return str.compare(0, prefix.size(), prefix) == 0;
}

std::string sanitizeName(const std::string& name) {
    std::string result;
    for (char c : name) {
        if (std::isalnum(static_cast<unsigned char>(c)) || c == '_' || c == '-') {
            result += c;
        }
    }
    return result;
}

bool sha256File(const std::string& path, std::string& hexDigest, std::string& error) {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        error = "Failed to open file for checksum: " + path;
        return false;
    }

    EVP_MD_CTX* ctx = EVP_MD_CTX_new();
    if (!ctx) {
        error = "Failed to create OpenSSL context";
        return false;
    }

    if (EVP_DigestInit_ex(ctx, EVP_sha256(), nullptr) != 1) {
        EVP_MD_CTX_free(ctx);
        error = "Failed to initialize digest";
        return false;
    }

    char buffer[65536];
    while (file.good()) {
        file.read(buffer, sizeof(buffer));
        if (file.gcount() > 0) {
            if (EVP_DigestUpdate(ctx, buffer, static_cast<size_t>(file.gcount())) != 1) {
                EVP_MD_CTX_free(ctx);
                error = "Failed to update digest";
                return false;
            }
        }
    }

    unsigned char hash[EVP_MAX_MD_SIZE];
    unsigned int hashLen = 0;
    if (EVP_DigestFinal_ex(ctx, hash, &hashLen) != 1) {
        EVP_MD_CTX_free(ctx);
        error = "Failed to finalize digest";
        return false;
    }
    EVP_MD_CTX_free(ctx);

    std::stringstream ss;
    for (unsigned int i = 0; i < hashLen; i++) {
        ss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(hash[i]);
    }
    hexDigest = ss.str();
    return true;
}

} // namespace utils
