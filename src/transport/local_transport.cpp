#include "transport/local_transport.hpp"
#include "common/logger.hpp"
#include <chrono>
#include <filesystem>
#include <system_error>

namespace fs = std::filesystem;

namespace {

TransportResult copyFile(const std::string& from, const std::string& to) {
    TransportResult result;
    std::error_code ec;

    if (!fs::is_regular_file(from, ec)) {
        result.message = "Source file not found: " + from;
        return result;
    }

    fs::path parent = fs::path(to).parent_path();
    if (!parent.empty()) {
        fs::create_directories(parent, ec);
        if (ec) {
            result.message = "Failed to create directory " + parent.string() + ": " + ec.message();
            return result;
        }
    }

    // Copying a file onto itself is a no-op for archives already in place
    if (fs::exists(to, ec) && fs::equivalent(from, to, ec)) {
        result.success = true;
    } else {
        fs::copy_file(from, to, fs::copy_options::overwrite_existing, ec);
        if (ec) {
            result.message = "Copy failed: " + ec.message();
            return result;
        }
        result.success = true;
    }

    result.path = to;
    auto size = fs::file_size(to, ec);
    result.size = ec ? 0 : static_cast<int64_t>(size);
    result.message = "Copied to " + to;
    return result;
}

int64_t toUnixTime(const fs::file_time_type& ftime) {
    auto sctp = std::chrono::time_point_cast<std::chrono::system_clock::duration>(
        ftime - fs::file_time_type::clock::now() + std::chrono::system_clock::now());
    return std::chrono::duration_cast<std::chrono::seconds>(sctp.time_since_epoch()).count();
}

} // namespace

TransportResult LocalTransport::upload(const std::string& localPath, const std::string& remoteKey,
                                       const Destination& destination) {
    return copyFile(localPath, resolvePath(remoteKey, destination));
}

TransportResult LocalTransport::download(const std::string& remoteKey, const std::string& localPath,
                                         const Destination& destination) {
    return copyFile(resolvePath(remoteKey, destination), localPath);
}

TransportResult LocalTransport::list(const std::string& path, const Destination& destination,
                                     std::vector<TransportEntry>& entries) {
    TransportResult result;
    std::string target = resolvePath(path, destination);
    entries.clear();

    std::error_code ec;
    if (!fs::is_directory(target, ec)) {
        result.message = "Not a directory: " + target;
        return result;
    }

    for (fs::directory_iterator it(target, ec), end; !ec && it != end; it.increment(ec)) {
        TransportEntry entry;
        entry.name = it->path().filename().string();
        entry.path = it->path().string();
        std::error_code entryEc;
        if (it->is_directory(entryEc)) {
            entry.type = "dir";
        } else {
            auto size = it->file_size(entryEc);
            entry.size = entryEc ? 0 : static_cast<int64_t>(size);
        }
        auto mtime = it->last_write_time(entryEc);
        if (!entryEc) {
            entry.mtime = toUnixTime(mtime);
        }
        entries.push_back(entry);
    }

    if (ec) {
        result.message = "Failed to list " + target + ": " + ec.message();
        return result;
    }

    result.success = true;
    result.path = target;
    result.message = "Listed " + std::to_string(entries.size()) + " entries";
    return result;
}

TransportResult LocalTransport::remove(const std::string& path, const Destination& destination) {
    TransportResult result;
    std::string target = resolvePath(path, destination);

    std::error_code ec;
    if (!fs::exists(target, ec)) {
        result.message = "Not found: " + target;
        return result;
    }
    fs::remove_all(target, ec);
    if (ec) {
        result.message = "Failed to delete " + target + ": " + ec.message();
        return result;
    }

    result.success = true;
    result.path = target;
    result.message = "Deleted: " + target;
    return result;
}

bool LocalTransport::exists(const std::string& path, const Destination& destination) {
    std::error_code ec;
    return fs::exists(resolvePath(path, destination), ec);
}

TransportResult LocalTransport::mkdir(const std::string& path, const Destination& destination) {
    TransportResult result;
    std::string target = resolvePath(path, destination);

    std::error_code ec;
    if (fs::is_directory(target, ec)) {
        result.success = true;
        result.path = target;
        result.message = "Directory exists: " + target;
        return result;
    }

    fs::create_directories(target, ec);
    if (ec) {
        result.message = "Failed to create directory " + target + ": " + ec.message();
        Logger::error(result.message);
        return result;
    }
    fs::permissions(target, fs::perms::owner_all, ec);

    result.success = true;
    result.path = target;
    result.message = "Created directory: " + target;
    return result;
}
