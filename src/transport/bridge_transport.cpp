#include "transport/bridge_transport.hpp"
#include "common/archive_name.hpp"
#include "common/logger.hpp"
#include "common/utils.hpp"
#include <filesystem>

using json = nlohmann::json;

namespace {

bool jsonTruthy(const json& value) {
    if (value.is_boolean()) return value.get<bool>();
    if (value.is_number_integer()) return value.get<int64_t>() != 0;
    if (value.is_string()) {
        const auto& s = value.get_ref<const std::string&>();
        return !s.empty() && s != "0";
    }
    return false;
}

int64_t jsonInt(const json& object, const char* key) {
    auto it = object.find(key);
    if (it == object.end()) return 0;
    if (it->is_number()) return it->get<int64_t>();
    if (it->is_string()) {
        try {
            return std::stoll(it->get<std::string>());
        } catch (const std::exception&) {
            return 0;
        }
    }
    return 0;
}

} // namespace

BridgeTransport::BridgeTransport(std::string bridgePath, ProcessRunner runner)
    : bridgePath_(std::move(bridgePath)), runner_(std::move(runner)) {}

bool BridgeTransport::invoke(const std::string& action, const Destination& destination,
                             const std::vector<std::string>& arguments,
                             json& response, std::string& error) const {
    std::vector<std::string> argv = {bridgePath_, "--action=" + action, "--transport=" + destination.id};
    argv.insert(argv.end(), arguments.begin(), arguments.end());

    std::string stdoutText;
    std::string stderrText;
    ProcessResult proc = runner_.capture(argv, stdoutText, stderrText);

    for (const auto& line : utils::split(stderrText, '\n')) {
        Logger::debug("[transport " + action + "] " + line);
    }

    if (!proc.started) {
        error = "Transport bridge could not be started: " + proc.error;
        return false;
    }

    std::string payload = utils::trim(stdoutText);
    if (payload.empty()) {
        error = "Transport bridge returned no output (exit code " + std::to_string(proc.exitCode) + ")";
        return false;
    }

    // Only the last line is the result object; anything before it is noise
    size_t lastLine = payload.find_last_of('\n');
    if (lastLine != std::string::npos) {
        payload = payload.substr(lastLine + 1);
    }

    try {
        response = json::parse(payload);
    } catch (const json::exception& e) {
        error = std::string("Transport bridge returned malformed JSON: ") + e.what();
        return false;
    }

    if (!response.is_object()) {
        error = "Transport bridge returned a non-object response";
        return false;
    }

    if (!proc.success()) {
        std::string message = response.value("message", std::string());
        error = "Transport bridge exited with code " + std::to_string(proc.exitCode) +
                (message.empty() ? "" : ": " + message);
        return false;
    }
    return true;
}

TransportResult BridgeTransport::toResult(const json& response) const {
    TransportResult result;
    result.success = response.contains("success") && jsonTruthy(response.at("success"));
    result.message = response.value("message", std::string(result.success ? "OK" : "Unknown error"));
    if (response.contains("remote_path") && response.at("remote_path").is_string()) {
        result.path = response.at("remote_path").get<std::string>();
    } else if (response.contains("local_path") && response.at("local_path").is_string()) {
        result.path = response.at("local_path").get<std::string>();
    } else if (response.contains("path") && response.at("path").is_string()) {
        result.path = response.at("path").get<std::string>();
    }
    result.size = jsonInt(response, "size");
    return result;
}

TransportResult BridgeTransport::upload(const std::string& localPath, const std::string& remoteKey,
                                        const Destination& destination) {
    json response;
    std::string error;
    if (!invoke("upload", destination,
                {"--local=" + localPath, "--remote=" + resolvePath(remoteKey, destination)},
                response, error)) {
        Logger::error("Upload of " + localPath + " failed: " + error);
        return TransportResult{false, error, "", 0};
    }
    return toResult(response);
}

TransportResult BridgeTransport::download(const std::string& remoteKey, const std::string& localPath,
                                          const Destination& destination) {
    json response;
    std::string error;
    if (!invoke("download", destination,
                {"--remote=" + resolvePath(remoteKey, destination), "--local=" + localPath},
                response, error)) {
        Logger::error("Download of " + remoteKey + " failed: " + error);
        return TransportResult{false, error, "", 0};
    }

    TransportResult result = toResult(response);
    if (result.success && !std::filesystem::exists(localPath)) {
        result.success = false;
        result.message = "Download reported success but file not found at " + localPath;
    }
    return result;
}

TransportResult BridgeTransport::list(const std::string& path, const Destination& destination,
                                      std::vector<TransportEntry>& entries) {
    entries.clear();
    std::string target = resolvePath(path, destination);

    json response;
    std::string error;
    if (!invoke("ls", destination, {"--path=" + target}, response, error)) {
        return TransportResult{false, error, target, 0};
    }

    TransportResult result = toResult(response);
    if (!result.success) {
        return result;
    }

    auto files = response.find("files");
    if (files != response.end() && files->is_array()) {
        for (const auto& file : *files) {
            if (!file.is_object()) {
                continue;
            }
            TransportEntry entry;
            entry.name = archive_name::baseName(file.value("file", std::string()));
            if (entry.name.empty() || entry.name == "." || entry.name == "..") {
                continue;
            }
            entry.path = target.empty() ? entry.name : target + "/" + entry.name;
            entry.size = jsonInt(file, "size");
            entry.mtime = jsonInt(file, "mtime");
            std::string type = utils::toLower(file.value("type", std::string("file")));
            entry.type = (type == "dir" || type == "directory" || type == "d") ? "dir" : "file";
            entries.push_back(entry);
        }
    }
    result.path = target;
    return result;
}

TransportResult BridgeTransport::remove(const std::string& path, const Destination& destination) {
    json response;
    std::string error;
    if (!invoke("delete", destination, {"--path=" + resolvePath(path, destination)}, response, error)) {
        return TransportResult{false, error, "", 0};
    }
    return toResult(response);
}

bool BridgeTransport::exists(const std::string& path, const Destination& destination) {
    std::string target = resolvePath(path, destination);
    std::string parent = archive_name::dirName(target);
    std::string name = archive_name::baseName(target);

    std::vector<TransportEntry> entries;
    TransportResult result = list(parent, destination, entries);
    if (!result.success) {
        Logger::debug("exists(" + target + "): listing failed: " + result.message);
        return false;
    }
    for (const auto& entry : entries) {
        if (entry.name == name) {
            return true;
        }
    }
    return false;
}

TransportResult BridgeTransport::mkdir(const std::string& path, const Destination& destination) {
    json response;
    std::string error;
    if (!invoke("mkdir", destination, {"--path=" + resolvePath(path, destination)}, response, error)) {
        return TransportResult{false, error, "", 0};
    }

    TransportResult result = toResult(response);
    if (!result.success && utils::containsIgnoreCase(result.message, "exist")) {
        result.success = true;
    }
    return result;
}
