#pragma once

#include <string>
#include <vector>

// Append-only progress log for a single job: {logDir}/{jobId}.log.
// Each append is one locked write, so a viewer tailing the file never
// sees a torn line.
class JobLog {
public:
    JobLog(const std::string& logDir, const std::string& jobId);

    // "[YYYY-MM-DD HH:MM:SS] message"
    void write(const std::string& message);
    // Unstamped line, used for banners and raw tool output
    void writeRaw(const std::string& line);
    void banner(const std::string& title);

    const std::string& path() const { return path_; }
    bool isUsable() const { return usable_; }

    // Whole file split into lines, for tests and the CLI
    std::vector<std::string> readLines() const;

private:
    void appendLine(const std::string& line);

    std::string path_;
    bool usable_{true};
};
