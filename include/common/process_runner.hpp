#pragma once

#include <string>
#include <vector>
#include <functional>
#include <chrono>

enum class StreamKind {
    Stdout,
    Stderr
};

using LineCallback = std::function<void(StreamKind stream, const std::string& line)>;

struct ProcessOptions {
    std::string workingDirectory;
    // Written to the child's stdin, which is then closed. Empty closes it at once.
    std::string stdinData;
    std::chrono::milliseconds pollInterval{50};
    // Longer lines are delivered in chunks of this size
    size_t maxLineLength{65536};
};

struct ProcessResult {
    bool started{false};
    int exitCode{-1};
    bool signaled{false};
    int signal{0};
    std::string error;

    bool success() const { return started && !signaled && exitCode == 0; }
};

// Runs one child process to completion, draining stdout and stderr
// concurrently and handing every complete line to the callback as it arrives.
class ProcessRunner {
public:
    ProcessRunner() = default;
    explicit ProcessRunner(ProcessOptions options);

    ProcessResult run(const std::vector<std::string>& argv, const LineCallback& onLine) const;

    // Convenience wrapper that collects both streams
    ProcessResult capture(const std::vector<std::string>& argv,
                          std::string& stdoutText,
                          std::string& stderrText) const;

    void setOptions(const ProcessOptions& options) { options_ = options; }
    const ProcessOptions& getOptions() const { return options_; }

private:
    ProcessOptions options_;
};
