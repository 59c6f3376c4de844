#include "common/process_runner.hpp"
#include "common/logger.hpp"
#include <poll.h>
#include <fcntl.h>
#include <unistd.h>
#include <signal.h>
#include <sys/wait.h>
#include <cerrno>
#include <cstring>
#include <mutex>

namespace {

struct StreamBuffer {
    int fd{-1};
    StreamKind kind{StreamKind::Stdout};
    std::string pending;
};

void closeFd(int& fd) {
    if (fd >= 0) {
        close(fd);
        fd = -1;
    }
}

void emitLines(StreamBuffer& stream, size_t maxLineLength, const LineCallback& onLine) {
    size_t pos;
    while ((pos = stream.pending.find('\n')) != std::string::npos) {
        std::string line = stream.pending.substr(0, pos);
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        stream.pending.erase(0, pos + 1);
        if (!onLine) {
            continue;
        }
        while (line.size() > maxLineLength) {
            onLine(stream.kind, line.substr(0, maxLineLength));
            line.erase(0, maxLineLength);
        }
        onLine(stream.kind, line);
    }
    while (stream.pending.size() >= maxLineLength) {
        if (onLine) {
            onLine(stream.kind, stream.pending.substr(0, maxLineLength));
        }
        stream.pending.erase(0, maxLineLength);
    }
}

void flushRemainder(StreamBuffer& stream, const LineCallback& onLine) {
    if (!stream.pending.empty()) {
        if (onLine) {
            onLine(stream.kind, stream.pending);
        }
        stream.pending.clear();
    }
}

// Drains whatever is available; returns false once the stream reached EOF
bool drain(StreamBuffer& stream, size_t maxLineLength, const LineCallback& onLine) {
    char buffer[4096];
    while (true) {
        ssize_t n = read(stream.fd, buffer, sizeof(buffer));
        if (n > 0) {
            stream.pending.append(buffer, static_cast<size_t>(n));
            emitLines(stream, maxLineLength, onLine);
            continue;
        }
        if (n == 0) {
            flushRemainder(stream, onLine);
            closeFd(stream.fd);
            return false;
        }
        if (errno == EINTR) {
            continue;
        }
        if (errno == EAGAIN || errno == EWOULDBLOCK) {
            return true;
        }
        Logger::warning(std::string("Read from child process failed: ") + strerror(errno));
        flushRemainder(stream, onLine);
        closeFd(stream.fd);
        return false;
    }
}

void ignoreSigpipe() {
    static std::once_flag once;
    std::call_once(once, []() { signal(SIGPIPE, SIG_IGN); });
}

} // namespace

ProcessRunner::ProcessRunner(ProcessOptions options) : options_(std::move(options)) {}

ProcessResult ProcessRunner::run(const std::vector<std::string>& argv, const LineCallback& onLine) const {
    ProcessResult result;

    if (argv.empty()) {
        result.error = "No command given";
        return result;
    }

    ignoreSigpipe();

    int inPipe[2] = {-1, -1};
    int outPipe[2] = {-1, -1};
    int errPipe[2] = {-1, -1};
    int execPipe[2] = {-1, -1};

    if (pipe2(inPipe, O_CLOEXEC) != 0 || pipe2(outPipe, O_CLOEXEC) != 0 ||
        pipe2(errPipe, O_CLOEXEC) != 0 || pipe2(execPipe, O_CLOEXEC) != 0) {
        result.error = std::string("Failed to create pipes: ") + strerror(errno);
        for (int* p : {inPipe, outPipe, errPipe, execPipe}) {
            closeFd(p[0]);
            closeFd(p[1]);
        }
        return result;
    }

    std::vector<char*> args;
    args.reserve(argv.size() + 1);
    for (const auto& arg : argv) {
        args.push_back(const_cast<char*>(arg.c_str()));
    }
    args.push_back(nullptr);

    pid_t pid = fork();
    if (pid < 0) {
        result.error = std::string("fork failed: ") + strerror(errno);
        for (int* p : {inPipe, outPipe, errPipe, execPipe}) {
            closeFd(p[0]);
            closeFd(p[1]);
        }
        return result;
    }

    if (pid == 0) {
        dup2(inPipe[0], STDIN_FILENO);
        dup2(outPipe[1], STDOUT_FILENO);
        dup2(errPipe[1], STDERR_FILENO);
        if (!options_.workingDirectory.empty() && chdir(options_.workingDirectory.c_str()) != 0) {
            int err = errno;
            ssize_t ignored = write(execPipe[1], &err, sizeof(err));
            (void)ignored;
            _exit(127);
        }
        execvp(args[0], args.data());
        int err = errno;
        ssize_t ignored = write(execPipe[1], &err, sizeof(err));
        (void)ignored;
        _exit(127);
    }

    closeFd(inPipe[0]);
    closeFd(outPipe[1]);
    closeFd(errPipe[1]);
    closeFd(execPipe[1]);

    // The exec pipe closes on a successful exec; anything written is the child's errno
    int childErrno = 0;
    ssize_t n;
    do {
        n = read(execPipe[0], &childErrno, sizeof(childErrno));
    } while (n < 0 && errno == EINTR);
    closeFd(execPipe[0]);

    if (n == static_cast<ssize_t>(sizeof(childErrno))) {
        int status = 0;
        while (waitpid(pid, &status, 0) < 0 && errno == EINTR) {
        }
        closeFd(inPipe[1]);
        closeFd(outPipe[0]);
        closeFd(errPipe[0]);
        result.error = "Failed to execute " + argv[0] + ": " + strerror(childErrno);
        return result;
    }

    result.started = true;

    StreamBuffer out{outPipe[0], StreamKind::Stdout, {}};
    StreamBuffer err{errPipe[0], StreamKind::Stderr, {}};
    fcntl(out.fd, F_SETFL, fcntl(out.fd, F_GETFL) | O_NONBLOCK);
    fcntl(err.fd, F_SETFL, fcntl(err.fd, F_GETFL) | O_NONBLOCK);

    int stdinFd = inPipe[1];
    size_t stdinOffset = 0;
    if (options_.stdinData.empty()) {
        closeFd(stdinFd);
    } else {
        fcntl(stdinFd, F_SETFL, fcntl(stdinFd, F_GETFL) | O_NONBLOCK);
    }

    const int timeoutMs = static_cast<int>(options_.pollInterval.count());

    while (out.fd >= 0 || err.fd >= 0) {
        pollfd fds[3];
        nfds_t count = 0;
        int outIndex = -1, errIndex = -1, inIndex = -1;
        if (out.fd >= 0) {
            outIndex = static_cast<int>(count);
            fds[count++] = {out.fd, POLLIN, 0};
        }
        if (err.fd >= 0) {
            errIndex = static_cast<int>(count);
            fds[count++] = {err.fd, POLLIN, 0};
        }
        if (stdinFd >= 0) {
            inIndex = static_cast<int>(count);
            fds[count++] = {stdinFd, POLLOUT, 0};
        }

        int ready = poll(fds, count, timeoutMs);
        if (ready < 0) {
            if (errno == EINTR) {
                continue;
            }
            Logger::error(std::string("poll failed: ") + strerror(errno));
            break;
        }
        if (ready == 0) {
            continue;
        }

        if (inIndex >= 0 && fds[inIndex].revents != 0) {
            if (fds[inIndex].revents & (POLLERR | POLLHUP)) {
                closeFd(stdinFd);
            } else {
                ssize_t written = write(stdinFd, options_.stdinData.data() + stdinOffset,
                                        options_.stdinData.size() - stdinOffset);
                if (written > 0) {
                    stdinOffset += static_cast<size_t>(written);
                } else if (written < 0 && errno != EAGAIN && errno != EINTR) {
                    Logger::warning(std::string("Write to child stdin failed: ") + strerror(errno));
                    closeFd(stdinFd);
                }
                if (stdinOffset >= options_.stdinData.size()) {
                    closeFd(stdinFd);
                }
            }
        }
        if (outIndex >= 0 && fds[outIndex].revents != 0) {
            drain(out, options_.maxLineLength, onLine);
        }
        if (errIndex >= 0 && fds[errIndex].revents != 0) {
            drain(err, options_.maxLineLength, onLine);
        }
    }

    closeFd(stdinFd);
    closeFd(out.fd);
    closeFd(err.fd);

    int status = 0;
    while (waitpid(pid, &status, 0) < 0) {
        if (errno != EINTR) {
            result.error = std::string("waitpid failed: ") + strerror(errno);
            return result;
        }
    }

    if (WIFEXITED(status)) {
        result.exitCode = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        result.signaled = true;
        result.signal = WTERMSIG(status);
        result.error = argv[0] + " terminated by signal " + std::to_string(result.signal);
    }
    return result;
}

ProcessResult ProcessRunner::capture(const std::vector<std::string>& argv,
                                     std::string& stdoutText,
                                     std::string& stderrText) const {
    stdoutText.clear();
    stderrText.clear();
    return run(argv, [&](StreamKind stream, const std::string& line) {
        std::string& target = stream == StreamKind::Stdout ? stdoutText : stderrText;
        target += line;
        target += '\n';
    });
}
