#include <gtest/gtest.h>
#include "common/process_runner.hpp"
#include "test_support.hpp"
#include <vector>

class ProcessRunnerTest : public ::testing::Test {
protected:
    struct Captured {
        StreamKind stream;
        std::string line;
    };

    LineCallback collector() {
        return [this](StreamKind stream, const std::string& line) { lines_.push_back({stream, line}); };
    }

    std::vector<std::string> linesFor(StreamKind stream) const {
        std::vector<std::string> result;
        for (const auto& c : lines_) {
            if (c.stream == stream) {
                result.push_back(c.line);
            }
        }
        return result;
    }

    std::vector<Captured> lines_;
    ProcessRunner runner_;
};

// Test that both streams arrive line by line with the exit code
TEST_F(ProcessRunnerTest, SeparatesStdoutAndStderr) {
    ProcessResult result = runner_.run(
        {"/bin/sh", "-c", "echo one; echo two 1>&2; printf 'three\\nfour'; exit 3"}, collector());

    EXPECT_TRUE(result.started);
    EXPECT_FALSE(result.success());
    EXPECT_EQ(result.exitCode, 3);

    auto out = linesFor(StreamKind::Stdout);
    ASSERT_EQ(out.size(), 3u);
    EXPECT_EQ(out[0], "one");
    EXPECT_EQ(out[1], "three");
    EXPECT_EQ(out[2], "four");

    auto err = linesFor(StreamKind::Stderr);
    ASSERT_EQ(err.size(), 1u);
    EXPECT_EQ(err[0], "two");
}

TEST_F(ProcessRunnerTest, ZeroExitIsSuccess) {
    std::string out;
    std::string err;
    ProcessResult result = runner_.capture({"/bin/echo", "hello"}, out, err);
    EXPECT_TRUE(result.success());
    EXPECT_EQ(out, "hello\n");
    EXPECT_TRUE(err.empty());
}

// Test that a missing executable is reported as not started
TEST_F(ProcessRunnerTest, SpawnFailure) {
    ProcessResult result = runner_.run({"/nonexistent/acctvault-tool"}, collector());
    EXPECT_FALSE(result.started);
    EXPECT_FALSE(result.success());
    EXPECT_NE(result.error.find("Failed to execute"), std::string::npos);
    EXPECT_TRUE(lines_.empty());
}

TEST_F(ProcessRunnerTest, EmptyArgvIsRejected) {
    ProcessResult result = runner_.run({}, collector());
    EXPECT_FALSE(result.started);
    EXPECT_FALSE(result.error.empty());
}

TEST_F(ProcessRunnerTest, StdinIsFedAndClosed) {
    ProcessOptions options;
    options.stdinData = "first\nsecond\n";
    ProcessRunner runner(options);

    std::string out;
    std::string err;
    ProcessResult result = runner.capture({"/bin/cat"}, out, err);
    EXPECT_TRUE(result.success());
    EXPECT_EQ(out, "first\nsecond\n");
}

// Test that a child reading stdin sees EOF when no input is given
TEST_F(ProcessRunnerTest, StdinClosedWhenEmpty) {
    std::string out;
    std::string err;
    ProcessResult result = runner_.capture({"/bin/cat"}, out, err);
    EXPECT_TRUE(result.success());
    EXPECT_TRUE(out.empty());
}

TEST_F(ProcessRunnerTest, LongLinesAreChunked) {
    ProcessOptions options;
    options.maxLineLength = 10;
    ProcessRunner runner(options);

    runner.run({"/bin/sh", "-c", "printf '%s\\n' abcdefghijklmnopqrstuvwxy"}, collector());
    auto out = linesFor(StreamKind::Stdout);
    ASSERT_EQ(out.size(), 3u);
    EXPECT_EQ(out[0], "abcdefghij");
    EXPECT_EQ(out[1], "klmnopqrst");
    EXPECT_EQ(out[2], "uvwxy");
}

TEST_F(ProcessRunnerTest, WorkingDirectory) {
    TempDir dir("runner");
    ProcessOptions options;
    options.workingDirectory = dir.path();
    ProcessRunner runner(options);

    std::string out;
    std::string err;
    ASSERT_TRUE(runner.capture({"/bin/pwd"}, out, err).success());
    EXPECT_EQ(out, dir.path() + "\n");
}

TEST_F(ProcessRunnerTest, SignalIsReported) {
    ProcessResult result = runner_.run({"/bin/sh", "-c", "kill -TERM $$"}, collector());
    EXPECT_TRUE(result.started);
    EXPECT_TRUE(result.signaled);
    EXPECT_EQ(result.signal, 15);
    EXPECT_FALSE(result.success());
}
