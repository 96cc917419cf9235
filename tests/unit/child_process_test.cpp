#include "process/child_process.hpp"

#include <gtest/gtest.h>
#include <signal.h>

#include <chrono>
#include <string>
#include <thread>

using namespace coderun;
using namespace coderun::execution;

namespace {

process::ProcessSpec shell(const std::string &script) {
    process::ProcessSpec spec;
    spec.executable = "/bin/sh";
    spec.args = {"-c", script};
    return spec;
}

ExecutionContext context_for(std::chrono::milliseconds budget) {
    return {Deadline::after(budget), CancellationToken()};
}

}  // namespace

TEST(ChildProcessTest, CapturesStdoutStderrAndExitCode) {
    process::ChildProcess child("test", shell("echo out; echo err >&2; exit 3"));
    auto result = child.run(context_for(std::chrono::seconds(5)));

    ASSERT_TRUE(result.started) << result.spawn_error;
    ASSERT_TRUE(result.exit_code.has_value());
    EXPECT_EQ(*result.exit_code, 3);
    EXPECT_EQ(result.stdout_data, "out\n");
    EXPECT_EQ(result.stderr_data, "err\n");
    EXPECT_FALSE(result.killed);
    EXPECT_FALSE(result.truncated);
}

TEST(ChildProcessTest, FeedsStdin) {
    auto spec = shell("cat");
    spec.stdin_data = std::string("line one\nline two\n");

    process::ChildProcess child("test", spec);
    auto result = child.run(context_for(std::chrono::seconds(5)));

    ASSERT_TRUE(result.started);
    EXPECT_EQ(result.exit_code, 0);
    EXPECT_EQ(result.stdout_data, "line one\nline two\n");
}

TEST(ChildProcessTest, NoStdinMeansImmediateEof) {
    process::ChildProcess child("test", shell("cat; echo done"));
    auto result = child.run(context_for(std::chrono::seconds(5)));

    EXPECT_EQ(result.exit_code, 0);
    EXPECT_EQ(result.stdout_data, "done\n");
    EXPECT_FALSE(result.killed);
}

TEST(ChildProcessTest, LargeStdinDoesNotDeadlock) {
    // Bigger than a pipe buffer in both directions
    auto spec = shell("cat");
    spec.stdin_data = std::string(512 * 1024, 'z');

    process::ChildProcess child("test", spec);
    auto result = child.run(context_for(std::chrono::seconds(10)));

    EXPECT_EQ(result.exit_code, 0);
    EXPECT_EQ(result.stdout_data.size(), 512u * 1024u);
}

TEST(ChildProcessTest, ChildIgnoringStdinIsFine) {
    auto spec = shell("exit 0");
    spec.stdin_data = std::string(1024 * 1024, 'q');

    process::ChildProcess child("test", spec);
    auto result = child.run(context_for(std::chrono::seconds(5)));

    EXPECT_TRUE(result.started);
    EXPECT_EQ(result.exit_code, 0);
}

TEST(ChildProcessTest, OutputCappedPerStream) {
    auto spec = shell("head -c 10000 /dev/zero | tr '\\0' 'a'; head -c 100 /dev/zero | tr '\\0' 'b' >&2");
    spec.max_output_bytes = 1024;

    process::ChildProcess child("test", spec);
    auto result = child.run(context_for(std::chrono::seconds(5)));

    EXPECT_EQ(result.exit_code, 0);
    EXPECT_EQ(result.stdout_data.size(), 1024u);
    EXPECT_EQ(result.stderr_data.size(), 100u);
    EXPECT_TRUE(result.truncated);
}

TEST(ChildProcessTest, DeadlineKillsProcessGroup) {
    // The grandchild sleep must die with the shell
    process::ChildProcess child("test", shell("echo started; sleep 30 & wait"));
    auto started = Clock::now();
    auto result = child.run(context_for(std::chrono::milliseconds(300)));
    auto elapsed = Clock::now() - started;

    EXPECT_TRUE(result.started);
    EXPECT_TRUE(result.killed);
    EXPECT_FALSE(result.cancelled);
    EXPECT_FALSE(result.exit_code.has_value());
    ASSERT_TRUE(result.term_signal.has_value());
    EXPECT_EQ(*result.term_signal, SIGKILL);
    EXPECT_EQ(result.stdout_data, "started\n");
    EXPECT_LT(elapsed, std::chrono::seconds(5));
}

TEST(ChildProcessTest, CancellationKills) {
    CancellationToken token;
    ExecutionContext ctx{Deadline::after(std::chrono::seconds(30)), token};

    std::thread canceller([token]() mutable {
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
        token.cancel();
    });

    process::ChildProcess child("test", shell("sleep 30"));
    auto started = Clock::now();
    auto result = child.run(ctx);
    canceller.join();

    EXPECT_TRUE(result.killed);
    EXPECT_TRUE(result.cancelled);
    EXPECT_LT(Clock::now() - started, std::chrono::seconds(5));
}

TEST(ChildProcessTest, ExpiredContextNeverSpawns) {
    ExecutionContext ctx{Deadline::at(Clock::now() - std::chrono::seconds(1)), CancellationToken()};

    process::ChildProcess child("test", shell("echo should-not-run"));
    auto result = child.run(ctx);

    EXPECT_FALSE(result.started);
    EXPECT_FALSE(result.spawn_error.empty());
    EXPECT_TRUE(result.stdout_data.empty());
}

TEST(ChildProcessTest, MissingExecutableReportsSpawnError) {
    process::ProcessSpec spec;
    spec.executable = "/nonexistent/coderun-no-such-binary";

    process::ChildProcess child("test", spec);
    auto result = child.run(context_for(std::chrono::seconds(5)));

    EXPECT_FALSE(result.started);
    EXPECT_NE(result.spawn_error.find("coderun-no-such-binary"), std::string::npos) << result.spawn_error;
}

TEST(ChildProcessTest, ResolvesExecutableOnPath) {
    process::ProcessSpec spec;
    spec.executable = "echo";
    spec.args = {"via", "path"};

    process::ChildProcess child("test", spec);
    auto result = child.run(context_for(std::chrono::seconds(5)));

    ASSERT_TRUE(result.started) << result.spawn_error;
    EXPECT_EQ(result.stdout_data, "via path\n");
}

TEST(ChildProcessTest, SignalDeathReported) {
    process::ChildProcess child("test", shell("kill -TERM $$"));
    auto result = child.run(context_for(std::chrono::seconds(5)));

    EXPECT_TRUE(result.started);
    EXPECT_FALSE(result.killed);
    EXPECT_FALSE(result.exit_code.has_value());
    ASSERT_TRUE(result.term_signal.has_value());
    EXPECT_EQ(*result.term_signal, SIGTERM);
}
