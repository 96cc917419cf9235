#pragma once

#include <sys/types.h>

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "execution/context.hpp"
#include "execution/types.hpp"

namespace coderun {
namespace process {

struct ProcessSpec {
    std::string executable;  // looked up on PATH when it has no '/'
    std::vector<std::string> args;
    std::optional<std::string> stdin_data;  // nullopt: child sees EOF immediately
    size_t max_output_bytes = execution::kDefaultMaxOutputBytes;
};

struct ProcessResult {
    bool started = false;
    std::string spawn_error;

    std::optional<int> exit_code;    // set when the child exited normally
    std::optional<int> term_signal;  // set when the child died from a signal
    bool killed = false;             // we killed it because ctx asked us to stop
    bool cancelled = false;          // the kill was caused by cancellation rather than the deadline

    std::string stdout_data;
    std::string stderr_data;
    bool truncated = false;
    int64_t duration_ms = 0;
};

// ChildProcess runs one command to completion under an ExecutionContext.
// Responsibilities:
// - Spawn with piped stdin/stdout/stderr in a fresh process group
// - Feed stdin and capture both output streams up to the cap
// - Kill the whole process group on deadline or cancellation
// - Always reap the child before returning
class ChildProcess {
public:
    ChildProcess(std::string label, ProcessSpec spec);
    ~ChildProcess();

    ChildProcess(const ChildProcess &) = delete;
    ChildProcess &operator=(const ChildProcess &) = delete;

    // Blocking. May be called once.
    ProcessResult run(const execution::ExecutionContext &ctx);

    const std::string &label() const { return label_; }

private:
    std::string label_;
    ProcessSpec spec_;

    pid_t pid_ = -1;
    int stdin_fd_ = -1;
    int stdout_fd_ = -1;
    int stderr_fd_ = -1;

    bool spawn(ProcessResult &result);
    void pump(const execution::ExecutionContext &ctx, ProcessResult &result);
    bool reap(bool block, ProcessResult &result);
    void force_terminate();
    void close_fds();
};

}  // namespace process
}  // namespace coderun
