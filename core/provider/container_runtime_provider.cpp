#include "container_runtime_provider.hpp"

#include <stdlib.h>

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <chrono>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <functional>
#include <sstream>
#include <utility>

#include "logging/logger.hpp"
#include "process/child_process.hpp"

namespace fs = std::filesystem;

namespace coderun {
namespace provider {

namespace {

// GNU timeout reports an expired command with 124
constexpr int kInUnitTimeout = 124;
// 128 + SIGKILL, what busybox timeout passes through
constexpr int kKilledExit = 137;

constexpr const char *kMountPoint = "/code";
// .State.StartedAt of a container that never ran
constexpr const char *kNeverStarted = "0001-01-01";

std::string trim(const std::string &s) {
    size_t begin = 0;
    size_t end = s.size();
    while (begin < end && std::isspace(static_cast<unsigned char>(s[begin]))) ++begin;
    while (end > begin && std::isspace(static_cast<unsigned char>(s[end - 1]))) --end;
    return s.substr(begin, end - begin);
}

std::string first_line(const std::string &s) {
    auto t = trim(s);
    auto nl = t.find('\n');
    return nl == std::string::npos ? t : t.substr(0, nl);
}

// Keeps the cleanup on every exit path out of the main flow
class UnitCleanup {
public:
    explicit UnitCleanup(std::function<void()> fn) : fn_(std::move(fn)) {}
    ~UnitCleanup() {
        if (fn_) fn_();
    }
    UnitCleanup(const UnitCleanup &) = delete;
    UnitCleanup &operator=(const UnitCleanup &) = delete;

private:
    std::function<void()> fn_;
};

}  // namespace

ContainerRuntimeProvider::ContainerRuntimeProvider(ContainerProviderConfig config) : config_(std::move(config)) {
    if (config_.images.empty()) {
        config_.images = default_container_images();
    }
}

execution::ProviderDescriptor ContainerRuntimeProvider::capabilities() const {
    execution::ProviderDescriptor descriptor;
    descriptor.name = config_.name;
    descriptor.kind = execution::ProviderKind::Container;
    descriptor.priority = config_.priority;
    for (const auto &[language, image] : config_.images) {
        (void)image;
        descriptor.supported_languages.push_back(language);
    }
    return descriptor;
}

std::string ContainerRuntimeProvider::expand_command(const std::string &command, const std::string &filename) {
    static const std::string kPlaceholder = "{file}";
    std::string path = std::string(kMountPoint) + "/" + filename;

    std::string out;
    size_t pos = 0;
    while (true) {
        auto hit = command.find(kPlaceholder, pos);
        if (hit == std::string::npos) {
            out.append(command, pos, std::string::npos);
            break;
        }
        out.append(command, pos, hit - pos);
        out += path;
        pos = hit + kPlaceholder.size();
    }
    return out;
}

std::string ContainerRuntimeProvider::make_container_name(const std::string &request_id) {
    std::string safe;
    for (char c : request_id) {
        if (std::isalnum(static_cast<unsigned char>(c)) || c == '-' || c == '_' || c == '.') {
            safe += c;
        }
        if (safe.size() >= 40) break;
    }
    return "coderun-" + (safe.empty() ? std::string("anon") : safe) + "-" + std::to_string(sequence_.fetch_add(1));
}

std::vector<std::string> ContainerRuntimeProvider::build_create_args(const std::string &container_name,
                                                                     const std::string &work_dir,
                                                                     const ImageSpec &image,
                                                                     const execution::ExecutionRequest &request,
                                                                     int timeout_seconds) const {
    std::ostringstream cpus;
    cpus << config_.cpus;
    std::string memory = std::to_string(config_.memory_mb) + "m";

    std::vector<std::string> args = {
        "create",
        "-i",
        "--name",
        container_name,
        "--memory=" + memory,
        "--memory-swap=" + memory,
        "--cpus=" + cpus.str(),
        "--pids-limit=" + std::to_string(config_.pids_limit),
    };
    if (!config_.allow_network) {
        args.push_back("--network=none");
    }
    args.push_back("--read-only");
    args.push_back("--tmpfs");
    args.push_back("/tmp:rw,exec,size=" + std::to_string(config_.tmpfs_mb) + "m");
    args.push_back("--cap-drop=ALL");
    args.push_back("--security-opt=no-new-privileges");
    args.push_back("-v");
    args.push_back(work_dir + ":" + kMountPoint + ":ro");
    args.push_back("-w");
    args.push_back(kMountPoint);
    for (const auto &[name, value] : request.env) {
        args.push_back("-e");
        args.push_back(name + "=" + value);
    }
    args.push_back(image.image);
    args.push_back("timeout");
    args.push_back("-s");
    args.push_back("KILL");
    args.push_back(std::to_string(timeout_seconds));
    args.push_back("sh");
    args.push_back("-c");
    args.push_back(expand_command(image.command, image.filename));
    return args;
}

bool ContainerRuntimeProvider::prepare_work_dir(const ImageSpec &image, const execution::ExecutionRequest &request,
                                                std::string &work_dir, std::string &error) const {
    std::string pattern = (fs::path(config_.work_root) / "coderun-XXXXXX").string();
    std::vector<char> buf(pattern.begin(), pattern.end());
    buf.push_back('\0');
    if (mkdtemp(buf.data()) == nullptr) {
        error = "Cannot create work directory under " + config_.work_root + ": " + std::strerror(errno);
        return false;
    }
    work_dir = buf.data();

    std::error_code ec;
    // The unit's user is not necessarily ours
    fs::permissions(work_dir,
                    fs::perms::owner_all | fs::perms::group_read | fs::perms::group_exec | fs::perms::others_read |
                        fs::perms::others_exec,
                    ec);
    if (ec) {
        LOG_WARN("[Container] " << request.request_id << " cannot relax permissions on " << work_dir << ": "
                                << ec.message());
    }

    auto source_path = fs::path(work_dir) / image.filename;
    std::ofstream out(source_path, std::ios::binary | std::ios::trunc);
    if (!out) {
        error = "Cannot write " + source_path.string();
        return false;
    }
    out << request.source;
    out.close();
    if (!out) {
        error = "Short write to " + source_path.string();
        return false;
    }
    return true;
}

void ContainerRuntimeProvider::remove_container(const std::string &container_name,
                                                const std::string &request_id) const {
    // Own budget and token: cleanup must run even when the request was cancelled
    execution::ExecutionContext ctx{execution::Deadline::after(std::chrono::milliseconds(config_.teardown_timeout_ms)),
                                    execution::CancellationToken()};

    process::ProcessSpec spec;
    spec.executable = config_.docker_binary;
    spec.args = {"rm", "-f", container_name};
    spec.max_output_bytes = 64 * 1024;

    process::ChildProcess rm("Container", spec);
    auto res = rm.run(ctx);
    if (!res.started) {
        LOG_ERROR("[Container] " << request_id << " cannot remove " << container_name << ": " << res.spawn_error);
    } else if (res.killed) {
        LOG_ERROR("[Container] " << request_id << " removal of " << container_name << " exceeded "
                                 << config_.teardown_timeout_ms << "ms");
    } else if (res.exit_code && *res.exit_code != 0) {
        // --rm usually got there first
        LOG_DEBUG("[Container] " << request_id << " rm -f " << container_name << ": " << first_line(res.stderr_data));
    }
}

bool ContainerRuntimeProvider::inspect_started(const std::string &container_name, const std::string &request_id,
                                               bool &started) const {
    execution::ExecutionContext ctx{execution::Deadline::after(std::chrono::milliseconds(config_.teardown_timeout_ms)),
                                    execution::CancellationToken()};

    process::ProcessSpec spec;
    spec.executable = config_.docker_binary;
    spec.args = {"inspect", "--format", "{{.State.StartedAt}}", container_name};
    spec.max_output_bytes = 64 * 1024;

    process::ChildProcess inspect("Container", spec);
    auto res = inspect.run(ctx);
    if (!res.started || res.killed || !res.exit_code || *res.exit_code != 0) {
        LOG_WARN("[Container] " << request_id << " cannot inspect " << container_name << ": "
                                << (res.started ? first_line(res.stderr_data) : res.spawn_error));
        return false;
    }

    auto started_at = first_line(res.stdout_data);
    started = !started_at.empty() && started_at.rfind(kNeverStarted, 0) != 0;
    return true;
}

void ContainerRuntimeProvider::remove_work_dir(const std::string &work_dir, const std::string &request_id) const {
    std::error_code ec;
    fs::remove_all(work_dir, ec);
    if (ec) {
        LOG_ERROR("[Container] " << request_id << " cannot remove " << work_dir << ": " << ec.message());
    }
}

execution::HealthProbeResult ContainerRuntimeProvider::health_check(const execution::ExecutionContext &ctx) {
    execution::HealthProbeResult probe;

    process::ProcessSpec spec;
    spec.executable = config_.docker_binary;
    spec.args = {"version", "--format", "{{.Server.Version}}"};
    spec.max_output_bytes = 64 * 1024;

    auto started = execution::Clock::now();
    process::ChildProcess version("Container", spec);
    auto res = version.run(ctx);
    probe.latency_ms =
        std::chrono::duration_cast<std::chrono::milliseconds>(execution::Clock::now() - started).count();

    if (!res.started) {
        probe.detail = res.spawn_error;
    } else if (res.killed) {
        probe.detail = "docker version timed out";
    } else if (!res.exit_code || *res.exit_code != 0) {
        probe.detail = "docker version failed: " + first_line(res.stderr_data);
    } else {
        probe.available = true;
        probe.detail = "server " + first_line(res.stdout_data);
    }
    return probe;
}

execution::ExecutionResult ContainerRuntimeProvider::execute(const execution::ExecutionContext &ctx,
                                                             const execution::ExecutionRequest &request) {
    execution::ExecutionResult result;
    result.request_id = request.request_id;
    result.language = request.language;
    result.provider_used = config_.name;

    auto image_it = config_.images.find(request.language);
    if (image_it == config_.images.end()) {
        result.outcome = execution::Outcome::ProviderUnavailable;
        result.error_message = "No image configured for " + request.language;
        return result;
    }
    const auto &image = image_it->second;

    if (ctx.should_stop()) {
        result.outcome = execution::Outcome::ProviderUnavailable;
        result.error_message = "No budget left to dispatch";
        return result;
    }

    std::string work_dir;
    std::string container_name;
    bool container_created = false;
    UnitCleanup cleanup([&]() {
        if (container_created) {
            remove_container(container_name, request.request_id);
        }
        if (!work_dir.empty()) {
            remove_work_dir(work_dir, request.request_id);
        }
    });

    std::string error;
    if (!prepare_work_dir(image, request, work_dir, error)) {
        result.outcome = execution::Outcome::ProviderUnavailable;
        result.error_message = error;
        LOG_WARN("[Container] " << request.request_id << " " << error);
        return result;
    }

    int timeout_seconds = std::min(request.timeout_seconds, ctx.deadline.remaining_seconds_ceil());
    container_name = make_container_name(request.request_id);

    // Create: nothing has run yet, so any failure is the runtime's
    process::ProcessSpec create_spec;
    create_spec.executable = config_.docker_binary;
    create_spec.args = build_create_args(container_name, work_dir, image, request, timeout_seconds);
    create_spec.max_output_bytes = 64 * 1024;

    LOG_DEBUG("[Container] " << request.request_id << " creating " << container_name << " (" << image.image << ", "
                             << timeout_seconds << "s)");

    process::ChildProcess create("Container", create_spec);
    auto created = create.run(ctx);
    if (created.started) {
        container_created = true;
    }
    if (!created.started || created.killed || !created.exit_code || *created.exit_code != 0) {
        result.outcome = execution::Outcome::ProviderUnavailable;
        if (!created.started) {
            result.error_message = created.spawn_error;
        } else if (created.killed) {
            result.error_message = created.cancelled ? "Cancelled while creating container"
                                                     : "No budget left while creating container";
        } else {
            result.error_message = "Container runtime failed: " + first_line(created.stderr_data);
        }
        LOG_WARN("[Container] " << request.request_id << " " << result.error_message);
        return result;
    }

    // Start: from here on the program may have run, so nothing is retryable
    process::ProcessSpec start_spec;
    start_spec.executable = config_.docker_binary;
    start_spec.args = {"start", "-ai", container_name};
    start_spec.stdin_data = request.stdin_data;
    start_spec.max_output_bytes = config_.max_output_bytes;

    process::ChildProcess start("Container", start_spec);
    auto res = start.run(ctx);

    result.stdout_data = std::move(res.stdout_data);
    result.stderr_data = std::move(res.stderr_data);
    result.truncated = res.truncated;
    result.duration_ms = res.duration_ms;

    if (!res.started) {
        result.outcome = execution::Outcome::ProviderUnavailable;
        result.error_message = res.spawn_error;
        result.stdout_data.clear();
        result.stderr_data.clear();
        LOG_WARN("[Container] " << request.request_id << " " << res.spawn_error);
        return result;
    }

    if (res.killed) {
        result.outcome = execution::Outcome::TimedOut;
        result.error_message = res.cancelled ? "Execution cancelled" : "Execution exceeded its time budget";
        return result;
    }

    if (res.term_signal) {
        result.outcome = execution::Outcome::InternalError;
        result.error_code = execution::ErrorCode::ADAPTER_FAULT;
        result.error_message = "Docker CLI terminated by signal " + std::to_string(*res.term_signal);
        return result;
    }

    if (!res.exit_code) {
        result.outcome = execution::Outcome::InternalError;
        result.error_code = execution::ErrorCode::ADAPTER_FAULT;
        result.error_message = "Docker CLI exit status unavailable";
        return result;
    }

    int exit_code = *res.exit_code;
    if (exit_code != 0) {
        // A non-zero start is either the program's status or a unit that never ran
        bool unit_started = true;
        if (inspect_started(container_name, request.request_id, unit_started) && !unit_started) {
            result.outcome = execution::Outcome::ProviderUnavailable;
            result.error_message = "Container did not start: " + first_line(result.stderr_data);
            result.stdout_data.clear();
            result.stderr_data.clear();
            result.truncated = false;
            LOG_WARN("[Container] " << request.request_id << " " << result.error_message);
            return result;
        }
    }

    // The in-unit timeout fires only once the full budget has run
    bool ran_out_of_time = res.duration_ms >= static_cast<int64_t>(timeout_seconds) * 1000;
    if ((exit_code == kInUnitTimeout || exit_code == kKilledExit) && ran_out_of_time) {
        result.outcome = execution::Outcome::TimedOut;
        result.error_message = "Execution exceeded " + std::to_string(timeout_seconds) + "s";
        return result;
    }

    result.outcome = execution::Outcome::Completed;
    result.exit_code = exit_code;
    return result;
}

}  // namespace provider
}  // namespace coderun
