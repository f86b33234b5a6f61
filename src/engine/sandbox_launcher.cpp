#include "engine/sandbox_launcher.hpp"
#include <fmt/core.h>
#include <glog/logging.h>
#include <boost/algorithm/string/join.hpp>
#include "common/exceptions.hpp"
#include "common/io_utils.hpp"
#include "common/utils.hpp"
#include "config.hpp"
#include "engine/policy_audit.hpp"

namespace coderun {
using namespace std;

static const char *WORKSPACE_MOUNT = "/workspace";
static const char *STDIN_FILE = "stdin.txt";

sandbox::sandbox(container_runtime &runtime, string container_id, filesystem::path workspace)
    : runtime(runtime), container_id(move(container_id)), workspace_dir(move(workspace)) {}

sandbox::~sandbox() {
    release();
}

const string &sandbox::id() const {
    return container_id;
}

const filesystem::path &sandbox::workspace() const {
    return workspace_dir;
}

void sandbox::start() {
    runtime.start(container_id);
}

optional<container_state> sandbox::wait(chrono::milliseconds timeout) {
    return runtime.wait(container_id, timeout);
}

container_logs sandbox::logs() {
    return runtime.logs(container_id);
}

container_stats sandbox::stats() {
    return runtime.stats(container_id);
}

void sandbox::kill() {
    runtime.kill(container_id);
}

void sandbox::stop(chrono::seconds grace) {
    runtime.stop(container_id, grace);
}

void sandbox::remove() {
    runtime.remove(container_id);
}

void sandbox::release() noexcept {
    if (released) return;
    released = true;

    try {
        stop(STOP_GRACE_PERIOD);
    } catch (std::exception &ex) {
        LOG(ERROR) << "Unable to stop sandbox " << container_id << ": " << ex.what();
    }
    try {
        remove();
    } catch (std::exception &ex) {
        LOG(ERROR) << "Unable to remove sandbox " << container_id << ": " << ex.what();
    }

    if (DEBUG)
        LOG(INFO) << "Keeping workspace " << workspace_dir << " of sandbox " << container_id;
    else
        remove_directory_quietly(workspace_dir);
}

string build_command(const execution_environment &env, const vector<string> &arguments, bool has_stdin) {
    string source = fmt::format("{}/main{}", WORKSPACE_MOUNT, env.file_extension);

    vector<string> quoted;
    for (auto &arg : arguments) quoted.push_back(shell_quote(arg));
    string args = quoted.empty() ? "" : " " + boost::algorithm::join(quoted, " ");

    string redirect = has_stdin ? fmt::format(" < {}/{}", WORKSPACE_MOUNT, STDIN_FILE) : " < /dev/null";

    if (!env.interpreter_command.empty())
        return env.interpreter_command + " " + source + args + redirect;
    if (!env.compiler_command.empty())
        return env.compiler_command + " " + source + " -o /tmp/main && /tmp/main" + args + redirect;
    return source + args + redirect;
}

container_spec build_container_spec(const execution_environment &env, const sandbox_options &options, const filesystem::path &workspace) {
    // 调用方只能调低内存上限，不能超过运行环境的 max_memory
    int memory_mb = env.max_memory;
    if (options.memory_limit && *options.memory_limit > 0)
        memory_mb = min(*options.memory_limit, env.max_memory);
    auto timeout_seconds = chrono::duration_cast<chrono::seconds>(options.timeout + chrono::milliseconds(999)).count();

    container_spec spec;
    spec.image = env.image;
    spec.command = {"sh", "-c", build_command(env, options.arguments, !options.stdin_input.empty())};
    spec.user = SANDBOX_USER;
    spec.working_dir = "/tmp";
    spec.env = {{"TIMEOUT", std::to_string(timeout_seconds)},
                {"MAX_MEMORY", std::to_string(memory_mb)},
                {"HOME", "/tmp"}};
    spec.mounts.push_back({workspace, WORKSPACE_MOUNT, true});
    // 编译型语言需要在 /tmp 中执行编译结果，因此不能加 noexec
    spec.tmpfs["/tmp"] = fmt::format("rw,exec,nosuid,size={}m", env.max_file_size);
    spec.memory_bytes = int64_t(memory_mb) * 1024 * 1024;
    spec.memory_swap_bytes = spec.memory_bytes;
    spec.cpu_period = 100000;
    spec.cpu_quota = max<int64_t>(1000, int64_t(env.max_cpu_time) * 1000);
    spec.pids_limit = PIDS_LIMIT;
    spec.log_max_bytes = int64_t(MAX_OUTPUT) * 2;
    spec.read_only_rootfs = true;
    spec.network_disabled = !env.supports_networking;
    spec.cap_drop = {"ALL"};
    spec.security_opt = {"no-new-privileges"};
    spec.labels = {{"coderun.execution", options.execution_id},
                   {"coderun.environment", env.key()}};
    return spec;
}

sandbox_launcher::sandbox_launcher(container_runtime &runtime)
    : runtime(runtime) {}

result<unique_ptr<sandbox>> sandbox_launcher::launch(const execution_environment &env, const sandbox_options &options) {
    auto violations = audit_source(env, options.source_code);
    if (!violations.empty()) {
        LOG(INFO) << "Execution " << options.execution_id << " rejected by security policy of " << env.key()
                  << ": " << boost::algorithm::join(violations, "; ");
        return engine_error(error_kind::SECURITY_VIOLATION,
                            "Security policy violation: " + boost::algorithm::join(violations, "; "), violations);
    }

    sandbox_options effective = options;
    if (!env.supports_input && !effective.stdin_input.empty()) {
        LOG(WARNING) << "Environment " << env.key() << " does not support input, ignoring stdin of execution " << options.execution_id;
        effective.stdin_input.clear();
    }

    filesystem::path workspace;
    try {
        workspace = create_unique_directory(RUN_DIR);
        // 沙箱内以非特权用户运行，需要能够读取工作区
        using filesystem::perms;
        filesystem::permissions(workspace, perms::owner_all | perms::group_read | perms::group_exec |
                                               perms::others_read | perms::others_exec);
        auto source_path = workspace / ("main" + env.file_extension);
        write_file_content(source_path, effective.source_code);
        if (!effective.stdin_input.empty())
            write_file_content(workspace / STDIN_FILE, effective.stdin_input);
    } catch (std::exception &ex) {
        if (!workspace.empty()) remove_directory_quietly(workspace);
        return engine_error(error_kind::SANDBOX_LAUNCH_FAILURE, fmt::format("Unable to prepare workspace: {}", ex.what()));
    }

    string container_id;
    try {
        container_id = runtime.create(build_container_spec(env, effective, workspace));
    } catch (container_error &ex) {
        LOG(ERROR) << "Unable to create sandbox for execution " << options.execution_id << ": " << ex;
        remove_directory_quietly(workspace);
        return engine_error(error_kind::SANDBOX_LAUNCH_FAILURE, fmt::format("Unable to create sandbox: {}", ex.what()));
    }

    auto box = make_unique<sandbox>(runtime, container_id, workspace);
    try {
        box->start();
    } catch (container_error &ex) {
        LOG(ERROR) << "Unable to start sandbox " << container_id << ": " << ex;
        // box 析构时回收容器和工作区
        return engine_error(error_kind::SANDBOX_LAUNCH_FAILURE, fmt::format("Unable to start sandbox: {}", ex.what()));
    }

    LOG(INFO) << "Started sandbox " << container_id << " (" << env.image << ") for execution " << options.execution_id;
    return result<unique_ptr<sandbox>>(move(box));
}

}  // namespace coderun
