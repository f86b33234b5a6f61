#include "engine/orchestrator.hpp"
#include <fmt/core.h>
#include <glog/logging.h>
#include <boost/algorithm/string/join.hpp>
#include <algorithm>
#include <cmath>
#include "common/defer.hpp"
#include "common/exceptions.hpp"
#include "common/io_utils.hpp"
#include "common/utils.hpp"
#include "config.hpp"

namespace coderun {
using namespace std;

execution_orchestrator::execution_orchestrator(environment_registry &registry, quota_tracker &quotas, sandbox_launcher &launcher, result_store &store)
    : registry(registry), quotas(quotas), launcher(launcher), store(store) {}

result<code_execution> execution_orchestrator::submit(const execution_request &request) {
    auto env_result = request.version.empty() ? registry.default_for(request.language)
                                              : registry.lookup(request.language, request.version);
    if (!is_ok(env_result)) {
        LOG(INFO) << "Rejected execution of user " << request.user_id << ": " << get_error(env_result).message;
        return get_error(env_result);
    }
    auto env = get<shared_ptr<const execution_environment>>(env_result);

    try {
        auto reserved = quotas.check_and_reserve(request.user_id);
        if (!is_ok(reserved)) return get_error(reserved);
    } catch (engine_exception &ex) {
        LOG(ERROR) << "Unable to reserve quota of user " << request.user_id << ": " << ex;
        return engine_error(error_kind::INTERNAL_ERROR, fmt::format("Unable to reserve quota: {}", ex.what()));
    }

    code_execution execution;
    execution.id = generate_id();
    execution.user_id = request.user_id;
    execution.environment_id = env->id;
    execution.kind = request.kind;
    execution.status = execution_status::QUEUED;
    execution.source_code = request.source_code;
    execution.stdin_input = request.stdin_input;
    execution.arguments = request.arguments;
    execution.exercise_id = request.exercise_id;
    execution.test_case_id = request.test_case_id;
    execution.session_id = request.session_id;
    if (request.timeout && request.timeout->count() > 0)
        execution.timeout_override = request.timeout;
    if (request.memory_limit && *request.memory_limit > 0)
        execution.memory_override = request.memory_limit;
    execution.created_at = chrono::system_clock::now();

    try {
        store.create_execution(execution);
    } catch (engine_exception &ex) {
        LOG(ERROR) << "Unable to save execution of user " << request.user_id << ": " << ex;
        try {
            quotas.release(request.user_id);
        } catch (engine_exception &release_ex) {
            LOG(ERROR) << "Unable to release quota of user " << request.user_id << ": " << release_ex;
        }
        return engine_error(error_kind::INTERNAL_ERROR, fmt::format("Unable to save execution: {}", ex.what()));
    }

    cancel_flag_of(execution.id);
    LOG(INFO) << "Execution " << execution.id << " of user " << execution.user_id << " queued on " << env->key();
    return execution;
}

code_execution execution_orchestrator::run(code_execution execution) noexcept {
    auto cancelled = cancel_flag_of(execution.id);

    try {
        run_sandbox(execution, *cancelled);
    } catch (engine_exception &ex) {
        LOG(ERROR) << "Execution " << execution.id << " failed: " << ex;
        execution.status = execution_status::FAILED;
        execution.stderr_output += fmt::format("Internal error: {}", ex.what());
    } catch (std::exception &ex) {
        LOG(ERROR) << "Execution " << execution.id << " failed: " << ex.what();
        execution.status = execution_status::FAILED;
        execution.stderr_output += fmt::format("Internal error: {}", ex.what());
    }

    if (!is_terminal(execution.status)) {
        LOG(ERROR) << "Execution " << execution.id << " left in non-terminal status " << to_string(execution.status);
        execution.status = execution_status::FAILED;
    }
    if (!execution.completed_at) execution.completed_at = chrono::system_clock::now();
    forget(execution.id);
    persist(execution);

    LOG(INFO) << "Execution " << execution.id << " finished with " << to_string(execution.status)
              << (execution.exit_code ? fmt::format(", exit code {}", *execution.exit_code) : "");

    try {
        quotas.commit_usage(execution.user_id, execution.execution_time.value_or(0), execution.memory_used.value_or(0));
    } catch (std::exception &ex) {
        LOG(ERROR) << "Unable to commit quota usage of execution " << execution.id << ": " << ex.what();
    }
    return execution;
}

void execution_orchestrator::run_sandbox(code_execution &execution, const atomic<bool> &cancelled) {
    if (cancelled) {
        LOG(INFO) << "Execution " << execution.id << " cancelled before start";
        execution.status = execution_status::CANCELLED;
        return;
    }

    auto env = registry.find_by_id(execution.environment_id);
    if (!env) throw internal_error("unknown environment " + execution.environment_id);

    execution.status = execution_status::RUNNING;
    execution.started_at = chrono::system_clock::now();
    execution.worker_node = WORKER_NODE;
    persist(execution);

    sandbox_options options;
    options.execution_id = execution.id;
    options.source_code = execution.source_code;
    options.stdin_input = execution.stdin_input;
    options.arguments = execution.arguments;
    options.timeout = execution.timeout_override.value_or(chrono::seconds(env->default_timeout));
    options.memory_limit = execution.memory_override;

    auto launched = launcher.launch(*env, options);
    if (!is_ok(launched)) {
        auto &error = get_error(launched);
        if (error.kind == error_kind::SECURITY_VIOLATION) {
            execution.status = execution_status::SECURITY_VIOLATION;
            execution.security_violations = error.violations;
        } else {
            execution.status = execution_status::FAILED;
        }
        execution.stderr_output = error.message;
        execution.completed_at = chrono::system_clock::now();
        return;
    }

    auto box = move(get<unique_ptr<sandbox>>(launched));
    defer { box->release(); };
    execution.sandbox_id = box->id();

    // 容器退出后 Docker 不再报告内存用量，cgroup v2 也没有峰值，因此运行期间持续采样取最大值
    int64_t peak_memory = 0;
    double cpu_seconds = 0;
    auto sample_stats = [&] {
        try {
            auto stats = box->stats();
            peak_memory = max(peak_memory, stats.peak_memory_bytes);
            cpu_seconds = max(cpu_seconds, stats.cpu_seconds);
        } catch (container_error &ex) {
            VLOG(1) << "Unable to fetch stats of sandbox " << box->id() << ": " << ex.what();
        }
    };

    elapsed_time timer;
    optional<container_state> state;
    bool was_cancelled = false;
    sample_stats();
    while (true) {
        auto remaining = options.timeout - timer.duration<chrono::milliseconds>();
        if (remaining.count() <= 0) break;
        if (cancelled) {
            was_cancelled = true;
            break;
        }
        state = box->wait(min<chrono::milliseconds>(remaining, WAIT_SLICE));
        if (state) break;
        sample_stats();
    }
    execution.execution_time = timer.seconds();
    execution.completed_at = chrono::system_clock::now();

    if (!state) {
        // 超时或者被取消，立即杀死用户程序，但仍然保留已经产生的输出
        try {
            box->kill();
        } catch (container_error &ex) {
            LOG(ERROR) << "Unable to kill sandbox " << box->id() << ": " << ex.what();
        }
    }

    try {
        auto logs = box->logs();
        execution.stdout_output = sanitize_utf8(truncate_output(logs.stdout_output, MAX_OUTPUT));
        execution.stderr_output = sanitize_utf8(truncate_output(logs.stderr_output, MAX_OUTPUT));
    } catch (container_error &ex) {
        // 正常结束时拿不到输出视为执行失败，超时和取消时只保留已有的结果
        if (state) throw;
        LOG(WARNING) << "Unable to fetch logs of sandbox " << box->id() << ": " << ex.what();
    }

    sample_stats();
    if (peak_memory > 0)
        execution.memory_used = (int)ceil(peak_memory / (1024.0 * 1024.0));
    else
        LOG(WARNING) << "No memory usage sampled for sandbox " << box->id();
    if (cpu_seconds > 0) execution.cpu_time = cpu_seconds;

    if (was_cancelled) {
        LOG(INFO) << "Execution " << execution.id << " cancelled while running";
        execution.status = execution_status::CANCELLED;
    } else if (!state) {
        LOG(INFO) << "Execution " << execution.id << " timed out after " << options.timeout.count() << "ms";
        execution.status = execution_status::TIMEOUT;
    } else {
        execution.exit_code = state->exit_code;
        if (!state->violations.empty()) {
            LOG(INFO) << "Execution " << execution.id << " violated sandbox isolation: " << boost::algorithm::join(state->violations, "; ");
            execution.status = execution_status::SECURITY_VIOLATION;
            execution.security_violations = state->violations;
            execution.blocked_operations = state->blocked_operations;
        } else if (state->oom_killed) {
            execution.status = execution_status::MEMORY_LIMIT;
        } else {
            execution.status = execution_status::COMPLETED;
        }
    }
}

result<code_execution> execution_orchestrator::execute(const execution_request &request) {
    auto submitted = submit(request);
    if (!is_ok(submitted)) return submitted;
    return run(move(get<code_execution>(submitted)));
}

bool execution_orchestrator::cancel(const string &execution_id) {
    lock_guard<mutex> lock(cancel_mut);
    auto it = cancel_flags.find(execution_id);
    if (it == cancel_flags.end()) return false;
    it->second->store(true);
    LOG(INFO) << "Cancelling execution " << execution_id;
    return true;
}

shared_ptr<atomic<bool>> execution_orchestrator::cancel_flag_of(const string &execution_id) {
    lock_guard<mutex> lock(cancel_mut);
    auto &flag = cancel_flags[execution_id];
    if (!flag) flag = make_shared<atomic<bool>>(false);
    return flag;
}

void execution_orchestrator::forget(const string &execution_id) {
    lock_guard<mutex> lock(cancel_mut);
    cancel_flags.erase(execution_id);
}

void execution_orchestrator::persist(const code_execution &execution) noexcept {
    try {
        store.update_execution(execution);
    } catch (std::exception &ex) {
        LOG(ERROR) << "Unable to save execution " << execution.id << ": " << ex.what();
    }
}

}  // namespace coderun
