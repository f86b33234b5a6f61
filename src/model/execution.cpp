#include "model/execution.hpp"
#include "common/json_utils.hpp"

namespace coderun {
using namespace std;
using namespace nlohmann;

bool code_execution::is_successful() const {
    return status == execution_status::COMPLETED && exit_code && *exit_code == 0;
}

template <typename T>
static json optional_to_json(const optional<T> &value) {
    return value ? json(*value) : json(nullptr);
}

static json optional_to_json(const optional<timestamp> &value) {
    return value ? json(format_timestamp(*value)) : json(nullptr);
}

static optional<timestamp> optional_timestamp(const json &j, const char *key) {
    if (!exists(j, key)) return nullopt;
    return parse_timestamp(j.at(key).get<string>());
}

void from_json(const json &j, execution_request &request) {
    j.at("user_id").get_to(request.user_id);
    j.at("language").get_to(request.language);
    j.at("version").get_to(request.version);
    j.at("source_code").get_to(request.source_code);
    assign_optional(j, request.stdin_input, "stdin");
    assign_optional(j, request.arguments, "arguments");
    if (exists(j, "kind"))
        request.kind = parse_execution_kind(j.at("kind").get<string>());
    assign_optional(j, request.exercise_id, "exercise_id");
    assign_optional(j, request.test_case_id, "test_case_id");
    assign_optional(j, request.session_id, "session_id");
    if (exists(j, "timeout_ms"))
        request.timeout = chrono::milliseconds(j.at("timeout_ms").get<long>());
    assign_optional(j, request.memory_limit, "memory_limit");
}

void to_json(json &j, const code_execution &execution) {
    j = json{{"id", execution.id},
             {"user_id", execution.user_id},
             {"environment_id", execution.environment_id},
             {"kind", to_string(execution.kind)},
             {"status", to_string(execution.status)},
             {"source_code", execution.source_code},
             {"stdin", execution.stdin_input},
             {"arguments", execution.arguments},
             {"stdout", execution.stdout_output},
             {"stderr", execution.stderr_output},
             {"exit_code", optional_to_json(execution.exit_code)},
             {"execution_time", optional_to_json(execution.execution_time)},
             {"memory_used", optional_to_json(execution.memory_used)},
             {"cpu_time", optional_to_json(execution.cpu_time)},
             {"sandbox_id", execution.sandbox_id},
             {"worker_node", execution.worker_node},
             {"exercise_id", optional_to_json(execution.exercise_id)},
             {"test_case_id", optional_to_json(execution.test_case_id)},
             {"session_id", optional_to_json(execution.session_id)},
             {"security_violations", execution.security_violations},
             {"blocked_operations", execution.blocked_operations},
             {"created_at", format_timestamp(execution.created_at)},
             {"started_at", optional_to_json(execution.started_at)},
             {"completed_at", optional_to_json(execution.completed_at)}};
}

void from_json(const json &j, code_execution &execution) {
    j.at("id").get_to(execution.id);
    j.at("user_id").get_to(execution.user_id);
    j.at("environment_id").get_to(execution.environment_id);
    execution.kind = parse_execution_kind(j.at("kind").get<string>());
    execution.status = parse_execution_status(j.at("status").get<string>());
    assign_optional(j, execution.source_code, "source_code");
    assign_optional(j, execution.stdin_input, "stdin");
    assign_optional(j, execution.arguments, "arguments");
    assign_optional(j, execution.stdout_output, "stdout");
    assign_optional(j, execution.stderr_output, "stderr");
    assign_optional(j, execution.exit_code, "exit_code");
    assign_optional(j, execution.execution_time, "execution_time");
    assign_optional(j, execution.memory_used, "memory_used");
    assign_optional(j, execution.cpu_time, "cpu_time");
    assign_optional(j, execution.sandbox_id, "sandbox_id");
    assign_optional(j, execution.worker_node, "worker_node");
    assign_optional(j, execution.exercise_id, "exercise_id");
    assign_optional(j, execution.test_case_id, "test_case_id");
    assign_optional(j, execution.session_id, "session_id");
    assign_optional(j, execution.security_violations, "security_violations");
    assign_optional(j, execution.blocked_operations, "blocked_operations");
    execution.created_at = parse_timestamp(j.at("created_at").get<string>());
    execution.started_at = optional_timestamp(j, "started_at");
    execution.completed_at = optional_timestamp(j, "completed_at");
}

}  // namespace coderun
