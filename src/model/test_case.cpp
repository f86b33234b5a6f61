#include "model/test_case.hpp"
#include "common/json_utils.hpp"

namespace coderun {
using namespace std;
using namespace nlohmann;

test_summary summarize(const vector<test_result> &results) {
    test_summary summary;
    summary.total = results.size();
    for (auto &result : results) {
        switch (result.status) {
            case test_status::PASSED:
                ++summary.passed;
                break;
            case test_status::FAILED:
                ++summary.failed;
                break;
            case test_status::SKIPPED:
                ++summary.skipped;
                continue;
            case test_status::ERROR:
            case test_status::TIMEOUT:
            case test_status::MEMORY_EXCEEDED:
                ++summary.errored;
                break;
        }
        summary.points_earned += result.points_earned;
        summary.points_possible += result.points_possible;
    }
    if (summary.points_possible > 0)
        summary.score = 100.0 * summary.points_earned / summary.points_possible;
    return summary;
}

void to_json(json &j, const test_case &tc) {
    j = json{{"id", tc.id},
             {"exercise_id", tc.exercise_id},
             {"name", tc.name},
             {"test_type", to_string(tc.type)},
             {"description", tc.description},
             {"input_data", tc.input_data},
             {"expected_output", tc.expected_output},
             {"expected_error", tc.expected_error},
             {"setup_code", tc.setup_code},
             {"test_code", tc.test_code},
             {"teardown_code", tc.teardown_code},
             {"timeout", tc.timeout},
             {"memory_limit", tc.memory_limit},
             {"points", tc.points},
             {"order", tc.order},
             {"weight", tc.weight},
             {"is_hidden", tc.is_hidden},
             {"is_required", tc.is_required},
             {"difficulty", tc.difficulty},
             {"created_at", format_timestamp(tc.created_at)}};
}

void from_json(const json &j, test_case &tc) {
    j.at("id").get_to(tc.id);
    assign_optional(j, tc.exercise_id, "exercise_id");
    tc.name = get_value_def<string>(j, tc.id, "name");
    if (exists(j, "test_type"))
        tc.type = parse_test_type(j.at("test_type").get<string>());
    assign_optional(j, tc.description, "description");
    assign_optional(j, tc.input_data, "input_data");
    assign_optional(j, tc.expected_output, "expected_output");
    assign_optional(j, tc.expected_error, "expected_error");
    assign_optional(j, tc.setup_code, "setup_code");
    assign_optional(j, tc.test_code, "test_code");
    assign_optional(j, tc.teardown_code, "teardown_code");
    assign_optional(j, tc.timeout, "timeout");
    assign_optional(j, tc.memory_limit, "memory_limit");
    assign_optional(j, tc.points, "points");
    assign_optional(j, tc.order, "order");
    assign_optional(j, tc.weight, "weight");
    assign_optional(j, tc.is_hidden, "is_hidden");
    assign_optional(j, tc.is_required, "is_required");
    assign_optional(j, tc.difficulty, "difficulty");
    tc.created_at = exists(j, "created_at") ? parse_timestamp(j.at("created_at").get<string>())
                                            : chrono::system_clock::now();
}

void to_json(json &j, const test_result &result) {
    j = json{{"id", result.id},
             {"execution_id", result.execution_id},
             {"test_case_id", result.test_case_id},
             {"status", to_string(result.status)},
             {"actual_output", result.actual_output},
             {"error_message", result.error_message},
             {"execution_time", result.execution_time ? json(*result.execution_time) : json(nullptr)},
             {"memory_used", result.memory_used ? json(*result.memory_used) : json(nullptr)},
             {"points_earned", result.points_earned},
             {"points_possible", result.points_possible},
             {"output_diff", result.output_diff},
             {"similarity_score", result.similarity_score ? json(*result.similarity_score) : json(nullptr)},
             {"created_at", format_timestamp(result.created_at)}};
}

void from_json(const json &j, test_result &result) {
    j.at("id").get_to(result.id);
    j.at("execution_id").get_to(result.execution_id);
    j.at("test_case_id").get_to(result.test_case_id);
    result.status = parse_test_status(j.at("status").get<string>());
    assign_optional(j, result.actual_output, "actual_output");
    assign_optional(j, result.error_message, "error_message");
    assign_optional(j, result.execution_time, "execution_time");
    assign_optional(j, result.memory_used, "memory_used");
    assign_optional(j, result.points_earned, "points_earned");
    assign_optional(j, result.points_possible, "points_possible");
    assign_optional(j, result.output_diff, "output_diff");
    assign_optional(j, result.similarity_score, "similarity_score");
    result.created_at = parse_timestamp(j.at("created_at").get<string>());
}

void to_json(json &j, const test_summary &summary) {
    j = json{{"total", summary.total},
             {"passed", summary.passed},
             {"failed", summary.failed},
             {"errored", summary.errored},
             {"skipped", summary.skipped},
             {"points_earned", summary.points_earned},
             {"points_possible", summary.points_possible},
             {"score", summary.score}};
}

}  // namespace coderun
