#include "common/status.hpp"
#include <boost/assign.hpp>
#include <stdexcept>
#include <unordered_map>

namespace coderun {
using namespace std;

// clang-format off
static const unordered_map<execution_status, const char *> execution_status_string = boost::assign::map_list_of
    (execution_status::QUEUED, "queued")
    (execution_status::RUNNING, "running")
    (execution_status::COMPLETED, "completed")
    (execution_status::FAILED, "failed")
    (execution_status::TIMEOUT, "timeout")
    (execution_status::MEMORY_LIMIT, "memory_limit")
    (execution_status::SECURITY_VIOLATION, "security_violation")
    (execution_status::CANCELLED, "cancelled");

static const unordered_map<execution_status, const char *> execution_status_display = boost::assign::map_list_of
    (execution_status::QUEUED, "Queued")
    (execution_status::RUNNING, "Running")
    (execution_status::COMPLETED, "Completed")
    (execution_status::FAILED, "Failed")
    (execution_status::TIMEOUT, "Timeout")
    (execution_status::MEMORY_LIMIT, "Memory Limit Exceeded")
    (execution_status::SECURITY_VIOLATION, "Security Violation")
    (execution_status::CANCELLED, "Cancelled");

static const unordered_map<execution_kind, const char *> execution_kind_string = boost::assign::map_list_of
    (execution_kind::EXERCISE, "exercise")
    (execution_kind::PLAYGROUND, "playground")
    (execution_kind::TEST, "test")
    (execution_kind::DEBUG_RUN, "debug")
    (execution_kind::DEMO, "demo");

static const unordered_map<environment_status, const char *> environment_status_string = boost::assign::map_list_of
    (environment_status::ACTIVE, "active")
    (environment_status::MAINTENANCE, "maintenance")
    (environment_status::DEPRECATED, "deprecated")
    (environment_status::DISABLED, "disabled");

static const unordered_map<test_status, const char *> test_status_string = boost::assign::map_list_of
    (test_status::PASSED, "passed")
    (test_status::FAILED, "failed")
    (test_status::ERROR, "error")
    (test_status::TIMEOUT, "timeout")
    (test_status::MEMORY_EXCEEDED, "memory_exceeded")
    (test_status::SKIPPED, "skipped");

static const unordered_map<test_status, const char *> test_status_display = boost::assign::map_list_of
    (test_status::PASSED, "Passed")
    (test_status::FAILED, "Failed")
    (test_status::ERROR, "Error")
    (test_status::TIMEOUT, "Timeout")
    (test_status::MEMORY_EXCEEDED, "Memory Exceeded")
    (test_status::SKIPPED, "Skipped");

static const unordered_map<quota_type, const char *> quota_type_string = boost::assign::map_list_of
    (quota_type::DAILY, "daily")
    (quota_type::MONTHLY, "monthly")
    (quota_type::TOTAL, "total");

static const unordered_map<test_type, const char *> test_type_string = boost::assign::map_list_of
    (test_type::UNIT, "unit")
    (test_type::INTEGRATION, "integration")
    (test_type::INPUT_OUTPUT, "input_output")
    (test_type::PERFORMANCE, "performance")
    (test_type::MEMORY, "memory")
    (test_type::CUSTOM, "custom");
// clang-format on

/**
 * @brief 在 to_string 的映射表中反查枚举值
 */
template <typename EnumT>
static EnumT parse_enum(const unordered_map<EnumT, const char *> &table, const string &text, const char *what) {
    for (auto &[value, name] : table)
        if (text == name) return value;
    throw invalid_argument(string("unrecognized ") + what + " " + text);
}

bool is_terminal(execution_status status) {
    return status != execution_status::QUEUED && status != execution_status::RUNNING;
}

const char *to_string(execution_status status) {
    return execution_status_string.at(status);
}

const char *to_string(execution_kind kind) {
    return execution_kind_string.at(kind);
}

const char *to_string(environment_status status) {
    return environment_status_string.at(status);
}

const char *to_string(test_status status) {
    return test_status_string.at(status);
}

const char *to_string(quota_type type) {
    return quota_type_string.at(type);
}

const char *to_string(test_type type) {
    return test_type_string.at(type);
}

execution_status parse_execution_status(const string &text) {
    return parse_enum(execution_status_string, text, "execution status");
}

execution_kind parse_execution_kind(const string &text) {
    return parse_enum(execution_kind_string, text, "execution kind");
}

environment_status parse_environment_status(const string &text) {
    return parse_enum(environment_status_string, text, "environment status");
}

test_status parse_test_status(const string &text) {
    return parse_enum(test_status_string, text, "test status");
}

quota_type parse_quota_type(const string &text) {
    return parse_enum(quota_type_string, text, "quota type");
}

test_type parse_test_type(const string &text) {
    return parse_enum(test_type_string, text, "test type");
}

const char *get_display_message(execution_status status) {
    return execution_status_display.at(status);
}

const char *get_display_message(test_status status) {
    return test_status_display.at(status);
}

}  // namespace coderun
