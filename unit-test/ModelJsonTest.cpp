#include <stdexcept>
#include "gtest/gtest.h"
#include "model/environment.hpp"
#include "model/execution.hpp"
#include "model/quota.hpp"
#include "model/test_case.hpp"
#include "common/error.hpp"
#include "test/assertions.hpp"

using namespace std;
using namespace coderun;
using nlohmann::json;

TEST(ModelJsonTest, ExecutionRequestTest) {
    auto request = json::parse(R"json({
        "user_id": "alice", "language": "python", "version": "3.11",
        "source_code": "print(input())", "stdin": "5", "arguments": ["-v"],
        "kind": "exercise", "exercise_id": "ex-1", "timeout_ms": 1500, "memory_limit": 64
    })json").get<execution_request>();

    EXPECT_EQ(request.user_id, "alice");
    EXPECT_EQ(request.stdin_input, "5");
    EXPECT_EQ(request.arguments, vector<string>{"-v"});
    EXPECT_EQ(request.kind, execution_kind::EXERCISE);
    EXPECT_EQ(request.exercise_id, optional<string>("ex-1"));
    EXPECT_FALSE(request.session_id);
    ASSERT_TRUE(request.timeout);
    EXPECT_EQ(request.timeout->count(), 1500);
    EXPECT_EQ(request.memory_limit, optional<int>(64));

    auto minimal = json::parse(R"({"user_id": "bob", "language": "cpp", "version": "", "source_code": ""})")
                       .get<execution_request>();
    EXPECT_EQ(minimal.kind, execution_kind::PLAYGROUND);
    EXPECT_FALSE(minimal.timeout);

    EXPECT_THROW(json::parse(R"({"user_id": "bob"})").get<execution_request>(), json::exception);
    EXPECT_THROW(json::parse(R"({"user_id": "bob", "language": "cpp", "version": "", "source_code": "", "kind": "homework"})")
                     .get<execution_request>(),
                 invalid_argument);
}

TEST(ModelJsonTest, CodeExecutionTest) {
    code_execution execution;
    execution.id = "e1";
    execution.user_id = "alice";
    execution.environment_id = "env-python-311";
    execution.kind = execution_kind::TEST;
    execution.status = execution_status::SECURITY_VIOLATION;
    execution.source_code = "import os";
    execution.stderr_output = "Security policy violation: blocked import: os";
    execution.security_violations = {"blocked import: os"};
    execution.test_case_id = "t1";
    execution.created_at = parse_timestamp("2024-03-01T08:00:00.250Z");
    execution.completed_at = parse_timestamp("2024-03-01T08:00:01Z");

    json j = execution;
    EXPECT_EQ(j["status"], "security_violation");
    EXPECT_EQ(j["kind"], "test");
    EXPECT_EQ(j["stderr"], "Security policy violation: blocked import: os");
    EXPECT_TRUE(j["exit_code"].is_null());
    EXPECT_TRUE(j["started_at"].is_null());
    EXPECT_EQ(j["created_at"], "2024-03-01T08:00:00.250Z");
    EXPECT_EQ(j["completed_at"], "2024-03-01T08:00:01.000Z");

    auto parsed = j.get<code_execution>();
    EXPECT_EQ(parsed.status, execution_status::SECURITY_VIOLATION);
    EXPECT_EQ(parsed.security_violations, execution.security_violations);
    EXPECT_EQ(parsed.created_at, execution.created_at);
    EXPECT_EQ(parsed.test_case_id, optional<string>("t1"));
    EXPECT_FALSE(parsed.exit_code);
    EXPECT_JSON_EQ(json(parsed), j);
}

TEST(ModelJsonTest, EnvironmentTest) {
    auto env = json::parse(R"({
        "language": "java", "version": "17", "docker_image": "openjdk:17-alpine",
        "file_extension": ".java", "interpreter_command": "java", "max_memory": 256,
        "allowed_imports": ["java.util"], "blocked_imports": ["java.net"], "status": "active"
    })").get<execution_environment>();

    EXPECT_EQ(env.key(), "java/17");
    EXPECT_EQ(env.id, "java/17");
    EXPECT_EQ(env.image, "openjdk:17-alpine");
    EXPECT_EQ(env.max_memory, 256);
    EXPECT_EQ(env.max_file_size, 10);
    EXPECT_TRUE(env.supports_input);
    EXPECT_FALSE(env.supports_networking);
    EXPECT_EQ(env.policy.allowed_imports, vector<string>{"java.util"});
    EXPECT_FALSE(env.is_default);

    json j = env;
    EXPECT_EQ(j["docker_image"], "openjdk:17-alpine");
    EXPECT_EQ(j["blocked_imports"], json::array({"java.net"}));
}

TEST(ModelJsonTest, QuotaTest) {
    auto total = json::parse(R"({"user_id": "alice", "quota_type": "total", "max_executions": 1000,
                                 "executions_used": 12, "last_reset": "2024-01-01T00:00:00Z"})")
                     .get<execution_quota>();
    EXPECT_EQ(total.id, "alice/total");
    EXPECT_EQ(total.type, quota_type::TOTAL);
    EXPECT_EQ(total.executions_used, 12);
    EXPECT_FALSE(total.next_reset);

    json j = total;
    EXPECT_TRUE(j["next_reset"].is_null());
    EXPECT_EQ(j["quota_type"], "total");

    auto daily = json::parse(R"({"user_id": "alice", "quota_type": "daily", "last_reset": "2024-01-01T00:00:00Z"})")
                     .get<execution_quota>();
    ASSERT_TRUE(daily.next_reset);
    EXPECT_EQ(format_timestamp(*daily.next_reset), "2024-01-02T00:00:00.000Z");
    EXPECT_EQ(daily.max_executions, 100);
}

TEST(ModelJsonTest, TestSummaryTest) {
    vector<test_result> results(5);
    results[0].status = test_status::PASSED;
    results[0].points_earned = results[0].points_possible = 2;
    results[1].status = test_status::FAILED;
    results[1].points_possible = 2;
    results[2].status = test_status::TIMEOUT;
    results[2].points_possible = 1;
    results[3].status = test_status::MEMORY_EXCEEDED;
    results[3].points_possible = 1;
    results[4].status = test_status::SKIPPED;
    results[4].points_possible = 10;

    auto summary = summarize(results);
    json j = summary;
    j.erase("score");
    EXPECT_JSON_EQ(j, json::parse(R"({
        "total": 5, "passed": 1, "failed": 1, "errored": 2, "skipped": 1,
        "points_earned": 2, "points_possible": 6
    })"));
    EXPECT_NEAR(summary.score, 100.0 / 3, 1e-9);

    auto empty = summarize({});
    EXPECT_EQ(empty.total, 0);
    EXPECT_DOUBLE_EQ(empty.score, 0);
}

TEST(ModelJsonTest, StatusStringsTest) {
    EXPECT_STREQ(to_string(execution_status::MEMORY_LIMIT), "memory_limit");
    EXPECT_EQ(parse_execution_status("cancelled"), execution_status::CANCELLED);
    EXPECT_EQ(parse_test_status("memory_exceeded"), test_status::MEMORY_EXCEEDED);
    EXPECT_THROW(parse_quota_type("weekly"), invalid_argument);
    EXPECT_STREQ(to_string(error_kind::QUOTA_EXCEEDED), "quota_exceeded");
    EXPECT_STREQ(get_display_message(execution_status::MEMORY_LIMIT), "Memory Limit Exceeded");
    EXPECT_STREQ(get_display_message(test_status::SKIPPED), "Skipped");

    EXPECT_TRUE(is_terminal(execution_status::CANCELLED));
    EXPECT_TRUE(is_terminal(execution_status::SECURITY_VIOLATION));
    EXPECT_FALSE(is_terminal(execution_status::QUEUED));
    EXPECT_FALSE(is_terminal(execution_status::RUNNING));
}
