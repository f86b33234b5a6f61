#include "common/exceptions.hpp"
#include "config.hpp"
#include "engine/sandbox_launcher.hpp"
#include "gmock/gmock.h"
#include "gtest/gtest.h"
#include "test/fake_runtime.hpp"
#include "test/fixtures.hpp"

using namespace std;
using namespace coderun;
using namespace coderun::test;
using ::testing::_;
using ::testing::ElementsAre;
using ::testing::NiceMock;
using ::testing::Return;
using ::testing::Throw;

namespace {

struct mock_runtime : public container_runtime {
    MOCK_METHOD(string, create, (const container_spec &), (override));
    MOCK_METHOD(void, start, (const string &), (override));
    MOCK_METHOD(optional<container_state>, wait, (const string &, chrono::milliseconds), (override));
    MOCK_METHOD(container_logs, logs, (const string &), (override));
    MOCK_METHOD(container_stats, stats, (const string &), (override));
    MOCK_METHOD(container_state, inspect, (const string &), (override));
    MOCK_METHOD(void, kill, (const string &), (override));
    MOCK_METHOD(void, stop, (const string &, chrono::seconds), (override));
    MOCK_METHOD(void, remove, (const string &), (override));
};

}  // namespace

TEST(SandboxLauncherTest, InterpreterCommandTest) {
    auto env = python_environment();
    EXPECT_EQ(build_command(env, {}, false), "python /workspace/main.py < /dev/null");
    EXPECT_EQ(build_command(env, {"a b", "c"}, true), "python /workspace/main.py 'a b' 'c' < /workspace/stdin.txt");
}

TEST(SandboxLauncherTest, CompilerCommandTest) {
    auto env = cpp_environment();
    EXPECT_EQ(build_command(env, {}, true),
              "g++ -O2 -std=c++17 /workspace/main.cpp -o /tmp/main && /tmp/main < /workspace/stdin.txt");

    env.compiler_command.clear();
    env.file_extension = ".sh";
    EXPECT_EQ(build_command(env, {"x"}, false), "/workspace/main.sh 'x' < /dev/null");
}

TEST(SandboxLauncherTest, ContainerSpecTest) {
    auto env = python_environment();
    sandbox_options options;
    options.execution_id = "exec-1";
    options.timeout = chrono::milliseconds(2500);

    auto spec = build_container_spec(env, options, "/tmp/ws");
    EXPECT_EQ(spec.image, "python:3.11-alpine");
    EXPECT_THAT(spec.command, ElementsAre("sh", "-c", "python /workspace/main.py < /dev/null"));
    EXPECT_EQ(spec.user, coderun::SANDBOX_USER);
    EXPECT_NE(spec.user, "root");
    EXPECT_EQ(spec.env.at("TIMEOUT"), "3");
    EXPECT_EQ(spec.env.at("MAX_MEMORY"), "128");
    ASSERT_EQ(spec.mounts.size(), 1u);
    EXPECT_EQ(spec.mounts[0].source, filesystem::path("/tmp/ws"));
    EXPECT_EQ(spec.mounts[0].target, "/workspace");
    EXPECT_TRUE(spec.mounts[0].read_only);
    EXPECT_EQ(spec.tmpfs.at("/tmp"), "rw,exec,nosuid,size=10m");
    EXPECT_EQ(spec.memory_bytes, 128ll * 1024 * 1024);
    EXPECT_EQ(spec.memory_swap_bytes, spec.memory_bytes);
    EXPECT_EQ(spec.cpu_period, 100000);
    EXPECT_EQ(spec.cpu_quota, 10000);
    EXPECT_EQ(spec.pids_limit, coderun::PIDS_LIMIT);
    EXPECT_TRUE(spec.read_only_rootfs);
    EXPECT_TRUE(spec.network_disabled);
    EXPECT_THAT(spec.cap_drop, ElementsAre("ALL"));
    EXPECT_THAT(spec.security_opt, ElementsAre("no-new-privileges"));
    EXPECT_EQ(spec.labels.at("coderun.execution"), "exec-1");
    EXPECT_EQ(spec.labels.at("coderun.environment"), "python/3.11");
    EXPECT_EQ(spec.log_max_bytes, int64_t(coderun::MAX_OUTPUT) * 2);
}

TEST(SandboxLauncherTest, MemoryOverrideAndNetworkingTest) {
    auto env = python_environment();
    env.supports_networking = true;
    env.max_cpu_time = 0;
    sandbox_options options;
    options.memory_limit = 64;
    options.timeout = chrono::seconds(1);

    auto spec = build_container_spec(env, options, "/tmp/ws");
    EXPECT_EQ(spec.memory_bytes, 64ll * 1024 * 1024);
    EXPECT_EQ(spec.env.at("MAX_MEMORY"), "64");
    EXPECT_EQ(spec.env.at("TIMEOUT"), "1");
    EXPECT_FALSE(spec.network_disabled);
    EXPECT_EQ(spec.cpu_quota, 1000);
}

TEST(SandboxLauncherTest, MemoryOverrideCappedByEnvironmentTest) {
    auto env = python_environment();
    sandbox_options options;
    options.timeout = chrono::seconds(1);

    options.memory_limit = 100000;
    auto spec = build_container_spec(env, options, "/tmp/ws");
    EXPECT_EQ(spec.memory_bytes, 128ll * 1024 * 1024);
    EXPECT_EQ(spec.env.at("MAX_MEMORY"), "128");

    options.memory_limit = 0;
    EXPECT_EQ(build_container_spec(env, options, "/tmp/ws").memory_bytes, 128ll * 1024 * 1024);
}

TEST(SandboxLauncherTest, SecurityViolationCreatesNoContainerTest) {
    mock_runtime runtime;
    EXPECT_CALL(runtime, create(_)).Times(0);
    EXPECT_CALL(runtime, start(_)).Times(0);

    sandbox_launcher launcher(runtime);
    sandbox_options options;
    options.execution_id = "exec-2";
    options.source_code = "import subprocess\nsubprocess.run(['ls'])\n";
    options.timeout = chrono::seconds(1);

    auto launched = launcher.launch(python_environment(), options);
    ASSERT_FALSE(is_ok(launched));
    EXPECT_EQ(get_error(launched).kind, error_kind::SECURITY_VIOLATION);
    EXPECT_THAT(get_error(launched).violations, ElementsAre("blocked import: subprocess"));
}

TEST(SandboxLauncherTest, CreateFailureTest) {
    NiceMock<mock_runtime> runtime;
    container_error error("no such image: python:3.11-alpine");
    error.http_status = 404;
    EXPECT_CALL(runtime, create(_)).WillOnce(Throw(error));
    EXPECT_CALL(runtime, start(_)).Times(0);

    sandbox_launcher launcher(runtime);
    sandbox_options options;
    options.source_code = "print(1)";
    auto launched = launcher.launch(python_environment(), options);
    ASSERT_FALSE(is_ok(launched));
    EXPECT_EQ(get_error(launched).kind, error_kind::SANDBOX_LAUNCH_FAILURE);
}

TEST(SandboxLauncherTest, StartFailureReleasesContainerTest) {
    NiceMock<mock_runtime> runtime;
    EXPECT_CALL(runtime, create(_)).WillOnce(Return("c-1"));
    EXPECT_CALL(runtime, start("c-1")).WillOnce(Throw(container_error("cannot start")));
    EXPECT_CALL(runtime, remove("c-1")).Times(1);

    sandbox_launcher launcher(runtime);
    sandbox_options options;
    options.source_code = "print(1)";
    auto launched = launcher.launch(python_environment(), options);
    ASSERT_FALSE(is_ok(launched));
    EXPECT_EQ(get_error(launched).kind, error_kind::SANDBOX_LAUNCH_FAILURE);
}

TEST(SandboxLauncherTest, WorkspacePreparedAndReleasedTest) {
    fake_invocation seen;
    fake_runtime runtime([&](const fake_invocation &in) {
        seen = in;
        return fake_program();
    });
    sandbox_launcher launcher(runtime);

    sandbox_options options;
    options.execution_id = "exec-3";
    options.source_code = "print(input())";
    options.stdin_input = "hello\n";
    options.timeout = chrono::seconds(1);

    auto launched = launcher.launch(python_environment(), options);
    ASSERT_TRUE(is_ok(launched));
    auto box = move(get<unique_ptr<sandbox>>(launched));
    auto workspace = box->workspace();

    EXPECT_EQ(seen.source_code, "print(input())");
    EXPECT_EQ(seen.stdin_input, "hello\n");
    EXPECT_EQ(seen.spec.command.back(), "python /workspace/main.py < /workspace/stdin.txt");
    EXPECT_TRUE(filesystem::exists(workspace / "main.py"));
    EXPECT_EQ(runtime.live_count(), 1u);

    box->release();
    EXPECT_EQ(runtime.live_count(), 0u);
    if (!coderun::DEBUG) EXPECT_FALSE(filesystem::exists(workspace));

    // 重复调用不会出错
    box->release();
}

TEST(SandboxLauncherTest, InputIgnoredWhenUnsupportedTest) {
    fake_invocation seen;
    fake_runtime runtime([&](const fake_invocation &in) {
        seen = in;
        return fake_program();
    });
    sandbox_launcher launcher(runtime);

    auto env = python_environment();
    env.supports_input = false;
    sandbox_options options;
    options.source_code = "print(1)";
    options.stdin_input = "ignored";

    auto launched = launcher.launch(env, options);
    ASSERT_TRUE(is_ok(launched));
    EXPECT_EQ(seen.stdin_input, "");
    EXPECT_EQ(seen.spec.command.back(), "python /workspace/main.py < /dev/null");
}
