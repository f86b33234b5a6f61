#include "test/fixtures.hpp"
#include <glog/logging.h>
#include <boost/algorithm/string/predicate.hpp>
#include <filesystem>
#include <regex>
#include "common/utils.hpp"
#include "config.hpp"

namespace coderun::test {
using namespace std;

void setup_test_environment() {
    if (getenv("DEBUG")) coderun::DEBUG = true;

    coderun::RUN_DIR = filesystem::path("/tmp/coderun-test/run");
    filesystem::create_directories(coderun::RUN_DIR);
    CHECK(filesystem::is_directory(coderun::RUN_DIR))
        << "Run directory " << coderun::RUN_DIR << " does not exist";
    coderun::WAIT_SLICE = chrono::milliseconds(20);
    coderun::STOP_GRACE_PERIOD = chrono::seconds(0);
    coderun::WORKER_NODE = "test-node";
}

execution_environment python_environment() {
    execution_environment env;
    env.id = "env-python-311";
    env.name = "Python 3.11";
    env.language = "python";
    env.version = "3.11";
    env.image = "python:3.11-alpine";
    env.file_extension = ".py";
    env.interpreter_command = "python";
    env.policy.blocked_imports = {"os", "subprocess", "socket"};
    env.policy.blocked_functions = {"eval", "exec"};
    env.is_default = true;
    env.created_at = env.updated_at = chrono::system_clock::now();
    return env;
}

execution_environment cpp_environment() {
    execution_environment env;
    env.id = "env-cpp-11";
    env.name = "C++ GCC 11";
    env.language = "cpp";
    env.version = "11";
    env.image = "gcc:11";
    env.file_extension = ".cpp";
    env.compiler_command = "g++ -O2 -std=c++17";
    env.max_memory = 256;
    env.max_cpu_time = 5;
    env.policy.blocked_imports = {"sys/socket.h"};
    env.policy.blocked_functions = {"system", "fork"};
    env.created_at = env.updated_at = chrono::system_clock::now();
    return env;
}

fake_program fake_python(const fake_invocation &in) {
    static regex print_literal(R"(print\("([^"]*)"\))");
    fake_program program;
    // 真实的解释器启动也需要时间，stats 可以在这段时间内采样到内存用量
    program.duration = chrono::milliseconds(50);
    smatch matches;
    if (boost::contains(in.source_code, "while True")) {
        program.hangs = true;
        if (regex_search(in.source_code, matches, print_literal))
            program.stdout_output = matches[1].str() + "\n";
    } else if (boost::contains(in.source_code, "ALLOCATE_FOREVER")) {
        program.oom_killed = true;
        program.exit_code = 137;
        program.peak_memory_bytes = 128ll * 1024 * 1024;
    } else if (boost::contains(in.source_code, "FORBIDDEN_SYSCALL")) {
        program.exit_code = 159;
        program.violations = {"blocked system call (killed by SIGSYS)"};
        program.blocked_operations = {"syscall"};
    } else if (boost::contains(in.source_code, "raise")) {
        program.exit_code = 1;
        program.stderr_output = "Traceback (most recent call last):\nValueError\n";
    } else if (boost::contains(in.source_code, "print(input())")) {
        program.stdout_output = in.stdin_input;
    } else if (regex_search(in.source_code, matches, print_literal)) {
        program.stdout_output = matches[1].str() + "\n";
    }
    if (boost::contains(in.source_code, "time.sleep")) program.duration = chrono::milliseconds(150);
    return program;
}

execution_quota make_quota(const string &user_id, quota_type type, int max_executions) {
    execution_quota quota;
    quota.id = generate_id();
    quota.user_id = user_id;
    quota.type = type;
    quota.max_executions = max_executions;
    return quota;
}

}  // namespace coderun::test
