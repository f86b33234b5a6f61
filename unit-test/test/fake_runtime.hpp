#pragma once

#include <chrono>
#include <functional>
#include <map>
#include <mutex>
#include <string>
#include <vector>
#include "runtime/container_runtime.hpp"

namespace coderun::test {

/**
 * @brief 假容器中“用户程序”看到的输入
 * 在 create 时从工作区中读取，和真实沙箱看到的文件相同
 */
struct fake_invocation {
    container_spec spec;
    std::string source_code;
    std::string stdin_input;
};

/**
 * @brief 假容器中“用户程序”的行为
 */
struct fake_program {
    std::string stdout_output;
    std::string stderr_output;
    int exit_code = 0;
    bool oom_killed = false;
    std::vector<std::string> violations;
    std::vector<std::string> blocked_operations;

    /**
     * @brief 程序从启动到退出经过的时间
     */
    std::chrono::milliseconds duration{0};

    /**
     * @brief 死循环，直到被 kill 或者 stop 才会结束
     */
    bool hangs = false;

    /**
     * @brief 运行期间 stats 报告的内存用量，和 Docker 一样，容器退出后只报告 0
     */
    int64_t peak_memory_bytes = 16 * 1024 * 1024;
    double cpu_seconds = 0.01;
};

/**
 * 脚本化的容器运行时
 * 用法：
 * 1. fake_runtime runtime([](const fake_invocation &in) { fake_program p; ...; return p; });
 * 2. 把 runtime 传给 sandbox_launcher
 * 3. 通过 live_count、created_specs 检查沙箱是否被回收、隔离参数是否正确
 *
 * wait 会真实地阻塞，超时语义和 docker_runtime 相同。
 */
struct fake_runtime : public container_runtime {
    using behaviour = std::function<fake_program(const fake_invocation &)>;

    explicit fake_runtime(behaviour program);

    std::string create(const container_spec &spec) override;
    void start(const std::string &id) override;
    std::optional<container_state> wait(const std::string &id, std::chrono::milliseconds timeout) override;
    container_logs logs(const std::string &id) override;
    container_stats stats(const std::string &id) override;
    container_state inspect(const std::string &id) override;
    void kill(const std::string &id) override;
    void stop(const std::string &id, std::chrono::seconds grace) override;
    void remove(const std::string &id) override;

    /**
     * @brief 已经创建但还没有删除的容器数量
     */
    std::size_t live_count() const;

    std::size_t created_count() const;

    std::vector<container_spec> created_specs() const;

    /**
     * @brief 被 kill 过的容器数量
     */
    std::size_t killed_count() const;

    /**
     * @brief 让之后对应的调用抛出 container_error
     * fail_remove 时容器不会被删除，仍然计入 live_count
     */
    bool fail_create = false;
    bool fail_start = false;
    bool fail_wait = false;
    bool fail_stop = false;
    bool fail_remove = false;

private:
    struct container {
        fake_invocation invocation;
        fake_program program;
        bool started = false;
        bool killed = false;
        std::chrono::steady_clock::time_point started_at;
    };

    behaviour program;
    mutable std::mutex mut;
    std::map<std::string, container> containers;
    std::vector<container_spec> specs;
    std::size_t next_id = 0;
    std::size_t kills = 0;

    container &get(const std::string &id);
    container_state state_of(const container &c) const;
};

}  // namespace coderun::test
