#pragma once

#include <chrono>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include "common/error.hpp"
#include "model/environment.hpp"
#include "runtime/container_runtime.hpp"

namespace coderun {

/**
 * @brief 启动一个沙箱所需的参数
 */
struct sandbox_options {
    /**
     * @brief 所属执行记录的 id，会作为容器标签记录下来
     */
    std::string execution_id;

    std::string source_code;

    /**
     * @brief 标准输入，为空时用户程序的标准输入重定向到 /dev/null
     */
    std::string stdin_input;

    std::vector<std::string> arguments;

    /**
     * @brief 执行时限，通过 TIMEOUT 环境变量告知沙箱
     */
    std::chrono::milliseconds timeout{0};

    /**
     * @brief 内存限制，单位为 MB，为空时使用运行环境的 max_memory，超过 max_memory 时按 max_memory 处理
     */
    std::optional<int> memory_limit;
};

/**
 * @brief 一个已经启动的沙箱
 * 沙箱对象持有容器和工作区，析构时会调用 release 回收两者
 */
struct sandbox {
    sandbox(container_runtime &runtime, std::string container_id, std::filesystem::path workspace);
    ~sandbox();

    sandbox(const sandbox &) = delete;
    sandbox &operator=(const sandbox &) = delete;

    const std::string &id() const;
    const std::filesystem::path &workspace() const;

    void start();

    /**
     * @brief 等待沙箱结束
     * @return 沙箱结束后的状态，超时返回空
     */
    std::optional<container_state> wait(std::chrono::milliseconds timeout);

    container_logs logs();
    container_stats stats();

    /**
     * @brief 立即强制停止沙箱内的用户程序
     */
    void kill();

    void stop(std::chrono::seconds grace);
    void remove();

    /**
     * @brief 停止并删除容器，删除工作区
     * 失败时只记录日志，可以重复调用
     */
    void release() noexcept;

private:
    container_runtime &runtime;
    std::string container_id;
    std::filesystem::path workspace_dir;
    bool released = false;
};

/**
 * @brief 根据运行环境生成在沙箱中执行的 shell 命令
 * 1. 有解释器：<interpreter> /workspace/main<ext> [args]
 * 2. 有编译器：<compiler> /workspace/main<ext> -o /tmp/main && /tmp/main [args]
 *    编译错误会输出到 stderr，并且退出码不为 0
 * 3. 都没有：直接执行 /workspace/main<ext> [args]
 * 用户程序的标准输入重定向到 /workspace/stdin.txt 或者 /dev/null
 */
std::string build_command(const execution_environment &env, const std::vector<std::string> &arguments, bool has_stdin);

/**
 * @brief 生成沙箱的隔离参数
 * 只读根文件系统；工作区只读挂载到 /workspace；/tmp 为大小受 max_file_size 限制的 tmpfs；
 * 内存和交换空间都限制为内存上限；CPU quota 为 max_cpu_time × 1000 微秒（至少 1000）；
 * 去掉所有 capability；no-new-privileges；除非运行环境支持网络否则禁用网络；
 * 以非特权用户运行；限制进程数。
 */
container_spec build_container_spec(const execution_environment &env, const sandbox_options &options,
                                    const std::filesystem::path &workspace);

/**
 * @brief 沙箱启动器，负责检查安全策略、准备工作区、创建并启动容器
 */
struct sandbox_launcher {
    explicit sandbox_launcher(container_runtime &runtime);

    /**
     * @brief 启动一个沙箱
     * @return 已经启动的沙箱。源代码违反安全策略时返回 SECURITY_VIOLATION，此时不会创建容器；
     * 工作区或者容器无法创建、启动时返回 SANDBOX_LAUNCH_FAILURE
     */
    result<std::unique_ptr<sandbox>> launch(const execution_environment &env, const sandbox_options &options);

private:
    container_runtime &runtime;
};

}  // namespace coderun
