#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace coderun {

/**
 * @brief 绑定挂载，把宿主机的文件夹挂载到容器中
 */
struct bind_mount {
    std::filesystem::path source;
    std::string target;
    bool read_only = true;
};

/**
 * @brief 创建容器所需的全部隔离参数
 */
struct container_spec {
    std::string image;

    /**
     * @brief 容器的启动命令，第一个元素为可执行文件
     */
    std::vector<std::string> command;

    std::string user;
    std::string working_dir;
    std::map<std::string, std::string> env;

    std::vector<bind_mount> mounts;

    /**
     * @brief tmpfs 挂载点到挂载选项的映射，比如 "/tmp" -> "rw,nosuid,size=10m"
     */
    std::map<std::string, std::string> tmpfs;

    /**
     * @brief 内存限制，单位为字节
     */
    int64_t memory_bytes = 0;

    /**
     * @brief 内存加交换空间的限制，和 memory_bytes 相等时禁止使用交换空间
     */
    int64_t memory_swap_bytes = 0;

    /**
     * @brief CFS 调度周期和配额，单位为微秒
     */
    int64_t cpu_period = 100000;
    int64_t cpu_quota = 0;

    int64_t pids_limit = 0;

    bool read_only_rootfs = true;
    bool network_disabled = true;

    std::vector<std::string> cap_drop;
    std::vector<std::string> security_opt;

    /**
     * @brief 容器日志文件的大小上限，单位为字节，为 0 时不限制
     * 超出上限后较早的日志会被丢弃，防止用户程序无限输出占满磁盘
     */
    int64_t log_max_bytes = 0;

    /**
     * @brief 容器标签，用于识别执行引擎创建的容器
     */
    std::map<std::string, std::string> labels;
};

/**
 * @brief 容器的运行状态
 */
struct container_state {
    bool running = false;
    int exit_code = 0;

    /**
     * @brief 是否因为内存超限被 OOM killer 杀死
     */
    bool oom_killed = false;

    /**
     * @brief 容器运行时报告的错误信息
     */
    std::string error;

    /**
     * @brief 容器运行时报告的隔离违规，比如被 seccomp 拦截的系统调用
     */
    std::vector<std::string> violations;

    /**
     * @brief 被拦截的操作类别，比如 "syscall"
     */
    std::vector<std::string> blocked_operations;
};

/**
 * @brief 容器的资源使用统计
 */
struct container_stats {
    /**
     * @brief 内存峰值，单位为字节
     */
    int64_t peak_memory_bytes = 0;

    /**
     * @brief 累计 CPU 时间，单位为秒
     */
    double cpu_seconds = 0;
};

struct container_logs {
    std::string stdout_output;
    std::string stderr_output;
};

/**
 * @brief 容器运行时接口
 * 生产环境使用 docker_runtime，测试中使用脚本化的假实现。
 * 所有方法在容器运行时返回错误时抛出 container_error。
 * 实现必须是线程安全的，多个 worker 会同时调用同一个实例。
 */
struct container_runtime {
    virtual ~container_runtime();

    /**
     * @brief 创建容器但不启动
     * @return 容器 id
     */
    virtual std::string create(const container_spec &spec) = 0;

    virtual void start(const std::string &id) = 0;

    /**
     * @brief 等待容器结束
     * @param timeout 最长等待时间
     * @return 容器结束后的状态，超时返回空
     */
    virtual std::optional<container_state> wait(const std::string &id, std::chrono::milliseconds timeout) = 0;

    virtual container_logs logs(const std::string &id) = 0;

    virtual container_stats stats(const std::string &id) = 0;

    virtual container_state inspect(const std::string &id) = 0;

    /**
     * @brief 立即杀死容器内的所有进程
     * 容器已经停止时什么也不做
     */
    virtual void kill(const std::string &id) = 0;

    /**
     * @brief 停止容器，宽限期过后强制杀死
     * 容器已经停止时什么也不做
     */
    virtual void stop(const std::string &id, std::chrono::seconds grace) = 0;

    /**
     * @brief 删除容器，容器不存在时什么也不做
     */
    virtual void remove(const std::string &id) = 0;
};

}  // namespace coderun
