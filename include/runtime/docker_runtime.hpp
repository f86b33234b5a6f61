#pragma once

#include <initializer_list>
#include <nlohmann/json.hpp>
#include <string>
#include "runtime/container_runtime.hpp"

namespace coderun {

/**
 * @brief seccomp 拦截系统调用时进程被 SIGSYS 杀死，容器的退出码为 128 + 31
 */
constexpr int SIGSYS_EXIT_CODE = 159;

/**
 * @brief 通过 unix socket 调用 Docker Engine API 的容器运行时
 * 每次请求都使用独立的 CURL easy handle，因此可以被多个线程同时调用。
 * 调用前需要在 main 中执行 curl_global_init。
 */
struct docker_runtime : public container_runtime {
    /**
     * @param socket_path Docker Engine 的 unix socket 路径
     * @param api_version API 版本前缀，比如 v1.41，为空时不带版本前缀
     */
    docker_runtime(const std::string &socket_path, const std::string &api_version);

    std::string create(const container_spec &spec) override;
    void start(const std::string &id) override;
    std::optional<container_state> wait(const std::string &id, std::chrono::milliseconds timeout) override;
    container_logs logs(const std::string &id) override;
    container_stats stats(const std::string &id) override;
    container_state inspect(const std::string &id) override;
    void kill(const std::string &id) override;
    void stop(const std::string &id, std::chrono::seconds grace) override;
    void remove(const std::string &id) override;

private:
    struct http_response {
        long status = 0;
        std::string body;

        /**
         * @brief 是否因为超过 timeout 而中断
         */
        bool timed_out = false;
    };

    std::string socket_path;
    std::string api_version;

    /**
     * @param timeout 为 0 时不限制请求时间
     */
    http_response request(const std::string &method, const std::string &path,
                          const std::string &body = "",
                          std::chrono::milliseconds timeout = std::chrono::milliseconds(0));

    /**
     * @brief 状态码不是 2xx 也不在 accepted 中时抛出 container_error
     */
    void expect(const http_response &response, const std::string &what,
                std::initializer_list<long> accepted = {});
};

/**
 * @brief 生成 POST /containers/create 的请求体
 */
nlohmann::json build_create_body(const container_spec &spec);

/**
 * @brief 拆分 Docker 的多路复用日志流
 * 没有分配 TTY 时，日志流由若干帧组成，每帧以 8 字节的帧头开始：
 * 第 1 个字节为流类型（1 为 stdout，2 为 stderr），第 5~8 字节为大端序的帧长度
 */
container_logs demultiplex_logs(const std::string &raw);

/**
 * @brief 解析 GET /containers/{id}/stats?stream=false 的结果
 * cgroup v1 下使用 memory_stats.max_usage，cgroup v2 没有峰值统计时退化为 memory_stats.usage
 */
container_stats parse_stats(const nlohmann::json &stats);

/**
 * @brief 解析 GET /containers/{id}/json 的结果
 * 退出码为 SIGSYS_EXIT_CODE 时记录一条被拦截系统调用的隔离违规
 */
container_state parse_inspect(const nlohmann::json &inspect);

}  // namespace coderun
