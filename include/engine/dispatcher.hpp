#pragma once

#include <atomic>
#include <functional>
#include <thread>
#include <vector>
#include "common/concurrent_queue.hpp"
#include "engine/orchestrator.hpp"

namespace coderun {

/**
 * @brief 执行分发器，固定数量的 worker 线程从队列中取出 QUEUED 的执行并运行
 * worker 数量就是同时运行的沙箱数量上限，超出上限的执行在队列中等待。
 */
struct execution_dispatcher {
    /**
     * @brief 执行进入终止状态后的回调，在 worker 线程中调用
     */
    using completion_callback = std::function<void(const code_execution &)>;

    execution_dispatcher(execution_orchestrator &orchestrator, std::size_t worker_count);

    /**
     * @brief 停止并等待所有 worker 退出
     */
    ~execution_dispatcher();

    execution_dispatcher(const execution_dispatcher &) = delete;
    execution_dispatcher &operator=(const execution_dispatcher &) = delete;

    /**
     * @brief 启动 worker 线程
     */
    void start();

    /**
     * @brief 接受一个执行请求并放入队列
     * @param callback 执行结束后的回调
     * @return QUEUED 的执行记录，或者 submit 返回的错误
     */
    result<code_execution> submit(const execution_request &request, completion_callback callback = {});

    /**
     * @brief 停止接受新的执行，等待队列中已有的执行全部完成后 worker 退出
     * 可以重复调用
     */
    void stop();

    /**
     * @brief 队列中等待运行的执行数量
     */
    std::size_t pending() const;

private:
    struct job {
        code_execution execution;
        completion_callback callback;
    };

    execution_orchestrator &orchestrator;
    std::size_t worker_count;
    concurrent_queue<job> queue;
    std::vector<std::thread> workers;
    std::atomic<bool> stopping{false};

    void worker_loop(std::size_t worker_id);
};

}  // namespace coderun
