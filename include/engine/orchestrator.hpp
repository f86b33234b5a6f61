#pragma once

#include <atomic>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include "common/error.hpp"
#include "engine/environment_registry.hpp"
#include "engine/quota_tracker.hpp"
#include "engine/sandbox_launcher.hpp"
#include "model/execution.hpp"
#include "store/result_store.hpp"

namespace coderun {

/**
 * @brief 执行编排器，驱动一次执行的状态机
 * QUEUED → RUNNING → {COMPLETED, FAILED, TIMEOUT, MEMORY_LIMIT, SECURITY_VIOLATION, CANCELLED}
 *
 * submit 检查运行环境和配额并创建 QUEUED 的执行记录；run 在当前线程中启动沙箱，
 * 等待沙箱结束或者超时，记录结果，回收沙箱，最后提交配额用量。
 * run 只阻塞调用它的线程，多个 worker 可以同时调用同一个编排器。
 */
struct execution_orchestrator {
    execution_orchestrator(environment_registry &registry, quota_tracker &quotas, sandbox_launcher &launcher, result_store &store);

    /**
     * @brief 接受一个执行请求
     * version 为空时使用语言的默认运行环境
     * @return QUEUED 状态的执行记录，已经保存到 result_store 中；
     * 运行环境不存在或者不可用时返回 INVALID_ENVIRONMENT，配额不足时返回 QUOTA_EXCEEDED，
     * 这两种情况都不会产生执行记录
     */
    result<code_execution> submit(const execution_request &request);

    /**
     * @brief 执行一个 QUEUED 的执行记录，直到进入终止状态
     * 不会抛出异常，调用方总能拿到一个终止状态的执行记录。
     * 无论执行结果如何，沙箱都会被回收，配额用量都会被提交。
     */
    code_execution run(code_execution execution) noexcept;

    /**
     * @brief submit 之后立即 run
     */
    result<code_execution> execute(const execution_request &request);

    /**
     * @brief 取消一个 QUEUED 或者 RUNNING 的执行
     * QUEUED 的执行开始运行时会直接进入 CANCELLED；RUNNING 的执行会在下一次检查取消标记时
     * 强制停止沙箱并进入 CANCELLED
     * @return 执行不存在或者已经结束时返回 false
     */
    bool cancel(const std::string &execution_id);

private:
    environment_registry &registry;
    quota_tracker &quotas;
    sandbox_launcher &launcher;
    result_store &store;

    std::mutex cancel_mut;
    std::map<std::string, std::shared_ptr<std::atomic<bool>>> cancel_flags;

    std::shared_ptr<std::atomic<bool>> cancel_flag_of(const std::string &execution_id);
    void forget(const std::string &execution_id);

    /**
     * @brief 启动沙箱并等待结果，把结果写入 execution
     * 这里可能抛出异常，由 run 转换为 FAILED
     */
    void run_sandbox(code_execution &execution, const std::atomic<bool> &cancelled);

    /**
     * @brief 保存执行记录，失败时只记录日志
     */
    void persist(const code_execution &execution) noexcept;
};

}  // namespace coderun
