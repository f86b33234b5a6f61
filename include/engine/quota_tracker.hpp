#pragma once

#include <functional>
#include <string>
#include <vector>
#include "common/error.hpp"
#include "common/utils.hpp"
#include "model/quota.hpp"
#include "store/result_store.hpp"

namespace coderun {

/**
 * @brief 用户执行配额的检查、预留、用量提交和重置
 * 配额数据保存在 result_store 中，每次修改都是 result_store::update_quotas 中的一个事务，
 * 因此多个 worker（甚至多个执行节点）并发预留时不会超出上限。
 */
struct quota_tracker {
    using clock_fn = std::function<timestamp()>;

    /**
     * @param store 保存配额的存储
     * @param clock 返回当前时间，测试中可以替换为固定时间
     */
    explicit quota_tracker(result_store &store, clock_fn clock = default_clock);

    /**
     * @brief 为用户预留一次执行
     * 在一个事务中检查用户所有 active 的配额，全部允许时全部计数加一，否则都不变。
     * 到期的配额会先被重置。没有任何配额的用户不受限制。
     * @return 成功返回 ok，被拒绝时返回 QUOTA_EXCEEDED，并且超出的配额被标记为 is_exceeded
     */
    result<ok_t> check_and_reserve(const std::string &user_id);

    /**
     * @brief 执行结束后提交资源用量
     * 累加到用户所有 active 的配额上，用量达到上限时标记 is_exceeded
     * @param seconds 执行时间，单位为秒
     * @param memory_mb 内存用量，单位为 MB
     */
    void commit_usage(const std::string &user_id, double seconds, int memory_mb);

    /**
     * @brief 撤销一次 check_and_reserve 预留的执行次数
     * 用于预留成功之后执行记录却没能创建的情况，已用次数不会小于 0
     */
    void release(const std::string &user_id);

    /**
     * @brief 重置用户的某一种配额，配额不存在时什么也不做
     */
    void reset(const std::string &user_id, quota_type type);

    /**
     * @brief 重置所有到期的配额，由定时任务调用
     * @return 被重置的配额数量
     */
    std::size_t reset_due(const timestamp &now);

    /**
     * @brief 新增或替换配额，从当前时间开始计算重置周期，已有的用量保持不变
     */
    void assign(execution_quota quota);

    std::vector<execution_quota> quotas_of(const std::string &user_id);

    static timestamp default_clock();

private:
    result_store &store;
    clock_fn clock;
};

}  // namespace coderun
