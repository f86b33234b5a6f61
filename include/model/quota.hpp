#pragma once

#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include "common/status.hpp"
#include "common/utils.hpp"

namespace coderun {

/**
 * @brief 用户的执行配额，(user_id, type) 唯一
 * 每次成功预留后都满足 executions_used <= max_executions
 */
struct execution_quota {
    std::string id;
    std::string user_id;
    quota_type type = quota_type::DAILY;

    int max_executions = 100;

    /**
     * @brief 累计执行时间上限，单位为秒
     */
    int max_execution_time = 3600;

    /**
     * @brief 累计内存用量上限，单位为 MB
     */
    int max_memory_usage = 1024;

    int executions_used = 0;
    double execution_time_used = 0;
    int memory_usage_used = 0;

    timestamp last_reset;

    /**
     * @brief 下一次重置的时间，total 配额永不重置，因此为空
     */
    std::optional<timestamp> next_reset;

    bool is_active = true;
    bool is_exceeded = false;

    /**
     * @brief 是否到了重置时间
     */
    bool is_reset_due(const timestamp &now) const;

    /**
     * @brief 能否再容纳一次执行
     */
    bool admits_one_more() const;

    /**
     * @brief 清零用量并计算下一次重置时间，重复调用结果相同
     */
    void reset(const timestamp &now);

    /**
     * @brief 从 from 开始计算重置周期，daily 为一天，monthly 为 30 天，total 不重置
     */
    void schedule_from(const timestamp &from);
};

void to_json(nlohmann::json &j, const execution_quota &quota);
void from_json(const nlohmann::json &j, execution_quota &quota);

}  // namespace coderun
