#pragma once

#include <chrono>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>
#include "common/status.hpp"
#include "common/utils.hpp"

namespace coderun {

/**
 * @brief 一次代码执行的请求
 * 请求已经由上层服务完成身份验证和参数校验，执行引擎只检查运行环境和配额
 */
struct execution_request {
    std::string user_id;

    /**
     * @brief 语言和版本，用于在 environment_registry 中查找运行环境
     */
    std::string language;
    std::string version;

    std::string source_code;

    /**
     * @brief 标准输入，为空时用户程序的标准输入为空
     */
    std::string stdin_input;

    /**
     * @brief 传递给用户程序的命令行参数
     */
    std::vector<std::string> arguments;

    execution_kind kind = execution_kind::PLAYGROUND;

    std::optional<std::string> exercise_id;
    std::optional<std::string> test_case_id;
    std::optional<std::string> session_id;

    /**
     * @brief 覆盖运行环境的默认时限
     */
    std::optional<std::chrono::milliseconds> timeout;

    /**
     * @brief 覆盖运行环境的内存限制
     * @note 单位为 MB
     */
    std::optional<int> memory_limit;
};

/**
 * @brief 一次代码执行的记录
 * 只有 orchestrator 在执行过程中会修改记录，进入终止状态后记录不再改变。
 */
struct code_execution {
    std::string id;
    std::string user_id;
    std::string environment_id;

    execution_kind kind = execution_kind::PLAYGROUND;
    execution_status status = execution_status::QUEUED;

    std::string source_code;
    std::string stdin_input;
    std::vector<std::string> arguments;

    std::string stdout_output;
    std::string stderr_output;

    std::optional<int> exit_code;

    /**
     * @brief 墙上时间
     * @note 单位为秒
     */
    std::optional<double> execution_time;

    /**
     * @brief 峰值内存
     * @note 单位为 MB
     */
    std::optional<int> memory_used;

    /**
     * @brief CPU 时间
     * @note 单位为秒
     */
    std::optional<double> cpu_time;

    /**
     * @brief 容器运行时分配的沙箱 id
     */
    std::string sandbox_id;

    /**
     * @brief 执行该记录的节点名
     */
    std::string worker_node;

    std::optional<std::string> exercise_id;
    std::optional<std::string> test_case_id;
    std::optional<std::string> session_id;

    /**
     * @brief 违反安全策略的描述，比如 "blocked import: os"
     */
    std::vector<std::string> security_violations;

    /**
     * @brief 沙箱运行时拦截的操作类别，比如 "syscall"
     * 只来自容器运行时，静态检查拒绝的执行不会启动，因此这里为空
     */
    std::vector<std::string> blocked_operations;

    /**
     * @brief 请求携带的时限和内存限制覆盖，只在执行过程中使用，不持久化
     */
    std::optional<std::chrono::milliseconds> timeout_override;
    std::optional<int> memory_override;

    timestamp created_at;
    std::optional<timestamp> started_at;
    std::optional<timestamp> completed_at;

    /**
     * @brief 正常结束且退出码为 0
     */
    bool is_successful() const;
};

void from_json(const nlohmann::json &j, execution_request &request);

void to_json(nlohmann::json &j, const code_execution &execution);
void from_json(const nlohmann::json &j, code_execution &execution);

}  // namespace coderun
