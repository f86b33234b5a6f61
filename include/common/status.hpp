#pragma once

#include <string>

namespace coderun {

/**
 * @brief 一次代码执行的状态
 * 状态机：QUEUED → RUNNING → {COMPLETED, FAILED, TIMEOUT, MEMORY_LIMIT, SECURITY_VIOLATION, CANCELLED}
 * 另外 QUEUED 可以直接转移到 CANCELLED。右侧的状态都是终止状态。
 */
enum class execution_status {
    /**
     * @brief 执行请求已经通过配额检查，正在等待空闲的 worker
     */
    QUEUED = 0,

    /**
     * @brief 沙箱已经创建，用户程序正在运行
     */
    RUNNING = 1,

    /**
     * @brief 用户程序在时限内运行结束
     * 注意退出码可能不为 0，COMPLETED 只表示沙箱正常结束
     */
    COMPLETED = 2,

    /**
     * @brief 沙箱无法创建或者执行引擎内部出错
     * 诊断信息保存在 stderr 中
     */
    FAILED = 3,

    /**
     * @brief 用户程序运行时间超出限制，沙箱被强制停止
     */
    TIMEOUT = 4,

    /**
     * @brief 用户程序内存超限，被容器运行时 OOM kill
     */
    MEMORY_LIMIT = 5,

    /**
     * @brief 用户代码违反了运行环境的安全策略
     * 比如导入了被禁止的模块、调用了被禁止的函数、或者触发了被禁止的系统调用
     */
    SECURITY_VIOLATION = 6,

    /**
     * @brief 执行被调用方取消
     */
    CANCELLED = 7
};

/**
 * @brief 执行的来源类型
 */
enum class execution_kind {
    EXERCISE = 0,    // 练习题提交
    PLAYGROUND = 1,  // 代码游乐场
    TEST = 2,        // 测试用例派生出来的执行
    DEBUG_RUN = 3,   // 调试会话
    DEMO = 4         // 演示代码
};

/**
 * @brief 运行环境的生命周期状态，只有 ACTIVE 的运行环境可以接受执行请求
 */
enum class environment_status {
    ACTIVE = 0,
    MAINTENANCE = 1,
    DEPRECATED = 2,
    DISABLED = 3
};

/**
 * @brief 一个测试用例的评测结果
 */
enum class test_status {
    PASSED = 0,
    FAILED = 1,
    ERROR = 2,
    TIMEOUT = 3,
    MEMORY_EXCEEDED = 4,
    SKIPPED = 5
};

/**
 * @brief 配额类型，每个用户每种类型至多一个配额
 */
enum class quota_type {
    DAILY = 0,
    MONTHLY = 1,
    TOTAL = 2
};

enum class test_type {
    UNIT = 0,
    INTEGRATION = 1,
    INPUT_OUTPUT = 2,
    PERFORMANCE = 3,
    MEMORY = 4,
    CUSTOM = 5
};

/**
 * @brief 是否为终止状态，终止状态的执行记录不会再被修改
 */
bool is_terminal(execution_status status);

/**
 * 以下函数返回序列化使用的小写标识，比如 execution_status::MEMORY_LIMIT 对应 "memory_limit"
 */
const char *to_string(execution_status status);
const char *to_string(execution_kind kind);
const char *to_string(environment_status status);
const char *to_string(test_status status);
const char *to_string(quota_type type);
const char *to_string(test_type type);

/**
 * 以下函数解析 to_string 生成的标识
 * @throw std::invalid_argument 无法识别的标识
 */
execution_status parse_execution_status(const std::string &text);
execution_kind parse_execution_kind(const std::string &text);
environment_status parse_environment_status(const std::string &text);
test_status parse_test_status(const std::string &text);
quota_type parse_quota_type(const std::string &text);
test_type parse_test_type(const std::string &text);

/**
 * @brief 返回给用户看的状态描述
 */
const char *get_display_message(execution_status status);
const char *get_display_message(test_status status);

}  // namespace coderun
