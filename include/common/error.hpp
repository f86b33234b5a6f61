#pragma once

#include <string>
#include <variant>
#include <vector>

namespace coderun {

/**
 * @brief 执行引擎的错误分类
 * INVALID_ENVIRONMENT 和 QUOTA_EXCEEDED 会在创建沙箱之前直接拒绝请求，不会产生执行记录；
 * 其他错误都会被记录为执行记录的终止状态，而不是抛给调用方。
 */
enum class error_kind {
    INVALID_ENVIRONMENT,     // 语言和版本不存在，或者运行环境不是 active 状态
    QUOTA_EXCEEDED,          // 配额预留被拒绝
    SANDBOX_LAUNCH_FAILURE,  // 容器运行时无法创建或启动沙箱
    EXECUTION_TIMEOUT,       // 超出执行时限
    MEMORY_LIMIT_EXCEEDED,   // 超出内存限制
    SECURITY_VIOLATION,      // 违反安全策略
    INTERNAL_ERROR           // 编排逻辑本身的错误
};

const char *to_string(error_kind kind);

struct engine_error {
    error_kind kind;

    /**
     * @brief 返回给调用方看的诊断信息
     */
    std::string message;

    /**
     * @brief 违反安全策略的描述，仅对 SECURITY_VIOLATION 有效
     */
    std::vector<std::string> violations;

    engine_error(error_kind kind, std::string message);
    engine_error(error_kind kind, std::string message, std::vector<std::string> violations);
};

/**
 * @brief 可能失败的操作的返回值，要么是成功的结果，要么是 engine_error
 * 使用 is_ok/get_error 判断和取出错误，或者直接 std::get 取出成功的结果
 */
template <typename T>
using result = std::variant<T, engine_error>;

template <typename T>
bool is_ok(const result<T> &r) {
    return std::holds_alternative<T>(r);
}

template <typename T>
const engine_error &get_error(const result<T> &r) {
    return std::get<engine_error>(r);
}

/**
 * @brief 没有返回值的操作的成功标记
 */
struct ok_t {};

constexpr ok_t ok{};

}  // namespace coderun
