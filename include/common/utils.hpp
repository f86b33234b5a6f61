#pragma once

#include <fmt/core.h>
#include <chrono>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace fmt {
template <>
struct formatter<std::filesystem::path> {
    template <typename ParseContext>
    constexpr auto parse(ParseContext &ctx) { return ctx.begin(); }

    template <typename FormatContext>
    auto format(const std::filesystem::path &p, FormatContext &ctx) const {
        return format_to(ctx.out(), "{}", p.string());
    }
};
}  // namespace fmt

namespace coderun {

/**
 * @brief 执行记录中使用的时间戳类型
 */
using timestamp = std::chrono::system_clock::time_point;

/**
 * @brief 根据 key 来查找环境变量
 * @param key 环境变量的键
 * @param def_value 如果键不存在，返回该参数
 * @return 环境变量的值，或者不存在时返回 def_value
 */
std::string get_env(const std::string &key, const std::string &def_value);

/**
 * @brief 去掉字符串首尾的空白字符，中间的空白字符保持不变
 */
std::string trim(const std::string &str);

/**
 * @brief 按行切分字符串，行尾的 \r 会被去掉
 */
std::vector<std::string> split_lines(const std::string &str);

/**
 * @brief 将参数转义为可以安全放入 sh -c 命令中的单个参数
 * @code{.cpp}
 *     shell_quote("it's") == "'it'\\''s'"
 * @endcode
 */
std::string shell_quote(const std::string &arg);

/**
 * @brief 生成一个随机 uuid 字符串，作为记录的 id
 */
std::string generate_id();

/**
 * @brief 将时间戳格式化为 ISO 8601 格式（UTC），比如 2024-01-01T08:00:00.000Z
 */
std::string format_timestamp(const timestamp &time);

/**
 * @brief 解析 format_timestamp 生成的时间字符串
 * @throw std::invalid_argument 时间格式不正确
 */
timestamp parse_timestamp(const std::string &text);

/**
 * @brief 计时器，从构造开始计时
 * 使用 steady_clock，不受系统时间调整影响
 */
struct elapsed_time {
    elapsed_time();

    template <typename DurationT>
    DurationT duration() const {
        return std::chrono::duration_cast<DurationT>(std::chrono::steady_clock::now() - start);
    }

    /**
     * @brief 已经经过的秒数
     */
    double seconds() const;

private:
    std::chrono::steady_clock::time_point start;
};

}  // namespace coderun
