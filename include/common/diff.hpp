#pragma once

#include <string>

namespace coderun {

struct line_diff {
    /**
     * @brief 逐行比较的结果，相同的行以 "  " 开头，只在期望输出中的行以 "- " 开头，
     * 只在实际输出中的行以 "+ " 开头。两边完全相同时为空字符串。
     */
    std::string text;

    /**
     * @brief 相似度，取值 0~1，为 2 * 相同行数 / (期望行数 + 实际行数)
     * 两边都为空时为 1
     */
    double similarity = 1;
};

/**
 * @brief 基于最长公共子序列计算两段文本的逐行差异
 * @param expected 期望输出
 * @param actual 实际输出
 */
line_diff diff_lines(const std::string &expected, const std::string &actual);

}  // namespace coderun
