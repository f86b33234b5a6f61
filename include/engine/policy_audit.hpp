#pragma once

#include <string>
#include <vector>
#include "model/environment.hpp"

namespace coderun {

/**
 * @brief 从源代码中提取导入的模块名
 * 支持的语言：
 * 1. python: import a.b, c as d / from a.b import c
 * 2. javascript: require('x') / import ... from 'x' / import 'x'，node: 前缀会被去掉
 * 3. java: import a.b.C; / import static a.b.C.d;
 * 4. c, cpp: #include <x> / #include "x"
 * 其他语言返回空列表
 *
 * @param language 运行环境的语言标识
 * @param source 源代码
 * @return 按出现顺序排列的模块名，可能有重复
 */
std::vector<std::string> extract_imports(const std::string &language, const std::string &source);

/**
 * @brief 判断模块名是否命中规则
 * 模块名和规则相同，或者以规则加上 "." 或 "/" 开头时命中，
 * 比如规则 "os" 命中 "os" 和 "os.path"，但不命中 "osmosis"
 */
bool import_matches(const std::string &name, const std::string &rule);

/**
 * @brief 去掉源代码中的注释和字符串字面量的内容
 * 字符串替换为空字面量（比如 "abc" 变为 ""），注释直接删除，换行保留。
 * 注释语法按语言区分：python 为 #，javascript、java、c、cpp 为 // 和 斜杠星号块注释。
 */
std::string strip_literals(const std::string &language, const std::string &source);

/**
 * @brief 在用户代码启动之前，按运行环境的安全策略静态检查源代码
 * @param env 运行环境，使用其中的 policy
 * @param source 源代码
 * @return 违反策略的描述，比如 "blocked import: os"、"blocked function: eval"，
 * 没有违反时返回空列表
 */
std::vector<std::string> audit_source(const execution_environment &env, const std::string &source);

}  // namespace coderun
