#pragma once

#include <nlohmann/json.hpp>
#include <string>
#include <vector>
#include "common/status.hpp"
#include "common/utils.hpp"

namespace coderun {

/**
 * @brief 运行环境的安全策略
 */
struct security_policy {
    /**
     * @brief 允许导入的模块白名单，为空时不限制
     */
    std::vector<std::string> allowed_imports;

    /**
     * @brief 禁止导入的模块，比如 os、subprocess、socket
     * 匹配顶层模块名，也就是 blocked_imports 包含 "os" 时 "os.path" 也会被禁止
     */
    std::vector<std::string> blocked_imports;

    /**
     * @brief 禁止调用的函数，比如 eval、exec、system
     */
    std::vector<std::string> blocked_functions;
};

/**
 * @brief 表示一个语言版本的运行环境
 * 由管理员创建，对执行引擎只读，(language, version) 唯一
 */
struct execution_environment {
    std::string id;

    /**
     * @brief 显示名，比如 "Python 3.11"
     */
    std::string name;

    /**
     * @brief 语言标识，比如 python, javascript, java, cpp
     */
    std::string language;

    std::string version;

    /**
     * @brief 容器镜像，比如 python:3.11-alpine
     */
    std::string image;

    /**
     * @brief 默认执行时限
     * @note 单位为秒
     */
    int default_timeout = 30;

    /**
     * @brief 内存限制
     * @note 单位为 MB
     */
    int max_memory = 128;

    /**
     * @brief CPU 时间限制，用于计算容器的 CPU quota
     * @note 单位为秒
     */
    int max_cpu_time = 10;

    /**
     * @brief 可写临时目录的大小限制
     * @note 单位为 MB
     */
    int max_file_size = 10;

    bool supports_input = true;
    bool supports_graphics = false;
    bool supports_networking = false;
    bool supports_file_operations = true;

    /**
     * @brief 编译命令，比如 g++，编译型语言使用
     * 程序会被编译为 /tmp 下的可执行文件再运行
     */
    std::string compiler_command;

    /**
     * @brief 解释器命令，比如 python，同时存在时优先于 compiler_command
     */
    std::string interpreter_command;

    /**
     * @brief 源代码文件扩展名，包含 "."，比如 ".py"
     */
    std::string file_extension;

    std::vector<std::string> installed_packages;
    std::vector<std::string> available_libraries;

    security_policy policy;

    environment_status status = environment_status::ACTIVE;

    /**
     * @brief 是否为该语言的默认运行环境
     */
    bool is_default = false;

    timestamp created_at;
    timestamp updated_at;

    /**
     * @brief 用于索引的键，比如 "python/3.11"
     */
    std::string key() const;
};

std::string environment_key(const std::string &language, const std::string &version);

void to_json(nlohmann::json &j, const security_policy &policy);
void from_json(const nlohmann::json &j, security_policy &policy);

void to_json(nlohmann::json &j, const execution_environment &env);

/**
 * @brief 从配置文件中解析运行环境
 * 只有 language、version、image、file_extension 是必填项，其余字段使用默认值
 */
void from_json(const nlohmann::json &j, execution_environment &env);

}  // namespace coderun
