#pragma once

#include <filesystem>
#include <map>
#include <memory>
#include <nlohmann/json.hpp>
#include <shared_mutex>
#include <string>
#include <vector>
#include "common/error.hpp"
#include "model/environment.hpp"

namespace coderun {

/**
 * @brief 运行环境注册表，(language, version) 到运行环境的映射
 * 查询和管理员更新可以并发进行，查询者拿到的是某个版本的完整快照，
 * 更新不会修改已经被查询者持有的对象。
 */
struct environment_registry {
    /**
     * @brief 从 json 数组中加载运行环境，已有的同名运行环境会被覆盖
     * @throw config_error 格式不正确
     */
    void load(const nlohmann::json &environments);

    /**
     * @brief 从配置文件中加载运行环境
     * 配置文件为运行环境的数组，或者是包含 environments 数组的对象
     * @throw config_error 文件不存在或者格式不正确
     */
    void load_file(const std::filesystem::path &path);

    /**
     * @brief 查找可以接受执行请求的运行环境
     * @return 运行环境，如果不存在或者不是 active 状态返回 INVALID_ENVIRONMENT
     */
    result<std::shared_ptr<const execution_environment>> lookup(const std::string &language, const std::string &version) const;

    /**
     * @brief 查找语言的默认运行环境
     * 没有标记为默认的运行环境时，取版本号最大的 active 运行环境
     */
    result<std::shared_ptr<const execution_environment>> default_for(const std::string &language) const;

    /**
     * @brief 查找运行环境，不检查状态
     * @return 不存在时返回 nullptr
     */
    std::shared_ptr<const execution_environment> find(const std::string &language, const std::string &version) const;

    std::shared_ptr<const execution_environment> find_by_id(const std::string &id) const;

    /**
     * @brief 列出所有 active 的运行环境，按 language、version 排序
     */
    std::vector<std::shared_ptr<const execution_environment>> list_active() const;

    /**
     * @brief 新增或者替换运行环境
     * 如果新的运行环境是默认环境，同语言的其他运行环境不再是默认环境
     */
    void upsert(execution_environment env);

    std::size_t size() const;

private:
    mutable std::shared_mutex mut;
    std::map<std::string, std::shared_ptr<const execution_environment>> environments;

    void upsert_locked(execution_environment env);
};

}  // namespace coderun
