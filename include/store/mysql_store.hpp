#pragma once

#include <mysql/mysql.h>
#include <mutex>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>
#include "store/result_store.hpp"

namespace coderun {

/**
 * @brief 描述一个 MySQL 数据库连接信息
 */
struct database_config {
    /**
     * @brief 数据库服务器的地址
     */
    std::string host;

    unsigned int port = 3306;

    /**
     * @brief 数据库服务器的账号
     */
    std::string user;

    /**
     * @brief 数据库服务器的密码
     */
    std::string password;

    /**
     * @brief 使用连接到的数据库服务器的哪一个数据库
     */
    std::string database;
};

void from_json(const nlohmann::json &j, database_config &db);

/**
 * @brief 保存在 MySQL 中的 result_store
 * 每张表只有用于查询的索引列和一个保存完整记录的 JSON 列 data。
 * 一个实例只持有一个连接，所有操作串行执行；多个执行节点共享数据库时，
 * update_quotas 通过 SELECT ... FOR UPDATE 保证同一用户的配额事务串行。
 */
struct mysql_store : public result_store {
    explicit mysql_store(const database_config &config);
    ~mysql_store() override;

    mysql_store(const mysql_store &) = delete;
    mysql_store &operator=(const mysql_store &) = delete;

    /**
     * @brief 创建不存在的表
     */
    void ensure_schema();

    void create_execution(const code_execution &execution) override;
    void update_execution(const code_execution &execution) override;
    std::optional<code_execution> get_execution(const std::string &id) override;
    std::vector<code_execution> list_executions(const std::string &user_id) override;

    void save_test_case(const test_case &tc) override;
    std::vector<test_case> list_test_cases(const std::string &exercise_id) override;

    void save_test_result(const test_result &result) override;
    std::vector<test_result> list_test_results(const std::string &execution_id) override;

    void save_quota(const execution_quota &quota) override;
    std::vector<execution_quota> list_quotas(const std::string &user_id) override;
    std::vector<std::string> quota_users() override;
    void update_quotas(const std::string &user_id, const std::function<void(std::vector<execution_quota> &)> &txn) override;

private:
    database_config config;
    MYSQL *conn = nullptr;
    std::mutex mut;

    /**
     * @brief 连接断开时重新连接
     * @throw database_error 无法连接数据库
     */
    void ensure_connected();

    void execute(const std::string &sql);

    /**
     * @brief 执行查询并返回每一行的第一列
     */
    std::vector<std::string> query_column(const std::string &sql);

    /**
     * @brief 转义字符串并加上引号，用于拼接 SQL 语句
     */
    std::string quote(const std::string &value);

    void replace_quota_locked(const execution_quota &quota);
};

}  // namespace coderun
