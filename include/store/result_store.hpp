#pragma once

#include <functional>
#include <optional>
#include <string>
#include <vector>
#include "model/execution.hpp"
#include "model/quota.hpp"
#include "model/test_case.hpp"

namespace coderun {

/**
 * @brief 执行引擎的持久化接口
 * 所有方法都必须是线程安全的，出错时抛出 database_error
 */
struct result_store {
    virtual ~result_store();

    /**
     * @brief 新增执行记录
     * @throw database_error id 已经存在
     */
    virtual void create_execution(const code_execution &execution) = 0;

    /**
     * @brief 更新执行记录
     * @throw database_error 记录不存在
     */
    virtual void update_execution(const code_execution &execution) = 0;

    virtual std::optional<code_execution> get_execution(const std::string &id) = 0;

    /**
     * @brief 查询用户的执行记录，按创建时间倒序
     */
    virtual std::vector<code_execution> list_executions(const std::string &user_id) = 0;

    /**
     * @brief 新增或者替换测试用例
     */
    virtual void save_test_case(const test_case &tc) = 0;

    virtual std::vector<test_case> list_test_cases(const std::string &exercise_id) = 0;

    /**
     * @brief 保存测试结果，(execution_id, test_case_id) 已经存在时替换原来的结果
     */
    virtual void save_test_result(const test_result &result) = 0;

    virtual std::vector<test_result> list_test_results(const std::string &execution_id) = 0;

    /**
     * @brief 新增或者替换配额，(user_id, type) 唯一
     */
    virtual void save_quota(const execution_quota &quota) = 0;

    virtual std::vector<execution_quota> list_quotas(const std::string &user_id) = 0;

    /**
     * @brief 拥有配额的全部用户
     */
    virtual std::vector<std::string> quota_users() = 0;

    /**
     * @brief 在一个事务中读取、修改并写回用户的全部配额
     * 同一个用户的并发事务串行执行。txn 抛出异常时事务回滚，异常继续向外抛出。
     * @param txn 修改配额的函数，参数为用户的全部配额
     */
    virtual void update_quotas(const std::string &user_id, const std::function<void(std::vector<execution_quota> &)> &txn) = 0;
};

}  // namespace coderun
