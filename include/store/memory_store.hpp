#pragma once

#include <map>
#include <mutex>
#include "store/result_store.hpp"

namespace coderun {

/**
 * @brief 保存在内存中的 result_store，用于测试和单进程运行
 * 所有操作共用一把锁，update_quotas 的事务在锁内执行
 */
struct memory_store : public result_store {
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
    std::mutex mut;
    std::map<std::string, code_execution> executions;
    std::map<std::string, test_case> test_cases;

    // (execution_id, test_case_id) -> result
    std::map<std::pair<std::string, std::string>, test_result> test_results;

    // user_id -> quotas
    std::map<std::string, std::vector<execution_quota>> quotas;
};

}  // namespace coderun
