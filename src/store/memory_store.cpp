#include "store/memory_store.hpp"
#include <algorithm>
#include "common/exceptions.hpp"

namespace coderun {
using namespace std;

void memory_store::create_execution(const code_execution &execution) {
    lock_guard<mutex> lock(mut);
    if (!executions.emplace(execution.id, execution).second)
        throw database_error("duplicate execution " + execution.id);
}

void memory_store::update_execution(const code_execution &execution) {
    lock_guard<mutex> lock(mut);
    auto it = executions.find(execution.id);
    if (it == executions.end())
        throw database_error("unknown execution " + execution.id);
    it->second = execution;
}

optional<code_execution> memory_store::get_execution(const string &id) {
    lock_guard<mutex> lock(mut);
    auto it = executions.find(id);
    if (it == executions.end()) return nullopt;
    return it->second;
}

vector<code_execution> memory_store::list_executions(const string &user_id) {
    lock_guard<mutex> lock(mut);
    vector<code_execution> result;
    for (auto &[id, execution] : executions)
        if (execution.user_id == user_id)
            result.push_back(execution);
    stable_sort(result.begin(), result.end(), [](const code_execution &a, const code_execution &b) {
        return a.created_at > b.created_at;
    });
    return result;
}

void memory_store::save_test_case(const test_case &tc) {
    lock_guard<mutex> lock(mut);
    test_cases[tc.id] = tc;
}

vector<test_case> memory_store::list_test_cases(const string &exercise_id) {
    lock_guard<mutex> lock(mut);
    vector<test_case> result;
    for (auto &[id, tc] : test_cases)
        if (tc.exercise_id == exercise_id)
            result.push_back(tc);
    return result;
}

void memory_store::save_test_result(const test_result &result) {
    lock_guard<mutex> lock(mut);
    test_results[{result.execution_id, result.test_case_id}] = result;
}

vector<test_result> memory_store::list_test_results(const string &execution_id) {
    lock_guard<mutex> lock(mut);
    vector<test_result> result;
    for (auto &[key, tr] : test_results)
        if (key.first == execution_id)
            result.push_back(tr);
    return result;
}

void memory_store::save_quota(const execution_quota &quota) {
    lock_guard<mutex> lock(mut);
    auto &user_quotas = quotas[quota.user_id];
    for (auto &existing : user_quotas) {
        if (existing.type == quota.type) {
            existing = quota;
            return;
        }
    }
    user_quotas.push_back(quota);
}

vector<execution_quota> memory_store::list_quotas(const string &user_id) {
    lock_guard<mutex> lock(mut);
    auto it = quotas.find(user_id);
    if (it == quotas.end()) return {};
    return it->second;
}

vector<string> memory_store::quota_users() {
    lock_guard<mutex> lock(mut);
    vector<string> users;
    for (auto &[user_id, user_quotas] : quotas)
        users.push_back(user_id);
    return users;
}

void memory_store::update_quotas(const string &user_id, const function<void(vector<execution_quota> &)> &txn) {
    lock_guard<mutex> lock(mut);
    auto it = quotas.find(user_id);
    vector<execution_quota> working = it == quotas.end() ? vector<execution_quota>() : it->second;
    // txn 抛出异常时 working 被丢弃，相当于回滚
    txn(working);
    if (it != quotas.end())
        it->second = move(working);
    else if (!working.empty())
        quotas[user_id] = move(working);
}

}  // namespace coderun
