#include <stdexcept>
#include "common/exceptions.hpp"
#include "gtest/gtest.h"
#include "store/memory_store.hpp"
#include "test/fixtures.hpp"

using namespace std;
using namespace coderun;
using namespace coderun::test;

static code_execution make_execution(const string &id, const string &user_id, const timestamp &created_at) {
    code_execution execution;
    execution.id = id;
    execution.user_id = user_id;
    execution.environment_id = "env-python-311";
    execution.created_at = created_at;
    return execution;
}

TEST(MemoryStoreTest, ExecutionLifecycleTest) {
    memory_store store;
    auto now = chrono::system_clock::now();
    auto execution = make_execution("e1", "alice", now);
    store.create_execution(execution);
    EXPECT_THROW(store.create_execution(execution), database_error);

    execution.status = execution_status::COMPLETED;
    execution.stdout_output = "done";
    store.update_execution(execution);

    auto stored = store.get_execution("e1");
    ASSERT_TRUE(stored);
    EXPECT_EQ(stored->status, execution_status::COMPLETED);
    EXPECT_EQ(stored->stdout_output, "done");

    EXPECT_FALSE(store.get_execution("missing"));
    EXPECT_THROW(store.update_execution(make_execution("missing", "alice", now)), database_error);
}

TEST(MemoryStoreTest, ListExecutionsNewestFirstTest) {
    memory_store store;
    auto now = chrono::system_clock::now();
    store.create_execution(make_execution("old", "alice", now - chrono::minutes(5)));
    store.create_execution(make_execution("new", "alice", now));
    store.create_execution(make_execution("other", "bob", now));

    auto executions = store.list_executions("alice");
    ASSERT_EQ(executions.size(), 2u);
    EXPECT_EQ(executions[0].id, "new");
    EXPECT_EQ(executions[1].id, "old");
}

TEST(MemoryStoreTest, TestResultUniquePerPairTest) {
    memory_store store;
    test_result result;
    result.id = "r1";
    result.execution_id = "e1";
    result.test_case_id = "t1";
    result.status = test_status::FAILED;
    store.save_test_result(result);

    result.id = "r2";
    result.status = test_status::PASSED;
    store.save_test_result(result);

    result.test_case_id = "t2";
    store.save_test_result(result);

    auto results = store.list_test_results("e1");
    ASSERT_EQ(results.size(), 2u);
    EXPECT_EQ(results[0].status, test_status::PASSED);
    EXPECT_TRUE(store.list_test_results("e2").empty());
}

TEST(MemoryStoreTest, QuotaUniquePerUserAndTypeTest) {
    memory_store store;
    store.save_quota(make_quota("alice", quota_type::DAILY, 5));
    store.save_quota(make_quota("alice", quota_type::DAILY, 10));
    store.save_quota(make_quota("alice", quota_type::TOTAL, 100));
    store.save_quota(make_quota("bob", quota_type::DAILY, 1));

    auto quotas = store.list_quotas("alice");
    ASSERT_EQ(quotas.size(), 2u);
    EXPECT_EQ(quotas[0].max_executions, 10);
    EXPECT_EQ(store.quota_users(), (vector<string>{"alice", "bob"}));
}

TEST(MemoryStoreTest, QuotaTransactionRollbackTest) {
    memory_store store;
    store.save_quota(make_quota("alice", quota_type::DAILY, 5));

    EXPECT_THROW(store.update_quotas("alice", [](vector<execution_quota> &quotas) {
        quotas[0].executions_used = 5;
        throw runtime_error("abort");
    }),
                 runtime_error);
    EXPECT_EQ(store.list_quotas("alice")[0].executions_used, 0);

    store.update_quotas("alice", [](vector<execution_quota> &quotas) {
        quotas[0].executions_used = 3;
    });
    EXPECT_EQ(store.list_quotas("alice")[0].executions_used, 3);

    // 没有配额的用户不会因为事务而产生空记录
    store.update_quotas("nobody", [](vector<execution_quota> &quotas) {
        EXPECT_TRUE(quotas.empty());
    });
    EXPECT_EQ(store.quota_users(), vector<string>{"alice"});
}

TEST(MemoryStoreTest, TestCasesByExerciseTest) {
    memory_store store;
    test_case tc;
    tc.id = "t1";
    tc.exercise_id = "x1";
    store.save_test_case(tc);
    tc.id = "t2";
    store.save_test_case(tc);
    tc.id = "t3";
    tc.exercise_id = "x2";
    store.save_test_case(tc);

    EXPECT_EQ(store.list_test_cases("x1").size(), 2u);
    EXPECT_EQ(store.list_test_cases("x2").size(), 1u);
    EXPECT_TRUE(store.list_test_cases("x3").empty());
}
