#include "engine/quota_tracker.hpp"
#include <fmt/core.h>
#include <glog/logging.h>

namespace coderun {
using namespace std;

quota_tracker::quota_tracker(result_store &store, clock_fn clock)
    : store(store), clock(move(clock)) {}

timestamp quota_tracker::default_clock() {
    return chrono::system_clock::now();
}

result<ok_t> quota_tracker::check_and_reserve(const string &user_id) {
    timestamp now = clock();
    vector<string> denied;

    store.update_quotas(user_id, [&](vector<execution_quota> &quotas) {
        for (auto &quota : quotas) {
            if (!quota.is_active) continue;
            if (quota.is_reset_due(now)) {
                LOG(INFO) << "Resetting " << to_string(quota.type) << " quota of user " << user_id;
                quota.reset(now);
            }
            if (!quota.admits_one_more()) {
                quota.is_exceeded = true;
                denied.push_back(fmt::format("{} quota exceeded ({}/{} executions)",
                                             to_string(quota.type), quota.executions_used, quota.max_executions));
            }
        }
        if (!denied.empty()) return;
        for (auto &quota : quotas)
            if (quota.is_active) ++quota.executions_used;
    });

    if (!denied.empty()) {
        LOG(INFO) << "Denied execution of user " << user_id << ": " << denied.front();
        return engine_error(error_kind::QUOTA_EXCEEDED, denied.front(), denied);
    }
    return ok;
}

void quota_tracker::commit_usage(const string &user_id, double seconds, int memory_mb) {
    store.update_quotas(user_id, [&](vector<execution_quota> &quotas) {
        for (auto &quota : quotas) {
            if (!quota.is_active) continue;
            quota.execution_time_used += seconds;
            quota.memory_usage_used += memory_mb;
            if (quota.execution_time_used >= quota.max_execution_time ||
                quota.memory_usage_used >= quota.max_memory_usage)
                quota.is_exceeded = true;
        }
    });
}

void quota_tracker::release(const string &user_id) {
    store.update_quotas(user_id, [&](vector<execution_quota> &quotas) {
        for (auto &quota : quotas)
            if (quota.is_active && quota.executions_used > 0) --quota.executions_used;
    });
}

void quota_tracker::reset(const string &user_id, quota_type type) {
    timestamp now = clock();
    store.update_quotas(user_id, [&](vector<execution_quota> &quotas) {
        for (auto &quota : quotas)
            if (quota.type == type) quota.reset(now);
    });
}

size_t quota_tracker::reset_due(const timestamp &now) {
    size_t count = 0;
    for (auto &user_id : store.quota_users()) {
        store.update_quotas(user_id, [&](vector<execution_quota> &quotas) {
            for (auto &quota : quotas) {
                if (quota.is_active && quota.is_reset_due(now)) {
                    quota.reset(now);
                    ++count;
                }
            }
        });
    }
    if (count > 0) LOG(INFO) << "Reset " << count << " due quotas";
    return count;
}

void quota_tracker::assign(execution_quota quota) {
    timestamp now = clock();
    if (quota.id.empty()) quota.id = quota.user_id + "/" + to_string(quota.type);
    quota.schedule_from(now);
    store.save_quota(quota);
}

vector<execution_quota> quota_tracker::quotas_of(const string &user_id) {
    return store.list_quotas(user_id);
}

}  // namespace coderun
