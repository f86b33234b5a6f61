#include "model/quota.hpp"
#include "common/json_utils.hpp"

namespace coderun {
using namespace std;
using namespace nlohmann;

bool execution_quota::is_reset_due(const timestamp &now) const {
    return next_reset && *next_reset <= now;
}

bool execution_quota::admits_one_more() const {
    return executions_used + 1 <= max_executions &&
           execution_time_used < max_execution_time &&
           memory_usage_used < max_memory_usage;
}

void execution_quota::reset(const timestamp &now) {
    executions_used = 0;
    execution_time_used = 0;
    memory_usage_used = 0;
    is_exceeded = false;
    schedule_from(now);
}

void execution_quota::schedule_from(const timestamp &from) {
    last_reset = from;
    switch (type) {
        case quota_type::DAILY:
            next_reset = from + chrono::hours(24);
            break;
        case quota_type::MONTHLY:
            next_reset = from + chrono::hours(24 * 30);
            break;
        case quota_type::TOTAL:
            next_reset.reset();
            break;
    }
}

void to_json(json &j, const execution_quota &quota) {
    j = json{{"id", quota.id},
             {"user_id", quota.user_id},
             {"quota_type", to_string(quota.type)},
             {"max_executions", quota.max_executions},
             {"max_execution_time", quota.max_execution_time},
             {"max_memory_usage", quota.max_memory_usage},
             {"executions_used", quota.executions_used},
             {"execution_time_used", quota.execution_time_used},
             {"memory_usage_used", quota.memory_usage_used},
             {"last_reset", format_timestamp(quota.last_reset)},
             {"next_reset", quota.next_reset ? json(format_timestamp(*quota.next_reset)) : json(nullptr)},
             {"is_active", quota.is_active},
             {"is_exceeded", quota.is_exceeded}};
}

void from_json(const json &j, execution_quota &quota) {
    j.at("user_id").get_to(quota.user_id);
    quota.type = parse_quota_type(j.at("quota_type").get<string>());
    quota.id = get_value_def<string>(j, quota.user_id + "/" + to_string(quota.type), "id");
    assign_optional(j, quota.max_executions, "max_executions");
    assign_optional(j, quota.max_execution_time, "max_execution_time");
    assign_optional(j, quota.max_memory_usage, "max_memory_usage");
    assign_optional(j, quota.executions_used, "executions_used");
    assign_optional(j, quota.execution_time_used, "execution_time_used");
    assign_optional(j, quota.memory_usage_used, "memory_usage_used");
    assign_optional(j, quota.is_active, "is_active");
    assign_optional(j, quota.is_exceeded, "is_exceeded");

    quota.schedule_from(exists(j, "last_reset") ? parse_timestamp(j.at("last_reset").get<string>())
                                                : chrono::system_clock::now());
    if (exists(j, "next_reset"))
        quota.next_reset = parse_timestamp(j.at("next_reset").get<string>());
}

}  // namespace coderun
