#include "store/mysql_store.hpp"
#include <fmt/core.h>
#include <glog/logging.h>
#include "common/exceptions.hpp"
#include "common/json_utils.hpp"

namespace coderun {
using namespace std;
using namespace nlohmann;

// clang-format off
static const char *SCHEMA[] = {
    "CREATE TABLE IF NOT EXISTS code_executions ("
    "  id VARCHAR(64) PRIMARY KEY,"
    "  user_id VARCHAR(64) NOT NULL,"
    "  status VARCHAR(32) NOT NULL,"
    "  created_at VARCHAR(32) NOT NULL,"
    "  data JSON NOT NULL,"
    "  INDEX idx_user_created (user_id, created_at))",
    "CREATE TABLE IF NOT EXISTS test_cases ("
    "  id VARCHAR(64) PRIMARY KEY,"
    "  exercise_id VARCHAR(64) NOT NULL,"
    "  data JSON NOT NULL,"
    "  INDEX idx_exercise (exercise_id))",
    "CREATE TABLE IF NOT EXISTS test_results ("
    "  execution_id VARCHAR(64) NOT NULL,"
    "  test_case_id VARCHAR(64) NOT NULL,"
    "  data JSON NOT NULL,"
    "  PRIMARY KEY (execution_id, test_case_id))",
    "CREATE TABLE IF NOT EXISTS execution_quotas ("
    "  user_id VARCHAR(64) NOT NULL,"
    "  quota_type VARCHAR(16) NOT NULL,"
    "  data JSON NOT NULL,"
    "  PRIMARY KEY (user_id, quota_type))"
};
// clang-format on

void from_json(const json &j, database_config &db) {
    j.at("host").get_to(db.host);
    assign_optional(j, db.port, "port");
    j.at("user").get_to(db.user);
    j.at("password").get_to(db.password);
    j.at("database").get_to(db.database);
}

template <typename T>
static vector<T> parse_rows(const vector<string> &rows) {
    vector<T> result;
    for (auto &row : rows) {
        try {
            result.push_back(json::parse(row).get<T>());
        } catch (json::exception &ex) {
            throw database_error(string("malformed record: ") + ex.what());
        }
    }
    return result;
}

mysql_store::mysql_store(const database_config &config)
    : config(config) {
    lock_guard<mutex> lock(mut);
    ensure_connected();
}

mysql_store::~mysql_store() {
    if (conn) mysql_close(conn);
}

void mysql_store::ensure_connected() {
    if (conn && mysql_ping(conn) == 0) return;
    if (conn) {
        LOG(WARNING) << "Lost connection to MySQL server " << config.host << ", reconnecting";
        mysql_close(conn);
    }

    conn = mysql_init(nullptr);
    if (!conn) throw database_error("unable to initialize mysql client");
    if (!mysql_real_connect(conn, config.host.c_str(), config.user.c_str(), config.password.c_str(),
                            config.database.c_str(), config.port, nullptr, 0)) {
        string error = mysql_error(conn);
        mysql_close(conn);
        conn = nullptr;
        throw database_error(fmt::format("unable to connect to {}:{}/{}: {}", config.host, config.port, config.database, error));
    }
    mysql_set_character_set(conn, "utf8mb4");
}

void mysql_store::execute(const string &sql) {
    if (mysql_query(conn, sql.c_str()))
        throw database_error(fmt::format("{}: {}", mysql_error(conn), sql.substr(0, 200)));
}

vector<string> mysql_store::query_column(const string &sql) {
    execute(sql);
    MYSQL_RES *res = mysql_store_result(conn);
    if (!res) throw database_error(fmt::format("{}: {}", mysql_error(conn), sql.substr(0, 200)));

    vector<string> rows;
    while (MYSQL_ROW row = mysql_fetch_row(res)) {
        unsigned long *lengths = mysql_fetch_lengths(res);
        rows.push_back(row[0] ? string(row[0], lengths[0]) : string());
    }
    mysql_free_result(res);
    return rows;
}

string mysql_store::quote(const string &value) {
    string escaped(value.size() * 2 + 1, '\0');
    unsigned long length = mysql_real_escape_string(conn, escaped.data(), value.c_str(), value.size());
    escaped.resize(length);
    return "'" + escaped + "'";
}

void mysql_store::ensure_schema() {
    lock_guard<mutex> lock(mut);
    ensure_connected();
    for (const char *sql : SCHEMA)
        execute(sql);
}

void mysql_store::create_execution(const code_execution &execution) {
    lock_guard<mutex> lock(mut);
    ensure_connected();
    execute(fmt::format("INSERT INTO code_executions (id, user_id, status, created_at, data) VALUES ({}, {}, {}, {}, {})",
                        quote(execution.id), quote(execution.user_id), quote(to_string(execution.status)),
                        quote(format_timestamp(execution.created_at)), quote(json(execution).dump())));
}

void mysql_store::update_execution(const code_execution &execution) {
    lock_guard<mutex> lock(mut);
    ensure_connected();
    execute(fmt::format("UPDATE code_executions SET status={}, data={} WHERE id={}",
                        quote(to_string(execution.status)), quote(json(execution).dump()), quote(execution.id)));
    // 内容没有变化时 affected rows 也是 0，因此用 info 中的匹配行数判断记录是否存在
    const char *info = mysql_info(conn);
    if (info && string(info).find("Rows matched: 0") != string::npos)
        throw database_error("unknown execution " + execution.id);
}

optional<code_execution> mysql_store::get_execution(const string &id) {
    lock_guard<mutex> lock(mut);
    ensure_connected();
    auto rows = parse_rows<code_execution>(query_column("SELECT data FROM code_executions WHERE id=" + quote(id)));
    if (rows.empty()) return nullopt;
    return rows.front();
}

vector<code_execution> mysql_store::list_executions(const string &user_id) {
    lock_guard<mutex> lock(mut);
    ensure_connected();
    return parse_rows<code_execution>(query_column(
        "SELECT data FROM code_executions WHERE user_id=" + quote(user_id) + " ORDER BY created_at DESC"));
}

void mysql_store::save_test_case(const test_case &tc) {
    lock_guard<mutex> lock(mut);
    ensure_connected();
    execute(fmt::format("REPLACE INTO test_cases (id, exercise_id, data) VALUES ({}, {}, {})",
                        quote(tc.id), quote(tc.exercise_id), quote(json(tc).dump())));
}

vector<test_case> mysql_store::list_test_cases(const string &exercise_id) {
    lock_guard<mutex> lock(mut);
    ensure_connected();
    return parse_rows<test_case>(query_column("SELECT data FROM test_cases WHERE exercise_id=" + quote(exercise_id)));
}

void mysql_store::save_test_result(const test_result &result) {
    lock_guard<mutex> lock(mut);
    ensure_connected();
    execute(fmt::format("REPLACE INTO test_results (execution_id, test_case_id, data) VALUES ({}, {}, {})",
                        quote(result.execution_id), quote(result.test_case_id), quote(json(result).dump())));
}

vector<test_result> mysql_store::list_test_results(const string &execution_id) {
    lock_guard<mutex> lock(mut);
    ensure_connected();
    return parse_rows<test_result>(query_column("SELECT data FROM test_results WHERE execution_id=" + quote(execution_id)));
}

void mysql_store::replace_quota_locked(const execution_quota &quota) {
    execute(fmt::format("REPLACE INTO execution_quotas (user_id, quota_type, data) VALUES ({}, {}, {})",
                        quote(quota.user_id), quote(to_string(quota.type)), quote(json(quota).dump())));
}

void mysql_store::save_quota(const execution_quota &quota) {
    lock_guard<mutex> lock(mut);
    ensure_connected();
    replace_quota_locked(quota);
}

vector<execution_quota> mysql_store::list_quotas(const string &user_id) {
    lock_guard<mutex> lock(mut);
    ensure_connected();
    return parse_rows<execution_quota>(query_column("SELECT data FROM execution_quotas WHERE user_id=" + quote(user_id)));
}

vector<string> mysql_store::quota_users() {
    lock_guard<mutex> lock(mut);
    ensure_connected();
    return query_column("SELECT DISTINCT user_id FROM execution_quotas");
}

void mysql_store::update_quotas(const string &user_id, const function<void(vector<execution_quota> &)> &txn) {
    lock_guard<mutex> lock(mut);
    ensure_connected();
    execute("START TRANSACTION");
    try {
        auto quotas = parse_rows<execution_quota>(query_column(
            "SELECT data FROM execution_quotas WHERE user_id=" + quote(user_id) + " FOR UPDATE"));
        txn(quotas);
        for (auto &quota : quotas)
            replace_quota_locked(quota);
        execute("COMMIT");
    } catch (std::exception &ex) {
        LOG(WARNING) << "Rolling back quota transaction of user " << user_id << ": " << ex.what();
        if (mysql_query(conn, "ROLLBACK"))
            LOG(ERROR) << "Unable to roll back quota transaction: " << mysql_error(conn);
        throw;
    }
}

}  // namespace coderun
