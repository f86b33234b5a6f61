#include "engine/environment_registry.hpp"
#include <fmt/core.h>
#include <glog/logging.h>
#include <fstream>
#include <mutex>
#include "common/exceptions.hpp"
#include "common/utils.hpp"

namespace coderun {
using namespace std;
using namespace nlohmann;

void environment_registry::load(const json &j) {
    if (!j.is_array())
        throw config_error("environments must be an array");

    vector<execution_environment> parsed;
    for (auto &item : j) {
        try {
            parsed.push_back(item.get<execution_environment>());
        } catch (std::exception &ex) {
            throw config_error(fmt::format("malformed environment {}: {}", item.dump(), ex.what()));
        }
    }

    unique_lock<shared_mutex> lock(mut);
    for (auto &env : parsed) {
        LOG(INFO) << "Registered environment " << env.key() << " (" << env.image << ", " << to_string(env.status) << ")";
        upsert_locked(move(env));
    }
}

void environment_registry::load_file(const filesystem::path &path) {
    ifstream fin(path);
    if (!fin) throw config_error("unable to open environment file " + path.string());

    json j;
    try {
        fin >> j;
    } catch (json::exception &ex) {
        throw config_error(fmt::format("malformed environment file {}: {}", path, ex.what()));
    }
    if (j.is_object() && j.count("environments"))
        load(j.at("environments"));
    else
        load(j);
}

result<shared_ptr<const execution_environment>> environment_registry::lookup(const string &language, const string &version) const {
    auto env = find(language, version);
    if (!env)
        return engine_error(error_kind::INVALID_ENVIRONMENT, fmt::format("unknown environment {}", environment_key(language, version)));
    if (env->status != environment_status::ACTIVE)
        return engine_error(error_kind::INVALID_ENVIRONMENT, fmt::format("environment {} is {}", env->key(), to_string(env->status)));
    return env;
}

result<shared_ptr<const execution_environment>> environment_registry::default_for(const string &language) const {
    shared_lock<shared_mutex> lock(mut);
    shared_ptr<const execution_environment> fallback;
    for (auto &[key, env] : environments) {
        if (env->language != language || env->status != environment_status::ACTIVE) continue;
        if (env->is_default) return env;
        // map 按 key 排序，最后一个就是版本号字典序最大的
        fallback = env;
    }
    if (fallback) return fallback;
    return engine_error(error_kind::INVALID_ENVIRONMENT, fmt::format("no active environment for language {}", language));
}

shared_ptr<const execution_environment> environment_registry::find(const string &language, const string &version) const {
    shared_lock<shared_mutex> lock(mut);
    auto it = environments.find(environment_key(language, version));
    return it == environments.end() ? nullptr : it->second;
}

shared_ptr<const execution_environment> environment_registry::find_by_id(const string &id) const {
    shared_lock<shared_mutex> lock(mut);
    for (auto &[key, env] : environments)
        if (env->id == id) return env;
    return nullptr;
}

vector<shared_ptr<const execution_environment>> environment_registry::list_active() const {
    shared_lock<shared_mutex> lock(mut);
    vector<shared_ptr<const execution_environment>> result;
    for (auto &[key, env] : environments)
        if (env->status == environment_status::ACTIVE)
            result.push_back(env);
    return result;
}

void environment_registry::upsert(execution_environment env) {
    unique_lock<shared_mutex> lock(mut);
    LOG(INFO) << "Updated environment " << env.key() << " (" << to_string(env.status) << ")";
    upsert_locked(move(env));
}

size_t environment_registry::size() const {
    shared_lock<shared_mutex> lock(mut);
    return environments.size();
}

void environment_registry::upsert_locked(execution_environment env) {
    string key = env.key();
    auto now = chrono::system_clock::now();
    auto existing = environments.find(key);
    if (existing != environments.end()) {
        // 替换时保留原来的 id 和创建时间
        env.id = existing->second->id;
        env.created_at = existing->second->created_at;
    }
    env.updated_at = now;

    if (env.is_default) {
        for (auto &[other_key, other] : environments) {
            if (other_key == key || other->language != env.language || !other->is_default) continue;
            auto copy = make_shared<execution_environment>(*other);
            copy->is_default = false;
            copy->updated_at = now;
            other = copy;
        }
    }
    environments[key] = make_shared<const execution_environment>(move(env));
}

}  // namespace coderun
