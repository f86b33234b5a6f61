#include "model/environment.hpp"
#include "common/json_utils.hpp"

namespace coderun {
using namespace std;
using namespace nlohmann;

string environment_key(const string &language, const string &version) {
    return language + "/" + version;
}

string execution_environment::key() const {
    return environment_key(language, version);
}

void to_json(json &j, const security_policy &policy) {
    j = json{{"allowed_imports", policy.allowed_imports},
             {"blocked_imports", policy.blocked_imports},
             {"blocked_functions", policy.blocked_functions}};
}

void from_json(const json &j, security_policy &policy) {
    assign_optional(j, policy.allowed_imports, "allowed_imports");
    assign_optional(j, policy.blocked_imports, "blocked_imports");
    assign_optional(j, policy.blocked_functions, "blocked_functions");
}

void to_json(json &j, const execution_environment &env) {
    j = json{{"id", env.id},
             {"name", env.name},
             {"language", env.language},
             {"version", env.version},
             {"docker_image", env.image},
             {"default_timeout", env.default_timeout},
             {"max_memory", env.max_memory},
             {"max_cpu_time", env.max_cpu_time},
             {"max_file_size", env.max_file_size},
             {"supports_input", env.supports_input},
             {"supports_graphics", env.supports_graphics},
             {"supports_networking", env.supports_networking},
             {"supports_file_operations", env.supports_file_operations},
             {"compiler_command", env.compiler_command},
             {"interpreter_command", env.interpreter_command},
             {"file_extension", env.file_extension},
             {"installed_packages", env.installed_packages},
             {"available_libraries", env.available_libraries},
             {"allowed_imports", env.policy.allowed_imports},
             {"blocked_imports", env.policy.blocked_imports},
             {"blocked_functions", env.policy.blocked_functions},
             {"status", to_string(env.status)},
             {"is_default", env.is_default},
             {"created_at", format_timestamp(env.created_at)},
             {"updated_at", format_timestamp(env.updated_at)}};
}

void from_json(const json &j, execution_environment &env) {
    j.at("language").get_to(env.language);
    j.at("version").get_to(env.version);
    j.at("docker_image").get_to(env.image);
    j.at("file_extension").get_to(env.file_extension);

    env.id = get_value_def<string>(j, env.key(), "id");
    env.name = get_value_def<string>(j, env.language + " " + env.version, "name");
    assign_optional(j, env.default_timeout, "default_timeout");
    assign_optional(j, env.max_memory, "max_memory");
    assign_optional(j, env.max_cpu_time, "max_cpu_time");
    assign_optional(j, env.max_file_size, "max_file_size");
    assign_optional(j, env.supports_input, "supports_input");
    assign_optional(j, env.supports_graphics, "supports_graphics");
    assign_optional(j, env.supports_networking, "supports_networking");
    assign_optional(j, env.supports_file_operations, "supports_file_operations");
    assign_optional(j, env.compiler_command, "compiler_command");
    assign_optional(j, env.interpreter_command, "interpreter_command");
    assign_optional(j, env.installed_packages, "installed_packages");
    assign_optional(j, env.available_libraries, "available_libraries");
    // 安全策略的字段和其他字段平铺在同一层
    from_json(j, env.policy);
    if (exists(j, "status"))
        env.status = parse_environment_status(j.at("status").get<string>());
    assign_optional(j, env.is_default, "is_default");

    auto now = chrono::system_clock::now();
    env.created_at = exists(j, "created_at") ? parse_timestamp(j.at("created_at").get<string>()) : now;
    env.updated_at = exists(j, "updated_at") ? parse_timestamp(j.at("updated_at").get<string>()) : now;
}

}  // namespace coderun
