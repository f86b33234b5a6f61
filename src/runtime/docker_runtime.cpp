#include "runtime/docker_runtime.hpp"
#include <curl/curl.h>
#include <fmt/core.h>
#include <glog/logging.h>
#include "common/defer.hpp"
#include "common/exceptions.hpp"
#include "common/json_utils.hpp"

namespace coderun {
using namespace std;
using namespace nlohmann;

static size_t write_callback(char *data, size_t size, size_t nmemb, void *userdata) {
    auto *body = reinterpret_cast<string *>(userdata);
    body->append(data, size * nmemb);
    return size * nmemb;
}

static container_error make_container_error(const string &message, long http_status) {
    container_error error(message);
    error.http_status = http_status;
    return error;
}

docker_runtime::docker_runtime(const string &socket_path, const string &api_version)
    : socket_path(socket_path), api_version(api_version) {}

docker_runtime::http_response docker_runtime::request(const string &method, const string &path, const string &body, chrono::milliseconds timeout) {
    // 通过 unix socket 访问时主机名会被忽略
    string url = "http://localhost";
    if (!api_version.empty()) url += "/" + api_version;
    url += path;

    CURL *curl = curl_easy_init();
    if (!curl) throw container_error("unable to initialize curl");
    defer { curl_easy_cleanup(curl); };

    struct curl_slist *headers = nullptr;
    headers = curl_slist_append(headers, "Content-Type: application/json");
    defer { curl_slist_free_all(headers); };

    http_response response;
    curl_easy_setopt(curl, CURLOPT_UNIX_SOCKET_PATH, socket_path.c_str());
    curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl, CURLOPT_CUSTOMREQUEST, method.c_str());
    curl_easy_setopt(curl, CURLOPT_HTTPHEADER, headers);
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, write_callback);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &response.body);
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
    if (method == "POST") {
        curl_easy_setopt(curl, CURLOPT_POSTFIELDS, body.c_str());
        curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE, (long)body.size());
    }
    if (timeout.count() > 0)
        curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS, (long)timeout.count());

    VLOG(1) << method << " " << url << (body.empty() ? "" : " " + body);
    CURLcode res = curl_easy_perform(curl);
    if (res == CURLE_OPERATION_TIMEDOUT) {
        response.timed_out = true;
        return response;
    }
    if (res != CURLE_OK)
        throw container_error(fmt::format("{} {} failed: {}", method, path, curl_easy_strerror(res)));

    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &response.status);
    VLOG(1) << method << " " << url << " -> " << response.status;
    return response;
}

void docker_runtime::expect(const http_response &response, const string &what, initializer_list<long> accepted) {
    if (response.status >= 200 && response.status < 300) return;
    for (long status : accepted)
        if (response.status == status) return;

    // Docker Engine 的错误响应为 {"message": "..."}
    json error = json::parse(response.body, nullptr, false);
    string message = error.is_discarded() ? response.body : get_value_def<string>(error, response.body, "message");
    throw make_container_error(fmt::format("{}: HTTP {}: {}", what, response.status, message), response.status);
}

string docker_runtime::create(const container_spec &spec) {
    auto response = request("POST", "/containers/create", build_create_body(spec).dump());
    expect(response, "create container from " + spec.image);
    try {
        return json::parse(response.body).at("Id").get<string>();
    } catch (json::exception &ex) {
        throw container_error(string("malformed create response: ") + ex.what());
    }
}

void docker_runtime::start(const string &id) {
    // 304 表示容器已经启动
    expect(request("POST", "/containers/" + id + "/start"), "start container " + id, {304});
}

optional<container_state> docker_runtime::wait(const string &id, chrono::milliseconds timeout) {
    auto response = request("POST", "/containers/" + id + "/wait", "", timeout);
    if (response.timed_out) return nullopt;
    expect(response, "wait container " + id);

    container_state state = inspect(id);
    try {
        json result = json::parse(response.body);
        state.running = false;
        state.exit_code = get_value_def<int>(result, state.exit_code, "StatusCode");
        string error = get_value_def<string>(result, "", "Error", "Message");
        if (!error.empty()) state.error = error;
    } catch (json::exception &ex) {
        throw container_error(string("malformed wait response: ") + ex.what());
    }
    return state;
}

container_logs docker_runtime::logs(const string &id) {
    auto response = request("GET", "/containers/" + id + "/logs?stdout=1&stderr=1");
    expect(response, "fetch logs of container " + id);
    return demultiplex_logs(response.body);
}

container_stats docker_runtime::stats(const string &id) {
    // one-shot 避免 Docker 为了计算 CPU 百分比再等待一个采样周期
    auto response = request("GET", "/containers/" + id + "/stats?stream=false&one-shot=true");
    expect(response, "fetch stats of container " + id);
    try {
        return parse_stats(json::parse(response.body));
    } catch (json::exception &ex) {
        throw container_error(string("malformed stats response: ") + ex.what());
    }
}

container_state docker_runtime::inspect(const string &id) {
    auto response = request("GET", "/containers/" + id + "/json");
    expect(response, "inspect container " + id);
    try {
        return parse_inspect(json::parse(response.body));
    } catch (json::exception &ex) {
        throw container_error(string("malformed inspect response: ") + ex.what());
    }
}

void docker_runtime::kill(const string &id) {
    // 409 表示容器没有在运行
    expect(request("POST", "/containers/" + id + "/kill"), "kill container " + id, {409});
}

void docker_runtime::stop(const string &id, chrono::seconds grace) {
    // 304 表示容器已经停止，Docker 会在 t 秒之后发送 SIGKILL，因此请求的超时时间要比宽限期长
    auto response = request("POST", fmt::format("/containers/{}/stop?t={}", id, grace.count()), "",
                            chrono::duration_cast<chrono::milliseconds>(grace + chrono::seconds(10)));
    if (response.timed_out)
        throw container_error(fmt::format("stop container {}: timed out", id));
    expect(response, "stop container " + id, {304});
}

void docker_runtime::remove(const string &id) {
    expect(request("DELETE", "/containers/" + id + "?force=true&v=true"), "remove container " + id, {404});
}

json build_create_body(const container_spec &spec) {
    json env = json::array();
    for (auto &[key, value] : spec.env)
        env.push_back(key + "=" + value);

    json binds = json::array();
    for (auto &mount : spec.mounts)
        binds.push_back(fmt::format("{}:{}:{}", mount.source.string(), mount.target, mount.read_only ? "ro" : "rw"));

    json host_config{{"Binds", binds},
                     {"Tmpfs", spec.tmpfs},
                     {"Memory", spec.memory_bytes},
                     {"MemorySwap", spec.memory_swap_bytes},
                     {"CpuPeriod", spec.cpu_period},
                     {"CpuQuota", spec.cpu_quota},
                     {"PidsLimit", spec.pids_limit},
                     {"ReadonlyRootfs", spec.read_only_rootfs},
                     {"CapDrop", spec.cap_drop},
                     {"SecurityOpt", spec.security_opt}};
    if (spec.network_disabled)
        host_config["NetworkMode"] = "none";
    if (spec.log_max_bytes > 0) {
        host_config["LogConfig"] = {{"Type", "json-file"},
                                    {"Config", {{"max-size", std::to_string(spec.log_max_bytes)}, {"max-file", "1"}}}};
    }

    return json{{"Image", spec.image},
                {"Cmd", spec.command},
                {"User", spec.user},
                {"WorkingDir", spec.working_dir},
                {"Env", env},
                {"Labels", spec.labels},
                {"Tty", false},
                {"OpenStdin", false},
                {"AttachStdin", false},
                {"NetworkDisabled", spec.network_disabled},
                {"HostConfig", host_config}};
}

container_logs demultiplex_logs(const string &raw) {
    container_logs logs;
    size_t pos = 0;
    while (pos + 8 <= raw.size()) {
        unsigned char stream = raw[pos];
        size_t length = 0;
        for (size_t i = 4; i < 8; ++i)
            length = (length << 8) | (unsigned char)raw[pos + i];
        pos += 8;

        size_t available = min(length, raw.size() - pos);
        string payload = raw.substr(pos, available);
        pos += available;

        if (stream == 2)
            logs.stderr_output += payload;
        else
            logs.stdout_output += payload;
    }
    return logs;
}

container_stats parse_stats(const json &stats) {
    container_stats result;
    int64_t peak = get_value_def<int64_t>(stats, 0, "memory_stats", "max_usage");
    if (peak == 0)
        peak = get_value_def<int64_t>(stats, 0, "memory_stats", "usage");
    result.peak_memory_bytes = peak;

    int64_t cpu_ns = get_value_def<int64_t>(stats, 0, "cpu_stats", "cpu_usage", "total_usage");
    result.cpu_seconds = cpu_ns / 1e9;
    return result;
}

container_state parse_inspect(const json &inspect) {
    container_state state;
    state.running = get_value_def<bool>(inspect, false, "State", "Running");
    state.exit_code = get_value_def<int>(inspect, 0, "State", "ExitCode");
    state.oom_killed = get_value_def<bool>(inspect, false, "State", "OOMKilled");
    state.error = get_value_def<string>(inspect, "", "State", "Error");
    if (!state.running && state.exit_code == SIGSYS_EXIT_CODE) {
        state.violations.push_back("blocked system call (killed by SIGSYS)");
        state.blocked_operations.push_back("syscall");
    }
    return state;
}

}  // namespace coderun
