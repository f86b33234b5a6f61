#include <curl/curl.h>
#include <fmt/core.h>
#include <glog/logging.h>
#include <boost/lexical_cast.hpp>
#include <boost/program_options.hpp>
#include <fstream>
#include <iostream>
#include <mutex>
#include "common/exceptions.hpp"
#include "common/io_utils.hpp"
#include "common/status.hpp"
#include "common/utils.hpp"
#include "config.hpp"
#include "engine/dispatcher.hpp"
#include "engine/environment_registry.hpp"
#include "engine/orchestrator.hpp"
#include "engine/quota_tracker.hpp"
#include "engine/sandbox_launcher.hpp"
#include "engine/test_runner.hpp"
#include "runtime/docker_runtime.hpp"
#include "store/memory_store.hpp"
#include "store/mysql_store.hpp"
using namespace std;
using namespace coderun;
using nlohmann::json;

static json read_json_file(const string &path) {
    try {
        if (path == "-") return json::parse(cin);
        return json::parse(read_file_content(path));
    } catch (json::exception &ex) {
        throw config_error(fmt::format("malformed json file {}: {}", path, ex.what()));
    }
}

static json error_to_json(const engine_error &error) {
    return json{{"error", {{"kind", to_string(error.kind)}, {"message", error.message}, {"violations", error.violations}}}};
}

static int run(const boost::program_options::variables_map &vm) {
    string environments_file = vm.count("environments") ? vm.at("environments").as<string>() : get_env("ENVIRONMENTS", "");
    CHECK(!environments_file.empty())
        << "Environment configuration file should be specified by --environments or ENVIRONMENTS";

    environment_registry registry;
    registry.load_file(environments_file);
    LOG(INFO) << "Loaded " << registry.size() << " environments from " << environments_file;

    unique_ptr<result_store> store;
    string database_file = vm.count("database") ? vm.at("database").as<string>() : get_env("DATABASE", "");
    if (!database_file.empty()) {
        auto db = make_unique<mysql_store>(read_json_file(database_file).get<database_config>());
        db->ensure_schema();
        store = move(db);
    } else {
        store = make_unique<memory_store>();
    }

    quota_tracker quotas(*store);
    if (vm.count("quotas")) {
        for (auto &item : read_json_file(vm.at("quotas").as<string>()))
            quotas.assign(item.get<execution_quota>());
    }
    quotas.reset_due(chrono::system_clock::now());

    if (vm.count("test-cases")) {
        for (auto &item : read_json_file(vm.at("test-cases").as<string>()))
            store->save_test_case(item.get<test_case>());
    }

    docker_runtime runtime(coderun::DOCKER_SOCKET, coderun::DOCKER_API_VERSION);
    sandbox_launcher launcher(runtime);
    execution_orchestrator orchestrator(registry, quotas, launcher, *store);
    test_runner runner(orchestrator, registry, *store);
    execution_dispatcher dispatcher(orchestrator, coderun::WORKER_COUNT);

    json requests = read_json_file(vm.at("requests").as<string>());
    CHECK(requests.is_array()) << "Execution requests should be a json array";

    mutex output_mut;
    vector<json> output(requests.size());

    dispatcher.start();
    for (size_t i = 0; i < requests.size(); ++i) {
        execution_request request;
        try {
            request = requests[i].get<execution_request>();
        } catch (std::exception &ex) {
            output[i] = error_to_json(engine_error(error_kind::INTERNAL_ERROR, fmt::format("malformed request: {}", ex.what())));
            continue;
        }

        auto submitted = dispatcher.submit(request, [&, i](const code_execution &execution) {
            json j = execution;
            j["message"] = get_display_message(execution.status);
            if (execution.kind == execution_kind::EXERCISE && execution.exercise_id) {
                auto report = runner.run_exercise_tests(execution);
                j["test_results"] = report.results;
                for (size_t k = 0; k < report.results.size(); ++k)
                    j["test_results"][k]["message"] = get_display_message(report.results[k].status);
                j["test_summary"] = report.summary;
            }
            lock_guard<mutex> lock(output_mut);
            output[i] = move(j);
        });

        if (!is_ok(submitted)) {
            lock_guard<mutex> lock(output_mut);
            output[i] = error_to_json(get_error(submitted));
        }
    }
    dispatcher.stop();

    cout << json(output).dump(2) << endl;
    return EXIT_SUCCESS;
}

int main(int argc, char *argv[]) {
    google::InitGoogleLogging(argv[0]);
    curl_global_init(CURL_GLOBAL_ALL);

    namespace po = boost::program_options;
    po::options_description desc("coderun options");
    po::variables_map vm;

    // clang-format off
    desc.add_options()
        ("environments", po::value<string>(), "set the execution environment configuration file. You can either pass it from environ ENVIRONMENTS")
        ("requests", po::value<string>()->default_value("-"), "set the file of execution requests in json array, - for stdin")
        ("quotas", po::value<string>(), "load execution quotas from given json file")
        ("test-cases", po::value<string>(), "load test cases from given json file, exercise submissions are graded against them")
        ("database", po::value<string>(), "use MySQL to store executions, with connection configuration file path. You can either pass it from environ DATABASE")
        ("run-dir", po::value<string>(), "set the directory to store workspaces of executions. You can either pass it from environ RUNDIR")
        ("docker-socket", po::value<string>(), "set the unix socket of Docker Engine, default to /var/run/docker.sock. You can either pass it from environ DOCKER_SOCKET")
        ("docker-api-version", po::value<string>(), "set the Docker Engine API version, default to v1.41. You can either pass it from environ DOCKER_API_VERSION")
        ("sandbox-user", po::value<string>(), "set the unprivileged user to run user programs, default to nobody. You can either pass it from environ SANDBOX_USER")
        ("workers", po::value<size_t>(), "set the maximum number of concurrent executions, default to 4. You can either pass it from environ WORKERS")
        ("stop-grace-period", po::value<unsigned>(), "set the grace period in seconds before a stopping sandbox is killed, default to 2. You can either pass it from environ STOP_GRACE_PERIOD")
        ("pids-limit", po::value<int>(), "set the maximum number of processes in a sandbox, default to 64. You can either pass it from environ PIDS_LIMIT")
        ("max-output", po::value<size_t>(), "set the maximum bytes of stdout and stderr kept per execution, default to 1048576. You can either pass it from environ MAX_OUTPUT")
        ("worker-node", po::value<string>(), "set the node name recorded in executions. You can either pass it from environ WORKER_NODE")
        ("debug", "turn on the debug mode to keep workspaces of executions to check the validity of generated files.")
        ("help", "display this help text")
        ("version", "display version of this application");
    // clang-format on

    try {
        po::store(po::command_line_parser(argc, argv)
                      .options(desc)
                      .run(),
                  vm);
        po::notify(vm);
    } catch (po::error &e) {
        cerr << e.what() << endl
             << endl;
        cerr << desc << endl;
        return EXIT_FAILURE;
    }

    if (vm.count("help")) {
        cout << "coderun: Run untrusted code in sandboxes, grade them against test cases" << endl
             << "Usage: " << argv[0] << " --environments <file> [options] < requests.json" << endl;
        cout << desc << endl;
        return EXIT_SUCCESS;
    }

    if (vm.count("version")) {
        cout << "coderun 1.0" << endl;
        return EXIT_SUCCESS;
    }

    if (vm.count("debug") || getenv("DEBUG")) {
        coderun::DEBUG = true;
    }

    if (vm.count("run-dir")) {
        coderun::RUN_DIR = filesystem::path(vm.at("run-dir").as<string>());
    } else if (getenv("RUNDIR")) {
        coderun::RUN_DIR = filesystem::path(getenv("RUNDIR"));
    }
    error_code ec;
    filesystem::create_directories(coderun::RUN_DIR, ec);
    CHECK(filesystem::is_directory(coderun::RUN_DIR))
        << "Run directory " << coderun::RUN_DIR << " does not exist: " << ec.message();

    if (vm.count("docker-socket")) {
        coderun::DOCKER_SOCKET = vm.at("docker-socket").as<string>();
    } else {
        coderun::DOCKER_SOCKET = get_env("DOCKER_SOCKET", coderun::DOCKER_SOCKET);
    }

    if (vm.count("docker-api-version")) {
        coderun::DOCKER_API_VERSION = vm.at("docker-api-version").as<string>();
    } else {
        coderun::DOCKER_API_VERSION = get_env("DOCKER_API_VERSION", coderun::DOCKER_API_VERSION);
    }

    if (vm.count("sandbox-user")) {
        coderun::SANDBOX_USER = vm.at("sandbox-user").as<string>();
    } else {
        coderun::SANDBOX_USER = get_env("SANDBOX_USER", coderun::SANDBOX_USER);
    }
    CHECK(coderun::SANDBOX_USER != "root" && coderun::SANDBOX_USER != "0")
        << "Sandboxes must not run as root";

    if (vm.count("workers")) {
        coderun::WORKER_COUNT = vm.at("workers").as<size_t>();
    } else if (getenv("WORKERS")) {
        coderun::WORKER_COUNT = boost::lexical_cast<size_t>(getenv("WORKERS"));
    }

    if (vm.count("stop-grace-period")) {
        coderun::STOP_GRACE_PERIOD = chrono::seconds(vm.at("stop-grace-period").as<unsigned>());
    } else if (getenv("STOP_GRACE_PERIOD")) {
        coderun::STOP_GRACE_PERIOD = chrono::seconds(boost::lexical_cast<unsigned>(getenv("STOP_GRACE_PERIOD")));
    }

    if (vm.count("pids-limit")) {
        coderun::PIDS_LIMIT = vm.at("pids-limit").as<int>();
    } else if (getenv("PIDS_LIMIT")) {
        coderun::PIDS_LIMIT = boost::lexical_cast<int>(getenv("PIDS_LIMIT"));
    }

    if (vm.count("max-output")) {
        coderun::MAX_OUTPUT = vm.at("max-output").as<size_t>();
    } else if (getenv("MAX_OUTPUT")) {
        coderun::MAX_OUTPUT = boost::lexical_cast<size_t>(getenv("MAX_OUTPUT"));
    }

    if (vm.count("worker-node")) {
        coderun::WORKER_NODE = vm.at("worker-node").as<string>();
    } else {
        coderun::WORKER_NODE = get_env("WORKER_NODE", coderun::WORKER_NODE);
    }

    int exit_code = EXIT_FAILURE;
    try {
        exit_code = run(vm);
    } catch (engine_exception &ex) {
        LOG(FATAL) << ex;
    } catch (std::exception &ex) {
        LOG(FATAL) << ex.what();
    }
    curl_global_cleanup();
    return exit_code;
}
