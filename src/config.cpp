#include "config.hpp"

namespace coderun {
using namespace std;

filesystem::path RUN_DIR = "/tmp/coderun/run";

string DOCKER_SOCKET = "/var/run/docker.sock";

string DOCKER_API_VERSION = "v1.41";

string SANDBOX_USER = "nobody";

size_t WORKER_COUNT = 4;

chrono::seconds STOP_GRACE_PERIOD{2};

chrono::milliseconds WAIT_SLICE{100};

int PIDS_LIMIT = 64;

size_t MAX_OUTPUT = 1024 * 1024;

string WORKER_NODE = "localhost";

bool DEBUG = false;

}  // namespace coderun
