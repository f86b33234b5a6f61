#include "common/error.hpp"

namespace coderun {
using namespace std;

const char *to_string(error_kind kind) {
    switch (kind) {
        case error_kind::INVALID_ENVIRONMENT:
            return "invalid_environment";
        case error_kind::QUOTA_EXCEEDED:
            return "quota_exceeded";
        case error_kind::SANDBOX_LAUNCH_FAILURE:
            return "sandbox_launch_failure";
        case error_kind::EXECUTION_TIMEOUT:
            return "execution_timeout";
        case error_kind::MEMORY_LIMIT_EXCEEDED:
            return "memory_limit_exceeded";
        case error_kind::SECURITY_VIOLATION:
            return "security_violation";
        case error_kind::INTERNAL_ERROR:
            return "internal_error";
    }
    return "internal_error";
}

engine_error::engine_error(error_kind kind, string message)
    : kind(kind), message(move(message)) {}

engine_error::engine_error(error_kind kind, string message, vector<string> violations)
    : kind(kind), message(move(message)), violations(move(violations)) {}

}  // namespace coderun
