#include "common/exceptions.hpp"
#include <boost/exception/diagnostic_information.hpp>

namespace coderun {
using namespace std;

engine_exception::engine_exception()
    : engine_exception("") {}

engine_exception::engine_exception(const string &message)
    : message(message), stacktrace(make_shared<boost::stacktrace::stacktrace>()) {}

const char *engine_exception::what() const noexcept {
    return message.c_str();
}

ostream &operator<<(ostream &os, const engine_exception &ex) {
    os << boost::diagnostic_information(ex) << endl << *ex.stacktrace;
    return os;
}

internal_error::internal_error()
    : engine_exception() {}

internal_error::internal_error(const string &message)
    : engine_exception(message) {}

container_error::container_error()
    : engine_exception() {}

container_error::container_error(const string &message)
    : engine_exception(message) {}

database_error::database_error()
    : engine_exception() {}

database_error::database_error(const string &message)
    : engine_exception(message) {}

config_error::config_error()
    : engine_exception() {}

config_error::config_error(const string &message)
    : engine_exception(message) {}

}  // namespace coderun
