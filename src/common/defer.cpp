#include "common/defer.hpp"
#include <glog/logging.h>
#include <exception>

namespace coderun {
using namespace std;

scope_exit::scope_exit() : action() {}

scope_exit::scope_exit(function<void()> action) : action(move(action)) {}

scope_exit::scope_exit(scope_exit &&other) : action(move(other.action)) {
    other.action = nullptr;
}

scope_exit::~scope_exit() {
    if (!action) return;
    // 析构函数中不能抛出异常，否则在栈展开时会直接 terminate
    try {
        action();
    } catch (std::exception &ex) {
        LOG(ERROR) << "Deferred action failed: " << ex.what();
    }
}

scope_exit scope_exit::operator+(function<void()> action) const {
    return scope_exit(move(action));
}

}  // namespace coderun
