#include "runtime/container_runtime.hpp"

namespace coderun {

container_runtime::~container_runtime() = default;

}  // namespace coderun
