#include "store/result_store.hpp"

namespace coderun {

result_store::~result_store() = default;

}  // namespace coderun
