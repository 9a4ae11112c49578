#include "sandbox/container_runtime.hpp"

namespace arena::sandbox {

container_runtime::~container_runtime() = default;

}  // namespace arena::sandbox
