#include "common/status.hpp"
#include <boost/assign.hpp>
#include <unordered_map>

namespace arena {
using namespace std;

// clang-format off
static const unordered_map<error_type, const char *> error_string = boost::assign::map_list_of
    (error_type::NONE, "None")
    (error_type::VALIDATION_ERROR, "ValidationError")
    (error_type::TIME_LIMIT_EXCEEDED, "TimeoutError")
    (error_type::MEMORY_LIMIT_EXCEEDED, "MemoryError")
    (error_type::CRASHED, "CrashError")
    (error_type::PROVISIONING_ERROR, "ProvisioningError");
// clang-format on

const char *get_display_message(error_type type) {
    return error_string.at(type);
}

}  // namespace arena
