#include "common/status.hpp"
#include <boost/assign.hpp>
#include <unordered_map>

namespace grader {
using namespace std;

// clang-format off
static const unordered_map<error_kind, const char *> error_kind_string = boost::assign::map_list_of
    (error_kind::NOT_FOUND, "NotFound")
    (error_kind::UNAUTHORIZED, "Unauthorized")
    (error_kind::TIMEOUT, "Timeout")
    (error_kind::MALFORMED, "Malformed")
    (error_kind::SANDBOX_INFRASTRUCTURE, "SandboxInfrastructure")
    (error_kind::CANCELLED, "Cancelled")
    (error_kind::INTERNAL, "Internal");
// clang-format on

const char *get_display_message(error_kind kind) {
    return error_kind_string.at(kind);
}

}  // namespace grader
