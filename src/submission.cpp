#include "submission.hpp"
#include <fmt/chrono.h>
#include <fmt/core.h>
#include <ctime>
#include "common/utils.hpp"

namespace grader {
using namespace std;

string generate_grading_id() {
    time_t now = chrono::system_clock::to_time_t(chrono::system_clock::now());
    return fmt::format("grade_{:%Y%m%d_%H%M%S}_{}", fmt::localtime(now), random_uuid().substr(0, 8));
}

}  // namespace grader
