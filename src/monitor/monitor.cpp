#include "monitor/monitor.hpp"
#include <fmt/core.h>
#include <glog/logging.h>
#include <boost/assign.hpp>
#include <unordered_map>

namespace grader {
using namespace std;

// clang-format off
static const unordered_map<worker_state, const char *> worker_state_string = boost::assign::map_list_of
    (worker_state::START, "start")
    (worker_state::GRADING, "grading")
    (worker_state::IDLE, "idle")
    (worker_state::STOPPED, "stopped")
    (worker_state::CRASHED, "crashed");
// clang-format on

const char *get_display_message(worker_state state) {
    return worker_state_string.at(state);
}

monitor::~monitor() {}

void monitor::start_submission(size_t, const string &) {}

void monitor::end_submission(size_t, const grading_result &) {}

void monitor::worker_state_changed(int, worker_state, const string &) {}

void monitor::report_error(const string &) {}

void log_monitor::start_submission(size_t index, const string &reference) {
    LOG(INFO) << fmt::format("Submission #{} {} started", index, reference);
}

void log_monitor::end_submission(size_t index, const grading_result &result) {
    if (result.success)
        LOG(INFO) << fmt::format("Submission #{} [{}:{}] finished with {:.1f} ({}) in {:.2f}s",
                                 index, result.grading_id, result.submission_id, result.total_score, result.grade, result.duration_seconds);
    else
        LOG(WARNING) << fmt::format("Submission #{} [{}:{}] failed: {} {}",
                                    index, result.grading_id, result.submission_id,
                                    result.error ? get_display_message(result.error->kind) : "",
                                    result.error ? result.error->message : "");
}

void log_monitor::worker_state_changed(int worker_id, worker_state state, const string &information) {
    if (state == worker_state::CRASHED)
        LOG(ERROR) << "Worker " << worker_id << " crashed: " << information;
    else
        DLOG(INFO) << "Worker " << worker_id << " " << get_display_message(state);
}

void log_monitor::report_error(const string &message) {
    LOG(ERROR) << message;
}

}  // namespace grader
