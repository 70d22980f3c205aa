#include "result.hpp"
#include <chrono>

namespace grader {
using namespace std;

grading_result make_failure_result(const submission &submit, error_kind kind, const string &message, const grader_config &config) {
    grading_result result;
    result.submission_id = submit.reference;
    result.grading_id = submit.grading_id;
    result.success = false;
    result.total_score = 0;
    result.grade = config.grade_thresholds.empty() ? "" : config.grade_thresholds.back().letter;
    result.error = error_info{kind, message};
    result.payload = build_report(submit, {}, config.rubric, 0, result.grade, result.error, config.report_excerpt_bytes);
    result.duration_seconds = result.payload.duration_seconds;
    return result;
}

}  // namespace grader
