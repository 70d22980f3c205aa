#include "report/report.hpp"
#include <fmt/chrono.h>
#include <fmt/core.h>
#include <map>
#include "common/io_utils.hpp"

namespace grader {
using namespace std;
using namespace nlohmann;

static const char *INVALID_OUTPUT_MARKER = "[output is not valid UTF-8 and has been omitted]";
static const char *EXCERPT_MARKER = "\n[log excerpt truncated]";

static string format_time(chrono::system_clock::time_point time) {
    return fmt::format("{:%Y-%m-%dT%H:%M:%S}", fmt::localtime(chrono::system_clock::to_time_t(time)));
}

/**
 * @brief 截取日志摘录
 * @param truncated 摘录被截断时置为真
 */
static string excerpt(const string &log, size_t max_bytes, bool &truncated) {
    if (!utf8_check_is_valid(log)) {
        truncated = true;
        return INVALID_OUTPUT_MARKER;
    }
    if (log.size() <= max_bytes) return log;
    truncated = true;
    return utf8_truncate(log, max_bytes) + EXCERPT_MARKER;
}

report build_report(const submission &submit,
                    const vector<score_entry> &entries,
                    const vector<rubric_criterion> &criteria,
                    double total_score,
                    const string &grade,
                    const optional<error_info> &error,
                    size_t excerpt_bytes) {
    map<string, const rubric_criterion *> names;
    for (auto &criterion : criteria) names[criterion.id] = &criterion;

    report r;
    // 提交引用、错误信息和评分说明都可能来自选手的文件名或程序输出
    r.submission_id = utf8_sanitize(submit.reference);
    r.grading_id = submit.grading_id;
    r.success = !error;
    r.total_score = total_score;
    r.grade = grade;
    if (error) r.error = error_info{error->kind, utf8_sanitize(error->message)};
    r.started_at = format_time(submit.started_at);
    r.finished_at = format_time(submit.finished_at);
    r.duration_seconds = chrono::duration<double>(submit.finished_at - submit.started_at).count();
    r.language = submit.language;
    r.entry_point = utf8_sanitize(submit.entry_point);

    for (auto &entry : entries) {
        criterion_report c;
        c.id = entry.criterion_id;
        auto it = names.find(entry.criterion_id);
        c.name = it != names.end() ? it->second->name : entry.criterion_id;
        c.raw_score = entry.raw_score;
        c.max_score = entry.max_score;
        c.rationale = utf8_sanitize(entry.rationale);
        c.truncated = entry.truncated;
        c.log = excerpt(entry.log, excerpt_bytes, c.truncated);
        if (entry.error) c.error = utf8_sanitize(*entry.error);
        r.criteria.push_back(move(c));
    }
    return r;
}

void to_json(json &j, const criterion_report &criterion) {
    j = {{"id", criterion.id},
         {"name", criterion.name},
         {"raw_score", criterion.raw_score},
         {"max_score", criterion.max_score},
         {"rationale", criterion.rationale},
         {"truncated", criterion.truncated},
         {"log", criterion.log}};
    if (criterion.error) j["error"] = *criterion.error;
}

void to_json(json &j, const report &r) {
    j = {{"submission_id", r.submission_id},
         {"grading_id", r.grading_id},
         {"success", r.success},
         {"total_score", r.total_score},
         {"grade", r.grade},
         {"criteria", r.criteria},
         {"metadata", {{"start_time", r.started_at},
                       {"end_time", r.finished_at},
                       {"duration_seconds", r.duration_seconds},
                       {"language", r.language},
                       {"entry_point", r.entry_point}}}};
    if (r.error)
        j["error"] = {{"kind", get_display_message(r.error->kind)}, {"message", r.error->message}};
}

}  // namespace grader
