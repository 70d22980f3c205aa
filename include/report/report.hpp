#pragma once

#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>
#include "rubric/criterion.hpp"
#include "rubric/evaluator.hpp"
#include "submission.hpp"

namespace grader {

struct criterion_report {
    std::string id;
    std::string name;
    double raw_score = 0;
    double max_score = 0;
    std::string rationale;

    /**
     * @brief 日志摘录，不超过 report_excerpt_bytes 字节
     */
    std::string log;

    /**
     * @brief 沙箱输出或者日志摘录是否被截断
     */
    bool truncated = false;

    std::optional<std::string> error;
};

/**
 * @brief 评测报告
 * 渲染为 HTML 或者 CSV 由外部程序完成，这里只保证报告内容完整且与评测结果一致。
 */
struct report {
    std::string submission_id;
    std::string grading_id;
    bool success = false;
    double total_score = 0;
    std::string grade;
    std::vector<criterion_report> criteria;
    std::optional<error_info> error;

    /**
     * @brief ISO 8601 格式的开始和结束时间
     */
    std::string started_at;
    std::string finished_at;

    double duration_seconds = 0;
    std::string language;
    std::string entry_point;
};

/**
 * @brief 生成评测报告
 * 不运行任何选手代码。日志摘录会截断到 excerpt_bytes 字节，不合法的 UTF-8 输出会被替换为提示信息。
 * @param entries 各评分项的得分，拉取失败时为空
 * @param criteria 评分表，用于查找评分项名称
 * @param error 提交级别的错误，评测成功时为空
 * @param excerpt_bytes 每个评分项日志摘录的最大字节数
 */
report build_report(const submission &submit,
                    const std::vector<score_entry> &entries,
                    const std::vector<rubric_criterion> &criteria,
                    double total_score,
                    const std::string &grade,
                    const std::optional<error_info> &error,
                    size_t excerpt_bytes);

void to_json(nlohmann::json &j, const criterion_report &criterion);
void to_json(nlohmann::json &j, const report &r);

}  // namespace grader
