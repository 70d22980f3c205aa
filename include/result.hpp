#pragma once

#include <optional>
#include <string>
#include <vector>
#include "config.hpp"
#include "report/report.hpp"
#include "submission.hpp"

namespace grader {

/**
 * @brief 一个提交的最终评测结果，生成后不再修改
 */
struct grading_result {
    std::string submission_id;
    std::string grading_id;
    bool success = false;

    /**
     * @brief 与评分表顺序一致的得分，拉取失败时为空
     */
    std::vector<score_entry> entries;

    double total_score = 0;
    std::string grade;
    std::optional<error_info> error;
    report payload;
    double duration_seconds = 0;
};

/**
 * @brief 生成失败的评测结果
 * 总分为 0，等级为最低等级，不包含任何得分。
 */
grading_result make_failure_result(const submission &submit,
                                   error_kind kind,
                                   const std::string &message,
                                   const grader_config &config);

}  // namespace grader
