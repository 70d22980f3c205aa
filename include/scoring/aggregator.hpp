#pragma once

#include <string>
#include <vector>
#include "config.hpp"
#include "rubric/criterion.hpp"
#include "rubric/evaluator.hpp"

namespace grader {

struct aggregate_result {
    /**
     * @brief 总分，范围 [0, 100]，保留一位小数
     */
    double total_score = 0;

    /**
     * @brief 等级，比如 A
     */
    std::string grade;
};

/**
 * @brief 计算加权总分和等级
 * 总分 = 100 * Σ(raw / max * weight) / Σweight，缺少得分的评分项记为 0 分。
 * 等级为第一个 score 不超过总分的阈值对应的等级。
 * 同样的输入总是得到同样的结果。
 * @param entries 各评分项的得分
 * @param criteria 评分表，需要先通过 validate_rubric 的检查
 * @param thresholds 等级阈值，需要先通过 validate_thresholds 的检查
 * @throw aggregation_error 评分表权重之和为 0
 */
aggregate_result aggregate(const std::vector<score_entry> &entries,
                           const std::vector<rubric_criterion> &criteria,
                           const std::vector<grade_threshold> &thresholds);

/**
 * @brief 根据总分查找等级
 * 阈值为空时返回空字符串
 */
std::string letter_grade(double total_score, const std::vector<grade_threshold> &thresholds);

/**
 * @brief 检查评分表
 * @throw aggregation_error 评分表为空、权重为负、权重之和为 0、满分不为正数或者 id 重复
 */
void validate_rubric(const std::vector<rubric_criterion> &criteria);

/**
 * @brief 检查等级阈值
 * @throw configuration_error 阈值为空、不严格递减、超出 [0, 100] 或者最低阈值不为 0
 */
void validate_thresholds(const std::vector<grade_threshold> &thresholds);

}  // namespace grader
