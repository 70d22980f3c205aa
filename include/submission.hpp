#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <vector>
#include "common/status.hpp"
#include "rubric/evaluator.hpp"

namespace grader {

/**
 * @brief 提交级别的错误
 */
struct error_info {
    error_kind kind = error_kind::INTERNAL;
    std::string message;
};

/**
 * @brief 表示一次评测中的提交
 * 由处理该提交的评测流程独占。
 */
struct submission {
    /**
     * @brief 提交引用，同时作为提交的标识
     */
    std::string reference;

    /**
     * @brief 本次评测的唯一 id，格式为 grade_<yyyymmdd_hhmmss>_<8 位十六进制>
     */
    std::string grading_id;

    std::chrono::system_clock::time_point started_at;
    std::chrono::system_clock::time_point finished_at;

    /**
     * @brief 识别到的项目语言，拉取失败时为空
     */
    std::string language;

    /**
     * @brief 入口文件，拉取失败时为空
     */
    std::string entry_point;
};

/**
 * @brief 生成评测 id
 */
std::string generate_grading_id();

}  // namespace grader
