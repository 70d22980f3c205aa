#pragma once

#include <optional>
#include <string>
#include <vector>
#include "rubric/evaluator.hpp"

namespace grader {

/**
 * @brief 测试脚本报告的测试结果
 */
struct test_report {
    size_t passed = 0;
    size_t total = 0;
    std::vector<std::string> failures;
};

/**
 * @brief 从测试脚本的标准输出中解析测试结果
 * 以最后一个合法的 json 行为准，找不到时尝试解析 GoogleTest 的统计输出。
 * @return 找不到测试结果时返回空
 */
std::optional<test_report> parse_test_report(const std::string &output);

/**
 * @brief 功能测试评测器
 * 在代码副本中运行测试命令，得分为 max_score * passed / total。
 * 超时、超出 CPU 时间、崩溃且没有测试结果时得 0 分。
 */
struct functional_test_evaluator : public evaluator {
    criterion_kind kind() const override;
    score_entry evaluate(const evaluation_context &ctx, const rubric_criterion &criterion) const override;
};

}  // namespace grader
