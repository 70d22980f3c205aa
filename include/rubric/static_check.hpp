#pragma once

#include <filesystem>
#include <set>
#include <string>
#include "rubric/evaluator.hpp"

namespace grader {

/**
 * @brief 读取环境变量模板中声明的变量名
 * 支持 "KEY=value" 和 "export KEY=value"，忽略注释和空行
 */
std::set<std::string> parse_env_template(const std::string &content);

/**
 * @brief 静态检查评测器
 * 只读访问代码快照，不运行选手代码。
 */
struct static_check_evaluator : public evaluator {
    criterion_kind kind() const override;
    score_entry evaluate(const evaluation_context &ctx, const rubric_criterion &criterion) const override;
};

}  // namespace grader
