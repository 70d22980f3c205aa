#pragma once

#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include "common/cancellation.hpp"
#include "config.hpp"
#include "rubric/criterion.hpp"
#include "sandbox/sandbox.hpp"
#include "workspace.hpp"

namespace grader {

/**
 * @brief 评测一个评分项时可以访问的资源
 * 所有成员都是只读的，同一个提交的多个评分项可以并行评测。
 */
struct evaluation_context {
    const workspace &ws;
    const grader_config &config;
    const sandbox &runner;
    const cancellation_token &token;
};

/**
 * @brief 一个评分项的得分
 */
struct score_entry {
    std::string criterion_id;

    /**
     * @brief 得分，范围 [0, max_score]
     */
    double raw_score = 0;

    double max_score = 0;

    /**
     * @brief 给分理由，比如 "3/4 assertions passed"
     */
    std::string rationale;

    /**
     * @brief 评测过程中沙箱的输出，用于生成报告
     */
    std::string log;

    /**
     * @brief log 是否因为超过输出限制而被截断
     */
    bool truncated = false;

    /**
     * @brief 评分项评测失败时的错误原因，此时 raw_score 为 0
     */
    std::optional<std::string> error;
};

/**
 * @brief 表示一种评分项的评测逻辑
 */
struct evaluator {
    virtual ~evaluator();

    /**
     * @brief evaluator 负责评测哪种类型的评分项
     */
    virtual criterion_kind kind() const = 0;

    /**
     * @brief 评测一个评分项
     * 调用方确保 criterion.kind() == kind()
     * 选手程序的错误行为（超时、崩溃、输出格式错误）应当体现为低分或者抛出 criterion_evaluation_error，
     * 而不应该影响其他评分项。
     * @throw criterion_evaluation_error 选手程序的输出无法评分
     * @throw sandbox_infrastructure_error 沙箱无法工作
     * @throw cancelled_error 评测被取消
     */
    virtual score_entry evaluate(const evaluation_context &ctx, const rubric_criterion &criterion) const = 0;
};

/**
 * @brief 按照评分表评测一个提交
 * 根据评分项的类型分派给对应的 evaluator。
 */
struct rubric_evaluator {
    /**
     * @brief 构造时注册功能测试、检索指标、静态检查三种 evaluator
     */
    rubric_evaluator();

    /**
     * @brief 注册评测器，同一类型的评测器会被替换
     */
    void register_evaluator(std::unique_ptr<evaluator> &&e);

    /**
     * @brief 评测提交的所有评分项
     * 单个评分项失败时该评分项记 0 分并记录错误原因，不影响其他评分项。
     * @param criteria 评分表
     * @param parallel 为真时各评分项并行评测，每个评分项使用独立的运行目录
     * @return 与 criteria 顺序一致的得分
     * @throw sandbox_infrastructure_error 沙箱无法工作，整个提交评测失败
     * @throw cancelled_error 评测被取消
     */
    std::vector<score_entry> evaluate(const evaluation_context &ctx,
                                      const std::vector<rubric_criterion> &criteria,
                                      bool parallel = false) const;

    /**
     * @brief 评测单个评分项，将评分项错误转换为 0 分
     */
    score_entry evaluate_one(const evaluation_context &ctx, const rubric_criterion &criterion) const;

private:
    std::map<criterion_kind, std::unique_ptr<evaluator>> evaluators;
};

}  // namespace grader
