#pragma once

#include <memory>
#include <string>
#include <vector>
#include "acquire/acquirer.hpp"
#include "common/cancellation.hpp"
#include "config.hpp"
#include "monitor/monitor.hpp"
#include "result.hpp"
#include "rubric/evaluator.hpp"
#include "sandbox/sandbox.hpp"
#include "worker.hpp"

namespace grader {

/**
 * @brief 评测引擎
 * 评测一个提交的流程为：拉取提交 -> 按照评分表逐项评测 -> 汇总总分和等级 -> 生成报告。
 * 配置在构造后不再修改，多个线程可以同时调用 grade_submission。
 */
struct grading_engine {
    /**
     * @brief 检查配置并创建评测引擎
     * 评分表、等级阈值、评分项文件、runguard 路径有误时在评测开始前抛出异常。
     * @throw aggregation_error 评分表有误
     * @throw configuration_error 等级阈值有误、评分项文件不存在或者找不到 runguard
     */
    explicit grading_engine(grader_config config);

    grading_engine(const grading_engine &) = delete;
    grading_engine &operator=(const grading_engine &) = delete;

    /**
     * @brief 评测一个提交
     * 提交级别的错误（拉取失败、沙箱无法工作、取消、评测系统缺陷）都会转换为失败的评测结果，不会抛出异常。
     * @param reference 提交引用，比如 https://github.com/owner/repo.git
     * @return 评测结果
     */
    grading_result grade_submission(const std::string &reference) const;
    grading_result grade_submission(const std::string &reference, const cancellation_token &token) const;

    /**
     * @brief 批量评测
     * 配置了 batch_deadline_seconds 时超过时限后取消剩余的评测。
     * @param concurrency 同时评测的提交数，为 0 时使用配置中的 max_concurrency
     * @return 与 references 顺序一致的评测结果
     */
    std::vector<grading_result> grade_batch(const std::vector<std::string> &references, size_t concurrency = 0);
    std::vector<grading_result> grade_batch(const std::vector<std::string> &references, size_t concurrency, const cancellation_token &token);

    /**
     * @brief 根据 batch_deadline_seconds 创建批量评测的取消标记
     */
    std::unique_ptr<cancellation_token> create_batch_token() const;

    void register_monitor(std::unique_ptr<monitor> &&m);

    const grader_config &get_config() const;

private:
    std::shared_ptr<const grader_config> config;
    sandbox runner;
    acquirer fetcher;
    rubric_evaluator evaluator;
    batch_orchestrator orchestrator;
};

}  // namespace grader
