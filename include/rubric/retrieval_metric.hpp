#pragma once

#include <map>
#include <string>
#include <vector>
#include "rubric/evaluator.hpp"

namespace grader {

/**
 * @brief 检索测试脚本对一个问题的回答
 */
struct retrieval_response {
    std::string id;
    std::string query;

    /**
     * @brief 按照相关度从高到低排列的文档 id
     */
    std::vector<std::string> retrieved;

    std::string answer;
};

/**
 * @brief 从检索测试脚本的标准输出中解析回答
 * 以最后一个包含 results 字段的 json 行为准
 * @throw criterion_evaluation_error 找不到合法的结果
 */
std::vector<retrieval_response> parse_retrieval_responses(const std::string &output);

double precision_at_k(const std::vector<std::string> &retrieved, const std::vector<std::string> &relevant, size_t k);
double recall_at_k(const std::vector<std::string> &retrieved, const std::vector<std::string> &relevant, size_t k);
double reciprocal_rank(const std::vector<std::string> &retrieved, const std::vector<std::string> &relevant, size_t k);

/**
 * @brief 回答中出现的期望关键词比例，忽略大小写
 */
double keyword_relevance(const std::string &answer, const std::vector<std::string> &keywords);

/**
 * @brief 计算所有问题的平均指标值，缺少回答的问题记为 0
 */
double compute_metric(const retrieval_metric_spec &spec, const std::vector<retrieval_response> &responses);

/**
 * @brief 检索指标评测器
 */
struct retrieval_metric_evaluator : public evaluator {
    criterion_kind kind() const override;
    score_entry evaluate(const evaluation_context &ctx, const rubric_criterion &criterion) const override;
};

}  // namespace grader
