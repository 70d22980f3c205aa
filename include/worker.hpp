#pragma once

#include <functional>
#include <memory>
#include <string>
#include <vector>
#include "common/cancellation.hpp"
#include "config.hpp"
#include "monitor/monitor.hpp"
#include "result.hpp"

/**
 * 批量评测相关函数
 * 批量评测时，调用线程作为生产者将提交在输入中的位置依次放入有界的评测队列，
 * concurrency 个 worker 线程从队列中取出提交并完成整个评测流程（拉取、评分、汇总、生成报告），
 * 结果写入预先分配好的、按照输入位置索引的结果数组中，因此输出顺序与输入顺序一致。
 *
 * 评测流程抛出的任何异常都会在 worker 中被捕获并转换为失败的评测结果，
 * 不会影响其他提交的评测，也不会使 worker 退出。
 */
namespace grader {

/**
 * @brief 评测一个提交的完整流程
 * 提交级别的错误应当体现在返回的评测结果中，抛出的异常只作为最后的保护。
 */
using grading_pipeline = std::function<grading_result(const std::string &reference, const cancellation_token &token)>;

struct batch_orchestrator {
    /**
     * @param config 全局配置，用于生成失败的评测结果
     * @param pipeline 评测一个提交的流程，会被多个 worker 线程同时调用
     */
    batch_orchestrator(std::shared_ptr<const grader_config> config, grading_pipeline pipeline);

    /**
     * @brief 注册监控器
     * 必须在 grade_all 之前注册
     */
    void register_monitor(std::unique_ptr<monitor> &&m);

    /**
     * @brief 批量评测
     * 取消标记被触发后，还未开始评测的提交直接得到 CANCELLED 的评测结果，
     * 正在评测的提交由评测流程负责终止沙箱，已经完成的结果不受影响。
     * @param references 提交引用
     * @param concurrency worker 数量，为 0 时使用配置中的 max_concurrency
     * @param token 取消标记
     * @return 与 references 顺序一致的评测结果，每个提交恰好有一个结果
     */
    std::vector<grading_result> grade_all(const std::vector<std::string> &references,
                                          size_t concurrency,
                                          const cancellation_token &token);

    /**
     * @brief 向所有的监控器报错
     */
    void report_error(const std::string &message);

private:
    std::shared_ptr<const grader_config> config;
    grading_pipeline pipeline;
    std::vector<std::unique_ptr<monitor>> monitors;

    void call_monitor(int worker_id, const std::function<void(monitor &)> &callback);
    grading_result make_failure(const std::string &reference, error_kind kind, const std::string &message) const;
};

}  // namespace grader
