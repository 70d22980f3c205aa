#pragma once

#include <atomic>
#include <chrono>
#include <optional>

namespace grader {

/**
 * @brief 取消标记
 * 批量评测中所有 worker 共享同一个取消标记。调用 cancel 或者超过截止时间后，
 * 还未开始评测的提交直接标记为取消，正在评测的提交会终止沙箱中的进程树。
 * 该结构体可以被多个线程同时读取。
 */
struct cancellation_token {
    cancellation_token();

    /**
     * @param deadline 截止时间，超过截止时间后视为已取消
     */
    explicit cancellation_token(std::chrono::steady_clock::time_point deadline);

    cancellation_token(const cancellation_token &) = delete;
    cancellation_token &operator=(const cancellation_token &) = delete;

    void cancel();

    /**
     * @brief 是否已经被取消或者已经超过截止时间
     */
    bool cancelled() const;

    /**
     * @brief 如果已经被取消，抛出 cancelled_error
     */
    void throw_if_cancelled() const;

private:
    std::atomic<bool> flag;
    std::optional<std::chrono::steady_clock::time_point> deadline;
};

}  // namespace grader
