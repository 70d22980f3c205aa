#pragma once

#include <string>
#include "result.hpp"

namespace grader {

enum class worker_state {
    /**
     * @brief worker 线程启动
     */
    START,

    /**
     * @brief worker 正在评测提交
     */
    GRADING,

    /**
     * @brief worker 空闲，等待提交
     */
    IDLE,

    /**
     * @brief worker 因为队列关闭而正常退出
     */
    STOPPED,

    /**
     * @brief worker 因为未处理的异常而退出
     */
    CRASHED
};

const char *get_display_message(worker_state state);

/**
 * @brief 执行监控行为
 * 监控函数会被多个 worker 线程同时调用，实现需要保证线程安全。
 * 监控函数抛出的异常会被记录日志并忽略，不影响评测。
 */
struct monitor {
    virtual ~monitor();

    /**
     * @brief 监控上报当前已经开始评测某个提交
     * @param index 提交在批量评测输入中的位置
     * @param reference 提交引用
     */
    virtual void start_submission(size_t index, const std::string &reference);

    /**
     * @brief 监控上报当前已经完成一个提交的评测
     * @param index 提交在批量评测输入中的位置
     * @param result 评测结果，包括失败和取消的结果
     */
    virtual void end_submission(size_t index, const grading_result &result);

    /**
     * @brief 监控上报当前某个 Worker 的状态
     * @param worker_id Worker 编号
     * @param state Worker 的新状态
     * @param information 如果 Worker 崩溃，则为错误原因，用于日志记录
     */
    virtual void worker_state_changed(int worker_id, worker_state state, const std::string &information);

    /**
     * @brief 监控上报评测系统的错误
     */
    virtual void report_error(const std::string &message);
};

/**
 * @brief 通过 glog 输出监控信息
 */
struct log_monitor : public monitor {
    void start_submission(size_t index, const std::string &reference) override;
    void end_submission(size_t index, const grading_result &result) override;
    void worker_state_changed(int worker_id, worker_state state, const std::string &information) override;
    void report_error(const std::string &message) override;
};

}  // namespace grader
