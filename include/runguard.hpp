#pragma once

#include <cstdint>
#include <filesystem>
#include <string>

namespace grader {

/**
 * @brief runguard 写入 meta 文件的运行结果
 */
struct runguard_result {
    /**
     * @brief 时钟时间
     * 单位为秒
     */
    double wall_time = -1;

    /**
     * @brief 用户时间（指在用户态下运行的 CPU 时间）
     * 单位为秒，如果是多进程程序，所有已回收子进程的 CPU 时间会累加
     */
    double user_time = -1;

    /**
     * @brief 系统时间（指在内核态下运行的时间）
     */
    double sys_time = -1;

    /**
     * @brief CPU 时间，为用户时间和系统时间之和
     */
    double cpu_time = -1;

    int exitcode = -1;

    /**
     * @brief 终止子进程的信号，没有收到信号时为 -1
     */
    int signal = -1;

    /**
     * @brief runguard 自身出错的原因，为空表示 runguard 正常工作
     */
    std::string internal_error;

    /**
     * @brief 实际内存使用峰值（单位为字节）
     */
    int64_t memory = -1;

    /**
     * @brief 时间限制结果，为 soft-timelimit、hard-timelimit 或空
     */
    std::string time_result;
    std::string wall_result;
    std::string cpu_result;

    /**
     * @brief 被截断的输出流，比如 "stdout,stderr"
     */
    std::string output_truncated;

    int64_t stdout_bytes = -1;
    int64_t stderr_bytes = -1;
};

/**
 * @brief 读取 runguard 的 meta 文件
 * @param metafile meta 文件路径
 * @throw std::runtime_error meta 文件不存在或者为空
 */
runguard_result read_runguard_result(const std::filesystem::path &metafile);

}  // namespace grader
