#pragma once

#include <cstdint>
#include <limits>
#include <string>
#include <vector>

/**
 * @brief 时间限制，超过 soft 记为超时，超过 hard 时终止进程树
 */
struct time_limit {
    double soft, hard;
};

struct runguard_options {
    /**
     * @brief 选手程序的工作目录
     */
    std::string work_dir;

    size_t nproc = std::numeric_limits<size_t>::max();
    int user_id = -1;
    int group_id = -1;

    bool use_wall_limit = false;
    struct time_limit wall_limit;
    bool use_cpu_limit = false;
    struct time_limit cpu_limit;

    int64_t memory_limit = -1;  // 字节
    int64_t stream_size = -1;   // 标准输出、标准错误各自保留的最大字节数
    bool no_core_dumps = false;

    /**
     * @brief 是否与宿主共享网络命名空间
     */
    bool share_network = false;

    std::string stdin_filename;
    std::string stdout_filename;
    std::string stderr_filename;

    /**
     * @brief 传给选手程序的环境变量，形如 KEY=VALUE，PATH 以外的宿主环境变量都会被清除
     */
    std::vector<std::string> env;

    std::string metafile_path;
    std::vector<std::string> command;
};
