#pragma once

#include <filesystem>
#include <map>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>
#include "rubric/criterion.hpp"

namespace grader {

/**
 * @brief 描述一种项目语言如何被识别、安装依赖和启动
 */
struct language_profile {
    std::string name;

    /**
     * @brief 依赖描述文件，比如 package.json、requirements.txt
     * 代码根目录存在其中任意一个文件时认为项目使用该语言
     */
    std::vector<std::string> dependency_files;

    /**
     * @brief 候选的入口文件，按顺序查找
     */
    std::vector<std::string> entry_points;

    /**
     * @brief 安装依赖的命令，评分项命令中的 ${install_command} 会被展开为该命令
     */
    std::vector<std::string> install_command;

    /**
     * @brief 启动应用的命令，评分项命令中的 ${run_command} 会被展开为该命令
     * 命令中可以使用 ${entry_point} 占位符
     */
    std::vector<std::string> run_command;
};

/**
 * @brief 分数线，总分不低于 score 时评为 letter
 */
struct grade_threshold {
    double score;
    std::string letter;
};

/**
 * @brief 评测系统的配置
 * 配置加载后不再修改，通过 std::shared_ptr<const grader_config> 在所有 worker 之间共享。
 */
struct grader_config {
    /**
     * @brief 单次沙箱运行的时钟时间限制（秒）
     */
    double sandbox_timeout_seconds = 60;

    /**
     * @brief 单次沙箱运行的 CPU 时间限制（秒），为 0 时与时钟时间限制相同
     */
    double sandbox_cpu_time_seconds = 0;

    /**
     * @brief 单次沙箱运行的内存限制（KB）
     */
    size_t sandbox_memory_limit = 2097152;

    /**
     * @brief 单次沙箱运行的标准输出、标准错误的最大字节数，超出部分将被截断
     */
    size_t sandbox_output_limit = 65536;

    /**
     * @brief 沙箱中同时存在的最大进程数
     * 通过运行用户的 RLIMIT_NPROC 实现，只在设置了 run_user 时生效。
     * 并发评测时每个运行用户的进程数是共享的。
     */
    size_t sandbox_process_limit = 256;

    /**
     * @brief 沙箱中的程序是否可以访问网络
     */
    bool sandbox_network = false;

    /**
     * @brief 批量评测的并发数
     */
    size_t max_concurrency = 4;

    /**
     * @brief 拉取提交的时间限制（秒）
     */
    double acquisition_timeout_seconds = 60;

    /**
     * @brief 批量评测的总时间限制（秒），为 0 时不限制
     */
    double batch_deadline_seconds = 0;

    /**
     * @brief 是否并发评测同一个提交的各个评分项
     */
    bool parallel_criteria = false;

    /**
     * @brief 存放代码快照和运行目录的文件夹
     *
     * RUN_DIR
     * └── grade_20240101_120000_1a2b3c4d // 一次评测
     *     ├── snapshot // 冻结的代码快照（只读）
     *     └── run-<uuid> // 一次沙箱运行
     *         ├── work // 代码快照的可写副本，选手程序的工作目录
     *         ├── fixture // 评分项的测试脚本、测试文档
     *         ├── program.out // 标准输出
     *         ├── program.err // 标准错误
     *         ├── program.meta // runguard 的运行结果
     *         └── runguard.log // runguard 自身的日志
     */
    std::filesystem::path run_dir;

    /**
     * @brief runguard 可执行文件的路径
     */
    std::filesystem::path runguard;

    /**
     * @brief git 可执行文件
     */
    std::string git = "git";

    /**
     * @brief 运行选手程序的用户和用户组，为空时使用当前用户
     */
    std::string run_user;
    std::string run_group;

    /**
     * @brief 传给选手程序的环境变量（比如测试用的 API Key、CHUNK_LENGTH、PORT）
     */
    std::map<std::string, std::string> environment;

    /**
     * @brief 是否将 environment 写入工作目录下的 .env 文件
     */
    bool write_env_file = false;

    /**
     * @brief 报告中每个评分项日志摘录的最大字节数
     */
    size_t report_excerpt_bytes = 4096;

    /**
     * @brief 调试模式，评测完成后不删除代码快照和运行目录
     */
    bool keep_workspace = false;

    std::vector<language_profile> languages;

    std::vector<rubric_criterion> rubric;

    /**
     * @brief 分数线，按分数从高到低排列，最后一条分数线必须为 0
     */
    std::vector<grade_threshold> grade_thresholds;
};

/**
 * @brief 默认支持的语言：nodejs、python、golang、dart
 */
std::vector<language_profile> default_language_profiles();

/**
 * @brief 默认分数线：A >= 90, B >= 80, C >= 70, D >= 60, F >= 0
 */
std::vector<grade_threshold> default_grade_thresholds();

void from_json(const nlohmann::json &j, language_profile &profile);
void from_json(const nlohmann::json &j, grade_threshold &threshold);
void from_json(const nlohmann::json &j, grader_config &config);

/**
 * @brief 从 json 文件加载配置
 * 评分项 fixtures 中的相对路径相对于配置文件所在目录。
 * @throw configuration_error 配置文件不存在或者格式错误
 */
grader_config load_config(const std::filesystem::path &path);

}  // namespace grader
