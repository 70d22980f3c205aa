#pragma once

#include <filesystem>
#include <map>
#include <memory>
#include <string>
#include <vector>
#include "asset.hpp"
#include "common/cancellation.hpp"
#include "config.hpp"
#include "workspace.hpp"

namespace grader {

/**
 * @brief 单次沙箱运行的资源限制
 */
struct execution_limits {
    /**
     * @brief 时钟时间限制（秒），超时后 runguard 会杀死整个进程树
     */
    double wall_time = 60;

    /**
     * @brief CPU 时间限制（秒），为 0 时不限制
     */
    double cpu_time = 0;

    /**
     * @brief 内存限制（KB），为 0 时不限制
     */
    size_t memory = 0;

    /**
     * @brief 标准输出和标准错误各自的最大字节数
     */
    size_t output = 65536;

    /**
     * @brief 最大进程数，为 0 时不限制
     */
    size_t nproc = 0;

    /**
     * @brief 是否允许访问网络
     */
    bool network = false;

    /**
     * @brief 是否切换到配置中的 run_user 运行，拉取代码时为假
     */
    bool use_run_user = true;
};

/**
 * @brief 一次沙箱运行的结果
 * 选手程序的各种异常行为（非零退出码、崩溃、超时、输出过多）都记录在这里，而不是抛出异常。
 */
struct execution_outcome {
    /**
     * @brief 退出码，因为信号终止时为 128 + 信号
     */
    int exit_status = -1;

    /**
     * @brief 终止进程的信号，没有时为 -1
     */
    int signal = -1;

    std::string stdout_text;
    std::string stderr_text;

    double wall_time = 0;
    double cpu_time = 0;

    /**
     * @brief 内存使用峰值（字节）
     */
    int64_t memory = 0;

    /**
     * @brief 输出是否因为超过限制而被截断
     */
    bool truncated = false;

    /**
     * @brief 是否因为超出时钟时间限制而被杀死
     */
    bool timeout = false;

    /**
     * @brief 是否因为超出 CPU 时间限制而被杀死
     */
    bool cpu_limit_exceeded = false;

    /**
     * @brief 是否因为评测被取消而被杀死
     */
    bool cancelled = false;

    bool timed_out() const;

    /**
     * @brief 程序是否正常退出且退出码为 0
     */
    bool succeeded() const;
};

/**
 * @brief 一次沙箱运行的请求
 */
struct sandbox_request {
    /**
     * @brief 运行的命令，支持以下占位符：
     * ${workspace} 代码副本所在目录（即工作目录）
     * ${fixture} 评分项文件所在目录
     * ${entry_point} 入口文件
     * ${language} 项目语言
     * 整个参数为 ${install_command} 或 ${run_command} 时展开为语言配置中的对应命令
     */
    std::vector<std::string> command;

    execution_limits limits;

    /**
     * @brief 额外的环境变量，值中同样支持占位符
     */
    std::map<std::string, std::string> environment;

    /**
     * @brief 需要放到 ${fixture} 目录中的文件
     */
    std::vector<asset_ptr> fixtures;
};

/**
 * @brief 沙箱
 * 通过 runguard 在独立的进程组中运行不可信的命令，限制时间、内存、进程数和输出大小。
 * 每次运行都有独立的运行目录，多个线程可以同时调用同一个 sandbox 对象。
 */
struct sandbox {
    explicit sandbox(std::shared_ptr<const grader_config> config);

    /**
     * @brief 根据全局配置生成资源限制
     * @param timeout_seconds 时钟时间限制，为 0 时使用 sandbox_timeout_seconds
     */
    execution_limits default_limits(double timeout_seconds = 0) const;

    /**
     * @brief 在工作区的可写副本中运行命令
     * 创建运行目录 root/run-<uuid>，复制代码快照到 work 目录，写入评分项文件和 .env 文件，
     * 展开命令中的占位符后调用 execute 运行。运行目录在返回前删除。
     * @throw sandbox_infrastructure_error 无法创建运行目录或者 runguard 工作不正常
     */
    execution_outcome run(const workspace &ws, const sandbox_request &request, const cancellation_token &token) const;

    /**
     * @brief 通过 runguard 运行命令
     * @param run_dir 存放输出文件和 meta 文件的目录
     * @param work_dir 命令的工作目录
     * @throw sandbox_infrastructure_error 无法启动 runguard、runguard 报告内部错误
     */
    execution_outcome execute(const std::filesystem::path &run_dir,
                              const std::filesystem::path &work_dir,
                              const std::vector<std::string> &command,
                              const execution_limits &limits,
                              const std::map<std::string, std::string> &environment,
                              const cancellation_token &token) const;

private:
    std::shared_ptr<const grader_config> config;
};

/**
 * @brief 展开命令中的占位符
 * @param command 命令
 * @param variables 占位符的值，比如 {"workspace", "/tmp/run/work"} 用于替换 ${workspace}
 * @param profile 语言配置，用于展开 ${install_command} 和 ${run_command}
 */
std::vector<std::string> expand_command(const std::vector<std::string> &command,
                                        const std::map<std::string, std::string> &variables,
                                        const language_profile &profile);

}  // namespace grader
