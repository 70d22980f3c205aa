#pragma once

#include <boost/stacktrace.hpp>
#include <memory>
#include <stdexcept>
#include "common/status.hpp"

namespace grader {

struct grader_exception : std::exception {
    grader_exception();
    explicit grader_exception(const std::string &message);

    friend std::ostream &operator<<(std::ostream &os, const grader_exception &ex);

    const char *what() const noexcept override;

private:
    std::string message;
    std::shared_ptr<boost::stacktrace::stacktrace> stacktrace;
};

/**
 * @brief 表示拉取提交失败
 * 包括引用格式不合法、仓库不存在、没有访问权限、拉取超时、仓库缺少入口文件等情况。
 * 拉取失败的提交不会进行任何评分项的评测。
 */
struct acquisition_error : public grader_exception {
    acquisition_error(error_kind kind, const std::string &message);

    /**
     * @brief 失败原因，只可能是 NOT_FOUND、UNAUTHORIZED、TIMEOUT、MALFORMED 之一
     */
    error_kind kind() const noexcept;

private:
    error_kind reason;
};

/**
 * @brief 表示沙箱本身出现了问题（而不是选手程序出错）
 * 比如无法创建运行目录、无法启动 runguard、runguard 报告内部错误等。
 * 这种错误会导致整个提交评测失败。
 */
struct sandbox_infrastructure_error : public grader_exception {
    sandbox_infrastructure_error();
    explicit sandbox_infrastructure_error(const std::string &message);
};

/**
 * @brief 表示单个评分项评测失败，比如评测脚本输出格式不正确
 * 只影响当前评分项，该评分项记 0 分
 */
struct criterion_evaluation_error : public grader_exception {
    criterion_evaluation_error();
    explicit criterion_evaluation_error(const std::string &message);
};

/**
 * @brief 评分表配置错误（比如权重和为 0），在评测开始前抛出
 */
struct aggregation_error : public grader_exception {
    aggregation_error();
    explicit aggregation_error(const std::string &message);
};

/**
 * @brief 配置文件错误，在评测开始前抛出
 */
struct configuration_error : public grader_exception {
    configuration_error();
    explicit configuration_error(const std::string &message);
};

/**
 * @brief 评测被取消（批量评测超时或者调用方主动取消）
 */
struct cancelled_error : public grader_exception {
    cancelled_error();
    explicit cancelled_error(const std::string &message);
};

}  // namespace grader
