#pragma once

#include <memory>
#include <string>
#include "common/cancellation.hpp"
#include "common/status.hpp"
#include "config.hpp"
#include "sandbox/sandbox.hpp"
#include "workspace.hpp"

namespace grader {

/**
 * @brief 提交引用的类型
 */
enum class reference_type {
    /**
     * @brief 远程 git 仓库，比如 https://github.com/owner/repo.git 或 git@github.com:owner/repo.git
     */
    REMOTE,

    /**
     * @brief 本地文件夹，比如 /home/student/repo 或 file:///home/student/repo
     */
    LOCAL
};

struct submission_reference {
    reference_type type;

    /**
     * @brief 远程仓库的地址，或者本地文件夹的绝对路径
     */
    std::string location;
};

/**
 * @brief 检查提交引用的格式
 * @throw acquisition_error(MALFORMED) 引用格式不合法
 */
submission_reference parse_reference(const std::string &reference);

/**
 * @brief 根据 git clone 的错误输出判断拉取失败的原因
 * @return UNAUTHORIZED 或者 NOT_FOUND
 */
error_kind classify_clone_failure(const std::string &stderr_text);

/**
 * @brief 拉取提交代码
 * 将提交引用指向的代码复制到 RUN_DIR/<grading id>/snapshot，检查项目结构后冻结为只读快照。
 */
struct acquirer {
    acquirer(std::shared_ptr<const grader_config> config, const sandbox &runner);

    /**
     * @brief 拉取提交
     * 拉取失败时已经创建的临时文件夹会被删除。
     * @param reference 提交引用
     * @param grading_id 本次评测的 id，作为工作区文件夹名
     * @param token 取消标记，拉取过程中被取消时 git 进程会被终止
     * @return 包含只读代码快照的工作区
     * @throw acquisition_error 拉取失败
     * @throw cancelled_error 评测被取消
     * @throw sandbox_infrastructure_error 无法创建工作区或者无法运行 git
     */
    workspace acquire(const std::string &reference, const std::string &grading_id, const cancellation_token &token) const;

private:
    std::shared_ptr<const grader_config> config;
    const sandbox &runner;

    void clone(const submission_reference &ref, const workspace &ws, const cancellation_token &token) const;
    void copy_local(const submission_reference &ref, const workspace &ws) const;
    void verify_structure(workspace &ws) const;
};

}  // namespace grader
