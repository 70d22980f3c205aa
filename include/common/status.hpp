#pragma once

namespace grader {

/**
 * @brief 表示一个提交评测失败的原因
 * 评测成功的提交没有错误原因
 */
enum class error_kind {
    /**
     * @brief 提交引用的仓库或目录不存在
     */
    NOT_FOUND = 0,

    /**
     * @brief 没有权限访问提交引用的仓库或目录
     */
    UNAUTHORIZED = 1,

    /**
     * @brief 拉取提交超时
     */
    TIMEOUT = 2,

    /**
     * @brief 提交引用格式错误，或者拉取到的代码缺少可识别的项目入口
     */
    MALFORMED = 3,

    /**
     * @brief 沙箱基础设施错误
     * 比如 runguard 无法启动、无法创建运行目录、磁盘已满
     */
    SANDBOX_INFRASTRUCTURE = 4,

    /**
     * @brief 提交因为批量评测被取消或者超出批量评测时限而未完成评测
     */
    CANCELLED = 5,

    /**
     * @brief 评测系统内部错误，一般是评测流程本身的缺陷
     */
    INTERNAL = 6
};

const char *get_display_message(error_kind);

}  // namespace grader
