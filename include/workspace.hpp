#pragma once

#include <filesystem>
#include <string>
#include "config.hpp"

namespace grader {

/**
 * @brief 一次评测的工作区
 * 工作区拥有 root 文件夹，其中包含冻结的代码快照以及所有沙箱运行目录。
 * 工作区只能移动不能复制，析构时删除整个 root 文件夹（调试模式除外），
 * 因此无论评测成功、失败、抛出异常还是被取消，临时文件都会被清理。
 */
struct workspace {
    /**
     * @brief 本次评测的根目录，RUN_DIR/<grading id>
     */
    std::filesystem::path root;

    /**
     * @brief 冻结的代码快照，root/snapshot，只读
     */
    std::filesystem::path snapshot;

    /**
     * @brief 识别到的项目语言
     */
    language_profile language;

    /**
     * @brief 入口文件相对于代码根目录的路径，比如 main.py
     */
    std::string entry_point;

    /**
     * @brief 环境变量模板文件名，比如 .env.example，不存在时为空
     */
    std::string env_template;

    bool has_readme = false;

    /**
     * @brief 为真时析构不删除 root 文件夹，用于调试
     */
    bool keep = false;

    workspace();
    explicit workspace(const std::filesystem::path &root);
    workspace(workspace &&other);
    workspace(const workspace &) = delete;
    ~workspace();

    workspace &operator=(workspace &&other);
    workspace &operator=(const workspace &) = delete;

    /**
     * @brief 删除工作区文件夹
     * 不会抛出异常，删除失败时只记录日志
     */
    void release() noexcept;
};

}  // namespace grader
