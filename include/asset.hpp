#pragma once

#include <filesystem>
#include <memory>
#include <string>

namespace grader {

/**
 * @class asset
 * @brief 评测时需要放到运行目录中的文件，比如测试脚本、检索测试用的文档
 */
struct asset {
    /**
     * @brief 该文件在运行目录中的文件名
     * @note 可以包含子目录，比如 name="documents/ml.txt"，那么评测脚本可以通过
     *      ${fixture}/documents/ml.txt 来访问这个文件
     */
    std::string name;

    asset(const std::string &name);
    virtual ~asset();

    /**
     * @brief 将文件写入到指定目录
     * @param dir 要写入的目录
     * @note 该函数会抛出异常
     */
    virtual void fetch(const std::filesystem::path &dir) const = 0;
};

/**
 * @brief 表示一个已经在本地的文件或文件夹
 */
struct local_asset : public asset {
    std::filesystem::path path;

    local_asset(const std::string &name, const std::filesystem::path &path);

    void fetch(const std::filesystem::path &dir) const override;
};

/**
 * @brief 表示已经知道内容的文本文件
 */
struct text_asset : public asset {
    std::string text;

    text_asset(const std::string &name, const std::string &text);

    void fetch(const std::filesystem::path &dir) const override;
};

typedef std::shared_ptr<asset> asset_ptr;

}  // namespace grader
