#pragma once

#include <filesystem>
#include <set>
#include <string>

namespace grader {

/**
 * @brief 读取文本文件的全部内容
 * @param path 文本文件路径
 * @return 文本文件的内容(没有指定编码)
 */
std::string read_file_content(const std::filesystem::path &path);

/**
 * @brief 读取文本文件的全部内容
 * @param path 文本文件路径
 * @param def 若文件不存在，返回 def
 * @return 文本文件的内容(没有指定编码)
 */
std::string read_file_content(std::filesystem::path const &path, const std::string &def);

/**
 * @brief 将文本写入文件，覆盖原有内容
 * @throw std::system_error 如果文件无法写入
 */
void write_file_content(const std::filesystem::path &path, const std::string &content);

bool utf8_check_is_valid(const std::string &string);

/**
 * @brief 将不合法的 UTF-8 字节替换为 U+FFFD，使得字符串可以写入 JSON
 */
std::string utf8_sanitize(const std::string &string);

/**
 * @brief 截取字符串的前 max_bytes 个字节，并保证不会截断 UTF-8 多字节字符
 */
std::string utf8_truncate(const std::string &string, size_t max_bytes);

/**
 * @brief 断言 subpath 一定不会出现返回上一层目录的情况
 * 评分表中的文件名会拼接到选手的代码目录下，如果文件名包含 "../" 或者是绝对路径，
 * 就有可能读到代码目录以外的文件。
 * @param subpath 被检查的文件名
 */
std::string assert_safe_path(const std::string &subpath);

/**
 * @brief 递归复制文件夹
 * @param from 源文件夹
 * @param to 目标文件夹，不存在时会被创建
 * @param excluded 需要跳过的文件或文件夹名（比如 .git）
 * @throw std::filesystem::filesystem_error 复制失败
 */
void copy_directory(const std::filesystem::path &from, const std::filesystem::path &to, const std::set<std::string> &excluded = {});

/**
 * @brief 递归设置文件夹内所有文件的写权限
 * 冻结代码快照时移除写权限，删除快照之前需要恢复文件夹的写权限。
 * @param dir 文件夹
 * @param writable 真为添加所有者写权限，假为移除所有写权限
 */
void set_tree_writable(const std::filesystem::path &dir, bool writable);

}  // namespace grader
