#pragma once

#include <fmt/core.h>
#include <sys/types.h>
#include <boost/lexical_cast.hpp>
#include <chrono>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace fmt {
template <>
struct formatter<std::filesystem::path> {
    template <typename ParseContext>
    constexpr auto parse(ParseContext &ctx) { return ctx.begin(); }

    template <typename FormatContext>
    auto format(const std::filesystem::path &p, FormatContext &ctx) const {
        return format_to(ctx.out(), "{}", p.string());
    }
};
}  // namespace fmt

namespace grader {

template <typename T>
struct to_string_cont {
    template <typename ContainerT>
    static void to_string(ContainerT &cont, const T &element) {
        cont.push_back(boost::lexical_cast<std::string>(element));
    }
};

template <>
struct to_string_cont<std::filesystem::path> {
    template <typename ContainerT>
    static void to_string(ContainerT &cont, const std::filesystem::path &element) {
        cont.push_back(element.string());
    }
};

template <typename T>
struct to_string_cont<std::vector<T>> {
    template <typename ContainerT>
    static void to_string(ContainerT &cont, const std::vector<T> &vec) {
        for (const T &value : vec)
            to_string_cont<T>::to_string(cont, value);
    }
};

/**
 * @brief 将参数 args 的内容通过 to_string 转换为字符串并装入容器中
 * @param cont 字符串容器
 * @param args 按顺序 to_string 转换为字符串并装入容器（如果 arg 本身为容器，则遍历这个容器将各个元素加入结果容器中）
 * @code{.cpp}
 *     std::vector<std::string> argv;
 *     // argv = {"/usr/bin/runguard", "-T", "1.5", "--", "sh", "-c", "exit 1"}
 *     to_string_list(argv, runguard_path, "-T", 1.5, "--", command);
 * @endcode
 */
template <typename ContainerT, typename Head, typename... Args>
void to_string_list(ContainerT &cont, const Head &head, const Args &... args) {
    to_string_cont<std::decay_t<const Head>>::to_string(cont, head);
    if constexpr (sizeof...(args) > 0)
        to_string_list(cont, args...);
}

/**
 * @brief 启动外部程序，不等待程序结束
 * @param argv 外部命令的路径 (argv[0]) 和 参数 (argv)
 * @param output_file 外部程序的标准输出和标准错误将被重定向到该文件
 * @return 子进程的 pid
 * @throw std::system_error 如果无法打开输出文件或者 fork 失败
 */
pid_t spawn_program(const std::vector<std::string> &argv, const std::filesystem::path &output_file);

/**
 * @brief 检查子进程是否已经结束，不阻塞
 * @param pid 由 spawn_program 返回的子进程 pid
 * @return 子进程结束时返回退出码（因为信号崩溃则返回 128 + 信号），否则返回空
 * @throw std::system_error 如果 waitpid 失败
 */
std::optional<int> try_wait_program(pid_t pid);

/**
 * @brief 根据 key 来查找环境变量
 * @param key 环境变量的键
 * @param def_value 如果键不存在，返回该参数
 * @return 环境变量的值，或者不存在时返回 def_value
 */
std::string get_env(const std::string &key, const std::string &def_value);

/**
 * @brief 生成一个随机的 uuid 字符串
 */
std::string random_uuid();

/**
 * @brief 从构造开始计时
 */
struct elapsed_time {
    elapsed_time();

    double seconds() const;

private:
    std::chrono::steady_clock::time_point start;
};

}  // namespace grader
