#pragma once

#include "runguard_options.hpp"

/**
 * @brief 根据 opt 的设置隔离命名空间
 * 只在 runguard 进程中调用一次，子进程会继承新的命名空间。
 * 非特权用户无法创建新的命名空间，此时只记录警告。
 */
void isolate_namespaces(const struct runguard_options &opt);

/**
 * @brief 限制当前进程的资源使用
 * 在 fork 出的子进程中、execvp 之前调用。
 */
void set_restrictions(const struct runguard_options &opt);
