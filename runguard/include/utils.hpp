#pragma once

#include <string>

bool is_number(const std::string &s);

/**
 * @brief 根据用户名查找用户 id
 * @throw std::runtime_error 用户不存在
 */
int get_userid(const char *name);

/**
 * @brief 根据用户组名查找用户组 id
 * @throw std::runtime_error 用户组不存在
 */
int get_groupid(const char *name);
