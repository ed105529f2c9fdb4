#pragma once

#include <string>

/**
 * @brief 查找用户 id
 * @param user 用户名或者数字形式的用户 id
 * @return 用户 id，用户不存在时返回 -1
 */
int get_userid(const std::string &user);

/**
 * @brief 查找组 id
 * @param group 组名或者数字形式的组 id
 * @return 组 id，组不存在时返回 -1
 */
int get_groupid(const std::string &group);

/**
 * @brief 查找用户的主组 id
 * @return 组 id，用户不存在时返回 -1
 */
int get_primary_groupid(const std::string &user);
