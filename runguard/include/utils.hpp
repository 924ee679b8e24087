#pragma once

#include <string>

namespace coexec::runguard {

bool is_number(const std::string &s);

/**
 * @brief 查找用户名对应的 uid
 * @return 用户不存在时返回 -1
 */
int get_userid(const std::string &name);

/**
 * @brief 查找组名对应的 gid
 * @return 组不存在时返回 -1
 */
int get_groupid(const std::string &name);

}  // namespace coexec::runguard
