/**
 * @file env.hpp
 * @brief 配置值中的环境变量展开
 */

#pragma once

#include <string>

namespace huddle::common {

/**
 * @brief 展开 ${VAR} 与 $VAR，未定义的变量展开为空串
 *
 * 替换进来的值不会再次展开
 */
std::string expand_env(const std::string& value);

} // namespace huddle::common
