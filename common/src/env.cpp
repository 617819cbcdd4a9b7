/**
 * @file env.cpp
 * @brief 环境变量展开实现
 */

#include "common/env.hpp"

#include <cstdlib>
#include <regex>

namespace huddle::common {

std::string expand_env(const std::string& value) {
    // 匹配 ${VAR} 或 $VAR
    static const std::regex env_regex(R"(\$\{([^}]+)\}|\$([A-Za-z_][A-Za-z0-9_]*))");

    std::string result;
    std::smatch match;
    std::string rest = value;

    while (std::regex_search(rest, match, env_regex)) {
        std::string var_name = match[1].matched ? match[1].str() : match[2].str();

        result += match.prefix().str();
        if (const char* val = std::getenv(var_name.c_str())) {
            result += val;
        }
        rest = match.suffix().str();
    }

    return result + rest;
}

} // namespace huddle::common
