/**
 * @file codec.hpp
 * @brief 信令消息 JSON 编解码
 */

#pragma once

#include "common/message.hpp"

#include <optional>
#include <string>

namespace huddle::common {

/**
 * @brief 解析一条 JSON 文本消息
 *
 * 只做结构检查：必需字段存在且类型正确。数值范围与字符串长度
 * 由服务端路由器校验。
 *
 * @param text 原始文本帧
 * @param error 失败时写入原因（可为空）
 * @return 解析结果，失败返回 std::nullopt
 */
std::optional<SignalingMessage> parse_message(const std::string& text,
                                              std::string* error = nullptr);

/**
 * @brief 序列化为 JSON 文本
 */
std::string serialize(const SignalingMessage& msg);

/**
 * @brief 当前系统时间（毫秒）
 */
int64_t now_ms();

} // namespace huddle::common
