/**
 * @file upgrade_target.hpp
 * @brief 升级请求目标解析
 *
 * 支持 /ws?room=R1 与 /ws/R1 两种写法，缺省房间为 "default"
 */

#pragma once

#include <cstddef>
#include <string>

namespace huddle::signaling {

constexpr const char* kDefaultRoomId = "default";

/**
 * @brief 解析结果
 */
enum class UpgradeTargetStatus {
    OK,
    NOT_FOUND,          // 非信令路径 (HTTP 404)
    BAD_ROOM_ID         // 房间 ID 超长或非法 (HTTP 400)
};

struct UpgradeTarget {
    UpgradeTargetStatus status = UpgradeTargetStatus::NOT_FOUND;
    std::string room_id;
};

/**
 * @brief 解析升级请求的 request-target
 * @param target 如 "/ws?room=lobby"
 * @param max_room_id_length 房间 ID 最大长度
 */
UpgradeTarget parse_upgrade_target(const std::string& target, size_t max_room_id_length);

/**
 * @brief URL 百分号解码（'+' 视为空格）
 * @return 解码失败返回 false
 */
bool url_decode(const std::string& input, std::string& output);

} // namespace huddle::signaling
