/**
 * @file message.hpp
 * @brief 房间信令消息定义
 *
 * 服务端与客户端共用的线上消息模型（JSON 文本帧）
 */

#pragma once

#include <nlohmann/json.hpp>

#include <cstdint>
#include <string>
#include <vector>

namespace huddle::common {

/**
 * @brief 消息类型
 */
enum class MessageType {
    UNKNOWN,
    // 点对点信令（需要 target）
    OFFER,
    ANSWER,
    ICE_CANDIDATE,
    // 成员通知（仅服务端下发）
    USER_JOINED,
    USER_LEFT,
    ROOM_MEMBERS,
    // 房间广播（协作状态）
    AVATAR_POSITION,
    CANVAS_DRAW,
    CANVAS_CLEAR,
    SET_PRESENTER
};

/**
 * @brief 二维坐标
 */
struct Point {
    double x = 0.0;
    double y = 0.0;
};

/**
 * @brief 信令消息
 *
 * 按 type 区分的带标签联合体，各类型只使用自己的字段
 */
struct SignalingMessage {
    MessageType type = MessageType::UNKNOWN;

    // offer / answer / ice-candidate
    std::string target;
    std::string from;               // 服务端转发时填写的发送方连接 ID
    nlohmann::json payload;         // 不透明描述，服务端不解析

    // user-joined / user-left / 广播消息的发起方
    std::string user_id;
    std::string authenticated_user_id;

    // room-members
    std::vector<std::string> members;
    std::string self_id;

    // avatar-position
    double x = 0.0;
    double y = 0.0;

    // canvas-draw
    std::string tool;
    std::string color;
    double width = 0.0;
    bool has_width = false;
    Point from_point;
    Point to_point;

    // set-presenter
    std::string presenter_id;

    int64_t timestamp = 0;          // 毫秒，0 表示未携带
};

/** @brief 类型名（线上格式，如 "ice-candidate"） */
const char* to_string(MessageType type);

/** @brief 解析类型名，未识别返回 UNKNOWN */
MessageType message_type_from_string(const std::string& name);

/** @brief 是否为点对点转发类型 */
bool is_targeted(MessageType type);

/** @brief 是否为房间广播类型 */
bool is_broadcast(MessageType type);

// ==================== 构造辅助 ====================

SignalingMessage make_user_joined(const std::string& connection_id,
                                  const std::string& authenticated_user_id = "");

SignalingMessage make_user_left(const std::string& connection_id);

SignalingMessage make_room_members(const std::string& self_id,
                                   std::vector<std::string> members);

} // namespace huddle::common
