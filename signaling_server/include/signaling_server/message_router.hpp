/**
 * @file message_router.hpp
 * @brief 消息路由策略
 *
 * 按消息类型决定扇出目标：点对点转发或房间广播。
 * 纯函数实现，不持有任何连接，可脱离 socket 测试。
 */

#pragma once

#include "common/message.hpp"
#include "signaling_server/config.hpp"

#include <string>
#include <vector>

namespace huddle::signaling {

class RoomRegistry;

/**
 * @brief 路由处理结果
 */
enum class RouteDisposition {
    DELIVER,                // 投递给 recipients
    DROP_TARGET_MISSING,    // 目标已离开（正常竞态，静默丢弃）
    DROP_INVALID,           // 结构校验失败
    DROP_NOT_IN_ROOM        // 发送方不在任何房间
};

/**
 * @brief 路由决策
 */
struct RouteDecision {
    RouteDisposition disposition = RouteDisposition::DROP_INVALID;
    std::vector<std::string> recipients;
    common::SignalingMessage outbound;
    std::string reason;
};

/**
 * @brief 消息路由器
 */
class MessageRouter {
public:
    explicit MessageRouter(const LimitsConfig& limits);

    /**
     * @brief 计算一条入站消息的投递目标
     * @param sender_id 发送方连接 ID
     * @param msg 已解析的入站消息
     * @param registry 房间注册表（只读）
     */
    RouteDecision route(const std::string& sender_id,
                        const common::SignalingMessage& msg,
                        const RoomRegistry& registry) const;

    /**
     * @brief 广播消息结构校验（坐标有限且有界，字符串限长）
     */
    bool validate_broadcast(const common::SignalingMessage& msg, std::string* reason) const;

private:
    RouteDecision route_targeted(const std::string& sender_id,
                                 const std::string& room_id,
                                 const common::SignalingMessage& msg,
                                 const RoomRegistry& registry) const;

    RouteDecision route_broadcast(const std::string& sender_id,
                                  const std::string& room_id,
                                  const common::SignalingMessage& msg,
                                  const RoomRegistry& registry) const;

    bool check_coordinate(double value) const;
    bool check_text(const std::string& value) const;

    LimitsConfig limits_;
};

} // namespace huddle::signaling
