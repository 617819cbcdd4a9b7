/**
 * @file message_router.cpp
 * @brief 消息路由策略实现
 */

#include "signaling_server/message_router.hpp"
#include "signaling_server/room_registry.hpp"

#include <cctype>
#include <cmath>

namespace huddle::signaling {

using common::MessageType;
using common::SignalingMessage;

namespace {

RouteDecision drop(RouteDisposition disposition, std::string reason) {
    RouteDecision decision;
    decision.disposition = disposition;
    decision.reason = std::move(reason);
    return decision;
}

// 颜色只允许 #rrggbb、颜色名、rgb()/hsl() 等写法用到的字符
bool is_color_char(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) ||
           c == '#' || c == '(' || c == ')' || c == ',' ||
           c == '.' || c == '%' || c == ' ';
}

bool is_tool_char(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) || c == '-' || c == '_';
}

} // namespace

MessageRouter::MessageRouter(const LimitsConfig& limits)
    : limits_(limits)
{
}

RouteDecision MessageRouter::route(const std::string& sender_id,
                                   const SignalingMessage& msg,
                                   const RoomRegistry& registry) const {
    auto room_id = registry.room_of(sender_id);
    if (!room_id) {
        return drop(RouteDisposition::DROP_NOT_IN_ROOM, "sender is not in a room");
    }

    if (common::is_targeted(msg.type)) {
        return route_targeted(sender_id, *room_id, msg, registry);
    }

    if (common::is_broadcast(msg.type)) {
        return route_broadcast(sender_id, *room_id, msg, registry);
    }

    // user-joined / user-left / room-members 只能由服务端产生
    return drop(RouteDisposition::DROP_INVALID,
                std::string("client may not send '") + common::to_string(msg.type) + "'");
}

RouteDecision MessageRouter::route_targeted(const std::string& sender_id,
                                            const std::string& room_id,
                                            const SignalingMessage& msg,
                                            const RoomRegistry& registry) const {
    if (msg.target.size() > limits_.max_string_length) {
        return drop(RouteDisposition::DROP_INVALID, "target id too long");
    }

    if (msg.payload.dump().size() > limits_.max_payload_bytes) {
        return drop(RouteDisposition::DROP_INVALID, "payload too large");
    }

    if (msg.target == sender_id || !registry.contains(room_id, msg.target)) {
        return drop(RouteDisposition::DROP_TARGET_MISSING,
                    "target " + msg.target + " not in room " + room_id);
    }

    RouteDecision decision;
    decision.disposition = RouteDisposition::DELIVER;
    decision.outbound = msg;
    decision.outbound.from = sender_id;
    decision.recipients.push_back(msg.target);
    return decision;
}

RouteDecision MessageRouter::route_broadcast(const std::string& sender_id,
                                             const std::string& room_id,
                                             const SignalingMessage& msg,
                                             const RoomRegistry& registry) const {
    std::string reason;
    if (!validate_broadcast(msg, &reason)) {
        return drop(RouteDisposition::DROP_INVALID, reason);
    }

    RouteDecision decision;
    decision.disposition = RouteDisposition::DELIVER;
    decision.outbound = msg;
    // 发起方以连接 ID 为准，客户端不能冒充他人
    decision.outbound.user_id = sender_id;
    decision.outbound.authenticated_user_id.clear();

    for (const auto& member : registry.members(room_id)) {
        if (member != sender_id) {
            decision.recipients.push_back(member);
        }
    }
    return decision;
}

bool MessageRouter::validate_broadcast(const SignalingMessage& msg, std::string* reason) const {
    auto fail = [reason](const char* text) {
        if (reason) *reason = text;
        return false;
    };

    switch (msg.type) {
        case MessageType::AVATAR_POSITION:
            if (!check_coordinate(msg.x) || !check_coordinate(msg.y)) {
                return fail("avatar coordinates out of range");
            }
            break;

        case MessageType::CANVAS_DRAW:
            if (!check_coordinate(msg.from_point.x) || !check_coordinate(msg.from_point.y) ||
                !check_coordinate(msg.to_point.x) || !check_coordinate(msg.to_point.y)) {
                return fail("stroke coordinates out of range");
            }
            if (msg.tool.empty() || !check_text(msg.tool)) {
                return fail("invalid tool");
            }
            for (char c : msg.tool) {
                if (!is_tool_char(c)) return fail("invalid tool");
            }
            if (msg.color.empty() || !check_text(msg.color)) {
                return fail("invalid color");
            }
            for (char c : msg.color) {
                if (!is_color_char(c)) return fail("invalid color");
            }
            if (msg.has_width &&
                (!std::isfinite(msg.width) || msg.width < 0.0 || msg.width > limits_.max_stroke_width)) {
                return fail("stroke width out of range");
            }
            break;

        case MessageType::SET_PRESENTER:
            if (!check_text(msg.presenter_id)) {
                return fail("presenter id too long");
            }
            break;

        case MessageType::CANVAS_CLEAR:
            break;

        default:
            return fail("not a broadcast type");
    }
    return true;
}

bool MessageRouter::check_coordinate(double value) const {
    return std::isfinite(value) && std::fabs(value) <= limits_.max_coordinate;
}

bool MessageRouter::check_text(const std::string& value) const {
    return value.size() <= limits_.max_string_length;
}

} // namespace huddle::signaling
