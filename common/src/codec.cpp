/**
 * @file codec.cpp
 * @brief 信令消息 JSON 编解码实现
 */

#include "common/codec.hpp"

#include <chrono>
#include <cmath>
#include <cstdint>
#include <limits>

using json = nlohmann::json;

namespace huddle::common {

namespace {

struct TypeName {
    MessageType type;
    const char* name;
};

constexpr TypeName kTypeNames[] = {
    {MessageType::OFFER, "offer"},
    {MessageType::ANSWER, "answer"},
    {MessageType::ICE_CANDIDATE, "ice-candidate"},
    {MessageType::USER_JOINED, "user-joined"},
    {MessageType::USER_LEFT, "user-left"},
    {MessageType::ROOM_MEMBERS, "room-members"},
    {MessageType::AVATAR_POSITION, "avatar-position"},
    {MessageType::CANVAS_DRAW, "canvas-draw"},
    {MessageType::CANVAS_CLEAR, "canvas-clear"},
    {MessageType::SET_PRESENTER, "set-presenter"},
};

void set_error(std::string* error, const std::string& text) {
    if (error) {
        *error = text;
    }
}

bool read_string(const json& j, const char* key, std::string& out) {
    auto it = j.find(key);
    if (it == j.end() || !it->is_string()) {
        return false;
    }
    out = it->get<std::string>();
    return true;
}

bool read_number(const json& j, const char* key, double& out) {
    auto it = j.find(key);
    if (it == j.end() || !it->is_number()) {
        return false;
    }
    out = it->get<double>();
    return true;
}

bool read_point(const json& j, const char* key, Point& out) {
    auto it = j.find(key);
    if (it == j.end() || !it->is_object()) {
        return false;
    }
    return read_number(*it, "x", out.x) && read_number(*it, "y", out.y);
}

void read_timestamp(const json& j, SignalingMessage& msg) {
    auto it = j.find("timestamp");
    if (it == j.end()) {
        return;
    }
    if (it->is_number_unsigned()) {
        auto value = it->get<uint64_t>();
        if (value <= static_cast<uint64_t>(std::numeric_limits<int64_t>::max())) {
            msg.timestamp = static_cast<int64_t>(value);
        }
    } else if (it->is_number_integer()) {
        msg.timestamp = it->get<int64_t>();
    } else if (it->is_number_float()) {
        // 超出 int64 范围或非有限值的时间戳忽略
        double value = it->get<double>();
        if (std::isfinite(value) && value >= -9223372036854775808.0 && value < 9223372036854775808.0) {
            msg.timestamp = static_cast<int64_t>(value);
        }
    }
}

json point_to_json(const Point& p) {
    return json{{"x", p.x}, {"y", p.y}};
}

} // namespace

const char* to_string(MessageType type) {
    for (const auto& entry : kTypeNames) {
        if (entry.type == type) {
            return entry.name;
        }
    }
    return "unknown";
}

MessageType message_type_from_string(const std::string& name) {
    for (const auto& entry : kTypeNames) {
        if (name == entry.name) {
            return entry.type;
        }
    }
    return MessageType::UNKNOWN;
}

bool is_targeted(MessageType type) {
    return type == MessageType::OFFER ||
           type == MessageType::ANSWER ||
           type == MessageType::ICE_CANDIDATE;
}

bool is_broadcast(MessageType type) {
    return type == MessageType::AVATAR_POSITION ||
           type == MessageType::CANVAS_DRAW ||
           type == MessageType::CANVAS_CLEAR ||
           type == MessageType::SET_PRESENTER;
}

SignalingMessage make_user_joined(const std::string& connection_id,
                                  const std::string& authenticated_user_id) {
    SignalingMessage msg;
    msg.type = MessageType::USER_JOINED;
    msg.user_id = connection_id;
    msg.authenticated_user_id = authenticated_user_id;
    return msg;
}

SignalingMessage make_user_left(const std::string& connection_id) {
    SignalingMessage msg;
    msg.type = MessageType::USER_LEFT;
    msg.user_id = connection_id;
    return msg;
}

SignalingMessage make_room_members(const std::string& self_id,
                                   std::vector<std::string> members) {
    SignalingMessage msg;
    msg.type = MessageType::ROOM_MEMBERS;
    msg.self_id = self_id;
    msg.members = std::move(members);
    return msg;
}

std::optional<SignalingMessage> parse_message(const std::string& text, std::string* error) {
    json j;
    try {
        j = json::parse(text);
    } catch (const json::exception& e) {
        set_error(error, std::string("invalid json: ") + e.what());
        return std::nullopt;
    }

    if (!j.is_object()) {
        set_error(error, "message is not an object");
        return std::nullopt;
    }

    std::string type_name;
    if (!read_string(j, "type", type_name)) {
        set_error(error, "missing 'type'");
        return std::nullopt;
    }

    SignalingMessage msg;
    msg.type = message_type_from_string(type_name);
    read_timestamp(j, msg);

    switch (msg.type) {
        case MessageType::OFFER:
        case MessageType::ANSWER:
        case MessageType::ICE_CANDIDATE: {
            if (!read_string(j, "target", msg.target) || msg.target.empty()) {
                set_error(error, "missing 'target'");
                return std::nullopt;
            }
            auto it = j.find("payload");
            if (it == j.end() || it->is_null()) {
                set_error(error, "missing 'payload'");
                return std::nullopt;
            }
            msg.payload = *it;
            read_string(j, "from", msg.from);
            break;
        }

        case MessageType::USER_JOINED:
        case MessageType::USER_LEFT:
            if (!read_string(j, "userId", msg.user_id)) {
                set_error(error, "missing 'userId'");
                return std::nullopt;
            }
            read_string(j, "authenticatedUserId", msg.authenticated_user_id);
            break;

        case MessageType::ROOM_MEMBERS: {
            auto it = j.find("members");
            if (it == j.end() || !it->is_array()) {
                set_error(error, "missing 'members'");
                return std::nullopt;
            }
            for (const auto& member : *it) {
                if (!member.is_string()) {
                    set_error(error, "non-string member id");
                    return std::nullopt;
                }
                msg.members.push_back(member.get<std::string>());
            }
            read_string(j, "self", msg.self_id);
            break;
        }

        case MessageType::AVATAR_POSITION:
            if (!read_number(j, "x", msg.x) || !read_number(j, "y", msg.y)) {
                set_error(error, "avatar-position requires numeric 'x' and 'y'");
                return std::nullopt;
            }
            read_string(j, "userId", msg.user_id);
            break;

        case MessageType::CANVAS_DRAW:
            if (!read_string(j, "tool", msg.tool) || !read_string(j, "color", msg.color)) {
                set_error(error, "canvas-draw requires 'tool' and 'color'");
                return std::nullopt;
            }
            if (!read_point(j, "from", msg.from_point) || !read_point(j, "to", msg.to_point)) {
                set_error(error, "canvas-draw requires 'from' and 'to' points");
                return std::nullopt;
            }
            msg.has_width = read_number(j, "width", msg.width);
            read_string(j, "userId", msg.user_id);
            break;

        case MessageType::CANVAS_CLEAR:
            read_string(j, "userId", msg.user_id);
            break;

        case MessageType::SET_PRESENTER:
            if (!read_string(j, "presenterId", msg.presenter_id)) {
                set_error(error, "set-presenter requires 'presenterId'");
                return std::nullopt;
            }
            read_string(j, "userId", msg.user_id);
            break;

        case MessageType::UNKNOWN:
            set_error(error, "unknown type '" + type_name + "'");
            return std::nullopt;
    }

    return msg;
}

std::string serialize(const SignalingMessage& msg) {
    json j;
    j["type"] = to_string(msg.type);

    switch (msg.type) {
        case MessageType::OFFER:
        case MessageType::ANSWER:
        case MessageType::ICE_CANDIDATE:
            j["target"] = msg.target;
            if (!msg.from.empty()) j["from"] = msg.from;
            j["payload"] = msg.payload;
            break;

        case MessageType::USER_JOINED:
            j["userId"] = msg.user_id;
            if (!msg.authenticated_user_id.empty()) {
                j["authenticatedUserId"] = msg.authenticated_user_id;
            }
            break;

        case MessageType::USER_LEFT:
            j["userId"] = msg.user_id;
            break;

        case MessageType::ROOM_MEMBERS:
            j["members"] = msg.members;
            if (!msg.self_id.empty()) j["self"] = msg.self_id;
            break;

        case MessageType::AVATAR_POSITION:
            if (!msg.user_id.empty()) j["userId"] = msg.user_id;
            j["x"] = msg.x;
            j["y"] = msg.y;
            break;

        case MessageType::CANVAS_DRAW:
            if (!msg.user_id.empty()) j["userId"] = msg.user_id;
            j["tool"] = msg.tool;
            j["color"] = msg.color;
            if (msg.has_width) j["width"] = msg.width;
            j["from"] = point_to_json(msg.from_point);
            j["to"] = point_to_json(msg.to_point);
            break;

        case MessageType::CANVAS_CLEAR:
            if (!msg.user_id.empty()) j["userId"] = msg.user_id;
            break;

        case MessageType::SET_PRESENTER:
            if (!msg.user_id.empty()) j["userId"] = msg.user_id;
            j["presenterId"] = msg.presenter_id;
            break;

        case MessageType::UNKNOWN:
            break;
    }

    if (msg.timestamp != 0) {
        j["timestamp"] = msg.timestamp;
    }
    return j.dump();
}

int64_t now_ms() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
}

} // namespace huddle::common
