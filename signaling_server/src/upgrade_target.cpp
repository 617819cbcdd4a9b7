/**
 * @file upgrade_target.cpp
 * @brief 升级请求目标解析实现
 */

#include "signaling_server/upgrade_target.hpp"

#include <cctype>

namespace huddle::signaling {

namespace {

constexpr const char* kSignalingPath = "/ws";

int hex_value(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

// 查询串中取出 room 参数（最后一次出现为准）
bool find_room_param(const std::string& query, std::string& raw) {
    bool found = false;
    size_t pos = 0;
    while (pos <= query.size()) {
        auto end = query.find('&', pos);
        if (end == std::string::npos) {
            end = query.size();
        }
        std::string pair = query.substr(pos, end - pos);
        auto eq = pair.find('=');
        std::string key = pair.substr(0, eq);
        if (key == "room") {
            raw = (eq == std::string::npos) ? "" : pair.substr(eq + 1);
            found = true;
        }
        pos = end + 1;
    }
    return found;
}

bool valid_room_id(const std::string& room_id, size_t max_length) {
    if (room_id.size() > max_length) {
        return false;
    }
    for (char c : room_id) {
        if (std::iscntrl(static_cast<unsigned char>(c))) {
            return false;
        }
    }
    return true;
}

} // namespace

bool url_decode(const std::string& input, std::string& output) {
    output.clear();
    output.reserve(input.size());
    for (size_t i = 0; i < input.size(); ++i) {
        char c = input[i];
        if (c == '%') {
            if (i + 2 >= input.size()) {
                return false;
            }
            int hi = hex_value(input[i + 1]);
            int lo = hex_value(input[i + 2]);
            if (hi < 0 || lo < 0) {
                return false;
            }
            output.push_back(static_cast<char>((hi << 4) | lo));
            i += 2;
        } else if (c == '+') {
            output.push_back(' ');
        } else {
            output.push_back(c);
        }
    }
    return true;
}

UpgradeTarget parse_upgrade_target(const std::string& target, size_t max_room_id_length) {
    UpgradeTarget result;

    auto qpos = target.find('?');
    std::string path = target.substr(0, qpos);
    std::string query = (qpos == std::string::npos) ? "" : target.substr(qpos + 1);

    const std::string base = kSignalingPath;
    std::string raw_room;

    if (path == base || path == base + "/") {
        find_room_param(query, raw_room);
    } else if (path.compare(0, base.size() + 1, base + "/") == 0) {
        raw_room = path.substr(base.size() + 1);
        if (raw_room.find('/') != std::string::npos) {
            return result;
        }
    } else {
        return result;
    }

    std::string room_id;
    if (!url_decode(raw_room, room_id)) {
        result.status = UpgradeTargetStatus::BAD_ROOM_ID;
        return result;
    }

    if (room_id.empty()) {
        room_id = kDefaultRoomId;
    }

    if (!valid_room_id(room_id, max_room_id_length)) {
        result.status = UpgradeTargetStatus::BAD_ROOM_ID;
        return result;
    }

    result.status = UpgradeTargetStatus::OK;
    result.room_id = std::move(room_id);
    return result;
}

} // namespace huddle::signaling
