/**
 * @file room_registry.cpp
 * @brief 房间成员注册表实现
 */

#include "signaling_server/room_registry.hpp"

#include <algorithm>

namespace huddle::signaling {

std::optional<std::vector<std::string>> RoomRegistry::join(const std::string& connection_id,
                                                           const std::string& room_id) {
    if (room_of_.count(connection_id) > 0) {
        return std::nullopt;
    }

    auto& members = rooms_[room_id];
    std::vector<std::string> existing = members;

    members.push_back(connection_id);
    room_of_[connection_id] = room_id;
    return existing;
}

std::optional<LeaveResult> RoomRegistry::leave(const std::string& connection_id) {
    auto it = room_of_.find(connection_id);
    if (it == room_of_.end()) {
        return std::nullopt;
    }

    LeaveResult result;
    result.room_id = it->second;
    room_of_.erase(it);

    auto room_it = rooms_.find(result.room_id);
    if (room_it == rooms_.end()) {
        result.room_discarded = true;
        return result;
    }

    auto& members = room_it->second;
    members.erase(std::remove(members.begin(), members.end(), connection_id), members.end());

    if (members.empty()) {
        rooms_.erase(room_it);
        result.room_discarded = true;
    } else {
        result.remaining = members;
    }
    return result;
}

std::vector<std::string> RoomRegistry::members(const std::string& room_id) const {
    auto it = rooms_.find(room_id);
    if (it == rooms_.end()) {
        return {};
    }
    return it->second;
}

std::optional<std::string> RoomRegistry::room_of(const std::string& connection_id) const {
    auto it = room_of_.find(connection_id);
    if (it == room_of_.end()) {
        return std::nullopt;
    }
    return it->second;
}

bool RoomRegistry::contains(const std::string& room_id, const std::string& connection_id) const {
    auto it = room_of_.find(connection_id);
    return it != room_of_.end() && it->second == room_id;
}

size_t RoomRegistry::room_size(const std::string& room_id) const {
    auto it = rooms_.find(room_id);
    return it == rooms_.end() ? 0 : it->second.size();
}

void RoomRegistry::clear() {
    rooms_.clear();
    room_of_.clear();
}

} // namespace huddle::signaling
