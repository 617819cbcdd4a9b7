/**
 * @file signaling_gateway.cpp
 * @brief 信令网关实现
 */

#include "signaling_server/signaling_gateway.hpp"
#include "signaling_server/room_registry.hpp"
#include "signaling_server/message_router.hpp"
#include "common/codec.hpp"
#include "common/logger.hpp"

#include <map>
#include <random>
#include <sstream>
#include <iomanip>

namespace huddle::signaling {

using common::SignalingMessage;

SignalingGateway::SignalingGateway(RoomRegistry& registry, const MessageRouter& router)
    : registry_(registry)
    , router_(router)
{
}

std::string SignalingGateway::open(const std::string& room_id,
                                   const std::optional<std::string>& user_id,
                                   std::weak_ptr<ConnectionSink> sink) {
    std::string id = generate_connection_id();
    while (connections_.count(id) > 0) {
        id = generate_connection_id();
    }

    auto existing = registry_.join(id, room_id);
    if (!existing) {
        // 新 ID 不可能已在注册表中
        LOG_ERROR("Connection " << id << " already registered");
        return id;
    }

    Connection conn;
    conn.id = id;
    conn.room_id = room_id;
    conn.user_id = user_id;
    conn.created_at = std::chrono::steady_clock::now();
    conn.sink = std::move(sink);
    connections_.emplace(id, std::move(conn));
    ++stats_.joins;

    LOG_INFO("Client " << id
             << (user_id ? " (user " + *user_id + ")" : std::string())
             << " joined room " << room_id
             << ", members=" << existing->size() + 1);

    // 先告知新连接现有成员，再通知其他人
    deliver(id, common::serialize(common::make_room_members(id, *existing)));
    fanout(*existing, common::make_user_joined(id, user_id.value_or("")));
    return id;
}

void SignalingGateway::on_message(const std::string& connection_id, const std::string& text) {
    if (connections_.count(connection_id) == 0) {
        LOG_DEBUG("Message from closed connection " << connection_id << " ignored");
        return;
    }

    std::string error;
    auto msg = common::parse_message(text, &error);
    if (!msg) {
        ++stats_.dropped_malformed;
        LOG_WARN("Dropping malformed message from " << connection_id << ": " << error);
        return;
    }

    auto decision = router_.route(connection_id, *msg, registry_);
    switch (decision.disposition) {
        case RouteDisposition::DELIVER:
            ++stats_.messages_routed;
            fanout(decision.recipients, decision.outbound);
            break;

        case RouteDisposition::DROP_TARGET_MISSING:
            ++stats_.dropped_target_missing;
            LOG_DEBUG("Dropping " << common::to_string(msg->type) << " from "
                      << connection_id << ": " << decision.reason);
            break;

        case RouteDisposition::DROP_INVALID:
        case RouteDisposition::DROP_NOT_IN_ROOM:
            ++stats_.dropped_malformed;
            LOG_WARN("Dropping " << common::to_string(msg->type) << " from "
                     << connection_id << ": " << decision.reason);
            break;
    }
}

void SignalingGateway::close(const std::string& connection_id) {
    auto it = connections_.find(connection_id);
    if (it == connections_.end()) {
        return;
    }
    connections_.erase(it);

    auto result = registry_.leave(connection_id);
    if (!result) {
        return;
    }
    ++stats_.leaves;

    LOG_INFO("Client " << connection_id << " left room " << result->room_id
             << (result->room_discarded ? " (room closed)" : ""));

    fanout(result->remaining, common::make_user_left(connection_id));
}

void SignalingGateway::close_all() {
    std::vector<std::shared_ptr<ConnectionSink>> sinks;
    sinks.reserve(connections_.size());
    for (const auto& [id, conn] : connections_) {
        if (auto sink = conn.sink.lock()) {
            sinks.push_back(std::move(sink));
        }
    }

    // 会话关闭回调会再次进入 close()，这里先清空状态
    connections_.clear();
    registry_.clear();

    for (auto& sink : sinks) {
        sink->close();
    }
}

bool SignalingGateway::can_join(const std::string& room_id, size_t max_room_size) const {
    return max_room_size == 0 || registry_.room_size(room_id) < max_room_size;
}

const Connection* SignalingGateway::find_connection(const std::string& connection_id) const {
    auto it = connections_.find(connection_id);
    return it == connections_.end() ? nullptr : &it->second;
}

RoomInfo SignalingGateway::room_info(const std::string& room_id) const {
    RoomInfo info;
    info.room_id = room_id;
    info.count = registry_.room_size(room_id);
    return info;
}

std::vector<RoomInfo> SignalingGateway::rooms() const {
    std::map<std::string, size_t> counts;
    for (const auto& [id, conn] : connections_) {
        ++counts[conn.room_id];
    }

    std::vector<RoomInfo> result;
    result.reserve(counts.size());
    for (const auto& [room_id, count] : counts) {
        result.push_back(RoomInfo{room_id, count});
    }
    return result;
}

void SignalingGateway::deliver(const std::string& connection_id, const std::string& text) {
    auto it = connections_.find(connection_id);
    if (it == connections_.end()) {
        return;
    }
    if (auto sink = it->second.sink.lock()) {
        sink->send(text);
    }
}

void SignalingGateway::fanout(const std::vector<std::string>& recipients,
                              const SignalingMessage& msg) {
    if (recipients.empty()) {
        return;
    }

    std::string text;
    try {
        text = common::serialize(msg);
    } catch (const nlohmann::json::exception& e) {
        LOG_ERROR("Failed to serialize " << common::to_string(msg.type) << ": " << e.what());
        return;
    }

    for (const auto& recipient : recipients) {
        deliver(recipient, text);
    }
}

std::string SignalingGateway::generate_connection_id() const {
    static thread_local std::mt19937 gen(std::random_device{}());
    std::uniform_int_distribution<> dis(0, 255);

    std::stringstream ss;
    ss << std::hex << std::setfill('0');
    for (int i = 0; i < 8; ++i) {
        ss << std::setw(2) << dis(gen);
    }
    return ss.str();
}

} // namespace huddle::signaling
