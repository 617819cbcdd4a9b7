/**
 * @file signaling_gateway.hpp
 * @brief 信令网关
 *
 * 管理连接身份与房间进出通知，把入站消息交给路由器并完成扇出。
 * 与 socket 解耦：每个连接通过 ConnectionSink 接收下行消息。
 */

#pragma once

#include "common/message.hpp"

#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace huddle::signaling {

class RoomRegistry;
class MessageRouter;

/**
 * @brief 下行消息出口（由 WebSocket 会话实现）
 */
class ConnectionSink {
public:
    virtual ~ConnectionSink() = default;

    /** @brief 异步发送一条文本帧 */
    virtual void send(const std::string& text) = 0;

    /** @brief 主动关闭底层连接 */
    virtual void close() = 0;
};

/**
 * @brief 服务端连接身份
 */
struct Connection {
    std::string id;
    std::string room_id;
    std::optional<std::string> user_id;     // 外部认证得到的用户 ID
    std::chrono::steady_clock::time_point created_at;
    std::weak_ptr<ConnectionSink> sink;
};

/**
 * @brief 房间信息（诊断用）
 */
struct RoomInfo {
    std::string room_id;
    size_t count = 0;
};

/**
 * @brief 网关统计
 */
struct GatewayStats {
    uint64_t joins = 0;
    uint64_t leaves = 0;
    uint64_t messages_routed = 0;
    uint64_t dropped_malformed = 0;
    uint64_t dropped_target_missing = 0;
};

/**
 * @brief 信令网关
 */
class SignalingGateway {
public:
    SignalingGateway(RoomRegistry& registry, const MessageRouter& router);

    /**
     * @brief 新连接加入房间
     *
     * 分配连接 ID，向新连接发送 room-members，再向房间其他成员广播 user-joined
     *
     * @param room_id 房间 ID
     * @param user_id 认证后的用户 ID（匿名时为空）
     * @param sink 下行出口
     * @return 分配的连接 ID
     */
    std::string open(const std::string& room_id,
                     const std::optional<std::string>& user_id,
                     std::weak_ptr<ConnectionSink> sink);

    /**
     * @brief 处理入站文本帧
     *
     * 格式错误的消息记录日志后丢弃，不断开发送方
     */
    void on_message(const std::string& connection_id, const std::string& text);

    /**
     * @brief 连接关闭（主动离开、超时、网络错误）
     *
     * 幂等：只有第一次调用会广播 user-left
     */
    void close(const std::string& connection_id);

    /**
     * @brief 关闭全部连接（服务停止）
     */
    void close_all();

    /**
     * @brief 是否还能加入该房间
     */
    bool can_join(const std::string& room_id, size_t max_room_size) const;

    const Connection* find_connection(const std::string& connection_id) const;
    size_t connection_count() const { return connections_.size(); }
    RoomInfo room_info(const std::string& room_id) const;
    std::vector<RoomInfo> rooms() const;
    const GatewayStats& stats() const { return stats_; }

private:
    void deliver(const std::string& connection_id, const std::string& text);
    void fanout(const std::vector<std::string>& recipients, const common::SignalingMessage& msg);
    std::string generate_connection_id() const;

private:
    RoomRegistry& registry_;
    const MessageRouter& router_;

    std::unordered_map<std::string, Connection> connections_;
    GatewayStats stats_;
};

} // namespace huddle::signaling
