/**
 * @file peer_connection_manager.hpp
 * @brief 对端连接管理
 *
 * 每个远端参与者一个 PeerConnection。由连接 ID 字典序较小的一方发起 offer，
 * 避免双方同时发送 offer。
 */

#pragma once

#include "room_client/peer_connection.hpp"
#include "common/message.hpp"

#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace huddle::client {

/**
 * @brief 对端事件观察者（UI 层把远端轨道挂到自己的视频元素上）
 */
class PeerConnectionObserver {
public:
    virtual ~PeerConnectionObserver() = default;
    virtual void on_peer_state(const std::string& /*remote_id*/, PeerState /*state*/) {}
    virtual void on_remote_track(const std::string& /*remote_id*/,
                                 std::shared_ptr<MediaTrack> /*track*/) {}
    virtual void on_peer_removed(const std::string& /*remote_id*/) {}
};

/**
 * @brief 对端连接管理器
 */
class PeerConnectionManager {
public:
    using SendFn = std::function<void(const common::SignalingMessage&)>;

    PeerConnectionManager(PeerTransportFactory& factory, SendFn send);
    ~PeerConnectionManager();

    void add_observer(PeerConnectionObserver* observer);
    void remove_observer(PeerConnectionObserver* observer);

    /**
     * @brief 分发信令相关消息（room-members / user-joined / user-left / offer / answer / ice-candidate）
     * @return 消息是否属于本模块
     */
    bool handle_message(const common::SignalingMessage& msg);

    void on_room_members(const std::string& self_id, const std::vector<std::string>& members);
    void on_user_joined(const std::string& remote_id);
    void on_user_left(const std::string& remote_id);
    void on_offer(const std::string& from, const nlohmann::json& payload);
    void on_answer(const std::string& from, const nlohmann::json& payload);
    void on_ice_candidate(const std::string& from, const nlohmann::json& payload);

    /**
     * @brief 在所有对端上替换发送轨道，并记住供之后的对端使用
     */
    void set_outgoing_track(MediaKind kind, std::shared_ptr<MediaTrack> track);

    /**
     * @brief 关闭全部对端连接，幂等
     */
    void close_all();

    const std::string& self_id() const { return self_id_; }
    void set_self_id(const std::string& self_id) { self_id_ = self_id; }

    /**
     * @brief 本端是否应向 remote_id 发起 offer
     */
    bool is_initiator_for(const std::string& remote_id) const;

    size_t peer_count() const { return peers_.size(); }
    std::vector<std::string> peer_ids() const;
    std::optional<PeerState> state_of(const std::string& remote_id) const;
    PeerConnection* find(const std::string& remote_id);

private:
    PeerConnection& ensure_peer(const std::string& remote_id);
    void remove_peer(const std::string& remote_id);

    void notify_state(const std::string& remote_id, PeerState state);
    void notify_track(const std::string& remote_id, std::shared_ptr<MediaTrack> track);

private:
    PeerTransportFactory& factory_;
    SendFn send_;
    std::string self_id_;

    std::map<std::string, std::unique_ptr<PeerConnection>> peers_;
    std::map<MediaKind, std::shared_ptr<MediaTrack>> outgoing_;
    std::vector<PeerConnectionObserver*> observers_;
};

/**
 * @brief 解析 offer/answer 负载 {type, sdp}
 */
std::optional<SessionDescription> parse_description(const nlohmann::json& payload);

/**
 * @brief 解析 ice-candidate 负载 {candidate, sdpMid, sdpMLineIndex}
 */
std::optional<IceCandidate> parse_candidate(const nlohmann::json& payload);

} // namespace huddle::client
