/**
 * @file peer_connection.hpp
 * @brief 单个远端参与者的连接状态机
 *
 * new → negotiating → connected → (disconnected ⇄ reconnecting) → closed
 * 传输失败后重建一次，再失败则进入 failed（仅影响该对端）。
 */

#pragma once

#include "room_client/peer_transport.hpp"
#include "common/message.hpp"

#include <functional>
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace huddle::client {

/**
 * @brief 对端连接状态
 */
enum class PeerState {
    NEW,
    NEGOTIATING,
    CONNECTED,
    DISCONNECTED,
    RECONNECTING,
    CLOSED,
    FAILED
};

const char* to_string(PeerState state);

/**
 * @brief 对端连接
 */
class PeerConnection {
public:
    struct Handlers {
        std::function<void(const common::SignalingMessage&)> send;
        std::function<void(PeerState)> on_state;
        std::function<void(std::shared_ptr<MediaTrack>)> on_remote_track;
    };

    /**
     * @param remote_id 远端连接 ID
     * @param initiator 是否由本端发起 offer
     * @param factory 传输工厂（重建时使用）
     * @param handlers 回调
     */
    PeerConnection(std::string remote_id,
                   bool initiator,
                   PeerTransportFactory& factory,
                   Handlers handlers);
    ~PeerConnection();

    PeerConnection(const PeerConnection&) = delete;
    PeerConnection& operator=(const PeerConnection&) = delete;

    /**
     * @brief 发起协商（发送 offer）
     * @param restart 是否为失败后的重建
     */
    void start_offer(bool restart = false);

    /**
     * @brief 处理远端 offer
     * @return 因冲突被忽略时返回 false
     */
    bool handle_offer(const SessionDescription& desc, bool restart);

    /**
     * @brief 处理远端 answer
     */
    bool handle_answer(const SessionDescription& desc);

    /**
     * @brief 处理远端 ICE 候选（远端描述未就绪时先缓存）
     */
    void handle_candidate(const IceCandidate& candidate);

    /**
     * @brief 替换某类型的发送轨道
     */
    void set_outgoing_track(MediaKind kind, std::shared_ptr<MediaTrack> track);

    /**
     * @brief 关闭连接并停止远端轨道，幂等
     */
    void close();

    const std::string& remote_id() const { return remote_id_; }
    bool initiator() const { return initiator_; }
    PeerState state() const { return state_; }
    bool retry_used() const { return retry_used_; }
    bool negotiation_needed() const { return negotiation_needed_; }
    size_t pending_candidates() const { return pending_candidates_.size(); }
    const std::vector<std::shared_ptr<MediaTrack>>& remote_tracks() const { return remote_tracks_; }

private:
    void attach_transport();
    void dispose_transport();
    void restart();

    void on_local_description(uint64_t generation, const SessionDescription& desc);
    void on_local_candidate(uint64_t generation, const IceCandidate& candidate);
    void on_transport_state(uint64_t generation, TransportState state);
    void on_remote_track(uint64_t generation, std::shared_ptr<MediaTrack> track);

    void resume_negotiation();
    void flush_candidates();
    void set_state(PeerState state);
    void send_description(const SessionDescription& desc);

private:
    std::string remote_id_;
    bool initiator_;
    PeerTransportFactory& factory_;
    Handlers handlers_;

    std::unique_ptr<PeerTransport> transport_;
    uint64_t generation_ = 0;

    PeerState state_ = PeerState::NEW;
    bool making_offer_ = false;
    bool have_local_offer_ = false;
    bool have_remote_description_ = false;
    bool pending_restart_flag_ = false;
    bool retry_used_ = false;
    bool negotiation_needed_ = false;     // 有未协商的发送器变更

    std::vector<IceCandidate> pending_candidates_;
    std::map<MediaKind, std::shared_ptr<MediaTrack>> outgoing_;
    std::vector<std::shared_ptr<MediaTrack>> remote_tracks_;
};

} // namespace huddle::client
