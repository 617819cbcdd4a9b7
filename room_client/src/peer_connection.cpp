/**
 * @file peer_connection.cpp
 * @brief 对端连接状态机实现
 */

#include "room_client/peer_connection.hpp"
#include "common/logger.hpp"

namespace huddle::client {

using common::MessageType;
using common::SignalingMessage;

const char* to_string(TransportState state) {
    switch (state) {
        case TransportState::NEW: return "new";
        case TransportState::CONNECTING: return "connecting";
        case TransportState::CONNECTED: return "connected";
        case TransportState::DISCONNECTED: return "disconnected";
        case TransportState::FAILED: return "failed";
        case TransportState::CLOSED: return "closed";
    }
    return "unknown";
}

const char* to_string(PeerState state) {
    switch (state) {
        case PeerState::NEW: return "new";
        case PeerState::NEGOTIATING: return "negotiating";
        case PeerState::CONNECTED: return "connected";
        case PeerState::DISCONNECTED: return "disconnected";
        case PeerState::RECONNECTING: return "reconnecting";
        case PeerState::CLOSED: return "closed";
        case PeerState::FAILED: return "failed";
    }
    return "unknown";
}

PeerConnection::PeerConnection(std::string remote_id,
                               bool initiator,
                               PeerTransportFactory& factory,
                               Handlers handlers)
    : remote_id_(std::move(remote_id))
    , initiator_(initiator)
    , factory_(factory)
    , handlers_(std::move(handlers))
{
    attach_transport();
}

PeerConnection::~PeerConnection() {
    dispose_transport();
}

void PeerConnection::attach_transport() {
    transport_ = factory_.create(remote_id_);
    ++generation_;
    if (!transport_) {
        LOG_ERROR("[Peer " << remote_id_ << "] transport factory returned null");
        return;
    }

    const uint64_t generation = generation_;
    PeerTransport::Handlers handlers;
    handlers.on_local_description = [this, generation](const SessionDescription& desc) {
        on_local_description(generation, desc);
    };
    handlers.on_local_candidate = [this, generation](const IceCandidate& candidate) {
        on_local_candidate(generation, candidate);
    };
    handlers.on_state = [this, generation](TransportState state) {
        on_transport_state(generation, state);
    };
    handlers.on_remote_track = [this, generation](std::shared_ptr<MediaTrack> track) {
        on_remote_track(generation, std::move(track));
    };
    transport_->set_handlers(std::move(handlers));

    for (const auto& [kind, track] : outgoing_) {
        if (transport_->set_outgoing_track(kind, track)) {
            negotiation_needed_ = true;
        }
    }
}

void PeerConnection::dispose_transport() {
    for (auto& track : remote_tracks_) {
        track->stop();
    }
    remote_tracks_.clear();

    if (transport_) {
        transport_->close();
        transport_.reset();
    }

    making_offer_ = false;
    have_local_offer_ = false;
    have_remote_description_ = false;
    negotiation_needed_ = false;
    pending_candidates_.clear();
}

void PeerConnection::start_offer(bool restart) {
    if (!transport_ || state_ == PeerState::CLOSED || state_ == PeerState::FAILED) {
        return;
    }
    if (making_offer_) {
        // 正在生成的 offer 可能不含新发送器，完成后再协商一次
        negotiation_needed_ = true;
        return;
    }

    if (state_ == PeerState::NEW) {
        set_state(PeerState::NEGOTIATING);
    }

    negotiation_needed_ = false;
    making_offer_ = true;
    pending_restart_flag_ = restart;
    transport_->create_offer();
}

bool PeerConnection::handle_offer(const SessionDescription& desc, bool restart) {
    if (state_ == PeerState::CLOSED || state_ == PeerState::FAILED) {
        return false;
    }

    // 对端已重建传输：本端也必须丢弃旧传输
    if (restart && state_ != PeerState::RECONNECTING) {
        LOG_INFO("[Peer " << remote_id_ << "] remote restarted transport, recreating");
        retry_used_ = true;
        set_state(PeerState::RECONNECTING);
        dispose_transport();
        attach_transport();
    }

    if (!transport_) {
        return false;
    }

    bool collision = making_offer_ || have_local_offer_;
    if (collision) {
        if (initiator_) {
            // 发起方保持自己的 offer，忽略对方的
            LOG_DEBUG("[Peer " << remote_id_ << "] offer collision, ignoring remote offer");
            return false;
        }
        LOG_DEBUG("[Peer " << remote_id_ << "] offer collision, rolling back local offer");
        transport_->rollback();
        making_offer_ = false;
        have_local_offer_ = false;
        // 被回滚的 offer 携带的变更要在应答后重新提出
        negotiation_needed_ = true;
    }

    if (!transport_->set_remote_description(desc)) {
        LOG_WARN("[Peer " << remote_id_ << "] failed to apply remote offer");
        return false;
    }
    have_remote_description_ = true;

    if (state_ == PeerState::NEW) {
        set_state(PeerState::NEGOTIATING);
    }

    flush_candidates();
    transport_->create_answer();
    return true;
}

bool PeerConnection::handle_answer(const SessionDescription& desc) {
    if (!transport_ || state_ == PeerState::CLOSED || state_ == PeerState::FAILED) {
        return false;
    }

    if (!have_local_offer_) {
        LOG_DEBUG("[Peer " << remote_id_ << "] unexpected answer, ignoring");
        return false;
    }

    if (!transport_->set_remote_description(desc)) {
        LOG_WARN("[Peer " << remote_id_ << "] failed to apply remote answer");
        return false;
    }

    have_local_offer_ = false;
    have_remote_description_ = true;
    flush_candidates();
    resume_negotiation();
    return true;
}

void PeerConnection::handle_candidate(const IceCandidate& candidate) {
    if (!transport_ || state_ == PeerState::CLOSED || state_ == PeerState::FAILED) {
        return;
    }

    if (!have_remote_description_) {
        pending_candidates_.push_back(candidate);
        return;
    }

    if (!transport_->add_remote_candidate(candidate)) {
        LOG_DEBUG("[Peer " << remote_id_ << "] remote candidate rejected");
    }
}

void PeerConnection::set_outgoing_track(MediaKind kind, std::shared_ptr<MediaTrack> track) {
    outgoing_[kind] = track;

    if (!transport_ || state_ == PeerState::CLOSED || state_ == PeerState::FAILED) {
        return;
    }

    bool needs_negotiation = transport_->set_outgoing_track(kind, std::move(track));
    if (!needs_negotiation) {
        return;
    }
    if (state_ == PeerState::NEW || have_local_offer_) {
        // 尚未协商或正等待 answer：记下，回到稳定状态后再发 offer
        negotiation_needed_ = true;
        return;
    }
    // 新增发送器需要重新协商，任一方都可以发起
    start_offer();
}

void PeerConnection::close() {
    if (state_ == PeerState::CLOSED) {
        return;
    }
    dispose_transport();
    set_state(PeerState::CLOSED);
}

void PeerConnection::restart() {
    dispose_transport();
    attach_transport();
    if (initiator_) {
        start_offer(true);
    }
}

void PeerConnection::on_local_description(uint64_t generation, const SessionDescription& desc) {
    if (generation != generation_ || state_ == PeerState::CLOSED) {
        return;
    }

    if (desc.type == "offer") {
        if (!making_offer_) {
            // 已被回滚
            return;
        }
        making_offer_ = false;
        have_local_offer_ = true;
    }
    send_description(desc);

    if (desc.type == "answer") {
        resume_negotiation();
    }
}

void PeerConnection::resume_negotiation() {
    if (negotiation_needed_ && !making_offer_ && !have_local_offer_) {
        LOG_DEBUG("[Peer " << remote_id_ << "] renegotiating pending local changes");
        start_offer();
    }
}

void PeerConnection::on_local_candidate(uint64_t generation, const IceCandidate& candidate) {
    if (generation != generation_ || state_ == PeerState::CLOSED || !handlers_.send) {
        return;
    }

    SignalingMessage msg;
    msg.type = MessageType::ICE_CANDIDATE;
    msg.target = remote_id_;
    msg.payload = {
        {"candidate", candidate.candidate},
        {"sdpMid", candidate.sdp_mid}
    };
    // 下标未知时不带该字段，由接收方按 sdpMid 匹配
    if (candidate.sdp_mline_index >= 0) {
        msg.payload["sdpMLineIndex"] = candidate.sdp_mline_index;
    }
    handlers_.send(msg);
}

void PeerConnection::on_transport_state(uint64_t generation, TransportState state) {
    if (generation != generation_ || state_ == PeerState::CLOSED || state_ == PeerState::FAILED) {
        return;
    }

    LOG_DEBUG("[Peer " << remote_id_ << "] transport " << to_string(state));

    switch (state) {
        case TransportState::NEW:
        case TransportState::CLOSED:
            break;

        case TransportState::CONNECTING:
            if (state_ == PeerState::NEW) {
                set_state(PeerState::NEGOTIATING);
            }
            break;

        case TransportState::CONNECTED:
            // 恢复后重新获得一次重试机会
            retry_used_ = false;
            set_state(PeerState::CONNECTED);
            break;

        case TransportState::DISCONNECTED:
            if (state_ == PeerState::CONNECTED) {
                set_state(PeerState::DISCONNECTED);
            }
            break;

        case TransportState::FAILED:
            if (!retry_used_) {
                retry_used_ = true;
                LOG_WARN("[Peer " << remote_id_ << "] transport failed, renegotiating once");
                set_state(PeerState::RECONNECTING);
                restart();
            } else {
                LOG_WARN("[Peer " << remote_id_ << "] transport failed again, giving up");
                dispose_transport();
                set_state(PeerState::FAILED);
            }
            break;
    }
}

void PeerConnection::on_remote_track(uint64_t generation, std::shared_ptr<MediaTrack> track) {
    if (generation != generation_ || state_ == PeerState::CLOSED || !track) {
        return;
    }
    remote_tracks_.push_back(track);
    if (handlers_.on_remote_track) {
        handlers_.on_remote_track(std::move(track));
    }
}

void PeerConnection::flush_candidates() {
    if (!transport_ || pending_candidates_.empty()) {
        return;
    }

    auto pending = std::move(pending_candidates_);
    pending_candidates_.clear();
    for (const auto& candidate : pending) {
        if (!transport_->add_remote_candidate(candidate)) {
            LOG_DEBUG("[Peer " << remote_id_ << "] buffered candidate rejected");
        }
    }
}

void PeerConnection::set_state(PeerState state) {
    if (state_ == state) {
        return;
    }
    LOG_INFO("[Peer " << remote_id_ << "] " << to_string(state_) << " -> " << to_string(state));
    state_ = state;
    if (handlers_.on_state) {
        handlers_.on_state(state);
    }
}

void PeerConnection::send_description(const SessionDescription& desc) {
    if (!handlers_.send) {
        return;
    }

    SignalingMessage msg;
    msg.type = (desc.type == "offer") ? MessageType::OFFER : MessageType::ANSWER;
    msg.target = remote_id_;
    msg.payload = {
        {"type", desc.type},
        {"sdp", desc.sdp}
    };
    if (desc.type == "offer" && pending_restart_flag_) {
        msg.payload["restart"] = true;
        pending_restart_flag_ = false;
    }
    handlers_.send(msg);
}

} // namespace huddle::client
