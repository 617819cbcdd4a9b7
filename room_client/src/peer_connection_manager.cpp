/**
 * @file peer_connection_manager.cpp
 * @brief 对端连接管理实现
 */

#include "room_client/peer_connection_manager.hpp"
#include "common/logger.hpp"

#include <algorithm>

namespace huddle::client {

using common::MessageType;
using common::SignalingMessage;

std::optional<SessionDescription> parse_description(const nlohmann::json& payload) {
    if (!payload.is_object()) {
        return std::nullopt;
    }
    auto type = payload.find("type");
    auto sdp = payload.find("sdp");
    if (type == payload.end() || !type->is_string() ||
        sdp == payload.end() || !sdp->is_string()) {
        return std::nullopt;
    }

    SessionDescription desc;
    desc.type = type->get<std::string>();
    desc.sdp = sdp->get<std::string>();
    if (desc.type != "offer" && desc.type != "answer") {
        return std::nullopt;
    }
    return desc;
}

std::optional<IceCandidate> parse_candidate(const nlohmann::json& payload) {
    if (!payload.is_object()) {
        return std::nullopt;
    }
    auto candidate = payload.find("candidate");
    if (candidate == payload.end() || !candidate->is_string()) {
        return std::nullopt;
    }

    IceCandidate result;
    result.candidate = candidate->get<std::string>();

    auto mid = payload.find("sdpMid");
    if (mid != payload.end() && mid->is_string()) {
        result.sdp_mid = mid->get<std::string>();
    }
    auto index = payload.find("sdpMLineIndex");
    if (index != payload.end() && index->is_number_integer()) {
        result.sdp_mline_index = index->get<int>();
    }
    return result;
}

PeerConnectionManager::PeerConnectionManager(PeerTransportFactory& factory, SendFn send)
    : factory_(factory)
    , send_(std::move(send))
{
}

PeerConnectionManager::~PeerConnectionManager() {
    observers_.clear();
    close_all();
}

void PeerConnectionManager::add_observer(PeerConnectionObserver* observer) {
    if (observer && std::find(observers_.begin(), observers_.end(), observer) == observers_.end()) {
        observers_.push_back(observer);
    }
}

void PeerConnectionManager::remove_observer(PeerConnectionObserver* observer) {
    observers_.erase(std::remove(observers_.begin(), observers_.end(), observer), observers_.end());
}

bool PeerConnectionManager::handle_message(const SignalingMessage& msg) {
    switch (msg.type) {
        case MessageType::ROOM_MEMBERS:
            on_room_members(msg.self_id, msg.members);
            return true;
        case MessageType::USER_JOINED:
            on_user_joined(msg.user_id);
            return true;
        case MessageType::USER_LEFT:
            on_user_left(msg.user_id);
            return true;
        case MessageType::OFFER:
            on_offer(msg.from, msg.payload);
            return true;
        case MessageType::ANSWER:
            on_answer(msg.from, msg.payload);
            return true;
        case MessageType::ICE_CANDIDATE:
            on_ice_candidate(msg.from, msg.payload);
            return true;
        default:
            return false;
    }
}

void PeerConnectionManager::on_room_members(const std::string& self_id,
                                            const std::vector<std::string>& members) {
    if (!self_id.empty()) {
        self_id_ = self_id;
    }
    LOG_INFO("[Peers] joined as " << self_id_ << ", " << members.size() << " existing member(s)");

    for (const auto& member : members) {
        if (member == self_id_ || peers_.count(member) > 0) {
            continue;
        }
        auto& peer = ensure_peer(member);
        if (peer.initiator()) {
            peer.start_offer();
        }
    }
}

void PeerConnectionManager::on_user_joined(const std::string& remote_id) {
    if (remote_id.empty() || remote_id == self_id_ || peers_.count(remote_id) > 0) {
        return;
    }
    auto& peer = ensure_peer(remote_id);
    if (peer.initiator()) {
        peer.start_offer();
    }
}

void PeerConnectionManager::on_user_left(const std::string& remote_id) {
    remove_peer(remote_id);
}

void PeerConnectionManager::on_offer(const std::string& from, const nlohmann::json& payload) {
    if (from.empty() || from == self_id_) {
        return;
    }
    auto desc = parse_description(payload);
    if (!desc || desc->type != "offer") {
        LOG_WARN("[Peers] malformed offer from " << from);
        return;
    }

    bool restart = payload.is_object() && payload.value("restart", false);

    // offer 可能先于 user-joined 到达
    auto& peer = ensure_peer(from);
    peer.handle_offer(*desc, restart);
}

void PeerConnectionManager::on_answer(const std::string& from, const nlohmann::json& payload) {
    auto it = peers_.find(from);
    if (it == peers_.end()) {
        LOG_DEBUG("[Peers] answer from unknown peer " << from);
        return;
    }
    auto desc = parse_description(payload);
    if (!desc || desc->type != "answer") {
        LOG_WARN("[Peers] malformed answer from " << from);
        return;
    }
    it->second->handle_answer(*desc);
}

void PeerConnectionManager::on_ice_candidate(const std::string& from, const nlohmann::json& payload) {
    auto candidate = parse_candidate(payload);
    if (!candidate) {
        LOG_WARN("[Peers] malformed ice-candidate from " << from);
        return;
    }

    auto it = peers_.find(from);
    if (it == peers_.end()) {
        LOG_DEBUG("[Peers] ice-candidate from unknown peer " << from);
        return;
    }
    it->second->handle_candidate(*candidate);
}

void PeerConnectionManager::set_outgoing_track(MediaKind kind, std::shared_ptr<MediaTrack> track) {
    outgoing_[kind] = track;
    for (auto& [id, peer] : peers_) {
        peer->set_outgoing_track(kind, track);
    }
}

void PeerConnectionManager::close_all() {
    auto ids = peer_ids();
    for (const auto& id : ids) {
        remove_peer(id);
    }
}

bool PeerConnectionManager::is_initiator_for(const std::string& remote_id) const {
    return !self_id_.empty() && self_id_ < remote_id;
}

std::vector<std::string> PeerConnectionManager::peer_ids() const {
    std::vector<std::string> ids;
    ids.reserve(peers_.size());
    for (const auto& [id, peer] : peers_) {
        ids.push_back(id);
    }
    return ids;
}

std::optional<PeerState> PeerConnectionManager::state_of(const std::string& remote_id) const {
    auto it = peers_.find(remote_id);
    if (it == peers_.end()) {
        return std::nullopt;
    }
    return it->second->state();
}

PeerConnection* PeerConnectionManager::find(const std::string& remote_id) {
    auto it = peers_.find(remote_id);
    return it == peers_.end() ? nullptr : it->second.get();
}

PeerConnection& PeerConnectionManager::ensure_peer(const std::string& remote_id) {
    auto it = peers_.find(remote_id);
    if (it != peers_.end()) {
        return *it->second;
    }

    PeerConnection::Handlers handlers;
    handlers.send = [this](const SignalingMessage& msg) {
        if (send_) {
            send_(msg);
        }
    };
    handlers.on_state = [this, remote_id](PeerState state) {
        notify_state(remote_id, state);
    };
    handlers.on_remote_track = [this, remote_id](std::shared_ptr<MediaTrack> track) {
        notify_track(remote_id, std::move(track));
    };

    auto peer = std::make_unique<PeerConnection>(
        remote_id, is_initiator_for(remote_id), factory_, std::move(handlers));

    // 先挂上当前本地媒体再协商
    for (const auto& [kind, track] : outgoing_) {
        peer->set_outgoing_track(kind, track);
    }

    LOG_INFO("[Peers] new peer " << remote_id
             << (peer->initiator() ? " (initiator)" : " (waiting for offer)"));

    auto& ref = *peer;
    peers_.emplace(remote_id, std::move(peer));
    return ref;
}

void PeerConnectionManager::remove_peer(const std::string& remote_id) {
    auto it = peers_.find(remote_id);
    if (it == peers_.end()) {
        return;
    }

    // 先从表中摘除，再关闭，回调中不会再找到它
    auto peer = std::move(it->second);
    peers_.erase(it);
    peer->close();

    LOG_INFO("[Peers] removed peer " << remote_id);
    for (auto* observer : observers_) {
        observer->on_peer_removed(remote_id);
    }
}

void PeerConnectionManager::notify_state(const std::string& remote_id, PeerState state) {
    for (auto* observer : observers_) {
        observer->on_peer_state(remote_id, state);
    }
}

void PeerConnectionManager::notify_track(const std::string& remote_id,
                                         std::shared_ptr<MediaTrack> track) {
    for (auto* observer : observers_) {
        observer->on_remote_track(remote_id, track);
    }
}

} // namespace huddle::client
