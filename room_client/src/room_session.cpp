/**
 * @file room_session.cpp
 * @brief 房间会话实现
 */

#include "room_client/room_session.hpp"
#include "common/codec.hpp"
#include "common/logger.hpp"

namespace huddle::client {

using common::MessageType;
using common::SignalingMessage;

const char* to_string(RoomState state) {
    switch (state) {
        case RoomState::IDLE: return "idle";
        case RoomState::CONNECTING: return "connecting";
        case RoomState::JOINED: return "joined";
        case RoomState::LEFT: return "left";
    }
    return "unknown";
}

RoomSession::RoomSession(boost::asio::io_context& io_context,
                         SignalingTransport& transport,
                         PeerTransportFactory& peer_factory,
                         MediaDevices& devices,
                         CanvasSurface& surface,
                         const ClientConfig& config)
    : transport_(transport)
    , config_(config)
    , peers_(peer_factory, [this](const SignalingMessage& msg) { send(msg); })
    , media_(devices, peers_)
    , avatars_(io_context, config.avatar.max_rate_hz,
               [this](const SignalingMessage& msg) { return send(msg); })
    , canvas_(surface, [this](const SignalingMessage& msg) { return send(msg); })
{
    if (!canvas_.set_tool(config_.canvas.tool)) {
        LOG_WARN("Unknown default tool '" << config_.canvas.tool << "', using pen");
    }
    canvas_.set_color(config_.canvas.color);
    canvas_.set_line_width(config_.canvas.line_width);
}

RoomSession::~RoomSession() {
    transport_.set_on_open(nullptr);
    transport_.set_on_message(nullptr);
    transport_.set_on_close(nullptr);
    leave();
}

bool RoomSession::initialize(const std::string& room_id) {
    if (state_ != RoomState::IDLE) {
        LOG_WARN("Room session already " << to_string(state_));
        return false;
    }

    room_id_ = room_id.empty() ? "default" : room_id;
    state_ = RoomState::CONNECTING;

    transport_.set_on_open([this]() { on_transport_open(); });
    transport_.set_on_message([this](const std::string& text) { handle_text(text); });
    transport_.set_on_close([this](const std::string& reason) { on_transport_close(reason); });

    LOG_INFO("Joining room " << room_id_);
    transport_.connect(room_id_);
    return true;
}

// ==================== 媒体 ====================

MediaResult RoomSession::start_local_media() {
    if (state_ == RoomState::LEFT) {
        return MediaResult::failure(MediaError::UNKNOWN, "session has left the room");
    }
    return media_.start_local_media();
}

bool RoomSession::stop_local_media() {
    if (!media_.has_local_media()) {
        return false;
    }
    media_.stop_local_media();
    return true;
}

bool RoomSession::toggle_video(std::optional<bool> enabled) {
    return media_.toggle_video(enabled);
}

bool RoomSession::toggle_audio(std::optional<bool> enabled) {
    return media_.toggle_audio(enabled);
}

MediaResult RoomSession::start_screen_share() {
    if (state_ == RoomState::LEFT) {
        return MediaResult::failure(MediaError::UNKNOWN, "session has left the room");
    }
    return media_.start_screen_share();
}

bool RoomSession::stop_screen_share() {
    return media_.stop_screen_share();
}

// ==================== 头像 ====================

bool RoomSession::add_avatar(const std::string& user_id, double x, double y, const AvatarStyle& style) {
    return avatars_.add_avatar(user_id, x, y, style);
}

bool RoomSession::update_avatar(double x, double y) {
    if (state_ != RoomState::JOINED) {
        return false;
    }
    return avatars_.move_local(x, y);
}

bool RoomSession::remove_avatar(const std::string& user_id) {
    return avatars_.remove_avatar(user_id);
}

// ==================== 白板 ====================

bool RoomSession::set_tool(const std::string& tool) {
    return canvas_.set_tool(tool);
}

bool RoomSession::set_color(const std::string& color) {
    return canvas_.set_color(color);
}

bool RoomSession::set_line_width(double width) {
    return canvas_.set_line_width(width);
}

bool RoomSession::clear_canvas() {
    if (state_ != RoomState::JOINED) {
        return false;
    }
    return canvas_.clear();
}

// ==================== 演示者 ====================

bool RoomSession::set_presenter(const std::string& presenter_id) {
    if (state_ != RoomState::JOINED) {
        return false;
    }

    // 广播不回送给自己，本地直接生效
    presenter_id_ = presenter_id;
    if (on_presenter_) {
        on_presenter_(presenter_id_);
    }

    SignalingMessage msg;
    msg.type = MessageType::SET_PRESENTER;
    msg.presenter_id = presenter_id;
    msg.timestamp = common::now_ms();
    return send(msg);
}

bool RoomSession::leave() {
    if (state_ == RoomState::LEFT || state_ == RoomState::IDLE) {
        return false;
    }
    transport_.close();
    cleanup("left");
    return true;
}

void RoomSession::handle_text(const std::string& text) {
    std::string error;
    auto msg = common::parse_message(text, &error);
    if (!msg) {
        LOG_WARN("Dropping malformed message from server: " << error);
        return;
    }

    switch (msg->type) {
        case MessageType::ROOM_MEMBERS:
            self_id_ = msg->self_id;
            state_ = RoomState::JOINED;
            avatars_.set_self_id(self_id_);
            canvas_.set_self_id(self_id_);
            peers_.handle_message(*msg);
            break;

        case MessageType::USER_JOINED:
            LOG_INFO("User " << msg->user_id << " joined"
                     << (msg->authenticated_user_id.empty()
                         ? std::string() : " (user " + msg->authenticated_user_id + ")"));
            peers_.handle_message(*msg);
            break;

        case MessageType::USER_LEFT:
            LOG_INFO("User " << msg->user_id << " left");
            peers_.handle_message(*msg);
            avatars_.handle_message(*msg);
            break;

        case MessageType::OFFER:
        case MessageType::ANSWER:
        case MessageType::ICE_CANDIDATE:
            peers_.handle_message(*msg);
            break;

        case MessageType::AVATAR_POSITION:
            avatars_.handle_message(*msg);
            break;

        case MessageType::CANVAS_DRAW:
        case MessageType::CANVAS_CLEAR:
            canvas_.handle_message(*msg);
            break;

        case MessageType::SET_PRESENTER:
            if (msg->user_id == self_id_) {
                break;
            }
            presenter_id_ = msg->presenter_id;
            LOG_INFO("Presenter set to " << presenter_id_ << " by " << msg->user_id);
            if (on_presenter_) {
                on_presenter_(presenter_id_);
            }
            break;

        case MessageType::UNKNOWN:
            break;
    }
}

bool RoomSession::send(const SignalingMessage& msg) {
    if (state_ == RoomState::LEFT || !transport_.is_open()) {
        return false;
    }
    try {
        return transport_.send(common::serialize(msg));
    } catch (const nlohmann::json::exception& e) {
        LOG_ERROR("Failed to serialize " << common::to_string(msg.type) << ": " << e.what());
        return false;
    }
}

void RoomSession::on_transport_open() {
    LOG_INFO("Signaling connected, waiting for room-members");
}

void RoomSession::on_transport_close(const std::string& reason) {
    if (state_ == RoomState::LEFT) {
        return;
    }
    // 信令断开按离开处理，不自动重连
    LOG_WARN("Signaling connection lost (" << reason << "), leaving room " << room_id_);
    cleanup(reason);
}

void RoomSession::cleanup(const std::string& reason) {
    state_ = RoomState::LEFT;
    media_.stop_all();
    peers_.close_all();
    avatars_.clear();
    LOG_INFO("Left room " << room_id_);
    if (on_left_) {
        on_left_(reason);
    }
}

} // namespace huddle::client
