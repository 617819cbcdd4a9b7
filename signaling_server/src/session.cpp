/**
 * @file session.cpp
 * @brief WebSocket 会话实现
 */

#include "signaling_server/session.hpp"
#include "signaling_server/server.hpp"
#include "signaling_server/config.hpp"
#include "signaling_server/identity.hpp"
#include "signaling_server/upgrade_target.hpp"
#include "common/logger.hpp"

#include <chrono>

namespace huddle::signaling {

namespace {
constexpr const char* kServerName = "huddle-signaling";
}

Session::Session(tcp::socket&& socket,
                 Server& server,
                 SignalingGateway& gateway,
                 const IdentityResolver& identity,
                 const Config& config,
                 std::string remote)
    : ws_(std::move(socket))
    , server_(server)
    , gateway_(gateway)
    , identity_(identity)
    , config_(config)
    , remote_(std::move(remote))
{
}

Session::~Session() {
    server_.remove_session(this);
}

void Session::start() {
    server_.add_session(shared_from_this());
    do_read_request();
}

void Session::do_read_request() {
    // 握手阶段超时，防止半开连接占用名额
    beast::get_lowest_layer(ws_).expires_after(
        std::chrono::seconds(config_.server.handshake_timeout_sec));

    http::async_read(
        beast::get_lowest_layer(ws_),
        buffer_,
        request_,
        beast::bind_front_handler(&Session::on_read_request, shared_from_this())
    );
}

void Session::on_read_request(beast::error_code ec, std::size_t) {
    if (ec) {
        if (ec != http::error::end_of_stream) {
            LOG_DEBUG("Failed to read upgrade request from " << remote_ << ": " << ec.message());
        }
        state_ = SessionState::CLOSING;
        return;
    }

    if (!websocket::is_upgrade(request_)) {
        reject(http::status::bad_request, "WebSocket upgrade required");
        return;
    }

    auto target = parse_upgrade_target(std::string(request_.target()),
                                       config_.limits.max_room_id_length);
    if (target.status == UpgradeTargetStatus::NOT_FOUND) {
        reject(http::status::not_found, "Not found");
        return;
    }
    if (target.status == UpgradeTargetStatus::BAD_ROOM_ID) {
        reject(http::status::bad_request, "Invalid room id");
        return;
    }

    if (!gateway_.can_join(target.room_id, config_.server.max_room_size)) {
        LOG_WARN("Room " << target.room_id << " is full, rejecting " << remote_);
        reject(http::status::service_unavailable, "Room is full");
        return;
    }

    room_id_ = target.room_id;

    auto cookie = request_.find(http::field::cookie);
    if (cookie != request_.end()) {
        user_id_ = identity_.resolve(std::string(cookie->value()));
    }

    do_accept();
}

void Session::reject(http::status status, const std::string& reason) {
    LOG_INFO("Rejecting upgrade from " << remote_ << " (" << request_.target()
             << "): " << static_cast<unsigned>(status) << " " << reason);

    state_ = SessionState::CLOSING;

    response_ = std::make_shared<http::response<http::string_body>>(status, request_.version());
    response_->set(http::field::server, kServerName);
    response_->set(http::field::content_type, "text/plain");
    response_->keep_alive(false);
    response_->body() = reason;
    response_->prepare_payload();

    http::async_write(
        beast::get_lowest_layer(ws_),
        *response_,
        beast::bind_front_handler(&Session::on_reject_written, shared_from_this())
    );
}

void Session::on_reject_written(beast::error_code, std::size_t) {
    beast::error_code ec;
    beast::get_lowest_layer(ws_).socket().shutdown(tcp::socket::shutdown_send, ec);
}

void Session::do_accept() {
    // 握手后由 websocket 自己的超时接管
    beast::get_lowest_layer(ws_).expires_never();

    websocket::stream_base::timeout opt{
        std::chrono::seconds(config_.server.handshake_timeout_sec),
        std::chrono::seconds(config_.server.idle_timeout_sec),
        true    // 空闲一半时间发送 ping，对端无响应则断开
    };
    ws_.set_option(opt);

    ws_.set_option(websocket::stream_base::decorator(
        [](websocket::response_type& res) {
            res.set(http::field::server, kServerName);
        }));

    ws_.text(true);
    ws_.read_message_max(config_.server.max_message_bytes);

    ws_.async_accept(
        request_,
        beast::bind_front_handler(&Session::on_accept, shared_from_this())
    );
}

void Session::on_accept(beast::error_code ec) {
    if (ec) {
        LOG_WARN("WebSocket accept error from " << remote_ << ": " << ec.message());
        state_ = SessionState::CLOSING;
        return;
    }

    // 握手期间可能已有其他连接占满房间
    if (!gateway_.can_join(room_id_, config_.server.max_room_size)) {
        LOG_WARN("Room " << room_id_ << " filled up during handshake, closing " << remote_);
        state_ = SessionState::CLOSING;
        ws_.async_close(websocket::close_reason(websocket::close_code::try_again_later, "Room is full"),
                        [self = shared_from_this()](beast::error_code) {});
        return;
    }

    state_ = SessionState::OPEN;
    connection_id_ = gateway_.open(room_id_, user_id_, weak_from_this());

    do_read();
}

void Session::do_read() {
    ws_.async_read(
        buffer_,
        beast::bind_front_handler(&Session::on_read, shared_from_this())
    );
}

void Session::on_read(beast::error_code ec, std::size_t) {
    if (ec == websocket::error::closed) {
        on_disconnect("closed by client");
        return;
    }

    if (ec) {
        on_disconnect(ec.message());
        return;
    }

    if (!ws_.got_text()) {
        LOG_WARN("Dropping binary frame from " << connection_id_);
    } else {
        gateway_.on_message(connection_id_, beast::buffers_to_string(buffer_.data()));
    }

    buffer_.consume(buffer_.size());

    if (state_ == SessionState::OPEN) {
        do_read();
    }
}

void Session::send(const std::string& text) {
    if (state_ != SessionState::OPEN) {
        return;
    }

    write_queue_.push(text);
    if (!writing_) {
        writing_ = true;
        net::post(ws_.get_executor(), [self = shared_from_this()]() {
            self->do_write();
        });
    }
}

void Session::do_write() {
    if (write_queue_.empty() || state_ != SessionState::OPEN) {
        writing_ = false;
        return;
    }

    ws_.async_write(
        net::buffer(write_queue_.front()),
        beast::bind_front_handler(&Session::on_write, shared_from_this())
    );
}

void Session::on_write(beast::error_code ec, std::size_t) {
    if (ec) {
        writing_ = false;
        on_disconnect("write error: " + ec.message());
        return;
    }

    write_queue_.pop();
    do_write();
}

void Session::close() {
    if (state_ == SessionState::CLOSING) {
        return;
    }

    bool was_open = (state_ == SessionState::OPEN);
    state_ = SessionState::CLOSING;

    if (!was_open) {
        beast::error_code ec;
        beast::get_lowest_layer(ws_).socket().close(ec);
        return;
    }

    gateway_.close(connection_id_);

    ws_.async_close(websocket::close_code::going_away,
                    [self = shared_from_this()](beast::error_code ec) {
                        if (ec) {
                            LOG_DEBUG("Close handshake failed for " << self->connection_id_
                                      << ": " << ec.message());
                        }
                    });
}

void Session::on_disconnect(const std::string& reason) {
    if (state_ == SessionState::OPEN) {
        LOG_INFO("Connection " << connection_id_ << " from " << remote_
                 << " disconnected: " << reason);
    }
    state_ = SessionState::CLOSING;

    // 幂等：同一连接只会产生一次 user-left
    if (!connection_id_.empty()) {
        gateway_.close(connection_id_);
    }
}

} // namespace huddle::signaling
