/**
 * @file server.cpp
 * @brief WebSocket 信令服务器实现
 */

#include "signaling_server/server.hpp"
#include "signaling_server/session.hpp"
#include "signaling_server/config.hpp"
#include "signaling_server/signaling_gateway.hpp"
#include "signaling_server/identity.hpp"
#include "common/logger.hpp"

#include <vector>

namespace huddle::signaling {

Server::Server(net::io_context& io_context,
               const Config& config,
               SignalingGateway& gateway,
               const IdentityResolver& identity)
    : io_context_(io_context)
    , acceptor_(io_context)
    , config_(config)
    , gateway_(gateway)
    , identity_(identity)
{
}

Server::~Server() {
    stop();
}

bool Server::start() {
    beast::error_code ec;

    auto const address = net::ip::make_address(config_.server.host, ec);
    if (ec) {
        LOG_ERROR("Invalid address " << config_.server.host << ": " << ec.message());
        return false;
    }

    tcp::endpoint endpoint{address, config_.server.port};

    // 打开 acceptor
    acceptor_.open(endpoint.protocol(), ec);
    if (ec) {
        LOG_ERROR("Failed to open acceptor: " << ec.message());
        return false;
    }

    // 设置 SO_REUSEADDR
    acceptor_.set_option(net::socket_base::reuse_address(true), ec);
    if (ec) {
        LOG_ERROR("Failed to set SO_REUSEADDR: " << ec.message());
        return false;
    }

    // 绑定地址
    acceptor_.bind(endpoint, ec);
    if (ec) {
        LOG_ERROR("Failed to bind " << config_.server.host << ":" << config_.server.port
                  << ": " << ec.message());
        return false;
    }

    // 开始监听
    acceptor_.listen(net::socket_base::max_listen_connections, ec);
    if (ec) {
        LOG_ERROR("Failed to listen: " << ec.message());
        return false;
    }

    running_ = true;
    LOG_INFO("Signaling server listening on " << config_.server.host << ":" << port());

    do_accept();
    return true;
}

void Server::stop() {
    if (!running_) {
        return;
    }

    running_ = false;

    beast::error_code ec;
    acceptor_.close(ec);

    // 已入房连接由网关统一关闭（不再广播 user-left）
    gateway_.close_all();

    // 握手中的连接直接关闭 socket
    std::vector<std::shared_ptr<Session>> pending;
    pending.reserve(sessions_.size());
    for (auto& [ptr, weak] : sessions_) {
        if (auto session = weak.lock()) {
            pending.push_back(std::move(session));
        }
    }
    for (auto& session : pending) {
        session->close();
    }
}

uint16_t Server::port() const {
    beast::error_code ec;
    auto endpoint = acceptor_.local_endpoint(ec);
    return ec ? config_.server.port : endpoint.port();
}

void Server::add_session(const std::shared_ptr<Session>& session) {
    sessions_[session.get()] = session;
}

void Server::remove_session(Session* session) {
    sessions_.erase(session);
}

void Server::do_accept() {
    acceptor_.async_accept(
        net::make_strand(io_context_),
        beast::bind_front_handler(&Server::on_accept, shared_from_this())
    );
}

void Server::on_accept(beast::error_code ec, tcp::socket socket) {
    if (ec) {
        if (running_) {
            LOG_ERROR("Accept error: " << ec.message());
        }
    } else {
        // 解析远端地址
        beast::error_code ep_ec;
        auto remote = socket.remote_endpoint(ep_ec);
        std::string remote_str = ep_ec
            ? "unknown"
            : remote.address().to_string() + ":" + std::to_string(remote.port());

        if (config_.server.max_connections > 0 &&
            session_count() >= config_.server.max_connections) {
            LOG_WARN("Rejecting connection from " << remote_str
                     << ": connection limit " << config_.server.max_connections << " reached");
            beast::error_code close_ec;
            socket.close(close_ec);
        } else {
            auto session = std::make_shared<Session>(
                std::move(socket), *this, gateway_, identity_, config_, remote_str);
            session->start();
            LOG_DEBUG("New connection from " << remote_str);
        }
    }

    // 继续接受新连接
    if (running_) {
        do_accept();
    }
}

} // namespace huddle::signaling
