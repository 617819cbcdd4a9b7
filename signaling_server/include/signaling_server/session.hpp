/**
 * @file session.hpp
 * @brief WebSocket 会话
 *
 * 一个会话对应一条客户端连接：先读取 HTTP 升级请求，
 * 校验路径与房间容量后完成握手，之后把文本帧交给信令网关。
 */

#pragma once

#include "signaling_server/signaling_gateway.hpp"

#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/websocket.hpp>
#include <boost/asio/ip/tcp.hpp>

#include <memory>
#include <optional>
#include <queue>
#include <string>

namespace huddle::signaling {

namespace beast = boost::beast;
namespace http = beast::http;
namespace websocket = beast::websocket;
namespace net = boost::asio;
using tcp = net::ip::tcp;

class Server;
class Config;
class IdentityResolver;

/**
 * @brief 会话状态
 */
enum class SessionState {
    HANDSHAKING,    // 读取升级请求 / 握手中
    OPEN,           // 已加入房间
    CLOSING         // 关闭中
};

/**
 * @brief WebSocket 会话
 */
class Session : public ConnectionSink, public std::enable_shared_from_this<Session> {
public:
    Session(tcp::socket&& socket,
            Server& server,
            SignalingGateway& gateway,
            const IdentityResolver& identity,
            const Config& config,
            std::string remote);

    ~Session() override;

    /**
     * @brief 启动会话（开始读取升级请求）
     */
    void start();

    void send(const std::string& text) override;
    void close() override;

    const std::string& connection_id() const { return connection_id_; }
    const std::string& room_id() const { return room_id_; }
    SessionState state() const { return state_; }

private:
    void do_read_request();
    void on_read_request(beast::error_code ec, std::size_t bytes_transferred);

    void reject(http::status status, const std::string& reason);
    void on_reject_written(beast::error_code ec, std::size_t bytes_transferred);

    void do_accept();
    void on_accept(beast::error_code ec);

    void do_read();
    void on_read(beast::error_code ec, std::size_t bytes_transferred);

    void do_write();
    void on_write(beast::error_code ec, std::size_t bytes_transferred);

    /**
     * @brief 连接断开（读/写错误、超时、对端关闭）
     */
    void on_disconnect(const std::string& reason);

private:
    websocket::stream<beast::tcp_stream> ws_;
    Server& server_;
    SignalingGateway& gateway_;
    const IdentityResolver& identity_;
    const Config& config_;
    std::string remote_;

    beast::flat_buffer buffer_;
    http::request<http::string_body> request_;
    std::shared_ptr<http::response<http::string_body>> response_;

    std::string room_id_;
    std::optional<std::string> user_id_;
    std::string connection_id_;
    SessionState state_ = SessionState::HANDSHAKING;

    std::queue<std::string> write_queue_;
    bool writing_ = false;
};

} // namespace huddle::signaling
