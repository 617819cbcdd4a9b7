/**
 * @file websocket_transport.hpp
 * @brief 基于 Boost.Beast 的 WebSocket 信令传输
 */

#pragma once

#include "room_client/signaling_transport.hpp"

#include <boost/beast/core.hpp>
#include <boost/beast/websocket.hpp>
#include <boost/asio/ip/tcp.hpp>

#include <memory>
#include <optional>
#include <queue>
#include <string>

namespace huddle::client {

namespace beast = boost::beast;
namespace websocket = beast::websocket;
namespace net = boost::asio;
using tcp = net::ip::tcp;

/**
 * @brief 解析后的 ws:// 地址
 */
struct WsUrl {
    std::string host;
    std::string port = "80";
    std::string target = "/ws";
};

/**
 * @brief 解析 ws://host[:port][/path]（也接受 http://）
 */
std::optional<WsUrl> parse_ws_url(const std::string& url);

/**
 * @brief 拼接带房间参数的升级目标，如 /ws?room=lobby
 */
std::string make_room_target(const std::string& base_target, const std::string& room_id);

/**
 * @brief WebSocket 信令传输
 */
class WebSocketTransport : public SignalingTransport {
public:
    /**
     * @param io_context 客户端事件循环
     * @param server_url 信令服务地址（ws://host:port/ws）
     * @param session_cookie 会话 Cookie 头（可为空）
     */
    WebSocketTransport(net::io_context& io_context,
                       std::string server_url,
                       std::string session_cookie = "");
    ~WebSocketTransport() override;

    void connect(const std::string& room_id) override;
    bool send(const std::string& text) override;
    void close() override;
    bool is_open() const override;

private:
    struct Connection;

    void on_resolve(std::shared_ptr<Connection> conn, beast::error_code ec,
                    tcp::resolver::results_type results);
    void on_connect(std::shared_ptr<Connection> conn, beast::error_code ec,
                    tcp::resolver::results_type::endpoint_type endpoint);
    void on_handshake(std::shared_ptr<Connection> conn, beast::error_code ec);
    void do_read(std::shared_ptr<Connection> conn);
    void on_read(std::shared_ptr<Connection> conn, beast::error_code ec, std::size_t bytes);
    void do_write(std::shared_ptr<Connection> conn);
    void on_write(std::shared_ptr<Connection> conn, beast::error_code ec, std::size_t bytes);

    void fail(const std::shared_ptr<Connection>& conn, const std::string& reason);

private:
    net::io_context& io_context_;
    std::string server_url_;
    std::string session_cookie_;

    std::shared_ptr<Connection> conn_;
};

} // namespace huddle::client
