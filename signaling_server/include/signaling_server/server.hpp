/**
 * @file server.hpp
 * @brief WebSocket 信令服务器
 *
 * 基于 Boost.Beast 实现，单线程 io_context 驱动全部连接
 */

#pragma once

#include <boost/beast/core.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/strand.hpp>

#include <memory>
#include <unordered_map>

namespace huddle::signaling {

namespace beast = boost::beast;
namespace net = boost::asio;
using tcp = net::ip::tcp;

class Session;
class Config;
class SignalingGateway;
class IdentityResolver;

/**
 * @brief WebSocket 服务器
 */
class Server : public std::enable_shared_from_this<Server> {
public:
    /**
     * @brief 构造函数
     * @param io_context IO 上下文
     * @param config 配置
     * @param gateway 信令网关
     * @param identity 身份解析
     */
    Server(net::io_context& io_context,
           const Config& config,
           SignalingGateway& gateway,
           const IdentityResolver& identity);

    ~Server();

    /**
     * @brief 启动服务器
     * @return 监听失败返回 false
     */
    bool start();

    /**
     * @brief 停止服务器并关闭所有会话
     */
    void stop();

    /**
     * @brief 实际监听端口（配置端口为 0 时由系统分配）
     */
    uint16_t port() const;

    void add_session(const std::shared_ptr<Session>& session);
    void remove_session(Session* session);

    /**
     * @brief 获取会话数量（含握手中的连接）
     */
    size_t session_count() const { return sessions_.size(); }

private:
    void do_accept();
    void on_accept(beast::error_code ec, tcp::socket socket);

private:
    net::io_context& io_context_;
    tcp::acceptor acceptor_;
    const Config& config_;
    SignalingGateway& gateway_;
    const IdentityResolver& identity_;

    std::unordered_map<Session*, std::weak_ptr<Session>> sessions_;

    bool running_ = false;
};

} // namespace huddle::signaling
