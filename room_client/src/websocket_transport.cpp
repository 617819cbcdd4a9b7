/**
 * @file websocket_transport.cpp
 * @brief WebSocket 信令传输实现
 */

#include "room_client/websocket_transport.hpp"
#include "common/logger.hpp"

#include <boost/asio/strand.hpp>
#include <boost/beast/http.hpp>

#include <cctype>
#include <iomanip>
#include <sstream>

namespace huddle::client {

namespace http = beast::http;

struct WebSocketTransport::Connection {
    explicit Connection(net::io_context& ioc)
        : resolver(net::make_strand(ioc))
        , ws(net::make_strand(ioc))
    {
    }

    WebSocketTransport* owner = nullptr;
    tcp::resolver resolver;
    websocket::stream<beast::tcp_stream> ws;
    beast::flat_buffer buffer;
    std::queue<std::string> write_queue;
    WsUrl url;
    std::string host_header;
    bool writing = false;
    bool open = false;
    bool closed = false;
};

std::optional<WsUrl> parse_ws_url(const std::string& url) {
    std::string work = url;
    std::string default_port = "80";
    if (work.rfind("ws://", 0) == 0) {
        work = work.substr(5);
    } else if (work.rfind("http://", 0) == 0) {
        work = work.substr(7);
    } else if (work.rfind("wss://", 0) == 0 || work.rfind("https://", 0) == 0) {
        // 不支持 TLS
        return std::nullopt;
    }

    // 拆分 host[:port] 和 path
    std::string hostport;
    std::string path;
    auto slash_pos = work.find('/');
    if (slash_pos == std::string::npos) {
        hostport = work;
    } else {
        hostport = work.substr(0, slash_pos);
        path = work.substr(slash_pos);
    }

    WsUrl result;
    auto colon_pos = hostport.find(':');
    if (colon_pos == std::string::npos) {
        result.host = hostport;
        result.port = default_port;
    } else {
        result.host = hostport.substr(0, colon_pos);
        result.port = hostport.substr(colon_pos + 1);
    }

    if (result.host.empty() || result.port.empty()) {
        return std::nullopt;
    }
    if (!path.empty()) {
        result.target = path;
    }
    return result;
}

std::string make_room_target(const std::string& base_target, const std::string& room_id) {
    std::ostringstream ss;
    ss << base_target << (base_target.find('?') == std::string::npos ? '?' : '&') << "room=";
    for (unsigned char c : room_id) {
        if (std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~') {
            ss << c;
        } else {
            ss << '%' << std::uppercase << std::hex << std::setw(2) << std::setfill('0')
               << static_cast<int>(c) << std::nouppercase << std::dec;
        }
    }
    return ss.str();
}

WebSocketTransport::WebSocketTransport(net::io_context& io_context,
                                       std::string server_url,
                                       std::string session_cookie)
    : io_context_(io_context)
    , server_url_(std::move(server_url))
    , session_cookie_(std::move(session_cookie))
{
}

WebSocketTransport::~WebSocketTransport() {
    if (conn_) {
        // 析构后不再回调
        conn_->owner = nullptr;
        conn_->closed = true;
        beast::error_code ec;
        beast::get_lowest_layer(conn_->ws).socket().close(ec);
        conn_.reset();
    }
}

void WebSocketTransport::connect(const std::string& room_id) {
    auto url = parse_ws_url(server_url_);
    if (!url) {
        LOG_ERROR("[Signaling] invalid server url: " << server_url_);
        net::post(io_context_, [this]() {
            if (on_close_) on_close_("invalid server url");
        });
        return;
    }

    if (conn_) {
        close();
    }

    auto conn = std::make_shared<Connection>(io_context_);
    conn->owner = this;
    conn->url = *url;
    conn->url.target = make_room_target(url->target, room_id);
    conn->host_header = url->host + ":" + url->port;
    conn_ = conn;

    LOG_INFO("[Signaling] connecting to " << conn->host_header << conn->url.target);

    conn->resolver.async_resolve(
        url->host, url->port,
        [this, conn](beast::error_code ec, tcp::resolver::results_type results) {
            if (!conn->owner) return;
            on_resolve(conn, ec, std::move(results));
        });
}

void WebSocketTransport::on_resolve(std::shared_ptr<Connection> conn, beast::error_code ec,
                                    tcp::resolver::results_type results) {
    if (ec) {
        fail(conn, "resolve: " + ec.message());
        return;
    }

    beast::get_lowest_layer(conn->ws).expires_after(std::chrono::seconds(10));
    beast::get_lowest_layer(conn->ws).async_connect(
        results,
        [this, conn](beast::error_code ec, tcp::resolver::results_type::endpoint_type endpoint) {
            if (!conn->owner) return;
            on_connect(conn, ec, endpoint);
        });
}

void WebSocketTransport::on_connect(std::shared_ptr<Connection> conn, beast::error_code ec,
                                    tcp::resolver::results_type::endpoint_type) {
    if (ec) {
        fail(conn, "connect: " + ec.message());
        return;
    }

    beast::get_lowest_layer(conn->ws).expires_never();
    conn->ws.set_option(websocket::stream_base::timeout::suggested(beast::role_type::client));

    std::string cookie = session_cookie_;
    conn->ws.set_option(websocket::stream_base::decorator(
        [cookie](websocket::request_type& req) {
            req.set(http::field::user_agent, "huddle-room-client");
            if (!cookie.empty()) {
                req.set(http::field::cookie, cookie);
            }
        }));
    conn->ws.text(true);

    conn->ws.async_handshake(
        conn->host_header, conn->url.target,
        [this, conn](beast::error_code ec) {
            if (!conn->owner) return;
            on_handshake(conn, ec);
        });
}

void WebSocketTransport::on_handshake(std::shared_ptr<Connection> conn, beast::error_code ec) {
    if (ec) {
        fail(conn, "handshake: " + ec.message());
        return;
    }

    conn->open = true;
    LOG_INFO("[Signaling] connected");
    if (on_open_) {
        on_open_();
    }

    do_read(conn);
    if (!conn->write_queue.empty() && !conn->writing) {
        conn->writing = true;
        do_write(conn);
    }
}

void WebSocketTransport::do_read(std::shared_ptr<Connection> conn) {
    conn->ws.async_read(
        conn->buffer,
        [this, conn](beast::error_code ec, std::size_t bytes) {
            if (!conn->owner) return;
            on_read(conn, ec, bytes);
        });
}

void WebSocketTransport::on_read(std::shared_ptr<Connection> conn, beast::error_code ec, std::size_t) {
    if (ec == websocket::error::closed) {
        fail(conn, "closed by server");
        return;
    }
    if (ec) {
        fail(conn, "read: " + ec.message());
        return;
    }

    std::string text = beast::buffers_to_string(conn->buffer.data());
    conn->buffer.consume(conn->buffer.size());

    if (on_message_) {
        on_message_(text);
    }

    if (!conn->closed) {
        do_read(conn);
    }
}

bool WebSocketTransport::send(const std::string& text) {
    auto conn = conn_;
    if (!conn || conn->closed || !conn->open) {
        return false;
    }

    conn->write_queue.push(text);
    if (!conn->writing) {
        conn->writing = true;
        net::post(conn->ws.get_executor(), [this, conn]() {
            if (!conn->owner) return;
            do_write(conn);
        });
    }
    return true;
}

void WebSocketTransport::do_write(std::shared_ptr<Connection> conn) {
    if (conn->write_queue.empty() || conn->closed) {
        conn->writing = false;
        return;
    }

    conn->ws.async_write(
        net::buffer(conn->write_queue.front()),
        [this, conn](beast::error_code ec, std::size_t bytes) {
            if (!conn->owner) return;
            on_write(conn, ec, bytes);
        });
}

void WebSocketTransport::on_write(std::shared_ptr<Connection> conn, beast::error_code ec, std::size_t) {
    if (ec) {
        conn->writing = false;
        fail(conn, "write: " + ec.message());
        return;
    }
    conn->write_queue.pop();
    do_write(conn);
}

void WebSocketTransport::close() {
    auto conn = conn_;
    if (!conn || conn->closed) {
        return;
    }
    conn->closed = true;
    conn->owner = nullptr;
    conn_.reset();

    if (conn->open) {
        conn->open = false;
        conn->ws.async_close(websocket::close_code::normal,
                             [conn](beast::error_code ec) {
                                 if (ec) {
                                     LOG_DEBUG("[Signaling] close: " << ec.message());
                                 }
                             });
    } else {
        beast::error_code ec;
        beast::get_lowest_layer(conn->ws).socket().close(ec);
    }
    LOG_INFO("[Signaling] disconnected");
}

bool WebSocketTransport::is_open() const {
    return conn_ && conn_->open && !conn_->closed;
}

void WebSocketTransport::fail(const std::shared_ptr<Connection>& conn, const std::string& reason) {
    if (conn->closed) {
        return;
    }
    conn->closed = true;
    conn->open = false;
    conn->owner = nullptr;
    if (conn_ == conn) {
        conn_.reset();
    }

    LOG_WARN("[Signaling] connection lost: " << reason);
    if (on_close_) {
        on_close_(reason);
    }
}

} // namespace huddle::client
