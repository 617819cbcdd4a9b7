/**
 * @file signaling_transport.hpp
 * @brief 信令传输抽象（connect / send / on_message / close）
 */

#pragma once

#include <functional>
#include <string>

namespace huddle::client {

/**
 * @brief 信令传输
 *
 * 回调都在客户端事件循环上触发；on_close 对每次连接最多触发一次
 */
class SignalingTransport {
public:
    using OnOpen = std::function<void()>;
    using OnMessage = std::function<void(const std::string& text)>;
    using OnClose = std::function<void(const std::string& reason)>;

    virtual ~SignalingTransport() = default;

    /**
     * @brief 异步连接到指定房间，成功后触发 on_open
     */
    virtual void connect(const std::string& room_id) = 0;

    /**
     * @brief 发送文本帧
     * @return 未连接时返回 false
     */
    virtual bool send(const std::string& text) = 0;

    /**
     * @brief 主动关闭，幂等
     */
    virtual void close() = 0;

    virtual bool is_open() const = 0;

    void set_on_open(OnOpen cb) { on_open_ = std::move(cb); }
    void set_on_message(OnMessage cb) { on_message_ = std::move(cb); }
    void set_on_close(OnClose cb) { on_close_ = std::move(cb); }

protected:
    OnOpen on_open_;
    OnMessage on_message_;
    OnClose on_close_;
};

} // namespace huddle::client
