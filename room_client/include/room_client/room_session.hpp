/**
 * @file room_session.hpp
 * @brief 房间会话
 *
 * 持有一个房间的信令传输，把入站消息分发给对端管理、头像与白板，
 * 并对外提供客户端 API。离开房间（主动离开或连接断开）时必须
 * 停止全部本地轨道并关闭所有对端连接。
 */

#pragma once

#include "room_client/avatar_board.hpp"
#include "room_client/canvas_board.hpp"
#include "room_client/config.hpp"
#include "room_client/media_controller.hpp"
#include "room_client/peer_connection_manager.hpp"
#include "room_client/signaling_transport.hpp"

#include <boost/asio/io_context.hpp>

#include <functional>
#include <optional>
#include <string>

namespace huddle::client {

/**
 * @brief 会话状态
 */
enum class RoomState {
    IDLE,
    CONNECTING,
    JOINED,
    LEFT
};

const char* to_string(RoomState state);

/**
 * @brief 房间会话
 */
class RoomSession {
public:
    using OnPresenter = std::function<void(const std::string& presenter_id)>;
    using OnLeft = std::function<void(const std::string& reason)>;

    RoomSession(boost::asio::io_context& io_context,
                SignalingTransport& transport,
                PeerTransportFactory& peer_factory,
                MediaDevices& devices,
                CanvasSurface& surface,
                const ClientConfig& config);
    ~RoomSession();

    RoomSession(const RoomSession&) = delete;
    RoomSession& operator=(const RoomSession&) = delete;

    /**
     * @brief 加入房间
     * @return 已加入或已离开时返回 false
     */
    bool initialize(const std::string& room_id);

    // ==================== 媒体 ====================

    MediaResult start_local_media();
    bool stop_local_media();
    bool toggle_video(std::optional<bool> enabled = std::nullopt);
    bool toggle_audio(std::optional<bool> enabled = std::nullopt);
    MediaResult start_screen_share();
    bool stop_screen_share();

    // ==================== 头像 ====================

    bool add_avatar(const std::string& user_id, double x, double y, const AvatarStyle& style = {});
    bool update_avatar(double x, double y);
    bool remove_avatar(const std::string& user_id);

    // ==================== 白板 ====================

    bool set_tool(const std::string& tool);
    bool set_color(const std::string& color);
    bool set_line_width(double width);
    bool clear_canvas();

    // ==================== 演示者 ====================

    bool set_presenter(const std::string& presenter_id);
    const std::string& presenter_id() const { return presenter_id_; }
    void set_on_presenter(OnPresenter cb) { on_presenter_ = std::move(cb); }

    /**
     * @brief 离开房间（停止本地媒体，关闭全部对端连接），幂等
     * @return 本次调用是否执行了清理
     */
    bool leave();
    void set_on_left(OnLeft cb) { on_left_ = std::move(cb); }

    RoomState state() const { return state_; }
    const std::string& room_id() const { return room_id_; }
    const std::string& self_id() const { return self_id_; }

    PeerConnectionManager& peers() { return peers_; }
    MediaController& media() { return media_; }
    AvatarBoard& avatars() { return avatars_; }
    CanvasBoard& canvas() { return canvas_; }

    /**
     * @brief 处理一条入站文本帧（供传输回调调用）
     */
    void handle_text(const std::string& text);

private:
    bool send(const common::SignalingMessage& msg);
    void on_transport_open();
    void on_transport_close(const std::string& reason);
    void cleanup(const std::string& reason);

private:
    SignalingTransport& transport_;
    const ClientConfig& config_;

    PeerConnectionManager peers_;
    MediaController media_;
    AvatarBoard avatars_;
    CanvasBoard canvas_;

    RoomState state_ = RoomState::IDLE;
    std::string room_id_;
    std::string self_id_;
    std::string presenter_id_;

    OnPresenter on_presenter_;
    OnLeft on_left_;
};

} // namespace huddle::client
