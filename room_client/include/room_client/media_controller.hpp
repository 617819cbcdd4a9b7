/**
 * @file media_controller.hpp
 * @brief 本地媒体控制
 *
 * 摄像头/麦克风只获取一次，由所有对端共享。关闭视频/音频时用禁用的
 * 占位轨道替换发送轨道，不触发重新协商；屏幕共享同样通过替换发送轨道切换。
 */

#pragma once

#include "room_client/media_track.hpp"

#include <memory>
#include <optional>

namespace huddle::client {

class PeerConnectionManager;

/**
 * @brief 本地媒体控制器
 */
class MediaController {
public:
    MediaController(MediaDevices& devices, PeerConnectionManager& peers);
    ~MediaController();

    /**
     * @brief 获取摄像头与麦克风，幂等
     *
     * 权限被拒绝等错误不会抛出，记录在 last_error() 中，可再次重试
     */
    MediaResult start_local_media();

    /**
     * @brief 停止摄像头与麦克风（屏幕共享不受影响）
     */
    void stop_local_media();

    /**
     * @brief 切换视频
     * @param enabled 指定目标状态，不指定则取反
     * @return 切换后的启用状态（无本地媒体时为 false）
     */
    bool toggle_video(std::optional<bool> enabled = std::nullopt);

    /**
     * @brief 切换音频
     */
    bool toggle_audio(std::optional<bool> enabled = std::nullopt);

    /**
     * @brief 开始屏幕共享，在所有对端上替换视频发送轨道
     */
    MediaResult start_screen_share();

    /**
     * @brief 结束屏幕共享，恢复摄像头或占位轨道
     * @return 之前是否在共享
     */
    bool stop_screen_share();

    /**
     * @brief 离开房间时的强制清理：停止全部本地轨道，幂等
     */
    void stop_all();

    bool has_local_media() const { return camera_ != nullptr || microphone_ != nullptr; }
    bool video_enabled() const { return camera_ != nullptr && video_enabled_; }
    bool audio_enabled() const { return microphone_ != nullptr && audio_enabled_; }
    bool screen_sharing() const { return screen_ != nullptr; }

    /** @brief 媒体控件是否可用（获取失败时禁用） */
    bool controls_enabled() const { return has_local_media(); }
    MediaError last_error() const { return last_error_; }

    std::shared_ptr<MediaTrack> camera_track() const { return camera_; }
    std::shared_ptr<MediaTrack> microphone_track() const { return microphone_; }
    std::shared_ptr<MediaTrack> screen_track() const { return screen_; }

    /** @brief 当前实际发送的轨道 */
    std::shared_ptr<MediaTrack> outgoing_video() const;
    std::shared_ptr<MediaTrack> outgoing_audio() const;

private:
    void publish_video();
    void publish_audio();
    std::shared_ptr<MediaTrack> placeholder(MediaKind kind);

private:
    MediaDevices& devices_;
    PeerConnectionManager& peers_;

    std::shared_ptr<MediaTrack> camera_;
    std::shared_ptr<MediaTrack> microphone_;
    std::shared_ptr<MediaTrack> screen_;
    std::shared_ptr<MediaTrack> video_placeholder_;
    std::shared_ptr<MediaTrack> audio_placeholder_;

    bool video_enabled_ = true;
    bool audio_enabled_ = true;
    MediaError last_error_ = MediaError::NONE;
};

} // namespace huddle::client
