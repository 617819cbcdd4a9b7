/**
 * @file media_track.hpp
 * @brief 本地/远端媒体轨道与采集设备抽象
 *
 * 轨道是编码后样本的来源；同一本地轨道可被多个对端连接共享，
 * 每个对端通过 add_sink 订阅样本。
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace huddle::client {

/**
 * @brief 轨道类型
 */
enum class MediaKind {
    AUDIO,
    VIDEO
};

/**
 * @brief 轨道来源
 */
enum class TrackSource {
    CAMERA,
    MICROPHONE,
    SCREEN,
    PLACEHOLDER,    // 关闭摄像头/麦克风时发送的黑帧/静音
    REMOTE
};

const char* to_string(MediaKind kind);
const char* to_string(TrackSource source);

/**
 * @brief 媒体轨道
 */
class MediaTrack {
public:
    using SampleSink = std::function<void(const uint8_t* data, size_t size)>;
    using OnEnded = std::function<void()>;

    MediaTrack(std::string id, MediaKind kind, TrackSource source);
    virtual ~MediaTrack() = default;

    MediaTrack(const MediaTrack&) = delete;
    MediaTrack& operator=(const MediaTrack&) = delete;

    const std::string& id() const { return id_; }
    MediaKind kind() const { return kind_; }
    TrackSource source() const { return source_; }

    bool enabled() const;
    void set_enabled(bool enabled);

    /**
     * @brief 停止轨道（释放采集资源），幂等
     */
    void stop();
    bool stopped() const;

    /**
     * @brief 采集源自行结束时回调（例如用户在系统界面结束屏幕共享）
     */
    void set_on_ended(OnEnded cb);

    /**
     * @brief 采集源结束：标记停止并触发 on_ended
     */
    void notify_ended();

    /**
     * @brief 订阅样本，返回用于取消订阅的句柄
     */
    int add_sink(SampleSink sink);
    void remove_sink(int handle);
    size_t sink_count() const;

    /**
     * @brief 推送一帧编码样本；禁用或已停止时丢弃
     */
    void push_sample(const uint8_t* data, size_t size);

protected:
    /**
     * @brief 子类释放采集资源
     */
    virtual void on_stop() {}

private:
    std::string id_;
    MediaKind kind_;
    TrackSource source_;

    mutable std::mutex mutex_;
    bool enabled_ = true;
    bool stopped_ = false;
    OnEnded on_ended_;
    std::map<int, SampleSink> sinks_;
    int next_handle_ = 1;
};

/**
 * @brief 媒体获取错误
 */
enum class MediaError {
    NONE,
    PERMISSION_DENIED,
    DEVICE_NOT_FOUND,
    DEVICE_BUSY,
    UNKNOWN
};

const char* to_string(MediaError error);

/**
 * @brief 媒体获取结果
 */
struct MediaResult {
    MediaError error = MediaError::NONE;
    std::string message;
    std::vector<std::shared_ptr<MediaTrack>> tracks;

    bool ok() const { return error == MediaError::NONE; }

    static MediaResult failure(MediaError error, std::string message) {
        MediaResult result;
        result.error = error;
        result.message = std::move(message);
        return result;
    }
};

/**
 * @brief 采集设备接口（由 UI 层或 GStreamer 实现）
 */
class MediaDevices {
public:
    virtual ~MediaDevices() = default;

    /**
     * @brief 打开摄像头/麦克风
     */
    virtual MediaResult open_user_media(bool audio, bool video) = 0;

    /**
     * @brief 打开屏幕采集（返回一条视频轨道）
     */
    virtual MediaResult open_display_media() = 0;

    /**
     * @brief 创建占位轨道（默认禁用，不产生样本）
     */
    virtual std::shared_ptr<MediaTrack> create_placeholder(MediaKind kind);
};

} // namespace huddle::client
