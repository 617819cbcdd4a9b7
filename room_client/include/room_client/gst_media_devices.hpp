/**
 * @file gst_media_devices.hpp
 * @brief 基于 GStreamer 的本地采集设备
 *
 * 摄像头 v4l2src、麦克风 pulsesrc、屏幕 ximagesrc，编码后经
 * appsink 拉取，交给 MediaTrack 的 sink。
 */

#pragma once

#include "room_client/config.hpp"
#include "room_client/media_track.hpp"

#include <boost/asio/io_context.hpp>

namespace huddle::client {

/**
 * @brief GStreamer 采集设备
 */
class GstMediaDevices : public MediaDevices {
public:
    GstMediaDevices(boost::asio::io_context& io_context, const MediaConfig& config);

    MediaResult open_user_media(bool audio, bool video) override;
    MediaResult open_display_media() override;

private:
    MediaResult open_track(const std::string& id, MediaKind kind, TrackSource source,
                           const std::string& pipeline_desc);

    std::string video_pipeline(const std::string& source) const;
    std::string audio_pipeline() const;

private:
    boost::asio::io_context& io_context_;
    MediaConfig config_;
    int next_id_ = 1;
};

} // namespace huddle::client
