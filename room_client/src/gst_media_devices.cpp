/**
 * @file gst_media_devices.cpp
 * @brief GStreamer 采集设备实现
 */

#include "room_client/gst_media_devices.hpp"
#include "common/logger.hpp"

#include <boost/asio/post.hpp>

#include <gst/gst.h>
#include <gst/app/gstappsink.h>

#include <atomic>
#include <sstream>
#include <thread>

#include <unistd.h>

namespace huddle::client {

namespace {

constexpr GstClockTime kPullTimeout = 100 * GST_MSECOND;
constexpr GstClockTime kStartTimeout = 2 * GST_SECOND;

/**
 * @brief 由一条 GStreamer 管线驱动的轨道
 *
 * 拉取线程把编码后的帧推给 sink；管线出错或 EOS（如屏幕共享被系统
 * 终止）时，在事件循环上触发 notify_ended。
 */
class GstTrack : public MediaTrack {
public:
    GstTrack(boost::asio::io_context& io_context, std::string id, MediaKind kind,
             TrackSource source, GstElement* pipeline, GstElement* appsink)
        : MediaTrack(std::move(id), kind, source)
        , io_context_(io_context)
        , pipeline_(pipeline)
        , appsink_(appsink)
    {
    }

    ~GstTrack() override {
        stop();
    }

    void start_pull_thread(const std::weak_ptr<GstTrack>& weak_self) {
        auto* sink = GST_APP_SINK(appsink_);
        gst_app_sink_set_emit_signals(sink, FALSE);
        gst_app_sink_set_drop(sink, TRUE);
        gst_app_sink_set_max_buffers(sink, 5);

        pulling_ = true;
        pull_thread_ = std::thread([this, weak_self]() {
            GstBus* bus = gst_element_get_bus(pipeline_);
            while (pulling_) {
                GstSample* sample = gst_app_sink_try_pull_sample(GST_APP_SINK(appsink_), kPullTimeout);
                if (sample) {
                    GstBuffer* buffer = gst_sample_get_buffer(sample);
                    GstMapInfo map;
                    if (buffer && gst_buffer_map(buffer, &map, GST_MAP_READ)) {
                        push_sample(map.data, map.size);
                        gst_buffer_unmap(buffer, &map);
                    }
                    gst_sample_unref(sample);
                }

                GstMessage* msg = gst_bus_pop_filtered(
                    bus, static_cast<GstMessageType>(GST_MESSAGE_ERROR | GST_MESSAGE_EOS));
                if (msg) {
                    if (GST_MESSAGE_TYPE(msg) == GST_MESSAGE_ERROR) {
                        GError* err = nullptr;
                        gst_message_parse_error(msg, &err, nullptr);
                        LOG_WARN("Capture " << id() << " failed: " << (err ? err->message : "unknown"));
                        if (err) g_error_free(err);
                    } else {
                        LOG_INFO("Capture " << id() << " ended");
                    }
                    gst_message_unref(msg);
                    pulling_ = false;
                    boost::asio::post(io_context_, [weak_self]() {
                        if (auto self = weak_self.lock()) {
                            self->notify_ended();
                        }
                    });
                }
            }
            gst_object_unref(bus);
        });
    }

protected:
    void on_stop() override {
        pulling_ = false;
        if (pull_thread_.joinable()) {
            pull_thread_.join();
        }
        if (pipeline_) {
            gst_element_set_state(pipeline_, GST_STATE_NULL);
            gst_object_unref(appsink_);
            gst_object_unref(pipeline_);
            appsink_ = nullptr;
            pipeline_ = nullptr;
        }
    }

private:
    boost::asio::io_context& io_context_;
    GstElement* pipeline_;
    GstElement* appsink_;
    std::atomic<bool> pulling_{false};
    std::thread pull_thread_;
};

MediaError classify_device(const std::string& path) {
    if (path.empty()) {
        return MediaError::NONE;
    }
    if (::access(path.c_str(), F_OK) != 0) {
        return MediaError::DEVICE_NOT_FOUND;
    }
    if (::access(path.c_str(), R_OK) != 0) {
        return MediaError::PERMISSION_DENIED;
    }
    return MediaError::NONE;
}

void stop_all(std::vector<std::shared_ptr<MediaTrack>>& tracks) {
    for (auto& track : tracks) {
        track->stop();
    }
    tracks.clear();
}

} // namespace

GstMediaDevices::GstMediaDevices(boost::asio::io_context& io_context, const MediaConfig& config)
    : io_context_(io_context)
    , config_(config)
{
    gst_init(nullptr, nullptr);
}

MediaResult GstMediaDevices::open_user_media(bool audio, bool video) {
    MediaResult result;

    if (video) {
        auto error = classify_device(config_.video_device);
        if (error != MediaError::NONE) {
            return MediaResult::failure(error, "camera " + config_.video_device + " unavailable");
        }
        auto camera = open_track("camera-" + std::to_string(next_id_++), MediaKind::VIDEO,
                                 TrackSource::CAMERA,
                                 video_pipeline("v4l2src device=" + config_.video_device));
        if (!camera.ok()) {
            return camera;
        }
        result.tracks.push_back(camera.tracks.front());
    }

    if (audio) {
        auto microphone = open_track("microphone-" + std::to_string(next_id_++), MediaKind::AUDIO,
                                     TrackSource::MICROPHONE, audio_pipeline());
        if (!microphone.ok()) {
            stop_all(result.tracks);
            return microphone;
        }
        result.tracks.push_back(microphone.tracks.front());
    }

    return result;
}

MediaResult GstMediaDevices::open_display_media() {
    return open_track("screen-" + std::to_string(next_id_++), MediaKind::VIDEO,
                      TrackSource::SCREEN, video_pipeline("ximagesrc use-damage=false"));
}

MediaResult GstMediaDevices::open_track(const std::string& id, MediaKind kind, TrackSource source,
                                        const std::string& pipeline_desc) {
    GError* error = nullptr;
    GstElement* pipeline = gst_parse_launch(pipeline_desc.c_str(), &error);
    if (!pipeline || error) {
        std::string reason = error ? error->message : "unknown";
        LOG_ERROR("Failed to create pipeline for " << id << ": " << reason);
        if (error) g_error_free(error);
        if (pipeline) gst_object_unref(pipeline);
        return MediaResult::failure(MediaError::UNKNOWN, reason);
    }

    GstElement* appsink = gst_bin_get_by_name(GST_BIN(pipeline), "appsink");
    if (!appsink) {
        gst_object_unref(pipeline);
        return MediaResult::failure(MediaError::UNKNOWN, "appsink missing");
    }

    // 设备被占用时管线无法进入 PLAYING
    gst_element_set_state(pipeline, GST_STATE_PLAYING);
    GstState state = GST_STATE_NULL;
    auto ret = gst_element_get_state(pipeline, &state, nullptr, kStartTimeout);
    if (ret == GST_STATE_CHANGE_FAILURE) {
        LOG_WARN("Capture " << id << " could not start");
        gst_element_set_state(pipeline, GST_STATE_NULL);
        gst_object_unref(appsink);
        gst_object_unref(pipeline);
        return MediaResult::failure(MediaError::DEVICE_BUSY, id + " could not start");
    }

    auto track = std::make_shared<GstTrack>(io_context_, id, kind, source, pipeline, appsink);
    track->start_pull_thread(track);
    LOG_INFO("Capture started: " << pipeline_desc);

    MediaResult result;
    result.tracks.push_back(track);
    return result;
}

std::string GstMediaDevices::video_pipeline(const std::string& source) const {
    std::ostringstream desc;
    desc << source << " ! "
         << "videoconvert ! "
         << "x264enc tune=zerolatency speed-preset=ultrafast key-int-max=30 ! "
         << "video/x-h264,profile=constrained-baseline,stream-format=byte-stream ! "
         << "appsink name=appsink";
    return desc.str();
}

std::string GstMediaDevices::audio_pipeline() const {
    std::ostringstream desc;
    desc << "pulsesrc";
    if (!config_.audio_device.empty()) {
        desc << " device=" << config_.audio_device;
    }
    desc << " ! audioconvert ! audioresample ! "
         << "opusenc ! "
         << "appsink name=appsink";
    return desc.str();
}

} // namespace huddle::client
