/**
 * @file media_track.cpp
 * @brief 媒体轨道实现
 */

#include "room_client/media_track.hpp"

namespace huddle::client {

const char* to_string(MediaKind kind) {
    return kind == MediaKind::AUDIO ? "audio" : "video";
}

const char* to_string(TrackSource source) {
    switch (source) {
        case TrackSource::CAMERA: return "camera";
        case TrackSource::MICROPHONE: return "microphone";
        case TrackSource::SCREEN: return "screen";
        case TrackSource::PLACEHOLDER: return "placeholder";
        case TrackSource::REMOTE: return "remote";
    }
    return "unknown";
}

const char* to_string(MediaError error) {
    switch (error) {
        case MediaError::NONE: return "none";
        case MediaError::PERMISSION_DENIED: return "permission-denied";
        case MediaError::DEVICE_NOT_FOUND: return "device-not-found";
        case MediaError::DEVICE_BUSY: return "device-busy";
        case MediaError::UNKNOWN: return "unknown";
    }
    return "unknown";
}

MediaTrack::MediaTrack(std::string id, MediaKind kind, TrackSource source)
    : id_(std::move(id))
    , kind_(kind)
    , source_(source)
{
}

bool MediaTrack::enabled() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return enabled_;
}

void MediaTrack::set_enabled(bool enabled) {
    std::lock_guard<std::mutex> lock(mutex_);
    enabled_ = enabled;
}

void MediaTrack::stop() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stopped_) {
            return;
        }
        stopped_ = true;
        sinks_.clear();
    }
    on_stop();
}

bool MediaTrack::stopped() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return stopped_;
}

void MediaTrack::set_on_ended(OnEnded cb) {
    std::lock_guard<std::mutex> lock(mutex_);
    on_ended_ = std::move(cb);
}

void MediaTrack::notify_ended() {
    OnEnded cb;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stopped_) {
            return;
        }
        cb = on_ended_;
    }
    stop();
    if (cb) {
        cb();
    }
}

int MediaTrack::add_sink(SampleSink sink) {
    std::lock_guard<std::mutex> lock(mutex_);
    int handle = next_handle_++;
    sinks_.emplace(handle, std::move(sink));
    return handle;
}

void MediaTrack::remove_sink(int handle) {
    std::lock_guard<std::mutex> lock(mutex_);
    sinks_.erase(handle);
}

size_t MediaTrack::sink_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return sinks_.size();
}

void MediaTrack::push_sample(const uint8_t* data, size_t size) {
    std::vector<SampleSink> sinks;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!enabled_ || stopped_) {
            return;
        }
        sinks.reserve(sinks_.size());
        for (const auto& [handle, sink] : sinks_) {
            sinks.push_back(sink);
        }
    }
    for (const auto& sink : sinks) {
        sink(data, size);
    }
}

std::shared_ptr<MediaTrack> MediaDevices::create_placeholder(MediaKind kind) {
    auto track = std::make_shared<MediaTrack>(
        std::string("placeholder-") + to_string(kind), kind, TrackSource::PLACEHOLDER);
    track->set_enabled(false);
    return track;
}

} // namespace huddle::client
