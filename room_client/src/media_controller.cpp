/**
 * @file media_controller.cpp
 * @brief 本地媒体控制实现
 */

#include "room_client/media_controller.hpp"
#include "room_client/peer_connection_manager.hpp"
#include "common/logger.hpp"

namespace huddle::client {

MediaController::MediaController(MediaDevices& devices, PeerConnectionManager& peers)
    : devices_(devices)
    , peers_(peers)
{
}

MediaController::~MediaController() {
    stop_all();
}

MediaResult MediaController::start_local_media() {
    if (has_local_media()) {
        MediaResult result;
        if (camera_) result.tracks.push_back(camera_);
        if (microphone_) result.tracks.push_back(microphone_);
        return result;
    }

    auto result = devices_.open_user_media(true, true);
    if (!result.ok()) {
        last_error_ = result.error;
        LOG_WARN("[Media] failed to acquire camera/microphone: "
                 << to_string(result.error) << " " << result.message);
        return result;
    }

    for (const auto& track : result.tracks) {
        if (!track) continue;
        if (track->kind() == MediaKind::VIDEO && !camera_) {
            camera_ = track;
        } else if (track->kind() == MediaKind::AUDIO && !microphone_) {
            microphone_ = track;
        } else {
            track->stop();
        }
    }

    if (!has_local_media()) {
        last_error_ = MediaError::DEVICE_NOT_FOUND;
        LOG_WARN("[Media] no usable tracks returned");
        return MediaResult::failure(MediaError::DEVICE_NOT_FOUND, "no usable tracks");
    }

    last_error_ = MediaError::NONE;
    video_enabled_ = true;
    audio_enabled_ = true;
    if (camera_) camera_->set_enabled(true);
    if (microphone_) microphone_->set_enabled(true);

    LOG_INFO("[Media] local media started"
             << (camera_ ? " video" : "") << (microphone_ ? " audio" : ""));

    publish_video();
    publish_audio();
    return result;
}

void MediaController::stop_local_media() {
    if (!has_local_media()) {
        return;
    }

    if (camera_) {
        camera_->stop();
        camera_.reset();
    }
    if (microphone_) {
        microphone_->stop();
        microphone_.reset();
    }
    LOG_INFO("[Media] local media stopped");

    publish_video();
    publish_audio();
}

bool MediaController::toggle_video(std::optional<bool> enabled) {
    if (!camera_) {
        return false;
    }

    video_enabled_ = enabled.value_or(!video_enabled_);
    camera_->set_enabled(video_enabled_);
    publish_video();
    return video_enabled_;
}

bool MediaController::toggle_audio(std::optional<bool> enabled) {
    if (!microphone_) {
        return false;
    }

    audio_enabled_ = enabled.value_or(!audio_enabled_);
    microphone_->set_enabled(audio_enabled_);
    publish_audio();
    return audio_enabled_;
}

MediaResult MediaController::start_screen_share() {
    if (screen_) {
        MediaResult result;
        result.tracks.push_back(screen_);
        return result;
    }

    auto result = devices_.open_display_media();
    if (!result.ok()) {
        LOG_WARN("[Media] screen share unavailable: "
                 << to_string(result.error) << " " << result.message);
        return result;
    }

    std::shared_ptr<MediaTrack> screen;
    for (const auto& track : result.tracks) {
        if (track && track->kind() == MediaKind::VIDEO && !screen) {
            screen = track;
        } else if (track) {
            track->stop();
        }
    }
    if (!screen) {
        return MediaResult::failure(MediaError::DEVICE_NOT_FOUND, "no screen track");
    }

    screen_ = screen;
    MediaTrack* raw = screen.get();
    // 用户从系统界面结束共享
    screen_->set_on_ended([this, raw]() {
        if (screen_.get() == raw) {
            LOG_INFO("[Media] screen share ended by source");
            stop_screen_share();
        }
    });

    LOG_INFO("[Media] screen share started");
    publish_video();
    return result;
}

bool MediaController::stop_screen_share() {
    if (!screen_) {
        return false;
    }

    auto screen = std::move(screen_);
    screen_.reset();
    screen->set_on_ended(nullptr);
    screen->stop();

    LOG_INFO("[Media] screen share stopped");
    publish_video();
    return true;
}

void MediaController::stop_all() {
    stop_screen_share();
    stop_local_media();
    if (video_placeholder_) {
        video_placeholder_->stop();
        video_placeholder_.reset();
    }
    if (audio_placeholder_) {
        audio_placeholder_->stop();
        audio_placeholder_.reset();
    }
}

std::shared_ptr<MediaTrack> MediaController::outgoing_video() const {
    if (screen_) {
        return screen_;
    }
    if (camera_ && video_enabled_) {
        return camera_;
    }
    return camera_ ? video_placeholder_ : nullptr;
}

std::shared_ptr<MediaTrack> MediaController::outgoing_audio() const {
    if (microphone_ && audio_enabled_) {
        return microphone_;
    }
    return microphone_ ? audio_placeholder_ : nullptr;
}

void MediaController::publish_video() {
    // 摄像头关闭时发送占位轨道，保持发送器不变
    if (!screen_ && camera_ && !video_enabled_) {
        placeholder(MediaKind::VIDEO);
    }
    peers_.set_outgoing_track(MediaKind::VIDEO, outgoing_video());
}

void MediaController::publish_audio() {
    if (microphone_ && !audio_enabled_) {
        placeholder(MediaKind::AUDIO);
    }
    peers_.set_outgoing_track(MediaKind::AUDIO, outgoing_audio());
}

std::shared_ptr<MediaTrack> MediaController::placeholder(MediaKind kind) {
    auto& slot = (kind == MediaKind::VIDEO) ? video_placeholder_ : audio_placeholder_;
    if (!slot) {
        slot = devices_.create_placeholder(kind);
    }
    return slot;
}

} // namespace huddle::client
