/**
 * @file fakes.hpp
 * @brief 客户端测试用假传输、假设备与记录型输出
 */

#pragma once

#include "room_client/avatar_board.hpp"
#include "room_client/canvas_board.hpp"
#include "room_client/media_track.hpp"
#include "room_client/peer_transport.hpp"
#include "room_client/signaling_transport.hpp"

#include <nlohmann/json.hpp>

#include <map>
#include <memory>
#include <set>
#include <string>
#include <vector>

namespace huddle::client::testing {

class FakePeerTransport;

/**
 * @brief 单个假传输的调用记录（传输销毁后仍可查看）
 */
struct FakeTransportRecord {
    std::string remote_id;
    FakePeerTransport* transport = nullptr;
    int offers = 0;
    int answers = 0;
    int rollbacks = 0;
    bool closed = false;
    std::vector<SessionDescription> remote_descriptions;
    std::vector<IceCandidate> remote_candidates;
    std::map<MediaKind, std::shared_ptr<MediaTrack>> outgoing;
};

/**
 * @brief 假传输：create_offer / create_answer 同步产出本地描述
 */
class FakePeerTransport : public PeerTransport {
public:
    explicit FakePeerTransport(std::shared_ptr<FakeTransportRecord> record)
        : record_(std::move(record))
    {
        record_->transport = this;
    }

    ~FakePeerTransport() override {
        record_->transport = nullptr;
    }

    void set_handlers(Handlers h) override { handlers = std::move(h); }

    void create_offer() override {
        ++record_->offers;
        emit_description("offer");
    }

    void create_answer() override {
        ++record_->answers;
        emit_description("answer");
    }

    void rollback() override { ++record_->rollbacks; }

    bool set_remote_description(const SessionDescription& desc) override {
        record_->remote_descriptions.push_back(desc);
        return true;
    }

    bool add_remote_candidate(const IceCandidate& candidate) override {
        record_->remote_candidates.push_back(candidate);
        return true;
    }

    bool set_outgoing_track(MediaKind kind, std::shared_ptr<MediaTrack> track) override {
        record_->outgoing[kind] = track;
        if (!track || senders_.count(kind) > 0) {
            return false;
        }
        senders_.insert(kind);
        return true;
    }

    void close() override { record_->closed = true; }

    void emit_description(const std::string& type) {
        if (handlers.on_local_description) {
            handlers.on_local_description(SessionDescription{type, type + "-sdp"});
        }
    }

    void emit_state(TransportState state) {
        if (handlers.on_state) {
            handlers.on_state(state);
        }
    }

    void emit_candidate(const std::string& candidate, const std::string& mid = "0", int mline_index = 0) {
        if (handlers.on_local_candidate) {
            handlers.on_local_candidate(IceCandidate{candidate, mid, mline_index});
        }
    }

    void emit_remote_track(std::shared_ptr<MediaTrack> track) {
        if (handlers.on_remote_track) {
            handlers.on_remote_track(std::move(track));
        }
    }

    Handlers handlers;

private:
    std::shared_ptr<FakeTransportRecord> record_;
    std::set<MediaKind> senders_;
};

class FakePeerTransportFactory : public PeerTransportFactory {
public:
    std::unique_ptr<PeerTransport> create(const std::string& remote_id) override {
        auto record = std::make_shared<FakeTransportRecord>();
        record->remote_id = remote_id;
        records.push_back(record);
        return std::make_unique<FakePeerTransport>(record);
    }

    /** @brief 指定远端最近一次创建的传输记录 */
    std::shared_ptr<FakeTransportRecord> latest(const std::string& remote_id) const {
        for (auto it = records.rbegin(); it != records.rend(); ++it) {
            if ((*it)->remote_id == remote_id) {
                return *it;
            }
        }
        return nullptr;
    }

    int created_for(const std::string& remote_id) const {
        int count = 0;
        for (const auto& record : records) {
            if (record->remote_id == remote_id) ++count;
        }
        return count;
    }

    std::vector<std::shared_ptr<FakeTransportRecord>> records;
};

/**
 * @brief 假采集设备
 */
class FakeMediaDevices : public MediaDevices {
public:
    MediaResult open_user_media(bool audio, bool video) override {
        ++user_media_calls;
        if (user_media_error != MediaError::NONE) {
            return MediaResult::failure(user_media_error, "fake failure");
        }
        MediaResult result;
        if (video && has_camera) {
            result.tracks.push_back(std::make_shared<MediaTrack>("cam", MediaKind::VIDEO, TrackSource::CAMERA));
        }
        if (audio && has_microphone) {
            result.tracks.push_back(std::make_shared<MediaTrack>("mic", MediaKind::AUDIO, TrackSource::MICROPHONE));
        }
        opened.insert(opened.end(), result.tracks.begin(), result.tracks.end());
        return result;
    }

    MediaResult open_display_media() override {
        ++display_media_calls;
        if (display_error != MediaError::NONE) {
            return MediaResult::failure(display_error, "fake failure");
        }
        MediaResult result;
        result.tracks.push_back(std::make_shared<MediaTrack>("screen", MediaKind::VIDEO, TrackSource::SCREEN));
        opened.push_back(result.tracks.front());
        return result;
    }

    MediaError user_media_error = MediaError::NONE;
    MediaError display_error = MediaError::NONE;
    bool has_camera = true;
    bool has_microphone = true;
    int user_media_calls = 0;
    int display_media_calls = 0;
    std::vector<std::shared_ptr<MediaTrack>> opened;
};

/**
 * @brief 记录型白板
 */
class RecordingSurface : public CanvasSurface {
public:
    RecordingSurface(double w = 800, double h = 600) : w_(w), h_(h) {}

    double width() const override { return w_; }
    double height() const override { return h_; }
    void draw_stroke(const CanvasStroke& stroke) override { strokes.push_back(stroke); }
    void clear() override {
        strokes.clear();
        ++clears;
    }

    void resize(double w, double h) {
        w_ = w;
        h_ = h;
    }

    std::vector<CanvasStroke> strokes;
    int clears = 0;

private:
    double w_;
    double h_;
};

/**
 * @brief 记录型头像层
 */
class RecordingAvatarLayer : public AvatarLayer {
public:
    void render_avatar(const AvatarInfo& avatar) override { rendered.push_back(avatar); }
    void remove_avatar(const std::string& user_id) override { removed.push_back(user_id); }

    std::vector<AvatarInfo> rendered;
    std::vector<std::string> removed;
};

/**
 * @brief 假信令传输：测试手动驱动打开、收消息与断开
 */
class FakeSignalingTransport : public SignalingTransport {
public:
    void connect(const std::string& room_id) override {
        connected_room = room_id;
        ++connect_calls;
    }

    bool send(const std::string& text) override {
        if (!open_) {
            return false;
        }
        sent.push_back(nlohmann::json::parse(text));
        return true;
    }

    void close() override {
        ++close_calls;
        open_ = false;
    }

    bool is_open() const override { return open_; }

    void open() {
        open_ = true;
        if (on_open_) on_open_();
    }

    void deliver(const nlohmann::json& frame) {
        if (on_message_) on_message_(frame.dump());
    }

    void drop(const std::string& reason) {
        open_ = false;
        if (on_close_) on_close_(reason);
    }

    /** @brief 已发送中指定类型的消息 */
    std::vector<nlohmann::json> sent_of(const std::string& type) const {
        std::vector<nlohmann::json> result;
        for (const auto& frame : sent) {
            if (frame["type"] == type) result.push_back(frame);
        }
        return result;
    }

    std::string connected_room;
    int connect_calls = 0;
    int close_calls = 0;
    std::vector<nlohmann::json> sent;

private:
    bool open_ = false;
};

} // namespace huddle::client::testing
