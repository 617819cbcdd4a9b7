/**
 * @file rtc_peer_transport.cpp
 * @brief 基于 libdatachannel 的对端传输实现
 */

#include "room_client/rtc_peer_transport.hpp"
#include "common/logger.hpp"

#include <boost/asio/post.hpp>

#include <rtc/rtc.hpp>

#include <atomic>
#include <variant>

namespace huddle::client {

namespace {

constexpr int kVideoPayloadType = 96;
constexpr int kAudioPayloadType = 111;
constexpr uint32_t kVideoClockRate = 90000;

std::atomic<uint32_t> g_next_ssrc{0x1000};

const char* mid_of(MediaKind kind) {
    return kind == MediaKind::AUDIO ? "audio" : "video";
}

TransportState map_state(rtc::PeerConnection::State state) {
    switch (state) {
        case rtc::PeerConnection::State::New: return TransportState::NEW;
        case rtc::PeerConnection::State::Connecting: return TransportState::CONNECTING;
        case rtc::PeerConnection::State::Connected: return TransportState::CONNECTED;
        case rtc::PeerConnection::State::Disconnected: return TransportState::DISCONNECTED;
        case rtc::PeerConnection::State::Failed: return TransportState::FAILED;
        case rtc::PeerConnection::State::Closed: return TransportState::CLOSED;
    }
    return TransportState::FAILED;
}

// 本地描述中各 m 行的 mid，下标即 sdpMLineIndex
std::vector<std::string> media_mids(const rtc::Description& desc) {
    std::vector<std::string> mids;
    for (int i = 0; i < desc.mediaCount(); ++i) {
        std::visit([&mids](const auto* entry) { mids.push_back(entry ? entry->mid() : std::string()); },
                   desc.media(i));
    }
    return mids;
}

// stun:host:port / turn:user:pass@host:port 写法
std::string to_rtc_url(const IceServer& server) {
    if (server.username.empty()) {
        return server.urls;
    }
    auto colon = server.urls.find(':');
    if (colon == std::string::npos) {
        return server.urls;
    }
    return server.urls.substr(0, colon + 1) + server.username + ":" + server.credential + "@" +
           server.urls.substr(colon + 1);
}

} // namespace

/**
 * @brief 跨线程共享的回调状态（只在事件循环线程上读写 handlers / closed）
 */
struct RtcPeerTransport::Shared {
    explicit Shared(boost::asio::io_context& io) : io_context(io) {}

    boost::asio::io_context& io_context;
    Handlers handlers;
    std::vector<std::string> local_mids;
    bool closed = false;

    int mline_index_of(const std::string& mid) const {
        for (size_t i = 0; i < local_mids.size(); ++i) {
            if (local_mids[i] == mid) {
                return static_cast<int>(i);
            }
        }
        return -1;
    }

    template <typename F>
    static void post(const std::weak_ptr<Shared>& weak, F&& fn) {
        auto self = weak.lock();
        if (!self) {
            return;
        }
        boost::asio::post(self->io_context, [weak, fn = std::forward<F>(fn)]() mutable {
            auto shared = weak.lock();
            if (!shared || shared->closed) {
                return;
            }
            fn(*shared);
        });
    }
};

RtcPeerTransport::RtcPeerTransport(boost::asio::io_context& io_context,
                                   const std::string& remote_id,
                                   const std::vector<IceServer>& ice_servers)
    : remote_id_(remote_id)
    , shared_(std::make_shared<Shared>(io_context))
{
    rtc::Configuration config;
    for (const auto& server : ice_servers) {
        try {
            config.iceServers.emplace_back(to_rtc_url(server));
        } catch (const std::exception& e) {
            LOG_WARN("Ignoring ICE server " << server.urls << ": " << e.what());
        }
    }
    // 协商时机由对端状态机控制
    config.disableAutoNegotiation = true;

    pc_ = std::make_shared<rtc::PeerConnection>(config);
    std::weak_ptr<Shared> weak = shared_;

    pc_->onLocalDescription([weak](rtc::Description desc) {
        SessionDescription local;
        local.type = desc.typeString();
        local.sdp = std::string(desc);
        auto mids = media_mids(desc);
        Shared::post(weak, [local, mids](Shared& s) {
            s.local_mids = mids;
            if (s.handlers.on_local_description) {
                s.handlers.on_local_description(local);
            }
        });
    });

    pc_->onLocalCandidate([weak](rtc::Candidate cand) {
        IceCandidate local;
        local.candidate = cand.candidate();
        local.sdp_mid = cand.mid();
        // 候选总在本地描述之后投递，此时 mid 表已就绪
        Shared::post(weak, [local](Shared& s) mutable {
            local.sdp_mline_index = s.mline_index_of(local.sdp_mid);
            if (s.handlers.on_local_candidate) {
                s.handlers.on_local_candidate(local);
            }
        });
    });

    pc_->onStateChange([weak](rtc::PeerConnection::State state) {
        auto mapped = map_state(state);
        Shared::post(weak, [mapped](Shared& s) {
            if (s.handlers.on_state) {
                s.handlers.on_state(mapped);
            }
        });
    });

    // close() 会先注销回调，之后不会再用到 this
    pc_->onTrack([this](std::shared_ptr<rtc::Track> track) {
        MediaKind kind = track->description().type() == "audio" ? MediaKind::AUDIO : MediaKind::VIDEO;
        bind_incoming(track, kind);
    });
}

RtcPeerTransport::~RtcPeerTransport() {
    close();
}

void RtcPeerTransport::set_handlers(Handlers handlers) {
    shared_->handlers = std::move(handlers);
}

void RtcPeerTransport::create_offer() {
    if (!pc_) return;
    try {
        pc_->setLocalDescription(rtc::Description::Type::Offer);
    } catch (const std::exception& e) {
        LOG_ERROR("Failed to create offer for " << remote_id_ << ": " << e.what());
    }
}

void RtcPeerTransport::create_answer() {
    if (!pc_) return;
    try {
        pc_->setLocalDescription(rtc::Description::Type::Answer);
    } catch (const std::exception& e) {
        LOG_ERROR("Failed to create answer for " << remote_id_ << ": " << e.what());
    }
}

void RtcPeerTransport::rollback() {
    if (!pc_) return;
    try {
        pc_->setLocalDescription(rtc::Description::Type::Rollback);
    } catch (const std::exception& e) {
        LOG_WARN("Rollback failed for " << remote_id_ << ": " << e.what());
    }
}

bool RtcPeerTransport::set_remote_description(const SessionDescription& desc) {
    if (!pc_) return false;
    try {
        pc_->setRemoteDescription(rtc::Description(desc.sdp, desc.type));
        return true;
    } catch (const std::exception& e) {
        LOG_WARN("Rejected remote " << desc.type << " from " << remote_id_ << ": " << e.what());
        return false;
    }
}

bool RtcPeerTransport::add_remote_candidate(const IceCandidate& candidate) {
    if (!pc_) return false;
    try {
        pc_->addRemoteCandidate(rtc::Candidate(candidate.candidate, candidate.sdp_mid));
        return true;
    } catch (const std::exception& e) {
        LOG_WARN("Rejected ICE candidate from " << remote_id_ << ": " << e.what());
        return false;
    }
}

bool RtcPeerTransport::set_outgoing_track(MediaKind kind, std::shared_ptr<MediaTrack> track) {
    if (!pc_) return false;

    bool renegotiate = false;
    auto& sender = senders_[kind];
    if (!sender.track) {
        if (!track) {
            return false;
        }
        sender.track = add_local_track(kind);
        if (!sender.track) {
            return false;
        }
        renegotiate = true;
    }

    detach_source(sender);
    if (track) {
        std::weak_ptr<rtc::Track> weak_track = sender.track;
        sender.source = track;
        sender.sink_handle = track->add_sink([weak_track](const uint8_t* data, size_t size) {
            auto rtc_track = weak_track.lock();
            if (!rtc_track || !rtc_track->isOpen()) {
                return;
            }
            try {
                auto bytes = reinterpret_cast<const std::byte*>(data);
                rtc_track->send(rtc::binary(bytes, bytes + size));
            } catch (const std::exception& e) {
                LOG_DEBUG("Dropping sample: " << e.what());
            }
        });
    }
    return renegotiate;
}

void RtcPeerTransport::close() {
    if (shared_->closed) {
        return;
    }
    shared_->closed = true;

    for (auto& [kind, sender] : senders_) {
        detach_source(sender);
    }
    senders_.clear();

    if (pc_) {
        pc_->onLocalDescription(nullptr);
        pc_->onLocalCandidate(nullptr);
        pc_->onStateChange(nullptr);
        pc_->onTrack(nullptr);
        pc_->close();
        pc_.reset();
    }
}

std::shared_ptr<rtc::Track> RtcPeerTransport::add_local_track(MediaKind kind) {
    uint32_t ssrc = g_next_ssrc++;
    std::string cname = "huddle-" + remote_id_;

    try {
        if (kind == MediaKind::VIDEO) {
            rtc::Description::Video desc(mid_of(kind), rtc::Description::Direction::SendRecv);
            desc.addH264Codec(kVideoPayloadType);
            desc.addSSRC(ssrc, cname);
            auto track = pc_->addTrack(desc);

            auto rtp_config = std::make_shared<rtc::RtpPacketizationConfig>(
                ssrc, cname, kVideoPayloadType, kVideoClockRate);
            auto packetizer = std::make_shared<rtc::H264RtpPacketizer>(
                rtc::NalUnit::Separator::StartSequence, rtp_config);
            packetizer->addToChain(std::make_shared<rtc::RtcpSrReporter>(rtp_config));
            packetizer->addToChain(std::make_shared<rtc::RtcpNackResponder>());
            track->setMediaHandler(packetizer);

            bind_incoming(track, kind);
            return track;
        }

        rtc::Description::Audio desc(mid_of(kind), rtc::Description::Direction::SendRecv);
        desc.addOpusCodec(kAudioPayloadType);
        desc.addSSRC(ssrc, cname);
        auto track = pc_->addTrack(desc);

        auto rtp_config = std::make_shared<rtc::RtpPacketizationConfig>(
            ssrc, cname, kAudioPayloadType, rtc::OpusRtpPacketizer::DefaultClockRate);
        auto packetizer = std::make_shared<rtc::OpusRtpPacketizer>(rtp_config);
        packetizer->addToChain(std::make_shared<rtc::RtcpSrReporter>(rtp_config));
        track->setMediaHandler(packetizer);

        bind_incoming(track, kind);
        return track;
    } catch (const std::exception& e) {
        LOG_ERROR("Failed to add " << to_string(kind) << " track for " << remote_id_ << ": " << e.what());
        return nullptr;
    }
}

void RtcPeerTransport::bind_incoming(const std::shared_ptr<rtc::Track>& track, MediaKind kind) {
    // 双向轨道上收到第一个包时才通知上层，避免对端未发送时出现空轨道
    auto remote = std::make_shared<MediaTrack>(remote_id_ + "-" + to_string(kind), kind, TrackSource::REMOTE);
    auto announced = std::make_shared<std::atomic<bool>>(false);
    std::weak_ptr<Shared> weak = shared_;

    track->onMessage(
        [weak, remote, announced](rtc::binary data) {
            if (!announced->exchange(true)) {
                Shared::post(weak, [remote](Shared& s) {
                    if (s.handlers.on_remote_track) {
                        s.handlers.on_remote_track(remote);
                    }
                });
            }
            remote->push_sample(reinterpret_cast<const uint8_t*>(data.data()), data.size());
        },
        nullptr);

    track->onClosed([weak, remote]() {
        Shared::post(weak, [remote](Shared&) { remote->notify_ended(); });
    });
}

void RtcPeerTransport::detach_source(Sender& sender) {
    if (sender.source) {
        sender.source->remove_sink(sender.sink_handle);
        sender.source.reset();
        sender.sink_handle = 0;
    }
}

RtcPeerTransportFactory::RtcPeerTransportFactory(boost::asio::io_context& io_context,
                                                 std::vector<IceServer> ice_servers)
    : io_context_(io_context)
    , ice_servers_(std::move(ice_servers))
{
    rtc::InitLogger(rtc::LogLevel::Warning);
}

std::unique_ptr<PeerTransport> RtcPeerTransportFactory::create(const std::string& remote_id) {
    return std::make_unique<RtcPeerTransport>(io_context_, remote_id, ice_servers_);
}

} // namespace huddle::client
