/**
 * @file rtc_peer_transport.hpp
 * @brief 基于 libdatachannel 的对端传输
 *
 * libdatachannel 的回调在其内部线程触发，这里统一投递回客户端
 * 事件循环，关闭后到达的回调直接丢弃。
 */

#pragma once

#include "room_client/config.hpp"
#include "room_client/peer_transport.hpp"

#include <boost/asio/io_context.hpp>

#include <map>
#include <memory>
#include <vector>

namespace rtc {
class PeerConnection;
class Track;
}

namespace huddle::client {

/**
 * @brief libdatachannel 对端传输
 */
class RtcPeerTransport : public PeerTransport {
public:
    RtcPeerTransport(boost::asio::io_context& io_context,
                     const std::string& remote_id,
                     const std::vector<IceServer>& ice_servers);
    ~RtcPeerTransport() override;

    void set_handlers(Handlers handlers) override;
    void create_offer() override;
    void create_answer() override;
    void rollback() override;
    bool set_remote_description(const SessionDescription& desc) override;
    bool add_remote_candidate(const IceCandidate& candidate) override;
    bool set_outgoing_track(MediaKind kind, std::shared_ptr<MediaTrack> track) override;
    void close() override;

private:
    struct Shared;

    // 发送方向：每种媒体一个 rtc::Track，由当前 MediaTrack 的 sink 喂数据
    struct Sender {
        std::shared_ptr<rtc::Track> track;
        std::shared_ptr<MediaTrack> source;
        int sink_handle = 0;
    };

    std::shared_ptr<rtc::Track> add_local_track(MediaKind kind);
    void bind_incoming(const std::shared_ptr<rtc::Track>& track, MediaKind kind);
    void detach_source(Sender& sender);

private:
    std::string remote_id_;
    std::shared_ptr<Shared> shared_;
    std::shared_ptr<rtc::PeerConnection> pc_;
    std::map<MediaKind, Sender> senders_;
};

/**
 * @brief libdatachannel 传输工厂
 */
class RtcPeerTransportFactory : public PeerTransportFactory {
public:
    RtcPeerTransportFactory(boost::asio::io_context& io_context, std::vector<IceServer> ice_servers);

    std::unique_ptr<PeerTransport> create(const std::string& remote_id) override;

private:
    boost::asio::io_context& io_context_;
    std::vector<IceServer> ice_servers_;
};

} // namespace huddle::client
