/**
 * @file peer_transport.hpp
 * @brief 对端传输抽象
 *
 * 屏蔽具体 WebRTC 实现（libdatachannel），使对端状态机可以
 * 在测试中配合假传输运行。所有回调都必须在客户端事件循环上触发。
 */

#pragma once

#include "room_client/media_track.hpp"

#include <functional>
#include <memory>
#include <string>

namespace huddle::client {

/**
 * @brief 底层传输状态
 */
enum class TransportState {
    NEW,
    CONNECTING,
    CONNECTED,
    DISCONNECTED,
    FAILED,
    CLOSED
};

const char* to_string(TransportState state);

/**
 * @brief 会话描述（SDP）
 */
struct SessionDescription {
    std::string type;   // "offer" | "answer"
    std::string sdp;
};

/**
 * @brief ICE 候选
 */
struct IceCandidate {
    std::string candidate;
    std::string sdp_mid;
    int sdp_mline_index = -1;
};

/**
 * @brief 对端传输
 */
class PeerTransport {
public:
    struct Handlers {
        std::function<void(const SessionDescription&)> on_local_description;
        std::function<void(const IceCandidate&)> on_local_candidate;
        std::function<void(TransportState)> on_state;
        std::function<void(std::shared_ptr<MediaTrack>)> on_remote_track;
    };

    virtual ~PeerTransport() = default;

    virtual void set_handlers(Handlers handlers) = 0;

    /** @brief 生成本地 offer（结果经 on_local_description 返回） */
    virtual void create_offer() = 0;

    /** @brief 生成本地 answer（需已设置远端 offer） */
    virtual void create_answer() = 0;

    /** @brief 回滚尚未被应答的本地 offer */
    virtual void rollback() = 0;

    /**
     * @brief 设置远端描述
     * @return 描述无法应用时返回 false
     */
    virtual bool set_remote_description(const SessionDescription& desc) = 0;

    virtual bool add_remote_candidate(const IceCandidate& candidate) = 0;

    /**
     * @brief 设置某类型的发送轨道（替换已有发送源，不触发重新协商）
     * @return 需要重新协商（首次添加该类型发送器）时返回 true
     */
    virtual bool set_outgoing_track(MediaKind kind, std::shared_ptr<MediaTrack> track) = 0;

    /** @brief 关闭传输，之后不再触发任何回调 */
    virtual void close() = 0;
};

/**
 * @brief 传输工厂（每个远端参与者一个实例，失败重建时再次调用）
 */
class PeerTransportFactory {
public:
    virtual ~PeerTransportFactory() = default;
    virtual std::unique_ptr<PeerTransport> create(const std::string& remote_id) = 0;
};

} // namespace huddle::client
