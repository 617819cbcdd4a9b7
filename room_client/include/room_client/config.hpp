/**
 * @file config.hpp
 * @brief 房间客户端配置
 */

#pragma once

#include <optional>
#include <string>
#include <vector>

namespace huddle::client {

struct IceServer {
    std::string urls;
    std::string username;
    std::string credential;
};

struct SignalingConfig {
    std::string server_url = "ws://127.0.0.1:3000/ws";
    std::string room = "default";
    std::string session_cookie;     // 如 "session=<jwt>"，支持 ${VAR}
};

struct WebRtcConfig {
    std::vector<IceServer> ice_servers;
};

struct AvatarConfig {
    int max_rate_hz = 10;
};

struct CanvasConfig {
    std::string color = "#000000";
    double line_width = 2.0;
    std::string tool = "pen";
};

struct MediaConfig {
    std::string video_device = "/dev/video0";
    std::string audio_device;       // 为空时使用系统默认
};

struct LoggingConfig {
    std::string level = "INFO";
};

struct ClientConfig {
    SignalingConfig signaling;
    WebRtcConfig webrtc;
    AvatarConfig avatar;
    CanvasConfig canvas;
    MediaConfig media;
    LoggingConfig logging;
};

/**
 * @brief 从 YAML 文件加载配置
 * @return 文件不存在或格式错误返回 std::nullopt
 */
std::optional<ClientConfig> load_client_config(const std::string& path);

/**
 * @brief 环境变量覆盖（HUDDLE_SERVER_URL / HUDDLE_ROOM / HUDDLE_SESSION_COOKIE / HUDDLE_LOG_LEVEL）
 */
void apply_env_overrides(ClientConfig& config);

} // namespace huddle::client
