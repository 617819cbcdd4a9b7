/**
 * @file config.hpp
 * @brief 信令服务配置管理
 */

#pragma once

#include <string>
#include <cstdint>
#include <cstddef>

namespace huddle::signaling {

/**
 * @brief 服务器配置
 */
struct ServerConfig {
    std::string host = "0.0.0.0";
    uint16_t port = 3000;
    size_t max_connections = 500;
    size_t max_room_size = 15;
    size_t max_message_bytes = 256 * 1024;
    int idle_timeout_sec = 60;
    int handshake_timeout_sec = 10;
};

/**
 * @brief 认证配置
 *
 * 会话 Cookie 由外部系统签发，这里只解析出可选的用户 ID
 */
struct AuthConfig {
    bool enabled = true;
    std::string jwt_secret;
    std::string cookie_name = "session";
};

/**
 * @brief 广播消息结构校验限制
 */
struct LimitsConfig {
    double max_coordinate = 1e6;
    size_t max_string_length = 64;
    double max_stroke_width = 1000.0;
    size_t max_payload_bytes = 64 * 1024;
    size_t max_room_id_length = 128;
};

/**
 * @brief 日志配置
 */
struct LoggingConfig {
    std::string level = "INFO";
};

/**
 * @brief 总配置
 */
class Config {
public:
    /**
     * @brief 从文件加载配置
     * @param path 配置文件路径
     * @return 是否成功
     */
    bool load_from_file(const std::string& path);

    /**
     * @brief 从环境变量覆盖配置
     */
    void load_from_env();

    ServerConfig server;
    AuthConfig auth;
    LimitsConfig limits;
    LoggingConfig logging;
};

} // namespace huddle::signaling
