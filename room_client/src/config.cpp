/**
 * @file config.cpp
 * @brief 房间客户端配置实现
 */

#include "room_client/config.hpp"
#include "common/env.hpp"
#include "common/logger.hpp"

#include <yaml-cpp/yaml.h>

#include <cstdlib>
#include <fstream>

namespace huddle::client {

std::optional<ClientConfig> load_client_config(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        return std::nullopt;
    }

    ClientConfig cfg;
    try {
        YAML::Node root = YAML::LoadFile(path);

        if (root["signaling"]) {
            auto s = root["signaling"];
            cfg.signaling.server_url = s["server_url"].as<std::string>(cfg.signaling.server_url);
            cfg.signaling.room = s["room"].as<std::string>(cfg.signaling.room);
            if (s["session_cookie"]) {
                cfg.signaling.session_cookie = common::expand_env(s["session_cookie"].as<std::string>());
            }
        }

        if (root["webrtc"] && root["webrtc"]["ice_servers"]) {
            for (const auto& node : root["webrtc"]["ice_servers"]) {
                IceServer server;
                server.urls = node["urls"].as<std::string>("");
                server.username = node["username"].as<std::string>("");
                server.credential = common::expand_env(node["credential"].as<std::string>(""));
                if (!server.urls.empty()) {
                    cfg.webrtc.ice_servers.push_back(server);
                }
            }
        }

        if (root["avatar"]) {
            cfg.avatar.max_rate_hz = root["avatar"]["max_rate_hz"].as<int>(cfg.avatar.max_rate_hz);
        }

        if (root["canvas"]) {
            auto c = root["canvas"];
            cfg.canvas.color = c["color"].as<std::string>(cfg.canvas.color);
            cfg.canvas.line_width = c["line_width"].as<double>(cfg.canvas.line_width);
            cfg.canvas.tool = c["tool"].as<std::string>(cfg.canvas.tool);
        }

        if (root["media"]) {
            auto m = root["media"];
            cfg.media.video_device = m["video_device"].as<std::string>(cfg.media.video_device);
            cfg.media.audio_device = m["audio_device"].as<std::string>(cfg.media.audio_device);
        }

        if (root["logging"]) {
            cfg.logging.level = root["logging"]["level"].as<std::string>(cfg.logging.level);
        }
    } catch (const YAML::Exception& e) {
        LOG_ERROR("YAML parse error in " << path << ": " << e.what());
        return std::nullopt;
    }

    return cfg;
}

void apply_env_overrides(ClientConfig& config) {
    if (const char* val = std::getenv("HUDDLE_SERVER_URL")) {
        config.signaling.server_url = val;
    }
    if (const char* val = std::getenv("HUDDLE_ROOM")) {
        config.signaling.room = val;
    }
    if (const char* val = std::getenv("HUDDLE_SESSION_COOKIE")) {
        config.signaling.session_cookie = val;
    }
    if (const char* val = std::getenv("HUDDLE_LOG_LEVEL")) {
        config.logging.level = val;
    }
}

} // namespace huddle::client
