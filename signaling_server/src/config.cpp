/**
 * @file config.cpp
 * @brief 信令服务配置实现
 */

#include "signaling_server/config.hpp"
#include "common/env.hpp"
#include "common/logger.hpp"

#include <yaml-cpp/yaml.h>
#include <fstream>
#include <cstdlib>

namespace huddle::signaling {

bool Config::load_from_file(const std::string& path) {
    try {
        std::ifstream file(path);
        if (!file.is_open()) {
            return false;
        }

        YAML::Node config = YAML::LoadFile(path);

        // Server 配置
        if (config["server"]) {
            auto s = config["server"];
            if (s["host"]) server.host = s["host"].as<std::string>();
            if (s["port"]) server.port = s["port"].as<uint16_t>();
            if (s["max_connections"]) server.max_connections = s["max_connections"].as<size_t>();
            if (s["max_room_size"]) server.max_room_size = s["max_room_size"].as<size_t>();
            if (s["max_message_bytes"]) server.max_message_bytes = s["max_message_bytes"].as<size_t>();
            if (s["idle_timeout_sec"]) server.idle_timeout_sec = s["idle_timeout_sec"].as<int>();
            if (s["handshake_timeout_sec"]) server.handshake_timeout_sec = s["handshake_timeout_sec"].as<int>();
        }

        // Auth 配置
        if (config["auth"]) {
            auto a = config["auth"];
            if (a["enabled"]) auth.enabled = a["enabled"].as<bool>();
            if (a["jwt_secret"]) auth.jwt_secret = common::expand_env(a["jwt_secret"].as<std::string>());
            if (a["cookie_name"]) auth.cookie_name = a["cookie_name"].as<std::string>();
        }

        // Limits 配置
        if (config["limits"]) {
            auto l = config["limits"];
            if (l["max_coordinate"]) limits.max_coordinate = l["max_coordinate"].as<double>();
            if (l["max_string_length"]) limits.max_string_length = l["max_string_length"].as<size_t>();
            if (l["max_stroke_width"]) limits.max_stroke_width = l["max_stroke_width"].as<double>();
            if (l["max_payload_bytes"]) limits.max_payload_bytes = l["max_payload_bytes"].as<size_t>();
            if (l["max_room_id_length"]) limits.max_room_id_length = l["max_room_id_length"].as<size_t>();
        }

        // Logging 配置
        if (config["logging"]) {
            auto l = config["logging"];
            if (l["level"]) logging.level = l["level"].as<std::string>();
        }

        return true;

    } catch (const YAML::Exception& e) {
        LOG_ERROR("YAML parse error: " << e.what());
        return false;
    }
}

void Config::load_from_env() {
    // 环境变量覆盖
    if (const char* val = std::getenv("HUDDLE_HOST")) {
        server.host = val;
    }

    if (const char* val = std::getenv("HUDDLE_PORT")) {
        try {
            server.port = static_cast<uint16_t>(std::stoi(val));
        } catch (const std::exception&) {
            LOG_WARN("Ignoring invalid HUDDLE_PORT: " << val);
        }
    }

    if (const char* val = std::getenv("HUDDLE_JWT_SECRET")) {
        auth.jwt_secret = val;
    }

    if (const char* val = std::getenv("HUDDLE_LOG_LEVEL")) {
        logging.level = val;
    }
}

} // namespace huddle::signaling
