/**
 * @file main.cpp
 * @brief 信令服务主程序入口
 */

#include "signaling_server/server.hpp"
#include "signaling_server/config.hpp"
#include "signaling_server/identity.hpp"
#include "signaling_server/message_router.hpp"
#include "signaling_server/room_registry.hpp"
#include "signaling_server/signaling_gateway.hpp"
#include "common/logger.hpp"

#include <boost/asio/io_context.hpp>
#include <boost/asio/signal_set.hpp>

#include <iostream>
#include <memory>

namespace net = boost::asio;

int main(int argc, char* argv[]) {
    // 配置文件路径
    std::string config_path = "/etc/huddle/signaling_server.yaml";
    if (argc > 1) {
        config_path = argv[1];
    }

    // 加载配置
    huddle::signaling::Config config;
    if (!config.load_from_file(config_path)) {
        std::cerr << "Failed to load config from: " << config_path << std::endl;
        std::cerr << "Using default configuration" << std::endl;
    }
    config.load_from_env();

    huddle::common::set_log_level(huddle::common::parse_log_level(config.logging.level));

    std::cout << "=== Huddle Signaling Server ===" << std::endl;
    std::cout << "Config: " << config_path << std::endl;
    std::cout << "Listen: " << config.server.host << ":" << config.server.port << std::endl;
    std::cout << "Auth: " << (config.auth.enabled && !config.auth.jwt_secret.empty()
                              ? "session cookie '" + config.auth.cookie_name + "'"
                              : std::string("anonymous")) << std::endl;

    try {
        // 单线程 IO 上下文：房间注册表无需加锁
        net::io_context io_context{1};

        huddle::signaling::RoomRegistry registry;
        huddle::signaling::MessageRouter router(config.limits);
        huddle::signaling::SignalingGateway gateway(registry, router);

        std::unique_ptr<huddle::signaling::IdentityResolver> identity;
        if (config.auth.enabled && !config.auth.jwt_secret.empty()) {
            identity = std::make_unique<huddle::signaling::JwtCookieResolver>(
                config.auth.jwt_secret, config.auth.cookie_name);
        } else {
            identity = std::make_unique<huddle::signaling::AnonymousResolver>();
        }

        auto server = std::make_shared<huddle::signaling::Server>(
            io_context, config, gateway, *identity);
        if (!server->start()) {
            return 1;
        }

        // 信号处理
        net::signal_set signals(io_context, SIGINT, SIGTERM);
        signals.async_wait([&](const boost::system::error_code&, int signal) {
            LOG_INFO("Received signal " << signal << ", shutting down...");
            for (const auto& room : gateway.rooms()) {
                LOG_INFO("Room " << room.room_id << ": " << room.count << " connection(s)");
            }
            server->stop();
            io_context.stop();
        });

        io_context.run();

        const auto& stats = gateway.stats();
        LOG_INFO("Joins=" << stats.joins << " leaves=" << stats.leaves
                 << " routed=" << stats.messages_routed
                 << " dropped_malformed=" << stats.dropped_malformed
                 << " dropped_target_missing=" << stats.dropped_target_missing);

    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }

    std::cout << "Signaling server shutdown complete" << std::endl;
    return 0;
}
