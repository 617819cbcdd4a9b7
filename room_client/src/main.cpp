/**
 * @file main.cpp
 * @brief 房间客户端主程序入口
 *
 * 无界面运行：从标准输入读取命令，白板与头像输出到日志。
 */

#include "room_client/config.hpp"
#include "room_client/console_view.hpp"
#include "room_client/gst_media_devices.hpp"
#include "room_client/room_session.hpp"
#include "room_client/rtc_peer_transport.hpp"
#include "room_client/websocket_transport.hpp"
#include "common/logger.hpp"

#include <boost/asio/io_context.hpp>
#include <boost/asio/posix/stream_descriptor.hpp>
#include <boost/asio/read_until.hpp>
#include <boost/asio/signal_set.hpp>
#include <boost/asio/streambuf.hpp>

#include <unistd.h>

#include <functional>
#include <iostream>

namespace net = boost::asio;

int main(int argc, char* argv[]) {
    std::string config_path = "config/room_client.yaml";
    if (argc > 1) {
        config_path = argv[1];
    }

    huddle::client::ClientConfig config;
    if (auto loaded = huddle::client::load_client_config(config_path)) {
        config = *loaded;
    } else {
        std::cerr << "Failed to load config from: " << config_path << std::endl;
        std::cerr << "Using default configuration" << std::endl;
    }
    huddle::client::apply_env_overrides(config);

    // 第二个参数指定房间
    if (argc > 2) {
        config.signaling.room = argv[2];
    }

    huddle::common::set_log_level(huddle::common::parse_log_level(config.logging.level));

    std::cout << "=== Huddle Room Client ===" << std::endl;
    std::cout << "Server: " << config.signaling.server_url << std::endl;
    std::cout << "Room: " << config.signaling.room << std::endl;

    try {
        net::io_context io_context{1};

        // 先于会话构造，会话析构时的离开回调仍可访问
        net::posix::stream_descriptor input(io_context, ::dup(STDIN_FILENO));
        net::streambuf input_buffer;
        net::signal_set signals(io_context, SIGINT, SIGTERM);
        std::function<void()> read_command;

        huddle::client::WebSocketTransport transport(
            io_context, config.signaling.server_url, config.signaling.session_cookie);
        huddle::client::RtcPeerTransportFactory peer_factory(io_context, config.webrtc.ice_servers);
        huddle::client::GstMediaDevices devices(io_context, config.media);
        huddle::client::ConsoleSurface surface(1920, 1080);
        huddle::client::ConsoleAvatarLayer avatar_layer;

        huddle::client::RoomSession session(
            io_context, transport, peer_factory, devices, surface, config);
        session.avatars().set_layer(&avatar_layer);

        // 离开房间后取消剩余等待，事件循环在信令关闭握手完成后自然退出
        auto release = [&]() {
            boost::system::error_code ignored;
            input.close(ignored);
            signals.cancel(ignored);
        };
        auto shutdown = [&]() {
            if (!session.leave()) {
                release();
            }
        };

        session.set_on_presenter([](const std::string& presenter_id) {
            std::cout << "presenter: " << (presenter_id.empty() ? "(none)" : presenter_id) << std::endl;
        });
        session.set_on_left([&](const std::string& reason) {
            std::cout << "left room (" << reason << ")" << std::endl;
            release();
        });

        read_command = [&]() {
            net::async_read_until(input, input_buffer, '\n',
                [&](const boost::system::error_code& ec, std::size_t) {
                    if (ec) {
                        if (ec != net::error::operation_aborted) {
                            shutdown();
                        }
                        return;
                    }
                    std::istream stream(&input_buffer);
                    std::string line;
                    std::getline(stream, line);
                    auto reply = huddle::client::execute_command(session, line);
                    if (!reply.empty()) {
                        std::cout << reply << std::endl;
                    }
                    if (session.state() != huddle::client::RoomState::LEFT) {
                        read_command();
                    }
                });
        };

        signals.async_wait([&](const boost::system::error_code& ec, int signal) {
            if (ec) {
                return;
            }
            LOG_INFO("Received signal " << signal << ", leaving...");
            shutdown();
        });

        session.initialize(config.signaling.room);
        read_command();
        io_context.run();

    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }

    std::cout << "Room client shutdown complete" << std::endl;
    return 0;
}
