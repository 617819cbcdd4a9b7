/**
 * @file console_view.cpp
 * @brief 控制台输出与命令实现
 */

#include "room_client/console_view.hpp"
#include "room_client/room_session.hpp"
#include "common/logger.hpp"

#include <optional>
#include <sstream>

namespace huddle::client {

void ConsoleSurface::draw_stroke(const CanvasStroke& stroke) {
    ++stroke_count_;
    LOG_DEBUG("[canvas] " << stroke.user_id << " " << to_string(stroke.tool) << " "
              << stroke.color << " w=" << stroke.width
              << " (" << stroke.from.x << "," << stroke.from.y << ") -> ("
              << stroke.to.x << "," << stroke.to.y << ")");
}

void ConsoleSurface::clear() {
    stroke_count_ = 0;
    LOG_INFO("[canvas] cleared");
}

void ConsoleAvatarLayer::render_avatar(const AvatarInfo& avatar) {
    LOG_DEBUG("[avatar] " << avatar.user_id << " '" << avatar.style.label << "' at ("
              << avatar.x << "," << avatar.y << ")");
}

void ConsoleAvatarLayer::remove_avatar(const std::string& user_id) {
    LOG_INFO("[avatar] " << user_id << " removed");
}

namespace {

std::string on_off(bool value) {
    return value ? "on" : "off";
}

std::optional<bool> parse_switch(const std::string& arg) {
    if (arg == "on") return true;
    if (arg == "off") return false;
    return std::nullopt;
}

std::string media_result(const MediaResult& result, const std::string& what) {
    if (result.ok()) {
        return what + " started";
    }
    return what + " failed: " + to_string(result.error) + " (" + result.message + ")";
}

const char* kHelp =
    "commands:\n"
    "  media start|stop        camera + microphone\n"
    "  video [on|off]          toggle camera\n"
    "  audio [on|off]          toggle microphone\n"
    "  share start|stop        screen share\n"
    "  move <x> <y>            move own avatar\n"
    "  avatar add <id> <x> <y> | avatar remove <id>\n"
    "  tool <name> | color <c> | width <w>\n"
    "  draw <x1> <y1> <x2> <y2>\n"
    "  clear                   clear canvas\n"
    "  present <id>            set presenter\n"
    "  peers                   list peer connections\n"
    "  leave";

} // namespace

std::string execute_command(RoomSession& session, const std::string& line) {
    std::istringstream in(line);
    std::string cmd;
    if (!(in >> cmd)) {
        return "";
    }

    if (cmd == "help") {
        return kHelp;
    }

    if (cmd == "media") {
        std::string arg;
        in >> arg;
        if (arg == "start") return media_result(session.start_local_media(), "local media");
        if (arg == "stop") return session.stop_local_media() ? "local media stopped" : "no local media";
        return "usage: media start|stop";
    }

    if (cmd == "video" || cmd == "audio") {
        std::string arg;
        in >> arg;
        auto value = parse_switch(arg);
        if (!arg.empty() && !value) {
            return "usage: " + cmd + " [on|off]";
        }
        bool enabled = cmd == "video" ? session.toggle_video(value) : session.toggle_audio(value);
        if (!session.media().controls_enabled()) {
            return "no local media";
        }
        return cmd + " " + on_off(enabled);
    }

    if (cmd == "share") {
        std::string arg;
        in >> arg;
        if (arg == "start") return media_result(session.start_screen_share(), "screen share");
        if (arg == "stop") return session.stop_screen_share() ? "screen share stopped" : "not sharing";
        return "usage: share start|stop";
    }

    if (cmd == "move") {
        double x = 0, y = 0;
        if (!(in >> x >> y)) return "usage: move <x> <y>";
        return session.update_avatar(x, y) ? "moved" : "move not sent";
    }

    if (cmd == "avatar") {
        std::string op, id;
        in >> op >> id;
        if (op == "add") {
            double x = 0, y = 0;
            if (id.empty() || !(in >> x >> y)) return "usage: avatar add <id> <x> <y>";
            return session.add_avatar(id, x, y) ? "avatar set" : "invalid avatar";
        }
        if (op == "remove" && !id.empty()) {
            return session.remove_avatar(id) ? "avatar removed" : "no such avatar";
        }
        return "usage: avatar add <id> <x> <y> | avatar remove <id>";
    }

    if (cmd == "tool" || cmd == "color") {
        std::string arg;
        in >> arg;
        bool ok = cmd == "tool" ? session.set_tool(arg) : session.set_color(arg);
        return ok ? cmd + " " + arg : "invalid " + cmd;
    }

    if (cmd == "width") {
        double width = 0;
        if (!(in >> width)) return "usage: width <w>";
        return session.set_line_width(width) ? "width set" : "invalid width";
    }

    if (cmd == "draw") {
        common::Point from, to;
        if (!(in >> from.x >> from.y >> to.x >> to.y)) return "usage: draw <x1> <y1> <x2> <y2>";
        return session.canvas().draw(session.canvas().tool(), from, to) ? "drawn" : "draw failed";
    }

    if (cmd == "clear") {
        return session.clear_canvas() ? "canvas cleared" : "not in a room";
    }

    if (cmd == "present") {
        std::string id;
        in >> id;
        return session.set_presenter(id) ? "presenter " + (id.empty() ? "cleared" : id) : "not in a room";
    }

    if (cmd == "peers") {
        std::ostringstream out;
        out << session.peers().peer_count() << " peer(s)";
        for (const auto& id : session.peers().peer_ids()) {
            auto state = session.peers().state_of(id);
            out << "\n  " << id << " " << (state ? to_string(*state) : "?");
        }
        return out.str();
    }

    if (cmd == "leave") {
        return session.leave() ? "left" : "not in a room";
    }

    return "unknown command '" + cmd + "', try help";
}

} // namespace huddle::client
