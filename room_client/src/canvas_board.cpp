/**
 * @file canvas_board.cpp
 * @brief 协作白板实现
 */

#include "room_client/canvas_board.hpp"
#include "common/codec.hpp"
#include "common/logger.hpp"

#include <cctype>
#include <cmath>

namespace huddle::client {

using common::MessageType;
using common::Point;
using common::SignalingMessage;

namespace {

struct ToolName {
    DrawTool tool;
    const char* name;
};

constexpr ToolName kToolNames[] = {
    {DrawTool::PEN, "pen"},
    {DrawTool::ERASER, "eraser"},
    {DrawTool::LINE, "line"},
    {DrawTool::ARROW, "arrow"},
    {DrawTool::RECTANGLE, "rectangle"},
    {DrawTool::CIRCLE, "circle"},
};

bool is_freehand(DrawTool tool) {
    return tool == DrawTool::PEN || tool == DrawTool::ERASER;
}

bool valid_point(const Point& p) {
    return std::isfinite(p.x) && std::isfinite(p.y);
}

// 只接受 #rgb/#rrggbb、颜色名和 rgb()/hsl() 形式用到的字符
bool valid_color(const std::string& color) {
    if (color.empty() || color.size() > 64) {
        return false;
    }
    for (char c : color) {
        if (!std::isalnum(static_cast<unsigned char>(c)) &&
            c != '#' && c != '(' && c != ')' && c != ',' && c != '.' && c != '%' && c != ' ') {
            return false;
        }
    }
    return true;
}

} // namespace

const char* to_string(DrawTool tool) {
    for (const auto& entry : kToolNames) {
        if (entry.tool == tool) {
            return entry.name;
        }
    }
    return "pen";
}

std::optional<DrawTool> draw_tool_from_string(const std::string& name) {
    for (const auto& entry : kToolNames) {
        if (name == entry.name) {
            return entry.tool;
        }
    }
    return std::nullopt;
}

CanvasBoard::CanvasBoard(CanvasSurface& surface, SendFn send)
    : surface_(surface)
    , send_(std::move(send))
{
}

bool CanvasBoard::set_tool(DrawTool tool) {
    tool_ = tool;
    drawing_ = false;
    return true;
}

bool CanvasBoard::set_tool(const std::string& name) {
    auto tool = draw_tool_from_string(name);
    if (!tool) {
        LOG_WARN("[Canvas] unknown tool '" << name << "'");
        return false;
    }
    return set_tool(*tool);
}

bool CanvasBoard::set_color(const std::string& color) {
    if (!valid_color(color)) {
        LOG_WARN("[Canvas] invalid color '" << color << "'");
        return false;
    }
    color_ = color;
    return true;
}

bool CanvasBoard::set_line_width(double width) {
    if (!std::isfinite(width) || width <= 0.0) {
        return false;
    }
    line_width_ = width;
    return true;
}

void CanvasBoard::pointer_down(const Point& at) {
    if (!valid_point(at)) {
        return;
    }
    drawing_ = true;
    press_point_ = at;
    last_point_ = at;
}

void CanvasBoard::pointer_move(const Point& at) {
    if (!drawing_ || !valid_point(at)) {
        return;
    }
    if (is_freehand(tool_)) {
        draw(tool_, last_point_, at);
        last_point_ = at;
    }
}

void CanvasBoard::pointer_up(const Point& at) {
    if (!drawing_) {
        return;
    }
    drawing_ = false;
    if (!is_freehand(tool_) && valid_point(at)) {
        draw(tool_, press_point_, at);
    }
}

bool CanvasBoard::draw(DrawTool tool, const Point& from, const Point& to) {
    if (!valid_point(from) || !valid_point(to)) {
        return false;
    }

    CanvasStroke stroke;
    stroke.user_id = self_id_;
    stroke.tool = tool;
    if (tool == DrawTool::ERASER) {
        // 橡皮用白色、两倍线宽覆盖
        stroke.color = kEraserColor;
        stroke.width = line_width_ * 2.0;
    } else {
        stroke.color = color_;
        stroke.width = line_width_;
    }
    stroke.from = from;
    stroke.to = to;
    stroke.timestamp = common::now_ms();

    render(stroke);
    return broadcast(stroke);
}

bool CanvasBoard::clear() {
    strokes_.clear();
    surface_.clear();

    SignalingMessage msg;
    msg.type = MessageType::CANVAS_CLEAR;
    msg.timestamp = common::now_ms();
    return send_ && send_(msg);
}

bool CanvasBoard::handle_message(const SignalingMessage& msg) {
    if (msg.type != MessageType::CANVAS_DRAW && msg.type != MessageType::CANVAS_CLEAR) {
        return false;
    }

    // 自己的回显不重复绘制
    if (!self_id_.empty() && msg.user_id == self_id_) {
        return true;
    }

    if (msg.type == MessageType::CANVAS_CLEAR) {
        LOG_DEBUG("[Canvas] cleared by " << msg.user_id);
        strokes_.clear();
        surface_.clear();
        return true;
    }

    auto tool = draw_tool_from_string(msg.tool);
    if (!tool) {
        LOG_WARN("[Canvas] dropping stroke with unknown tool '" << msg.tool << "'");
        return true;
    }
    if (!valid_color(msg.color)) {
        LOG_WARN("[Canvas] dropping stroke with invalid color");
        return true;
    }

    // 按本地画布尺寸反归一化
    const double w = surface_.width();
    const double h = surface_.height();

    CanvasStroke stroke;
    stroke.user_id = msg.user_id;
    stroke.tool = *tool;
    stroke.color = msg.color;
    stroke.width = msg.has_width ? msg.width * w : line_width_;
    stroke.from = Point{msg.from_point.x * w, msg.from_point.y * h};
    stroke.to = Point{msg.to_point.x * w, msg.to_point.y * h};
    stroke.timestamp = msg.timestamp;

    render(stroke);
    return true;
}

void CanvasBoard::render(const CanvasStroke& stroke) {
    strokes_.push_back(stroke);
    surface_.draw_stroke(stroke);
}

bool CanvasBoard::broadcast(const CanvasStroke& stroke) {
    const double w = surface_.width();
    const double h = surface_.height();
    if (w <= 0.0 || h <= 0.0) {
        LOG_WARN("[Canvas] surface has no size, stroke not broadcast");
        return false;
    }

    SignalingMessage msg;
    msg.type = MessageType::CANVAS_DRAW;
    msg.tool = to_string(stroke.tool);
    msg.color = stroke.color;
    msg.width = stroke.width / w;
    msg.has_width = true;
    msg.from_point = Point{stroke.from.x / w, stroke.from.y / h};
    msg.to_point = Point{stroke.to.x / w, stroke.to.y / h};
    msg.timestamp = stroke.timestamp;
    return send_ && send_(msg);
}

} // namespace huddle::client
