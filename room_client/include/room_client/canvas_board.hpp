/**
 * @file canvas_board.hpp
 * @brief 协作白板
 *
 * 每个笔画段自描述（工具、颜色、线宽、端点），互不依赖，
 * 接收端按到达顺序追加绘制，不去重、不持久化。
 * 线上坐标与线宽按本地画布尺寸归一化到 0..1。
 */

#pragma once

#include "common/message.hpp"

#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace huddle::client {

/**
 * @brief 绘图工具
 */
enum class DrawTool {
    PEN,
    ERASER,
    LINE,
    ARROW,
    RECTANGLE,
    CIRCLE
};

const char* to_string(DrawTool tool);
std::optional<DrawTool> draw_tool_from_string(const std::string& name);

/**
 * @brief 已绘制的笔画（画布像素坐标）
 */
struct CanvasStroke {
    std::string user_id;
    DrawTool tool = DrawTool::PEN;
    std::string color;
    double width = 0.0;
    common::Point from;
    common::Point to;
    int64_t timestamp = 0;
};

/**
 * @brief 画布（UI 层实现）
 */
class CanvasSurface {
public:
    virtual ~CanvasSurface() = default;
    virtual double width() const = 0;
    virtual double height() const = 0;
    virtual void draw_stroke(const CanvasStroke& stroke) = 0;
    virtual void clear() = 0;
};

/**
 * @brief 白板
 */
class CanvasBoard {
public:
    using SendFn = std::function<bool(const common::SignalingMessage&)>;

    static constexpr const char* kEraserColor = "#ffffff";

    CanvasBoard(CanvasSurface& surface, SendFn send);

    void set_self_id(const std::string& self_id) { self_id_ = self_id; }

    bool set_tool(DrawTool tool);
    bool set_tool(const std::string& name);
    bool set_color(const std::string& color);
    bool set_line_width(double width);

    DrawTool tool() const { return tool_; }
    const std::string& color() const { return color_; }
    double line_width() const { return line_width_; }

    /**
     * @brief 指针事件（画布像素坐标）
     *
     * 画笔/橡皮每次移动产生一段；形状工具在抬起时从按下点到抬起点产生一次
     */
    void pointer_down(const common::Point& at);
    void pointer_move(const common::Point& at);
    void pointer_up(const common::Point& at);

    /**
     * @brief 直接绘制一段并广播
     */
    bool draw(DrawTool tool, const common::Point& from, const common::Point& to);

    /**
     * @brief 清空本地画布并广播 canvas-clear
     */
    bool clear();

    /**
     * @brief 处理 canvas-draw / canvas-clear
     * @return 消息是否属于本模块
     */
    bool handle_message(const common::SignalingMessage& msg);

    const std::vector<CanvasStroke>& strokes() const { return strokes_; }

private:
    void render(const CanvasStroke& stroke);
    bool broadcast(const CanvasStroke& stroke);

private:
    CanvasSurface& surface_;
    SendFn send_;
    std::string self_id_;

    DrawTool tool_ = DrawTool::PEN;
    std::string color_ = "#000000";
    double line_width_ = 2.0;

    bool drawing_ = false;
    common::Point press_point_;
    common::Point last_point_;

    std::vector<CanvasStroke> strokes_;
};

} // namespace huddle::client
