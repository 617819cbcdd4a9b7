/**
 * @file console_view.hpp
 * @brief 无界面运行时的白板/头像输出与控制台命令
 */

#pragma once

#include "room_client/avatar_board.hpp"
#include "room_client/canvas_board.hpp"

#include <string>

namespace huddle::client {

class RoomSession;

/**
 * @brief 固定尺寸的日志白板
 */
class ConsoleSurface : public CanvasSurface {
public:
    ConsoleSurface(double width, double height) : width_(width), height_(height) {}

    double width() const override { return width_; }
    double height() const override { return height_; }
    void draw_stroke(const CanvasStroke& stroke) override;
    void clear() override;

    size_t stroke_count() const { return stroke_count_; }

private:
    double width_;
    double height_;
    size_t stroke_count_ = 0;
};

/**
 * @brief 日志头像层
 */
class ConsoleAvatarLayer : public AvatarLayer {
public:
    void render_avatar(const AvatarInfo& avatar) override;
    void remove_avatar(const std::string& user_id) override;
};

/**
 * @brief 执行一行控制台命令
 *
 * 支持 media / video / audio / share / move / avatar / tool / color / width /
 * draw / clear / present / peers / leave / help
 *
 * @return 给用户的反馈文本
 */
std::string execute_command(RoomSession& session, const std::string& line);

} // namespace huddle::client
