/**
 * @file avatar_board.hpp
 * @brief 头像位置同步
 *
 * 每个用户只移动自己的头像，接收端按发起用户做最后写入生效，
 * 不存在跨用户冲突。本端移动按频率限流，超出部分合并为最新位置。
 */

#pragma once

#include "room_client/rate_limiter.hpp"
#include "common/message.hpp"

#include <boost/asio/io_context.hpp>
#include <boost/asio/steady_timer.hpp>

#include <functional>
#include <map>
#include <optional>
#include <string>

namespace huddle::client {

/**
 * @brief 头像显示信息
 */
struct AvatarStyle {
    std::string label;      // 头像上的缩写
    std::string name;       // 显示名
    std::string color;
};

/**
 * @brief 头像状态
 */
struct AvatarInfo {
    std::string user_id;
    double x = 0.0;
    double y = 0.0;
    AvatarStyle style;
    int64_t timestamp = 0;
};

/**
 * @brief 地图容器（UI 层实现）
 */
class AvatarLayer {
public:
    virtual ~AvatarLayer() = default;
    virtual void render_avatar(const AvatarInfo& avatar) = 0;
    virtual void remove_avatar(const std::string& user_id) = 0;
};

/**
 * @brief 头像面板
 */
class AvatarBoard {
public:
    using SendFn = std::function<bool(const common::SignalingMessage&)>;

    AvatarBoard(boost::asio::io_context& io_context, int max_rate_hz, SendFn send);
    ~AvatarBoard();

    void set_layer(AvatarLayer* layer) { layer_ = layer; }
    void set_self_id(const std::string& self_id) { self_id_ = self_id; }
    const std::string& self_id() const { return self_id_; }

    /**
     * @brief 添加头像，已存在时只更新位置
     */
    bool add_avatar(const std::string& user_id, double x, double y, const AvatarStyle& style = {});

    /**
     * @brief 本地更新某头像位置（不广播）
     */
    bool update_avatar_position(const std::string& user_id, double x, double y);

    bool remove_avatar(const std::string& user_id);

    /**
     * @brief 移动自己的头像并广播（限流，合并）
     * @return 坐标非法时返回 false
     */
    bool move_local(double x, double y);

    /**
     * @brief 处理 avatar-position / user-left
     * @return 消息是否属于本模块
     */
    bool handle_message(const common::SignalingMessage& msg);

    void clear();

    std::optional<AvatarInfo> find(const std::string& user_id) const;
    size_t count() const { return avatars_.size(); }
    int sent_count() const { return sent_count_; }
    bool has_pending() const { return pending_.has_value(); }

private:
    void apply(const std::string& user_id, double x, double y, int64_t timestamp);
    void flush_pending();
    bool send_position(double x, double y);

private:
    boost::asio::steady_timer timer_;
    RateLimiter limiter_;
    SendFn send_;
    AvatarLayer* layer_ = nullptr;
    std::string self_id_;

    std::map<std::string, AvatarInfo> avatars_;
    std::optional<std::pair<double, double>> pending_;
    bool timer_armed_ = false;
    int sent_count_ = 0;
};

} // namespace huddle::client
