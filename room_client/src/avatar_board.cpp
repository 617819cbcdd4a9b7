/**
 * @file avatar_board.cpp
 * @brief 头像位置同步实现
 */

#include "room_client/avatar_board.hpp"
#include "common/codec.hpp"
#include "common/logger.hpp"

#include <cctype>
#include <cmath>

namespace huddle::client {

using common::MessageType;
using common::SignalingMessage;

AvatarBoard::AvatarBoard(boost::asio::io_context& io_context, int max_rate_hz, SendFn send)
    : timer_(io_context)
    , limiter_(max_rate_hz)
    , send_(std::move(send))
{
}

AvatarBoard::~AvatarBoard() {
    timer_.cancel();
}

bool AvatarBoard::add_avatar(const std::string& user_id, double x, double y, const AvatarStyle& style) {
    if (user_id.empty() || !std::isfinite(x) || !std::isfinite(y)) {
        return false;
    }

    auto it = avatars_.find(user_id);
    if (it != avatars_.end()) {
        return update_avatar_position(user_id, x, y);
    }

    AvatarInfo info;
    info.user_id = user_id;
    info.x = x;
    info.y = y;
    info.style = style;
    if (info.style.label.empty()) {
        // 缺省缩写取 ID 前两位
        for (size_t i = 0; i < user_id.size() && i < 2; ++i) {
            info.style.label.push_back(static_cast<char>(std::toupper(static_cast<unsigned char>(user_id[i]))));
        }
    }

    auto& stored = avatars_[user_id];
    stored = std::move(info);
    LOG_DEBUG("[Avatar] added " << user_id << " at [" << x << ", " << y << "]");
    if (layer_) {
        layer_->render_avatar(stored);
    }
    return true;
}

bool AvatarBoard::update_avatar_position(const std::string& user_id, double x, double y) {
    auto it = avatars_.find(user_id);
    if (it == avatars_.end() || !std::isfinite(x) || !std::isfinite(y)) {
        return false;
    }
    it->second.x = x;
    it->second.y = y;
    if (layer_) {
        layer_->render_avatar(it->second);
    }
    return true;
}

bool AvatarBoard::remove_avatar(const std::string& user_id) {
    auto it = avatars_.find(user_id);
    if (it == avatars_.end()) {
        return false;
    }
    avatars_.erase(it);
    LOG_DEBUG("[Avatar] removed " << user_id);
    if (layer_) {
        layer_->remove_avatar(user_id);
    }
    return true;
}

bool AvatarBoard::move_local(double x, double y) {
    if (!std::isfinite(x) || !std::isfinite(y)) {
        return false;
    }

    const std::string& own_id = self_id_.empty() ? std::string("me") : self_id_;
    if (avatars_.count(own_id) == 0) {
        add_avatar(own_id, x, y);
    } else {
        update_avatar_position(own_id, x, y);
    }

    if (!pending_ && limiter_.should_publish()) {
        return send_position(x, y);
    }

    // 窗口未到：只保留最新位置，窗口打开时发送
    pending_ = std::make_pair(x, y);
    if (!timer_armed_) {
        timer_armed_ = true;
        timer_.expires_after(limiter_.time_until_next());
        timer_.async_wait([this](const boost::system::error_code& ec) {
            // 取消时对象可能已析构，不能再访问成员
            if (ec) {
                return;
            }
            timer_armed_ = false;
            flush_pending();
        });
    }
    return true;
}

bool AvatarBoard::handle_message(const SignalingMessage& msg) {
    switch (msg.type) {
        case MessageType::AVATAR_POSITION:
            if (msg.user_id.empty() || msg.user_id == self_id_) {
                // 自己的回显
                return true;
            }
            apply(msg.user_id, msg.x, msg.y, msg.timestamp);
            return true;

        case MessageType::USER_LEFT:
            remove_avatar(msg.user_id);
            return true;

        default:
            return false;
    }
}

void AvatarBoard::clear() {
    timer_.cancel();
    timer_armed_ = false;
    pending_.reset();

    auto avatars = std::move(avatars_);
    avatars_.clear();
    if (layer_) {
        for (const auto& [id, info] : avatars) {
            layer_->remove_avatar(id);
        }
    }
}

std::optional<AvatarInfo> AvatarBoard::find(const std::string& user_id) const {
    auto it = avatars_.find(user_id);
    if (it == avatars_.end()) {
        return std::nullopt;
    }
    return it->second;
}

void AvatarBoard::apply(const std::string& user_id, double x, double y, int64_t timestamp) {
    auto it = avatars_.find(user_id);
    if (it == avatars_.end()) {
        // 首次出现的远端头像隐式创建
        if (add_avatar(user_id, x, y)) {
            avatars_[user_id].timestamp = timestamp;
        }
        return;
    }

    // 带时间戳时丢弃比已应用更旧的位置
    if (timestamp != 0 && it->second.timestamp != 0 && timestamp < it->second.timestamp) {
        return;
    }
    if (timestamp != 0) {
        it->second.timestamp = timestamp;
    }
    update_avatar_position(user_id, x, y);
}

void AvatarBoard::flush_pending() {
    if (!pending_) {
        return;
    }
    if (!limiter_.should_publish()) {
        // 时钟抖动，重新等待
        auto position = *pending_;
        pending_.reset();
        move_local(position.first, position.second);
        return;
    }
    auto [x, y] = *pending_;
    pending_.reset();
    send_position(x, y);
}

bool AvatarBoard::send_position(double x, double y) {
    SignalingMessage msg;
    msg.type = MessageType::AVATAR_POSITION;
    msg.x = x;
    msg.y = y;
    msg.timestamp = common::now_ms();
    ++sent_count_;
    return send_ && send_(msg);
}

} // namespace huddle::client
