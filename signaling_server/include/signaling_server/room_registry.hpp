/**
 * @file room_registry.hpp
 * @brief 房间成员注册表
 *
 * 房间 ID → 在线连接集合，成员关系的唯一来源。
 * 只在 io_context 线程上访问，不加锁。
 */

#pragma once

#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace huddle::signaling {

/**
 * @brief 离开房间的结果
 */
struct LeaveResult {
    std::string room_id;
    std::vector<std::string> remaining;     // 仍在房间内的连接
    bool room_discarded = false;            // 房间因变空被删除
};

/**
 * @brief 房间注册表
 */
class RoomRegistry {
public:
    /**
     * @brief 加入房间，房间不存在时隐式创建
     * @param connection_id 连接 ID
     * @param room_id 房间 ID
     * @return 加入前已在房间内的成员（按加入顺序），连接已在某个房间时返回 std::nullopt
     */
    std::optional<std::vector<std::string>> join(const std::string& connection_id,
                                                 const std::string& room_id);

    /**
     * @brief 离开房间，房间变空时删除
     * @return 连接不在任何房间时返回 std::nullopt
     */
    std::optional<LeaveResult> leave(const std::string& connection_id);

    /**
     * @brief 获取房间成员（按加入顺序）
     */
    std::vector<std::string> members(const std::string& room_id) const;

    /**
     * @brief 获取连接所在房间
     */
    std::optional<std::string> room_of(const std::string& connection_id) const;

    /**
     * @brief 连接是否在指定房间内
     */
    bool contains(const std::string& room_id, const std::string& connection_id) const;

    size_t room_size(const std::string& room_id) const;
    size_t room_count() const { return rooms_.size(); }
    size_t connection_count() const { return room_of_.size(); }

    /**
     * @brief 清空所有房间（服务停止时）
     */
    void clear();

private:
    std::unordered_map<std::string, std::vector<std::string>> rooms_;
    std::unordered_map<std::string, std::string> room_of_;
};

} // namespace huddle::signaling
