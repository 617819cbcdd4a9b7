/**
 * @file upgrade_target_test.cpp
 * @brief 升级请求目标解析测试
 */

#include "signaling_server/upgrade_target.hpp"

#include <gtest/gtest.h>

using namespace huddle::signaling;

TEST(UpgradeTargetTest, QueryParameterSelectsRoom) {
    auto t = parse_upgrade_target("/ws?room=lobby", 128);
    EXPECT_EQ(t.status, UpgradeTargetStatus::OK);
    EXPECT_EQ(t.room_id, "lobby");
}

TEST(UpgradeTargetTest, PathSegmentSelectsRoom) {
    auto t = parse_upgrade_target("/ws/team%20a", 128);
    EXPECT_EQ(t.status, UpgradeTargetStatus::OK);
    EXPECT_EQ(t.room_id, "team a");
}

TEST(UpgradeTargetTest, MissingRoomUsesDefault) {
    EXPECT_EQ(parse_upgrade_target("/ws", 128).room_id, kDefaultRoomId);
    EXPECT_EQ(parse_upgrade_target("/ws/", 128).room_id, kDefaultRoomId);
    EXPECT_EQ(parse_upgrade_target("/ws?room=", 128).room_id, kDefaultRoomId);
    EXPECT_EQ(parse_upgrade_target("/ws?other=1", 128).room_id, kDefaultRoomId);
}

TEST(UpgradeTargetTest, LastRoomParameterWins) {
    auto t = parse_upgrade_target("/ws?room=a&x=1&room=b", 128);
    EXPECT_EQ(t.room_id, "b");
}

TEST(UpgradeTargetTest, OtherPathsAreNotFound) {
    EXPECT_EQ(parse_upgrade_target("/", 128).status, UpgradeTargetStatus::NOT_FOUND);
    EXPECT_EQ(parse_upgrade_target("/wss", 128).status, UpgradeTargetStatus::NOT_FOUND);
    EXPECT_EQ(parse_upgrade_target("/ws/a/b", 128).status, UpgradeTargetStatus::NOT_FOUND);
}

TEST(UpgradeTargetTest, RejectsBadRoomIds) {
    EXPECT_EQ(parse_upgrade_target("/ws?room=%zz", 128).status, UpgradeTargetStatus::BAD_ROOM_ID);
    EXPECT_EQ(parse_upgrade_target("/ws?room=a%0Ab", 128).status, UpgradeTargetStatus::BAD_ROOM_ID);
    EXPECT_EQ(parse_upgrade_target("/ws?room=" + std::string(10, 'r'), 8).status,
              UpgradeTargetStatus::BAD_ROOM_ID);
}

TEST(UpgradeTargetTest, UrlDecode) {
    std::string out;
    EXPECT_TRUE(url_decode("a+b%2Fc", out));
    EXPECT_EQ(out, "a b/c");
    EXPECT_FALSE(url_decode("%4", out));
    EXPECT_FALSE(url_decode("%", out));
}
