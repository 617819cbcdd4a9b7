/**
 * @file websocket_transport_test.cpp
 * @brief 信令地址解析测试
 */

#include "room_client/websocket_transport.hpp"

#include <gtest/gtest.h>

using namespace huddle::client;

TEST(WsUrlTest, ParsesHostPortAndPath) {
    auto url = parse_ws_url("ws://signal.local:3000/ws");
    ASSERT_TRUE(url);
    EXPECT_EQ(url->host, "signal.local");
    EXPECT_EQ(url->port, "3000");
    EXPECT_EQ(url->target, "/ws");
}

TEST(WsUrlTest, DefaultsPortAndPath) {
    auto url = parse_ws_url("ws://signal.local");
    ASSERT_TRUE(url);
    EXPECT_EQ(url->port, "80");
    EXPECT_EQ(url->target, "/ws");

    auto http = parse_ws_url("http://127.0.0.1:8080/signal");
    ASSERT_TRUE(http);
    EXPECT_EQ(http->host, "127.0.0.1");
    EXPECT_EQ(http->port, "8080");
    EXPECT_EQ(http->target, "/signal");
}

TEST(WsUrlTest, RejectsTlsAndEmptyHost) {
    EXPECT_FALSE(parse_ws_url("wss://signal.local/ws"));
    EXPECT_FALSE(parse_ws_url("https://signal.local/ws"));
    EXPECT_FALSE(parse_ws_url("ws:///ws"));
    EXPECT_FALSE(parse_ws_url("ws://host:/ws"));
}

TEST(RoomTargetTest, EncodesRoomId) {
    EXPECT_EQ(make_room_target("/ws", "lobby"), "/ws?room=lobby");
    EXPECT_EQ(make_room_target("/ws", "team a"), "/ws?room=team%20a");
    EXPECT_EQ(make_room_target("/ws", "a/b&c"), "/ws?room=a%2Fb%26c");
}

TEST(RoomTargetTest, AppendsToExistingQuery) {
    EXPECT_EQ(make_room_target("/ws?v=1", "lobby"), "/ws?v=1&room=lobby");
}
