/**
 * @file codec_test.cpp
 * @brief 信令消息编解码测试
 */

#include "common/codec.hpp"

#include <gtest/gtest.h>

using namespace huddle::common;

TEST(CodecTest, ParsesTargetedMessage) {
    auto msg = parse_message(R"({"type":"offer","target":"b1","payload":{"type":"offer","sdp":"v=0"}})");
    ASSERT_TRUE(msg);
    EXPECT_EQ(msg->type, MessageType::OFFER);
    EXPECT_EQ(msg->target, "b1");
    EXPECT_EQ(msg->payload["sdp"], "v=0");
}

TEST(CodecTest, TargetedMessageRequiresTargetAndPayload) {
    std::string error;
    EXPECT_FALSE(parse_message(R"({"type":"answer","payload":{}})", &error));
    EXPECT_NE(error.find("target"), std::string::npos);

    EXPECT_FALSE(parse_message(R"({"type":"ice-candidate","target":"x"})", &error));
    EXPECT_NE(error.find("payload"), std::string::npos);
}

TEST(CodecTest, RejectsMalformedInput) {
    EXPECT_FALSE(parse_message("not json"));
    EXPECT_FALSE(parse_message("[1,2,3]"));
    EXPECT_FALSE(parse_message(R"({"target":"x"})"));
    EXPECT_FALSE(parse_message(R"({"type":"launch-rockets"})"));
    EXPECT_FALSE(parse_message(R"({"type":"avatar-position","x":"1","y":2})"));
    EXPECT_FALSE(parse_message(R"({"type":"canvas-draw","tool":"pen","color":"#000","from":{"x":0}})"));
}

TEST(CodecTest, ParsesCanvasDraw) {
    auto msg = parse_message(
        R"({"type":"canvas-draw","tool":"pen","color":"#ff0000","width":3,)"
        R"("from":{"x":0.1,"y":0.2},"to":{"x":0.3,"y":0.4},"timestamp":1700000000000})");
    ASSERT_TRUE(msg);
    EXPECT_EQ(msg->tool, "pen");
    EXPECT_TRUE(msg->has_width);
    EXPECT_DOUBLE_EQ(msg->width, 3.0);
    EXPECT_DOUBLE_EQ(msg->to_point.y, 0.4);
    EXPECT_EQ(msg->timestamp, 1700000000000);
}

TEST(CodecTest, OutOfRangeTimestampIsIgnored) {
    auto huge = parse_message(R"({"type":"canvas-clear","timestamp":1e300})");
    ASSERT_TRUE(huge);
    EXPECT_EQ(huge->timestamp, 0);

    auto negative = parse_message(R"({"type":"canvas-clear","timestamp":-1e19})");
    ASSERT_TRUE(negative);
    EXPECT_EQ(negative->timestamp, 0);

    auto unsigned_max = parse_message(R"({"type":"canvas-clear","timestamp":18446744073709551615})");
    ASSERT_TRUE(unsigned_max);
    EXPECT_EQ(unsigned_max->timestamp, 0);

    auto fractional = parse_message(R"({"type":"canvas-clear","timestamp":1700000000000.5})");
    ASSERT_TRUE(fractional);
    EXPECT_EQ(fractional->timestamp, 1700000000000);
}

TEST(CodecTest, SerializesRoomMembers) {
    auto text = serialize(make_room_members("c3", {"c1", "c2"}));
    auto j = nlohmann::json::parse(text);
    EXPECT_EQ(j["type"], "room-members");
    EXPECT_EQ(j["self"], "c3");
    EXPECT_EQ(j["members"], nlohmann::json::array({"c1", "c2"}));
}

TEST(CodecTest, UserJoinedCarriesAuthenticatedIdOnlyWhenKnown) {
    auto anonymous = nlohmann::json::parse(serialize(make_user_joined("c1")));
    EXPECT_FALSE(anonymous.contains("authenticatedUserId"));

    auto known = nlohmann::json::parse(serialize(make_user_joined("c1", "42")));
    EXPECT_EQ(known["authenticatedUserId"], "42");
    EXPECT_EQ(known["userId"], "c1");
}

TEST(CodecTest, BroadcastOmitsEmptyUserId) {
    SignalingMessage msg;
    msg.type = MessageType::AVATAR_POSITION;
    msg.x = 10;
    msg.y = 20;
    auto j = nlohmann::json::parse(serialize(msg));
    EXPECT_FALSE(j.contains("userId"));
    EXPECT_FALSE(j.contains("timestamp"));
}

TEST(CodecTest, TypeClassification) {
    EXPECT_TRUE(is_targeted(MessageType::ICE_CANDIDATE));
    EXPECT_FALSE(is_targeted(MessageType::CANVAS_CLEAR));
    EXPECT_TRUE(is_broadcast(MessageType::SET_PRESENTER));
    EXPECT_FALSE(is_broadcast(MessageType::USER_LEFT));
    EXPECT_EQ(message_type_from_string("ice-candidate"), MessageType::ICE_CANDIDATE);
    EXPECT_STREQ(to_string(MessageType::CANVAS_DRAW), "canvas-draw");
}
