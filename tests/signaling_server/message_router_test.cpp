/**
 * @file message_router_test.cpp
 * @brief 消息路由策略测试
 */

#include "signaling_server/message_router.hpp"
#include "signaling_server/room_registry.hpp"

#include <gtest/gtest.h>

#include <limits>

using namespace huddle::signaling;
using huddle::common::MessageType;
using huddle::common::SignalingMessage;

class MessageRouterTest : public ::testing::Test {
protected:
    void SetUp() override {
        registry_.join("a", "R1");
        registry_.join("b", "R1");
        registry_.join("c", "R1");
        registry_.join("x", "R2");
    }

    SignalingMessage targeted(MessageType type, const std::string& target) {
        SignalingMessage msg;
        msg.type = type;
        msg.target = target;
        msg.payload = {{"type", "offer"}, {"sdp", "v=0"}};
        return msg;
    }

    LimitsConfig limits_;
    MessageRouter router_{limits_};
    RoomRegistry registry_;
};

TEST_F(MessageRouterTest, TargetedMessageStampsSender) {
    auto decision = router_.route("a", targeted(MessageType::OFFER, "b"), registry_);
    ASSERT_EQ(decision.disposition, RouteDisposition::DELIVER);
    EXPECT_EQ(decision.recipients, (std::vector<std::string>{"b"}));
    EXPECT_EQ(decision.outbound.from, "a");
    EXPECT_EQ(decision.outbound.payload["sdp"], "v=0");
}

TEST_F(MessageRouterTest, SenderCannotForgeFrom) {
    auto msg = targeted(MessageType::ANSWER, "b");
    msg.from = "c";
    auto decision = router_.route("a", msg, registry_);
    ASSERT_EQ(decision.disposition, RouteDisposition::DELIVER);
    EXPECT_EQ(decision.outbound.from, "a");
}

TEST_F(MessageRouterTest, TargetOutsideRoomIsDropped) {
    EXPECT_EQ(router_.route("a", targeted(MessageType::OFFER, "x"), registry_).disposition,
              RouteDisposition::DROP_TARGET_MISSING);
    EXPECT_EQ(router_.route("a", targeted(MessageType::OFFER, "gone"), registry_).disposition,
              RouteDisposition::DROP_TARGET_MISSING);
    EXPECT_EQ(router_.route("a", targeted(MessageType::OFFER, "a"), registry_).disposition,
              RouteDisposition::DROP_TARGET_MISSING);
}

TEST_F(MessageRouterTest, BroadcastExcludesSender) {
    SignalingMessage msg;
    msg.type = MessageType::CANVAS_CLEAR;
    auto decision = router_.route("b", msg, registry_);
    ASSERT_EQ(decision.disposition, RouteDisposition::DELIVER);
    EXPECT_EQ(decision.recipients, (std::vector<std::string>{"a", "c"}));
    EXPECT_EQ(decision.outbound.user_id, "b");
}

TEST_F(MessageRouterTest, BroadcastOverridesClaimedUserId) {
    SignalingMessage msg;
    msg.type = MessageType::AVATAR_POSITION;
    msg.user_id = "c";
    msg.x = 1;
    msg.y = 2;
    auto decision = router_.route("a", msg, registry_);
    ASSERT_EQ(decision.disposition, RouteDisposition::DELIVER);
    EXPECT_EQ(decision.outbound.user_id, "a");
}

TEST_F(MessageRouterTest, ServerOnlyTypesAreRejected) {
    auto msg = huddle::common::make_user_left("b");
    EXPECT_EQ(router_.route("a", msg, registry_).disposition, RouteDisposition::DROP_INVALID);
}

TEST_F(MessageRouterTest, UnknownSenderIsDropped) {
    SignalingMessage msg;
    msg.type = MessageType::CANVAS_CLEAR;
    EXPECT_EQ(router_.route("ghost", msg, registry_).disposition, RouteDisposition::DROP_NOT_IN_ROOM);
}

TEST_F(MessageRouterTest, RejectsNonFiniteOrHugeCoordinates) {
    SignalingMessage msg;
    msg.type = MessageType::AVATAR_POSITION;
    msg.x = std::numeric_limits<double>::infinity();
    msg.y = 0;
    EXPECT_EQ(router_.route("a", msg, registry_).disposition, RouteDisposition::DROP_INVALID);

    msg.x = 1e9;
    EXPECT_EQ(router_.route("a", msg, registry_).disposition, RouteDisposition::DROP_INVALID);

    msg.x = -1e6;
    EXPECT_EQ(router_.route("a", msg, registry_).disposition, RouteDisposition::DELIVER);
}

TEST_F(MessageRouterTest, ValidatesStrokeFields) {
    SignalingMessage msg;
    msg.type = MessageType::CANVAS_DRAW;
    msg.tool = "pen";
    msg.color = "#ff0000";
    msg.from_point = {0.1, 0.1};
    msg.to_point = {0.2, 0.2};
    std::string reason;
    EXPECT_TRUE(router_.validate_broadcast(msg, &reason));

    msg.color = "red;<script>";
    EXPECT_FALSE(router_.validate_broadcast(msg, &reason));
    EXPECT_EQ(reason, "invalid color");

    msg.color = "rgb(1, 2, 3)";
    EXPECT_TRUE(router_.validate_broadcast(msg, &reason));

    msg.tool = std::string(100, 'p');
    EXPECT_FALSE(router_.validate_broadcast(msg, &reason));

    msg.tool = "pen";
    msg.has_width = true;
    msg.width = -1;
    EXPECT_FALSE(router_.validate_broadcast(msg, &reason));
}

TEST_F(MessageRouterTest, OversizedPayloadIsRejected) {
    auto msg = targeted(MessageType::OFFER, "b");
    msg.payload["sdp"] = std::string(limits_.max_payload_bytes + 1, 'a');
    EXPECT_EQ(router_.route("a", msg, registry_).disposition, RouteDisposition::DROP_INVALID);
}
