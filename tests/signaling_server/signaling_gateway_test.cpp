/**
 * @file signaling_gateway_test.cpp
 * @brief 信令网关测试（加入/离开通知与转发）
 */

#include "signaling_server/signaling_gateway.hpp"
#include "signaling_server/message_router.hpp"
#include "signaling_server/room_registry.hpp"
#include "common/codec.hpp"

#include <gtest/gtest.h>

using namespace huddle::signaling;
using huddle::common::MessageType;
using nlohmann::json;

namespace {

class RecordingSink : public ConnectionSink {
public:
    void send(const std::string& text) override {
        frames.push_back(json::parse(text));
    }
    void close() override {
        ++close_calls;
    }

    std::vector<json> frames;
    int close_calls = 0;
};

} // namespace

class SignalingGatewayTest : public ::testing::Test {
protected:
    std::string join(const std::string& room, std::shared_ptr<RecordingSink>& sink,
                     std::optional<std::string> user = std::nullopt) {
        sink = std::make_shared<RecordingSink>();
        return gateway_.open(room, user, sink);
    }

    LimitsConfig limits_;
    RoomRegistry registry_;
    MessageRouter router_{limits_};
    SignalingGateway gateway_{registry_, router_};
};

TEST_F(SignalingGatewayTest, JoinAnnouncesMembersBothWays) {
    std::shared_ptr<RecordingSink> s1, s2;
    auto c1 = join("R1", s1);
    auto c2 = join("R1", s2, std::string("u-7"));

    ASSERT_EQ(s1->frames.size(), 2u);
    EXPECT_EQ(s1->frames[0]["type"], "room-members");
    EXPECT_TRUE(s1->frames[0]["members"].empty());
    EXPECT_EQ(s1->frames[0]["self"], c1);
    EXPECT_EQ(s1->frames[1]["type"], "user-joined");
    EXPECT_EQ(s1->frames[1]["userId"], c2);
    EXPECT_EQ(s1->frames[1]["authenticatedUserId"], "u-7");

    ASSERT_EQ(s2->frames.size(), 1u);
    EXPECT_EQ(s2->frames[0]["members"], json::array({c1}));
    EXPECT_EQ(s2->frames[0]["self"], c2);
}

TEST_F(SignalingGatewayTest, ConnectionIdsAreUnique) {
    std::shared_ptr<RecordingSink> s1, s2;
    auto c1 = join("R1", s1);
    auto c2 = join("R2", s2);
    EXPECT_NE(c1, c2);
    EXPECT_EQ(c1.size(), 16u);
}

TEST_F(SignalingGatewayTest, ForwardsOfferToTargetOnly) {
    std::shared_ptr<RecordingSink> sa, sb, sc;
    auto a = join("R1", sa);
    auto b = join("R1", sb);
    join("R1", sc);
    sa->frames.clear();
    sb->frames.clear();
    sc->frames.clear();

    json offer = {{"type", "offer"}, {"target", b}, {"payload", {{"type", "offer"}, {"sdp", "v=0"}}}};
    gateway_.on_message(a, offer.dump());

    ASSERT_EQ(sb->frames.size(), 1u);
    EXPECT_EQ(sb->frames[0]["from"], a);
    EXPECT_EQ(sb->frames[0]["payload"]["sdp"], "v=0");
    EXPECT_TRUE(sa->frames.empty());
    EXPECT_TRUE(sc->frames.empty());
}

TEST_F(SignalingGatewayTest, BroadcastReachesOthersWithSenderId) {
    std::shared_ptr<RecordingSink> sa, sb, sc;
    auto a = join("R1", sa);
    join("R1", sb);
    join("R1", sc);
    sa->frames.clear();
    sb->frames.clear();
    sc->frames.clear();

    gateway_.on_message(a, R"({"type":"avatar-position","x":100,"y":200})");

    EXPECT_TRUE(sa->frames.empty());
    ASSERT_EQ(sb->frames.size(), 1u);
    ASSERT_EQ(sc->frames.size(), 1u);
    EXPECT_EQ(sb->frames[0]["userId"], a);
    EXPECT_EQ(sb->frames[0]["x"], 100);
}

TEST_F(SignalingGatewayTest, CloseNotifiesRemainingMembersOnce) {
    std::shared_ptr<RecordingSink> sa, sb;
    auto a = join("R1", sa);
    join("R1", sb);
    sb->frames.clear();

    gateway_.close(a);
    gateway_.close(a);

    ASSERT_EQ(sb->frames.size(), 1u);
    EXPECT_EQ(sb->frames[0]["type"], "user-left");
    EXPECT_EQ(sb->frames[0]["userId"], a);
    EXPECT_EQ(gateway_.stats().leaves, 1u);
    EXPECT_EQ(gateway_.connection_count(), 1u);
}

TEST_F(SignalingGatewayTest, OfferToDepartedPeerIsDroppedSilently) {
    std::shared_ptr<RecordingSink> sa, sb;
    auto a = join("R1", sa);
    auto b = join("R1", sb);
    gateway_.close(b);
    sa->frames.clear();

    json offer = {{"type", "offer"}, {"target", b}, {"payload", {{"sdp", "v=0"}}}};
    gateway_.on_message(a, offer.dump());

    EXPECT_TRUE(sa->frames.empty());
    EXPECT_EQ(gateway_.stats().dropped_target_missing, 1u);
    EXPECT_NE(gateway_.find_connection(a), nullptr);
}

TEST_F(SignalingGatewayTest, MalformedMessageKeepsConnection) {
    std::shared_ptr<RecordingSink> sa, sb;
    auto a = join("R1", sa);
    join("R1", sb);
    sb->frames.clear();

    gateway_.on_message(a, "{not json");
    gateway_.on_message(a, R"({"type":"avatar-position","x":"far","y":0})");
    gateway_.on_message(a, R"({"type":"user-left","userId":"someone"})");

    EXPECT_TRUE(sb->frames.empty());
    EXPECT_EQ(gateway_.stats().dropped_malformed, 3u);
    EXPECT_EQ(sa->close_calls, 0);
    EXPECT_NE(gateway_.find_connection(a), nullptr);
}

TEST_F(SignalingGatewayTest, RoomsAreIsolated) {
    std::shared_ptr<RecordingSink> s1, s2;
    auto a = join("R1", s1);
    join("R2", s2);
    s2->frames.clear();

    gateway_.on_message(a, R"({"type":"canvas-clear"})");
    gateway_.close(a);

    EXPECT_TRUE(s2->frames.empty());
}

TEST_F(SignalingGatewayTest, CanJoinHonorsRoomCap) {
    std::shared_ptr<RecordingSink> s1, s2;
    join("R1", s1);
    EXPECT_TRUE(gateway_.can_join("R1", 2));
    join("R1", s2);
    EXPECT_FALSE(gateway_.can_join("R1", 2));
    EXPECT_TRUE(gateway_.can_join("R1", 0));
    EXPECT_TRUE(gateway_.can_join("R2", 2));
}

TEST_F(SignalingGatewayTest, CloseAllClosesSinksWithoutNotifications) {
    std::shared_ptr<RecordingSink> s1, s2;
    join("R1", s1);
    join("R1", s2);
    s1->frames.clear();
    s2->frames.clear();

    gateway_.close_all();

    EXPECT_EQ(s1->close_calls, 1);
    EXPECT_EQ(s2->close_calls, 1);
    EXPECT_TRUE(s1->frames.empty());
    EXPECT_EQ(gateway_.connection_count(), 0u);
    EXPECT_EQ(registry_.room_count(), 0u);
}

TEST_F(SignalingGatewayTest, RoomsSnapshotCountsConnections) {
    std::shared_ptr<RecordingSink> s1, s2, s3;
    join("R1", s1);
    join("R1", s2);
    join("R2", s3);

    auto rooms = gateway_.rooms();
    ASSERT_EQ(rooms.size(), 2u);
    EXPECT_EQ(rooms[0].room_id, "R1");
    EXPECT_EQ(rooms[0].count, 2u);
    EXPECT_EQ(gateway_.room_info("R2").count, 1u);
}
