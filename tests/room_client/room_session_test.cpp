/**
 * @file room_session_test.cpp
 * @brief 房间会话测试（消息分发与离开清理）
 */

#include "room_client/room_session.hpp"
#include "room_client/fakes.hpp"

#include <gtest/gtest.h>

#include <boost/asio/io_context.hpp>

using namespace huddle::client;
using namespace huddle::client::testing;
using nlohmann::json;

class RoomSessionTest : public ::testing::Test {
protected:
    void join_as(const std::string& self, std::vector<std::string> members = {}) {
        ASSERT_TRUE(session_.initialize("R1"));
        transport_.open();
        transport_.deliver({{"type", "room-members"}, {"self", self}, {"members", members}});
    }

    boost::asio::io_context io_;
    ClientConfig config_;
    FakeSignalingTransport transport_;
    FakePeerTransportFactory factory_;
    FakeMediaDevices devices_;
    RecordingSurface surface_;
    RoomSession session_{io_, transport_, factory_, devices_, surface_, config_};
};

TEST_F(RoomSessionTest, InitializeConnectsOnce) {
    EXPECT_TRUE(session_.initialize("R1"));
    EXPECT_FALSE(session_.initialize("R2"));
    EXPECT_EQ(transport_.connect_calls, 1);
    EXPECT_EQ(transport_.connected_room, "R1");
    EXPECT_EQ(session_.state(), RoomState::CONNECTING);
}

TEST_F(RoomSessionTest, RoomMembersJoinsAndStartsNegotiation) {
    join_as("b", {"a", "c"});

    EXPECT_EQ(session_.state(), RoomState::JOINED);
    EXPECT_EQ(session_.self_id(), "b");
    EXPECT_EQ(session_.peers().peer_count(), 2u);

    auto offers = transport_.sent_of("offer");
    ASSERT_EQ(offers.size(), 1u);
    EXPECT_EQ(offers[0]["target"], "c");
}

TEST_F(RoomSessionTest, SignalingIsRoutedToPeers) {
    join_as("b", {"a"});
    transport_.deliver({{"type", "offer"}, {"target", "b"}, {"from", "a"},
                        {"payload", {{"type", "offer"}, {"sdp", "v=0"}}}});

    auto answers = transport_.sent_of("answer");
    ASSERT_EQ(answers.size(), 1u);
    EXPECT_EQ(answers[0]["target"], "a");
    EXPECT_EQ(answers[0]["payload"]["type"], "answer");
}

TEST_F(RoomSessionTest, CollaborationMessagesReachBoards) {
    join_as("b", {"a"});
    transport_.deliver({{"type", "avatar-position"}, {"userId", "a"}, {"x", 3}, {"y", 4}});
    transport_.deliver({{"type", "canvas-draw"}, {"userId", "a"}, {"tool", "pen"}, {"color", "#000"},
                        {"from", {{"x", 0}, {"y", 0}}}, {"to", {{"x", 0.5}, {"y", 0.5}}}});

    ASSERT_TRUE(session_.avatars().find("a"));
    EXPECT_EQ(session_.avatars().find("a")->x, 3);
    EXPECT_EQ(surface_.strokes.size(), 1u);

    transport_.deliver({{"type", "user-left"}, {"userId", "a"}});
    EXPECT_FALSE(session_.avatars().find("a"));
    EXPECT_EQ(session_.peers().peer_count(), 0u);
}

TEST_F(RoomSessionTest, PresenterUpdates) {
    std::vector<std::string> seen;
    session_.set_on_presenter([&](const std::string& id) { seen.push_back(id); });
    join_as("b", {"a"});

    EXPECT_TRUE(session_.set_presenter("b"));
    ASSERT_EQ(transport_.sent_of("set-presenter").size(), 1u);
    EXPECT_EQ(transport_.sent_of("set-presenter")[0]["presenterId"], "b");

    transport_.deliver({{"type", "set-presenter"}, {"userId", "a"}, {"presenterId", "a"}});
    EXPECT_EQ(session_.presenter_id(), "a");
    EXPECT_EQ(seen, (std::vector<std::string>{"b", "a"}));
}

TEST_F(RoomSessionTest, MalformedFramesAreIgnored) {
    join_as("b");
    transport_.deliver(json("not an object"));
    transport_.deliver({{"type", "mystery"}});
    EXPECT_EQ(session_.state(), RoomState::JOINED);
}

TEST_F(RoomSessionTest, LeaveStopsMediaAndClosesPeers) {
    join_as("a", {"b"});
    ASSERT_TRUE(session_.start_local_media().ok());
    ASSERT_TRUE(session_.start_screen_share().ok());

    std::vector<std::string> reasons;
    session_.set_on_left([&](const std::string& reason) { reasons.push_back(reason); });

    EXPECT_TRUE(session_.leave());
    EXPECT_FALSE(session_.leave());

    EXPECT_EQ(session_.state(), RoomState::LEFT);
    EXPECT_EQ(transport_.close_calls, 1);
    EXPECT_EQ(session_.peers().peer_count(), 0u);
    for (const auto& track : devices_.opened) {
        EXPECT_TRUE(track->stopped()) << track->id();
    }
    for (const auto& record : factory_.records) {
        EXPECT_TRUE(record->closed);
    }
    EXPECT_EQ(reasons, (std::vector<std::string>{"left"}));
}

TEST_F(RoomSessionTest, ConnectionLossRunsLeaveCleanup) {
    join_as("a", {"b"});
    session_.start_local_media();

    transport_.drop("connection reset");

    EXPECT_EQ(session_.state(), RoomState::LEFT);
    EXPECT_EQ(session_.peers().peer_count(), 0u);
    EXPECT_FALSE(session_.media().controls_enabled());
    EXPECT_FALSE(session_.leave());
}

TEST_F(RoomSessionTest, NothingIsSentAfterLeaving) {
    join_as("a");
    session_.leave();
    size_t before = transport_.sent.size();

    EXPECT_FALSE(session_.update_avatar(1, 1));
    EXPECT_FALSE(session_.clear_canvas());
    EXPECT_FALSE(session_.set_presenter("a"));
    EXPECT_FALSE(session_.start_local_media().ok());
    EXPECT_EQ(transport_.sent.size(), before);
}

TEST_F(RoomSessionTest, AvatarMovesAreBroadcast) {
    join_as("a", {"b"});
    EXPECT_TRUE(session_.update_avatar(10, 20));
    auto positions = transport_.sent_of("avatar-position");
    ASSERT_EQ(positions.size(), 1u);
    EXPECT_EQ(positions[0]["x"], 10.0);
    EXPECT_FALSE(positions[0].contains("userId"));
}

TEST_F(RoomSessionTest, CanvasDefaultsComeFromConfig) {
    ClientConfig config;
    config.canvas.tool = "line";
    config.canvas.color = "#123456";
    config.canvas.line_width = 5;
    FakeSignalingTransport transport;
    RoomSession session(io_, transport, factory_, devices_, surface_, config);

    EXPECT_EQ(session.canvas().tool(), DrawTool::LINE);
    EXPECT_EQ(session.canvas().color(), "#123456");
    EXPECT_DOUBLE_EQ(session.canvas().line_width(), 5);
}
