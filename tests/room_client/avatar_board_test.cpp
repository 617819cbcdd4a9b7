/**
 * @file avatar_board_test.cpp
 * @brief 头像位置同步测试
 */

#include "room_client/avatar_board.hpp"
#include "room_client/fakes.hpp"

#include <gtest/gtest.h>

#include <boost/asio/io_context.hpp>

#include <cmath>
#include <limits>

using namespace huddle::client;
using namespace huddle::client::testing;
using huddle::common::MessageType;
using huddle::common::SignalingMessage;

namespace {

SignalingMessage position(const std::string& user, double x, double y, int64_t ts = 0) {
    SignalingMessage msg;
    msg.type = MessageType::AVATAR_POSITION;
    msg.user_id = user;
    msg.x = x;
    msg.y = y;
    msg.timestamp = ts;
    return msg;
}

} // namespace

class AvatarBoardTest : public ::testing::Test {
protected:
    void SetUp() override {
        board_.set_layer(&layer_);
        board_.set_self_id("self");
    }

    boost::asio::io_context io_;
    std::vector<SignalingMessage> sent_;
    AvatarBoard board_{io_, 10, [this](const SignalingMessage& msg) {
        sent_.push_back(msg);
        return true;
    }};
    RecordingAvatarLayer layer_;
};

TEST_F(AvatarBoardTest, AddUsesInitialsAsDefaultLabel) {
    EXPECT_TRUE(board_.add_avatar("alice", 10, 20));
    auto info = board_.find("alice");
    ASSERT_TRUE(info);
    EXPECT_EQ(info->style.label, "AL");
    ASSERT_EQ(layer_.rendered.size(), 1u);

    AvatarStyle style;
    style.label = "B";
    style.color = "#00ff00";
    board_.add_avatar("bob", 0, 0, style);
    EXPECT_EQ(board_.find("bob")->style.color, "#00ff00");
}

TEST_F(AvatarBoardTest, RejectsNonFinitePositions) {
    EXPECT_FALSE(board_.add_avatar("x", std::nan(""), 0));
    EXPECT_FALSE(board_.move_local(0, std::numeric_limits<double>::infinity()));
    EXPECT_TRUE(sent_.empty());
}

TEST_F(AvatarBoardTest, FirstMoveIsSentImmediately) {
    EXPECT_TRUE(board_.move_local(100, 200));
    ASSERT_EQ(sent_.size(), 1u);
    EXPECT_EQ(sent_[0].type, MessageType::AVATAR_POSITION);
    EXPECT_DOUBLE_EQ(sent_[0].x, 100);
    EXPECT_NE(sent_[0].timestamp, 0);
    EXPECT_EQ(board_.find("self")->x, 100);
}

TEST_F(AvatarBoardTest, RapidMovesAreCoalescedToLatest) {
    board_.move_local(1, 1);
    board_.move_local(2, 2);
    board_.move_local(3, 3);

    EXPECT_EQ(sent_.size(), 1u);
    EXPECT_TRUE(board_.has_pending());
    // 本地头像立即更新
    EXPECT_EQ(board_.find("self")->x, 3);

    io_.run_for(std::chrono::milliseconds(300));

    ASSERT_EQ(sent_.size(), 2u);
    EXPECT_DOUBLE_EQ(sent_[1].x, 3);
    EXPECT_FALSE(board_.has_pending());
}

TEST_F(AvatarBoardTest, RemotePositionsCreateAndMoveAvatars) {
    board_.handle_message(position("peer", 5, 6, 1000));
    ASSERT_TRUE(board_.find("peer"));
    EXPECT_EQ(board_.find("peer")->y, 6);

    board_.handle_message(position("peer", 7, 8, 2000));
    EXPECT_EQ(board_.find("peer")->x, 7);
}

TEST_F(AvatarBoardTest, StalePositionsAreIgnored) {
    board_.handle_message(position("peer", 5, 5, 2000));
    board_.handle_message(position("peer", 1, 1, 1000));
    EXPECT_EQ(board_.find("peer")->x, 5);

    // 无时间戳的消息按到达顺序应用
    board_.handle_message(position("peer", 9, 9));
    EXPECT_EQ(board_.find("peer")->x, 9);
}

TEST_F(AvatarBoardTest, OwnEchoIsIgnored) {
    board_.handle_message(position("self", 50, 50));
    board_.handle_message(position("", 50, 50));
    EXPECT_EQ(board_.count(), 0u);
}

TEST_F(AvatarBoardTest, UserLeftRemovesAvatar) {
    board_.handle_message(position("peer", 1, 1));
    board_.handle_message(huddle::common::make_user_left("peer"));
    EXPECT_FALSE(board_.find("peer"));
    EXPECT_EQ(layer_.removed, (std::vector<std::string>{"peer"}));
}

TEST_F(AvatarBoardTest, ClearDropsPendingPosition) {
    board_.move_local(1, 1);
    board_.move_local(2, 2);
    board_.handle_message(position("peer", 1, 1));

    board_.clear();
    io_.run_for(std::chrono::milliseconds(200));

    EXPECT_EQ(sent_.size(), 1u);
    EXPECT_EQ(board_.count(), 0u);
    EXPECT_EQ(layer_.removed.size(), 2u);
}

TEST_F(AvatarBoardTest, RepeatedPositionLeavesAvatarInPlace) {
    board_.handle_message(position("peer", 12, 34, 1000));
    board_.handle_message(position("peer", 12, 34, 1000));

    ASSERT_EQ(board_.count(), 1u);
    auto info = board_.find("peer");
    ASSERT_TRUE(info);
    EXPECT_EQ(info->x, 12);
    EXPECT_EQ(info->y, 34);
    EXPECT_EQ(layer_.rendered.back().x, 12);
    EXPECT_EQ(layer_.rendered.back().y, 34);
}

TEST_F(AvatarBoardTest, RejectedFirstPositionCreatesNothing) {
    const double nan = std::numeric_limits<double>::quiet_NaN();
    board_.handle_message(position("peer", nan, 1, 1000));

    EXPECT_FALSE(board_.find("peer"));
    EXPECT_EQ(board_.count(), 0u);
    EXPECT_TRUE(layer_.rendered.empty());
}
