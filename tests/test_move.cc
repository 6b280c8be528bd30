#include <gtest/gtest.h>
#include <string>

#include "move.h"
#include "test_helpers.h"

TEST(MoveTest, StraightRunsAreValid) {
    EXPECT_TRUE(line_move(PLAYER_A, 0, 0, Direction::Right, 3).validate_path());
    EXPECT_TRUE(line_move(PLAYER_B, 2, 4, Direction::Down, 5).validate_path());
    EXPECT_TRUE(line_move(PLAYER_A, 4, 4, Direction::Left, 4, LAYER_SECONDARY).validate_path());
    EXPECT_TRUE(line_move(PLAYER_B, 4, 1, Direction::Up, 3).validate_path());
}

TEST(MoveTest, LengthOutsideThreeToFiveIsRejected) {
    std::string reason;
    EXPECT_FALSE(line_move(PLAYER_A, 0, 0, Direction::Right, 2).validate_path(&reason));
    EXPECT_NE(reason.find("between 3 and 5"), std::string::npos);
    EXPECT_FALSE(line_move(PLAYER_A, 0, 0, Direction::Right, 6).validate_path());
    EXPECT_FALSE(Move(PLAYER_A, {}).validate_path());
}

TEST(MoveTest, GapsAndBendsAreRejected) {
    std::string reason;
    Move gap(PLAYER_A, {{0, 0, 0}, {0, 1, 0}, {0, 3, 0}});
    EXPECT_FALSE(gap.validate_path(&reason));
    EXPECT_EQ(reason, "path is not continuous");

    Move bent(PLAYER_A, {{0, 0, 0}, {0, 1, 0}, {1, 1, 0}});
    EXPECT_FALSE(bent.validate_path(&reason));
    EXPECT_EQ(reason, "path is not straight");

    Move diagonal(PLAYER_A, {{0, 0, 0}, {1, 1, 0}, {2, 2, 0}});
    EXPECT_FALSE(diagonal.validate_path());
}

TEST(MoveTest, RepeatedCellIsRejected) {
    std::string reason;
    Move back_and_forth(PLAYER_B, {{0, 0, 0}, {0, 1, 0}, {0, 0, 0}});
    EXPECT_FALSE(back_and_forth.validate_path(&reason));
    EXPECT_EQ(reason, "path visits a cell twice");
}

TEST(MoveTest, MixedLayersAreRejected) {
    Move mixed(PLAYER_A, {{0, 0, 1}, {0, 1, 0}, {0, 2, 1}});
    EXPECT_FALSE(mixed.validate_path());

    Move bad_layer(PLAYER_A, {{0, 0, 2}, {0, 1, 2}, {0, 2, 2}});
    EXPECT_FALSE(bad_layer.validate_path());
}

TEST(MoveTest, UnknownPlayerIsRejected) {
    Move move = line_move(PLAYER_A, 0, 0, Direction::Right, 3);
    move.player = EMPTY;
    EXPECT_FALSE(move.validate_path());
    move.player = 3;
    EXPECT_FALSE(move.validate_path());
}

TEST(MoveTest, Accessors) {
    Move move = line_move(PLAYER_B, 1, 3, Direction::Down, 4, LAYER_SECONDARY);
    EXPECT_EQ(move.block_size(), 4);
    EXPECT_TRUE(move.is_bridge_mode());
    EXPECT_EQ(move.direction(), "vertical");
    EXPECT_EQ(move.start_position(), Position(1, 3, LAYER_SECONDARY));
    EXPECT_EQ(move.end_position(), Position(4, 3, LAYER_SECONDARY));
    EXPECT_TRUE(move.touches(2, 3));
    EXPECT_FALSE(move.touches(2, 2));

    Move flat = line_move(PLAYER_A, 0, 0, Direction::Right, 3);
    EXPECT_FALSE(flat.is_bridge_mode());
    EXPECT_EQ(flat.direction(), "horizontal");
    EXPECT_EQ(Move().direction(), "none");
}

TEST(MoveTest, EqualityIgnoresTimestamp) {
    Move a = line_move(PLAYER_A, 0, 0, Direction::Right, 3);
    Move b = Move::create(PLAYER_A, a.path);
    EXPECT_GT(b.timestamp, 0.0);
    EXPECT_EQ(a, b);

    Move other_player = b;
    other_player.player = PLAYER_B;
    EXPECT_NE(a, other_player);

    // Same cells walked the other way is a different path.
    Move reversed = line_move(PLAYER_A, 0, 2, Direction::Left, 3);
    EXPECT_NE(a, reversed);
}

TEST(MoveTest, ToStringNamesPlayerAndMode) {
    Move move = line_move(PLAYER_B, 0, 0, Direction::Right, 5, LAYER_SECONDARY);
    std::string text = move.to_string();
    EXPECT_NE(text.find("Move(B"), std::string::npos);
    EXPECT_NE(text.find("size=5"), std::string::npos);
    EXPECT_NE(text.find("bridge"), std::string::npos);
    EXPECT_EQ(player_name(EMPTY), "-");
}
