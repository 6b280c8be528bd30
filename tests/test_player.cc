#include <gtest/gtest.h>

#include "player.h"
#include "test_helpers.h"

TEST(PlayerTest, RandomPlayerPicksLegalMoves) {
    Gamestate game(6);
    RandomPlayer player(12);
    for (int i = 0; i < 5 && !game.is_terminal(); i++) {
        Move move = player.choose_move(game);
        EXPECT_TRUE(game.is_move_valid(move)) << move.to_string();
        game.make_move(move);
    }
    EXPECT_EQ(player.name(), "random");
}

TEST(PlayerTest, RandomPlayerWithoutMovesThrows) {
    RandomPlayer player(1);
    Gamestate stuck = Gamestate::from_position(checkerboard(4), PLAYER_A);
    EXPECT_THROW(player.choose_move(stuck), NoLegalMoves);
}

TEST(PlayerTest, RandomGamesEndWithConnectedWinner) {
    for (unsigned seed = 1; seed <= 4; seed++) {
        Gamestate game(6);
        RandomPlayer first(seed);
        RandomPlayer second(seed * 31);
        int winner = play_game(first, second, game);

        EXPECT_EQ(winner, game.get_winner());
        if (winner != EMPTY) {
            EXPECT_TRUE(game.board.check_bridge(winner));
            EXPECT_EQ(game.move_history.back().player, winner);
        } else {
            EXPECT_TRUE(game.is_stalemate());
        }
    }
}

TEST(PlayerTest, MoveCapStopsTheGame) {
    Gamestate game(8);
    RandomPlayer first(2);
    RandomPlayer second(3);
    EXPECT_EQ(play_game(first, second, game, 2), EMPTY);
    EXPECT_EQ(game.move_history.size(), 2u);
}

TEST(PlayerTest, StuckPositionEndsUndecided) {
    Gamestate stuck = Gamestate::from_position(checkerboard(4), PLAYER_A);
    RandomPlayer first(1);
    RandomPlayer second(2);
    EXPECT_EQ(play_game(first, second, stuck), EMPTY);
    EXPECT_TRUE(stuck.move_history.empty());
}

TEST(PlayerTest, MCTSPlayerKeepsLastResult) {
    MCTSConfig config;
    config.max_simulations = 15;
    config.seed = 21;
    MCTSPlayer player(config);
    EXPECT_FALSE(player.last_result().has_value());

    Gamestate game(6);
    Move move = player.choose_move(game);
    ASSERT_TRUE(player.last_result().has_value());
    EXPECT_EQ(player.last_result()->move, move);
    EXPECT_EQ(player.last_result()->simulations, 15);
    EXPECT_TRUE(game.is_move_valid(move));
    EXPECT_EQ(player.name(), "mcts");
}

TEST(PlayerTest, MCTSPlayerBeatsOneMoveFromVictory) {
    // A's column 0 is complete except the last cell; a bridge or a fresh
    // column wins on the spot.
    Board board = board_with(5, {{0, 0, PLAYER_A}, {1, 0, PLAYER_A}, {2, 0, PLAYER_A}, {3, 0, PLAYER_A}});
    Gamestate game = Gamestate::from_position(board, PLAYER_A);

    MCTSConfig config;
    config.max_simulations = 10;
    config.seed = 4;
    MCTSPlayer mcts_player(config);
    RandomPlayer random_player(4);

    EXPECT_EQ(play_game(mcts_player, random_player, game), PLAYER_A);
    EXPECT_EQ(game.move_history.size(), 1u);
}
