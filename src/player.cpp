// player.cpp
#include "player.h"
#include "debug.h"

MCTSPlayer::MCTSPlayer(const MCTSConfig& config)
    : mcts_(config) {
}

Move MCTSPlayer::choose_move(const Gamestate& state) {
    last_result_ = mcts_.search(state);
    return last_result_->move;
}

RandomPlayer::RandomPlayer(unsigned int seed)
    : rng_(seed != 0 ? seed : std::random_device{}()) {
}

Move RandomPlayer::choose_move(const Gamestate& state) {
    const auto& moves = state.get_legal_moves();
    if (moves.empty()) {
        throw NoLegalMoves("Player " + player_name(state.current_player) + " has no legal moves");
    }
    std::uniform_int_distribution<std::size_t> dist(0, moves.size() - 1);
    return moves[dist(rng_)];
}

int play_game(Player& first, Player& second, Gamestate& game, int max_moves) {
    int moves_played = 0;
    while (!game.is_terminal() && moves_played < max_moves) {
        if (game.is_stalemate()) {
            WATARU_DEBUG("Player " << player_name(game.current_player) << " has no legal moves, game undecided");
            break;
        }
        Player& mover = (game.current_player == PLAYER_A) ? first : second;
        Move move = mover.choose_move(game);
        game.make_move(move);
        moves_played++;
    }
    WATARU_DEBUG("Game finished after " << moves_played << " moves, winner " << player_name(game.get_winner()));
    return game.get_winner();
}
