#pragma once

#include <memory>
#include <optional>
#include <random>
#include <string>

#include "mcts.h"
#include "wataru.h"

/**
 * Anything that can pick a move for the side to move. Search-based and
 * learned players plug in behind the same call.
 */
class Player {
public:
    virtual ~Player() = default;

    // Must return a move legal in `state`; throws NoLegalMoves if none exists.
    virtual Move choose_move(const Gamestate& state) = 0;
    virtual std::string name() const = 0;
};

class MCTSPlayer : public Player {
public:
    explicit MCTSPlayer(const MCTSConfig& config = MCTSConfig());

    Move choose_move(const Gamestate& state) override;
    std::string name() const override { return "mcts"; }

    const std::optional<SearchResult>& last_result() const noexcept { return last_result_; }

private:
    MCTS mcts_;
    std::optional<SearchResult> last_result_;
};

// Uniform choice among the legal moves.
class RandomPlayer : public Player {
public:
    explicit RandomPlayer(unsigned int seed = 0);

    Move choose_move(const Gamestate& state) override;
    std::string name() const override { return "random"; }

private:
    std::mt19937 rng_;
};

/**
 * Alternates `first` (player A) and `second` (player B) on `game` until
 * someone wins, the side to move is stuck, or `max_moves` moves were made.
 * Returns the winner, EMPTY when undecided.
 */
int play_game(Player& first, Player& second, Gamestate& game, int max_moves = 500);
