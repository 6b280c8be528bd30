// wataru.h
#ifndef WATARU_H
#define WATARU_H

#include <array>
#include <string>
#include <vector>

#include "board.h"
#include "move.h"
#include "record.h"
#include "errors.h"

/**
 * Remaining block inventory of one player. Length-3 blocks are unlimited
 * and are not tracked.
 */
struct PlayerBlocks {
    int size4 = 1;
    int size5 = 1;

    PlayerBlocks() = default;
    PlayerBlocks(int size4, int size5) : size4(size4), size5(size5) {}

    bool has_block(int size) const noexcept;
    bool use_block(int size) noexcept;
    void return_block(int size) noexcept;

    bool operator==(const PlayerBlocks& o) const { return size4 == o.size4 && size5 == o.size5; }
    bool operator!=(const PlayerBlocks& o) const { return !(*this == o); }
};

struct GameInfo {
    int current_player;
    int move_count;
    PlayerBlocks blocks_a;
    PlayerBlocks blocks_b;
    int winner;
    bool is_game_over;
    int legal_moves_count;
    int board_size;
};

/**
 * Full game state and rules engine. Mutated only by make_move and
 * undo_move; a refused call leaves every field unchanged.
 */
class Gamestate {
public:
    // Fresh game, player A to move.
    explicit Gamestate(int board_size = 18, int size4_blocks = 1, int size5_blocks = 1);

    Gamestate(const Gamestate& other) = default;
    Gamestate& operator=(const Gamestate& other) = default;
    Gamestate(Gamestate&&) noexcept = default;
    Gamestate& operator=(Gamestate&&) noexcept = default;

    // Public fields. Writing board, current_player or blocks directly bypasses
    // the legal-move cache: get_legal_moves() keeps returning the old list.
    // Go through make_move / undo_move, or build a new state with
    // from_position or copy_with_turn.
    Board board;
    int current_player;                 // PLAYER_A or PLAYER_B
    std::array<PlayerBlocks, 2> blocks; // indexed by player - 1
    std::vector<Move> move_history;
    int winner;                         // EMPTY while in progress

    int board_size() const noexcept { return board.size(); }

    PlayerBlocks& blocks_of(int player) { return blocks[player - 1]; }
    const PlayerBlocks& blocks_of(int player) const { return blocks[player - 1]; }

    // All legal moves for the side to move, one entry per distinct path.
    // Empty once the game is won.
    const std::vector<Move>& get_legal_moves() const;

    // Legal moves that touch (on or beside a cell) both the mover's
    // starting-edge group, or that edge itself, and its far-edge group, or
    // that edge. Only these can connect on the spot; order follows
    // get_legal_moves().
    std::vector<Move> connecting_candidates() const;

    // Frees the legal-move list; the next get_legal_moves() regenerates it.
    void clear_move_cache() const noexcept;
    std::size_t cached_move_count() const noexcept { return cached_legal_moves_.size(); }

    // Moves obtained by extending from one start cell in one direction.
    std::vector<Move> propose_moves(int row, int col, Direction dir) const;

    bool is_move_valid(const Move& move, std::string* reason = nullptr) const;

    // Throws IllegalMove.
    void make_move(const Move& move);

    // Throws NothingToUndo.
    void undo_move();

    bool is_terminal() const noexcept { return winner != EMPTY; }
    int get_winner() const noexcept { return winner; }
    bool is_stalemate() const;

    // Recomputes connectivity for both players without touching state.
    int check_winner() const;

    Gamestate copy() const;
    void reset();

    // Would this (legal) move connect the mover's edges? State is untouched.
    bool is_winning_move(const Move& move) const;

    // Copy with `player` to move and nothing else changed, for asking
    // "what could the opponent do from here".
    Gamestate copy_with_turn(int player) const;

    // Position set up directly rather than played from an empty board.
    // Such a game has no replayable record.
    static Gamestate from_position(const Board& board, int current_player,
                                   const PlayerBlocks& blocks_a = PlayerBlocks(),
                                   const PlayerBlocks& blocks_b = PlayerBlocks());

    // Throws std::logic_error for a game created by from_position.
    GameRecord export_record() const;
    // Replays through make_move; throws IllegalMove on a bad record and
    // RecordFormatError when the stated winner disagrees with the replay.
    static Gamestate from_record(const GameRecord& record);

    GameInfo get_game_info() const;
    std::string to_string() const;

private:
    int initial_size4_;
    int initial_size5_;
    bool custom_start_;

    mutable std::vector<Move> cached_legal_moves_;
    mutable bool legal_moves_dirty_;

    void _invalidate_caches() noexcept {
        cached_legal_moves_.clear();
        legal_moves_dirty_ = true;
    }
    void _extend_from(int row, int col, int start_layer, int dr, int dc, double timestamp,
                      std::vector<Move>& out) const;
    void _propose_into(int row, int col, Direction dir, double timestamp,
                       std::vector<Move>& out) const;
};

#endif // WATARU_H
