// wataru.cpp
#include "wataru.h"
#include <chrono>
#include <sstream>
#include <stdexcept>

static double now_timestamp() {
    return std::chrono::duration<double>(std::chrono::system_clock::now().time_since_epoch()).count();
}

bool PlayerBlocks::has_block(int size) const noexcept {
    switch (size) {
        case 3: return true;  // unlimited
        case 4: return size4 > 0;
        case 5: return size5 > 0;
        default: return false;
    }
}

bool PlayerBlocks::use_block(int size) noexcept {
    if (!has_block(size)) {
        return false;
    }
    if (size == 4) size4--;
    else if (size == 5) size5--;
    return true;
}

void PlayerBlocks::return_block(int size) noexcept {
    if (size == 4) size4++;
    else if (size == 5) size5++;
}

Gamestate::Gamestate(int board_size, int size4_blocks, int size5_blocks)
    : board(board_size),
      current_player(PLAYER_A),
      blocks{PlayerBlocks(size4_blocks, size5_blocks), PlayerBlocks(size4_blocks, size5_blocks)},
      move_history(),
      winner(EMPTY),
      initial_size4_(size4_blocks),
      initial_size5_(size5_blocks),
      custom_start_(false),
      cached_legal_moves_(),
      legal_moves_dirty_(true) {
    if (size4_blocks < 0 || size5_blocks < 0) {
        throw std::invalid_argument("Block inventory cannot be negative");
    }
}

Gamestate Gamestate::from_position(const Board& board, int current_player,
                                   const PlayerBlocks& blocks_a, const PlayerBlocks& blocks_b) {
    if (current_player != PLAYER_A && current_player != PLAYER_B) {
        throw std::invalid_argument("current_player must be PLAYER_A or PLAYER_B");
    }
    Gamestate state(board.size(), blocks_a.size4, blocks_a.size5);
    state.board = board;
    state.current_player = current_player;
    state.blocks_of(PLAYER_A) = blocks_a;
    state.blocks_of(PLAYER_B) = blocks_b;
    state.custom_start_ = true;
    if (board.check_bridge(PLAYER_A)) {
        state.winner = PLAYER_A;
    } else if (board.check_bridge(PLAYER_B)) {
        state.winner = PLAYER_B;
    }
    return state;
}

// Create a deep copy
Gamestate Gamestate::copy() const {
    return Gamestate(*this);
}

bool Gamestate::is_winning_move(const Move& move) const {
    Board scratch = board;
    for (const auto& pos : move.path) {
        scratch.set_cell(pos.row, pos.col, pos.layer, move.player);
    }
    return scratch.check_bridge(move.player);
}

Gamestate Gamestate::copy_with_turn(int player) const {
    if (player != PLAYER_A && player != PLAYER_B) {
        throw std::invalid_argument("player must be PLAYER_A or PLAYER_B");
    }
    Gamestate other(*this);
    other.current_player = player;
    other._invalidate_caches();
    return other;
}

void Gamestate::reset() {
    board.reset();
    current_player = PLAYER_A;
    blocks_of(PLAYER_A) = PlayerBlocks(initial_size4_, initial_size5_);
    blocks_of(PLAYER_B) = PlayerBlocks(initial_size4_, initial_size5_);
    move_history.clear();
    winner = EMPTY;
    custom_start_ = false;
    _invalidate_caches();
}

// Walks from (row, col) one cell at a time. Every prefix of length 3 to 5
// that satisfies the mode's rules becomes a move; the walk stops at the
// first ineligible cell.
void Gamestate::_extend_from(int row, int col, int start_layer, int dr, int dc, double timestamp,
                             std::vector<Move>& out) const {
    const int player = current_player;
    const PlayerBlocks& inventory = blocks_of(player);

    std::vector<Position> path;
    path.reserve(MAX_BLOCK_SIZE);
    path.emplace_back(row, col, start_layer);

    int r = row;
    int c = col;
    for (int length = 1; length < MAX_BLOCK_SIZE; length++) {
        r += dr;
        c += dc;
        if (!board.is_valid_position(r, c)) {
            break;
        }
        if (board.secondary(r, c) != EMPTY) {
            break;
        }

        int p = board.primary(r, c);
        if (start_layer == LAYER_PRIMARY) {
            if (p != EMPTY) break;
        } else {
            if (p != EMPTY && p != player) break;
        }

        path.emplace_back(r, c, start_layer);

        if (static_cast<int>(path.size()) < MIN_BLOCK_SIZE) {
            continue;
        }
        // A bridge has to land on one of the mover's own stones.
        if (start_layer == LAYER_SECONDARY && p != player) {
            continue;
        }
        if (!inventory.has_block(static_cast<int>(path.size()))) {
            continue;
        }
        out.emplace_back(player, path, timestamp);
    }
}

// Start-cell rules: an occupied secondary layer or an opponent stone on the
// primary layer blocks the cell; an empty primary starts a primary-mode move,
// the mover's own stone starts a bridge.
void Gamestate::_propose_into(int row, int col, Direction dir, double timestamp,
                              std::vector<Move>& out) const {
    if (board.secondary(row, col) != EMPTY) {
        return;
    }

    int start_layer;
    int p = board.primary(row, col);
    if (p == EMPTY) {
        start_layer = LAYER_PRIMARY;
    } else if (p == current_player) {
        start_layer = LAYER_SECONDARY;
    } else {
        return;
    }

    const int d = static_cast<int>(dir);
    _extend_from(row, col, start_layer, DIRECTION_DELTAS[d][0], DIRECTION_DELTAS[d][1], timestamp, out);
}

std::vector<Move> Gamestate::propose_moves(int row, int col, Direction dir) const {
    std::vector<Move> moves;
    if (winner != EMPTY || !board.is_valid_position(row, col)) {
        return moves;
    }
    _propose_into(row, col, dir, now_timestamp(), moves);
    return moves;
}

// Only right and down are scanned: a left or upward path is the reversal of
// a right or downward one and the placement rules are symmetric in its ends.
const std::vector<Move>& Gamestate::get_legal_moves() const {
    if (!legal_moves_dirty_) {
        return cached_legal_moves_;
    }

    cached_legal_moves_.clear();
    if (winner == EMPTY) {
        const double ts = now_timestamp();
        const int n = board.size();
        for (int row = 0; row < n; row++) {
            for (int col = 0; col < n; col++) {
                _propose_into(row, col, Direction::Right, ts, cached_legal_moves_);
                _propose_into(row, col, Direction::Down, ts, cached_legal_moves_);
            }
        }
    }

    legal_moves_dirty_ = false;
    return cached_legal_moves_;
}

void Gamestate::clear_move_cache() const noexcept {
    std::vector<Move>().swap(cached_legal_moves_);
    legal_moves_dirty_ = true;
}

std::vector<Move> Gamestate::connecting_candidates() const {
    std::vector<Move> candidates;
    const auto& legal = get_legal_moves();
    if (legal.empty()) {
        return candidates;
    }

    const int player = current_player;
    const int n = board.size();
    const std::vector<char> near_group = board.edge_group(player, false);
    const std::vector<char> far_group = board.edge_group(player, true);

    auto reaches = [&](const Move& move, const std::vector<char>& group, int edge_line) {
        for (const auto& pos : move.path) {
            if (((player == PLAYER_A) ? pos.row : pos.col) == edge_line) return true;
            if (group[pos.row * n + pos.col]) return true;
            for (int d = 0; d < 4; d++) {
                int r = pos.row + DIRECTION_DELTAS[d][0];
                int c = pos.col + DIRECTION_DELTAS[d][1];
                if (board.is_valid_position(r, c) && group[r * n + c]) return true;
            }
        }
        return false;
    };

    for (const auto& move : legal) {
        if (reaches(move, near_group, 0) && reaches(move, far_group, n - 1)) {
            candidates.push_back(move);
        }
    }
    return candidates;
}

bool Gamestate::is_move_valid(const Move& move, std::string* reason) const {
    auto refuse = [reason](const std::string& msg) {
        if (reason) *reason = msg;
        return false;
    };

    if (winner != EMPTY) {
        return refuse("Game is already over");
    }
    if (move.player != current_player) {
        return refuse("Not player " + player_name(move.player) + "'s turn");
    }

    std::string path_error;
    if (!move.validate_path(&path_error)) {
        return refuse("Invalid path: " + path_error);
    }

    const int size = move.block_size();
    if (!blocks_of(move.player).has_block(size)) {
        return refuse("No " + std::to_string(size) + "-size blocks available");
    }

    auto where = [](const Position& pos) {
        return " at (" + std::to_string(pos.row) + "," + std::to_string(pos.col) + ")";
    };

    const bool bridge = move.is_bridge_mode();
    for (const auto& pos : move.path) {
        if (!board.is_valid_position(pos.row, pos.col)) {
            return refuse("Position out of bounds" + where(pos));
        }

        const int p = board.primary(pos.row, pos.col);
        if (board.secondary(pos.row, pos.col) != EMPTY) {
            return refuse("Layer 2 already occupied" + where(pos));
        }
        if (!bridge && p != EMPTY) {
            return refuse("Layer 1 not empty" + where(pos));
        }
        if (bridge && p != EMPTY && p != move.player) {
            return refuse("Cannot place on opponent's color" + where(pos));
        }
    }

    if (bridge) {
        const Position& s = move.start_position();
        const Position& e = move.end_position();
        if (board.primary(s.row, s.col) != move.player || board.primary(e.row, e.col) != move.player) {
            return refuse("Bridge mode: both ends must be on existing player tiles");
        }
    }

    return true;
}

void Gamestate::make_move(const Move& move) {
    std::string reason;
    if (!is_move_valid(move, &reason)) {
        throw IllegalMove(reason);
    }

    blocks_of(move.player).use_block(move.block_size());

    for (const auto& pos : move.path) {
        board.set_cell(pos.row, pos.col, pos.layer, move.player);
    }
    move_history.push_back(move);

    if (board.check_bridge(move.player)) {
        winner = move.player;
    } else {
        current_player = opponent(current_player);
    }

    _invalidate_caches();
}

void Gamestate::undo_move() {
    if (move_history.empty()) {
        throw NothingToUndo();
    }

    Move last = std::move(move_history.back());
    move_history.pop_back();

    for (const auto& pos : last.path) {
        board.set_cell(pos.row, pos.col, pos.layer, EMPTY);
    }
    blocks_of(last.player).return_block(last.block_size());

    // Play stops at a win, so any winner was produced by this move.
    current_player = last.player;
    winner = EMPTY;

    _invalidate_caches();
}

bool Gamestate::is_stalemate() const {
    return winner == EMPTY && get_legal_moves().empty();
}

int Gamestate::check_winner() const {
    if (winner != EMPTY) {
        return winner;
    }
    if (board.check_bridge(PLAYER_A)) return PLAYER_A;
    if (board.check_bridge(PLAYER_B)) return PLAYER_B;
    return EMPTY;
}

GameRecord Gamestate::export_record() const {
    if (custom_start_) {
        throw std::logic_error("Game was set up from a position and has no replayable record");
    }
    GameRecord record;
    record.board_size = board.size();
    record.initial_size4 = initial_size4_;
    record.initial_size5 = initial_size5_;
    record.moves = move_history;
    record.winner = winner;
    return record;
}

Gamestate Gamestate::from_record(const GameRecord& record) {
    Gamestate game(record.board_size, record.initial_size4, record.initial_size5);
    for (const auto& move : record.moves) {
        game.make_move(move);
    }
    if (game.winner != record.winner) {
        throw RecordFormatError("record states winner " + player_name(record.winner)
                                + " but its moves give " + player_name(game.winner));
    }
    return game;
}

GameInfo Gamestate::get_game_info() const {
    GameInfo info;
    info.current_player = current_player;
    info.move_count = static_cast<int>(move_history.size());
    info.blocks_a = blocks_of(PLAYER_A);
    info.blocks_b = blocks_of(PLAYER_B);
    info.winner = winner;
    info.is_game_over = is_terminal();
    info.legal_moves_count = static_cast<int>(get_legal_moves().size());
    info.board_size = board.size();
    return info;
}

std::string Gamestate::to_string() const {
    std::ostringstream oss;
    oss << "Gamestate(current_player=" << player_name(current_player)
        << ", moves=" << move_history.size()
        << ", winner=" << player_name(winner)
        << ", blocks A=" << blocks_of(PLAYER_A).size4 << "/" << blocks_of(PLAYER_A).size5
        << " B=" << blocks_of(PLAYER_B).size4 << "/" << blocks_of(PLAYER_B).size5
        << ")\n"
        << board.to_string();
    return oss.str();
}
