#pragma once

#include <initializer_list>
#include <vector>

#include "wataru.h"

// Straight run of `length` cells from (row, col), all on `layer`.
inline Move line_move(int player, int row, int col, Direction dir, int length, int layer = LAYER_PRIMARY) {
    std::vector<Position> path;
    const int d = static_cast<int>(dir);
    for (int i = 0; i < length; i++) {
        path.emplace_back(row + i * DIRECTION_DELTAS[d][0], col + i * DIRECTION_DELTAS[d][1], layer);
    }
    return Move(player, path);
}

inline Board board_with(int size, std::initializer_list<std::vector<int>> primaries) {
    Board board(size);
    for (const auto& cell : primaries) {
        board.set_cell(cell[0], cell[1], LAYER_PRIMARY, cell[2]);
    }
    return board;
}

// Every cell holds a primary stone, colours alternating like a chessboard.
// Nobody is connected and nobody can move.
inline Board checkerboard(int size) {
    Board board(size);
    for (int r = 0; r < size; r++) {
        for (int c = 0; c < size; c++) {
            board.set_cell(r, c, LAYER_PRIMARY, (r + c) % 2 == 0 ? PLAYER_A : PLAYER_B);
        }
    }
    return board;
}

inline bool contains_move(const std::vector<Move>& moves, const Move& move) {
    for (const auto& m : moves) {
        if (m == move) return true;
    }
    return false;
}
