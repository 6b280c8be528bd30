// move.h
#ifndef MOVE_H
#define MOVE_H

#include <vector>
#include <string>
#include <utility>

#include "board.h"

// Axis directions a move may be extended in.
enum class Direction { Right = 0, Down = 1, Left = 2, Up = 3 };

const int DIRECTION_DELTAS[4][2] = {{0, 1}, {1, 0}, {0, -1}, {-1, 0}};

struct Position {
    int row = 0;
    int col = 0;
    int layer = LAYER_PRIMARY;

    Position() = default;
    Position(int row, int col, int layer) : row(row), col(col), layer(layer) {}

    bool operator==(const Position& o) const {
        return row == o.row && col == o.col && layer == o.layer;
    }
    bool operator!=(const Position& o) const { return !(*this == o); }
};

const int MIN_BLOCK_SIZE = 3;
const int MAX_BLOCK_SIZE = 5;

/**
 * A straight run of 3 to 5 cells placed by one player. The timestamp only
 * orders history entries and never takes part in comparison or legality.
 */
struct Move {
    int player = PLAYER_A;
    std::vector<Position> path;
    double timestamp = 0.0;

    Move() = default;
    Move(int player, std::vector<Position> path, double timestamp = 0.0)
        : player(player), path(std::move(path)), timestamp(timestamp) {}

    // Stamps the move with the current wall-clock time.
    static Move create(int player, std::vector<Position> path);

    int block_size() const noexcept { return static_cast<int>(path.size()); }

    // Bridge moves write every cell on the secondary layer.
    bool is_bridge_mode() const noexcept {
        return !path.empty() && path.front().layer == LAYER_SECONDARY;
    }

    const Position& start_position() const { return path.front(); }
    const Position& end_position() const { return path.back(); }

    // "horizontal", "vertical", "none" or "invalid".
    std::string direction() const;

    // Structural check only: length, straightness, unit steps, no repeats,
    // single target layer. Board contents are not consulted.
    bool validate_path(std::string* reason = nullptr) const;

    bool touches(int row, int col) const noexcept;

    std::string to_string() const;

    bool operator==(const Move& o) const { return player == o.player && path == o.path; }
    bool operator!=(const Move& o) const { return !(*this == o); }
};

std::string player_name(int player);

#endif // MOVE_H
