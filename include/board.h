// board.h
#ifndef BOARD_H
#define BOARD_H

#include <vector>
#include <string>
#include <utility>
#include <cstdint>

// Cell values
const int EMPTY = 0;
const int PLAYER_A = 1;    // connects row 0 to row N-1
const int PLAYER_B = 2;    // connects column 0 to column N-1

// Layers
const int LAYER_PRIMARY = 0;
const int LAYER_SECONDARY = 1;

inline int opponent(int player) noexcept {
    return 3 - player;
}

struct TileCount {
    int primary = 0;
    int secondary = 0;
    int total = 0;
};

/**
 * Square grid where every cell has a primary and a secondary slot.
 * Copying a Board is a full value copy; nothing is shared between copies.
 */
class Board {
public:
    explicit Board(int board_size = 18);

    int size() const noexcept { return board_size_; }

    bool is_valid_position(int row, int col) const noexcept;

    // Throws std::out_of_range outside the grid.
    std::pair<int, int> get_cell(int row, int col) const;
    int get(int row, int col, int layer) const;

    // Unchecked fast paths for move generation and flood fill.
    int primary(int row, int col) const noexcept { return cells_[index(row, col)]; }
    int secondary(int row, int col) const noexcept { return cells_[index(row, col) + 1]; }

    // Throws std::out_of_range / std::invalid_argument on bad input.
    void set_cell(int row, int col, int layer, int value);

    bool is_empty(int row, int col, int layer) const noexcept;
    bool has_player_color(int row, int col, int player) const noexcept;
    bool can_place_primary(int row, int col) const noexcept;
    bool can_place_secondary(int row, int col, int player) const noexcept;

    // True when the player's cells (either layer) join its two goal edges.
    bool check_bridge(int player) const;

    // Cells of `player` connected to its starting edge (row 0 for A, column 0
    // for B), or to its far edge when `far_edge` is set. Indexed row * size + col.
    std::vector<char> edge_group(int player, bool far_edge) const;

    Board clone() const;
    void reset();

    TileCount count_tiles(int player) const;

    // Planes: A primary, A secondary, B primary, B secondary.
    std::vector<std::vector<std::vector<float>>> to_tensor() const;

    // Nested [row][col][layer] form used on the wire.
    std::vector<std::vector<std::vector<int>>> get_board() const;
    static Board from_board(const std::vector<std::vector<std::vector<int>>>& cells);

    std::string to_string() const;

    bool operator==(const Board& other) const;
    bool operator!=(const Board& other) const { return !(*this == other); }

private:
    int board_size_;
    std::vector<int8_t> cells_;  // (row * size + col) * 2 + layer

    std::size_t index(int row, int col) const noexcept {
        return (static_cast<std::size_t>(row) * board_size_ + col) * 2;
    }

    void check_position(int row, int col) const;

    bool flood_from_edge(int player, bool far_edge, bool stop_on_reach,
                         std::vector<char>& visited) const;
};

#endif // BOARD_H
