// board.cpp
#include "board.h"
#include <algorithm>
#include <stdexcept>
#include <sstream>

Board::Board(int board_size)
    : board_size_(board_size) {
    if (board_size <= 0) {
        throw std::invalid_argument("Board size must be positive, got " + std::to_string(board_size));
    }
    cells_.assign(static_cast<std::size_t>(board_size) * board_size * 2, EMPTY);
}

bool Board::is_valid_position(int row, int col) const noexcept {
    return row >= 0 && row < board_size_ && col >= 0 && col < board_size_;
}

void Board::check_position(int row, int col) const {
    if (!is_valid_position(row, col)) {
        std::ostringstream oss;
        oss << "Invalid position: (" << row << ", " << col << ")";
        throw std::out_of_range(oss.str());
    }
}

std::pair<int, int> Board::get_cell(int row, int col) const {
    check_position(row, col);
    return {primary(row, col), secondary(row, col)};
}

int Board::get(int row, int col, int layer) const {
    check_position(row, col);
    if (layer != LAYER_PRIMARY && layer != LAYER_SECONDARY) {
        throw std::invalid_argument("Invalid layer: " + std::to_string(layer));
    }
    return cells_[index(row, col) + layer];
}

void Board::set_cell(int row, int col, int layer, int value) {
    check_position(row, col);
    if (layer != LAYER_PRIMARY && layer != LAYER_SECONDARY) {
        throw std::invalid_argument("Invalid layer: " + std::to_string(layer));
    }
    if (value != EMPTY && value != PLAYER_A && value != PLAYER_B) {
        throw std::invalid_argument("Invalid cell value: " + std::to_string(value));
    }
    cells_[index(row, col) + layer] = static_cast<int8_t>(value);
}

bool Board::is_empty(int row, int col, int layer) const noexcept {
    if (!is_valid_position(row, col) || (layer != LAYER_PRIMARY && layer != LAYER_SECONDARY)) {
        return false;
    }
    return cells_[index(row, col) + layer] == EMPTY;
}

bool Board::has_player_color(int row, int col, int player) const noexcept {
    if (!is_valid_position(row, col)) {
        return false;
    }
    return primary(row, col) == player || secondary(row, col) == player;
}

bool Board::can_place_primary(int row, int col) const noexcept {
    if (!is_valid_position(row, col)) {
        return false;
    }
    return primary(row, col) == EMPTY && secondary(row, col) == EMPTY;
}

bool Board::can_place_secondary(int row, int col, int player) const noexcept {
    if (!is_valid_position(row, col)) {
        return false;
    }
    if (secondary(row, col) != EMPTY) {
        return false;
    }
    int p = primary(row, col);
    return p == EMPTY || p == player;
}

// Depth-first flood fill from one of the player's edges. A runs between
// row 0 and the last row, B between column 0 and the last column. Returns
// whether the opposite edge was reached; with `stop_on_reach` the fill ends
// there and `visited` is partial.
bool Board::flood_from_edge(int player, bool far_edge, bool stop_on_reach,
                            std::vector<char>& visited) const {
    const int n = board_size_;
    const int seed_line = far_edge ? n - 1 : 0;
    const int target_line = far_edge ? 0 : n - 1;

    visited.assign(static_cast<std::size_t>(n) * n, 0);
    std::vector<int> stack;
    stack.reserve(n * 2);

    for (int i = 0; i < n; i++) {
        int row = (player == PLAYER_A) ? seed_line : i;
        int col = (player == PLAYER_A) ? i : seed_line;
        if (has_player_color(row, col, player)) {
            visited[row * n + col] = 1;
            stack.push_back(row * n + col);
        }
    }

    static const int dr[4] = {1, -1, 0, 0};
    static const int dc[4] = {0, 0, 1, -1};

    bool reached = false;
    while (!stack.empty()) {
        int cell = stack.back();
        stack.pop_back();
        int row = cell / n;
        int col = cell % n;

        if (((player == PLAYER_A) ? row : col) == target_line) {
            reached = true;
            if (stop_on_reach) return true;
        }

        for (int d = 0; d < 4; d++) {
            int nr = row + dr[d];
            int nc = col + dc[d];
            if (!is_valid_position(nr, nc)) continue;
            int next = nr * n + nc;
            if (visited[next] || !has_player_color(nr, nc, player)) continue;
            visited[next] = 1;
            stack.push_back(next);
        }
    }

    return reached;
}

bool Board::check_bridge(int player) const {
    std::vector<char> visited;
    return flood_from_edge(player, false, true, visited);
}

std::vector<char> Board::edge_group(int player, bool far_edge) const {
    std::vector<char> visited;
    flood_from_edge(player, far_edge, false, visited);
    return visited;
}

Board Board::clone() const {
    return Board(*this);
}

void Board::reset() {
    std::fill(cells_.begin(), cells_.end(), static_cast<int8_t>(EMPTY));
}

TileCount Board::count_tiles(int player) const {
    TileCount count;
    for (int r = 0; r < board_size_; r++) {
        for (int c = 0; c < board_size_; c++) {
            if (primary(r, c) == player) count.primary++;
            if (secondary(r, c) == player) count.secondary++;
        }
    }
    count.total = count.primary + count.secondary;
    return count;
}

std::vector<std::vector<std::vector<float>>> Board::to_tensor() const {
    std::vector<std::vector<std::vector<float>>> tensor(
        4, std::vector<std::vector<float>>(board_size_, std::vector<float>(board_size_, 0.0f)));

    for (int r = 0; r < board_size_; r++) {
        for (int c = 0; c < board_size_; c++) {
            int p = primary(r, c);
            int s = secondary(r, c);
            if (p == PLAYER_A) tensor[0][r][c] = 1.0f;
            else if (p == PLAYER_B) tensor[2][r][c] = 1.0f;
            if (s == PLAYER_A) tensor[1][r][c] = 1.0f;
            else if (s == PLAYER_B) tensor[3][r][c] = 1.0f;
        }
    }
    return tensor;
}

std::vector<std::vector<std::vector<int>>> Board::get_board() const {
    std::vector<std::vector<std::vector<int>>> out(
        board_size_, std::vector<std::vector<int>>(board_size_, std::vector<int>(2, EMPTY)));
    for (int r = 0; r < board_size_; r++) {
        for (int c = 0; c < board_size_; c++) {
            out[r][c][LAYER_PRIMARY] = primary(r, c);
            out[r][c][LAYER_SECONDARY] = secondary(r, c);
        }
    }
    return out;
}

Board Board::from_board(const std::vector<std::vector<std::vector<int>>>& cells) {
    Board board(static_cast<int>(cells.size()));
    for (int r = 0; r < board.size(); r++) {
        if (static_cast<int>(cells[r].size()) != board.size()) {
            throw std::invalid_argument("Board row " + std::to_string(r) + " has wrong length");
        }
        for (int c = 0; c < board.size(); c++) {
            if (cells[r][c].size() != 2) {
                throw std::invalid_argument("Cell must have exactly two layers");
            }
            board.set_cell(r, c, LAYER_PRIMARY, cells[r][c][LAYER_PRIMARY]);
            board.set_cell(r, c, LAYER_SECONDARY, cells[r][c][LAYER_SECONDARY]);
        }
    }
    return board;
}

std::string Board::to_string() const {
    std::ostringstream oss;
    oss << "Board(" << board_size_ << "x" << board_size_ << ")\n";
    for (int r = 0; r < board_size_; r++) {
        for (int c = 0; c < board_size_; c++) {
            int p = primary(r, c);
            int s = secondary(r, c);
            char ch = '.';
            if (s == PLAYER_A) ch = 'A';
            else if (s == PLAYER_B) ch = 'B';
            else if (p == PLAYER_A) ch = 'a';
            else if (p == PLAYER_B) ch = 'b';
            oss << ch;
        }
        oss << '\n';
    }
    return oss.str();
}

bool Board::operator==(const Board& other) const {
    return board_size_ == other.board_size_ && cells_ == other.cells_;
}
