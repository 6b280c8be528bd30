// move.cpp
#include "move.h"
#include <chrono>
#include <cstdlib>
#include <set>
#include <sstream>

Move Move::create(int player, std::vector<Position> path) {
    auto now = std::chrono::system_clock::now().time_since_epoch();
    double ts = std::chrono::duration<double>(now).count();
    return Move(player, std::move(path), ts);
}

std::string Move::direction() const {
    if (path.size() < 2) {
        return "none";
    }
    const Position& first = path[0];
    const Position& second = path[1];
    if (first.row == second.row) return "horizontal";
    if (first.col == second.col) return "vertical";
    return "invalid";
}

static bool fail(std::string* reason, const std::string& msg) {
    if (reason) *reason = msg;
    return false;
}

bool Move::validate_path(std::string* reason) const {
    if (player != PLAYER_A && player != PLAYER_B) {
        return fail(reason, "player must be A or B");
    }
    if (block_size() < MIN_BLOCK_SIZE || block_size() > MAX_BLOCK_SIZE) {
        return fail(reason, "path length must be between 3 and 5, got " + std::to_string(block_size()));
    }

    const int layer = path.front().layer;
    if (layer != LAYER_PRIMARY && layer != LAYER_SECONDARY) {
        return fail(reason, "invalid layer " + std::to_string(layer));
    }

    bool same_row = true;
    bool same_col = true;
    std::set<std::pair<int, int>> seen;
    for (const auto& pos : path) {
        if (pos.layer != layer) {
            return fail(reason, "all cells of a move must target the same layer");
        }
        same_row = same_row && pos.row == path.front().row;
        same_col = same_col && pos.col == path.front().col;
        if (!seen.insert({pos.row, pos.col}).second) {
            return fail(reason, "path visits a cell twice");
        }
    }
    if (!same_row && !same_col) {
        return fail(reason, "path is not straight");
    }

    for (std::size_t i = 1; i < path.size(); i++) {
        int step = std::abs(path[i].row - path[i - 1].row) + std::abs(path[i].col - path[i - 1].col);
        if (step != 1) {
            return fail(reason, "path is not continuous");
        }
    }

    return true;
}

bool Move::touches(int row, int col) const noexcept {
    for (const auto& pos : path) {
        if (pos.row == row && pos.col == col) return true;
    }
    return false;
}

std::string player_name(int player) {
    switch (player) {
        case PLAYER_A: return "A";
        case PLAYER_B: return "B";
        default: return "-";
    }
}

std::string Move::to_string() const {
    std::ostringstream oss;
    oss << "Move(" << player_name(player) << ", size=" << block_size();
    if (!path.empty()) {
        oss << ", from=(" << path.front().row << "," << path.front().col << ")"
            << ", to=(" << path.back().row << "," << path.back().col << ")";
    }
    oss << ", dir=" << direction() << (is_bridge_mode() ? ", bridge" : "") << ")";
    return oss.str();
}
