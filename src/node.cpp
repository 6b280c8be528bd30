// node.cpp
#include "node.h"
#include <algorithm>
#include <cmath>
#include <limits>
#include <numeric>
#include <stdexcept>

#include "debug.h"

Node::Node(const Gamestate& state, const Move* moveFromParent, Node* parent)
    : state_(state),
      parent_(parent),
      move_from_parent_(moveFromParent ? *moveFromParent : Move()),
      has_move_(moveFromParent != nullptr),
      player_just_moved_(moveFromParent ? moveFromParent->player : opponent(state.current_player)),
      visit_count_(0),
      wins_(0.0),
      untried_moves_(state_.get_legal_moves().size()),
      priority_count_(0)
{
    std::iota(untried_moves_.begin(), untried_moves_.end(), 0);
    state_.clear_move_cache();
}

double Node::get_win_rate() const noexcept {
    if (visit_count_ == 0) {
        return 0.0;
    }
    return wins_ / visit_count_;
}

std::vector<Node*> Node::get_children() const {
    std::vector<Node*> result;
    result.reserve(children_.size());
    for (const auto& c : children_) {
        result.push_back(c.get());
    }
    return result;
}

double Node::ucb1(double exploration_weight) const {
    if (visit_count_ == 0) {
        return std::numeric_limits<double>::infinity();
    }
    double exploitation = wins_ / visit_count_;
    if (!parent_ || parent_->visit_count_ == 0) {
        return exploitation;
    }
    double exploration = exploration_weight *
        std::sqrt(std::log(static_cast<double>(parent_->visit_count_)) / visit_count_);
    return exploitation + exploration;
}

Node* Node::select_child(double exploration_weight) const {
    Node* best = nullptr;
    double best_score = -std::numeric_limits<double>::infinity();
    for (const auto& child : children_) {
        double score = child->ucb1(exploration_weight);
        if (!best || score > best_score) {
            best = child.get();
            best_score = score;
        }
    }
    return best;
}

void Node::prioritize(const std::vector<Move>& preferred) {
    if (preferred.empty()) {
        return;
    }
    const auto& legal = state_.get_legal_moves();
    auto begin = untried_moves_.begin() + priority_count_;
    for (const auto& move : preferred) {
        auto found = std::find(legal.begin(), legal.end(), move);
        if (found == legal.end()) continue;
        const int index = static_cast<int>(found - legal.begin());
        auto it = std::find(begin, untried_moves_.end(), index);
        if (it != untried_moves_.end()) {
            std::iter_swap(begin, it);
            ++begin;
            ++priority_count_;
        }
    }
    state_.clear_move_cache();
}

Node* Node::expand(std::mt19937& rng) {
    if (untried_moves_.empty()) {
        throw std::logic_error("No untried moves to expand");
    }

    std::size_t idx;
    if (priority_count_ > 0) {
        idx = 0;
        priority_count_--;
    } else {
        std::uniform_int_distribution<std::size_t> dist(0, untried_moves_.size() - 1);
        idx = dist(rng);
    }

    const int moveIndex = untried_moves_[idx];
    if (idx == 0 && priority_count_ > 0) {
        // keep the remaining preferred moves in front, in order
        untried_moves_.erase(untried_moves_.begin());
    } else {
        untried_moves_[idx] = untried_moves_.back();
        untried_moves_.pop_back();
    }

    Move move = state_.get_legal_moves()[moveIndex];
    state_.clear_move_cache();

    Gamestate childState = state_.copy();
    childState.make_move(move);

    children_.push_back(std::make_unique<Node>(childState, &move, this));
    return children_.back().get();
}

void Node::update_stats(double reward) noexcept {
    visit_count_++;
    wins_ += reward;
}

Node* Node::most_visited_child() const {
    Node* best = nullptr;
    for (const auto& child : children_) {
        if (!best || child->visit_count_ > best->visit_count_) {
            best = child.get();
        }
    }
    return best;
}

int Node::subtree_size() const {
    int count = 1;
    for (const auto& child : children_) {
        count += child->subtree_size();
    }
    return count;
}

// Depth along the most visited line.
int Node::get_tree_depth() const {
    int depth = 0;
    const Node* current = this;
    while (current) {
        depth++;
        current = current->most_visited_child();
    }
    return depth;
}
