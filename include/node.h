#pragma once

#include <memory>
#include <random>
#include <vector>

#include "wataru.h"

/**
 * Search tree node. Owns a snapshot of the game after its move and its
 * children; the parent pointer is non-owning and only walked during backup.
 * The snapshot keeps no legal-move list between calls: untried moves are
 * indices into the list the snapshot regenerates on demand.
 */
class Node {
public:
    Node(const Gamestate& state, const Move* moveFromParent = nullptr, Node* parent = nullptr);
    ~Node() = default;

    Node(const Node&) = delete;
    Node& operator=(const Node&) = delete;

    int get_visit_count() const noexcept { return visit_count_; }
    double get_wins() const noexcept { return wins_; }
    double get_win_rate() const noexcept;
    const Gamestate& get_state() const noexcept { return state_; }
    Node* get_parent() const noexcept { return parent_; }
    bool has_move() const noexcept { return has_move_; }
    const Move& get_move_from_parent() const noexcept { return move_from_parent_; }

    // Player whose move produced this node; wins are counted for them.
    int get_player_just_moved() const noexcept { return player_just_moved_; }

    std::vector<Node*> get_children() const;
    std::size_t num_children() const noexcept { return children_.size(); }
    std::size_t num_untried() const noexcept { return untried_moves_.size(); }

    bool is_terminal() const noexcept { return state_.is_terminal(); }
    bool is_fully_expanded() const noexcept { return untried_moves_.empty(); }

    // UCB1 from the parent's point of view. Unvisited children score +inf.
    double ucb1(double exploration_weight) const;
    Node* select_child(double exploration_weight) const;

    // Moves in `preferred` that are still untried are expanded first.
    void prioritize(const std::vector<Move>& preferred);

    // Creates one child from an untried move and returns it.
    Node* expand(std::mt19937& rng);

    void update_stats(double reward) noexcept;

    Node* most_visited_child() const;
    int subtree_size() const;
    int get_tree_depth() const;

private:
    Gamestate state_;
    Node* parent_;
    Move move_from_parent_;
    bool has_move_;
    int player_just_moved_;

    int visit_count_;
    double wins_;

    std::vector<int> untried_moves_;  // indices into state_.get_legal_moves()
    std::size_t priority_count_;      // leading untried moves to expand in order
    std::vector<std::unique_ptr<Node>> children_;
};
