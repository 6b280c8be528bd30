// mcts.h
#pragma once

#include <memory>
#include <optional>
#include <random>
#include <string>
#include <vector>

#include "mcts_config.h"
#include "node.h"
#include "wataru.h"
#include "debug.h"

struct CandidateStat {
    Move move;
    int visits = 0;
    double win_rate = 0.0;
};

// How the returned move was chosen.
enum class SearchDecision {
    ImmediateWin,   // root scan found a move that wins on the spot
    Search,         // most visited root child
    Fallback        // no simulation finished; blocking move or random legal move
};

std::string decision_name(SearchDecision decision);

struct SearchResult {
    Move move;
    int simulations = 0;
    int nodes_created = 0;
    double elapsed_seconds = 0.0;
    std::vector<CandidateStat> top_candidates;
    SearchDecision decision = SearchDecision::Search;
    bool threat_detected = false;
    bool block_found = false;
};

/**
 * Time-bounded UCB1 tree search with tactical shortcuts at the root.
 * Each call builds a private tree over copies of the given state and
 * discards it before returning; the caller's state is never touched.
 */
class MCTS {
public:
    explicit MCTS(const MCTSConfig& config = MCTSConfig());

    // Throws NoLegalMoves when the side to move has nothing to play.
    SearchResult search(const Gamestate& rootState);

    const MCTSConfig& get_config() const noexcept { return config_; }
    void set_config(const MCTSConfig& config);

    // Checks the first `limit` connecting candidates of the side to move and
    // returns the first that wins immediately.
    std::optional<Move> find_immediate_win(const Gamestate& state, int limit) const;

    // Opponent replies (from its first config.threat_scan_limit connecting
    // candidates) that would win if the side to move passed.
    std::vector<Move> find_threats(const Gamestate& state) const;

    // Moves for the side to move after which none of `threats`, and no
    // scanned opponent reply, wins any more.
    std::vector<Move> find_blocking_moves(const Gamestate& state, const std::vector<Move>& threats) const;

private:
    void run_simulation(Node* root);
    Node* select_node(Node* root);
    int rollout(Gamestate state);
    void backup(Node* leaf, int winner);

    SearchResult build_result(const Node& root, const std::vector<Move>& blocks,
                              const Gamestate& rootState);
    void analyze_search_result(const Node& root, const SearchResult& result) const;

private:
    MCTSConfig config_;
    std::mt19937 rng_;
};
