// mcts.cpp
#include "mcts.h"
#include <algorithm>
#include <chrono>
#include <cmath>
#include <iomanip>
#include <sstream>

std::string decision_name(SearchDecision decision) {
    switch (decision) {
        case SearchDecision::ImmediateWin: return "immediate_win";
        case SearchDecision::Search: return "search";
        case SearchDecision::Fallback: return "fallback";
    }
    return "unknown";
}

static std::mt19937 make_rng(unsigned int seed) {
    return std::mt19937(seed != 0 ? seed : std::random_device{}());
}

MCTS::MCTS(const MCTSConfig& config)
    : config_(config),
      rng_(make_rng(config.seed))
{
}

void MCTS::set_config(const MCTSConfig& config) {
    config_ = config;
    rng_ = make_rng(config.seed);
}

std::optional<Move> MCTS::find_immediate_win(const Gamestate& state, int limit) const {
    const std::vector<Move> candidates = state.connecting_candidates();
    const std::size_t n = std::min(candidates.size(), static_cast<std::size_t>(std::max(limit, 0)));
    for (std::size_t i = 0; i < n; i++) {
        if (state.is_winning_move(candidates[i])) {
            return candidates[i];
        }
    }
    return std::nullopt;
}

std::vector<Move> MCTS::find_threats(const Gamestate& state) const {
    std::vector<Move> threats;
    if (state.is_terminal()) {
        return threats;
    }

    Gamestate opponentView = state.copy_with_turn(opponent(state.current_player));
    const std::vector<Move> replies = opponentView.connecting_candidates();
    const std::size_t n = std::min(replies.size(),
                                   static_cast<std::size_t>(std::max(config_.threat_scan_limit, 0)));
    for (std::size_t i = 0; i < n; i++) {
        if (opponentView.is_winning_move(replies[i])) {
            threats.push_back(replies[i]);
        }
    }
    return threats;
}

std::vector<Move> MCTS::find_blocking_moves(const Gamestate& state, const std::vector<Move>& threats) const {
    std::vector<Move> blocks;
    if (threats.empty()) {
        return blocks;
    }

    // Only a move that occupies a cell of a threatening path can make it illegal.
    for (const auto& candidate : state.get_legal_moves()) {
        bool touches_threat = false;
        for (const auto& threat : threats) {
            for (const auto& pos : threat.path) {
                if (candidate.touches(pos.row, pos.col)) {
                    touches_threat = true;
                    break;
                }
            }
            if (touches_threat) break;
        }
        if (!touches_threat) continue;

        Gamestate after = state.copy();
        after.make_move(candidate);
        if (after.get_winner() == candidate.player) {
            blocks.push_back(candidate);
            continue;
        }

        bool still_threatened = false;
        for (const auto& threat : threats) {
            if (after.is_move_valid(threat) && after.is_winning_move(threat)) {
                still_threatened = true;
                break;
            }
        }
        if (!still_threatened) {
            still_threatened = !find_threats(after.copy_with_turn(candidate.player)).empty();
        }
        if (!still_threatened) {
            blocks.push_back(candidate);
        }
    }
    return blocks;
}

SearchResult MCTS::search(const Gamestate& rootState) {
    const auto start_time = std::chrono::steady_clock::now();
    auto elapsed = [&start_time]() {
        return std::chrono::duration<double>(std::chrono::steady_clock::now() - start_time).count();
    };

    const auto& rootMoves = rootState.get_legal_moves();
    if (rootMoves.empty()) {
        WATARU_DEBUG("No legal moves from root state, search aborted");
        throw NoLegalMoves(rootState.is_terminal()
                               ? "Game is already over"
                               : "Player " + player_name(rootState.current_player) + " has no legal moves");
    }

    WATARU_DEBUG("Starting search for player " << player_name(rootState.current_player)
                 << ", root has " << rootMoves.size() << " legal moves");

    // 1. Root short-circuits
    if (auto win = find_immediate_win(rootState, config_.win_scan_limit)) {
        WATARU_DEBUG("Immediate win found: " << win->to_string());
        SearchResult result;
        result.move = *win;
        result.elapsed_seconds = elapsed();
        result.top_candidates.push_back(CandidateStat{*win, 1, 1.0});
        result.decision = SearchDecision::ImmediateWin;
        return result;
    }

    std::vector<Move> threats = find_threats(rootState);
    std::vector<Move> blocks;
    if (!threats.empty()) {
        blocks = find_blocking_moves(rootState, threats);
        WATARU_DEBUG("Threat detected: " << threats.size() << " opponent winning replies, "
                     << blocks.size() << " blocking moves");
    }

    // 2. Iterative tree growth
    auto root = std::make_unique<Node>(rootState);
    root->prioritize(blocks);

    int simulations = 0;
    while (true) {
        if (config_.max_simulations && simulations >= *config_.max_simulations) {
            break;
        }
        if (elapsed() >= config_.time_limit_seconds) {
            break;
        }
        run_simulation(root.get());
        simulations++;
    }

    // 3. Move selection
    SearchResult result = build_result(*root, blocks, rootState);
    result.simulations = simulations;
    result.elapsed_seconds = elapsed();
    result.threat_detected = !threats.empty();
    result.block_found = !blocks.empty();

    double rate = result.elapsed_seconds > 0.0 ? simulations / result.elapsed_seconds : 0.0;
    WATARU_DEBUG("MCTS search completed with " << simulations << " simulations in "
                 << std::fixed << std::setprecision(3) << result.elapsed_seconds << "s ("
                 << std::setprecision(1) << rate << "/s), tree size " << result.nodes_created
                 << " nodes, decision " << decision_name(result.decision));

    if (config_.verbose) {
        analyze_search_result(*root, result);
    }
    return result;
}

void MCTS::run_simulation(Node* root) {
    Node* leaf = select_node(root);
    int winner = rollout(leaf->get_state());
    backup(leaf, winner);
}

// Descends by UCB1 until a node still has untried moves (expanded here) or
// the game is over.
Node* MCTS::select_node(Node* root) {
    Node* current = root;
    while (!current->is_terminal()) {
        if (!current->is_fully_expanded()) {
            return current->expand(rng_);
        }
        Node* next = current->select_child(config_.exploration_weight);
        if (!next) {
            break;  // no legal moves and nobody won
        }
        current = next;
    }
    return current;
}

// Plays to the end. Returns the winner, or EMPTY for a stalemate or a
// rollout that reached max_rollout_moves.
int MCTS::rollout(Gamestate state) {
    int moves_played = 0;
    while (!state.is_terminal() && moves_played < config_.max_rollout_moves) {
        const auto& legal = state.get_legal_moves();
        if (legal.empty()) {
            break;
        }

        std::optional<Move> chosen;
        if (config_.tactical_rollout) {
            chosen = find_immediate_win(state, config_.rollout_win_scan_limit);
        }
        if (!chosen) {
            std::uniform_int_distribution<std::size_t> dist(0, legal.size() - 1);
            chosen = legal[dist(rng_)];
        }

        state.make_move(*chosen);
        moves_played++;
    }
    return state.get_winner();
}

void MCTS::backup(Node* leaf, int winner) {
    for (Node* current = leaf; current; current = current->get_parent()) {
        double reward = 0.5;
        if (winner != EMPTY) {
            reward = (current->get_player_just_moved() == winner) ? 1.0 : 0.0;
        }
        current->update_stats(reward);
    }
}

SearchResult MCTS::build_result(const Node& root, const std::vector<Move>& blocks,
                                const Gamestate& rootState) {
    SearchResult result;
    result.nodes_created = root.subtree_size();

    std::vector<Node*> children = root.get_children();
    std::stable_sort(children.begin(), children.end(), [](const Node* a, const Node* b) {
        return a->get_visit_count() > b->get_visit_count();
    });

    const std::size_t report = std::min(children.size(),
                                        static_cast<std::size_t>(std::max(config_.top_candidates, 0)));
    for (std::size_t i = 0; i < report; i++) {
        result.top_candidates.push_back(CandidateStat{
            children[i]->get_move_from_parent(), children[i]->get_visit_count(), children[i]->get_win_rate()});
    }

    Node* best = root.most_visited_child();
    if (best && best->get_visit_count() > 0) {
        result.move = best->get_move_from_parent();
        result.decision = SearchDecision::Search;
        return result;
    }

    result.decision = SearchDecision::Fallback;
    if (!blocks.empty()) {
        result.move = blocks.front();
    } else {
        const auto& legal = rootState.get_legal_moves();
        std::uniform_int_distribution<std::size_t> dist(0, legal.size() - 1);
        result.move = legal[dist(rng_)];
    }
    WATARU_DEBUG("No simulation completed, falling back to " << result.move.to_string());
    return result;
}

void MCTS::analyze_search_result(const Node& root, const SearchResult& result) const {
    std::ostringstream oss;
    oss << "Top " << result.top_candidates.size() << " moves from root:";
    int rank = 1;
    for (const auto& c : result.top_candidates) {
        oss << "\n  " << rank++ << ". visits " << std::setw(5) << c.visits
            << "  win rate " << std::fixed << std::setprecision(1) << std::setw(5) << c.win_rate * 100.0
            << "%  " << c.move.to_string();
    }
    WATARU_DEBUG(oss.str());
    WATARU_DEBUG("Tree depth along best line: " << root.get_tree_depth()
                 << ", root visits: " << root.get_visit_count());
}
