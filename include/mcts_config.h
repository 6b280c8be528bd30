#pragma once

#include <cmath>
#include <optional>

/**
 * Basic struct holding MCTS parameters.
 */
struct MCTSConfig {
    double time_limit_seconds = 15.0;          // wall-clock budget per search
    std::optional<int> max_simulations;        // unset: bounded by time only
    double exploration_weight = std::sqrt(2.0); // UCB1 constant C
    bool tactical_rollout = true;              // take immediate wins during rollouts

    // Caps on connecting candidates (see Gamestate::connecting_candidates)
    int win_scan_limit = 30;          // checked at the root for an immediate win
    int threat_scan_limit = 10;       // opponent replies checked for a threat
    int rollout_win_scan_limit = 30;  // checked per rollout ply in tactical mode
    int max_rollout_moves = 100;      // rollout scored as a draw past this
    int top_candidates = 5;           // entries reported in SearchResult

    unsigned int seed = 0;            // 0 seeds from std::random_device
    bool verbose = false;             // log the ranked root summary
};
