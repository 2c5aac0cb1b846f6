// mcts_search.h
// UCT search: selection, expansion, simulation, backpropagation under an
// iteration or wall-clock budget. Generic over the game's state and action types.

#pragma once

#include "mcts_node.h"
#include "mcts_config.h"
#include "game.h"
#include "checked_game.h"
#include "rollout.h"
#include "errors.h"
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <iomanip>
#include <iostream>
#include <memory>
#include <random>
#include <stdexcept>
#include <utility>
#include <vector>

namespace uct {
namespace mcts {

// Statistics of the most recent search
struct SearchStats {
    std::uint32_t iterations{0};            // Completed select/expand/simulate/backpropagate cycles
    std::size_t tree_nodes{0};              // Nodes in the final tree, root included
    std::chrono::microseconds elapsed{0};   // Wall-clock time of the iteration loop
};

template <typename State, typename Action>
class MCTSSearch {
public:
    using GameType = Game<State, Action>;
    using Node = MCTSNode<Action>;
    using Rollout = RolloutPolicy<State, Action>;

    // Throws EmptyBudget or std::invalid_argument for an unusable configuration.
    explicit MCTSSearch(const MCTSConfig& config = MCTSConfig{},
                        std::shared_ptr<const Rollout> rollout = std::make_shared<RandomRollout<State, Action>>())
        : config_(config)
        , rollout_(std::move(rollout))
        , rng_(config.random_seed == 0 ? std::random_device{}() : config.random_seed)
    {
        validate_config(config_);
        if (!rollout_) {
            throw std::invalid_argument("rollout policy must not be null");
        }
    }

    // Run MCTS from `root_state` and return the action chosen for the player to move.
    // Throws InvalidState for a terminal root.
    Action search(const GameType& game, const State& root_state);

    // Tree of the most recent search (for debugging/analysis)
    const Node* get_root() const { return root_.get(); }

    const SearchStats& last_stats() const { return stats_; }

    const MCTSConfig& config() const { return config_; }

    const Rollout& rollout() const { return *rollout_; }

private:
    using Clock = std::chrono::steady_clock;

    // MCTS phases
    Node* select(Node* node, const GameType& game, State& state) const;
    Node* expand(Node* node, const GameType& game, State& state);
    void backpropagate(Node* node, bool won) const;

    bool budget_exhausted(std::uint32_t iterations, Clock::time_point start) const;

    void log_summary(const Node& chosen) const;

    MCTSConfig config_;

    std::shared_ptr<const Rollout> rollout_;

    std::mt19937 rng_;

    // Root node (replaced each search)
    std::unique_ptr<Node> root_;

    SearchStats stats_{};
};

template <typename State, typename Action>
Action MCTSSearch<State, Action>::search(const GameType& game, const State& root_state) {
    if (game.is_ended(root_state)) {
        throw InvalidState("cannot search from a terminal state");
    }

    // Identity whose wins the tree counts
    const PlayerId searcher = game.current_player(root_state);

    root_ = std::make_unique<Node>(nullptr, Action{}, checked_legal_actions(game, root_state));
    stats_ = SearchStats{};

    const Clock::time_point start = Clock::now();
    std::uint32_t iterations = 0;

    // At least one iteration always runs, so the root has a child afterwards.
    do {
        // Copy state for this iteration
        State state = root_state;

        // 1. Selection: descend through fully expanded nodes by UCT
        Node* node = select(root_.get(), game, state);

        // 2. Expansion: add one untried child
        if (!node->untried_actions.empty()) {
            node = expand(node, game, state);
        }

        // 3. Simulation: play the sampled game to the end
        State terminal = rollout_->simulate(game, std::move(state), searcher, rng_);

        // The player left to move at the end is the one who lost
        bool won = game.current_player(terminal) != searcher;

        // 4. Backpropagation
        backpropagate(node, won);

        ++iterations;
    } while (!budget_exhausted(iterations, start));

    stats_.iterations = iterations;
    stats_.elapsed = std::chrono::duration_cast<std::chrono::microseconds>(Clock::now() - start);
    stats_.tree_nodes = root_->subtree_size();

    Node* best_child = root_->get_best_win_rate_child(config_.tie_break);
    if (best_child == nullptr) {
        throw InvalidState("search finished without expanding any root action");
    }

    if (config_.verbose) {
        log_summary(*best_child);
    }

    return best_child->action;
}

template <typename State, typename Action>
typename MCTSSearch<State, Action>::Node*
MCTSSearch<State, Action>::select(Node* node, const GameType& game, State& state) const {
    // Descend while the node is fully expanded and some child scores above zero
    while (node->is_fully_expanded() && !node->children.empty()) {
        Node* next = node->select_child(config_.exploration_constant, config_.tie_break);
        if (next == nullptr) {
            break;
        }

        // Apply action to advance state
        state = checked_next_state(game, state, next->action);
        node = next;
    }

    return node;
}

template <typename State, typename Action>
typename MCTSSearch<State, Action>::Node*
MCTSSearch<State, Action>::expand(Node* node, const GameType& game, State& state) {
    // Terminal node or nothing left to try: return as-is
    if (game.is_ended(state) || node->untried_actions.empty()) {
        return node;
    }

    // Pick a random untried action
    std::uniform_int_distribution<std::size_t> dist(0, node->untried_actions.size() - 1);
    std::size_t idx = dist(rng_);
    Action action = node->untried_actions[idx];

    state = checked_next_state(game, state, action);

    Node* child = node->add_child(
        std::make_unique<Node>(node, action, checked_legal_actions(game, state)));

    node->untried_actions.erase(node->untried_actions.begin() + static_cast<std::ptrdiff_t>(idx));

    return child;
}

template <typename State, typename Action>
void MCTSSearch<State, Action>::backpropagate(Node* node, bool won) const {
    while (node != nullptr) {
        node->visits++;
        if (won) {
            node->wins++;
        }
        node = node->parent;
    }
}

template <typename State, typename Action>
bool MCTSSearch<State, Action>::budget_exhausted(std::uint32_t iterations,
                                                 Clock::time_point start) const {
    const SearchBudget& budget = config_.budget;
    if (budget.mode == BudgetMode::Iterations) {
        return iterations >= budget.iterations;
    }
    // Checked between iterations only; the last one may run past the limit.
    return Clock::now() - start >= budget.time_limit;
}

template <typename State, typename Action>
void MCTSSearch<State, Action>::log_summary(const Node& chosen) const {
    const double elapsed_ms = static_cast<double>(stats_.elapsed.count()) / 1000.0;
    std::cerr << std::fixed << std::setprecision(2)
              << "MCTS search: budget=" << to_string(config_.budget.mode)
              << " rollout=" << rollout_->name()
              << " iterations=" << stats_.iterations
              << " nodes=" << stats_.tree_nodes
              << " time_ms=" << elapsed_ms
              << " root_children=" << root_->children.size()
              << " chosen_visits=" << chosen.visits
              << " chosen_win_rate=" << chosen.win_rate()
              << std::endl;
}

// One-shot decision with a fresh search.
template <typename State, typename Action>
Action decide(const Game<State, Action>& game, const State& state,
              const MCTSConfig& config = MCTSConfig{},
              std::shared_ptr<const typename MCTSSearch<State, Action>::Rollout> rollout =
                  std::make_shared<RandomRollout<State, Action>>()) {
    MCTSSearch<State, Action> search(config, std::move(rollout));
    return search.search(game, state);
}

} // namespace mcts
} // namespace uct
