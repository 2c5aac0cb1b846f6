// mcts_agent.h
// High-level MCTS agent interface: decisions and root statistics.

#pragma once

#include "mcts_search.h"
#include <cstdint>
#include <memory>
#include <utility>
#include <vector>

namespace uct {
namespace mcts {

// Root action with its search statistics
template <typename Action>
struct ActionPolicy {
    Action action{};
    double probability{0.0};    // Share of root-child visits
    std::uint32_t visits{0};
    std::uint32_t wins{0};
};

// MCTS agent for one game type
template <typename State, typename Action>
class MCTSAgent {
public:
    using GameType = Game<State, Action>;
    using SearchType = MCTSSearch<State, Action>;
    using Rollout = typename SearchType::Rollout;

    explicit MCTSAgent(const MCTSConfig& config = MCTSConfig{},
                       std::shared_ptr<const Rollout> rollout = std::make_shared<RandomRollout<State, Action>>())
        : config_(config)
        , rollout_(rollout)
        , search_(config, std::move(rollout))
    {}

    // Select action from current game state
    Action decide(const GameType& game, const State& state) {
        return search_.search(game, state);
    }

    // Search and report every expanded root action.
    // Useful for analysis and training data collection.
    std::vector<ActionPolicy<Action>> get_action_policy(const GameType& game, const State& state);

    const MCTSConfig& get_config() const { return config_; }

    // Update configuration (takes effect on next search).
    // Throws without changing the agent if the configuration is unusable.
    void set_config(const MCTSConfig& config) {
        search_ = SearchType(config, rollout_);
        config_ = config;
    }

    // Swap the simulation strategy (takes effect on next search)
    void set_rollout(std::shared_ptr<const Rollout> rollout) {
        search_ = SearchType(config_, rollout);
        rollout_ = std::move(rollout);
    }

    const SearchType& search() const { return search_; }

private:
    MCTSConfig config_;
    std::shared_ptr<const Rollout> rollout_;
    SearchType search_;
};

template <typename State, typename Action>
std::vector<ActionPolicy<Action>> MCTSAgent<State, Action>::get_action_policy(
        const GameType& game, const State& state) {
    search_.search(game, state);

    const auto* root = search_.get_root();

    // Calculate total visits
    std::uint64_t total_visits = 0;
    for (const auto& child : root->children) {
        total_visits += child->visits;
    }

    std::vector<ActionPolicy<Action>> policy;
    policy.reserve(root->children.size());

    for (const auto& child : root->children) {
        ActionPolicy<Action> ap;
        ap.action = child->action;
        ap.visits = child->visits;
        ap.wins = child->wins;
        ap.probability = total_visits == 0 ? 0.0 :
            static_cast<double>(child->visits) / static_cast<double>(total_visits);
        policy.push_back(ap);
    }

    return policy;
}

} // namespace mcts
} // namespace uct
