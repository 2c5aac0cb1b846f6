// rollout.h
// Simulation strategies: play a sampled game from a tree frontier to the end.
// Strategies are interchangeable objects handed to the search.

#pragma once

#include "game.h"
#include "checked_game.h"
#include "errors.h"
#include <cstdint>
#include <limits>
#include <optional>
#include <random>
#include <string>
#include <utility>
#include <vector>

namespace uct {
namespace mcts {

struct RolloutConfig {
    std::uint32_t samples{10};              // Playouts per candidate action (heuristic rollout)
    std::uint32_t lookahead_depth{5};       // Ply cap per sampled playout
    double points_scale{9.0};               // Weight of a terminal point over one owned cell
    std::uint32_t max_plies{10000};         // Guard against rules that never terminate
};

// Throws std::invalid_argument for zero samples or a zero ply cap.
void validate_rollout_config(const RolloutConfig& config);

// Difference between `me` and the opponent, from terminal points when present,
// otherwise from owned cells.
// Throws std::invalid_argument unless `me` is kPlayerOne or kPlayerTwo.
double score_outcome(const OwnedBoxes& owned,
                     const std::optional<PointTally>& points,
                     PlayerId me,
                     double points_scale);

template <typename T>
const T& pick_uniform(const std::vector<T>& items, std::mt19937& rng) {
    std::uniform_int_distribution<std::size_t> dist(0, items.size() - 1);
    return items[dist(rng)];
}

// Simulation strategy interface.
template <typename State, typename Action>
class RolloutPolicy {
public:
    using GameType = Game<State, Action>;

    explicit RolloutPolicy(const RolloutConfig& config)
        : config_(config)
    {
        validate_rollout_config(config_);
    }

    virtual ~RolloutPolicy() = default;

    // Play from `state` until the game ends and return the terminal state.
    virtual State simulate(const GameType& game, State state, PlayerId searcher,
                           std::mt19937& rng) const = 0;

    virtual std::string name() const = 0;

    const RolloutConfig& config() const { return config_; }

protected:
    // Legal actions of a non-terminal rollout state.
    std::vector<Action> rollout_actions(const GameType& game, const State& state,
                                        std::uint32_t& plies) const {
        if (++plies > config_.max_plies) {
            throw GameInterfaceViolation("rollout exceeded " + std::to_string(config_.max_plies) +
                                         " plies without reaching a terminal state");
        }
        std::vector<Action> actions = game.legal_actions(state);
        if (actions.empty()) {
            throw GameInterfaceViolation("legal_actions is empty but is_ended is false");
        }
        return actions;
    }

    // Terminal state of a playout, checked against legal_actions.
    State finished_state(const GameType& game, State state) const {
        if (!game.legal_actions(state).empty()) {
            throw GameInterfaceViolation("rollout reached an ended state that still lists legal actions");
        }
        return state;
    }

    RolloutConfig config_;
};

// Uniformly random playout to the end of the game.
template <typename State, typename Action>
class RandomRollout : public RolloutPolicy<State, Action> {
public:
    using typename RolloutPolicy<State, Action>::GameType;

    explicit RandomRollout(const RolloutConfig& config = RolloutConfig{})
        : RolloutPolicy<State, Action>(config)
    {}

    State simulate(const GameType& game, State state, PlayerId /*searcher*/,
                   std::mt19937& rng) const override {
        std::uint32_t plies = 0;
        while (!game.is_ended(state)) {
            std::vector<Action> actions = this->rollout_actions(game, state, plies);
            state = checked_next_state(game, state, pick_uniform(actions, rng));
        }
        return this->finished_state(game, std::move(state));
    }

    std::string name() const override { return "random"; }
};

// Playout where the searching player picks, at each of its turns, the action
// with the best average score over short random lookaheads. The opponent
// still moves uniformly at random.
template <typename State, typename Action>
class HeuristicRollout : public RolloutPolicy<State, Action> {
public:
    using typename RolloutPolicy<State, Action>::GameType;

    explicit HeuristicRollout(const RolloutConfig& config = RolloutConfig{})
        : RolloutPolicy<State, Action>(config)
    {}

    State simulate(const GameType& game, State state, PlayerId searcher,
                   std::mt19937& rng) const override {
        std::uint32_t plies = 0;
        while (!game.is_ended(state)) {
            std::vector<Action> actions = this->rollout_actions(game, state, plies);

            if (game.current_player(state) == searcher) {
                state = checked_next_state(game, state, best_action(game, state, actions, searcher, rng));
            } else {
                state = checked_next_state(game, state, pick_uniform(actions, rng));
            }
        }
        return this->finished_state(game, std::move(state));
    }

    // First action with the strictly greatest expected score.
    const Action& best_action(const GameType& game, const State& state,
                              const std::vector<Action>& actions, PlayerId searcher,
                              std::mt19937& rng) const {
        std::size_t best_idx = 0;
        double best_expectation = -std::numeric_limits<double>::infinity();

        for (std::size_t i = 0; i < actions.size(); ++i) {
            double expectation = expected_score(game, state, actions[i], searcher, rng);
            if (expectation > best_expectation) {
                best_expectation = expectation;
                best_idx = i;
            }
        }

        return actions[best_idx];
    }

    // Average outcome of `samples` short random playouts after `action`.
    double expected_score(const GameType& game, const State& state, const Action& action,
                          PlayerId searcher, std::mt19937& rng) const {
        const RolloutConfig& cfg = this->config_;
        double total_score = 0.0;

        for (std::uint32_t r = 0; r < cfg.samples; ++r) {
            State sample = checked_next_state(game, state, action);

            for (std::uint32_t depth = 0; depth < cfg.lookahead_depth; ++depth) {
                if (game.is_ended(sample)) break;
                std::vector<Action> replies = game.legal_actions(sample);
                if (replies.empty()) {
                    throw GameInterfaceViolation("legal_actions is empty but is_ended is false");
                }
                sample = checked_next_state(game, sample, pick_uniform(replies, rng));
            }

            total_score += score_outcome(game.owned_boxes(sample), game.points_values(sample),
                                         searcher, cfg.points_scale);
        }

        return total_score / static_cast<double>(cfg.samples);
    }

    std::string name() const override { return "heuristic"; }
};

} // namespace mcts
} // namespace uct
