// game.h
// Abstract rules interface consumed by the search engine.
// Any two-player, turn-based, perfect-information game can be searched by
// implementing this interface for its own state and action types.

#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <vector>

namespace uct {
namespace mcts {

// Player identity. Two-player games use kPlayerOne and kPlayerTwo.
using PlayerId = std::uint8_t;

constexpr PlayerId kNoPlayer = 0;
constexpr PlayerId kPlayerOne = 1;
constexpr PlayerId kPlayerTwo = 2;

inline PlayerId opponent_of(PlayerId player) {
    if (player == kPlayerOne) return kPlayerTwo;
    if (player == kPlayerTwo) return kPlayerOne;
    return kNoPlayer;
}

// Owner of each scoring cell, indexed by cell.
// Values other than kPlayerOne/kPlayerTwo (unowned, drawn) count for neither side.
using OwnedBoxes = std::vector<PlayerId>;

// Final point totals per player.
using PointTally = std::map<PlayerId, int>;

// Game rules provider.
// All methods are pure with respect to their inputs: states are values and
// next_state never mutates its argument.
template <typename State, typename Action>
class Game {
public:
    using state_type = State;
    using action_type = Action;

    virtual ~Game() = default;

    // All actions available to the player to move. Empty iff the state is terminal.
    virtual std::vector<Action> legal_actions(const State& state) const = 0;

    // Deterministic transition. Throws std::invalid_argument if the action
    // cannot be applied to the state.
    virtual State next_state(const State& state, const Action& action) const = 0;

    // Player to move. At a terminal state this is the player who would move
    // next, i.e. the side unable to move; the search counts that side as the loser.
    virtual PlayerId current_player(const State& state) const = 0;

    virtual bool is_ended(const State& state) const = 0;

    // Scoring hooks, only used by HeuristicRollout.
    virtual OwnedBoxes owned_boxes(const State& /*state*/) const { return {}; }

    virtual std::optional<PointTally> points_values(const State& /*state*/) const {
        return std::nullopt;
    }
};

} // namespace mcts
} // namespace uct
