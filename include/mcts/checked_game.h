// checked_game.h
// Game calls with consistency checks. A rules provider that contradicts
// itself is reported as GameInterfaceViolation instead of being searched.

#pragma once

#include "game.h"
#include "errors.h"
#include <stdexcept>
#include <string>
#include <vector>

namespace uct {
namespace mcts {

// Legal actions, checked against is_ended.
template <typename State, typename Action>
std::vector<Action> checked_legal_actions(const Game<State, Action>& game, const State& state) {
    std::vector<Action> actions = game.legal_actions(state);
    const bool ended = game.is_ended(state);

    if (actions.empty() && !ended) {
        throw GameInterfaceViolation("legal_actions is empty but is_ended is false");
    }
    if (!actions.empty() && ended) {
        throw GameInterfaceViolation("is_ended is true but legal_actions returned " +
                                     std::to_string(actions.size()) + " actions");
    }

    return actions;
}

// Transition for an action taken from the game's own legal action list.
template <typename State, typename Action>
State checked_next_state(const Game<State, Action>& game, const State& state, const Action& action) {
    try {
        return game.next_state(state, action);
    } catch (const std::invalid_argument& e) {
        throw GameInterfaceViolation(std::string("next_state rejected a legal action: ") + e.what());
    }
}

} // namespace mcts
} // namespace uct
