// ultimate_game.cpp
// Game interface adapter over move generation and state transitions.

#include "ultimate_game.h"
#include "move_gen.h"
#include "state_transition.h"
#include <stdexcept>

namespace uct {

std::vector<Action> UltimateGame::legal_actions(const GameState& state) const {
    std::vector<Action> actions;
    actions.reserve(MAX_ACTIONS);
    generate_legal_actions(state, actions);
    return actions;
}

GameState UltimateGame::next_state(const GameState& state, const Action& action) const {
    GameState next = state;
    if (!apply_action(next, action)) {
        throw std::invalid_argument("illegal action " + to_string(action));
    }
    return next;
}

mcts::PlayerId UltimateGame::current_player(const GameState& state) const {
    return state.current_player;
}

bool UltimateGame::is_ended(const GameState& state) const {
    return state.is_game_over();
}

mcts::OwnedBoxes UltimateGame::owned_boxes(const GameState& state) const {
    return mcts::OwnedBoxes(state.box_owners.begin(), state.box_owners.end());
}

std::optional<mcts::PointTally> UltimateGame::points_values(const GameState& state) const {
    if (!state.is_game_over()) {
        return std::nullopt;
    }

    mcts::PointTally points{{kPlayerOne, 0}, {kPlayerTwo, 0}};
    if (state.winner != kNoPlayer) {
        points[state.winner] = 1;
        points[mcts::opponent_of(state.winner)] = -1;
    }
    return points;
}

} // namespace uct
