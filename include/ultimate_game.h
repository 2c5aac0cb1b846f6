// ultimate_game.h
// Ultimate Tic-Tac-Toe rules exposed through the search engine's Game interface.

#pragma once

#include "action.h"
#include "game_state.h"
#include "mcts/game.h"
#include <optional>
#include <vector>

namespace uct {

class UltimateGame final : public mcts::Game<GameState, Action> {
public:
    std::vector<Action> legal_actions(const GameState& state) const override;

    // Throws std::invalid_argument for an illegal action.
    GameState next_state(const GameState& state, const Action& action) const override;

    mcts::PlayerId current_player(const GameState& state) const override;

    bool is_ended(const GameState& state) const override;

    // The nine box owners (kNoPlayer, a player, or DRAWN_BOX).
    mcts::OwnedBoxes owned_boxes(const GameState& state) const override;

    // Empty until the game ends; then winner +1 and loser -1, or 0 each for a draw.
    std::optional<mcts::PointTally> points_values(const GameState& state) const override;
};

} // namespace uct
