// state_transition.h
// Apply actions to game state - deterministic state transitions for MCTS.
// All functions mutate the provided GameState in-place.

#pragma once

#include "game_state.h"
#include "action.h"
#include <cstdint>

namespace uct {

// Apply an action to the game state.
// Returns true if action was applied, false (state untouched) if illegal.
bool apply_action(GameState& state, const Action& action);

// Specialized transition functions (called by apply_action, can also be used directly).
// They assume legality.

// Place the current player's mark
void apply_place_mark(GameState& state, const Action& action);

// Route the next move to the box matching the cell just played, or free it
// when that box is closed
void update_target_box(GameState& state, std::uint8_t last_cell);

// Detect the end of the game after a mark by `mover` and record the winner
void check_game_over(GameState& state, PlayerId mover);

// Pass the turn. At a decided end the loser is left to move.
void advance_turn(GameState& state, PlayerId mover);

} // namespace uct
