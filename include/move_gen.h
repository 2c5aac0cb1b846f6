// move_gen.h
// Legal move generation for Ultimate Tic-Tac-Toe.
// Called at every rollout ply, so it appends into caller-owned storage.

#pragma once

#include <cstdint>
#include <vector>
#include "action.h"
#include "game_state.h"

namespace uct {

// Maximum possible actions in any state (for pre-allocation).
constexpr std::size_t MAX_ACTIONS = NUM_CELLS;

// Generate all legal actions for the current player in the given state.
// Actions are appended to the provided vector (does not clear it first).
// Returns number of actions generated.
std::size_t generate_legal_actions(const GameState& state, std::vector<Action>& out_actions);

// Empty cells of one box, in cell order.
// Returns 0 for a box that is not open.
std::size_t generate_box_placements(const GameState& state, std::uint8_t box_idx,
                                    std::vector<Action>& out);

// Whether the next mark may go in this box: open, and either the forced box or
// any box when no box is forced.
bool is_playable_box(const GameState& state, std::uint8_t box_idx);

// Whether an action is legal in the given state.
bool is_action_legal(const GameState& state, const Action& action);

} // namespace uct
