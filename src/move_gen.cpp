// move_gen.cpp
// Legal move generation for Ultimate Tic-Tac-Toe.

#include "move_gen.h"

namespace uct {

bool is_playable_box(const GameState& state, std::uint8_t box_idx) {
    if (box_idx >= NUM_BOXES) return false;
    if (!state.is_box_open(box_idx)) return false;

    return state.target_box == ANY_BOX || state.target_box == box_idx;
}

bool is_action_legal(const GameState& state, const Action& action) {
    if (state.is_game_over()) return false;
    if (!action.is_valid()) return false;
    if (!is_playable_box(state, action.box)) return false;

    return state.is_cell_empty(action.box, action.cell);
}

std::size_t generate_box_placements(const GameState& state, std::uint8_t box_idx,
                                    std::vector<Action>& out) {
    if (box_idx >= NUM_BOXES || !state.is_box_open(box_idx)) return 0;

    std::size_t count = 0;
    for (std::uint8_t c = 0; c < CELLS_PER_BOX; ++c) {
        if (state.is_cell_empty(box_idx, c)) {
            out.push_back(Action::place(box_idx, c));
            ++count;
        }
    }
    return count;
}

std::size_t generate_legal_actions(const GameState& state, std::vector<Action>& out_actions) {
    if (state.is_game_over()) return 0;

    // Forced box: transitions only set target_box to an open box
    if (state.target_box != ANY_BOX) {
        return generate_box_placements(state, state.target_box, out_actions);
    }

    std::size_t count = 0;
    for (std::uint8_t b = 0; b < NUM_BOXES; ++b) {
        count += generate_box_placements(state, b, out_actions);
    }
    return count;
}

} // namespace uct
