// state_transition.cpp
// Deterministic state transitions for Ultimate Tic-Tac-Toe.

#include "state_transition.h"
#include "move_gen.h"

namespace uct {

bool apply_action(GameState& state, const Action& action) {
    if (!is_action_legal(state, action)) {
        return false;
    }

    const PlayerId mover = state.current_player;

    apply_place_mark(state, action);
    check_game_over(state, mover);
    update_target_box(state, action.cell);
    advance_turn(state, mover);

    return true;
}

void apply_place_mark(GameState& state, const Action& action) {
    state.place_mark(state.current_player, action.box, action.cell);
}

void update_target_box(GameState& state, std::uint8_t last_cell) {
    if (state.is_game_over()) {
        state.target_box = ANY_BOX;
        return;
    }

    // The cell index names the opponent's box
    state.target_box = state.is_box_open(last_cell) ? last_cell : ANY_BOX;
}

void check_game_over(GameState& state, PlayerId mover) {
    // A line of boxes wins outright
    if (has_line(state.box_owners, mover)) {
        state.finished = true;
        state.winner = mover;
        return;
    }

    if (state.any_open_box()) {
        return;
    }

    // Board closed: most boxes wins
    state.finished = true;
    const std::uint8_t one = state.count_boxes(kPlayerOne);
    const std::uint8_t two = state.count_boxes(kPlayerTwo);
    if (one > two) {
        state.winner = kPlayerOne;
    } else if (two > one) {
        state.winner = kPlayerTwo;
    } else {
        state.winner = kNoPlayer;
    }
}

void advance_turn(GameState& state, PlayerId mover) {
    if (state.is_game_over() && state.winner != kNoPlayer) {
        state.current_player = mcts::opponent_of(state.winner);
        return;
    }
    state.current_player = mcts::opponent_of(mover);
}

} // namespace uct
