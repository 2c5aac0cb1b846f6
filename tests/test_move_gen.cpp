// test_move_gen.cpp
// Test harness for legal move generation.

#include <iostream>
#include <iomanip>
#include "move_gen.h"
#include "state_transition.h"

using namespace uct;

static int failures = 0;

static void report(bool ok) {
    std::cout << (ok ? "PASSED" : "FAILED") << "\n";
    if (!ok) ++failures;
}

static bool all_in_box(const std::vector<Action>& actions, std::uint8_t box) {
    for (const Action& a : actions) {
        if (a.box != box) return false;
    }
    return true;
}

static void test_opening_moves() {
    std::cout << "\n=== Test: Opening Moves ===\n";

    GameState state = GameState::create_new_game();
    std::vector<Action> actions;
    std::size_t count = generate_legal_actions(state, actions);

    std::cout << "  Generated " << count << " opening moves\n";

    bool ok = true;

    if (count != NUM_CELLS || actions.size() != NUM_CELLS) {
        std::cout << "  ERROR: Every cell should be playable on an empty board\n";
        ok = false;
    }

    // Box-major, cell order
    if (!actions.empty() && (actions.front() != Action::place(0, 0) || actions.back() != Action::place(8, 8))) {
        std::cout << "  ERROR: Unexpected generation order\n";
        ok = false;
    }

    // Appends without clearing
    std::size_t again = generate_legal_actions(state, actions);
    if (again != NUM_CELLS || actions.size() != 2u * NUM_CELLS) {
        std::cout << "  ERROR: Generation should append to the output\n";
        ok = false;
    }

    report(ok);
}

static void test_forced_box() {
    std::cout << "\n=== Test: Forced Box ===\n";

    GameState state = GameState::create_new_game();
    apply_action(state, Action::place(0, 4));

    std::vector<Action> actions;
    generate_legal_actions(state, actions);

    std::cout << "  Target box: " << static_cast<int>(state.target_box)
              << ", moves: " << actions.size() << "\n";

    bool ok = true;

    if (state.target_box != 4 || actions.size() != 9 || !all_in_box(actions, 4)) {
        std::cout << "  ERROR: Reply should be forced into box 4\n";
        ok = false;
    }

    // Back into box 0: one cell already taken
    apply_action(state, Action::place(4, 0));
    actions.clear();
    generate_legal_actions(state, actions);

    if (actions.size() != 8 || !all_in_box(actions, 0)) {
        std::cout << "  ERROR: Expected the 8 free cells of box 0\n";
        ok = false;
    }

    report(ok);
}

static void test_closed_target_frees_choice() {
    std::cout << "\n=== Test: Closed Target Box ===\n";

    GameState state = GameState::create_new_game();

    // Box 2 already won by player two
    state.place_mark(kPlayerTwo, 2, 0);
    state.place_mark(kPlayerTwo, 2, 1);
    state.place_mark(kPlayerTwo, 2, 2);

    // Player one plays cell 2, which would send the reply to box 2
    state.current_player = kPlayerOne;
    state.target_box = ANY_BOX;
    apply_action(state, Action::place(5, 2));

    std::vector<Action> actions;
    generate_legal_actions(state, actions);

    std::cout << "  Target box: " << static_cast<int>(state.target_box)
              << ", moves: " << actions.size() << "\n";

    bool ok = true;

    if (state.target_box != ANY_BOX) {
        std::cout << "  ERROR: Closed target box should free the choice\n";
        ok = false;
    }

    // 8 open boxes; box 5 has one mark
    if (actions.size() != 8u * CELLS_PER_BOX - 1) {
        std::cout << "  ERROR: Expected 71 moves, got " << actions.size() << "\n";
        ok = false;
    }

    for (const Action& a : actions) {
        if (a.box == 2) {
            std::cout << "  ERROR: Owned box offered a move\n";
            ok = false;
            break;
        }
    }

    report(ok);
}

static void test_action_legality() {
    std::cout << "\n=== Test: Action Legality ===\n";

    GameState state = GameState::create_new_game();
    apply_action(state, Action::place(3, 6));

    bool ok = true;

    if (!is_action_legal(state, Action::place(6, 0))) {
        std::cout << "  ERROR: Move in the forced box should be legal\n";
        ok = false;
    }
    if (is_action_legal(state, Action::place(3, 0))) {
        std::cout << "  ERROR: Move outside the forced box should be illegal\n";
        ok = false;
    }
    if (is_action_legal(state, Action{})) {
        std::cout << "  ERROR: Default action should be illegal\n";
        ok = false;
    }

    apply_action(state, Action::place(6, 3));
    if (is_action_legal(state, Action::place(3, 6))) {
        std::cout << "  ERROR: Occupied cell should be illegal\n";
        ok = false;
    }

    if (!is_playable_box(state, 3) || is_playable_box(state, 4) || is_playable_box(state, 9)) {
        std::cout << "  ERROR: Only box 3 should be playable\n";
        ok = false;
    }

    report(ok);
}

static void test_finished_game() {
    std::cout << "\n=== Test: Finished Game Has No Moves ===\n";

    GameState state = GameState::create_new_game();
    state.finished = true;

    std::vector<Action> actions;
    std::size_t count = generate_legal_actions(state, actions);

    bool ok = true;

    if (count != 0 || !actions.empty()) {
        std::cout << "  ERROR: Finished game should have no legal actions\n";
        ok = false;
    }

    if (generate_box_placements(state, 9, actions) != 0) {
        std::cout << "  ERROR: Out of range box should yield nothing\n";
        ok = false;
    }

    report(ok);
}

int main() {
    std::cout << "========================================\n";
    std::cout << "  Move Generation Test Suite\n";
    std::cout << "========================================\n";

    test_opening_moves();
    test_forced_box();
    test_closed_target_frees_choice();
    test_action_legality();
    test_finished_game();

    std::cout << "\n========================================\n";
    std::cout << "  Move Generation Test Suite Complete! (" << failures << " failed)\n";
    std::cout << "========================================\n";

    return failures == 0 ? 0 : 1;
}
