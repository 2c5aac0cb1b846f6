// test_mcts_agent.cpp
// Test MCTS agent interface: decisions, root policy and reconfiguration.

#include <iostream>
#include <iomanip>
#include <chrono>
#include <memory>
#include "mcts/mcts_agent.h"
#include "ultimate_game.h"
#include "toy_games.h"

using namespace uct;
using namespace uct::mcts;

static int failures = 0;

static void report(bool ok) {
    std::cout << (ok ? "PASSED" : "FAILED") << "\n";
    if (!ok) ++failures;
}

static void test_agent_basic() {
    std::cout << "\n=== Test: MCTS Agent Basic ===\n";

    MCTSConfig config;
    config.budget = SearchBudget::iteration_count(100);
    config.random_seed = 42;

    MCTSAgent<GameState, Action> agent(config);
    UltimateGame game;
    GameState state = GameState::create_new_game();

    bool ok = true;

    // Select action
    Action action = agent.decide(game, state);
    std::cout << "  Selected action: " << to_string(action) << "\n";

    if (!action.is_valid()) {
        std::cout << "  ERROR: Agent returned an invalid action\n";
        ok = false;
    }

    // Get policy
    std::vector<ActionPolicy<Action>> policy = agent.get_action_policy(game, state);
    std::cout << "  Policy size: " << policy.size() << "\n";

    // Verify probabilities sum to ~1.0
    double prob_sum = 0.0;
    std::uint64_t visit_sum = 0;
    for (const auto& ap : policy) {
        prob_sum += ap.probability;
        visit_sum += ap.visits;
        if (ap.wins > ap.visits) {
            std::cout << "  ERROR: Wins exceed visits for " << to_string(ap.action) << "\n";
            ok = false;
        }
    }

    std::cout << "  Probability sum: " << prob_sum << "\n";
    std::cout << "  Visit sum: " << visit_sum << "\n";

    if (prob_sum < 0.99 || prob_sum > 1.01) {
        std::cout << "  ERROR: Probabilities should sum to 1.0\n";
        ok = false;
    }

    if (visit_sum == 0 || visit_sum > 100) {
        std::cout << "  ERROR: Root-child visits should be within the iteration budget\n";
        ok = false;
    }

    if (policy.size() != agent.search().get_root()->children.size()) {
        std::cout << "  ERROR: One policy entry per expanded root action\n";
        ok = false;
    }

    report(ok);
}

static void test_agent_policy_single_move() {
    std::cout << "\n=== Test: Agent Policy Single Move ===\n";

    MCTSConfig config;
    config.budget = SearchBudget::iteration_count(30);
    config.random_seed = 1;

    MCTSAgent<int, int> agent(config);
    toy::SingleMoveGame game;

    bool ok = true;

    auto policy = agent.get_action_policy(game, 0);

    if (policy.size() != 1 || policy[0].action != 7 || policy[0].probability != 1.0 ||
        policy[0].visits != 30) {
        std::cout << "  ERROR: Only action should carry the whole policy\n";
        ok = false;
    }

    report(ok);
}

static void test_agent_set_config() {
    std::cout << "\n=== Test: Agent Reconfiguration ===\n";

    MCTSConfig config;
    config.budget = SearchBudget::iteration_count(20);
    config.random_seed = 5;

    MCTSAgent<toy::NimState, int> agent(config);
    toy::NimGame game;
    toy::NimState state;
    state.stones = 10;

    bool ok = true;

    MCTSConfig bigger = config;
    bigger.budget = SearchBudget::iteration_count(60);
    agent.set_config(bigger);
    agent.decide(game, state);

    if (agent.get_config().budget.iterations != 60 ||
        agent.search().get_root()->visits != 60) {
        std::cout << "  ERROR: New budget should apply to the next search\n";
        ok = false;
    }

    // Rejected configuration leaves the agent unchanged
    MCTSConfig empty = config;
    empty.budget = SearchBudget::iteration_count(0);
    try {
        agent.set_config(empty);
        std::cout << "  ERROR: Empty budget should be rejected\n";
        ok = false;
    } catch (const EmptyBudget& e) {
        std::cout << "  Caught: " << e.what() << "\n";
    }

    if (agent.get_config().budget.iterations != 60) {
        std::cout << "  ERROR: Failed reconfiguration should keep the old config\n";
        ok = false;
    }

    agent.decide(game, state);
    if (agent.search().last_stats().iterations != 60) {
        std::cout << "  ERROR: Agent should still search with the old budget\n";
        ok = false;
    }

    report(ok);
}

static void test_agent_set_rollout() {
    std::cout << "\n=== Test: Agent Rollout Swap ===\n";

    MCTSConfig config;
    config.budget = SearchBudget::iteration_count(15);
    config.random_seed = 21;

    MCTSAgent<GameState, Action> agent(config);
    UltimateGame game;
    GameState state = GameState::create_new_game();

    bool ok = true;

    if (agent.search().rollout().name() != "random") {
        std::cout << "  ERROR: Default rollout should be random\n";
        ok = false;
    }

    RolloutConfig quick;
    quick.samples = 2;
    quick.lookahead_depth = 2;
    agent.set_rollout(std::make_shared<HeuristicRollout<GameState, Action>>(quick));

    Action action = agent.decide(game, state);
    std::cout << "  Heuristic agent selected: " << to_string(action) << "\n";

    if (agent.search().rollout().name() != "heuristic") {
        std::cout << "  ERROR: Rollout swap did not take effect\n";
        ok = false;
    }

    try {
        agent.set_rollout(nullptr);
        std::cout << "  ERROR: Null rollout should be rejected\n";
        ok = false;
    } catch (const std::invalid_argument&) {
    }

    if (agent.search().rollout().name() != "heuristic") {
        std::cout << "  ERROR: Rejected swap should keep the current rollout\n";
        ok = false;
    }

    report(ok);
}

static void test_agent_verbose() {
    std::cout << "\n=== Test: Agent Verbose Summary ===\n";

    MCTSConfig config;
    config.budget = SearchBudget::wall_clock(std::chrono::milliseconds(20));
    config.random_seed = 4;
    config.verbose = true;

    MCTSAgent<toy::NimState, int> agent(config);
    toy::NimGame game;
    toy::NimState state;
    state.stones = 12;

    bool ok = true;

    int take = agent.decide(game, state);
    std::cout << "  Took " << take << " stones after "
              << agent.search().last_stats().iterations << " iterations\n";

    if (take < 1 || take > 3) {
        std::cout << "  ERROR: Illegal take\n";
        ok = false;
    }

    report(ok);
}

static void test_agent_full_game() {
    std::cout << "\n=== Test: Agent Full Game ===\n";

    MCTSConfig config;
    config.budget = SearchBudget::iteration_count(30);  // Fast for testing
    config.random_seed = 99;

    MCTSAgent<GameState, Action> agent(config);
    UltimateGame game;
    GameState state = GameState::create_new_game();

    bool ok = true;
    int moves = 0;

    auto start = std::chrono::high_resolution_clock::now();

    while (!game.is_ended(state)) {
        state = game.next_state(state, agent.decide(game, state));
        moves++;
    }

    auto end = std::chrono::high_resolution_clock::now();
    auto duration = std::chrono::duration_cast<std::chrono::milliseconds>(end - start);

    std::cout << "  Moves: " << moves << ", marks: " << state.ply_count << "\n";
    std::cout << "  Winner: Player " << static_cast<int>(state.get_winner()) << "\n";
    std::cout << "  Boxes: " << static_cast<int>(state.count_boxes(kPlayerOne)) << " / "
              << static_cast<int>(state.count_boxes(kPlayerTwo)) << "\n";
    std::cout << "  Time: " << duration.count() << " ms\n";

    if (state.ply_count != moves) {
        std::cout << "  ERROR: Every decision should place exactly one mark\n";
        ok = false;
    }

    if (state.get_winner() != kNoPlayer &&
        state.current_player != opponent_of(state.get_winner())) {
        std::cout << "  ERROR: Loser should be left to move\n";
        ok = false;
    }

    report(ok);
}

int main() {
    std::cout << "========================================\n";
    std::cout << "  MCTS Agent Test Suite\n";
    std::cout << "========================================\n";

    test_agent_basic();
    test_agent_policy_single_move();
    test_agent_set_config();
    test_agent_set_rollout();
    test_agent_verbose();
    test_agent_full_game();

    std::cout << "\n========================================\n";
    std::cout << "  MCTS Agent Test Suite Complete! (" << failures << " failed)\n";
    std::cout << "========================================\n";

    return failures == 0 ? 0 : 1;
}
