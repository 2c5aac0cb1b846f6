// mcts_config.h
// Search configuration: stopping rule, exploration constant, tie-break rule.

#pragma once

#include <chrono>
#include <cstdint>
#include <string>

namespace uct {
namespace mcts {

// Stopping rule for the iteration loop.
enum class BudgetMode : std::uint8_t {
    Iterations,         // Run a fixed number of iterations
    TimeLimit           // Run until a wall-clock duration has elapsed
};

struct SearchBudget {
    BudgetMode mode{BudgetMode::Iterations};
    std::uint32_t iterations{1000};
    std::chrono::milliseconds time_limit{1000};

    static SearchBudget iteration_count(std::uint32_t n) {
        SearchBudget b;
        b.mode = BudgetMode::Iterations;
        b.iterations = n;
        return b;
    }

    static SearchBudget wall_clock(std::chrono::milliseconds limit) {
        SearchBudget b;
        b.mode = BudgetMode::TimeLimit;
        b.time_limit = limit;
        return b;
    }
};

// How equal scores are resolved when comparing children in scan order.
// Applies both to UCT descent and to the final action choice.
// MCTSConfig defaults to KeepFirst for both; KeepLast gives the final choice
// the later of two equal win rates, at the cost of also doing so in descent.
enum class TieBreak : std::uint8_t {
    KeepFirst,          // Strict '>': the earliest child keeps the lead
    KeepLast            // '>=': the latest child takes the lead
};

struct MCTSConfig {
    SearchBudget budget{};                  // Iteration count or time limit
    double exploration_constant{2.0};       // UCT exploration parameter C
    TieBreak tie_break{TieBreak::KeepFirst};
    std::uint32_t random_seed{0};           // Seed for randomness (0 = time-based)
    bool verbose{false};                    // Print a one-line summary per search to stderr
};

// Throws EmptyBudget for a zero iteration count or non-positive duration,
// std::invalid_argument for a non-positive or non-finite exploration constant.
void validate_config(const MCTSConfig& config);

std::string to_string(BudgetMode mode);
std::string to_string(TieBreak tie_break);

} // namespace mcts
} // namespace uct
