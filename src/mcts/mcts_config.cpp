// mcts_config.cpp
// Validation of search configuration.

#include "mcts/mcts_config.h"
#include "mcts/errors.h"
#include <cmath>
#include <stdexcept>

namespace uct {
namespace mcts {

void validate_config(const MCTSConfig& config) {
    const SearchBudget& budget = config.budget;

    switch (budget.mode) {
        case BudgetMode::Iterations:
            if (budget.iterations == 0) {
                throw EmptyBudget("iteration budget must be at least 1");
            }
            break;
        case BudgetMode::TimeLimit:
            if (budget.time_limit.count() <= 0) {
                throw EmptyBudget("time budget must be positive, got " +
                                  std::to_string(budget.time_limit.count()) + " ms");
            }
            break;
    }

    if (!std::isfinite(config.exploration_constant) || config.exploration_constant <= 0.0) {
        throw std::invalid_argument("exploration constant must be positive and finite, got " +
                                    std::to_string(config.exploration_constant));
    }
}

std::string to_string(BudgetMode mode) {
    switch (mode) {
        case BudgetMode::Iterations: return "iterations";
        case BudgetMode::TimeLimit:  return "time_limit";
    }
    return "unknown";
}

std::string to_string(TieBreak tie_break) {
    switch (tie_break) {
        case TieBreak::KeepFirst: return "keep_first";
        case TieBreak::KeepLast:  return "keep_last";
    }
    return "unknown";
}

} // namespace mcts
} // namespace uct
