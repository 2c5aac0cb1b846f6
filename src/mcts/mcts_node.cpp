// mcts_node.cpp
// UCT arithmetic shared by all node instantiations.

#include "mcts/mcts_node.h"
#include <cmath>

namespace uct {
namespace mcts {

double uct_score(std::uint32_t wins, std::uint32_t visits,
                 std::uint32_t parent_visits, double exploration_constant) {
    // UCB1: exploitation + exploration
    double n = static_cast<double>(visits);
    double exploitation = static_cast<double>(wins) / n;
    double exploration = exploration_constant *
        std::sqrt(std::log(static_cast<double>(parent_visits)) / n);

    return exploitation + exploration;
}

bool takes_lead(double candidate, double best, TieBreak tie_break) {
    if (tie_break == TieBreak::KeepLast) {
        return candidate >= best;
    }
    return candidate > best;
}

} // namespace mcts
} // namespace uct
