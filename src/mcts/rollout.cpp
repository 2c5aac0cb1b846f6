// rollout.cpp
// Outcome scoring for heuristic rollouts.

#include "mcts/rollout.h"
#include <algorithm>
#include <stdexcept>
#include <string>

namespace uct {
namespace mcts {

void validate_rollout_config(const RolloutConfig& config) {
    if (config.samples == 0) {
        throw std::invalid_argument("rollout samples must be at least 1");
    }
    if (config.max_plies == 0) {
        throw std::invalid_argument("rollout ply cap must be at least 1");
    }
}

double score_outcome(const OwnedBoxes& owned,
                     const std::optional<PointTally>& points,
                     PlayerId me,
                     double points_scale) {
    if (me != kPlayerOne && me != kPlayerTwo) {
        throw std::invalid_argument("outcome scored for unknown player " + std::to_string(me));
    }
    const PlayerId opponent = opponent_of(me);

    if (points.has_value()) {
        auto points_of = [&points](PlayerId player) {
            auto it = points->find(player);
            return it == points->end() ? 0 : it->second;
        };
        return points_scale * static_cast<double>(points_of(me) - points_of(opponent));
    }

    auto my_cells = std::count(owned.begin(), owned.end(), me);
    auto their_cells = std::count(owned.begin(), owned.end(), opponent);
    return static_cast<double>(my_cells - their_cells);
}

} // namespace mcts
} // namespace uct
