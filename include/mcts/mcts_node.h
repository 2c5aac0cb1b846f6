// mcts_node.h
// MCTS tree node for UCT search with random or heuristic rollouts.
// The tree owns its nodes top-down; parent links are non-owning.

#pragma once

#include "mcts_config.h"
#include <cstdint>
#include <memory>
#include <utility>
#include <vector>

namespace uct {
namespace mcts {

// UCT score: w/n + c * sqrt(ln(N) / n).
// Requires visits > 0 and parent_visits > 0.
double uct_score(std::uint32_t wins, std::uint32_t visits,
                 std::uint32_t parent_visits, double exploration_constant);

// Whether a candidate score replaces the current best under the tie-break rule.
bool takes_lead(double candidate, double best, TieBreak tie_break);

// MCTS tree node
// Each node stands for the state reached by replaying the actions on the path
// from the root; the state itself is never stored.
template <typename Action>
struct MCTSNode {
    MCTSNode() = default;

    MCTSNode(MCTSNode* parent_node, const Action& parent_action, std::vector<Action> actions)
        : parent(parent_node)
        , action(parent_action)
        , untried_actions(std::move(actions))
    {}

    MCTSNode(const MCTSNode&) = delete;
    MCTSNode& operator=(const MCTSNode&) = delete;

    // Parent node (nullptr for root)
    MCTSNode* parent{nullptr};

    // Action taken from parent to reach this node (unused for root)
    Action action{};

    // Children nodes, one per expanded action
    std::vector<std::unique_ptr<MCTSNode>> children{};

    // Legal actions from this state not yet expanded into a child
    std::vector<Action> untried_actions{};

    // Statistics, from the searching player's perspective
    std::uint32_t visits{0};
    std::uint32_t wins{0};

    bool is_fully_expanded() const {
        return untried_actions.empty();
    }

    // Fully expanded with no children: no legal actions at this state.
    bool is_terminal() const {
        return untried_actions.empty() && children.empty();
    }

    double win_rate() const {
        if (visits == 0) return 0.0;
        return static_cast<double>(wins) / static_cast<double>(visits);
    }

    double get_ucb_score(double exploration_constant) const {
        return uct_score(wins, visits, parent->visits, exploration_constant);
    }

    MCTSNode* add_child(std::unique_ptr<MCTSNode> child) {
        MCTSNode* child_ptr = child.get();
        children.push_back(std::move(child));
        return child_ptr;
    }

    MCTSNode* find_child(const Action& a) const {
        for (const auto& child : children) {
            if (child->action == a) {
                return child.get();
            }
        }
        return nullptr;
    }

    // Child to descend into, or nullptr if no child scores above zero.
    // Only meaningful once every child has been visited.
    MCTSNode* select_child(double exploration_constant, TieBreak tie_break) const {
        MCTSNode* best_child = nullptr;
        double best_score = 0.0;

        for (const auto& child : children) {
            double score = child->get_ucb_score(exploration_constant);
            if (score <= 0.0) continue;

            if (best_child == nullptr || takes_lead(score, best_score, tie_break)) {
                best_score = score;
                best_child = child.get();
            }
        }

        return best_child;
    }

    // Child with the highest empirical win rate (for final action selection).
    MCTSNode* get_best_win_rate_child(TieBreak tie_break) const {
        MCTSNode* best_child = nullptr;
        double best_value = 0.0;

        for (const auto& child : children) {
            double value = child->win_rate();
            if (best_child == nullptr || takes_lead(value, best_value, tie_break)) {
                best_value = value;
                best_child = child.get();
            }
        }

        return best_child;
    }

    // Number of nodes in the subtree rooted here, including this node.
    std::size_t subtree_size() const {
        std::size_t count = 0;
        std::vector<const MCTSNode*> stack{this};
        while (!stack.empty()) {
            const MCTSNode* node = stack.back();
            stack.pop_back();
            ++count;
            for (const auto& child : node->children) {
                stack.push_back(child.get());
            }
        }
        return count;
    }
};

} // namespace mcts
} // namespace uct
