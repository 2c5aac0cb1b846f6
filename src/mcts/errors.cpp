// errors.cpp
// Search engine exceptions.

#include "mcts/errors.h"

namespace uct {
namespace mcts {

SearchError::SearchError(const std::string& what)
    : std::runtime_error(what)
{}

InvalidState::InvalidState(const std::string& what)
    : SearchError("invalid state: " + what)
{}

EmptyBudget::EmptyBudget(const std::string& what)
    : SearchError("empty budget: " + what)
{}

GameInterfaceViolation::GameInterfaceViolation(const std::string& what)
    : SearchError("game interface violation: " + what)
{}

} // namespace mcts
} // namespace uct
