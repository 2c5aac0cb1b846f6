// errors.h
// Exceptions raised by the search engine.

#pragma once

#include <stdexcept>
#include <string>

namespace uct {
namespace mcts {

// Base class for all search failures.
class SearchError : public std::runtime_error {
public:
    explicit SearchError(const std::string& what);
};

// Search requested from a terminal state, or a finished search produced no root children.
class InvalidState : public SearchError {
public:
    explicit InvalidState(const std::string& what);
};

// Budget configured to zero iterations or a non-positive duration.
class EmptyBudget : public SearchError {
public:
    explicit EmptyBudget(const std::string& what);
};

// The Game implementation returned inconsistent results.
class GameInterfaceViolation : public SearchError {
public:
    explicit GameInterfaceViolation(const std::string& what);
};

} // namespace mcts
} // namespace uct
