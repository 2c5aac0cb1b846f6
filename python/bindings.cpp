// bindings.cpp
// Python bindings for the UCT engine using pybind11

#include <pybind11/pybind11.h>
#include <pybind11/stl.h>
#include <pybind11/chrono.h>
#include <pybind11/operators.h>
#include <memory>
#include <stdexcept>
#include <string>

#include "game_state.h"
#include "action.h"
#include "move_gen.h"
#include "state_transition.h"
#include "ultimate_game.h"
#include "mcts/mcts_agent.h"

namespace py = pybind11;

using namespace uct;
using namespace uct::mcts;

using UltimateAgent = MCTSAgent<GameState, Action>;
using UltimateRollout = RolloutPolicy<GameState, Action>;

// Strategy by name: "random" or "heuristic".
static std::shared_ptr<const UltimateRollout> make_rollout(const std::string& name,
                                                           const RolloutConfig& config) {
    if (name == "random") {
        return std::make_shared<RandomRollout<GameState, Action>>(config);
    }
    if (name == "heuristic") {
        return std::make_shared<HeuristicRollout<GameState, Action>>(config);
    }
    throw std::invalid_argument("unknown rollout strategy '" + name + "'");
}

PYBIND11_MODULE(uct_engine, m) {
    m.doc() = "UCT Engine - Monte Carlo Tree Search with Ultimate Tic-Tac-Toe reference game";

    // ========================================================================
    // Errors
    // ========================================================================

    auto& search_error = py::register_exception<SearchError>(m, "SearchError");
    py::register_exception<InvalidState>(m, "InvalidState", search_error.ptr());
    py::register_exception<EmptyBudget>(m, "EmptyBudget", search_error.ptr());
    py::register_exception<GameInterfaceViolation>(m, "GameInterfaceViolation", search_error.ptr());

    // ========================================================================
    // Constants
    // ========================================================================

    m.attr("NO_PLAYER") = kNoPlayer;
    m.attr("PLAYER_ONE") = kPlayerOne;
    m.attr("PLAYER_TWO") = kPlayerTwo;
    m.attr("DRAWN_BOX") = DRAWN_BOX;
    m.attr("ANY_BOX") = ANY_BOX;

    // ========================================================================
    // Enums
    // ========================================================================

    py::enum_<BudgetMode>(m, "BudgetMode")
        .value("Iterations", BudgetMode::Iterations)
        .value("TimeLimit", BudgetMode::TimeLimit)
        .export_values();

    py::enum_<TieBreak>(m, "TieBreak")
        .value("KeepFirst", TieBreak::KeepFirst)
        .value("KeepLast", TieBreak::KeepLast)
        .export_values();

    // ========================================================================
    // Action
    // ========================================================================

    py::class_<Action>(m, "Action")
        .def(py::init<>())
        .def_readwrite("box", &Action::box)
        .def_readwrite("cell", &Action::cell)
        .def_static("place", &Action::place, py::arg("box"), py::arg("cell"))
        .def_static("at", &Action::at,
            py::arg("box_row"), py::arg("box_col"), py::arg("cell_row"), py::arg("cell_col"),
            "Action from board coordinates")
        .def("is_valid", &Action::is_valid)
        .def(py::self == py::self)
        .def(py::self != py::self)
        .def("__repr__", [](const Action& a) {
            return "Action" + to_string(a);
        });

    // ========================================================================
    // GameState
    // ========================================================================

    py::class_<GameState>(m, "GameState")
        .def(py::init<>())
        .def_static("create_new_game", &GameState::create_new_game,
            "Create an empty board with player one to move")
        .def_readonly("cells", &GameState::cells,
            "Marks indexed box * 9 + cell")
        .def_readonly("box_owners", &GameState::box_owners,
            "Owner of each box (NO_PLAYER, a player, or DRAWN_BOX)")
        .def_readwrite("current_player", &GameState::current_player)
        .def_readwrite("target_box", &GameState::target_box)
        .def_readonly("ply_count", &GameState::ply_count)
        .def("is_game_over", &GameState::is_game_over)
        .def("get_winner", &GameState::get_winner)
        .def("cell_at", &GameState::cell_at, py::arg("box"), py::arg("cell"))
        .def("is_box_open", &GameState::is_box_open, py::arg("box"))
        .def("count_boxes", &GameState::count_boxes, py::arg("player"))
        .def("copy", [](const GameState& state) {
            return GameState(state);
        }, "Create a copy of the game state")
        .def("__repr__", [](const GameState& state) {
            return "GameState(plies=" + std::to_string(state.ply_count) +
                   ", to_move=" + std::to_string(static_cast<int>(state.current_player)) +
                   ", over=" + (state.is_game_over() ? "True" : "False") + ")";
        });

    // ========================================================================
    // Move Generation and State Transition
    // ========================================================================

    m.def("generate_legal_actions",
        [](const GameState& state) {
            std::vector<Action> actions;
            generate_legal_actions(state, actions);
            return actions;
        },
        py::arg("state"),
        "Generate all legal actions from current state");

    m.def("is_action_legal", &is_action_legal, py::arg("state"), py::arg("action"));

    m.def("apply_action", &apply_action,
        py::arg("state"),
        py::arg("action"),
        "Apply action to game state (mutates state in-place, False if illegal)");

    py::class_<UltimateGame>(m, "UltimateGame")
        .def(py::init<>())
        .def("legal_actions", &UltimateGame::legal_actions, py::arg("state"))
        .def("next_state", &UltimateGame::next_state, py::arg("state"), py::arg("action"),
            "Successor state; raises ValueError for an illegal action")
        .def("current_player", &UltimateGame::current_player, py::arg("state"))
        .def("is_ended", &UltimateGame::is_ended, py::arg("state"))
        .def("owned_boxes", &UltimateGame::owned_boxes, py::arg("state"))
        .def("points_values", &UltimateGame::points_values, py::arg("state"));

    // ========================================================================
    // Configuration
    // ========================================================================

    py::class_<SearchBudget>(m, "SearchBudget")
        .def(py::init<>())
        .def_readwrite("mode", &SearchBudget::mode)
        .def_readwrite("iterations", &SearchBudget::iterations)
        .def_readwrite("time_limit", &SearchBudget::time_limit)
        .def_static("iteration_count", &SearchBudget::iteration_count, py::arg("n"))
        .def_static("wall_clock", &SearchBudget::wall_clock, py::arg("limit"));

    py::class_<MCTSConfig>(m, "MCTSConfig")
        .def(py::init<>())
        .def_readwrite("budget", &MCTSConfig::budget)
        .def_readwrite("exploration_constant", &MCTSConfig::exploration_constant)
        .def_readwrite("tie_break", &MCTSConfig::tie_break)
        .def_readwrite("random_seed", &MCTSConfig::random_seed)
        .def_readwrite("verbose", &MCTSConfig::verbose)
        .def("__repr__", [](const MCTSConfig& cfg) {
            return "MCTSConfig(budget=" + to_string(cfg.budget.mode) +
                   ", c=" + std::to_string(cfg.exploration_constant) +
                   ", tie_break=" + to_string(cfg.tie_break) + ")";
        });

    py::class_<RolloutConfig>(m, "RolloutConfig")
        .def(py::init<>())
        .def_readwrite("samples", &RolloutConfig::samples)
        .def_readwrite("lookahead_depth", &RolloutConfig::lookahead_depth)
        .def_readwrite("points_scale", &RolloutConfig::points_scale)
        .def_readwrite("max_plies", &RolloutConfig::max_plies);

    // ========================================================================
    // Search Results
    // ========================================================================

    py::class_<ActionPolicy<Action>>(m, "ActionPolicy")
        .def(py::init<>())
        .def_readwrite("action", &ActionPolicy<Action>::action)
        .def_readwrite("probability", &ActionPolicy<Action>::probability)
        .def_readwrite("visits", &ActionPolicy<Action>::visits)
        .def_readwrite("wins", &ActionPolicy<Action>::wins)
        .def("__repr__", [](const ActionPolicy<Action>& ap) {
            return "ActionPolicy(action=" + to_string(ap.action) +
                   ", prob=" + std::to_string(ap.probability) +
                   ", visits=" + std::to_string(ap.visits) + ")";
        });

    py::class_<SearchStats>(m, "SearchStats")
        .def(py::init<>())
        .def_readonly("iterations", &SearchStats::iterations)
        .def_readonly("tree_nodes", &SearchStats::tree_nodes)
        .def_readonly("elapsed", &SearchStats::elapsed);

    // ========================================================================
    // MCTS Agent
    // ========================================================================

    py::class_<UltimateAgent>(m, "MCTSAgent")
        .def(py::init([](const MCTSConfig& config, const std::string& rollout,
                         const RolloutConfig& rollout_config) {
                return std::make_unique<UltimateAgent>(config, make_rollout(rollout, rollout_config));
            }),
            py::arg("config") = MCTSConfig(),
            py::arg("rollout") = "random",
            py::arg("rollout_config") = RolloutConfig(),
            "Create MCTS agent with configuration and rollout strategy ('random' or 'heuristic')")
        .def("decide", [](UltimateAgent& agent, const UltimateGame& game, const GameState& state) {
                return agent.decide(game, state);
            },
            py::arg("game"), py::arg("state"),
            "Select best action from game state")
        .def("get_action_policy", [](UltimateAgent& agent, const UltimateGame& game, const GameState& state) {
                return agent.get_action_policy(game, state);
            },
            py::arg("game"), py::arg("state"),
            "Search and return visit statistics of every expanded root action")
        .def("last_stats", [](const UltimateAgent& agent) {
            return agent.search().last_stats();
        })
        .def("rollout_name", [](const UltimateAgent& agent) {
            return agent.search().rollout().name();
        })
        .def("get_config", &UltimateAgent::get_config,
            py::return_value_policy::reference_internal)
        .def("set_config", &UltimateAgent::set_config,
            py::arg("config"))
        .def("set_rollout", [](UltimateAgent& agent, const std::string& rollout,
                               const RolloutConfig& rollout_config) {
                agent.set_rollout(make_rollout(rollout, rollout_config));
            },
            py::arg("rollout"),
            py::arg("rollout_config") = RolloutConfig());

    // ========================================================================
    // Free Functions
    // ========================================================================

    m.def("decide",
        [](const UltimateGame& game, const GameState& state, const MCTSConfig& config,
           const std::string& rollout, const RolloutConfig& rollout_config) {
            return decide<GameState, Action>(game, state, config, make_rollout(rollout, rollout_config));
        },
        py::arg("game"),
        py::arg("state"),
        py::arg("config") = MCTSConfig(),
        py::arg("rollout") = "random",
        py::arg("rollout_config") = RolloutConfig(),
        "One-shot search from a state");
}
