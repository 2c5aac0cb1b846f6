// game_state.h
// Ultimate Tic-Tac-Toe game state.
// Plain value type: fixed-size arrays only, cheap to copy for MCTS simulations.

#pragma once

#include <array>
#include <cstdint>
#include "action.h"
#include "mcts/game.h"

namespace uct {

using mcts::PlayerId;
using mcts::kNoPlayer;
using mcts::kPlayerOne;
using mcts::kPlayerTwo;

constexpr std::uint8_t NUM_BOXES = 9;
constexpr std::uint8_t CELLS_PER_BOX = 9;
constexpr std::uint8_t NUM_CELLS = NUM_BOXES * CELLS_PER_BOX;

// Box owner for a box filled without a line.
constexpr PlayerId DRAWN_BOX = 3;

// No forced box: the next move may go in any open box.
constexpr std::uint8_t ANY_BOX = 0xFF;

// The eight lines of a 3x3 grid (rows, columns, diagonals).
constexpr std::array<std::array<std::uint8_t, 3>, 8> GRID_LINES = {{
    {{0, 1, 2}}, {{3, 4, 5}}, {{6, 7, 8}},
    {{0, 3, 6}}, {{1, 4, 7}}, {{2, 5, 8}},
    {{0, 4, 8}}, {{2, 4, 6}}
}};

using Grid = std::array<PlayerId, 9>;

// Whether `player` holds a complete line of `grid`.
bool has_line(const Grid& grid, PlayerId player);

// Complete game state.
struct GameState {
    // Marks, indexed box * CELLS_PER_BOX + cell (kNoPlayer = empty).
    std::array<PlayerId, NUM_CELLS> cells{};

    // Owner of each box: kNoPlayer while undecided, a player, or DRAWN_BOX.
    Grid box_owners{};

    // Player to move. Once the game is over with a winner this is the loser.
    PlayerId current_player{kPlayerOne};

    // Box the next mark must go in, or ANY_BOX.
    std::uint8_t target_box{ANY_BOX};

    bool finished{false};
    PlayerId winner{kNoPlayer};

    // Marks placed so far.
    std::uint16_t ply_count{0};

    // Initialize an empty board with player one to move.
    static GameState create_new_game();

    bool is_game_over() const { return finished; }

    // Winner (kNoPlayer for a draw or an unfinished game).
    PlayerId get_winner() const { return winner; }

    PlayerId cell_at(std::uint8_t box_idx, std::uint8_t cell_idx) const {
        return cells[box_idx * CELLS_PER_BOX + cell_idx];
    }

    bool is_cell_empty(std::uint8_t box_idx, std::uint8_t cell_idx) const {
        return cell_at(box_idx, cell_idx) == kNoPlayer;
    }

    // Marks of one box as a 3x3 grid.
    Grid box_grid(std::uint8_t box_idx) const;

    bool is_box_full(std::uint8_t box_idx) const;

    // Undecided and with at least one empty cell.
    bool is_box_open(std::uint8_t box_idx) const {
        return box_owners[box_idx] == kNoPlayer && !is_box_full(box_idx);
    }

    bool any_open_box() const;

    // Number of boxes owned by a player.
    std::uint8_t count_boxes(PlayerId player) const;

    // Place a mark (caller must validate legality).
    void place_mark(PlayerId player, std::uint8_t box_idx, std::uint8_t cell_idx);

    // Recalculate the owner of a box after a mark was placed in it.
    void update_box_owner(std::uint8_t box_idx);
};

} // namespace uct
