// game_state.cpp
// Implementation of Ultimate Tic-Tac-Toe game state.

#include "game_state.h"
#include <algorithm>

namespace uct {

bool has_line(const Grid& grid, PlayerId player) {
    for (const auto& line : GRID_LINES) {
        if (grid[line[0]] == player && grid[line[1]] == player && grid[line[2]] == player) {
            return true;
        }
    }
    return false;
}

GameState GameState::create_new_game() {
    GameState state;

    state.cells.fill(kNoPlayer);
    state.box_owners.fill(kNoPlayer);

    // Player one opens anywhere
    state.current_player = kPlayerOne;
    state.target_box = ANY_BOX;
    state.finished = false;
    state.winner = kNoPlayer;
    state.ply_count = 0;

    return state;
}

Grid GameState::box_grid(std::uint8_t box_idx) const {
    Grid grid{};
    for (std::uint8_t c = 0; c < CELLS_PER_BOX; ++c) {
        grid[c] = cell_at(box_idx, c);
    }
    return grid;
}

bool GameState::is_box_full(std::uint8_t box_idx) const {
    for (std::uint8_t c = 0; c < CELLS_PER_BOX; ++c) {
        if (is_cell_empty(box_idx, c)) return false;
    }
    return true;
}

bool GameState::any_open_box() const {
    for (std::uint8_t b = 0; b < NUM_BOXES; ++b) {
        if (is_box_open(b)) return true;
    }
    return false;
}

std::uint8_t GameState::count_boxes(PlayerId player) const {
    return static_cast<std::uint8_t>(std::count(box_owners.begin(), box_owners.end(), player));
}

void GameState::place_mark(PlayerId player, std::uint8_t box_idx, std::uint8_t cell_idx) {
    if (box_idx >= NUM_BOXES || cell_idx >= CELLS_PER_BOX) return;
    if (!is_cell_empty(box_idx, cell_idx)) return;

    cells[box_idx * CELLS_PER_BOX + cell_idx] = player;
    ply_count++;

    update_box_owner(box_idx);
}

void GameState::update_box_owner(std::uint8_t box_idx) {
    // Decided boxes never change hands
    if (box_owners[box_idx] != kNoPlayer) return;

    const Grid grid = box_grid(box_idx);
    if (has_line(grid, kPlayerOne)) {
        box_owners[box_idx] = kPlayerOne;
    } else if (has_line(grid, kPlayerTwo)) {
        box_owners[box_idx] = kPlayerTwo;
    } else if (is_box_full(box_idx)) {
        box_owners[box_idx] = DRAWN_BOX;
    }
}

} // namespace uct
