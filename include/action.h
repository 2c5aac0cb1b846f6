// action.h
// Compact action representation for Ultimate Tic-Tac-Toe.
// Used for move generation, MCTS tree edges, and state transitions.

#pragma once

#include <cstdint>
#include <string>

namespace uct {

constexpr std::uint8_t GRID_SIDE = 3;
constexpr std::uint8_t INVALID_INDEX = 0xFF;

// Mark placement: one cell of one box.
// Boxes and cells are both indexed row-major, 0..8.
struct Action {
    std::uint8_t box{INVALID_INDEX};
    std::uint8_t cell{INVALID_INDEX};

    static Action place(std::uint8_t box_idx, std::uint8_t cell_idx) {
        Action a;
        a.box = box_idx;
        a.cell = cell_idx;
        return a;
    }

    // Box at (box_row, box_col) of the big board, cell at (cell_row, cell_col) inside it.
    static Action at(std::uint8_t box_row, std::uint8_t box_col,
                     std::uint8_t cell_row, std::uint8_t cell_col) {
        return place(static_cast<std::uint8_t>(box_row * GRID_SIDE + box_col),
                     static_cast<std::uint8_t>(cell_row * GRID_SIDE + cell_col));
    }

    std::uint8_t box_row() const { return box / GRID_SIDE; }
    std::uint8_t box_col() const { return box % GRID_SIDE; }
    std::uint8_t cell_row() const { return cell / GRID_SIDE; }
    std::uint8_t cell_col() const { return cell % GRID_SIDE; }

    bool is_valid() const { return box < 9 && cell < 9; }

    bool operator==(const Action& other) const {
        return box == other.box && cell == other.cell;
    }

    bool operator!=(const Action& other) const {
        return !(*this == other);
    }
};

// "(R, C, r, c)" in board coordinates.
inline std::string to_string(const Action& a) {
    return "(" + std::to_string(a.box_row()) + ", " + std::to_string(a.box_col()) + ", " +
           std::to_string(a.cell_row()) + ", " + std::to_string(a.cell_col()) + ")";
}

} // namespace uct
