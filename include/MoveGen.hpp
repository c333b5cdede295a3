#pragma once
#include "Board.hpp"
#include "MoveList.hpp"

namespace MoveGen {
    // Pseudo-legal moves for the side to move. Castling is already
    // filtered for attacked transit squares.
    void generate_moves(const Board& board, MoveList& move_list);

    // Pseudo-legal moves that do not leave the mover's king attacked.
    // The board is restored before returning.
    void generate_legal(Board& board, MoveList& move_list);
}
