#include "Perft.hpp"
#include "MoveGen.hpp"


namespace Perft {

uint64_t perft(Board& board, int depth) {
    if (depth <= 0) return 1ULL;

    MoveList moves;
    MoveGen::generate_legal(board, moves);

    // Bulk count at the frontier
    if (depth == 1) return moves.size();

    uint64_t nodes = 0;
    for (Move move : moves) {
        board.make_move(move);
        nodes += perft(board, depth - 1);
        board.undo_move();
    }
    return nodes;
}

std::vector<std::pair<Move, uint64_t>> divide(Board& board, int depth) {
    std::vector<std::pair<Move, uint64_t>> out;
    if (depth <= 0) return out;

    MoveList moves;
    MoveGen::generate_legal(board, moves);

    for (Move move : moves) {
        board.make_move(move);
        out.emplace_back(move, perft(board, depth - 1));
        board.undo_move();
    }
    return out;
}

}
