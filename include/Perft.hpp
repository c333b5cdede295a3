#pragma once
#include "Board.hpp"

#include <cstdint>
#include <utility>
#include <vector>

namespace Perft {
    // Leaf count of the legal move tree to `depth` plies. The board is
    // restored before returning.
    uint64_t perft(Board& board, int depth);

    // Per root move leaf counts, in generation order.
    std::vector<std::pair<Move, uint64_t>> divide(Board& board, int depth);
}
