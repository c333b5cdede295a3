#pragma once

#include "Board.hpp"

#include <string>
#include <string_view>


namespace San {
    // Standard algebraic text for `move`, which must be legal on `board`.
    // Includes the +/# suffix.
    std::string render(const Board& board, Move move);

    // Matches `token` against the legal moves of `board`. Check, capture
    // and annotation marks are ignored. Throws SanError.
    Move resolve(const Board& board, std::string_view token);
}
