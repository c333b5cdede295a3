#pragma once

#include "Board.hpp"

#include <string>
#include <string_view>


namespace Fen {
    // Builds a fresh Board. Every field is validated; failures throw
    // FenError naming the offending field.
    Board parse(std::string_view fen);

    std::string serialize(const Board& board);
}
