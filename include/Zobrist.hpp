#pragma once
#include "Types.hpp"
#include <array>

// Position keys. Seeded, so keys are identical across runs and builds.
namespace Zobrist {
    extern std::array<std::array<uint64_t, 64>, 12> piece_keys;
    // Slot 64 (no target) is zero.
    extern std::array<uint64_t, 65> en_passant_keys;
    // Indexed by the castling-rights mask; no rights is zero.
    extern std::array<uint64_t, 16> castle_keys;
    // Mixed in when black is to move.
    extern uint64_t side_key;

    void init();

    inline uint64_t piece(size_t index, Square sq) {
        return piece_keys[index][static_cast<int>(sq)];
    }

    inline uint64_t en_passant(Square target) {
        return en_passant_keys[static_cast<int>(target)];
    }
}
