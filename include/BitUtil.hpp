#pragma once

#include "Types.hpp"

#include <bit>


namespace BitUtil {
    constexpr Bitboard from_square(Square sq) {
        return 1ULL << static_cast<int>(sq);
    }

    constexpr void set_bit(Bitboard& bb, Square sq) { bb |= from_square(sq); }
    constexpr bool get_bit(Bitboard bb, Square sq) { return (bb & from_square(sq)) != 0; }

    // Square::None on an empty board.
    constexpr Square lsb(Bitboard bb) {
        if (bb == 0) return Square::None;
        return static_cast<Square>(std::countr_zero(bb));
    }

    constexpr Square pop_lsb(Bitboard& bb) {
        int index{std::countr_zero(bb)};
        bb &= bb - 1;
        return static_cast<Square>(index);
    }

    constexpr int count_bits(Bitboard bb) {
        return std::popcount(bb);
    }

    inline constexpr Bitboard RANK_1{0x00000000000000FFULL};
    inline constexpr Bitboard RANK_8{RANK_1 << 56};
    inline constexpr Bitboard FILE_A{0x0101010101010101ULL};
    inline constexpr Bitboard FILE_H{FILE_A << 7};
}
