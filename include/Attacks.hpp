#pragma once

#include "Types.hpp"
#include "BitUtil.hpp"

#include <array>
#include <string>


namespace Attacks {

// Sum over squares of 2^(relevant bits).
inline constexpr size_t ROOK_TABLE_SIZE = 102400;
inline constexpr size_t BISHOP_TABLE_SIZE = 5248;

struct Magic {
    Bitboard mask;       // relevant blockers, board edge excluded
    Bitboard multiplier;
    uint32_t base;       // first slot of this square in the shared table
    int shift;

    [[nodiscard]] size_t index(Bitboard occ) const {
        return ((occ & mask) * multiplier) >> shift;
    }
};

namespace detail {
    struct Step {
        int file;
        int rank;
    };

    inline constexpr std::array<Step, 8> KNIGHT_STEPS{{
        {1, 2}, {2, 1}, {2, -1}, {1, -2}, {-1, -2}, {-2, -1}, {-2, 1}, {-1, 2}}};
    inline constexpr std::array<Step, 8> KING_STEPS{{
        {0, 1}, {1, 1}, {1, 0}, {1, -1}, {0, -1}, {-1, -1}, {-1, 0}, {-1, 1}}};
    // Indexed by colour
    inline constexpr std::array<std::array<Step, 2>, 2> PAWN_CAPTURE_STEPS{{
        {{{-1, 1}, {1, 1}}},
        {{{-1, -1}, {1, -1}}}}};
    inline constexpr std::array<std::array<Step, 1>, 2> PAWN_PUSH_STEPS{{
        {{{0, 1}}},
        {{{0, -1}}}}};

    // Squares one step away from `sq`; steps that leave the board are dropped.
    template <size_t N>
    constexpr Bitboard step_targets(int sq, const std::array<Step, N>& steps) {
        Bitboard targets{0};
        for (const Step& step : steps) {
            const int file = sq % 8 + step.file;
            const int rank = sq / 8 + step.rank;
            if (file >= 0 && file < 8 && rank >= 0 && rank < 8) {
                targets |= 1ULL << (rank * 8 + file);
            }
        }
        return targets;
    }

    template <size_t N>
    constexpr std::array<Bitboard, 64> step_table(const std::array<Step, N>& steps) {
        std::array<Bitboard, 64> table{};
        for (int sq = 0; sq < 64; ++sq) table[sq] = step_targets(sq, steps);
        return table;
    }

    template <size_t N>
    constexpr std::array<std::array<Bitboard, 64>, 2> pawn_table(
        const std::array<std::array<Step, N>, 2>& steps) {
        return {step_table(steps[0]), step_table(steps[1])};
    }
}

// Leaper tables are built at compile time. Pawn pushes are a single step
// forward and empty on the last rank.
inline constexpr std::array<Bitboard, 64> KnightAttacks = detail::step_table(detail::KNIGHT_STEPS);
inline constexpr std::array<Bitboard, 64> KingAttacks = detail::step_table(detail::KING_STEPS);
inline constexpr std::array<std::array<Bitboard, 64>, 2> PawnAttacks = detail::pawn_table(detail::PAWN_CAPTURE_STEPS);
inline constexpr std::array<std::array<Bitboard, 64>, 2> PawnPushes = detail::pawn_table(detail::PAWN_PUSH_STEPS);

// Filled by init().
extern std::array<Magic, 64> RookMagics;
extern std::array<Magic, 64> BishopMagics;
extern std::array<Bitboard, ROOK_TABLE_SIZE> RookTable;
extern std::array<Bitboard, BISHOP_TABLE_SIZE> BishopTable;

// Searches the rook and bishop magics. Runs once per process; later calls
// return immediately.
void init();

// 8x8 grid, rank 8 first, 'X' for set bits.
std::string format_bitboard(Bitboard b);
void print_bitboard(Bitboard b);

bool is_square_attacked(Square sq, Colour attacker,
                        const Bitboard pieces[],
                        Bitboard all_occ);

// Every piece of `attacker` that attacks `sq`.
Bitboard attackers_to(Square sq, Colour attacker,
                      const Bitboard pieces[],
                      Bitboard all_occ);

inline Bitboard get_rook_attacks(int sq, Bitboard occ) {
    const Magic& m = RookMagics[sq];
    return RookTable[m.base + m.index(occ)];
}

inline Bitboard get_bishop_attacks(int sq, Bitboard occ) {
    const Magic& m = BishopMagics[sq];
    return BishopTable[m.base + m.index(occ)];
}

inline Bitboard get_queen_attacks(int sq, Bitboard occ) {
    return get_rook_attacks(sq, occ) | get_bishop_attacks(sq, occ);
}

}
