#include "Attacks.hpp"
#include "BitUtil.hpp"

#include <algorithm>
#include <iostream>
#include <vector>

namespace Attacks {

std::array<Magic, 64> RookMagics;
std::array<Magic, 64> BishopMagics;
std::array<Bitboard, ROOK_TABLE_SIZE> RookTable;
std::array<Bitboard, BISHOP_TABLE_SIZE> BishopTable;

namespace {
    // Xorshift, fixed seed so the magic search is reproducible.
    uint64_t random_state = 1804289383;

    uint64_t get_random_u64() {
        uint64_t x = random_state;
        x ^= x << 13;
        x ^= x >> 7;
        x ^= x << 17;
        random_state = x;
        return x;
    }

    uint64_t get_random_u64_sparse() {
        return get_random_u64() & get_random_u64() & get_random_u64();
    }

    using detail::Step;

    constexpr std::array<Step, 4> ROOK_DIRECTIONS{{{0, 1}, {1, 0}, {0, -1}, {-1, 0}}};
    constexpr std::array<Step, 4> BISHOP_DIRECTIONS{{{1, 1}, {1, -1}, {-1, -1}, {-1, 1}}};

    bool on_board(int file, int rank) {
        return file >= 0 && file < 8 && rank >= 0 && rank < 8;
    }

    // Sliding attacks walked square by square, stopping on (and including)
    // the first blocker. Only used to fill the magic tables.
    Bitboard walk_rays(int sq, Bitboard occ, const std::array<Step, 4>& directions) {
        Bitboard attacks = 0;
        for (const Step& dir : directions) {
            int file = sq % 8 + dir.file;
            int rank = sq / 8 + dir.rank;
            while (on_board(file, rank)) {
                const Bitboard b = 1ULL << (rank * 8 + file);
                attacks |= b;
                if (occ & b) break;
                file += dir.file;
                rank += dir.rank;
            }
        }
        return attacks;
    }

    // Squares whose occupancy can change the attack set: every ray square
    // except the last one before the edge.
    Bitboard relevant_mask(int sq, const std::array<Step, 4>& directions) {
        Bitboard mask = 0;
        for (const Step& dir : directions) {
            int file = sq % 8 + dir.file;
            int rank = sq / 8 + dir.rank;
            while (on_board(file + dir.file, rank + dir.rank)) {
                mask |= 1ULL << (rank * 8 + file);
                file += dir.file;
                rank += dir.rank;
            }
        }
        return mask;
    }

    // The index-th subset of mask, bit i of index selecting the i-th set bit.
    Bitboard set_occupancy(int index, int bits_in_mask, Bitboard mask) {
        Bitboard occ = 0ULL;
        for (int i = 0; i < bits_in_mask; ++i) {
            Square square = BitUtil::pop_lsb(mask);
            if (index & (1 << i)) BitUtil::set_bit(occ, square);
        }
        return occ;
    }

    template <size_t TableSize>
    void find_magics(const std::array<Step, 4>& directions,
                     std::array<Magic, 64>& magics,
                     std::array<Bitboard, TableSize>& table) {
        uint32_t base = 0;

        for (int sq = 0; sq < 64; ++sq) {
            const Bitboard mask = relevant_mask(sq, directions);
            const int bits = BitUtil::count_bits(mask);
            const int subsets = 1 << bits;

            std::vector<Bitboard> occupancies(subsets);
            std::vector<Bitboard> attacks(subsets);
            for (int i = 0; i < subsets; ++i) {
                occupancies[i] = set_occupancy(i, bits, mask);
                attacks[i] = walk_rays(sq, occupancies[i], directions);
            }

            Magic candidate{mask, 0, base, 64 - bits};
            std::vector<int> owner(subsets);

            while (true) {
                candidate.multiplier = get_random_u64_sparse();
                // Weak multipliers leave the top byte nearly empty
                if (BitUtil::count_bits((mask * candidate.multiplier) & 0xFF00000000000000ULL) < 6) continue;

                std::fill(owner.begin(), owner.end(), -1);
                bool collision = false;
                for (int i = 0; i < subsets && !collision; ++i) {
                    const size_t idx = candidate.index(occupancies[i]);
                    // Sharing a slot is fine only when the attack sets agree.
                    if (owner[idx] != -1 && attacks[owner[idx]] != attacks[i]) collision = true;
                    else owner[idx] = i;
                }
                if (!collision) break;
            }

            for (int i = 0; i < subsets; ++i) {
                table[base + candidate.index(occupancies[i])] = attacks[i];
            }
            magics[sq] = candidate;
            base += static_cast<uint32_t>(subsets);
        }
    }

    bool build_tables() {
        find_magics(ROOK_DIRECTIONS, RookMagics, RookTable);
        find_magics(BISHOP_DIRECTIONS, BishopMagics, BishopTable);
        return true;
    }
}

void init() {
    // Function-local static: the search runs once even with concurrent callers.
    static const bool initialized = build_tables();
    (void)initialized;
}

std::string format_bitboard(Bitboard b) {
    std::string out;
    for (int rank = 7; rank >= 0; --rank) {
        out += rank_char(rank);
        out += "  ";
        for (int file = 0; file < 8; ++file) {
            out += BitUtil::get_bit(b, make_square(file, rank)) ? 'X' : '.';
            if (file < 7) out += ' ';
        }
        out += '\n';
    }
    out += "\n   a b c d e f g h\n";
    return out;
}

void print_bitboard(Bitboard b) {
    std::cout << format_bitboard(b);
}

bool is_square_attacked(Square sq, Colour attacker, const Bitboard pieces[], Bitboard all_occ) {
    int s = static_cast<int>(sq);
    int us = static_cast<int>(attacker);
    int them = us ^ 1;

    if (PawnAttacks[them][s] & pieces[us * 6]) return true;
    if (KnightAttacks[s] & pieces[us * 6 + 1]) return true;
    if (KingAttacks[s]   & pieces[us * 6 + 5]) return true;

    Bitboard bishops = pieces[us * 6 + 2] | pieces[us * 6 + 4];
    if (bishops && (get_bishop_attacks(s, all_occ) & bishops)) return true;

    Bitboard rooks = pieces[us * 6 + 3] | pieces[us * 6 + 4];
    if (rooks && (get_rook_attacks(s, all_occ) & rooks)) return true;

    return false;
}

Bitboard attackers_to(Square sq, Colour attacker, const Bitboard pieces[], Bitboard all_occ) {
    int s = static_cast<int>(sq);
    int us = static_cast<int>(attacker);
    int them = us ^ 1;

    Bitboard found = PawnAttacks[them][s] & pieces[us * 6];
    found |= KnightAttacks[s] & pieces[us * 6 + 1];
    found |= KingAttacks[s] & pieces[us * 6 + 5];
    found |= get_bishop_attacks(s, all_occ) & (pieces[us * 6 + 2] | pieces[us * 6 + 4]);
    found |= get_rook_attacks(s, all_occ) & (pieces[us * 6 + 3] | pieces[us * 6 + 4]);
    return found;
}

}
