#include "Zobrist.hpp"
#include <random>

namespace Zobrist {
    std::array<std::array<uint64_t, 64>, 12> piece_keys;
    std::array<uint64_t, 65> en_passant_keys;
    std::array<uint64_t, 16> castle_keys;
    uint64_t side_key;

    namespace {
        bool fill_keys() {
            std::mt19937_64 rng(123456789ULL);
            std::uniform_int_distribution<uint64_t> dist;

            for (auto& row : piece_keys) {
                for (auto& key : row) key = dist(rng);
            }

            for (int sq = 0; sq < 64; ++sq) {
                en_passant_keys[sq] = dist(rng);
            }
            en_passant_keys[64] = 0;

            // No rights hashes to zero so an empty board keys to zero.
            castle_keys[0] = 0;
            for (int i = 1; i < 16; ++i) {
                castle_keys[i] = dist(rng);
            }

            side_key = dist(rng);
            return true;
        }
    }

    void init() {
        static const bool initialized = fill_keys();
        (void)initialized;
    }
}
