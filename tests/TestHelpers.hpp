#pragma once

#include "Board.hpp"
#include "Game.hpp"

#include <initializer_list>
#include <string_view>

// --- TEST HELPERS ---

inline void add_piece(Board& b, Square sq, PieceType type, Colour colour) {
    b.put_piece(Piece{colour, type}, sq);
}

inline Board kings_only(Square white_king, Square black_king) {
    Board b;
    add_piece(b, white_king, PieceType::King, Colour::White);
    add_piece(b, black_king, PieceType::King, Colour::Black);
    return b;
}

inline void play_all(Game& game, std::initializer_list<std::string_view> sans) {
    for (std::string_view san : sans) game.play_san(san);
}

inline size_t count_flag(const MoveList& moves, MoveFlag flag) {
    size_t n = 0;
    for (Move m : moves) {
        if (m.flags() == flag) ++n;
    }
    return n;
}

inline constexpr std::string_view KIWIPETE_FEN{
    "r3k2r/p1ppqpb1/bn2pnp1/3PN3/1p2P3/2N2Q1p/PPPBBPPP/R3K2R w KQkq - 0 1"};
