#pragma once

#include "Types.hpp"
#include "Board.hpp"
#include "MoveList.hpp"

#include <string_view>


// What a front end (GUI, bindings) needs from a rules engine.
class IChessCore {
public:
    virtual ~IChessCore() = default;
    virtual void make_move(Move move) = 0;
    virtual void unmake_move() = 0;
    virtual MoveList legal_moves() const = 0;
    virtual MoveList legal_moves_from(Square from) const = 0;
    virtual GameResult get_game_state() const = 0;
    virtual bool is_check(Colour side) const = 0;
    virtual const Board& get_board_state() const = 0;
    virtual Piece piece_at(Square sq) const = 0;
    virtual bool can_select_square(Square sq) const = 0;
    virtual void reset() = 0;
    // False (and no change) when the FEN is rejected.
    virtual bool load_fen(std::string_view fen) = 0;
};
