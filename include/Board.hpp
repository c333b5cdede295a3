#pragma once

#include "Types.hpp"
#include "BitUtil.hpp"
#include "MoveList.hpp"

#include <array>
#include <optional>
#include <string>
#include <string_view>
#include <vector>


inline constexpr std::string_view STARTPOS_FEN{
    "rnbqkbnr/pppppppp/8/8/8/8/PPPPPPPP/RNBQKBNR w KQkq - 0 1"};

struct Board {
    std::array<Bitboard, 12> pieces;
    std::array<Bitboard, 3> occupancy; // White, Black, All

    Colour to_move;
    Square en_passant_sq;
    uint8_t castle_rights;
    uint16_t half_move_clock;
    uint16_t full_move_number;
    uint64_t key;

    // Everything make_move overwrites that cannot be recomputed from the move.
    struct UndoInfo {
        Move move;
        uint8_t castle_rights;
        Square en_passant_sq;
        uint16_t half_move_clock;
        uint16_t full_move_number;
        PieceType captured;
        uint64_t key;
    };
    std::vector<UndoInfo> history;

    // Empty board, white to move, no rights. Builds the attack tables and
    // Zobrist keys on first use.
    Board();

    static Board starting_position();

    // Throws FenError.
    static Board from_fen(std::string_view fen);
    [[nodiscard]] std::string to_fen() const;

    static constexpr size_t get_piece_index(Colour c, PieceType type) {
        return static_cast<size_t>(c) * 6 + static_cast<size_t>(type);
    }

    [[nodiscard]] Bitboard pieces_of(Colour c, PieceType type) const {
        return pieces[get_piece_index(c, type)];
    }

    [[nodiscard]] Piece piece_at(Square sq) const;
    [[nodiscard]] PieceType piece_type_at(Square sq, Colour side) const;

    // Board editing. Both keep occupancy and the key in sync; neither
    // touches the undo stack.
    void put_piece(Piece piece, Square sq);
    void remove_piece(Square sq);

    [[nodiscard]] Square king_square(Colour c) const;
    [[nodiscard]] bool is_attacked(Square sq, Colour by) const;

    [[nodiscard]] bool is_check(Colour side) const;
    [[nodiscard]] bool in_check() const { return is_check(to_move); }
    [[nodiscard]] bool in_checkmate() const;
    [[nodiscard]] bool in_stalemate() const;

    [[nodiscard]] MoveList legal_moves() const;
    [[nodiscard]] MoveList legal_moves_from(Square from) const;
    [[nodiscard]] bool has_legal_moves() const;
    [[nodiscard]] bool is_legal(Move move) const;

    // Unchecked: `move` must come from this position's generator.
    void make_move(Move move);
    // Reverts the last make_move. No-op on an empty history.
    void undo_move();
    // Checked: throws IllegalMoveError and leaves the board untouched.
    void apply_move(Move move);

    [[nodiscard]] std::optional<Move> last_move() const;

    // K v K, K+minor v K, K+B v K+B with bishops on one square colour.
    [[nodiscard]] bool insufficient_material() const;

    [[nodiscard]] std::string pretty() const;

    [[nodiscard]] uint64_t compute_hash() const;
    void refresh_hash() { key = compute_hash(); }

    // Position equality; the undo stack is not compared.
    bool operator==(const Board& other) const;

private:
    void toggle_piece(size_t index, Square sq);
};
