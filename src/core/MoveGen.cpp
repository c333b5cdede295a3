#include "Attacks.hpp"
#include "MoveGen.hpp"
#include "BitUtil.hpp"

#include <array>
#include <initializer_list>


namespace MoveGen {

namespace {
    void serialize_moves(Square from, Bitboard targets, MoveList& list, MoveFlag flag = MoveFlag::Quiet) {
        while (targets) {
            Square to = BitUtil::pop_lsb(targets);
            list.emplace_back(from, to, flag);
        }
    }

    void add_promotions(Square from, Square to, bool capture, MoveList& list) {
        for (PieceType type : {PieceType::Queen, PieceType::Rook, PieceType::Bishop, PieceType::Knight}) {
            list.emplace_back(from, to, promotion_flag(type, capture));
        }
    }

    void generate_pawn_moves(const Board& board, MoveList& list) {
        const Colour us = board.to_move;
        const int side = static_cast<int>(us);
        const Bitboard them_occ = board.occupancy[side ^ 1];
        const Bitboard empty = ~board.occupancy[2];
        const Bitboard promo_rank = (us == Colour::White) ? BitUtil::RANK_8 : BitUtil::RANK_1;

        Bitboard pawns = board.pieces_of(us, PieceType::Pawn);
        while (pawns) {
            Square from = BitUtil::pop_lsb(pawns);
            int s = static_cast<int>(from);

            // Pushes
            Bitboard push = Attacks::PawnPushes[side][s] & empty;
            if (push) {
                Square to = BitUtil::lsb(push);
                if (push & promo_rank) {
                    add_promotions(from, to, false, list);
                } else {
                    list.emplace_back(from, to, MoveFlag::Quiet);
                    if (relative_rank(us, from) == 1) {
                        Bitboard double_push = Attacks::PawnPushes[side][static_cast<int>(to)] & empty;
                        if (double_push) {
                            list.emplace_back(from, BitUtil::lsb(double_push), MoveFlag::DoublePawnPush);
                        }
                    }
                }
            }

            // Captures
            Bitboard attacks = Attacks::PawnAttacks[side][s];
            Bitboard captures = attacks & them_occ;
            while (captures) {
                Square to = BitUtil::pop_lsb(captures);
                if (BitUtil::get_bit(promo_rank, to)) add_promotions(from, to, true, list);
                else list.emplace_back(from, to, MoveFlag::Capture);
            }

            if (board.en_passant_sq != Square::None
                && (attacks & BitUtil::from_square(board.en_passant_sq))) {
                list.emplace_back(from, board.en_passant_sq, MoveFlag::EnPassant);
            }
        }
    }

    struct CastleRule {
        uint8_t right;
        Square king_from;
        Square king_to;
        Bitboard must_be_empty;
        Square transit;
        MoveFlag flag;
    };

    constexpr Bitboard squares(std::initializer_list<Square> list) {
        Bitboard b = 0;
        for (Square sq : list) b |= BitUtil::from_square(sq);
        return b;
    }

    // b1/b8 must be empty for the long castle but may be attacked.
    constexpr std::array<std::array<CastleRule, 2>, 2> CASTLE_RULES{{
        {{
            {WhiteKingside, Square::E1, Square::G1, squares({Square::F1, Square::G1}), Square::F1, MoveFlag::KingCastle},
            {WhiteQueenside, Square::E1, Square::C1, squares({Square::B1, Square::C1, Square::D1}), Square::D1, MoveFlag::QueenCastle},
        }},
        {{
            {BlackKingside, Square::E8, Square::G8, squares({Square::F8, Square::G8}), Square::F8, MoveFlag::KingCastle},
            {BlackQueenside, Square::E8, Square::C8, squares({Square::B8, Square::C8, Square::D8}), Square::D8, MoveFlag::QueenCastle},
        }},
    }};

    void generate_castles(const Board& board, MoveList& list) {
        const Colour us = board.to_move;
        const Colour them = opposite(us);

        for (const CastleRule& rule : CASTLE_RULES[static_cast<int>(us)]) {
            if (!(board.castle_rights & rule.right)) continue;
            if (board.occupancy[2] & rule.must_be_empty) continue;
            if (!BitUtil::get_bit(board.pieces_of(us, PieceType::King), rule.king_from)) continue;

            if (board.is_attacked(rule.king_from, them) ||
                board.is_attacked(rule.transit, them) ||
                board.is_attacked(rule.king_to, them)) continue;

            list.emplace_back(rule.king_from, rule.king_to, rule.flag);
        }
    }
}

void generate_moves(const Board& board, MoveList& move_list) {
    const Colour us = board.to_move;
    const Colour them = opposite(us);

    const Bitboard us_occ = board.occupancy[static_cast<int>(us)];
    const Bitboard them_occ = board.occupancy[static_cast<int>(them)];
    const Bitboard all_occ = board.occupancy[2];

    generate_pawn_moves(board, move_list);

    for (int pt = 1; pt <= 5; ++pt) {
        PieceType type = static_cast<PieceType>(pt);
        Bitboard pieces = board.pieces_of(us, type);

        while (pieces) {
            Square from = BitUtil::pop_lsb(pieces);
            Bitboard attacks = 0;

            switch (type) {
                case PieceType::Knight:
                    attacks = Attacks::KnightAttacks[static_cast<int>(from)];
                    break;
                case PieceType::Bishop:
                    attacks = Attacks::get_bishop_attacks(static_cast<int>(from), all_occ);
                    break;
                case PieceType::Rook:
                    attacks = Attacks::get_rook_attacks(static_cast<int>(from), all_occ);
                    break;
                case PieceType::Queen:
                    attacks = Attacks::get_queen_attacks(static_cast<int>(from), all_occ);
                    break;
                case PieceType::King:
                    attacks = Attacks::KingAttacks[static_cast<int>(from)];
                    break;
                default: break;
            }

            // Can't capture own pieces
            attacks &= ~us_occ;

            serialize_moves(from, attacks & them_occ, move_list, MoveFlag::Capture);
            serialize_moves(from, attacks & ~them_occ, move_list, MoveFlag::Quiet);
        }
    }

    generate_castles(board, move_list);
}

void generate_legal(Board& board, MoveList& move_list) {
    MoveList pseudo;
    generate_moves(board, pseudo);

    const Colour us = board.to_move;
    for (Move move : pseudo) {
        board.make_move(move);
        if (!board.is_check(us)) move_list.push_back(move);
        board.undo_move();
    }
}

}
