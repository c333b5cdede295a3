#include "Board.hpp"
#include "Attacks.hpp"
#include "BitUtil.hpp"
#include "Errors.hpp"
#include "Fen.hpp"
#include "MoveGen.hpp"
#include "Zobrist.hpp"

#include <limits>
#include <sstream>


namespace {
    // Rights that survive a move touching each square.
    constexpr std::array<uint8_t, 64> init_castle_masks() {
        std::array<uint8_t, 64> masks{};
        masks.fill(AllCastling);
        masks[static_cast<int>(Square::E1)] = AllCastling & ~WhiteCastling;
        masks[static_cast<int>(Square::H1)] = AllCastling & ~WhiteKingside;
        masks[static_cast<int>(Square::A1)] = AllCastling & ~WhiteQueenside;
        masks[static_cast<int>(Square::E8)] = AllCastling & ~BlackCastling;
        masks[static_cast<int>(Square::H8)] = AllCastling & ~BlackKingside;
        masks[static_cast<int>(Square::A8)] = AllCastling & ~BlackQueenside;
        return masks;
    }

    constexpr std::array<uint8_t, 64> CASTLE_MASKS = init_castle_masks();

    struct RookHop {
        Square from;
        Square to;
    };

    constexpr RookHop castle_rook(Colour us, MoveFlag flag) {
        if (flag == MoveFlag::KingCastle) {
            return us == Colour::White ? RookHop{Square::H1, Square::F1}
                                       : RookHop{Square::H8, Square::F8};
        }
        return us == Colour::White ? RookHop{Square::A1, Square::D1}
                                   : RookHop{Square::A8, Square::D8};
    }

    // Clocks stick at the largest value FEN can carry instead of wrapping.
    constexpr uint16_t COUNTER_MAX = std::numeric_limits<uint16_t>::max();

    constexpr Square en_passant_victim(Square to, Colour us) {
        return offset(to, us == Colour::White ? -8 : 8);
    }
}

Board::Board() {
    Attacks::init();
    Zobrist::init();

    pieces.fill(0);
    occupancy.fill(0);
    to_move = Colour::White;
    en_passant_sq = Square::None;
    castle_rights = 0;
    half_move_clock = 0;
    full_move_number = 1;
    key = 0;
    history.reserve(256);
}

Board Board::starting_position() {
    return Fen::parse(STARTPOS_FEN);
}

Board Board::from_fen(std::string_view fen) {
    return Fen::parse(fen);
}

std::string Board::to_fen() const {
    return Fen::serialize(*this);
}

Piece Board::piece_at(Square sq) const {
    if (sq == Square::None || !BitUtil::get_bit(occupancy[2], sq)) return Piece{};
    Colour side = BitUtil::get_bit(occupancy[0], sq) ? Colour::White : Colour::Black;
    return Piece{side, piece_type_at(sq, side)};
}

PieceType Board::piece_type_at(Square sq, Colour side) const {
    size_t offset = static_cast<size_t>(side) * 6;
    for (int i = 0; i < 6; ++i) {
        if (BitUtil::get_bit(pieces[offset + i], sq)) {
            return static_cast<PieceType>(i);
        }
    }
    return PieceType::None;
}

void Board::toggle_piece(size_t index, Square sq) {
    Bitboard b = BitUtil::from_square(sq);
    pieces[index] ^= b;
    occupancy[index / 6] ^= b;
    occupancy[2] ^= b;
}

void Board::put_piece(Piece piece, Square sq) {
    if (piece.empty()) return;
    remove_piece(sq);
    toggle_piece(piece.index(), sq);
    key ^= Zobrist::piece(piece.index(), sq);
}

void Board::remove_piece(Square sq) {
    Piece old = piece_at(sq);
    if (old.empty()) return;
    toggle_piece(old.index(), sq);
    key ^= Zobrist::piece(old.index(), sq);
}

Square Board::king_square(Colour c) const {
    return BitUtil::lsb(pieces_of(c, PieceType::King));
}

bool Board::is_attacked(Square sq, Colour by) const {
    return Attacks::is_square_attacked(sq, by, pieces.data(), occupancy[2]);
}

bool Board::is_check(Colour side) const {
    Square king = king_square(side);
    if (king == Square::None) return false;
    return is_attacked(king, opposite(side));
}

bool Board::in_checkmate() const {
    return in_check() && !has_legal_moves();
}

bool Board::in_stalemate() const {
    return !in_check() && !has_legal_moves();
}

MoveList Board::legal_moves() const {
    Board scratch{*this};
    MoveList list;
    MoveGen::generate_legal(scratch, list);
    return list;
}

MoveList Board::legal_moves_from(Square from) const {
    return legal_moves().from_square(from);
}

bool Board::has_legal_moves() const {
    return !legal_moves().empty();
}

bool Board::is_legal(Move move) const {
    return legal_moves().contains(move);
}

void Board::make_move(Move move) {
    const Square from = move.from();
    const Square to = move.to();
    const MoveFlag flag = move.flags();
    const Colour us = to_move;
    const Colour them = opposite(us);

    UndoInfo undo{move, castle_rights, en_passant_sq, half_move_clock,
                  full_move_number, PieceType::None, key};

    // Hash out the state that is about to change
    key ^= Zobrist::en_passant(en_passant_sq);
    key ^= Zobrist::castle_keys[castle_rights];

    const PieceType moving = piece_type_at(from, us);
    if (half_move_clock < COUNTER_MAX) ++half_move_clock;
    if (moving == PieceType::Pawn) half_move_clock = 0;

    if (flag == MoveFlag::EnPassant) {
        Square victim = en_passant_victim(to, us);
        size_t idx = get_piece_index(them, PieceType::Pawn);
        toggle_piece(idx, victim);
        key ^= Zobrist::piece(idx, victim);
        undo.captured = PieceType::Pawn;
    } else if (move.is_capture()) {
        undo.captured = piece_type_at(to, them);
        if (undo.captured != PieceType::None) {
            size_t idx = get_piece_index(them, undo.captured);
            toggle_piece(idx, to);
            key ^= Zobrist::piece(idx, to);
        }
        half_move_clock = 0;
    }

    const size_t from_idx = get_piece_index(us, moving);
    const size_t to_idx = move.is_promotion()
        ? get_piece_index(us, move.promotion_type()) : from_idx;

    toggle_piece(from_idx, from);
    key ^= Zobrist::piece(from_idx, from);
    toggle_piece(to_idx, to);
    key ^= Zobrist::piece(to_idx, to);

    if (move.is_castle()) {
        const RookHop hop = castle_rook(us, flag);
        const size_t rook_idx = get_piece_index(us, PieceType::Rook);
        toggle_piece(rook_idx, hop.from);
        toggle_piece(rook_idx, hop.to);
        key ^= Zobrist::piece(rook_idx, hop.from);
        key ^= Zobrist::piece(rook_idx, hop.to);
    }

    castle_rights &= CASTLE_MASKS[static_cast<int>(from)] & CASTLE_MASKS[static_cast<int>(to)];

    en_passant_sq = Square::None;
    if (flag == MoveFlag::DoublePawnPush) {
        en_passant_sq = offset(from, us == Colour::White ? 8 : -8);
    }

    // Hash in the new state
    key ^= Zobrist::en_passant(en_passant_sq);
    key ^= Zobrist::castle_keys[castle_rights];
    key ^= Zobrist::side_key;

    to_move = them;
    if (us == Colour::Black && full_move_number < COUNTER_MAX) ++full_move_number;

    history.push_back(undo);
}

void Board::undo_move() {
    if (history.empty()) return;
    const UndoInfo undo = history.back();
    history.pop_back();

    const Move move = undo.move;
    const Square from = move.from();
    const Square to = move.to();
    const Colour us = opposite(to_move);
    const Colour them = to_move;

    const PieceType placed = piece_type_at(to, us);
    const PieceType original = move.is_promotion() ? PieceType::Pawn : placed;
    toggle_piece(get_piece_index(us, placed), to);
    toggle_piece(get_piece_index(us, original), from);

    if (undo.captured != PieceType::None) {
        Square cap_sq = move.is_en_passant() ? en_passant_victim(to, us) : to;
        toggle_piece(get_piece_index(them, undo.captured), cap_sq);
    }

    if (move.is_castle()) {
        const RookHop hop = castle_rook(us, move.flags());
        const size_t rook_idx = get_piece_index(us, PieceType::Rook);
        toggle_piece(rook_idx, hop.to);
        toggle_piece(rook_idx, hop.from);
    }

    to_move = us;
    castle_rights = undo.castle_rights;
    en_passant_sq = undo.en_passant_sq;
    half_move_clock = undo.half_move_clock;
    full_move_number = undo.full_move_number;
    key = undo.key;
}

void Board::apply_move(Move move) {
    if (!is_legal(move)) throw IllegalMoveError(move);
    make_move(move);
}

std::optional<Move> Board::last_move() const {
    if (history.empty()) return std::nullopt;
    return history.back().move;
}

bool Board::insufficient_material() const {
    switch (BitUtil::count_bits(occupancy[2])) {
        case 2:
            return true;
        case 3:
            return BitUtil::count_bits(pieces_of(Colour::White, PieceType::Knight)
                                     | pieces_of(Colour::Black, PieceType::Knight)
                                     | pieces_of(Colour::White, PieceType::Bishop)
                                     | pieces_of(Colour::Black, PieceType::Bishop)) == 1;
        case 4: {
            Bitboard white_bishops = pieces_of(Colour::White, PieceType::Bishop);
            Bitboard black_bishops = pieces_of(Colour::Black, PieceType::Bishop);
            if (BitUtil::count_bits(white_bishops) != 1 || BitUtil::count_bits(black_bishops) != 1) {
                return false;
            }
            return is_light(BitUtil::lsb(white_bishops)) == is_light(BitUtil::lsb(black_bishops));
        }
        default:
            return false;
    }
}

std::string Board::pretty() const {
    std::ostringstream out;
    for (int rank = 7; rank >= 0; --rank) {
        out << rank_char(rank) << "  ";
        for (int file = 0; file < 8; ++file) {
            out << piece_at(make_square(file, rank)).to_char();
            if (file < 7) out << ' ';
        }
        out << '\n';
    }
    out << "\n   a b c d e f g h\n";
    return out.str();
}

uint64_t Board::compute_hash() const {
    uint64_t hash = 0;
    for (size_t p = 0; p < 12; ++p) {
        Bitboard bb = pieces[p];
        while (bb) {
            Square sq = BitUtil::pop_lsb(bb);
            hash ^= Zobrist::piece(p, sq);
        }
    }
    hash ^= Zobrist::castle_keys[castle_rights];
    hash ^= Zobrist::en_passant(en_passant_sq);
    if (to_move == Colour::Black) {
        hash ^= Zobrist::side_key;
    }
    return hash;
}

bool Board::operator==(const Board& other) const {
    return pieces == other.pieces
        && occupancy == other.occupancy
        && to_move == other.to_move
        && en_passant_sq == other.en_passant_sq
        && castle_rights == other.castle_rights
        && half_move_clock == other.half_move_clock
        && full_move_number == other.full_move_number
        && key == other.key;
}
