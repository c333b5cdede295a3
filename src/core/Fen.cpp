#include "Fen.hpp"
#include "BitUtil.hpp"
#include "Errors.hpp"

#include <array>
#include <charconv>
#include <limits>
#include <sstream>
#include <vector>


namespace Fen {

namespace {
    std::vector<std::string> split(std::string_view text, char sep) {
        std::vector<std::string> parts;
        std::string current;
        for (char c : text) {
            if (c == sep) {
                parts.push_back(current);
                current.clear();
            } else {
                current += c;
            }
        }
        parts.push_back(current);
        return parts;
    }

    bool is_digit(char c) { return c >= '0' && c <= '9'; }

    void parse_placement(Board& board, const std::string& placement) {
        std::vector<std::string> ranks = split(placement, '/');
        if (ranks.size() != 8) {
            throw FenError(FenField::Placement,
                           "expected 8 ranks, found " + std::to_string(ranks.size()));
        }

        for (int i = 0; i < 8; ++i) {
            const int rank = 7 - i;
            int file = 0;
            for (char c : ranks[i]) {
                if (is_digit(c)) {
                    if (c == '0' || c == '9') {
                        throw FenError(FenField::Placement, std::string("bad empty-square count '") + c + "'");
                    }
                    file += c - '0';
                    if (file > 8) {
                        throw FenError(FenField::Placement,
                                       "rank " + std::to_string(rank + 1) + " spans more than 8 files");
                    }
                } else {
                    Piece piece = Piece::from_char(c);
                    if (piece.empty()) {
                        throw FenError(FenField::Placement, std::string("unknown piece letter '") + c + "'");
                    }
                    if (file > 7) {
                        throw FenError(FenField::Placement,
                                       "rank " + std::to_string(rank + 1) + " spans more than 8 files");
                    }
                    Square sq = make_square(file, rank);
                    if (piece.type == PieceType::Pawn && (rank == 0 || rank == 7)) {
                        throw FenError(FenField::Placement, "pawn on " + to_string(sq));
                    }
                    board.put_piece(piece, sq);
                    ++file;
                }
            }
            if (file != 8) {
                throw FenError(FenField::Placement,
                               "rank " + std::to_string(rank + 1) + " does not span 8 files");
            }
        }

        for (Colour c : {Colour::White, Colour::Black}) {
            if (BitUtil::count_bits(board.pieces_of(c, PieceType::King)) != 1) {
                throw FenError(FenField::Placement,
                               std::string(c == Colour::White ? "white" : "black")
                               + " must have exactly one king");
            }
        }
    }

    struct CastleHome {
        char letter;
        uint8_t right;
        Piece king;
        Square king_sq;
        Piece rook;
        Square rook_sq;
    };

    constexpr std::array<CastleHome, 4> CASTLE_HOMES{{
        {'K', WhiteKingside, {Colour::White, PieceType::King}, Square::E1, {Colour::White, PieceType::Rook}, Square::H1},
        {'Q', WhiteQueenside, {Colour::White, PieceType::King}, Square::E1, {Colour::White, PieceType::Rook}, Square::A1},
        {'k', BlackKingside, {Colour::Black, PieceType::King}, Square::E8, {Colour::Black, PieceType::Rook}, Square::H8},
        {'q', BlackQueenside, {Colour::Black, PieceType::King}, Square::E8, {Colour::Black, PieceType::Rook}, Square::A8},
    }};

    uint8_t parse_castling(const Board& board, const std::string& field) {
        if (field == "-") return 0;

        uint8_t rights = 0;
        for (char c : field) {
            const CastleHome* home = nullptr;
            for (const CastleHome& h : CASTLE_HOMES) {
                if (h.letter == c) home = &h;
            }
            if (home == nullptr) {
                throw FenError(FenField::Castling, std::string("unexpected character '") + c + "'");
            }
            if (rights & home->right) {
                throw FenError(FenField::Castling, std::string("duplicate right '") + c + "'");
            }
            if (board.piece_at(home->king_sq) != home->king || board.piece_at(home->rook_sq) != home->rook) {
                throw FenError(FenField::Castling,
                               std::string("right '") + c + "' without king and rook on their home squares");
            }
            rights |= home->right;
        }
        return rights;
    }

    Square parse_en_passant(const Board& board, const std::string& field) {
        if (field == "-") return Square::None;

        std::optional<Square> target = parse_square(field);
        if (!target) {
            throw FenError(FenField::EnPassant, "'" + field + "' is not a square");
        }

        const Colour us = board.to_move;
        const Colour them = opposite(us);
        const Square sq = *target;
        if (relative_rank(us, sq) != 5) {
            throw FenError(FenField::EnPassant, field + " is on the wrong rank for the side to move");
        }

        // The pawn that just double-pushed sits one step past the target.
        const int forward = (us == Colour::White) ? 8 : -8;
        const Square pawn_sq = offset(sq, -forward);
        const Square origin = offset(sq, forward);
        if (board.piece_at(pawn_sq) != Piece{them, PieceType::Pawn}) {
            throw FenError(FenField::EnPassant, "no pawn to capture on " + to_string(pawn_sq));
        }
        if (!board.piece_at(sq).empty() || !board.piece_at(origin).empty()) {
            throw FenError(FenField::EnPassant, "squares behind the pushed pawn are not empty");
        }
        return sq;
    }

    uint16_t parse_counter(FenField field, const std::string& text) {
        if (text.empty()) throw FenError(field, "empty counter");
        for (char c : text) {
            if (!is_digit(c)) throw FenError(field, "'" + text + "' is not a decimal number");
        }
        unsigned value = 0;
        auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
        if (ec != std::errc{} || value > std::numeric_limits<uint16_t>::max()) {
            throw FenError(field, "'" + text + "' is out of range");
        }
        return static_cast<uint16_t>(value);
    }
}

Board parse(std::string_view fen) {
    std::istringstream ss{std::string(fen)};
    std::vector<std::string> fields;
    std::string field;
    while (ss >> field) fields.push_back(field);

    if (fields.size() != 6) {
        throw FenError(FenField::Placement,
                       "field count: expected 6, found " + std::to_string(fields.size()));
    }

    Board board;
    parse_placement(board, fields[0]);

    if (fields[1] == "w") board.to_move = Colour::White;
    else if (fields[1] == "b") board.to_move = Colour::Black;
    else throw FenError(FenField::SideToMove, "expected 'w' or 'b', found '" + fields[1] + "'");

    if (board.is_check(opposite(board.to_move))) {
        throw FenError(FenField::Placement, "the side not to move is in check");
    }

    board.castle_rights = parse_castling(board, fields[2]);
    board.en_passant_sq = parse_en_passant(board, fields[3]);
    board.half_move_clock = parse_counter(FenField::HalfmoveClock, fields[4]);
    board.full_move_number = parse_counter(FenField::FullmoveNumber, fields[5]);
    if (board.full_move_number == 0) {
        throw FenError(FenField::FullmoveNumber, "must be at least 1");
    }

    board.refresh_hash();
    return board;
}

std::string serialize(const Board& board) {
    std::string out;

    for (int rank = 7; rank >= 0; --rank) {
        int empties = 0;
        for (int file = 0; file < 8; ++file) {
            Piece piece = board.piece_at(make_square(file, rank));
            if (piece.empty()) {
                ++empties;
            } else {
                if (empties) { out += static_cast<char>('0' + empties); empties = 0; }
                out += piece.to_char();
            }
        }
        if (empties) out += static_cast<char>('0' + empties);
        if (rank) out += '/';
    }
    out += ' ';

    out += to_char(board.to_move);
    out += ' ';

    if (board.castle_rights == 0) {
        out += '-';
    } else {
        for (const CastleHome& home : CASTLE_HOMES) {
            if (board.castle_rights & home.right) out += home.letter;
        }
    }
    out += ' ';

    out += to_string(board.en_passant_sq);
    out += ' ';

    out += std::to_string(board.half_move_clock);
    out += ' ';
    out += std::to_string(board.full_move_number);

    return out;
}

}
