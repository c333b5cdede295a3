#include "San.hpp"
#include "Errors.hpp"


namespace San {

namespace {
    bool ends_with(std::string_view text, std::string_view suffix) {
        return text.size() >= suffix.size()
            && text.substr(text.size() - suffix.size()) == suffix;
    }

    bool is_file(char c) { return c >= 'a' && c <= 'h'; }
    bool is_rank(char c) { return c >= '1' && c <= '8'; }

    // Drops check/mate marks, annotation glyphs and an "e.p." tag.
    std::string_view strip_decorations(std::string_view text) {
        bool changed = true;
        while (changed && !text.empty()) {
            changed = false;
            char last = text.back();
            if (last == '+' || last == '#' || last == '!' || last == '?') {
                text.remove_suffix(1);
                changed = true;
            } else if (ends_with(text, "e.p.")) {
                text.remove_suffix(4);
                while (!text.empty() && text.back() == ' ') text.remove_suffix(1);
                changed = true;
            }
        }
        return text;
    }

    // What the token says about the move, before matching.
    struct Pattern {
        PieceType piece{PieceType::Pawn};
        int from_file{-1};
        int from_rank{-1};
        Square to{Square::None};
        PieceType promotion{PieceType::None};
    };

    std::optional<Pattern> parse_pattern(std::string_view text) {
        Pattern p;
        if (text.empty()) return std::nullopt;

        if (text.front() == 'N' || text.front() == 'B' || text.front() == 'R'
            || text.front() == 'Q' || text.front() == 'K' || text.front() == 'P') {
            p.piece = piece_type_from_char(text.front());
            text.remove_prefix(1);
        }

        // Promotion suffix: "e8=Q" or "e8Q"
        if (text.size() >= 2) {
            char last = text.back();
            char before = text[text.size() - 2];
            if ((last == 'N' || last == 'B' || last == 'R' || last == 'Q')
                && (before == '=' || is_rank(before))) {
                p.promotion = piece_type_from_char(last);
                text.remove_suffix(before == '=' ? 2 : 1);
            }
        }

        if (text.size() < 2) return std::nullopt;
        std::optional<Square> to = parse_square(text.substr(text.size() - 2));
        if (!to) return std::nullopt;
        p.to = *to;
        text.remove_suffix(2);

        if (!text.empty() && (text.back() == 'x' || text.back() == ':')) text.remove_suffix(1);

        if (!text.empty() && is_rank(text.back())) {
            p.from_rank = text.back() - '1';
            text.remove_suffix(1);
        }
        if (!text.empty() && is_file(text.back())) {
            p.from_file = text.back() - 'a';
            text.remove_suffix(1);
        }

        if (!text.empty()) return std::nullopt;
        if (p.promotion != PieceType::None && p.piece != PieceType::Pawn) return std::nullopt;
        return p;
    }

    bool matches(const Board& board, Move move, const Pattern& p) {
        if (move.to() != p.to || move.is_castle()) return false;
        if (board.piece_type_at(move.from(), board.to_move) != p.piece) return false;
        if (p.from_file >= 0 && file_of(move.from()) != p.from_file) return false;
        if (p.from_rank >= 0 && rank_of(move.from()) != p.from_rank) return false;
        if (p.promotion != PieceType::None && move.promotion_type() != p.promotion) return false;
        return true;
    }
}

std::string render(const Board& board, Move move) {
    std::string san;

    if (move.flags() == MoveFlag::KingCastle) {
        san = "O-O";
    } else if (move.flags() == MoveFlag::QueenCastle) {
        san = "O-O-O";
    } else {
        const Square from = move.from();
        const Square to = move.to();
        const PieceType piece = board.piece_type_at(from, board.to_move);

        if (piece == PieceType::Pawn) {
            if (move.is_capture()) {
                san += file_char(file_of(from));
                san += 'x';
            }
            san += to_string(to);
            if (move.is_promotion()) {
                san += '=';
                san += to_char(move.promotion_type());
            }
        } else {
            san += to_char(piece);

            // Minimal disambiguation: file, else rank, else both.
            bool clash = false, same_file = false, same_rank = false;
            for (Move other : board.legal_moves()) {
                if (other.to() != to || other.from() == from) continue;
                if (board.piece_type_at(other.from(), board.to_move) != piece) continue;
                clash = true;
                if (file_of(other.from()) == file_of(from)) same_file = true;
                if (rank_of(other.from()) == rank_of(from)) same_rank = true;
            }
            if (clash) {
                if (!same_file) {
                    san += file_char(file_of(from));
                } else if (!same_rank) {
                    san += rank_char(rank_of(from));
                } else {
                    san += to_string(from);
                }
            }

            if (move.is_capture()) san += 'x';
            san += to_string(to);
        }
    }

    Board after{board};
    after.make_move(move);
    if (after.in_check()) {
        san += after.has_legal_moves() ? '+' : '#';
    }
    return san;
}

Move resolve(const Board& board, std::string_view token) {
    const std::string original{token};
    std::string_view text = strip_decorations(token);
    const MoveList legal = board.legal_moves();

    MoveFlag castle = MoveFlag::Quiet;
    if (text == "O-O" || text == "0-0") castle = MoveFlag::KingCastle;
    else if (text == "O-O-O" || text == "0-0-0") castle = MoveFlag::QueenCastle;

    if (castle != MoveFlag::Quiet) {
        for (Move move : legal) {
            if (move.flags() == castle) return move;
        }
        throw SanError(SanErrorKind::Illegal, original);
    }

    std::optional<Pattern> pattern = parse_pattern(text);
    if (!pattern) throw SanError(SanErrorKind::Illegal, original);

    Move found;
    int count = 0;
    for (Move move : legal) {
        if (matches(board, move, *pattern)) {
            found = move;
            ++count;
        }
    }

    if (count == 0) throw SanError(SanErrorKind::Illegal, original);
    // Also covers a promotion written without its piece.
    if (count > 1) throw SanError(SanErrorKind::Ambiguous, original);
    return found;
}

}
