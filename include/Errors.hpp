#pragma once

#include "Types.hpp"

#include <cstddef>
#include <stdexcept>
#include <string>


enum class ErrorKind : uint8_t {
    MalformedFen,
    MalformedPgn,
    AmbiguousSan,
    IllegalSan,
    IllegalMove,
    GameOver,
    DrawNotAvailable
};

// Base of every error the core throws. Catch this to handle them all.
class ChessError : public std::runtime_error {
public:
    ChessError(ErrorKind kind, const std::string& message)
        : std::runtime_error(message), kind_(kind) {}

    [[nodiscard]] ErrorKind kind() const noexcept { return kind_; }

private:
    ErrorKind kind_;
};

enum class FenField : uint8_t {
    Placement,
    SideToMove,
    Castling,
    EnPassant,
    HalfmoveClock,
    FullmoveNumber
};

constexpr const char* to_string(FenField field) {
    switch (field) {
        case FenField::Placement:      return "piece placement";
        case FenField::SideToMove:     return "side to move";
        case FenField::Castling:       return "castling rights";
        case FenField::EnPassant:      return "en passant target";
        case FenField::HalfmoveClock:  return "halfmove clock";
        case FenField::FullmoveNumber: return "fullmove number";
    }
    return "unknown field";
}

class FenError : public ChessError {
public:
    FenError(FenField field, const std::string& detail)
        : ChessError(ErrorKind::MalformedFen,
                     std::string("invalid FEN ") + ::to_string(field) + ": " + detail),
          field_(field), detail_(detail) {}

    [[nodiscard]] FenField field() const noexcept { return field_; }
    [[nodiscard]] const std::string& detail() const noexcept { return detail_; }

private:
    FenField field_;
    std::string detail_;
};

class PgnError : public ChessError {
public:
    PgnError(size_t offset, size_t line, const std::string& detail)
        : ChessError(ErrorKind::MalformedPgn,
                     "invalid PGN at line " + std::to_string(line)
                     + " (offset " + std::to_string(offset) + "): " + detail),
          offset_(offset), line_(line), detail_(detail) {}

    // Byte offset into the input and 1-based line of the offending token.
    [[nodiscard]] size_t offset() const noexcept { return offset_; }
    [[nodiscard]] size_t line() const noexcept { return line_; }
    [[nodiscard]] const std::string& detail() const noexcept { return detail_; }

private:
    size_t offset_;
    size_t line_;
    std::string detail_;
};

enum class SanErrorKind : uint8_t { Ambiguous, Illegal };

class SanError : public ChessError {
public:
    SanError(SanErrorKind kind, const std::string& token)
        : ChessError(kind == SanErrorKind::Ambiguous ? ErrorKind::AmbiguousSan
                                                     : ErrorKind::IllegalSan,
                     (kind == SanErrorKind::Ambiguous ? "ambiguous SAN move '"
                                                      : "illegal SAN move '")
                     + token + "'"),
          san_kind_(kind), token_(token) {}

    [[nodiscard]] SanErrorKind san_kind() const noexcept { return san_kind_; }
    [[nodiscard]] const std::string& token() const noexcept { return token_; }

private:
    SanErrorKind san_kind_;
    std::string token_;
};

class IllegalMoveError : public ChessError {
public:
    explicit IllegalMoveError(Move move)
        : ChessError(ErrorKind::IllegalMove, "illegal move " + move.to_uci()),
          move_(move) {}

    [[nodiscard]] Move move() const noexcept { return move_; }

private:
    Move move_;
};

class GameOverError : public ChessError {
public:
    GameOverError()
        : ChessError(ErrorKind::GameOver, "the game is already over") {}
};

class DrawClaimError : public ChessError {
public:
    explicit DrawClaimError(const std::string& detail)
        : ChessError(ErrorKind::DrawNotAvailable, "draw claim rejected: " + detail) {}
};
