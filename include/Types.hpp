#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>


using Bitboard = std::uint64_t;

enum class Colour : uint8_t { White, Black, None };
enum class PieceType : uint8_t { Pawn, Knight, Bishop, Rook, Queen, King, None };

enum class Square : int {
    A1 = 0, B1, C1, D1, E1, F1, G1, H1,
    A2 = 8, B2, C2, D2, E2, F2, G2, H2,
    A3 = 16, B3, C3, D3, E3, F3, G3, H3,
    A4 = 24, B4, C4, D4, E4, F4, G4, H4,
    A5 = 32, B5, C5, D5, E5, F5, G5, H5,
    A6 = 40, B6, C6, D6, E6, F6, G6, H6,
    A7 = 48, B7, C7, D7, E7, F7, G7, H7,
    A8 = 56, B8, C8, D8, E8, F8, G8, H8,
    None = 64
};

// Castling rights bitmask, KQkq order.
enum CastleRight : uint8_t {
    WhiteKingside = 1,
    WhiteQueenside = 2,
    BlackKingside = 4,
    BlackQueenside = 8,
    WhiteCastling = WhiteKingside | WhiteQueenside,
    BlackCastling = BlackKingside | BlackQueenside,
    AllCastling = WhiteCastling | BlackCastling
};

constexpr Colour opposite(Colour c) {
    return c == Colour::White ? Colour::Black : Colour::White;
}

constexpr int rank_of(Square sq) { return static_cast<int>(sq) >> 3; }
constexpr int file_of(Square sq) { return static_cast<int>(sq) & 7; }

constexpr Square make_square(int file, int rank) {
    return static_cast<Square>(rank * 8 + file);
}

constexpr Square offset(Square sq, int delta) {
    return static_cast<Square>(static_cast<int>(sq) + delta);
}

// Rank index as seen from `c`'s side of the board (0 = own back rank).
constexpr int relative_rank(Colour c, Square sq) {
    return c == Colour::White ? rank_of(sq) : 7 - rank_of(sq);
}

constexpr bool is_light(Square sq) {
    return ((rank_of(sq) + file_of(sq)) & 1) != 0;
}

constexpr char file_char(int file) { return static_cast<char>('a' + file); }
constexpr char rank_char(int rank) { return static_cast<char>('1' + rank); }

inline std::string to_string(Square sq) {
    if (sq == Square::None) return "-";
    return {file_char(file_of(sq)), rank_char(rank_of(sq))};
}

// "e4" -> Square::E4. Anything that is not exactly a file letter followed
// by a rank digit yields nullopt.
inline std::optional<Square> parse_square(std::string_view text) {
    if (text.size() != 2) return std::nullopt;
    if (text[0] < 'a' || text[0] > 'h') return std::nullopt;
    if (text[1] < '1' || text[1] > '8') return std::nullopt;
    return make_square(text[0] - 'a', text[1] - '1');
}

constexpr char to_char(PieceType type) {
    switch (type) {
        case PieceType::Pawn:   return 'P';
        case PieceType::Knight: return 'N';
        case PieceType::Bishop: return 'B';
        case PieceType::Rook:   return 'R';
        case PieceType::Queen:  return 'Q';
        case PieceType::King:   return 'K';
        default: return '?';
    }
}

constexpr PieceType piece_type_from_char(char c) {
    switch (c) {
        case 'P': case 'p': return PieceType::Pawn;
        case 'N': case 'n': return PieceType::Knight;
        case 'B': case 'b': return PieceType::Bishop;
        case 'R': case 'r': return PieceType::Rook;
        case 'Q': case 'q': return PieceType::Queen;
        case 'K': case 'k': return PieceType::King;
        default: return PieceType::None;
    }
}

constexpr char to_char(Colour c) {
    return c == Colour::White ? 'w' : 'b';
}

struct Piece {
    Colour colour{Colour::None};
    PieceType type{PieceType::None};

    constexpr Piece() = default;
    constexpr Piece(Colour c, PieceType t) : colour(c), type(t) {}

    [[nodiscard]] constexpr bool empty() const { return type == PieceType::None; }

    // 0..11, matching the Board bitboard layout.
    [[nodiscard]] constexpr size_t index() const {
        return static_cast<size_t>(colour) * 6 + static_cast<size_t>(type);
    }

    // FEN letter: upper case for White, lower case for Black.
    [[nodiscard]] constexpr char to_char() const {
        if (empty()) return '.';
        char c = ::to_char(type);
        return colour == Colour::White ? c : static_cast<char>(c - 'A' + 'a');
    }

    static constexpr Piece from_char(char c) {
        PieceType type = piece_type_from_char(c);
        if (type == PieceType::None) return Piece{};
        return Piece{(c >= 'a' && c <= 'z') ? Colour::Black : Colour::White, type};
    }

    bool operator==(const Piece& other) const = default;
};

enum class MoveFlag : uint16_t {
    Quiet = 0b0000,
    DoublePawnPush = 0b0001,
    KingCastle = 0b0010,
    QueenCastle = 0b0011,
    Capture = 0b0100,
    EnPassant = 0b0101,
    Promotion = 0b1000,
    KnightPromo = 0b1000,
    BishopPromo = 0b1001,
    RookPromo = 0b1010,
    QueenPromo = 0b1011,
    KnightPromoCapture = 0b1100,
    BishopPromoCapture = 0b1101,
    RookPromoCapture = 0b1110,
    QueenPromoCapture = 0b1111
};

// Promotion flag for `type` (Knight..Queen), optionally with the capture bit.
constexpr MoveFlag promotion_flag(PieceType type, bool capture) {
    uint16_t bits = static_cast<uint16_t>(MoveFlag::Promotion)
        | static_cast<uint16_t>(static_cast<uint16_t>(type) - 1);
    if (capture) bits |= static_cast<uint16_t>(MoveFlag::Capture);
    return static_cast<MoveFlag>(bits);
}

struct Move {
    uint16_t data;

    static constexpr uint16_t FROM_MASK{0x3F}; // Bits 0-5: From square
    static constexpr uint16_t TO_MASK{0xFC0}; // Bits 6-11: To square
    static constexpr uint16_t FLAG_MASK{0xF000}; // Bits 12-15: Special moves flag

    constexpr Move() : data(0) {}

    constexpr Move(Square from, Square to, MoveFlag flags = MoveFlag::Quiet)
        : data(static_cast<uint16_t>(
            static_cast<uint16_t>(from) |
            (static_cast<uint16_t>(to) << 6) |
            (static_cast<uint16_t>(flags) << 12))) {}

    [[nodiscard]] constexpr Square from() const {
        return static_cast<Square>(data & FROM_MASK);
    }

    [[nodiscard]] constexpr Square to() const {
        return static_cast<Square>((data & TO_MASK) >> 6);
    }

    [[nodiscard]] constexpr MoveFlag flags() const {
        return static_cast<MoveFlag>((data & FLAG_MASK) >> 12);
    }

    [[nodiscard]] constexpr bool is_capture() const {
        return static_cast<uint16_t>(flags())
            & static_cast<uint16_t>(MoveFlag::Capture);
    }

    [[nodiscard]] constexpr bool is_promotion() const {
        return static_cast<uint16_t>(flags())
            & static_cast<uint16_t>(MoveFlag::Promotion);
    }

    [[nodiscard]] constexpr bool is_castle() const {
        return flags() == MoveFlag::KingCastle || flags() == MoveFlag::QueenCastle;
    }

    [[nodiscard]] constexpr bool is_en_passant() const {
        return flags() == MoveFlag::EnPassant;
    }

    [[nodiscard]] constexpr PieceType promotion_type() const {
        if (!is_promotion()) return PieceType::None;
        return static_cast<PieceType>((static_cast<uint16_t>(flags()) & 0b0011) + 1);
    }

    // Long algebraic form: "e2e4", "e7e8q".
    [[nodiscard]] std::string to_uci() const {
        std::string out = to_string(from()) + to_string(to());
        if (is_promotion()) {
            out += static_cast<char>(::to_char(promotion_type()) - 'A' + 'a');
        }
        return out;
    }

    bool operator==(const Move& other) const = default;
};

enum class GameStatus : uint8_t {
    InProgress,
    Checkmate,
    Stalemate,
    DrawClaimed,
    DrawAutomatic,
    Resigned
};

enum class DrawReason : uint8_t {
    None,
    FiftyMove,
    Repetition,
    Agreement,
    InsufficientMaterial
};

struct GameResult {
    GameStatus status{GameStatus::InProgress};
    Colour winner{Colour::None};
    DrawReason reason{DrawReason::None};

    static constexpr GameResult in_progress() { return {}; }
    static constexpr GameResult checkmate(Colour winner) {
        return {GameStatus::Checkmate, winner, DrawReason::None};
    }
    static constexpr GameResult stalemate() {
        return {GameStatus::Stalemate, Colour::None, DrawReason::None};
    }
    static constexpr GameResult draw_claimed(DrawReason reason) {
        return {GameStatus::DrawClaimed, Colour::None, reason};
    }
    static constexpr GameResult insufficient_material() {
        return {GameStatus::DrawAutomatic, Colour::None, DrawReason::InsufficientMaterial};
    }
    static constexpr GameResult resigned(Colour winner) {
        return {GameStatus::Resigned, winner, DrawReason::None};
    }

    [[nodiscard]] constexpr bool is_over() const { return status != GameStatus::InProgress; }
    [[nodiscard]] constexpr bool is_draw() const {
        return status == GameStatus::Stalemate || status == GameStatus::DrawClaimed
            || status == GameStatus::DrawAutomatic;
    }

    // PGN result marker.
    [[nodiscard]] constexpr std::string_view marker() const {
        if (winner == Colour::White) return "1-0";
        if (winner == Colour::Black) return "0-1";
        if (is_draw()) return "1/2-1/2";
        return "*";
    }

    bool operator==(const GameResult& other) const = default;
};
