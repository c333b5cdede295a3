#include <gtest/gtest.h>
#include "Board.hpp"
#include "Errors.hpp"
#include "Fen.hpp"
#include "TestHelpers.hpp"

#include <string>
#include <string_view>

namespace {

// Parses `fen` and returns the field the parser rejected.
FenField rejected_field(std::string_view fen) {
    try {
        Fen::parse(fen);
    } catch (const FenError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::MalformedFen);
        EXPECT_FALSE(e.detail().empty());
        return e.field();
    }
    ADD_FAILURE() << "accepted: " << fen;
    return FenField::Placement;
}

}

TEST(FenTest, StartingPosition) {
    Board board = Fen::parse(STARTPOS_FEN);
    EXPECT_TRUE(board == Board::starting_position());
    EXPECT_EQ(board.to_fen(), STARTPOS_FEN);
    EXPECT_EQ(board.key, board.compute_hash());
}

TEST(FenTest, FieldsAreRead) {
    Board board = Fen::parse("r3k2r/8/8/3pP3/8/8/8/R3K2R w Kq d6 7 42");
    EXPECT_EQ(board.to_move, Colour::White);
    EXPECT_EQ(board.castle_rights, WhiteKingside | BlackQueenside);
    EXPECT_EQ(board.en_passant_sq, Square::D6);
    EXPECT_EQ(board.half_move_clock, 7);
    EXPECT_EQ(board.full_move_number, 42);
    EXPECT_EQ(board.piece_at(Square::E5), Piece(Colour::White, PieceType::Pawn));
}

TEST(FenTest, RoundTrip) {
    const std::string_view fens[] = {
        STARTPOS_FEN,
        KIWIPETE_FEN,
        "8/2p5/3p4/KP5r/1R3p1k/8/4P1P1/8 w - - 0 1",
        "rnbq1k1r/pp1Pbppp/2p5/8/2B5/8/PPP1NnPP/RNBQK2R w KQ - 1 8",
        "rnbqkbnr/ppp1pppp/8/8/3pP3/8/PPPP1PPP/RNBQKBNR b KQkq e3 0 3",
        "4k3/8/8/8/8/8/8/4K3 b - - 99 120",
    };
    for (std::string_view fen : fens) {
        EXPECT_EQ(Fen::serialize(Fen::parse(fen)), fen);
    }
}

// Every position within three plies of the start survives a serialize/parse cycle.
TEST(FenTest, ReachablePositionsRoundTrip) {
    Board board = Board::starting_position();
    size_t checked = 0;
    auto expect_round_trip = [&checked](const Board& b) {
        EXPECT_TRUE(Fen::parse(Fen::serialize(b)) == b) << Fen::serialize(b);
        ++checked;
    };

    for (Move first : board.legal_moves()) {
        board.make_move(first);
        expect_round_trip(board);
        for (Move second : board.legal_moves()) {
            board.make_move(second);
            expect_round_trip(board);
            for (Move third : board.legal_moves()) {
                board.make_move(third);
                expect_round_trip(board);
                board.undo_move();
            }
            board.undo_move();
        }
        board.undo_move();
    }
    EXPECT_EQ(checked, 20u + 400u + 8902u);
}

TEST(FenTest, ExtraWhitespaceIsTolerated) {
    Board board = Fen::parse("  4k3/8/8/8/8/8/8/4K3   w  -  -  0  1 ");
    EXPECT_EQ(board.to_fen(), "4k3/8/8/8/8/8/8/4K3 w - - 0 1");
}

TEST(FenTest, FieldCount) {
    EXPECT_EQ(rejected_field(""), FenField::Placement);
    EXPECT_EQ(rejected_field("4k3/8/8/8/8/8/8/4K3 w - - 0"), FenField::Placement);
    EXPECT_EQ(rejected_field("4k3/8/8/8/8/8/8/4K3 w - - 0 1 extra"), FenField::Placement);
}

TEST(FenTest, BadPlacement) {
    EXPECT_EQ(rejected_field("4k3/8/8/8/8/8/4K3 w - - 0 1"), FenField::Placement);          // 7 ranks
    EXPECT_EQ(rejected_field("4k3/8/8/8/8/8/8/8/4K3 w - - 0 1"), FenField::Placement);      // 9 ranks
    EXPECT_EQ(rejected_field("4k3/8/8/8/8/8/8/4K4 w - - 0 1"), FenField::Placement);        // 9 files
    EXPECT_EQ(rejected_field("4k3/8/8/8/8/8/8/4K2 w - - 0 1"), FenField::Placement);        // 7 files
    EXPECT_EQ(rejected_field("4k3/8/8/8/8/8/8/RNBQKBNRP w - - 0 1"), FenField::Placement);  // 9 pieces
    EXPECT_EQ(rejected_field("4k3/8/8/8/8/8/8/4K3/ w - - 0 1"), FenField::Placement);
    EXPECT_EQ(rejected_field("4k3/8/8/8/8/8/8/09 w - - 0 1"), FenField::Placement);
    EXPECT_EQ(rejected_field("4k3/8/8/8/8/8/8/4X3 w - - 0 1"), FenField::Placement);
}

TEST(FenTest, ImpossiblePositions) {
    EXPECT_EQ(rejected_field("8/8/8/8/8/8/8/4K3 w - - 0 1"), FenField::Placement);          // no black king
    EXPECT_EQ(rejected_field("4k3/8/8/8/8/8/8/3KK3 w - - 0 1"), FenField::Placement);       // two white kings
    EXPECT_EQ(rejected_field("P3k3/8/8/8/8/8/8/4K3 w - - 0 1"), FenField::Placement);       // pawn on rank 8
    EXPECT_EQ(rejected_field("4k3/8/8/8/8/8/8/p3K3 b - - 0 1"), FenField::Placement);       // pawn on rank 1
    // Black to move would capture the white king
    EXPECT_EQ(rejected_field("4k3/8/8/8/8/8/8/r3K3 b - - 0 1"), FenField::Placement);
}

TEST(FenTest, BadSideToMove) {
    EXPECT_EQ(rejected_field("4k3/8/8/8/8/8/8/4K3 x - - 0 1"), FenField::SideToMove);
    EXPECT_EQ(rejected_field("4k3/8/8/8/8/8/8/4K3 W - - 0 1"), FenField::SideToMove);
}

TEST(FenTest, BadCastlingRights) {
    EXPECT_EQ(rejected_field("r3k2r/8/8/8/8/8/8/R3K2R w KQkx - 0 1"), FenField::Castling);
    EXPECT_EQ(rejected_field("r3k2r/8/8/8/8/8/8/R3K2R w KK - 0 1"), FenField::Castling);
    // No rook on h1
    EXPECT_EQ(rejected_field("r3k2r/8/8/8/8/8/8/R3K3 w K - 0 1"), FenField::Castling);
    // King off its home square
    EXPECT_EQ(rejected_field("r3k2r/8/8/8/8/8/8/R2K3R w Q - 0 1"), FenField::Castling);
}

TEST(FenTest, BadEnPassantTarget) {
    EXPECT_EQ(rejected_field("4k3/8/8/3pP3/8/8/8/4K3 w - z9 0 1"), FenField::EnPassant);
    // Wrong rank for white to move
    EXPECT_EQ(rejected_field("4k3/8/8/8/3Pp3/8/8/4K3 w - d3 0 1"), FenField::EnPassant);
    // No pawn that could have double-pushed
    EXPECT_EQ(rejected_field("4k3/8/8/4P3/8/8/8/4K3 w - d6 0 1"), FenField::EnPassant);
    // Origin square occupied
    EXPECT_EQ(rejected_field("4k3/3n4/8/3pP3/8/8/8/4K3 w - d6 0 1"), FenField::EnPassant);
}

TEST(FenTest, BadCounters) {
    EXPECT_EQ(rejected_field("4k3/8/8/8/8/8/8/4K3 w - - -1 1"), FenField::HalfmoveClock);
    EXPECT_EQ(rejected_field("4k3/8/8/8/8/8/8/4K3 w - - x 1"), FenField::HalfmoveClock);
    EXPECT_EQ(rejected_field("4k3/8/8/8/8/8/8/4K3 w - - 70000 1"), FenField::HalfmoveClock);
    EXPECT_EQ(rejected_field("4k3/8/8/8/8/8/8/4K3 w - - 0 0"), FenField::FullmoveNumber);
    EXPECT_EQ(rejected_field("4k3/8/8/8/8/8/8/4K3 w - - 0 1.5"), FenField::FullmoveNumber);
}

TEST(FenTest, MessageNamesTheField) {
    try {
        Fen::parse("4k3/8/8/8/8/8/8/4K3 w - - 0 0");
        FAIL() << "expected FenError";
    } catch (const ChessError& e) {
        EXPECT_NE(std::string(e.what()).find("fullmove number"), std::string::npos);
    }
}
