#include <gtest/gtest.h>
#include "Board.hpp"
#include "Errors.hpp"
#include "San.hpp"
#include "TestHelpers.hpp"

#include <string_view>

namespace {

SanErrorKind resolve_error(const Board& board, std::string_view token) {
    try {
        San::resolve(board, token);
    } catch (const SanError& e) {
        EXPECT_EQ(e.token(), std::string(token));
        return e.san_kind();
    }
    ADD_FAILURE() << "resolved: " << token;
    return SanErrorKind::Illegal;
}

}

TEST(SanTest, PawnAndPieceMoves) {
    Board board = Board::starting_position();
    EXPECT_EQ(San::render(board, Move(Square::E2, Square::E4, MoveFlag::DoublePawnPush)), "e4");
    EXPECT_EQ(San::render(board, Move(Square::G1, Square::F3)), "Nf3");

    Board ep = Board::from_fen("4k3/8/8/3pP3/8/8/8/4K3 w - d6 0 3");
    EXPECT_EQ(San::render(ep, Move(Square::E5, Square::D6, MoveFlag::EnPassant)), "exd6");
}

TEST(SanTest, Disambiguation) {
    // Knights on b1 and f1 both reach d2
    Board by_file = Board::from_fen("4k3/8/8/8/8/8/8/1N3N1K w - - 0 1");
    EXPECT_EQ(San::render(by_file, Move(Square::B1, Square::D2)), "Nbd2");
    EXPECT_EQ(San::render(by_file, Move(Square::F1, Square::D2)), "Nfd2");
    // Only one knight reaches c3
    EXPECT_EQ(San::render(by_file, Move(Square::B1, Square::C3)), "Nc3");

    // Rooks on a1 and a5 share the file
    Board by_rank = Board::from_fen("4k3/8/8/R7/8/8/8/R6K w - - 0 1");
    EXPECT_EQ(San::render(by_rank, Move(Square::A1, Square::A3)), "R1a3");
    EXPECT_EQ(San::render(by_rank, Move(Square::A5, Square::A3)), "R5a3");

    // Queens on h4, e4 and h1 all reach e1
    Board by_square = Board::from_fen("8/8/1k6/8/4Q2Q/8/8/K6Q w - - 0 1");
    EXPECT_EQ(San::render(by_square, Move(Square::H4, Square::E1)), "Qh4e1");
    EXPECT_EQ(San::render(by_square, Move(Square::E4, Square::E1)), "Qee1");
    EXPECT_EQ(San::render(by_square, Move(Square::H1, Square::E1)), "Q1e1");
}

TEST(SanTest, CheckAndMateSuffixes) {
    Board check = Board::from_fen("rnbqkbnr/ppppp1pp/8/5p2/4P3/8/PPPP1PPP/RNBQKBNR w KQkq f6 0 2");
    EXPECT_EQ(San::render(check, Move(Square::D1, Square::H5)), "Qh5+");

    Board mate = Board::from_fen("rnbqkbnr/pppp1ppp/8/4p3/6P1/5P2/PPPPP2P/RNBQKBNR b KQkq g3 0 2");
    EXPECT_EQ(San::render(mate, Move(Square::D8, Square::H4)), "Qh4#");
}

TEST(SanTest, CastlingAndPromotion) {
    Board castle = Board::from_fen("r3k2r/8/8/8/8/8/8/R3K2R w KQkq - 0 1");
    EXPECT_EQ(San::render(castle, Move(Square::E1, Square::G1, MoveFlag::KingCastle)), "O-O");
    EXPECT_EQ(San::render(castle, Move(Square::E1, Square::C1, MoveFlag::QueenCastle)), "O-O-O");

    Board promo = Board::from_fen("8/P7/8/8/8/8/8/k6K w - - 0 1");
    EXPECT_EQ(San::render(promo, Move(Square::A7, Square::A8, MoveFlag::QueenPromo)), "a8=Q+");
    EXPECT_EQ(San::render(promo, Move(Square::A7, Square::A8, MoveFlag::RookPromo)), "a8=R+");
    EXPECT_EQ(San::render(promo, Move(Square::A7, Square::A8, MoveFlag::KnightPromo)), "a8=N");
}

TEST(SanTest, ResolveAcceptsCommonSpellings) {
    Board castle = Board::from_fen("r3k2r/8/8/8/8/8/8/R3K2R w KQkq - 0 1");
    EXPECT_EQ(San::resolve(castle, "O-O"), Move(Square::E1, Square::G1, MoveFlag::KingCastle));
    EXPECT_EQ(San::resolve(castle, "0-0"), Move(Square::E1, Square::G1, MoveFlag::KingCastle));
    EXPECT_EQ(San::resolve(castle, "0-0-0"), Move(Square::E1, Square::C1, MoveFlag::QueenCastle));
    EXPECT_EQ(San::resolve(castle, "O-O-O+"), Move(Square::E1, Square::C1, MoveFlag::QueenCastle));

    Board start = Board::starting_position();
    const Move e4(Square::E2, Square::E4, MoveFlag::DoublePawnPush);
    EXPECT_EQ(San::resolve(start, "e4"), e4);
    EXPECT_EQ(San::resolve(start, "e4!?"), e4);
    EXPECT_EQ(San::resolve(start, "Pe4"), e4);
    EXPECT_EQ(San::resolve(start, "Ng1f3"), Move(Square::G1, Square::F3));

    Board promo = Board::from_fen("8/P7/8/8/8/8/8/k6K w - - 0 1");
    EXPECT_EQ(San::resolve(promo, "a8=Q+"), Move(Square::A7, Square::A8, MoveFlag::QueenPromo));
    EXPECT_EQ(San::resolve(promo, "a8Q"), Move(Square::A7, Square::A8, MoveFlag::QueenPromo));
    EXPECT_EQ(San::resolve(promo, "a8=N"), Move(Square::A7, Square::A8, MoveFlag::KnightPromo));

    Board ep = Board::from_fen("4k3/8/8/3pP3/8/8/8/4K3 w - d6 0 3");
    const Move exd6(Square::E5, Square::D6, MoveFlag::EnPassant);
    EXPECT_EQ(San::resolve(ep, "exd6"), exd6);
    EXPECT_EQ(San::resolve(ep, "exd6e.p."), exd6);
    EXPECT_EQ(San::resolve(ep, "exd6 e.p."), exd6);
    EXPECT_EQ(San::resolve(ep, "e5:d6"), exd6);
}

TEST(SanTest, ResolveRejectsAmbiguity) {
    Board knights = Board::from_fen("4k3/8/8/8/8/8/8/1N3N1K w - - 0 1");
    EXPECT_EQ(resolve_error(knights, "Nd2"), SanErrorKind::Ambiguous);
    EXPECT_EQ(resolve_error(knights, "N1d2"), SanErrorKind::Ambiguous);
    EXPECT_EQ(San::resolve(knights, "Nbd2"), Move(Square::B1, Square::D2));

    // A promotion needs its piece
    Board promo = Board::from_fen("8/P7/8/8/8/8/8/k6K w - - 0 1");
    EXPECT_EQ(resolve_error(promo, "a8"), SanErrorKind::Ambiguous);
}

TEST(SanTest, ResolveRejectsIllegalMoves) {
    Board start = Board::starting_position();
    EXPECT_EQ(resolve_error(start, "e5"), SanErrorKind::Illegal);
    EXPECT_EQ(resolve_error(start, "Ke2"), SanErrorKind::Illegal);
    EXPECT_EQ(resolve_error(start, "O-O"), SanErrorKind::Illegal);
    EXPECT_EQ(resolve_error(start, "Nf3=Q"), SanErrorKind::Illegal);
    EXPECT_EQ(resolve_error(start, "hello"), SanErrorKind::Illegal);
    EXPECT_EQ(resolve_error(start, ""), SanErrorKind::Illegal);

    try {
        San::resolve(start, "Qd4");
        FAIL() << "expected SanError";
    } catch (const ChessError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::IllegalSan);
    }
}

TEST(SanTest, RenderedMovesResolveBack) {
    const std::string_view fens[] = {
        STARTPOS_FEN,
        KIWIPETE_FEN,
        "r3k2r/Pppp1ppp/1b3nbN/nP6/BBP1P3/q4N2/Pp1P2PP/R2Q1RK1 w kq - 0 1",
        "8/8/1k6/8/4Q2Q/8/8/K6Q w - - 0 1",
    };
    for (std::string_view fen : fens) {
        Board board = Board::from_fen(fen);
        for (Move first : board.legal_moves()) {
            EXPECT_EQ(San::resolve(board, San::render(board, first)), first) << fen;
            board.make_move(first);
            for (Move reply : board.legal_moves()) {
                std::string san = San::render(board, reply);
                EXPECT_EQ(San::resolve(board, san), reply) << fen << " " << first.to_uci() << " " << san;
            }
            board.undo_move();
        }
    }
}
