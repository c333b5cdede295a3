#pragma once

#include "Types.hpp"
#include "Board.hpp"
#include "IChessCore.hpp"
#include "MoveList.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>


// A game from some start position: the moves played, the positions seen
// (for repetition) and how it ended.
class Game : public IChessCore {
public:
    Game();
    explicit Game(const Board& start);

    // Throws FenError.
    static Game from_fen(std::string_view fen);
    // Exactly one game; throws PgnError.
    static Game from_pgn(std::string_view pgn);

    const Board& board() const { return board_; }
    const Board& start_board() const { return start_; }
    Colour side_to_move() const { return board_.to_move; }
    const std::vector<Move>& moves() const { return moves_; }
    std::optional<Move> last_move() const { return board_.last_move(); }
    GameResult result() const { return result_; }
    bool is_over() const { return result_.is_over(); }

    bool in_check() const { return board_.in_check(); }
    bool in_checkmate() const { return result_.status == GameStatus::Checkmate; }
    bool in_stalemate() const { return result_.status == GameStatus::Stalemate; }

    // Legal move with this origin and destination. `promotion` picks the
    // piece when the move promotes.
    std::optional<Move> find_move(Square from, Square to,
                                  PieceType promotion = PieceType::Queen) const;

    // Throws GameOverError or IllegalMoveError; the game is unchanged on failure.
    void play_move(Move move);
    // Throws GameOverError or SanError.
    Move play_san(std::string_view san);

    // Fifty-move rule first, then threefold repetition. Throws DrawClaimError.
    DrawReason claim_draw();
    void claim_draw(DrawReason reason);
    bool can_claim_draw() const;
    bool can_claim_draw(DrawReason reason) const;

    // Times the current position has occurred, this occurrence included.
    int repetition_count() const;

    // Throws GameOverError.
    void resign(Colour loser);
    void agree_draw();

    // Takes back the last ply; no-op at the start position.
    void undo_move();

    std::string to_fen() const { return board_.to_fen(); }
    std::string to_pgn() const;

    // IChessCore
    void make_move(Move move) override { play_move(move); }
    void unmake_move() override { undo_move(); }
    MoveList legal_moves() const override;
    MoveList legal_moves_from(Square from) const override;
    GameResult get_game_state() const override { return result_; }
    bool is_check(Colour side) const override { return board_.is_check(side); }
    const Board& get_board_state() const override { return board_; }
    Piece piece_at(Square sq) const override { return board_.piece_at(sq); }
    bool can_select_square(Square sq) const override;
    void reset() override;
    bool load_fen(std::string_view fen) override;

private:
    void restart(const Board& start);
    void evaluate();

    Board start_;
    Board board_;
    std::vector<Move> moves_;
    std::vector<uint64_t> keys_;
    std::unordered_map<uint64_t, int> repetitions_;
    GameResult result_;
};
