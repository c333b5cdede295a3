#include "Game.hpp"
#include "Errors.hpp"
#include "Fen.hpp"
#include "Pgn.hpp"
#include "San.hpp"

#include <initializer_list>


Game::Game() {
    restart(Board::starting_position());
}

Game::Game(const Board& start) {
    restart(start);
}

Game Game::from_fen(std::string_view fen) {
    return Game(Fen::parse(fen));
}

Game Game::from_pgn(std::string_view pgn) {
    return Pgn::parse(pgn);
}

void Game::restart(const Board& start) {
    start_ = start;
    start_.history.clear();
    board_ = start_;
    moves_.clear();
    keys_.clear();
    repetitions_.clear();

    keys_.push_back(board_.key);
    ++repetitions_[board_.key];
    evaluate();
}

void Game::evaluate() {
    if (!board_.has_legal_moves()) {
        result_ = board_.in_check() ? GameResult::checkmate(opposite(board_.to_move))
                                    : GameResult::stalemate();
    } else if (board_.insufficient_material()) {
        result_ = GameResult::insufficient_material();
    } else {
        result_ = GameResult::in_progress();
    }
}

MoveList Game::legal_moves() const {
    if (is_over()) return MoveList{};
    return board_.legal_moves();
}

MoveList Game::legal_moves_from(Square from) const {
    return legal_moves().from_square(from);
}

bool Game::can_select_square(Square sq) const {
    if (is_over()) return false;
    Piece piece = board_.piece_at(sq);
    return !piece.empty() && piece.colour == board_.to_move;
}

std::optional<Move> Game::find_move(Square from, Square to, PieceType promotion) const {
    for (Move move : legal_moves_from(from)) {
        if (move.to() != to) continue;
        if (move.is_promotion() && move.promotion_type() != promotion) continue;
        return move;
    }
    return std::nullopt;
}

void Game::play_move(Move move) {
    if (is_over()) throw GameOverError();
    board_.apply_move(move);

    moves_.push_back(move);
    keys_.push_back(board_.key);
    ++repetitions_[board_.key];
    evaluate();
}

Move Game::play_san(std::string_view san) {
    if (is_over()) throw GameOverError();
    Move move = San::resolve(board_, san);
    play_move(move);
    return move;
}

int Game::repetition_count() const {
    auto it = repetitions_.find(board_.key);
    return it == repetitions_.end() ? 0 : it->second;
}

bool Game::can_claim_draw(DrawReason reason) const {
    if (is_over()) return false;
    switch (reason) {
        case DrawReason::FiftyMove:  return board_.half_move_clock >= 100;
        case DrawReason::Repetition: return repetition_count() >= 3;
        default: return false;
    }
}

bool Game::can_claim_draw() const {
    return can_claim_draw(DrawReason::FiftyMove) || can_claim_draw(DrawReason::Repetition);
}

DrawReason Game::claim_draw() {
    if (is_over()) throw DrawClaimError("the game is already over");
    for (DrawReason reason : {DrawReason::FiftyMove, DrawReason::Repetition}) {
        if (can_claim_draw(reason)) {
            result_ = GameResult::draw_claimed(reason);
            return reason;
        }
    }
    throw DrawClaimError("neither the fifty-move rule nor threefold repetition applies");
}

void Game::claim_draw(DrawReason reason) {
    if (is_over()) throw DrawClaimError("the game is already over");
    if (reason != DrawReason::FiftyMove && reason != DrawReason::Repetition) {
        throw DrawClaimError("only fifty-move and repetition draws can be claimed");
    }
    if (!can_claim_draw(reason)) {
        throw DrawClaimError(reason == DrawReason::FiftyMove
                             ? "fewer than fifty moves without a capture or pawn move"
                             : "the position has not occurred three times");
    }
    result_ = GameResult::draw_claimed(reason);
}

void Game::resign(Colour loser) {
    if (is_over()) throw GameOverError();
    result_ = GameResult::resigned(opposite(loser));
}

void Game::agree_draw() {
    if (is_over()) throw GameOverError();
    result_ = GameResult::draw_claimed(DrawReason::Agreement);
}

void Game::undo_move() {
    if (moves_.empty()) return;

    auto it = repetitions_.find(keys_.back());
    if (it != repetitions_.end() && --it->second == 0) repetitions_.erase(it);
    keys_.pop_back();

    moves_.pop_back();
    board_.undo_move();
    evaluate();
}

std::string Game::to_pgn() const {
    return Pgn::serialize(*this);
}

void Game::reset() {
    restart(Board::starting_position());
}

bool Game::load_fen(std::string_view fen) {
    try {
        restart(Fen::parse(fen));
    } catch (const FenError&) {
        return false;
    }
    return true;
}
