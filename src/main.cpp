#include "Attacks.hpp"
#include "Board.hpp"
#include "Errors.hpp"
#include "Fen.hpp"
#include "Game.hpp"
#include "Perft.hpp"
#include "Pgn.hpp"
#include "San.hpp"
#include "Types.hpp"

#include <chrono>
#include <fstream>
#include <iostream>
#include <sstream>
#include <string>
#include <vector>


namespace {

constexpr int EXIT_USAGE = 1;
constexpr int EXIT_MALFORMED = 2;

void print_usage() {
    std::cerr << "usage:\n"
              << "  chesscore_cli perft <depth> [fen]\n"
              << "  chesscore_cli divide <depth> [fen]\n"
              << "  chesscore_cli fen <fen>\n"
              << "  chesscore_cli pgn <file>\n";
}

// FENs arrive either quoted as one argument or split over six.
std::string join_args(const std::vector<std::string>& args, size_t first) {
    std::string out;
    for (size_t i = first; i < args.size(); ++i) {
        if (!out.empty()) out += ' ';
        out += args[i];
    }
    return out;
}

bool parse_depth(const std::string& text, int& depth) {
    if (text.empty() || text.size() > 2) return false;
    for (char c : text) {
        if (c < '0' || c > '9') return false;
    }
    depth = std::stoi(text);
    return true;
}

std::string describe(const GameResult& result) {
    switch (result.status) {
        case GameStatus::InProgress:    return "in progress";
        case GameStatus::Checkmate:     return std::string("checkmate, ") + (result.winner == Colour::White ? "white" : "black") + " wins";
        case GameStatus::Stalemate:     return "stalemate";
        case GameStatus::DrawAutomatic: return "draw by insufficient material";
        case GameStatus::DrawClaimed:   return "draw claimed";
        case GameStatus::Resigned:      return std::string("resignation, ") + (result.winner == Colour::White ? "white" : "black") + " wins";
    }
    return "unknown";
}

int run_perft(const std::vector<std::string>& args, bool divide) {
    int depth = 0;
    if (args.size() < 2 || !parse_depth(args[1], depth)) {
        print_usage();
        return EXIT_USAGE;
    }

    Board board = args.size() > 2 ? Fen::parse(join_args(args, 2)) : Board::starting_position();

    std::cout << "Starting Perft (Depth " << depth << ")..." << std::endl;
    auto start = std::chrono::high_resolution_clock::now();

    uint64_t nodes = 0;
    if (divide) {
        for (const auto& [move, count] : Perft::divide(board, depth)) {
            std::cout << move.to_uci() << ": " << count << "\n";
            nodes += count;
        }
    } else {
        nodes = Perft::perft(board, depth);
    }

    auto end = std::chrono::high_resolution_clock::now();
    std::chrono::duration<double> elapsed = end - start;

    std::cout << "Nodes: " << nodes << " | Time: " << elapsed.count() << "s" << std::endl;
    return 0;
}

int run_fen(const std::vector<std::string>& args) {
    if (args.size() < 2) {
        print_usage();
        return EXIT_USAGE;
    }

    Game game = Game::from_fen(join_args(args, 1));
    const Board& board = game.board();

    std::cout << board.pretty() << "\n";
    std::cout << "FEN:    " << board.to_fen() << "\n";
    std::cout << "Side:   " << (board.to_move == Colour::White ? "white" : "black") << "\n";
    std::cout << "Key:    0x" << std::hex << board.key << std::dec << "\n";
    std::cout << "Status: " << describe(game.result()) << (board.in_check() ? " (check)" : "") << "\n";

    if (board.in_check()) {
        std::cout << "Checkers:\n";
        Attacks::print_bitboard(Attacks::attackers_to(board.king_square(board.to_move), opposite(board.to_move),
                                                      board.pieces.data(), board.occupancy[2]));
    }

    MoveList moves = game.legal_moves();
    std::cout << "Moves (" << moves.size() << "):";
    for (Move move : moves) {
        std::cout << ' ' << San::render(board, move);
    }
    std::cout << std::endl;
    return 0;
}

int run_pgn(const std::vector<std::string>& args) {
    if (args.size() != 2) {
        print_usage();
        return EXIT_USAGE;
    }

    std::ifstream file(args[1]);
    if (!file) {
        std::cerr << "cannot open " << args[1] << std::endl;
        return EXIT_USAGE;
    }
    std::stringstream buffer;
    buffer << file.rdbuf();

    std::vector<PgnRecord> games = Pgn::parse_all(buffer.str());
    for (size_t i = 0; i < games.size(); ++i) {
        if (i > 0) std::cout << "\n";
        std::cout << Pgn::serialize(games[i].game, games[i].tags);
    }
    std::cerr << games.size() << " game(s) read" << std::endl;
    return 0;
}

}


int main(int argc, char* argv[]) {
    std::vector<std::string> args(argv + 1, argv + argc);
    if (args.empty()) {
        print_usage();
        return EXIT_USAGE;
    }

    const std::string& command = args[0];
    try {
        if (command == "perft") return run_perft(args, false);
        if (command == "divide") return run_perft(args, true);
        if (command == "fen") return run_fen(args);
        if (command == "pgn") return run_pgn(args);
    } catch (const ChessError& e) {
        std::cerr << "error: " << e.what() << std::endl;
        return EXIT_MALFORMED;
    }

    print_usage();
    return EXIT_USAGE;
}
