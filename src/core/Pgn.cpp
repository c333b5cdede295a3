#include "Pgn.hpp"
#include "Errors.hpp"
#include "Fen.hpp"
#include "San.hpp"

#include <algorithm>
#include <array>
#include <cctype>


void PgnTags::set(const std::string& name, const std::string& value) {
    for (Pair& pair : pairs_) {
        if (pair.first == name) {
            pair.second = value;
            return;
        }
    }
    pairs_.emplace_back(name, value);
}

std::optional<std::string> PgnTags::get(std::string_view name) const {
    for (const Pair& pair : pairs_) {
        if (pair.first == name) return pair.second;
    }
    return std::nullopt;
}


namespace Pgn {

namespace {
    constexpr std::array<std::string_view, 7> SEVEN_TAG_ROSTER{
        "Event", "Site", "Date", "Round", "White", "Black", "Result"};

    bool is_result_marker(std::string_view token) {
        return token == "1-0" || token == "0-1" || token == "1/2-1/2" || token == "*";
    }

    bool is_space(char c) {
        return std::isspace(static_cast<unsigned char>(c)) != 0;
    }

    bool is_digit(char c) { return c >= '0' && c <= '9'; }

    // Characters that end a SAN or move-number token.
    bool is_delimiter(char c) {
        return is_space(c) || c == '{' || c == '}' || c == '(' || c == ')'
            || c == '[' || c == ']' || c == ';' || c == '$';
    }

    class Parser {
    public:
        explicit Parser(std::string_view text) : text_(text) {}

        bool at_end() {
            skip_trivia();
            return pos_ >= text_.size();
        }

        void expect_end() {
            if (!at_end()) fail(pos_, "more than one game in the input");
        }

        PgnRecord parse_game() {
            skip_trivia();
            const size_t game_start = pos_;

            PgnTags tags;
            size_t fen_offset = 0;
            while (peek() == '[') {
                size_t tag_offset = pos_;
                auto [name, value] = parse_tag();
                if (name == "FEN") fen_offset = tag_offset;
                tags.set(name, value);
                skip_trivia();
            }

            Board start = Board::starting_position();
            if (std::optional<std::string> fen = tags.get("FEN")) {
                try {
                    start = Fen::parse(*fen);
                } catch (const FenError& e) {
                    fail(fen_offset, e.what());
                }
            }
            Game game(start);

            std::optional<std::string> marker;
            size_t marker_offset = pos_;
            bool saw_movetext = false;

            while (true) {
                skip_trivia();
                if (pos_ >= text_.size() || peek() == '[') break;

                const size_t token_offset = pos_;
                std::string token = read_token();
                saw_movetext = true;

                if (is_result_marker(token)) {
                    marker = token;
                    marker_offset = token_offset;
                    break;
                }

                if (is_digit(token.front()) && token.rfind("0-0", 0) != 0) {
                    token = consume_move_number(game, token, token_offset);
                    if (token.empty()) continue;
                }

                // Stray annotation glyphs and "e.p." written as its own token
                if (std::all_of(token.begin(), token.end(), [](char c) { return c == '!' || c == '?'; })
                    || token == "e.p.") {
                    continue;
                }

                play(game, token, token_offset);
            }

            if (tags.empty() && !saw_movetext) {
                fail(game_start, "no game found");
            }

            std::optional<std::string> result_tag = tags.get("Result");
            if (marker && result_tag && *result_tag != *marker) {
                fail(marker_offset, "result marker " + *marker
                     + " disagrees with the Result tag " + *result_tag);
            }
            if (!marker && result_tag && is_result_marker(*result_tag)) {
                marker = result_tag;
            }
            if (marker) apply_result(game, *marker, marker_offset);

            return PgnRecord{tags, game};
        }

    private:
        char peek() const { return pos_ < text_.size() ? text_[pos_] : '\0'; }

        size_t line_at(size_t offset) const {
            return 1 + static_cast<size_t>(std::count(text_.begin(), text_.begin() + std::min(offset, text_.size()), '\n'));
        }

        [[noreturn]] void fail(size_t offset, const std::string& detail) const {
            throw PgnError(offset, line_at(offset), detail);
        }

        bool at_line_start() const {
            return pos_ == 0 || text_[pos_ - 1] == '\n';
        }

        void skip_line() {
            while (pos_ < text_.size() && text_[pos_] != '\n') ++pos_;
        }

        void skip_comment() {
            const size_t start = pos_;
            size_t close = text_.find('}', pos_);
            if (close == std::string_view::npos) fail(start, "unterminated comment");
            pos_ = close + 1;
        }

        void skip_variation() {
            const size_t start = pos_;
            int depth = 0;
            while (pos_ < text_.size()) {
                char c = text_[pos_];
                if (c == '{') { skip_comment(); continue; }
                if (c == ';') { skip_line(); continue; }
                ++pos_;
                if (c == '(') ++depth;
                else if (c == ')' && --depth == 0) return;
            }
            fail(start, "unterminated variation");
        }

        // Whitespace, comments, NAGs, variations and escape lines.
        void skip_trivia() {
            while (pos_ < text_.size()) {
                char c = text_[pos_];
                if (is_space(c)) {
                    ++pos_;
                } else if (c == '%' && at_line_start()) {
                    skip_line();
                } else if (c == ';') {
                    skip_line();
                } else if (c == '{') {
                    skip_comment();
                } else if (c == '(') {
                    skip_variation();
                } else if (c == '$') {
                    ++pos_;
                    while (pos_ < text_.size() && is_digit(text_[pos_])) ++pos_;
                } else if (c == ')' || c == '}') {
                    fail(pos_, std::string("unbalanced '") + c + "'");
                } else {
                    break;
                }
            }
        }

        std::pair<std::string, std::string> parse_tag() {
            const size_t start = pos_;
            ++pos_; // '['
            while (pos_ < text_.size() && is_space(text_[pos_])) ++pos_;

            std::string name;
            while (pos_ < text_.size()
                   && (std::isalnum(static_cast<unsigned char>(text_[pos_])) || text_[pos_] == '_')) {
                name += text_[pos_++];
            }
            if (name.empty()) fail(start, "tag without a name");

            while (pos_ < text_.size() && is_space(text_[pos_])) ++pos_;
            if (peek() != '"') fail(pos_, "tag " + name + " has no quoted value");
            ++pos_;

            std::string value;
            while (true) {
                if (pos_ >= text_.size() || text_[pos_] == '\n') fail(start, "unterminated value for tag " + name);
                char c = text_[pos_++];
                if (c == '"') break;
                if (c == '\\' && pos_ < text_.size() && (text_[pos_] == '"' || text_[pos_] == '\\')) {
                    c = text_[pos_++];
                }
                value += c;
            }

            while (pos_ < text_.size() && is_space(text_[pos_])) ++pos_;
            if (peek() != ']') fail(pos_, "tag " + name + " is not closed");
            ++pos_;
            return {name, value};
        }

        std::string read_token() {
            std::string token;
            while (pos_ < text_.size() && !is_delimiter(text_[pos_])) {
                token += text_[pos_++];
            }
            if (token.empty()) fail(pos_, std::string("unexpected '") + peek() + "'");
            return token;
        }

        // Checks "12." / "12..." against the game and returns whatever SAN
        // was glued on after the dots.
        std::string consume_move_number(const Game& game, const std::string& token, size_t offset) {
            size_t i = 0;
            while (i < token.size() && is_digit(token[i])) ++i;
            if (i == token.size() || token[i] != '.') fail(offset, "unexpected token '" + token + "'");

            const unsigned long number = std::stoul(token.substr(0, std::min<size_t>(i, 9)));
            if (number != game.board().full_move_number) {
                fail(offset, "move number " + token.substr(0, i) + " does not match fullmove number "
                     + std::to_string(game.board().full_move_number));
            }

            while (i < token.size() && token[i] == '.') ++i;
            return token.substr(i);
        }

        void play(Game& game, const std::string& token, size_t offset) {
            try {
                game.play_san(token);
            } catch (const SanError& e) {
                fail(offset, e.what());
            } catch (const GameOverError&) {
                fail(offset, "move " + token + " after the game has ended");
            }
        }

        void apply_result(Game& game, const std::string& marker, size_t offset) {
            if (marker == "*") return;

            if (game.is_over()) {
                if (game.result().marker() != marker) {
                    fail(offset, "result " + marker + " contradicts the final position ("
                         + std::string(game.result().marker()) + ")");
                }
                return;
            }

            if (marker == "1-0") {
                game.resign(Colour::Black);
            } else if (marker == "0-1") {
                game.resign(Colour::White);
            } else if (game.can_claim_draw()) {
                game.claim_draw();
            } else {
                game.agree_draw();
            }
        }

        std::string_view text_;
        size_t pos_{0};
    };

    std::string escape(const std::string& value) {
        std::string out;
        for (char c : value) {
            if (c == '"' || c == '\\') out += '\\';
            out += c;
        }
        return out;
    }

    void write_tag(std::string& out, std::string_view name, const std::string& value) {
        out += '[';
        out += name;
        out += " \"";
        out += escape(value);
        out += "\"]\n";
    }
}

Game parse(std::string_view text, PgnTags* tags) {
    Parser parser(text);
    PgnRecord record = parser.parse_game();
    parser.expect_end();
    if (tags) *tags = record.tags;
    return record.game;
}

std::vector<PgnRecord> parse_all(std::string_view text) {
    std::vector<PgnRecord> games;
    Parser parser(text);
    while (!parser.at_end()) {
        games.push_back(parser.parse_game());
    }
    return games;
}

std::string serialize(const Game& game, const PgnTags& tags) {
    std::string out;
    const std::string result{game.result().marker()};

    for (std::string_view name : SEVEN_TAG_ROSTER) {
        if (name == "Result") {
            write_tag(out, name, result);
            continue;
        }
        std::optional<std::string> value = tags.get(name);
        write_tag(out, name, value.value_or(name == "Date" ? "????.??.??" : "?"));
    }

    const Board& start = game.start_board();
    const bool custom_start = !(start == Board::starting_position());
    if (custom_start) {
        write_tag(out, "SetUp", "1");
        write_tag(out, "FEN", start.to_fen());
    }

    for (const auto& [name, value] : tags) {
        if (std::find(SEVEN_TAG_ROSTER.begin(), SEVEN_TAG_ROSTER.end(), name) != SEVEN_TAG_ROSTER.end()) continue;
        if (name == "SetUp" || name == "FEN") continue;
        write_tag(out, name, value);
    }
    out += '\n';

    std::vector<std::string> tokens;
    Board board = start;
    for (size_t i = 0; i < game.moves().size(); ++i) {
        Move move = game.moves()[i];
        if (board.to_move == Colour::White) {
            tokens.push_back(std::to_string(board.full_move_number) + ".");
        } else if (i == 0) {
            tokens.push_back(std::to_string(board.full_move_number) + "...");
        }
        tokens.push_back(San::render(board, move));
        board.make_move(move);
    }
    tokens.push_back(result);

    size_t line_length = 0;
    for (const std::string& token : tokens) {
        if (line_length > 0 && line_length + 1 + token.size() > LINE_WIDTH) {
            out += '\n';
            line_length = 0;
        } else if (line_length > 0) {
            out += ' ';
            ++line_length;
        }
        out += token;
        line_length += token.size();
    }
    out += '\n';
    return out;
}

}
