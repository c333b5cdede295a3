#pragma once

#include "Game.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>


// Tag pairs in the order they were added. Setting an existing tag keeps
// its position.
class PgnTags {
public:
    using Pair = std::pair<std::string, std::string>;
    using const_iterator = std::vector<Pair>::const_iterator;

    void set(const std::string& name, const std::string& value);
    [[nodiscard]] std::optional<std::string> get(std::string_view name) const;
    [[nodiscard]] bool contains(std::string_view name) const { return get(name).has_value(); }

    [[nodiscard]] size_t size() const { return pairs_.size(); }
    [[nodiscard]] bool empty() const { return pairs_.empty(); }
    const_iterator begin() const { return pairs_.begin(); }
    const_iterator end() const { return pairs_.end(); }

private:
    std::vector<Pair> pairs_;
};

struct PgnRecord {
    PgnTags tags;
    Game game;
};

namespace Pgn {
    inline constexpr size_t LINE_WIDTH = 80;

    // Exactly one game. Tags are copied to `tags` when it is non-null.
    // Throws PgnError.
    Game parse(std::string_view text, PgnTags* tags = nullptr);

    // Every game in a multi-game file, in order. Throws PgnError.
    std::vector<PgnRecord> parse_all(std::string_view text);

    // Seven Tag Roster first, then the remaining tags of `tags`, then the
    // movetext ending with the result marker.
    std::string serialize(const Game& game, const PgnTags& tags = {});
}
