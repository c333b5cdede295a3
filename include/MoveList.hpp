#pragma once

#include "Types.hpp"

#include <algorithm>
#include <utility>
#include <vector>


// Sized, re-iterable collection of moves. The count is known before
// iteration starts and the list can be walked any number of times.
class MoveList {
public:
    // No legal position has more than 218 moves.
    static constexpr size_t CAPACITY_HINT = 256;

    using const_iterator = std::vector<Move>::const_iterator;

    MoveList() { moves_.reserve(CAPACITY_HINT); }

    void push_back(Move move) { moves_.push_back(move); }

    template <typename... Args>
    void emplace_back(Args&&... args) {
        moves_.emplace_back(std::forward<Args>(args)...);
    }

    [[nodiscard]] size_t size() const { return moves_.size(); }
    [[nodiscard]] bool empty() const { return moves_.empty(); }

    const_iterator begin() const { return moves_.begin(); }
    const_iterator end() const { return moves_.end(); }

    Move operator[](size_t i) const { return moves_[i]; }

    [[nodiscard]] bool contains(Move move) const {
        return std::find(moves_.begin(), moves_.end(), move) != moves_.end();
    }

    [[nodiscard]] MoveList from_square(Square from) const {
        MoveList out;
        for (Move m : moves_) {
            if (m.from() == from) out.push_back(m);
        }
        return out;
    }

private:
    std::vector<Move> moves_;
};
