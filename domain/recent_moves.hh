#pragma once

#include <array>
#include <vector>

#include "domain/rock_paper_scissors.hh"

namespace rps::domain {

// Bounded record of the human's most recent moves. Once full, each push evicts the oldest move.
class RecentMoves {
   public:
    static constexpr int CAPACITY = 12;

    RecentMoves() = default;
    // Keeps only the last CAPACITY moves of `moves`, oldest first.
    explicit RecentMoves(const std::vector<Move> &moves);

    void push(const Move move);
    void clear();

    int size() const { return size_; }
    bool empty() const { return size_ == 0; }

    // i = 0 is the oldest move still held
    Move at(const int i) const;

    std::vector<Move> to_vector() const;

    bool operator==(const RecentMoves &other) const;

   private:
    std::array<Move, CAPACITY> buffer_{};
    int start_ = 0;
    int size_ = 0;
};
}  // namespace rps::domain
