#include "domain/recent_moves.hh"

#include "common/check.hh"

namespace rps::domain {
RecentMoves::RecentMoves(const std::vector<Move> &moves) {
    for (const auto move : moves) {
        push(move);
    }
}

void RecentMoves::push(const Move move) {
    if (size_ < CAPACITY) {
        buffer_[(start_ + size_) % CAPACITY] = move;
        size_++;
    } else {
        buffer_[start_] = move;
        start_ = (start_ + 1) % CAPACITY;
    }
}

void RecentMoves::clear() {
    start_ = 0;
    size_ = 0;
}

Move RecentMoves::at(const int i) const {
    RPS_CHECK(i >= 0 && i < size_, "Index out of range", i, size_);
    return buffer_[(start_ + i) % CAPACITY];
}

std::vector<Move> RecentMoves::to_vector() const {
    std::vector<Move> out;
    out.reserve(size_);
    for (int i = 0; i < size_; i++) {
        out.push_back(at(i));
    }
    return out;
}

bool RecentMoves::operator==(const RecentMoves &other) const {
    return to_vector() == other.to_vector();
}
}  // namespace rps::domain
