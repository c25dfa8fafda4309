#include "learning/opponent_policy.hh"

#include <algorithm>

#include "common/check.hh"
#include "common/indexed_array.hh"

namespace rps::learning {
using domain::Difficulty;
using domain::Move;
using domain::Ruleset;

std::vector<Move> counters(const Ruleset ruleset, const Move target) {
    std::vector<Move> out;
    for (const auto move : domain::legal_moves(ruleset)) {
        if (domain::beats(ruleset, move, target)) {
            out.push_back(move);
        }
    }
    return out;
}

Move sample_uniform(const std::vector<Move> &moves, InOut<std::mt19937> gen) {
    RPS_CHECK(!moves.empty(), "Cannot sample from an empty set of moves");
    std::uniform_int_distribution<int> dist(0, static_cast<int>(moves.size()) - 1);
    return moves.at(dist(*gen));
}

Move best_counter(const Ruleset ruleset, const Move target, InOut<std::mt19937> gen) {
    const std::vector<Move> candidates = counters(ruleset, target);
    if (candidates.empty()) {
        return target;
    }
    return sample_uniform(candidates, gen);
}

Move predict_move(const domain::RecentMoves &recent, const Move just_played,
                  InOut<std::mt19937> gen) {
    if (recent.empty()) {
        return just_played;
    }

    IndexedArray<int, Move> counts{0};
    for (const auto move : recent.to_vector()) {
        counts[move]++;
    }

    int max_count = 0;
    for (const auto &[move, count] : counts) {
        max_count = std::max(max_count, count);
    }

    std::vector<Move> most_common;
    for (const auto &[move, count] : counts) {
        if (count == max_count) {
            most_common.push_back(move);
        }
    }
    return sample_uniform(most_common, gen);
}

Move choose_move(const Ruleset ruleset, const Difficulty difficulty,
                 const domain::RecentMoves &recent, const Move just_played,
                 InOut<std::mt19937> gen) {
    switch (difficulty) {
        case Difficulty::EASY:
            return sample_uniform(domain::legal_moves(ruleset), gen);
        case Difficulty::NORMAL: {
            std::bernoulli_distribution play_random(NORMAL_RANDOM_PROBABILITY);
            if (play_random(*gen)) {
                return sample_uniform(domain::legal_moves(ruleset), gen);
            }
            return best_counter(ruleset, just_played, gen);
        }
        case Difficulty::HARD:
            return best_counter(ruleset, predict_move(recent, just_played, gen), gen);
    }
    return sample_uniform(domain::legal_moves(ruleset), gen);
}
}  // namespace rps::learning
