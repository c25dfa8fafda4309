#pragma once

#include <random>
#include <vector>

#include "common/argument_wrapper.hh"
#include "domain/match_config.hh"
#include "domain/recent_moves.hh"
#include "domain/rock_paper_scissors.hh"

namespace rps::learning {

// Chance that the normal tier plays a uniformly random move instead of countering.
inline constexpr double NORMAL_RANDOM_PROBABILITY = 0.65;

// Moves that beat `target` under the ruleset, in enum order.
std::vector<domain::Move> counters(const domain::Ruleset ruleset, const domain::Move target);

// A uniformly sampled member of counters(ruleset, target), or `target` itself if nothing beats it.
domain::Move best_counter(const domain::Ruleset ruleset, const domain::Move target,
                          InOut<std::mt19937> gen);

// The most frequent move in `recent`, with ties broken uniformly at random. Falls back to
// `just_played` when `recent` is empty.
domain::Move predict_move(const domain::RecentMoves &recent, const domain::Move just_played,
                          InOut<std::mt19937> gen);

domain::Move sample_uniform(const std::vector<domain::Move> &moves, InOut<std::mt19937> gen);

// Picks the computer's move for the round. `recent` is expected to already contain
// `just_played`; the caller owns appending to it.
domain::Move choose_move(const domain::Ruleset ruleset, const domain::Difficulty difficulty,
                         const domain::RecentMoves &recent, const domain::Move just_played,
                         InOut<std::mt19937> gen);
}  // namespace rps::learning
