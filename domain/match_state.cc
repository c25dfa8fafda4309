#include "domain/match_state.hh"

#include <algorithm>
#include <sstream>
#include <type_traits>
#include <variant>

#include "common/check.hh"
#include "domain/errors.hh"
#include "learning/opponent_policy.hh"

namespace rps::domain {
namespace {
std::optional<RoundOutcome> winner_for_format(const MatchFormat &format,
                                              const std::vector<RoundRecord> &history,
                                              const int player1_round_wins,
                                              const int player2_round_wins) {
    const auto first_to = [&](const int needed) -> std::optional<RoundOutcome> {
        if (player1_round_wins >= needed) {
            return RoundOutcome::PLAYER1;
        } else if (player2_round_wins >= needed) {
            return RoundOutcome::PLAYER2;
        }
        return std::nullopt;
    };

    return std::visit(
        [&](const auto &alternative) -> std::optional<RoundOutcome> {
            using T = std::decay_t<decltype(alternative)>;
            if constexpr (std::is_same_v<T, BestOfN>) {
                // Ties don't count towards the majority, so this can take more than N rounds
                return first_to(alternative.wins_needed());
            } else if constexpr (std::is_same_v<T, FirstToK>) {
                return first_to(alternative.wins);
            } else {
                if (history.empty()) {
                    return std::nullopt;
                }
                return history.back().outcome;
            }
        },
        format);
}

MalformedPersistedState malformed(const std::string &reason) {
    return MalformedPersistedState("Saved match is malformed: " + reason);
}
}  // namespace

MatchState::MatchState(MatchConfig config) : config_(std::move(config)) { validate(config_); }

MatchState MatchState::from_parts(MatchConfig config, const int round_index,
                                  const int player1_round_wins, const int player2_round_wins,
                                  std::vector<RoundRecord> history,
                                  const RecentMoves &human_recent) {
    try {
        validate(config);
    } catch (const std::invalid_argument &e) {
        throw malformed(e.what());
    }

    MatchState out(std::move(config));
    const Ruleset ruleset = out.config_.ruleset;
    for (int i = 0; i < static_cast<int>(history.size()); i++) {
        const RoundRecord &record = history.at(i);
        if (record.round != i + 1) {
            std::stringstream reason;
            reason << "round " << record.round << " found at position " << i + 1;
            throw malformed(reason.str());
        }
        if (!is_legal(ruleset, record.player1_move) || !is_legal(ruleset, record.player2_move)) {
            throw malformed("round " + std::to_string(record.round) + " has an illegal move");
        }
        if (resolve(ruleset, record.player1_move, record.player2_move) != record.outcome) {
            throw malformed("round " + std::to_string(record.round) +
                            " outcome does not match its moves");
        }
        if (out.phase() == MatchPhase::MATCH_COMPLETE) {
            throw malformed("rounds recorded after the match was decided");
        }
        out.apply_round(record);
    }

    if (out.round_index_ != round_index) {
        std::stringstream reason;
        reason << "round index " << round_index << " with " << history.size() << " rounds played";
        throw malformed(reason.str());
    }
    if (out.player1_round_wins_ != player1_round_wins ||
        out.player2_round_wins_ != player2_round_wins) {
        throw malformed("round win tallies do not match the history");
    }
    // Recent moves are always the tail of player 1's moves in single player, and empty otherwise
    RecentMoves expected_recent;
    if (out.config_.mode == Mode::SINGLE_PLAYER) {
        for (const auto &record : out.history_) {
            expected_recent.push(record.player1_move);
        }
    }
    if (human_recent != expected_recent) {
        std::stringstream reason;
        reason << human_recent.size() << " recent human moves do not match the last "
               << expected_recent.size() << " moves of " << out.config_.player1;
        throw malformed(reason.str());
    }
    out.human_recent_ = expected_recent;
    return out;
}

RoundOutcome MatchState::advance_round(const Move move1, const Move move2) {
    RPS_CHECK(phase() == MatchPhase::AWAITING_ROUND, "Match is already complete",
              history_.size());
    const RoundOutcome outcome = resolve(config_.ruleset, move1, move2);
    if (config_.mode == Mode::SINGLE_PLAYER) {
        human_recent_.push(move1);
    }
    apply_round({.round = round_index_,
                 .player1_move = move1,
                 .player2_move = move2,
                 .outcome = outcome});
    return outcome;
}

RoundResult MatchState::advance_round_vs_computer(const Move human_move,
                                                  InOut<std::mt19937> gen) {
    RPS_CHECK(config_.mode == Mode::SINGLE_PLAYER && config_.difficulty.has_value(),
              "The computer only plays in single player matches");
    RPS_CHECK(phase() == MatchPhase::AWAITING_ROUND, "Match is already complete",
              history_.size());
    if (!is_legal(config_.ruleset, human_move)) {
        throw InvalidMove(to_string(human_move) + " is not a legal move under the " +
                          to_string(config_.ruleset) + " ruleset");
    }

    human_recent_.push(human_move);
    const Move computer_move = learning::choose_move(
        config_.ruleset, config_.difficulty.value(), human_recent_, human_move, gen);
    const RoundOutcome outcome = resolve(config_.ruleset, human_move, computer_move);
    apply_round({.round = round_index_,
                 .player1_move = human_move,
                 .player2_move = computer_move,
                 .outcome = outcome});
    return {.player2_move = computer_move, .outcome = outcome};
}

void MatchState::apply_round(const RoundRecord &record) {
    if (record.outcome == RoundOutcome::PLAYER1) {
        player1_round_wins_++;
    } else if (record.outcome == RoundOutcome::PLAYER2) {
        player2_round_wins_++;
    }
    history_.push_back(record);
    round_index_++;
}

std::optional<RoundOutcome> MatchState::check_match_winner() const {
    return winner_for_format(config_.format, history_, player1_round_wins_, player2_round_wins_);
}

MatchPhase MatchState::phase() const {
    return check_match_winner().has_value() ? MatchPhase::MATCH_COMPLETE
                                            : MatchPhase::AWAITING_ROUND;
}

void MatchState::reset_for_rematch() {
    round_index_ = 1;
    player1_round_wins_ = 0;
    player2_round_wins_ = 0;
    history_.clear();
    human_recent_.clear();
}

void MatchState::reset_for_rematch(MatchConfig config) {
    validate(config);
    config_ = std::move(config);
    reset_for_rematch();
}

int MatchState::tie_count() const {
    return std::count_if(history_.begin(), history_.end(), [](const RoundRecord &record) {
        return record.outcome == RoundOutcome::TIE;
    });
}

std::optional<MatchResult> match_result(const MatchState &state) {
    const auto maybe_winner = state.check_match_winner();
    if (!maybe_winner.has_value()) {
        return std::nullopt;
    }

    const MatchConfig &config = state.config();
    std::optional<std::string> winner;
    if (maybe_winner.value() == RoundOutcome::PLAYER1) {
        winner = config.player1;
    } else if (maybe_winner.value() == RoundOutcome::PLAYER2) {
        winner = config.player2;
    }
    return MatchResult{
        .player1 = config.player1,
        .player2 = config.player2,
        .winner = std::move(winner),
        .player1_round_wins = state.player1_round_wins(),
        .player2_round_wins = state.player2_round_wins(),
    };
}

std::string to_string(const RoundOutcome outcome) {
    switch (outcome) {
        case RoundOutcome::PLAYER1:
            return "Player1";
        case RoundOutcome::PLAYER2:
            return "Player2";
        case RoundOutcome::TIE:
            return "Tie";
    }
    return std::string(wise_enum::to_string(outcome));
}
}  // namespace rps::domain
