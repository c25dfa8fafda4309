#pragma once

#include <optional>
#include <random>
#include <string>
#include <vector>

#include "common/argument_wrapper.hh"
#include "domain/match_config.hh"
#include "domain/recent_moves.hh"
#include "domain/rock_paper_scissors.hh"
#include "wise_enum.h"

namespace rps::domain {

WISE_ENUM_CLASS(MatchPhase, AWAITING_ROUND, MATCH_COMPLETE);

struct RoundRecord {
    // 1-based
    int round;
    Move player1_move;
    Move player2_move;
    RoundOutcome outcome;

    bool operator==(const RoundRecord &other) const = default;
};

struct RoundResult {
    Move player2_move;
    RoundOutcome outcome;
};

// Arguments for merging a finished match into the scoreboard.
struct MatchResult {
    std::string player1;
    std::string player2;
    // nullopt when the match ended in a tie
    std::optional<std::string> winner;
    int player1_round_wins;
    int player2_round_wins;
};

class MatchState {
   public:
    // Throws if the config does not validate.
    explicit MatchState(MatchConfig config);

    // Rebuilds an in-progress match. Throws MalformedPersistedState if the parts are not
    // consistent with one another.
    static MatchState from_parts(MatchConfig config, const int round_index,
                                 const int player1_round_wins, const int player2_round_wins,
                                 std::vector<RoundRecord> history, const RecentMoves &human_recent);

    // Resolves one round. Throws InvalidMove if either move is illegal under the ruleset. In
    // single player mode, `move1` is also appended to the human's recent moves.
    RoundOutcome advance_round(const Move move1, const Move move2);

    // Single player only. Records the human move, lets the computer pick its reply and resolves
    // the round.
    RoundResult advance_round_vs_computer(const Move human_move, InOut<std::mt19937> gen);

    // The match winner once the format's completion predicate holds. TIE is only possible for a
    // single round match.
    std::optional<RoundOutcome> check_match_winner() const;

    MatchPhase phase() const;

    // Clears progress and keeps the config.
    void reset_for_rematch();
    // Clears progress and installs a new config, e.g. after a settings change.
    void reset_for_rematch(MatchConfig config);

    const MatchConfig &config() const { return config_; }
    // The index the next round will be recorded with
    int round_index() const { return round_index_; }
    int player1_round_wins() const { return player1_round_wins_; }
    int player2_round_wins() const { return player2_round_wins_; }
    int tie_count() const;
    const std::vector<RoundRecord> &history() const { return history_; }
    const RecentMoves &human_recent() const { return human_recent_; }

    bool operator==(const MatchState &other) const = default;

   private:
    void apply_round(const RoundRecord &record);

    MatchConfig config_;
    int round_index_ = 1;
    int player1_round_wins_ = 0;
    int player2_round_wins_ = 0;
    std::vector<RoundRecord> history_;
    RecentMoves human_recent_;
};

// nullopt while the match is still being played.
std::optional<MatchResult> match_result(const MatchState &state);

std::string to_string(const RoundOutcome outcome);
}  // namespace rps::domain
