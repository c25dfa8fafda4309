#pragma once

#include <cstdint>
#include <limits>
#include <map>
#include <string>
#include <vector>

#include "domain/match_state.hh"
#include "wise_enum.h"

namespace rps::domain {

WISE_ENUM_CLASS(ScoreboardSort, MATCHES_WON, WIN_RATE, ROUNDS_WON);

struct PlayerStats {
    // Loaded stats above this are rejected so that merging further matches cannot overflow
    static constexpr int64_t MAX_COUNT = std::numeric_limits<int64_t>::max() / 2;

    int64_t matches_played = 0;
    int64_t matches_won = 0;
    int64_t rounds_won = 0;

    // matches_won / matches_played, or 0 if no matches have been played
    double win_rate() const;

    bool operator==(const PlayerStats &other) const = default;
};

struct ScoreboardRow {
    std::string name;
    PlayerStats stats;
};

// Cumulative per player statistics across matches, keyed by player name.
class Scoreboard {
   public:
    Scoreboard() = default;
    explicit Scoreboard(std::map<std::string, PlayerStats> players)
        : players_(std::move(players)) {}

    void ensure_player(const std::string &name);

    // Both participants gain a match played and their round wins; only the winner, if any, gains
    // a match won.
    void add_match_result(const MatchResult &result);

    // Zero stats for a player that has never been seen
    PlayerStats stats(const std::string &name) const;

    const std::map<std::string, PlayerStats> &players() const { return players_; }
    bool empty() const { return players_.empty(); }

    // Descending by the sort key, ties broken by name.
    std::vector<ScoreboardRow> sorted(const ScoreboardSort sort) const;

    bool operator==(const Scoreboard &other) const = default;

   private:
    std::map<std::string, PlayerStats> players_;
};
}  // namespace rps::domain
