#include "domain/scoreboard.hh"

#include <algorithm>

#include "common/check.hh"

namespace rps::domain {
double PlayerStats::win_rate() const {
    if (matches_played == 0) {
        return 0.0;
    }
    return static_cast<double>(matches_won) / matches_played;
}

void Scoreboard::ensure_player(const std::string &name) { players_.try_emplace(name); }

void Scoreboard::add_match_result(const MatchResult &result) {
    RPS_CHECK(result.player1 != result.player2, "Match participants must be distinct",
              result.player1);
    for (const auto &name : {result.player1, result.player2}) {
        const PlayerStats current = stats(name);
        RPS_CHECK(current.matches_played <= PlayerStats::MAX_COUNT &&
                      current.rounds_won <= PlayerStats::MAX_COUNT,
                  "Stats out of range", name, current.matches_played, current.rounds_won);
    }

    PlayerStats &player1 = players_[result.player1];
    player1.matches_played++;
    player1.rounds_won += result.player1_round_wins;

    PlayerStats &player2 = players_[result.player2];
    player2.matches_played++;
    player2.rounds_won += result.player2_round_wins;

    if (result.winner.has_value()) {
        players_[result.winner.value()].matches_won++;
    }
}

PlayerStats Scoreboard::stats(const std::string &name) const {
    const auto iter = players_.find(name);
    if (iter == players_.end()) {
        return {};
    }
    return iter->second;
}

std::vector<ScoreboardRow> Scoreboard::sorted(const ScoreboardSort sort) const {
    std::vector<ScoreboardRow> rows;
    rows.reserve(players_.size());
    for (const auto &[name, stats] : players_) {
        rows.push_back({.name = name, .stats = stats});
    }

    const auto key = [sort](const PlayerStats &stats) -> double {
        switch (sort) {
            case ScoreboardSort::MATCHES_WON:
                return stats.matches_won;
            case ScoreboardSort::WIN_RATE:
                return stats.win_rate();
            case ScoreboardSort::ROUNDS_WON:
                return stats.rounds_won;
        }
        return 0.0;
    };

    // Rows start in name order, so a stable sort keeps ties alphabetical
    std::stable_sort(rows.begin(), rows.end(), [&key](const auto &a, const auto &b) {
        return key(a.stats) > key(b.stats);
    });
    return rows;
}
}  // namespace rps::domain
