#include "domain/scoreboard.hh"

#include "common/check.hh"
#include "gtest/gtest.h"

namespace rps::domain {
namespace {
std::vector<std::string> names(const std::vector<ScoreboardRow> &rows) {
    std::vector<std::string> out;
    for (const auto &row : rows) {
        out.push_back(row.name);
    }
    return out;
}
}  // namespace

TEST(ScoreboardTest, win_rate_of_new_player_is_zero) {
    // Action + Verification
    EXPECT_EQ(PlayerStats{}.win_rate(), 0.0);
    EXPECT_DOUBLE_EQ((PlayerStats{.matches_played = 4, .matches_won = 1}).win_rate(), 0.25);
}

TEST(ScoreboardTest, decided_match_credits_winner) {
    // Setup
    Scoreboard scoreboard;
    const MatchResult result = {.player1 = "Ada",
                                .player2 = "Bob",
                                .winner = "Bob",
                                .player1_round_wins = 1,
                                .player2_round_wins = 3};

    // Action
    scoreboard.add_match_result(result);

    // Verification
    EXPECT_EQ(scoreboard.stats("Ada"),
              (PlayerStats{.matches_played = 1, .matches_won = 0, .rounds_won = 1}));
    EXPECT_EQ(scoreboard.stats("Bob"),
              (PlayerStats{.matches_played = 1, .matches_won = 1, .rounds_won = 3}));
}

TEST(ScoreboardTest, tied_match_credits_nobody) {
    // Setup
    Scoreboard scoreboard;
    const MatchResult result = {.player1 = "Ada",
                                .player2 = "Computer",
                                .winner = std::nullopt,
                                .player1_round_wins = 0,
                                .player2_round_wins = 0};

    // Action
    scoreboard.add_match_result(result);
    scoreboard.add_match_result(result);

    // Verification
    EXPECT_EQ(scoreboard.stats("Ada").matches_played, 2);
    EXPECT_EQ(scoreboard.stats("Ada").matches_won, 0);
    EXPECT_EQ(scoreboard.stats("Computer").matches_won, 0);
}

TEST(ScoreboardTest, merges_result_of_finished_match) {
    // Setup
    MatchState state(make_multiplayer_config("Ada", "Bob", Ruleset::CLASSIC, make_best_of_n(3)));
    state.advance_round(Move::ROCK, Move::SCISSORS);
    state.advance_round(Move::ROCK, Move::ROCK);
    state.advance_round(Move::PAPER, Move::ROCK);
    Scoreboard scoreboard;

    // Action
    scoreboard.add_match_result(match_result(state).value());

    // Verification
    EXPECT_EQ(scoreboard.stats("Ada"),
              (PlayerStats{.matches_played = 1, .matches_won = 1, .rounds_won = 2}));
    EXPECT_EQ(scoreboard.stats("Bob"),
              (PlayerStats{.matches_played = 1, .matches_won = 0, .rounds_won = 0}));
}

TEST(ScoreboardTest, large_totals_keep_counting) {
    // Setup
    std::map<std::string, PlayerStats> players;
    players["Ada"] = {.matches_played = 5'000'000'000,
                      .matches_won = 4'000'000'000,
                      .rounds_won = PlayerStats::MAX_COUNT};
    Scoreboard scoreboard(players);
    const MatchResult result = {.player1 = "Ada",
                                .player2 = "Bob",
                                .winner = "Ada",
                                .player1_round_wins = std::numeric_limits<int>::max(),
                                .player2_round_wins = 0};

    // Action
    scoreboard.add_match_result(result);

    // Verification
    EXPECT_EQ(scoreboard.stats("Ada").matches_played, 5'000'000'001);
    EXPECT_EQ(scoreboard.stats("Ada").matches_won, 4'000'000'001);
    EXPECT_EQ(scoreboard.stats("Ada").rounds_won,
              PlayerStats::MAX_COUNT + std::numeric_limits<int>::max());
}

TEST(ScoreboardTest, rejects_out_of_range_totals) {
    // Setup
    std::map<std::string, PlayerStats> players;
    players["Ada"] = {.rounds_won = PlayerStats::MAX_COUNT + 1};
    Scoreboard scoreboard(players);
    const MatchResult result = {.player1 = "Ada",
                                .player2 = "Bob",
                                .winner = std::nullopt,
                                .player1_round_wins = 1,
                                .player2_round_wins = 1};

    // Action + Verification
    EXPECT_THROW(scoreboard.add_match_result(result), check_failure);
}

TEST(ScoreboardTest, rejects_match_against_self) {
    // Setup
    Scoreboard scoreboard;
    const MatchResult result = {.player1 = "Computer",
                                .player2 = "Computer",
                                .winner = "Computer",
                                .player1_round_wins = 1,
                                .player2_round_wins = 0};

    // Action + Verification
    EXPECT_THROW(scoreboard.add_match_result(result), check_failure);
    EXPECT_TRUE(scoreboard.empty());
}

TEST(ScoreboardTest, ensure_player_adds_empty_entry_once) {
    // Setup
    std::map<std::string, PlayerStats> players;
    players["Ada"] = {.matches_played = 3, .matches_won = 2, .rounds_won = 7};
    Scoreboard scoreboard(players);

    // Action
    scoreboard.ensure_player("Ada");
    scoreboard.ensure_player("Bob");

    // Verification
    EXPECT_EQ(scoreboard.players().size(), 2);
    EXPECT_EQ(scoreboard.stats("Ada").rounds_won, 7);
    EXPECT_EQ(scoreboard.stats("Bob"), PlayerStats{});
}

TEST(ScoreboardTest, sorted_orders_descending_by_key) {
    // Setup
    std::map<std::string, PlayerStats> players;
    players["Ada"] = {.matches_played = 10, .matches_won = 5, .rounds_won = 30};
    players["Bob"] = {.matches_played = 2, .matches_won = 2, .rounds_won = 6};
    players["Cy"] = {.matches_played = 8, .matches_won = 3, .rounds_won = 40};
    players["Di"] = {};
    const Scoreboard scoreboard(players);

    // Action + Verification
    EXPECT_EQ(names(scoreboard.sorted(ScoreboardSort::MATCHES_WON)),
              (std::vector<std::string>{"Ada", "Cy", "Bob", "Di"}));
    EXPECT_EQ(names(scoreboard.sorted(ScoreboardSort::WIN_RATE)),
              (std::vector<std::string>{"Bob", "Ada", "Cy", "Di"}));
    EXPECT_EQ(names(scoreboard.sorted(ScoreboardSort::ROUNDS_WON)),
              (std::vector<std::string>{"Cy", "Ada", "Bob", "Di"}));
}
}  // namespace rps::domain
