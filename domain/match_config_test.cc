#include "domain/match_config.hh"

#include "domain/errors.hh"
#include "gtest/gtest.h"

namespace rps::domain {
TEST(MatchConfigTest, best_of_n_requires_odd_positive_count) {
    // Action + Verification
    EXPECT_EQ(make_best_of_n(1).rounds, 1);
    EXPECT_EQ(make_best_of_n(5).wins_needed(), 3);
    EXPECT_EQ(make_best_of_n(7).wins_needed(), 4);
    EXPECT_THROW(make_best_of_n(0), InvalidFormatParameter);
    EXPECT_THROW(make_best_of_n(4), InvalidFormatParameter);
    EXPECT_THROW(make_best_of_n(-3), InvalidFormatParameter);
}

TEST(MatchConfigTest, first_to_k_requires_positive_count) {
    // Action + Verification
    EXPECT_EQ(make_first_to_k(1).wins, 1);
    EXPECT_EQ(make_first_to_k(2).wins, 2);
    EXPECT_THROW(make_first_to_k(0), InvalidFormatParameter);
}

TEST(MatchConfigTest, unvalidated_format_is_rejected_by_config) {
    // Setup
    const MatchFormat even_best_of = BestOfN{.rounds = 2};

    // Action + Verification
    EXPECT_THROW(validate(even_best_of), InvalidFormatParameter);
    EXPECT_THROW(make_multiplayer_config("Ada", "Bob", Ruleset::CLASSIC, even_best_of),
                 InvalidFormatParameter);
    EXPECT_THROW(make_multiplayer_config("Ada", "Bob", Ruleset::CLASSIC, FirstToK{.wins = 0}),
                 InvalidFormatParameter);
}

TEST(MatchConfigTest, single_player_plays_the_computer) {
    // Action
    const MatchConfig config = make_single_player_config("Ada", Ruleset::EXTENDED,
                                                         make_first_to_k(3), Difficulty::HARD);

    // Verification
    EXPECT_EQ(config.player1, "Ada");
    EXPECT_EQ(config.player2, COMPUTER_NAME);
    EXPECT_EQ(config.mode, Mode::SINGLE_PLAYER);
    EXPECT_EQ(config.difficulty, Difficulty::HARD);
    EXPECT_EQ(config.format, MatchFormat(FirstToK{.wins = 3}));
}

TEST(MatchConfigTest, names_must_be_present_and_distinct) {
    // Action + Verification
    EXPECT_THROW(make_multiplayer_config("", "Bob", Ruleset::CLASSIC, SingleRound{}), InvalidConfig);
    EXPECT_THROW(make_multiplayer_config("Ada", "Ada", Ruleset::CLASSIC, SingleRound{}),
                 InvalidConfig);
    EXPECT_THROW(
        make_single_player_config("", Ruleset::CLASSIC, SingleRound{}, Difficulty::EASY),
        InvalidConfig);
}

TEST(MatchConfigTest, single_player_cannot_take_the_computer_name) {
    // Setup
    const std::string computer_name(COMPUTER_NAME);

    // Action + Verification
    EXPECT_THROW(
        make_single_player_config(computer_name, Ruleset::CLASSIC, SingleRound{}, Difficulty::EASY),
        InvalidConfig);
    EXPECT_NO_THROW(
        make_single_player_config("Computer2", Ruleset::CLASSIC, SingleRound{}, Difficulty::EASY));
}

TEST(MatchConfigTest, difficulty_present_iff_single_player) {
    // Setup
    MatchConfig multiplayer = make_multiplayer_config("Ada", "Bob", Ruleset::CLASSIC, SingleRound{});
    MatchConfig single_player =
        make_single_player_config("Ada", Ruleset::CLASSIC, SingleRound{}, Difficulty::EASY);

    // Action
    multiplayer.difficulty = Difficulty::NORMAL;
    single_player.difficulty = std::nullopt;

    // Verification
    EXPECT_THROW(validate(multiplayer), InvalidConfig);
    EXPECT_THROW(validate(single_player), InvalidConfig);
}

TEST(MatchConfigTest, format_display_names) {
    // Action + Verification
    EXPECT_EQ(to_string(MatchFormat(SingleRound{})), "Single round");
    EXPECT_EQ(to_string(MatchFormat(make_best_of_n(5))), "Best of 5");
    EXPECT_EQ(to_string(MatchFormat(make_first_to_k(2))), "First to 2 wins");
}
}  // namespace rps::domain
