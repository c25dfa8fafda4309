#include "domain/match_state_to_proto.hh"

#include <cstdint>
#include <string>
#include <type_traits>
#include <variant>

#include "domain/errors.hh"

namespace rps::domain::proto {
namespace {
template <typename EnumT>
EnumT enum_from_name(const std::string &name, const std::string &field) {
    const auto maybe_value = wise_enum::from_string<EnumT>(name);
    if (!maybe_value.has_value()) {
        throw MalformedPersistedState("Unknown value '" + name + "' for " + field);
    }
    return maybe_value.value();
}

template <typename EnumT>
std::string enum_name(const EnumT value) {
    return std::string(wise_enum::to_string(value));
}

void pack_into(const domain::MatchFormat &in, MatchFormat *out) {
    std::visit(
        [out](const auto &alternative) {
            using T = std::decay_t<decltype(alternative)>;
            out->set_kind(std::string(T::name));
            if constexpr (std::is_same_v<T, domain::BestOfN>) {
                out->set_count(alternative.rounds);
            } else if constexpr (std::is_same_v<T, domain::FirstToK>) {
                out->set_count(alternative.wins);
            }
        },
        in);
}

domain::MatchFormat unpack_from(const MatchFormat &in) {
    try {
        if (in.kind() == domain::SingleRound::name) {
            return domain::SingleRound{};
        } else if (in.kind() == domain::BestOfN::name) {
            return domain::make_best_of_n(in.count());
        } else if (in.kind() == domain::FirstToK::name) {
            return domain::make_first_to_k(in.count());
        }
    } catch (const InvalidFormatParameter &e) {
        throw MalformedPersistedState(e.what());
    }
    throw MalformedPersistedState("Unknown match format '" + in.kind() + "'");
}
}  // namespace

void pack_into(const domain::MatchConfig &in, MatchConfig *out) {
    out->set_player1(in.player1);
    out->set_player2(in.player2);
    out->set_mode(enum_name(in.mode));
    out->set_ruleset(enum_name(in.ruleset));
    pack_into(in.format, out->mutable_format());
    if (in.difficulty.has_value()) {
        out->set_difficulty(enum_name(in.difficulty.value()));
    }
}

void pack_into(const domain::MatchState &in, MatchState *out) {
    pack_into(in.config(), out->mutable_config());
    out->set_round_index(in.round_index());
    out->set_player1_round_wins(in.player1_round_wins());
    out->set_player2_round_wins(in.player2_round_wins());
    for (const auto &record : in.history()) {
        RoundRecord &proto_record = *(out->add_history());
        proto_record.set_round(record.round);
        proto_record.set_player1_move(enum_name(record.player1_move));
        proto_record.set_player2_move(enum_name(record.player2_move));
        proto_record.set_outcome(enum_name(record.outcome));
    }
    for (const auto move : in.human_recent().to_vector()) {
        out->add_human_recent(enum_name(move));
    }
}

void pack_into(const domain::Scoreboard &in, Scoreboard *out) {
    for (const auto &[name, stats] : in.players()) {
        PlayerStats &proto_stats = (*out->mutable_players())[name];
        proto_stats.set_matches_played(stats.matches_played);
        proto_stats.set_matches_won(stats.matches_won);
        proto_stats.set_rounds_won(stats.rounds_won);
    }
}

domain::MatchConfig unpack_from(const MatchConfig &in) {
    if (!in.has_format()) {
        throw MalformedPersistedState("Match config has no format");
    }
    domain::MatchConfig out = {
        .player1 = in.player1(),
        .player2 = in.player2(),
        .mode = enum_from_name<domain::Mode>(in.mode(), "mode"),
        .ruleset = enum_from_name<domain::Ruleset>(in.ruleset(), "ruleset"),
        .format = unpack_from(in.format()),
        .difficulty = std::nullopt,
    };
    if (in.has_difficulty()) {
        out.difficulty = enum_from_name<domain::Difficulty>(in.difficulty(), "difficulty");
    }

    try {
        domain::validate(out);
    } catch (const std::invalid_argument &e) {
        throw MalformedPersistedState(e.what());
    }
    return out;
}

domain::MatchState unpack_from(const MatchState &in) {
    if (!in.has_config()) {
        throw MalformedPersistedState("Match state has no config");
    }
    if (in.human_recent_size() > domain::RecentMoves::CAPACITY) {
        throw MalformedPersistedState("Match state holds " + std::to_string(in.human_recent_size()) +
                                      " recent moves");
    }

    std::vector<domain::RoundRecord> history;
    history.reserve(in.history_size());
    for (const auto &record : in.history()) {
        history.push_back({
            .round = record.round(),
            .player1_move = enum_from_name<domain::Move>(record.player1_move(), "player1_move"),
            .player2_move = enum_from_name<domain::Move>(record.player2_move(), "player2_move"),
            .outcome = enum_from_name<domain::RoundOutcome>(record.outcome(), "outcome"),
        });
    }

    std::vector<domain::Move> recent;
    for (const auto &move : in.human_recent()) {
        recent.push_back(enum_from_name<domain::Move>(move, "human_recent"));
    }

    return domain::MatchState::from_parts(unpack_from(in.config()), in.round_index(),
                                          in.player1_round_wins(), in.player2_round_wins(),
                                          std::move(history), domain::RecentMoves(recent));
}

domain::Scoreboard unpack_from(const Scoreboard &in) {
    std::map<std::string, domain::PlayerStats> players;
    for (const auto &[name, stats] : in.players()) {
        const auto in_range = [](const int64_t count) {
            return count >= 0 && count <= domain::PlayerStats::MAX_COUNT;
        };
        if (!in_range(stats.matches_played()) || !in_range(stats.matches_won()) ||
            !in_range(stats.rounds_won()) || stats.matches_won() > stats.matches_played()) {
            throw MalformedPersistedState("Inconsistent stats for player " + name);
        }
        players[name] = {
            .matches_played = stats.matches_played(),
            .matches_won = stats.matches_won(),
            .rounds_won = stats.rounds_won(),
        };
    }
    return domain::Scoreboard(std::move(players));
}
}  // namespace rps::domain::proto
