#pragma once

#include "domain/match_config.hh"
#include "domain/match_state.hh"
#include "domain/rock_paper_scissors.pb.h"
#include "domain/scoreboard.hh"

namespace rps::domain::proto {
void pack_into(const domain::MatchConfig &in, MatchConfig *out);
void pack_into(const domain::MatchState &in, MatchState *out);
void pack_into(const domain::Scoreboard &in, Scoreboard *out);

// The unpack functions throw MalformedPersistedState if the message does not describe a valid
// value, e.g. an unknown move name or a history that doesn't match the tallies.
domain::MatchConfig unpack_from(const MatchConfig &in);
domain::MatchState unpack_from(const MatchState &in);
domain::Scoreboard unpack_from(const Scoreboard &in);
}  // namespace rps::domain::proto
