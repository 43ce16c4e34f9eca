#pragma once

// High score file identifiers.
//
// loadScores() also accepts the legacy layout: a bare JSON array of
// {player_name, completion_time, date_achieved} records.

#include <cstddef>

namespace minefield::scores::savefmt {

inline constexpr const char* kScoresFormat  = "Minefield.HighScores";
// Version history
//  v1: {format, version, scores:[{player_name, completion_time, date_achieved}]}
inline constexpr int         kScoresVersion = 1;

inline constexpr const char* kScoresFileName = "highscores.json";

// Guardrail against reading something that is clearly not a score file.
inline constexpr std::size_t kMaxScoresFileBytes = 1024u * 1024u;

} // namespace minefield::scores::savefmt
