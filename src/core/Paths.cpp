// src/core/Paths.cpp
#include "Paths.h"

#include "scores/HighScores_Format.h"

#include <cstdlib>          // std::getenv
#include <system_error>

using std::filesystem::path;

namespace paths {

static path slow_realpath(const path& p) {
  std::error_code ec;
  auto abs = std::filesystem::weakly_canonical(p, ec);
  return ec ? p : abs;
}

static path from_env(const char* name) {
  const char* v = std::getenv(name);
  if (v == nullptr || v[0] == '\0') return {};
  return path(v);
}

path user_data_dir() {
  if (auto p = from_env("MINEFIELD_HOME"); !p.empty())
    return slow_realpath(p);

#if defined(_WIN32)
  if (auto p = from_env("LOCALAPPDATA"); !p.empty())
    return slow_realpath(p / "Minefield");
#endif

  if (auto p = from_env("XDG_DATA_HOME"); !p.empty())
    return slow_realpath(p / "minefield");

  if (auto p = from_env("HOME"); !p.empty())
    return slow_realpath(p / ".minefield");

  std::error_code ec;
  auto tmp = std::filesystem::temp_directory_path(ec);
  return ec ? path("minefield") : tmp / "minefield";
}

path logs_dir()         { return user_data_dir() / "logs"; }
path config_dir()       { return user_data_dir(); }
path high_scores_file() { return user_data_dir() / minefield::scores::savefmt::kScoresFileName; }

} // namespace paths
