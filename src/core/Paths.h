// src/core/Paths.h
#pragma once
#include <filesystem>

namespace paths {
    // Per-user data root, first match wins:
    //   1) $MINEFIELD_HOME
    //   2) %LOCALAPPDATA%\Minefield        (Windows)
    //   3) $XDG_DATA_HOME/minefield
    //   4) ~/.minefield
    //   5) <temp>/minefield
    std::filesystem::path user_data_dir();

    std::filesystem::path logs_dir();          // <root>/logs
    std::filesystem::path config_dir();        // <root> (holds config.ini)
    std::filesystem::path high_scores_file();  // <root>/highscores.json
}
