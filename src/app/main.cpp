// src/app/main.cpp
//
// Terminal Minefield: config.ini + command line -> logging -> leaderboard ->
// controller -> read/eval/print loop on stdin.

#include "app/CommandLineArgs.h"
#include "app/ConsoleView.h"
#include "core/Config.h"
#include "core/Paths.h"
#include "logging/Log.h"

#include "minefield/game/GameController.hpp"
#include "minefield/scores/HighScores.hpp"

#include <exception>
#include <iostream>
#include <stdexcept>

#include <spdlog/spdlog.h>

namespace {

int RunScoresCommand(const minefield::app::CommandLineArgs& args,
                     minefield::scores::HighScoreManager& scores)
{
    if (args.clearScores)
    {
        if (!scores.clearScores())
        {
            std::cerr << "Could not clear " << scores.file().string() << " (see log)\n";
            return 1;
        }
        std::cout << "High scores cleared.\n";
    }
    if (args.showScores)
        std::cout << minefield::app::RenderScores(scores.getScores());
    return 0;
}

} // namespace

int main(int argc, char** argv)
{
    using namespace minefield;

    const app::CommandLineArgs args = app::ParseCommandLineArgs(argc, argv);
    if (args.showHelp)
    {
        std::cout << app::BuildCommandLineHelpText();
        return 0;
    }
    if (!args.unknown.empty())
    {
        for (const auto& a : args.unknown)
            std::cerr << "Unknown or malformed option: " << a << '\n';
        std::cerr << "Try --help.\n";
        return 2;
    }

    const auto dataDir = paths::user_data_dir();
    logsys::init_logs(paths::logs_dir());

    core::GameConfig cfg;
    core::LoadConfig(cfg, paths::config_dir());
    if (!app::ApplyCommandLineOverrides(cfg, args))
    {
        std::cerr << "Unknown difficulty '" << *args.difficulty
                  << "' (expected beginner, intermediate or expert)\n";
        logsys::shutdown();
        return 2;
    }

    if (args.saveConfig && !core::SaveConfig(cfg, paths::config_dir()))
        std::cerr << "Could not save config.ini (see log)\n";

    spdlog::info("Data directory: {}", dataDir.string());
    spdlog::info("Board {}x{}, {} mines ({})", cfg.rows, cfg.cols, cfg.mines,
                 core::DifficultyName(cfg.difficulty));

    int rc = 0;
    try
    {
        scores::HighScoreManager scores(
            args.scoresFile ? std::filesystem::path(*args.scoresFile) : paths::high_scores_file(),
            cfg.maxHighScores);

        if (args.showScores || args.clearScores)
        {
            rc = RunScoresCommand(args, scores);
        }
        else
        {
            game::GameController controller(cfg.rows, cfg.cols, cfg.mines, scores, args.seed);
            app::ConsoleSession session(controller, std::cin, std::cout);
            session.run();
        }
    }
    catch (const std::exception& e)
    {
        spdlog::critical("Fatal: {}", e.what());
        std::cerr << "minefield: " << e.what() << '\n';
        rc = 1;
    }

    logsys::shutdown();
    return rc;
}
