#pragma once
#include <filesystem>
#include <memory>
#include <spdlog/spdlog.h>

namespace logsys {
    // Rotating "minefield.log" under `dir` (1MB * 4), installed as spdlog's default logger.
    // Falls back to a stderr logger if the directory or file can't be used; returns false then.
    bool init_logs(const std::filesystem::path& dir,
                   spdlog::level::level_enum level = spdlog::level::info);
    std::shared_ptr<spdlog::logger> get();  // "minefield"
    void shutdown();
}
