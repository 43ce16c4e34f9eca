#include "Log.h"
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <system_error>
#include <utility>

namespace fs = std::filesystem;
static std::shared_ptr<spdlog::logger> g_logger;

static std::shared_ptr<spdlog::logger> make_stderr_logger() {
    return std::make_shared<spdlog::logger>("minefield", std::make_shared<spdlog::sinks::stderr_color_sink_mt>());
}

static void install(std::shared_ptr<spdlog::logger> logger, spdlog::level::level_enum level) {
    g_logger = std::move(logger);
    g_logger->set_level(level);
    g_logger->flush_on(spdlog::level::warn);
    spdlog::set_default_logger(g_logger);
    spdlog::set_pattern("[%Y-%m-%d %H:%M:%S.%e][%l] %v");
}

bool logsys::init_logs(const fs::path& dir, spdlog::level::level_enum level) {
    std::error_code ec;
    fs::create_directories(dir, ec);
    if (!ec) {
        try {
            auto file = (dir / "minefield.log").string();
            auto sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(file, 1 << 20, 4); // 1MB * 4
            install(std::make_shared<spdlog::logger>("minefield", sink), level);
            spdlog::info("Logging started");
            return true;
        } catch (const spdlog::spdlog_ex& e) {
            install(make_stderr_logger(), level);
            spdlog::warn("File logging unavailable ({}); logging to stderr", e.what());
            return false;
        }
    }

    install(make_stderr_logger(), level);
    spdlog::warn("Cannot create log directory {} ({}); logging to stderr", dir.string(), ec.message());
    return false;
}

std::shared_ptr<spdlog::logger> logsys::get() { return g_logger; }

void logsys::shutdown() {
    if (g_logger) g_logger->flush();
    spdlog::shutdown();
    g_logger.reset();
}
