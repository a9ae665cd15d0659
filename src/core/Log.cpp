#include "frontier/core/Log.hpp"

#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <mutex>
#include <system_error>
#include <vector>

namespace fs = std::filesystem;

namespace {
    std::mutex g_mutex;
    std::shared_ptr<spdlog::logger> g_logger;

    constexpr const char* kPattern = "[%Y-%m-%d %H:%M:%S.%e][%l] %v";

    void install(std::shared_ptr<spdlog::logger> logger) {
        logger->set_pattern(kPattern);
        logger->flush_on(spdlog::level::warn);
        g_logger = logger;
        spdlog::set_default_logger(std::move(logger));
    }
}

namespace frontier::logsys {

void init(const fs::path& dir) {
    std::lock_guard lock(g_mutex);
    std::error_code ec;
    fs::create_directories(dir, ec);

    std::vector<spdlog::sink_ptr> sinks;
    sinks.push_back(std::make_shared<spdlog::sinks::stdout_color_sink_mt>());
    if (!ec) {
        const auto file = (dir / "frontier.log").string();
        sinks.push_back(std::make_shared<spdlog::sinks::rotating_file_sink_mt>(file, 1 << 20, 4)); // 1MB * 4
    }

    auto logger = std::make_shared<spdlog::logger>("frontier", sinks.begin(), sinks.end());
    logger->set_level(spdlog::level::info);
    install(logger);
    if (ec)
        g_logger->warn("Log directory {} unavailable ({}), console only", dir.string(), ec.message());
    g_logger->info("Logging started");
}

void init_console(spdlog::level::level_enum level) {
    std::lock_guard lock(g_mutex);
    auto logger = std::make_shared<spdlog::logger>(
        "frontier", std::make_shared<spdlog::sinks::stdout_color_sink_mt>());
    logger->set_level(level);
    install(logger);
}

std::shared_ptr<spdlog::logger> get() {
    std::lock_guard lock(g_mutex);
    if (!g_logger) {
        // First use before init(): console logger, warnings and up.
        auto logger = std::make_shared<spdlog::logger>(
            "frontier", std::make_shared<spdlog::sinks::stdout_color_sink_mt>());
        logger->set_level(spdlog::level::warn);
        install(logger);
    }
    return g_logger;
}

} // namespace frontier::logsys
