#pragma once
#include <filesystem>
#include <memory>
#include <spdlog/spdlog.h>

namespace frontier::logsys {
    // Rotating file sink under `dir` (1MB * 4) plus console. Safe to call twice.
    void init(const std::filesystem::path& dir);
    // Console only (tests, tools).
    void init_console(spdlog::level::level_enum level = spdlog::level::info);
    std::shared_ptr<spdlog::logger> get();  // "frontier"
}
