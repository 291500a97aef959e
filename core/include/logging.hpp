#pragma once

#include <spdlog/spdlog.h>
#include <spdlog/logger.h>
#include <spdlog/formatter.h>
#include <memory>
#include <string>

namespace core {
namespace logging {

    // Call once at startup (main() or the test environment). Writes to the console and to
    // a rotating file <log_dir>/<base_name>_<UTC timestamp>.log
    void initialize(const std::string& base_name = "candle_replay",
                    spdlog::level::level_enum console_level = spdlog::level::info,
                    spdlog::level::level_enum file_level = spdlog::level::debug,
                    const std::string& log_dir = "logs");

    // Pattern shared by all sinks, timestamps in UTC
    std::unique_ptr<spdlog::formatter> makeFormatter();

    // Throws std::runtime_error when initialize() has not been called
    std::shared_ptr<spdlog::logger>& getLogger();

    // "trace", "debug", "info", "warn", "error", "critical", "off"
    spdlog::level::level_enum level_from_string(const std::string& level_str);

} // namespace logging
} // namespace core
