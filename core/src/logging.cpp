#include "logging.hpp"
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/pattern_formatter.h>
#include <algorithm>
#include <cctype>
#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <sstream>
#include <stdexcept>
#include <vector>

namespace core {
namespace logging {

    namespace {

        std::shared_ptr<spdlog::logger> g_logger;
        std::mutex g_init_mutex;

        constexpr const char* kLoggerName = "CandleReplay";
        constexpr const char* kPattern = "[%Y-%m-%d %H:%M:%S.%e%z] [%^%l%$] [%n] [t%t] %v";
        constexpr std::size_t kMaxFileSize = 10 * 1024 * 1024;
        constexpr std::size_t kMaxFiles = 5;

        // Falls back to the working directory when the log directory cannot be created
        std::filesystem::path ensureLogDirectory(const std::string& log_dir) {
            std::error_code ec;
            std::filesystem::create_directories(log_dir, ec);
            if (ec) {
                std::cerr << "[Logging] Cannot create log directory '" << log_dir << "': " << ec.message()
                          << "; writing logs to the working directory." << std::endl;
                return std::filesystem::path(".");
            }
            return std::filesystem::path(log_dir);
        }

        // <base>_<YYYYmmdd_HHMMSS>Z.log, stamped in UTC
        std::string logFileName(const std::string& base_name) {
            const auto now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
            std::tm utc_tm;
            #ifdef _WIN32
                gmtime_s(&utc_tm, &now);
            #else
                gmtime_r(&now, &utc_tm);
            #endif
            std::ostringstream oss;
            oss << base_name << "_" << std::put_time(&utc_tm, "%Y%m%d_%H%M%SZ") << ".log";
            return oss.str();
        }

    } // end anonymous namespace

    void initialize(const std::string& base_name,
                    spdlog::level::level_enum console_level,
                    spdlog::level::level_enum file_level,
                    const std::string& log_dir)
    {
        std::lock_guard<std::mutex> lock(g_init_mutex);
        if (g_logger) {
            return;
        }

        if (const char* env_level = std::getenv("SPDLOG_LEVEL")) {
            console_level = file_level = level_from_string(env_level);
        }

        const std::string log_file = (ensureLogDirectory(log_dir) / logFileName(base_name)).string();

        try {
            auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
            console_sink->set_level(console_level);
            console_sink->set_formatter(makeFormatter());

            auto file_sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(log_file, kMaxFileSize, kMaxFiles, true);
            file_sink->set_level(file_level);
            file_sink->set_formatter(makeFormatter());

            std::vector<spdlog::sink_ptr> sinks{console_sink, file_sink};
            auto logger = std::make_shared<spdlog::logger>(kLoggerName, sinks.begin(), sinks.end());
            logger->set_level(std::min(console_level, file_level));
            logger->flush_on(spdlog::level::warn);
            spdlog::register_logger(logger);
            spdlog::set_default_logger(logger);
            g_logger = logger;
        } catch (const spdlog::spdlog_ex& ex) {
            throw std::runtime_error(std::string("Log initialization failed: ") + ex.what());
        }

        g_logger->debug("Logging to console ({}) and {} ({}).",
                        spdlog::level::to_string_view(console_level), log_file,
                        spdlog::level::to_string_view(file_level));
    }

    std::unique_ptr<spdlog::formatter> makeFormatter() {
        return std::make_unique<spdlog::pattern_formatter>(kPattern, spdlog::pattern_time_type::utc);
    }

    std::shared_ptr<spdlog::logger>& getLogger() {
        if (!g_logger) {
            throw std::runtime_error("Logger accessed before core::logging::initialize().");
        }
        return g_logger;
    }

    spdlog::level::level_enum level_from_string(const std::string& level_str) {
        std::string name = level_str;
        std::transform(name.begin(), name.end(), name.begin(),
            [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

        if (name == "warning") name = "warn";
        if (name == "crit") name = "critical";
        if (name == "error") name = "err";

        const auto level = spdlog::level::from_str(name);
        if (level == spdlog::level::off && name != "off") {
            std::cerr << "[Logging] Unknown log level '" << level_str << "', using info." << std::endl;
            return spdlog::level::info;
        }
        return level;
    }

} // namespace logging
} // namespace core
