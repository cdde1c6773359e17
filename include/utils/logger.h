#pragma once

// Windows compatibility - undef macros that conflict with Logger::Level
#ifdef ERROR
#undef ERROR
#endif

#include <string>
#include <memory>

namespace spdlog { class logger; }

namespace trivium {
namespace utils {

class Logger {
public:
    enum class Level { TRACE, DEBUG, INFO, WARN, ERROR, CRITICAL };

    /// Console sink always; file sink only when log_file is non-empty.
    static void init(const std::string& log_file = "trivium.log", Level level = Level::INFO);
    static void shutdown();
    // Helper to convert from string to Level; returns INFO on unknown
    static Level levelFromString(const std::string& lvl);
    static const char* levelToString(Level lvl);

    template<typename FormatString, typename... Args>
    static void trace(FormatString&& fmt, Args&&... args);

    template<typename FormatString, typename... Args>
    static void debug(FormatString&& fmt, Args&&... args);

    template<typename FormatString, typename... Args>
    static void info(FormatString&& fmt, Args&&... args);

    template<typename FormatString, typename... Args>
    static void warn(FormatString&& fmt, Args&&... args);

    template<typename FormatString, typename... Args>
    static void error(FormatString&& fmt, Args&&... args);

    template<typename FormatString, typename... Args>
    static void critical(FormatString&& fmt, Args&&... args);

private:
    static std::shared_ptr<spdlog::logger> logger_;
};

} // namespace utils
} // namespace trivium

// Include implementation
#include "utils/logger_impl.h"

// Logging macros
#define TRIVIUM_TRACE(...) ::trivium::utils::Logger::trace(__VA_ARGS__)
#define TRIVIUM_DEBUG(...) ::trivium::utils::Logger::debug(__VA_ARGS__)
#define TRIVIUM_INFO(...) ::trivium::utils::Logger::info(__VA_ARGS__)
#define TRIVIUM_WARN(...) ::trivium::utils::Logger::warn(__VA_ARGS__)
#define TRIVIUM_ERROR(...) ::trivium::utils::Logger::error(__VA_ARGS__)
#define TRIVIUM_CRITICAL(...) ::trivium::utils::Logger::critical(__VA_ARGS__)
