#pragma once

// <windows.h> defines ERROR, which collides with Logger::Level::ERROR
#ifdef ERROR
#undef ERROR
#endif

#include <memory>
#include <string>

namespace spdlog { class logger; }

namespace strata {
namespace utils {

/// Process-wide spdlog facade for the storage layer.
///
/// Records are dropped until init() or initConsole() installs a logger, so
/// index and schema code logs unconditionally and embedders decide whether
/// anything is written. get() is the exception: it installs a console logger
/// on first use.
class Logger {
public:
    enum class Level { TRACE, DEBUG, INFO, WARN, ERROR, CRITICAL };

    /// Console plus file sink
    static void init(const std::string& log_file = "strata.log", Level level = Level::INFO);
    /// stderr only; used by the schema tool and tests
    static void initConsole(Level level = Level::INFO);
    static void shutdown();
    static bool isInitialized();

    static std::shared_ptr<spdlog::logger> get();
    static void setLevel(Level level);
    static void setPattern(const std::string& pattern);

    /// Case-insensitive; accepts "warning", "err" and "crit". Unknown names map to INFO.
    static Level levelFromString(const std::string& lvl);
    static const char* levelToString(Level lvl);

    /// Formats only when a logger is installed and `level` passes its filter
    template<typename FormatString, typename... Args>
    static void log(Level level, FormatString&& fmt, Args&&... args);

private:
    static std::shared_ptr<spdlog::logger> logger_;
};

} // namespace utils
} // namespace strata

#include "utils/logger_impl.h"

#define STRATA_TRACE(...) ::strata::utils::Logger::log(::strata::utils::Logger::Level::TRACE, __VA_ARGS__)
#define STRATA_DEBUG(...) ::strata::utils::Logger::log(::strata::utils::Logger::Level::DEBUG, __VA_ARGS__)
#define STRATA_INFO(...) ::strata::utils::Logger::log(::strata::utils::Logger::Level::INFO, __VA_ARGS__)
#define STRATA_WARN(...) ::strata::utils::Logger::log(::strata::utils::Logger::Level::WARN, __VA_ARGS__)
#define STRATA_ERROR(...) ::strata::utils::Logger::log(::strata::utils::Logger::Level::ERROR, __VA_ARGS__)
#define STRATA_CRITICAL(...) ::strata::utils::Logger::log(::strata::utils::Logger::Level::CRITICAL, __VA_ARGS__)
