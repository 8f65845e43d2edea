#include "utils/logger.h"
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <algorithm>
#include <cctype>
#include <iostream>
#include <memory>
#include <vector>

#ifdef ERROR
#undef ERROR
#endif

namespace strata {
namespace utils {

std::shared_ptr<spdlog::logger> Logger::logger_;

namespace {

constexpr const char* kLoggerName = "strata";
constexpr const char* kDefaultPattern = "[%Y-%m-%d %H:%M:%S.%e] [%n] [%^%l%$] [thread %t] %v";

struct LevelName {
    Logger::Level level;
    const char* name;
};

// First entry per level is its canonical name; later ones are accepted aliases.
constexpr LevelName kLevels[] = {
    {Logger::Level::TRACE, "trace"},
    {Logger::Level::DEBUG, "debug"},
    {Logger::Level::INFO, "info"},
    {Logger::Level::WARN, "warn"},
    {Logger::Level::WARN, "warning"},
    {Logger::Level::ERROR, "error"},
    {Logger::Level::ERROR, "err"},
    {Logger::Level::CRITICAL, "critical"},
    {Logger::Level::CRITICAL, "crit"},
};

const LevelName& entryFor(Logger::Level level) {
    for (const auto& e : kLevels) {
        if (e.level == level) {
            return e;
        }
    }
    return kLevels[2];
}

// Replaces the current logger; a failing sink leaves the previous one in place.
void install(std::vector<spdlog::sink_ptr> sinks, Logger::Level level, std::shared_ptr<spdlog::logger>& target) {
    auto logger = std::make_shared<spdlog::logger>(kLoggerName, sinks.begin(), sinks.end());
    logger->set_level(detail::toSpdlog(level));
    logger->set_pattern(kDefaultPattern);
    spdlog::set_default_logger(logger);
    target = std::move(logger);
}

} // namespace

void Logger::init(const std::string& log_file, Level level) {
    try {
        install({std::make_shared<spdlog::sinks::stdout_color_sink_mt>(),
                 std::make_shared<spdlog::sinks::basic_file_sink_mt>(log_file, true)},
                level, logger_);
        logger_->info("Logger initialized (file={}, level={})", log_file, levelToString(level));
    } catch (const spdlog::spdlog_ex& ex) {
        std::cerr << "Log initialization failed for " << log_file << ": " << ex.what() << std::endl;
    }
}

void Logger::initConsole(Level level) {
    try {
        install({std::make_shared<spdlog::sinks::stderr_color_sink_mt>()}, level, logger_);
    } catch (const spdlog::spdlog_ex& ex) {
        std::cerr << "Console log initialization failed: " << ex.what() << std::endl;
    }
}

void Logger::shutdown() {
    if (!logger_) {
        return;
    }
    logger_->flush();
    logger_.reset();
    spdlog::shutdown();
}

// Lazily falls back to a console logger; never creates a log file implicitly.
std::shared_ptr<spdlog::logger> Logger::get() {
    if (!logger_) {
        initConsole();
    }
    return logger_;
}

bool Logger::isInitialized() {
    return logger_ != nullptr;
}

void Logger::setLevel(Level level) {
    if (auto logger = get()) {
        logger->set_level(detail::toSpdlog(level));
    }
}

void Logger::setPattern(const std::string& pattern) {
    if (auto logger = get()) {
        logger->set_pattern(pattern);
    }
}

Logger::Level Logger::levelFromString(const std::string& lvl) {
    std::string lower(lvl);
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    for (const auto& e : kLevels) {
        if (lower == e.name) {
            return e.level;
        }
    }
    return Level::INFO;
}

const char* Logger::levelToString(Level lvl) {
    return entryFor(lvl).name;
}

} // namespace utils
} // namespace strata
