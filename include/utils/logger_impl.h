#pragma once

#include <spdlog/spdlog.h>
#include <fmt/format.h>

namespace strata {
namespace utils {

namespace detail {

inline spdlog::level::level_enum toSpdlog(Logger::Level level) {
    switch (level) {
        case Logger::Level::TRACE: return spdlog::level::trace;
        case Logger::Level::DEBUG: return spdlog::level::debug;
        case Logger::Level::INFO: return spdlog::level::info;
        case Logger::Level::WARN: return spdlog::level::warn;
        case Logger::Level::ERROR: return spdlog::level::err;
        case Logger::Level::CRITICAL: return spdlog::level::critical;
    }
    return spdlog::level::info;
}

} // namespace detail

// Index code logs on per-row paths; check the filter before formatting.
template<typename FormatString, typename... Args>
void Logger::log(Level level, FormatString&& fmt, Args&&... args) {
    const auto lvl = detail::toSpdlog(level);
    if (logger_ && logger_->should_log(lvl)) {
        logger_->log(lvl, fmt::runtime(std::forward<FormatString>(fmt)), std::forward<Args>(args)...);
    }
}

} // namespace utils
} // namespace strata
