/**
 * @file Log.cpp
 * @brief Process-wide log level
 */

#include "PropGraph/detail/Log.hpp"

#include <atomic>

namespace propgraph {

namespace {

std::atomic<LogLevel> g_log_level{LogLevel::Warning};

} // namespace

void set_log_level(LogLevel level) noexcept {
    g_log_level.store(level, std::memory_order_relaxed);
}

LogLevel log_level() noexcept {
    return g_log_level.load(std::memory_order_relaxed);
}

} // namespace propgraph
