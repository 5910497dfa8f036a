/**
 * @file Log.hpp
 * @brief Diagnostic logging macros for the PropGraph library
 *
 * Messages are written as "[PropGraph] file:line (function): message".
 * Debug and info messages go to std::cout, warnings and errors to
 * std::cerr. The process-wide level set with set_log_level() filters
 * messages at runtime; defining PROPGRAPH_DISABLE_LOGGING removes them
 * at compile time.
 */

#ifndef PROPGRAPH_DETAIL_LOG_HPP
#define PROPGRAPH_DETAIL_LOG_HPP

#include <iostream>

namespace propgraph {

enum class LogLevel {
    Debug,
    Info,
    Warning,
    Error,
    Off,
};

/**
 * @brief Set the minimum level of messages that are written
 *
 * The default level is LogLevel::Warning.
 */
void set_log_level(LogLevel level) noexcept;

[[nodiscard]] LogLevel log_level() noexcept;

namespace detail {

[[nodiscard]] inline bool should_log(LogLevel level) noexcept {
    return level != LogLevel::Off && level >= log_level();
}

} // namespace detail

} // namespace propgraph

#ifdef PROPGRAPH_DISABLE_LOGGING
#define PROPGRAPH_LOG(stream, level, ...) do { } while (0)
#else
#define PROPGRAPH_LOG(stream, level, ...) \
do { \
if (::propgraph::detail::should_log(level)) { \
stream << "[PropGraph] " << __FILE__ << ":" << __LINE__ << " (" << __FUNCTION__ << "): " << __VA_ARGS__ << std::endl; \
} \
} while (0)
#endif

#define PROPGRAPH_DEBUG(...) PROPGRAPH_LOG(std::cout, ::propgraph::LogLevel::Debug, __VA_ARGS__)
#define PROPGRAPH_INFO(...) PROPGRAPH_LOG(std::cout, ::propgraph::LogLevel::Info, __VA_ARGS__)
#define PROPGRAPH_WARN(...) PROPGRAPH_LOG(std::cerr, ::propgraph::LogLevel::Warning, __VA_ARGS__)
#define PROPGRAPH_ERROR(...) PROPGRAPH_LOG(std::cerr, ::propgraph::LogLevel::Error, __VA_ARGS__)

#endif // PROPGRAPH_DETAIL_LOG_HPP
