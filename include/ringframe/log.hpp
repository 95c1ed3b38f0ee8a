#pragma once

#include <fmt/format.h>

#include <string_view>
#include <utility>

namespace ringframe::log {

enum class Level { Debug, Info, Warn, Error, Off };

/// Sets the process-wide minimum level. Messages below it are dropped
/// before formatting. Defaults to Info.
void set_level(Level level) noexcept;

[[nodiscard]] Level level() noexcept;

[[nodiscard]] inline bool enabled(Level level) noexcept {
    return level >= ::ringframe::log::level() && level != Level::Off;
}

/// Writes one line to stderr. Serialized across threads.
void write(Level level, std::string_view component, std::string_view message);

template <typename... Args>
void logf(Level level, std::string_view component, fmt::format_string<Args...> fmt_str,
          Args&&... args) {
    if (!enabled(level)) {
        return;
    }
    write(level, component, fmt::format(fmt_str, std::forward<Args>(args)...));
}

[[nodiscard]] std::string_view to_string(Level level) noexcept;

}  // namespace ringframe::log

#define RINGFRAME_LOG_DEBUG(component, ...) \
    ::ringframe::log::logf(::ringframe::log::Level::Debug, component, __VA_ARGS__)
#define RINGFRAME_LOG_INFO(component, ...) \
    ::ringframe::log::logf(::ringframe::log::Level::Info, component, __VA_ARGS__)
#define RINGFRAME_LOG_WARN(component, ...) \
    ::ringframe::log::logf(::ringframe::log::Level::Warn, component, __VA_ARGS__)
#define RINGFRAME_LOG_ERROR(component, ...) \
    ::ringframe::log::logf(::ringframe::log::Level::Error, component, __VA_ARGS__)
