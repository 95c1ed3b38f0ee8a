#include "ringframe/log.hpp"

#include <atomic>
#include <cstdio>
#include <mutex>

namespace ringframe::log {
namespace {

std::atomic<Level> g_min_level{Level::Info};
std::mutex g_write_mutex;

}  // namespace

void set_level(Level level) noexcept {
    g_min_level.store(level, std::memory_order_relaxed);
}

Level level() noexcept {
    return g_min_level.load(std::memory_order_relaxed);
}

std::string_view to_string(Level level) noexcept {
    switch (level) {
        case Level::Debug:
            return "DEBUG";
        case Level::Info:
            return "INFO";
        case Level::Warn:
            return "WARN";
        case Level::Error:
            return "ERROR";
        case Level::Off:
            break;
    }
    return "OFF";
}

void write(Level level, std::string_view component, std::string_view message) {
    if (!enabled(level)) {
        return;
    }

    const auto line = fmt::format("[{}][{}] {}\n", to_string(level), component, message);

    std::lock_guard lock{g_write_mutex};
    std::fwrite(line.data(), 1, line.size(), stderr);
}

}  // namespace ringframe::log
