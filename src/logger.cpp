#include "mcp_echo/logger.hpp"
#include <fmt/chrono.h>
#include <chrono>
#include <cstdio>
#include <ctime>

namespace mcp_echo::logger {

namespace {

level g_level = level::info;
Sink g_sink;

std::string timestamp() {
    auto now = std::chrono::system_clock::now();
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                  now.time_since_epoch()).count() % 1000;
    std::time_t t = std::chrono::system_clock::to_time_t(now);
    return fmt::format("{:%Y-%m-%dT%H:%M:%S}.{:03d}Z", fmt::gmtime(t), ms);
}

} // anonymous namespace

void set_level(level lvl) {
    g_level = lvl;
}

level get_level() {
    return g_level;
}

bool enabled(level lvl) {
    return lvl != level::off && lvl >= g_level;
}

std::string_view to_string(level lvl) {
    switch (lvl) {
        case level::trace:    return "trace";
        case level::debug:    return "debug";
        case level::info:     return "info";
        case level::warn:     return "warn";
        case level::error:    return "error";
        case level::critical: return "critical";
        case level::off:      return "off";
    }
    return "unknown";
}

std::optional<level> level_from_string(std::string_view name) {
    for (auto lvl : {level::trace, level::debug, level::info, level::warn,
                     level::error, level::critical, level::off}) {
        if (name == to_string(lvl)) return lvl;
    }
    if (name == "warning") return level::warn;
    return std::nullopt;
}

void set_sink(Sink sink) {
    g_sink = std::move(sink);
}

void write(level lvl, std::string_view component, std::string_view message) {
    if (!enabled(lvl)) return;
    std::string line = fmt::format("{} [{}] {}: {}", timestamp(), to_string(lvl),
                                   component, message);
    if (g_sink) {
        g_sink(lvl, line);
        return;
    }
    // One fwrite per line keeps lines whole on a shared stderr.
    line += '\n';
    std::fwrite(line.data(), 1, line.size(), stderr);
    std::fflush(stderr);
}

} // namespace mcp_echo::logger
