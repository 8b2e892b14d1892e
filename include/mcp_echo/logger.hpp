#pragma once
#include <fmt/format.h>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

/// Leveled diagnostics. Everything goes to stderr unless a sink is
/// installed; stdout belongs to the protocol stream.
namespace mcp_echo::logger {

enum class level { trace, debug, info, warn, error, critical, off };

/// Receives one fully formatted line, without the trailing newline.
using Sink = std::function<void(level, std::string_view line)>;

void set_level(level lvl);
[[nodiscard]] level get_level();
[[nodiscard]] bool enabled(level lvl);

[[nodiscard]] std::string_view to_string(level lvl);
[[nodiscard]] std::optional<level> level_from_string(std::string_view name);

/// Install a custom sink; passing nullptr restores stderr.
void set_sink(Sink sink);

void write(level lvl, std::string_view component, std::string_view message);

template <typename... Args>
void log(level lvl, std::string_view component,
         fmt::format_string<Args...> format_str, Args&&... args) {
    write(lvl, component, fmt::format(format_str, std::forward<Args>(args)...));
}

} // namespace mcp_echo::logger

#define MCP_ECHO_LOG(lvl, component, ...)                                  \
    do {                                                                   \
        if (::mcp_echo::logger::enabled(lvl)) {                            \
            ::mcp_echo::logger::log(lvl, component, __VA_ARGS__);          \
        }                                                                  \
    } while (0)

#define MCP_ECHO_LOG_TRACE(component, ...) \
    MCP_ECHO_LOG(::mcp_echo::logger::level::trace, component, __VA_ARGS__)
#define MCP_ECHO_LOG_DEBUG(component, ...) \
    MCP_ECHO_LOG(::mcp_echo::logger::level::debug, component, __VA_ARGS__)
#define MCP_ECHO_LOG_INFO(component, ...) \
    MCP_ECHO_LOG(::mcp_echo::logger::level::info, component, __VA_ARGS__)
#define MCP_ECHO_LOG_WARN(component, ...) \
    MCP_ECHO_LOG(::mcp_echo::logger::level::warn, component, __VA_ARGS__)
#define MCP_ECHO_LOG_ERROR(component, ...) \
    MCP_ECHO_LOG(::mcp_echo::logger::level::error, component, __VA_ARGS__)
