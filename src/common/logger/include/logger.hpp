#pragma once

#include <spdlog/common.h>
#include <spdlog/logger.h>

#include <memory>
#include <string_view>

/// @brief Name of the spdlog logger shared by every module of the project.
constexpr auto LOGGER_NAME = "typed_signals";

/// @brief Access point to the process-wide spdlog logger.
///
/// The logger is created lazily on first use and writes to stderr. Hosts may attach
/// additional sinks (files, test collectors) and change the active level at runtime.
class Logger
{
public:
    /// @brief Returns the shared logger, creating it on first use.
    static std::shared_ptr<spdlog::logger> Get();

    /// @brief Sets the active level from its name.
    ///
    /// Accepted names are trace, debug, info, warn, error, critical and off. Unknown
    /// names leave the logger at info and emit a warning.
    ///
    /// @param level The level name.
    /// @return True if the name was recognised.
    static bool SetLevel(std::string_view level);

    /// @brief Attaches an additional sink to the shared logger.
    static void AddSink(spdlog::sink_ptr sink);

    /// @brief Detaches a sink previously attached with AddSink.
    static void RemoveSink(const spdlog::sink_ptr& sink);
};

#define LogTrace(...) Logger::Get()->trace(__VA_ARGS__)
#define LogDebug(...) Logger::Get()->debug(__VA_ARGS__)
#define LogInfo(...) Logger::Get()->info(__VA_ARGS__)
#define LogWarn(...) Logger::Get()->warn(__VA_ARGS__)
#define LogError(...) Logger::Get()->error(__VA_ARGS__)
#define LogCritical(...) Logger::Get()->critical(__VA_ARGS__)
