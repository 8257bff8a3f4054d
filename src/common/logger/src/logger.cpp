#include <logger.hpp>

#include <spdlog/sinks/stdout_color_sinks.h>

#include <algorithm>
#include <array>
#include <utility>

namespace
{
    constexpr std::array<std::pair<std::string_view, spdlog::level::level_enum>, 7> LEVEL_NAMES = {{
        {"trace", spdlog::level::trace},
        {"debug", spdlog::level::debug},
        {"info", spdlog::level::info},
        {"warn", spdlog::level::warn},
        {"error", spdlog::level::err},
        {"critical", spdlog::level::critical},
        {"off", spdlog::level::off},
    }};
} // namespace

std::shared_ptr<spdlog::logger> Logger::Get()
{
    static std::shared_ptr<spdlog::logger> instance = []()
    {
        auto logger = std::make_shared<spdlog::logger>(LOGGER_NAME,
                                                       std::make_shared<spdlog::sinks::stderr_color_sink_mt>());
        logger->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%n] [%l] %v");
        logger->set_level(spdlog::level::info);
        return logger;
    }();
    return instance;
}

bool Logger::SetLevel(std::string_view level)
{
    const auto it = std::find_if(
        LEVEL_NAMES.begin(), LEVEL_NAMES.end(), [level](const auto& entry) { return entry.first == level; });

    if (it == LEVEL_NAMES.end())
    {
        Get()->set_level(spdlog::level::info);
        LogWarn("Unknown log level '{}'. Using 'info'.", level);
        return false;
    }

    Get()->set_level(it->second);
    return true;
}

void Logger::AddSink(spdlog::sink_ptr sink)
{
    Get()->sinks().push_back(std::move(sink));
}

void Logger::RemoveSink(const spdlog::sink_ptr& sink)
{
    auto& sinks = Get()->sinks();
    sinks.erase(std::remove(sinks.begin(), sinks.end(), sink), sinks.end());
}
