#include <dispatcher_options.hpp>

#include <config.h>
#include <configuration_parser.hpp>
#include <logger.hpp>

#include <optional>

namespace
{
    std::optional<typed_signals::RegistrationMode> ParseRegistrationMode(const std::string& mode)
    {
        if (mode == "discover")
        {
            return typed_signals::RegistrationMode::Discover;
        }
        if (mode == "curated")
        {
            return typed_signals::RegistrationMode::Curated;
        }
        return std::nullopt;
    }
} // namespace

namespace typed_signals
{
    DispatcherOptions DispatcherOptions::Defaults()
    {
        return {config::signal_dispatcher::DEFAULT_LOG_LEVEL,
                *ParseRegistrationMode(config::signal_dispatcher::DEFAULT_REGISTRATION_MODE),
                {config::signal_dispatcher::DEFAULT_RESERVED_NAMESPACE},
                config::signal_dispatcher::DEFAULT_TRACE_DISPATCH};
    }

    DispatcherOptions DispatcherOptions::FromConfiguration(const configuration::ConfigurationParser& parser)
    {
        using namespace config::signal_dispatcher;

        auto options = Defaults();

        options.LogLevel = parser.GetConfig<std::string>(TABLE, "log_level").value_or(DEFAULT_LOG_LEVEL);

        if (const auto mode = parser.GetConfig<std::string>(TABLE, "registration_mode"))
        {
            if (const auto parsed = ParseRegistrationMode(*mode))
            {
                options.DefaultRegistrationMode = *parsed;
            }
            else
            {
                LogWarn("Invalid registration_mode '{}'. Using default value.", *mode);
            }
        }

        if (const auto namespaces = parser.GetConfig<std::vector<std::string>>(TABLE, "reserved_namespaces"))
        {
            options.ReservedNamespaces = *namespaces;
        }

        options.TraceDispatch = parser.GetConfig<bool>(TABLE, "trace_dispatch").value_or(DEFAULT_TRACE_DISPATCH);

        return options;
    }
} // namespace typed_signals
