#pragma once

#include <signal_registry.hpp>

#include <string>
#include <vector>

namespace configuration
{
    class ConfigurationParser;
} // namespace configuration

namespace typed_signals
{
    /// @brief Tunables of a SignalDispatcher, read from the "signal_dispatcher" table.
    struct DispatcherOptions
    {
        std::string LogLevel;

        /// @brief Mode of the registry built when no registry is supplied.
        RegistrationMode DefaultRegistrationMode;

        /// @brief Namespaces whose event kinds are built-in and never discovered.
        std::vector<std::string> ReservedNamespaces;

        /// @brief Log every dispatch at trace level.
        bool TraceDispatch;

        /// @brief Options with every value at its default.
        static DispatcherOptions Defaults();

        /// @brief Reads the options, falling back to defaults for absent or invalid values.
        static DispatcherOptions FromConfiguration(const configuration::ConfigurationParser& parser);
    };
} // namespace typed_signals
