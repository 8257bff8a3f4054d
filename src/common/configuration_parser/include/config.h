#pragma once

namespace config::signal_dispatcher
{
    constexpr auto TABLE = "signal_dispatcher";
    constexpr auto DEFAULT_LOG_LEVEL = "info";
    constexpr auto DEFAULT_REGISTRATION_MODE = "discover";
    constexpr auto DEFAULT_RESERVED_NAMESPACE = "typed_signals";
    constexpr bool DEFAULT_TRACE_DISPATCH = false;
} // namespace config::signal_dispatcher
