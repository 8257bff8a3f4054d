#include <signal_errors.hpp>

#include <fmt/format.h>

#include <utility>

namespace typed_signals
{
    std::string ToOrdinal(std::size_t number)
    {
        switch (number % 100)
        {
            case 11:
            case 12:
            case 13: return fmt::format("{}th", number);
            default: break;
        }

        switch (number % 10)
        {
            case 1: return fmt::format("{}st", number);
            case 2: return fmt::format("{}nd", number);
            case 3: return fmt::format("{}rd", number);
            default: return fmt::format("{}th", number);
        }
    }

    UnregisteredSignalError::UnregisteredSignalError(std::string signalName, const std::string& message)
        : SignalError(message)
        , m_signalName(std::move(signalName))
    {
    }

    ArityMismatchError::ArityMismatchError(const std::string& signalName, std::size_t expected, std::size_t provided)
        : SignalError(fmt::format("Incorrect number of arguments passed to 'Invoke<{}>(...)'. Expected {} "
                                  "argument(s) but {} were provided.",
                                  signalName,
                                  expected,
                                  provided))
        , m_expected(expected)
        , m_provided(provided)
    {
    }

    TypeMismatchError::TypeMismatchError(const std::string& message,
                                         std::size_t position,
                                         std::string expectedType,
                                         std::string foundType)
        : SignalError(message)
        , m_position(position)
        , m_expectedType(std::move(expectedType))
        , m_foundType(std::move(foundType))
    {
    }

    TypeMismatchError TypeMismatchError::ForArgument(const std::string& signalName,
                                                     std::size_t position,
                                                     const std::string& expectedType,
                                                     const std::string& foundType)
    {
        return {fmt::format("Incorrect argument type passed to 'Invoke<{0}>(...)'. Expected '{1}' but found '{2}'. "
                            "The {3} argument of Invoke(...) does not match what is defined by '{0}'.",
                            signalName,
                            expectedType,
                            foundType,
                            ToOrdinal(position)),
                position,
                expectedType,
                foundType};
    }

    TypeMismatchError TypeMismatchError::ForListenerParameter(const std::string& listenerName,
                                                              std::size_t position,
                                                              const std::string& expectedType,
                                                              const std::string& foundType)
    {
        return {fmt::format("Incorrect parameter type while binding listener method '{}'. Expected '{}' but found "
                            "'{}'. The {} parameter of the listener method does not match what is defined by the "
                            "signal.",
                            listenerName,
                            expectedType,
                            foundType,
                            ToOrdinal(position)),
                position,
                expectedType,
                foundType};
    }

    NullArgumentForNonNullableParameterError::NullArgumentForNonNullableParameterError(
        const std::string& signalName, std::size_t position, const std::string& expectedType)
        : TypeMismatchError(fmt::format("Incorrect argument type passed to 'Invoke<{0}>(...)'. Expected '{1}' but "
                                        "found 'null'. The {2} argument of Invoke(...) cannot be null.",
                                        signalName,
                                        expectedType,
                                        ToOrdinal(position)),
                            position,
                            expectedType,
                            "null")
    {
    }

    DuplicateListenerError::DuplicateListenerError(const std::string& signalName, const std::string& listenerName)
        : SignalError(fmt::format("Attempted to add a duplicate '{}' listener to '{}'.", listenerName, signalName))
    {
    }

    SignatureMismatchError::SignatureMismatchError(const std::string& signalName,
                                                   const std::string& listenerName,
                                                   std::size_t expected,
                                                   std::size_t found)
        : SignalError(fmt::format("Incorrect number of parameters found when binding '{}' to '{}'. Expected to find "
                                  "{} parameter(s) but found {}.",
                                  listenerName,
                                  signalName,
                                  expected,
                                  found))
        , m_expected(expected)
        , m_found(found)
    {
    }
} // namespace typed_signals
