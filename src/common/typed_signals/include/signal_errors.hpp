#pragma once

#include <cstddef>
#include <stdexcept>
#include <string>

namespace typed_signals
{
    /// @brief Formats a 1-based position as an English ordinal ("1st", "2nd", "11th").
    std::string ToOrdinal(std::size_t number);

    /// @brief Base class of every error raised by the dispatcher itself.
    ///
    /// Exceptions thrown from inside a listener body never derive from this type unless
    /// the listener throws one on purpose; they reach the invoker unchanged.
    class SignalError : public std::runtime_error
    {
    public:
        using std::runtime_error::runtime_error;
    };

    /// @brief A signal was bound or invoked without being registered.
    class UnregisteredSignalError : public SignalError
    {
    public:
        UnregisteredSignalError(std::string signalName, const std::string& message);

        const std::string& SignalName() const noexcept
        {
            return m_signalName;
        }

    private:
        std::string m_signalName;
    };

    /// @brief Invoke was called with the wrong number of arguments.
    class ArityMismatchError : public SignalError
    {
    public:
        ArityMismatchError(const std::string& signalName, std::size_t expected, std::size_t provided);

        std::size_t Expected() const noexcept
        {
            return m_expected;
        }

        std::size_t Provided() const noexcept
        {
            return m_provided;
        }

    private:
        std::size_t m_expected;
        std::size_t m_provided;
    };

    /// @brief An argument, or a listener parameter, does not match the signal's declared type.
    class TypeMismatchError : public SignalError
    {
    public:
        /// @param message Complete diagnostic text.
        /// @param position 1-based ordinal of the offending argument or parameter.
        /// @param expectedType Name of the declared type.
        /// @param foundType Name of the type that was supplied.
        TypeMismatchError(const std::string& message,
                          std::size_t position,
                          std::string expectedType,
                          std::string foundType);

        /// @brief Builds the error raised by Invoke for a badly typed argument.
        static TypeMismatchError ForArgument(const std::string& signalName,
                                             std::size_t position,
                                             const std::string& expectedType,
                                             const std::string& foundType);

        /// @brief Builds the error raised by Bind for a badly typed listener parameter.
        static TypeMismatchError ForListenerParameter(const std::string& listenerName,
                                                      std::size_t position,
                                                      const std::string& expectedType,
                                                      const std::string& foundType);

        std::size_t Position() const noexcept
        {
            return m_position;
        }

        const std::string& ExpectedType() const noexcept
        {
            return m_expectedType;
        }

        const std::string& FoundType() const noexcept
        {
            return m_foundType;
        }

    private:
        std::size_t m_position;
        std::string m_expectedType;
        std::string m_foundType;
    };

    /// @brief A null or absent value was passed for a parameter that cannot hold one.
    class NullArgumentForNonNullableParameterError : public TypeMismatchError
    {
    public:
        NullArgumentForNonNullableParameterError(const std::string& signalName,
                                                 std::size_t position,
                                                 const std::string& expectedType);
    };

    /// @brief The same owner method was bound twice to one signal.
    class DuplicateListenerError : public SignalError
    {
    public:
        DuplicateListenerError(const std::string& signalName, const std::string& listenerName);
    };

    /// @brief A listener method's parameter count differs from its signal's.
    class SignatureMismatchError : public SignalError
    {
    public:
        SignatureMismatchError(const std::string& signalName,
                               const std::string& listenerName,
                               std::size_t expected,
                               std::size_t found);

        std::size_t Expected() const noexcept
        {
            return m_expected;
        }

        std::size_t Found() const noexcept
        {
            return m_found;
        }

    private:
        std::size_t m_expected;
        std::size_t m_found;
    };

    /// @brief An operation that would destroy signals was requested while one is being invoked.
    class DispatchInProgressError : public SignalError
    {
    public:
        using SignalError::SignalError;
    };
} // namespace typed_signals
