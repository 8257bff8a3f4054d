#pragma once

#include <signal.hpp>

#include <functional>
#include <memory>
#include <string>
#include <typeindex>
#include <vector>

namespace typed_signals
{
    /// @brief Everything needed to instantiate one event kind without knowing its type.
    struct SignalDescriptor
    {
        std::type_index Type;
        std::string Name;
        std::function<std::unique_ptr<ISignal>()> Create;
    };

    /// @brief List of event kinds declared in the process.
    ///
    /// Kinds are added at static initialisation time with TYPED_SIGNALS_DECLARE_SIGNAL and
    /// enumerated by registries running in discovery mode. Kinds living in a reserved
    /// namespace are built-in and are left out of discovery.
    class SignalCatalog
    {
    public:
        /// @brief Returns the process-wide catalog filled by TYPED_SIGNALS_DECLARE_SIGNAL.
        static SignalCatalog& GetInstance();

        template<SignalKind Kind>
        static SignalDescriptor Describe()
        {
            return {std::type_index(typeid(Kind)), TypeName<Kind>(), []() { return std::make_unique<Kind>(); }};
        }

        template<SignalKind Kind>
        bool Declare()
        {
            return Declare(Describe<Kind>());
        }

        /// @brief Adds a kind to the catalog.
        ///
        /// @return False if the kind was already declared; the catalog is unchanged.
        bool Declare(SignalDescriptor descriptor);

        /// @brief Returns the declared kinds, in declaration order, minus the reserved ones.
        ///
        /// @param reservedNamespaces Namespaces whose kinds are built-in.
        std::vector<SignalDescriptor> Enumerate(const std::vector<std::string>& reservedNamespaces) const;

        /// @brief Returns true if name lies inside one of the reserved namespaces.
        static bool IsReserved(const std::string& name, const std::vector<std::string>& reservedNamespaces);

        std::size_t Size() const;

    private:
        std::vector<SignalDescriptor> m_descriptors;
    };
} // namespace typed_signals

#define TYPED_SIGNALS_CONCAT_IMPL(a, b) a##b
#define TYPED_SIGNALS_CONCAT(a, b) TYPED_SIGNALS_CONCAT_IMPL(a, b)

/// @brief Declares an event kind to the process-wide catalog. Use at global scope with a qualified name.
#define TYPED_SIGNALS_DECLARE_SIGNAL(Kind)                                                                            \
    namespace                                                                                                          \
    {                                                                                                                  \
        [[maybe_unused]] const bool TYPED_SIGNALS_CONCAT(typedSignalsDeclared, __COUNTER__) =                          \
            ::typed_signals::SignalCatalog::GetInstance().Declare<Kind>();                                            \
    }
