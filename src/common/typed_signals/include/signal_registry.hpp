#pragma once

#include <signal.hpp>
#include <signal_catalog.hpp>

#include <memory>
#include <string>
#include <typeindex>
#include <unordered_map>
#include <vector>

namespace typed_signals
{
    /// @brief How a registry obtains its event kinds.
    enum class RegistrationMode
    {
        /// @brief Every non-reserved kind found in the SignalCatalog.
        Discover,

        /// @brief Only the kinds registered by the host, typically from OnRegister().
        Curated
    };

    /// @brief Owns exactly one Signal instance per registered event kind.
    ///
    /// A Signal's identity is stable for the registry's lifetime; registering a kind again
    /// returns the existing instance. Hosts that want a curated set derive from this class
    /// and override OnRegister(), or call Register<Kind>() before installing the registry.
    class SignalRegistry
    {
    public:
        explicit SignalRegistry(RegistrationMode mode = RegistrationMode::Curated);
        virtual ~SignalRegistry() = default;

        SignalRegistry(const SignalRegistry&) = delete;
        SignalRegistry& operator=(const SignalRegistry&) = delete;

        RegistrationMode Mode() const;

        /// @brief Creates the Signal for Kind if absent and returns it.
        template<SignalKind Kind>
        Kind& Register()
        {
            return static_cast<Kind&>(Register(SignalCatalog::Describe<Kind>()));
        }

        /// @brief Creates the Signal described by descriptor if absent and returns it.
        ISignal& Register(const SignalDescriptor& descriptor);

        /// @brief Returns the Signal for Kind, or nullptr. Never creates one.
        template<SignalKind Kind>
        Kind* Get() const
        {
            return static_cast<Kind*>(Get(std::type_index(typeid(Kind))));
        }

        ISignal* Get(const std::type_index& type) const;

        /// @brief Looks a Signal up by its qualified name, or returns nullptr.
        ISignal* Find(const std::string& name) const;

        template<SignalKind Kind>
        bool Contains() const
        {
            return Get<Kind>() != nullptr;
        }

        std::size_t Size() const;

        /// @brief Qualified names of the registered kinds, in registration order.
        std::vector<std::string> Names() const;

        /// @brief Fills the registry according to its mode. Runs at most once.
        ///
        /// @param catalog Source of kinds for discovery mode.
        /// @param reservedNamespaces Namespaces excluded from discovery.
        void Populate(const SignalCatalog& catalog, const std::vector<std::string>& reservedNamespaces);

        bool IsPopulated() const;

    protected:
        /// @brief Hook for curated registries to register their kinds.
        virtual void OnRegister() {}

    private:
        void DiscoverAndRegister(const SignalCatalog& catalog, const std::vector<std::string>& reservedNamespaces);

        RegistrationMode m_mode;
        bool m_populated = false;
        std::vector<std::type_index> m_order;
        std::unordered_map<std::type_index, std::unique_ptr<ISignal>> m_signals;
        std::unordered_map<std::string, ISignal*> m_signalsByName;
    };
} // namespace typed_signals
