#include <signal_registry.hpp>

#include <logger.hpp>

namespace typed_signals
{
    SignalRegistry::SignalRegistry(RegistrationMode mode)
        : m_mode(mode)
    {
    }

    RegistrationMode SignalRegistry::Mode() const
    {
        return m_mode;
    }

    ISignal& SignalRegistry::Register(const SignalDescriptor& descriptor)
    {
        const auto it = m_signals.find(descriptor.Type);
        if (it != m_signals.end())
        {
            return *it->second;
        }

        auto signal = descriptor.Create();
        auto& registered = *signal;

        m_signals.emplace(descriptor.Type, std::move(signal));
        m_signalsByName.emplace(descriptor.Name, &registered);
        m_order.push_back(descriptor.Type);

        LogDebug("Registered signal '{}' with {} parameter(s)", descriptor.Name, registered.ParameterCount());
        return registered;
    }

    ISignal* SignalRegistry::Get(const std::type_index& type) const
    {
        const auto it = m_signals.find(type);
        return it != m_signals.end() ? it->second.get() : nullptr;
    }

    ISignal* SignalRegistry::Find(const std::string& name) const
    {
        const auto it = m_signalsByName.find(name);
        return it != m_signalsByName.end() ? it->second : nullptr;
    }

    std::size_t SignalRegistry::Size() const
    {
        return m_signals.size();
    }

    std::vector<std::string> SignalRegistry::Names() const
    {
        std::vector<std::string> names;
        names.reserve(m_order.size());

        for (const auto& type : m_order)
        {
            names.push_back(m_signals.at(type)->Name());
        }
        return names;
    }

    void SignalRegistry::Populate(const SignalCatalog& catalog, const std::vector<std::string>& reservedNamespaces)
    {
        if (m_populated)
        {
            return;
        }
        m_populated = true;

        if (m_mode == RegistrationMode::Discover)
        {
            DiscoverAndRegister(catalog, reservedNamespaces);
        }
        else
        {
            OnRegister();
        }

        LogInfo("Signal registry populated with {} signal(s) ({})",
                m_signals.size(),
                m_mode == RegistrationMode::Discover ? "discovered" : "curated");
    }

    bool SignalRegistry::IsPopulated() const
    {
        return m_populated;
    }

    void SignalRegistry::DiscoverAndRegister(const SignalCatalog& catalog,
                                             const std::vector<std::string>& reservedNamespaces)
    {
        for (const auto& descriptor : catalog.Enumerate(reservedNamespaces))
        {
            Register(descriptor);
        }
    }
} // namespace typed_signals
