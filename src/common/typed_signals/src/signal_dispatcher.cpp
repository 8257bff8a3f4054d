#include <signal_dispatcher.hpp>

#include <logger.hpp>

#include <fmt/format.h>

#include <algorithm>
#include <cstddef>
#include <exception>
#include <typeinfo>

namespace typed_signals
{
    SignalDispatcher::DispatchScope::DispatchScope(SignalDispatcher& dispatcher)
        : m_dispatcher(dispatcher)
    {
        ++m_dispatcher.m_dispatchDepth;
    }

    SignalDispatcher::DispatchScope::~DispatchScope()
    {
        if (--m_dispatcher.m_dispatchDepth == 0)
        {
            m_dispatcher.DrainDeferredUnbinds();
        }
    }

    SignalDispatcher::SignalDispatcher(std::shared_ptr<IOwnerLiveness> liveness,
                                       DispatcherOptions options,
                                       const SignalCatalog& catalog)
        : m_liveness(liveness ? std::move(liveness) : std::make_shared<AlwaysAlive>())
        , m_options(std::move(options))
        , m_catalog(catalog)
    {
        Logger::SetLevel(m_options.LogLevel);
    }

    void SignalDispatcher::SetRegistry(std::unique_ptr<SignalRegistry> registry)
    {
        if (m_dispatchDepth > 0)
        {
            throw DispatchInProgressError("The signal registry cannot be replaced while a signal is being invoked.");
        }

        if (m_registry)
        {
            UnbindAll();
        }

        if (!registry)
        {
            registry = std::make_unique<SignalRegistry>(m_options.DefaultRegistrationMode);
        }

        registry->Populate(m_catalog, m_options.ReservedNamespaces);
        m_registry = std::move(registry);
    }

    SignalRegistry* SignalDispatcher::Registry() const
    {
        return m_registry.get();
    }

    void SignalDispatcher::BindDeclarations(void* owner,
                                            const std::string& ownerType,
                                            const std::vector<ListenerDeclaration>& declarations)
    {
        PurgeStaleBindings(owner);

        std::vector<BoundListener> attached;
        const auto generation = m_liveness->Generation(owner);

        try
        {
            for (const auto& declaration : declarations)
            {
                ISignal* signal = m_registry ? m_registry->Get(declaration.SignalType) : nullptr;
                if (signal == nullptr)
                {
                    throw UnregisteredSignalError(
                        declaration.SignalName,
                        fmt::format("Unable to bind signals for an instance of '{}'. The signal '{}' is not "
                                    "registered with the SignalDispatcher.",
                                    ownerType,
                                    declaration.SignalName));
                }

                if (declaration.ParameterCount != signal->ParameterCount())
                {
                    throw SignatureMismatchError(
                        signal->Name(), declaration.MethodName, signal->ParameterCount(), declaration.ParameterCount);
                }

                ListenerKey key {owner, declaration.MethodKey, declaration.MethodName, generation};
                declaration.Attach(owner, *signal, key);
                attached.push_back(BoundListener {signal, std::move(key)});
            }
        }
        catch (const std::exception& e)
        {
            LogWarn("Binding an instance of '{}' failed: {}", ownerType, e.what());

            for (const auto& listener : attached)
            {
                listener.Signal->RemoveListener(listener.Key);
            }
            throw;
        }

        for (auto& listener : attached)
        {
            m_bindings.Record(owner, listener.Signal, std::move(listener.Key));
        }

        LogDebug("Bound {} listener(s) of '{}' ({})", attached.size(), ownerType, static_cast<OwnerId>(owner));
    }

    void SignalDispatcher::Unbind(OwnerId owner)
    {
        if (m_dispatchDepth > 0)
        {
            if (std::find(m_deferredUnbinds.begin(), m_deferredUnbinds.end(), owner) == m_deferredUnbinds.end())
            {
                LogDebug("Deferring unbind of {} until the current dispatch completes", owner);
                m_deferredUnbinds.push_back(owner);
            }
            return;
        }

        RemoveBindings(owner);
    }

    void SignalDispatcher::Invoke(const std::string& signalName, const ArgumentList& arguments)
    {
        DispatchScope scope(*this);
        auto& signal = RequireSignal(signalName);

        ValidateArguments(signal, arguments);
        TraceDispatch(signal);
        signal.InvokeErased(*this, arguments);
    }

    ISignal* SignalDispatcher::GetSignal(const std::string& signalName) const
    {
        return m_registry ? m_registry->Find(signalName) : nullptr;
    }

    bool SignalDispatcher::IsDispatching() const
    {
        return m_dispatchDepth > 0;
    }

    bool SignalDispatcher::IsBound(OwnerId owner) const
    {
        return m_bindings.Contains(owner);
    }

    std::size_t SignalDispatcher::BoundOwnerCount() const
    {
        return m_bindings.Size();
    }

    std::size_t SignalDispatcher::PendingUnbindCount() const
    {
        return m_deferredUnbinds.size();
    }

    const DispatcherOptions& SignalDispatcher::Options() const
    {
        return m_options;
    }

    bool SignalDispatcher::IsListenerAlive(const ListenerKey& key) const
    {
        if (!m_liveness->IsAlive(key.Owner))
        {
            return false;
        }

        const auto generation = m_liveness->Generation(key.Owner);
        return generation == 0 || generation == key.Generation;
    }

    void SignalDispatcher::OnOwnerExpired(OwnerId owner)
    {
        LogDebug("Listener owner {} is no longer alive; removing its bindings", owner);
        Unbind(owner);
    }

    void SignalDispatcher::OnListenerRetired(const ListenerKey& key)
    {
        m_bindings.Forget(key.Owner, key);
    }

    void SignalDispatcher::PurgeStaleBindings(OwnerId owner)
    {
        const auto* listeners = m_bindings.Find(owner);
        if (listeners == nullptr || listeners->empty() || IsListenerAlive(listeners->front().Key))
        {
            return;
        }

        LogDebug("Dropping stale bindings of a destroyed owner at {}", owner);
        RemoveBindings(owner);

        // The address now belongs to the owner being bound; a queued unbind targets the dead one.
        m_deferredUnbinds.erase(std::remove(m_deferredUnbinds.begin(), m_deferredUnbinds.end(), owner),
                                m_deferredUnbinds.end());
    }

    ISignal& SignalDispatcher::RequireSignal(const std::type_index& type, const std::string& signalName) const
    {
        ISignal* signal = m_registry ? m_registry->Get(type) : nullptr;
        if (signal == nullptr)
        {
            ThrowUnregistered(signalName);
        }
        return *signal;
    }

    ISignal& SignalDispatcher::RequireSignal(const std::string& signalName) const
    {
        ISignal* signal = GetSignal(signalName);
        if (signal == nullptr)
        {
            ThrowUnregistered(signalName);
        }
        return *signal;
    }

    void SignalDispatcher::ThrowUnregistered(const std::string& signalName) const
    {
        LogWarn("Invoke of unregistered signal '{}'", signalName);
        throw UnregisteredSignalError(signalName,
                                      fmt::format("The signal '{}' is not registered with the SignalDispatcher's "
                                                  "registry. Please register the signal before invoking it.",
                                                  signalName));
    }

    void SignalDispatcher::ValidateArguments(const ISignal& signal, const ArgumentList& arguments) const
    {
        if (arguments.size() != signal.ParameterCount())
        {
            ReportArityMismatch(signal, arguments.size());
        }

        const auto& parameters = signal.Parameters();
        for (std::size_t i = 0; i < arguments.size(); ++i)
        {
            const auto& argument = arguments[i];
            const auto& parameter = parameters[i];

            if (!argument.has_value() || argument.type() == typeid(std::nullptr_t))
            {
                if (!parameter.Nullable)
                {
                    ReportTypeMismatch(signal, i + 1, parameter.TypeName, std::nullopt);
                }
                continue;
            }

            if (std::type_index(argument.type()) != parameter.Type)
            {
                ReportTypeMismatch(signal, i + 1, parameter.TypeName, DemangledName(argument.type()));
            }
        }
    }

    void SignalDispatcher::ReportArityMismatch(const ISignal& signal, std::size_t provided) const
    {
        LogWarn("Invoke of '{}' with {} argument(s) instead of {}", signal.Name(), provided, signal.ParameterCount());
        throw ArityMismatchError(signal.Name(), signal.ParameterCount(), provided);
    }

    void SignalDispatcher::ReportTypeMismatch(const ISignal& signal,
                                              std::size_t position,
                                              const std::string& expectedType,
                                              const std::optional<std::string>& foundType) const
    {
        LogWarn("Invoke of '{}' with a mismatched {} argument", signal.Name(), ToOrdinal(position));

        if (!foundType)
        {
            throw NullArgumentForNonNullableParameterError(signal.Name(), position, expectedType);
        }
        throw TypeMismatchError::ForArgument(signal.Name(), position, expectedType, *foundType);
    }

    void SignalDispatcher::TraceDispatch(const ISignal& signal) const
    {
        if (m_options.TraceDispatch)
        {
            LogTrace("Invoking '{}' on {} listener(s), depth {}", signal.Name(), signal.ListenerCount(), m_dispatchDepth);
        }
    }

    void SignalDispatcher::RemoveBindings(OwnerId owner)
    {
        const auto listeners = m_bindings.Take(owner);

        for (const auto& listener : listeners)
        {
            listener.Signal->RemoveListener(listener.Key);
        }

        if (!listeners.empty())
        {
            LogDebug("Unbound {} listener(s) of {}", listeners.size(), owner);
        }
    }

    void SignalDispatcher::UnbindAll()
    {
        for (const auto owner : m_bindings.Owners())
        {
            RemoveBindings(owner);
        }

        m_bindings.Clear();
        m_deferredUnbinds.clear();
    }

    void SignalDispatcher::DrainDeferredUnbinds()
    {
        while (!m_deferredUnbinds.empty())
        {
            auto owners = std::move(m_deferredUnbinds);
            m_deferredUnbinds.clear();

            for (const auto owner : owners)
            {
                RemoveBindings(owner);
            }
        }
    }
} // namespace typed_signals
