#pragma once

#include <dispatcher_options.hpp>
#include <listener_binding_table.hpp>
#include <listener_declarations.hpp>
#include <owner_liveness.hpp>
#include <signal.hpp>
#include <signal_catalog.hpp>
#include <signal_errors.hpp>
#include <signal_registry.hpp>

#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <tuple>
#include <type_traits>
#include <typeindex>
#include <unordered_map>
#include <utility>
#include <vector>

namespace typed_signals
{
    /// @brief Binds listener owners to the signals of a registry and invokes those signals.
    ///
    /// The SignalDispatcher owns the active SignalRegistry, resolves the listener declarations
    /// of owner types into bindings, validates invoke arguments, and keeps an index of the
    /// bindings of every owner so they can be removed in bulk. It is meant to be created once
    /// by the host and passed to whoever needs to bind or invoke.
    ///
    /// All calls are expected from a single thread. Unbind requests made while a signal is
    /// being invoked are queued and processed when the outermost invocation returns.
    class SignalDispatcher : public IDispatchContext
    {
    public:
        /// @brief Creates a dispatcher without a registry.
        ///
        /// @param liveness Oracle consulted before each listener call. Defaults to AlwaysAlive.
        /// @param options Dispatcher tunables; the log level is applied to the shared logger.
        /// @param catalog Source of event kinds for registries in discovery mode.
        explicit SignalDispatcher(std::shared_ptr<IOwnerLiveness> liveness = nullptr,
                                  DispatcherOptions options = DispatcherOptions::Defaults(),
                                  const SignalCatalog& catalog = SignalCatalog::GetInstance());

        SignalDispatcher(const SignalDispatcher&) = delete;
        SignalDispatcher& operator=(const SignalDispatcher&) = delete;

        /// @brief Installs a registry, populating it according to its mode.
        ///
        /// Every existing binding is removed first so nothing keeps referring to the signals of
        /// the replaced registry. Passing nullptr installs a new registry in the configured
        /// default mode (discovery unless configured otherwise).
        ///
        /// @param registry The new registry, or nullptr.
        /// @throws DispatchInProgressError if called while a signal is being invoked.
        void SetRegistry(std::unique_ptr<SignalRegistry> registry = nullptr);

        /// @brief Returns the active registry, or nullptr if none was installed.
        SignalRegistry* Registry() const;

        /// @brief Binds every listener declared by Owner::DeclareListeners to its signal.
        ///
        /// Either all declared listeners are bound or, if one of them fails, none is. Bindings
        /// left behind by a dead owner at the same address are dropped first.
        ///
        /// @param owner The listener object. It must stay valid until unbound, or be reported
        ///              dead by the liveness oracle.
        /// @throws UnregisteredSignalError if a declared kind is not in the registry.
        /// @throws SignatureMismatchError if a method's parameter count differs from its signal's.
        /// @throws TypeMismatchError if a signal argument cannot be passed to a method parameter.
        /// @throws DuplicateListenerError if the owner is already bound.
        template<ListenerOwner Owner>
        void Bind(Owner& owner)
        {
            BindDeclarations(static_cast<void*>(std::addressof(owner)), TypeName<Owner>(), DeclarationsFor<Owner>());
        }

        /// @brief Removes every binding of owner. No-op if it has none.
        ///
        /// Deferred until the current dispatch completes when called from inside a listener.
        void Unbind(OwnerId owner);

        template<typename Owner>
            requires(!std::is_pointer_v<Owner>)
        void Unbind(const Owner& owner)
        {
            Unbind(static_cast<OwnerId>(std::addressof(owner)));
        }

        /// @brief Unbinds the object a smart pointer owns, not the smart pointer itself.
        template<typename Owner>
        void Unbind(const std::shared_ptr<Owner>& owner)
        {
            Unbind(static_cast<OwnerId>(owner.get()));
        }

        template<typename Owner, typename Deleter>
        void Unbind(const std::unique_ptr<Owner, Deleter>& owner)
        {
            Unbind(static_cast<OwnerId>(owner.get()));
        }

        /// @brief Invokes the signal registered for Kind.
        ///
        /// @param arguments One argument per signal parameter, convertible to its type.
        /// @throws UnregisteredSignalError if Kind is not in the registry.
        /// @throws ArityMismatchError if the argument count differs from the signal's.
        /// @throws TypeMismatchError for an argument not convertible to its parameter, or a
        ///         NullArgumentForNonNullableParameterError for nullptr passed to a value type.
        template<SignalKind Kind, typename... Provided>
        void Invoke(Provided&&... arguments)
        {
            DispatchScope scope(*this);
            auto& signal = static_cast<Kind&>(RequireSignal(std::type_index(typeid(Kind)), TypeName<Kind>()));

            if constexpr (sizeof...(Provided) != Kind::Arity)
            {
                ((void)arguments, ...);
                ReportArityMismatch(signal, sizeof...(Provided));
            }
            else
            {
                using Parameters = typename detail::ToTypeList<typename Kind::ParameterTypes>::Type;
                constexpr auto position = detail::FirstNonConvertible(Parameters {}, detail::TypeList<Provided...> {});

                if constexpr (position != 0)
                {
                    using Expected = std::tuple_element_t<position - 1, typename Kind::ParameterTypes>;
                    using Found = std::remove_cvref_t<std::tuple_element_t<position - 1, std::tuple<Provided...>>>;

                    ((void)arguments, ...);
                    ReportTypeMismatch(signal,
                                       position,
                                       TypeName<Expected>(),
                                       std::is_null_pointer_v<Found> ? std::nullopt
                                                                     : std::optional<std::string>(TypeName<Found>()));
                }
                else
                {
                    TraceDispatch(signal);
                    signal.Invoke(*this, std::forward<Provided>(arguments)...);
                }
            }
        }

        /// @brief Invokes a signal by qualified name with type-erased arguments.
        ///
        /// Each argument must hold exactly the parameter's type. An empty std::any, or one
        /// holding nullptr, is accepted for pointer-like parameters only.
        ///
        /// @throws UnregisteredSignalError, ArityMismatchError, TypeMismatchError as the typed overload.
        void Invoke(const std::string& signalName, const ArgumentList& arguments);

        /// @brief Returns the signal registered for Kind, or nullptr.
        template<SignalKind Kind>
        Kind* GetSignal() const
        {
            return m_registry ? m_registry->Get<Kind>() : nullptr;
        }

        /// @brief Returns the signal registered under signalName, or nullptr.
        ISignal* GetSignal(const std::string& signalName) const;

        /// @brief True while at least one Invoke is running.
        bool IsDispatching() const;

        bool IsBound(OwnerId owner) const;

        /// @brief Number of owners with at least one binding.
        std::size_t BoundOwnerCount() const;

        /// @brief Unbind requests waiting for the current dispatch to complete.
        std::size_t PendingUnbindCount() const;

        const DispatcherOptions& Options() const;

        bool IsListenerAlive(const ListenerKey& key) const override;
        void OnOwnerExpired(OwnerId owner) override;
        void OnListenerRetired(const ListenerKey& key) override;

    private:
        /// @brief Marks a dispatch in progress; draining deferred unbinds when the outermost one ends.
        class DispatchScope
        {
        public:
            explicit DispatchScope(SignalDispatcher& dispatcher);
            ~DispatchScope();

            DispatchScope(const DispatchScope&) = delete;
            DispatchScope& operator=(const DispatchScope&) = delete;

        private:
            SignalDispatcher& m_dispatcher;
        };

        template<ListenerOwner Owner>
        const std::vector<ListenerDeclaration>& DeclarationsFor()
        {
            const auto type = std::type_index(typeid(Owner));

            auto it = m_declarationCache.find(type);
            if (it == m_declarationCache.end())
            {
                ListenerDeclarations<Owner> declarations;
                Owner::DeclareListeners(declarations);
                it = m_declarationCache.emplace(type, declarations.Release()).first;
            }
            return it->second;
        }

        void BindDeclarations(void* owner,
                              const std::string& ownerType,
                              const std::vector<ListenerDeclaration>& declarations);

        void PurgeStaleBindings(OwnerId owner);

        ISignal& RequireSignal(const std::type_index& type, const std::string& signalName) const;

        ISignal& RequireSignal(const std::string& signalName) const;

        [[noreturn]] void ThrowUnregistered(const std::string& signalName) const;

        void ValidateArguments(const ISignal& signal, const ArgumentList& arguments) const;

        [[noreturn]] void ReportArityMismatch(const ISignal& signal, std::size_t provided) const;

        /// @param foundType Name of the supplied type, or std::nullopt for a null value.
        [[noreturn]] void ReportTypeMismatch(const ISignal& signal,
                                             std::size_t position,
                                             const std::string& expectedType,
                                             const std::optional<std::string>& foundType) const;

        void TraceDispatch(const ISignal& signal) const;

        void RemoveBindings(OwnerId owner);

        void UnbindAll();

        void DrainDeferredUnbinds();

        std::shared_ptr<IOwnerLiveness> m_liveness;
        DispatcherOptions m_options;
        const SignalCatalog& m_catalog;
        std::unique_ptr<SignalRegistry> m_registry;
        ListenerBindingTable m_bindings;
        std::unordered_map<std::type_index, std::vector<ListenerDeclaration>> m_declarationCache;
        std::vector<OwnerId> m_deferredUnbinds;
        std::size_t m_dispatchDepth = 0;
    };
} // namespace typed_signals
