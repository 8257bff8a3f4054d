#pragma once

#include <signal_errors.hpp>

#include <boost/core/demangle.hpp>
#include <boost/signals2.hpp>

#include <algorithm>
#include <any>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <tuple>
#include <type_traits>
#include <typeindex>
#include <typeinfo>
#include <utility>
#include <vector>

namespace typed_signals
{
    /// @brief How often a bound listener fires.
    enum class Cardinality
    {
        Every,
        Once
    };

    /// @brief Opaque identity of a listener owner. Never dereferenced by the dispatcher.
    using OwnerId = const void*;

    /// @brief Positional arguments for the type-erased invoke path.
    using ArgumentList = std::vector<std::any>;

    /// @brief Returns the demangled name of a runtime type.
    inline std::string DemangledName(const std::type_info& type)
    {
        return boost::core::demangle(type.name());
    }

    /// @brief Returns the demangled name of T, without cv or reference qualifiers.
    template<typename T>
    std::string TypeName()
    {
        return DemangledName(typeid(std::remove_cvref_t<T>));
    }

    /// @brief Identity of one listener callback: the owner plus the bound method.
    struct ListenerKey
    {
        OwnerId Owner = nullptr;

        /// @brief Opaque byte identity of the bound member function.
        std::string Method;

        /// @brief Readable name used in diagnostics only.
        std::string Name;

        /// @brief Liveness generation of the owner when it was bound; 0 for untracked owners.
        ///
        /// Not part of the identity: a stale binding at a reused address still collides.
        std::uint64_t Generation = 0;

        bool operator==(const ListenerKey& other) const
        {
            return Owner == other.Owner && Method == other.Method;
        }
    };

    /// @brief Runtime description of one declared signal parameter.
    struct ParameterInfo
    {
        std::type_index Type;
        std::string TypeName;

        /// @brief True if the parameter accepts a null value (pointer-like types).
        bool Nullable;
    };

    /// @brief Services a Signal needs from whoever invokes it.
    class IDispatchContext
    {
    public:
        virtual ~IDispatchContext() = default;

        /// @brief Answers whether the owner a binding was created for is still alive.
        ///
        /// False as well when the owner died and its address now belongs to another owner.
        virtual bool IsListenerAlive(const ListenerKey& key) const = 0;

        /// @brief Reports an owner found dead during a dispatch.
        virtual void OnOwnerExpired(OwnerId owner) = 0;

        /// @brief Reports a Once listener that fired and will be removed after the pass.
        virtual void OnListenerRetired(const ListenerKey& key) = 0;
    };

    /// @brief Type-erased view of a Signal used by the registry and the dispatcher.
    class ISignal
    {
    public:
        virtual ~ISignal() = default;

        /// @brief Qualified name of the event kind.
        virtual std::string Name() const = 0;

        virtual std::size_t ParameterCount() const = 0;

        virtual const std::vector<ParameterInfo>& Parameters() const = 0;

        /// @brief Removes the live binding matching key. No-op if absent.
        ///
        /// Bindings already retired during the current pass are left to the post-pass purge.
        virtual void RemoveListener(const ListenerKey& key) = 0;

        virtual bool HasListener(const ListenerKey& key) const = 0;

        /// @brief Number of bindings that will fire on the next invocation.
        virtual std::size_t ListenerCount() const = 0;

        /// @brief Bound listeners in dispatch order.
        virtual std::vector<ListenerKey> Listeners() const = 0;

        /// @brief Invokes the signal with type-erased arguments.
        ///
        /// The arguments must already have been validated against Parameters().
        virtual void InvokeErased(IDispatchContext& context, const ArgumentList& arguments) = 0;
    };

    namespace detail
    {
        template<typename... Ts>
        struct TypeList
        {
        };

        template<typename Tuple>
        struct ToTypeList;

        template<typename... Ts>
        struct ToTypeList<std::tuple<Ts...>>
        {
            using Type = TypeList<Ts...>;
        };

        /// @brief 1-based position of the first Provided type not convertible to its Expected type, 0 if none.
        template<typename... Expected, typename... Provided>
        constexpr std::size_t FirstNonConvertible(TypeList<Expected...>, TypeList<Provided...>)
        {
            static_assert(sizeof...(Expected) == sizeof...(Provided));

            std::size_t position = 0;
            std::size_t index = 0;
            ((++index, position = (position == 0 && !std::is_convertible_v<Provided, Expected>) ? index : position),
             ...);
            return position;
        }

        template<typename T>
        constexpr bool IsNullable = std::is_convertible_v<std::nullptr_t, std::remove_cvref_t<T>>;

        template<typename T>
        ParameterInfo MakeParameterInfo()
        {
            return {typeid(std::remove_cvref_t<T>), TypeName<T>(), IsNullable<T>};
        }

        template<typename T>
        std::remove_cvref_t<T> ArgumentCast(const std::any& argument)
        {
            using Value = std::remove_cvref_t<T>;

            if constexpr (IsNullable<T>)
            {
                if (!argument.has_value() || argument.type() == typeid(std::nullptr_t))
                {
                    return Value(nullptr);
                }
            }
            return std::any_cast<const Value&>(argument);
        }
    } // namespace detail

    /// @brief A strongly typed event channel with an ordered list of listener bindings.
    ///
    /// Event kinds derive from a Signal specialisation, for example
    /// `struct Move : Signal<Vector, float> {};`. Listeners are invoked synchronously in
    /// registration order. Bindings that must go away during a dispatch (Once listeners that
    /// fired, listeners whose owner died) are collected and purged after the pass, so the
    /// pass itself never skips or repeats a listener.
    ///
    /// @tparam Args Parameter types. Values and const references are supported.
    template<typename... Args>
    class Signal : public ISignal
    {
        static_assert(((!std::is_lvalue_reference_v<Args> || std::is_const_v<std::remove_reference_t<Args>>) && ...),
                      "Signal parameters must be values or const references");

    public:
        using Callback = std::function<void(Args...)>;
        using ParameterTypes = std::tuple<Args...>;

        static constexpr std::size_t Arity = sizeof...(Args);

        Signal() = default;
        Signal(const Signal&) = delete;
        Signal& operator=(const Signal&) = delete;

        std::string Name() const override
        {
            return DemangledName(typeid(*this));
        }

        std::size_t ParameterCount() const override
        {
            return Arity;
        }

        const std::vector<ParameterInfo>& Parameters() const override
        {
            static const std::vector<ParameterInfo> parameters = {detail::MakeParameterInfo<Args>()...};
            return parameters;
        }

        /// @brief Appends a listener after all existing ones.
        ///
        /// @param key Identity of the owner and method.
        /// @param callback Function invoked on dispatch.
        /// @param cardinality Every, or Once to remove the listener after its first call.
        /// @throws DuplicateListenerError if a binding with the same key is already attached.
        void AddListener(ListenerKey key, Callback callback, Cardinality cardinality = Cardinality::Every)
        {
            if (HasListener(key))
            {
                throw DuplicateListenerError(Name(), key.Name);
            }

            auto binding = std::make_shared<Binding>();
            binding->Key = std::move(key);
            binding->Handler = std::move(callback);
            binding->Mode = cardinality;
            binding->Connection =
                m_signal.connect([this, binding](Args... args) { Deliver(binding, std::forward<Args>(args)...); });

            m_bindings.push_back(std::move(binding));
        }

        void RemoveListener(const ListenerKey& key) override
        {
            const auto it = std::find_if(m_bindings.begin(),
                                         m_bindings.end(),
                                         [&key](const std::shared_ptr<Binding>& binding)
                                         { return !binding->Retired && binding->Key == key; });
            if (it == m_bindings.end())
            {
                return;
            }

            (*it)->Retired = true;
            (*it)->Connection.disconnect();
            m_bindings.erase(it);
        }

        bool HasListener(const ListenerKey& key) const override
        {
            return std::any_of(m_bindings.begin(),
                               m_bindings.end(),
                               [&key](const std::shared_ptr<Binding>& binding)
                               { return !binding->Retired && binding->Key == key; });
        }

        std::size_t ListenerCount() const override
        {
            return static_cast<std::size_t>(
                std::count_if(m_bindings.begin(),
                              m_bindings.end(),
                              [](const std::shared_ptr<Binding>& binding) { return !binding->Retired; }));
        }

        std::vector<ListenerKey> Listeners() const override
        {
            std::vector<ListenerKey> keys;
            for (const auto& binding : m_bindings)
            {
                if (!binding->Retired)
                {
                    keys.push_back(binding->Key);
                }
            }
            return keys;
        }

        /// @brief Calls every bound, alive listener once, in registration order.
        ///
        /// An exception thrown by a listener stops the pass and propagates unchanged; bindings
        /// already marked for removal are still purged.
        ///
        /// @param context Liveness oracle and sink for removal notifications.
        void Invoke(IDispatchContext& context, Args... args)
        {
            InvocationScope scope(*this, context);
            m_signal(args...);
        }

        void InvokeErased(IDispatchContext& context, const ArgumentList& arguments) override
        {
            InvokeErased(context, arguments, std::index_sequence_for<Args...> {});
        }

        /// @brief Wraps a member function of owner into a Callback of this signal.
        template<typename Owner, typename Method>
        static Callback MemberCallback(Owner* owner, Method method)
        {
            return [owner, method](Args... args) { (owner->*method)(std::forward<Args>(args)...); };
        }

    private:
        struct Binding
        {
            ListenerKey Key;
            Callback Handler;
            Cardinality Mode = Cardinality::Every;
            boost::signals2::connection Connection;
            bool Retired = false;
        };

        /// @brief Installs the context for the duration of one pass and purges afterwards.
        class InvocationScope
        {
        public:
            InvocationScope(Signal& signal, IDispatchContext& context)
                : m_owner(signal)
                , m_previous(signal.m_context)
            {
                m_owner.m_context = &context;
            }

            ~InvocationScope()
            {
                m_owner.m_context = m_previous;
                m_owner.PurgeRetired();
            }

            InvocationScope(const InvocationScope&) = delete;
            InvocationScope& operator=(const InvocationScope&) = delete;

        private:
            Signal& m_owner;
            IDispatchContext* m_previous;
        };

        template<std::size_t... I>
        void InvokeErased(IDispatchContext& context, const ArgumentList& arguments, std::index_sequence<I...>)
        {
            Invoke(context, detail::ArgumentCast<Args>(arguments[I])...);
        }

        void Deliver(const std::shared_ptr<Binding>& binding, Args... args)
        {
            if (binding->Retired)
            {
                return;
            }

            if (!m_context->IsListenerAlive(binding->Key))
            {
                Retire(binding);
                m_context->OnOwnerExpired(binding->Key.Owner);
                return;
            }

            if (binding->Mode == Cardinality::Once)
            {
                Retire(binding);
                m_context->OnListenerRetired(binding->Key);
            }

            binding->Handler(std::forward<Args>(args)...);
        }

        void Retire(const std::shared_ptr<Binding>& binding)
        {
            binding->Retired = true;
            m_pendingRemoval.push_back(binding);
        }

        void PurgeRetired()
        {
            for (const auto& binding : m_pendingRemoval)
            {
                binding->Connection.disconnect();
                m_bindings.erase(std::remove(m_bindings.begin(), m_bindings.end(), binding), m_bindings.end());
            }
            m_pendingRemoval.clear();
        }

        boost::signals2::signal<void(Args...)> m_signal;
        std::vector<std::shared_ptr<Binding>> m_bindings;
        std::vector<std::shared_ptr<Binding>> m_pendingRemoval;
        IDispatchContext* m_context = nullptr;
    };

    /// @brief Satisfied by event kinds: default constructible types deriving from a Signal.
    template<typename Kind>
    concept SignalKind = std::is_base_of_v<ISignal, Kind> && std::is_default_constructible_v<Kind> && requires {
        typename Kind::ParameterTypes;
        Kind::Arity;
    };
} // namespace typed_signals
