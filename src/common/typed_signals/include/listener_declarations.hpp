#pragma once

#include <signal.hpp>
#include <signal_errors.hpp>

#include <array>
#include <bit>
#include <cstddef>
#include <functional>
#include <string>
#include <tuple>
#include <typeindex>
#include <typeinfo>
#include <utility>
#include <vector>

namespace typed_signals
{
    /// @brief One "listen-to" declaration made by an owner type.
    struct ListenerDeclaration
    {
        std::type_index SignalType;
        std::string SignalName;
        std::string MethodName;

        /// @brief Opaque identity of the member function, shared by all instances of the owner type.
        std::string MethodKey;

        std::size_t ParameterCount;
        Cardinality Mode;

        /// @brief Builds the callback for an owner instance and attaches it to the resolved signal.
        ///
        /// The signal passed in must be the one registered for SignalType.
        std::function<void(void* owner, ISignal& signal, ListenerKey key)> Attach;
    };

    /// @brief Collects the listener declarations of one owner type.
    ///
    /// Owner types publish their listeners through a static member:
    /// @code
    /// class Player
    /// {
    /// public:
    ///     static void DeclareListeners(typed_signals::ListenerDeclarations<Player>& listeners)
    ///     {
    ///         listeners.ListenTo<Ping>("OnPing", &Player::OnPing);
    ///         listeners.ListenTo<Move>("OnMove", &Player::OnMove, typed_signals::Cardinality::Once);
    ///     }
    ///
    ///     void OnPing();
    ///     void OnMove(const Vector& direction, float speed);
    /// };
    /// @endcode
    template<typename Owner>
    class ListenerDeclarations
    {
    public:
        template<SignalKind Kind, typename... Params>
        ListenerDeclarations& ListenTo(void (Owner::*method)(Params...), Cardinality cardinality = Cardinality::Every)
        {
            return ListenTo<Kind>(DefaultName(), method, cardinality);
        }

        template<SignalKind Kind, typename... Params>
        ListenerDeclarations& ListenTo(void (Owner::*method)(Params...) const,
                                       Cardinality cardinality = Cardinality::Every)
        {
            return ListenTo<Kind>(DefaultName(), method, cardinality);
        }

        /// @brief Declares that method listens to the event kind Kind.
        ///
        /// @param name Method name used in diagnostics.
        /// @param method Member function invoked on dispatch.
        /// @param cardinality Every, or Once to fire a single time per bind.
        template<SignalKind Kind, typename... Params>
        ListenerDeclarations&
        ListenTo(std::string name, void (Owner::*method)(Params...), Cardinality cardinality = Cardinality::Every)
        {
            Add<Kind, Params...>(std::move(name), method, cardinality);
            return *this;
        }

        template<SignalKind Kind, typename... Params>
        ListenerDeclarations& ListenTo(std::string name,
                                       void (Owner::*method)(Params...) const,
                                       Cardinality cardinality = Cardinality::Every)
        {
            Add<Kind, Params...>(std::move(name), method, cardinality);
            return *this;
        }

        const std::vector<ListenerDeclaration>& Items() const
        {
            return m_items;
        }

        std::vector<ListenerDeclaration> Release()
        {
            return std::move(m_items);
        }

    private:
        std::string DefaultName() const
        {
            return "listener #" + std::to_string(m_items.size() + 1);
        }

        template<typename Method>
        static std::string MethodIdentity(Method method)
        {
            const auto bytes = std::bit_cast<std::array<char, sizeof(Method)>>(method);

            std::string identity(typeid(Method).name());
            identity.append(bytes.data(), bytes.size());
            return identity;
        }

        template<SignalKind Kind, typename... Params, typename Method>
        void Add(std::string name, Method method, Cardinality cardinality)
        {
            auto qualifiedName = TypeName<Owner>() + "::" + name;

            auto attach = [method, qualifiedName, cardinality](void* owner, ISignal& signal, ListenerKey key)
            {
                if constexpr (sizeof...(Params) != Kind::Arity)
                {
                    throw SignatureMismatchError(signal.Name(), qualifiedName, Kind::Arity, sizeof...(Params));
                }
                else
                {
                    using Arguments = typename detail::ToTypeList<typename Kind::ParameterTypes>::Type;
                    constexpr auto position =
                        detail::FirstNonConvertible(detail::TypeList<Params...> {}, Arguments {});

                    if constexpr (position != 0)
                    {
                        using Expected = std::tuple_element_t<position - 1, typename Kind::ParameterTypes>;
                        using Found = std::tuple_element_t<position - 1, std::tuple<Params...>>;
                        throw TypeMismatchError::ForListenerParameter(
                            qualifiedName, position, TypeName<Expected>(), TypeName<Found>());
                    }
                    else
                    {
                        auto& typed = static_cast<Kind&>(signal);
                        typed.AddListener(
                            std::move(key), Kind::MemberCallback(static_cast<Owner*>(owner), method), cardinality);
                    }
                }
            };

            m_items.push_back(ListenerDeclaration {std::type_index(typeid(Kind)),
                                                   TypeName<Kind>(),
                                                   std::move(qualifiedName),
                                                   MethodIdentity(method),
                                                   sizeof...(Params),
                                                   cardinality,
                                                   std::move(attach)});
        }

        std::vector<ListenerDeclaration> m_items;
    };

    /// @brief Satisfied by owner types that publish their listeners through DeclareListeners.
    template<typename Owner>
    concept ListenerOwner = requires(ListenerDeclarations<Owner>& declarations) {
        Owner::DeclareListeners(declarations);
    };
} // namespace typed_signals
