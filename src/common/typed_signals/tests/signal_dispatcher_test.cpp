#include <gtest/gtest.h>
#include <signal_dispatcher.hpp>

#include "test_signals.hpp"

#include <any>
#include <functional>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

using namespace typed_signals;
using namespace test_signals;

namespace
{
    using CallLog = std::vector<std::string>;

    /// @brief Registry with the kinds used by the dispatcher tests.
    class TestRegistry : public SignalRegistry
    {
    public:
        TestRegistry()
            : SignalRegistry(RegistrationMode::Curated)
        {
        }

    protected:
        void OnRegister() override
        {
            Register<Ping>();
            Register<Pong>();
            Register<Move>();
            Register<Label>();
            Register<Select>();
            Register<Quad>();
        }
    };

    /// @brief Registry that only knows Pong.
    class PongOnlyRegistry : public SignalRegistry
    {
    protected:
        void OnRegister() override
        {
            Register<Pong>();
        }
    };

    class PingListener
    {
    public:
        PingListener(CallLog& log, std::string name)
            : m_log(log)
            , m_name(std::move(name))
        {
        }

        static void DeclareListeners(ListenerDeclarations<PingListener>& listeners)
        {
            listeners.ListenTo<Ping>("OnPing", &PingListener::OnPing);
        }

        void OnPing()
        {
            m_log.push_back(m_name);
        }

    private:
        CallLog& m_log;
        std::string m_name;
    };

    class OncePingListener
    {
    public:
        static void DeclareListeners(ListenerDeclarations<OncePingListener>& listeners)
        {
            listeners.ListenTo<Ping>("OnPing", &OncePingListener::OnPing, Cardinality::Once);
        }

        void OnPing()
        {
            ++Calls;
        }

        int Calls = 0;
    };

    class MoveHandler
    {
    public:
        static void DeclareListeners(ListenerDeclarations<MoveHandler>& listeners)
        {
            listeners.ListenTo<Move>("OnMove", &MoveHandler::OnMove);
        }

        void OnMove(const Vector3& direction, float speed)
        {
            Directions.push_back(direction);
            Speeds.push_back(speed);
        }

        std::vector<Vector3> Directions;
        std::vector<float> Speeds;
    };

    /// @brief Listens to several kinds at once, one of them through a const method.
    class MultiListener
    {
    public:
        static void DeclareListeners(ListenerDeclarations<MultiListener>& listeners)
        {
            listeners.ListenTo<Ping>("OnPing", &MultiListener::OnPing)
                .ListenTo<Label>("OnLabel", &MultiListener::OnLabel)
                .ListenTo<Quad>(&MultiListener::OnQuad);
        }

        void OnPing()
        {
            ++Pings;
        }

        void OnLabel(const std::string& text) const
        {
            Labels.push_back(text);
        }

        void OnQuad(int a, int b, int c, int d)
        {
            Sum += a + b + c + d;
        }

        int Pings = 0;
        mutable std::vector<std::string> Labels;
        int Sum = 0;
    };

    class SelectListener
    {
    public:
        static void DeclareListeners(ListenerDeclarations<SelectListener>& listeners)
        {
            listeners.ListenTo<Select>("OnSelect", &SelectListener::OnSelect);
        }

        void OnSelect(const Widget* widget)
        {
            Selected.push_back(widget);
        }

        std::vector<const Widget*> Selected;
    };

    class WrongArityListener
    {
    public:
        static void DeclareListeners(ListenerDeclarations<WrongArityListener>& listeners)
        {
            listeners.ListenTo<Move>("OnMove", &WrongArityListener::OnMove);
        }

        void OnMove(Vector3) {}
    };

    class WrongTypeListener
    {
    public:
        static void DeclareListeners(ListenerDeclarations<WrongTypeListener>& listeners)
        {
            listeners.ListenTo<Move>("OnMove", &WrongTypeListener::OnMove);
        }

        void OnMove(const std::string&, float) {}
    };

    /// @brief Binds Ping successfully before failing on a kind that is not registered.
    class PartiallyRegisteredListener
    {
    public:
        static void DeclareListeners(ListenerDeclarations<PartiallyRegisteredListener>& listeners)
        {
            listeners.ListenTo<Ping>("OnPing", &PartiallyRegisteredListener::OnPing)
                .ListenTo<Orphan>("OnOrphan", &PartiallyRegisteredListener::OnOrphan);
        }

        void OnPing() {}

        void OnOrphan(int) {}
    };

    /// @brief Runs an arbitrary action when Ping fires.
    class ActionListener
    {
    public:
        ActionListener(CallLog& log, std::string name, std::function<void()> action)
            : m_log(log)
            , m_name(std::move(name))
            , m_action(std::move(action))
        {
        }

        static void DeclareListeners(ListenerDeclarations<ActionListener>& listeners)
        {
            listeners.ListenTo<Ping>("OnPing", &ActionListener::OnPing);
        }

        void OnPing()
        {
            m_log.push_back(m_name);
            m_action();
        }

    private:
        CallLog& m_log;
        std::string m_name;
        std::function<void()> m_action;
    };

    class CountingDeclarations
    {
    public:
        static void DeclareListeners(ListenerDeclarations<CountingDeclarations>& listeners)
        {
            ++Declared;
            listeners.ListenTo<Pong>("OnPong", &CountingDeclarations::OnPong);
        }

        void OnPong() {}

        static inline int Declared = 0;
    };

    /// @brief Two methods of the same owner listening to the same kind.
    class TwoPingMethods
    {
    public:
        explicit TwoPingMethods(CallLog& log)
            : m_log(log)
        {
        }

        static void DeclareListeners(ListenerDeclarations<TwoPingMethods>& listeners)
        {
            listeners.ListenTo<Ping>("OnFirst", &TwoPingMethods::OnFirst)
                .ListenTo<Ping>("OnSecond", &TwoPingMethods::OnSecond);
        }

        void OnFirst()
        {
            m_log.emplace_back("first");
        }

        void OnSecond()
        {
            m_log.emplace_back("second");
        }

    private:
        CallLog& m_log;
    };

    class NoListeners
    {
    public:
        static void DeclareListeners(ListenerDeclarations<NoListeners>&) {}
    };
} // namespace

/// @brief Test suite for the SignalDispatcher class.
class SignalDispatcherTest : public ::testing::Test
{
protected:
    /// @brief Creates a dispatcher with a curated registry and a tracking liveness oracle.
    void SetUp() override
    {
        m_liveness = std::make_shared<TrackedOwnerLiveness>();
        m_dispatcher = std::make_unique<SignalDispatcher>(m_liveness);
        m_dispatcher->SetRegistry(std::make_unique<TestRegistry>());
    }

    std::size_t ListenerCount(const std::string& signalName) const
    {
        return m_dispatcher->GetSignal(signalName)->ListenerCount();
    }

    std::shared_ptr<TrackedOwnerLiveness> m_liveness;
    std::unique_ptr<SignalDispatcher> m_dispatcher;
    CallLog m_log;
};

/// @test Listeners bound in order L1..Ln are invoked once each in that order.
TEST_F(SignalDispatcherTest, InvokeCallsListenersInBindOrder)
{
    PingListener first(m_log, "first");
    PingListener second(m_log, "second");
    PingListener third(m_log, "third");

    m_dispatcher->Bind(first);
    m_dispatcher->Bind(second);
    m_dispatcher->Bind(third);
    m_dispatcher->Invoke<Ping>();

    EXPECT_EQ(m_log, (CallLog {"first", "second", "third"}));
}

/// @test An Every listener fires on each call, a Once listener on the first call only.
TEST_F(SignalDispatcherTest, EveryAndOnceListeners)
{
    PingListener every(m_log, "every");
    OncePingListener once;

    m_dispatcher->Bind(every);
    m_dispatcher->Bind(once);

    m_dispatcher->Invoke<Ping>();
    m_dispatcher->Invoke<Ping>();

    EXPECT_EQ(m_log, (CallLog {"every", "every"}));
    EXPECT_EQ(once.Calls, 1);
    EXPECT_FALSE(m_dispatcher->IsBound(&once));
    EXPECT_TRUE(m_dispatcher->IsBound(&every));
    EXPECT_EQ(ListenerCount("test_signals::Ping"), 1u);
}

/// @test Move delivers its arguments; a missing argument is an arity error and calls nobody.
TEST_F(SignalDispatcherTest, MoveScenario)
{
    MoveHandler handler;
    const Vector3 direction {0.0f, 1.0f, 0.0f};
    m_dispatcher->Bind(handler);

    m_dispatcher->Invoke<Move>(direction, 1.5);

    ASSERT_EQ(handler.Directions.size(), 1u);
    EXPECT_EQ(handler.Directions.front(), direction);
    EXPECT_FLOAT_EQ(handler.Speeds.front(), 1.5f);

    try
    {
        m_dispatcher->Invoke<Move>(direction);
        FAIL() << "Invoke with a missing argument should throw ArityMismatchError.";
    }
    catch (const ArityMismatchError& e)
    {
        EXPECT_EQ(e.Expected(), 2u);
        EXPECT_EQ(e.Provided(), 1u);
    }
    EXPECT_EQ(handler.Directions.size(), 1u);
}

/// @test Too many arguments are an arity error as well.
TEST_F(SignalDispatcherTest, TooManyArgumentsIsArityMismatch)
{
    PingListener listener(m_log, "listener");
    m_dispatcher->Bind(listener);

    EXPECT_THROW(m_dispatcher->Invoke<Ping>(42), ArityMismatchError);
    EXPECT_TRUE(m_log.empty());
}

/// @test Binding the same owner twice fails and leaves the listener set unchanged.
TEST_F(SignalDispatcherTest, DuplicateBindIsRejected)
{
    PingListener listener(m_log, "listener");
    m_dispatcher->Bind(listener);

    EXPECT_THROW(m_dispatcher->Bind(listener), DuplicateListenerError);

    EXPECT_EQ(ListenerCount("test_signals::Ping"), 1u);
    EXPECT_TRUE(m_dispatcher->IsBound(&listener));

    m_dispatcher->Invoke<Ping>();
    EXPECT_EQ(m_log, (CallLog {"listener"}));
}

/// @test An argument of the wrong type is reported with its 1-based position.
TEST_F(SignalDispatcherTest, WrongArgumentTypeIsTypeMismatch)
{
    MoveHandler handler;
    m_dispatcher->Bind(handler);

    try
    {
        m_dispatcher->Invoke<Move>(Vector3 {}, std::string("fast"));
        FAIL() << "Invoke with a string speed should throw TypeMismatchError.";
    }
    catch (const TypeMismatchError& e)
    {
        EXPECT_EQ(e.Position(), 2u);
        EXPECT_EQ(e.ExpectedType(), "float");
        EXPECT_NE(std::string(e.what()).find("2nd argument"), std::string::npos);
    }
    EXPECT_TRUE(handler.Directions.empty());
}

/// @test nullptr for a value parameter is a type mismatch naming 'null'.
TEST_F(SignalDispatcherTest, NullForValueParameterIsRejected)
{
    MoveHandler handler;
    m_dispatcher->Bind(handler);

    try
    {
        m_dispatcher->Invoke<Move>(nullptr, 1.0f);
        FAIL() << "Invoke with a null vector should throw NullArgumentForNonNullableParameterError.";
    }
    catch (const NullArgumentForNonNullableParameterError& e)
    {
        EXPECT_EQ(e.Position(), 1u);
        EXPECT_EQ(e.ExpectedType(), "test_signals::Vector3");
        EXPECT_EQ(e.FoundType(), "null");
    }

    EXPECT_THROW(m_dispatcher->Invoke<Move>(nullptr, 1.0f), TypeMismatchError);
    EXPECT_TRUE(handler.Directions.empty());
}

/// @test nullptr for a pointer parameter is delivered as a null pointer.
TEST_F(SignalDispatcherTest, NullForPointerParameterIsDelivered)
{
    SelectListener listener;
    const Widget widget {3};
    m_dispatcher->Bind(listener);

    m_dispatcher->Invoke<Select>(nullptr);
    m_dispatcher->Invoke<Select>(&widget);

    EXPECT_EQ(listener.Selected, (std::vector<const Widget*> {nullptr, &widget}));
}

/// @test The type-erased invoke validates exact argument types.
TEST_F(SignalDispatcherTest, InvokeByNameValidatesArguments)
{
    MoveHandler handler;
    m_dispatcher->Bind(handler);

    m_dispatcher->Invoke("test_signals::Move", {Vector3 {1.0f, 0.0f, 0.0f}, 2.5f});
    ASSERT_EQ(handler.Speeds.size(), 1u);
    EXPECT_FLOAT_EQ(handler.Speeds.front(), 2.5f);

    EXPECT_THROW(m_dispatcher->Invoke("test_signals::Move", {Vector3 {}}), ArityMismatchError);

    try
    {
        m_dispatcher->Invoke("test_signals::Move", {Vector3 {}, 2.5});
        FAIL() << "A double speed should be rejected by the type-erased path.";
    }
    catch (const TypeMismatchError& e)
    {
        EXPECT_EQ(e.Position(), 2u);
        EXPECT_EQ(e.FoundType(), "double");
    }

    EXPECT_THROW(m_dispatcher->Invoke("test_signals::Move", {std::any {}, 2.5f}),
                 NullArgumentForNonNullableParameterError);
    EXPECT_EQ(handler.Speeds.size(), 1u);
}

/// @test The type-erased invoke accepts an empty value for a pointer parameter.
TEST_F(SignalDispatcherTest, InvokeByNameAcceptsNullPointer)
{
    SelectListener listener;
    m_dispatcher->Bind(listener);

    m_dispatcher->Invoke("test_signals::Select", {std::any {}});
    m_dispatcher->Invoke("test_signals::Select", {nullptr});

    EXPECT_EQ(listener.Selected, (std::vector<const Widget*> {nullptr, nullptr}));
}

/// @test Invoking an unknown kind fails and leaves the dispatcher idle.
TEST_F(SignalDispatcherTest, InvokeUnregisteredSignal)
{
    try
    {
        m_dispatcher->Invoke<Orphan>(1);
        FAIL() << "Invoking an unregistered signal should throw.";
    }
    catch (const UnregisteredSignalError& e)
    {
        EXPECT_EQ(e.SignalName(), "test_signals::Orphan");
    }

    EXPECT_THROW(m_dispatcher->Invoke("test_signals::Nothing", {}), UnregisteredSignalError);
    EXPECT_FALSE(m_dispatcher->IsDispatching());
}

/// @test A bind failing on an unregistered kind rolls back the listeners it already attached.
TEST_F(SignalDispatcherTest, FailedBindIsRolledBack)
{
    PartiallyRegisteredListener listener;

    EXPECT_THROW(m_dispatcher->Bind(listener), UnregisteredSignalError);

    EXPECT_EQ(ListenerCount("test_signals::Ping"), 0u);
    EXPECT_FALSE(m_dispatcher->IsBound(&listener));
}

/// @test A method with the wrong parameter count cannot be bound.
TEST_F(SignalDispatcherTest, SignatureMismatchOnBind)
{
    WrongArityListener listener;

    try
    {
        m_dispatcher->Bind(listener);
        FAIL() << "Binding a one-parameter method to Move should throw.";
    }
    catch (const SignatureMismatchError& e)
    {
        EXPECT_EQ(e.Expected(), 2u);
        EXPECT_EQ(e.Found(), 1u);
    }
    EXPECT_FALSE(m_dispatcher->IsBound(&listener));
}

/// @test A method parameter that cannot receive the signal's argument is reported at bind time.
TEST_F(SignalDispatcherTest, ParameterTypeMismatchOnBind)
{
    WrongTypeListener listener;

    try
    {
        m_dispatcher->Bind(listener);
        FAIL() << "Binding a string parameter to a Vector3 argument should throw.";
    }
    catch (const TypeMismatchError& e)
    {
        EXPECT_EQ(e.Position(), 1u);
        EXPECT_EQ(e.ExpectedType(), "test_signals::Vector3");
    }
    EXPECT_EQ(ListenerCount("test_signals::Move"), 0u);
}

/// @test One owner can listen to several kinds, through const and non-const methods.
TEST_F(SignalDispatcherTest, OwnerWithSeveralListeners)
{
    MultiListener listener;
    m_dispatcher->Bind(listener);

    m_dispatcher->Invoke<Ping>();
    m_dispatcher->Invoke<Label>(std::string("hello"));
    m_dispatcher->Invoke<Label>("world");
    m_dispatcher->Invoke<Quad>(1, 2, 3, 4);

    EXPECT_EQ(listener.Pings, 1);
    EXPECT_EQ(listener.Labels, (std::vector<std::string> {"hello", "world"}));
    EXPECT_EQ(listener.Sum, 10);

    m_dispatcher->Unbind(listener);

    EXPECT_FALSE(m_dispatcher->IsBound(&listener));
    EXPECT_EQ(ListenerCount("test_signals::Ping"), 0u);
    EXPECT_EQ(ListenerCount("test_signals::Label"), 0u);
    EXPECT_EQ(ListenerCount("test_signals::Quad"), 0u);
}

/// @test Unbinding an owner without bindings is a no-op.
TEST_F(SignalDispatcherTest, UnbindWithoutBindingsIsNoOp)
{
    PingListener listener(m_log, "listener");
    NoListeners empty;

    EXPECT_NO_THROW(m_dispatcher->Unbind(listener));
    EXPECT_NO_THROW(m_dispatcher->Bind(empty));
    EXPECT_FALSE(m_dispatcher->IsBound(&empty));
    EXPECT_EQ(m_dispatcher->BoundOwnerCount(), 0u);
}

/// @test An owner unbinding itself mid-dispatch is removed once the dispatch completes.
TEST_F(SignalDispatcherTest, SelfUnbindDuringInvokeIsDeferred)
{
    std::size_t pendingDuringDispatch = 0;
    ActionListener* selfRef = nullptr;
    ActionListener self(m_log,
                        "self",
                        [&]()
                        {
                            m_dispatcher->Unbind(*selfRef);
                            pendingDuringDispatch = m_dispatcher->PendingUnbindCount();
                        });
    selfRef = &self;
    PingListener after(m_log, "after");

    m_dispatcher->Bind(self);
    m_dispatcher->Bind(after);

    m_dispatcher->Invoke<Ping>();

    EXPECT_EQ(m_log, (CallLog {"self", "after"}));
    EXPECT_EQ(pendingDuringDispatch, 1u);
    EXPECT_EQ(m_dispatcher->PendingUnbindCount(), 0u);
    EXPECT_FALSE(m_dispatcher->IsBound(&self));

    m_log.clear();
    m_dispatcher->Invoke<Ping>();
    EXPECT_EQ(m_log, (CallLog {"after"}));
}

/// @test Unbinding a later listener mid-dispatch neither skips nor repeats it in that pass.
TEST_F(SignalDispatcherTest, UnbindOtherOwnerDuringInvokeDoesNotSkip)
{
    PingListener target(m_log, "target");
    ActionListener killer(m_log, "killer", [&]() { m_dispatcher->Unbind(target); });

    m_dispatcher->Bind(killer);
    m_dispatcher->Bind(target);

    m_dispatcher->Invoke<Ping>();
    EXPECT_EQ(m_log, (CallLog {"killer", "target"}));
    EXPECT_FALSE(m_dispatcher->IsBound(&target));

    m_log.clear();
    m_dispatcher->Invoke<Ping>();
    EXPECT_EQ(m_log, (CallLog {"killer"}));
}

/// @test Deferred unbinds wait for the outermost dispatch, not for a nested one.
TEST_F(SignalDispatcherTest, NestedInvokeKeepsUnbindDeferred)
{
    PingListener target(m_log, "target");
    ActionListener outer(m_log,
                         "outer",
                         [&]()
                         {
                             m_dispatcher->Unbind(target);
                             m_dispatcher->Invoke<Pong>();
                             EXPECT_TRUE(m_dispatcher->IsDispatching());
                             EXPECT_EQ(m_dispatcher->PendingUnbindCount(), 1u);
                         });

    m_dispatcher->Bind(outer);
    m_dispatcher->Bind(target);

    m_dispatcher->Invoke<Ping>();

    EXPECT_EQ(m_log, (CallLog {"outer", "target"}));
    EXPECT_FALSE(m_dispatcher->IsBound(&target));
    EXPECT_FALSE(m_dispatcher->IsDispatching());
}

/// @test A listener exception propagates unchanged and deferred unbinds are still drained.
TEST_F(SignalDispatcherTest, ListenerExceptionPropagatesAndDrains)
{
    ActionListener* selfRef = nullptr;
    ActionListener self(m_log, "self", [&]() { m_dispatcher->Unbind(*selfRef); });
    selfRef = &self;
    ActionListener thrower(m_log, "thrower", []() { throw std::logic_error("listener bug"); });
    PingListener skipped(m_log, "skipped");

    m_dispatcher->Bind(self);
    m_dispatcher->Bind(thrower);
    m_dispatcher->Bind(skipped);

    try
    {
        m_dispatcher->Invoke<Ping>();
        FAIL() << "The listener exception should reach the invoker.";
    }
    catch (const SignalError&)
    {
        FAIL() << "Listener exceptions must not be wrapped in dispatcher errors.";
    }
    catch (const std::logic_error& e)
    {
        EXPECT_STREQ(e.what(), "listener bug");
    }

    EXPECT_EQ(m_log, (CallLog {"self", "thrower"}));
    EXPECT_FALSE(m_dispatcher->IsBound(&self));
    EXPECT_FALSE(m_dispatcher->IsDispatching());
    EXPECT_TRUE(m_dispatcher->IsBound(&skipped));
}

/// @test Listeners of an expired owner are skipped and their bindings purged.
TEST_F(SignalDispatcherTest, ExpiredOwnerIsPurged)
{
    auto doomed = std::make_shared<PingListener>(m_log, "doomed");
    PingListener survivor(m_log, "survivor");
    const OwnerId doomedId = doomed.get();

    m_liveness->Track(doomed);
    m_dispatcher->Bind(*doomed);
    m_dispatcher->Bind(survivor);

    doomed.reset();
    m_dispatcher->Invoke<Ping>();

    EXPECT_EQ(m_log, (CallLog {"survivor"}));
    EXPECT_FALSE(m_dispatcher->IsBound(doomedId));
    EXPECT_EQ(ListenerCount("test_signals::Ping"), 1u);
}

/// @test Installing a new registry drops every binding of the old one.
TEST_F(SignalDispatcherTest, SetRegistryUnbindsEverything)
{
    PingListener listener(m_log, "listener");
    MoveHandler handler;
    m_dispatcher->Bind(listener);
    m_dispatcher->Bind(handler);
    auto* oldPing = m_dispatcher->GetSignal<Ping>();

    EXPECT_EQ(oldPing->ListenerCount(), 1u);

    m_dispatcher->SetRegistry(std::make_unique<PongOnlyRegistry>());

    EXPECT_EQ(m_dispatcher->BoundOwnerCount(), 0u);
    EXPECT_EQ(m_dispatcher->GetSignal<Ping>(), nullptr);
    EXPECT_NE(m_dispatcher->GetSignal<Pong>(), nullptr);
    EXPECT_THROW(m_dispatcher->Invoke<Move>(Vector3 {}, 1.0f), UnregisteredSignalError);
    EXPECT_THROW(m_dispatcher->Bind(listener), UnregisteredSignalError);
}

/// @test Replacing the registry from inside a listener is refused.
TEST_F(SignalDispatcherTest, SetRegistryDuringInvokeIsRefused)
{
    ActionListener replacer(
        m_log, "replacer", [&]() { m_dispatcher->SetRegistry(std::make_unique<PongOnlyRegistry>()); });
    m_dispatcher->Bind(replacer);

    EXPECT_THROW(m_dispatcher->Invoke<Ping>(), DispatchInProgressError);
    EXPECT_NE(m_dispatcher->GetSignal<Ping>(), nullptr);
    EXPECT_TRUE(m_dispatcher->IsBound(&replacer));
}

/// @test Without an explicit registry the dispatcher discovers the declared kinds.
TEST_F(SignalDispatcherTest, NullRegistryDiscoversKinds)
{
    m_dispatcher->SetRegistry(nullptr);

    ASSERT_NE(m_dispatcher->Registry(), nullptr);
    EXPECT_EQ(m_dispatcher->Registry()->Mode(), RegistrationMode::Discover);
    EXPECT_NE(m_dispatcher->GetSignal<Ping>(), nullptr);
    EXPECT_NE(m_dispatcher->GetSignal<Quad>(), nullptr);
    EXPECT_EQ(m_dispatcher->GetSignal<Orphan>(), nullptr);
    EXPECT_EQ(m_dispatcher->GetSignal<builtin::ReservedProbe>(), nullptr);
}

/// @test Binding before any registry is installed reports the kind as unregistered.
TEST_F(SignalDispatcherTest, BindWithoutRegistry)
{
    SignalDispatcher dispatcher;
    PingListener listener(m_log, "listener");

    EXPECT_EQ(dispatcher.Registry(), nullptr);
    EXPECT_THROW(dispatcher.Bind(listener), UnregisteredSignalError);
    EXPECT_THROW(dispatcher.Invoke<Ping>(), UnregisteredSignalError);
}

/// @test Listener declarations are collected once per owner type.
TEST_F(SignalDispatcherTest, DeclarationsAreMemoizedPerType)
{
    CountingDeclarations first;
    CountingDeclarations second;
    const auto before = CountingDeclarations::Declared;

    m_dispatcher->Bind(first);
    m_dispatcher->Bind(second);

    EXPECT_EQ(CountingDeclarations::Declared - before, 1);
    EXPECT_EQ(ListenerCount("test_signals::Pong"), 2u);
}

/// @test Signals can be looked up by kind and by name.
TEST_F(SignalDispatcherTest, GetSignal)
{
    EXPECT_EQ(m_dispatcher->GetSignal<Move>(), m_dispatcher->GetSignal("test_signals::Move"));
    EXPECT_EQ(m_dispatcher->GetSignal<Orphan>(), nullptr);
    EXPECT_EQ(m_dispatcher->GetSignal("test_signals::Orphan"), nullptr);
}

/// @test Different methods of one owner are distinct listeners of the same kind.
TEST_F(SignalDispatcherTest, OwnerWithTwoMethodsOnOneSignal)
{
    TwoPingMethods listener(m_log);
    m_dispatcher->Bind(listener);

    EXPECT_EQ(ListenerCount("test_signals::Ping"), 2u);

    m_dispatcher->Invoke<Ping>();
    EXPECT_EQ(m_log, (CallLog {"first", "second"}));
}

/// @test Unbinding through a smart pointer removes the bindings of the object it owns.
TEST_F(SignalDispatcherTest, UnbindThroughSmartPointer)
{
    auto shared = std::make_shared<PingListener>(m_log, "shared");
    auto unique = std::make_unique<PingListener>(m_log, "unique");
    m_dispatcher->Bind(*shared);
    m_dispatcher->Bind(*unique);

    m_dispatcher->Unbind(shared);
    m_dispatcher->Unbind(unique);

    EXPECT_FALSE(m_dispatcher->IsBound(shared.get()));
    EXPECT_FALSE(m_dispatcher->IsBound(unique.get()));
    EXPECT_EQ(m_dispatcher->BoundOwnerCount(), 0u);
    EXPECT_EQ(ListenerCount("test_signals::Ping"), 0u);
}

/// @test A new owner at a destroyed owner's address can be bound and fires once per call.
TEST_F(SignalDispatcherTest, RebindAtReusedAddress)
{
    PingListener listener(m_log, "reused");

    std::shared_ptr<PingListener> first(std::make_shared<int>(0), &listener);
    m_liveness->Track(first);
    m_dispatcher->Bind(listener);
    first.reset();

    std::shared_ptr<PingListener> second(std::make_shared<int>(0), &listener);
    m_liveness->Track(second);

    EXPECT_NO_THROW(m_dispatcher->Bind(listener));
    EXPECT_EQ(ListenerCount("test_signals::Ping"), 1u);

    m_dispatcher->Invoke<Ping>();
    m_dispatcher->Invoke<Ping>();

    EXPECT_EQ(m_log, (CallLog {"reused", "reused"}));
    EXPECT_TRUE(m_dispatcher->IsBound(&listener));
}

/// @test A binding made for a destroyed owner does not fire for the next owner at that address.
TEST_F(SignalDispatcherTest, StaleBindingDoesNotFireForNewOwner)
{
    PingListener listener(m_log, "listener");

    std::shared_ptr<PingListener> first(std::make_shared<int>(0), &listener);
    m_liveness->Track(first);
    m_dispatcher->Bind(listener);
    first.reset();

    std::shared_ptr<PingListener> second(std::make_shared<int>(0), &listener);
    m_liveness->Track(second);

    m_dispatcher->Invoke<Ping>();

    EXPECT_TRUE(m_log.empty());
    EXPECT_FALSE(m_dispatcher->IsBound(&listener));
    EXPECT_EQ(ListenerCount("test_signals::Ping"), 0u);
}

/// @test Binding a new owner while the dead owner's unbind is still queued keeps the new bindings.
TEST_F(SignalDispatcherTest, RebindWhileStaleUnbindIsPending)
{
    PingListener listener(m_log, "reused");
    std::shared_ptr<PingListener> first(std::make_shared<int>(0), &listener);
    std::shared_ptr<PingListener> second;
    std::size_t pendingAfterRebind = 1;
    bool rebound = false;

    ActionListener rebinder(m_log,
                            "rebinder",
                            [&]()
                            {
                                if (rebound)
                                {
                                    return;
                                }
                                rebound = true;
                                second = std::shared_ptr<PingListener>(std::make_shared<int>(0), &listener);
                                m_liveness->Track(second);
                                m_dispatcher->Bind(listener);
                                pendingAfterRebind = m_dispatcher->PendingUnbindCount();
                            });

    m_liveness->Track(first);
    m_dispatcher->Bind(listener);
    m_dispatcher->Bind(rebinder);
    first.reset();

    m_dispatcher->Invoke<Ping>();

    EXPECT_EQ(m_log, (CallLog {"rebinder"}));
    EXPECT_EQ(pendingAfterRebind, 0u);
    EXPECT_TRUE(m_dispatcher->IsBound(&listener));
    EXPECT_EQ(m_dispatcher->PendingUnbindCount(), 0u);

    m_log.clear();
    m_dispatcher->Invoke<Ping>();
    EXPECT_EQ(m_log, (CallLog {"rebinder", "reused"}));
}
