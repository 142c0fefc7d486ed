#include <gtest/gtest.h>

#include "core/signal.hpp"

#include <stdexcept>
#include <string>
#include <vector>

using namespace casement;

TEST(Signal, EmitReachesHandlersInOrder)
{
    Signal<int, std::string> sig;
    std::vector<std::string> log;

    sig.connect([&](int n, const std::string& s) { log.push_back("a" + std::to_string(n) + s); });
    sig.connect([&](int n, const std::string& s) { log.push_back("b" + std::to_string(n) + s); });
    sig.emit(1, "x");

    ASSERT_EQ(log.size(), 2u);
    EXPECT_EQ(log[0], "a1x");
    EXPECT_EQ(log[1], "b1x");
}

TEST(Signal, Disconnect)
{
    Signal<bool> sig;
    int          calls = 0;

    ConnectionId id = sig.connect([&](bool) { ++calls; });
    EXPECT_EQ(sig.subscriber_count(), 1u);
    sig.disconnect(id);
    EXPECT_EQ(sig.subscriber_count(), 0u);

    sig.emit(true);
    EXPECT_EQ(calls, 0);

    sig.disconnect(id);   // already gone
    sig.disconnect(12345);
}

TEST(Signal, ConnectionIdsAreUnique)
{
    Signal<> sig;
    ConnectionId a = sig.connect([] {});
    ConnectionId b = sig.connect([] {});
    EXPECT_NE(a, b);
}

TEST(Signal, ThrowingHandlerDoesNotStopOthers)
{
    Signal<int> sig;
    int         seen = 0;

    sig.connect([](int) { throw std::runtime_error("subscriber failed"); });
    sig.connect([&](int n) { seen = n; });

    EXPECT_NO_THROW(sig.emit(7));
    EXPECT_EQ(seen, 7);
}

TEST(Signal, HandlerMayDisconnectItselfDuringEmit)
{
    Signal<>     sig;
    int          calls = 0;
    ConnectionId id    = 0;

    id = sig.connect(
        [&]
        {
            ++calls;
            sig.disconnect(id);
        });

    sig.emit();
    sig.emit();
    EXPECT_EQ(calls, 1);
}

TEST(Signal, HandlerConnectedDuringEmitRunsNextTime)
{
    Signal<> sig;
    int      late = 0;

    sig.connect([&] { sig.connect([&] { ++late; }); });
    sig.emit();
    EXPECT_EQ(late, 0);
    sig.emit();
    EXPECT_EQ(late, 1);
}

TEST(Signal, DisconnectAll)
{
    Signal<int> sig;
    int         calls = 0;
    sig.connect([&](int) { ++calls; });
    sig.connect([&](int) { ++calls; });
    sig.disconnect_all();
    sig.emit(1);
    EXPECT_EQ(calls, 0);
}
