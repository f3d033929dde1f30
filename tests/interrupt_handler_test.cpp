#include <gtest/gtest.h>

#include <chrono>
#include <thread>

#include <signal.h>

#include "pilapse/interrupt_handler.hpp"

namespace pilapse {
namespace {

using namespace std::chrono_literals;

TEST(CancellationTokenTest, WaitReturnsEarlyOnceRequested) {
    CancellationToken token;
    EXPECT_FALSE(token.waitFor(10ms));

    std::thread canceller([&token]() {
        std::this_thread::sleep_for(50ms);
        token.request();
    });
    const auto start = std::chrono::steady_clock::now();
    EXPECT_TRUE(token.waitFor(10s));
    canceller.join();
    EXPECT_LT(std::chrono::steady_clock::now() - start, 5s);
    EXPECT_TRUE(token.isRequested());
}

TEST(InterruptHandlerTest, SignalsRequestCancellation) {
    CancellationToken token;
    {
        InterruptHandler handler(&token);
        ASSERT_TRUE(handler.installed());
        ASSERT_EQ(::raise(SIGTERM), 0);
        EXPECT_TRUE(token.isRequested());
        EXPECT_EQ(token.signalNumber(), SIGTERM);
    }

    CancellationToken second;
    InterruptHandler handler(&second);
    ASSERT_TRUE(handler.installed());
    ASSERT_EQ(::raise(SIGINT), 0);
    EXPECT_TRUE(second.isRequested());
    EXPECT_EQ(second.signalNumber(), SIGINT);
}

TEST(InterruptHandlerTest, OnlyOneHandlerIsActive) {
    CancellationToken first;
    CancellationToken second;
    InterruptHandler active(&first);
    InterruptHandler ignored(&second);

    EXPECT_TRUE(active.installed());
    EXPECT_FALSE(ignored.installed());
    ASSERT_EQ(::raise(SIGINT), 0);
    EXPECT_TRUE(first.isRequested());
    EXPECT_FALSE(second.isRequested());
}

}  // namespace
}  // namespace pilapse
