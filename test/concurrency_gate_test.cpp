#include <gtest/gtest.h>

#include <algorithm>
#include <chrono>
#include <stdexcept>
#include <vector>

#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/use_awaitable.hpp>

#include "ConcurrencyGate.hpp"

namespace asio = boost::asio;

TEST(ConcurrencyGateTest, ZeroLimitIsRejected) {
    asio::io_context ioc;
    EXPECT_THROW(ConcurrencyGate(ioc.get_executor(), 0), std::invalid_argument);
}

TEST(ConcurrencyGateTest, NeverAdmitsMoreThanLimit) {
    asio::io_context ioc;
    ConcurrencyGate gate(ioc.get_executor(), 3);

    std::size_t active = 0;
    std::size_t peak = 0;
    std::size_t finished = 0;

    for (int i = 0; i < 10; ++i) {
        asio::co_spawn(
            ioc,
            [&]() -> asio::awaitable<void> {
                auto permit = co_await gate.Acquire();
                ++active;
                peak = std::max(peak, active);
                asio::steady_timer hold(co_await asio::this_coro::executor,
                                        std::chrono::milliseconds(5));
                co_await hold.async_wait(asio::use_awaitable);
                --active;
                ++finished;
            },
            asio::detached);
    }
    ioc.run();

    EXPECT_EQ(finished, 10U);
    EXPECT_EQ(peak, 3U);
    EXPECT_EQ(gate.in_flight(), 0U);
    EXPECT_EQ(gate.waiting(), 0U);
}

TEST(ConcurrencyGateTest, ReleaseHandsSlotToOldestWaiter) {
    asio::io_context ioc;
    ConcurrencyGate gate(ioc.get_executor(), 1);
    std::vector<int> order;

    for (int i = 0; i < 4; ++i) {
        asio::co_spawn(
            ioc,
            [&, i]() -> asio::awaitable<void> {
                auto permit = co_await gate.Acquire();
                order.push_back(i);
                asio::steady_timer hold(co_await asio::this_coro::executor,
                                        std::chrono::milliseconds(1));
                co_await hold.async_wait(asio::use_awaitable);
            },
            asio::detached);
    }
    ioc.run();

    EXPECT_EQ(order, (std::vector<int>{0, 1, 2, 3}));
}

TEST(ConcurrencyGateTest, PermitReleasesOnResetAndMove) {
    asio::io_context ioc;
    ConcurrencyGate gate(ioc.get_executor(), 2);

    asio::co_spawn(
        ioc,
        [&]() -> asio::awaitable<void> {
            auto a = co_await gate.Acquire();
            auto b = co_await gate.Acquire();
            EXPECT_EQ(gate.in_flight(), 2U);

            ConcurrencyGate::Permit moved = std::move(a);
            EXPECT_FALSE(a.held());
            EXPECT_TRUE(moved.held());
            EXPECT_EQ(gate.in_flight(), 2U);

            moved.reset();
            EXPECT_EQ(gate.in_flight(), 1U);
            b = ConcurrencyGate::Permit();
            EXPECT_EQ(gate.in_flight(), 0U);
        },
        asio::detached);
    ioc.run();
    EXPECT_EQ(gate.in_flight(), 0U);
}
