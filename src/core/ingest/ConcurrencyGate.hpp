#pragma once
#include <cstddef>
#include <deque>
#include <memory>

#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/awaitable.hpp>
#include <boost/asio/steady_timer.hpp>

/**
 * @brief Bounded admission control for in-flight transfers.
 *
 * @details
 * At most `limit` permits exist at any time. A coroutine that finds the gate
 * full parks on a timer; releasing a permit hands the slot to the oldest
 * waiter directly.
 *
 * **Thread Safety:** none. All coroutines using one gate must run on the same
 * single-threaded executor.
 */
class ConcurrencyGate {
   public:
    class Permit {
       public:
        Permit() = default;
        Permit(Permit&& other) noexcept : gate_(other.gate_) { other.gate_ = nullptr; }
        Permit& operator=(Permit&& other) noexcept;
        ~Permit() { reset(); }

        Permit(const Permit&) = delete;
        Permit& operator=(const Permit&) = delete;

        // Returns the slot early.
        void reset();
        bool held() const { return gate_ != nullptr; }

       private:
        friend class ConcurrencyGate;
        explicit Permit(ConcurrencyGate* gate) : gate_(gate) {}
        ConcurrencyGate* gate_ = nullptr;
    };

    /**
     * @throws std::invalid_argument if @p limit is zero.
     */
    ConcurrencyGate(boost::asio::any_io_executor executor, std::size_t limit);

    ConcurrencyGate(const ConcurrencyGate&) = delete;
    ConcurrencyGate& operator=(const ConcurrencyGate&) = delete;

    boost::asio::awaitable<Permit> Acquire();

    std::size_t limit() const { return limit_; }
    std::size_t in_flight() const { return in_flight_; }
    std::size_t waiting() const { return waiters_.size(); }

   private:
    void release();

    boost::asio::any_io_executor executor_;
    std::size_t limit_;
    std::size_t in_flight_ = 0;
    std::deque<std::shared_ptr<boost::asio::steady_timer>> waiters_;
};
