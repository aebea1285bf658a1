#include "ConcurrencyGate.hpp"

#include <stdexcept>

#include <boost/asio/as_tuple.hpp>
#include <boost/asio/use_awaitable.hpp>

#include "spdlog/spdlog.h"

ConcurrencyGate::Permit& ConcurrencyGate::Permit::operator=(Permit&& other) noexcept {
    if (this != &other) {
        reset();
        gate_ = other.gate_;
        other.gate_ = nullptr;
    }
    return *this;
}

void ConcurrencyGate::Permit::reset() {
    if (gate_) {
        gate_->release();
        gate_ = nullptr;
    }
}

ConcurrencyGate::ConcurrencyGate(boost::asio::any_io_executor executor, std::size_t limit)
    : executor_(std::move(executor)), limit_(limit) {
    if (limit_ == 0) {
        throw std::invalid_argument("ConcurrencyGate limit must be > 0");
    }
}

boost::asio::awaitable<ConcurrencyGate::Permit> ConcurrencyGate::Acquire() {
    if (in_flight_ < limit_) {
        ++in_flight_;
        co_return Permit(this);
    }

    auto timer = std::make_shared<boost::asio::steady_timer>(
        executor_, boost::asio::steady_timer::time_point::max());
    waiters_.push_back(timer);
    spdlog::trace("[Gate] Full ({}/{}), {} waiting", in_flight_, limit_, waiters_.size());

    // Woken by cancel(); the slot was transferred by release().
    auto [ec] = co_await timer->async_wait(boost::asio::as_tuple(boost::asio::use_awaitable));
    if (ec && ec != boost::asio::error::operation_aborted) {
        throw boost::system::system_error(ec, "ConcurrencyGate wait");
    }
    co_return Permit(this);
}

void ConcurrencyGate::release() {
    if (!waiters_.empty()) {
        auto next = std::move(waiters_.front());
        waiters_.pop_front();
        next->cancel();
        return;
    }
    --in_flight_;
}
