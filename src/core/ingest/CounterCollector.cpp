#include "CounterCollector.hpp"

#include <stdexcept>

void CounterCollector::Increment(std::string_view name, uint64_t amount) {
    if (name.empty() || name == kTotal) {
        throw std::invalid_argument("invalid counter name: '" + std::string(name) + "'");
    }

    std::lock_guard<std::mutex> lock(mutex_);
    auto it = counters_.find(name);
    if (it == counters_.end()) {
        it = counters_.emplace(std::string(name), 0).first;
    }
    it->second += amount;
    counters_.find(kTotal)->second += amount;
}

uint64_t CounterCollector::Get(std::string_view name) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = counters_.find(name);
    return it == counters_.end() ? 0 : it->second;
}

CounterCollector::Snapshot CounterCollector::TakeSnapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return counters_;
}
