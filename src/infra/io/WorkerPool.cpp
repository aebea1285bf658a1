#include "WorkerPool.hpp"

#include <stdexcept>

#include "spdlog/spdlog.h"

WorkerPool::WorkerPool(std::size_t pool_size) : work_guard_(boost::asio::make_work_guard(ioc_)) {
    if (pool_size == 0) {
        throw std::runtime_error("WorkerPool size must be > 0");
    }

    spdlog::info("Starting worker pool with {} threads.", pool_size);

    for (std::size_t i = 0; i < pool_size; ++i) {
        threads_.emplace_back([this]() {
            try {
                ioc_.run();
            } catch (const std::exception& e) {
                spdlog::critical("worker thread exception: {}", e.what());
            }
        });
    }
}

WorkerPool::~WorkerPool() { stop(); }

void WorkerPool::stop() {
    work_guard_.reset();
    for (auto& t : threads_) {
        if (t.joinable()) {
            t.join();
        }
    }
}
