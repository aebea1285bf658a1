#ifndef WORKER_POOL_HPP
#define WORKER_POOL_HPP

#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>
#include <cstddef>
#include <thread>
#include <vector>

/**
 * @brief Threads servicing one shared io_context, used for blocking calls.
 *
 * Blocking work is posted here so the single-threaded I/O scheduler never
 * stalls on it. Threads start on construction and are joined on destruction.
 */
class WorkerPool {
   public:
    explicit WorkerPool(std::size_t pool_size);

    // Stops the io_context and joins all threads.
    ~WorkerPool();

    // Disable copying
    WorkerPool(const WorkerPool&) = delete;
    WorkerPool& operator=(const WorkerPool&) = delete;

    boost::asio::any_io_executor get_executor() { return ioc_.get_executor(); }

    std::size_t size() const { return threads_.size(); }

    // Lets queued work drain, then joins.
    void stop();

   private:
    boost::asio::io_context ioc_;

    using work_guard_type = boost::asio::executor_work_guard<boost::asio::io_context::executor_type>;
    work_guard_type work_guard_;

    std::vector<std::jthread> threads_;
};
#endif
