#pragma once
#include <memory>
#include <string>
#include <type_traits>
#include <utility>
#include <vector>

#include <boost/asio/awaitable.hpp>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/use_awaitable.hpp>

#include "CounterCollector.hpp"
#include "IObjectStore.hpp"
#include "TransferTask.hpp"
#include "WorkerPool.hpp"

/**
 * @brief Awaitable front-end for the multipart primitives of an IObjectStore.
 *
 * @details
 * Each primitive is a blocking remote call: it is counted on the calling
 * coroutine (one increment per attempt, before the call), run on the worker
 * pool, and the caller resumes on its own executor when it finishes. There is
 * no retry.
 *
 * Session state is enforced here: Complete only from Open, Abort from Open or
 * Completing. An UploadSession is owned by one coroutine and must not be
 * shared.
 */
class MultipartUploadCoordinator {
   public:
    MultipartUploadCoordinator(std::shared_ptr<IObjectStore> store, WorkerPool& pool,
                               CounterCollector& counters);

    boost::asio::awaitable<UploadSession> Create(const std::string& key,
                                                 const ObjectMetadata& metadata);

    /**
     * @brief Uploads one part and records it on the session.
     * @throws std::logic_error if the session is not open or @p part_number is 0.
     */
    boost::asio::awaitable<Part> UploadPart(UploadSession& session, uint32_t part_number,
                                            std::vector<uint8_t> data);

    /**
     * @brief Completes the session with its parts sorted by number.
     * @throws std::logic_error on an empty part list, a numbering gap, or a
     * session that is not open. The store is not called in that case.
     */
    boost::asio::awaitable<void> Complete(UploadSession& session);

    // No-op for an already aborted session.
    boost::asio::awaitable<void> Abort(UploadSession& session);

    // Single zero-length write, used instead of completing an empty session.
    boost::asio::awaitable<void> PutEmpty(const std::string& key, const ObjectMetadata& metadata);

   private:
    template <typename Fn>
    auto offload(Fn fn) -> boost::asio::awaitable<std::invoke_result_t<Fn&>> {
        using result_t = std::invoke_result_t<Fn&>;
        co_return co_await boost::asio::co_spawn(
            pool_.get_executor(),
            [fn = std::move(fn)]() mutable -> boost::asio::awaitable<result_t> {
                if constexpr (std::is_void_v<result_t>) {
                    fn();
                    co_return;
                } else {
                    co_return fn();
                }
            },
            boost::asio::use_awaitable);
    }

    std::shared_ptr<IObjectStore> store_;
    WorkerPool& pool_;
    CounterCollector& counters_;
};
