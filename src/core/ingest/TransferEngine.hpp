#pragma once
#include <chrono>
#include <optional>
#include <string>

#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/awaitable.hpp>
#include <boost/asio/ssl/context.hpp>
#include <boost/json/object.hpp>
#include <spdlog/common.h>

#include "ConcurrencyGate.hpp"
#include "ITransferObserver.hpp"
#include "MultipartUploadCoordinator.hpp"
#include "PartBuffer.hpp"
#include "TransferTask.hpp"

/**
 * @brief Collaborators and settings shared by every transfer of one run.
 */
struct TransferContext {
    boost::asio::any_io_executor executor;
    ConcurrencyGate& gate;
    MultipartUploadCoordinator& coordinator;
    ITransferObserver& observer;
    boost::asio::ssl::context& tls;
    std::size_t part_size;
    std::chrono::milliseconds read_timeout;
    std::string content_type;
    std::string request_id;
};

/**
 * @brief Streams one source URL into one multipart upload.
 *
 * @details
 * Idle -> Downloading -> (PartReady -> Uploading)* -> Finalizing ->
 * Completed | Aborted | Failed.
 *
 * The upload session is opened as soon as the response headers arrive,
 * before any body byte, so that an empty source still has a session to abort.
 * A source that produced no bytes is stored with a single zero-length put,
 * since a multipart upload cannot complete without parts.
 *
 * `Run` never throws a std::exception: any failure aborts the session (once,
 * best-effort) and is recorded in the task.
 */
class TransferEngine {
   public:
    TransferEngine(TransferContext& ctx, TransferTask& task);

    TransferEngine(const TransferEngine&) = delete;
    TransferEngine& operator=(const TransferEngine&) = delete;

    boost::asio::awaitable<void> Run();

   private:
    boost::asio::awaitable<void> transfer();
    boost::asio::awaitable<void> flush_part();
    boost::asio::awaitable<void> abort_quietly(const std::string& reason);

    ObjectMetadata make_metadata() const;

    void emit(std::string name, spdlog::level::level_enum severity,
              boost::json::object fields = {});

    TransferContext& ctx_;
    TransferTask& task_;
    PartBuffer buffer_;
    std::optional<UploadSession> session_;
    bool abort_attempted_ = false;
    uint32_t next_part_ = 1;
    std::chrono::system_clock::time_point ingestion_time_;
};
