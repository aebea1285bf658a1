#pragma once
#include <cstdint>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include <boost/asio/io_context.hpp>
#include <boost/asio/ssl/context.hpp>

#include "CounterCollector.hpp"
#include "IObjectStore.hpp"
#include "ITransferObserver.hpp"
#include "TransferTask.hpp"
#include "WorkerPool.hpp"
#include "config.hpp"

enum class IngestStatus { Success, ConfigurationFailure, EmptyInput, OrchestrationFailure };

std::string_view to_string(IngestStatus status);

struct IngestSummary {
    std::size_t total_files = 0;
    std::size_t successful = 0;
    std::size_t failed = 0;
    uint64_t total_bytes = 0;
    double elapsed_seconds = 0.0;
};

struct IngestResult {
    IngestStatus status = IngestStatus::Success;
    std::string message;
    std::string request_id;
    IngestSummary summary;
    std::vector<FileResult> results;  // input order
    CounterCollector::Snapshot counters;
};

/**
 * @brief Runs one ingestion: one TransferEngine per URL behind a shared gate.
 *
 * @details
 * **Role:**
 * Validates the configuration, resolves every destination key, spawns the
 * transfers on the I/O context and drives it until each one is terminal.
 * A failing transfer never cancels its siblings.
 *
 * **Threading:**
 * `Run` blocks the calling thread while it drives @p ioc, which must not be
 * running elsewhere. Store calls happen on @p workers.
 */
class Orchestrator {
   public:
    Orchestrator(boost::asio::io_context& ioc, std::shared_ptr<IObjectStore> store,
                 WorkerPool& workers, CounterCollector& counters, ITransferObserver& observer,
                 AppConfig config);

    IngestResult Run(const std::vector<std::string>& urls);

    // Verification settings for HTTPS sources.
    boost::asio::ssl::context& tls_context() { return tls_; }

   private:
    IngestResult finish(IngestResult result,
                        std::chrono::steady_clock::time_point started) const;

    boost::asio::io_context& ioc_;
    std::shared_ptr<IObjectStore> store_;
    WorkerPool& workers_;
    CounterCollector& counters_;
    ITransferObserver& observer_;
    AppConfig config_;
    boost::asio::ssl::context tls_;
};
