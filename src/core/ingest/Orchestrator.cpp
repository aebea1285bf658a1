#include "Orchestrator.hpp"

#include <exception>
#include <stdexcept>

#include <boost/asio/co_spawn.hpp>
#include <boost/uuid/uuid.hpp>
#include <boost/uuid/uuid_generators.hpp>
#include <boost/uuid/uuid_io.hpp>

#include "ConcurrencyGate.hpp"
#include "DestinationKeyResolver.hpp"
#include "MultipartUploadCoordinator.hpp"
#include "TransferEngine.hpp"
#include "spdlog/spdlog.h"
#include "types.hpp"

std::string_view to_string(IngestStatus status) {
    switch (status) {
        case IngestStatus::Success:
            return "success";
        case IngestStatus::ConfigurationFailure:
            return "configuration_failure";
        case IngestStatus::EmptyInput:
            return "empty_input";
        case IngestStatus::OrchestrationFailure:
            return "orchestration_failure";
    }
    return "unknown";
}

Orchestrator::Orchestrator(asio::io_context& ioc, std::shared_ptr<IObjectStore> store,
                           WorkerPool& workers, CounterCollector& counters,
                           ITransferObserver& observer, AppConfig config)
    : ioc_(ioc),
      store_(std::move(store)),
      workers_(workers),
      counters_(counters),
      observer_(observer),
      config_(std::move(config)),
      tls_(ssl::context::tls_client) {
    tls_.set_default_verify_paths();
    tls_.set_verify_mode(ssl::verify_peer);
}

IngestResult Orchestrator::finish(IngestResult result,
                                  std::chrono::steady_clock::time_point started) const {
    auto& summary = result.summary;
    summary.total_files = result.results.size();
    for (const auto& r : result.results) {
        if (r.ok()) {
            ++summary.successful;
            summary.total_bytes += r.bytes;
        } else {
            ++summary.failed;
        }
    }
    summary.elapsed_seconds =
        std::chrono::duration<double>(std::chrono::steady_clock::now() - started).count();
    result.counters = counters_.TakeSnapshot();
    return result;
}

IngestResult Orchestrator::Run(const std::vector<std::string>& urls) {
    const auto started = std::chrono::steady_clock::now();

    IngestResult result;
    boost::uuids::random_generator generator;
    result.request_id = boost::uuids::to_string(generator());

    // 1. Configuration checks, before anything is launched
    if (config_.s3.bucket.empty()) {
        result.status = IngestStatus::ConfigurationFailure;
        result.message = "BUCKET_NAME environment variable not set";
        spdlog::error("[Ingest] {}", result.message);
        return finish(std::move(result), started);
    }
    if (urls.empty()) {
        result.status = IngestStatus::EmptyInput;
        result.message = "No file_urls found in parameters";
        spdlog::error("[Ingest] {}", result.message);
        return finish(std::move(result), started);
    }

    const auto& ingest = config_.ingest;
    DestinationKeyResolver resolver(ingest.path_prefix,
                                    ingest.suffix_table.empty() ? DestinationKeyResolver::DefaultTable()
                                                                : ingest.suffix_table);

    // 2. One task per URL; one calendar day for the whole run
    const auto now = std::chrono::system_clock::now();
    std::vector<TransferTask> tasks(urls.size());
    for (std::size_t i = 0; i < urls.size(); ++i) {
        auto& task = tasks[i];
        task.index = i;
        task.source_url = urls[i];
        task.suffix = resolver.ResolveSuffix(urls[i]);
        task.destination_key = resolver.BuildKey(task.suffix, now);

        TransferEvent queued;
        queued.name = "transfer_queued";
        queued.request_id = result.request_id;
        queued.source_url = task.source_url;
        queued.destination_key = task.destination_key;
        queued.fields["index"] = i;
        observer_.OnEvent(queued);
    }

    spdlog::info("[Ingest] {} files, concurrency {}, part size {} bytes, bucket '{}'", urls.size(),
                 ingest.concurrency, ingest.part_size, config_.s3.bucket);

    // 3. Fan out
    ConcurrencyGate gate(ioc_.get_executor(), ingest.concurrency);
    MultipartUploadCoordinator coordinator(store_, workers_, counters_);
    TransferContext ctx{ioc_.get_executor(), gate,    coordinator,         observer_,
                        tls_,                ingest.part_size, ingest.read_timeout,
                        ingest.content_type, result.request_id};

    std::exception_ptr fatal;
    for (auto& task : tasks) {
        asio::co_spawn(
            ioc_,
            [&ctx, &task]() -> asio::awaitable<void> {
                TransferEngine engine(ctx, task);
                co_await engine.Run();
            },
            [&fatal, &task](std::exception_ptr ep) {
                if (ep) {
                    task.status = TransferStatus::Error;
                    task.error = "unhandled failure";
                    if (!fatal) fatal = ep;
                }
            });
    }

    // 4. Wait for every outcome
    ioc_.restart();
    ioc_.run();

    for (const auto& task : tasks) {
        result.results.push_back(FileResult::From(task));
    }

    if (fatal) {
        result.status = IngestStatus::OrchestrationFailure;
        try {
            std::rethrow_exception(fatal);
        } catch (const std::exception& e) {
            result.message = std::string("Ingestion failed: ") + e.what();
        }
        spdlog::critical("[Ingest] {}", result.message);
        return finish(std::move(result), started);
    }

    result = finish(std::move(result), started);
    result.message = "Data ingestion completed: " + std::to_string(result.summary.successful) +
                     " successful, " + std::to_string(result.summary.failed) + " failed";
    spdlog::info("[Ingest] {} in {:.2f}s ({} bytes)", result.message,
                 result.summary.elapsed_seconds, result.summary.total_bytes);
    return result;
}
