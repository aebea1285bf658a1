#include "TransferEngine.hpp"

#include <algorithm>
#include <exception>
#include <vector>

#include <boost/asio/post.hpp>
#include <boost/asio/use_awaitable.hpp>

#include "HttpSource.hpp"
#include "UtcTime.hpp"
#include "spdlog/spdlog.h"
#include "types.hpp"

// Floor for elapsed time in throughput figures.
static constexpr double MIN_ELAPSED_SECONDS = 1e-6;

static double throughput_mb_per_s(uint64_t bytes, double seconds) {
    return static_cast<double>(bytes) / static_cast<double>(MEGABYTE) /
           std::max(seconds, MIN_ELAPSED_SECONDS);
}

TransferEngine::TransferEngine(TransferContext& ctx, TransferTask& task)
    : ctx_(ctx), task_(task), buffer_(ctx.part_size) {}

ObjectMetadata TransferEngine::make_metadata() const {
    ObjectMetadata metadata;
    metadata.source_url = task_.source_url;
    metadata.ingestion_time = utc::FormatIso8601(ingestion_time_);
    metadata.original_suffix = task_.suffix;
    metadata.content_type = ctx_.content_type;
    return metadata;
}

void TransferEngine::emit(std::string name, spdlog::level::level_enum severity,
                          json::object fields) {
    TransferEvent event;
    event.name = std::move(name);
    event.severity = severity;
    event.request_id = ctx_.request_id;
    event.source_url = task_.source_url;
    event.destination_key = task_.destination_key;
    event.bytes = task_.bytes_transferred;
    event.parts = task_.part_count;
    event.fields = std::move(fields);
    ctx_.observer.OnEvent(event);
}

asio::awaitable<void> TransferEngine::Run() {
    const auto started = std::chrono::steady_clock::now();
    std::optional<std::string> failure;

    try {
        // 1. Admission: held until the transfer (and any abort) is over
        auto permit = co_await ctx_.gate.Acquire();
        emit("transfer_started", spdlog::level::info,
             {{"in_flight", ctx_.gate.in_flight()}, {"limit", ctx_.gate.limit()}});

        try {
            co_await transfer();
        } catch (const std::exception& e) {
            failure = e.what();
        }

        if (failure) {
            task_.status = TransferStatus::Error;
            task_.error = failure->empty() ? "unknown error" : *failure;
            if (session_ && !session_->terminal() && !abort_attempted_) {
                co_await abort_quietly(task_.error);
            }
        }
    } catch (const std::exception& e) {
        // Gate or telemetry failure outside the transfer proper
        task_.status = TransferStatus::Error;
        task_.error = e.what();
        failure = task_.error;
    }

    task_.elapsed = std::chrono::steady_clock::now() - started;
    const double seconds = std::chrono::duration<double>(task_.elapsed).count();

    if (failure) {
        spdlog::error("[Transfer] {} failed: {}", task_.source_url, task_.error);
        emit("transfer_failed", spdlog::level::err,
             {{"error", task_.error}, {"elapsed_s", seconds}});
    } else {
        spdlog::info("[Transfer] {} -> {} ({} bytes, {} parts, {:.2f} MB/s)", task_.source_url,
                     task_.destination_key, task_.bytes_transferred, task_.part_count,
                     throughput_mb_per_s(task_.bytes_transferred, seconds));
        emit("transfer_completed", spdlog::level::info,
             {{"elapsed_s", seconds},
              {"throughput_mbps", throughput_mb_per_s(task_.bytes_transferred, seconds)}});
    }
}

asio::awaitable<void> TransferEngine::transfer() {
    // 2. Streaming GET
    task_.status = TransferStatus::Downloading;
    ingestion_time_ = std::chrono::system_clock::now();

    HttpSource source(ctx_.executor, ctx_.tls, ctx_.read_timeout);
    task_.content_length = co_await source.Open(task_.source_url);

    // 3. Declared length, progress only
    json::object opened{{"final_url", source.final_url()}};
    if (task_.content_length) {
        opened["content_length"] = *task_.content_length;
    }
    emit("download_opened", spdlog::level::info, std::move(opened));

    // 4. Session before any byte
    const ObjectMetadata metadata = make_metadata();
    session_ = co_await ctx_.coordinator.Create(task_.destination_key, metadata);
    emit("session_created", spdlog::level::info, {{"upload_id", session_->upload_id}});

    // 5. Chunks -> buffer -> parts
    std::vector<uint8_t> chunk(READ_CHUNK_SIZE);
    for (;;) {
        std::size_t n = co_await source.ReadSome(chunk);
        if (n == 0) break;

        buffer_.Append({chunk.data(), n});
        task_.bytes_transferred += n;

        if (buffer_.size() >= ctx_.part_size) {
            co_await flush_part();
        }
    }
    source.Close();
    emit("download_finished", spdlog::level::info);

    // 6. Finalize
    if (task_.bytes_transferred == 0) {
        emit("empty_source", spdlog::level::warn);
        co_await abort_quietly("empty source");
        co_await ctx_.coordinator.PutEmpty(task_.destination_key, metadata);
        task_.status = TransferStatus::Completed;
        co_return;
    }

    if (!buffer_.empty()) {
        co_await flush_part();  // final part, may be under the threshold
    }

    task_.status = TransferStatus::Uploading;
    co_await ctx_.coordinator.Complete(*session_);
    emit("session_completed", spdlog::level::info, {{"upload_id", session_->upload_id}});
    task_.status = TransferStatus::Completed;
}

asio::awaitable<void> TransferEngine::flush_part() {
    std::vector<uint8_t> data = buffer_.Extract();
    const uint32_t number = next_part_++;
    const uint64_t size = data.size();
    task_.status = TransferStatus::Uploading;

    // Let sibling transfers run before this one occupies a worker
    co_await asio::post(ctx_.executor, asio::use_awaitable);

    const auto t0 = std::chrono::steady_clock::now();
    co_await ctx_.coordinator.UploadPart(*session_, number, std::move(data));
    const double seconds =
        std::chrono::duration<double>(std::chrono::steady_clock::now() - t0).count();

    task_.part_count = number;

    json::object fields{{"part_number", number},
                        {"part_bytes", size},
                        {"elapsed_s", seconds},
                        {"throughput_mbps", throughput_mb_per_s(size, seconds)}};
    if (task_.content_length && *task_.content_length > 0) {
        fields["progress_pct"] = 100.0 * static_cast<double>(task_.bytes_transferred) /
                                 static_cast<double>(*task_.content_length);
    }
    emit("part_uploaded", spdlog::level::info, std::move(fields));

    task_.status = TransferStatus::Downloading;
}

asio::awaitable<void> TransferEngine::abort_quietly(const std::string& reason) {
    abort_attempted_ = true;
    std::optional<std::string> abort_error;
    try {
        co_await ctx_.coordinator.Abort(*session_);
    } catch (const std::exception& e) {
        abort_error = e.what();
    }

    if (abort_error) {
        spdlog::warn("[Transfer] Abort of upload {} for {} failed: {}", session_->upload_id,
                     task_.destination_key, *abort_error);
        emit("abort_failed", spdlog::level::warn,
             {{"upload_id", session_->upload_id}, {"error", *abort_error}});
        co_return;
    }
    emit("session_aborted", spdlog::level::warn,
         {{"upload_id", session_->upload_id}, {"reason", reason}});
}
