#include "MultipartUploadCoordinator.hpp"

#include <algorithm>
#include <stdexcept>

#include "spdlog/spdlog.h"

MultipartUploadCoordinator::MultipartUploadCoordinator(std::shared_ptr<IObjectStore> store,
                                                       WorkerPool& pool,
                                                       CounterCollector& counters)
    : store_(std::move(store)), pool_(pool), counters_(counters) {
    if (!store_) {
        throw std::invalid_argument("MultipartUploadCoordinator: store is null");
    }
}

boost::asio::awaitable<UploadSession> MultipartUploadCoordinator::Create(
    const std::string& key, const ObjectMetadata& metadata) {
    counters_.Increment(CounterCollector::kCreateMultipart);

    UploadSession session;
    session.key = key;
    session.upload_id = co_await offload(
        [store = store_, key, metadata]() { return store->CreateMultipartUpload(key, metadata); });
    co_return session;
}

boost::asio::awaitable<Part> MultipartUploadCoordinator::UploadPart(UploadSession& session,
                                                                    uint32_t part_number,
                                                                    std::vector<uint8_t> data) {
    if (session.state != UploadState::Open) {
        throw std::logic_error("UploadPart on a " + std::string(to_string(session.state)) +
                               " session");
    }
    if (part_number == 0) {
        throw std::logic_error("part numbers start at 1");
    }
    counters_.Increment(CounterCollector::kUploadPart);

    Part part;
    part.number = part_number;
    part.size = data.size();
    part.etag = co_await offload([store = store_, key = session.key, id = session.upload_id,
                                  part_number, data = std::move(data)]() mutable {
        return store->UploadPart(key, id, part_number, std::move(data));
    });

    session.parts.push_back(part);
    co_return part;
}

boost::asio::awaitable<void> MultipartUploadCoordinator::Complete(UploadSession& session) {
    if (session.state != UploadState::Open) {
        throw std::logic_error("Complete on a " + std::string(to_string(session.state)) +
                               " session");
    }

    std::vector<Part> parts = session.parts;
    std::sort(parts.begin(), parts.end(),
              [](const Part& a, const Part& b) { return a.number < b.number; });

    if (parts.empty()) {
        throw std::logic_error("cannot complete a multipart upload without parts");
    }
    for (std::size_t i = 0; i < parts.size(); ++i) {
        if (parts[i].number != i + 1) {
            throw std::logic_error("part numbering gap before part " +
                                   std::to_string(parts[i].number));
        }
    }

    session.state = UploadState::Completing;
    counters_.Increment(CounterCollector::kCompleteMultipart);

    co_await offload([store = store_, key = session.key, id = session.upload_id,
                      parts = std::move(parts)]() {
        store->CompleteMultipartUpload(key, id, parts);
    });
    session.state = UploadState::Completed;
}

boost::asio::awaitable<void> MultipartUploadCoordinator::Abort(UploadSession& session) {
    if (session.state == UploadState::Aborted) {
        co_return;
    }
    if (session.state == UploadState::Completed) {
        throw std::logic_error("Abort on a completed session");
    }
    counters_.Increment(CounterCollector::kAbortMultipart);

    co_await offload([store = store_, key = session.key, id = session.upload_id]() {
        store->AbortMultipartUpload(key, id);
    });
    session.state = UploadState::Aborted;
}

boost::asio::awaitable<void> MultipartUploadCoordinator::PutEmpty(const std::string& key,
                                                                  const ObjectMetadata& metadata) {
    counters_.Increment(CounterCollector::kPutObject);

    co_await offload([store = store_, key, metadata]() {
        store->PutObject(key, std::vector<uint8_t>{}, metadata);
    });
    spdlog::debug("[S3] Wrote empty object {}", key);
}
