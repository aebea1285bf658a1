#pragma once
#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "IObjectStore.hpp"

enum class TransferStatus { Pending, Downloading, Uploading, Completed, Error };

std::string_view to_string(TransferStatus status);

/**
 * @brief Per-URL unit of work.
 * Created by the Orchestrator, mutated only by the TransferEngine that runs it.
 */
struct TransferTask {
    size_t index = 0;  // position in the input list
    std::string source_url;
    std::string suffix;
    std::string destination_key;

    TransferStatus status = TransferStatus::Pending;
    uint64_t bytes_transferred = 0;
    uint32_t part_count = 0;
    std::optional<uint64_t> content_length;
    std::string error;
    std::chrono::steady_clock::duration elapsed{};

    bool terminal() const {
        return status == TransferStatus::Completed || status == TransferStatus::Error;
    }
};

enum class UploadState { Open, Completing, Completed, Aborted };

std::string_view to_string(UploadState state);

struct UploadSession {
    std::string upload_id;
    std::string key;
    std::vector<Part> parts;
    UploadState state = UploadState::Open;

    bool terminal() const {
        return state == UploadState::Completed || state == UploadState::Aborted;
    }
};

// Terminal snapshot of a TransferTask, as reported in the summary.
struct FileResult {
    std::string source_url;
    std::string suffix;
    std::string destination_key;
    TransferStatus status = TransferStatus::Pending;
    uint64_t bytes = 0;
    uint32_t parts = 0;
    std::string error;
    double elapsed_seconds = 0.0;

    bool ok() const { return status == TransferStatus::Completed; }

    static FileResult From(const TransferTask& task);
};
