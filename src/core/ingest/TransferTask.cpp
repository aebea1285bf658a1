#include "TransferTask.hpp"

std::string_view to_string(TransferStatus status) {
    switch (status) {
        case TransferStatus::Pending:
            return "pending";
        case TransferStatus::Downloading:
            return "downloading";
        case TransferStatus::Uploading:
            return "uploading";
        case TransferStatus::Completed:
            return "completed";
        case TransferStatus::Error:
            return "error";
    }
    return "unknown";
}

std::string_view to_string(UploadState state) {
    switch (state) {
        case UploadState::Open:
            return "open";
        case UploadState::Completing:
            return "completing";
        case UploadState::Completed:
            return "completed";
        case UploadState::Aborted:
            return "aborted";
    }
    return "unknown";
}

FileResult FileResult::From(const TransferTask& task) {
    FileResult r;
    r.source_url = task.source_url;
    r.suffix = task.suffix;
    r.destination_key = task.destination_key;
    r.status = task.status;
    r.bytes = task.bytes_transferred;
    r.parts = task.part_count;
    r.error = task.error;
    r.elapsed_seconds = std::chrono::duration<double>(task.elapsed).count();
    return r;
}
