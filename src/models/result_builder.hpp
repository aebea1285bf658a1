#pragma once

#include <boost/json.hpp>
#include <string>

#include "Orchestrator.hpp"

namespace ingest::models {
namespace json = boost::json;

class ResultBuilder {
   private:
    static json::object build_file(const FileResult& r) {
        json::object file;
        file["suffix"] = r.suffix;
        file["source_url"] = r.source_url;
        file["status"] = r.ok() ? "success" : "error";
        if (r.ok()) {
            file["s3_key"] = r.destination_key;
            file["size_bytes"] = r.bytes;
            file["parts"] = r.parts;
        } else {
            file["error"] = r.error;
            file["bytes_transferred"] = r.bytes;
        }
        file["elapsed_seconds"] = r.elapsed_seconds;
        return file;
    }

   public:
    // HTTP-style status for callers that expect one.
    static unsigned status_code(IngestStatus status) {
        switch (status) {
            case IngestStatus::Success:
                return 200;
            case IngestStatus::EmptyInput:
                return 400;
            default:
                return 500;
        }
    }

    static json::object build_result(const IngestResult& result) {
        json::object out;
        out["status"] = std::string(to_string(result.status));
        out["status_code"] = status_code(result.status);
        out["message"] = result.message;
        out["request_id"] = result.request_id;

        json::object summary;
        summary["total_files"] = result.summary.total_files;
        summary["successful"] = result.summary.successful;
        summary["failed"] = result.summary.failed;
        summary["total_bytes"] = result.summary.total_bytes;
        summary["elapsed_seconds"] = result.summary.elapsed_seconds;
        out["summary"] = std::move(summary);

        json::array files;
        for (const auto& r : result.results) {
            files.push_back(build_file(r));
        }
        out["results"] = std::move(files);

        json::object counters;
        for (const auto& [name, value] : result.counters) {
            counters[name] = value;
        }
        out["counters"] = std::move(counters);
        return out;
    }

    static std::string serialize(const IngestResult& result) {
        return json::serialize(build_result(result));
    }
};

}  // namespace ingest::models
