#pragma once
#include <cstdint>
#include <stdexcept>
#include <string>
#include <vector>

// One uploaded part, acknowledged by the store's ETag.
struct Part {
    uint32_t number = 0;  // >= 1
    std::string etag;
    uint64_t size = 0;
};

// Attached to every object the pipeline writes.
struct ObjectMetadata {
    std::string source_url;
    std::string ingestion_time;  // ISO-8601, UTC
    std::string original_suffix;
    std::string content_type = "text/csv";
};

/**
 * @brief Rejection reported by the object store.
 */
class S3Error : public std::runtime_error {
   public:
    S3Error(const std::string& what, unsigned status, std::string code = {})
        : std::runtime_error(what), status_(status), code_(std::move(code)) {}

    unsigned status() const { return status_; }
    const std::string& code() const { return code_; }

   private:
    unsigned status_;
    std::string code_;
};

/**
 * @brief Blocking object-store primitives used by the ingestion pipeline.
 *
 * @details
 * Every call is a synchronous remote round trip and may throw (S3Error or
 * boost::system::system_error). Implementations must tolerate concurrent
 * calls from several worker threads; nothing here retries.
 */
class IObjectStore {
   public:
    virtual ~IObjectStore() = default;

    // @return the upload id of the new multipart session.
    virtual std::string CreateMultipartUpload(const std::string& key,
                                              const ObjectMetadata& metadata) = 0;

    // @return the ETag acknowledging the part.
    virtual std::string UploadPart(const std::string& key, const std::string& upload_id,
                                   uint32_t part_number, std::vector<uint8_t> data) = 0;

    // @p parts must be sorted by number, starting at 1 without gaps.
    virtual void CompleteMultipartUpload(const std::string& key, const std::string& upload_id,
                                         const std::vector<Part>& parts) = 0;

    virtual void AbortMultipartUpload(const std::string& key, const std::string& upload_id) = 0;

    virtual void PutObject(const std::string& key, std::vector<uint8_t> data,
                           const ObjectMetadata& metadata) = 0;
};
