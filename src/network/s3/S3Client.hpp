#pragma once

#include <boost/asio/ssl/context.hpp>
#include <memory>
#include <string>
#include <vector>

#include "IObjectStore.hpp"
#include "S3Session.hpp"
#include "config.hpp"

/**
 * @brief S3 REST implementation of IObjectStore.
 *
 * @details
 * **Role:**
 * Stores the immutable S3 configuration (endpoint, bucket, region) loaded at
 * startup and spawns a short-lived `S3Session` per remote call.
 *
 * **Thread Safety:**
 * Configuration is read-only after construction and every call uses its own
 * session, so the client may be shared across worker threads.
 */
class S3Client : public IObjectStore {
   public:
    explicit S3Client(S3Config cfg);

    std::string CreateMultipartUpload(const std::string& key,
                                      const ObjectMetadata& metadata) override;

    std::string UploadPart(const std::string& key, const std::string& upload_id,
                           uint32_t part_number, std::vector<uint8_t> data) override;

    void CompleteMultipartUpload(const std::string& key, const std::string& upload_id,
                                 const std::vector<Part>& parts) override;

    void AbortMultipartUpload(const std::string& key, const std::string& upload_id) override;

    void PutObject(const std::string& key, std::vector<uint8_t> data,
                   const ObjectMetadata& metadata) override;

    const S3Config& config() const { return cfg_; }

   private:
    std::unique_ptr<S3Session> CreateSession();

    S3Session::response_t execute(S3RequestFactory::request_t& req, const char* operation);

    S3Config cfg_;
    std::unique_ptr<boost::asio::ssl::context> tls_;
};
