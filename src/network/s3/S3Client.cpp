#include "S3Client.hpp"

#include <boost/beast/http.hpp>

#include "S3RequestFactory.hpp"
#include "spdlog/spdlog.h"
#include "types.hpp"

S3Client::S3Client(S3Config cfg) : cfg_(std::move(cfg)) {
    if (cfg_.use_tls) {
        tls_ = std::make_unique<ssl::context>(ssl::context::tls_client);
        tls_->set_default_verify_paths();
        tls_->set_verify_mode(ssl::verify_peer);
    }
    spdlog::info("created S3Client for {} (bucket '{}', {})", S3RequestFactory::host_header(cfg_),
                 cfg_.bucket, S3RequestFactory::is_virtual_hosted(cfg_) ? "virtual-hosted" : "path-style");
}

std::unique_ptr<S3Session> S3Client::CreateSession() {
    spdlog::trace("creating session");
    return std::make_unique<S3Session>(cfg_, tls_.get());
}

S3Session::response_t S3Client::execute(S3RequestFactory::request_t& req, const char* operation) {
    auto session = CreateSession();
    auto res = session->Execute(req);

    // CompleteMultipartUpload may report failure inside a 200 response.
    auto error_code = S3RequestFactory::parse_xml_tag(res.body(), "Code");
    bool error_document = res.body().find("<Error>") != std::string::npos;

    if (res.result_int() / 100 != 2 || error_document) {
        std::string code = error_code.value_or("");
        std::string message = S3RequestFactory::parse_xml_tag(res.body(), "Message").value_or("");
        spdlog::error("[S3] {} failed [{}] {}: {}", operation, res.result_int(), code, message);
        throw S3Error(std::string(operation) + " failed with HTTP " +
                          std::to_string(res.result_int()) + (code.empty() ? "" : " (" + code + ")"),
                      res.result_int(), code);
    }
    return res;
}

std::string S3Client::CreateMultipartUpload(const std::string& key,
                                            const ObjectMetadata& metadata) {
    auto req = S3RequestFactory::create_multipart_request(cfg_, key, metadata);
    auto res = execute(req, "CreateMultipartUpload");

    auto upload_id = S3RequestFactory::parse_xml_tag(res.body(), "UploadId");
    if (!upload_id || upload_id->empty()) {
        throw S3Error("CreateMultipartUpload response does not contain <UploadId>",
                      res.result_int());
    }
    spdlog::debug("[S3] Upload {} of {} started", *upload_id, key);
    return *upload_id;
}

std::string S3Client::UploadPart(const std::string& key, const std::string& upload_id,
                                 uint32_t part_number, std::vector<uint8_t> data) {
    auto req = S3RequestFactory::upload_part_request(cfg_, key, upload_id, part_number,
                                                     std::move(data));
    auto res = execute(req, "UploadPart");

    auto it = res.find(http::field::etag);
    if (it == res.end()) {
        throw S3Error("UploadPart response is missing the ETag header", res.result_int());
    }
    return std::string(it->value());
}

void S3Client::CompleteMultipartUpload(const std::string& key, const std::string& upload_id,
                                       const std::vector<Part>& parts) {
    auto req = S3RequestFactory::complete_multipart_request(cfg_, key, upload_id, parts);
    execute(req, "CompleteMultipartUpload");
    spdlog::debug("[S3] Upload {} of {} completed, parts={}", upload_id, key, parts.size());
}

void S3Client::AbortMultipartUpload(const std::string& key, const std::string& upload_id) {
    auto req = S3RequestFactory::abort_multipart_request(cfg_, key, upload_id);
    execute(req, "AbortMultipartUpload");
    spdlog::debug("[S3] Upload {} of {} aborted", upload_id, key);
}

void S3Client::PutObject(const std::string& key, std::vector<uint8_t> data,
                         const ObjectMetadata& metadata) {
    auto req = S3RequestFactory::put_object_request(cfg_, key, std::move(data), metadata);
    execute(req, "PutObject");
}
