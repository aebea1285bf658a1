#pragma once
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include <boost/beast/http/message.hpp>
#include <boost/beast/http/vector_body.hpp>

#include "IObjectStore.hpp"
#include "config.hpp"

/**
 * @brief Builds the S3 REST requests of the multipart upload protocol.
 *
 * @details
 * Requests are unsigned. Addressing follows the endpoint:
 * - AWS S3 (Virtual-Hosted-Style): https://bucket.s3.region.amazonaws.com/key
 * - MinIO / Local (Path-Style):    http://localhost:9000/bucket/key
 */
namespace S3RequestFactory {

using request_t = boost::beast::http::request<boost::beast::http::vector_body<uint8_t>>;

bool is_virtual_hosted(const S3Config& cfg);

// Host to connect to and to send in the Host header (port included if non-default).
std::string connect_host(const S3Config& cfg);
std::string host_header(const S3Config& cfg);
std::string connect_port(const S3Config& cfg);

// Percent-encoded "path?query" for an object key.
std::string object_target(const S3Config& cfg, const std::string& key,
                          std::string_view encoded_query = {});

request_t create_multipart_request(const S3Config& cfg, const std::string& key,
                                   const ObjectMetadata& metadata);

request_t upload_part_request(const S3Config& cfg, const std::string& key,
                              const std::string& upload_id, uint32_t part_number,
                              std::vector<uint8_t> data);

request_t complete_multipart_request(const S3Config& cfg, const std::string& key,
                                     const std::string& upload_id, const std::vector<Part>& parts);

request_t abort_multipart_request(const S3Config& cfg, const std::string& key,
                                  const std::string& upload_id);

request_t put_object_request(const S3Config& cfg, const std::string& key,
                             std::vector<uint8_t> data, const ObjectMetadata& metadata);

// CompleteMultipartUpload XML document for @p parts, in the given order.
std::string build_complete_body(const std::vector<Part>& parts);

// Text of the first <name>...</name> element, if any.
std::optional<std::string> parse_xml_tag(std::string_view xml, std::string_view name);

// Base64 MD5 digest, as expected in the Content-MD5 header.
std::string content_md5(std::span<const uint8_t> data);

}  // namespace S3RequestFactory
