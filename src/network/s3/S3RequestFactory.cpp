#include "S3RequestFactory.hpp"

#include <openssl/evp.h>

#include <array>
#include <stdexcept>

#include <boost/beast/http.hpp>
#include <boost/url/encode.hpp>
#include <boost/url/rfc/pchars.hpp>
#include <boost/url/rfc/unreserved_chars.hpp>

#include "types.hpp"

namespace S3RequestFactory {

namespace {

constexpr int HTTP_VERSION = 11;

// Encodes each '/'-separated segment of a key, keeping the separators.
std::string encode_key_path(std::string_view path) {
    std::string out;
    std::size_t start = 0;
    while (true) {
        auto slash = path.find('/', start);
        auto segment = path.substr(start, slash == std::string_view::npos ? std::string_view::npos
                                                                          : slash - start);
        out += boost::urls::encode(segment, boost::urls::pchars);
        if (slash == std::string_view::npos) break;
        out += '/';
        start = slash + 1;
    }
    return out;
}

std::string encode_query_value(std::string_view value) {
    return boost::urls::encode(value, boost::urls::unreserved_chars);
}

request_t make_request(const S3Config& cfg, http::verb method, std::string target) {
    request_t req{method, target, HTTP_VERSION};
    req.set(http::field::host, host_header(cfg));
    req.set(http::field::user_agent, "hermes-ingest");
    return req;
}

void set_metadata(request_t& req, const ObjectMetadata& metadata) {
    if (!metadata.content_type.empty()) {
        req.set(http::field::content_type, metadata.content_type);
    }
    req.set("x-amz-meta-source-url", metadata.source_url);
    req.set("x-amz-meta-ingestion-time", metadata.ingestion_time);
    if (!metadata.original_suffix.empty()) {
        req.set("x-amz-meta-original-suffix", metadata.original_suffix);
    }
}

}  // namespace

bool is_virtual_hosted(const S3Config& cfg) {
    return !cfg.path_style || cfg.host.find("amazonaws.com") != std::string::npos;
}

std::string connect_host(const S3Config& cfg) {
    if (cfg.host.find("amazonaws.com") != std::string::npos) {
        return cfg.bucket + ".s3." + cfg.region + ".amazonaws.com";
    }
    if (!cfg.path_style) {
        return cfg.bucket + "." + cfg.host;
    }
    return cfg.host;
}

std::string connect_port(const S3Config& cfg) {
    if (!cfg.port.empty()) return cfg.port;
    return cfg.use_tls ? "443" : "80";
}

std::string host_header(const S3Config& cfg) {
    std::string host = connect_host(cfg);
    const std::string port = connect_port(cfg);
    if (port != "80" && port != "443") {
        host += ":" + port;
    }
    return host;
}

std::string object_target(const S3Config& cfg, const std::string& key,
                          std::string_view encoded_query) {
    std::string target = "/";
    if (!is_virtual_hosted(cfg)) {
        target += encode_key_path(cfg.bucket);
        target += '/';
    }
    target += encode_key_path(key);
    if (!encoded_query.empty()) {
        target += '?';
        target += encoded_query;
    }
    return target;
}

request_t create_multipart_request(const S3Config& cfg, const std::string& key,
                                   const ObjectMetadata& metadata) {
    // CreateMultipartUpload: POST /key?uploads
    auto req = make_request(cfg, http::verb::post, object_target(cfg, key, "uploads"));
    set_metadata(req, metadata);
    req.prepare_payload();
    return req;
}

request_t upload_part_request(const S3Config& cfg, const std::string& key,
                              const std::string& upload_id, uint32_t part_number,
                              std::vector<uint8_t> data) {
    // UploadPart: PUT /key?partNumber=N&uploadId=ID
    if (part_number == 0) {
        throw std::invalid_argument("part numbers start at 1");
    }
    std::string query = "partNumber=" + std::to_string(part_number) +
                        "&uploadId=" + encode_query_value(upload_id);
    auto req = make_request(cfg, http::verb::put, object_target(cfg, key, query));
    req.set("Content-MD5", content_md5(data));
    req.body() = std::move(data);
    req.prepare_payload();
    return req;
}

request_t complete_multipart_request(const S3Config& cfg, const std::string& key,
                                     const std::string& upload_id,
                                     const std::vector<Part>& parts) {
    // CompleteMultipartUpload: POST /key?uploadId=ID
    std::string query = "uploadId=" + encode_query_value(upload_id);
    auto req = make_request(cfg, http::verb::post, object_target(cfg, key, query));
    req.set(http::field::content_type, "application/xml");
    std::string xml = build_complete_body(parts);
    req.body().assign(xml.begin(), xml.end());
    req.prepare_payload();
    return req;
}

request_t abort_multipart_request(const S3Config& cfg, const std::string& key,
                                  const std::string& upload_id) {
    // AbortMultipartUpload: DELETE /key?uploadId=ID
    std::string query = "uploadId=" + encode_query_value(upload_id);
    auto req = make_request(cfg, http::verb::delete_, object_target(cfg, key, query));
    req.prepare_payload();
    return req;
}

request_t put_object_request(const S3Config& cfg, const std::string& key,
                             std::vector<uint8_t> data, const ObjectMetadata& metadata) {
    auto req = make_request(cfg, http::verb::put, object_target(cfg, key));
    set_metadata(req, metadata);
    req.set("Content-MD5", content_md5(data));
    req.body() = std::move(data);
    req.prepare_payload();
    // prepare_payload() omits the header for an empty PUT body
    req.content_length(req.body().size());
    return req;
}

std::string build_complete_body(const std::vector<Part>& parts) {
    std::string xml = "<?xml version=\"1.0\" encoding=\"UTF-8\"?>\r\n";
    xml += "<CompleteMultipartUpload xmlns=\"http://s3.amazonaws.com/doc/2006-03-01/\">";
    for (const auto& part : parts) {
        xml += "<Part><PartNumber>";
        xml += std::to_string(part.number);
        xml += "</PartNumber><ETag>";
        xml += part.etag;
        xml += "</ETag></Part>";
    }
    xml += "</CompleteMultipartUpload>";
    return xml;
}

std::optional<std::string> parse_xml_tag(std::string_view xml, std::string_view name) {
    const std::string open = "<" + std::string(name) + ">";
    const std::string close = "</" + std::string(name) + ">";

    auto begin = xml.find(open);
    if (begin == std::string_view::npos) {
        return std::nullopt;
    }
    begin += open.size();
    auto end = xml.find(close, begin);
    if (end == std::string_view::npos) {
        return std::nullopt;
    }
    return std::string(xml.substr(begin, end - begin));
}

std::string content_md5(std::span<const uint8_t> data) {
    std::array<unsigned char, EVP_MAX_MD_SIZE> digest{};
    unsigned int digest_len = 0;
    if (EVP_Digest(data.data(), data.size(), digest.data(), &digest_len, EVP_md5(), nullptr) != 1) {
        throw std::runtime_error("MD5 digest failed");
    }

    // 4 output chars per 3 input bytes, plus NUL
    std::array<unsigned char, 4 * ((EVP_MAX_MD_SIZE + 2) / 3) + 1> encoded{};
    int len = EVP_EncodeBlock(encoded.data(), digest.data(), static_cast<int>(digest_len));
    return std::string(reinterpret_cast<const char*>(encoded.data()), static_cast<size_t>(len));
}

}  // namespace S3RequestFactory
