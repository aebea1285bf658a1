#include "S3Session.hpp"

#include <openssl/err.h>
#include <openssl/ssl.h>

#include <boost/asio/ssl/host_name_verification.hpp>
#include <boost/beast/core/flat_buffer.hpp>
#include <boost/beast/core/tcp_stream.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/ssl/ssl_stream.hpp>
#include <stdexcept>

#include "spdlog/spdlog.h"
#include "types.hpp"

// S3 error documents are small; anything larger is not worth keeping.
static constexpr uint64_t MAX_RESPONSE_BODY = 8 * MEGABYTE;

S3Session::S3Session(const S3Config& cfg, ssl::context* tls) : cfg_(cfg), tls_(tls) {
    if (cfg_.use_tls && !tls_) {
        throw std::invalid_argument("S3Session: TLS requested without a TLS context");
    }
}

template <class Stream>
S3Session::response_t S3Session::exchange(Stream& stream, S3RequestFactory::request_t& req) {
    http::write(stream, req);

    beast::flat_buffer buffer;
    http::response_parser<http::string_body> parser;
    parser.body_limit(MAX_RESPONSE_BODY);
    http::read(stream, buffer, parser);
    return parser.release();
}

S3Session::response_t S3Session::Execute(S3RequestFactory::request_t& req) {
    const std::string host = S3RequestFactory::connect_host(cfg_);
    const std::string port = S3RequestFactory::connect_port(cfg_);

    tcp::resolver resolver(ioc_);
    auto results = resolver.resolve(host, port);
    spdlog::trace("[S3] {} {} via {}:{}", std::string(req.method_string()),
                  std::string(req.target()), host, port);

    if (!cfg_.use_tls) {
        beast::tcp_stream stream(ioc_);
        stream.connect(results);
        auto res = exchange(stream, req);

        beast::error_code ec;
        stream.socket().shutdown(tcp::socket::shutdown_both, ec);
        return res;
    }

    beast::ssl_stream<beast::tcp_stream> stream(ioc_, *tls_);
    if (!SSL_set_tlsext_host_name(stream.native_handle(), host.c_str())) {
        throw beast::system_error(
            beast::error_code(static_cast<int>(::ERR_get_error()), asio::error::get_ssl_category()),
            "SNI");
    }
    stream.set_verify_callback(ssl::host_name_verification(host));
    beast::get_lowest_layer(stream).connect(results);
    stream.handshake(ssl::stream_base::client);

    auto res = exchange(stream, req);

    // Many servers close without close_notify; that is not a failure here.
    beast::error_code ec;
    stream.shutdown(ec);
    return res;
}
