#include "HttpSource.hpp"

#include <openssl/err.h>
#include <openssl/ssl.h>

#include <limits>
#include <memory>
#include <stdexcept>
#include <string_view>

#include <boost/asio/as_tuple.hpp>
#include <boost/asio/connect.hpp>
#include <boost/asio/ssl/host_name_verification.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/beast/http.hpp>
#include <boost/url/parse.hpp>
#include <boost/url/url.hpp>

#include "spdlog/spdlog.h"
#include "types.hpp"

HttpSource::HttpSource(asio::any_io_executor executor, ssl::context& tls,
                       std::chrono::milliseconds read_timeout)
    : executor_(std::move(executor)), tls_ctx_(tls), read_timeout_(read_timeout) {}

namespace {

bool is_followed_redirect(unsigned status) {
    switch (status) {
        case 301:
        case 302:
        case 303:
        case 307:
        case 308:
            return true;
        default:
            return false;
    }
}

// Resolves a Location header against the URL that produced it.
std::string resolve_location(const std::string& current, std::string_view location) {
    auto base = boost::urls::parse_uri(current);
    auto ref = boost::urls::parse_uri_reference(location);
    if (!base || !ref) {
        throw std::runtime_error("Invalid redirect Location '" + std::string(location) + "'");
    }
    boost::urls::url dest;
    auto rv = boost::urls::resolve(*base, *ref, dest);
    if (!rv) {
        throw std::runtime_error("Cannot resolve redirect Location '" + std::string(location) +
                                 "': " + rv.error().message());
    }
    return std::string(dest.buffer());
}

}  // namespace

HttpSource::Endpoint HttpSource::parse_endpoint(const std::string& url) {
    auto parsed = boost::urls::parse_uri(url);
    if (!parsed) {
        throw std::runtime_error("Invalid URL '" + url + "': " + parsed.error().message());
    }
    const auto& u = *parsed;

    Endpoint ep;
    if (u.scheme_id() == boost::urls::scheme::https) {
        ep.tls = true;
    } else if (u.scheme_id() != boost::urls::scheme::http) {
        throw std::runtime_error("Unsupported URL scheme '" + std::string(u.scheme()) + "'");
    }
    ep.host = u.host_address();
    if (ep.host.empty()) {
        throw std::runtime_error("URL has no host: " + url);
    }
    ep.port = u.has_port() ? std::string(u.port()) : (ep.tls ? "443" : "80");
    ep.host_header = std::string(u.encoded_host_and_port());
    ep.target = std::string(u.encoded_target());
    if (ep.target.empty() || ep.target.front() != '/') {
        ep.target.insert(ep.target.begin(), '/');
    }
    return ep;
}

void HttpSource::arm_timer() {
    if (secure_) {
        beast::get_lowest_layer(*secure_).expires_after(read_timeout_);
    } else if (plain_) {
        plain_->expires_after(read_timeout_);
    }
}

asio::awaitable<void> HttpSource::connect(const Endpoint& ep) {
    // getaddrinfo cannot be interrupted, so the lookup is not awaited directly:
    // whichever of lookup and deadline finishes first wakes this coroutine.
    struct Lookup {
        boost::system::error_code ec;
        tcp::resolver::results_type results;
        bool done = false;
    };
    auto lookup = std::make_shared<Lookup>();
    auto resolver = std::make_shared<tcp::resolver>(executor_);
    auto wake = std::make_shared<asio::steady_timer>(executor_, read_timeout_);

    resolver->async_resolve(
        ep.host, ep.port,
        [lookup, resolver, wake](const boost::system::error_code& ec,
                                 tcp::resolver::results_type results) {
            lookup->ec = ec;
            lookup->results = std::move(results);
            lookup->done = true;
            wake->cancel();
        });
    co_await wake->async_wait(asio::as_tuple(asio::use_awaitable));

    if (!lookup->done) {
        resolver->cancel();
        throw beast::system_error(beast::error::timeout, "resolve " + ep.host);
    }
    if (lookup->ec) {
        throw beast::system_error(lookup->ec, "resolve " + ep.host);
    }
    const auto results = lookup->results;

    if (!ep.tls) {
        plain_ = std::make_unique<beast::tcp_stream>(executor_);
        arm_timer();
        co_await plain_->async_connect(results, asio::use_awaitable);
        spdlog::debug("[HTTP] Connected to {}:{}", ep.host, ep.port);
        co_return;
    }

    secure_ = std::make_unique<beast::ssl_stream<beast::tcp_stream>>(executor_, tls_ctx_);
    if (!SSL_set_tlsext_host_name(secure_->native_handle(), ep.host.c_str())) {
        throw beast::system_error(
            beast::error_code(static_cast<int>(::ERR_get_error()), asio::error::get_ssl_category()),
            "SNI");
    }
    secure_->set_verify_callback(ssl::host_name_verification(ep.host));

    arm_timer();
    co_await beast::get_lowest_layer(*secure_).async_connect(results, asio::use_awaitable);
    arm_timer();
    co_await secure_->async_handshake(ssl::stream_base::client, asio::use_awaitable);
    spdlog::debug("[HTTP] TLS connected to {}:{}", ep.host, ep.port);
}

template <class Stream>
asio::awaitable<void> HttpSource::send_and_read_header(Stream& stream, const Endpoint& ep) {
    http::request<http::empty_body> req{http::verb::get, ep.target, 11};
    req.set(http::field::host, ep.host_header);
    req.set(http::field::user_agent, "hermes-ingest");
    req.set(http::field::accept, "*/*");

    arm_timer();
    co_await http::async_write(stream, req, asio::use_awaitable);

    buffer_.clear();
    parser_ = std::make_unique<http::response_parser<http::buffer_body>>();
    // Bodies are streamed, never stored, so the parser limit does not apply.
    parser_->body_limit(std::numeric_limits<std::uint64_t>::max());

    arm_timer();
    co_await http::async_read_header(stream, buffer_, *parser_, asio::use_awaitable);
}

asio::awaitable<std::optional<uint64_t>> HttpSource::Open(const std::string& url) {
    std::string current = url;

    for (int hop = 0; hop <= kMaxRedirects; ++hop) {
        Close();
        Endpoint ep = parse_endpoint(current);
        co_await connect(ep);

        if (secure_) {
            co_await send_and_read_header(*secure_, ep);
        } else {
            co_await send_and_read_header(*plain_, ep);
        }

        const auto& res = parser_->get();
        const unsigned status = res.result_int();

        if (is_followed_redirect(status)) {
            auto location = res.find(http::field::location);
            if (location == res.end()) {
                throw std::runtime_error("HTTP " + std::to_string(status) +
                                         " without Location for " + current);
            }
            std::string next = resolve_location(current, location->value());
            spdlog::debug("[HTTP] {} redirected ({}) to {}", current, status, next);
            current = std::move(next);
            continue;
        }

        if (status / 100 != 2) {
            std::string reason(res.reason());
            Close();
            throw std::runtime_error("HTTP " + std::to_string(status) + " " + reason + " for " +
                                     current);
        }

        final_url_ = current;
        if (auto length = parser_->content_length()) {
            co_return static_cast<uint64_t>(*length);
        }
        spdlog::debug("[HTTP] {} has no Content-Length. Progress unknown.", current);
        co_return std::nullopt;
    }

    Close();
    throw std::runtime_error("Too many redirects for " + url);
}

template <class Stream>
asio::awaitable<std::size_t> HttpSource::read_body(Stream& stream, std::span<uint8_t> out) {
    std::size_t got = 0;
    while (got == 0 && !parser_->is_done()) {
        auto& body = parser_->get().body();
        body.data = out.data();
        body.size = out.size();

        arm_timer();
        auto [ec, n] = co_await http::async_read_some(stream, buffer_, *parser_,
                                                      asio::as_tuple(asio::use_awaitable));
        if (ec == http::error::need_buffer) {
            ec = {};
        }
        if (ec) {
            throw beast::system_error(ec, "read body");
        }
        got = out.size() - body.size;
    }
    co_return got;
}

asio::awaitable<std::size_t> HttpSource::ReadSome(std::span<uint8_t> out) {
    if (!parser_) {
        throw std::logic_error("HttpSource::ReadSome before Open");
    }
    if (out.empty() || parser_->is_done()) {
        co_return 0;
    }
    if (secure_) {
        co_return co_await read_body(*secure_, out);
    }
    co_return co_await read_body(*plain_, out);
}

void HttpSource::Close() {
    beast::error_code ec;
    if (secure_) {
        beast::get_lowest_layer(*secure_).socket().close(ec);
        secure_.reset();
    }
    if (plain_) {
        plain_->socket().close(ec);
        plain_.reset();
    }
}
