#pragma once
#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <span>
#include <string>

#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/awaitable.hpp>
#include <boost/asio/ssl/context.hpp>
#include <boost/beast/core/flat_buffer.hpp>
#include <boost/beast/core/tcp_stream.hpp>
#include <boost/beast/http/buffer_body.hpp>
#include <boost/beast/http/parser.hpp>
#include <boost/beast/ssl/ssl_stream.hpp>

/**
 * @brief Streaming HTTP(S) GET of one source file.
 *
 * @details
 * `Open` connects, sends the request and reads the response headers,
 * following redirects. `ReadSome` then hands out the body piece by piece, so
 * the file is never held in memory as a whole.
 *
 * Every network operation is armed with the read-inactivity timeout: the
 * timer restarts on each call and only fires when the peer goes quiet for the
 * whole interval. There is no cap on total duration. A timeout surfaces as
 * boost::system::system_error carrying beast::error::timeout.
 */
class HttpSource {
   public:
    static constexpr int kMaxRedirects = 5;

    HttpSource(boost::asio::any_io_executor executor, boost::asio::ssl::context& tls,
               std::chrono::milliseconds read_timeout);

    HttpSource(const HttpSource&) = delete;
    HttpSource& operator=(const HttpSource&) = delete;

    /**
     * @brief Issues the GET and waits for a 2xx response header.
     * @return The declared Content-Length, if the response has one.
     * @throws std::runtime_error on an unusable URL, a non-2xx status or too
     * many redirects; boost::system::system_error on network failures.
     */
    boost::asio::awaitable<std::optional<uint64_t>> Open(const std::string& url);

    /**
     * @brief Reads the next piece of the body into @p out.
     * @return Bytes written to @p out; 0 once the body is complete.
     */
    boost::asio::awaitable<std::size_t> ReadSome(std::span<uint8_t> out);

    // Closes the connection; safe to call at any time.
    void Close();

    const std::string& final_url() const { return final_url_; }

   private:
    struct Endpoint {
        bool tls = false;
        std::string host;
        std::string port;
        std::string host_header;
        std::string target;
    };

    static Endpoint parse_endpoint(const std::string& url);

    boost::asio::awaitable<void> connect(const Endpoint& ep);

    template <class Stream>
    boost::asio::awaitable<void> send_and_read_header(Stream& stream, const Endpoint& ep);

    template <class Stream>
    boost::asio::awaitable<std::size_t> read_body(Stream& stream, std::span<uint8_t> out);

    void arm_timer();

    boost::asio::any_io_executor executor_;
    boost::asio::ssl::context& tls_ctx_;
    std::chrono::milliseconds read_timeout_;

    std::unique_ptr<boost::beast::tcp_stream> plain_;
    std::unique_ptr<boost::beast::ssl_stream<boost::beast::tcp_stream>> secure_;
    std::unique_ptr<boost::beast::http::response_parser<boost::beast::http::buffer_body>> parser_;
    boost::beast::flat_buffer buffer_;
    std::string final_url_;
};
