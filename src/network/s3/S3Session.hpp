#pragma once
#include <string>

#include <boost/asio/io_context.hpp>
#include <boost/asio/ssl/context.hpp>
#include <boost/beast/http/message.hpp>
#include <boost/beast/http/string_body.hpp>

#include "S3RequestFactory.hpp"
#include "config.hpp"

/**
 * @brief One-shot blocking connection to the object store.
 *
 * @details
 * Resolves, connects (TLS with SNI when configured), sends exactly one
 * request and reads the full response. Runs on a worker thread, so it owns
 * a private io_context and never touches the caller's scheduler.
 */
class S3Session {
   public:
    using response_t = boost::beast::http::response<boost::beast::http::string_body>;

    /**
     * @param cfg The S3 configuration.
     * @param tls TLS context; required when cfg.use_tls is set.
     */
    S3Session(const S3Config& cfg, boost::asio::ssl::context* tls);

    S3Session(const S3Session&) = delete;
    S3Session& operator=(const S3Session&) = delete;

    response_t Execute(S3RequestFactory::request_t& req);

   private:
    template <class Stream>
    response_t exchange(Stream& stream, S3RequestFactory::request_t& req);

    boost::asio::io_context ioc_;
    const S3Config& cfg_;
    boost::asio::ssl::context* tls_;
};
