#pragma once
#include <cstddef>
#include <cstdint>

#include <boost/asio.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/beast.hpp>
#include <boost/json.hpp>

namespace asio = boost::asio;
namespace ssl = boost::asio::ssl;
namespace beast = boost::beast;
namespace http = beast::http;
namespace json = boost::json;
using tcp = asio::ip::tcp;

static constexpr size_t KILOBYTE = 1024;
static constexpr size_t MEGABYTE = 1024 * KILOBYTE;

// S3 rejects non-final multipart parts below this size.
static constexpr size_t S3_MIN_PART_SIZE = 5 * MEGABYTE;

// Size of a single socket read while streaming a source body.
static constexpr size_t READ_CHUNK_SIZE = 64 * KILOBYTE;
