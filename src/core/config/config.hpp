#pragma once
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>
#include <utility>
#include <vector>

class CounterCollector;

struct S3Config {
    std::string host = "localhost";
    std::string port = "9000";
    std::string region = "us-east-1";
    std::string bucket;
    bool use_tls = false;
    bool path_style = true;
};

struct IngestConfig {
    std::string path_prefix = "raw";
    std::string parameters_file = "parameters.json";
    std::string content_type = "text/csv";
    std::size_t concurrency = 5;
    std::size_t part_size = 50UL * 1024 * 1024;
    std::chrono::milliseconds read_timeout{std::chrono::seconds(60)};
    unsigned int worker_threads = 4;

    // Empty means DestinationKeyResolver::DefaultTable().
    std::vector<std::pair<std::string, std::string>> suffix_table;
};

struct LoggingConfig {
    std::string level = "info";
    std::string file = "logs/ingest.log";
};

struct AppConfig {
    S3Config s3;
    IngestConfig ingest;
    LoggingConfig logging;
};

/**
 * @brief Loads configuration from a TOML file.
 *
 * A missing file yields defaults. The BUCKET_NAME and PATH_PREFIX
 * environment variables override the corresponding settings.
 *
 * @param path Path to the .toml file (default: "config.toml")
 * @return Parsed AppConfig object.
 * @throws std::runtime_error if file cannot be parsed or holds invalid values.
 */
AppConfig LoadConfig(const std::string& path = "config.toml");

/**
 * @brief Reads the `file_urls` array from a JSON parameters file.
 *
 * Runs before any transfer starts; each URL read is counted as
 * `urls_loaded` on @p counters.
 *
 * @throws std::runtime_error if the file is missing, malformed, or
 * `file_urls` holds anything but strings.
 */
std::vector<std::string> LoadFileUrls(const std::string& path, CounterCollector& counters);
