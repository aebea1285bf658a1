#include "config.hpp"

#include <spdlog/spdlog.h>

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <toml++/toml.hpp>

#include "CounterCollector.hpp"
#include "types.hpp"

namespace {

void apply_env_overrides(AppConfig& config) {
    if (const char* bucket = std::getenv("BUCKET_NAME"); bucket && *bucket) {
        config.s3.bucket = bucket;
    }
    if (const char* prefix = std::getenv("PATH_PREFIX"); prefix && *prefix) {
        config.ingest.path_prefix = prefix;
    }
}

void validate(const AppConfig& config) {
    const auto& ingest = config.ingest;
    if (ingest.concurrency == 0) {
        throw std::runtime_error("ingest.concurrency must be > 0");
    }
    if (ingest.part_size == 0) {
        throw std::runtime_error("ingest.part_size_mb must be > 0");
    }
    if (ingest.worker_threads == 0) {
        throw std::runtime_error("ingest.worker_threads must be > 0");
    }
    if (ingest.read_timeout.count() <= 0) {
        throw std::runtime_error("ingest.read_timeout_seconds must be > 0");
    }
    if (ingest.part_size < S3_MIN_PART_SIZE) {
        spdlog::warn("Part size {} bytes is below the S3 minimum of {} bytes; "
                     "multipart completion will be rejected by S3",
                     ingest.part_size, S3_MIN_PART_SIZE);
    }
}

}  // namespace

AppConfig LoadConfig(const std::string& path) {
    AppConfig config;

    if (!std::filesystem::exists(path)) {
        spdlog::warn("Config file '{}' not found. Using defaults.", path);
        apply_env_overrides(config);
        validate(config);
        return config;
    }

    toml::table tbl;
    try {
        tbl = toml::parse_file(path);
    } catch (const toml::parse_error& err) {
        spdlog::critical("Failed to parse config file: {}", err.description());
        throw std::runtime_error("Config parse error");
    }

    // 1. Ingestion Settings
    if (auto ingest = tbl["ingest"]) {
        auto& out = config.ingest;
        config.s3.bucket = ingest["bucket"].value_or(config.s3.bucket);
        out.path_prefix = ingest["path_prefix"].value_or(out.path_prefix);
        out.parameters_file = ingest["parameters_file"].value_or(out.parameters_file);
        out.content_type = ingest["content_type"].value_or(out.content_type);

        auto concurrency = ingest["concurrency"].value_or<int64_t>(
            static_cast<int64_t>(out.concurrency));
        auto part_size_mb = ingest["part_size_mb"].value_or<int64_t>(
            static_cast<int64_t>(out.part_size / MEGABYTE));
        auto timeout_s = ingest["read_timeout_seconds"].value_or<int64_t>(
            std::chrono::duration_cast<std::chrono::seconds>(out.read_timeout).count());
        auto workers = ingest["worker_threads"].value_or<int64_t>(out.worker_threads);
        if (concurrency < 0 || part_size_mb < 0 || workers < 0) {
            throw std::runtime_error("Negative value in [ingest]");
        }
        out.concurrency = static_cast<std::size_t>(concurrency);
        out.part_size = static_cast<std::size_t>(part_size_mb) * MEGABYTE;
        out.read_timeout = std::chrono::seconds(timeout_s);
        out.worker_threads = static_cast<unsigned int>(workers);

        // [[ingest.suffix]] keyword = "...", name = "..."  (table order is match order)
        if (auto* suffixes = ingest["suffix"].as_array()) {
            for (const auto& entry : *suffixes) {
                const auto* t = entry.as_table();
                if (!t) {
                    throw std::runtime_error("ingest.suffix entries must be tables");
                }
                auto keyword = (*t)["keyword"].value<std::string>();
                auto name = (*t)["name"].value<std::string>();
                if (!keyword || !name) {
                    throw std::runtime_error("ingest.suffix entries need 'keyword' and 'name'");
                }
                out.suffix_table.emplace_back(*keyword, *name);
            }
        }
    }

    // 2. S3 Settings
    if (auto s3 = tbl["s3"]) {
        config.s3.host = s3["host"].value_or(config.s3.host);
        config.s3.port = s3["port"].value_or(config.s3.port);
        config.s3.region = s3["region"].value_or(config.s3.region);
        config.s3.use_tls = s3["use_tls"].value_or(config.s3.use_tls);
        config.s3.path_style = s3["path_style"].value_or(config.s3.path_style);
    }

    // 3. Logging
    if (auto logging = tbl["logging"]) {
        config.logging.level = logging["level"].value_or(config.logging.level);
        config.logging.file = logging["file"].value_or(config.logging.file);
    }

    apply_env_overrides(config);
    validate(config);

    spdlog::info("Loaded configuration from {}", path);
    return config;
}

std::vector<std::string> LoadFileUrls(const std::string& path, CounterCollector& counters) {
    std::ifstream in(path);
    if (!in) {
        throw std::runtime_error("Failed to open parameters file: " + path);
    }
    std::stringstream ss;
    ss << in.rdbuf();

    boost::system::error_code ec;
    json::value jv = json::parse(ss.str(), ec);
    if (ec) {
        throw std::runtime_error("Invalid JSON in " + path + ": " + ec.message());
    }
    if (!jv.is_object()) {
        throw std::runtime_error("Parameters root must be a JSON object");
    }

    std::vector<std::string> urls;
    const auto* arr = jv.as_object().if_contains("file_urls");
    if (!arr) {
        spdlog::warn("No file_urls found in {}", path);
        return urls;
    }
    if (!arr->is_array()) {
        throw std::runtime_error("file_urls must be an array");
    }

    for (const auto& item : arr->as_array()) {
        if (!item.is_string()) {
            throw std::runtime_error("file_urls entries must be strings");
        }
        urls.emplace_back(item.as_string().c_str());
        counters.Increment(CounterCollector::kUrlsLoaded);
    }

    spdlog::info("Loaded {} source URLs from {}", urls.size(), path);
    return urls;
}
