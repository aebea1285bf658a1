// 1. Standard Library
#include <cstdlib>
#include <exception>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

// 2. Third Party
#include <boost/asio/io_context.hpp>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

// 3. Local Headers
#include "CounterCollector.hpp"
#include "LogTelemetrySink.hpp"
#include "Orchestrator.hpp"
#include "S3Client.hpp"
#include "WorkerPool.hpp"
#include "config.hpp"
#include "result_builder.hpp"

using ResultBuilder = ingest::models::ResultBuilder;

static void setup_logging(const LoggingConfig& cfg) {
    std::vector<spdlog::sink_ptr> sinks;

    // A. Console Sink (stderr; stdout carries the result document)
    auto console_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
    sinks.push_back(console_sink);

    // B. Rotating File Sink (Max 5MB, 3 files)
    if (!cfg.file.empty()) {
        constexpr size_t MAX_SIZE = 1024 * 1024 * 5;
        constexpr size_t MAX_FILES = 3;
        auto file_sink =
            std::make_shared<spdlog::sinks::rotating_file_sink_mt>(cfg.file, MAX_SIZE, MAX_FILES);
        file_sink->set_level(spdlog::level::trace);
        sinks.push_back(file_sink);
    }

    // C. Register Loggers
    auto logger = std::make_shared<spdlog::logger>("ingest", sinks.begin(), sinks.end());
    spdlog::register_logger(logger);
    spdlog::set_default_logger(logger);

    auto telemetry = std::make_shared<spdlog::logger>("telemetry", sinks.begin(), sinks.end());
    spdlog::register_logger(telemetry);

    // D. Global Formatting
    spdlog::set_level(spdlog::level::from_str(cfg.level));
    spdlog::set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] [thread %t] %v");
    spdlog::flush_on(spdlog::level::warn);
}

int main(int argc, char* argv[]) {
    if (argc > 2) {
        std::cerr << "Usage: hermes_ingest [config.toml]\n";
        return EXIT_FAILURE;
    }
    const std::string config_path = argc == 2 ? argv[1] : "config.toml";

    try {
        // 1. Configuration (defaults until logging is set up)
        AppConfig config = LoadConfig(config_path);
        setup_logging(config.logging);

        // 2. Source list, loaded before any concurrent work
        CounterCollector counters;
        std::vector<std::string> urls;
        IngestResult result;
        try {
            urls = LoadFileUrls(config.ingest.parameters_file, counters);
        } catch (const std::exception& e) {
            spdlog::error("Failed to load {}: {}", config.ingest.parameters_file, e.what());
            result.status = IngestStatus::ConfigurationFailure;
            result.message = e.what();
            result.counters = counters.TakeSnapshot();
            std::cout << ResultBuilder::serialize(result) << std::endl;
            return EXIT_FAILURE;
        }

        // 3. Pipeline Setup
        boost::asio::io_context ioc;
        WorkerPool workers(config.ingest.worker_threads);
        auto store = std::make_shared<S3Client>(config.s3);
        LogTelemetrySink telemetry;
        Orchestrator orchestrator(ioc, store, workers, counters, telemetry, config);

        // 4. Run
        result = orchestrator.Run(urls);
        workers.stop();

        std::cout << ResultBuilder::serialize(result) << std::endl;
        return result.status == IngestStatus::Success ? EXIT_SUCCESS : EXIT_FAILURE;

    } catch (const std::exception& e) {
        spdlog::critical("Fatal Error: {}", e.what());
        return EXIT_FAILURE;
    }
}
