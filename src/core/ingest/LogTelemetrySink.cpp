#include "LogTelemetrySink.hpp"

#include <boost/json/serialize.hpp>
#include <spdlog/spdlog.h>

#include "UtcTime.hpp"

LogTelemetrySink::LogTelemetrySink(std::shared_ptr<spdlog::logger> logger)
    : logger_(std::move(logger)) {
    if (!logger_) {
        logger_ = spdlog::get("telemetry");
    }
    if (!logger_) {
        logger_ = spdlog::default_logger();
    }
}

boost::json::object LogTelemetrySink::ToJson(const TransferEvent& event) {
    boost::json::object obj;
    obj["event"] = event.name;
    obj["severity"] = std::string(spdlog::level::to_string_view(event.severity).data(),
                                  spdlog::level::to_string_view(event.severity).size());
    obj["timestamp"] = utc::FormatIso8601(event.timestamp);
    obj["request_id"] = event.request_id;
    obj["url"] = event.source_url;
    obj["key"] = event.destination_key;
    obj["bytes"] = event.bytes;
    obj["parts"] = event.parts;
    for (const auto& field : event.fields) {
        obj[field.key()] = field.value();
    }
    return obj;
}

void LogTelemetrySink::OnEvent(const TransferEvent& event) {
    logger_->log(event.severity, "{}", boost::json::serialize(ToJson(event)));
}
