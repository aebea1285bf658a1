#pragma once
#include <chrono>
#include <cstdint>
#include <string>

#include <boost/json/object.hpp>
#include <spdlog/common.h>

/**
 * @brief One structured record per transfer state transition.
 */
struct TransferEvent {
    std::string name;  // e.g. "part_uploaded"
    spdlog::level::level_enum severity = spdlog::level::info;
    std::chrono::system_clock::time_point timestamp = std::chrono::system_clock::now();
    std::string request_id;
    std::string source_url;
    std::string destination_key;
    uint64_t bytes = 0;
    uint32_t parts = 0;
    boost::json::object fields;  // event-specific extras
};

/**
 * @brief Contract for receiving transfer telemetry.
 * @details
 * **Pattern:** Observer / Listener.
 * **Thread Safety:** Called from the I/O thread that runs the transfers.
 * Implementations must be fast and must not throw.
 */
struct ITransferObserver {
    virtual ~ITransferObserver() = default;

    virtual void OnEvent(const TransferEvent& event) = 0;
};
