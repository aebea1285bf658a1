#pragma once
#include <memory>

#include <boost/json/object.hpp>
#include <spdlog/logger.h>

#include "ITransferObserver.hpp"

/**
 * @brief Writes each TransferEvent as one JSON object through spdlog.
 *
 * Uses the logger registered as "telemetry" if there is one, the default
 * logger otherwise.
 */
class LogTelemetrySink : public ITransferObserver {
   public:
    explicit LogTelemetrySink(std::shared_ptr<spdlog::logger> logger = nullptr);

    void OnEvent(const TransferEvent& event) override;

    static boost::json::object ToJson(const TransferEvent& event);

   private:
    std::shared_ptr<spdlog::logger> logger_;
};
