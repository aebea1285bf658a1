#pragma once
#include <cstdint>
#include <map>
#include <mutex>
#include <string>
#include <string_view>

/**
 * @brief Shared registry of operation counts.
 *
 * @details
 * One instance is created per invocation and handed by reference to every
 * collaborator that counts something. All access goes through one mutex, so
 * increments are safe from the coordinator's worker threads as well as from
 * the I/O thread.
 *
 * `total` is bumped alongside every named counter and therefore always equals
 * the sum of the others.
 */
class CounterCollector {
   public:
    using Snapshot = std::map<std::string, uint64_t, std::less<>>;

    static constexpr std::string_view kTotal = "total";

    // Counter names used across the pipeline.
    static constexpr std::string_view kUrlsLoaded = "urls_loaded";
    static constexpr std::string_view kCreateMultipart = "create_multipart";
    static constexpr std::string_view kUploadPart = "upload_part";
    static constexpr std::string_view kCompleteMultipart = "complete_multipart";
    static constexpr std::string_view kAbortMultipart = "abort_multipart";
    static constexpr std::string_view kPutObject = "put_object";

    CounterCollector() = default;

    CounterCollector(const CounterCollector&) = delete;
    CounterCollector& operator=(const CounterCollector&) = delete;

    /**
     * @throws std::invalid_argument if @p name is "total" or empty.
     */
    void Increment(std::string_view name, uint64_t amount = 1);

    // Zero for unknown names.
    uint64_t Get(std::string_view name) const;

    Snapshot TakeSnapshot() const;

   private:
    mutable std::mutex mutex_;
    Snapshot counters_{{std::string(kTotal), 0}};
};
