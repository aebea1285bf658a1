#pragma once
#include <atomic>
#include <cstdint>
#include <map>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <thread>
#include <vector>

#include "IObjectStore.hpp"

/**
 * @brief Thread-safe IObjectStore fake that assembles objects in memory.
 *
 * Failures are injected per operation for keys containing a fragment.
 */
class InMemoryObjectStore : public IObjectStore {
   public:
    enum class Op { Create, UploadPart, Complete, Abort, Put };

    struct Upload {
        std::string key;
        ObjectMetadata metadata;
        std::map<uint32_t, std::vector<uint8_t>> parts;
        std::vector<Part> completed_with;
        bool completed = false;
        bool aborted = false;
    };

    struct StoredObject {
        std::vector<uint8_t> data;
        ObjectMetadata metadata;
        bool multipart = false;
        std::vector<uint64_t> part_sizes;
    };

    std::string CreateMultipartUpload(const std::string& key,
                                      const ObjectMetadata& metadata) override;
    std::string UploadPart(const std::string& key, const std::string& upload_id,
                           uint32_t part_number, std::vector<uint8_t> data) override;
    void CompleteMultipartUpload(const std::string& key, const std::string& upload_id,
                                 const std::vector<Part>& parts) override;
    void AbortMultipartUpload(const std::string& key, const std::string& upload_id) override;
    void PutObject(const std::string& key, std::vector<uint8_t> data,
                   const ObjectMetadata& metadata) override;

    void FailFor(Op op, std::string key_fragment);

    std::size_t calls(Op op) const;
    std::optional<StoredObject> object(const std::string& key) const;
    std::size_t object_count() const;
    std::vector<Upload> uploads() const;
    std::set<std::thread::id> calling_threads() const;

   private:
    void record(Op op, const std::string& key);  // throws on injected failure

    mutable std::mutex mutex_;
    std::map<Op, std::size_t> calls_;
    std::map<Op, std::vector<std::string>> failures_;
    std::map<std::string, Upload> uploads_;  // by upload id
    std::map<std::string, StoredObject> objects_;
    std::set<std::thread::id> threads_;
    uint64_t next_id_ = 1;
};
