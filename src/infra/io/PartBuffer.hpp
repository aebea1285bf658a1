#pragma once

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <span>
#include <utility>
#include <vector>

/**
 * @brief Growing byte accumulator for one multipart part.
 *
 * Storage grows on demand and tracks a write offset; `Extract` hands the
 * accumulated bytes out and starts a new, empty part. Capacity for the
 * expected part size is reserved on the first append of each part, so an
 * extracted part in flight is the only allocation held until more data
 * arrives. A part may grow beyond it when a large chunk arrives just before
 * the threshold check.
 */
class PartBuffer {
   public:
    explicit PartBuffer(size_t expected_part_size = 0) : expected_(expected_part_size) {}

    void Append(std::span<const uint8_t> chunk) {
        if (chunk.empty()) return;
        if (data_.capacity() == 0) {
            data_.reserve(std::max(expected_, chunk.size()));
        }
        if (offset_ + chunk.size() > data_.size()) {
            data_.resize(offset_ + chunk.size());
        }
        std::memcpy(data_.data() + offset_, chunk.data(), chunk.size());
        offset_ += chunk.size();
    }

    // Moves the accumulated bytes out and resets the write offset.
    std::vector<uint8_t> Extract() {
        data_.resize(offset_);
        std::vector<uint8_t> out = std::move(data_);
        data_ = std::vector<uint8_t>();
        offset_ = 0;
        return out;
    }

    size_t size() const { return offset_; }
    bool empty() const { return offset_ == 0; }
    size_t capacity() const { return data_.capacity(); }

   private:
    size_t expected_;
    size_t offset_ = 0;
    std::vector<uint8_t> data_;
};
