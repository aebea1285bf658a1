#include "InMemoryObjectStore.hpp"

#include <algorithm>

void InMemoryObjectStore::FailFor(Op op, std::string key_fragment) {
    std::lock_guard<std::mutex> lock(mutex_);
    failures_[op].push_back(std::move(key_fragment));
}

void InMemoryObjectStore::record(Op op, const std::string& key) {
    ++calls_[op];
    threads_.insert(std::this_thread::get_id());
    for (const auto& fragment : failures_[op]) {
        if (key.find(fragment) != std::string::npos) {
            throw S3Error("injected failure for " + key, 500, "InternalError");
        }
    }
}

std::string InMemoryObjectStore::CreateMultipartUpload(const std::string& key,
                                                       const ObjectMetadata& metadata) {
    std::lock_guard<std::mutex> lock(mutex_);
    record(Op::Create, key);
    std::string id = "upload-" + std::to_string(next_id_++);
    uploads_[id] = Upload{key, metadata, {}, {}, false, false};
    return id;
}

std::string InMemoryObjectStore::UploadPart(const std::string& key, const std::string& upload_id,
                                            uint32_t part_number, std::vector<uint8_t> data) {
    std::lock_guard<std::mutex> lock(mutex_);
    record(Op::UploadPart, key);
    auto it = uploads_.find(upload_id);
    if (it == uploads_.end() || it->second.completed || it->second.aborted) {
        throw S3Error("NoSuchUpload " + upload_id, 404, "NoSuchUpload");
    }
    it->second.parts[part_number] = std::move(data);
    return "\"etag-" + std::to_string(part_number) + "\"";
}

void InMemoryObjectStore::CompleteMultipartUpload(const std::string& key,
                                                  const std::string& upload_id,
                                                  const std::vector<Part>& parts) {
    std::lock_guard<std::mutex> lock(mutex_);
    record(Op::Complete, key);
    auto it = uploads_.find(upload_id);
    if (it == uploads_.end() || it->second.completed || it->second.aborted) {
        throw S3Error("NoSuchUpload " + upload_id, 404, "NoSuchUpload");
    }
    auto& upload = it->second;
    if (parts.empty()) {
        throw S3Error("MalformedXML", 400, "MalformedXML");
    }

    StoredObject obj;
    obj.metadata = upload.metadata;
    obj.multipart = true;
    for (const auto& part : parts) {
        auto p = upload.parts.find(part.number);
        if (p == upload.parts.end()) {
            throw S3Error("InvalidPart", 400, "InvalidPart");
        }
        obj.data.insert(obj.data.end(), p->second.begin(), p->second.end());
        obj.part_sizes.push_back(p->second.size());
    }
    upload.completed = true;
    upload.completed_with = parts;
    objects_[key] = std::move(obj);
}

void InMemoryObjectStore::AbortMultipartUpload(const std::string& key,
                                               const std::string& upload_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    record(Op::Abort, key);
    auto it = uploads_.find(upload_id);
    if (it == uploads_.end() || it->second.completed) {
        throw S3Error("NoSuchUpload " + upload_id, 404, "NoSuchUpload");
    }
    it->second.aborted = true;
    it->second.parts.clear();
}

void InMemoryObjectStore::PutObject(const std::string& key, std::vector<uint8_t> data,
                                    const ObjectMetadata& metadata) {
    std::lock_guard<std::mutex> lock(mutex_);
    record(Op::Put, key);
    objects_[key] = StoredObject{std::move(data), metadata, false, {}};
}

std::size_t InMemoryObjectStore::calls(Op op) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = calls_.find(op);
    return it == calls_.end() ? 0 : it->second;
}

std::optional<InMemoryObjectStore::StoredObject> InMemoryObjectStore::object(
    const std::string& key) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = objects_.find(key);
    if (it == objects_.end()) return std::nullopt;
    return it->second;
}

std::size_t InMemoryObjectStore::object_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return objects_.size();
}

std::vector<InMemoryObjectStore::Upload> InMemoryObjectStore::uploads() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<Upload> out;
    for (const auto& [id, upload] : uploads_) {
        out.push_back(upload);
    }
    return out;
}

std::set<std::thread::id> InMemoryObjectStore::calling_threads() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return threads_;
}
