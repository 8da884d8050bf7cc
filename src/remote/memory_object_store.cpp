/*
 * SPDX-License-Identifier: AGPL-3.0-or-later
 *
 * The Lucenia project is free software: you can redistribute it
 * and/or modify it under the terms of the GNU Affero General
 * Public License as published by the Free Software Foundation,
 * either version 3 of the License, or (at your option) any later
 * version.
 *
 * This program is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE. See the
 * GNU Affero General Public License for more details.
 *
 * You should have received a copy of the GNU Affero General Public
 * License along with this program. If not, see:
 * https://www.gnu.org/licenses/agpl-3.0.html
 */


#include "memory_object_store.h"
#include <algorithm>
#include <cstring>
#include "../errors.h"

namespace chunkstore {
namespace remote {

namespace {
    // Body over a shared, immutable blob; the store may replace the object
    // while the body is being read
    class BlobBody : public ObjectBody {
    public:
        BlobBody(std::shared_ptr<const std::vector<uint8_t>> blob, uint64_t first, uint64_t end)
            : blob_(std::move(blob)), pos_(first), end_(end) {}

        size_t read(uint8_t* buf, size_t len) override {
            size_t n = static_cast<size_t>(std::min<uint64_t>(len, end_ - pos_));
            if (n > 0) {
                std::memcpy(buf, blob_->data() + pos_, n);
                pos_ += n;
            }
            return n;
        }

    private:
        std::shared_ptr<const std::vector<uint8_t>> blob_;
        uint64_t pos_;
        uint64_t end_;
    };
}

GetObjectResponse MemoryObjectStore::get_object(const GetObjectRequest& req) {
    Blob blob;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        counters_.gets++;
        if (ranges_.size() == kMaxRecordedRanges) {
            ranges_.pop_front();
        }
        ranges_.push_back(req.range);
        auto it = objects_.find(object_key(req.bucket, req.key));
        if (it == objects_.end()) {
            throw ObjectNotFoundError("no such object: " + object_key(req.bucket, req.key));
        }
        blob = it->second;
    }

    uint64_t first = 0;
    uint64_t end = blob->size();
    if (!req.range.empty()) {
        auto r = parse_range(req.range, blob->size());
        if (!r) {
            throw ObjectStoreError("range not satisfiable: " + req.range, 416);
        }
        first = r->first;
        end = r->second + 1;
    }

    GetObjectResponse resp;
    resp.content_length = static_cast<int64_t>(end - first);
    resp.body = std::make_unique<BlobBody>(std::move(blob), first, end);
    return resp;
}

void MemoryObjectStore::put_object(const std::string& bucket, const std::string& key,
                                   const uint8_t* data, size_t len) {
    auto blob = std::make_shared<const std::vector<uint8_t>>(data, data + len);
    std::lock_guard<std::mutex> lock(mutex_);
    counters_.puts++;
    objects_[object_key(bucket, key)] = std::move(blob);
}

std::string MemoryObjectStore::create_multipart_upload(const std::string& bucket,
                                                       const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    counters_.multipart_creates++;
    std::string id = "upload-" + std::to_string(next_upload_++);
    uploads_[id] = Upload{bucket, key, {}};
    return id;
}

std::string MemoryObjectStore::upload_part(const std::string& bucket, const std::string& key,
                                           const std::string& upload_id, int part_number,
                                           const uint8_t* data, size_t len) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = uploads_.find(upload_id);
    if (it == uploads_.end() || it->second.bucket != bucket || it->second.key != key) {
        throw ObjectStoreError("no such upload: " + upload_id, 404);
    }
    if (part_number < 1) {
        throw ObjectStoreError("invalid part number " + std::to_string(part_number), 400);
    }
    counters_.parts_uploaded++;
    it->second.parts[part_number] = std::vector<uint8_t>(data, data + len);
    return "\"" + upload_id + "-" + std::to_string(part_number) + "\"";
}

void MemoryObjectStore::complete_multipart_upload(const std::string& bucket,
                                                  const std::string& key,
                                                  const std::string& upload_id,
                                                  const std::vector<CompletedPart>& parts) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = uploads_.find(upload_id);
    if (it == uploads_.end() || it->second.bucket != bucket || it->second.key != key) {
        throw ObjectStoreError("no such upload: " + upload_id, 404);
    }

    auto blob = std::make_shared<std::vector<uint8_t>>();
    int prev = 0;
    for (const auto& p : parts) {
        if (p.part_number <= prev) {
            throw ObjectStoreError("parts must be listed in ascending order", 400);
        }
        prev = p.part_number;
        auto part = it->second.parts.find(p.part_number);
        if (part == it->second.parts.end()) {
            throw ObjectStoreError("missing part " + std::to_string(p.part_number), 400);
        }
        blob->insert(blob->end(), part->second.begin(), part->second.end());
    }

    counters_.multipart_completes++;
    objects_[object_key(bucket, key)] = std::move(blob);
    uploads_.erase(it);
}

void MemoryObjectStore::abort_multipart_upload(const std::string& bucket, const std::string& key,
                                               const std::string& upload_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = uploads_.find(upload_id);
    if (it == uploads_.end() || it->second.bucket != bucket || it->second.key != key) {
        throw ObjectStoreError("no such upload: " + upload_id, 404);
    }
    counters_.multipart_aborts++;
    uploads_.erase(it);
}

bool MemoryObjectStore::contains(const std::string& bucket, const std::string& key) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return objects_.count(object_key(bucket, key)) != 0;
}

std::optional<std::vector<uint8_t>> MemoryObjectStore::object(const std::string& bucket,
                                                              const std::string& key) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = objects_.find(object_key(bucket, key));
    if (it == objects_.end()) {
        return std::nullopt;
    }
    return *it->second;
}

size_t MemoryObjectStore::object_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return objects_.size();
}

size_t MemoryObjectStore::pending_uploads() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return uploads_.size();
}

MemoryObjectStore::Counters MemoryObjectStore::counters() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return counters_;
}

std::vector<std::string> MemoryObjectStore::ranges() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return std::vector<std::string>(ranges_.begin(), ranges_.end());
}

void MemoryObjectStore::clear_ranges() {
    std::lock_guard<std::mutex> lock(mutex_);
    ranges_.clear();
}

} // namespace remote
} // namespace chunkstore
