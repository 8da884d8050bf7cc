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


#pragma once
#include <atomic>
#include <deque>
#include <map>
#include <mutex>
#include <unordered_map>
#include "object_store.h"

namespace chunkstore {
namespace remote {

/**
 * In-process ObjectStore. Thread safe. Supports single ranges and multipart
 * uploads, and counts requests so callers can assert on traffic.
 */
class MemoryObjectStore : public ObjectStore {
public:
    struct Counters {
        uint64_t gets = 0;
        uint64_t puts = 0;
        uint64_t multipart_creates = 0;
        uint64_t parts_uploaded = 0;
        uint64_t multipart_completes = 0;
        uint64_t multipart_aborts = 0;
    };

    MemoryObjectStore() = default;

    GetObjectResponse get_object(const GetObjectRequest& req) override;
    void put_object(const std::string& bucket, const std::string& key,
                    const uint8_t* data, size_t len) override;
    std::string create_multipart_upload(const std::string& bucket,
                                        const std::string& key) override;
    std::string upload_part(const std::string& bucket, const std::string& key,
                            const std::string& upload_id, int part_number,
                            const uint8_t* data, size_t len) override;
    void complete_multipart_upload(const std::string& bucket, const std::string& key,
                                   const std::string& upload_id,
                                   const std::vector<CompletedPart>& parts) override;
    void abort_multipart_upload(const std::string& bucket, const std::string& key,
                                const std::string& upload_id) override;

    bool contains(const std::string& bucket, const std::string& key) const;
    std::optional<std::vector<uint8_t>> object(const std::string& bucket,
                                               const std::string& key) const;
    size_t object_count() const;
    size_t pending_uploads() const;

    Counters counters() const;

    // Range headers of the most recent get_object calls, oldest first.
    // At most kMaxRecordedRanges are kept.
    std::vector<std::string> ranges() const;
    void clear_ranges();

    static constexpr size_t kMaxRecordedRanges = 4096;

private:
    using Blob = std::shared_ptr<const std::vector<uint8_t>>;

    struct Upload {
        std::string bucket;
        std::string key;
        std::map<int, std::vector<uint8_t>> parts;
    };

    static std::string object_key(const std::string& bucket, const std::string& key) {
        return bucket + "/" + key;
    }

    mutable std::mutex mutex_;
    std::unordered_map<std::string, Blob> objects_;
    std::unordered_map<std::string, Upload> uploads_;
    std::deque<std::string> ranges_;
    Counters counters_;
    uint64_t next_upload_ = 1;
};

} // namespace remote
} // namespace chunkstore
