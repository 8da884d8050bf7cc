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
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace chunkstore {
namespace remote {

/**
 * Streamed response body. read returns the number of bytes copied into buf,
 * 0 at end of body. A connection reset while streaming throws
 * TransientNetworkError.
 */
class ObjectBody {
public:
    virtual ~ObjectBody() = default;
    virtual size_t read(uint8_t* buf, size_t len) = 0;
};

// Reads until len bytes arrived or the body ended; returns the bytes read
size_t read_full(ObjectBody& body, uint8_t* buf, size_t len);

struct GetObjectRequest {
    std::string bucket;
    std::string key;
    std::string range;      // HTTP Range header value; empty for the whole object
};

struct GetObjectResponse {
    int64_t content_length = -1;    // declared by the server, -1 if unknown
    std::unique_ptr<ObjectBody> body;
};

struct CompletedPart {
    int part_number = 0;
    std::string etag;
};

/**
 * Minimal S3-style object store capability. Failures throw StoreError
 * subclasses: TransientNetworkError for connection resets,
 * ObjectNotFoundError for missing keys, ObjectStoreError otherwise.
 */
class ObjectStore {
public:
    virtual ~ObjectStore() = default;

    virtual GetObjectResponse get_object(const GetObjectRequest& req) = 0;

    virtual void put_object(const std::string& bucket, const std::string& key,
                            const uint8_t* data, size_t len) = 0;

    // Returns the upload id
    virtual std::string create_multipart_upload(const std::string& bucket,
                                                const std::string& key) = 0;

    // part_number starts at 1; returns the part's ETag
    virtual std::string upload_part(const std::string& bucket, const std::string& key,
                                    const std::string& upload_id, int part_number,
                                    const uint8_t* data, size_t len) = 0;

    virtual void complete_multipart_upload(const std::string& bucket, const std::string& key,
                                           const std::string& upload_id,
                                           const std::vector<CompletedPart>& parts) = 0;

    virtual void abort_multipart_upload(const std::string& bucket, const std::string& key,
                                        const std::string& upload_id) = 0;
};

// "bytes=<offset>-<offset+len-1>"; HTTP ranges are inclusive. len must be > 0
std::string format_range(uint64_t offset, uint64_t len);

// "bytes=-<n>", the last n bytes of an object
std::string format_suffix_range(uint64_t n);

/**
 * Resolves a single-range Range header against an object of object_size
 * bytes to an inclusive [first, last] pair. Empty if the header is malformed
 * or the range is unsatisfiable. A range reaching past the end is clamped.
 */
std::optional<std::pair<uint64_t, uint64_t>> parse_range(const std::string& header,
                                                         uint64_t object_size);

} // namespace remote
} // namespace chunkstore
