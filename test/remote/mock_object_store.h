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
#include <gmock/gmock.h>
#include <algorithm>
#include <cstring>
#include "errors.h"
#include "remote/memory_object_store.h"

namespace chunkstore {
namespace test {

class MockObjectStore : public remote::ObjectStore {
public:
    MOCK_METHOD(remote::GetObjectResponse, get_object, (const remote::GetObjectRequest& req), (override));
    MOCK_METHOD(void, put_object, (const std::string& bucket, const std::string& key,
                                   const uint8_t* data, size_t len), (override));
    MOCK_METHOD(std::string, create_multipart_upload, (const std::string& bucket,
                                                       const std::string& key), (override));
    MOCK_METHOD(std::string, upload_part, (const std::string& bucket, const std::string& key,
                                           const std::string& upload_id, int part_number,
                                           const uint8_t* data, size_t len), (override));
    MOCK_METHOD(void, complete_multipart_upload, (const std::string& bucket, const std::string& key,
                                                  const std::string& upload_id,
                                                  const std::vector<remote::CompletedPart>& parts),
                (override));
    MOCK_METHOD(void, abort_multipart_upload, (const std::string& bucket, const std::string& key,
                                               const std::string& upload_id), (override));

    // Forward every call to fake unless a test sets its own expectation
    void delegate_to(remote::MemoryObjectStore& fake) {
        using ::testing::Invoke;
        ON_CALL(*this, get_object).WillByDefault(Invoke(&fake, &remote::MemoryObjectStore::get_object));
        ON_CALL(*this, put_object).WillByDefault(Invoke(&fake, &remote::MemoryObjectStore::put_object));
        ON_CALL(*this, create_multipart_upload)
            .WillByDefault(Invoke(&fake, &remote::MemoryObjectStore::create_multipart_upload));
        ON_CALL(*this, upload_part).WillByDefault(Invoke(&fake, &remote::MemoryObjectStore::upload_part));
        ON_CALL(*this, complete_multipart_upload)
            .WillByDefault(Invoke(&fake, &remote::MemoryObjectStore::complete_multipart_upload));
        ON_CALL(*this, abort_multipart_upload)
            .WillByDefault(Invoke(&fake, &remote::MemoryObjectStore::abort_multipart_upload));
    }
};

// Body that serves a fixed buffer, optionally failing on the first read
class ScriptedBody : public remote::ObjectBody {
public:
    explicit ScriptedBody(std::vector<uint8_t> data, bool reset_first = false)
        : data_(std::move(data)), reset_first_(reset_first) {}

    size_t read(uint8_t* buf, size_t len) override {
        if (reset_first_) {
            reset_first_ = false;
            throw TransientNetworkError("connection reset while reading body");
        }
        size_t n = std::min(len, data_.size() - pos_);
        std::memcpy(buf, data_.data() + pos_, n);
        pos_ += n;
        return n;
    }

private:
    std::vector<uint8_t> data_;
    size_t pos_ = 0;
    bool reset_first_;
};

} // namespace test
} // namespace chunkstore
