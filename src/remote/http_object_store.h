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
#include <curl/curl.h>
#include <string>
#include <vector>
#include "object_store.h"
#include "../config.h"

namespace chunkstore {
namespace remote {

/**
 * ObjectStore over an S3-compatible HTTP endpoint, path-style addressing
 * (<endpoint>/<bucket>/<key>). Requests are not signed; point it at a
 * gateway or a bucket that allows anonymous access.
 *
 * One curl easy handle per request, so the store is safe for concurrent use.
 * Responses are buffered in full before get_object returns.
 */
class HttpObjectStore : public ObjectStore {
public:
    explicit HttpObjectStore(const std::string& endpoint,
                             long connect_timeout_seconds = kConnectTimeoutSeconds);

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

    std::string object_url(const std::string& bucket, const std::string& key) const;
    const std::string& endpoint() const { return endpoint_; }

private:
    struct Response {
        long status = 0;
        int64_t content_length = -1;
        std::vector<uint8_t> body;
        std::string etag;
    };

    Response perform(const std::string& method, const std::string& url,
                     const std::vector<std::string>& headers,
                     const uint8_t* data, size_t len) const;

    std::string endpoint_;
    long connect_timeout_;
};

namespace http {

    // True for a transfer that failed because the peer reset the connection
    bool is_connection_reset(CURLcode code, long os_errno);

    // Throws the StoreError matching a failed transfer
    [[noreturn]] void raise_transfer_error(CURLcode code, long os_errno, const std::string& context);

    // Throws ObjectNotFoundError for 404 and ObjectStoreError for any other non-2xx status
    void raise_for_status(long status, const std::string& context, const std::string& body);

    // UploadId from an InitiateMultipartUploadResult document
    std::string parse_upload_id(const std::string& xml);

    // CompleteMultipartUpload request document
    std::string complete_multipart_xml(const std::vector<CompletedPart>& parts);

    // Value of header `name` in a raw "Name: value\r\n" line, empty if the line is another header
    std::string header_value(const std::string& line, const std::string& name);

} // namespace http

} // namespace remote
} // namespace chunkstore
