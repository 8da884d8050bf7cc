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


#include "http_object_store.h"
#include <boost/property_tree/ptree.hpp>
#include <boost/property_tree/xml_parser.hpp>
#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstring>
#include <memory>
#include <mutex>
#include <sstream>
#include <stdexcept>
#include "../errors.h"
#include "../util/log.h"

namespace chunkstore {
namespace remote {

namespace {

    struct CurlDeleter {
        void operator()(CURL* c) const { curl_easy_cleanup(c); }
    };
    struct SlistDeleter {
        void operator()(curl_slist* s) const { curl_slist_free_all(s); }
    };
    using CurlHandle = std::unique_ptr<CURL, CurlDeleter>;
    using Slist = std::unique_ptr<curl_slist, SlistDeleter>;

    void global_init() {
        static std::once_flag once;
        std::call_once(once, [] {
            CURLcode rc = curl_global_init(CURL_GLOBAL_DEFAULT);
            if (rc != CURLE_OK) {
                throw ObjectStoreError(std::string("curl_global_init failed: ") +
                                       curl_easy_strerror(rc));
            }
        });
    }

    size_t on_write(char* ptr, size_t size, size_t nmemb, void* user_data) {
        auto* body = static_cast<std::vector<uint8_t>*>(user_data);
        size_t n = size * nmemb;
        body->insert(body->end(), ptr, ptr + n);
        return n;
    }

    size_t on_header(char* ptr, size_t size, size_t nitems, void* user_data) {
        auto* etag = static_cast<std::string*>(user_data);
        size_t n = size * nitems;
        std::string value = http::header_value(std::string(ptr, n), "etag");
        if (!value.empty()) {
            *etag = value;
        }
        return n;
    }

    class BufferBody : public ObjectBody {
    public:
        explicit BufferBody(std::vector<uint8_t> data) : data_(std::move(data)) {}

        size_t read(uint8_t* buf, size_t len) override {
            size_t n = std::min(len, data_.size() - pos_);
            if (n > 0) {
                std::memcpy(buf, data_.data() + pos_, n);
                pos_ += n;
            }
            return n;
        }

    private:
        std::vector<uint8_t> data_;
        size_t pos_ = 0;
    };

    void check_setopt(CURLcode rc, const char* option) {
        if (rc != CURLE_OK) {
            throw ObjectStoreError(std::string("curl_easy_setopt(") + option + ") failed: " +
                                   curl_easy_strerror(rc));
        }
    }

} // namespace

namespace http {

bool is_connection_reset(CURLcode code, long os_errno) {
    return (code == CURLE_RECV_ERROR || code == CURLE_SEND_ERROR) && os_errno == ECONNRESET;
}

void raise_transfer_error(CURLcode code, long os_errno, const std::string& context) {
    std::string what = context + ": " + curl_easy_strerror(code);
    if (os_errno != 0) {
        what += " (" + errnoWithDescription(static_cast<int>(os_errno)) + ")";
    }
    if (is_connection_reset(code, os_errno)) {
        throw TransientNetworkError(what);
    }
    throw ObjectStoreError(what);
}

void raise_for_status(long status, const std::string& context, const std::string& body) {
    if (status >= 200 && status < 300) {
        return;
    }
    std::string what = context + ": HTTP " + std::to_string(status);
    if (!body.empty()) {
        what += ": " + body.substr(0, 256);
    }
    if (status == 404) {
        throw ObjectNotFoundError(what);
    }
    throw ObjectStoreError(what, status);
}

std::string parse_upload_id(const std::string& xml) {
    namespace pt = boost::property_tree;
    pt::ptree tree;
    try {
        std::istringstream in(xml);
        pt::read_xml(in, tree);
        return tree.get<std::string>("InitiateMultipartUploadResult.UploadId");
    } catch (const pt::ptree_error& e) {
        throw ObjectStoreError(std::string("malformed CreateMultipartUpload response: ") + e.what());
    }
}

std::string complete_multipart_xml(const std::vector<CompletedPart>& parts) {
    namespace pt = boost::property_tree;
    pt::ptree tree;
    pt::ptree& root = tree.put_child("CompleteMultipartUpload", pt::ptree());
    for (const auto& p : parts) {
        pt::ptree part;
        part.put("PartNumber", p.part_number);
        part.put("ETag", p.etag);
        root.add_child("Part", part);
    }
    std::ostringstream out;
    pt::write_xml(out, tree);
    return out.str();
}

std::string header_value(const std::string& line, const std::string& name) {
    size_t colon = line.find(':');
    if (colon == std::string::npos || colon != name.size()) {
        return std::string();
    }
    for (size_t i = 0; i < colon; i++) {
        if (std::tolower(static_cast<unsigned char>(line[i])) !=
            std::tolower(static_cast<unsigned char>(name[i]))) {
            return std::string();
        }
    }
    size_t begin = colon + 1;
    size_t end = line.size();
    while (begin < end && std::isspace(static_cast<unsigned char>(line[begin]))) begin++;
    while (end > begin && std::isspace(static_cast<unsigned char>(line[end - 1]))) end--;
    return line.substr(begin, end - begin);
}

} // namespace http

HttpObjectStore::HttpObjectStore(const std::string& endpoint, long connect_timeout_seconds)
    : endpoint_(endpoint), connect_timeout_(connect_timeout_seconds) {
    while (!endpoint_.empty() && endpoint_.back() == '/') {
        endpoint_.pop_back();
    }
    if (endpoint_.empty()) {
        throw std::invalid_argument("HttpObjectStore: endpoint is required");
    }
    global_init();
}

std::string HttpObjectStore::object_url(const std::string& bucket, const std::string& key) const {
    return endpoint_ + "/" + bucket + "/" + key;
}

HttpObjectStore::Response HttpObjectStore::perform(const std::string& method,
                                                   const std::string& url,
                                                   const std::vector<std::string>& headers,
                                                   const uint8_t* data, size_t len) const {
    CurlHandle curl(curl_easy_init());
    if (!curl) {
        throw ObjectStoreError("curl_easy_init failed");
    }

    Response resp;
    CURL* h = curl.get();
    check_setopt(curl_easy_setopt(h, CURLOPT_URL, url.c_str()), "URL");
    check_setopt(curl_easy_setopt(h, CURLOPT_NOSIGNAL, 1L), "NOSIGNAL");
    check_setopt(curl_easy_setopt(h, CURLOPT_CONNECTTIMEOUT, connect_timeout_), "CONNECTTIMEOUT");
    check_setopt(curl_easy_setopt(h, CURLOPT_WRITEFUNCTION, on_write), "WRITEFUNCTION");
    check_setopt(curl_easy_setopt(h, CURLOPT_WRITEDATA, &resp.body), "WRITEDATA");
    check_setopt(curl_easy_setopt(h, CURLOPT_HEADERFUNCTION, on_header), "HEADERFUNCTION");
    check_setopt(curl_easy_setopt(h, CURLOPT_HEADERDATA, &resp.etag), "HEADERDATA");

    if (method != "GET") {
        check_setopt(curl_easy_setopt(h, CURLOPT_CUSTOMREQUEST, method.c_str()), "CUSTOMREQUEST");
    }
    if (method == "PUT" || method == "POST") {
        static const char kEmpty[] = "";
        const char* fields = data ? reinterpret_cast<const char*>(data) : kEmpty;
        check_setopt(curl_easy_setopt(h, CURLOPT_POSTFIELDSIZE_LARGE,
                                      static_cast<curl_off_t>(len)), "POSTFIELDSIZE_LARGE");
        check_setopt(curl_easy_setopt(h, CURLOPT_POSTFIELDS, fields), "POSTFIELDS");
    }

    Slist slist;
    for (const auto& header : headers) {
        curl_slist* appended = curl_slist_append(slist.get(), header.c_str());
        if (!appended) {
            throw ObjectStoreError("curl_slist_append failed");
        }
        slist.release();
        slist.reset(appended);
    }
    if (slist) {
        check_setopt(curl_easy_setopt(h, CURLOPT_HTTPHEADER, slist.get()), "HTTPHEADER");
    }

    const std::string context = method + " " + url;
    CURLcode rc = curl_easy_perform(h);
    if (rc != CURLE_OK) {
        long os_errno = 0;
        if (curl_easy_getinfo(h, CURLINFO_OS_ERRNO, &os_errno) != CURLE_OK) {
            os_errno = 0;
        }
        http::raise_transfer_error(rc, os_errno, context);
    }

    if (curl_easy_getinfo(h, CURLINFO_RESPONSE_CODE, &resp.status) != CURLE_OK) {
        throw ObjectStoreError(context + ": no response status");
    }
    curl_off_t content_length = -1;
    if (curl_easy_getinfo(h, CURLINFO_CONTENT_LENGTH_DOWNLOAD_T, &content_length) == CURLE_OK) {
        resp.content_length = static_cast<int64_t>(content_length);
    }

    http::raise_for_status(resp.status, context,
                           std::string(resp.body.begin(), resp.body.end()));
    trace() << context << " -> " << resp.status << ", " << resp.body.size() << " bytes";
    return resp;
}

GetObjectResponse HttpObjectStore::get_object(const GetObjectRequest& req) {
    std::vector<std::string> headers;
    if (!req.range.empty()) {
        headers.push_back("Range: " + req.range);
    }
    Response resp = perform("GET", object_url(req.bucket, req.key), headers, nullptr, 0);

    GetObjectResponse out;
    out.content_length = resp.content_length >= 0
        ? resp.content_length
        : static_cast<int64_t>(resp.body.size());
    out.body = std::make_unique<BufferBody>(std::move(resp.body));
    return out;
}

void HttpObjectStore::put_object(const std::string& bucket, const std::string& key,
                                 const uint8_t* data, size_t len) {
    perform("PUT", object_url(bucket, key),
            {"Content-Type: application/octet-stream", "Expect:"}, data, len);
}

std::string HttpObjectStore::create_multipart_upload(const std::string& bucket,
                                                     const std::string& key) {
    Response resp = perform("POST", object_url(bucket, key) + "?uploads", {}, nullptr, 0);
    return http::parse_upload_id(std::string(resp.body.begin(), resp.body.end()));
}

std::string HttpObjectStore::upload_part(const std::string& bucket, const std::string& key,
                                         const std::string& upload_id, int part_number,
                                         const uint8_t* data, size_t len) {
    std::string url = object_url(bucket, key) + "?partNumber=" + std::to_string(part_number) +
                      "&uploadId=" + upload_id;
    Response resp = perform("PUT", url,
                            {"Content-Type: application/octet-stream", "Expect:"}, data, len);
    if (resp.etag.empty()) {
        throw ObjectStoreError("upload of part " + std::to_string(part_number) + " of " + key +
                               " returned no ETag");
    }
    return resp.etag;
}

void HttpObjectStore::complete_multipart_upload(const std::string& bucket, const std::string& key,
                                                const std::string& upload_id,
                                                const std::vector<CompletedPart>& parts) {
    std::string xml = http::complete_multipart_xml(parts);
    perform("POST", object_url(bucket, key) + "?uploadId=" + upload_id,
            {"Content-Type: application/xml"},
            reinterpret_cast<const uint8_t*>(xml.data()), xml.size());
}

void HttpObjectStore::abort_multipart_upload(const std::string& bucket, const std::string& key,
                                             const std::string& upload_id) {
    perform("DELETE", object_url(bucket, key) + "?uploadId=" + upload_id, {}, nullptr, 0);
}

} // namespace remote
} // namespace chunkstore
