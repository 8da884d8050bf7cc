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
#include <stdexcept>
#include <string>

namespace chunkstore {

enum class ErrorKind {
    Codec,              // malformed varint/float encoding
    CorruptIndex,       // table index fails structural checks
    IntegrityMismatch,  // caller and table (or server) disagree on sizes/checksums
    TransientNetwork,   // connection reset by peer; retried
    Network,            // any other network or protocol failure
    ShortRead,          // fewer bytes than requested after a successful read
    Io,                 // local file system failure
    Cancelled           // caller cancelled a blocking operation
};

inline const char* to_string(ErrorKind kind) {
    switch (kind) {
    case ErrorKind::Codec:             return "Codec";
    case ErrorKind::CorruptIndex:      return "CorruptIndex";
    case ErrorKind::IntegrityMismatch: return "IntegrityMismatch";
    case ErrorKind::TransientNetwork:  return "TransientNetwork";
    case ErrorKind::Network:           return "Network";
    case ErrorKind::ShortRead:         return "ShortRead";
    case ErrorKind::Io:                return "Io";
    case ErrorKind::Cancelled:         return "Cancelled";
    }
    return "Unknown";
}

/**
 * Base class of every error raised by the chunk store.
 * Absence of a chunk is never an error; lookups return an empty optional.
 */
class StoreError : public std::runtime_error {
public:
    StoreError(ErrorKind kind, const std::string& what)
        : std::runtime_error(what), kind_(kind) {}

    ErrorKind kind() const noexcept { return kind_; }

private:
    ErrorKind kind_;
};

class CodecError : public StoreError {
public:
    explicit CodecError(const std::string& what)
        : StoreError(ErrorKind::Codec, what) {}
};

class CorruptIndexError : public StoreError {
public:
    explicit CorruptIndexError(const std::string& what)
        : StoreError(ErrorKind::CorruptIndex, what) {}
};

class IntegrityMismatchError : public StoreError {
public:
    explicit IntegrityMismatchError(const std::string& what)
        : StoreError(ErrorKind::IntegrityMismatch, what) {}
};

class TransientNetworkError : public StoreError {
public:
    explicit TransientNetworkError(const std::string& what)
        : StoreError(ErrorKind::TransientNetwork, what) {}
};

class ObjectStoreError : public StoreError {
public:
    explicit ObjectStoreError(const std::string& what, long status = 0)
        : StoreError(ErrorKind::Network, what), status_(status) {}

    // HTTP status when the failure came from a response, 0 otherwise
    long status() const noexcept { return status_; }

private:
    long status_;
};

class ObjectNotFoundError : public ObjectStoreError {
public:
    explicit ObjectNotFoundError(const std::string& what)
        : ObjectStoreError(what, 404) {}
};

class ShortReadError : public StoreError {
public:
    ShortReadError(const std::string& what, size_t expected, size_t actual)
        : StoreError(ErrorKind::ShortRead, what), expected_(expected), actual_(actual) {}

    size_t expected() const noexcept { return expected_; }
    size_t actual() const noexcept { return actual_; }

private:
    size_t expected_;
    size_t actual_;
};

class IoError : public StoreError {
public:
    explicit IoError(const std::string& what)
        : StoreError(ErrorKind::Io, what) {}
};

class CancelledError : public StoreError {
public:
    explicit CancelledError(const std::string& what)
        : StoreError(ErrorKind::Cancelled, what) {}
};

} // namespace chunkstore
