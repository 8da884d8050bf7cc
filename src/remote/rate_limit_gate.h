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
#include <condition_variable>
#include <cstddef>
#include <mutex>
#include <optional>
#include "cancellation.h"

namespace chunkstore {
namespace remote {

/**
 * Counting semaphore bounding concurrent object-store requests. Shared by
 * every reader that should count against the same limit.
 */
class RateLimitGate {
public:
    // Holds one unit of capacity until destroyed
    class Slot {
    public:
        Slot() = default;
        ~Slot() { release(); }

        Slot(Slot&& o) noexcept : gate_(o.gate_) { o.gate_ = nullptr; }
        Slot& operator=(Slot&& o) noexcept {
            if (this != &o) {
                release();
                gate_ = o.gate_;
                o.gate_ = nullptr;
            }
            return *this;
        }

        Slot(const Slot&) = delete;
        Slot& operator=(const Slot&) = delete;

        bool held() const { return gate_ != nullptr; }

        void release() {
            if (gate_) {
                gate_->release();
                gate_ = nullptr;
            }
        }

    private:
        friend class RateLimitGate;
        explicit Slot(RateLimitGate* gate) : gate_(gate) {}

        RateLimitGate* gate_ = nullptr;
    };

    explicit RateLimitGate(size_t capacity);

    RateLimitGate(const RateLimitGate&) = delete;
    RateLimitGate& operator=(const RateLimitGate&) = delete;

    // Blocks until a slot is free; throws CancelledError if token is cancelled first
    Slot acquire(const CancellationToken* token = nullptr);

    std::optional<Slot> try_acquire();

    size_t capacity() const { return capacity_; }
    size_t in_flight() const;
    size_t high_water_mark() const;

private:
    void release();

    const size_t capacity_;
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    size_t in_flight_ = 0;
    size_t high_water_ = 0;
};

} // namespace remote
} // namespace chunkstore
