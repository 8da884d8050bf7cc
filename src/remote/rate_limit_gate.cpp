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


#include "rate_limit_gate.h"
#include <algorithm>
#include <chrono>
#include <stdexcept>
#include "../errors.h"

namespace chunkstore {
namespace remote {

namespace {
    // Waiters re-check their cancellation token at this interval
    constexpr std::chrono::milliseconds kCancelPollInterval(5);
}

RateLimitGate::RateLimitGate(size_t capacity) : capacity_(capacity) {
    if (capacity == 0) {
        throw std::invalid_argument("RateLimitGate: capacity must be at least 1");
    }
}

RateLimitGate::Slot RateLimitGate::acquire(const CancellationToken* token) {
    std::unique_lock<std::mutex> lock(mutex_);
    // A waiter that gives up may have consumed a release() notification;
    // hand it on so another waiter sees the free slot.
    auto give_up = [&]() {
        lock.unlock();
        cv_.notify_one();
        throw CancelledError("cancelled while waiting for a request slot");
    };
    while (in_flight_ >= capacity_) {
        if (token && token->cancelled()) {
            give_up();
        }
        if (token) {
            cv_.wait_for(lock, kCancelPollInterval);
        } else {
            cv_.wait(lock);
        }
    }
    if (token && token->cancelled()) {
        give_up();
    }
    in_flight_++;
    high_water_ = std::max(high_water_, in_flight_);
    return Slot(this);
}

std::optional<RateLimitGate::Slot> RateLimitGate::try_acquire() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (in_flight_ >= capacity_) {
        return std::nullopt;
    }
    in_flight_++;
    high_water_ = std::max(high_water_, in_flight_);
    return Slot(this);
}

void RateLimitGate::release() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        in_flight_--;
    }
    cv_.notify_one();
}

size_t RateLimitGate::in_flight() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return in_flight_;
}

size_t RateLimitGate::high_water_mark() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return high_water_;
}

} // namespace remote
} // namespace chunkstore
