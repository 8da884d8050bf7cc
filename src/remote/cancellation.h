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
#include <chrono>
#include <condition_variable>
#include <mutex>

namespace chunkstore {
namespace remote {

/**
 * Cooperative cancellation for blocking remote operations. Once cancelled a
 * token stays cancelled; wait_for returns early when cancel() is called.
 */
class CancellationToken {
public:
    void cancel() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            cancelled_.store(true, std::memory_order_release);
        }
        cv_.notify_all();
    }

    bool cancelled() const {
        return cancelled_.load(std::memory_order_acquire);
    }

    // Sleeps up to d; returns true if the token was cancelled
    template <typename Rep, typename Period>
    bool wait_for(const std::chrono::duration<Rep, Period>& d) const {
        std::unique_lock<std::mutex> lock(mutex_);
        return cv_.wait_for(lock, d, [this] { return cancelled(); });
    }

private:
    mutable std::mutex mutex_;
    mutable std::condition_variable cv_;
    std::atomic<bool> cancelled_{false};
};

} // namespace remote
} // namespace chunkstore
