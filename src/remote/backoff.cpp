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


#include "backoff.h"
#include <algorithm>
#include <cmath>
#include <thread>

namespace chunkstore {
namespace remote {

Backoff::Backoff(const BackoffPolicy& policy)
    : Backoff(policy, std::random_device{}()) {}

Backoff::Backoff(const BackoffPolicy& policy, uint64_t seed)
    : policy_(policy), rng_(seed) {
    if (policy_.max < policy_.min) {
        policy_.max = policy_.min;
    }
}

std::chrono::microseconds Backoff::next() {
    const double min = static_cast<double>(policy_.min.count());
    const double max = static_cast<double>(policy_.max.count());

    double base = min * std::pow(policy_.factor, static_cast<double>(attempt_));
    if (!(base < max)) {
        base = max;
    }

    double d = base;
    if (policy_.jitter) {
        std::uniform_real_distribution<double> dist(base / 2.0, base);
        d = dist(rng_);
    }

    auto delay = std::chrono::microseconds(static_cast<int64_t>(d));
    delay = std::max(delay, policy_.min);
    delay = std::max(delay, last_);
    delay = std::min(delay, policy_.max);

    attempt_++;
    last_ = delay;
    return delay;
}

void Backoff::reset() {
    attempt_ = 0;
    last_ = std::chrono::microseconds(0);
}

void SystemSleeper::sleep_for(std::chrono::microseconds d, const CancellationToken* token) {
    if (!token) {
        std::this_thread::sleep_for(d);
        return;
    }
    if (token->wait_for(d)) {
        throw CancelledError("cancelled during backoff");
    }
}

} // namespace remote
} // namespace chunkstore
