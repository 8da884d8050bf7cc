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
#include <chrono>
#include <cstdint>
#include <random>
#include <string>
#include <utility>
#include "cancellation.h"
#include "../errors.h"
#include "../store_config.h"
#include "../util/log.h"
#include "../util/metrics.h"

namespace chunkstore {
namespace remote {

struct BackoffPolicy {
    std::chrono::microseconds min{kBackoffMinMicros};
    std::chrono::microseconds max{kBackoffMaxMicros};
    double factor = kBackoffFactor;
    bool jitter = true;

    static BackoffPolicy defaults() { return BackoffPolicy(); }

    static BackoffPolicy from(const StoreConfig& cfg) {
        BackoffPolicy p;
        p.min = std::chrono::microseconds(cfg.backoff_min_us);
        p.max = std::chrono::microseconds(cfg.backoff_max_us);
        p.factor = cfg.backoff_factor;
        p.jitter = cfg.backoff_jitter;
        return p;
    }
};

/**
 * Exponential backoff delay generator.
 *
 * Attempt k has base delay min * factor^k, capped at max. With jitter the
 * delay is drawn from [base/2, base] and then raised to at least min and to
 * at least the previous delay, so successive delays never shrink and never
 * exceed max.
 */
class Backoff {
public:
    explicit Backoff(const BackoffPolicy& policy = BackoffPolicy::defaults());
    Backoff(const BackoffPolicy& policy, uint64_t seed);

    std::chrono::microseconds next();
    void reset();

    unsigned attempt() const { return attempt_; }
    const BackoffPolicy& policy() const { return policy_; }

private:
    BackoffPolicy policy_;
    unsigned attempt_ = 0;
    std::chrono::microseconds last_{0};
    std::mt19937_64 rng_;
};

class Sleeper {
public:
    virtual ~Sleeper() = default;

    // Sleeps for d; throws CancelledError if token is cancelled first
    virtual void sleep_for(std::chrono::microseconds d, const CancellationToken* token) = 0;
};

class SystemSleeper : public Sleeper {
public:
    void sleep_for(std::chrono::microseconds d, const CancellationToken* token) override;
};

inline void throw_if_cancelled(const CancellationToken* token, const std::string& description) {
    if (token && token->cancelled()) {
        throw CancelledError(description + " cancelled");
    }
}

/**
 * Runs op until it returns or fails with something other than a connection
 * reset. Resets are retried indefinitely, strictly one attempt at a time,
 * sleeping Backoff::next() between attempts. The token is checked before
 * every attempt and every sleep.
 */
template <typename Op>
auto retry_on_connection_reset(Op&& op, const BackoffPolicy& policy, Sleeper& sleeper,
                               const CancellationToken* token, const std::string& description)
    -> decltype(op()) {
    Backoff backoff(policy);
    for (;;) {
        throw_if_cancelled(token, description);
        try {
            return op();
        } catch (const TransientNetworkError& e) {
            auto delay = backoff.next();
            METRIC_COUNTER_INC(remote_retries);
            warning() << "Retrying " << description << " in "
                      << static_cast<long long>(delay.count()) << "us (attempt "
                      << backoff.attempt() << "): " << e.what();
            throw_if_cancelled(token, description);
            sleeper.sleep_for(delay, token);
        }
    }
}

} // namespace remote
} // namespace chunkstore
