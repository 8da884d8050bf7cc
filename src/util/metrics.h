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
#include <array>
#include <cstdint>
#include <string>
#include <functional>
#include <chrono>
#include <atomic>
#include <mutex>
#include <vector>

namespace chunkstore {
namespace util {

enum class MetricType {
    Counter,
    Gauge,
    Histogram
};

class Metric {
public:
    virtual ~Metric() = default;
    virtual MetricType type() const = 0;
    virtual std::string name() const = 0;
    virtual void reset() = 0;
};

// Counter - monotonically increasing value
class Counter : public Metric {
public:
    explicit Counter(const std::string& name) : name_(name), value_(0) {}

    MetricType type() const override { return MetricType::Counter; }
    std::string name() const override { return name_; }
    void reset() override { value_.store(0); }

    void increment(uint64_t delta = 1) {
        value_.fetch_add(delta, std::memory_order_relaxed);
    }

    uint64_t value() const {
        return value_.load(std::memory_order_relaxed);
    }

private:
    std::string name_;
    std::atomic<uint64_t> value_;
};

// Gauge - value that can go up or down
class Gauge : public Metric {
public:
    explicit Gauge(const std::string& name) : name_(name), value_(0) {}

    MetricType type() const override { return MetricType::Gauge; }
    std::string name() const override { return name_; }
    void reset() override { value_.store(0); }

    void set(int64_t value) {
        value_.store(value, std::memory_order_relaxed);
    }

    void increment(int64_t delta = 1) {
        value_.fetch_add(delta, std::memory_order_relaxed);
    }

    void decrement(int64_t delta = 1) {
        value_.fetch_sub(delta, std::memory_order_relaxed);
    }

    int64_t value() const {
        return value_.load(std::memory_order_relaxed);
    }

private:
    std::string name_;
    std::atomic<int64_t> value_;
};

/**
 * Histogram over power-of-two buckets: bucket b counts values whose bit
 * width is b, so recording is a handful of relaxed atomics and never locks.
 * Percentiles report the upper edge of the bucket holding the rank, clamped
 * to the observed maximum, and are therefore accurate to within 2x.
 */
class Histogram : public Metric {
public:
    static constexpr size_t kBuckets = 65;

    explicit Histogram(const std::string& name) : name_(name) { reset(); }

    MetricType type() const override { return MetricType::Histogram; }
    std::string name() const override { return name_; }
    void reset() override;

    void record(uint64_t value);

    struct Stats {
        uint64_t count;
        uint64_t sum;
        uint64_t min;
        uint64_t max;
        double mean;
        uint64_t p50;
        uint64_t p95;
        uint64_t p99;
    };

    Stats get_stats() const;

    static size_t bucket_of(uint64_t value);
    static uint64_t bucket_upper(size_t bucket);

private:
    std::string name_;
    std::array<std::atomic<uint64_t>, kBuckets> buckets_;
    std::atomic<uint64_t> count_{0};
    std::atomic<uint64_t> sum_{0};
    std::atomic<uint64_t> min_{UINT64_MAX};
    std::atomic<uint64_t> max_{0};
};

class Timer {
public:
    Timer() : start_(std::chrono::steady_clock::now()) {}

    uint64_t elapsed_ns() const {
        auto now = std::chrono::steady_clock::now();
        return std::chrono::duration_cast<std::chrono::nanoseconds>(now - start_).count();
    }

    uint64_t elapsed_us() const {
        return elapsed_ns() / 1000;
    }

private:
    std::chrono::steady_clock::time_point start_;
};

// Scoped timer that records microseconds to a histogram on destruction
class ScopedTimer {
public:
    explicit ScopedTimer(Histogram& histogram)
        : histogram_(histogram), timer_() {}

    ~ScopedTimer() {
        histogram_.record(timer_.elapsed_us());
    }

private:
    Histogram& histogram_;
    Timer timer_;
};

class MetricsCollector {
public:
    static MetricsCollector& instance();

    void register_counter(Counter& counter);
    void register_gauge(Gauge& gauge);
    void register_histogram(Histogram& histogram);

    using ExportFunc = std::function<void(const std::string& name,
                                          MetricType type,
                                          const std::string& value)>;
    void export_metrics(ExportFunc func) const;

    // One "name value" line per registered metric
    std::string to_text() const;

    void reset_all();

private:
    MetricsCollector() = default;

    mutable std::mutex mutex_;
    std::vector<Counter*> counters_;
    std::vector<Gauge*> gauges_;
    std::vector<Histogram*> histograms_;
};

// Predefined metrics for the chunk store
namespace metrics {

    // Remote ranged reads
    extern Counter remote_ranged_reads;
    extern Counter remote_bytes_read;
    extern Counter remote_retries;
    extern Counter remote_read_errors;
    extern Gauge remote_reads_in_flight;
    extern Histogram remote_read_latency_us;

    // Table indexes
    extern Counter index_bootstraps;
    extern Counter index_cache_hits;
    extern Counter index_cache_misses;
    extern Counter index_cache_evictions;

    // Write path
    extern Counter tables_persisted;
    extern Counter bytes_persisted;

    // Registers every predefined metric with the collector; idempotent
    void initialize();

    // Point-in-time copy of the chunk store counters
    struct Snapshot {
        uint64_t ranged_reads;
        uint64_t bytes_read;
        uint64_t retries;
        uint64_t read_errors;
        int64_t reads_in_flight;
        uint64_t index_bootstraps;
        uint64_t index_cache_hits;
        uint64_t index_cache_misses;
        uint64_t index_cache_evictions;
        uint64_t tables_persisted;
        uint64_t bytes_persisted;

        // Fraction of index lookups served from the cache, 0 before any lookup
        double index_cache_hit_rate() const {
            uint64_t total = index_cache_hits + index_cache_misses;
            return total == 0 ? 0.0 : static_cast<double>(index_cache_hits) / total;
        }
    };

    Snapshot snapshot();
}

#define METRIC_COUNTER_INC(name) ::chunkstore::util::metrics::name.increment()
#define METRIC_COUNTER_ADD(name, delta) ::chunkstore::util::metrics::name.increment(delta)
#define METRIC_GAUGE_INC(name) ::chunkstore::util::metrics::name.increment()
#define METRIC_GAUGE_DEC(name) ::chunkstore::util::metrics::name.decrement()
#define METRIC_SCOPED_TIMER(name) ::chunkstore::util::ScopedTimer _timer(::chunkstore::util::metrics::name)

} // namespace util
} // namespace chunkstore
