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

#include "metrics.h"
#include <algorithm>
#include <cmath>
#include <sstream>

namespace chunkstore {
namespace util {

void Histogram::reset() {
    for (auto& b : buckets_) {
        b.store(0, std::memory_order_relaxed);
    }
    count_.store(0, std::memory_order_relaxed);
    sum_.store(0, std::memory_order_relaxed);
    min_.store(UINT64_MAX, std::memory_order_relaxed);
    max_.store(0, std::memory_order_relaxed);
}

size_t Histogram::bucket_of(uint64_t value) {
    return value == 0 ? 0 : 64 - static_cast<size_t>(__builtin_clzll(value));
}

uint64_t Histogram::bucket_upper(size_t bucket) {
    if (bucket == 0) return 0;
    if (bucket >= 64) return UINT64_MAX;
    return (uint64_t(1) << bucket) - 1;
}

void Histogram::record(uint64_t value) {
    buckets_[bucket_of(value)].fetch_add(1, std::memory_order_relaxed);
    count_.fetch_add(1, std::memory_order_relaxed);
    sum_.fetch_add(value, std::memory_order_relaxed);

    uint64_t cur = min_.load(std::memory_order_relaxed);
    while (value < cur && !min_.compare_exchange_weak(cur, value, std::memory_order_relaxed)) {
    }
    cur = max_.load(std::memory_order_relaxed);
    while (value > cur && !max_.compare_exchange_weak(cur, value, std::memory_order_relaxed)) {
    }
}

Histogram::Stats Histogram::get_stats() const {
    Stats stats{};
    std::array<uint64_t, kBuckets> counts;
    uint64_t total = 0;
    for (size_t b = 0; b < kBuckets; b++) {
        counts[b] = buckets_[b].load(std::memory_order_relaxed);
        total += counts[b];
    }
    if (total == 0) {
        return stats;
    }

    stats.count = total;
    stats.sum = sum_.load(std::memory_order_relaxed);
    stats.min = min_.load(std::memory_order_relaxed);
    stats.max = max_.load(std::memory_order_relaxed);
    stats.mean = static_cast<double>(stats.sum) / total;

    auto percentile = [&](double p) -> uint64_t {
        uint64_t rank = std::max<uint64_t>(1, static_cast<uint64_t>(std::ceil(p * total)));
        uint64_t seen = 0;
        for (size_t b = 0; b < kBuckets; b++) {
            seen += counts[b];
            if (seen >= rank) {
                return std::min(bucket_upper(b), stats.max);
            }
        }
        return stats.max;
    };

    stats.p50 = percentile(0.50);
    stats.p95 = percentile(0.95);
    stats.p99 = percentile(0.99);
    return stats;
}

MetricsCollector& MetricsCollector::instance() {
    static MetricsCollector* instance = new MetricsCollector();
    return *instance;
}

void MetricsCollector::register_counter(Counter& counter) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (std::find(counters_.begin(), counters_.end(), &counter) == counters_.end())
        counters_.push_back(&counter);
}

void MetricsCollector::register_gauge(Gauge& gauge) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (std::find(gauges_.begin(), gauges_.end(), &gauge) == gauges_.end())
        gauges_.push_back(&gauge);
}

void MetricsCollector::register_histogram(Histogram& histogram) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (std::find(histograms_.begin(), histograms_.end(), &histogram) == histograms_.end())
        histograms_.push_back(&histogram);
}

void MetricsCollector::export_metrics(ExportFunc func) const {
    std::lock_guard<std::mutex> lock(mutex_);

    for (const auto* counter : counters_) {
        func(counter->name(), MetricType::Counter, std::to_string(counter->value()));
    }

    for (const auto* gauge : gauges_) {
        func(gauge->name(), MetricType::Gauge, std::to_string(gauge->value()));
    }

    for (const auto* histogram : histograms_) {
        auto stats = histogram->get_stats();
        std::ostringstream oss;
        oss << "count=" << stats.count
            << ",sum=" << stats.sum
            << ",mean=" << stats.mean
            << ",p50=" << stats.p50
            << ",p95=" << stats.p95
            << ",p99=" << stats.p99;
        func(histogram->name(), MetricType::Histogram, oss.str());
    }
}

std::string MetricsCollector::to_text() const {
    std::ostringstream out;
    export_metrics([&out](const std::string& name, MetricType, const std::string& value) {
        out << name << " " << value << "\n";
    });
    return out.str();
}

void MetricsCollector::reset_all() {
    std::lock_guard<std::mutex> lock(mutex_);

    for (auto* counter : counters_) {
        counter->reset();
    }
    for (auto* gauge : gauges_) {
        gauge->reset();
    }
    for (auto* histogram : histograms_) {
        histogram->reset();
    }
}

namespace metrics {

    Counter remote_ranged_reads("remote_ranged_reads");
    Counter remote_bytes_read("remote_bytes_read");
    Counter remote_retries("remote_retries");
    Counter remote_read_errors("remote_read_errors");
    Gauge remote_reads_in_flight("remote_reads_in_flight");
    Histogram remote_read_latency_us("remote_read_latency_us");

    Counter index_bootstraps("index_bootstraps");
    Counter index_cache_hits("index_cache_hits");
    Counter index_cache_misses("index_cache_misses");
    Counter index_cache_evictions("index_cache_evictions");

    Counter tables_persisted("tables_persisted");
    Counter bytes_persisted("bytes_persisted");

    void initialize() {
        auto& collector = MetricsCollector::instance();
        collector.register_counter(remote_ranged_reads);
        collector.register_counter(remote_bytes_read);
        collector.register_counter(remote_retries);
        collector.register_counter(remote_read_errors);
        collector.register_gauge(remote_reads_in_flight);
        collector.register_histogram(remote_read_latency_us);
        collector.register_counter(index_bootstraps);
        collector.register_counter(index_cache_hits);
        collector.register_counter(index_cache_misses);
        collector.register_counter(index_cache_evictions);
        collector.register_counter(tables_persisted);
        collector.register_counter(bytes_persisted);
    }

    Snapshot snapshot() {
        Snapshot s;
        s.ranged_reads = remote_ranged_reads.value();
        s.bytes_read = remote_bytes_read.value();
        s.retries = remote_retries.value();
        s.read_errors = remote_read_errors.value();
        s.reads_in_flight = remote_reads_in_flight.value();
        s.index_bootstraps = index_bootstraps.value();
        s.index_cache_hits = index_cache_hits.value();
        s.index_cache_misses = index_cache_misses.value();
        s.index_cache_evictions = index_cache_evictions.value();
        s.tables_persisted = tables_persisted.value();
        s.bytes_persisted = bytes_persisted.value();
        return s;
    }
}

} // namespace util
} // namespace chunkstore
