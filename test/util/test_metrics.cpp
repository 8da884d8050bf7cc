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


#include <gtest/gtest.h>
#include <map>
#include <thread>
#include <chrono>
#include "util/metrics.h"

using namespace chunkstore::util;
using namespace std::chrono_literals;

class MetricsTest : public ::testing::Test {
protected:
    void SetUp() override {}
    void TearDown() override {}
};

TEST_F(MetricsTest, CounterBasics) {
    Counter counter("test_counter");

    EXPECT_EQ(counter.value(), 0u);
    EXPECT_EQ(counter.name(), "test_counter");
    EXPECT_EQ(counter.type(), MetricType::Counter);

    counter.increment();
    EXPECT_EQ(counter.value(), 1u);

    counter.increment(10);
    EXPECT_EQ(counter.value(), 11u);

    counter.reset();
    EXPECT_EQ(counter.value(), 0u);
}

TEST_F(MetricsTest, GaugeBasics) {
    Gauge gauge("test_gauge");

    EXPECT_EQ(gauge.value(), 0);
    EXPECT_EQ(gauge.type(), MetricType::Gauge);

    gauge.set(42);
    EXPECT_EQ(gauge.value(), 42);

    gauge.increment(8);
    EXPECT_EQ(gauge.value(), 50);

    gauge.decrement(20);
    EXPECT_EQ(gauge.value(), 30);

    gauge.reset();
    EXPECT_EQ(gauge.value(), 0);
}

TEST_F(MetricsTest, CounterConcurrency) {
    Counter counter("concurrent_counter");
    const int num_threads = 8;
    const int increments_per_thread = 10000;

    std::vector<std::thread> threads;
    for (int i = 0; i < num_threads; i++) {
        threads.emplace_back([&counter, increments_per_thread]() {
            for (int j = 0; j < increments_per_thread; j++) {
                counter.increment();
            }
        });
    }
    for (auto& t : threads) {
        t.join();
    }

    EXPECT_EQ(counter.value(), uint64_t(num_threads * increments_per_thread));
}

TEST_F(MetricsTest, HistogramStats) {
    Histogram h("latency");
    for (uint64_t v = 1; v <= 100; v++) {
        h.record(v);
    }

    auto stats = h.get_stats();
    EXPECT_EQ(stats.count, 100u);
    EXPECT_EQ(stats.sum, 5050u);
    EXPECT_EQ(stats.min, 1u);
    EXPECT_EQ(stats.max, 100u);
    EXPECT_DOUBLE_EQ(stats.mean, 50.5);
    // Rank 50 falls in [32, 63]; rank 99 in [64, 127], clamped to the max
    EXPECT_EQ(stats.p50, 63u);
    EXPECT_EQ(stats.p99, 100u);

    h.reset();
    EXPECT_EQ(h.get_stats().count, 0u);
    EXPECT_EQ(h.get_stats().max, 0u);
}

TEST_F(MetricsTest, HistogramBuckets) {
    EXPECT_EQ(Histogram::bucket_of(0), 0u);
    EXPECT_EQ(Histogram::bucket_of(1), 1u);
    EXPECT_EQ(Histogram::bucket_of(2), 2u);
    EXPECT_EQ(Histogram::bucket_of(3), 2u);
    EXPECT_EQ(Histogram::bucket_of(1024), 11u);
    EXPECT_EQ(Histogram::bucket_of(UINT64_MAX), 64u);

    EXPECT_EQ(Histogram::bucket_upper(0), 0u);
    EXPECT_EQ(Histogram::bucket_upper(11), 2047u);
    EXPECT_EQ(Histogram::bucket_upper(64), UINT64_MAX);

    Histogram h("constant");
    for (int i = 0; i < 1000; i++) {
        h.record(10);
    }
    auto stats = h.get_stats();
    EXPECT_EQ(stats.p50, 10u);
    EXPECT_EQ(stats.p99, 10u);
    EXPECT_EQ(stats.min, 10u);
}

TEST_F(MetricsTest, HistogramConcurrency) {
    Histogram h("concurrent");
    std::vector<std::thread> threads;
    for (int t = 0; t < 8; t++) {
        threads.emplace_back([&h, t]() {
            for (uint64_t i = 0; i < 10000; i++) {
                h.record(i + t);
            }
        });
    }
    for (auto& th : threads) {
        th.join();
    }
    auto stats = h.get_stats();
    EXPECT_EQ(stats.count, 80000u);
    EXPECT_EQ(stats.min, 0u);
    EXPECT_EQ(stats.max, 10006u);
}

TEST_F(MetricsTest, ScopedTimerRecords) {
    Histogram h("scoped");
    {
        ScopedTimer t(h);
        std::this_thread::sleep_for(2ms);
    }
    auto stats = h.get_stats();
    ASSERT_EQ(stats.count, 1u);
    EXPECT_GE(stats.max, 1000u);
}

TEST_F(MetricsTest, CollectorExportsPredefinedMetrics) {
    metrics::initialize();
    metrics::initialize();     // idempotent

    METRIC_COUNTER_INC(remote_retries);
    METRIC_COUNTER_ADD(remote_bytes_read, 10);

    std::map<std::string, std::string> exported;
    size_t retries_seen = 0;
    MetricsCollector::instance().export_metrics(
        [&](const std::string& name, MetricType, const std::string& value) {
            exported[name] = value;
            if (name == "remote_retries") retries_seen++;
        });

    EXPECT_EQ(retries_seen, 1u);
    EXPECT_TRUE(exported.count("remote_bytes_read"));
    EXPECT_TRUE(exported.count("index_cache_hits"));
    EXPECT_TRUE(exported.count("remote_read_latency_us"));
    EXPECT_GE(std::stoull(exported["remote_bytes_read"]), 10u);
}

TEST_F(MetricsTest, TextExportAndSnapshot) {
    metrics::initialize();
    auto before = metrics::snapshot();

    METRIC_COUNTER_INC(index_cache_hits);
    METRIC_COUNTER_INC(index_cache_hits);
    METRIC_COUNTER_INC(index_cache_misses);

    auto after = metrics::snapshot();
    EXPECT_EQ(after.index_cache_hits, before.index_cache_hits + 2);
    EXPECT_EQ(after.index_cache_misses, before.index_cache_misses + 1);
    EXPECT_GT(after.index_cache_hit_rate(), 0.0);
    EXPECT_LE(after.index_cache_hit_rate(), 1.0);

    std::string text = MetricsCollector::instance().to_text();
    EXPECT_NE(text.find("index_cache_hits " + std::to_string(after.index_cache_hits) + "\n"),
              std::string::npos);
    EXPECT_NE(text.find("remote_read_latency_us count="), std::string::npos);
}
