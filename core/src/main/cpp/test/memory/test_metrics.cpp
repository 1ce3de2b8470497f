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
#include "memory/host_buffer_backend.h"
#include "memory/memory_controller.h"
#include "memory/metrics.h"
#include "test_helpers.h"

using namespace geopool::memory;
using geopool::memory::testing_helpers::make_payload;
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
    gauge.increment(8);
    EXPECT_EQ(gauge.value(), 50);

    gauge.decrement(60);
    EXPECT_EQ(gauge.value(), -10);

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

    EXPECT_EQ(counter.value(), static_cast<uint64_t>(num_threads * increments_per_thread));
}

TEST_F(MetricsTest, HistogramStats) {
    Histogram histogram("test_histogram");
    EXPECT_EQ(histogram.get_stats().count, 0u);

    for (uint64_t v = 1; v <= 100; ++v) {
        histogram.record(v);
    }

    Histogram::Stats stats = histogram.get_stats();
    EXPECT_EQ(stats.count, 100u);
    EXPECT_EQ(stats.sum, 5050u);
    EXPECT_EQ(stats.min, 1u);
    EXPECT_EQ(stats.max, 100u);
    EXPECT_DOUBLE_EQ(stats.mean, 50.5);
    EXPECT_EQ(stats.p50, 50u);
    EXPECT_EQ(stats.p99, 99u);

    histogram.reset();
    EXPECT_EQ(histogram.get_stats().count, 0u);
}

TEST_F(MetricsTest, HistogramKeepsRecentSamples) {
    Histogram histogram("ring_histogram");

    // Fill the ring with large values, then overwrite it with small ones
    for (size_t i = 0; i < Histogram::kMaxSamples; ++i) {
        histogram.record(1000);
    }
    for (size_t i = 0; i < Histogram::kMaxSamples; ++i) {
        histogram.record(1);
    }

    Histogram::Stats stats = histogram.get_stats();
    EXPECT_EQ(stats.count, 2 * Histogram::kMaxSamples);
    EXPECT_EQ(stats.max, 1000u) << "max covers everything since reset";
    EXPECT_EQ(stats.p99, 1u) << "percentiles cover the retained window";
}

TEST_F(MetricsTest, TimerBasics) {
    Timer timer;
    std::this_thread::sleep_for(10ms);

    auto elapsed_us = timer.elapsed_us();
    EXPECT_GE(elapsed_us, 10000u);
    EXPECT_GE(timer.elapsed_ns(), 10000000u);
}

TEST_F(MetricsTest, ScopedTimerRecordsMicroseconds) {
    Histogram histogram("scoped_timer");
    {
        ScopedTimer scoped(histogram);
        std::this_thread::sleep_for(2ms);
    }

    Histogram::Stats stats = histogram.get_stats();
    EXPECT_EQ(stats.count, 1u);
    EXPECT_GE(stats.max, 2000u);
}

TEST_F(MetricsTest, CollectorExportsRegisteredMetricsOnce) {
    metrics::initialize();
    metrics::initialize();

    std::map<std::string, int> seen;
    MetricsCollector::instance().export_metrics(
        [&seen](const std::string& name, MetricType, const std::string&) { seen[name]++; });

    EXPECT_EQ(seen["geopool.slot.allocations"], 1);
    EXPECT_EQ(seen["geopool.batch.live"], 1);
    EXPECT_EQ(seen["geopool.growth.duration_us"], 1);
    EXPECT_EQ(seen["geopool.compaction.slots_relocated"], 1);
    EXPECT_EQ(seen["geopool.draw.calls"], 1);
}

TEST_F(MetricsTest, ControllerUpdatesProcessMetrics) {
    HostBufferBackend backend;
    MemoryController mc(backend);

    const uint64_t allocations = metrics::slot_allocations.value();
    const uint64_t frees = metrics::slot_frees.value();
    const uint64_t in_place = metrics::slot_updates_in_place.value();
    const uint64_t creations = metrics::batch_creations.value();
    const int64_t live = metrics::live_entries.value();
    const uint64_t draws = metrics::draw_calls.value();

    mc.ensure_slot(1, make_payload(100));
    mc.ensure_slot(2, make_payload(2000));
    mc.ensure_slot(1, make_payload(50));
    mc.draw();
    mc.remove_cluster(2);

    EXPECT_EQ(metrics::slot_allocations.value() - allocations, 2u);
    EXPECT_EQ(metrics::slot_updates_in_place.value() - in_place, 1u);
    EXPECT_EQ(metrics::slot_frees.value() - frees, 1u);
    EXPECT_EQ(metrics::batch_creations.value() - creations, 2u);
    EXPECT_EQ(metrics::draw_calls.value() - draws, 2u);
    EXPECT_EQ(metrics::live_entries.value() - live, 1);
}
