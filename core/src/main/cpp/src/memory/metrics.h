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
#include <cstdint>
#include <functional>
#include <mutex>
#include <string>
#include <utility>
#include <vector>

namespace geopool {
namespace memory {

enum class MetricType {
    Counter,
    Gauge,
    Histogram
};

class Metric {
public:
    virtual ~Metric() = default;
    virtual MetricType type() const = 0;
    virtual const std::string& name() const = 0;
    virtual void reset() = 0;
};

// Monotonically increasing value
class Counter : public Metric {
public:
    explicit Counter(std::string name) : name_(std::move(name)), value_(0) {}

    MetricType type() const override { return MetricType::Counter; }
    const std::string& name() const override { return name_; }
    void reset() override { value_.store(0, std::memory_order_relaxed); }

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

// Value that moves both ways (live entries, live batches)
class Gauge : public Metric {
public:
    explicit Gauge(std::string name) : name_(std::move(name)), value_(0) {}

    MetricType type() const override { return MetricType::Gauge; }
    const std::string& name() const override { return name_; }
    void reset() override { value_.store(0, std::memory_order_relaxed); }

    void set(int64_t value) { value_.store(value, std::memory_order_relaxed); }
    void increment(int64_t delta = 1) { value_.fetch_add(delta, std::memory_order_relaxed); }
    void decrement(int64_t delta = 1) { value_.fetch_sub(delta, std::memory_order_relaxed); }

    int64_t value() const {
        return value_.load(std::memory_order_relaxed);
    }

private:
    std::string name_;
    std::atomic<int64_t> value_;
};

/**
 * Distribution of recorded values. Keeps the most recent kMaxSamples
 * samples for percentiles; count/sum/min/max cover everything recorded
 * since the last reset.
 */
class Histogram : public Metric {
public:
    static constexpr size_t kMaxSamples = 4096;

    explicit Histogram(std::string name) : name_(std::move(name)) {}

    MetricType type() const override { return MetricType::Histogram; }
    const std::string& name() const override { return name_; }
    void reset() override;

    void record(uint64_t value);

    struct Stats {
        uint64_t count = 0;
        uint64_t sum = 0;
        uint64_t min = 0;
        uint64_t max = 0;
        double mean = 0.0;
        uint64_t p50 = 0;
        uint64_t p95 = 0;
        uint64_t p99 = 0;
    };

    Stats get_stats() const;

private:
    std::string name_;
    mutable std::mutex mutex_;
    std::vector<uint64_t> samples_;
    size_t next_ = 0;          // Ring position once samples_ is full
    uint64_t count_ = 0;
    uint64_t sum_ = 0;
    uint64_t min_ = 0;
    uint64_t max_ = 0;
};

class Timer {
public:
    Timer() : start_(std::chrono::steady_clock::now()) {}

    uint64_t elapsed_ns() const {
        auto now = std::chrono::steady_clock::now();
        return std::chrono::duration_cast<std::chrono::nanoseconds>(now - start_).count();
    }

    uint64_t elapsed_us() const { return elapsed_ns() / 1000; }

private:
    std::chrono::steady_clock::time_point start_;
};

// Records elapsed microseconds into a histogram on destruction
class ScopedTimer {
public:
    explicit ScopedTimer(Histogram& histogram) : histogram_(histogram) {}
    ~ScopedTimer() { histogram_.record(timer_.elapsed_us()); }

    ScopedTimer(const ScopedTimer&) = delete;
    ScopedTimer& operator=(const ScopedTimer&) = delete;

private:
    Histogram& histogram_;
    Timer timer_;
};

/**
 * Registry of process metrics for export. Metrics register themselves
 * through metrics::initialize(); export walks them in registration order.
 */
class MetricsCollector {
public:
    static MetricsCollector& instance();

    void register_counter(Counter& counter);
    void register_gauge(Gauge& gauge);
    void register_histogram(Histogram& histogram);

    using ExportFunc = std::function<void(const std::string& name,
                                          MetricType type,
                                          const std::string& value)>;
    void export_metrics(const ExportFunc& func) const;

    void reset_all();

private:
    MetricsCollector() = default;

    mutable std::mutex mutex_;
    std::vector<Counter*> counters_;
    std::vector<Gauge*> gauges_;
    std::vector<Histogram*> histograms_;
};

// Predefined allocator metrics, shared by every controller in the process
namespace metrics {

    // Slots
    extern Counter slot_allocations;
    extern Counter slot_frees;
    extern Counter slot_updates_in_place;
    extern Gauge live_entries;

    // Batches
    extern Counter batch_creations;
    extern Counter batch_deletions;
    extern Gauge live_batches;

    // Growth
    extern Counter growth_events;
    extern Histogram growth_duration_us;

    // Compaction
    extern Counter compaction_runs;
    extern Counter slots_relocated;
    extern Counter bytes_relocated;
    extern Histogram compaction_duration_us;

    // Submission
    extern Counter draw_calls;

    // Register everything with the collector. Idempotent.
    void initialize();
}

#define METRIC_COUNTER_INC(name) geopool::memory::metrics::name.increment()
#define METRIC_COUNTER_ADD(name, delta) geopool::memory::metrics::name.increment(delta)
#define METRIC_GAUGE_SET(name, value) geopool::memory::metrics::name.set(value)
#define METRIC_GAUGE_INC(name) geopool::memory::metrics::name.increment()
#define METRIC_GAUGE_DEC(name) geopool::memory::metrics::name.decrement()
#define METRIC_HISTOGRAM_RECORD(name, value) geopool::memory::metrics::name.record(value)
#define METRIC_SCOPED_TIMER(name) geopool::memory::ScopedTimer _timer(geopool::memory::metrics::name)

} // namespace memory
} // namespace geopool
