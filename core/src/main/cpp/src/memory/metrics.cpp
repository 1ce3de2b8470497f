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
#include <sstream>

namespace geopool {
namespace memory {

void Histogram::reset() {
    std::lock_guard<std::mutex> lock(mutex_);
    samples_.clear();
    next_ = 0;
    count_ = sum_ = min_ = max_ = 0;
}

void Histogram::record(uint64_t value) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (count_ == 0 || value < min_) min_ = value;
    if (count_ == 0 || value > max_) max_ = value;
    count_++;
    sum_ += value;

    if (samples_.size() < kMaxSamples) {
        samples_.push_back(value);
    } else {
        samples_[next_] = value;
        next_ = (next_ + 1) % kMaxSamples;
    }
}

Histogram::Stats Histogram::get_stats() const {
    std::lock_guard<std::mutex> lock(mutex_);

    Stats stats;
    if (count_ == 0) {
        return stats;
    }

    stats.count = count_;
    stats.sum = sum_;
    stats.min = min_;
    stats.max = max_;
    stats.mean = static_cast<double>(sum_) / static_cast<double>(count_);

    std::vector<uint64_t> sorted = samples_;
    std::sort(sorted.begin(), sorted.end());
    auto percentile = [&sorted](double p) -> uint64_t {
        size_t idx = static_cast<size_t>(p * (sorted.size() - 1));
        return sorted[idx];
    };
    stats.p50 = percentile(0.50);
    stats.p95 = percentile(0.95);
    stats.p99 = percentile(0.99);
    return stats;
}

MetricsCollector& MetricsCollector::instance() {
    static MetricsCollector collector;
    return collector;
}

void MetricsCollector::register_counter(Counter& counter) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (std::find(counters_.begin(), counters_.end(), &counter) == counters_.end()) {
        counters_.push_back(&counter);
    }
}

void MetricsCollector::register_gauge(Gauge& gauge) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (std::find(gauges_.begin(), gauges_.end(), &gauge) == gauges_.end()) {
        gauges_.push_back(&gauge);
    }
}

void MetricsCollector::register_histogram(Histogram& histogram) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (std::find(histograms_.begin(), histograms_.end(), &histogram) == histograms_.end()) {
        histograms_.push_back(&histogram);
    }
}

void MetricsCollector::export_metrics(const ExportFunc& func) const {
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
            << ",max=" << stats.max
            << ",p50=" << stats.p50
            << ",p95=" << stats.p95
            << ",p99=" << stats.p99;
        func(histogram->name(), MetricType::Histogram, oss.str());
    }
}

void MetricsCollector::reset_all() {
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto* counter : counters_) counter->reset();
    for (auto* gauge : gauges_) gauge->reset();
    for (auto* histogram : histograms_) histogram->reset();
}

namespace metrics {

    Counter slot_allocations("geopool.slot.allocations");
    Counter slot_frees("geopool.slot.frees");
    Counter slot_updates_in_place("geopool.slot.updates_in_place");
    Gauge live_entries("geopool.entries.live");

    Counter batch_creations("geopool.batch.creations");
    Counter batch_deletions("geopool.batch.deletions");
    Gauge live_batches("geopool.batch.live");

    Counter growth_events("geopool.growth.events");
    Histogram growth_duration_us("geopool.growth.duration_us");

    Counter compaction_runs("geopool.compaction.runs");
    Counter slots_relocated("geopool.compaction.slots_relocated");
    Counter bytes_relocated("geopool.compaction.bytes_relocated");
    Histogram compaction_duration_us("geopool.compaction.duration_us");

    Counter draw_calls("geopool.draw.calls");

    void initialize() {
        auto& collector = MetricsCollector::instance();
        collector.register_counter(slot_allocations);
        collector.register_counter(slot_frees);
        collector.register_counter(slot_updates_in_place);
        collector.register_gauge(live_entries);
        collector.register_counter(batch_creations);
        collector.register_counter(batch_deletions);
        collector.register_gauge(live_batches);
        collector.register_counter(growth_events);
        collector.register_histogram(growth_duration_us);
        collector.register_counter(compaction_runs);
        collector.register_counter(slots_relocated);
        collector.register_counter(bytes_relocated);
        collector.register_histogram(compaction_duration_us);
        collector.register_counter(draw_calls);
    }

} // namespace metrics

} // namespace memory
} // namespace geopool
