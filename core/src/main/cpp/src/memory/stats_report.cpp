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

#include "stats_report.h"
#include <cstdio>
#include <iomanip>
#include <sstream>
#include "memory_controller.h"

namespace geopool {
namespace memory {

namespace {
    const char* const kFilled = "\xe2\x96\x88";  // U+2588 full block
    const char* const kEmpty  = "\xe2\x96\x91";  // U+2591 light shade

    double ratio(size_t part, size_t whole) {
        return whole > 0 ? static_cast<double>(part) / static_cast<double>(whole) : 0.0;
    }

    std::string percent(double r, int precision) {
        std::ostringstream oss;
        oss << std::fixed << std::setprecision(precision) << r * 100 << "%";
        return oss.str();
    }
}

std::string format_number(int64_t n) {
    char buf[32];
    if (n < 1000) {
        std::snprintf(buf, sizeof(buf), "%lld", static_cast<long long>(n));
    } else if (n < 1000000) {
        std::snprintf(buf, sizeof(buf), "%.1fK", static_cast<double>(n) / 1000.0);
    } else {
        std::snprintf(buf, sizeof(buf), "%.1fM", static_cast<double>(n) / 1000000.0);
    }
    return buf;
}

std::string utilization_bar(double utilization, int width) {
    if (utilization < 0) utilization = 0;
    if (utilization > 1) utilization = 1;
    if (width < 0) width = 0;

    int filled = static_cast<int>(utilization * width);
    std::string bar;
    for (int i = 0; i < width; ++i) {
        bar += i < filled ? kFilled : kEmpty;
    }
    return bar;
}

std::vector<std::string> format_report(const MemoryController& controller) {
    const ControllerStats s = controller.stats();
    std::vector<std::string> lines;
    std::ostringstream oss;

    lines.push_back("===== Memory Controller Stats =====");

    oss << s.compaction_events << " compactions (" << s.slots_relocated << " slots relocated, "
        << s.batch_deletions << " batches deleted, " << s.last_compaction_us << "us last), "
        << s.growth_events << " growth events (" << s.last_growth_us << "us last)";
    lines.push_back(oss.str());

    oss.str("");
    oss << percent(ratio(s.active_slots, s.total_slots), 1) << " slots active (" << s.active_slots << "/"
        << s.total_slots << "), " << percent(ratio(s.active_batches, s.total_batches), 1)
        << " batches active (" << s.active_batches << "/" << s.total_batches << "), " << s.free_slots
        << " free-list slots, " << format_number(static_cast<int64_t>(s.total_bytes)) << " bytes, "
        << s.total_entries << " entries (" << format_number(static_cast<int64_t>(s.total_vertices))
        << " vertices), " << s.draw_calls_last_frame << " draw calls";
    lines.push_back(oss.str());

    for (SizeClass c : kAllSizeClasses) {
        const ClassStats& cs = s.of(c);
        if (cs.batches == 0) {
            continue;
        }

        double slots_util = ratio(cs.active_slots, cs.slots);
        oss.str("");
        oss << "  [" << std::setw(8) << to_string(c) << "] " << utilization_bar(slots_util, 12) << " "
            << percent(slots_util, 0) << " slots active (" << cs.active_slots << "/" << cs.slots << "), "
            << percent(ratio(cs.active_batches, cs.batches), 0) << " batches active (" << cs.active_batches
            << "/" << cs.batches << "), " << cs.free_slots << " free-list slots, "
            << format_number(static_cast<int64_t>(cs.bytes)) << " bytes ("
            << format_number(static_cast<int64_t>(cs.vertices)) << " vertices)";
        lines.push_back(oss.str());

        for (const auto& entry : controller.pool(c).batches()) {
            const Batch& batch = *entry.second;
            oss.str("");
            oss << "      batch#" << std::setw(3) << std::setfill('0') << batch.id() << std::setfill(' ')
                << "  " << utilization_bar(batch.utilization(), 8) << " " << percent(batch.utilization(), 0)
                << " slots active (" << batch.active_count() << "/" << batch.slot_count() << "), "
                << format_number(static_cast<int64_t>(batch.size_bytes())) << " bytes ("
                << format_number(static_cast<int64_t>(batch.used_vertices())) << " vertices), "
                << (1u << batch.growth_cycles()) << "x growth ("
                << format_number(batch.initial_capacity()) << " -> "
                << format_number(batch.total_capacity()) << ")";
            lines.push_back(oss.str());
        }
    }

    lines.push_back("===================================");
    return lines;
}

} // namespace memory
} // namespace geopool
