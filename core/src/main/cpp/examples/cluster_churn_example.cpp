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

#include <iostream>
#include <vector>
#include <random>
#include <chrono>
#include <cmath>
#include "memory/frame_cycle.h"
#include "memory/host_buffer_backend.h"
#include "memory/memory_controller.h"
#include "memory/stats_report.h"
#include "util/log_runtime.h"

using namespace geopool;
using namespace geopool::memory;
using namespace std;

// Triangle fan approximating a circle: `segments` triangles, 3 vertices each
static vector<float> make_cluster(EntryId id, uint32_t segments) {
    vector<float> v;
    v.reserve(static_cast<size_t>(segments) * 3 * vertex_layout::kFloatsPerVertex);
    const float cx = static_cast<float>(id % 100);
    const float cy = static_cast<float>(id / 100);
    const float r = 0.4f;
    const float step = 6.2831853f / static_cast<float>(segments);
    for (uint32_t s = 0; s < segments; ++s) {
        const float a0 = step * static_cast<float>(s);
        const float a1 = a0 + step;
        const float pts[3][2] = {{cx, cy},
                                 {cx + r * std::cos(a0), cy + r * std::sin(a0)},
                                 {cx + r * std::cos(a1), cy + r * std::sin(a1)}};
        for (const auto& p : pts) {
            v.insert(v.end(), {p[0], p[1], 0.2f, 0.5f, 0.9f, 1.0f});
        }
    }
    return v;
}

int main() {
    LogRuntime runtime(LogRuntime::configFromEnv());

    cout << "=== geopool cluster churn example ===\n\n";

    AllocatorConfig config = AllocatorConfig::defaults();
    if (!config.validate()) {
        cerr << "invalid allocator configuration in environment\n";
        return 1;
    }
    config.stats_interval_frames = config.stats_interval_frames ? config.stats_interval_frames : 100;

    HostBufferBackend backend;
    MemoryController controller(backend, config);
    FrameCycle frame(controller);

    mt19937 gen(12345);
    uniform_int_distribution<EntryId> id_dist(1, 2000);
    uniform_int_distribution<uint32_t> segment_dist(8, 400);
    uniform_int_distribution<int> op_dist(0, 9);
    vector<uint32_t> segments(2001, 0);   // 0 = not live

    auto regenerate = [&segments](EntryId id) { return make_cluster(id, segments[id]); };

    auto start = chrono::steady_clock::now();
    size_t resubmitted = 0;

    for (int f = 0; f < 300; ++f) {
        frame.begin_frame();
        for (int i = 0; i < 40; ++i) {
            EntryId id = id_dist(gen);
            if (op_dist(gen) < 7) {
                segments[id] = segment_dist(gen);
                frame.upload(id, make_cluster(id, segments[id]));
            } else if (segments[id] != 0) {
                frame.remove(id);
                segments[id] = 0;
            }
        }
        resubmitted += frame.finish_prepare(regenerate);
        frame.draw();
        frame.end_frame();

        if ((f + 1) % 50 == 0) {
            ControllerStats s = controller.stats();
            cout << "  frame " << (f + 1) << ": " << s.total_entries << " clusters in " << s.total_batches
                 << " batches, " << s.draw_calls_last_frame << " draw calls, " << s.growth_events
                 << " growths, " << s.compaction_events << " compactions\n";
        }
    }

    auto ms = chrono::duration_cast<chrono::milliseconds>(chrono::steady_clock::now() - start).count();
    cout << "\n300 frames in " << ms << " ms, " << resubmitted << " clusters resubmitted after growth\n";

    IntegrityReport report = controller.validate_integrity();
    cout << "Integrity: " << (report.ok() ? "ok" : "FAILED") << "\n";
    for (const string& e : report.errors) {
        cout << "  " << e << "\n";
    }

    cout << "\n";
    for (const string& line : format_report(controller)) {
        cout << line << "\n";
    }
    return report.ok() ? 0 : 1;
}
