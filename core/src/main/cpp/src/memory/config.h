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
#include <cstdint>
#include <cstddef>

namespace geopool {
namespace memory {

// Vertex layout shared by every backing buffer
namespace vertex_layout {
    // x, y, r, g, b, a
    constexpr size_t kFloatsPerVertex = 6;
    constexpr size_t kBytesPerFloat = sizeof(float);
    constexpr size_t kBytesPerVertex = kFloatsPerVertex * kBytesPerFloat;  // 24 bytes

    // Attribute 0: position (vec2), attribute 1: color (vec4)
    constexpr uint32_t kPositionComponents = 2;
    constexpr size_t kPositionOffset = 0;
    constexpr uint32_t kColorComponents = 4;
    constexpr size_t kColorOffset = kPositionComponents * kBytesPerFloat;  // 8 bytes
}

// Size class configuration
namespace size_class {
    // Per-slot vertex capacity for the fixed classes. The last class (XXL)
    // has no fixed capacity: each batch holds exactly one payload sized to fit.
    //   S:   1K vertices (~341 triangles)
    //   M:   4K vertices (~1365 triangles)
    //   L:  16K vertices (~5461 triangles)
    //   XL: 64K vertices (~21845 triangles)
    constexpr uint32_t kSlotCapacities[] = { 1024, 4096, 16384, 65536 };
    constexpr uint8_t kNumFixedClasses = sizeof(kSlotCapacities) / sizeof(kSlotCapacities[0]);
    constexpr uint8_t kNumClasses = kNumFixedClasses + 1;

    // Slots per batch, one entry per class including XXL
    constexpr uint32_t kSlotsPerBatch[] = { 256, 128, 64, 16, 1 };
    static_assert(sizeof(kSlotsPerBatch) / sizeof(kSlotsPerBatch[0]) == kNumClasses,
                  "kSlotsPerBatch needs one entry per size class");
}

// Dynamic growth configuration. A batch at or above the utilization threshold
// may double its buffer and slot array, up to kMaxCycles times (start size,
// 2x, 4x) or until the doubled buffer would exceed kMaxBatchBytes.
namespace growth {
    constexpr bool kEnabled = true;
    constexpr double kUtilThreshold = 0.75;
    constexpr uint32_t kMaxCycles = 2;
    constexpr size_t kMaxBatchBytes = 256 * 1024 * 1024;  // 256 MiB
}

// Defragmentation configuration. Batches below kThreshold utilization are
// compacted into other batches of the same pool; at most kMaxPerCycle batches
// are relocated per compaction pass.
namespace defrag {
    constexpr bool kEnabled = true;
    constexpr double kThreshold = 0.25;
    constexpr size_t kMaxPerCycle = 1;
}

// Free list configuration. Sorted by (batch id, slot index) so reuse favors
// earlier batches and later batches drain and become reclaimable.
namespace free_list {
    constexpr bool kSorted = true;
}

// Host loop cadence, in frames
namespace cadence {
    constexpr uint64_t kCompactionIntervalFrames = 60;
    constexpr uint64_t kValidateIntervalFrames = 100;
    constexpr uint64_t kStatsIntervalFrames = 0;  // 0 = never
}

} // namespace memory
} // namespace geopool
