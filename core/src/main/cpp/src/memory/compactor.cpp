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

#include "compactor.h"
#include <algorithm>
#include <string>
#include "memory_controller.h"
#include "../util/log.h"

namespace geopool {
    namespace memory {

        std::vector<CompactionCandidate> Compactor::scan(const PoolSet& pools) const {
            debug() << "compaction: scanning " << pools.size() << " pools (min-util="
                    << threshold_ * 100 << "%)";

            std::vector<CompactionCandidate> candidates;
            size_t total_batches = 0;
            size_t empty_batches = 0;

            for (const auto& pool : pools) {
                if (!pool) continue;
                const char* cls = to_string(pool->size_class());
                size_t n = 0;
                for (const auto& entry : pool->batches()) {
                    const Batch& batch = *entry.second;
                    ++n;
                    ++total_batches;

                    if (batch.slot_count() == 0) {
                        trace() << "compaction: [" << cls << "] batch#" << batch.id() << " skipped (no slots)";
                        continue;
                    }

                    double util = batch.utilization();
                    if (batch.empty() || util < threshold_) {
                        if (batch.empty()) ++empty_batches;
                        candidates.push_back(CompactionCandidate{pool->size_class(), batch.id(),
                                                                 batch.active_count(), batch.slot_count(), util});
                        trace() << "compaction: [" << cls << "] batch[" << n << "/" << pool->batch_count()
                                << "]#" << batch.id() << " candidate (" << util * 100 << "% util, "
                                << batch.active_count() << "/" << batch.slot_count() << " slots active)";
                    } else {
                        trace() << "compaction: [" << cls << "] batch[" << n << "/" << pool->batch_count()
                                << "]#" << batch.id() << " too dense (" << util * 100 << "% util)";
                    }
                }
            }

            // Sparsest first; ties keep class then id order
            std::stable_sort(candidates.begin(), candidates.end(),
                             [](const CompactionCandidate& a, const CompactionCandidate& b) {
                                 return a.utilization < b.utilization;
                             });

            debug() << "compaction: scan found " << candidates.size() << " candidates in "
                    << total_batches << " batches (" << empty_batches << " empty)";
            return candidates;
        }

        CompactionResult Compactor::compact(MemoryController& controller, BucketPool& pool, BatchId batch_id) const {
            CompactionResult result;
            Batch* source = pool.find_batch(batch_id);
            if (!source) {
                throw InvariantViolation("compaction of unknown batch " + std::to_string(batch_id));
            }

            std::vector<float> staging;

            // Copy: free() reorders the active list
            std::vector<uint32_t> to_move = source->active_slots();
            for (uint32_t src_idx : to_move) {
                const Slot src = source->slot(src_idx);

                Batch* target = pool.find_batch_with_spare_capacity(src.vertex_count, batch_id);
                if (!target) {
                    trace() << "compaction: no target with room for entry " << src.entry
                            << ", batch#" << batch_id << " keeps " << source->active_count() << " slots";
                    break;
                }

                int dst = target->allocate(src.entry, src.vertex_count);
                if (dst == Batch::kNoSlot) {
                    throw InvariantViolation("compaction target batch " + std::to_string(target->id()) +
                                             " reported spare capacity but is full");
                }
                const uint32_t dst_idx = static_cast<uint32_t>(dst);
                pool.remove_free_slot(target->id(), dst_idx);

                try {
                    staging.resize(static_cast<size_t>(src.vertex_count) * vertex_layout::kFloatsPerVertex);
                    source->read_slot(src_idx, staging.data(), src.vertex_count);
                    target->write_slot(dst_idx, staging.data(), src.vertex_count);
                } catch (const ResourceError& e) {
                    // Undo the claim; the entry still lives in the source slot
                    target->free(dst_idx);
                    pool.add_free_slot(SlotRef{target->id(), dst_idx});
                    error() << "compaction: copy of entry " << src.entry << " from batch#" << batch_id
                            << " to batch#" << target->id() << " failed: " << e.what();
                    throw;
                }

                controller.relocate_entry(src.entry, pool.size_class(), batch_id, src_idx, target->id(), dst_idx);

                source->free(src_idx);
                pool.add_free_slot(SlotRef{batch_id, src_idx});

                result.slots_moved++;
                result.bytes_moved += static_cast<size_t>(src.vertex_count) * vertex_layout::kBytesPerVertex;
                trace() << "compaction: entry " << src.entry << " batch#" << batch_id << "/" << src_idx
                        << " -> batch#" << target->id() << "/" << dst_idx;
            }

            result.now_empty = source->empty();
            debug() << "compaction: batch#" << batch_id << " moved " << result.slots_moved << " slots ("
                    << result.bytes_moved << " bytes)" << (result.now_empty ? ", now empty" : "");
            return result;
        }

    } // namespace memory
} // namespace geopool
