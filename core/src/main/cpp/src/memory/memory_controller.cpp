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

#include "memory_controller.h"
#include <algorithm>
#include <limits>
#include <stdexcept>
#include "metrics.h"
#include "stats_report.h"
#include "../util/log.h"

namespace geopool {
    namespace memory {

        MemoryController::MemoryController(BufferBackend& backend, const AllocatorConfig& config)
            : backend_(&backend), config_(config), compactor_(config.compaction_threshold) {
            if (!config_.validate()) {
                throw std::invalid_argument("invalid allocator configuration (thresholds must lie in [0,1], "
                                            "compaction threshold below growth threshold)");
            }
            for (SizeClass c : kAllSizeClasses) {
                pools_[class_index(c)] = std::make_unique<BucketPool>(c, config_.sorted_free_list);
            }
            metrics::initialize();
        }

        MemoryController::~MemoryController() {
            try {
                release_all();
            } catch (const ResourceError& e) {
                error() << "memory controller: failed to release backend resources: " << e.what();
            }
        }

        void MemoryController::ensure_slot(EntryId entry, const std::vector<float>& payload) {
            ensure_slot(entry, payload.data(), payload.size());
        }

        void MemoryController::ensure_slot(EntryId entry, const float* payload, size_t float_count) {
            if (float_count == 0 || payload == nullptr) {
                throw InvalidPayloadError("entry " + std::to_string(entry) + ": empty payload");
            }
            if (float_count % vertex_layout::kFloatsPerVertex != 0) {
                throw InvalidPayloadError("entry " + std::to_string(entry) + ": " + std::to_string(float_count) +
                                          " floats is not a whole number of " +
                                          std::to_string(vertex_layout::kFloatsPerVertex) + "-float vertices");
            }
            const size_t vertices = float_count / vertex_layout::kFloatsPerVertex;
            if (vertices > std::numeric_limits<uint32_t>::max()) {
                throw InvalidPayloadError("entry " + std::to_string(entry) + ": " + std::to_string(vertices) +
                                          " vertices exceeds the addressable range");
            }
            const uint32_t vertex_count = static_cast<uint32_t>(vertices);

            auto it = records_.find(entry);
            if (it != records_.end()) {
                EntryLocation& loc = it->second;
                BucketPool& pool = pool_for(loc.size_class);
                Batch* batch = pool.find_batch(loc.batch_id);
                if (!batch) {
                    throw InvariantViolation("entry " + std::to_string(entry) + " maps to missing batch " +
                                             std::to_string(loc.batch_id));
                }

                if (vertex_count <= batch->slot_capacity(loc.slot_index)) {
                    // Rewrite in place: same slot, new vertex count
                    batch->write_slot(loc.slot_index, payload, vertex_count);
                    batch->set_vertex_count(loc.slot_index, vertex_count);
                    loc.vertex_count = vertex_count;
                    METRIC_COUNTER_INC(slot_updates_in_place);
                    return;
                }

                trace() << "entry " << entry << " outgrew its " << to_string(loc.size_class) << " slot ("
                        << vertex_count << " > " << batch->slot_capacity(loc.slot_index) << " vertices)";
                EntryLocation old = loc;
                release_entry(entry, old);
            }

            const SizeClass size_class = classify(vertex_count);
            BucketPool& pool = pool_for(size_class);
            std::pair<Batch*, uint32_t> claimed = acquire_slot(pool, entry, vertex_count);
            Batch* batch = claimed.first;
            const uint32_t slot_index = claimed.second;

            try {
                batch->write_slot(slot_index, payload, vertex_count);
            } catch (const ResourceError& e) {
                batch->free(slot_index);
                pool.add_free_slot(SlotRef{batch->id(), slot_index});
                error() << "entry " << entry << ": upload to batch#" << batch->id() << "/" << slot_index
                        << " failed: " << e.what();
                throw;
            }

            records_[entry] = EntryLocation{size_class, batch->id(), slot_index, vertex_count};
            METRIC_COUNTER_INC(slot_allocations);
            METRIC_GAUGE_INC(live_entries);
        }

        std::pair<Batch*, uint32_t> MemoryController::acquire_slot(BucketPool& pool, EntryId entry,
                                                                   uint32_t vertex_count) {
            // 1) Free list
            if (std::optional<SlotRef> ref = pool.find_free_slot(vertex_count)) {
                Batch* batch = pool.find_batch(ref->batch_id);
                batch->claim(ref->slot_index, entry, vertex_count);
                return {batch, ref->slot_index};
            }

            // 2) A batch with an unlisted inactive slot
            if (Batch* batch = pool.find_batch_with_spare_capacity(vertex_count)) {
                int slot = batch->allocate(entry, vertex_count);
                if (slot != Batch::kNoSlot) {
                    if (!pool.remove_free_slot(batch->id(), static_cast<uint32_t>(slot))) {
                        warning() << "[" << to_string(pool.size_class()) << "] batch#" << batch->id()
                                  << " slot " << slot << " was inactive but missing from the free list";
                    }
                    return {batch, static_cast<uint32_t>(slot)};
                }
            }

            // 3) Grow, then 4) a fresh batch
            Batch* batch = try_grow(pool);
            if (!batch) {
                batch = &pool.create_batch(*backend_, next_batch_id_++, vertex_count);
                counters_.batch_creations++;
                METRIC_COUNTER_INC(batch_creations);
                METRIC_GAUGE_INC(live_batches);
            }

            int slot = batch->allocate(entry, vertex_count);
            if (slot == Batch::kNoSlot) {
                throw InvariantViolation("batch " + std::to_string(batch->id()) + " full right after " +
                                         (batch->growth_cycles() > 0 ? "growth" : "creation"));
            }
            pool.remove_free_slot(batch->id(), static_cast<uint32_t>(slot));
            return {batch, static_cast<uint32_t>(slot)};
        }

        Batch* MemoryController::try_grow(BucketPool& pool) {
            if (is_unbounded(pool.size_class()) || !config_.growth_enabled) {
                return nullptr;
            }

            for (const auto& entry : pool.batches()) {
                Batch& batch = *entry.second;
                if (!batch.can_grow(config_)) {
                    continue;
                }

                Timer timer;
                const uint32_t old_slots = static_cast<uint32_t>(batch.slot_count());
                const size_t old_bytes = batch.size_bytes();

                std::vector<EntryId> affected = batch.grow();
                pool.add_free_range(batch, old_slots);
                pending_reuploads_.insert(affected.begin(), affected.end());

                const uint64_t elapsed = timer.elapsed_us();
                counters_.growth_events++;
                counters_.last_growth_us = elapsed;
                METRIC_COUNTER_INC(growth_events);
                METRIC_HISTOGRAM_RECORD(growth_duration_us, elapsed);

                debug() << "[" << to_string(pool.size_class()) << "] grew batch#" << batch.id() << " "
                        << old_slots << " -> " << batch.slot_count() << " slots, " << old_bytes << " -> "
                        << batch.size_bytes() << " bytes (cycle " << batch.growth_cycles() << ", "
                        << affected.size() << " entries to re-upload, " << elapsed << "us)";
                return &batch;
            }
            return nullptr;
        }

        void MemoryController::release_entry(EntryId entry, const EntryLocation& loc) {
            BucketPool& pool = pool_for(loc.size_class);
            Batch* batch = pool.find_batch(loc.batch_id);
            if (!batch) {
                throw InvariantViolation("entry " + std::to_string(entry) + " maps to missing batch " +
                                         std::to_string(loc.batch_id));
            }
            batch->free(loc.slot_index);
            pool.add_free_slot(SlotRef{loc.batch_id, loc.slot_index});
            records_.erase(entry);
            METRIC_COUNTER_INC(slot_frees);
            METRIC_GAUGE_DEC(live_entries);
        }

        void MemoryController::remove_cluster(EntryId entry) {
            auto it = records_.find(entry);
            if (it == records_.end()) {
                throw EntryNotFoundError(entry);
            }
            EntryLocation loc = it->second;
            release_entry(entry, loc);
            pending_reuploads_.erase(entry);
        }

        std::set<EntryId> MemoryController::get_and_clear_pending_reuploads() {
            std::set<EntryId> drained;
            drained.swap(pending_reuploads_);
            return drained;
        }

        void MemoryController::draw() {
            size_t calls = 0;
            std::vector<uint32_t> order;
            std::vector<int32_t> firsts;
            std::vector<int32_t> counts;

            for (SizeClass c : kAllSizeClasses) {
                for (const auto& entry : pool(c).batches()) {
                    const Batch& batch = *entry.second;
                    if (batch.empty()) {
                        continue;
                    }

                    order = batch.active_slots();
                    std::sort(order.begin(), order.end());
                    firsts.clear();
                    counts.clear();
                    for (uint32_t idx : order) {
                        const Slot& slot = batch.slots()[idx];
                        firsts.push_back(static_cast<int32_t>(slot.vertex_offset));
                        counts.push_back(static_cast<int32_t>(slot.vertex_count));
                    }

                    backend_->draw_ranges(batch.layout(), firsts, counts);
                    ++calls;
                }
            }

            counters_.draw_calls_last_frame = calls;
            METRIC_COUNTER_ADD(draw_calls, calls);
        }

        CompactionPass MemoryController::try_compaction() {
            CompactionPass pass;
            if (!config_.compaction_enabled) {
                return pass;
            }

            Timer timer;
            std::vector<CompactionCandidate> candidates = compactor_.scan(pools_);
            pass.candidates = candidates.size();

            for (const CompactionCandidate& cand : candidates) {
                BucketPool& pool = pool_for(cand.size_class);
                Batch* batch = pool.find_batch(cand.batch_id);
                if (!batch) {
                    throw InvariantViolation("compaction candidate batch " + std::to_string(cand.batch_id) +
                                             " vanished during the pass");
                }

                // Empty batches are reclaimed regardless of the relocation cap
                if (batch->empty()) {
                    delete_batch(cand.size_class, cand.batch_id);
                    pass.batches_deleted++;
                    counters_.compaction_events++;
                    continue;
                }

                if (pass.batches_compacted >= config_.compaction_max_per_cycle) {
                    pass.deferred++;
                    continue;
                }

                CompactionResult result = compactor_.compact(*this, pool, cand.batch_id);
                if (result.slots_moved > 0) {
                    pass.batches_compacted++;
                    pass.slots_moved += result.slots_moved;
                    counters_.compaction_events++;
                    counters_.slots_relocated += result.slots_moved;
                    counters_.bytes_relocated += result.bytes_moved;
                    METRIC_COUNTER_ADD(slots_relocated, result.slots_moved);
                    METRIC_COUNTER_ADD(bytes_relocated, result.bytes_moved);
                }
                if (result.now_empty) {
                    delete_batch(cand.size_class, cand.batch_id);
                    pass.batches_deleted++;
                }
            }

            if (pass.deferred > 0) {
                debug() << "compaction: relocation cap (" << config_.compaction_max_per_cycle
                        << ") reached, " << pass.deferred << " candidates left for a later pass";
            }

            if (pass.batches_compacted > 0 || pass.batches_deleted > 0) {
                const uint64_t elapsed = timer.elapsed_us();
                counters_.last_compaction_us = elapsed;
                METRIC_COUNTER_INC(compaction_runs);
                METRIC_HISTOGRAM_RECORD(compaction_duration_us, elapsed);
                debug() << "compaction: " << pass.candidates << " candidates, " << pass.batches_compacted
                        << " compacted, " << pass.batches_deleted << " deleted, " << pass.slots_moved
                        << " slots moved in " << elapsed << "us";
            }
            return pass;
        }

        void MemoryController::delete_batch(SizeClass size_class, BatchId batch_id) {
            pool_for(size_class).erase_batch(batch_id);
            counters_.batch_deletions++;
            METRIC_COUNTER_INC(batch_deletions);
            METRIC_GAUGE_DEC(live_batches);
        }

        void MemoryController::relocate_entry(EntryId entry, SizeClass size_class, BatchId from_batch,
                                              uint32_t from_slot, BatchId to_batch, uint32_t to_slot) {
            auto it = records_.find(entry);
            if (it == records_.end()) {
                throw InvariantViolation("relocated entry " + std::to_string(entry) + " has no location record");
            }
            EntryLocation& loc = it->second;
            if (loc.size_class != size_class || loc.batch_id != from_batch || loc.slot_index != from_slot) {
                throw InvariantViolation("relocated entry " + std::to_string(entry) + " is recorded at batch " +
                                         std::to_string(loc.batch_id) + " slot " + std::to_string(loc.slot_index) +
                                         ", expected batch " + std::to_string(from_batch) + " slot " +
                                         std::to_string(from_slot));
            }
            loc.batch_id = to_batch;
            loc.slot_index = to_slot;
        }

        IntegrityReport MemoryController::validate_integrity() const {
            IntegrityReport report;
            auto fail = [&report](const std::string& msg) { report.errors.push_back(msg); };

            std::array<size_t, size_class::kNumClasses> records_per_class{};

            // Records -> slots
            for (const auto& kv : records_) {
                const EntryId entry = kv.first;
                const EntryLocation& loc = kv.second;
                records_per_class[class_index(loc.size_class)]++;
                const std::string who = "entry " + std::to_string(entry);

                const Batch* batch = pool(loc.size_class).find_batch(loc.batch_id);
                if (!batch) {
                    fail(who + " references deleted batch " + std::to_string(loc.batch_id));
                    continue;
                }
                if (loc.slot_index >= batch->slot_count()) {
                    fail(who + " has invalid slot index " + std::to_string(loc.slot_index) + " (batch " +
                         std::to_string(loc.batch_id) + " has " + std::to_string(batch->slot_count()) + " slots)");
                    continue;
                }
                const Slot& slot = batch->slots()[loc.slot_index];
                if (!slot.active) {
                    fail(who + " references inactive slot " + std::to_string(loc.slot_index) + " in batch " +
                         std::to_string(loc.batch_id));
                }
                if (slot.entry != entry) {
                    fail(who + " slot mismatch: slot is owned by entry " + std::to_string(slot.entry));
                }
                if (slot.vertex_count != loc.vertex_count) {
                    fail(who + " records " + std::to_string(loc.vertex_count) + " vertices, slot holds " +
                         std::to_string(slot.vertex_count));
                }
            }

            // Pools -> slots, free list
            for (SizeClass c : kAllSizeClasses) {
                const BucketPool& p = pool(c);
                const std::string cls = std::string("[") + to_string(c) + "] ";
                size_t active_total = 0;

                std::vector<SlotRef> free_refs = p.free_slots();
                std::sort(free_refs.begin(), free_refs.end());
                if (std::adjacent_find(free_refs.begin(), free_refs.end()) != free_refs.end()) {
                    fail(cls + "free list holds duplicate refs");
                }
                for (const SlotRef& ref : free_refs) {
                    const Batch* batch = p.find_batch(ref.batch_id);
                    if (!batch) {
                        fail(cls + "free list references missing batch " + std::to_string(ref.batch_id));
                    } else if (ref.slot_index >= batch->slot_count()) {
                        fail(cls + "free list references slot " + std::to_string(ref.slot_index) +
                             " past the end of batch " + std::to_string(ref.batch_id));
                    } else if (batch->slots()[ref.slot_index].active) {
                        fail(cls + "active slot " + std::to_string(ref.slot_index) + " of batch " +
                             std::to_string(ref.batch_id) + " is on the free list");
                    }
                }

                for (const auto& kv : p.batches()) {
                    const Batch& batch = *kv.second;
                    const std::string where = cls + "batch " + std::to_string(batch.id());
                    active_total += batch.active_count();

                    if (!batch.buffer().valid() || !batch.layout().valid()) {
                        fail(where + " has released backend resources");
                    }
                    if (batch.growth_cycles() > config_.growth_max_cycles) {
                        fail(where + " grew " + std::to_string(batch.growth_cycles()) + " times (max " +
                             std::to_string(config_.growth_max_cycles) + ")");
                    }
                    if (batch.growth_cycles() > 0 && batch.size_bytes() > config_.growth_max_batch_bytes) {
                        fail(where + " is " + std::to_string(batch.size_bytes()) + " bytes, above the growth ceiling");
                    }

                    size_t flagged = 0;
                    for (uint32_t i = 0; i < batch.slot_count(); ++i) {
                        const Slot& slot = batch.slots()[i];
                        const bool listed = std::binary_search(free_refs.begin(), free_refs.end(),
                                                               SlotRef{batch.id(), i});
                        if (slot.active) {
                            flagged++;
                            auto rec = records_.find(slot.entry);
                            if (rec == records_.end() || rec->second.batch_id != batch.id() ||
                                rec->second.slot_index != i || rec->second.size_class != c) {
                                fail(where + " slot " + std::to_string(i) + " is owned by entry " +
                                     std::to_string(slot.entry) + " whose record points elsewhere");
                            }
                        } else if (!listed) {
                            fail(where + " slot " + std::to_string(i) + " is neither active nor on the free list");
                        }
                    }
                    if (flagged != batch.active_count()) {
                        fail(where + " has " + std::to_string(flagged) + " active slots but tracks " +
                             std::to_string(batch.active_count()));
                    }
                }

                if (active_total != records_per_class[class_index(c)]) {
                    fail(cls + std::to_string(active_total) + " active slots for " +
                         std::to_string(records_per_class[class_index(c)]) + " entries");
                }
            }

            if (!report.ok()) {
                error() << "integrity check failed with " << report.errors.size() << " errors:";
                for (const std::string& e : report.errors) {
                    error() << "  - " << e;
                }
            }
            return report;
        }

        ControllerStats MemoryController::stats() const {
            ControllerStats s = counters_;
            s.per_class = {};

            for (const auto& kv : records_) {
                s.per_class[class_index(kv.second.size_class)].entries++;
            }

            for (SizeClass c : kAllSizeClasses) {
                BucketPool::Stats ps = pool(c).stats();
                ClassStats& cs = s.per_class[class_index(c)];
                cs.batches = ps.batches;
                cs.active_batches = ps.active_batches;
                cs.slots = ps.slots;
                cs.active_slots = ps.active_slots;
                cs.free_slots = ps.free_slots;
                cs.bytes = ps.bytes;
                cs.vertices = ps.vertices;
            }

            s.total_entries = records_.size();
            s.total_vertices = 0;
            s.total_bytes = 0;
            s.total_batches = 0;
            s.active_batches = 0;
            s.total_slots = 0;
            s.active_slots = 0;
            s.free_slots = 0;
            for (const ClassStats& cs : s.per_class) {
                s.total_vertices += cs.vertices;
                s.total_bytes += cs.bytes;
                s.total_batches += cs.batches;
                s.active_batches += cs.active_batches;
                s.total_slots += cs.slots;
                s.active_slots += cs.active_slots;
                s.free_slots += cs.free_slots;
            }
            return s;
        }

        void MemoryController::print_stats() const {
            for (const std::string& line : format_report(*this)) {
                info() << line;
            }
        }

        EntryLocation MemoryController::location(EntryId entry) const {
            auto it = records_.find(entry);
            if (it == records_.end()) {
                throw EntryNotFoundError(entry);
            }
            return it->second;
        }

        std::vector<float> MemoryController::read_back(EntryId entry) const {
            EntryLocation loc = location(entry);
            const Batch* batch = pool(loc.size_class).find_batch(loc.batch_id);
            if (!batch) {
                throw InvariantViolation("entry " + std::to_string(entry) + " maps to missing batch " +
                                         std::to_string(loc.batch_id));
            }
            std::vector<float> out(static_cast<size_t>(loc.vertex_count) * vertex_layout::kFloatsPerVertex);
            batch->read_slot(loc.slot_index, out.data(), loc.vertex_count);
            return out;
        }

        size_t MemoryController::batch_count() const {
            size_t total = 0;
            for (const auto& p : pools_) {
                total += p->batch_count();
            }
            return total;
        }

        void MemoryController::release_all() {
            const size_t batches = batch_count();
            const size_t entries = records_.size();
            records_.clear();
            pending_reuploads_.clear();
            metrics::live_entries.decrement(static_cast<int64_t>(entries));
            metrics::live_batches.decrement(static_cast<int64_t>(batches));
            for (auto& p : pools_) {
                if (p) p->clear();
            }
        }

    } // namespace memory
} // namespace geopool
