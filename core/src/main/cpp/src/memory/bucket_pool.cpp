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

#include "bucket_pool.h"
#include <algorithm>
#include <string>
#include "../util/log.h"

namespace geopool {
    namespace memory {

        BucketPool::BucketPool(SizeClass size_class, bool sorted_free_list)
            : size_class_(size_class),
              slot_capacity_(memory::slot_capacity(size_class)),
              slots_per_batch_(memory::slots_per_batch(size_class)),
              sorted_(sorted_free_list) {}

        bool BucketPool::fits(const SlotRef& ref, uint32_t min_capacity) const {
            const Batch* batch = find_batch(ref.batch_id);
            if (!batch) {
                throw InvariantViolation(std::string(to_string(size_class_)) + " free list references missing batch " +
                                         std::to_string(ref.batch_id));
            }
            return batch->slot_capacity(ref.slot_index) >= min_capacity;
        }

        std::optional<SlotRef> BucketPool::find_free_slot(uint32_t min_capacity) {
            // Lowest ref (sorted) or most recent push (unsorted) sits at the back
            for (auto it = free_list_.rbegin(); it != free_list_.rend(); ++it) {
                if (!fits(*it, min_capacity)) {
                    continue;
                }
                SlotRef ref = *it;
                free_list_.erase(std::next(it).base());
                return ref;
            }
            return std::nullopt;
        }

        Batch* BucketPool::find_batch_with_spare_capacity(uint32_t min_capacity,
                                                          std::optional<BatchId> exclude) {
            for (auto& [id, batch] : batches_) {
                if (exclude && *exclude == id) continue;
                if (!batch->has_spare_capacity()) continue;
                if (min_capacity == 0 || !is_unbounded(size_class_)) {
                    return batch.get();
                }
                for (uint32_t i = 0; i < batch->slot_count(); ++i) {
                    if (!batch->slots()[i].active && batch->slot_capacity(i) >= min_capacity) {
                        return batch.get();
                    }
                }
            }
            return nullptr;
        }

        void BucketPool::add_free_slot(const SlotRef& ref) {
            if (!sorted_) {
                free_list_.push_back(ref);
                return;
            }
            // Descending order; lower_bound with a reversed comparator finds the first ref not above ours
            auto pos = std::lower_bound(free_list_.begin(), free_list_.end(), ref,
                                        [](const SlotRef& a, const SlotRef& b) { return b < a; });
            free_list_.insert(pos, ref);
        }

        bool BucketPool::remove_free_slot(BatchId batch_id, uint32_t slot_index) {
            SlotRef ref{batch_id, slot_index};
            auto it = std::find(free_list_.begin(), free_list_.end(), ref);
            if (it == free_list_.end()) {
                return false;
            }
            free_list_.erase(it);
            return true;
        }

        size_t BucketPool::purge_free_slots(BatchId batch_id) {
            size_t before = free_list_.size();
            free_list_.erase(std::remove_if(free_list_.begin(), free_list_.end(),
                                            [batch_id](const SlotRef& r) { return r.batch_id == batch_id; }),
                             free_list_.end());
            return before - free_list_.size();
        }

        bool BucketPool::is_free(BatchId batch_id, uint32_t slot_index) const {
            SlotRef ref{batch_id, slot_index};
            return std::find(free_list_.begin(), free_list_.end(), ref) != free_list_.end();
        }

        Batch& BucketPool::create_batch(BufferBackend& backend, BatchId id, uint32_t vertex_count) {
            if (batches_.count(id)) {
                throw InvariantViolation("batch id " + std::to_string(id) + " already in use");
            }
            auto batch = std::make_unique<Batch>(backend, id, size_class_, vertex_count);
            Batch& ref = *batch;
            batches_.emplace(id, std::move(batch));
            add_free_range(ref, 0);

            debug() << "[" << to_string(size_class_) << "] created batch#" << id << " ("
                    << ref.slot_count() << " slots, " << ref.total_capacity() << " vertices, "
                    << ref.size_bytes() << " bytes)";
            return ref;
        }

        void BucketPool::add_free_range(const Batch& batch, uint32_t first_slot) {
            const uint32_t count = static_cast<uint32_t>(batch.slot_count());
            for (uint32_t n = first_slot; n < count; ++n) {
                // A stack pops the last push, so feed it highest slot first
                uint32_t i = sorted_ ? n : count - 1 - (n - first_slot);
                if (!batch.slots()[i].active) {
                    add_free_slot(SlotRef{batch.id(), i});
                }
            }
        }

        void BucketPool::erase_batch(BatchId id) {
            auto it = batches_.find(id);
            if (it == batches_.end()) {
                throw InvariantViolation("erase of unknown batch " + std::to_string(id));
            }
            const Batch& batch = *it->second;
            if (!batch.empty()) {
                severe() << "[" << to_string(size_class_) << "] refusing to delete batch#" << id
                         << " with " << batch.active_count() << " active slots";
                for (uint32_t idx : batch.active_slots()) {
                    const Slot& slot = batch.slots()[idx];
                    severe() << "  slot " << idx << " -> entry " << slot.entry
                             << " (" << slot.vertex_count << " vertices)";
                }
                throw InvariantViolation("delete of non-empty batch " + std::to_string(id) + " (" +
                                         std::to_string(batch.active_count()) + " active slots)");
            }

            purge_free_slots(id);
            std::unique_ptr<Batch> doomed = std::move(it->second);
            batches_.erase(it);
            doomed->release();
            trace() << "[" << to_string(size_class_) << "] deleted batch#" << id;
        }

        Batch* BucketPool::find_batch(BatchId id) {
            auto it = batches_.find(id);
            return it == batches_.end() ? nullptr : it->second.get();
        }

        const Batch* BucketPool::find_batch(BatchId id) const {
            auto it = batches_.find(id);
            return it == batches_.end() ? nullptr : it->second.get();
        }

        void BucketPool::clear() {
            free_list_.clear();
            BatchMap doomed;
            doomed.swap(batches_);
            for (auto& entry : doomed) {
                entry.second->release();
            }
        }

        BucketPool::Stats BucketPool::stats() const {
            Stats s;
            s.batches = batches_.size();
            s.free_slots = free_list_.size();
            for (const auto& entry : batches_) {
                const Batch& batch = *entry.second;
                if (!batch.empty()) s.active_batches++;
                s.slots += batch.slot_count();
                s.active_slots += batch.active_count();
                s.bytes += batch.size_bytes();
                s.vertices += batch.used_vertices();
                s.growth_cycles += batch.growth_cycles();
            }
            return s;
        }

    } // namespace memory
} // namespace geopool
