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
#include <array>
#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <vector>
#include "batch.h"
#include "size_class.hpp"

namespace geopool {
    namespace memory {

        // (batch id, slot index). Ordered by batch first.
        struct SlotRef {
            BatchId  batch_id = 0;
            uint32_t slot_index = 0;

            bool operator==(const SlotRef& o) const {
                return batch_id == o.batch_id && slot_index == o.slot_index;
            }
            bool operator!=(const SlotRef& o) const { return !(*this == o); }
            bool operator<(const SlotRef& o) const {
                return batch_id != o.batch_id ? batch_id < o.batch_id : slot_index < o.slot_index;
            }
        };

        /**
         * All batches of one size class plus the free list shared between them.
         *
         * Batches live in an id-ordered arena owned by the pool. Every slot of
         * every batch is either active or on the free list. The free list is
         * kept in descending (batch id, slot) order when sorted so the lowest
         * ref pops from the back; unsorted it is a plain stack.
         */
        class BucketPool {
        public:
            using BatchMap = std::map<BatchId, std::unique_ptr<Batch>>;

            explicit BucketPool(SizeClass size_class, bool sorted_free_list = free_list::kSorted);

            BucketPool(const BucketPool&) = delete;
            BucketPool& operator=(const BucketPool&) = delete;

            SizeClass size_class() const { return size_class_; }
            uint32_t slot_capacity() const { return slot_capacity_; }
            uint32_t slots_per_batch() const { return slots_per_batch_; }
            bool sorted_free_list() const { return sorted_; }

            // Pop a free slot able to hold min_capacity vertices. Refs that
            // are too small (XXL only) are skipped and stay on the list.
            std::optional<SlotRef> find_free_slot(uint32_t min_capacity);

            // First batch in id order with an inactive slot that can hold
            // min_capacity vertices
            Batch* find_batch_with_spare_capacity(uint32_t min_capacity = 0,
                                                  std::optional<BatchId> exclude = std::nullopt);

            void add_free_slot(const SlotRef& ref);
            // Returns false if the ref was not on the list
            bool remove_free_slot(BatchId batch_id, uint32_t slot_index);
            // Drop every ref into a batch; returns how many were dropped
            size_t purge_free_slots(BatchId batch_id);
            bool is_free(BatchId batch_id, uint32_t slot_index) const;

            // Create a batch and push all of its slots on the free list
            Batch& create_batch(BufferBackend& backend, BatchId id, uint32_t vertex_count);

            // Push slots [first_slot, slot_count) of a batch on the free list
            void add_free_range(const Batch& batch, uint32_t first_slot);

            // Remove an empty batch, its free refs, and its backend resources.
            // Throws InvariantViolation if the batch still has active slots.
            void erase_batch(BatchId id);

            Batch* find_batch(BatchId id);
            const Batch* find_batch(BatchId id) const;

            const BatchMap& batches() const { return batches_; }
            const std::vector<SlotRef>& free_slots() const { return free_list_; }
            size_t batch_count() const { return batches_.size(); }
            size_t free_slot_count() const { return free_list_.size(); }

            // Drop every batch without checking occupancy (shutdown)
            void clear();

            struct Stats {
                size_t batches = 0;
                size_t active_batches = 0;   // Batches with at least one active slot
                size_t slots = 0;
                size_t active_slots = 0;
                size_t free_slots = 0;       // Free-list depth
                size_t bytes = 0;            // Backing buffer bytes
                uint64_t vertices = 0;       // Vertices stored
                size_t growth_cycles = 0;

                double utilization() const {
                    return slots > 0 ? static_cast<double>(active_slots) / slots : 0.0;
                }
            };
            Stats stats() const;

        private:
            bool fits(const SlotRef& ref, uint32_t min_capacity) const;

            SizeClass size_class_;
            uint32_t slot_capacity_;
            uint32_t slots_per_batch_;
            bool sorted_;
            BatchMap batches_;
            std::vector<SlotRef> free_list_;
        };

        // One pool per size class, indexed by class_index()
        using PoolSet = std::array<std::unique_ptr<BucketPool>, size_class::kNumClasses>;

    } // namespace memory
} // namespace geopool
