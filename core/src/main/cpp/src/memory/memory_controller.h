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
#include <set>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>
#include "allocator_config.h"
#include "bucket_pool.h"
#include "buffer_backend.h"
#include "compactor.h"
#include "errors.h"
#include "size_class.hpp"

namespace geopool {
    namespace memory {

        // Where an entry's vertices live
        struct EntryLocation {
            SizeClass size_class = SizeClass::S;
            BatchId   batch_id = 0;
            uint32_t  slot_index = 0;
            uint32_t  vertex_count = 0;
        };

        struct ClassStats {
            size_t   entries = 0;
            size_t   batches = 0;
            size_t   active_batches = 0;
            size_t   slots = 0;
            size_t   active_slots = 0;
            size_t   free_slots = 0;
            size_t   bytes = 0;
            uint64_t vertices = 0;
        };

        struct ControllerStats {
            size_t   total_entries = 0;
            uint64_t total_vertices = 0;
            size_t   total_bytes = 0;
            size_t   total_batches = 0;
            size_t   active_batches = 0;
            size_t   total_slots = 0;
            size_t   active_slots = 0;
            size_t   free_slots = 0;
            size_t   draw_calls_last_frame = 0;

            uint64_t batch_creations = 0;
            uint64_t growth_events = 0;
            uint64_t last_growth_us = 0;
            uint64_t compaction_events = 0;
            uint64_t slots_relocated = 0;
            uint64_t bytes_relocated = 0;
            uint64_t batch_deletions = 0;
            uint64_t last_compaction_us = 0;

            std::array<ClassStats, size_class::kNumClasses> per_class{};

            const ClassStats& of(SizeClass c) const { return per_class[class_index(c)]; }
        };

        // Result of a consistency check. Never produced by mutating anything.
        struct IntegrityReport {
            std::vector<std::string> errors;

            bool ok() const { return errors.empty(); }
        };

        // Outcome of one try_compaction() pass
        struct CompactionPass {
            size_t candidates = 0;
            size_t batches_compacted = 0;   // Batches that had slots moved out
            size_t batches_deleted = 0;
            size_t slots_moved = 0;
            size_t deferred = 0;            // Candidates left for a later pass
        };

        /**
         * Packs variable-sized vertex payloads ("entries") into shared
         * backing buffers bucketed by size class.
         *
         * ensure_slot() guarantees an entry has a slot big enough for its
         * payload and writes it; remove_cluster() gives the slot back.
         * Batches grow under pressure and sparse batches are compacted and
         * deleted by try_compaction(). Growth replaces backing buffers, so
         * callers must resubmit the entries reported by
         * get_and_clear_pending_reuploads() before drawing.
         *
         * Not thread-safe. All calls are expected from one frame loop.
         */
        class MemoryController {
        public:
            explicit MemoryController(BufferBackend& backend,
                                      const AllocatorConfig& config = AllocatorConfig());
            ~MemoryController();

            MemoryController(const MemoryController&) = delete;
            MemoryController& operator=(const MemoryController&) = delete;

            // Payload is interleaved x, y, r, g, b, a per vertex.
            // Throws InvalidPayloadError, ResourceError.
            void ensure_slot(EntryId entry, const std::vector<float>& payload);
            void ensure_slot(EntryId entry, const float* payload, size_t float_count);

            // Throws EntryNotFoundError
            void remove_cluster(EntryId entry);

            std::set<EntryId> get_and_clear_pending_reuploads();
            const std::set<EntryId>& pending_reuploads() const { return pending_reuploads_; }

            // One batched draw per non-empty batch, size class then id order
            void draw();

            CompactionPass try_compaction();

            // Remove an empty batch. Throws InvariantViolation if it still
            // holds entries.
            void delete_batch(SizeClass size_class, BatchId batch_id);

            IntegrityReport validate_integrity() const;

            ControllerStats stats() const;
            void print_stats() const;

            bool contains(EntryId entry) const { return records_.count(entry) != 0; }
            // Throws EntryNotFoundError
            EntryLocation location(EntryId entry) const;
            std::vector<float> read_back(EntryId entry) const;

            size_t entry_count() const { return records_.size(); }
            size_t batch_count() const;

            const BucketPool& pool(SizeClass size_class) const { return *pools_[class_index(size_class)]; }
            const AllocatorConfig& config() const { return config_; }
            BufferBackend& backend() { return *backend_; }

            // Destroy every batch and forget every entry
            void release_all();

        private:
            friend class Compactor;

            BucketPool& pool_for(SizeClass size_class) { return *pools_[class_index(size_class)]; }

            // Free the entry's slot and drop its record
            void release_entry(EntryId entry, const EntryLocation& loc);

            // Steps 3-6 of allocation: free list, spare capacity, growth, new batch
            std::pair<Batch*, uint32_t> acquire_slot(BucketPool& pool, EntryId entry, uint32_t vertex_count);

            Batch* try_grow(BucketPool& pool);

            // Called by the compactor after bytes have been copied
            void relocate_entry(EntryId entry, SizeClass size_class, BatchId from_batch, uint32_t from_slot,
                                BatchId to_batch, uint32_t to_slot);

            BufferBackend* backend_;
            AllocatorConfig config_;
            Compactor compactor_;
            PoolSet pools_;
            BatchId next_batch_id_ = 1;
            std::unordered_map<EntryId, EntryLocation> records_;
            std::set<EntryId> pending_reuploads_;
            ControllerStats counters_;   // Event counters only; totals computed in stats()
        };

    } // namespace memory
} // namespace geopool
