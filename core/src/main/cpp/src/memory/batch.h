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
#include <vector>
#include "allocator_config.h"
#include "buffer_backend.h"
#include "config.h"
#include "errors.h"
#include "size_class.hpp"

namespace geopool {
    namespace memory {

        using BatchId = uint32_t;

        struct Slot {
            bool     active = false;
            EntryId  entry = 0;           // Owner; meaningless while inactive
            uint32_t vertex_count = 0;    // Vertices stored, <= slot capacity
            uint32_t vertex_offset = 0;   // Fixed position within the batch buffer
        };

        /**
         * One backing buffer plus its layout descriptor, subdivided into
         * fixed-capacity slots. Slots are index-stable: they are flagged
         * active/inactive, never reordered. The batch owns its backend
         * handles and releases them on destruction.
         */
        class Batch {
        public:
            static constexpr int kNoSlot = -1;

            // Creates the buffer and layout. For XXL the batch holds a single
            // slot sized to vertex_count; otherwise vertex_count is ignored.
            Batch(BufferBackend& backend, BatchId id, SizeClass size_class, uint32_t vertex_count);
            ~Batch();

            Batch(const Batch&) = delete;
            Batch& operator=(const Batch&) = delete;

            // Claim the first inactive slot. Returns kNoSlot when full.
            int allocate(EntryId entry, uint32_t vertex_count);

            // Claim a specific inactive slot (free-list path)
            void claim(uint32_t slot_index, EntryId entry, uint32_t vertex_count);

            // Mark the slot inactive and drop it from the active set
            void free(uint32_t slot_index);

            // Record a new vertex count for an in-place rewrite
            void set_vertex_count(uint32_t slot_index, uint32_t vertex_count);

            bool can_grow(const AllocatorConfig& config) const;

            // Double slot count and capacity. Existing offsets are preserved;
            // live data is copied into a new buffer which replaces the old
            // one. Returns the entries that lived here before growth.
            std::vector<EntryId> grow();

            // Byte position of a slot in the buffer. The only place slot
            // offsets are turned into bytes.
            size_t byte_offset(uint32_t slot_index) const {
                return static_cast<size_t>(slots_[slot_index].vertex_offset) * vertex_layout::kBytesPerVertex;
            }

            // Vertices the slot can hold
            uint32_t slot_capacity(uint32_t slot_index) const;

            // Upload / read back vertex data at a slot through the backend
            void write_slot(uint32_t slot_index, const float* vertices, uint32_t vertex_count);
            void read_slot(uint32_t slot_index, float* out, uint32_t vertex_count) const;

            // Destroy buffer and layout. Safe to call twice.
            void release();

            BatchId id() const { return id_; }
            SizeClass size_class() const { return size_class_; }
            BufferHandle buffer() const { return buffer_; }
            LayoutHandle layout() const { return layout_; }
            uint32_t total_capacity() const { return total_capacity_; }
            uint32_t initial_capacity() const { return initial_capacity_; }
            uint32_t growth_cycles() const { return growth_cycles_; }

            const std::vector<Slot>& slots() const { return slots_; }
            const Slot& slot(uint32_t slot_index) const { return slots_.at(slot_index); }
            const std::vector<uint32_t>& active_slots() const { return active_slots_; }

            size_t slot_count() const { return slots_.size(); }
            size_t active_count() const { return active_slots_.size(); }
            bool has_spare_capacity() const { return active_slots_.size() < slots_.size(); }
            bool empty() const { return active_slots_.empty(); }

            double utilization() const {
                return slots_.empty() ? 0.0
                    : static_cast<double>(active_slots_.size()) / static_cast<double>(slots_.size());
            }

            size_t size_bytes() const {
                return static_cast<size_t>(total_capacity_) * vertex_layout::kBytesPerVertex;
            }

            uint64_t used_vertices() const;

        private:
            void check_index(uint32_t slot_index, const char* op) const;

            BufferBackend* backend_;
            BatchId id_;
            SizeClass size_class_;
            uint32_t per_slot_capacity_;   // 0 for XXL
            uint32_t total_capacity_;      // Vertices in the buffer
            uint32_t initial_capacity_;
            uint32_t growth_cycles_ = 0;
            BufferHandle buffer_;
            LayoutHandle layout_;
            std::vector<Slot> slots_;
            std::vector<uint32_t> active_slots_;  // Indices into slots_
        };

    } // namespace memory
} // namespace geopool
