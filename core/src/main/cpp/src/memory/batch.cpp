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

#include "batch.h"
#include <algorithm>
#include <string>
#include "../util/log.h"

namespace geopool {
    namespace memory {

        Batch::Batch(BufferBackend& backend, BatchId id, SizeClass size_class, uint32_t vertex_count)
            : backend_(&backend), id_(id), size_class_(size_class),
              per_slot_capacity_(memory::slot_capacity(size_class)) {
            uint32_t num_slots = slots_per_batch(size_class);
            if (is_unbounded(size_class)) {
                total_capacity_ = vertex_count;
            } else {
                total_capacity_ = per_slot_capacity_ * num_slots;
            }
            initial_capacity_ = total_capacity_;

            buffer_ = backend_->create_buffer(size_bytes());
            try {
                layout_ = backend_->create_layout(buffer_);
            } catch (const ResourceError&) {
                backend_->destroy_buffer(buffer_);
                buffer_ = BufferHandle{};
                throw;
            }

            // XXL: single slot at offset 0 spanning the whole buffer
            slots_.resize(num_slots);
            for (uint32_t i = 0; i < num_slots; ++i) {
                slots_[i].vertex_offset = i * per_slot_capacity_;
            }
            active_slots_.reserve(num_slots);
        }

        Batch::~Batch() {
            try {
                release();
            } catch (const ResourceError& e) {
                error() << "batch#" << id_ << ": failed to release resources: " << e.what();
            }
        }

        void Batch::release() {
            if (layout_.valid()) {
                LayoutHandle layout = layout_;
                layout_ = LayoutHandle{};
                backend_->destroy_layout(layout);
            }
            if (buffer_.valid()) {
                BufferHandle buffer = buffer_;
                buffer_ = BufferHandle{};
                backend_->destroy_buffer(buffer);
            }
        }

        void Batch::check_index(uint32_t slot_index, const char* op) const {
            if (slot_index >= slots_.size()) {
                throw InvariantViolation(std::string(op) + ": slot " + std::to_string(slot_index) +
                                         " out of range in batch " + std::to_string(id_) +
                                         " (" + std::to_string(slots_.size()) + " slots)");
            }
        }

        int Batch::allocate(EntryId entry, uint32_t vertex_count) {
            // Find first inactive slot
            for (uint32_t i = 0; i < slots_.size(); ++i) {
                if (!slots_[i].active) {
                    claim(i, entry, vertex_count);
                    return static_cast<int>(i);
                }
            }
            return kNoSlot;
        }

        void Batch::claim(uint32_t slot_index, EntryId entry, uint32_t vertex_count) {
            check_index(slot_index, "claim");
            Slot& slot = slots_[slot_index];
            if (slot.active) {
                throw InvariantViolation("claim: slot " + std::to_string(slot_index) + " in batch " +
                                         std::to_string(id_) + " already owned by entry " +
                                         std::to_string(slot.entry));
            }
            if (vertex_count > slot_capacity(slot_index)) {
                throw InvariantViolation("claim: " + std::to_string(vertex_count) +
                                         " vertices exceed slot capacity " +
                                         std::to_string(slot_capacity(slot_index)));
            }
            slot.active = true;
            slot.entry = entry;
            slot.vertex_count = vertex_count;
            active_slots_.push_back(slot_index);
        }

        void Batch::free(uint32_t slot_index) {
            check_index(slot_index, "free");
            Slot& slot = slots_[slot_index];
            if (!slot.active) {
                throw InvariantViolation("free: slot " + std::to_string(slot_index) + " in batch " +
                                         std::to_string(id_) + " is not active");
            }
            slot.active = false;
            slot.entry = 0;
            slot.vertex_count = 0;

            // Swap-remove; draw ranges are rebuilt from the active set each frame
            auto it = std::find(active_slots_.begin(), active_slots_.end(), slot_index);
            if (it != active_slots_.end()) {
                *it = active_slots_.back();
                active_slots_.pop_back();
            }
        }

        void Batch::set_vertex_count(uint32_t slot_index, uint32_t vertex_count) {
            check_index(slot_index, "update");
            if (vertex_count > slot_capacity(slot_index)) {
                throw InvariantViolation("update: " + std::to_string(vertex_count) +
                                         " vertices exceed slot capacity " +
                                         std::to_string(slot_capacity(slot_index)));
            }
            slots_[slot_index].vertex_count = vertex_count;
        }

        uint32_t Batch::slot_capacity(uint32_t slot_index) const {
            if (is_unbounded(size_class_)) {
                return total_capacity_ - slots_[slot_index].vertex_offset;
            }
            return per_slot_capacity_;
        }

        bool Batch::can_grow(const AllocatorConfig& config) const {
            if (!config.growth_enabled || is_unbounded(size_class_)) {
                return false;
            }
            if (growth_cycles_ >= config.growth_max_cycles) {
                return false;
            }
            if (slots_.empty()) {
                return false;
            }
            if (utilization() < config.growth_util_threshold) {
                return false;
            }
            return size_bytes() * 2 <= config.growth_max_batch_bytes;
        }

        std::vector<EntryId> Batch::grow() {
            if (slots_.empty() || is_unbounded(size_class_)) {
                throw InvariantViolation("batch " + std::to_string(id_) + " (" + to_string(size_class_) +
                                         ") cannot grow");
            }

            std::vector<EntryId> affected;
            affected.reserve(active_slots_.size());
            for (uint32_t idx : active_slots_) {
                affected.push_back(slots_[idx].entry);
            }

            const uint32_t old_slot_count = static_cast<uint32_t>(slots_.size());
            const uint32_t new_capacity = total_capacity_ * 2;

            // The old buffer may still be referenced by submitted draws
            backend_->finish();

            BufferHandle fresh = backend_->create_buffer(static_cast<size_t>(new_capacity) *
                                                         vertex_layout::kBytesPerVertex);
            try {
                // Copy forward live slots only; offsets do not change
                std::vector<uint8_t> staging;
                for (uint32_t idx : active_slots_) {
                    size_t len = static_cast<size_t>(slots_[idx].vertex_count) * vertex_layout::kBytesPerVertex;
                    if (len == 0) continue;
                    staging.resize(len);
                    backend_->read(buffer_, byte_offset(idx), staging.data(), len);
                    backend_->write(fresh, byte_offset(idx), staging.data(), len);
                }
                backend_->bind_layout(layout_, fresh);
            } catch (const ResourceError&) {
                backend_->destroy_buffer(fresh);
                throw;
            }

            BufferHandle old = buffer_;
            buffer_ = fresh;
            total_capacity_ = new_capacity;
            growth_cycles_++;

            slots_.resize(static_cast<size_t>(old_slot_count) * 2);
            uint32_t vertex_offset = per_slot_capacity_ * old_slot_count;
            for (uint32_t i = old_slot_count; i < slots_.size(); ++i) {
                slots_[i].vertex_offset = vertex_offset;
                vertex_offset += per_slot_capacity_;
            }

            backend_->destroy_buffer(old);
            return affected;
        }

        void Batch::write_slot(uint32_t slot_index, const float* vertices, uint32_t vertex_count) {
            check_index(slot_index, "write");
            backend_->write(buffer_, byte_offset(slot_index), vertices,
                            static_cast<size_t>(vertex_count) * vertex_layout::kBytesPerVertex);
        }

        void Batch::read_slot(uint32_t slot_index, float* out, uint32_t vertex_count) const {
            check_index(slot_index, "read");
            backend_->read(buffer_, byte_offset(slot_index), out,
                           static_cast<size_t>(vertex_count) * vertex_layout::kBytesPerVertex);
        }

        uint64_t Batch::used_vertices() const {
            uint64_t total = 0;
            for (uint32_t idx : active_slots_) {
                total += slots_[idx].vertex_count;
            }
            return total;
        }

    } // namespace memory
} // namespace geopool
