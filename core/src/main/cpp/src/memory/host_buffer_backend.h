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
#include "buffer_backend.h"
#include <limits>
#include <unordered_map>
#include <vector>

namespace geopool {
    namespace memory {

        /**
         * Host-memory backend: buffers are byte vectors and draws are
         * recorded instead of rasterized. Used headless and in tests.
         */
        class HostBufferBackend final : public BufferBackend {
        public:
            struct DrawCall {
                LayoutHandle layout;
                BufferHandle buffer;
                std::vector<int32_t> firsts;
                std::vector<int32_t> counts;
            };

            BufferHandle create_buffer(size_t size_bytes) override;
            void destroy_buffer(BufferHandle buffer) override;
            size_t buffer_size(BufferHandle buffer) const override;

            void write(BufferHandle buffer, size_t byte_offset,
                       const void* data, size_t size_bytes) override;
            void read(BufferHandle buffer, size_t byte_offset,
                      void* out, size_t size_bytes) const override;

            LayoutHandle create_layout(BufferHandle buffer) override;
            void bind_layout(LayoutHandle layout, BufferHandle buffer) override;
            void destroy_layout(LayoutHandle layout) override;

            void draw_ranges(LayoutHandle layout,
                             const std::vector<int32_t>& firsts,
                             const std::vector<int32_t>& counts) override;

            // Total bytes this backend may hold; create_buffer beyond it fails
            void set_capacity_limit(size_t bytes) { capacity_limit_ = bytes; }

            size_t live_buffers() const { return buffers_.size(); }
            size_t live_layouts() const { return layouts_.size(); }
            size_t allocated_bytes() const { return allocated_bytes_; }
            BufferHandle layout_target(LayoutHandle layout) const;

            const std::vector<DrawCall>& draw_log() const { return draw_log_; }
            void clear_draw_log() { draw_log_.clear(); }

        private:
            const std::vector<uint8_t>& bytes_of(BufferHandle buffer) const;

            std::unordered_map<uint32_t, std::vector<uint8_t>> buffers_;
            std::unordered_map<uint32_t, BufferHandle> layouts_;
            std::vector<DrawCall> draw_log_;
            uint32_t next_buffer_id_ = 1;
            uint32_t next_layout_id_ = 1;
            size_t allocated_bytes_ = 0;
            size_t capacity_limit_ = std::numeric_limits<size_t>::max();
        };
    }
}
