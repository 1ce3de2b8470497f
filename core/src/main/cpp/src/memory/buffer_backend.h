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
#include <cstddef>
#include <cstdint>
#include <vector>
#include "errors.h"

namespace geopool {
    namespace memory {

        // Typed resource handles. Zero is never a live handle.
        struct BufferHandle {
            uint32_t id = 0;

            bool valid() const { return id != 0; }
            bool operator==(const BufferHandle& o) const { return id == o.id; }
            bool operator!=(const BufferHandle& o) const { return id != o.id; }
        };

        // Vertex layout descriptor (attribute bindings) pointing at one buffer
        struct LayoutHandle {
            uint32_t id = 0;

            bool valid() const { return id != 0; }
            bool operator==(const LayoutHandle& o) const { return id == o.id; }
            bool operator!=(const LayoutHandle& o) const { return id != o.id; }
        };

        /**
         * Backing-resource boundary. Implementations wrap a graphics API
         * (or host memory) and report failures by throwing ResourceError.
         * Each write/read is a self-contained bind/mutate/unbind sequence;
         * no binding state leaks across calls.
         */
        class BufferBackend {
        public:
            virtual ~BufferBackend() = default;

            // 1) Buffers
            virtual BufferHandle create_buffer(size_t size_bytes) = 0;
            virtual void destroy_buffer(BufferHandle buffer) = 0;
            virtual size_t buffer_size(BufferHandle buffer) const = 0;

            // 2) Data transfer
            virtual void write(BufferHandle buffer, size_t byte_offset,
                               const void* data, size_t size_bytes) = 0;
            virtual void read(BufferHandle buffer, size_t byte_offset,
                              void* out, size_t size_bytes) const = 0;

            // 3) Layout descriptors
            virtual LayoutHandle create_layout(BufferHandle buffer) = 0;
            // Re-point an existing layout at another buffer (used after growth)
            virtual void bind_layout(LayoutHandle layout, BufferHandle buffer) = 0;
            virtual void destroy_layout(LayoutHandle layout) = 0;

            // 4) Submission: one batched draw of the (first, count) vertex ranges
            virtual void draw_ranges(LayoutHandle layout,
                                     const std::vector<int32_t>& firsts,
                                     const std::vector<int32_t>& counts) = 0;

            // Wait for outstanding work on the device before a buffer is
            // replaced. Default: nothing to wait for.
            virtual void finish() {}
        };

    } // namespace memory
} // namespace geopool
