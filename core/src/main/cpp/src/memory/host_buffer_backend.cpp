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

#include "host_buffer_backend.h"
#include "config.h"
#include <cstring>
#include <string>

namespace geopool {
    namespace memory {

        BufferHandle HostBufferBackend::create_buffer(size_t size_bytes) {
            if (size_bytes == 0) {
                throw ResourceError("cannot create zero-sized buffer");
            }
            if (size_bytes > capacity_limit_ - allocated_bytes_) {
                throw ResourceError("out of buffer memory: requested " + std::to_string(size_bytes) +
                                    " bytes, " + std::to_string(capacity_limit_ - allocated_bytes_) +
                                    " available");
            }

            BufferHandle handle{next_buffer_id_++};
            buffers_[handle.id].assign(size_bytes, 0);
            allocated_bytes_ += size_bytes;
            return handle;
        }

        void HostBufferBackend::destroy_buffer(BufferHandle buffer) {
            auto it = buffers_.find(buffer.id);
            if (it == buffers_.end()) {
                throw ResourceError("destroy of unknown buffer " + std::to_string(buffer.id));
            }
            allocated_bytes_ -= it->second.size();
            buffers_.erase(it);
        }

        size_t HostBufferBackend::buffer_size(BufferHandle buffer) const {
            return bytes_of(buffer).size();
        }

        void HostBufferBackend::write(BufferHandle buffer, size_t byte_offset,
                                      const void* data, size_t size_bytes) {
            auto it = buffers_.find(buffer.id);
            if (it == buffers_.end()) {
                throw ResourceError("write to unknown buffer " + std::to_string(buffer.id));
            }
            auto& bytes = it->second;
            if (byte_offset > bytes.size() || size_bytes > bytes.size() - byte_offset) {
                throw ResourceError("write out of range: offset " + std::to_string(byte_offset) +
                                    " size " + std::to_string(size_bytes) +
                                    " buffer " + std::to_string(bytes.size()));
            }
            if (size_bytes > 0) {
                std::memcpy(bytes.data() + byte_offset, data, size_bytes);
            }
        }

        void HostBufferBackend::read(BufferHandle buffer, size_t byte_offset,
                                     void* out, size_t size_bytes) const {
            const auto& bytes = bytes_of(buffer);
            if (byte_offset > bytes.size() || size_bytes > bytes.size() - byte_offset) {
                throw ResourceError("read out of range: offset " + std::to_string(byte_offset) +
                                    " size " + std::to_string(size_bytes) +
                                    " buffer " + std::to_string(bytes.size()));
            }
            if (size_bytes > 0) {
                std::memcpy(out, bytes.data() + byte_offset, size_bytes);
            }
        }

        LayoutHandle HostBufferBackend::create_layout(BufferHandle buffer) {
            bytes_of(buffer);  // must exist
            LayoutHandle handle{next_layout_id_++};
            layouts_[handle.id] = buffer;
            return handle;
        }

        void HostBufferBackend::bind_layout(LayoutHandle layout, BufferHandle buffer) {
            auto it = layouts_.find(layout.id);
            if (it == layouts_.end()) {
                throw ResourceError("bind of unknown layout " + std::to_string(layout.id));
            }
            bytes_of(buffer);
            it->second = buffer;
        }

        void HostBufferBackend::destroy_layout(LayoutHandle layout) {
            if (layouts_.erase(layout.id) == 0) {
                throw ResourceError("destroy of unknown layout " + std::to_string(layout.id));
            }
        }

        void HostBufferBackend::draw_ranges(LayoutHandle layout,
                                            const std::vector<int32_t>& firsts,
                                            const std::vector<int32_t>& counts) {
            if (firsts.size() != counts.size()) {
                throw ResourceError("draw range arrays differ in length");
            }
            BufferHandle target = layout_target(layout);
            const size_t vertices = buffer_size(target) / vertex_layout::kBytesPerVertex;
            for (size_t i = 0; i < firsts.size(); ++i) {
                if (firsts[i] < 0 || counts[i] < 0 ||
                    static_cast<size_t>(firsts[i]) + static_cast<size_t>(counts[i]) > vertices) {
                    throw ResourceError("draw range [" + std::to_string(firsts[i]) + ", +" +
                                        std::to_string(counts[i]) + ") outside buffer " +
                                        std::to_string(target.id));
                }
            }
            draw_log_.push_back(DrawCall{layout, target, firsts, counts});
        }

        BufferHandle HostBufferBackend::layout_target(LayoutHandle layout) const {
            auto it = layouts_.find(layout.id);
            if (it == layouts_.end()) {
                throw ResourceError("unknown layout " + std::to_string(layout.id));
            }
            return it->second;
        }

        const std::vector<uint8_t>& HostBufferBackend::bytes_of(BufferHandle buffer) const {
            auto it = buffers_.find(buffer.id);
            if (it == buffers_.end()) {
                throw ResourceError("unknown buffer " + std::to_string(buffer.id));
            }
            return it->second;
        }
    }
}
