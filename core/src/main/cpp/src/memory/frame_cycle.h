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
#include <functional>
#include <unordered_map>
#include <vector>
#include "memory_controller.h"

namespace geopool {
    namespace memory {

        /**
         * Drives one controller through the per-frame sequence
         *
         *   begin_frame() -> upload()/remove()* -> finish_prepare() -> draw() -> end_frame()
         *
         * finish_prepare() resubmits every entry whose backing buffer was
         * replaced by growth, using the geometry uploaded this frame or, when
         * the entry was not touched, the caller's regenerate callback.
         * end_frame() runs compaction, validation and the stats report on
         * their configured cadences. Out-of-order calls throw std::logic_error.
         */
        class FrameCycle {
        public:
            enum class Phase {
                Idle,       // Between frames
                Preparing,  // Uploads allowed
                Prepared,   // Re-uploads drained, ready to draw
                Drawn
            };

            using Regenerate = std::function<std::vector<float>(EntryId)>;

            explicit FrameCycle(MemoryController& controller) : controller_(controller) {}

            void begin_frame();
            void upload(EntryId entry, std::vector<float> payload);
            void remove(EntryId entry);

            // Returns the number of entries resubmitted
            size_t finish_prepare(const Regenerate& regenerate = Regenerate());

            void draw();

            // Throws InvariantViolation when a scheduled validation fails
            void end_frame();

            Phase phase() const { return phase_; }
            uint64_t frame() const { return frame_; }   // Completed frames
            size_t last_resubmitted() const { return last_resubmitted_; }
            const CompactionPass& last_compaction() const { return last_compaction_; }

        private:
            void expect(Phase expected, const char* op) const;

            MemoryController& controller_;
            Phase phase_ = Phase::Idle;
            uint64_t frame_ = 0;
            size_t last_resubmitted_ = 0;
            CompactionPass last_compaction_;
            std::unordered_map<EntryId, std::vector<float>> uploaded_;  // This frame only
        };

        const char* to_string(FrameCycle::Phase phase);

    } // namespace memory
} // namespace geopool
