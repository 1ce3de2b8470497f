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
#include <vector>
#include "bucket_pool.h"
#include "config.h"

namespace geopool {
    namespace memory {

        class MemoryController;

        struct CompactionCandidate {
            SizeClass size_class;
            BatchId   batch_id;
            size_t    active_slots;
            size_t    slots;
            double    utilization;
        };

        struct CompactionResult {
            bool   now_empty = false;
            size_t slots_moved = 0;
            size_t bytes_moved = 0;
        };

        /**
         * Relocates live slots out of sparse batches so the batches can be
         * deleted. Holds no state between passes: scheduling (how many
         * candidates to process per pass) belongs to the controller.
         */
        class Compactor {
        public:
            explicit Compactor(double threshold = defrag::kThreshold) : threshold_(threshold) {}

            double threshold() const { return threshold_; }

            // Batches below the utilization floor, and every empty batch,
            // sparsest first. Batches with no slots are skipped.
            std::vector<CompactionCandidate> scan(const PoolSet& pools) const;

            // Move active slots of one batch into other batches of the same
            // pool until the batch is empty or no target has room. Bytes are
            // copied through the backend and entry records re-pointed.
            CompactionResult compact(MemoryController& controller, BucketPool& pool, BatchId batch_id) const;

        private:
            double threshold_;
        };

    } // namespace memory
} // namespace geopool
