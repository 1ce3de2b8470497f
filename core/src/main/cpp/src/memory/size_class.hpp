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
#include "config.h"

namespace geopool {
    namespace memory {

        // Ordered: iteration, stats and draw submission follow this order
        enum class SizeClass : uint8_t {
            S = 0,
            M,
            L,
            XL,
            XXL    // Dedicated batch per payload for outliers
        };

        constexpr SizeClass kAllSizeClasses[] = {
            SizeClass::S, SizeClass::M, SizeClass::L, SizeClass::XL, SizeClass::XXL
        };
        static_assert(sizeof(kAllSizeClasses) / sizeof(kAllSizeClasses[0]) == size_class::kNumClasses,
                      "kAllSizeClasses needs one entry per size class");

        constexpr size_t class_index(SizeClass c) {
            return static_cast<size_t>(c);
        }

        constexpr bool is_unbounded(SizeClass c) {
            return c == SizeClass::XXL;
        }

        constexpr SizeClass classify(size_t vertex_count) {
            // Find the smallest class that fits
            for (uint8_t i = 0; i < size_class::kNumFixedClasses; ++i) {
                if (vertex_count <= size_class::kSlotCapacities[i]) {
                    return static_cast<SizeClass>(i);
                }
            }

            // Too large for any fixed class
            return SizeClass::XXL;
        }

        // Per-slot vertex capacity; 0 for XXL, which is sized per payload
        constexpr uint32_t slot_capacity(SizeClass c) {
            return is_unbounded(c) ? 0 : size_class::kSlotCapacities[class_index(c)];
        }

        constexpr uint32_t slots_per_batch(SizeClass c) {
            return size_class::kSlotsPerBatch[class_index(c)];
        }

        inline const char* to_string(SizeClass c) {
            switch (c) {
                case SizeClass::S:   return "small";
                case SizeClass::M:   return "medium";
                case SizeClass::L:   return "large";
                case SizeClass::XL:  return "xlarge";
                case SizeClass::XXL: return "xxlarge";
            }
            return "unknown";
        }
    }
}
