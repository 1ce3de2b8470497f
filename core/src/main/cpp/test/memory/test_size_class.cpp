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

#include <gtest/gtest.h>
#include <string>
#include "memory/size_class.hpp"

using namespace geopool::memory;

static_assert(classify(1024) == SizeClass::S, "classify must be usable at compile time");

TEST(SizeClassTest, ClassifiesAtBoundaries) {
    EXPECT_EQ(classify(1), SizeClass::S);
    EXPECT_EQ(classify(1024), SizeClass::S);
    EXPECT_EQ(classify(1025), SizeClass::M);
    EXPECT_EQ(classify(4096), SizeClass::M);
    EXPECT_EQ(classify(4097), SizeClass::L);
    EXPECT_EQ(classify(16384), SizeClass::L);
    EXPECT_EQ(classify(16385), SizeClass::XL);
    EXPECT_EQ(classify(65536), SizeClass::XL);
    EXPECT_EQ(classify(65537), SizeClass::XXL);
    EXPECT_EQ(classify(10000000), SizeClass::XXL);
}

TEST(SizeClassTest, SmallestFittingClass) {
    // Every count lands in the first class whose capacity holds it
    for (size_t n : {1u, 3u, 900u, 1023u, 2000u, 5000u, 20000u, 60000u}) {
        SizeClass c = classify(n);
        ASSERT_FALSE(is_unbounded(c)) << n;
        EXPECT_LE(n, slot_capacity(c)) << n;
        if (class_index(c) > 0) {
            EXPECT_GT(n, slot_capacity(static_cast<SizeClass>(class_index(c) - 1))) << n;
        }
    }
}

TEST(SizeClassTest, CapacitiesAndSlotsPerBatch) {
    EXPECT_EQ(slot_capacity(SizeClass::S), 1024u);
    EXPECT_EQ(slot_capacity(SizeClass::M), 4096u);
    EXPECT_EQ(slot_capacity(SizeClass::L), 16384u);
    EXPECT_EQ(slot_capacity(SizeClass::XL), 65536u);
    EXPECT_EQ(slot_capacity(SizeClass::XXL), 0u);

    EXPECT_EQ(slots_per_batch(SizeClass::S), 256u);
    EXPECT_EQ(slots_per_batch(SizeClass::M), 128u);
    EXPECT_EQ(slots_per_batch(SizeClass::L), 64u);
    EXPECT_EQ(slots_per_batch(SizeClass::XL), 16u);
    EXPECT_EQ(slots_per_batch(SizeClass::XXL), 1u);

    EXPECT_TRUE(is_unbounded(SizeClass::XXL));
    EXPECT_FALSE(is_unbounded(SizeClass::XL));
}

TEST(SizeClassTest, Names) {
    EXPECT_EQ(std::string(to_string(SizeClass::S)), "small");
    EXPECT_EQ(std::string(to_string(SizeClass::M)), "medium");
    EXPECT_EQ(std::string(to_string(SizeClass::L)), "large");
    EXPECT_EQ(std::string(to_string(SizeClass::XL)), "xlarge");
    EXPECT_EQ(std::string(to_string(SizeClass::XXL)), "xxlarge");
}

TEST(SizeClassTest, VertexLayout) {
    EXPECT_EQ(vertex_layout::kFloatsPerVertex, 6u);
    EXPECT_EQ(vertex_layout::kBytesPerVertex, 24u);
    EXPECT_EQ(vertex_layout::kPositionOffset, 0u);
    EXPECT_EQ(vertex_layout::kColorOffset, 8u);
}
