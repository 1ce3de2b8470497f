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
#include <set>
#include "memory/host_buffer_backend.h"
#include "memory/memory_controller.h"
#include "test_helpers.h"

using namespace geopool::memory;
using geopool::memory::testing_helpers::integrity_ok;
using geopool::memory::testing_helpers::make_payload;

class GrowthTest : public ::testing::Test {
protected:
    HostBufferBackend backend;

    void fill(MemoryController& mc, EntryId from, EntryId to, uint32_t vertices = 10) {
        for (EntryId id = from; id <= to; ++id) {
            mc.ensure_slot(id, make_payload(vertices, static_cast<float>(id)));
        }
    }

    const Batch& only_batch(const MemoryController& mc, SizeClass c) {
        return *mc.pool(c).batches().begin()->second;
    }
};

TEST_F(GrowthTest, FullBatchGrowsBeforeAllocating) {
    MemoryController mc(backend);
    fill(mc, 1, 256);
    EXPECT_TRUE(mc.get_and_clear_pending_reuploads().empty());
    ASSERT_DOUBLE_EQ(only_batch(mc, SizeClass::S).utilization(), 1.0);

    mc.ensure_slot(257, make_payload(10, 257.0f));

    EXPECT_EQ(mc.pool(SizeClass::S).batch_count(), 1u);
    const Batch& batch = only_batch(mc, SizeClass::S);
    EXPECT_EQ(batch.slot_count(), 512u);
    EXPECT_EQ(batch.growth_cycles(), 1u);
    EXPECT_EQ(mc.location(257).slot_index, 256u);
    EXPECT_EQ(mc.stats().growth_events, 1u);
    EXPECT_EQ(mc.pool(SizeClass::S).free_slot_count(), 255u);

    std::set<EntryId> pending = mc.get_and_clear_pending_reuploads();
    ASSERT_EQ(pending.size(), 256u);
    EXPECT_EQ(*pending.begin(), 1u);
    EXPECT_EQ(*pending.rbegin(), 256u);
    EXPECT_EQ(pending.count(257), 0u);
    EXPECT_TRUE(mc.get_and_clear_pending_reuploads().empty()) << "drained by the first call";

    // Growth copies forward; nothing was lost
    for (EntryId id = 1; id <= 257; ++id) {
        ASSERT_EQ(mc.read_back(id), make_payload(10, static_cast<float>(id))) << "entry " << id;
    }
    EXPECT_TRUE(integrity_ok(mc));
}

TEST_F(GrowthTest, GrowthStopsAtMaxCycles) {
    MemoryController mc(backend);
    fill(mc, 1, 1025, 4);

    const BucketPool& pool = mc.pool(SizeClass::S);
    ASSERT_EQ(pool.batch_count(), 2u);
    const Batch& first = *pool.batches().begin()->second;
    EXPECT_EQ(first.growth_cycles(), 2u);
    EXPECT_EQ(first.slot_count(), 1024u);
    EXPECT_EQ(first.total_capacity(), 4u * first.initial_capacity());
    EXPECT_EQ(mc.stats().growth_events, 2u);
    EXPECT_TRUE(integrity_ok(mc));
}

TEST_F(GrowthTest, GrowthRespectsByteCeiling) {
    AllocatorConfig config;
    config.growth_max_batch_bytes = 256u * 1024u * 24u * 2u - 1u;
    MemoryController mc(backend, config);
    fill(mc, 1, 257);

    EXPECT_EQ(mc.pool(SizeClass::S).batch_count(), 2u);
    EXPECT_EQ(mc.stats().growth_events, 0u);
    for (const auto& kv : mc.pool(SizeClass::S).batches()) {
        EXPECT_LE(kv.second->size_bytes(), 256u * 1024u * 24u);
    }
}

TEST_F(GrowthTest, DisabledGrowthSpills) {
    MemoryController mc(backend, AllocatorConfig::no_growth());
    fill(mc, 1, 257);
    EXPECT_EQ(mc.pool(SizeClass::S).batch_count(), 2u);
    EXPECT_TRUE(mc.get_and_clear_pending_reuploads().empty());
}

TEST_F(GrowthTest, PendingSetCoversOnlyTheGrownBatch) {
    MemoryController mc(backend);
    mc.ensure_slot(1000, make_payload(2000));  // medium
    fill(mc, 1, 257);

    std::set<EntryId> pending = mc.get_and_clear_pending_reuploads();
    EXPECT_EQ(pending.size(), 256u);
    EXPECT_EQ(pending.count(1000), 0u);
}

TEST_F(GrowthTest, RemovedEntryLeavesPendingSet) {
    MemoryController mc(backend);
    fill(mc, 1, 257);
    mc.remove_cluster(5);

    std::set<EntryId> pending = mc.get_and_clear_pending_reuploads();
    EXPECT_EQ(pending.size(), 255u);
    EXPECT_EQ(pending.count(5), 0u);
}

TEST_F(GrowthTest, UnboundedClassNeverGrows) {
    MemoryController mc(backend);
    mc.ensure_slot(1, make_payload(70000));
    mc.ensure_slot(2, make_payload(70000));
    EXPECT_EQ(mc.pool(SizeClass::XXL).batch_count(), 2u);
    EXPECT_EQ(mc.stats().growth_events, 0u);
}

TEST_F(GrowthTest, FailedGrowthLeavesStateConsistent) {
    MemoryController mc(backend);
    fill(mc, 1, 256);
    backend.set_capacity_limit(backend.allocated_bytes() + 4096);

    EXPECT_THROW(mc.ensure_slot(257, make_payload(10)), ResourceError);

    EXPECT_FALSE(mc.contains(257));
    EXPECT_EQ(only_batch(mc, SizeClass::S).slot_count(), 256u);
    EXPECT_EQ(mc.stats().growth_events, 0u);
    EXPECT_TRUE(mc.get_and_clear_pending_reuploads().empty());
    EXPECT_EQ(backend.live_buffers(), 1u);
    EXPECT_TRUE(integrity_ok(mc));
}
