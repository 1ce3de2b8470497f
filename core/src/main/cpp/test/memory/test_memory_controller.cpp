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
#include <gmock/gmock.h>
#include <stdexcept>
#include "memory/host_buffer_backend.h"
#include "memory/memory_controller.h"
#include "test_helpers.h"

using namespace geopool::memory;
using geopool::memory::testing_helpers::integrity_ok;
using geopool::memory::testing_helpers::make_payload;
using geopool::memory::testing_helpers::MockBufferBackend;

class MemoryControllerTest : public ::testing::Test {
protected:
    HostBufferBackend backend;
};

TEST_F(MemoryControllerTest, RejectsInvalidPayloads) {
    MemoryController mc(backend);

    EXPECT_THROW(mc.ensure_slot(1, std::vector<float>{}), InvalidPayloadError);
    EXPECT_THROW(mc.ensure_slot(1, std::vector<float>(7, 1.0f)), InvalidPayloadError);
    EXPECT_THROW(mc.ensure_slot(1, nullptr, 6), InvalidPayloadError);

    EXPECT_EQ(mc.entry_count(), 0u);
    EXPECT_EQ(mc.batch_count(), 0u);
    EXPECT_EQ(backend.live_buffers(), 0u);

    // Also an invalid_argument for callers that don't know the type
    EXPECT_THROW(mc.ensure_slot(1, std::vector<float>(5, 0.0f)), std::invalid_argument);
}

TEST_F(MemoryControllerTest, InvalidPayloadLeavesExistingEntryAlone) {
    MemoryController mc(backend);
    auto payload = make_payload(100);
    mc.ensure_slot(1, payload);
    EntryLocation before = mc.location(1);

    EXPECT_THROW(mc.ensure_slot(1, std::vector<float>(13, 0.0f)), InvalidPayloadError);

    EntryLocation after = mc.location(1);
    EXPECT_EQ(after.batch_id, before.batch_id);
    EXPECT_EQ(after.slot_index, before.slot_index);
    EXPECT_EQ(after.vertex_count, 100u);
    EXPECT_EQ(mc.read_back(1), payload);
}

TEST_F(MemoryControllerTest, RemoveUnknownEntry) {
    MemoryController mc(backend);
    try {
        mc.remove_cluster(42);
        FAIL() << "expected EntryNotFoundError";
    } catch (const EntryNotFoundError& e) {
        EXPECT_EQ(e.entry(), 42u);
    }
    EXPECT_THROW(mc.location(42), EntryNotFoundError);
    EXPECT_THROW(mc.read_back(42), std::out_of_range);
}

TEST_F(MemoryControllerTest, FirstInsertCreatesBatch) {
    MemoryController mc(backend);
    mc.ensure_slot(1, make_payload(900));

    EXPECT_TRUE(mc.contains(1));
    EntryLocation loc = mc.location(1);
    EXPECT_EQ(loc.size_class, SizeClass::S);
    EXPECT_EQ(loc.slot_index, 0u);
    EXPECT_EQ(loc.vertex_count, 900u);

    const BucketPool& pool = mc.pool(SizeClass::S);
    EXPECT_EQ(pool.batch_count(), 1u);
    EXPECT_EQ(pool.free_slot_count(), 255u);
    EXPECT_FALSE(pool.is_free(loc.batch_id, 0));
    EXPECT_TRUE(integrity_ok(mc));
}

TEST_F(MemoryControllerTest, ThreeHundredEntriesSpillIntoSecondBatch) {
    MemoryController mc(backend, AllocatorConfig::no_growth());
    for (EntryId id = 1; id <= 300; ++id) {
        mc.ensure_slot(id, make_payload(900, static_cast<float>(id)));
    }

    const BucketPool& pool = mc.pool(SizeClass::S);
    ASSERT_EQ(pool.batch_count(), 2u);
    auto it = pool.batches().begin();
    const Batch& first = *it->second;
    const Batch& second = *(++it)->second;
    EXPECT_EQ(first.active_count(), 256u);
    EXPECT_EQ(second.active_count(), 44u);
    EXPECT_DOUBLE_EQ(first.utilization(), 1.0);

    EXPECT_EQ(pool.free_slot_count(), 212u);
    for (const SlotRef& ref : pool.free_slots()) {
        EXPECT_EQ(ref.batch_id, second.id());
    }

    ControllerStats s = mc.stats();
    EXPECT_EQ(s.growth_events, 0u);
    EXPECT_EQ(s.total_entries, 300u);
    EXPECT_EQ(s.total_batches, 2u);
    EXPECT_EQ(s.active_slots, 300u);
    EXPECT_EQ(s.free_slots, 212u);
    EXPECT_EQ(s.total_vertices, 300u * 900u);
    EXPECT_EQ(s.of(SizeClass::S).entries, 300u);
    EXPECT_EQ(s.of(SizeClass::M).batches, 0u);
    EXPECT_TRUE(integrity_ok(mc));
}

TEST_F(MemoryControllerTest, EnsureSlotIsIdempotent) {
    MemoryController mc(backend);
    auto payload = make_payload(500);
    mc.ensure_slot(7, payload);
    EntryLocation first = mc.location(7);
    size_t buffers = backend.live_buffers();

    mc.ensure_slot(7, payload);
    EntryLocation second = mc.location(7);

    EXPECT_EQ(second.size_class, first.size_class);
    EXPECT_EQ(second.batch_id, first.batch_id);
    EXPECT_EQ(second.slot_index, first.slot_index);
    EXPECT_EQ(second.vertex_count, first.vertex_count);
    EXPECT_EQ(backend.live_buffers(), buffers);
    EXPECT_EQ(mc.entry_count(), 1u);
}

TEST_F(MemoryControllerTest, RoundTrip) {
    MemoryController mc(backend);
    auto a = make_payload(3, 1.0f);
    auto b = make_payload(1024, 2.0f);
    auto c = make_payload(5000, 3.0f);
    mc.ensure_slot(1, a);
    mc.ensure_slot(2, b);
    mc.ensure_slot(3, c);

    EXPECT_EQ(mc.read_back(1), a);
    EXPECT_EQ(mc.read_back(2), b);
    EXPECT_EQ(mc.read_back(3), c);
    EXPECT_EQ(mc.location(3).size_class, SizeClass::L);
}

TEST_F(MemoryControllerTest, RewriteInPlaceWhenItFits) {
    MemoryController mc(backend);
    mc.ensure_slot(1, make_payload(900));
    EntryLocation before = mc.location(1);

    auto bigger = make_payload(1024, 9.0f);
    mc.ensure_slot(1, bigger);
    EntryLocation after = mc.location(1);
    EXPECT_EQ(after.batch_id, before.batch_id);
    EXPECT_EQ(after.slot_index, before.slot_index);
    EXPECT_EQ(after.vertex_count, 1024u);
    EXPECT_EQ(mc.read_back(1), bigger);

    // Shrinking stays put as well
    auto smaller = make_payload(2, 4.0f);
    mc.ensure_slot(1, smaller);
    EXPECT_EQ(mc.location(1).slot_index, before.slot_index);
    EXPECT_EQ(mc.read_back(1), smaller);
    EXPECT_TRUE(integrity_ok(mc));
}

TEST_F(MemoryControllerTest, ShrunkEntryKeepsItsLargerSlot) {
    MemoryController mc(backend);
    mc.ensure_slot(1, make_payload(2000));
    EntryLocation before = mc.location(1);
    ASSERT_EQ(before.size_class, SizeClass::M);

    auto smaller = make_payload(10, 3.0f);
    mc.ensure_slot(1, smaller);

    EntryLocation after = mc.location(1);
    EXPECT_EQ(after.size_class, SizeClass::M);
    EXPECT_EQ(after.batch_id, before.batch_id);
    EXPECT_EQ(after.slot_index, before.slot_index);
    EXPECT_EQ(after.vertex_count, 10u);
    EXPECT_EQ(mc.read_back(1), smaller);
    EXPECT_EQ(mc.pool(SizeClass::S).batch_count(), 0u);
    EXPECT_EQ(mc.stats().of(SizeClass::M).entries, 1u);
    EXPECT_TRUE(integrity_ok(mc));
}

TEST_F(MemoryControllerTest, ShrunkUnboundedEntryKeepsItsBatch) {
    MemoryController mc(backend);
    mc.ensure_slot(1, make_payload(70000));
    EntryLocation before = mc.location(1);
    ASSERT_EQ(before.size_class, SizeClass::XXL);

    auto smaller = make_payload(5000, 6.0f);
    mc.ensure_slot(1, smaller);

    EntryLocation after = mc.location(1);
    EXPECT_EQ(after.size_class, SizeClass::XXL);
    EXPECT_EQ(after.batch_id, before.batch_id);
    EXPECT_EQ(after.slot_index, before.slot_index);
    EXPECT_EQ(after.vertex_count, 5000u);
    EXPECT_EQ(mc.read_back(1), smaller);
    EXPECT_EQ(mc.pool(SizeClass::M).batch_count(), 0u);
    EXPECT_EQ(mc.batch_count(), 1u);
    EXPECT_TRUE(integrity_ok(mc));
}

TEST_F(MemoryControllerTest, OutgrownEntryMovesToLargerClass) {
    MemoryController mc(backend);
    mc.ensure_slot(1, make_payload(900));
    EntryLocation before = mc.location(1);

    auto payload = make_payload(2000, 5.0f);
    mc.ensure_slot(1, payload);

    EntryLocation after = mc.location(1);
    EXPECT_EQ(after.size_class, SizeClass::M);
    EXPECT_EQ(after.vertex_count, 2000u);
    EXPECT_EQ(mc.read_back(1), payload);

    const BucketPool& small = mc.pool(SizeClass::S);
    EXPECT_TRUE(small.is_free(before.batch_id, before.slot_index));
    EXPECT_EQ(small.find_batch(before.batch_id)->active_count(), 0u);
    EXPECT_EQ(mc.entry_count(), 1u);
    EXPECT_TRUE(integrity_ok(mc));
}

TEST_F(MemoryControllerTest, RemoveReturnsSlotToFreeList) {
    MemoryController mc(backend);
    for (EntryId id = 1; id <= 5; ++id) {
        mc.ensure_slot(id, make_payload(10));
    }
    EntryLocation loc = mc.location(3);

    mc.remove_cluster(3);
    EXPECT_FALSE(mc.contains(3));
    EXPECT_TRUE(mc.pool(SizeClass::S).is_free(loc.batch_id, loc.slot_index));
    EXPECT_THROW(mc.remove_cluster(3), EntryNotFoundError);

    // Lowest free slot is reused first
    mc.ensure_slot(99, make_payload(10));
    EXPECT_EQ(mc.location(99).slot_index, loc.slot_index);
    EXPECT_TRUE(integrity_ok(mc));
}

TEST_F(MemoryControllerTest, UnboundedEntriesGetDedicatedBatches) {
    MemoryController mc(backend);
    mc.ensure_slot(1, make_payload(70000));

    const BucketPool& xxl = mc.pool(SizeClass::XXL);
    ASSERT_EQ(xxl.batch_count(), 1u);
    const Batch& batch = *xxl.batches().begin()->second;
    EXPECT_EQ(batch.total_capacity(), 70000u);
    EXPECT_EQ(batch.slot_count(), 1u);

    // Fits in place
    auto smaller = make_payload(66000, 2.0f);
    mc.ensure_slot(1, smaller);
    EXPECT_EQ(mc.location(1).batch_id, batch.id());
    EXPECT_EQ(mc.read_back(1), smaller);

    // A free slot that is too small is passed over and kept
    mc.remove_cluster(1);
    mc.ensure_slot(2, make_payload(80000));
    EXPECT_EQ(xxl.batch_count(), 2u);
    EXPECT_NE(mc.location(2).batch_id, batch.id());
    EXPECT_EQ(xxl.free_slot_count(), 1u);

    // ... and reused by a payload that fits
    BatchId old_id = batch.id();
    mc.ensure_slot(3, make_payload(69000));
    EXPECT_EQ(mc.location(3).batch_id, old_id);
    EXPECT_EQ(xxl.free_slot_count(), 0u);
    EXPECT_TRUE(integrity_ok(mc));
}

TEST_F(MemoryControllerTest, DrawSubmitsOneCallPerNonEmptyBatch) {
    MemoryController mc(backend, AllocatorConfig::no_growth());
    mc.ensure_slot(1, make_payload(10));
    mc.ensure_slot(2, make_payload(20));
    mc.ensure_slot(3, make_payload(3000));
    mc.ensure_slot(4, make_payload(30));
    mc.remove_cluster(1);

    // An empty batch in between must not be drawn
    mc.ensure_slot(5, make_payload(70000));
    mc.remove_cluster(5);

    mc.draw();

    const auto& calls = backend.draw_log();
    ASSERT_EQ(calls.size(), 2u);
    EXPECT_EQ(mc.stats().draw_calls_last_frame, 2u);

    const Batch& small = *mc.pool(SizeClass::S).batches().begin()->second;
    EXPECT_EQ(calls[0].layout, small.layout());
    EXPECT_EQ(calls[0].firsts, (std::vector<int32_t>{1024, 2048}));
    EXPECT_EQ(calls[0].counts, (std::vector<int32_t>{20, 30}));

    const Batch& medium = *mc.pool(SizeClass::M).batches().begin()->second;
    EXPECT_EQ(calls[1].layout, medium.layout());
    EXPECT_EQ(calls[1].firsts, (std::vector<int32_t>{0}));
    EXPECT_EQ(calls[1].counts, (std::vector<int32_t>{3000}));
}

TEST_F(MemoryControllerTest, DeleteBatchRefusesLiveEntries) {
    MemoryController mc(backend);
    mc.ensure_slot(1, make_payload(10));
    BatchId id = mc.location(1).batch_id;

    EXPECT_THROW(mc.delete_batch(SizeClass::S, id), InvariantViolation);
    EXPECT_EQ(mc.batch_count(), 1u);
    EXPECT_EQ(mc.read_back(1), make_payload(10));

    mc.remove_cluster(1);
    mc.delete_batch(SizeClass::S, id);
    EXPECT_EQ(mc.batch_count(), 0u);
    EXPECT_EQ(mc.stats().batch_deletions, 1u);
    EXPECT_EQ(backend.live_buffers(), 0u);
    EXPECT_TRUE(integrity_ok(mc));
}

TEST_F(MemoryControllerTest, BatchIdsAreNeverReused) {
    MemoryController mc(backend);
    mc.ensure_slot(1, make_payload(10));
    BatchId first = mc.location(1).batch_id;
    mc.remove_cluster(1);
    mc.delete_batch(SizeClass::S, first);

    mc.ensure_slot(2, make_payload(10));
    EXPECT_GT(mc.location(2).batch_id, first);
}

TEST_F(MemoryControllerTest, ControllersAreIndependent) {
    HostBufferBackend other_backend;
    MemoryController a(backend);
    MemoryController b(other_backend);

    a.ensure_slot(1, make_payload(10));
    b.ensure_slot(1, make_payload(20));

    EXPECT_EQ(a.location(1).batch_id, b.location(1).batch_id) << "each controller numbers its own batches";
    EXPECT_EQ(a.location(1).vertex_count, 10u);
    EXPECT_EQ(b.location(1).vertex_count, 20u);
}

TEST_F(MemoryControllerTest, ReleaseAllDestroysEverything) {
    {
        MemoryController mc(backend);
        mc.ensure_slot(1, make_payload(10));
        mc.ensure_slot(2, make_payload(5000));
        EXPECT_EQ(backend.live_buffers(), 2u);

        mc.release_all();
        EXPECT_EQ(mc.entry_count(), 0u);
        EXPECT_EQ(mc.batch_count(), 0u);
        EXPECT_EQ(backend.live_buffers(), 0u);
        EXPECT_EQ(backend.live_layouts(), 0u);

        // Still usable afterwards
        mc.ensure_slot(3, make_payload(10));
        EXPECT_TRUE(integrity_ok(mc));
    }
    EXPECT_EQ(backend.live_buffers(), 0u);
    EXPECT_EQ(backend.allocated_bytes(), 0u);
}

TEST_F(MemoryControllerTest, ResourceFailureOnBatchCreationPropagates) {
    MemoryController mc(backend);
    backend.set_capacity_limit(1000);

    EXPECT_THROW(mc.ensure_slot(1, make_payload(10)), ResourceError);
    EXPECT_FALSE(mc.contains(1));
    EXPECT_EQ(mc.batch_count(), 0u);
    EXPECT_TRUE(integrity_ok(mc));
}

TEST(MemoryControllerMockTest, UploadFailureReleasesClaimedSlot) {
    using ::testing::_;
    ::testing::NiceMock<MockBufferBackend> mock;
    MemoryController mc(mock);
    mc.ensure_slot(1, make_payload(10));

    EXPECT_CALL(mock, write(_, _, _, _)).WillOnce(::testing::Throw(ResourceError("device lost")));
    EXPECT_THROW(mc.ensure_slot(2, make_payload(10)), ResourceError);

    EXPECT_FALSE(mc.contains(2));
    EXPECT_EQ(mc.entry_count(), 1u);
    EXPECT_TRUE(integrity_ok(mc));
    EXPECT_EQ(mc.stats().free_slots, 255u);
}

TEST(MemoryControllerMockTest, DrawFailurePropagates) {
    using ::testing::_;
    ::testing::NiceMock<MockBufferBackend> mock;
    MemoryController mc(mock);
    mc.ensure_slot(1, make_payload(10));

    EXPECT_CALL(mock, draw_ranges(_, _, _)).WillOnce(::testing::Throw(ResourceError("submit failed")));
    EXPECT_THROW(mc.draw(), ResourceError);
}

TEST_F(MemoryControllerTest, RejectsInconsistentConfig) {
    AllocatorConfig config;
    config.compaction_threshold = 0.9;  // above the growth threshold
    EXPECT_THROW({ MemoryController mc(backend, config); }, std::invalid_argument);
}
