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
#include <cstdlib>
#include <string>
#include "config.h"  // For defaults

namespace geopool {
namespace memory {

/**
 * Runtime configuration for the memory controller
 * Can be customized per controller instead of compile-time constants
 */
struct AllocatorConfig {
    // Dynamic growth
    bool     growth_enabled          = growth::kEnabled;
    double   growth_util_threshold   = growth::kUtilThreshold;
    uint32_t growth_max_cycles       = growth::kMaxCycles;
    size_t   growth_max_batch_bytes  = growth::kMaxBatchBytes;

    // Compaction
    bool     compaction_enabled      = defrag::kEnabled;
    double   compaction_threshold    = defrag::kThreshold;
    size_t   compaction_max_per_cycle = defrag::kMaxPerCycle;

    // Free list policy
    bool     sorted_free_list        = free_list::kSorted;

    // Host loop cadence (0 disables)
    uint64_t compaction_interval_frames = cadence::kCompactionIntervalFrames;
    uint64_t validate_interval_frames   = cadence::kValidateIntervalFrames;
    uint64_t stats_interval_frames      = cadence::kStatsIntervalFrames;

    /**
     * Create config with defaults, optionally reading from environment
     */
    static AllocatorConfig defaults() {
        AllocatorConfig cfg;

        if (const char* env = std::getenv("GEOPOOL_GROWTH_ENABLE")) {
            cfg.growth_enabled = (std::string(env) != "0");
        }

        if (const char* env = std::getenv("GEOPOOL_GROWTH_UTIL_THRESHOLD")) {
            cfg.growth_util_threshold = std::stod(env);
        }

        if (const char* env = std::getenv("GEOPOOL_GROWTH_MAX_CYCLES")) {
            cfg.growth_max_cycles = static_cast<uint32_t>(std::stoul(env));
        }

        if (const char* env = std::getenv("GEOPOOL_GROWTH_MAX_BATCH_MB")) {
            cfg.growth_max_batch_bytes = std::stoull(env) * 1024 * 1024;
        }

        if (const char* env = std::getenv("GEOPOOL_DEFRAG_ENABLE")) {
            cfg.compaction_enabled = (std::string(env) != "0");
        }

        if (const char* env = std::getenv("GEOPOOL_DEFRAG_THRESHOLD")) {
            cfg.compaction_threshold = std::stod(env);
        }

        if (const char* env = std::getenv("GEOPOOL_DEFRAG_MAX_PER_CYCLE")) {
            cfg.compaction_max_per_cycle = std::stoull(env);
        }

        if (const char* env = std::getenv("GEOPOOL_FREELIST_SORTED")) {
            cfg.sorted_free_list = (std::string(env) != "0");
        }

        if (const char* env = std::getenv("GEOPOOL_COMPACTION_INTERVAL_FRAMES")) {
            cfg.compaction_interval_frames = std::stoull(env);
        }

        if (const char* env = std::getenv("GEOPOOL_VALIDATE_INTERVAL_FRAMES")) {
            cfg.validate_interval_frames = std::stoull(env);
        }

        if (const char* env = std::getenv("GEOPOOL_STATS_INTERVAL_FRAMES")) {
            cfg.stats_interval_frames = std::stoull(env);
        }

        return cfg;
    }

    /**
     * Fixed-size batches only: a full batch spills into a new batch
     */
    static AllocatorConfig no_growth() {
        AllocatorConfig cfg;
        cfg.growth_enabled = false;
        return cfg;
    }

    /**
     * Never relocate or reclaim batches
     */
    static AllocatorConfig no_compaction() {
        AllocatorConfig cfg;
        cfg.compaction_enabled = false;
        return cfg;
    }

    /**
     * Validate configuration
     */
    bool validate() const {
        if (growth_util_threshold < 0.0 || growth_util_threshold > 1.0) {
            return false;
        }
        if (compaction_threshold < 0.0 || compaction_threshold > 1.0) {
            return false;
        }
        if (compaction_enabled && compaction_max_per_cycle < 1) {
            // Compaction that may never move anything
            return false;
        }
        if (growth_enabled && growth_max_batch_bytes == 0) {
            return false;
        }
        if (growth_enabled && compaction_enabled &&
            compaction_threshold >= growth_util_threshold) {
            // A batch could be grown and compacted in alternating cycles
            return false;
        }
        return true;
    }
};

} // namespace memory
} // namespace geopool
