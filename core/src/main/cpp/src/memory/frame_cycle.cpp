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

#include "frame_cycle.h"
#include <stdexcept>
#include <string>
#include "../util/log.h"

namespace geopool {
    namespace memory {

        const char* to_string(FrameCycle::Phase phase) {
            switch (phase) {
                case FrameCycle::Phase::Idle:      return "idle";
                case FrameCycle::Phase::Preparing: return "preparing";
                case FrameCycle::Phase::Prepared:  return "prepared";
                case FrameCycle::Phase::Drawn:     return "drawn";
            }
            return "unknown";
        }

        void FrameCycle::expect(Phase expected, const char* op) const {
            if (phase_ != expected) {
                throw std::logic_error(std::string(op) + " called while " + to_string(phase_) +
                                       " (expected " + to_string(expected) + ")");
            }
        }

        void FrameCycle::begin_frame() {
            expect(Phase::Idle, "begin_frame");
            uploaded_.clear();
            last_resubmitted_ = 0;
            phase_ = Phase::Preparing;
        }

        void FrameCycle::upload(EntryId entry, std::vector<float> payload) {
            expect(Phase::Preparing, "upload");
            controller_.ensure_slot(entry, payload);
            uploaded_[entry] = std::move(payload);
        }

        void FrameCycle::remove(EntryId entry) {
            expect(Phase::Preparing, "remove");
            controller_.remove_cluster(entry);
            uploaded_.erase(entry);
        }

        size_t FrameCycle::finish_prepare(const Regenerate& regenerate) {
            expect(Phase::Preparing, "finish_prepare");

            size_t resubmitted = 0;
            // A regenerated payload may move to a larger class and grow
            // another batch, so drain until nothing is left
            for (std::set<EntryId> pending = controller_.get_and_clear_pending_reuploads();
                 !pending.empty();
                 pending = controller_.get_and_clear_pending_reuploads()) {
                for (EntryId entry : pending) {
                    auto cached = uploaded_.find(entry);
                    if (cached != uploaded_.end()) {
                        controller_.ensure_slot(entry, cached->second);
                    } else if (regenerate) {
                        std::vector<float> payload = regenerate(entry);
                        controller_.ensure_slot(entry, payload);
                        uploaded_[entry] = std::move(payload);
                    } else {
                        throw std::invalid_argument("entry " + std::to_string(entry) +
                                                    " needs re-upload but has no geometry this frame "
                                                    "and no regenerate callback was given");
                    }
                    ++resubmitted;
                }
            }

            if (resubmitted > 0) {
                debug() << "frame " << frame_ << ": resubmitted " << resubmitted << " entries after growth";
            }
            last_resubmitted_ = resubmitted;
            phase_ = Phase::Prepared;
            return resubmitted;
        }

        void FrameCycle::draw() {
            expect(Phase::Prepared, "draw");
            controller_.draw();
            phase_ = Phase::Drawn;
        }

        void FrameCycle::end_frame() {
            expect(Phase::Drawn, "end_frame");
            phase_ = Phase::Idle;
            ++frame_;

            const AllocatorConfig& config = controller_.config();
            if (config.compaction_interval_frames > 0 && frame_ % config.compaction_interval_frames == 0) {
                last_compaction_ = controller_.try_compaction();
            }

            if (config.validate_interval_frames > 0 && frame_ % config.validate_interval_frames == 0) {
                IntegrityReport report = controller_.validate_integrity();
                if (!report.ok()) {
                    severe() << "frame " << frame_ << ": allocator integrity check failed";
                    throw InvariantViolation("integrity check failed at frame " + std::to_string(frame_) + " with " +
                                             std::to_string(report.errors.size()) + " errors, first: " +
                                             report.errors.front());
                }
            }

            if (config.stats_interval_frames > 0 && frame_ % config.stats_interval_frames == 0) {
                controller_.print_stats();
            }
        }

    } // namespace memory
} // namespace geopool
