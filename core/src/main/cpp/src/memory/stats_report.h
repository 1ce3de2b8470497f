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
#include <string>
#include <vector>

namespace geopool {
namespace memory {

class MemoryController;

// 950 -> "950", 12345 -> "12.3K", 2500000 -> "2.5M"
std::string format_number(int64_t n);

// Fixed-width bar of filled/empty cells; utilization is clamped to [0,1]
std::string utilization_bar(double utilization, int width);

// Multi-line report: totals, one line per non-empty size class, one line
// per batch beneath it
std::vector<std::string> format_report(const MemoryController& controller);

} // namespace memory
} // namespace geopool
