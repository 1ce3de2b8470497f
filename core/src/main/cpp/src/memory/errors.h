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
#include <stdexcept>
#include <string>

namespace geopool {
namespace memory {

using EntryId = uint64_t;

// Empty payload, or a float count that is not a whole number of vertices.
// Nothing was changed.
class InvalidPayloadError : public std::invalid_argument {
public:
    explicit InvalidPayloadError(const std::string& what)
        : std::invalid_argument(what) {}
};

// No location record for the entry. Nothing was changed.
class EntryNotFoundError : public std::out_of_range {
public:
    explicit EntryNotFoundError(EntryId entry)
        : std::out_of_range("entry " + std::to_string(entry) + " not found"),
          entry_(entry) {}

    EntryId entry() const { return entry_; }

private:
    EntryId entry_;
};

// Failure at the backing-resource boundary. The operation in progress is
// abandoned and the error propagated.
class ResourceError : public std::runtime_error {
public:
    explicit ResourceError(const std::string& what)
        : std::runtime_error(what) {}
};

// Allocator state no longer satisfies its invariants (programming error)
class InvariantViolation : public std::logic_error {
public:
    explicit InvariantViolation(const std::string& what)
        : std::logic_error(what) {}
};

} // namespace memory
} // namespace geopool
