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
#include <cstdint>

namespace chunkstore {
namespace table {

/**
 * Random-access byte source backing a table file.
 *
 * read_at fills up to len bytes of buf from offset and returns the count
 * actually read. Implementations must be safe for concurrent calls and
 * report failures by throwing a StoreError.
 */
class ReadAtSource {
public:
    virtual ~ReadAtSource() = default;
    virtual size_t read_at(uint8_t* buf, size_t len, uint64_t offset) const = 0;
};

} // namespace table
} // namespace chunkstore
