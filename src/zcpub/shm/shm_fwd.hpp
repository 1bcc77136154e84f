/* zcpub: Zero-copy SHM publishing
 * Copyright 2023 Akamai Technologies, Inc.
 *
 * Licensed under the Apache License, Version 2.0 (the
 * "License"); you may not use this file except in
 * compliance with the License.  You may obtain a copy
 * of the License at
 *
 *   https://www.apache.org/licenses/LICENSE-2.0
 *
 * Unless required by applicable law or agreed to in
 * writing, software distributed under the License is
 * distributed on an "AS IS" BASIS, WITHOUT WARRANTIES OR
 * CONDITIONS OF ANY KIND, either express or implied.
 * See the License for the specific language governing
 * permissions and limitations under the License. */

/// @file
#pragma once

#include "zcpub/common.hpp"
#include <cstdint>
#include <ostream>

/**
 * Modules for SHared Memory (SHM) support: relative addressing into SHM segments, and the SHM-provider that owns
 * the segments and issues those addresses.
 *
 * ### Relative addressing ###
 * A SHM pool (segment) is typically `mmap()`ped at a different base vaddr in each process that opens it.  Therefore
 * a `void*` into the pool in process 1 means nothing in process 2.  What *does* mean the same thing everywhere is the
 * distance from the pool's base; plus, if there are several pools, which pool.  shm::Pointer_offset is that pair,
 * packed into one integer.  It is a value type: copying it copies a name of a region, not the region.
 *
 * Only the pool allocator (shm::classic::Pool_arena) constructs `Pointer_offset`s: it alone knows its base vaddr
 * and hence can translate a local pointer into an offset (and back, in any process that has the pool open).
 *
 * ### SHM-providers ###
 * As of this writing there is one, shm::classic: a single `bipc::managed_shared_memory` pool with bipc's default
 * allocation algorithm.  It is deliberately minimalistic.
 */
namespace zcpub::shm
{

// Types.

// Find doc headers near the bodies of these compound types.

class Pointer_offset;

// Free functions.

/**
 * Prints string representation of the given `Pointer_offset` to the given `ostream`.
 *
 * @relatesalso Pointer_offset
 *
 * @param os
 *        Stream to which to write.
 * @param val
 *        Object to serialize.
 * @return `os`.
 */
std::ostream& operator<<(std::ostream& os, const Pointer_offset& val);

/**
 * Returns `true` if and only if the two offsets name the same region (same segment, same offset).
 *
 * @relatesalso Pointer_offset
 *
 * @param val1
 *        Object to compare.
 * @param val2
 *        Object to compare.
 * @return See above.
 */
bool operator==(const Pointer_offset& val1, const Pointer_offset& val2);

/**
 * Negation of similar `==`.
 *
 * @relatesalso Pointer_offset
 *
 * @param val1
 *        Object to compare.
 * @param val2
 *        Object to compare.
 * @return See above.
 */
bool operator!=(const Pointer_offset& val1, const Pointer_offset& val2);

/**
 * Orders by Pointer_offset::value().  Meaningful (beyond use as a map key) only between offsets into the same
 * segment.
 *
 * @relatesalso Pointer_offset
 *
 * @param val1
 *        Object to compare.
 * @param val2
 *        Object to compare.
 * @return See above.
 */
bool operator<(const Pointer_offset& val1, const Pointer_offset& val2);

namespace classic
{

class Pool_arena;

} // namespace classic

} // namespace zcpub::shm
