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

#include "zcpub/shm/shm_fwd.hpp"
#include <iosfwd>

/**
 * Named-segment SHM pool backing zcpub::port publishers.  A Pool_arena maps one boost.interprocess managed
 * segment, hands out raw chunks from it, and is the only issuer of shm::Pointer_offset values: each arena carries
 * a small segment id, and an offset it issued can be resolved by any other mapping of the same segment, in this
 * or another process, at whatever address that mapping landed.
 */
namespace zcpub::shm::classic
{

// Types.

class Pool_arena;

// Free functions.

/**
 * Prints string representation of the given `Pool_arena` to the given `ostream`.
 *
 * @relatesalso Pool_arena
 *
 * @param os
 *        Stream to which to write.
 * @param val
 *        Object to serialize.
 * @return `os`.
 */
std::ostream& operator<<(std::ostream& os, const Pool_arena& val);

} // namespace zcpub::shm::classic
