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
#include <cstddef>

namespace zcpub::shm
{

// Types.

/**
 * Identifies a region inside a SHM segment by its distance from the segment base, together with the id of that
 * segment; valid identically in every process that has the segment mapped, unlike a process-local address.
 * See shm namespace doc header for background.
 *
 * The offset and the segment id are packed into one 64-bit #Value: the low #S_SEGMENT_ID_BITS bits hold the segment
 * id, and the rest hold the offset.  So the max offset is 2^56 - 1 bytes, which is not a limitation in practice.
 *
 * Equality and ordering are by #Value.  There is no default constructor and no public constructor: only the
 * allocator owning the segment (classic::Pool_arena) creates these.  Copying is fine and cheap; it does not
 * duplicate or otherwise affect the named region, and a `Pointer_offset` carries no ownership of it.
 */
class Pointer_offset
{
public:
  // Types.

  /// The packed representation; see value().
  using Value = uint64_t;

  /// Identifies one segment among several that may be in use concurrently.
  using Segment_id = uint8_t;

  // Constants.

  /// How many low bits of #Value hold the segment id.
  static constexpr unsigned int S_SEGMENT_ID_BITS = 8;

  /// The largest representable offset.
  static constexpr size_t S_MAX_OFFSET = (size_t(1) << (64 - S_SEGMENT_ID_BITS)) - 1;

  // Methods.

  /**
   * Distance in bytes from the base of the segment.
   *
   * @return See above.
   */
  size_t offset() const;

  /**
   * Id of the segment into which offset() points.
   *
   * @return See above.
   */
  Segment_id segment_id() const;

  /**
   * The packed value, suitable for transmission to another process bit-for-bit.
   *
   * @return See above.
   */
  Value value() const;

private:
  // Friends.

  /// The allocator is the only constructor of these.
  friend class classic::Pool_arena;

  // Constructors.

  /**
   * Constructs the offset.
   *
   * @param offset
   *        Distance from segment base.  Must not exceed #S_MAX_OFFSET (else behavior undefined/assertion may trip).
   * @param segment_id
   *        Segment id.
   */
  explicit Pointer_offset(size_t offset, Segment_id segment_id);

  // Data.

  /// See value().
  Value m_value;
}; // class Pointer_offset

} // namespace zcpub::shm
