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

#include "zcpub/port/header.hpp"
#include "zcpub/port/maybe_uninit.hpp"
#include <atomic>
#include <type_traits>

namespace zcpub::port::detail
{

// Types.

/**
 * The payload-type-independent leading part of every chunk loaned by a Publisher_base; so Publisher_base can
 * manage chunks without knowing the payload type.  It is placed at the start of the chunk, at the chunk's
 * shm::Pointer_offset.
 */
struct Chunk_prefix
{
  // Types.

  /// Short-hand for the atomic owner count type.
  using Atomic_owner_ct = std::atomic<unsigned int>;

  // Constructors/destructor.

  /**
   * Constructs the prefix of a freshly loaned chunk: owner count 0 and the given header.
   *
   * @param header
   *        The header, fixed for the chunk's lifetime.
   */
  explicit Chunk_prefix(const Header& header) :
    m_atomic_owner_ct(0),
    m_header(header)
  {
    // Done.
  }

  // Data.

  /**
   * While the chunk is loaned: unused (0).  Once delivered: 1 per receiver that accepted the chunk and has not
   * yet returned it via Publisher_base::release_delivered_sample(); plus 1 for the publisher for the duration of
   * the fan-out.  Whoever brings it to 0 deallocates the chunk, through whatever read-write mapping of the segment
   * they hold.  Atomic, since receivers may return chunks from other threads or processes, possibly after the
   * publisher is gone.
   */
  Atomic_owner_ct m_atomic_owner_ct;

  /// The header; see Header.
  Header m_header;
}; // struct Chunk_prefix

/**
 * The full layout of a chunk for a given payload type: Chunk_prefix, followed by the (aligned) payload storage.
 * Header and payload are independently addressable within the one region.
 *
 * @tparam Payload
 *         Payload type.
 */
template<typename Payload>
struct Chunk
{
  // Constructors/destructor.

  /**
   * Constructs the chunk of a freshly loaned sample: prefix per Chunk_prefix ctor; payload storage uninitialized.
   *
   * @param header
   *        See Chunk_prefix ctor.
   */
  explicit Chunk(const Header& header) :
    m_prefix(header)
  {
    // Done.
  }

  // Data.

  /// Must be first: the chunk's offset is the prefix's offset.
  Chunk_prefix m_prefix;

  /// The payload storage.
  Maybe_uninit<Payload> m_payload;
}; // struct Chunk

static_assert(std::is_standard_layout_v<Chunk_prefix>,
              "Chunk_prefix must be standard-layout so that it sits at a known place in SHM.");
static_assert(std::is_trivially_destructible_v<Chunk_prefix>,
              "Chunks are deallocated without running destructors, possibly by another process.");

} // namespace zcpub::port::detail
