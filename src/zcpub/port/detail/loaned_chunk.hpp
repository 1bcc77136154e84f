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

#include "zcpub/port/publish_mgmt.hpp"
#include "zcpub/shm/pointer_offset.hpp"
#include <boost/core/noncopyable.hpp>

namespace zcpub::port::detail
{

// Types.

/**
 * The ownership core shared by Sample_mut_uninit and Sample_mut: the (Publish_mgmt, shm::Pointer_offset) pair
 * naming a loaned chunk, with the guarantee that exactly one of `Publish_mgmt::reclaim()` and
 * `Publish_mgmt::deliver()` is called for it, exactly once.
 *
 * It is move-only.  Moving transfers that obligation to the target and leaves the source *empty*: its destructor
 * does nothing, and nothing else may be called on it except assignment and destruction.  The typed samples hold
 * one of these by value; the Sample_mut_uninit -> Sample_mut transition simply moves it over.
 */
class Loaned_chunk :
  private boost::noncopyable
{
public:
  // Constructors/destructor.

  /**
   * Takes on the obligation to release the given chunk.
   *
   * @param publisher
   *        The publisher that loaned it.  Must not be null, and must outlive `*this` (or rather the moment
   *        `*this` releases the chunk).
   * @param offset
   *        The chunk.
   */
  explicit Loaned_chunk(Publish_mgmt* publisher, const shm::Pointer_offset& offset);

  /**
   * Move-constructs from `src`, making it empty.
   *
   * @param src
   *        Source object.
   */
  Loaned_chunk(Loaned_chunk&& src) noexcept;

  /// Reclaims the chunk, unless empty.
  ~Loaned_chunk();

  // Methods.

  /**
   * Reclaims the chunk held by `*this`, if any; then takes over `src`'s, making `src` empty.
   *
   * @param src
   *        Source object.
   * @return `*this`.
   */
  Loaned_chunk& operator=(Loaned_chunk&& src) noexcept;

  /**
   * Gives the chunk to Publish_mgmt::deliver(), making `*this` empty, regardless of the outcome.
   * Behavior undefined (assertion may trip) if empty.
   *
   * @param err_code
   *        Must not be null.  See Publish_mgmt::deliver().
   * @return See Publish_mgmt::deliver().
   */
  size_t deliver(Error_code* err_code);

  /**
   * Returns `true` if and only if `*this` is empty (moved-from or delivered).
   *
   * @return See above.
   */
  bool empty() const;

  /**
   * The chunk's offset.  Remains valid even when empty (it then names the chunk that used to be held).
   *
   * @return See above.
   */
  const shm::Pointer_offset& offset() const;

private:
  // Methods.

  /// Reclaims the chunk, if not empty, making `*this` empty.
  void reclaim() noexcept;

  // Data.

  /// The publisher that loaned the chunk; null if and only if empty().
  Publish_mgmt* m_publisher;

  /// See offset().
  shm::Pointer_offset m_offset;
}; // class Loaned_chunk

} // namespace zcpub::port::detail
