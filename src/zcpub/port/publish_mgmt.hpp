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

#include "zcpub/port/port_fwd.hpp"
#include "zcpub/common.hpp"
#include <cstddef>

namespace zcpub::port
{

// Types.

/**
 * The capability a sample (Sample_mut_uninit, Sample_mut) requires from whatever loaned it: take back a region
 * that will not be sent, or deliver a region that is being sent.  The sample calls exactly one of these, exactly
 * once, with the shm::Pointer_offset it was created with.  Publisher_base is the implementation in this library;
 * any other transport may implement it too.
 *
 * It is also the only creator of samples: an implementation, having placed a chunk (a Header followed by payload
 * storage) in SHM, wraps it via make_sample_uninit().  The sample then belongs to the user and comes back to
 * `*this` through exactly one of reclaim() and deliver().
 *
 * Implementations need not be thread-safe: all samples loaned from a given `Publish_mgmt` are confined to one
 * thread.  See port namespace doc header.
 */
class Publish_mgmt
{
public:
  // Constructors/destructor.

  /// Boring virtual destructor.
  virtual ~Publish_mgmt();

  // Methods.

  /**
   * Returns the region identified by `offset` to the free list without delivering it.  Called from a sample's
   * destructor; hence it must not throw, must not block indefinitely, and must absorb (log) any internal fault.
   *
   * @param offset
   *        The loaned region.
   */
  virtual void reclaim(const shm::Pointer_offset& offset) noexcept = 0;

  /**
   * Makes the region identified by `offset` visible to all currently connected receivers; from this call on
   * the region's fate belongs to `*this` regardless of the outcome.  No retry is expected of the implementation.
   *
   * @param offset
   *        The loaned, written region.
   * @param err_code
   *        Must not be null.  Set to success, or to error::Code::S_CONNECTION_FAILURE if delivery could not be
   *        attempted at all (structural fault; e.g., nobody is connected).  A receiver declining the region (e.g.,
   *        its queue is full) is not an error; it is merely not counted.
   * @return Number of receivers that accepted the region; 0 on error.
   */
  virtual size_t deliver(const shm::Pointer_offset& offset, Error_code* err_code) = 0;

protected:
  // Methods.

  /**
   * Creates the uninitialized sample owning the given loaned chunk, tied to `*this`.  `*this` must outlive the
   * sample (or at least the moment the sample calls reclaim() or deliver()).  Defined in sample_mut.hpp.
   *
   * @tparam Payload
   *         Payload type.
   * @param offset
   *        The chunk.  Passed back to reclaim() or deliver() later.
   * @param header
   *        The constructed Header inside the chunk.
   * @param payload
   *        The payload storage inside the chunk.
   * @return See above.
   */
  template<typename Payload>
  Sample_mut_uninit<Payload> make_sample_uninit(const shm::Pointer_offset& offset, const Header* header,
                                                Maybe_uninit<Payload>* payload);
}; // class Publish_mgmt

} // namespace zcpub::port
