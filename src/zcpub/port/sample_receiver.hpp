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
#include "zcpub/shm/pointer_offset.hpp"

namespace zcpub::port
{

// Types.

/**
 * Interface of a receiving endpoint connected to a Publisher_base via Publisher_base::connect().  On each
 * Sample_mut::send() the publisher offers the chunk to every connected receiver, in connection order, by calling
 * on_sample() synchronously.
 *
 * An implementation that *accepts* a sample (returns `true`) co-owns the chunk from that moment and must, exactly
 * once, call Publisher_base::release_delivered_sample() for it when done reading; possibly later, from another
 * thread or process, and possibly after the publisher is gone.  It reads the chunk via Publisher_base::header_at()
 * and Publisher::payload_at() on its own mapping of the segment.  One that *declines* (returns `false`; e.g., its
 * queue is full) must not touch the chunk afterwards.  Throwing from on_sample() counts as declining, and the
 * exception reaches the sender.
 *
 * on_sample() must not call Publisher_base::connect() or Publisher_base::disconnect() on the offering publisher.
 */
class Sample_receiver
{
public:
  // Constructors/destructor.

  /// Boring virtual destructor.
  virtual ~Sample_receiver();

  // Methods.

  /**
   * Offers a just-sent chunk.
   *
   * @param offset
   *        The chunk's location within the publisher's data segment; the header is at the start of the chunk.
   * @return `true` to accept (see class doc header); `false` to decline.
   */
  virtual bool on_sample(const shm::Pointer_offset& offset) = 0;
}; // class Sample_receiver

} // namespace zcpub::port
