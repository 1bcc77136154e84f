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
#include <boost/uuid/uuid.hpp>
#include <boost/chrono/system_clocks.hpp>
#include <cstdint>
#include <type_traits>

namespace zcpub::port
{

// Types.

/**
 * Metadata placed by the publisher into each loaned chunk just ahead of the payload, in the same SHM region:
 * who sent it and when.  A sample exposes it read-only; it does not change across the
 * Sample_mut_uninit -> Sample_mut transition (or at all, after the loan).
 *
 * It is trivially copyable and contains no pointers, so it is valid as-is in every process mapping the segment.
 */
class Header
{
public:
  // Types.

  /**
   * Unique id of the sending endpoint (publisher).  It is a boost.uuid; generated randomly when the publisher
   * is created; hence unique across processes and time for all practical purposes.
   */
  using Publisher_id = boost::uuids::uuid;

  /// Creation time of a chunk: wall-clock time, so that it is comparable across processes.
  using Time_stamp = boost::chrono::system_clock::time_point;

  // Constructors/destructor.

  /**
   * Constructs the header.
   *
   * @param publisher_id
   *        See publisher_id().
   * @param time_stamp
   *        See time_stamp().
   * @param payload_size
   *        See payload_size().
   */
  explicit Header(const Publisher_id& publisher_id, Time_stamp time_stamp, size_t payload_size);

  // Methods.

  /**
   * Id of the publisher that loaned the chunk.
   *
   * @return See above.
   */
  const Publisher_id& publisher_id() const;

  /**
   * Time at which the chunk was loaned.
   *
   * @return See above.
   */
  Time_stamp time_stamp() const;

  /**
   * `sizeof` the payload type the chunk was loaned for.
   *
   * @return See above.
   */
  size_t payload_size() const;

private:
  // Data.

  /// See publisher_id().
  Publisher_id m_publisher_id;

  /// See time_stamp().  Stored as the raw tick count to keep `*this` trivially copyable.
  Time_stamp::rep m_time_stamp_raw;

  /// See payload_size().
  uint64_t m_payload_size;
}; // class Header

static_assert(std::is_trivially_copyable_v<Header>, "Header lives in SHM; it must be trivially copyable.");

} // namespace zcpub::port
