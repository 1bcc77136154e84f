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

#include "zcpub/port/header.hpp"
#include <boost/uuid/uuid_io.hpp>
#include <boost/chrono/chrono_io.hpp>
#include <ostream>

namespace zcpub::port
{

// Header implementations.

Header::Header(const Publisher_id& publisher_id, Time_stamp time_stamp, size_t payload_size) :
  m_publisher_id(publisher_id),
  m_time_stamp_raw(time_stamp.time_since_epoch().count()),
  m_payload_size(payload_size)
{
  // That's it.
}

const Header::Publisher_id& Header::publisher_id() const
{
  return m_publisher_id;
}

Header::Time_stamp Header::time_stamp() const
{
  return Time_stamp(Time_stamp::duration(m_time_stamp_raw));
}

size_t Header::payload_size() const
{
  return size_t(m_payload_size);
}

std::ostream& operator<<(std::ostream& os, const Header& val)
{
  return os << "pub_id[" << val.publisher_id() << "] time_stamp[" << val.time_stamp().time_since_epoch() << "] "
               "payload_sz[" << val.payload_size() << ']';
}

} // namespace zcpub::port
