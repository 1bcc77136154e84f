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

#include "zcpub/port/detail/loaned_chunk.hpp"
#include <cassert>

namespace zcpub::port::detail
{

Loaned_chunk::Loaned_chunk(Publish_mgmt* publisher, const shm::Pointer_offset& offset) :
  m_publisher(publisher),
  m_offset(offset)
{
  assert(m_publisher);
}

Loaned_chunk::Loaned_chunk(Loaned_chunk&& src) noexcept :
  m_publisher(src.m_publisher),
  m_offset(src.m_offset)
{
  src.m_publisher = nullptr;
}

Loaned_chunk::~Loaned_chunk()
{
  reclaim();
}

Loaned_chunk& Loaned_chunk::operator=(Loaned_chunk&& src) noexcept
{
  if (&src != this)
  {
    reclaim();
    m_publisher = src.m_publisher;
    m_offset = src.m_offset;
    src.m_publisher = nullptr;
  }
  return *this;
}

void Loaned_chunk::reclaim() noexcept
{
  if (m_publisher)
  {
    // Null it first: reclaim() must run at most once even if something below re-enters.
    const auto publisher = m_publisher;
    m_publisher = nullptr;
    publisher->reclaim(m_offset);
  }
}

size_t Loaned_chunk::deliver(Error_code* err_code)
{
  assert(m_publisher && "Are you operating on a moved-from or already-sent sample?");
  assert(err_code);

  // Ownership passes to the publisher right now, whatever the outcome of the delivery.
  const auto publisher = m_publisher;
  m_publisher = nullptr;
  return publisher->deliver(m_offset, err_code);
}

bool Loaned_chunk::empty() const
{
  return !m_publisher;
}

const shm::Pointer_offset& Loaned_chunk::offset() const
{
  return m_offset;
}

} // namespace zcpub::port::detail
