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

#include "zcpub/shm/pointer_offset.hpp"
#include <cassert>

namespace zcpub::shm
{

// Pointer_offset implementations.

Pointer_offset::Pointer_offset(size_t offset, Segment_id segment_id) :
  m_value((Value(offset) << S_SEGMENT_ID_BITS) | Value(segment_id))
{
  assert((offset <= S_MAX_OFFSET) && "Offset does not fit into the packed representation.  Giant pool?");
}

size_t Pointer_offset::offset() const
{
  return size_t(m_value >> S_SEGMENT_ID_BITS);
}

Pointer_offset::Segment_id Pointer_offset::segment_id() const
{
  return Segment_id(m_value & ((Value(1) << S_SEGMENT_ID_BITS) - 1));
}

Pointer_offset::Value Pointer_offset::value() const
{
  return m_value;
}

// Free function implementations.

bool operator==(const Pointer_offset& val1, const Pointer_offset& val2)
{
  return val1.value() == val2.value();
}

bool operator!=(const Pointer_offset& val1, const Pointer_offset& val2)
{
  return !(val1 == val2);
}

bool operator<(const Pointer_offset& val1, const Pointer_offset& val2)
{
  return val1.value() < val2.value();
}

std::ostream& operator<<(std::ostream& os, const Pointer_offset& val)
{
  return os << "seg[" << int(val.segment_id()) << "]+" << val.offset();
}

} // namespace zcpub::shm
