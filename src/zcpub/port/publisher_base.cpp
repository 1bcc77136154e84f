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

#include "zcpub/port/publisher_base.hpp"
#include "zcpub/port/sample_receiver.hpp"
#include "zcpub/port/error.hpp"
#include "zcpub/shm/classic/pool_arena.hpp"
#include <boost/uuid/random_generator.hpp>
#include <boost/uuid/uuid_io.hpp>
#include <boost/chrono/system_clocks.hpp>
#include <boost/interprocess/exceptions.hpp>
#include <algorithm>
#include <cassert>
#include <new>

namespace zcpub::port
{

// Publisher_base implementations.

Publisher_base::Publisher_base(flow::log::Logger* logger_ptr, shm::classic::Pool_arena* data_segment,
                               const Publisher_config& config,
                               size_t chunk_sz, size_t chunk_alignment, size_t payload_sz) :
  flow::log::Log_context(logger_ptr, Log_component::S_PORT),
  m_data_segment(data_segment),
  m_config(config),
  m_chunk_sz(chunk_sz),
  m_chunk_alignment(chunk_alignment),
  m_payload_sz(payload_sz),
  m_id(boost::uuids::random_generator()()),
  m_loaned_sample_ct(0),
  m_sent_ct(0),
  m_reclaimed_ct(0)
{
  assert(m_data_segment && m_data_segment->attached());
  assert((m_chunk_sz >= sizeof(detail::Chunk_prefix)) && "Chunk must at least hold the prefix.");

  m_receivers.reserve(m_config.m_max_receivers);

  FLOW_LOG_INFO("Publisher [" << *this << "]: Created on data segment [" << *m_data_segment << "]; "
                "chunk size [" << m_chunk_sz << "], alignment [" << m_chunk_alignment << "], "
                "payload size [" << m_payload_sz << "]; "
                "max loaned samples [" << m_config.m_max_loaned_samples << "], "
                "max receivers [" << m_config.m_max_receivers << "].");
}

Publisher_base::~Publisher_base()
{
  FLOW_LOG_INFO("Publisher [" << *this << "]: Shutting down.  Sent [" << m_sent_ct << "] samples; "
                "reclaimed [" << m_reclaimed_ct << "] dropped ones.  "
                "Receivers still connected: [" << m_receivers.size() << "].");

  assert((m_loaned_sample_ct == 0)
         && "Destroying a publisher while samples it loaned are alive; they would call into a dead object.");
}

const Publisher_base::Publisher_id& Publisher_base::id() const
{
  return m_id;
}

const Publisher_config& Publisher_base::config() const
{
  return m_config;
}

bool Publisher_base::connect(Sample_receiver* receiver)
{
  assert(receiver);

  if (std::find(m_receivers.begin(), m_receivers.end(), receiver) != m_receivers.end())
  {
    FLOW_LOG_WARNING("Publisher [" << *this << "]: Receiver [" << receiver << "] is already connected.  "
                     "Ignoring.");
    return false;
  }
  // else
  if (m_receivers.size() >= m_config.m_max_receivers)
  {
    FLOW_LOG_WARNING("Publisher [" << *this << "]: Receiver [" << receiver << "] cannot connect: already at "
                     "max receiver count [" << m_config.m_max_receivers << "].");
    return false;
  }
  // else

  m_receivers.push_back(receiver);
  FLOW_LOG_INFO("Publisher [" << *this << "]: Receiver [" << receiver << "] connected; "
                "receiver count is now [" << m_receivers.size() << "].");
  return true;
}

bool Publisher_base::disconnect(Sample_receiver* receiver)
{
  const auto it = std::find(m_receivers.begin(), m_receivers.end(), receiver);
  if (it == m_receivers.end())
  {
    FLOW_LOG_WARNING("Publisher [" << *this << "]: Receiver [" << receiver << "] is not connected.  Ignoring.");
    return false;
  }
  // else

  m_receivers.erase(it);
  FLOW_LOG_INFO("Publisher [" << *this << "]: Receiver [" << receiver << "] disconnected; "
                "receiver count is now [" << m_receivers.size() << "].");
  return true;
}

size_t Publisher_base::receiver_count() const
{
  return m_receivers.size();
}

size_t Publisher_base::loaned_sample_count() const
{
  return m_loaned_sample_ct;
}

void* Publisher_base::loan_chunk(Error_code* err_code)
{
  assert(err_code);

  if (m_loaned_sample_ct >= m_config.m_max_loaned_samples)
  {
    FLOW_LOG_WARNING("Publisher [" << *this << "]: Loan refused: [" << m_loaned_sample_ct << "] samples already "
                     "loaned, which is the max.  Send or drop some first.");
    *err_code = error::Code::S_LOAN_EXCEEDS_MAX_LOANS;
    return nullptr;
  }
  // else

  void* chunk_buf = nullptr;
  try
  {
    chunk_buf = m_data_segment->allocate_aligned(m_chunk_sz, m_chunk_alignment);
  }
  catch (const boost::interprocess::bad_alloc& exc)
  {
    FLOW_LOG_WARNING("Publisher [" << *this << "]: Loan failed: data segment [" << *m_data_segment << "] has "
                     "no room for a [" << m_chunk_sz << "]-byte chunk (free bytes: "
                     "[" << m_data_segment->free_memory() << "]).  Details: [" << exc.what() << "].");
    *err_code = error::Code::S_LOAN_OUT_OF_MEMORY;
    return nullptr;
  }
  if (!chunk_buf)
  {
    FLOW_LOG_WARNING("Publisher [" << *this << "]: Loan failed: data segment [" << *m_data_segment << "] is not "
                     "attached.");
    *err_code = error::Code::S_LOAN_OUT_OF_MEMORY;
    return nullptr;
  }
  // else

  ++m_loaned_sample_ct;
  err_code->clear();

  FLOW_LOG_TRACE("Publisher [" << *this << "]: Loaned chunk [" << chunk_offset(chunk_buf) << "]; "
                 "loaned sample count is now [" << m_loaned_sample_ct << "].");
  return chunk_buf;
} // Publisher_base::loan_chunk()

Header Publisher_base::make_header() const
{
  return Header(m_id, boost::chrono::system_clock::now(), m_payload_sz);
}

shm::Pointer_offset Publisher_base::chunk_offset(const void* chunk) const
{
  return m_data_segment->to_offset(chunk);
}

void Publisher_base::reclaim(const shm::Pointer_offset& offset) noexcept
{
  assert((m_loaned_sample_ct != 0) && "Reclaiming a chunk while none are loaned?  Double release?");

  --m_loaned_sample_ct;
  ++m_reclaimed_ct;

  FLOW_LOG_TRACE("Publisher [" << *this << "]: Sample at [" << offset << "] dropped unsent; reclaiming its chunk.  "
                 "Loaned sample count is now [" << m_loaned_sample_ct << "].");
  free_chunk(m_data_segment, static_cast<detail::Chunk_prefix*>(m_data_segment->to_local(offset)));
}

size_t Publisher_base::deliver(const shm::Pointer_offset& offset, Error_code* err_code)
{
  assert(err_code);
  assert((m_loaned_sample_ct != 0) && "Delivering a chunk while none are loaned?  Double release?");

  // It is no longer loaned, whatever happens below.
  --m_loaned_sample_ct;
  ++m_sent_ct;

  const auto chunk = static_cast<detail::Chunk_prefix*>(m_data_segment->to_local(offset));

  if (m_receivers.empty())
  {
    FLOW_LOG_WARNING("Publisher [" << *this << "]: Sample at [" << offset << "] sent, but no receivers are "
                     "connected.  Discarding it.");
    free_chunk(m_data_segment, chunk);
    *err_code = error::Code::S_CONNECTION_FAILURE;
    return 0;
  }
  // else

  /* Hold an ownership ourselves during the fan-out, so that a receiver releasing its chunk synchronously from
   * inside on_sample() cannot bring the count to 0 while others have yet to be offered it.  Similarly each receiver's
   * ownership is added before the offer and retracted if declined. */
  chunk->m_atomic_owner_ct.store(1);

  size_t accepted_ct = 0;
  for (const auto receiver : m_receivers)
  {
    ++chunk->m_atomic_owner_ct;

    bool accepted = false;
    try
    {
      accepted = receiver->on_sample(offset);
    }
    catch (...)
    {
      FLOW_LOG_WARNING("Publisher [" << *this << "]: Receiver [" << receiver << "] threw while offered sample "
                       "at [" << offset << "]; treating it as declined and not offering to the rest.  "
                       "[" << accepted_ct << "] receivers accepted it so far.  Rethrowing.");
      // Its ownership and ours; the chunk goes away now unless an earlier receiver holds it.
      --chunk->m_atomic_owner_ct;
      drop_owner(m_data_segment, chunk);
      throw;
    }

    if (accepted)
    {
      ++accepted_ct;
    }
    else
    {
      FLOW_LOG_TRACE("Publisher [" << *this << "]: Receiver [" << receiver << "] declined sample "
                     "at [" << offset << "].");
      --chunk->m_atomic_owner_ct;
    }
  }

  FLOW_LOG_TRACE("Publisher [" << *this << "]: Sample at [" << offset << "] accepted by [" << accepted_ct << "] of "
                 "[" << m_receivers.size() << "] receivers.");

  drop_owner(m_data_segment, chunk); // Our own.  Frees it if nobody accepted (or all already released).
  err_code->clear();
  return accepted_ct;
} // Publisher_base::deliver()

void Publisher_base::release_delivered_sample(flow::log::Logger* logger_ptr, // Static.
                                              shm::classic::Pool_arena* data_segment,
                                              const shm::Pointer_offset& offset)
{
  FLOW_LOG_SET_CONTEXT(logger_ptr, Log_component::S_PORT);

  assert(data_segment);
  const auto chunk = static_cast<detail::Chunk_prefix*>(data_segment->to_local(offset));
  assert((chunk->m_atomic_owner_ct.load() != 0) && "Releasing a chunk nobody owns?  Double release?");

  if (drop_owner(data_segment, chunk))
  {
    FLOW_LOG_TRACE("Last receiver released sample at [" << offset << "] through mapping [" << *data_segment << "]; "
                   "chunk freed.");
  }
}

bool Publisher_base::drop_owner(shm::classic::Pool_arena* data_segment, // Static.
                                detail::Chunk_prefix* chunk) noexcept
{
  if (--chunk->m_atomic_owner_ct == 0)
  {
    free_chunk(data_segment, chunk);
    return true;
  }
  return false;
}

void Publisher_base::free_chunk(shm::classic::Pool_arena* data_segment, // Static.
                                detail::Chunk_prefix* chunk) noexcept
{
  // Chunks are trivially destructible; the storage just goes back to the pool.
  [[maybe_unused]] const bool ok = data_segment->deallocate(chunk);
  assert(ok && "Data segment mapping must be attached to release into it.");
}

const Header& Publisher_base::header_at(const shm::classic::Pool_arena& data_segment, // Static.
                                        const shm::Pointer_offset& offset)
{
  return static_cast<const detail::Chunk_prefix*>(data_segment.to_local(offset))->m_header;
}

std::ostream& operator<<(std::ostream& os, const Publisher_base& val)
{
  return os << "pub[" << val.id() << "]@" << static_cast<const void*>(&val);
}

} // namespace zcpub::port
