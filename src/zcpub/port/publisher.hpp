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

#include "zcpub/port/publisher_base.hpp"
#include "zcpub/port/sample_mut.hpp"
#include "zcpub/shm/classic/pool_arena.hpp"
#include <flow/error/error.hpp>
#include <optional>
#include <new>
#include <type_traits>

namespace zcpub::port
{

// Types.

/**
 * Publishes samples of type `Payload` through shared memory, without copying: the user loans a chunk of the
 * data segment, writes the payload directly into it, and sends it; receivers then read it at the same
 * shm::Pointer_offset in their own mappings of the segment.
 *
 * Typical use:
 *
 *   ~~~
 *   Publisher<Position> pub(logger, &data_segment);
 *   pub.connect(&some_receiver);
 *
 *   auto sample = pub.loan_uninit(); // Sample_mut_uninit<Position>: payload cannot be read yet.
 *   auto ready = std::move(*sample).write_payload(Position{1, 2, 3}); // Sample_mut<Position>.
 *   ready.payload_mut().m_x += 10;
 *   const auto n = std::move(ready).send(); // ready is consumed; n receivers got it.
 *   ~~~
 *
 * See Publisher_base for chunk accounting, thread safety and lifetime.
 *
 * @tparam Payload
 *         Payload type.  Must be trivially copyable.
 */
template<typename Payload>
class Publisher : public Publisher_base
{
public:
  // Types.

  /// Short-hand for the payload type.
  using Payload_obj = Payload;

  /// Short-hand for the loaned-uninitialized sample type.
  using Sample_uninit = Sample_mut_uninit<Payload>;

  /// Short-hand for the loaned-initialized sample type.
  using Sample = Sample_mut<Payload>;

  static_assert(std::is_trivially_copyable_v<Payload>,
                "Payload must be trivially copyable: it is placed in SHM and read there by other processes.");
  static_assert(std::is_standard_layout_v<detail::Chunk<Payload>>,
                "The chunk must be standard-layout: its prefix is reached through the chunk's own address.");

  // Constructors/destructor.

  /**
   * Constructs the publisher.  It has a fresh random id() and no receivers.
   *
   * @param logger_ptr
   *        Logger to use for subsequently logging.
   * @param data_segment
   *        Segment out of which to loan chunks.  Must be attached, read-write, and outlive `*this`.
   * @param config
   *        Knobs.
   */
  explicit Publisher(flow::log::Logger* logger_ptr, shm::classic::Pool_arena* data_segment,
                     const Publisher_config& config = Publisher_config());

  // Methods.

  /**
   * Loans a chunk and returns it as an uninitialized sample, its header filled in.
   *
   * @param err_code
   *        See `flow::Error_code` docs for error reporting semantics.  #Error_code generated:
   *        error::Code::S_LOAN_EXCEEDS_MAX_LOANS, error::Code::S_LOAN_OUT_OF_MEMORY.
   * @return The sample; or empty on error.
   */
  std::optional<Sample_uninit> loan_uninit(Error_code* err_code = 0);

  /**
   * Like loan_uninit(), but the payload is value-initialized in place, so the sample starts out initialized.
   *
   * @param err_code
   *        See loan_uninit().
   * @return The sample; or empty on error.
   */
  std::optional<Sample> loan(Error_code* err_code = 0);

  /**
   * Loans a chunk, copies `value` into it and sends it: a shortcut for loan_uninit(), `write_payload()` and
   * `send()`.
   *
   * @param value
   *        The payload.
   * @param err_code
   *        See `flow::Error_code` docs for error reporting semantics.  #Error_code generated:
   *        those of loan_uninit() and Sample_mut::send().
   * @return See Sample_mut::send(); 0 on error.
   */
  size_t send_copy(const Payload& value, Error_code* err_code = 0);

  /**
   * Returns the payload of the delivered chunk at the given offset, as mapped by `data_segment`.  For receivers.
   *
   * @param data_segment
   *        A mapping of the chunk's segment.
   * @param offset
   *        The chunk.
   * @return See above.
   */
  static const Payload& payload_at(const shm::classic::Pool_arena& data_segment, const shm::Pointer_offset& offset);

private:
  // Types.

  /// Chunk layout for our payload type.
  using Chunk = detail::Chunk<Payload>;
}; // class Publisher

// Template implementations.

template<typename Payload>
Publisher<Payload>::Publisher(flow::log::Logger* logger_ptr, shm::classic::Pool_arena* data_segment,
                              const Publisher_config& config) :
  Publisher_base(logger_ptr, data_segment, config, sizeof(Chunk), alignof(Chunk), sizeof(Payload))
{
  // Done.
}

template<typename Payload>
std::optional<typename Publisher<Payload>::Sample_uninit> Publisher<Payload>::loan_uninit(Error_code* err_code)
{
  FLOW_ERROR_EXEC_AND_THROW_ON_ERROR(std::optional<Sample_uninit>, loan_uninit, _1);
  // ^-- Call ourselves and return if err_code is null.  If got to present line, err_code is not null.

  const auto chunk_buf = loan_chunk(err_code);
  if (!chunk_buf)
  {
    return std::nullopt;
  }
  // else

  // The whole chunk object starts its life here; the payload storage inside stays uninitialized.
  const auto chunk = ::new (chunk_buf) Chunk(make_header());
  return make_sample_uninit(chunk_offset(chunk), &chunk->m_prefix.m_header, &chunk->m_payload);
}

template<typename Payload>
std::optional<typename Publisher<Payload>::Sample> Publisher<Payload>::loan(Error_code* err_code)
{
  FLOW_ERROR_EXEC_AND_THROW_ON_ERROR(std::optional<Sample>, loan, _1);
  // ^-- Call ourselves and return if err_code is null.  If got to present line, err_code is not null.

  auto sample = loan_uninit(err_code);
  if (!sample)
  {
    return std::nullopt;
  }
  // else

  sample->payload_mut().emplace();
  return std::move(*sample).assume_init();
}

template<typename Payload>
size_t Publisher<Payload>::send_copy(const Payload& value, Error_code* err_code)
{
  FLOW_ERROR_EXEC_AND_THROW_ON_ERROR(size_t, send_copy, value, _1);
  // ^-- Call ourselves and return if err_code is null.  If got to present line, err_code is not null.

  auto sample = loan_uninit(err_code);
  if (!sample)
  {
    return 0;
  }
  // else

  return std::move(*sample).write_payload(value).send(err_code);
}

template<typename Payload>
const Payload& Publisher<Payload>::payload_at(const shm::classic::Pool_arena& data_segment, // Static.
                                              const shm::Pointer_offset& offset)
{
  const auto chunk = static_cast<const Chunk*>(data_segment.to_local(offset));
  // Maybe_uninit's storage is at its own address; a sent chunk holds a constructed Payload there.
  return *std::launder(static_cast<const Payload*>(static_cast<const void*>(&chunk->m_payload)));
}

} // namespace zcpub::port
