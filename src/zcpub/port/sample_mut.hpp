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

#include "zcpub/port/detail/loaned_chunk.hpp"
#include "zcpub/port/header.hpp"
#include "zcpub/port/maybe_uninit.hpp"
#include "zcpub/port/error.hpp"
#include <flow/error/error.hpp>
#include <cassert>
#include <new>
#include <ostream>
#include <type_traits>

namespace zcpub::port
{

// Types.

/**
 * A loaned, writable sample whose payload has not (as far as the type system knows) been written yet: the
 * *uninitialized* typestate.  Obtain one from Publisher::loan_uninit() (or another Publish_mgmt implementation).  It permits exactly:
 *   - header(): read the header (always initialized, by the publisher, at loan time);
 *   - payload_mut(): a write-only view of the payload storage (Maybe_uninit);
 *   - `std::move(s).write_payload(value)`: write the payload and get the *initialized* Sample_mut in exchange;
 *   - `std::move(s).assume_init()`: get the Sample_mut in exchange, on the user's word that payload_mut() was used
 *     to write the payload;
 *   - destruction: the chunk is reclaimed by the publisher, and nothing is sent.
 *
 * There is no way to read the payload, and no way to send, from this type; both exist only on Sample_mut.  The
 * two transitions are `&&`-qualified: they can only be invoked on an rvalue, and they leave `*this` moved-from.
 * A moved-from `*this` does nothing on destruction; calling anything else on it is undefined behavior (an
 * assertion may trip).  The transition does not copy or move the payload: the resulting Sample_mut names the same
 * chunk at the same shm::Pointer_offset.
 *
 * Move-only.  Not thread-safe: confine each object to one thread at a time.
 *
 * @tparam Payload
 *         Payload type.  Must be trivially copyable, since it lives in SHM and is seen by other processes
 *         without serialization.
 */
template<typename Payload>
class Sample_mut_uninit
{
public:
  // Types.

  /// Short-hand for the payload type.
  using Payload_obj = Payload;

  /// The type into which `*this` transitions once initialized.
  using Initialized = Sample_mut<Payload>;

  static_assert(std::is_trivially_copyable_v<Payload>,
                "Payload must be trivially copyable: it is placed in SHM and read there by other processes.");

  // Constructors/destructor.

  /**
   * Move-constructs from `src`; `src` becomes moved-from.
   *
   * @param src
   *        Source object.
   */
  Sample_mut_uninit(Sample_mut_uninit&& src) noexcept = default;

  /// Forbid copying.
  Sample_mut_uninit(const Sample_mut_uninit&) = delete;

  /// If not moved-from: the chunk is returned to the publisher; nothing is sent.
  ~Sample_mut_uninit() = default;

  // Methods.

  /**
   * Move-assigns from `src`; the chunk held by `*this` (if any) is returned to the publisher first.
   *
   * @param src
   *        Source object.
   * @return `*this`.
   */
  Sample_mut_uninit& operator=(Sample_mut_uninit&& src) noexcept = default;

  /// Forbid copying.
  Sample_mut_uninit& operator=(const Sample_mut_uninit&) = delete;

  /**
   * The header.
   *
   * @return See above.
   */
  const Header& header() const;

  /**
   * Write-only view of the payload storage.  Use it to construct the payload in place; then assume_init().
   *
   * @return See above.
   */
  Maybe_uninit<Payload>& payload_mut();

  /**
   * Writes `value` into the payload storage (one copy, straight into SHM) and transitions to Sample_mut.
   * `*this` becomes moved-from.
   *
   * @param value
   *        The payload.
   * @return The initialized sample, naming the same chunk.
   */
  Initialized write_payload(const Payload& value) &&;

  /**
   * Transitions to Sample_mut without writing anything.  `*this` becomes moved-from.  The caller asserts that
   * the payload was written via payload_mut(); if it was not, reading it later yields unspecified contents.
   *
   * @return The initialized sample, naming the same chunk.
   */
  Initialized assume_init() &&;

  /**
   * Location of the chunk within its segment.  It is unchanged across the transition to Sample_mut.
   *
   * @return See above.
   */
  const shm::Pointer_offset& offset() const;

private:
  // Friends.

  /// The only creator.
  friend class Publish_mgmt;

  // Constructors.

  /**
   * Constructs a sample taking over the loaned chunk.
   *
   * @param chunk
   *        The chunk ownership; it is moved-from after this.
   * @param header
   *        The header inside the chunk.
   * @param payload
   *        The payload storage inside the chunk.
   */
  explicit Sample_mut_uninit(detail::Loaned_chunk&& chunk, const Header* header, Maybe_uninit<Payload>* payload);

  // Data.

  /// Ownership of the chunk.
  detail::Loaned_chunk m_chunk;

  /// The header inside the chunk (publisher-side mapping).
  const Header* m_header;

  /// The payload storage inside the chunk (publisher-side mapping).
  Maybe_uninit<Payload>* m_payload;
}; // class Sample_mut_uninit

/**
 * A loaned, writable sample whose payload has been initialized: the *initialized* typestate.  Obtain it from
 * Sample_mut_uninit::write_payload() or Sample_mut_uninit::assume_init(), or directly (with a value-initialized
 * payload) from Publisher::loan().
 *
 * It permits reading the header, reading and modifying the payload, and `std::move(s).send()`, which consumes
 * `*this` and hands the chunk to the publisher for delivery.  If destroyed without send() the chunk is returned to
 * the publisher and nothing is sent.
 *
 * Move-only; a moved-from `*this` may only be assigned-to or destroyed.  Not thread-safe.
 *
 * @tparam Payload
 *         See Sample_mut_uninit.
 */
template<typename Payload>
class Sample_mut
{
public:
  // Types.

  /// Short-hand for the payload type.
  using Payload_obj = Payload;

  // Constructors/destructor.

  /**
   * Move-constructs from `src`; `src` becomes moved-from.
   *
   * @param src
   *        Source object.
   */
  Sample_mut(Sample_mut&& src) noexcept = default;

  /// Forbid copying.
  Sample_mut(const Sample_mut&) = delete;

  /// If not moved-from (and not sent): the chunk is returned to the publisher; nothing is sent.
  ~Sample_mut() = default;

  // Methods.

  /**
   * Move-assigns from `src`; the chunk held by `*this` (if any) is returned to the publisher first.
   *
   * @param src
   *        Source object.
   * @return `*this`.
   */
  Sample_mut& operator=(Sample_mut&& src) noexcept = default;

  /// Forbid copying.
  Sample_mut& operator=(const Sample_mut&) = delete;

  /**
   * The header.  Same values as observed in the Sample_mut_uninit this came from.
   *
   * @return See above.
   */
  const Header& header() const;

  /**
   * The payload.
   *
   * @return See above.
   */
  const Payload& payload() const;

  /**
   * The payload, modifiable in place.
   *
   * @return See above.
   */
  Payload& payload_mut();

  /**
   * Hands the chunk to the publisher, which offers it to every connected receiver.  `*this` becomes moved-from
   * regardless of the outcome: once this is called the chunk will never be reclaimed through `*this`.
   *
   * @param err_code
   *        See `flow::Error_code` docs for error reporting semantics.  #Error_code generated:
   *        error::Code::S_CONNECTION_FAILURE (no receiver could be reached; the sample was discarded).
   * @return Number of receivers that accepted the sample; 0 on error.  A receiver that declined is simply not
   *         counted; that is not an error.
   */
  size_t send(Error_code* err_code = 0) &&;

  /**
   * Location of the chunk within its segment.  Same as that of the Sample_mut_uninit this came from.
   *
   * @return See above.
   */
  const shm::Pointer_offset& offset() const;

private:
  // Friends.

  /// The only creator.
  friend class Sample_mut_uninit<Payload>;

  // Constructors.

  /**
   * Constructs a sample taking over the loaned chunk, whose payload is initialized.
   *
   * @param chunk
   *        The chunk ownership; it is moved-from after this.
   * @param header
   *        The header inside the chunk.
   * @param payload
   *        The payload inside the chunk.
   */
  explicit Sample_mut(detail::Loaned_chunk&& chunk, const Header* header, Payload* payload);

  // Methods.

  /**
   * Body of send(), with `err_code` not null.
   *
   * @param err_code
   *        Not null.
   * @return See send().
   */
  size_t send_impl(Error_code* err_code);

  // Data.

  /// Ownership of the chunk.
  detail::Loaned_chunk m_chunk;

  /// The header inside the chunk.
  const Header* m_header;

  /// The payload inside the chunk.
  Payload* m_payload;
}; // class Sample_mut

// Template implementations.

template<typename Payload>
Sample_mut_uninit<Payload>::Sample_mut_uninit(detail::Loaned_chunk&& chunk, const Header* header,
                                              Maybe_uninit<Payload>* payload) :
  m_chunk(std::move(chunk)),
  m_header(header),
  m_payload(payload)
{
  assert(m_header && m_payload);
}

template<typename Payload>
const Header& Sample_mut_uninit<Payload>::header() const
{
  assert((!m_chunk.empty()) && "Are you operating on a moved-from `*this`?");
  return *m_header;
}

template<typename Payload>
Maybe_uninit<Payload>& Sample_mut_uninit<Payload>::payload_mut()
{
  assert((!m_chunk.empty()) && "Are you operating on a moved-from `*this`?");
  return *m_payload;
}

template<typename Payload>
typename Sample_mut_uninit<Payload>::Initialized Sample_mut_uninit<Payload>::write_payload(const Payload& value) &&
{
  assert((!m_chunk.empty()) && "Are you operating on a moved-from `*this`?");
  m_payload->write(value);
  return std::move(*this).assume_init();
}

template<typename Payload>
typename Sample_mut_uninit<Payload>::Initialized Sample_mut_uninit<Payload>::assume_init() &&
{
  assert((!m_chunk.empty()) && "Are you operating on a moved-from `*this`?");
  // Same storage, now known to hold a Payload.
  return Initialized(std::move(m_chunk), m_header, std::launder(static_cast<Payload*>(m_payload->data())));
}

template<typename Payload>
const shm::Pointer_offset& Sample_mut_uninit<Payload>::offset() const
{
  return m_chunk.offset();
}

template<typename Payload>
Sample_mut<Payload>::Sample_mut(detail::Loaned_chunk&& chunk, const Header* header, Payload* payload) :
  m_chunk(std::move(chunk)),
  m_header(header),
  m_payload(payload)
{
  assert(m_header && m_payload);
}

template<typename Payload>
const Header& Sample_mut<Payload>::header() const
{
  assert((!m_chunk.empty()) && "Are you operating on a moved-from `*this`?");
  return *m_header;
}

template<typename Payload>
const Payload& Sample_mut<Payload>::payload() const
{
  assert((!m_chunk.empty()) && "Are you operating on a moved-from `*this`?");
  return *m_payload;
}

template<typename Payload>
Payload& Sample_mut<Payload>::payload_mut()
{
  assert((!m_chunk.empty()) && "Are you operating on a moved-from `*this`?");
  return *m_payload;
}

template<typename Payload>
size_t Sample_mut<Payload>::send(Error_code* err_code) &&
{
  FLOW_ERROR_EXEC_AND_THROW_ON_ERROR(size_t, send_impl, _1);
  // ^-- Call ourselves and return if err_code is null.  If got to present line, err_code is not null.

  return send_impl(err_code);
}

template<typename Payload>
size_t Sample_mut<Payload>::send_impl(Error_code* err_code)
{
  assert((!m_chunk.empty()) && "Are you operating on a moved-from or already-sent `*this`?");
  return m_chunk.deliver(err_code);
}

template<typename Payload>
const shm::Pointer_offset& Sample_mut<Payload>::offset() const
{
  return m_chunk.offset();
}

template<typename Payload>
Sample_mut_uninit<Payload> Publish_mgmt::make_sample_uninit(const shm::Pointer_offset& offset, const Header* header,
                                                            Maybe_uninit<Payload>* payload)
{
  return Sample_mut_uninit<Payload>(detail::Loaned_chunk(this, offset), header, payload);
}

template<typename Payload>
std::ostream& operator<<(std::ostream& os, const Sample_mut_uninit<Payload>& val)
{
  os << "sample_mut_uninit[" << val.offset() << ']';
  return os;
}

template<typename Payload>
std::ostream& operator<<(std::ostream& os, const Sample_mut<Payload>& val)
{
  os << "sample_mut[" << val.offset() << ']';
  return os;
}

} // namespace zcpub::port
