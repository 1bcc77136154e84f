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
#include "zcpub/port/header.hpp"
#include "zcpub/port/detail/chunk.hpp"
#include "zcpub/shm/classic/classic_fwd.hpp"
#include "zcpub/shm/pointer_offset.hpp"
#include "zcpub/util/util_fwd.hpp"
#include <flow/log/log.hpp>
#include <boost/core/noncopyable.hpp>
#include <vector>

namespace zcpub::port
{

// Types.

/// Knobs of a Publisher_base, fixed at construction.
struct Publisher_config
{
  // Data.

  /**
   * Max number of samples (Sample_mut_uninit or Sample_mut) loaned out and not yet sent or dropped, at a time.
   * Beyond it, loans fail with error::Code::S_LOAN_EXCEEDS_MAX_LOANS.
   */
  size_t m_max_loaned_samples = 2;

  /// Max number of receivers connected at a time; Publisher_base::connect() beyond it fails.
  size_t m_max_receivers = 8;
}; // struct Publisher_config

/**
 * The payload-type-independent core of Publisher: loans chunks out of a shm::classic::Pool_arena data segment,
 * implements the Publish_mgmt boundary through which samples return them, and fans sent chunks out to the
 * connected Sample_receiver objects.  Use Publisher, not this, to loan samples.
 *
 * ### Chunk accounting ###
 * Each chunk is in one of 3 states:
 *   - *loaned*: held by exactly one Sample_mut_uninit or Sample_mut.  Counted in loaned_sample_count().  Leaves
 *     this state via reclaim() (sample dropped: chunk is deallocated) or deliver() (sample sent).
 *   - *delivered*: owned jointly by the receivers that accepted it; Chunk_prefix::m_atomic_owner_ct counts them.
 *     Each calls release_delivered_sample() once; the last one deallocates the chunk.  This state does not
 *     involve `*this` at all, so it may outlive `*this`.
 *   - *free*: deallocated.
 *
 * deliver() with nobody accepting (including nobody connected) deallocates the chunk immediately.
 *
 * ### Thread safety ###
 * Loaning, sending, connect() and disconnect() must not be invoked concurrently on the same `*this`.
 * release_delivered_sample() may be invoked concurrently with anything, from any thread or process; the chunk
 * deallocation it may perform relies on the thread and process safety of the pool's allocator.
 *
 * `*this` must outlive every sample it loaned (it asserts none are outstanding at destruction).  It need not outlive
 * delivered chunks.
 */
class Publisher_base :
  public flow::log::Log_context,
  public Publish_mgmt,
  private boost::noncopyable
{
public:
  // Types.

  /// Short-hand for the publisher ID type, as stored in every Header.
  using Publisher_id = Header::Publisher_id;

  // Constructors/destructor.

  /// Asserts no samples are outstanding.  Logs stats.
  ~Publisher_base() override;

  // Methods.

  /**
   * Randomly generated at construction; stamped into the header of every sample loaned by `*this`.
   *
   * @return See above.
   */
  const Publisher_id& id() const;

  /**
   * The config given at construction.
   *
   * @return See above.
   */
  const Publisher_config& config() const;

  /**
   * Connects a receiver: subsequent sends will offer chunks to it.
   *
   * @param receiver
   *        Not null.  Must stay valid until disconnect() or `*this` destruction.
   * @return `false` if already connected, or Publisher_config::m_max_receivers are already connected; else `true`.
   */
  bool connect(Sample_receiver* receiver);

  /**
   * Disconnects a receiver connected via connect().  Chunks it already accepted remain its to release.
   *
   * @param receiver
   *        The receiver.
   * @return `false` if it was not connected; else `true`.
   */
  bool disconnect(Sample_receiver* receiver);

  /**
   * Number of connected receivers.
   *
   * @return See above.
   */
  size_t receiver_count() const;

  /**
   * Number of samples loaned and not yet sent or dropped.
   *
   * @return See above.
   */
  size_t loaned_sample_count() const;

  /**
   * To be invoked by a receiver that accepted the given chunk, exactly once, when done with it.  The last such call
   * for a chunk deallocates it.  Since everything needed lives in the chunk itself, this does not involve the
   * publisher: it may be called from any thread, from any process with a read-write mapping of the segment, and
   * after the publisher is destroyed.
   *
   * @param logger_ptr
   *        Logger to use for logging within this static method.
   * @param data_segment
   *        A read-write mapping of the segment into which the chunk was loaned.
   * @param offset
   *        Offset given to Sample_receiver::on_sample() which returned `true`.
   */
  static void release_delivered_sample(flow::log::Logger* logger_ptr, shm::classic::Pool_arena* data_segment,
                                       const shm::Pointer_offset& offset);

  /**
   * Implements Publish_mgmt API: deallocates a loaned chunk whose sample was dropped unsent.
   *
   * @param offset
   *        See Publish_mgmt.
   */
  void reclaim(const shm::Pointer_offset& offset) noexcept override;

  /**
   * Implements Publish_mgmt API: offers a loaned chunk to each connected receiver, in connection order.
   *
   * If a receiver's on_sample() throws, the exception propagates (out of Sample_mut::send()).  That receiver is
   * considered to have declined; those offered earlier keep what they accepted; the rest are not offered it.
   * Either way the chunk does not leak.
   *
   * @param offset
   *        See Publish_mgmt.
   * @param err_code
   *        See Publish_mgmt.  error::Code::S_CONNECTION_FAILURE if no receiver is connected.
   * @return Number of receivers that accepted.
   */
  size_t deliver(const shm::Pointer_offset& offset, Error_code* err_code) override;

  /**
   * Returns the header of the chunk at the given offset, as mapped by `data_segment` (which may be any mapping,
   * including a read-only one in another process, of the segment into which the chunk was loaned).
   *
   * @param data_segment
   *        A mapping of the chunk's segment.
   * @param offset
   *        The chunk.
   * @return See above.
   */
  static const Header& header_at(const shm::classic::Pool_arena& data_segment, const shm::Pointer_offset& offset);

protected:
  // Constructors.

  /**
   * Constructs the publisher.
   *
   * @param logger_ptr
   *        Logger to use for subsequently logging.
   * @param data_segment
   *        Segment out of which to loan chunks.  Must be attached, read-write, and outlive `*this`.
   * @param config
   *        Knobs.
   * @param chunk_sz
   *        Size of each chunk (prefix, padding and payload).
   * @param chunk_alignment
   *        Required alignment of each chunk.  Power of 2.
   * @param payload_sz
   *        Payload size, as recorded in each header.
   */
  explicit Publisher_base(flow::log::Logger* logger_ptr, shm::classic::Pool_arena* data_segment,
                          const Publisher_config& config,
                          size_t chunk_sz, size_t chunk_alignment, size_t payload_sz);

  // Methods.

  /**
   * Allocates a chunk's worth of the data segment and counts it as loaned.  The caller must construct the chunk
   * (detail::Chunk) in it, with the header from make_header(), before anything else touches it.
   *
   * @param err_code
   *        Not null.  error::Code::S_LOAN_EXCEEDS_MAX_LOANS, error::Code::S_LOAN_OUT_OF_MEMORY.
   * @return Pointer to the raw buffer; null on error.
   */
  void* loan_chunk(Error_code* err_code);

  /**
   * The header for a sample loaned right now.
   *
   * @return See above.
   */
  Header make_header() const;

  /**
   * Offset of a chunk in a buffer returned by loan_chunk().
   *
   * @param chunk
   *        The chunk.
   * @return See above.
   */
  shm::Pointer_offset chunk_offset(const void* chunk) const;

private:
  // Methods.

  /**
   * Deallocates a chunk no longer owned by anyone.
   *
   * @param data_segment
   *        Read-write mapping of the chunk's segment.
   * @param chunk
   *        The chunk.
   */
  static void free_chunk(shm::classic::Pool_arena* data_segment, detail::Chunk_prefix* chunk) noexcept;

  /**
   * Drops one ownership of a delivered chunk; frees it if that was the last.
   *
   * @param data_segment
   *        Read-write mapping of the chunk's segment.
   * @param chunk
   *        The chunk.
   * @return `true` if and only if the chunk was freed.
   */
  static bool drop_owner(shm::classic::Pool_arena* data_segment, detail::Chunk_prefix* chunk) noexcept;

  // Data.

  /// See ctor.
  shm::classic::Pool_arena* const m_data_segment;

  /// See config().
  const Publisher_config m_config;

  /// See ctor.
  const size_t m_chunk_sz;

  /// See ctor.
  const size_t m_chunk_alignment;

  /// See ctor.
  const size_t m_payload_sz;

  /// See id().
  const Publisher_id m_id;

  /// Connected receivers, in connection order.
  std::vector<Sample_receiver*> m_receivers;

  /// See loaned_sample_count().
  size_t m_loaned_sample_ct;

  /// Stats: number of deliver() calls so far.
  size_t m_sent_ct;

  /// Stats: number of reclaim() calls so far.
  size_t m_reclaimed_ct;
}; // class Publisher_base

} // namespace zcpub::port
