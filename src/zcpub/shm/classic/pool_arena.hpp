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

#include "zcpub/shm/classic/classic_fwd.hpp"
#include "zcpub/shm/pointer_offset.hpp"
#include "zcpub/util/util_fwd.hpp"
#include <boost/interprocess/managed_shared_memory.hpp>
#include <boost/core/noncopyable.hpp>
#include <optional>
#include <string>

namespace zcpub::shm::classic
{

// Types.

/**
 * A SHM-classic interface around a single SHM pool with allocation-algorithm services by boost.interprocess,
 * as in `bipc::managed_shared_memory`, with symmetric read/write semantics; and the issuer of shm::Pointer_offset
 * values naming regions inside that pool.
 *
 * ### When to use ###
 * This is the segment allocator a port::Publisher loans its chunks from.  It is a simple way to work with SHM:
 * it is very easy to set up and has very little infrastructure on top of a typically-used subset of bipc's SHM API,
 * which itself is a thin wrapper around an OS-supplied SHM pool (segment) plus a Boost-supplied heap-like
 * allocation algorithm.  Main limitations:
 *   - bipc's default allocation algorithm, `rbtree_best_fit`, is used; it does no thread-caching.
 *   - It works within exactly one *pool* a/k/a `mmap()`ped segment, and that pool's max size must be specified
 *     at creation.  Once exhausted via un-deallocated allocations, allocate() throws.  One may set the max pool
 *     size to a giant value: Linux assigns RAM only when a page is actually touched.
 *   - Any process with a read-write `Pool_arena` to the pool can allocate, deallocate and write; hence
 *     any process can corrupt it for the others.
 *
 * ### Properties ###
 * Backing pool structure: One (1) SHM pool, explicitly named at construction.  Can open handle with create-only,
 * create-or-open (atomic), or open-only semantics.  Pool size specified at construction/cannot be changed.
 * Vaddr structure is not synchronized: `void* p` pointing into SHM in process 1 cannot be used in process 2.
 * Hence to_offset() and to_local(): process 1 converts `p` into a shm::Pointer_offset, which it transmits by
 * any means; process 2 converts it back into its own locally-dereferenceable `void*`.
 *
 * The pool is also assigned a #Segment_id at construction (by the user; `Pool_arena` does not coordinate these).
 * It is stamped into each issued `Pointer_offset`, so that a multi-pool system can route an offset to the right
 * pool; and to_local() asserts it matches.
 *
 * Cleanup: The underlying SHM pool is deleted if and only if one calls remove_persistent(), supplying it the
 * pool name.  This is not invoked internally at all, so it is the user's responsibility.
 *
 * ### Allocation API and how to properly use it ###
 * allocate() and deallocate() are low-level: it is easy to leak and double-free (same as with `new` and `delete`
 * in regular heap, except as usual with SHM anything that was not deallocated persists until remove_persistent()).
 * In zcpub they are invoked by port::Publisher_base, whose sample handles guarantee exactly-once release.
 */
class Pool_arena :
  public flow::log::Log_context,
  private boost::noncopyable
{
public:
  // Types.

  /// Short-hand for the pool id stamped into issued offsets.
  using Segment_id = Pointer_offset::Segment_id;

  // Constructors/destructor.

  /**
   * Construct Pool_arena accessor object to non-existing named SHM pool, creating it first.
   * If it already exists, it is an error.  If an error is emitted via `*err_code`, methods shall return
   * sentinel/`false` values.
   *
   * @param logger_ptr
   *        Logger to use for subsequently logging.
   * @param pool_name
   *        Absolute name at which the persistent SHM pool lives.
   * @param segment_id
   *        See class doc header.
   * @param mode_tag
   *        API-choosing tag util::CREATE_ONLY.
   * @param pool_sz
   *        Pool size.  Note: OS, namely Linux, shall not in fact take (necessarily) this full amount from general
   *        availability but rather a small amount.  Pages are reserved as they begin to be used.
   * @param perms
   *        Permissions to use for creation.  They shall *ignore* the process umask.
   * @param err_code
   *        See `flow::Error_code` docs for error reporting semantics.  #Error_code generated:
   *        various.  Most likely creation failed due to permissions, or it already existed.
   *        An `ENOSPC` (No space left on device) error means a kernel limit on total SHM size has been hit.
   */
  explicit Pool_arena(flow::log::Logger* logger_ptr, const std::string& pool_name, Segment_id segment_id,
                      util::Create_only mode_tag, size_t pool_sz,
                      const util::Permissions& perms = util::Permissions(), Error_code* err_code = 0);

  /**
   * Construct Pool_arena accessor object to existing named SHM pool, or else if it does not exist creates it
   * first and opens it (atomically).  If an error is emitted via `*err_code`, methods shall return
   * sentinel/`false` values.
   *
   * @param logger_ptr
   *        Logger to use for subsequently logging.
   * @param pool_name
   *        Absolute name at which the persistent SHM pool lives.
   * @param segment_id
   *        See class doc header.
   * @param mode_tag
   *        API-choosing tag util::OPEN_OR_CREATE.
   * @param pool_sz
   *        Pool size.  See note in first ctor.
   * @param perms_on_create
   *        Permissions to use for creation.
   * @param err_code
   *        See `flow::Error_code` docs for error reporting semantics.  #Error_code generated: various.
   */
  explicit Pool_arena(flow::log::Logger* logger_ptr, const std::string& pool_name, Segment_id segment_id,
                      util::Open_or_create mode_tag, size_t pool_sz,
                      const util::Permissions& perms_on_create = util::Permissions(), Error_code* err_code = 0);

  /**
   * Construct Pool_arena accessor object to existing named SHM pool.  If it does not exist, it is an error.
   * If an error is emitted via `*err_code`, methods shall return sentinel/`false` values.
   *
   * @param logger_ptr
   *        Logger to use for subsequently logging.
   * @param pool_name
   *        Absolute name at which the persistent SHM pool lives.
   * @param segment_id
   *        See class doc header.  Should equal the one used by the creator, so that to_local() accepts its offsets.
   * @param mode_tag
   *        API-choosing tag util::OPEN_ONLY.
   * @param read_only
   *        If and only if `true` the calling process will be prevented by the OS from writing into the pages
   *        mapped by `*this` subsequently.  This includes allocate() and deallocate().  Such attempts lead to
   *        undefined behavior.  to_offset() and to_local() are fine: a read-only mapping is what a pure receiver
   *        would use to look at delivered samples.
   * @param err_code
   *        See `flow::Error_code` docs for error reporting semantics.  #Error_code generated: various.
   */
  explicit Pool_arena(flow::log::Logger* logger_ptr, const std::string& pool_name, Segment_id segment_id,
                      util::Open_only mode_tag, bool read_only = false, Error_code* err_code = 0);

  /**
   * Destroys Pool_arena accessor object.  In and of itself this does not destroy the underlying pool named
   * #m_pool_name; it continues to exist as long as (1) any other similar accessor objects (or other OS-created
   * handles) do; and/or (2) its entry in the file system lives (hence until remove_persistent() is called
   * for #m_pool_name).  This is analogous to closing a descriptor to a file.
   */
  ~Pool_arena();

  // Methods.

  /**
   * Removes the named SHM pool object.  The name `name` is removed from the system immediately; and
   * the function is non-blocking.  However the underlying pool if any continues to exist until all handles
   * to it are closed.  Trying to remove a non-existent name *is* an error.
   *
   * Logs INFO message.
   *
   * @param logger_ptr
   *        Logger to use for subsequently logging.
   * @param name
   *        Absolute name at which the persistent SHM pool lives.
   * @param err_code
   *        See `flow::Error_code` docs for error reporting semantics.  #Error_code generated:
   *        various.  Most likely it'll be a not-found error or permissions error.
   */
  static void remove_persistent(flow::log::Logger* logger_ptr, const std::string& name,
                                Error_code* err_code = 0);

  /**
   * Returns `true` if and only if a pool is attached; i.e., the ctor did not fail.
   *
   * @return See above.
   */
  bool attached() const;

  /**
   * Allocates buffer of specified size, in bytes, in the accessed pool; returns locally-dereferenceable address
   * to the first byte.  Returns null if no pool attached to `*this`.  Throws exception if ran out of space.
   *
   * ### Rationale for throwing exception instead of returning null ###
   * It's what bipc does (throws `bipc::bad_alloc`), and we propagate what it throws.  It really is an exceptional
   * situation to run out of pool space; a caller with a policy for it (such as port::Publisher_base, which turns it
   * into a loan error) catches it.
   *
   * @param n
   *        Desired buffer size in bytes.  Must not be 0 (behavior undefined/assertion may trip).
   * @return Non-null on success (see above); null if ctor failed to attach pool.
   */
  void* allocate(size_t n);

  /**
   * Identical to allocate() but the returned buffer's first byte is aligned to `alignment`.
   *
   * @param n
   *        See allocate().
   * @param alignment
   *        Power of 2 (else behavior undefined).
   * @return See allocate().
   */
  void* allocate_aligned(size_t n, size_t alignment);

  /**
   * Undoes effects of local allocate() that returned `buf_not_null`; or another-process's
   * allocate() that returned pointer whose locally-dereferenceable equivalent is `buf_not_null`.
   * Returns `false` if and only if no pool attached to `*this`.  Does not throw exception.
   *
   * @param buf_not_null
   *        See above.
   * @return `true` on success; `false` if ctor failed to attach a pool.
   */
  bool deallocate(void* buf_not_null) noexcept;

  /**
   * Returns the relative address of the given locally-dereferenceable pointer into the attached pool.
   * Behavior undefined (assertion may trip) if no pool is attached, or `ptr` does not point into it.
   *
   * @param ptr
   *        Pointer into the pool, as returned by allocate() or derived from one.
   * @return See above.
   */
  Pointer_offset to_offset(const void* ptr) const;

  /**
   * Inverse of to_offset(), in this or any other process with the same pool open: returns the
   * locally-dereferenceable pointer for the given offset.  Behavior undefined (assertion may trip) if no pool is
   * attached, or the offset is from another segment or beyond the pool's end.
   *
   * @param offset
   *        Value returned by to_offset() in any process.
   * @return See above.
   */
  void* to_local(const Pointer_offset& offset) const;

  /**
   * Pool size in bytes; 0 if no pool attached.
   *
   * @return See above.
   */
  size_t size() const;

  /**
   * Free space in bytes as reported by the allocation algorithm; 0 if no pool attached.
   *
   * @return See above.
   */
  size_t free_memory() const;

  // Data.

  /// SHM pool name as set immutably at construction.
  const std::string m_pool_name;

  /// Segment id as set immutably at construction.
  const Segment_id m_segment_id;

private:
  // Types.

  /// The SHM pool type one instance of which is managed by `*this`.
  using Pool = bipc::managed_shared_memory;

  // Constructors.

  /**
   * Helper ctor delegated by the 2 `public` ctors that take `Open_or_create` or `Create_only` mode.
   *
   * @tparam Mode_tag
   *         Either util::Open_or_create or util::Create_only.
   * @param mode_tag
   *        See `public` ctors.
   * @param logger_ptr
   *        See `public` ctors.
   * @param pool_name
   *        See `public` ctors.
   * @param segment_id
   *        See `public` ctors.
   * @param pool_sz
   *        See `public` ctors.
   * @param perms
   *        See `public` ctors.
   * @param err_code
   *        See `public` ctors.
   */
  template<typename Mode_tag>
  explicit Pool_arena(Mode_tag mode_tag, flow::log::Logger* logger_ptr, const std::string& pool_name,
                      Segment_id segment_id, size_t pool_sz, const util::Permissions& perms, Error_code* err_code);

  // Methods.

  /**
   * Logs, at DATA severity, the free-space change brought about by an alloc or dealloc.
   *
   * @param what
   *        Brief description of the op.
   * @param n
   *        Size of the op, if known; else 0.
   * @param prev_free
   *        free_memory() before the op.
   */
  void log_free_space_change(util::String_view what, size_t n, size_t prev_free) const;

  // Data.

  /// Attached SHM pool.  If ctor fails in non-throwing fashion then this remains empty.  Immutable after ctor.
  std::optional<Pool> m_pool;
}; // class Pool_arena

} // namespace zcpub::shm::classic
