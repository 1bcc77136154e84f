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

#include "zcpub/shm/shm_fwd.hpp"
#include <iosfwd>

/**
 * Publisher-side ports: the loan-to-send lifecycle of a single message placed directly in SHM.
 *
 * ### Lifecycle ###
 * A sample is the single owning handle to a *loaned* region (chunk) of a SHM segment.  Its life goes:
 *
 *   ~~~
 *   Publisher::loan_uninit() --> Sample_mut_uninit<T> --write_payload()--> Sample_mut<T> --send()--> Delivered
 *                                         |                                      |
 *                                         +--(destroyed)--> Reclaimed <--(destroyed)--+
 *   ~~~
 *
 * The *state* (uninitialized or initialized payload) is part of the *type*.  Sample_mut_uninit<T> gives the caller
 * a Maybe_uninit<T> through which the payload can be written but not read; so a read-before-write is a compile
 * error, not a runtime check.  Sample_mut_uninit::write_payload() constructs the `T` in place in the loaned storage
 * and re-wraps the *same* region (same shm::Pointer_offset) as a Sample_mut<T>: no allocation, no copy of the
 * payload beyond constructing it.
 *
 * Each handle ends in exactly one of two ways:
 *   - Sample_mut::send() hands the region to the Publish_mgmt::deliver() operation of the publisher that loaned it.
 *     From that point on the region is the publisher's business, whether delivery succeeded or not.
 *   - The handle is destroyed without having been sent (including by exception unwinding).  Its destructor
 *     hands the region to Publish_mgmt::reclaim().
 *
 * @note A caller that forgets to send() a fully written sample loses no memory (it is reclaimed), but the message
 *       is never delivered either.  Abandonment is the way to cancel a loan, so this is not an error.  It is
 *       logged at TRACE severity only.
 *
 * The transition operations are `&&`-qualified: one writes `std::move(sample).send()`, after which `sample` is
 * a moved-from husk whose destruction does nothing and whose use is a contract violation (assertion may trip).
 *
 * ### Thread safety ###
 * A sample calls back into its publisher on send and on destruction; the publisher is not internally
 * synchronized.  Therefore a sample must stay in the thread that loaned it until it is sent or destroyed; and
 * it must never be given to another process (give it shm::Pointer_offset, via send(), instead).  C++ cannot
 * enforce this; it is a documented contract.
 */
namespace zcpub::port
{

// Types.

// Find doc headers near the bodies of these compound types.

class Header;
template<typename T>
class Maybe_uninit;
class Publish_mgmt;
template<typename Payload>
class Sample_mut_uninit;
template<typename Payload>
class Sample_mut;
class Sample_receiver;
struct Publisher_config;
class Publisher_base;
template<typename Payload>
class Publisher;

// Free functions.

/**
 * Prints string representation of the given `Header` to the given `ostream`.
 *
 * @relatesalso Header
 *
 * @param os
 *        Stream to which to write.
 * @param val
 *        Object to serialize.
 * @return `os`.
 */
std::ostream& operator<<(std::ostream& os, const Header& val);

/**
 * Prints string representation of the given `Publisher_base` to the given `ostream`.
 *
 * @relatesalso Publisher_base
 *
 * @param os
 *        Stream to which to write.
 * @param val
 *        Object to serialize.
 * @return `os`.
 */
std::ostream& operator<<(std::ostream& os, const Publisher_base& val);

/**
 * Prints string representation of the given `Sample_mut_uninit` to the given `ostream`.
 *
 * @relatesalso Sample_mut_uninit
 *
 * @tparam Payload
 *         See Sample_mut_uninit.
 * @param os
 *        Stream to which to write.
 * @param val
 *        Object to serialize.
 * @return `os`.
 */
template<typename Payload>
std::ostream& operator<<(std::ostream& os, const Sample_mut_uninit<Payload>& val);

/**
 * Prints string representation of the given `Sample_mut` to the given `ostream`.
 *
 * @relatesalso Sample_mut
 *
 * @tparam Payload
 *         See Sample_mut.
 * @param os
 *        Stream to which to write.
 * @param val
 *        Object to serialize.
 * @return `os`.
 */
template<typename Payload>
std::ostream& operator<<(std::ostream& os, const Sample_mut<Payload>& val);

} // namespace zcpub::port
