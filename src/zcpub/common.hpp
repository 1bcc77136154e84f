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

#include <flow/util/util.hpp>
#include <flow/log/log.hpp>
#include <flow/error/error.hpp>
#include <boost/interprocess/interprocess_fwd.hpp>
#include <boost/unordered_map.hpp>
#include <string>

/* The headers rely on C++17 (inline variables, `if constexpr`, nested namespace definitions), and so does
 * any translation unit `#include`ing them. */
#if (!defined(__cplusplus)) || (__cplusplus < 201703L)
#  error "To compile a translation unit that `#include`s any zcpub/ API headers, use C++17 compile mode or later."
#endif

/**
 * Catch-all namespace for zcpub: the loan-to-send lifecycle of a single message in a zero-copy, shared-memory
 * (SHM) publish/subscribe transport.
 *
 * A sending endpoint obtains (*loans*) writable memory in a SHM segment; the caller writes the payload in place;
 * and the memory is then either *delivered* to connected receivers or, if the caller abandons it, *reclaimed*.
 * No payload byte is ever copied on the way, and the memory is never addressed by process-local pointers when
 * it crosses a boundary: it travels as a segment-relative shm::Pointer_offset.
 *
 * Modules overview
 * ----------------
 *   - *zcpub::shm*: Relative addressing (shm::Pointer_offset) and the SHM-classic pool allocator
 *     (shm::classic::Pool_arena) that is the sole issuer of offsets.
 *   - *zcpub::port*: The typed mutable sample handles port::Sample_mut_uninit and port::Sample_mut; the
 *     port::Publish_mgmt capability they call back into; and a reference publisher port::Publisher.
 *   - *zcpub::util*: Miscellaneous small items shared by the above.
 *
 * ### Error reporting ###
 * The standards and mechanics w/r/t error reporting are inherited from Flow.  Therefore, see the `namespace flow`
 * doc header's "Error reporting" section.  In short: a fallible API takes a trailing `Error_code* err_code = 0`;
 * if null, an error is thrown as `flow::error::Runtime_error`; else it is emitted into `*err_code`.
 *
 * ### Logging ###
 * We use `flow::log`.  The user supplies a `flow::log::Logger*` to the various constructors; null means log
 * nowhere.  Log components are enumerated in zcpub::Log_component.
 */
namespace zcpub
{

// Types.

/**
 * @namespace zcpub::bipc
 * @brief Short-hand for boost.interprocess namespace.
 */
namespace bipc = boost::interprocess;

/// Short-hand for `flow::Error_code` which is very common.
using Error_code = flow::Error_code;

/**
 * The `flow::log::Component` payload enumeration containing the log components used by zcpub internal logging.
 * The user specifies it when configuring their program's logging via
 * `flow::log::Config::init_component_to_union_idx_mapping()` and `flow::log::Config::init_component_names()`.
 */
enum class Log_component
{
  /// Uncategorized.
  S_UNCAT = 0,
  /// SHM pools and relative addressing: zcpub::shm.
  S_SHM,
  /// Publisher ports and samples: zcpub::port.
  S_PORT,
  /// SENTINEL: Not a component.  Its numeric value is the number of components.
  S_END_SENTINEL
};

// Constants.

/**
 * Maps each enumerated value in zcpub::Log_component to its string representation as used in log output and
 * verbosity config; pass to `flow::log::Config::init_component_names()`.  If the member is called `S_SOME_NAME`,
 * then its string counterpart is `"SOME_NAME"`.
 */
extern const boost::unordered_multimap<Log_component, std::string> S_ZCPUB_LOG_COMPONENT_NAME_MAP;

} // namespace zcpub
