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

#include "zcpub/common.hpp"
#include <iosfwd>

/**
 * Namespace containing the zcpub::port module's extension of boost.system error conventions, so that that API can
 * return codes/messages from within its own new set of error codes/messages.
 *
 * Only codes specific to zcpub::port are here.  Errors coming from the OS (such as `errno`-based failures to
 * open a pool) are emitted as `boost::system::system_category()` codes and do not appear here.
 */
namespace zcpub::port::error
{

// Types.

/// Numeric value of the lowest Code.
constexpr int S_CODE_LOWEST_INT_VALUE = 1;

/**
 * All possible errors returned (via `Error_code` arguments) by zcpub::port functions/methods *outside of*
 * possibly system-triggered errors.
 *
 * Each member's doc comment is also its message() text; keep them in sync with error.cpp.
 */
enum class Code
{
  /**
   * Publisher send: the sample could not be delivered at all, as there are no connected receivers.
   * (Individual receivers declining a sample is not this error.)
   */
  S_CONNECTION_FAILURE = S_CODE_LOWEST_INT_VALUE,

  /**
   * Publisher loan: the publisher already has the configured maximum number of samples loaned out; send or
   * destroy one first.
   */
  S_LOAN_EXCEEDS_MAX_LOANS,

  /// Publisher loan: the publisher's data segment has no room for another sample.
  S_LOAN_OUT_OF_MEMORY,

  /// SENTINEL: Not an error.  This Code must never be issued by an error/success-emitting API; I/O use only.
  S_END_SENTINEL
}; // enum class Code

// Free functions.

/**
 * Given a `Code` `enum` value, creates a lightweight flow::Error_code (a/k/a boost.system `error_code`)
 * representing that error.  This is needed to make the `flow::Error_code(Code)` constructor
 * work.  You should not need to call this directly.
 *
 * @param err_code
 *        Lightweight `enum` value.
 * @return See above.
 */
Error_code make_error_code(Code err_code);

/**
 * Deserializes a port::error::Code from a standard input stream.  Reads up to but not including the next
 * non-alphanumeric-or-underscore character; the resulting string is then mapped to a Code.  If none is
 * recognized, Code::S_END_SENTINEL is the result.  The recognized values are:
 *   - "<number>", where `<number>` is the `int` value of the Code (e.g., "1");
 *   - "<code symbol>", case-insensitive, e.g., "CONNECTION_FAILURE" or "connection_failure".
 *
 * @param is
 *        Stream from which to deserialize.
 * @param val
 *        Value to set.
 * @return `is`.
 */
std::istream& operator>>(std::istream& is, Code& val);

/**
 * Serializes a port::error::Code to a standard output stream.  The output string is compatible with the reverse
 * `istream>>` operator.
 *
 * @param os
 *        Stream to which to serialize.
 * @param val
 *        Value to serialize.
 * @return `os`.
 */
std::ostream& operator<<(std::ostream& os, Code val);

} // namespace zcpub::port::error

namespace boost::system
{

// Types.

/**
 * Ummm -- it specializes this `struct` to -- look -- the end result is boost.system uses this as
 * authorization to make `enum` `Code` convertible to `Error_code`.  The non-specialized
 * version of this sets `value` to `false`, so that random arbitary `enum`s can't just be used as
 * `Error_code`s.  Note that this is the offical way to accomplish that, as (confusingly but
 * formally) documented in boost.system docs.
 */
template<>
struct is_error_code_enum<::zcpub::port::error::Code>
{
  /// Means `Code` `enum` values can be used for `Error_code`.
  static const bool value = true;
};

} // namespace boost::system
