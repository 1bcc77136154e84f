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
 * Error codes emitted by shm::classic::Pool_arena when boost.interprocess fails without an underlying system code.
 * Failures that do carry a system code (e.g., `ENOENT` on open, `EACCES` on a permissions mismatch) are reported
 * as that system code instead, so this set stays small.  Structure mirrors zcpub::port::error.
 */
namespace zcpub::shm::classic::error
{

// Types.

/// Numeric value of the lowest Code.
constexpr int S_CODE_LOWEST_INT_VALUE = 1;

/// Pool_arena failures not expressible as a system error code.  Category name: `zcpub/shm/classic`.
enum class Code
{
  /**
   * Creating, opening or removing the pool segment failed with a boost.interprocess exception that had no
   * system code attached; the WARNING logged by Pool_arena at that point has the exception text.
   */
  S_SHM_BIPC_MISC_LIBRARY_ERROR = S_CODE_LOWEST_INT_VALUE,

  /// SENTINEL: Not an error.  This Code must never be issued by an error/success-emitting API; I/O use only.
  S_END_SENTINEL
}; // enum class Code

// Free functions.

/**
 * Analogous to port::error::make_error_code().
 *
 * @param err_code
 *        See above.
 * @return See above.
 */
Error_code make_error_code(Code err_code);

/**
 * Analogous to port::error::operator>>().
 *
 * @param is
 *        See above.
 * @param val
 *        See above.
 * @return See above.
 */
std::istream& operator>>(std::istream& is, Code& val);

/**
 * Analogous to port::error::operator<<().
 *
 * @param os
 *        See above.
 * @param val
 *        See above.
 * @return See above.
 */
std::ostream& operator<<(std::ostream& os, Code val);

} // namespace zcpub::shm::classic::error

namespace boost::system
{

// Types.

/// Lets zcpub::shm::classic::error::Code values convert implicitly to `Error_code`.
template<>
struct is_error_code_enum<::zcpub::shm::classic::error::Code>
{
  /// Means `Code` `enum` values can be used for `Error_code`.
  static const bool value = true;
};

} // namespace boost::system
