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

#include "zcpub/util/util_fwd.hpp"
#include <boost/interprocess/exceptions.hpp>

namespace zcpub::util::detail
{

// Free functions.

/**
 * Emits, into `*err_code` or (if null) via thrown `flow::error::Runtime_error`, an #Error_code corresponding
 * to the given bipc exception; logs a WARNING with all its details first.  The emitted code is the system
 * (errno) code if bipc supplied one; else `misc_bipc_lib_error`.
 *
 * @param logger_ptr
 *        Logger to use for logging.
 * @param exc
 *        What bipc threw.
 * @param err_code
 *        See above.
 * @param misc_bipc_lib_error
 *        Code to emit when `exc` carries no native code.
 * @param context
 *        Brief description of the operation; logged and used as the exception context.
 */
void handle_bipc_exception(flow::log::Logger* logger_ptr, const bipc::interprocess_exception& exc,
                           Error_code* err_code, const Error_code& misc_bipc_lib_error, String_view context);

/**
 * Helper that invokes `func()` which may throw a bipc `interprocess_exception`; if it does so, the exception
 * (or a subclass, such as `bipc::bad_alloc`) is translated per handle_bipc_exception(); else `*err_code`
 * (if not null) is cleared.  Any other exception passes through untouched.
 *
 * @tparam Func
 *         Functor with signature `void F()`.
 * @param logger_ptr
 *        Logger to use for logging.
 * @param err_code
 *        See `flow::Error_code` docs for error reporting semantics.
 * @param misc_bipc_lib_error
 *        See handle_bipc_exception().
 * @param context
 *        See handle_bipc_exception().
 * @param func
 *        The operation.
 */
template<typename Func>
void op_with_possible_bipc_exception(flow::log::Logger* logger_ptr, Error_code* err_code,
                                     const Error_code& misc_bipc_lib_error,
                                     String_view context, const Func& func);

// Template implementations.

template<typename Func>
void op_with_possible_bipc_exception(flow::log::Logger* logger_ptr, Error_code* err_code,
                                     const Error_code& misc_bipc_lib_error,
                                     String_view context, const Func& func)
{
  if (err_code)
  {
    err_code->clear();
  }

  try
  {
    func();
  }
  catch (const bipc::interprocess_exception& exc)
  {
    handle_bipc_exception(logger_ptr, exc, err_code, misc_bipc_lib_error, context);
  }
} // op_with_possible_bipc_exception()

} // namespace zcpub::util::detail
