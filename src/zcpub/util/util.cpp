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

#include "zcpub/util/util_fwd.hpp"
#include "zcpub/util/detail/util.hpp"

namespace zcpub::util
{

// Static initializations.

const Open_or_create OPEN_OR_CREATE;
const Open_only OPEN_ONLY;
const Create_only CREATE_ONLY;

} // namespace zcpub::util

namespace zcpub::util::detail
{

// Implementations.

void handle_bipc_exception(flow::log::Logger* logger_ptr, const bipc::interprocess_exception& exc,
                           Error_code* err_code, const Error_code& misc_bipc_lib_error, String_view context)
{
  FLOW_LOG_SET_CONTEXT(logger_ptr, Log_component::S_SHM);

  const auto native_code_raw = exc.get_native_error();
  const auto bipc_err_code_enum = exc.get_error_code();
  FLOW_LOG_WARNING("bipc threw interprocess_exception; will emit some hopefully suitable Error_code; "
                   "but here are all the details of the original exception: native code int "
                   "[" << native_code_raw << "]; bipc error_code_t enum->int "
                   "[" << int(bipc_err_code_enum) << "]; message = [" << exc.what() << "]; "
                   "context = [" << context << "].");

  /* bipc sets the native (errno) code when the failure came from the OS; that is the most informative thing
   * we can emit.  Otherwise there's no system code, and the caller's module-specific misc code is used. */
  const Error_code our_err_code = (native_code_raw != 0)
                                    ? Error_code(native_code_raw, boost::system::system_category())
                                    : misc_bipc_lib_error;
  if (err_code)
  {
    *err_code = our_err_code;
    return;
  }
  // else
  throw flow::error::Runtime_error(our_err_code, context);
} // handle_bipc_exception()

} // namespace zcpub::util::detail
