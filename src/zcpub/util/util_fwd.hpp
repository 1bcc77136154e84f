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
#include <flow/util/string_view.hpp>
#include <boost/interprocess/creation_tags.hpp>
#include <boost/interprocess/permissions.hpp>

/**
 * Flow-IPC-style miscellany used across zcpub modules: resource-opening mode tags, permissions, string views.
 */
namespace zcpub::util
{

// Types.

/// Short-hand for Flow's `String_view`.
using String_view = flow::util::String_view;

/// Tag type indicating an atomic open-if-exists-else-create operation.  #OPEN_OR_CREATE is an instance.
using Open_or_create = bipc::open_or_create_t;

/// Tag type indicating an ideally-atomic open-if-exists-else-fail operation.  #OPEN_ONLY is an instance.
using Open_only = bipc::open_only_t;

/// Tag type indicating a create-unless-exists-else-fail operation.  #CREATE_ONLY is an instance.
using Create_only = bipc::create_only_t;

/// Short-hand for Unix (POSIX) permissions class.
using Permissions = bipc::permissions;

// Constants.

/// Tag value indicating an open-if-exists-else-create operation.
extern const Open_or_create OPEN_OR_CREATE;

/// Tag value indicating an open-if-exists-else-fail operation.
extern const Open_only OPEN_ONLY;

/// Tag value indicating an atomic create-unless-exists-else-fail operation.
extern const Create_only CREATE_ONLY;

} // namespace zcpub::util
