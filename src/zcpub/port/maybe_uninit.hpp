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

#include "zcpub/port/port_fwd.hpp"
#include <new>
#include <utility>

namespace zcpub::port
{

// Types.

/**
 * Storage for a `T` that may not have been constructed yet, exposing only operations that *write* it: there is
 * no way to obtain a `T&` or `const T&` from a `Maybe_uninit` other than as the result of constructing the `T`.
 * Sample_mut_uninit::payload_mut() returns one of these; that's how reading an unwritten payload is made
 * unrepresentable.
 *
 * `sizeof` and `alignof` equal those of `T`, and the `T` lives at data().  Nothing tracks whether the `T` has
 * been constructed, and the destructor never destroys a `T`: that is the owner's business.  (In zcpub the owner
 * never needs to, since payload types are trivially copyable.)
 *
 * Not copyable or movable: it is a view of a particular region, placed there by others.
 *
 * @tparam T
 *         The payload type.
 */
template<typename T>
class Maybe_uninit
{
public:
  // Types.

  /// Short-hand for the template parameter.
  using Value = T;

  // Constructors/destructor.

  /// Leaves the storage uninitialized.
  Maybe_uninit() = default;

  /// Forbid copying.
  Maybe_uninit(const Maybe_uninit&) = delete;

  // Methods.

  /// Forbid copying.
  Maybe_uninit& operator=(const Maybe_uninit&) = delete;

  /**
   * Constructs the `T` in place from the given ctor args, overwriting any previous contents without destroying
   * them.
   *
   * @tparam Ctor_args
   *         `T` ctor arg types.
   * @param ctor_args
   *        0 or more args to `T` constructor.
   * @return Reference to the now-constructed `T`.
   */
  template<typename... Ctor_args>
  Value& emplace(Ctor_args&&... ctor_args);

  /**
   * Equivalent to `emplace(std::move(value))`.
   *
   * @param value
   *        Value to write.
   * @return See emplace().
   */
  Value& write(Value&& value);

  /**
   * Equivalent to `emplace(value)`.
   *
   * @param value
   *        Value to write.
   * @return See emplace().
   */
  Value& write(const Value& value);

  /**
   * Raw storage, for the user who wants to construct the `T` piecemeal (e.g., `memcpy()` into it).
   * Use Sample_mut_uninit::assume_init() afterwards.
   *
   * @return Pointer to `sizeof(T)` bytes aligned to `alignof(T)`.
   */
  void* data();

private:
  // Data.

  /// The storage; uninitialized unless the owner knows better.
  alignas(Value) unsigned char m_storage[sizeof(Value)];
}; // class Maybe_uninit

// Template implementations.

template<typename T>
template<typename... Ctor_args>
typename Maybe_uninit<T>::Value& Maybe_uninit<T>::emplace(Ctor_args&&... ctor_args)
{
  return *(::new (static_cast<void*>(m_storage)) Value(std::forward<Ctor_args>(ctor_args)...));
}

template<typename T>
typename Maybe_uninit<T>::Value& Maybe_uninit<T>::write(Value&& value)
{
  return emplace(std::move(value));
}

template<typename T>
typename Maybe_uninit<T>::Value& Maybe_uninit<T>::write(const Value& value)
{
  return emplace(value);
}

template<typename T>
void* Maybe_uninit<T>::data()
{
  return static_cast<void*>(m_storage);
}

} // namespace zcpub::port
