/* Flow-Chan: Core
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

#include <memory>
#include <type_traits>

namespace chan::util
{

/**
 * Allocator adaptor (for `std::vector` and the like) that turns value-initialization of elements into
 * default-initialization.  For a `vector<uint8_t>` this means `resize(n)` leaves the `n` bytes uninitialized,
 * instead of zeroing them, which is what one wants for a buffer that is about to be filled by a copy anyway.
 * channel::Udp_socket_channel uses it for the staging buffer of gather-sends.
 *
 * Everything other than 0-arg construction behaves as in `Allocator`.
 *
 * @tparam T
 *         Element type.
 * @tparam Allocator
 *         Adaptee allocator.
 */
template<typename T, typename Allocator = std::allocator<T>>
class Default_init_allocator : public Allocator
{
public:
  // Types.

  /// Rebinding to another element type keeps the adaptor.
  template<typename U>
  struct rebind
  {
    /// The rebound type.
    using other = Default_init_allocator<U, typename std::allocator_traits<Allocator>::template rebind_alloc<U>>;
  };

  // Constructors/destructor.

  /// Inherit adaptee allocator's constructors.
  using Allocator::Allocator;

  // Methods.

  /**
   * In-place 0-arg construction: default-initializes.
   *
   * @tparam U
   *         Type being constructed.
   * @param ptr
   *        Where.
   */
  template<typename U>
  void construct(U* ptr) noexcept(std::is_nothrow_default_constructible_v<U>);

  /**
   * In-place 1+-arg construction: as in `Allocator`.
   *
   * @tparam U
   *         Type being constructed.
   * @tparam Args
   *         Constructor arg types.
   * @param ptr
   *        Where.
   * @param args
   *        Constructor args.
   */
  template<typename U, typename... Args>
  void construct(U* ptr, Args&&... args);
}; // class Default_init_allocator

// Template implementations.

template<typename T, typename Allocator>
template<typename U>
void Default_init_allocator<T, Allocator>::construct(U* ptr) noexcept(std::is_nothrow_default_constructible_v<U>)
{
  ::new(static_cast<void*>(ptr)) U;
}

template<typename T, typename Allocator>
template<typename U, typename... Args>
void Default_init_allocator<T, Allocator>::construct(U* ptr, Args&&... args)
{
  std::allocator_traits<Allocator>::construct(static_cast<Allocator&>(*this), ptr, std::forward<Args>(args)...);
}

} // namespace chan::util
