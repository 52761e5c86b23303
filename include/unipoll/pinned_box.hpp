/*
 * Copyright (c) Facebook, Inc. and its affiliates.
 *
 * Licensed under the Apache License Version 2.0 with LLVM Exceptions
 * (the "License"); you may not use this file except in compliance with
 * the License. You may obtain a copy of the License at
 *
 *   https://llvm.org/LICENSE.txt
 *
 * Unless required by applicable law or agreed to in writing, software
 * distributed under the License is distributed on an "AS IS" BASIS,
 * WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
 * See the License for the specific language governing permissions and
 * limitations under the License.
 */
#pragma once

#include <unipoll/config.hpp>
#include <unipoll/marker.hpp>
#include <unipoll/pin.hpp>

#include <memory>
#include <new>
#include <type_traits>
#include <utility>

namespace unipoll {

namespace _pinned_box {
template <typename T, typename Allocator>
struct _node {
  using allocator_type = typename std::allocator_traits<
      Allocator>::template rebind_alloc<_node>;

  template <typename... Args>
  explicit _node(const allocator_type& a, Args&&... args)
    : value((Args &&) args...)
    , alloc(a) {}

  // Destroys the node and gives its storage back to the allocator it
  // came from.
  static void destroy(_node* node) noexcept {
    allocator_type allocCopy = std::move(node->alloc);
    node->~_node();
    std::allocator_traits<allocator_type>::deallocate(allocCopy, node, 1);
  }

  T value;
  UNIPOLL_NO_UNIQUE_ADDRESS allocator_type alloc;
};
} // namespace _pinned_box

// Owns a T in a slot obtained from Allocator. Moving the box moves the
// pointer, never the T, so the T may be handed out as a pin_ref for as
// long as the box (or whichever box it was moved into) is alive.
template <typename T, typename Allocator = std::allocator<T>>
class pinned_box {
  static_assert(!std::is_reference_v<T>);
  static_assert(std::is_nothrow_destructible_v<T>);

 public:
  using element_type = T;
  using node_type = _pinned_box::_node<T, Allocator>;
  using is_relocatable = std::true_type;

  template <typename... Args>
  explicit pinned_box(
      std::allocator_arg_t, const Allocator& alloc, Args&&... args) {
    using node_allocator = typename node_type::allocator_type;
    using traits = std::allocator_traits<node_allocator>;
    node_allocator nodeAlloc{alloc};
    node_type* node = traits::allocate(nodeAlloc, 1);
    UNIPOLL_TRY {
      ::new ((void*)node) node_type{nodeAlloc, (Args &&) args...};
    } UNIPOLL_CATCH (...) {
      traits::deallocate(nodeAlloc, node, 1);
      UNIPOLL_RETHROW();
    }
    node_ = node;
  }

  pinned_box(pinned_box&& other) noexcept
    : node_(std::exchange(other.node_, nullptr)) {}

  pinned_box& operator=(pinned_box other) noexcept {
    swap(other);
    return *this;
  }

  ~pinned_box() { reset(); }

  void swap(pinned_box& other) noexcept { std::swap(node_, other.node_); }

  friend void swap(pinned_box& a, pinned_box& b) noexcept { a.swap(b); }

  void reset() noexcept {
    if (node_ != nullptr) {
      node_type::destroy(std::exchange(node_, nullptr));
    }
  }

  pin_ref<T> as_pin() const noexcept {
    UNIPOLL_ASSERT(node_ != nullptr);
    return pin_ref<T>::new_unchecked(node_->value);
  }

  T* get() const noexcept {
    return node_ != nullptr ? std::addressof(node_->value) : nullptr;
  }
  const T& operator*() const noexcept { return node_->value; }
  const T* operator->() const noexcept { return std::addressof(node_->value); }

  explicit operator bool() const noexcept { return node_ != nullptr; }

  // Gives up ownership. The node must later be passed to
  // node_type::destroy().
  node_type* release() noexcept { return std::exchange(node_, nullptr); }

 private:
  node_type* node_ = nullptr;
};

template <typename T, typename Allocator>
struct enable_transferable<pinned_box<T, Allocator>>
  : std::bool_constant<is_transferable_v<T>> {};

template <typename T, typename... Args>
pinned_box<T> make_pinned_box(Args&&... args) {
  return pinned_box<T>{
      std::allocator_arg, std::allocator<T>{}, (Args &&) args...};
}

template <typename T, typename Allocator, typename... Args>
pinned_box<T, Allocator> allocate_pinned_box(
    const Allocator& alloc, Args&&... args) {
  return pinned_box<T, Allocator>{
      std::allocator_arg, alloc, (Args &&) args...};
}

} // namespace unipoll
