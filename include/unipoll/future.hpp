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
#include <unipoll/context.hpp>
#include <unipoll/marker.hpp>
#include <unipoll/pin.hpp>
#include <unipoll/poll_result.hpp>
#include <unipoll/tag_invoke.hpp>
#include <unipoll/type_traits.hpp>
#include <unipoll/detail/unipoll_fwd.hpp>

#include <functional>
#include <type_traits>

namespace unipoll {

// The value a future produces when it completes.
template <typename F, typename = void>
struct future_output {};

template <typename F>
struct future_output<F, std::void_t<typename F::output_type>> {
  using type = typename F::output_type;
};

template <typename F>
struct future_output<pin_ref<F>> : future_output<F> {};

template <typename F>
struct future_output<std::reference_wrapper<F>> : future_output<F> {};

template <typename F>
using future_output_t = typename future_output<remove_cvref_t<F>>::type;

namespace _poll {
template <typename F, typename Spawner, typename = void>
inline constexpr bool _has_member_poll = false;

template <typename F, typename Spawner>
inline constexpr bool _has_member_poll<
    F,
    Spawner,
    std::void_t<decltype(UNIPOLL_DECLVAL(F&).poll(
        UNIPOLL_DECLVAL(context<Spawner>&)))>> = true;

// Advances a future by one step. self must stay where it is until the
// future is destroyed. Once the result is ready the future must not be
// polled again.
//
// Dispatch, in order:
//  - tag_invoke(poll, pin_ref<F>, context<Spawner>&)
//  - pin_ref<G> polls the G it refers to
//  - std::reference_wrapper<G>, for relocatable G, polls the G
//  - F::poll(context<Spawner>&) on the pinned object
struct _fn {
 private:
  template <typename F, typename Spawner>
  static constexpr bool _pollable() noexcept {
    if constexpr (is_tag_invocable_v<_fn, pin_ref<F>, context<Spawner>&>) {
      return true;
    } else if constexpr (instance_of_v<pin_ref, F>) {
      return _pollable<typename F::element_type, Spawner>();
    } else if constexpr (instance_of_v<std::reference_wrapper, F>) {
      return is_relocatable_v<typename F::type> &&
          _pollable<typename F::type, Spawner>();
    } else {
      return _has_member_poll<F, Spawner>;
    }
  }

 public:
  template <
      typename F,
      typename Spawner,
      std::enable_if_t<_pollable<F, Spawner>(), int> = 0>
  auto operator()(pin_ref<F> self, context<Spawner>& cx) const {
    if constexpr (is_tag_invocable_v<_fn, pin_ref<F>, context<Spawner>&>) {
      return unipoll::tag_invoke(_fn{}, self, cx);
    } else if constexpr (instance_of_v<pin_ref, F>) {
      return (*this)(self.get(), cx);
    } else if constexpr (instance_of_v<std::reference_wrapper, F>) {
      return (*this)(pin_ref<typename F::type>{self.get().get()}, cx);
    } else {
      return self.get_unchecked().poll(cx);
    }
  }
};
} // namespace _poll

inline constexpr _poll::_fn poll{};

template <typename F, typename Spawner = spawner, typename = void>
inline constexpr bool is_future_v = false;

template <typename F, typename Spawner>
inline constexpr bool is_future_v<
    F,
    Spawner,
    std::void_t<
        future_output_t<F>,
        std::invoke_result_t<
            const _poll::_fn&,
            pin_ref<remove_cvref_t<F>>,
            context<Spawner>&>>> =
    std::is_same_v<
        std::invoke_result_t<
            const _poll::_fn&,
            pin_ref<remove_cvref_t<F>>,
            context<Spawner>&>,
        poll_result<future_output_t<F>>>;

// Polls a relocatable future that the caller holds by ordinary reference.
template <
    typename F,
    typename Spawner,
    std::enable_if_t<is_relocatable_v<F>, int> = 0>
auto poll_relocatable(F& future, context<Spawner>& cx) {
  return poll(pin_ref<F>{future}, cx);
}

} // namespace unipoll
