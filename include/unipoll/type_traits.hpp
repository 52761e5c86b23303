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

#include <type_traits>

#define UNIPOLL_DECLVAL(...) static_cast<__VA_ARGS__(*)()noexcept>(nullptr)()

namespace unipoll {

// We don't care about volatile, and not handling volatile is
// less work for the compiler.
template <class T> struct remove_cvref { using type = T; };
template <class T> struct remove_cvref<T const> { using type = T; };
template <class T> struct remove_cvref<T&> { using type = T; };
template <class T> struct remove_cvref<T const&> { using type = T; };
template <class T> struct remove_cvref<T&&> { using type = T; };
template <class T> struct remove_cvref<T const&&> { using type = T; };

template <class T> using remove_cvref_t = typename remove_cvref<T>::type;

template <template <typename...> class T, typename X>
inline constexpr bool instance_of_v = false;

template <template <typename...> class T, typename... Args>
inline constexpr bool instance_of_v<T, T<Args...>> = true;

template <bool B>
struct _if {
  template <typename, typename T>
  using apply = T;
};
template <>
struct _if<true> {
  template <typename T, typename>
  using apply = T;
};

template <bool B, typename T, typename U>
using conditional_t = typename _if<B>::template apply<T, U>;

template <typename T, typename = void>
inline constexpr bool is_equality_comparable_v = false;

template <typename T>
inline constexpr bool is_equality_comparable_v<
    T,
    std::void_t<decltype(UNIPOLL_DECLVAL(const T&) == UNIPOLL_DECLVAL(const T&))>> =
    true;

} // namespace unipoll
