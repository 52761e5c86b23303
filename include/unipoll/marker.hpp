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

#include <unipoll/type_traits.hpp>

#include <functional>
#include <type_traits>

namespace unipoll {

// A type is relocatable when it holds no references into its own storage,
// so a suspended instance may be moved in memory between polls. This is
// opt-in: specialise enable_relocatable or declare
//   using is_relocatable = std::true_type;
// as a member.
template <typename T, typename = void>
struct enable_relocatable : std::false_type {};

template <typename T>
struct enable_relocatable<T, std::void_t<typename T::is_relocatable>>
  : std::bool_constant<T::is_relocatable::value> {};

template <typename T>
struct enable_relocatable<std::reference_wrapper<T>> : std::true_type {};

template <typename T>
inline constexpr bool is_relocatable_v =
    std::is_scalar_v<T> || enable_relocatable<remove_cvref_t<T>>::value;

// A type is transferable when an instance may be handed to, polled on and
// destroyed from another thread. Nothing checks this; types that are bound
// to their creating thread opt out by specialising enable_transferable or
// declaring
//   using is_transferable = std::false_type;
// as a member.
template <typename T, typename = void>
struct enable_transferable : std::true_type {};

template <typename T>
struct enable_transferable<T, std::void_t<typename T::is_transferable>>
  : std::bool_constant<T::is_transferable::value> {};

template <typename T>
struct enable_transferable<std::reference_wrapper<T>>
  : enable_transferable<T> {};

template <typename T>
inline constexpr bool is_transferable_v =
    enable_transferable<remove_cvref_t<T>>::value;

} // namespace unipoll
