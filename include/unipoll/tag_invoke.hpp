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
#include <unipoll/type_traits.hpp>

namespace unipoll {
  namespace _tag_invoke {
    void tag_invoke();

    struct _fn {
      template <typename CPO, typename... Args>
      constexpr auto operator()(CPO cpo, Args&&... args) const
          noexcept(noexcept(tag_invoke((CPO &&) cpo, (Args &&) args...)))
          -> decltype(tag_invoke((CPO &&) cpo, (Args &&) args...)) {
        return tag_invoke((CPO &&) cpo, (Args &&) args...);
      }
    };

    template <typename CPO, typename... Args>
    using tag_invoke_result_t = decltype(
        tag_invoke(UNIPOLL_DECLVAL(CPO &&), UNIPOLL_DECLVAL(Args &&)...));

    using yes_type = char;
    using no_type = char(&)[2];

    template <typename CPO,
              typename... Args,
              typename = tag_invoke_result_t<CPO, Args...>>
    yes_type try_tag_invoke(int);

    template <typename CPO, typename... Args>
    no_type try_tag_invoke(...);

    namespace _cpo {
      inline constexpr _fn tag_invoke{};
    }
  } // namespace _tag_invoke
  using namespace _tag_invoke::_cpo;

  template <auto& CPO>
  using tag_t = remove_cvref_t<decltype(CPO)>;

  template <typename CPO, typename... Args>
  inline constexpr bool is_tag_invocable_v =
      (sizeof(_tag_invoke::try_tag_invoke<CPO, Args...>(0)) ==
       sizeof(_tag_invoke::yes_type));
} // namespace unipoll
