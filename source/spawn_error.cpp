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
#include <unipoll/spawn_error.hpp>

#include <ostream>

namespace unipoll {

const char* spawn_error_kind::name() const noexcept {
  switch (code_) {
    case code_t::shutdown:
      return "shutdown";
  }
  UNIPOLL_ASSUME_UNREACHABLE;
}

std::ostream& operator<<(std::ostream& os, spawn_error_kind kind) {
  return os << "spawn_error_kind(\"" << kind.name() << "\")";
}

} // namespace unipoll
