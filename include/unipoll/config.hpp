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

#include <cassert>

#if __GNUG__ && !__clang__
#define UNIPOLL_NO_UNIQUE_ADDRESS [[no_unique_address]]
#else
#define UNIPOLL_NO_UNIQUE_ADDRESS
#endif

// UNIPOLL_NO_EXCEPTIONS is defined to 1 when compiling without exception
// support and to 0 otherwise. The build may force it either way.
#ifndef UNIPOLL_NO_EXCEPTIONS
#if defined(__cpp_exceptions) || defined(__EXCEPTIONS) || defined(_CPPUNWIND)
#define UNIPOLL_NO_EXCEPTIONS 0
#else
#define UNIPOLL_NO_EXCEPTIONS 1
#endif
#endif

#if UNIPOLL_NO_EXCEPTIONS
#define UNIPOLL_TRY if (true)
#define UNIPOLL_CATCH(...) else if (false)
#define UNIPOLL_RETHROW() ((void)0)
#else
#define UNIPOLL_TRY try
#define UNIPOLL_CATCH(...) catch (__VA_ARGS__)
#define UNIPOLL_RETHROW() throw
#endif

#if defined(_MSC_VER) && !defined(__clang__)
#define UNIPOLL_ASSUME_UNREACHABLE __assume(0)
#else
#define UNIPOLL_ASSUME_UNREACHABLE __builtin_unreachable()
#endif

#ifndef UNIPOLL_ASSERT
#define UNIPOLL_ASSERT(...) assert((__VA_ARGS__))
#endif
