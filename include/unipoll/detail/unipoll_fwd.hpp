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

namespace unipoll {

class spawner;
class local_spawner;

class waker;
class local_waker;

template <typename Spawner = spawner>
class context;

template <typename Holder, typename Spawner = spawner>
struct unsafe_future_obj;

template <typename T, typename Spawner = spawner>
class local_future_obj;

template <typename T, typename Spawner = spawner>
class future_obj;

} // namespace unipoll
