// Copyright 2024 Google LLC
//
// Licensed under the Apache License, Version 2.0 (the "License");
// you may not use this file except in compliance with the License.
// You may obtain a copy of the License at
//
//     https://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing, software
// distributed under the License is distributed on an "AS IS" BASIS,
// WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
// See the License for the specific language governing permissions and
// limitations under the License.

#ifndef TOOLGUARD_UTIL_THREAD_H_
#define TOOLGUARD_UTIL_THREAD_H_

#include <pthread.h>

#include <string>
#include <thread>
#include <utility>

#include "absl/functional/any_invocable.h"
#include "absl/strings/string_view.h"

namespace toolguard::util {

// Joinable thread with an optional kernel-visible name (truncated to 15
// characters).
class Thread {
 public:
  static void StartDetachedThread(absl::AnyInvocable<void() &&> functor,
                                  absl::string_view name = "") {
    Thread thread(std::move(functor), name);
    thread.thread_.detach();
  }

  Thread() = default;

  Thread(const Thread&) = delete;
  Thread& operator=(const Thread&) = delete;

  Thread(Thread&&) = default;
  Thread& operator=(Thread&&) = default;

  explicit Thread(absl::AnyInvocable<void() &&> functor,
                  absl::string_view name = "")
      : thread_([functor = std::move(functor),
                 name = std::string(name.substr(0, 15))]() mutable {
          if (!name.empty()) {
            pthread_setname_np(pthread_self(), name.c_str());
          }
          std::move(functor)();
        }) {}

  template <class CL>
  Thread(CL* ptr, void (CL::*ptr_to_member)(), absl::string_view name = "")
      : Thread([ptr, ptr_to_member]() { (ptr->*ptr_to_member)(); }, name) {}

  void Join() { thread_.join(); }

  bool IsJoinable() const { return thread_.joinable(); }

 private:
  std::thread thread_;
};

}  // namespace toolguard::util

#endif  // TOOLGUARD_UTIL_THREAD_H_
