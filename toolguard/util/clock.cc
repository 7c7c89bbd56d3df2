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

#include "toolguard/util/clock.h"

#include "absl/base/no_destructor.h"
#include "absl/time/clock.h"
#include "absl/time/time.h"

namespace toolguard::util {
namespace {

class WallClock : public Clock {
 public:
  absl::Time Now() override { return absl::Now(); }
};

}  // namespace

Clock* Clock::RealClock() {
  static absl::NoDestructor<WallClock> clock;
  return clock.get();
}

}  // namespace toolguard::util
