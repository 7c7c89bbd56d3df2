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

#include "toolguard/util/fileops.h"

#include <unistd.h>

#include <string>

#include "gmock/gmock.h"
#include "gtest/gtest.h"
#include "absl/status/status.h"
#include "absl/strings/str_cat.h"
#include "absl/time/clock.h"
#include "absl/time/time.h"
#include "toolguard/util/status_matchers.h"

namespace toolguard::util {
namespace {

using ::testing::Eq;
using ::testing::IsFalse;
using ::testing::IsTrue;

std::string TempPath() {
  return absl::StrCat(::testing::TempDir(), "/fileops-",
                      absl::ToUnixNanos(absl::Now()));
}

TEST(FileOpsTest, AppendedDataCanBeReadBack) {
  const std::string path = TempPath();
  for (const char* chunk : {"hello ", "world"}) {
    TOOLGUARD_ASSERT_OK_AND_ASSIGN(FDCloser fd, OpenForAppend(path));
    ASSERT_THAT(WriteToFD(fd.get(), chunk, std::string(chunk).size()),
                IsTrue());
  }
  EXPECT_THAT(ReadWholeFile(path), IsOkAndHolds(Eq("hello world")));
}

TEST(FileOpsTest, MissingFileIsNotFound) {
  EXPECT_THAT(ReadWholeFile(TempPath()),
              StatusIs(absl::StatusCode::kNotFound));
}

TEST(FileOpsTest, ReadWithDeadlineReportsStalledPeer) {
  int fds[2];
  ASSERT_THAT(pipe(fds), Eq(0));
  FDCloser reader(fds[0]);
  FDCloser writer(fds[1]);
  char buffer[4];
  EXPECT_THAT(ReadFromFDWithDeadline(reader.get(), buffer, sizeof(buffer),
                                     absl::Now() + absl::Milliseconds(50)),
              StatusIs(absl::StatusCode::kDeadlineExceeded));

  ASSERT_THAT(WriteToFD(writer.get(), "ab", 2), IsTrue());
  writer.Close();
  EXPECT_THAT(ReadFromFDWithDeadline(reader.get(), buffer, sizeof(buffer),
                                     absl::Now() + absl::Seconds(5)),
              StatusIs(absl::StatusCode::kUnavailable));
}

TEST(FileOpsTest, CloserReleasesOwnership) {
  int fds[2];
  ASSERT_THAT(pipe(fds), Eq(0));
  FDCloser closer(fds[0]);
  EXPECT_THAT(closer.Release(), Eq(fds[0]));
  EXPECT_THAT(closer.is_valid(), IsFalse());
  EXPECT_THAT(close(fds[0]), Eq(0));
  EXPECT_THAT(close(fds[1]), Eq(0));
}

}  // namespace
}  // namespace toolguard::util
