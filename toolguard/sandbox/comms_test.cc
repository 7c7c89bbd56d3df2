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

#include "toolguard/sandbox/comms.h"

#include <sys/socket.h>

#include <cstdint>
#include <memory>
#include <utility>

#include "gmock/gmock.h"
#include "gtest/gtest.h"
#include "absl/status/status.h"
#include "absl/time/clock.h"
#include "absl/time/time.h"
#include "toolguard/toolguard.pb.h"
#include "toolguard/util/status_matchers.h"

namespace toolguard {
namespace {

using ::testing::Eq;
using ::testing::IsFalse;
using ::testing::IsTrue;

class CommsTest : public ::testing::Test {
 protected:
  void SetUp() override {
    TOOLGUARD_ASSERT_OK_AND_ASSIGN(auto pair, Comms::CreatePair());
    host_ = std::make_unique<Comms>(std::move(pair.first));
    sandboxee_ = std::make_unique<Comms>(std::move(pair.second));
  }

  std::unique_ptr<Comms> host_;
  std::unique_ptr<Comms> sandboxee_;
};

TEST_F(CommsTest, DeliversCapabilityCall) {
  SandboxMessage sent;
  sent.mutable_call()->set_name("list_meals");
  (*sent.mutable_call()->mutable_arguments()->mutable_keyword())["limit"]
      .set_int_value(3);
  TOOLGUARD_ASSERT_OK(sandboxee_->SendMessage(sent));

  TOOLGUARD_ASSERT_OK_AND_ASSIGN(bool readable,
                                 host_->WaitReadable(absl::Seconds(1)));
  EXPECT_THAT(readable, IsTrue());
  SandboxMessage received;
  TOOLGUARD_ASSERT_OK(host_->RecvMessage(&received));
  ASSERT_THAT(received.has_call(), IsTrue());
  EXPECT_THAT(received.call().name(), Eq("list_meals"));
  EXPECT_THAT(received.call().arguments().keyword().at("limit").int_value(),
              Eq(3));
}

TEST_F(CommsTest, IdleChannelIsNotReadable) {
  TOOLGUARD_ASSERT_OK_AND_ASSIGN(bool readable,
                                 host_->WaitReadable(absl::Milliseconds(10)));
  EXPECT_THAT(readable, IsFalse());
}

TEST_F(CommsTest, PeerHangupIsUnavailable) {
  sandboxee_->Terminate();
  SandboxMessage message;
  EXPECT_THAT(host_->RecvMessage(&message, absl::Now() + absl::Seconds(1)),
              StatusIs(absl::StatusCode::kUnavailable));
  EXPECT_THAT(host_->RecvMessage(&message),
              StatusIs(absl::StatusCode::kUnavailable));
  EXPECT_THAT(host_->SendMessage(message),
              StatusIs(absl::StatusCode::kUnavailable));
}

TEST_F(CommsTest, StalledFrameHitsDeadline) {
  // Half of a frame header.
  const char partial[] = {0x02, 0x01};
  ASSERT_THAT(send(sandboxee_->fd(), partial, sizeof(partial), 0),
              Eq(static_cast<ssize_t>(sizeof(partial))));
  SandboxMessage message;
  EXPECT_THAT(
      host_->RecvMessage(&message, absl::Now() + absl::Milliseconds(50)),
      StatusIs(absl::StatusCode::kDeadlineExceeded));
}

TEST_F(CommsTest, RejectsForeignTags) {
  const uint32_t header[] = {0x1234, 0};
  ASSERT_THAT(send(sandboxee_->fd(), header, sizeof(header), 0),
              Eq(static_cast<ssize_t>(sizeof(header))));
  SandboxMessage message;
  EXPECT_THAT(host_->RecvMessage(&message),
              StatusIs(absl::StatusCode::kDataLoss));
}

TEST_F(CommsTest, TerminatedChannelFailsFast) {
  host_->Terminate();
  EXPECT_THAT(host_->IsTerminated(), IsTrue());
  SandboxMessage message;
  EXPECT_THAT(host_->SendMessage(message),
              StatusIs(absl::StatusCode::kFailedPrecondition));
}

}  // namespace
}  // namespace toolguard
