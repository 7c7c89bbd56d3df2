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

// Host <-> sandboxee channel. Messages are protobufs framed as TLV records
// (tag, length, value) over a connected AF_UNIX stream socket pair.
//
// The sandboxee side of the channel runs under the syscall filter and only
// ever reads and writes its descriptor, so nothing in here may log, allocate
// descriptors or poll on that side.

#ifndef TOOLGUARD_SANDBOX_COMMS_H_
#define TOOLGUARD_SANDBOX_COMMS_H_

#include <cstddef>
#include <cstdint>
#include <utility>

#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/time/time.h"
#include "google/protobuf/message_lite.h"
#include "toolguard/util/fileops.h"

namespace toolguard {

class Comms {
 public:
  static constexpr uint32_t kTagProto = 0x80000102;
  // Upper bound on a single message; larger frames are a protocol error.
  static constexpr size_t kMaxMessageSize = size_t{8} << 20;

  // Takes ownership of an already connected descriptor.
  explicit Comms(util::FDCloser fd) : fd_(std::move(fd)) {}

  Comms(Comms&&) = default;
  Comms& operator=(Comms&&) = default;

  // Creates a connected pair; the first end is meant for the host.
  static absl::StatusOr<std::pair<Comms, Comms>> CreatePair();

  int fd() const { return fd_.get(); }
  bool IsTerminated() const { return !fd_.is_valid(); }

  absl::Status SendMessage(const google::protobuf::MessageLite& message);

  // Blocks until a whole message arrives. With a finite deadline the read
  // fails with DeadlineExceeded when the peer stalls mid-frame.
  absl::Status RecvMessage(google::protobuf::MessageLite* message,
                           absl::Time deadline = absl::InfiniteFuture());

  // Waits up to `timeout` for the channel to become readable (data or EOF).
  absl::StatusOr<bool> WaitReadable(absl::Duration timeout);

  // Closes the descriptor. Further calls fail with FailedPrecondition.
  void Terminate() { fd_.Close(); }

 private:
  struct InternalTLV {
    uint32_t tag;
    uint32_t length;
  };

  util::FDCloser fd_;
};

}  // namespace toolguard

#endif  // TOOLGUARD_SANDBOX_COMMS_H_
