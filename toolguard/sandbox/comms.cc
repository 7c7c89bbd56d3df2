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

#include <poll.h>
#include <sys/socket.h>

#include <algorithm>
#include <cerrno>
#include <cstdint>
#include <string>
#include <utility>

#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/str_cat.h"
#include "absl/time/time.h"
#include "google/protobuf/message_lite.h"
#include "toolguard/util/fileops.h"
#include "toolguard/util/status_macros.h"

namespace toolguard {
namespace {

absl::Status ReadExactly(int fd, char* data, size_t size,
                         absl::Time deadline) {
  if (deadline == absl::InfiniteFuture()) {
    if (!util::ReadFromFD(fd, data, size)) {
      return absl::UnavailableError("comms channel closed");
    }
    return absl::OkStatus();
  }
  return util::ReadFromFDWithDeadline(fd, data, size, deadline);
}

// Like util::WriteToFD() but a vanished peer is an error, not a SIGPIPE.
bool SendFully(int fd, const char* data, size_t size) {
  while (size > 0) {
    ssize_t sent = send(fd, data, size, MSG_NOSIGNAL);
    if (sent == -1 && errno == EINTR) {
      continue;
    }
    if (sent <= 0) {
      return false;
    }
    data += sent;
    size -= sent;
  }
  return true;
}

}  // namespace

absl::StatusOr<std::pair<Comms, Comms>> Comms::CreatePair() {
  int fds[2];
  if (socketpair(AF_UNIX, SOCK_STREAM | SOCK_CLOEXEC, 0, fds) == -1) {
    return absl::ErrnoToStatus(errno, "socketpair");
  }
  return std::make_pair(Comms(util::FDCloser(fds[0])),
                        Comms(util::FDCloser(fds[1])));
}

absl::Status Comms::SendMessage(const google::protobuf::MessageLite& message) {
  if (IsTerminated()) {
    return absl::FailedPreconditionError("comms channel terminated");
  }
  std::string payload;
  if (!message.SerializeToString(&payload)) {
    return absl::InternalError("failed to serialize message");
  }
  if (payload.size() > kMaxMessageSize) {
    return absl::ResourceExhaustedError(
        absl::StrCat("message of ", payload.size(),
                     " bytes exceeds the comms limit"));
  }
  InternalTLV tlv = {kTagProto, static_cast<uint32_t>(payload.size())};
  if (!SendFully(fd(), reinterpret_cast<const char*>(&tlv), sizeof(tlv)) ||
      !SendFully(fd(), payload.data(), payload.size())) {
    return absl::UnavailableError("comms channel closed");
  }
  return absl::OkStatus();
}

absl::Status Comms::RecvMessage(google::protobuf::MessageLite* message,
                                absl::Time deadline) {
  if (IsTerminated()) {
    return absl::FailedPreconditionError("comms channel terminated");
  }
  InternalTLV tlv;
  TOOLGUARD_RETURN_IF_ERROR(ReadExactly(
      fd(), reinterpret_cast<char*>(&tlv), sizeof(tlv), deadline));
  if (tlv.tag != kTagProto) {
    return absl::DataLossError(
        absl::StrCat("unexpected comms tag 0x", absl::Hex(tlv.tag)));
  }
  if (tlv.length > kMaxMessageSize) {
    return absl::DataLossError(
        absl::StrCat("comms frame of ", tlv.length, " bytes is too large"));
  }
  std::string payload(tlv.length, '\0');
  TOOLGUARD_RETURN_IF_ERROR(
      ReadExactly(fd(), payload.data(), payload.size(), deadline));
  if (!message->ParseFromString(payload)) {
    return absl::DataLossError("unparsable comms message");
  }
  return absl::OkStatus();
}

absl::StatusOr<bool> Comms::WaitReadable(absl::Duration timeout) {
  if (IsTerminated()) {
    return absl::FailedPreconditionError("comms channel terminated");
  }
  pollfd pfd = {.fd = fd(), .events = POLLIN};
  const int timeout_msec = static_cast<int>(std::max<int64_t>(
      0, absl::ToInt64Milliseconds(timeout)));
  int ret;
  do {
    ret = poll(&pfd, 1, timeout_msec);
  } while (ret == -1 && errno == EINTR);
  if (ret == -1) {
    return absl::ErrnoToStatus(errno, "poll");
  }
  return ret > 0;
}

}  // namespace toolguard
