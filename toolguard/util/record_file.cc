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

#include "toolguard/util/record_file.h"

#include <fcntl.h>
#include <unistd.h>

#include <cerrno>
#include <memory>
#include <string>
#include <utility>

#include "absl/log/log.h"
#include "absl/memory/memory.h"
#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/str_cat.h"
#include "absl/synchronization/mutex.h"
#include "google/protobuf/io/coded_stream.h"
#include "google/protobuf/io/zero_copy_stream_impl.h"
#include "google/protobuf/util/delimited_message_util.h"
#include "toolguard/util/fileops.h"
#include "toolguard/util/status_macros.h"

namespace toolguard::util {

absl::StatusOr<std::unique_ptr<RecordWriter>> RecordWriter::Open(
    const std::string& path) {
  TOOLGUARD_ASSIGN_OR_RETURN(FDCloser fd, OpenForAppend(path));
  return absl::WrapUnique(new RecordWriter(path, std::move(fd)));
}

absl::Status RecordWriter::Append(const google::protobuf::MessageLite& record,
                                  bool sync) {
  // Serialize into memory first so a record is written with one write(2) and
  // concurrent appenders never interleave.
  std::string buffer;
  {
    google::protobuf::io::StringOutputStream stream(&buffer);
    if (!google::protobuf::util::SerializeDelimitedToZeroCopyStream(record,
                                                                    &stream)) {
      return absl::InternalError("failed to serialize record");
    }
  }
  absl::MutexLock lock(&mutex_);
  if (!WriteToFD(fd_.get(), buffer.data(), buffer.size())) {
    return absl::ErrnoToStatus(errno, absl::StrCat("write(", path_, ")"));
  }
  if (sync && fdatasync(fd_.get()) != 0) {
    return absl::ErrnoToStatus(errno, absl::StrCat("fdatasync(", path_, ")"));
  }
  return absl::OkStatus();
}

absl::Status RecordWriter::Sync() {
  absl::MutexLock lock(&mutex_);
  if (fdatasync(fd_.get()) != 0) {
    return absl::ErrnoToStatus(errno, absl::StrCat("fdatasync(", path_, ")"));
  }
  return absl::OkStatus();
}

absl::Status ReadRecords(
    const std::string& path,
    absl::FunctionRef<absl::Status(const std::string&)> callback) {
  int fd = TEMP_FAILURE_RETRY(open(path.c_str(), O_RDONLY | O_CLOEXEC));
  if (fd == -1) {
    if (errno == ENOENT) {
      return absl::OkStatus();
    }
    return absl::ErrnoToStatus(errno, absl::StrCat("open(", path, ")"));
  }
  FDCloser closer(fd);
  google::protobuf::io::FileInputStream input(fd);
  google::protobuf::io::CodedInputStream coded(&input);
  for (int index = 0;; ++index) {
    uint32_t size;
    if (!coded.ReadVarint32(&size)) {
      // Clean end of file.
      break;
    }
    std::string payload;
    if (!coded.ReadString(&payload, static_cast<int>(size))) {
      LOG(WARNING) << path << ": ignoring truncated record #" << index;
      break;
    }
    TOOLGUARD_RETURN_IF_ERROR(callback(payload));
  }
  if (input.GetErrno() != 0) {
    return absl::ErrnoToStatus(input.GetErrno(),
                               absl::StrCat("read(", path, ")"));
  }
  return absl::OkStatus();
}

}  // namespace toolguard::util
