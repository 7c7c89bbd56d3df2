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

// Append-only files of length-delimited protobuf records. Used for the
// security event log and the tool registry journal.

#ifndef TOOLGUARD_UTIL_RECORD_FILE_H_
#define TOOLGUARD_UTIL_RECORD_FILE_H_

#include <memory>
#include <string>
#include <utility>

#include "absl/base/thread_annotations.h"
#include "absl/functional/function_ref.h"
#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/str_cat.h"
#include "absl/synchronization/mutex.h"
#include "google/protobuf/message_lite.h"
#include "toolguard/util/fileops.h"

namespace toolguard::util {

class RecordWriter {
 public:
  static absl::StatusOr<std::unique_ptr<RecordWriter>> Open(
      const std::string& path);

  RecordWriter(const RecordWriter&) = delete;
  RecordWriter& operator=(const RecordWriter&) = delete;

  // Appends one record. With `sync` set, the call returns only after the
  // record reached stable storage.
  absl::Status Append(const google::protobuf::MessageLite& record, bool sync);

  // Forces previously appended records to stable storage.
  absl::Status Sync();

  const std::string& path() const { return path_; }

 private:
  RecordWriter(std::string path, FDCloser fd)
      : path_(std::move(path)), fd_(std::move(fd)) {}

  const std::string path_;
  absl::Mutex mutex_;
  FDCloser fd_ ABSL_GUARDED_BY(mutex_);
};

// Reads every record from `path`, calling `callback` with each serialized
// payload. A missing file yields no records. A truncated trailing record (torn
// write) is ignored with a warning; any other corruption is an error.
absl::Status ReadRecords(const std::string& path,
                         absl::FunctionRef<absl::Status(const std::string&)>
                             callback);

// Typed convenience wrapper around ReadRecords().
template <typename Proto>
absl::Status ReadRecordsAs(const std::string& path,
                           absl::FunctionRef<absl::Status(Proto)> callback) {
  return ReadRecords(path, [&](const std::string& payload) -> absl::Status {
    Proto record;
    if (!record.ParseFromString(payload)) {
      return absl::DataLossError(
          absl::StrCat("unparsable record in ", path));
    }
    return callback(std::move(record));
  });
}

}  // namespace toolguard::util

#endif  // TOOLGUARD_UTIL_RECORD_FILE_H_
