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

// Implementation of the toolguard::Executor class.

#include "toolguard/sandbox/executor.h"

#include <linux/filter.h>
#include <sys/prctl.h>
#include <sys/resource.h>
#include <sys/syscall.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

#include <cerrno>
#include <csignal>
#include <cstdint>
#include <memory>
#include <new>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "absl/log/log.h"
#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/string_view.h"
#include "absl/synchronization/notification.h"
#include "absl/time/clock.h"
#include "absl/time/time.h"
#include "toolguard/capabilities.h"
#include "toolguard/lang/ast.h"
#include "toolguard/lang/interpreter.h"
#include "toolguard/lang/object.h"
#include "toolguard/lang/parser.h"
#include "toolguard/sandbox/comms.h"
#include "toolguard/sandbox/governor.h"
#include "toolguard/sandbox/limits.h"
#include "toolguard/sandbox/result.h"
#include "toolguard/sandbox/syscall_policy.h"
#include "toolguard/toolguard.pb.h"
#include "toolguard/util/thread.h"

namespace toolguard {
namespace {

// Error class a tool raises when an allocation would exceed its budget.
constexpr absl::string_view kMemoryErrorClass = "MemoryError";
// Error class reported for a return value that does not fit in one frame.
constexpr absl::string_view kResultTooLargeErrorClass = "ResultTooLargeError";

// ---------------------------------------------------------------------------
// Sandboxee side. Everything below runs in the forked child: no logging, no
// flag access, and exit only through _exit().

// Forwards ctx.<capability> calls to the host.
class ChannelInvoker : public CapabilityInvoker {
 public:
  explicit ChannelInvoker(Comms* comms) : comms_(comms) {}

  absl::StatusOr<Value> Invoke(absl::string_view name,
                               const Arguments& arguments) override {
    SandboxMessage request;
    request.mutable_call()->set_name(std::string(name));
    *request.mutable_call()->mutable_arguments() = arguments;
    if (request.ByteSizeLong() > Comms::kMaxMessageSize) {
      return ToolError("ValueError", "capability arguments are too large");
    }
    if (absl::Status status = comms_->SendMessage(request); !status.ok()) {
      return absl::InternalError("capability channel closed");
    }
    SandboxMessage reply;
    if (absl::Status status = comms_->RecvMessage(&reply); !status.ok()) {
      return absl::InternalError("capability channel closed");
    }
    if (!reply.has_reply()) {
      return absl::InternalError("unexpected message on capability channel");
    }
    switch (reply.reply().code()) {
      case CapabilityReply::OK:
        return reply.reply().value();
      case CapabilityReply::DENIED:
        return absl::PermissionDeniedError(reply.reply().message());
      default:
        return absl::UnknownError(reply.reply().message());
    }
  }

 private:
  Comms* comms_;
};

[[noreturn]] void OutOfMemory() { _exit(kSandboxeeOutOfMemoryExitCode); }

// Closes every descriptor but `keep`.
void CloseOtherDescriptors(int keep) {
#ifdef __NR_close_range
  bool closed = (keep == 0 || syscall(__NR_close_range, 0, keep - 1, 0) == 0) &&
                syscall(__NR_close_range, keep + 1, ~0U, 0) == 0;
  if (closed) {
    return;
  }
#endif
  rlimit nofile;
  rlim_t max_fd = 1024;
  if (getrlimit(RLIMIT_NOFILE, &nofile) == 0 &&
      nofile.rlim_cur != RLIM_INFINITY) {
    max_fd = nofile.rlim_cur;
  }
  for (rlim_t fd = 0; fd < max_fd; ++fd) {
    if (static_cast<int>(fd) != keep) {
      close(static_cast<int>(fd));
    }
  }
}

bool SetLimit(int resource, rlim_t soft, rlim_t hard) {
  rlimit limit;
  limit.rlim_cur = soft;
  limit.rlim_max = hard;
  return setrlimit(resource, &limit) == 0;
}

// Applies rlimits and the nice level. The address-space ceiling is relative
// to the footprint inherited from the host.
bool ApplyLimits(const Limits& limits) {
  absl::StatusOr<Governor::MemoryUsage> usage =
      Governor::ReadMemoryUsage(getpid());
  if (!usage.ok()) {
    return false;
  }
  const rlim_t address_space =
      static_cast<rlim_t>(usage->virtual_bytes) + limits.memory_limit_bytes();
  const rlim_t cpu_seconds = static_cast<rlim_t>(
      absl::ToInt64Seconds(absl::Ceil(limits.cpu_time_limit(),
                                      absl::Seconds(1))));
  if (!SetLimit(RLIMIT_AS, address_space, address_space) ||
      !SetLimit(RLIMIT_CPU, cpu_seconds, cpu_seconds + 1) ||
      !SetLimit(RLIMIT_CORE, 0, 0) || !SetLimit(RLIMIT_FSIZE, 0, 0)) {
    return false;
  }
  errno = 0;
  if (nice(limits.nice_level()) == -1 && errno != 0) {
    return false;
  }
  return true;
}

Outcome RunTool(const Node& module, const ExecutionRequest& request,
                Comms* comms) {
  ChannelInvoker invoker(comms);
  Interpreter::Options options;
  options.principal_id = request.principal_id;
  Interpreter interpreter(module, &invoker, std::move(options));
  absl::StatusOr<Value> value =
      interpreter.Run(request.tool.entry_point, request.arguments);

  Outcome outcome;
  if (value.ok()) {
    *outcome.mutable_result() = *std::move(value);
    return outcome;
  }
  ExecutionFailure* failure = outcome.mutable_failure();
  if (absl::IsPermissionDenied(value.status())) {
    failure->set_kind(ExecutionFailure::VIOLATION);
    failure->set_message(std::string(value.status().message()));
    return outcome;
  }
  std::string error_class = ToolErrorClass(value.status());
  failure->set_kind(ExecutionFailure::RUNTIME_ERROR);
  failure->set_message(error_class.empty() ? "RuntimeError" : error_class);
  failure->set_line(interpreter.error_line());
  return outcome;
}

[[noreturn]] void RunSandboxee(pid_t host_pid, const Node& module,
                               const ExecutionRequest& request,
                               const std::vector<sock_filter>& policy,
                               Comms* comms) {
  CloseOtherDescriptors(comms->fd());
  if (prctl(PR_SET_PDEATHSIG, SIGKILL) != 0 || getppid() != host_pid) {
    _exit(kSandboxeeSetupFailedExitCode);
  }
  if (!ApplyLimits(request.limits)) {
    _exit(kSandboxeeSetupFailedExitCode);
  }
  std::set_new_handler(&OutOfMemory);
  if (!SyscallPolicy::Apply(policy).ok()) {
    _exit(kSandboxeeSetupFailedExitCode);
  }

  SandboxMessage message;
  *message.mutable_outcome() = RunTool(module, request, comms);
  if (message.ByteSizeLong() > Comms::kMaxMessageSize) {
    ExecutionFailure* failure = message.mutable_outcome()->mutable_failure();
    failure->set_kind(ExecutionFailure::RUNTIME_ERROR);
    failure->set_message(std::string(kResultTooLargeErrorClass));
  }
  _exit(comms->SendMessage(message).ok() ? 0 : kSandboxeeSendFailedExitCode);
}

// ---------------------------------------------------------------------------
// Host side.

// A capability call running on its own thread. Shared with that thread so a
// handler that outlives the session writes into memory nobody reads.
struct PendingCall {
  absl::Notification done;
  absl::StatusOr<Value> value;
};

// Serves the sandboxee's channel while the Governor runs.
class ChannelSession {
 public:
  ChannelSession(const CapabilityCatalog* catalog,
                 const ExecutionRequest* request, Comms* comms,
                 absl::Time deadline)
      : catalog_(catalog),
        request_(request),
        comms_(comms),
        deadline_(deadline) {}

  absl::StatusOr<bool> OnReadable() {
    SandboxMessage message;
    absl::Status status = comms_->RecvMessage(&message, deadline_);
    if (absl::IsUnavailable(status) || absl::IsDeadlineExceeded(status)) {
      // Hung up or stalled mid-frame; the Governor sorts out the rest.
      return false;
    }
    if (!status.ok()) {
      return absl::InvalidArgumentError(status.message());
    }
    switch (message.kind_case()) {
      case SandboxMessage::kCall:
        return ServeCall(message.call());
      case SandboxMessage::kOutcome:
        outcome_ = message.outcome();
        return false;
      default:
        return absl::InvalidArgumentError("unexpected message from sandboxee");
    }
  }

  const std::optional<Outcome>& outcome() const { return outcome_; }

 private:
  absl::StatusOr<bool> ServeCall(const CapabilityCall& call) {
    const CapabilitySpec* spec = catalog_->Find(call.name());
    const CapabilityHandler* handler =
        request_->capabilities != nullptr
            ? request_->capabilities->Find(call.name())
            : nullptr;
    if (spec == nullptr || handler == nullptr) {
      return absl::PermissionDeniedError(
          absl::StrCat("capability '", call.name(), "' was not granted"));
    }
    if (spec->mutating && request_->tool.capability_class != READ_WRITE) {
      return absl::PermissionDeniedError(
          absl::StrCat("capability '", call.name(),
                       "' mutates state but the tool is read-only"));
    }
    VLOG(2) << "Serving capability call " << call.name();
    auto pending = std::make_shared<PendingCall>();
    util::Thread::StartDetachedThread(
        [pending, handler = *handler, arguments = call.arguments()] {
          pending->value = handler(arguments);
          pending->done.Notify();
        },
        "toolguard-call");
    if (!pending->done.WaitForNotificationWithDeadline(deadline_)) {
      // The Governor kills the sandboxee on its next pass. A late reply is
      // dropped with `pending`.
      LOG(WARNING) << "Capability " << call.name()
                   << " did not answer before the wall-time deadline";
      return false;
    }
    absl::StatusOr<Value> value = std::move(pending->value);

    SandboxMessage reply;
    if (value.ok()) {
      reply.mutable_reply()->set_code(CapabilityReply::OK);
      *reply.mutable_reply()->mutable_value() = *std::move(value);
    } else {
      reply.mutable_reply()->set_code(CapabilityReply::ERROR);
      reply.mutable_reply()->set_message(
          std::string(value.status().message()));
    }
    if (absl::Status status = comms_->SendMessage(reply); !status.ok()) {
      VLOG(1) << "Capability reply not delivered: " << status;
      return false;
    }
    return true;
  }

  const CapabilityCatalog* catalog_;
  const ExecutionRequest* request_;
  Comms* comms_;
  absl::Time deadline_;
  std::optional<Outcome> outcome_;
};

std::string BreachMessage(Breach breach, const Limits& limits) {
  switch (breach) {
    case Breach::kTime:
      return absl::StrCat("wall-time limit of ",
                          absl::FormatDuration(limits.wall_time_limit()),
                          " exceeded");
    case Breach::kMemory:
      return absl::StrCat("memory limit of ", limits.memory_limit_bytes(),
                          " bytes exceeded");
    case Breach::kCpu:
      return absl::StrCat("CPU-time limit of ",
                          absl::FormatDuration(limits.cpu_time_limit()),
                          " exceeded");
    case Breach::kNone:
      break;
  }
  return "";
}

void SetFromOutcome(const Outcome& outcome, const Limits& limits,
                    Result* result) {
  if (outcome.has_result()) {
    result->set_value(outcome.result());
    result->SetExitStatusCode(Result::OK, Result::NO_REASON);
    return;
  }
  const ExecutionFailure& failure = outcome.failure();
  if (failure.kind() == ExecutionFailure::VIOLATION) {
    result->set_message(failure.message());
    result->SetExitStatusCode(Result::VIOLATION,
                              Result::VIOLATION_CAPABILITY);
    return;
  }
  if (failure.message() == kMemoryErrorClass) {
    result->set_message(BreachMessage(Breach::kMemory, limits));
    result->SetExitStatusCode(Result::MEMORY_EXCEEDED,
                              Result::MEMORY_ALLOCATION_FAILED);
    return;
  }
  result->set_message(failure.message());
  result->set_error_line(failure.line());
  result->SetExitStatusCode(Result::RUNTIME_ERROR, Result::NO_REASON);
}

void SetFromTermination(const Termination& termination, const Limits& limits,
                        Result* result) {
  switch (termination.breach) {
    case Breach::kTime:
      result->set_message(BreachMessage(Breach::kTime, limits));
      result->SetExitStatusCode(Result::TIMEOUT, Result::NO_REASON);
      return;
    case Breach::kMemory:
      result->set_message(BreachMessage(Breach::kMemory, limits));
      result->SetExitStatusCode(
          Result::MEMORY_EXCEEDED,
          termination.reaped && WIFEXITED(termination.wait_status)
              ? Result::MEMORY_ALLOCATION_FAILED
              : Result::MEMORY_RSS_SAMPLE);
      return;
    case Breach::kCpu:
      result->set_message(BreachMessage(Breach::kCpu, limits));
      result->SetExitStatusCode(Result::CPU_EXCEEDED, Result::CPU_RLIMIT);
      return;
    case Breach::kNone:
      break;
  }
  const int status = termination.wait_status;
  if (WIFSIGNALED(status) && WTERMSIG(status) == SIGSYS) {
    result->set_message("disallowed system call");
    result->SetExitStatusCode(Result::VIOLATION, Result::VIOLATION_SYSCALL);
    return;
  }
  if (WIFEXITED(status) &&
      WEXITSTATUS(status) == kSandboxeeSetupFailedExitCode) {
    result->set_message("sandboxee setup failed");
    result->SetExitStatusCode(Result::SETUP_ERROR, Result::FAILED_POLICY);
    return;
  }
  if (WIFEXITED(status) &&
      WEXITSTATUS(status) == kSandboxeeSendFailedExitCode) {
    result->set_message("outcome could not be delivered");
    result->SetExitStatusCode(Result::RUNTIME_ERROR, Result::NO_REASON);
    return;
  }
  result->set_message(
      WIFSIGNALED(status)
          ? absl::StrCat("terminated by signal ", WTERMSIG(status))
          : absl::StrCat("exited with code ", WEXITSTATUS(status),
                         " without an outcome"));
  result->SetExitStatusCode(Result::VIOLATION, Result::VIOLATION_CRASH);
}

}  // namespace

Result Executor::Execute(const ExecutionRequest& request) const {
  Result result;
  absl::StatusOr<NodePtr> module = Parse(request.source);
  if (!module.ok()) {
    LOG(ERROR) << "Validated source failed to parse: " << module.status();
    result.set_message("source does not parse");
    result.SetExitStatusCode(Result::SETUP_ERROR, Result::NO_REASON);
    return result;
  }
  absl::StatusOr<std::pair<Comms, Comms>> channel = Comms::CreatePair();
  if (!channel.ok()) {
    LOG(ERROR) << "Could not create the comms channel: " << channel.status();
    result.SetExitStatusCode(Result::SETUP_ERROR, Result::FAILED_COMMS);
    return result;
  }
  Comms host_comms = std::move(channel->first);
  Comms sandboxee_comms = std::move(channel->second);
  const std::vector<sock_filter> policy =
      SyscallPolicy(sandboxee_comms.fd()).GetPolicy();

  const pid_t host_pid = getpid();
  const pid_t pid = fork();
  if (pid == -1) {
    PLOG(ERROR) << "fork()";
    result.SetExitStatusCode(Result::SETUP_ERROR, Result::FAILED_FORK);
    return result;
  }
  if (pid == 0) {
    RunSandboxee(host_pid, **module, request, policy, &sandboxee_comms);
  }
  sandboxee_comms.Terminate();
  VLOG(1) << "Started sandboxee PID " << pid << " for entry point "
          << request.tool.entry_point;

  const absl::Time deadline = absl::Now() + request.limits.wall_time_limit();
  ChannelSession session(catalog_, &request, &host_comms, deadline);
  Governor governor(pid, request.limits);
  Termination termination =
      governor.Run(&host_comms, [&session] { return session.OnReadable(); });
  host_comms.Terminate();

  *result.GetRUsage() = termination.usage;
  result.set_wall_time(termination.wall_time);
  result.set_peak_memory_bytes(termination.peak_memory_bytes);

  if (!termination.internal_status.ok()) {
    result.set_message(std::string(termination.internal_status.message()));
    result.SetExitStatusCode(Result::INTERNAL_ERROR, Result::FAILED_WAIT);
  } else if (!termination.channel_status.ok()) {
    result.set_message(std::string(termination.channel_status.message()));
    result.SetExitStatusCode(
        Result::VIOLATION, absl::IsPermissionDenied(termination.channel_status)
                               ? Result::VIOLATION_CAPABILITY
                               : Result::VIOLATION_PROTOCOL);
  } else if (session.outcome().has_value()) {
    SetFromOutcome(*session.outcome(), request.limits, &result);
  } else {
    SetFromTermination(termination, request.limits, &result);
  }
  VLOG(1) << "Sandboxee PID " << pid << " finished: " << result.ToString();
  return result;
}

}  // namespace toolguard
