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

// Command line front end for toolguard.
//
// Example usage:
//   toolguard_tool --source=adder.py --args='[2, 3]'
//     --toolguard_wall_time_limit=1s --toolguard_audit_log_path=/tmp/audit.log
//   toolguard_tool --source=note.py --approve_as=alice
//     --toolguard_audit_memory_only
//   toolguard_tool --dump_audit_log=/tmp/audit.log

#include <cstdlib>
#include <iostream>
#include <memory>
#include <string>
#include <utility>
#include <vector>

#include "absl/flags/flag.h"
#include "absl/flags/parse.h"
#include "absl/flags/usage.h"
#include "absl/log/initialize.h"
#include "absl/log/log.h"
#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "google/protobuf/struct.pb.h"
#include "toolguard/audit/audit_log.h"
#include "toolguard/capabilities.h"
#include "toolguard/service/tool_service.h"
#include "toolguard/toolguard.pb.h"
#include "toolguard/tools/cli_util.h"
#include "toolguard/util/clock.h"
#include "toolguard/util/fileops.h"
#include "toolguard/util/status_macros.h"

ABSL_FLAG(std::string, source, "", "File holding the tool source");
ABSL_FLAG(std::string, name, "", "Tool name (defaults to the entry point)");
ABSL_FLAG(std::string, principal, "cli", "Principal the tool runs for");
ABSL_FLAG(std::string, args, "[]", "Positional arguments as a JSON array");
ABSL_FLAG(std::string, kwargs, "{}", "Keyword arguments as a JSON object");
ABSL_FLAG(std::string, approve_as, "",
          "Operator that approves the tool if it needs approval");
ABSL_FLAG(std::string, dump_audit_log, "",
          "Print the security events of this audit log file and exit");

namespace {

absl::Status DumpAuditLog(const std::string& path) {
  TOOLGUARD_ASSIGN_OR_RETURN(std::vector<toolguard::SecurityEvent> events,
                             toolguard::AuditLog::ReadEventFile(path));
  for (const toolguard::SecurityEvent& event : events) {
    TOOLGUARD_ASSIGN_OR_RETURN(std::string line,
                               toolguard::cli::PrintJson(event));
    std::cout << line << "\n";
  }
  return absl::OkStatus();
}

absl::StatusOr<std::string> RunTool() {
  TOOLGUARD_ASSIGN_OR_RETURN(
      std::string source,
      toolguard::util::ReadWholeFile(absl::GetFlag(FLAGS_source)));
  TOOLGUARD_ASSIGN_OR_RETURN(
      toolguard::Arguments arguments,
      toolguard::cli::ParseArguments(absl::GetFlag(FLAGS_args),
                                     absl::GetFlag(FLAGS_kwargs)));

  // The command line grants no collaborator operations.
  toolguard::CapabilityCatalog catalog;
  TOOLGUARD_ASSIGN_OR_RETURN(
      std::unique_ptr<toolguard::ToolService> service,
      toolguard::ToolService::Create(toolguard::ToolService::Options::FromFlags(),
                                     &catalog,
                                     toolguard::util::Clock::RealClock()));
  const std::string principal = absl::GetFlag(FLAGS_principal);
  TOOLGUARD_ASSIGN_OR_RETURN(
      toolguard::ToolDefinition tool,
      service->RegisterTool(principal, source, absl::GetFlag(FLAGS_name)));
  LOG(INFO) << "Registered " << tool.name() << " as " << tool.tool_id();
  if (const std::string reviewer = absl::GetFlag(FLAGS_approve_as);
      tool.status() == toolguard::PENDING_APPROVAL && !reviewer.empty()) {
    TOOLGUARD_ASSIGN_OR_RETURN(tool,
                               service->ApproveTool(tool.tool_id(), reviewer));
  }

  toolguard::InvokeRequest request;
  request.tool_id = tool.tool_id();
  request.principal_id = principal;
  request.arguments = std::move(arguments);
  TOOLGUARD_ASSIGN_OR_RETURN(toolguard::Value value,
                             service->InvokeTool(request));
  TOOLGUARD_ASSIGN_OR_RETURN(google::protobuf::Value json,
                             toolguard::cli::ValueToJson(value));
  return toolguard::cli::PrintJson(json);
}

}  // namespace

int main(int argc, char* argv[]) {
  absl::SetProgramUsageMessage(
      "Validates a tool, runs it in the sandbox and prints its JSON result.");
  absl::ParseCommandLine(argc, argv);
  absl::InitializeLog();

  if (const std::string path = absl::GetFlag(FLAGS_dump_audit_log);
      !path.empty()) {
    if (absl::Status status = DumpAuditLog(path); !status.ok()) {
      LOG(ERROR) << "Cannot dump " << path << ": " << status;
      return toolguard::cli::kExitInternal;
    }
    return toolguard::cli::kExitOk;
  }
  if (absl::GetFlag(FLAGS_source).empty()) {
    std::cerr << "--source or --dump_audit_log is required\n";
    return toolguard::cli::kExitInternal;
  }

  absl::StatusOr<std::string> result = RunTool();
  if (result.ok()) {
    std::cout << *result << "\n";
    return toolguard::cli::kExitOk;
  }
  const int code = toolguard::cli::ExitCode(result.status());
  if (code == toolguard::cli::kExitInternal) {
    LOG(ERROR) << "toolguard failed: " << result.status();
  } else {
    std::cerr << toolguard::cli::DescribeError(result.status()) << "\n";
  }
  return code;
}
