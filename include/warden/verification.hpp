#pragma once

// warden/verification.hpp: Post-condition checks run after every tool call.
//
// DESIGN INVARIANTS:
//   1. READ-ONLY: verify() only inspects paths (stat, read, access). It never
//      writes, renames or changes permissions on anything it inspects.
//   2. LAYERED VERDICT: checks fall into critical / content / security /
//      quality categories. Only a failed critical check fails the report; any
//      other failure becomes a warning.
//   3. STRICTNESS: basic runs critical + content; strict runs all four.
//      Strictness comes from the operation profile, never from the call site.
//   4. FIXED SCHEMAS: write_file reports four named groups; every other tool
//      reports one flat "checks" group (see to_map()).
//
// EXTENSION_POINT: language_linters
//   Current: quality checks use lightweight heuristics (bracket balance,
//   trailing whitespace, line length) and a strict parse for .json.
//   Upgrade path: dispatch per extension to an external linter through the
//   IToolPrimitive boundary. Invariant: quality failures stay non-fatal.

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include "warden/operation_types.hpp"
#include "warden/types.hpp"
#include "warden/workspace.hpp"

namespace warden {

enum class CheckCategory { critical, content, security, quality };

std::string to_string(CheckCategory c);

struct Check {
  std::string group;          // schema group the check is reported under
  std::string name;
  CheckCategory category{CheckCategory::critical};
  CheckValue value{false};
  bool passed{true};
  std::string message;        // set when !passed
  bool user_relevant{false};  // surfaced in important_warnings / history
};

struct VerificationInput {
  std::vector<std::string> args;      // args[0] is the workspace-relative target
  const ToolResult* result{nullptr};  // the attempt being verified
  std::optional<FileState> pre_state; // target state before the operation
};

struct VerificationReport {
  std::string tool_name;
  bool success{true};
  std::vector<Check> checks;
  std::vector<std::string> warnings;
  std::vector<std::string> important_warnings;
  std::vector<std::string> critical_failures;

  VerificationMap to_map() const;
  std::map<std::string, CheckTally> tally() const;  // keyed by category name
};

class VerificationEngine {
 public:
  explicit VerificationEngine(const Workspace& workspace) : workspace_(workspace) {}

  VerificationReport verify(const std::string& tool_name,
                            const VerificationInput& input,
                            const OperationProfile& profile) const;

 private:
  const Workspace& workspace_;
};

// Extensions that receive quality checks under strict verification.
bool is_code_file(const std::string& path);

}  // namespace warden
