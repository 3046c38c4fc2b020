#pragma once

// warden/operation_types.hpp: Static operation-type profile table.
//
// DESIGN INVARIANTS:
//   1. SINGLE SOURCE: this table is the only place criticality, backup policy,
//      retry strategies and verification strictness are declared. The
//      VerificationEngine, RetryStrategy and OperationExecutor all read it;
//      none of them hardcode per-tool policy.
//   2. IMMUTABLE: built once on first use, then shared read-only.
//   3. ORDERED STRATEGIES: strategies are listed in the order they are tried.
//      Each differs in approach, not merely in repetition.
//
// EXTENSION_POINT: pluggable_tools
//   Current: the table is compiled in and matches LocalToolPrimitive.
//   Upgrade path: allow registering profiles alongside a custom IToolPrimitive.
//   Invariant: a tool without a profile must be rejected at PRE_CHECK.

#include <cstddef>
#include <string>
#include <vector>

namespace warden {

enum class Strictness { basic, strict };

std::string to_string(Strictness s);

struct OperationProfile {
  std::string tool_name;
  std::string category;                 // file_creation, file_read, directory_ops, ...
  bool critical{false};
  bool requires_backup{false};
  std::vector<std::string> strategies;  // ordered, first is the default approach
  Strictness strictness{Strictness::basic};
  std::size_t min_args{1};              // args[0] is always the target path
  bool targets_entry{false};            // acts on the entry itself; a symlink leaf is not followed
};

// Returns nullptr for unknown tools.
const OperationProfile* find_profile(const std::string& tool_name);

const std::vector<OperationProfile>& operation_profiles();

}  // namespace warden
