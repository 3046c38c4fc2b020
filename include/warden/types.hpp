#pragma once

// warden/types.hpp: Core data structures for the Warden side-effect engine.
//
// ARCHITECTURE NOTES:
//
// OWNERSHIP:
//   - ToolResult, AttemptRecord, OperationRecord and HistoryEntry are value types.
//     Every component returns them by value; no borrowed references escape.
//   - EnvironmentState is owned by EnvironmentStateTracker for the duration of a
//     session. snapshot() hands out copies, never references into live state.
//
// LIFECYCLE:
//   - OperationRecord is created by OperationExecutor when an operation begins,
//     appended to once per attempt, and sealed when final_state is set. After
//     sealing it is never mutated; HistoryManager condenses it into a
//     HistoryEntry for the durable log.
//   - HistoryEntry is immutable once written (see history.hpp).
//
// CONCURRENCY NOTES:
//   - Operations execute strictly sequentially within a session. None of these
//     types carry internal synchronization.
//
// EXTENSION_POINT: structured_rollback_descriptors
//   Current: rollback_info values are compact strings ("absent", "dir",
//   "cas:<digest>:<octal-permissions>").
//   Upgrade path: replace with a tagged struct once descriptors carry more than
//   one payload (e.g. xattrs, ownership). Invariant: descriptors must stay
//   restorable by pure copy-back from the backup store, no replay logic.

#include <cstdint>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <variant>
#include <vector>

namespace warden {

enum class ErrorCode {
  none,
  json_parse_error,
  json_duplicate_key,
  path_escape,
  invalid_path,
  missing_input,
  unknown_tool,
  dependency_unmet,
  execution_fault,
  verification_failed,
  backup_failed,
  rollback_partial,
  schema_mismatch,
  cas_integrity_failed,
  hash_unavailable_blake3,
  session_limit_reached,
  cancelled,
  config_invalid,
};

std::string to_string(ErrorCode code);

// Wall-clock milliseconds since the Unix epoch.
std::uint64_t now_unix_ms();

// ---------------------------------------------------------------------------
// Verification values
// ---------------------------------------------------------------------------
// A single check yields a boolean, an unsigned measure (sizes) or a string
// (hashes, octal permissions, detected encodings).
using CheckValue = std::variant<bool, std::uint64_t, std::string>;
using CheckGroup = std::map<std::string, CheckValue>;
using VerificationMap = std::map<std::string, CheckGroup>;

std::string check_value_to_json(const CheckValue& v);
std::string verification_to_json(const VerificationMap& m);

// Pass/fail tally for one check category within a verification report.
struct CheckTally {
  std::uint32_t passed{0};
  std::uint32_t failed{0};
};

// ---------------------------------------------------------------------------
// ToolResult: uniform outcome envelope for one tool invocation attempt.
// ---------------------------------------------------------------------------
// INVARIANTS:
//   1. success == false implies result describes the failure cause.
//   2. For critical operation types, rollback_info is populated whenever
//      affected_files is non-empty.
struct ToolResult {
  bool success{false};
  std::string result;
  VerificationMap verification;
  std::map<std::string, std::string> diagnostics;
  std::vector<std::string> dependencies;
  std::set<std::string> affected_files;
  std::vector<std::string> warnings;
  std::map<std::string, std::string> rollback_info;
};

std::string tool_result_to_json(const ToolResult& r);

// ---------------------------------------------------------------------------
// File and workspace state
// ---------------------------------------------------------------------------
struct FileState {
  std::string path;                 // workspace-relative, generic separators
  bool exists{false};
  bool is_directory{false};
  std::uint64_t size{0};
  std::string hash;                 // BLAKE3 hex of content; empty for dirs/absent
  std::string permissions;          // three octal digits, e.g. "644"
  std::uint32_t owner{0};           // uid
  std::uint64_t last_verified_at_ms{0};
};

std::string file_state_to_json(const FileState& s);

struct WorkspaceState {
  std::string root;
  bool root_valid{false};
  std::uint64_t free_bytes{0};
  std::uint32_t uid{0};
  std::uint32_t gid{0};
};

struct EnvironmentState {
  WorkspaceState workspace;
  std::map<std::string, FileState> file_states;
  std::vector<std::string> operation_sequence;
  std::vector<std::string> rollback_points;  // checkpoint ids, oldest first
};

// ---------------------------------------------------------------------------
// Operation lifecycle
// ---------------------------------------------------------------------------
enum class FinalState { succeeded, failed, rolled_back, skipped };

enum class OperationPhase {
  pending,
  pre_check,
  executing,
  verifying,
  retry,
  succeeded,
  rolled_back,
  failed,
  skipped,
};

std::string to_string(FinalState s);
std::string to_string(OperationPhase p);

// One requested tool invocation. operation_id may be left empty; the executor
// assigns a session-unique id.
struct OperationRequest {
  std::string operation_id;
  std::string tool_name;
  std::vector<std::string> args;
  std::vector<std::string> dependencies;
  std::string batch_id;
};

struct AttemptRecord {
  std::uint32_t attempt_number{0};
  std::string strategy_name;
  ToolResult result;
  std::uint64_t timestamp_unix_ms{0};
  std::map<std::string, std::string> state_changes;  // path -> created|modified|deleted
  bool verification_ran{false};
  std::map<std::string, CheckTally> check_tally;     // category -> tally
};

struct OperationRecord {
  std::string operation_id;
  std::string batch_id;
  std::uint64_t start_time_ms{0};
  std::uint64_t end_time_ms{0};
  std::string tool_name;
  std::vector<std::string> args;
  std::vector<std::string> dependencies;
  EnvironmentState environment_state;  // snapshot at start
  std::vector<AttemptRecord> attempts;
  std::vector<OperationPhase> phases;  // transitions in order, for diagnostics
  std::optional<FinalState> final_state;
  std::string error_code;
  std::string result;                  // final human-readable outcome
  std::vector<std::string> warnings;
  std::vector<std::string> important_warnings;
  std::map<std::string, FileState> pre_states;
  std::map<std::string, FileState> post_states;
  std::string checkpoint_id;           // set while a checkpoint is still held
  bool rollback_partial{false};
  std::vector<std::string> unrestored_paths;

  bool sealed() const { return final_state.has_value(); }
  bool succeeded() const { return final_state == FinalState::succeeded; }
};

// ---------------------------------------------------------------------------
// HistoryEntry: durable, condensed record. Never mutated after append().
// ---------------------------------------------------------------------------
struct HistoryEntry {
  std::uint64_t sequence{0};
  std::string previous_digest;
  std::string operation_id;
  std::string batch_id;
  std::string tool_name;
  std::string summary;
  std::vector<std::string> files_affected;
  bool success{false};
  std::string final_state;
  std::uint64_t attempt_count{0};
  std::vector<std::string> important_warnings;
  std::map<std::string, std::string> state_changes;  // net diff
  std::uint64_t timestamp_unix_ms{0};
};

}  // namespace warden
