#pragma once

// warden/executor.hpp: Per-operation state machine.
//
//   PENDING -> PRE_CHECK -> EXECUTING -> VERIFYING -> (RETRY -> EXECUTING)*
//           -> SUCCEEDED | ROLLED_BACK | FAILED
//
// DESIGN INVARIANTS (must not be broken):
//   1. FAULT ISOLATION: a std::exception from the tool primitive becomes a
//      failed attempt with diagnostics["fault"]. Nothing escapes execute().
//   2. PRE_CHECK NEVER INVOKES: unknown tools, missing arguments, path escapes
//      and unmet dependencies fail before the primitive is called.
//   3. BACKUP BEFORE MUTATION: a critical operation holds a rollback point and
//      journaled rollback_info before its first attempt. If the backup cannot
//      be taken the operation fails with backup_failed and nothing runs.
//   4. CLEAN RETRIES: rollback_info is restored before every retry, so each
//      strategy starts from the pre-operation state.
//   5. NO FAILED-WITH-DIRT: a critical operation that exhausts its retries is
//      rolled back. A rollback that cannot restore everything is reported
//      (rollback_partial + unrestored_paths), never hidden.
//   6. ONE RECOVERY WARNING: success after retries adds exactly one warning
//      naming the first failure mode.
//   7. SEAL ONCE: every returned record is sealed, recorded in the tracker,
//      appended to history and emitted as one OperationEvent.
//
// EXTENSION_POINT: attempt_timeouts
//   Current: primitive calls are assumed to be bounded by the collaborator.
//   Upgrade path: run invoke() under a deadline and convert expiry into an
//   execution fault. Invariant: a timed-out attempt is still retried, never
//   treated as a session abort.

#include <cstdint>
#include <map>
#include <string>

#include "warden/environment.hpp"
#include "warden/history.hpp"
#include "warden/retry.hpp"
#include "warden/tools.hpp"
#include "warden/types.hpp"
#include "warden/verification.hpp"
#include "warden/workspace.hpp"

namespace warden {

// Everything an executor needs from the owning session. All references must
// outlive the executor.
struct ExecutionContext {
  const Workspace& workspace;
  IToolPrimitive& tools;
  const VerificationEngine& verifier;
  const RetryStrategy& retry;
  EnvironmentStateTracker& tracker;
  HistoryManager& history;
  std::map<std::string, FinalState>& final_states;
  std::string session_id;
  std::string event_log_path;
};

struct ExecuteOptions {
  // Keep the rollback point of a succeeded critical operation; the caller
  // (batch coordinator) discards it later.
  bool defer_checkpoint_discard{false};
};

class OperationExecutor {
 public:
  explicit OperationExecutor(ExecutionContext ctx) : ctx_(std::move(ctx)) {}

  OperationRecord execute(OperationRequest request, const ExecuteOptions& opts = {});

  // Seal an operation as SKIPPED without running anything.
  OperationRecord skip(OperationRequest request, const std::string& reason);

  // Assigns "op-N" when operation_id is empty. Returns the id.
  const std::string& assign_id(OperationRequest& request);

  EnvironmentStateTracker& tracker() { return ctx_.tracker; }

 private:
  OperationRecord run(OperationRequest request, const ExecuteOptions& opts);
  OperationRecord begin(const OperationRequest& request);
  void fail_precheck(OperationRecord& record, ErrorCode code, const std::string& message);
  ToolResult invoke(const OperationRequest& request, const std::string& strategy);
  void finish(OperationRecord& record, FinalState state, const ToolResult& last);
  void publish(const OperationRecord& record, std::uint64_t duration_ns);

  ExecutionContext ctx_;
  std::uint64_t next_op_{1};
};

}  // namespace warden
