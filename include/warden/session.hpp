#pragma once

// warden/session.hpp: Bounded session loop and end-of-session review.
//
// DESIGN INVARIANTS (must not be broken):
//   1. ISOLATION: every run() builds a fresh tracker, history session log and
//      final-state table. Nothing is shared between sessions except the
//      content-addressed backup store, whose keys are content hashes.
//   2. MUTUAL EXCLUSION: one session per workspace and per state dir at a
//      time, enforced by process-wide mutexes held for the whole run().
//   3. HARD CEILING: at most max_operations operation starts per session.
//      Reaching it is a termination reason, not an error.
//   4. CANCELLATION BETWEEN OPERATIONS: the token is checked only before an
//      operation starts; a running verification or rollback always finishes.
//   5. PURE REVIEW: build_review() is a projection over sealed records and
//      never touches the filesystem.
//
// EXTENSION_POINT: multi_process_locking
//   Current: the session mutexes are in-process only.
//   Upgrade path: take an flock() on <state_dir>/session.lock alongside them.

#include <atomic>
#include <cstdint>
#include <map>
#include <memory>
#include <string>
#include <variant>
#include <vector>

#include "warden/batch.hpp"
#include "warden/cas.hpp"
#include "warden/config.hpp"
#include "warden/tools.hpp"
#include "warden/types.hpp"
#include "warden/workspace.hpp"

namespace warden {

class CancellationToken {
 public:
  void cancel() { cancelled_.store(true, std::memory_order_release); }
  bool cancelled() const { return cancelled_.load(std::memory_order_acquire); }

 private:
  std::atomic<bool> cancelled_{false};
};

enum class TerminationReason { completed, operation_limit_reached, cancelled, rejected };

std::string to_string(TerminationReason r);

using PlanStep = std::variant<OperationRequest, BatchRequest>;

struct SessionPlan {
  std::string goal;
  std::vector<PlanStep> steps;
};

std::string describe_step(const PlanStep& step);

struct ReviewChange {
  std::string operation_id;
  std::string batch_id;
  std::string tool_name;
  std::vector<std::string> files;
  std::string final_state;
  std::string verification;  // "passed" | "failed" | "not run"
  std::uint64_t attempts{0};
  std::string line;
};

struct SessionReview {
  std::string session_id;
  std::string goal;
  std::vector<std::string> plan_steps;
  std::uint32_t planned{0};
  std::uint32_t executed{0};
  std::uint32_t succeeded{0};
  std::uint32_t failed{0};
  std::uint32_t rolled_back{0};
  std::uint32_t skipped{0};
  std::uint32_t not_started{0};
  std::vector<ReviewChange> changes;
  std::map<std::string, std::string> environment_changes;  // path -> net change
  std::map<std::string, CheckTally> verification_totals;   // category -> tally
  std::vector<std::string> warnings;
  std::vector<std::string> partial_rollbacks;
  std::vector<std::string> follow_ups;
  std::vector<std::string> not_started_operations;
  TerminationReason termination{TerminationReason::completed};

  std::string to_json() const;
};

struct SessionOutcome {
  TerminationReason termination{TerminationReason::completed};
  SessionReview review;
  std::vector<OperationRecord> records;
  bool all_succeeded{false};
};

// Projection over sealed records. `suggestions` come from the tracker.
SessionReview build_review(const SessionPlan& plan, const std::vector<OperationRecord>& records,
                           const std::vector<std::string>& not_started, TerminationReason termination,
                           const std::vector<std::string>& suggestions);

class SessionLoop {
 public:
  // `tools` defaults to a LocalToolPrimitive over the configured workspace.
  explicit SessionLoop(SessionConfig config, std::unique_ptr<IToolPrimitive> tools = nullptr);

  // Replace the backup store (e.g. with a lossy one in tests). Not owned.
  void set_backup_store(ICASBackend* backend) { backups_override_ = backend; }

  SessionOutcome run(const SessionPlan& plan, const CancellationToken* cancel = nullptr);

  const SessionConfig& config() const { return config_; }
  const Workspace& workspace() const { return workspace_; }

 private:
  SessionConfig config_;
  Workspace workspace_;
  CasStore cas_;
  ICASBackend* backups_override_{nullptr};
  std::unique_ptr<IToolPrimitive> tools_;
  std::uint64_t sessions_run_{0};
};

}  // namespace warden
