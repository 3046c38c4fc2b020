#pragma once

// warden/batch.hpp: All-or-nothing critical-path semantics for a group of
// operations that share a batch_id.
//
// DESIGN INVARIANTS:
//   1. GATE: if any batch-level dependency has not succeeded, every member is
//      SKIPPED and no tool is invoked.
//   2. NO ORPHAN WRITES: a member whose dependency (explicit, or implicit: its
//      target lies under a directory created by an earlier member) did not
//      succeed is SKIPPED, never executed.
//   3. INDEPENDENCE: members with no failed dependency still run.
//   4. CHECKPOINT LIFETIME: rollback points of succeeded members are held
//      until the batch ends, then discarded. A failing member rolls back only
//      its own changes.

#include <cstdint>
#include <functional>
#include <map>
#include <string>
#include <vector>

#include "warden/executor.hpp"
#include "warden/types.hpp"

namespace warden {

struct BatchRequest {
  std::string batch_id;
  std::vector<std::string> dependencies;
  std::vector<OperationRequest> operations;
};

struct BatchCounts {
  std::uint32_t succeeded{0};
  std::uint32_t failed{0};
  std::uint32_t rolled_back{0};
  std::uint32_t skipped{0};
  std::uint32_t not_started{0};
};

struct BatchResult {
  std::string batch_id;
  std::vector<OperationRecord> records;
  std::vector<OperationRequest> not_started;  // cut off by the session
  BatchCounts counts;

  bool ok() const;
  // e.g. "1 rolled back, 1 skipped". "empty batch" when nothing ran.
  std::string summary() const;
};

class OperationBatchCoordinator {
 public:
  // Called before each member that would invoke a tool. Returning false stops
  // the batch; remaining members are reported in not_started.
  using StartGate = std::function<bool()>;

  OperationBatchCoordinator(OperationExecutor& executor,
                            const std::map<std::string, FinalState>& final_states)
      : executor_(executor), final_states_(final_states) {}

  BatchResult run(BatchRequest request, const StartGate& may_start = nullptr);

 private:
  OperationExecutor& executor_;
  const std::map<std::string, FinalState>& final_states_;
};

}  // namespace warden
