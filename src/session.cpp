#include "warden/session.hpp"

#include <algorithm>
#include <filesystem>
#include <mutex>

#include "warden/environment.hpp"
#include "warden/executor.hpp"
#include "warden/history.hpp"
#include "warden/jsonlite.hpp"
#include "warden/retry.hpp"
#include "warden/verification.hpp"
#include "warden/version.hpp"

namespace fs = std::filesystem;

namespace warden {

namespace {

// Process-wide registry of per-workspace and per-state-dir locks. Entries are
// never erased so a mutex outlives every session that locked it.
std::shared_ptr<std::mutex> named_mutex(const std::string& root) {
  static std::mutex registry_mu;
  static std::map<std::string, std::shared_ptr<std::mutex>> registry;
  std::lock_guard<std::mutex> lk(registry_mu);
  auto& slot = registry[root];
  if (!slot) slot = std::make_shared<std::mutex>();
  return slot;
}

void write_string(std::string& out, const std::string& s) { out += '"' + jsonlite::escape(s) + '"'; }

void write_array(std::string& out, const std::vector<std::string>& items) {
  out += '[';
  for (std::size_t i = 0; i < items.size(); ++i) {
    if (i > 0) out += ',';
    write_string(out, items[i]);
  }
  out += ']';
}

std::string verification_status(const OperationRecord& r) {
  if (r.attempts.empty()) return "not run";
  const AttemptRecord& last = r.attempts.back();
  if (!last.verification_ran) return "not run";
  auto it = last.check_tally.find("critical");
  const bool critical_ok = it == last.check_tally.end() || it->second.failed == 0;
  return critical_ok ? "passed" : "failed";
}

std::string request_label(const OperationRequest& op) {
  std::string label = op.operation_id.empty() ? op.tool_name : op.operation_id + " " + op.tool_name;
  if (!op.args.empty()) label += " " + op.args[0];
  return label;
}

}  // namespace

std::string to_string(TerminationReason r) {
  switch (r) {
    case TerminationReason::completed: return "completed";
    case TerminationReason::operation_limit_reached: return "operation_limit_reached";
    case TerminationReason::cancelled: return "cancelled";
    case TerminationReason::rejected: return "rejected";
  }
  return "";
}

std::string describe_step(const PlanStep& step) {
  if (const auto* op = std::get_if<OperationRequest>(&step)) return request_label(*op);
  const auto& batch = std::get<BatchRequest>(step);
  return "batch " + batch.batch_id + " (" + std::to_string(batch.operations.size()) + " operations)";
}

// ---------------------------------------------------------------------------
// Review
// ---------------------------------------------------------------------------

SessionReview build_review(const SessionPlan& plan, const std::vector<OperationRecord>& records,
                           const std::vector<std::string>& not_started, TerminationReason termination,
                           const std::vector<std::string>& suggestions) {
  SessionReview rv;
  rv.goal = plan.goal;
  rv.termination = termination;
  for (const auto& step : plan.steps) {
    rv.plan_steps.push_back(describe_step(step));
    if (const auto* batch = std::get_if<BatchRequest>(&step)) {
      rv.planned += static_cast<std::uint32_t>(batch->operations.size());
    } else {
      ++rv.planned;
    }
  }

  std::map<std::string, FileState> first_pre;
  std::map<std::string, FileState> last_post;

  for (const auto& r : records) {
    const FinalState state = r.final_state.value_or(FinalState::failed);
    switch (state) {
      case FinalState::succeeded: ++rv.succeeded; break;
      case FinalState::failed: ++rv.failed; break;
      case FinalState::rolled_back: ++rv.rolled_back; break;
      case FinalState::skipped: ++rv.skipped; break;
    }
    if (state != FinalState::skipped) ++rv.executed;

    ReviewChange c;
    c.operation_id = r.operation_id;
    c.batch_id = r.batch_id;
    c.tool_name = r.tool_name;
    for (const auto& [path, st] : r.post_states) c.files.push_back(path);
    if (c.files.empty() && !r.args.empty()) c.files.push_back(r.args[0]);
    c.final_state = to_string(state);
    c.verification = verification_status(r);
    c.attempts = r.attempts.size();
    c.line = r.operation_id + " " + r.tool_name + " " + (r.args.empty() ? std::string() : r.args[0]) +
             " -> " + c.final_state + " (verification " + c.verification + ", " +
             std::to_string(c.attempts) + (c.attempts == 1 ? " attempt)" : " attempts)");
    rv.changes.push_back(std::move(c));

    for (const auto& [path, st] : r.pre_states) first_pre.emplace(path, st);
    for (const auto& [path, st] : r.post_states) last_post[path] = st;

    for (const auto& a : r.attempts) {
      for (const auto& [category, tally] : a.check_tally) {
        rv.verification_totals[category].passed += tally.passed;
        rv.verification_totals[category].failed += tally.failed;
      }
    }

    for (const auto& w : r.warnings) rv.warnings.push_back(r.operation_id + ": " + w);

    if (r.rollback_partial) {
      for (const auto& p : r.unrestored_paths) rv.partial_rollbacks.push_back(r.operation_id + ": " + p);
      rv.follow_ups.push_back("Inspect " + std::to_string(r.unrestored_paths.size()) +
                              " unrestored path(s) left by " + r.operation_id);
    }
    if (state == FinalState::rolled_back || state == FinalState::failed) {
      rv.follow_ups.push_back("Retry " + r.tool_name + " " + (r.args.empty() ? std::string() : r.args[0]) +
                              " after addressing " + r.error_code);
    }
  }

  for (const auto& [path, after] : last_post) {
    auto it = first_pre.find(path);
    const std::string change = net_state_change(it == first_pre.end() ? FileState{} : it->second, after);
    if (change != "unchanged") rv.environment_changes[path] = change;
  }

  rv.not_started_operations = not_started;
  rv.not_started = static_cast<std::uint32_t>(not_started.size());
  if (rv.skipped > 0) {
    rv.follow_ups.push_back("Re-plan " + std::to_string(rv.skipped) + " skipped operation(s) once their dependencies succeed");
  }
  if (termination == TerminationReason::operation_limit_reached) {
    rv.follow_ups.push_back("Continue in a new session: " + std::to_string(rv.not_started) +
                            " operation(s) not started");
  }
  rv.follow_ups.insert(rv.follow_ups.end(), suggestions.begin(), suggestions.end());
  return rv;
}

std::string SessionReview::to_json() const {
  std::string out;
  out.reserve(2048);
  out += "{\"review_version\":" + std::to_string(version::REVIEW_FORMAT_VERSION);
  out += ",\"session_id\":";
  write_string(out, session_id);
  out += ",\"goal\":";
  write_string(out, goal);
  out += ",\"termination\":\"" + to_string(termination) + "\"";
  out += ",\"plan_steps\":";
  write_array(out, plan_steps);
  out += ",\"counts\":{\"planned\":" + std::to_string(planned) + ",\"executed\":" + std::to_string(executed) +
         ",\"succeeded\":" + std::to_string(succeeded) + ",\"failed\":" + std::to_string(failed) +
         ",\"rolled_back\":" + std::to_string(rolled_back) + ",\"skipped\":" + std::to_string(skipped) +
         ",\"not_started\":" + std::to_string(not_started) + "}";

  out += ",\"changes\":[";
  for (std::size_t i = 0; i < changes.size(); ++i) {
    const auto& c = changes[i];
    if (i > 0) out += ',';
    out += "{\"operation_id\":";
    write_string(out, c.operation_id);
    out += ",\"batch_id\":";
    write_string(out, c.batch_id);
    out += ",\"tool\":";
    write_string(out, c.tool_name);
    out += ",\"files\":";
    write_array(out, c.files);
    out += ",\"final_state\":\"" + c.final_state + "\",\"verification\":\"" + c.verification +
           "\",\"attempts\":" + std::to_string(c.attempts) + ",\"line\":";
    write_string(out, c.line);
    out += '}';
  }
  out += ']';

  out += ",\"environment_changes\":{";
  bool first = true;
  for (const auto& [path, change] : environment_changes) {
    if (!first) out += ',';
    first = false;
    write_string(out, path);
    out += ":\"" + change + "\"";
  }
  out += '}';

  out += ",\"verification\":{";
  first = true;
  for (const auto& [category, tally] : verification_totals) {
    if (!first) out += ',';
    first = false;
    out += "\"" + category + "\":{\"passed\":" + std::to_string(tally.passed) +
           ",\"failed\":" + std::to_string(tally.failed) + "}";
  }
  out += '}';

  out += ",\"warnings\":";
  write_array(out, warnings);
  out += ",\"partial_rollbacks\":";
  write_array(out, partial_rollbacks);
  out += ",\"follow_ups\":";
  write_array(out, follow_ups);
  out += ",\"not_started_operations\":";
  write_array(out, not_started_operations);
  out += '}';
  return out;
}

// ---------------------------------------------------------------------------
// SessionLoop
// ---------------------------------------------------------------------------

SessionLoop::SessionLoop(SessionConfig config, std::unique_ptr<IToolPrimitive> tools)
    : config_(std::move(config)),
      workspace_(config_.workspace_root),
      cas_(config_.cas_root()),
      tools_(std::move(tools)) {
  if (!tools_) tools_ = std::make_unique<LocalToolPrimitive>(workspace_);
}

SessionOutcome SessionLoop::run(const SessionPlan& plan, const CancellationToken* cancel) {
  SessionOutcome outcome;
  const std::string session_id =
      "s-" + std::to_string(now_unix_ms()) + "-" + std::to_string(++sessions_run_);

  std::vector<std::string> config_errors = check_session_config(config_);
  if (!workspace_.valid()) config_errors.push_back("workspace root is not usable: " + config_.workspace_root);
  if (!config_errors.empty()) {
    outcome.termination = TerminationReason::rejected;
    outcome.review = build_review(plan, {}, {}, TerminationReason::rejected, {});
    outcome.review.session_id = session_id;
    for (const auto& e : config_errors) outcome.review.warnings.push_back(to_string(ErrorCode::config_invalid) + ": " + e);
    return outcome;
  }

  // Sessions on different workspaces may still share a state dir, and with it
  // the backup store whose objects the tracker prunes.
  std::error_code ec;
  const fs::path state_root = fs::weakly_canonical(fs::absolute(config_.state_dir, ec), ec);
  const std::shared_ptr<std::mutex> ws_mu = named_mutex("workspace:" + workspace_.root().string());
  const std::shared_ptr<std::mutex> state_mu = named_mutex("state:" + state_root.string());
  std::scoped_lock session_lock(*ws_mu, *state_mu);

  ICASBackend& backups = backups_override_ ? *backups_override_ : static_cast<ICASBackend&>(cas_);
  EnvironmentStateTracker tracker(workspace_, backups, config_.backup_compression);
  tracker.capture_workspace();
  HistoryManager history(config_.history_path());
  std::map<std::string, FinalState> final_states;
  const VerificationEngine verifier(workspace_);
  const RetryStrategy retry(config_.max_attempts);

  OperationExecutor executor(ExecutionContext{workspace_, *tools_, verifier, retry, tracker, history,
                                              final_states, session_id, config_.event_log_path});
  OperationBatchCoordinator batches(executor, final_states);

  TerminationReason termination = TerminationReason::completed;
  std::uint32_t started = 0;
  auto may_start = [&]() -> bool {
    if (cancel && cancel->cancelled()) {
      termination = TerminationReason::cancelled;
      return false;
    }
    if (started >= config_.max_operations) {
      termination = TerminationReason::operation_limit_reached;
      return false;
    }
    ++started;
    return true;
  };

  std::vector<std::string> not_started;
  for (const auto& step : plan.steps) {
    if (termination != TerminationReason::completed) {
      if (const auto* op = std::get_if<OperationRequest>(&step)) {
        not_started.push_back(request_label(*op));
      } else {
        for (const auto& op : std::get<BatchRequest>(step).operations) not_started.push_back(request_label(op));
      }
      continue;
    }

    if (const auto* op = std::get_if<OperationRequest>(&step)) {
      if (!may_start()) {
        not_started.push_back(request_label(*op));
        continue;
      }
      executor.execute(*op);
      continue;
    }

    BatchResult br = batches.run(std::get<BatchRequest>(step), may_start);
    for (const auto& op : br.not_started) not_started.push_back(request_label(op));
  }

  outcome.termination = termination;
  outcome.records = history.records();
  outcome.review = build_review(plan, outcome.records, not_started, termination, tracker.suggestions());
  outcome.review.session_id = session_id;
  if (history.durable().failure_count() > 0) {
    outcome.review.warnings.push_back("history log: " + std::to_string(history.durable().failure_count()) +
                                      " entr" + (history.durable().failure_count() == 1 ? "y" : "ies") +
                                      " could not be written to " + config_.history_path());
  }
  outcome.all_succeeded = termination == TerminationReason::completed && not_started.empty() &&
                          std::all_of(outcome.records.begin(), outcome.records.end(),
                                      [](const OperationRecord& r) { return r.succeeded(); });
  history.end_session();
  return outcome;
}

}  // namespace warden
