#include "warden/executor.hpp"

#include <filesystem>
#include <optional>
#include <stdexcept>

#include "warden/observability.hpp"
#include "warden/operation_types.hpp"

namespace fs = std::filesystem;

namespace warden {

namespace {

std::string join(const std::vector<std::string>& items, const std::string& sep) {
  std::string out;
  for (std::size_t i = 0; i < items.size(); ++i) {
    if (i > 0) out += sep;
    out += items[i];
  }
  return out;
}

std::string normalized(const std::string& rel) { return fs::path(rel).lexically_normal().generic_string(); }

}  // namespace

const std::string& OperationExecutor::assign_id(OperationRequest& request) {
  if (request.operation_id.empty()) request.operation_id = "op-" + std::to_string(next_op_++);
  return request.operation_id;
}

OperationRecord OperationExecutor::begin(const OperationRequest& request) {
  OperationRecord record;
  record.operation_id = request.operation_id;
  record.batch_id = request.batch_id;
  record.tool_name = request.tool_name;
  record.args = request.args;
  record.dependencies = request.dependencies;
  record.start_time_ms = now_unix_ms();
  record.environment_state = ctx_.tracker.snapshot();
  record.phases.push_back(OperationPhase::pending);
  return record;
}

void OperationExecutor::fail_precheck(OperationRecord& record, ErrorCode code, const std::string& message) {
  record.error_code = to_string(code);
  record.result = message;
  record.important_warnings.push_back(message);
  record.warnings.push_back(message);
  record.phases.push_back(OperationPhase::failed);
  record.final_state = FinalState::failed;
  record.end_time_ms = now_unix_ms();
}

ToolResult OperationExecutor::invoke(const OperationRequest& request, const std::string& strategy) {
  ToolResult tr;
  tr.dependencies = request.dependencies;
  try {
    RawOutcome out = ctx_.tools.invoke(request.tool_name, request.args, strategy);
    tr.success = out.ok;
    tr.result = out.ok ? out.output : (out.error.empty() ? "tool reported failure" : out.error);
    tr.diagnostics = std::move(out.details);
  } catch (const std::exception& e) {
    tr.success = false;
    tr.result = std::string("fault: ") + e.what();
    tr.diagnostics["fault"] = e.what();
  } catch (...) {
    tr.success = false;
    tr.result = "fault: unknown exception";
    tr.diagnostics["fault"] = "unknown exception";
  }
  tr.diagnostics["strategy"] = strategy;
  return tr;
}

OperationRecord OperationExecutor::execute(OperationRequest request, const ExecuteOptions& opts) {
  assign_id(request);
  std::uint64_t duration_ns = 0;
  OperationRecord record;
  {
    ScopeTimer timer(duration_ns);
    record = run(std::move(request), opts);
  }
  publish(record, duration_ns);
  return record;
}

OperationRecord OperationExecutor::skip(OperationRequest request, const std::string& reason) {
  assign_id(request);
  OperationRecord record = begin(request);
  record.error_code = to_string(ErrorCode::dependency_unmet);
  record.result = "skipped: " + reason;
  record.warnings.push_back(record.result);
  record.important_warnings.push_back(record.result);
  record.phases.push_back(OperationPhase::skipped);
  record.final_state = FinalState::skipped;
  record.end_time_ms = now_unix_ms();
  publish(record, 0);
  return record;
}

OperationRecord OperationExecutor::run(OperationRequest request, const ExecuteOptions& opts) {
  OperationRecord record = begin(request);

  // ---- PRE_CHECK ----------------------------------------------------------
  record.phases.push_back(OperationPhase::pre_check);
  const OperationProfile* profile = find_profile(request.tool_name);
  if (!profile) {
    fail_precheck(record, ErrorCode::unknown_tool, "unknown tool: " + request.tool_name);
    return record;
  }
  if (request.args.size() < profile->min_args) {
    fail_precheck(record, ErrorCode::missing_input,
                  request.tool_name + " needs " + std::to_string(profile->min_args) + " argument(s), got " +
                      std::to_string(request.args.size()));
    return record;
  }
  const auto abs = profile->targets_entry ? ctx_.workspace.resolve_entry(request.args[0])
                                          : ctx_.workspace.resolve(request.args[0]);
  if (!abs) {
    fail_precheck(record, ErrorCode::path_escape, "path escapes workspace: " + request.args[0]);
    return record;
  }
  if (*abs == ctx_.workspace.root()) {
    fail_precheck(record, ErrorCode::invalid_path, "path resolves to the workspace root: " + request.args[0]);
    return record;
  }
  for (const auto& dep : request.dependencies) {
    auto it = ctx_.final_states.find(dep);
    if (it == ctx_.final_states.end() || it->second != FinalState::succeeded) {
      fail_precheck(record, ErrorCode::dependency_unmet, "dependency " + dep + " has not succeeded");
      return record;
    }
  }

  const std::string rel = normalized(ctx_.workspace.relative(*abs));
  record.pre_states[rel] = ctx_.tracker.capture(rel);

  // ---- Backup -------------------------------------------------------------
  std::map<std::string, std::string> rollback_info;
  if (profile->critical) {
    record.checkpoint_id = ctx_.tracker.push_rollback_point(record.operation_id);
    std::string err;
    rollback_info = ctx_.tracker.prepare_rollback(rel, request.tool_name, &err);
    if (rollback_info.empty()) {
      ctx_.tracker.discard_rollback_point(record.checkpoint_id);
      record.checkpoint_id.clear();
      fail_precheck(record, ErrorCode::backup_failed, "backup failed: " + err);
      return record;
    }
    ctx_.tracker.register_rollback_info(record.operation_id, rollback_info);
    for (const auto& [path, descriptor] : rollback_info) {
      if (!record.pre_states.count(path)) record.pre_states[path] = ctx_.tracker.capture(path);
    }
  }

  // ---- EXECUTING / VERIFYING / RETRY --------------------------------------
  std::optional<std::string> strategy = ctx_.retry.next_strategy(request.tool_name, record.attempts);
  std::string first_failure;
  bool verification_failed = false;
  VerificationReport accepted;
  ToolResult last;

  while (strategy) {
    if (!record.attempts.empty()) {
      record.phases.push_back(OperationPhase::retry);
      if (!rollback_info.empty()) {
        const RollbackResult reset = ctx_.tracker.restore(rollback_info);
        if (!reset.ok) {
          record.warnings.push_back("pre-retry restore incomplete: " + join(reset.unrestored, "; "));
        }
      }
    }

    record.phases.push_back(OperationPhase::executing);
    AttemptRecord attempt;
    attempt.attempt_number = static_cast<std::uint32_t>(record.attempts.size() + 1);
    attempt.strategy_name = *strategy;
    attempt.timestamp_unix_ms = now_unix_ms();

    ToolResult tr = invoke(request, *strategy);
    if (profile->critical) {
      tr.rollback_info = rollback_info;
      for (const auto& [path, descriptor] : rollback_info) tr.affected_files.insert(path);
    } else {
      tr.affected_files.insert(rel);
    }

    verification_failed = false;
    if (tr.success) {
      record.phases.push_back(OperationPhase::verifying);
      VerificationInput vin;
      vin.args = request.args;
      vin.result = &tr;
      vin.pre_state = record.pre_states[rel];
      VerificationReport report = ctx_.verifier.verify(request.tool_name, vin, *profile);
      tr.verification = report.to_map();
      tr.warnings = report.warnings;
      attempt.verification_ran = true;
      attempt.check_tally = report.tally();
      if (report.success) {
        accepted = std::move(report);
      } else {
        tr.success = false;
        tr.result = "verification failed: " + join(report.critical_failures, "; ");
        verification_failed = true;
      }
    }

    for (const auto& path : tr.affected_files) {
      auto pre = record.pre_states.find(path);
      const FileState before = pre == record.pre_states.end() ? FileState{} : pre->second;
      const std::string change = net_state_change(before, ctx_.tracker.capture(path));
      if (change != "unchanged") attempt.state_changes[path] = change;
    }

    attempt.result = tr;
    last = tr;
    record.attempts.push_back(std::move(attempt));
    if (tr.success) break;

    if (first_failure.empty()) first_failure = *strategy + ": " + tr.result;
    // A verification failure is only worth retrying when the attempt can be
    // undone from backup first.
    if (verification_failed && !profile->requires_backup) break;
    strategy = ctx_.retry.next_strategy(request.tool_name, record.attempts);
  }

  // ---- Terminal -----------------------------------------------------------
  if (last.success) {
    record.result = last.result;
    record.warnings.insert(record.warnings.end(), accepted.warnings.begin(), accepted.warnings.end());
    record.important_warnings = accepted.important_warnings;
    if (record.attempts.size() > 1) {
      const std::string w = "recovered on attempt " + std::to_string(record.attempts.size()) +
                            " with strategy " + record.attempts.back().strategy_name + " after: " + first_failure;
      record.warnings.push_back(w);
      record.important_warnings.push_back(w);
    }
    if (!record.checkpoint_id.empty() && !opts.defer_checkpoint_discard) {
      ctx_.tracker.discard_rollback_point(record.checkpoint_id);
      record.checkpoint_id.clear();
    }
    finish(record, FinalState::succeeded, last);
    return record;
  }

  record.error_code = to_string(verification_failed ? ErrorCode::verification_failed : ErrorCode::execution_fault);
  const std::string attempts_text = std::to_string(record.attempts.size()) +
                                    (record.attempts.size() == 1 ? " attempt" : " attempts");

  if (!profile->critical) {
    record.result = "failed after " + attempts_text + ": " + last.result;
    record.warnings.push_back(record.result);
    record.important_warnings.push_back(record.result);
    finish(record, FinalState::failed, last);
    return record;
  }

  // Rollback runs to completion here; cancellation is only honoured between
  // operations.
  const RollbackResult rb = ctx_.tracker.rollback_to(record.checkpoint_id);
  record.checkpoint_id.clear();
  record.result = "rolled back after " + attempts_text + ": " + last.result;
  record.warnings.push_back(record.result);
  record.important_warnings.push_back(record.result);
  if (!rb.ok) {
    record.rollback_partial = true;
    record.unrestored_paths = rb.unrestored;
    record.error_code = to_string(ErrorCode::rollback_partial);
    const std::string w = "partial rollback, not restored: " + join(rb.unrestored, "; ");
    record.warnings.push_back(w);
    record.important_warnings.push_back(w);
  }
  finish(record, FinalState::rolled_back, last);
  return record;
}

void OperationExecutor::finish(OperationRecord& record, FinalState state, const ToolResult& last) {
  ToolResult view = last;
  for (const auto& [path, st] : record.pre_states) view.affected_files.insert(path);
  ctx_.tracker.record(record.operation_id, view);
  for (const auto& path : view.affected_files) record.post_states[path] = ctx_.tracker.capture(path);

  switch (state) {
    case FinalState::succeeded: record.phases.push_back(OperationPhase::succeeded); break;
    case FinalState::failed: record.phases.push_back(OperationPhase::failed); break;
    case FinalState::rolled_back: record.phases.push_back(OperationPhase::rolled_back); break;
    case FinalState::skipped: record.phases.push_back(OperationPhase::skipped); break;
  }
  record.final_state = state;
  record.end_time_ms = now_unix_ms();
}

void OperationExecutor::publish(const OperationRecord& record, std::uint64_t duration_ns) {
  const FinalState state = record.final_state.value_or(FinalState::failed);
  ctx_.final_states[record.operation_id] = state;
  if (state != FinalState::skipped) {
    ctx_.tracker.note_outcome(record.args.empty() ? std::string() : record.args[0],
                              state == FinalState::succeeded, record.error_code);
  }
  ctx_.history.append(record);

  OperationEvent ev;
  ev.session_id = ctx_.session_id;
  ev.operation_id = record.operation_id;
  ev.batch_id = record.batch_id;
  ev.tool_name = record.tool_name;
  ev.final_state = to_string(state);
  ev.attempts = static_cast<std::uint32_t>(record.attempts.size());
  ev.ok = state == FinalState::succeeded;
  ev.error_code = record.error_code;
  ev.duration_ns = duration_ns;
  ev.rollback_partial = record.rollback_partial;
  ev.warnings = static_cast<std::uint32_t>(record.warnings.size());
  emit_operation_event(ev, ctx_.event_log_path);
}

}  // namespace warden
