#include "warden/batch.hpp"

#include <filesystem>

namespace fs = std::filesystem;

namespace warden {

namespace {

// True when `path` lies strictly under `dir` (lexically, workspace-relative).
bool is_under(const std::string& path, const std::string& dir) {
  const fs::path p = fs::path(path).lexically_normal();
  const fs::path d = fs::path(dir).lexically_normal();
  const fs::path rel = p.lexically_relative(d);
  return !rel.empty() && rel != "." && *rel.begin() != "..";
}

}  // namespace

bool BatchResult::ok() const {
  return counts.failed == 0 && counts.rolled_back == 0 && counts.skipped == 0 && counts.not_started == 0;
}

std::string BatchResult::summary() const {
  std::string out;
  auto add = [&](std::uint32_t n, const char* label) {
    if (n == 0) return;
    if (!out.empty()) out += ", ";
    out += std::to_string(n) + " " + label;
  };
  add(counts.succeeded, "succeeded");
  add(counts.failed, "failed");
  add(counts.rolled_back, "rolled back");
  add(counts.skipped, "skipped");
  add(counts.not_started, "not started");
  return out.empty() ? "empty batch" : out;
}

BatchResult OperationBatchCoordinator::run(BatchRequest request, const StartGate& may_start) {
  BatchResult result;
  result.batch_id = request.batch_id;

  std::string gate_failure;
  for (const auto& dep : request.dependencies) {
    auto it = final_states_.find(dep);
    if (it == final_states_.end() || it->second != FinalState::succeeded) {
      gate_failure = "batch dependency " + dep + " has not succeeded";
      break;
    }
  }

  // Directories created by earlier members, by operation id.
  std::vector<std::pair<std::string, std::string>> created_dirs;
  std::vector<std::string> held_checkpoints;

  for (std::size_t i = 0; i < request.operations.size(); ++i) {
    OperationRequest op = request.operations[i];
    op.batch_id = request.batch_id;
    executor_.assign_id(op);

    std::string skip_reason = gate_failure;
    if (skip_reason.empty()) {
      std::vector<std::string> deps = op.dependencies;
      const std::string target = op.args.empty() ? std::string() : op.args[0];
      for (const auto& [dir_op, dir] : created_dirs) {
        if (!target.empty() && is_under(target, dir)) deps.push_back(dir_op);
      }
      for (const auto& dep : deps) {
        auto it = final_states_.find(dep);
        if (it == final_states_.end() || it->second != FinalState::succeeded) {
          skip_reason = "dependency " + dep + " did not succeed";
          break;
        }
      }
    }

    if (!skip_reason.empty()) {
      result.records.push_back(executor_.skip(op, skip_reason));
      ++result.counts.skipped;
    } else {
      if (may_start && !may_start()) {
        result.not_started.assign(request.operations.begin() + static_cast<std::ptrdiff_t>(i),
                                  request.operations.end());
        result.counts.not_started = static_cast<std::uint32_t>(result.not_started.size());
        break;
      }
      ExecuteOptions opts;
      opts.defer_checkpoint_discard = true;
      OperationRecord rec = executor_.execute(op, opts);
      switch (rec.final_state.value_or(FinalState::failed)) {
        case FinalState::succeeded: ++result.counts.succeeded; break;
        case FinalState::failed: ++result.counts.failed; break;
        case FinalState::rolled_back: ++result.counts.rolled_back; break;
        case FinalState::skipped: ++result.counts.skipped; break;
      }
      if (!rec.checkpoint_id.empty()) held_checkpoints.push_back(rec.checkpoint_id);
      result.records.push_back(std::move(rec));
    }

    if (op.tool_name == "create_directory" && !op.args.empty()) {
      created_dirs.emplace_back(op.operation_id, op.args[0]);
    }
  }

  for (auto it = held_checkpoints.rbegin(); it != held_checkpoints.rend(); ++it) {
    executor_.tracker().discard_rollback_point(*it);
  }
  return result;
}

}  // namespace warden
