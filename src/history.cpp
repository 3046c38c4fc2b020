#include "warden/history.hpp"

#include <cstdio>
#include <filesystem>
#include <fstream>
#include <mutex>

#include "warden/hash.hpp"
#include "warden/jsonlite.hpp"
#include "warden/version.hpp"

namespace fs = std::filesystem;

namespace warden {

namespace {

const std::string kGenesisDigest(64, '0');

void write_array(std::string& out, const std::vector<std::string>& items) {
  out += '[';
  for (std::size_t i = 0; i < items.size(); ++i) {
    if (i > 0) out += ',';
    out += '"' + jsonlite::escape(items[i]) + '"';
  }
  out += ']';
}

std::string last_nonempty_line(const std::string& path) {
  std::ifstream ifs(path, std::ios::binary);
  std::string line, last;
  while (std::getline(ifs, line)) {
    if (!line.empty()) last = line;
  }
  return last;
}

std::string target_of(const OperationRecord& r) { return r.args.empty() ? std::string() : r.args[0]; }

}  // namespace

// ---------------------------------------------------------------------------
// HistoryEntry <-> JSON
// ---------------------------------------------------------------------------

std::string history_entry_to_json(const HistoryEntry& e) {
  std::string out;
  out.reserve(512);
  out += "{\"v\":" + std::to_string(version::HISTORY_LOG_VERSION);
  out += ",\"seq\":" + std::to_string(e.sequence);
  out += ",\"prev\":\"" + e.previous_digest + "\"";
  out += ",\"operation_id\":\"" + jsonlite::escape(e.operation_id) + "\"";
  out += ",\"batch_id\":\"" + jsonlite::escape(e.batch_id) + "\"";
  out += ",\"tool\":\"" + jsonlite::escape(e.tool_name) + "\"";
  out += ",\"summary\":\"" + jsonlite::escape(e.summary) + "\"";
  out += ",\"files_affected\":";
  write_array(out, e.files_affected);
  out += ",\"success\":";
  out += e.success ? "true" : "false";
  out += ",\"final_state\":\"" + e.final_state + "\"";
  out += ",\"attempt_count\":" + std::to_string(e.attempt_count);
  out += ",\"important_warnings\":";
  write_array(out, e.important_warnings);
  out += ",\"state_changes\":{";
  bool first = true;
  for (const auto& [path, change] : e.state_changes) {
    if (!first) out += ',';
    first = false;
    out += '"' + jsonlite::escape(path) + "\":\"" + change + '"';
  }
  out += "},\"timestamp_unix_ms\":" + std::to_string(e.timestamp_unix_ms) + "}";
  return out;
}

std::optional<HistoryEntry> history_entry_from_json(const std::string& line, std::string* error) {
  std::optional<jsonlite::JsonError> err;
  const auto obj = jsonlite::parse(line, &err);
  if (err) {
    if (error) *error = err->code + ": " + err->message;
    return std::nullopt;
  }
  const auto compat = version::check_history_log_version(
      static_cast<std::uint32_t>(jsonlite::get_u64(obj, "v")));
  if (!compat.ok) {
    if (error) *error = compat.description;
    return std::nullopt;
  }
  HistoryEntry e;
  e.sequence = jsonlite::get_u64(obj, "seq");
  e.previous_digest = jsonlite::get_string(obj, "prev");
  e.operation_id = jsonlite::get_string(obj, "operation_id");
  e.batch_id = jsonlite::get_string(obj, "batch_id");
  e.tool_name = jsonlite::get_string(obj, "tool");
  e.summary = jsonlite::get_string(obj, "summary");
  e.files_affected = jsonlite::get_string_array(obj, "files_affected");
  e.success = jsonlite::get_bool(obj, "success");
  e.final_state = jsonlite::get_string(obj, "final_state");
  e.attempt_count = jsonlite::get_u64(obj, "attempt_count");
  e.important_warnings = jsonlite::get_string_array(obj, "important_warnings");
  e.state_changes = jsonlite::get_string_map(obj, "state_changes");
  e.timestamp_unix_ms = jsonlite::get_u64(obj, "timestamp_unix_ms");
  return e;
}

std::string net_state_change(const FileState& before, const FileState& after) {
  if (!before.exists && after.exists) return "created";
  if (before.exists && !after.exists) return "deleted";
  if (!before.exists && !after.exists) return "unchanged";
  if (before.is_directory != after.is_directory || before.hash != after.hash ||
      before.permissions != after.permissions) {
    return "modified";
  }
  return "unchanged";
}

// ---------------------------------------------------------------------------
// ImmutableHistoryLog
// ---------------------------------------------------------------------------

struct ImmutableHistoryLog::Impl {
  std::mutex mu;
  FILE* file{nullptr};
  std::uint64_t seq{0};
  std::uint64_t entry_count{0};
  std::uint64_t failure_count{0};
  std::string last_digest{kGenesisDigest};
};

ImmutableHistoryLog::ImmutableHistoryLog(const std::string& path)
    : path_(path), impl_(std::make_unique<Impl>()) {
  if (path_.empty()) return;

  // Resume the chain from whatever the file already holds.
  const std::string tail = last_nonempty_line(path_);
  if (!tail.empty()) {
    if (auto prev = history_entry_from_json(tail)) impl_->seq = prev->sequence;
    impl_->last_digest = history_chain_hash(tail);
  }

  std::error_code ec;
  const fs::path parent = fs::path(path_).parent_path();
  if (!parent.empty()) fs::create_directories(parent, ec);
  impl_->file = std::fopen(path_.c_str(), "a");
}

ImmutableHistoryLog::~ImmutableHistoryLog() {
  if (impl_ && impl_->file) std::fclose(impl_->file);
}

bool ImmutableHistoryLog::append(HistoryEntry& entry) {
  std::lock_guard<std::mutex> lk(impl_->mu);

  entry.sequence = impl_->seq + 1;
  entry.previous_digest = impl_->last_digest;
  const std::string line = history_entry_to_json(entry);

  if (path_.empty()) {
    // Durable log disabled: keep the chain in memory only.
    impl_->seq = entry.sequence;
    impl_->last_digest = history_chain_hash(line);
    return true;
  }
  if (!impl_->file) {
    ++impl_->failure_count;
    return false;
  }

  // INV-1 ENFORCEMENT: always write at the end, whatever the stream position.
  std::fseek(impl_->file, 0, SEEK_END);
  const long pre_write_pos = std::ftell(impl_->file);
  if (pre_write_pos < 0) {
    ++impl_->failure_count;
    return false;
  }

  const std::string final_line = line + "\n";
  const bool written =
      std::fwrite(final_line.data(), 1, final_line.size(), impl_->file) == final_line.size() &&
      std::fflush(impl_->file) == 0;
  if (!written) {
    ++impl_->failure_count;
    return false;
  }

  impl_->seq = entry.sequence;
  impl_->last_digest = history_chain_hash(line);
  ++impl_->entry_count;
  return true;
}

std::uint64_t ImmutableHistoryLog::entry_count() const {
  std::lock_guard<std::mutex> lk(impl_->mu);
  return impl_->entry_count;
}

std::uint64_t ImmutableHistoryLog::failure_count() const {
  std::lock_guard<std::mutex> lk(impl_->mu);
  return impl_->failure_count;
}

// ---------------------------------------------------------------------------
// HistoryManager
// ---------------------------------------------------------------------------

HistoryManager::HistoryManager(const std::string& durable_path) : log_(durable_path) {}

HistoryEntry HistoryManager::condense(const OperationRecord& record) const {
  HistoryEntry e;
  e.operation_id = record.operation_id;
  e.batch_id = record.batch_id;
  e.tool_name = record.tool_name;
  e.success = record.succeeded();
  e.final_state = record.final_state ? to_string(*record.final_state) : "pending";
  e.attempt_count = record.attempts.size();
  e.important_warnings = record.important_warnings;
  e.timestamp_unix_ms = record.end_time_ms ? record.end_time_ms : now_unix_ms();

  for (const auto& [path, after] : record.post_states) {
    FileState before;
    auto it = record.pre_states.find(path);
    if (it != record.pre_states.end()) before = it->second;
    const std::string change = net_state_change(before, after);
    if (change != "unchanged") e.state_changes[path] = change;
  }
  if (!record.attempts.empty()) {
    for (const auto& f : record.attempts.back().result.affected_files) e.files_affected.push_back(f);
  }
  if (e.files_affected.empty() && !target_of(record).empty()) e.files_affected.push_back(target_of(record));

  e.summary = record.tool_name + " " + target_of(record) + ": " + e.final_state + " after " +
              std::to_string(e.attempt_count) + (e.attempt_count == 1 ? " attempt" : " attempts");
  if (!record.error_code.empty()) e.summary += " (" + record.error_code + ")";
  return e;
}

HistoryEntry HistoryManager::append(const OperationRecord& record) {
  records_.push_back(record);
  HistoryEntry e = condense(record);
  log_.append(e);
  return e;
}

const OperationRecord* HistoryManager::find(const std::string& operation_id) const {
  for (const auto& r : records_) {
    if (r.operation_id == operation_id) return &r;
  }
  return nullptr;
}

// ---------------------------------------------------------------------------
// Readers
// ---------------------------------------------------------------------------

std::optional<std::vector<HistoryEntry>> load_history(const std::string& path, std::string* error) {
  std::ifstream ifs(path, std::ios::binary);
  if (!ifs) {
    if (error) *error = "cannot open history log: " + path;
    return std::nullopt;
  }
  std::vector<HistoryEntry> out;
  std::string line;
  std::size_t lineno = 0;
  while (std::getline(ifs, line)) {
    ++lineno;
    if (line.empty()) continue;
    std::string err;
    auto e = history_entry_from_json(line, &err);
    if (!e) {
      if (error) *error = "line " + std::to_string(lineno) + ": " + err;
      return std::nullopt;
    }
    out.push_back(std::move(*e));
  }
  return out;
}

ChainVerification verify_history_chain(const std::string& path) {
  ChainVerification v;
  std::ifstream ifs(path, std::ios::binary);
  if (!ifs) {
    v.ok = false;
    v.error = "cannot open history log: " + path;
    return v;
  }
  std::string expected_prev = kGenesisDigest;
  std::uint64_t expected_seq = 0;
  std::string line;
  while (std::getline(ifs, line)) {
    if (line.empty()) continue;
    std::string err;
    auto e = history_entry_from_json(line, &err);
    if (!e) {
      v.ok = false;
      v.first_bad_sequence = expected_seq + 1;
      v.error = err;
      return v;
    }
    if (expected_seq != 0 && e->sequence != expected_seq + 1) {
      v.ok = false;
      v.first_bad_sequence = e->sequence;
      v.error = "sequence gap: expected " + std::to_string(expected_seq + 1);
      return v;
    }
    if (e->previous_digest != expected_prev) {
      v.ok = false;
      v.first_bad_sequence = e->sequence;
      v.error = "chain digest mismatch";
      return v;
    }
    expected_seq = e->sequence;
    expected_prev = history_chain_hash(line);
    ++v.entries;
  }
  return v;
}

}  // namespace warden
