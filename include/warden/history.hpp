#pragma once

// warden/history.hpp: Session log of full OperationRecords plus the durable,
// hash-chained history log of condensed HistoryEntry lines.
//
// DESIGN INVARIANTS (must not be broken):
//   1. APPEND-ONLY: durable entries are never modified or deleted.
//   2. SEQUENTIAL: each entry carries a monotonically increasing sequence
//      number, resumed from the existing file tail on open.
//   3. CHAINED: previous_digest = BLAKE3("hist:" + previous line). The first
//      entry of a fresh log chains to 64 zeros.
//   4. FAIL-SAFE: a durable write failure is counted, never fatal. The sealed
//      OperationRecord is authoritative.
//   5. CONDENSED: attempt_count always equals the number of attempts in the
//      full record; only user-relevant warnings survive condensation.
//
// EXTENSION_POINT: history_compaction
//   Current: one NDJSON file grows without bound.
//   Upgrade path: rotate by size and carry the last digest into the first
//   line of the next segment. Invariant: NEVER re-use a sequence number.

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "warden/types.hpp"

namespace warden {

std::string history_entry_to_json(const HistoryEntry& e);
std::optional<HistoryEntry> history_entry_from_json(const std::string& line, std::string* error = nullptr);

// Net change of one path between pre and post state:
// "created", "modified", "deleted" or "unchanged".
std::string net_state_change(const FileState& before, const FileState& after);

class ImmutableHistoryLog {
 public:
  // Empty path disables durable writes; sequencing still happens in memory.
  explicit ImmutableHistoryLog(const std::string& path = "");
  ~ImmutableHistoryLog();

  ImmutableHistoryLog(const ImmutableHistoryLog&) = delete;
  ImmutableHistoryLog& operator=(const ImmutableHistoryLog&) = delete;

  // Assigns sequence and previous_digest in place. Never throws.
  // INVARIANT: if append() returns false, the entry was NOT written.
  bool append(HistoryEntry& entry);

  std::uint64_t entry_count() const;
  std::uint64_t failure_count() const;
  const std::string& path() const { return path_; }

 private:
  struct Impl;
  std::string path_;
  std::unique_ptr<Impl> impl_;
};

class HistoryManager {
 public:
  explicit HistoryManager(const std::string& durable_path = "");

  HistoryEntry condense(const OperationRecord& record) const;

  // Keep the full record for the session and write its condensed entry.
  HistoryEntry append(const OperationRecord& record);

  const std::vector<OperationRecord>& records() const { return records_; }
  const OperationRecord* find(const std::string& operation_id) const;

  // Drop the in-memory session log. The durable log is untouched.
  void end_session() { records_.clear(); }

  const ImmutableHistoryLog& durable() const { return log_; }

 private:
  std::vector<OperationRecord> records_;
  ImmutableHistoryLog log_;
};

// Parse every line of a durable log. Returns nullopt and sets *error on the
// first malformed line or unsupported version.
std::optional<std::vector<HistoryEntry>> load_history(const std::string& path, std::string* error = nullptr);

struct ChainVerification {
  bool ok{true};
  std::uint64_t entries{0};
  std::uint64_t first_bad_sequence{0};
  std::string error;
};

ChainVerification verify_history_chain(const std::string& path);

}  // namespace warden
