#pragma once

// warden/environment.hpp: Authoritative view of workspace state plus the
// rollback journal for critical operations.
//
// DESIGN INVARIANTS:
//   1. REAL STATE ONLY: record() re-reads affected paths from disk (BLAKE3
//      hash, permissions, owner). A tool's self-report never updates
//      file_states directly.
//   2. COPY-BACK ROLLBACK: rollback_info descriptors are restored by copying
//      bytes out of the backup store. No operation is ever replayed or undone
//      by running an inverse tool.
//   3. REVERSE ORDER: rollback_to() applies journaled descriptors newest
//      first, and within one descriptor set deepest paths first, so children
//      are restored or removed before their parents.
//   4. SINGLE ATTEMPT: each descriptor is applied once. Anything that cannot
//      be restored is reported in RollbackResult::unrestored and the rollback
//      is partial; it is never retried or reported as success.
//   5. NOT THREAD-SAFE: one tracker per session; the session loop serializes
//      every mutation.
//   6. BACKUP RETENTION: a backup object lives only as long as a journal entry
//      references it. When the last referencing entry is discarded or rolled
//      back, objects this tracker added to the store are removed. Objects that
//      were already in the store before this tracker put them are left alone.
//
// Descriptor grammar (ToolResult::rollback_info values):
//   absent                      remove whatever is at the path
//   dir                         ensure a directory exists at the path
//   cas:<digest>:<octal-perms>  write the backed-up bytes and chmod
//   link:<target>               recreate the symbolic link
//
// Journal paths name directory entries: a symlink leaf is the link itself
// (Workspace::resolve_entry), never its target.
//
// EXTENSION_POINT: cross_session_rollback
//   Current: the journal lives in memory and ends with the session.
//   Upgrade path: persist journal marks beside the durable history log so an
//   interrupted session can be rolled back by a later process.

#include <cstdint>
#include <map>
#include <set>
#include <string>
#include <vector>

#include "warden/cas.hpp"
#include "warden/types.hpp"
#include "warden/workspace.hpp"

namespace warden {

struct RollbackResult {
  bool ok{true};
  std::string checkpoint_id;
  std::vector<std::string> restored;
  std::vector<std::string> unrestored;  // "<path>: <reason>"
};

// Per-session tallies used for review suggestions.
struct OperationStats {
  std::uint64_t successes{0};
  std::uint64_t failures{0};
  std::map<std::string, std::uint64_t> common_errors;  // error_code -> count
  std::map<std::string, std::uint64_t> directories;    // parent dir of successful targets
};

class EnvironmentStateTracker {
 public:
  EnvironmentStateTracker(const Workspace& workspace, ICASBackend& backups,
                          std::string compression = "off");
  ~EnvironmentStateTracker();

  EnvironmentStateTracker(const EnvironmentStateTracker&) = delete;
  EnvironmentStateTracker& operator=(const EnvironmentStateTracker&) = delete;

  EnvironmentState snapshot() const;

  // Refresh file_states for result.affected_files and append operation_id to
  // the operation sequence. Returns the updated snapshot.
  EnvironmentState record(const std::string& operation_id, const ToolResult& result);

  // Current on-disk state of one workspace-relative path (no side effects).
  FileState capture(const std::string& rel) const;

  // Walk the whole workspace into file_states. Used once at session start.
  void capture_workspace();

  std::string push_rollback_point(const std::string& operation_id);
  void discard_rollback_point(const std::string& checkpoint_id);

  // Build rollback descriptors for everything `tool_name` may touch at `rel`,
  // storing existing file bytes in the backup store. Returns an empty map and
  // sets *error when a backup cannot be taken.
  std::map<std::string, std::string> prepare_rollback(const std::string& rel,
                                                      const std::string& tool_name,
                                                      std::string* error);

  // Journal descriptors under the newest rollback point.
  void register_rollback_info(const std::string& operation_id,
                              const std::map<std::string, std::string>& info);

  // Apply one descriptor set immediately, without touching the journal.
  RollbackResult restore(const std::map<std::string, std::string>& info);

  // Undo everything journaled since `checkpoint_id`, then drop that point.
  RollbackResult rollback_to(const std::string& checkpoint_id);

  void note_outcome(const std::string& rel, bool success, const std::string& error_code);
  const OperationStats& stats() const { return stats_; }
  std::vector<std::string> suggestions() const;

  // Backup objects currently referenced by the journal.
  std::size_t live_backups() const { return backup_refs_.size(); }

 private:
  struct JournalEntry {
    bool mark{false};
    std::string id;            // checkpoint id for marks
    std::string operation_id;
    std::map<std::string, std::string> info;
  };

  bool apply_descriptor(const std::string& rel, const std::string& descriptor, std::string* reason);
  void refresh(const std::string& rel);
  void retain(const std::map<std::string, std::string>& info);
  void release(const std::map<std::string, std::string>& info);
  void prune(const std::string& digest);
  void erase_journal(std::vector<JournalEntry>::iterator first);

  const Workspace& workspace_;
  ICASBackend& backups_;
  std::string compression_;
  EnvironmentState state_;
  std::vector<JournalEntry> journal_;
  std::uint64_t next_checkpoint_{1};
  OperationStats stats_;
  std::map<std::string, std::uint32_t> backup_refs_;  // digest -> referencing journal entries
  std::set<std::string> owned_backups_;               // digests this tracker added to the store
};

}  // namespace warden
