#include "warden/environment.hpp"

#include <algorithm>
#include <filesystem>
#include <iterator>

#include <sys/stat.h>

#include "warden/hash.hpp"
#include "warden/tools.hpp"

namespace fs = std::filesystem;

namespace warden {

namespace {

constexpr const char* kAbsent = "absent";
constexpr const char* kDir = "dir";
constexpr const char* kCasPrefix = "cas:";
constexpr const char* kLinkPrefix = "link:";

bool starts_with(const std::string& s, const std::string& prefix) {
  return s.size() >= prefix.size() && s.compare(0, prefix.size(), prefix) == 0;
}

// Keys in reverse lexical order: "a/b/c" before "a/b" before "a".
std::vector<std::string> deepest_first(const std::map<std::string, std::string>& info) {
  std::vector<std::string> keys;
  keys.reserve(info.size());
  for (auto it = info.rbegin(); it != info.rend(); ++it) keys.push_back(it->first);
  return keys;
}

// Digest of a "cas:<digest>:<perms>" descriptor, "" for every other kind.
std::string backup_digest(const std::string& descriptor) {
  if (!starts_with(descriptor, kCasPrefix)) return {};
  const std::string rest = descriptor.substr(4);
  return rest.substr(0, rest.find(':'));
}

fs::perms parse_octal(const std::string& s) {
  unsigned v = 0;
  for (char c : s) {
    if (c < '0' || c > '7') return fs::perms::unknown;
    v = v * 8 + static_cast<unsigned>(c - '0');
  }
  return static_cast<fs::perms>(v & 0777u);
}

}  // namespace

EnvironmentStateTracker::EnvironmentStateTracker(const Workspace& workspace, ICASBackend& backups,
                                                 std::string compression)
    : workspace_(workspace), backups_(backups), compression_(std::move(compression)) {
  state_.workspace = workspace_.state();
}

EnvironmentStateTracker::~EnvironmentStateTracker() {
  if (!journal_.empty()) erase_journal(journal_.begin());
}

EnvironmentState EnvironmentStateTracker::snapshot() const { return state_; }

FileState EnvironmentStateTracker::capture(const std::string& rel) const {
  FileState fsx;
  fsx.path = rel;
  fsx.last_verified_at_ms = now_unix_ms();
  const auto abs = workspace_.resolve_entry(rel);
  if (!abs) return fsx;
  struct stat st {};
  if (::lstat(abs->c_str(), &st) != 0) return fsx;
  fsx.exists = true;
  fsx.is_directory = S_ISDIR(st.st_mode);
  fsx.permissions = octal_permissions(static_cast<fs::perms>(st.st_mode & 0777));
  fsx.owner = static_cast<std::uint32_t>(st.st_uid);
  if (S_ISREG(st.st_mode)) {
    fsx.size = static_cast<std::uint64_t>(st.st_size);
    fsx.hash = hash_file_blake3_hex(abs->string());
  }
  return fsx;
}

void EnvironmentStateTracker::refresh(const std::string& rel) { state_.file_states[rel] = capture(rel); }

void EnvironmentStateTracker::capture_workspace() {
  state_.workspace = workspace_.state();
  if (!state_.workspace.root_valid) return;
  std::error_code ec;
  for (fs::recursive_directory_iterator it(workspace_.root(), ec), end; !ec && it != end;
       it.increment(ec)) {
    refresh(workspace_.relative(it->path()));
  }
}

EnvironmentState EnvironmentStateTracker::record(const std::string& operation_id,
                                                 const ToolResult& result) {
  for (const auto& rel : result.affected_files) refresh(rel);
  state_.operation_sequence.push_back(operation_id);
  state_.workspace = workspace_.state();
  return state_;
}

std::string EnvironmentStateTracker::push_rollback_point(const std::string& operation_id) {
  JournalEntry mark;
  mark.mark = true;
  mark.id = "cp-" + std::to_string(next_checkpoint_++);
  mark.operation_id = operation_id;
  state_.rollback_points.push_back(mark.id);
  journal_.push_back(std::move(mark));
  return journal_.back().id;
}

void EnvironmentStateTracker::discard_rollback_point(const std::string& checkpoint_id) {
  journal_.erase(std::remove_if(journal_.begin(), journal_.end(),
                                [&](const JournalEntry& e) { return e.mark && e.id == checkpoint_id; }),
                 journal_.end());
  auto& pts = state_.rollback_points;
  pts.erase(std::remove(pts.begin(), pts.end(), checkpoint_id), pts.end());
  // Without any mark left nothing can roll back to these entries.
  if (pts.empty() && !journal_.empty()) erase_journal(journal_.begin());
}

void EnvironmentStateTracker::erase_journal(std::vector<JournalEntry>::iterator first) {
  std::vector<JournalEntry> dropped(std::make_move_iterator(first), std::make_move_iterator(journal_.end()));
  journal_.erase(first, journal_.end());
  for (const auto& e : dropped) {
    if (!e.mark) release(e.info);
  }
}

void EnvironmentStateTracker::retain(const std::map<std::string, std::string>& info) {
  for (const auto& [rel, descriptor] : info) {
    const std::string digest = backup_digest(descriptor);
    if (!digest.empty()) ++backup_refs_[digest];
  }
}

void EnvironmentStateTracker::release(const std::map<std::string, std::string>& info) {
  for (const auto& [rel, descriptor] : info) {
    const std::string digest = backup_digest(descriptor);
    if (digest.empty()) continue;
    auto it = backup_refs_.find(digest);
    if (it != backup_refs_.end() && --it->second > 0) continue;
    if (it != backup_refs_.end()) backup_refs_.erase(it);
    prune(digest);
  }
}

// An object that cannot be removed stays owned and is retried on the next
// release of the same digest or at destruction.
void EnvironmentStateTracker::prune(const std::string& digest) {
  if (backup_refs_.count(digest) || !owned_backups_.count(digest)) return;
  if (backups_.remove(digest)) owned_backups_.erase(digest);
}

std::map<std::string, std::string> EnvironmentStateTracker::prepare_rollback(
    const std::string& rel, const std::string& tool_name, std::string* error) {
  std::map<std::string, std::string> info;
  const auto abs = workspace_.resolve_entry(rel);
  if (!abs) {
    if (error) *error = "path escapes workspace: " + rel;
    return {};
  }
  // Objects put for a descriptor set that is never returned are not journaled.
  auto abandon = [&]() -> std::map<std::string, std::string> {
    for (const auto& [key, descriptor] : info) {
      const std::string digest = backup_digest(descriptor);
      if (!digest.empty()) prune(digest);
    }
    return {};
  };

  // Ancestors that do not exist yet would be created by the tool.
  for (fs::path p = fs::path(rel).lexically_normal().parent_path(); !p.empty(); p = p.parent_path()) {
    const auto pa = workspace_.resolve(p.generic_string());
    std::error_code ec;
    if (pa && !fs::exists(fs::symlink_status(*pa, ec))) info[p.generic_string()] = kAbsent;
  }

  auto backup_one = [&](const std::string& key, const fs::path& path) -> bool {
    std::error_code ec;
    const auto st = fs::symlink_status(path, ec);
    if (!fs::exists(st)) {
      info[key] = kAbsent;
      return true;
    }
    if (fs::is_directory(st)) {
      info[key] = kDir;
      return true;
    }
    if (fs::is_symlink(st)) {
      const fs::path to = fs::read_symlink(path, ec);
      if (ec) {
        if (error) *error = "cannot read symlink for backup: " + key;
        return false;
      }
      info[key] = std::string(kLinkPrefix) + to.string();
      return true;
    }
    if (!fs::is_regular_file(st)) {
      if (error) *error = "cannot back up non-regular file: " + key;
      return false;
    }
    const auto bytes = read_bytes(path);
    if (!bytes) {
      if (error) *error = "cannot read file for backup: " + key;
      return false;
    }
    const bool fresh = !backups_.contains(cas_content_hash(*bytes));
    const std::string digest = backups_.put(*bytes, compression_);
    if (digest.empty()) {
      if (error) *error = "backup store rejected " + key;
      return false;
    }
    if (fresh) owned_backups_.insert(digest);
    info[key] = std::string(kCasPrefix) + digest + ":" + octal_permissions(st.permissions());
    return true;
  };

  const std::string key = fs::path(rel).lexically_normal().generic_string();
  if (!backup_one(key, *abs)) return abandon();

  // A recursive delete needs every nested entry to come back.
  std::error_code ec;
  if (tool_name == "delete_file" && fs::is_directory(fs::symlink_status(*abs, ec))) {
    for (fs::recursive_directory_iterator it(*abs, ec), end; !ec && it != end; it.increment(ec)) {
      if (!backup_one(workspace_.relative(it->path()), it->path())) return abandon();
    }
    if (ec) {
      if (error) *error = "cannot walk directory for backup: " + ec.message();
      return abandon();
    }
  }
  return info;
}

void EnvironmentStateTracker::register_rollback_info(const std::string& operation_id,
                                                     const std::map<std::string, std::string>& info) {
  if (info.empty()) return;
  if (state_.rollback_points.empty()) {
    for (const auto& [rel, descriptor] : info) {
      const std::string digest = backup_digest(descriptor);
      if (!digest.empty()) prune(digest);
    }
    return;
  }
  retain(info);
  JournalEntry e;
  e.operation_id = operation_id;
  e.info = info;
  journal_.push_back(std::move(e));
}

bool EnvironmentStateTracker::apply_descriptor(const std::string& rel, const std::string& descriptor,
                                               std::string* reason) {
  const auto abs = workspace_.resolve_entry(rel);
  if (!abs) {
    *reason = "path escapes workspace";
    return false;
  }
  std::error_code ec;
  const bool present = fs::exists(fs::symlink_status(*abs, ec));

  if (descriptor == kAbsent) {
    if (present) fs::remove_all(*abs, ec);
    if (ec) {
      *reason = "remove failed: " + ec.message();
      return false;
    }
    return true;
  }

  if (descriptor == kDir) {
    if (present && !fs::is_directory(fs::symlink_status(*abs, ec))) fs::remove(*abs, ec);
    if (!ec) fs::create_directories(*abs, ec);
    if (ec) {
      *reason = "cannot recreate directory: " + ec.message();
      return false;
    }
    return true;
  }

  if (starts_with(descriptor, kLinkPrefix)) {
    if (present) fs::remove_all(*abs, ec);
    if (!ec) fs::create_directories(abs->parent_path(), ec);
    if (!ec) fs::create_symlink(descriptor.substr(5), *abs, ec);
    if (ec) {
      *reason = "cannot recreate symlink: " + ec.message();
      return false;
    }
    return true;
  }

  if (starts_with(descriptor, kCasPrefix)) {
    const std::string rest = descriptor.substr(4);
    const auto colon = rest.find(':');
    const std::string digest = rest.substr(0, colon);
    const fs::perms perms =
        colon == std::string::npos ? fs::perms::unknown : parse_octal(rest.substr(colon + 1));
    const auto bytes = backups_.get(digest);
    if (!bytes) {
      *reason = "backup " + digest + " missing or corrupt";
      return false;
    }
    if (present && fs::is_directory(fs::symlink_status(*abs, ec))) fs::remove_all(*abs, ec);
    fs::create_directories(abs->parent_path(), ec);
    std::string err;
    if (!atomic_replace(*abs, *bytes, &err)) {
      *reason = err;
      return false;
    }
    if (perms != fs::perms::unknown) {
      fs::permissions(*abs, perms, fs::perm_options::replace, ec);
      if (ec) {
        *reason = "cannot restore permissions: " + ec.message();
        return false;
      }
    }
    return true;
  }

  *reason = "unknown rollback descriptor '" + descriptor + "'";
  return false;
}

RollbackResult EnvironmentStateTracker::restore(const std::map<std::string, std::string>& info) {
  RollbackResult out;
  for (const auto& rel : deepest_first(info)) {
    std::string reason;
    if (apply_descriptor(rel, info.at(rel), &reason)) {
      out.restored.push_back(rel);
    } else {
      out.ok = false;
      out.unrestored.push_back(rel + ": " + reason);
    }
    refresh(rel);
  }
  return out;
}

RollbackResult EnvironmentStateTracker::rollback_to(const std::string& checkpoint_id) {
  RollbackResult out;
  out.checkpoint_id = checkpoint_id;
  const auto mark = std::find_if(journal_.begin(), journal_.end(),
                                 [&](const JournalEntry& e) { return e.mark && e.id == checkpoint_id; });
  if (mark == journal_.end()) {
    out.ok = false;
    out.unrestored.push_back("checkpoint " + checkpoint_id + " not found");
    return out;
  }

  for (auto it = journal_.rbegin(); it != std::make_reverse_iterator(mark); ++it) {
    if (it->mark) continue;
    RollbackResult step = restore(it->info);
    out.ok = out.ok && step.ok;
    out.restored.insert(out.restored.end(), step.restored.begin(), step.restored.end());
    out.unrestored.insert(out.unrestored.end(), step.unrestored.begin(), step.unrestored.end());
  }

  erase_journal(mark);
  auto& pts = state_.rollback_points;
  const auto pos = std::find(pts.begin(), pts.end(), checkpoint_id);
  pts.erase(pos, pts.end());
  return out;
}

void EnvironmentStateTracker::note_outcome(const std::string& rel, bool success,
                                           const std::string& error_code) {
  if (success) {
    ++stats_.successes;
    const std::string dir = fs::path(rel).parent_path().generic_string();
    if (!dir.empty()) ++stats_.directories[dir];
    return;
  }
  ++stats_.failures;
  if (!error_code.empty()) ++stats_.common_errors[error_code];
}

std::vector<std::string> EnvironmentStateTracker::suggestions() const {
  std::vector<std::string> out;
  if (!stats_.directories.empty()) {
    std::vector<std::pair<std::string, std::uint64_t>> dirs(stats_.directories.begin(),
                                                            stats_.directories.end());
    std::stable_sort(dirs.begin(), dirs.end(),
                     [](const auto& a, const auto& b) { return a.second > b.second; });
    std::string line = "Consider using these directories: ";
    for (std::size_t i = 0; i < dirs.size() && i < 3; ++i) {
      if (i > 0) line += ", ";
      line += dirs[i].first;
    }
    out.push_back(line);
  }
  for (const auto& [code, count] : stats_.common_errors) {
    if (count < 2) continue;
    out.push_back("Watch out for " + code + " errors, seen " + std::to_string(count) + " times");
  }
  return out;
}

}  // namespace warden
