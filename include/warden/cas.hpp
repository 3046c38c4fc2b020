#pragma once

// warden/cas.hpp: Content-addressed backup store for rollback snapshots.
//
// Critical operations record the prior bytes of every file they may touch
// here before executing. Restoration is then a pure copy-back by digest, with
// no replay logic.
//
// DESIGN INVARIANTS (must not be broken by any implementation):
//   1. CAS key = BLAKE3("cas:" + original_bytes) ALWAYS, content-addressed.
//   2. Writes are atomic: tmp+rename on the same filesystem.
//   3. Reads verify integrity: stored_blob_hash is checked before returning
//      data, and the decoded bytes are re-keyed against the digest.
//   4. Fail-closed: any integrity failure returns nullopt, never corrupted data.
//   5. Deduplication: a second put() of the same content returns the same digest.
//
// EXTENSION_POINT: backup_retention
//   Current: objects live until the state directory is removed.
//   Upgrade path: reference-count digests from the durable history log and
//   prune objects no longer reachable from any retained entry.

#include <cstddef>
#include <cstdint>
#include <map>
#include <mutex>
#include <optional>
#include <string>

namespace warden {

struct CasObjectInfo {
  std::string digest;
  std::string encoding{"identity"};
  std::size_t original_size{0};
  std::size_t stored_size{0};
  std::string stored_blob_hash;
  uint64_t created_at_unix_ts{0};
};

// ---------------------------------------------------------------------------
// ICASBackend: abstract backup storage interface
// ---------------------------------------------------------------------------
// EnvironmentStateTracker only talks to this interface, so tests can inject a
// backend that loses objects to exercise partial rollback.
class ICASBackend {
 public:
  virtual ~ICASBackend() = default;

  // Store data. Returns the content digest on success, "" on failure.
  // compression: "off" (identity) or "zstd" (if built with WARDEN_WITH_ZSTD).
  virtual std::string put(const std::string& data, const std::string& compression = "off") = 0;

  // Retrieve data by digest. Returns nullopt if not found or integrity fails.
  virtual std::optional<std::string> get(const std::string& digest) const = 0;

  // Returns true if deleted or not found, false on failure.
  virtual bool remove(const std::string& digest) = 0;

  virtual bool contains(const std::string& digest) const = 0;
  virtual std::optional<CasObjectInfo> info(const std::string& digest) const = 0;
  virtual std::size_t size() const = 0;
  virtual std::string backend_id() const = 0;
};

// ---------------------------------------------------------------------------
// CasStore: local filesystem backend
// ---------------------------------------------------------------------------
// Stores objects as sharded files under:
//   <root>/objects/AB/CD/<full-64-char-digest>
//   <root>/objects/AB/CD/<full-64-char-digest>.meta
// plus <root>/index.ndjson of CasObjectInfo lines: appended on put(),
// rewritten without the removed digest on remove().
class CasStore : public ICASBackend {
 public:
  explicit CasStore(std::string root = ".warden/cas/v2");

  std::string put(const std::string& data, const std::string& compression = "off") override;
  std::optional<std::string> get(const std::string& digest) const override;
  bool remove(const std::string& digest) override;
  bool contains(const std::string& digest) const override;
  std::optional<CasObjectInfo> info(const std::string& digest) const override;
  std::size_t size() const override;
  std::string backend_id() const override { return "local_fs"; }

  const std::string& root() const { return root_; }
  std::string object_path(const std::string& digest) const;

 private:
  std::string meta_path(const std::string& digest) const;
  std::string index_path() const;
  void load_index() const;
  void save_index_entry(const CasObjectInfo& info) const;

  std::string root_;
  mutable std::mutex index_mu_;
  mutable std::map<std::string, CasObjectInfo> index_;
  mutable bool index_loaded_{false};
};

std::string cas_object_info_to_json(const CasObjectInfo& info);
std::optional<CasObjectInfo> cas_object_info_from_json(const std::string& line);

}  // namespace warden
