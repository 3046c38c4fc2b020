#pragma once

// warden/version.hpp: Version manifest for every on-disk format Warden writes.
//
// PURPOSE:
//   Prevent silent format drift across the backup store, the durable history
//   log, the event log and the session review. Every component that reads a
//   versioned format checks its constant here before processing data.
//
// INVARIANT:
//   Never silently accept data from a newer format version than this build was
//   compiled against. check_history_log_version() fails closed.

#include <cstdint>
#include <string>

namespace warden {
namespace version {

// Version 1 = BLAKE3, 32-byte output hex-encoded to 64 chars.
constexpr uint32_t HASH_ALGORITHM_VERSION = 1;

// Version 2 = objects/AB/CD/<64-char-digest> sharding with JSON .meta sidecars.
constexpr uint32_t CAS_FORMAT_VERSION = 2;

// Version 1 = NDJSON HistoryEntry lines chained by "hist:" BLAKE3 digests.
constexpr uint32_t HISTORY_LOG_VERSION = 1;

// Version 1 = one OperationEvent JSON object per line.
constexpr uint32_t EVENT_LOG_VERSION = 1;

// Version 1 = SessionReview::to_json() layout.
constexpr uint32_t REVIEW_FORMAT_VERSION = 1;

struct VersionManifest {
  uint32_t hash_algorithm{HASH_ALGORITHM_VERSION};
  uint32_t cas_format{CAS_FORMAT_VERSION};
  uint32_t history_log{HISTORY_LOG_VERSION};
  uint32_t event_log{EVENT_LOG_VERSION};
  uint32_t review_format{REVIEW_FORMAT_VERSION};
  std::string engine_semver;
  std::string hash_primitive;
  std::string build_timestamp;
};

VersionManifest current_manifest(const std::string& engine_semver = "");
std::string manifest_to_json(const VersionManifest& m);

struct CompatibilityResult {
  bool ok{true};
  std::string error_code;
  std::string description;
};

// Returns ok=false when `found` is newer than HISTORY_LOG_VERSION or zero.
CompatibilityResult check_history_log_version(uint32_t found);

}  // namespace version
}  // namespace warden
