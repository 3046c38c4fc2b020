#include "warden/config.hpp"

#include <cstdlib>
#include <filesystem>
#include <set>

#include "warden/jsonlite.hpp"

namespace fs = std::filesystem;

namespace warden {

namespace {

constexpr std::uint32_t kMaxOperationsCeiling = 1000;
constexpr std::uint32_t kMaxAttemptsCeiling = 10;

bool compression_known(const std::string& c) {
#if defined(WARDEN_WITH_ZSTD)
  return c == "off" || c == "zstd";
#else
  return c == "off";
#endif
}

const char* env(const char* name) {
  const char* e = std::getenv(name);
  return (e && e[0]) ? e : nullptr;
}

void bounded_u32(const char* name, std::uint32_t lo, std::uint32_t hi, std::uint32_t& out) {
  const char* e = env(name);
  if (!e) return;
  char* end = nullptr;
  const unsigned long v = std::strtoul(e, &end, 10);
  if (end && *end == '\0' && v >= lo && v <= hi) out = static_cast<std::uint32_t>(v);
}

fs::path canonical_path(const std::string& p) {
  std::error_code ec;
  const fs::path abs = fs::absolute(p, ec);
  if (ec) return {};
  const fs::path out = fs::weakly_canonical(abs, ec);
  if (ec) return {};
  return out.has_filename() ? out : out.parent_path();
}

// True when `inner` is `outer` or lies anywhere beneath it.
bool within(const fs::path& inner, const fs::path& outer) {
  const fs::path rel = inner.lexically_relative(outer);
  return !rel.empty() && *rel.begin() != "..";
}

}  // namespace

std::string SessionConfig::history_path() const {
  if (!history_log_path.empty()) return history_log_path;
  return (fs::path(state_dir) / "history.ndjson").string();
}

std::string SessionConfig::cas_root() const { return (fs::path(state_dir) / "cas" / "v2").string(); }

SessionConfig SessionConfig::from_env() {
  SessionConfig c;
  if (const char* e = env("WARDEN_WORKSPACE")) c.workspace_root = e;
  if (const char* e = env("WARDEN_STATE_DIR")) c.state_dir = e;
  if (const char* e = env("WARDEN_HISTORY_LOG")) c.history_log_path = e;
  if (const char* e = env("WARDEN_EVENT_LOG")) c.event_log_path = e;
  if (const char* e = env("WARDEN_BACKUP_COMPRESSION")) {
    if (compression_known(e)) c.backup_compression = e;
  }
  bounded_u32("WARDEN_MAX_OPERATIONS", 1, kMaxOperationsCeiling, c.max_operations);
  bounded_u32("WARDEN_MAX_ATTEMPTS", 1, kMaxAttemptsCeiling, c.max_attempts);
  return c;
}

ConfigValidationResult validate_config(const std::string& config_json) {
  ConfigValidationResult r;
  std::optional<jsonlite::JsonError> err;
  const auto obj = jsonlite::parse(config_json, &err);
  if (err) {
    r.errors.push_back(err->code + ": " + err->message);
    return r;
  }

  r.config_version = jsonlite::get_string(obj, "config_version");
  if (r.config_version.empty()) {
    r.warnings.push_back("config_version missing; assuming 1");
    r.config_version = "1";
  } else if (r.config_version != "1") {
    r.errors.push_back("unsupported config_version: " + r.config_version);
  }

  static const std::set<std::string> kKnown = {
      "config_version", "workspace_root", "state_dir",    "history_log_path",
      "event_log_path", "max_operations", "max_attempts", "backup_compression"};
  for (const auto& [key, value] : obj) {
    if (!kKnown.count(key)) r.warnings.push_back("unknown key ignored: " + key);
  }

  auto check_u32 = [&](const char* key, std::uint64_t lo, std::uint64_t hi) {
    auto it = obj.find(key);
    if (it == obj.end()) return;
    const auto* v = std::get_if<std::uint64_t>(&it->second.v);
    if (!v) {
      r.errors.push_back(std::string(key) + " must be a non-negative integer");
    } else if (*v < lo || *v > hi) {
      r.errors.push_back(std::string(key) + " must be in [" + std::to_string(lo) + ", " +
                         std::to_string(hi) + "]");
    }
  };
  check_u32("max_operations", 1, kMaxOperationsCeiling);
  check_u32("max_attempts", 1, kMaxAttemptsCeiling);

  for (const char* key : {"workspace_root", "state_dir", "history_log_path", "event_log_path",
                          "backup_compression"}) {
    auto it = obj.find(key);
    if (it != obj.end() && !std::holds_alternative<std::string>(it->second.v)) {
      r.errors.push_back(std::string(key) + " must be a string");
    }
  }
  auto comp = obj.find("backup_compression");
  if (comp != obj.end()) {
    const auto* s = std::get_if<std::string>(&comp->second.v);
    if (s && !compression_known(*s)) r.errors.push_back("unsupported backup_compression: " + *s);
  }

  r.ok = r.errors.empty();
  return r;
}

ConfigValidationResult apply_config_json(const std::string& config_json, SessionConfig& config) {
  ConfigValidationResult r = validate_config(config_json);
  if (!r.ok) return r;
  std::optional<jsonlite::JsonError> err;
  const auto obj = jsonlite::parse(config_json, &err);
  config.workspace_root = jsonlite::get_string(obj, "workspace_root", config.workspace_root);
  config.state_dir = jsonlite::get_string(obj, "state_dir", config.state_dir);
  config.history_log_path = jsonlite::get_string(obj, "history_log_path", config.history_log_path);
  config.event_log_path = jsonlite::get_string(obj, "event_log_path", config.event_log_path);
  config.backup_compression = jsonlite::get_string(obj, "backup_compression", config.backup_compression);
  config.max_operations =
      static_cast<std::uint32_t>(jsonlite::get_u64(obj, "max_operations", config.max_operations));
  config.max_attempts =
      static_cast<std::uint32_t>(jsonlite::get_u64(obj, "max_attempts", config.max_attempts));
  return r;
}

std::vector<std::string> check_session_config(const SessionConfig& config) {
  std::vector<std::string> errors;
  if (config.workspace_root.empty()) errors.push_back("workspace_root is empty");
  if (config.state_dir.empty()) errors.push_back("state_dir is empty");
  if (config.max_operations < 1 || config.max_operations > kMaxOperationsCeiling) {
    errors.push_back("max_operations out of range");
  }
  if (config.max_attempts < 1 || config.max_attempts > kMaxAttemptsCeiling) {
    errors.push_back("max_attempts out of range");
  }
  if (!compression_known(config.backup_compression)) {
    errors.push_back("unsupported backup_compression: " + config.backup_compression);
  }
  if (config.workspace_root.empty() || config.state_dir.empty()) return errors;

  const fs::path ws = canonical_path(config.workspace_root);
  const fs::path sd = canonical_path(config.state_dir);
  if (ws.empty() || sd.empty()) {
    errors.push_back("cannot resolve workspace_root or state_dir");
    return errors;
  }
  if (ws == sd) {
    errors.push_back("state_dir must differ from workspace_root");
  } else if (within(sd, ws)) {
    errors.push_back("state_dir must not lie inside workspace_root");
  } else if (within(ws, sd)) {
    errors.push_back("workspace_root must not lie inside state_dir");
  }
  if (!config.history_log_path.empty()) {
    const fs::path hl = canonical_path(config.history_log_path);
    if (!hl.empty() && within(hl, ws)) errors.push_back("history_log_path must not lie inside workspace_root");
  }
  return errors;
}

}  // namespace warden
