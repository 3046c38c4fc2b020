#pragma once

// warden/config.hpp: Session configuration.
//
// Precedence, lowest to highest: built-in defaults, WARDEN_* environment
// variables (from_env), a JSON config document (apply_config_json), CLI flags.
//
// INVARIANT: the state directory (backups, history) and the workspace are
// disjoint trees. Neither may equal or contain the other, and an explicit
// history_log_path may not sit inside the workspace, so no plan operation can
// reach rollback data or the durable log.

#include <cstdint>
#include <string>
#include <vector>

namespace warden {

struct SessionConfig {
  std::string workspace_root{"./workspace"};
  std::string state_dir{".warden"};
  std::string history_log_path;   // empty: <state_dir>/history.ndjson
  std::string event_log_path;     // empty: WARDEN_EVENT_LOG, else disabled
  std::uint32_t max_operations{25};
  std::uint32_t max_attempts{3};
  std::string backup_compression{"off"};

  std::string history_path() const;
  std::string cas_root() const;

  static SessionConfig from_env();
};

struct ConfigValidationResult {
  bool ok{false};
  std::string config_version;
  std::vector<std::string> errors;
  std::vector<std::string> warnings;
};

// Validate a JSON config document. Unknown keys are warnings, not errors.
ConfigValidationResult validate_config(const std::string& config_json);

// Overlay a config document onto `config`. Returns the validation result;
// `config` is left untouched unless ok.
ConfigValidationResult apply_config_json(const std::string& config_json, SessionConfig& config);

// Every error string in `config` that would make a session refuse to start.
std::vector<std::string> check_session_config(const SessionConfig& config);

}  // namespace warden
