#include "warden/types.hpp"

#include <chrono>
#include <sstream>

#include "warden/jsonlite.hpp"

namespace warden {

std::string to_string(ErrorCode code) {
  switch (code) {
    case ErrorCode::none: return "";
    case ErrorCode::json_parse_error: return "json_parse_error";
    case ErrorCode::json_duplicate_key: return "json_duplicate_key";
    case ErrorCode::path_escape: return "path_escape";
    case ErrorCode::invalid_path: return "invalid_path";
    case ErrorCode::missing_input: return "missing_input";
    case ErrorCode::unknown_tool: return "unknown_tool";
    case ErrorCode::dependency_unmet: return "dependency_unmet";
    case ErrorCode::execution_fault: return "execution_fault";
    case ErrorCode::verification_failed: return "verification_failed";
    case ErrorCode::backup_failed: return "backup_failed";
    case ErrorCode::rollback_partial: return "rollback_partial";
    case ErrorCode::schema_mismatch: return "schema_mismatch";
    case ErrorCode::cas_integrity_failed: return "cas_integrity_failed";
    case ErrorCode::hash_unavailable_blake3: return "hash_unavailable_blake3";
    case ErrorCode::session_limit_reached: return "session_limit_reached";
    case ErrorCode::cancelled: return "cancelled";
    case ErrorCode::config_invalid: return "config_invalid";
  }
  return "";
}

std::string to_string(FinalState s) {
  switch (s) {
    case FinalState::succeeded: return "succeeded";
    case FinalState::failed: return "failed";
    case FinalState::rolled_back: return "rolled_back";
    case FinalState::skipped: return "skipped";
  }
  return "";
}

std::string to_string(OperationPhase p) {
  switch (p) {
    case OperationPhase::pending: return "PENDING";
    case OperationPhase::pre_check: return "PRE_CHECK";
    case OperationPhase::executing: return "EXECUTING";
    case OperationPhase::verifying: return "VERIFYING";
    case OperationPhase::retry: return "RETRY";
    case OperationPhase::succeeded: return "SUCCEEDED";
    case OperationPhase::rolled_back: return "ROLLED_BACK";
    case OperationPhase::failed: return "FAILED";
    case OperationPhase::skipped: return "SKIPPED";
  }
  return "";
}

std::uint64_t now_unix_ms() {
  using SC = std::chrono::system_clock;
  return static_cast<std::uint64_t>(
      std::chrono::duration_cast<std::chrono::milliseconds>(SC::now().time_since_epoch())
          .count());
}

std::string check_value_to_json(const CheckValue& v) {
  if (std::holds_alternative<bool>(v)) return std::get<bool>(v) ? "true" : "false";
  if (std::holds_alternative<std::uint64_t>(v)) return std::to_string(std::get<std::uint64_t>(v));
  return "\"" + jsonlite::escape(std::get<std::string>(v)) + "\"";
}

std::string verification_to_json(const VerificationMap& m) {
  std::ostringstream o;
  o << "{";
  bool first_group = true;
  for (const auto& [group, checks] : m) {
    if (!first_group) o << ",";
    first_group = false;
    o << "\"" << jsonlite::escape(group) << "\":{";
    bool first = true;
    for (const auto& [name, value] : checks) {
      if (!first) o << ",";
      first = false;
      o << "\"" << jsonlite::escape(name) << "\":" << check_value_to_json(value);
    }
    o << "}";
  }
  o << "}";
  return o.str();
}

namespace {

void write_string_array(std::ostringstream& o, const std::vector<std::string>& items) {
  o << "[";
  for (size_t i = 0; i < items.size(); ++i) {
    if (i > 0) o << ",";
    o << "\"" << jsonlite::escape(items[i]) << "\"";
  }
  o << "]";
}

void write_string_map(std::ostringstream& o, const std::map<std::string, std::string>& items) {
  o << "{";
  bool first = true;
  for (const auto& [k, v] : items) {
    if (!first) o << ",";
    first = false;
    o << "\"" << jsonlite::escape(k) << "\":\"" << jsonlite::escape(v) << "\"";
  }
  o << "}";
}

}  // namespace

std::string tool_result_to_json(const ToolResult& r) {
  std::ostringstream o;
  o << "{\"success\":" << (r.success ? "true" : "false")
    << ",\"result\":\"" << jsonlite::escape(r.result) << "\""
    << ",\"verification\":" << verification_to_json(r.verification)
    << ",\"diagnostics\":";
  write_string_map(o, r.diagnostics);
  o << ",\"dependencies\":";
  write_string_array(o, r.dependencies);
  o << ",\"affected_files\":";
  write_string_array(o, std::vector<std::string>(r.affected_files.begin(), r.affected_files.end()));
  o << ",\"warnings\":";
  write_string_array(o, r.warnings);
  o << ",\"rollback_info\":";
  write_string_map(o, r.rollback_info);
  o << "}";
  return o.str();
}

std::string file_state_to_json(const FileState& s) {
  std::ostringstream o;
  o << "{\"path\":\"" << jsonlite::escape(s.path) << "\""
    << ",\"exists\":" << (s.exists ? "true" : "false")
    << ",\"is_directory\":" << (s.is_directory ? "true" : "false")
    << ",\"size\":" << s.size
    << ",\"hash\":\"" << s.hash << "\""
    << ",\"permissions\":\"" << s.permissions << "\""
    << ",\"owner\":" << s.owner
    << ",\"last_verified_at_ms\":" << s.last_verified_at_ms << "}";
  return o.str();
}

}  // namespace warden
