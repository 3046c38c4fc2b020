#include "warden/version.hpp"

#include <sstream>

namespace warden {
namespace version {

VersionManifest current_manifest(const std::string& engine_semver) {
  VersionManifest m;
#ifdef PROJECT_VERSION
  m.engine_semver = engine_semver.empty() ? PROJECT_VERSION : engine_semver;
#else
  m.engine_semver = engine_semver.empty() ? "0.0.0" : engine_semver;
#endif
  m.hash_primitive = "blake3";
  m.build_timestamp = std::string(__DATE__) + "T" + std::string(__TIME__);
  return m;
}

std::string manifest_to_json(const VersionManifest& m) {
  std::ostringstream o;
  o << "{"
    << "\"hash_algorithm\":" << m.hash_algorithm
    << ",\"cas_format\":" << m.cas_format
    << ",\"history_log\":" << m.history_log
    << ",\"event_log\":" << m.event_log
    << ",\"review_format\":" << m.review_format
    << ",\"engine_semver\":\"" << m.engine_semver << "\""
    << ",\"hash_primitive\":\"" << m.hash_primitive << "\""
    << ",\"build_timestamp\":\"" << m.build_timestamp << "\""
    << "}";
  return o.str();
}

CompatibilityResult check_history_log_version(uint32_t found) {
  CompatibilityResult r;
  if (found == 0 || found > HISTORY_LOG_VERSION) {
    r.ok = false;
    r.error_code = "history_log_version_unsupported";
    r.description = "History log version " + std::to_string(found) +
                    " is not readable by this build (supports " +
                    std::to_string(HISTORY_LOG_VERSION) + ").";
  }
  return r;
}

}  // namespace version
}  // namespace warden
