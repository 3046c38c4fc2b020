#include "warden/operation_types.hpp"

namespace warden {

std::string to_string(Strictness s) {
  return s == Strictness::strict ? "strict" : "basic";
}

const std::vector<OperationProfile>& operation_profiles() {
  static const std::vector<OperationProfile> kProfiles = {
      {"write_file", "file_creation", true, true,
       {"default", "encoding", "temp_file", "backup_restore"}, Strictness::strict, 2},
      {"read_file", "file_read", false, false,
       {"default", "binary_safe"}, Strictness::basic, 1},
      {"create_directory", "directory_ops", true, false,
       {"default", "explicit_mode", "via_temp"}, Strictness::basic, 1},
      {"delete_file", "file_deletion", true, true,
       {"default", "rename_then_remove", "chmod_parent"}, Strictness::basic, 1, true},
      {"save_json", "json_ops", true, true,
       {"default", "temp_file", "compact"}, Strictness::strict, 2},
      {"load_json", "json_read", false, false,
       {"default", "lenient"}, Strictness::basic, 1},
  };
  return kProfiles;
}

const OperationProfile* find_profile(const std::string& tool_name) {
  for (const auto& p : operation_profiles()) {
    if (p.tool_name == tool_name) return &p;
  }
  return nullptr;
}

}  // namespace warden
