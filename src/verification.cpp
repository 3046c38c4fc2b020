#include "warden/verification.hpp"

#include <algorithm>
#include <sstream>

#include <sys/stat.h>
#include <unistd.h>

#include "warden/hash.hpp"
#include "warden/jsonlite.hpp"
#include "warden/tools.hpp"

namespace fs = std::filesystem;

namespace warden {

std::string to_string(CheckCategory c) {
  switch (c) {
    case CheckCategory::critical: return "critical";
    case CheckCategory::content: return "content";
    case CheckCategory::security: return "security";
    case CheckCategory::quality: return "quality";
  }
  return "";
}

bool is_code_file(const std::string& path) {
  static const char* kExtensions[] = {".c",  ".cc", ".cpp", ".cxx", ".h",  ".hpp", ".py", ".js",
                                      ".ts", ".tsx", ".jsx", ".java", ".go", ".rs",  ".rb", ".sh",
                                      ".json"};
  const std::string ext = fs::path(path).extension().string();
  for (const char* e : kExtensions) {
    if (ext == e) return true;
  }
  return false;
}

VerificationMap VerificationReport::to_map() const {
  VerificationMap m;
  for (const auto& c : checks) m[c.group][c.name] = c.value;
  return m;
}

std::map<std::string, CheckTally> VerificationReport::tally() const {
  std::map<std::string, CheckTally> out;
  for (const auto& c : checks) {
    auto& t = out[to_string(c.category)];
    if (c.passed) ++t.passed;
    else ++t.failed;
  }
  return out;
}

namespace {

constexpr const char* kFlatGroup = "checks";

// Collects checks, dropping categories the profile's strictness excludes.
struct ReportBuilder {
  VerificationReport report;
  Strictness strictness;

  void add(const std::string& group, const std::string& name, CheckCategory cat, CheckValue value,
           bool passed, const std::string& message = "", bool user_relevant = false) {
    if (strictness == Strictness::basic &&
        (cat == CheckCategory::security || cat == CheckCategory::quality)) {
      return;
    }
    Check c;
    c.group = group;
    c.name = name;
    c.category = cat;
    c.value = std::move(value);
    c.passed = passed;
    c.message = passed ? "" : (message.empty() ? name + " check failed" : message);
    c.user_relevant = user_relevant;
    report.checks.push_back(std::move(c));
  }

  VerificationReport finish() {
    for (const auto& c : report.checks) {
      if (c.passed) continue;
      if (c.category == CheckCategory::critical) {
        report.success = false;
        report.critical_failures.push_back(c.name + ": " + c.message);
        continue;
      }
      report.warnings.push_back(c.message);
      if (c.user_relevant) report.important_warnings.push_back(c.message);
    }
    return std::move(report);
  }
};

struct Target {
  std::optional<fs::path> abs;
  bool exists{false};
  bool is_regular{false};
  bool is_directory{false};
  std::uint64_t size{0};
  fs::perms perms{fs::perms::none};
  std::uint32_t owner{0};
};

Target inspect(const Workspace& ws, const std::string& rel) {
  Target t;
  t.abs = ws.resolve(rel);
  if (!t.abs) return t;
  struct stat st {};
  if (::lstat(t.abs->c_str(), &st) != 0) return t;
  t.exists = true;
  t.is_regular = S_ISREG(st.st_mode);
  t.is_directory = S_ISDIR(st.st_mode);
  t.size = t.is_regular ? static_cast<std::uint64_t>(st.st_size) : 0;
  t.perms = static_cast<fs::perms>(st.st_mode & 0777);
  t.owner = static_cast<std::uint32_t>(st.st_uid);
  return t;
}

bool can_access(const fs::path& p, int mode) { return ::access(p.c_str(), mode) == 0; }

std::string detail(const ToolResult* r, const std::string& key) {
  if (!r) return {};
  auto it = r->diagnostics.find(key);
  return it == r->diagnostics.end() ? std::string() : it->second;
}

bool parses(const std::string& text) { return !jsonlite::validate_strict(text).has_value(); }

// Bracket balance outside string literals. A cheap syntax smoke test.
bool brackets_balanced(const std::string& text) {
  std::vector<char> stack;
  char quote = 0;
  for (size_t i = 0; i < text.size(); ++i) {
    const char c = text[i];
    if (quote) {
      if (c == '\\') ++i;
      else if (c == quote || c == '\n') quote = 0;
      continue;
    }
    if (c == '"' || c == '\'' || c == '`') { quote = c; continue; }
    if (c == '(' || c == '[' || c == '{') stack.push_back(c);
    if (c == ')' || c == ']' || c == '}') {
      const char open = c == ')' ? '(' : c == ']' ? '[' : '{';
      if (stack.empty() || stack.back() != open) return false;
      stack.pop_back();
    }
  }
  return stack.empty();
}

bool no_trailing_whitespace(const std::string& text) {
  std::istringstream in(text);
  std::string line;
  while (std::getline(in, line)) {
    if (!line.empty() && (line.back() == ' ' || line.back() == '\t' || line.back() == '\r')) return false;
  }
  return true;
}

bool lines_within(const std::string& text, size_t limit) {
  std::istringstream in(text);
  std::string line;
  while (std::getline(in, line)) {
    if (line.size() > limit) return false;
  }
  return true;
}

// Returns "" when the schema argument is absent, otherwise violations joined.
std::optional<std::string> schema_problem(const std::string& doc_text, const std::string& schema_text) {
  if (schema_text.empty()) return std::nullopt;
  std::optional<jsonlite::JsonError> err;
  const auto schema = jsonlite::parse_value(schema_text, &err);
  if (err) return "schema is not valid JSON: " + err->message;
  const auto doc = jsonlite::parse_value(doc_text, &err);
  if (err) return "document is not valid JSON";
  const auto violations = jsonlite::schema_violations(doc, schema);
  if (violations.empty()) return std::nullopt;
  std::string out = "schema violations: ";
  for (size_t i = 0; i < violations.size(); ++i) {
    if (i > 0) out += "; ";
    out += violations[i];
  }
  return out;
}

void verify_write_file(ReportBuilder& b, const Workspace& ws, const VerificationInput& in) {
  const std::string& rel = in.args[0];
  const Target t = inspect(ws, rel);
  const std::string content_arg = in.args.size() > 1 ? in.args[1] : "";

  b.add("critical_checks", "exists", CheckCategory::critical, t.is_regular, t.is_regular,
        "file does not exist after write");
  const bool writable = t.is_regular && can_access(*t.abs, W_OK);
  b.add("critical_checks", "writable", CheckCategory::critical, writable, writable,
        "file is not writable");
  const bool path_valid = t.abs.has_value() && !t.is_directory;
  b.add("critical_checks", "path_valid", CheckCategory::critical, path_valid, path_valid,
        "path is not a valid file path inside the workspace");

  std::string on_disk;
  if (t.is_regular) on_disk = read_bytes(*t.abs).value_or("");

  std::string expected_size = detail(in.result, "bytes_written");
  if (expected_size.empty()) expected_size = std::to_string(content_arg.size());
  const bool size_ok = std::to_string(t.size) == expected_size;
  b.add("content_checks", "size", CheckCategory::content, t.size, size_ok,
        "size mismatch: expected " + expected_size + " bytes, found " + std::to_string(t.size), true);

  std::string expected_hash = detail(in.result, "written_hash");
  if (expected_hash.empty()) expected_hash = blake3_hex(content_arg);
  const std::string actual_hash = t.is_regular ? blake3_hex(on_disk) : std::string();
  b.add("content_checks", "content_hash", CheckCategory::content, actual_hash, actual_hash == expected_hash,
        "content on disk differs from the bytes written", true);
  const bool utf8 = is_valid_utf8(on_disk);
  b.add("content_checks", "encoding_valid", CheckCategory::content, utf8, utf8,
        "content is not valid UTF-8", true);

  const std::string perm = octal_permissions(t.perms);
  const bool world_writable = (t.perms & fs::perms::others_write) != fs::perms::none;
  b.add("security_checks", "permissions", CheckCategory::security, perm, !world_writable,
        "file is world-writable (" + perm + ")", true);
  const bool owner_ok = t.exists && t.owner == static_cast<std::uint32_t>(::geteuid());
  b.add("security_checks", "owner_valid", CheckCategory::security, owner_ok, owner_ok,
        "file is owned by another user", true);
  const bool in_ws = t.abs.has_value() && ws.contains(*t.abs);
  b.add("security_checks", "in_workspace", CheckCategory::security, in_ws, in_ws,
        "file resolves outside the workspace", true);

  if (is_code_file(rel)) {
    const bool is_json = fs::path(rel).extension() == ".json";
    const bool syntax = is_json ? parses(on_disk) : brackets_balanced(on_disk);
    b.add("quality_checks", "syntax_valid", CheckCategory::quality, syntax, syntax,
          "syntax check failed");
    const bool format = no_trailing_whitespace(on_disk);
    b.add("quality_checks", "format_valid", CheckCategory::quality, format, format,
          "trailing whitespace found");
    const bool lint = lines_within(on_disk, 120);
    b.add("quality_checks", "lint_passed", CheckCategory::quality, lint, lint,
          "lines longer than 120 characters");
  } else {
    b.add("quality_checks", "syntax_valid", CheckCategory::quality, true, true);
    b.add("quality_checks", "format_valid", CheckCategory::quality, true, true);
    b.add("quality_checks", "lint_passed", CheckCategory::quality, true, true);
  }
}

void verify_read_file(ReportBuilder& b, const Workspace& ws, const VerificationInput& in) {
  const Target t = inspect(ws, in.args[0]);
  b.add(kFlatGroup, "exists", CheckCategory::critical, t.exists, t.exists, "file does not exist");
  const bool readable = t.is_regular && can_access(*t.abs, R_OK);
  b.add(kFlatGroup, "is_readable", CheckCategory::critical, readable, readable, "file is not readable");

  const std::string bytes_read = detail(in.result, "bytes_read");
  b.add(kFlatGroup, "size", CheckCategory::content, t.size, std::to_string(t.size) == bytes_read,
        "file size changed during read", true);

  std::string on_disk;
  if (readable) on_disk = read_bytes(*t.abs).value_or("");
  const bool utf8 = is_valid_utf8(on_disk);
  const bool binary_ok = detail(in.result, "strategy") == "binary_safe";
  b.add(kFlatGroup, "encoding", CheckCategory::content, std::string(utf8 ? "utf-8" : "binary"),
        utf8 || binary_ok, "content is not valid UTF-8", true);
  const bool content_valid = readable && blake3_hex(on_disk) == detail(in.result, "content_hash");
  b.add(kFlatGroup, "content_valid", CheckCategory::content, content_valid, content_valid,
        "content read differs from content on disk", true);
}

void verify_create_directory(ReportBuilder& b, const Workspace& ws, const VerificationInput& in) {
  const Target t = inspect(ws, in.args[0]);
  b.add(kFlatGroup, "exists", CheckCategory::critical, t.exists, t.exists, "directory does not exist");
  b.add(kFlatGroup, "is_directory", CheckCategory::critical, t.is_directory, t.is_directory,
        "path is not a directory");
  const bool writable = t.is_directory && can_access(*t.abs, W_OK | X_OK);
  b.add(kFlatGroup, "is_writable", CheckCategory::critical, writable, writable,
        "directory is not writable");
  const bool path_valid = t.abs.has_value() && ws.contains(*t.abs) && *t.abs != ws.root();
  b.add(kFlatGroup, "path_valid", CheckCategory::critical, path_valid, path_valid,
        "path is not a valid directory inside the workspace");
  const std::string perm = octal_permissions(t.perms);
  b.add(kFlatGroup, "permissions", CheckCategory::content, perm, !perm.empty() && perm[0] == '7',
        "owner lacks full access to directory (" + perm + ")", true);
}

void verify_delete_file(ReportBuilder& b, const Workspace& ws, const VerificationInput& in) {
  const std::string& rel = in.args[0];
  const auto abs = ws.resolve_entry(rel);
  std::error_code ec;
  const bool present = abs && fs::exists(fs::symlink_status(*abs, ec));
  b.add(kFlatGroup, "deleted", CheckCategory::critical, !present, !present, "path still exists");

  bool leftovers = false;
  if (abs) {
    const std::string prefix = "." + abs->filename().string() + ".warden-trash-";
    for (const auto& e : fs::directory_iterator(abs->parent_path(), ec)) {
      if (e.path().filename().string().rfind(prefix, 0) == 0) {
        leftovers = true;
        break;
      }
    }
  }
  const bool clear = abs.has_value() && !present && !leftovers;
  b.add(kFlatGroup, "path_clear", CheckCategory::critical, clear, clear,
        leftovers ? "trash entries remain next to the path" : "path is not clear");

  const bool existed = in.pre_state.has_value() && in.pre_state->exists;
  b.add(kFlatGroup, "existed", CheckCategory::content, existed, existed,
        "file did not exist prior to deletion.", true);
  const bool parent_writable = abs && can_access(abs->parent_path(), W_OK);
  b.add(kFlatGroup, "parent_writable", CheckCategory::content, parent_writable, parent_writable,
        "parent directory is not writable", true);
}

void verify_save_json(ReportBuilder& b, const Workspace& ws, const VerificationInput& in) {
  const Target t = inspect(ws, in.args[0]);
  b.add(kFlatGroup, "exists", CheckCategory::critical, t.is_regular, t.is_regular,
        "file does not exist after save");
  const bool readable = t.is_regular && can_access(*t.abs, R_OK);
  b.add(kFlatGroup, "is_readable", CheckCategory::critical, readable, readable, "file is not readable");

  const std::string on_disk = readable ? read_bytes(*t.abs).value_or("") : std::string();
  const bool valid = readable && parses(on_disk);
  b.add(kFlatGroup, "json_valid", CheckCategory::critical, valid, valid,
        "file on disk is not valid JSON");

  const auto problem = schema_problem(on_disk, in.args.size() > 2 ? in.args[2] : "");
  b.add(kFlatGroup, "schema_valid", CheckCategory::content, !problem.has_value(), !problem.has_value(),
        problem.value_or(""), true);

  const std::string expected = detail(in.result, "bytes_written");
  const bool size_ok = t.size > 0 && (expected.empty() || expected == std::to_string(t.size));
  b.add(kFlatGroup, "size", CheckCategory::content, t.size, size_ok,
        "saved size does not match bytes written", true);
}

void verify_load_json(ReportBuilder& b, const Workspace& ws, const VerificationInput& in) {
  const Target t = inspect(ws, in.args[0]);
  b.add(kFlatGroup, "exists", CheckCategory::critical, t.is_regular, t.is_regular, "file does not exist");

  std::string on_disk = t.is_regular ? read_bytes(*t.abs).value_or("") : std::string();
  bool valid = t.is_regular && parses(on_disk);
  if (!valid && t.is_regular && detail(in.result, "strategy") == "lenient") {
    std::string trimmed = on_disk;
    if (trimmed.compare(0, 3, "\xEF\xBB\xBF") == 0) trimmed.erase(0, 3);
    while (!trimmed.empty() && (trimmed.back() == '\0' || trimmed.back() == ' ' ||
                                trimmed.back() == '\n' || trimmed.back() == '\r' || trimmed.back() == '\t')) {
      trimmed.pop_back();
    }
    valid = parses(trimmed);
  }
  b.add(kFlatGroup, "json_valid", CheckCategory::critical, valid, valid, "file on disk is not valid JSON");

  const std::string loaded = in.result ? in.result->result : std::string();
  const bool parsed = in.result && in.result->success && parses(loaded);
  b.add(kFlatGroup, "parse_success", CheckCategory::critical, parsed, parsed,
        "loaded document could not be parsed");

  const auto problem = schema_problem(loaded, in.args.size() > 1 ? in.args[1] : "");
  b.add(kFlatGroup, "schema_valid", CheckCategory::content, !problem.has_value(), !problem.has_value(),
        problem.value_or(""), true);

  std::string type = "unknown";
  if (parsed) {
    std::optional<jsonlite::JsonError> err;
    type = jsonlite::type_name(jsonlite::parse_value(loaded, &err));
  }
  b.add(kFlatGroup, "data_type", CheckCategory::content, type, parsed, "document type unknown");
}

}  // namespace

VerificationReport VerificationEngine::verify(const std::string& tool_name,
                                              const VerificationInput& input,
                                              const OperationProfile& profile) const {
  ReportBuilder b{VerificationReport{}, profile.strictness};
  b.report.tool_name = tool_name;

  if (input.args.empty()) {
    b.add(kFlatGroup, "path_valid", CheckCategory::critical, false, false, "no target path supplied");
    return b.finish();
  }

  if (tool_name == "write_file") verify_write_file(b, workspace_, input);
  else if (tool_name == "read_file") verify_read_file(b, workspace_, input);
  else if (tool_name == "create_directory") verify_create_directory(b, workspace_, input);
  else if (tool_name == "delete_file") verify_delete_file(b, workspace_, input);
  else if (tool_name == "save_json") verify_save_json(b, workspace_, input);
  else if (tool_name == "load_json") verify_load_json(b, workspace_, input);
  else b.add(kFlatGroup, "known_tool", CheckCategory::critical, false, false, "no verification schema for " + tool_name);

  return b.finish();
}

}  // namespace warden
