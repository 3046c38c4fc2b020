#include <sys/stat.h>
#include <unistd.h>

#include <algorithm>
#include <atomic>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <set>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include "warden/batch.hpp"
#include "warden/cas.hpp"
#include "warden/config.hpp"
#include "warden/environment.hpp"
#include "warden/executor.hpp"
#include "warden/hash.hpp"
#include "warden/history.hpp"
#include "warden/jsonlite.hpp"
#include "warden/observability.hpp"
#include "warden/operation_types.hpp"
#include "warden/plan.hpp"
#include "warden/retry.hpp"
#include "warden/session.hpp"
#include "warden/tools.hpp"
#include "warden/verification.hpp"
#include "warden/version.hpp"
#include "warden/workspace.hpp"

namespace fs = std::filesystem;

namespace {
int g_tests_run = 0;
int g_tests_passed = 0;

void expect(bool condition, const std::string& message) {
  if (!condition) {
    std::cerr << "FAIL: " << message << "\n";
    std::exit(1);
  }
}

void run_test(const std::string& name, void (*fn)()) {
  std::cout << "  " << name << "...";
  fn();
  std::cout << " PASSED\n";
  g_tests_run++;
  g_tests_passed++;
}

// Fresh directory per test, removed on scope exit.
struct TempDir {
  fs::path path;
  explicit TempDir(const std::string& name) {
    static int counter = 0;
    path = fs::temp_directory_path() /
           ("warden_" + name + "_" + std::to_string(warden::now_unix_ms()) + "_" + std::to_string(++counter));
    fs::remove_all(path);
    fs::create_directories(path);
  }
  ~TempDir() {
    std::error_code ec;
    fs::remove_all(path, ec);
  }
  fs::path ws() const { return path / "ws"; }
};

std::string slurp(const fs::path& p) {
  std::ifstream ifs(p, std::ios::binary);
  return std::string((std::istreambuf_iterator<char>(ifs)), std::istreambuf_iterator<char>());
}

void spit(const fs::path& p, const std::string& data) {
  fs::create_directories(p.parent_path());
  std::ofstream ofs(p, std::ios::binary | std::ios::trunc);
  ofs << data;
}

bool contains(const std::vector<std::string>& v, const std::string& s) {
  for (const auto& x : v) {
    if (x == s) return true;
  }
  return false;
}

std::size_t count_prefix(const std::vector<std::string>& v, const std::string& prefix) {
  std::size_t n = 0;
  for (const auto& x : v) {
    if (x.rfind(prefix, 0) == 0) ++n;
  }
  return n;
}

std::size_t trash_entries(const fs::path& dir) {
  std::size_t n = 0;
  std::error_code ec;
  for (const auto& e : fs::directory_iterator(dir, ec)) {
    if (e.path().filename().string().find(".warden-trash-") != std::string::npos) ++n;
  }
  return n;
}

std::string digest_of(const std::string& descriptor) {
  const std::string rest = descriptor.substr(4);
  return rest.substr(0, rest.find(':'));
}

warden::OperationRequest op(const std::string& tool, std::vector<std::string> args,
                            const std::string& id = "", std::vector<std::string> deps = {}) {
  warden::OperationRequest r;
  r.operation_id = id;
  r.tool_name = tool;
  r.args = std::move(args);
  r.dependencies = std::move(deps);
  return r;
}

// Wraps the local primitive and injects failures per strategy and path.
class ScriptedTools : public warden::IToolPrimitive {
 public:
  explicit ScriptedTools(const warden::Workspace& ws) : ws_(ws), inner_(ws) {}

  std::set<std::string> failing;        // strategies that report failure
  std::set<std::string> throwing;       // strategies that throw
  std::set<std::string> throwing_ints;  // strategies that throw a non-exception value
  std::set<std::string> failing_paths;  // restrict injection to these targets; empty = all
  bool dirty_failures{false};           // scribble over the target before failing
  std::vector<std::string> calls;

  warden::RawOutcome invoke(const std::string& tool_name, const std::vector<std::string>& args,
                            const std::string& strategy) override {
    calls.push_back(tool_name + ":" + strategy);
    const bool targeted = failing_paths.empty() || (!args.empty() && failing_paths.count(args[0]));
    if (targeted && throwing.count(strategy)) throw std::runtime_error("injected fault in " + strategy);
    if (targeted && throwing_ints.count(strategy)) throw 42;
    if (targeted && failing.count(strategy)) {
      if (dirty_failures && !args.empty()) {
        if (auto abs = ws_.resolve(args[0])) spit(*abs, "partial garbage");
      }
      warden::RawOutcome r;
      r.error = "permission denied (injected in " + strategy + ")";
      return r;
    }
    return inner_.invoke(tool_name, args, strategy);
  }

 private:
  const warden::Workspace& ws_;
  warden::LocalToolPrimitive inner_;
};

// Accepts every backup but can never hand one back.
class LossyBackend : public warden::ICASBackend {
 public:
  explicit LossyBackend(const std::string& root) : inner_(root) {}
  std::string put(const std::string& data, const std::string& compression) override {
    return inner_.put(data, compression);
  }
  std::optional<std::string> get(const std::string&) const override { return std::nullopt; }
  bool remove(const std::string& digest) override { return inner_.remove(digest); }
  bool contains(const std::string&) const override { return false; }
  std::optional<warden::CasObjectInfo> info(const std::string&) const override { return std::nullopt; }
  std::size_t size() const override { return 0; }
  std::string backend_id() const override { return "lossy"; }

 private:
  warden::CasStore inner_;
};

// Executor wired to a scripted primitive and an in-memory history log.
struct Harness {
  warden::Workspace ws;
  warden::CasStore cas;
  LossyBackend lossy;
  ScriptedTools tools;
  warden::VerificationEngine verifier;
  warden::RetryStrategy retry;
  warden::EnvironmentStateTracker tracker;
  warden::HistoryManager history;
  std::map<std::string, warden::FinalState> final_states;
  warden::OperationExecutor executor;

  explicit Harness(const TempDir& t, bool lossy_backups = false)
      : ws(t.ws().string()),
        cas((t.path / "cas").string()),
        lossy((t.path / "lossy").string()),
        tools(ws),
        verifier(ws),
        retry(3),
        tracker(ws, lossy_backups ? static_cast<warden::ICASBackend&>(lossy)
                                  : static_cast<warden::ICASBackend&>(cas)),
        history(""),
        executor(warden::ExecutionContext{ws, tools, verifier, retry, tracker, history, final_states,
                                          "test-session", ""}) {}
};

warden::SessionConfig session_config(const TempDir& t) {
  warden::SessionConfig c;
  c.workspace_root = t.ws().string();
  c.state_dir = (t.path / "state").string();
  return c;
}

// ============================================================================
// Phase 1: Core types and hashing
// ============================================================================

void test_blake3_known_vectors() {
  expect(warden::blake3_hex("") == "af1349b9f5f9a1a6a0404dea36dcc9499bcb25c9adc112b7cc9a93cae41f3262",
         "BLAKE3 empty vector");
  expect(warden::blake3_hex("hello") == "ea8f163db38682925e4491c5e58d4bb3506ef8c14eb78a86e908c5624a67200f",
         "BLAKE3 hello vector");
}

void test_hash_runtime_info() {
  const auto info = warden::hash_runtime_info();
  expect(info.blake3_available, "BLAKE3 must be available");
  expect(info.primitive == "blake3", "primitive must be blake3");
  expect(!info.version.empty(), "version must be reported");
}

void test_domain_separation() {
  const std::string data = "backup bytes";
  expect(warden::cas_content_hash(data) == warden::hash_domain("cas:", data), "cas key uses cas: domain");
  expect(warden::cas_content_hash(data) != warden::blake3_hex(data), "cas key differs from plain hash");
  expect(warden::history_chain_hash(data) != warden::cas_content_hash(data), "hist and cas domains differ");
}

void test_file_hash_matches_bytes() {
  TempDir t("filehash");
  const fs::path f = t.path / "f.bin";
  spit(f, std::string(200000, 'x') + "tail");
  expect(warden::hash_file_blake3_hex(f.string()) == warden::blake3_hex(slurp(f)),
         "streamed file hash equals one-shot hash");
  expect(warden::hash_file_blake3_hex((t.path / "missing").string()).empty(), "missing file hashes to empty");
}

void test_enum_strings() {
  expect(warden::to_string(warden::ErrorCode::path_escape) == "path_escape", "path_escape code string");
  expect(warden::to_string(warden::ErrorCode::rollback_partial) == "rollback_partial", "rollback_partial string");
  expect(warden::to_string(warden::FinalState::rolled_back) == "rolled_back", "rolled_back string");
  expect(warden::to_string(warden::TerminationReason::operation_limit_reached) == "operation_limit_reached",
         "termination string");
}

void test_tool_result_json_is_strict() {
  warden::ToolResult r;
  r.success = true;
  r.result = "wrote \"5\" bytes\n";
  r.affected_files = {"a.txt"};
  r.rollback_info["a.txt"] = "absent";
  r.verification["critical_checks"]["exists"] = true;
  r.verification["content_checks"]["size"] = std::uint64_t{5};
  const std::string json = warden::tool_result_to_json(r);
  expect(!warden::jsonlite::validate_strict(json).has_value(), "tool result JSON must be strict JSON");
  expect(json.find("\"rollback_info\"") != std::string::npos, "rollback_info serialized");
}

// ============================================================================
// Phase 2: Backup store
// ============================================================================

void test_cas_put_get_dedup() {
  TempDir t("cas");
  warden::CasStore cas((t.path / "cas").string());
  const std::string d1 = cas.put("original file bytes");
  const std::string d2 = cas.put("original file bytes");
  expect(d1.size() == 64, "digest is 64 hex chars");
  expect(d1 == d2, "same content dedups to same digest");
  expect(cas.size() == 1, "one object stored");
  const auto back = cas.get(d1);
  expect(back.has_value() && *back == "original file bytes", "get returns stored bytes");
  expect(cas.contains(d1), "contains after put");
}

void test_cas_corruption_fails_closed() {
  TempDir t("cascorrupt");
  warden::CasStore cas((t.path / "cas").string());
  const std::string d = cas.put("important bytes");
  spit(cas.object_path(d), "tampered bytes!");
  expect(!cas.get(d).has_value(), "corrupted object must not be returned");

  // A fresh put of the same content repairs the object.
  expect(cas.put("important bytes") == d, "re-put returns same digest");
  expect(cas.get(d).value_or("") == "important bytes", "object repaired by re-put");
}

void test_cas_index_survives_reopen() {
  TempDir t("casreopen");
  std::string d;
  {
    warden::CasStore cas((t.path / "cas").string());
    d = cas.put("persisted");
  }
  warden::CasStore reopened((t.path / "cas").string());
  expect(reopened.get(d).value_or("") == "persisted", "object readable after reopen");
  const auto info = reopened.info(d);
  expect(info.has_value() && info->original_size == 9, "metadata readable after reopen");
}

void test_cas_remove_compacts_index() {
  TempDir t("casremove");
  std::string gone;
  std::string kept;
  {
    warden::CasStore cas((t.path / "cas").string());
    gone = cas.put("short lived");
    kept = cas.put("long lived");
    expect(cas.remove(gone), "remove succeeds");
    expect(!cas.contains(gone) && cas.size() == 1, "removed object gone");
    expect(cas.remove(gone), "removing an absent object is not an error");
  }
  warden::CasStore reopened((t.path / "cas").string());
  expect(reopened.size() == 1, "removed object stays gone after reopen");
  expect(!reopened.info(gone).has_value(), "no metadata for removed object");
  expect(reopened.get(kept).value_or("") == "long lived", "other object untouched");
  const std::string index = slurp(t.path / "cas" / "index.ndjson");
  expect(std::count(index.begin(), index.end(), '\n') == 1, "index holds one line");
}

#if defined(WARDEN_WITH_ZSTD)
void test_cas_zstd_backup() {
  TempDir t("caszstd");
  warden::CasStore cas((t.path / "cas").string());
  const std::string big(64 * 1024, 'a');
  const std::string d = cas.put(big, "zstd");
  const auto info = cas.info(d);
  expect(info.has_value() && info->encoding == "zstd", "compressible backup stored as zstd");
  expect(info->stored_size < info->original_size, "zstd object is smaller");
  expect(cas.get(d).value_or("") == big, "zstd object decodes to original bytes");
}
#endif

// ============================================================================
// Phase 3: JSON and workspace confinement
// ============================================================================

void test_json_duplicate_key_rejected() {
  std::optional<warden::jsonlite::JsonError> err;
  warden::jsonlite::parse("{\"a\":1,\"a\":2}", &err);
  expect(err.has_value() && err->code == "json_duplicate_key", "duplicate keys rejected");
}

void test_json_schema_violations() {
  std::optional<warden::jsonlite::JsonError> err;
  const auto schema = warden::jsonlite::parse_value(
      "{\"type\":\"object\",\"required\":[\"name\",\"port\"],"
      "\"properties\":{\"name\":{\"type\":\"string\"},\"port\":{\"type\":\"integer\"}}}",
      &err);
  expect(!err, "schema parses");
  const auto good = warden::jsonlite::parse_value("{\"name\":\"svc\",\"port\":8080}", &err);
  const auto bad = warden::jsonlite::parse_value("{\"name\":7}", &err);
  expect(warden::jsonlite::schema_violations(good, schema).empty(), "conforming document has no violations");
  expect(warden::jsonlite::schema_violations(bad, schema).size() >= 2,
         "wrong type and missing field both reported");
}

void test_workspace_confinement() {
  TempDir t("confine");
  warden::Workspace ws(t.ws().string());
  expect(ws.valid(), "workspace created");
  expect(!ws.resolve("../outside.txt").has_value(), "parent escape rejected");
  expect(!ws.resolve("/etc/passwd").has_value(), "absolute path outside rejected");
  const auto inside = ws.resolve("a/../b.txt");
  expect(inside.has_value() && ws.relative(*inside) == "b.txt", "normalized inside path");

  fs::create_directories(t.path / "elsewhere");
  fs::create_symlink(t.path / "elsewhere", t.ws() / "link");
  expect(!ws.resolve("link/x.txt").has_value(), "symlink leading out of the workspace rejected");
}

void test_workspace_resolve_entry_keeps_leaf() {
  TempDir t("entry");
  warden::Workspace ws(t.ws().string());
  spit(t.ws() / "real" / "target.txt", "T");
  fs::create_symlink("real/target.txt", t.ws() / "alias");
  fs::create_directories(t.path / "outside");
  fs::create_symlink(t.path / "outside", t.ws() / "out");

  const auto followed = ws.resolve("alias");
  expect(followed.has_value() && ws.relative(*followed) == "real/target.txt", "resolve follows the link");
  const auto entry = ws.resolve_entry("alias");
  expect(entry.has_value() && ws.relative(*entry) == "alias", "resolve_entry names the link");

  expect(!ws.resolve("out").has_value(), "escaping link target rejected");
  const auto out_entry = ws.resolve_entry("out");
  expect(out_entry.has_value() && ws.relative(*out_entry) == "out", "the link itself is inside");
  expect(!ws.resolve_entry("out/x.txt").has_value(), "parent through escaping link rejected");
  expect(!ws.resolve_entry("../x.txt").has_value(), "parent escape rejected");
  const auto root = ws.resolve_entry(".");
  expect(root.has_value() && *root == ws.root(), "dot resolves to the root");
}

// ============================================================================
// Phase 4: Verification engine
// ============================================================================

void test_verify_write_file_groups() {
  TempDir t("vwrite");
  warden::Workspace ws(t.ws().string());
  spit(t.ws() / "notes.txt", "hello");
  warden::VerificationEngine engine(ws);
  warden::VerificationInput in;
  in.args = {"notes.txt", "hello"};
  const auto report = engine.verify("write_file", in, *warden::find_profile("write_file"));
  expect(report.success, "matching file verifies");
  const auto m = report.to_map();
  expect(m.size() == 4, "write_file reports four groups");
  expect(m.count("critical_checks") && m.count("content_checks") && m.count("security_checks") &&
             m.count("quality_checks"),
         "write_file group names");
  expect(std::get<std::string>(m.at("content_checks").at("content_hash")) == warden::blake3_hex("hello"),
         "content hash is the plain BLAKE3 of the bytes");
}

void test_verify_write_file_content_mismatch_is_warning() {
  TempDir t("vmismatch");
  warden::Workspace ws(t.ws().string());
  spit(t.ws() / "notes.txt", "something else");
  warden::VerificationEngine engine(ws);
  warden::VerificationInput in;
  in.args = {"notes.txt", "hello"};
  const auto report = engine.verify("write_file", in, *warden::find_profile("write_file"));
  expect(report.success, "content checks never fail the report");
  expect(!report.warnings.empty() && !report.important_warnings.empty(), "content mismatch surfaced");
}

void test_verify_missing_target_is_critical() {
  TempDir t("vmissing");
  warden::Workspace ws(t.ws().string());
  warden::VerificationEngine engine(ws);
  warden::VerificationInput in;
  in.args = {"nothing.txt", "x"};
  const auto report = engine.verify("write_file", in, *warden::find_profile("write_file"));
  expect(!report.success, "missing written file fails");
  expect(count_prefix(report.critical_failures, "exists: ") == 1, "exists named in critical failures");
}

void test_verify_quality_only_for_code_files() {
  TempDir t("vquality");
  warden::Workspace ws(t.ws().string());
  const std::string code = "def f():   \n    return (1\n";
  spit(t.ws() / "bad.py", code);
  spit(t.ws() / "bad.txt", code);
  warden::VerificationEngine engine(ws);
  warden::VerificationInput in;
  in.args = {"bad.py", code};
  const auto py = engine.verify("write_file", in, *warden::find_profile("write_file"));
  expect(py.success, "quality failures are not fatal");
  expect(py.tally().at("quality").failed >= 2, "unbalanced bracket and trailing whitespace flagged");

  in.args = {"bad.txt", code};
  const auto txt = engine.verify("write_file", in, *warden::find_profile("write_file"));
  expect(txt.tally().at("quality").failed == 0, "quality checks pass for non-code files");
  expect(warden::is_code_file("src/main.cpp") && !warden::is_code_file("README.md"), "code file detection");
}

void test_verify_basic_strictness_skips_security() {
  TempDir t("vbasic");
  warden::Workspace ws(t.ws().string());
  fs::create_directories(t.ws() / "build");
  warden::VerificationEngine engine(ws);
  warden::VerificationInput in;
  in.args = {"build"};
  const auto report = engine.verify("create_directory", in, *warden::find_profile("create_directory"));
  expect(report.success, "existing directory verifies");
  expect(report.to_map().count("checks") == 1, "flat checks group");
  const auto tally = report.tally();
  expect(!tally.count("security") && !tally.count("quality"), "basic strictness runs critical + content only");
}

void test_verify_delete_missing_warns() {
  TempDir t("vdelete");
  warden::Workspace ws(t.ws().string());
  warden::VerificationEngine engine(ws);
  warden::VerificationInput in;
  in.args = {"ghost.txt"};
  in.pre_state = warden::FileState{};
  const auto report = engine.verify("delete_file", in, *warden::find_profile("delete_file"));
  expect(report.success, "deleting an absent file still verifies");
  expect(contains(report.important_warnings, "file did not exist prior to deletion."),
         "absent-before-delete surfaced as important warning");
}

void test_verify_read_binary_needs_binary_strategy() {
  TempDir t("vread");
  warden::Workspace ws(t.ws().string());
  const std::string bytes("\xff\xfe\x00\x01", 4);
  spit(t.ws() / "blob.bin", bytes);
  warden::VerificationEngine engine(ws);
  warden::ToolResult tr;
  tr.success = true;
  tr.diagnostics["bytes_read"] = "4";
  tr.diagnostics["content_hash"] = warden::blake3_hex(bytes);
  tr.diagnostics["strategy"] = "default";
  warden::VerificationInput in;
  in.args = {"blob.bin"};
  in.result = &tr;
  const auto text_read = engine.verify("read_file", in, *warden::find_profile("read_file"));
  expect(text_read.success && !text_read.warnings.empty(), "binary content under text read warns");

  tr.diagnostics["strategy"] = "binary_safe";
  const auto binary_read = engine.verify("read_file", in, *warden::find_profile("read_file"));
  expect(binary_read.warnings.empty(), "binary_safe read of binary content is clean");
}

void test_verify_unknown_tool_fails() {
  TempDir t("vunknown");
  warden::Workspace ws(t.ws().string());
  warden::VerificationEngine engine(ws);
  warden::VerificationInput in;
  in.args = {"x"};
  const auto report = engine.verify("launch_rocket", in, *warden::find_profile("read_file"));
  expect(!report.success, "unknown tool never verifies");
}

// ============================================================================
// Phase 5: Retry strategy
// ============================================================================

warden::AttemptRecord failed_attempt(const std::string& strategy) {
  warden::AttemptRecord a;
  a.strategy_name = strategy;
  a.result.success = false;
  return a;
}

void test_retry_first_is_default() {
  warden::RetryStrategy retry(3);
  expect(retry.next_strategy("write_file", {}).value_or("") == "default", "first strategy is default");
  expect(!retry.next_strategy("launch_rocket", {}).has_value(), "unknown tool has no strategy");
}

void test_retry_never_repeats_and_is_bounded() {
  for (std::uint32_t max : {1u, 2u, 3u, 10u}) {
    warden::RetryStrategy retry(max);
    for (const auto& profile : warden::operation_profiles()) {
      std::vector<warden::AttemptRecord> attempts;
      std::set<std::string> seen;
      while (auto s = retry.next_strategy(profile.tool_name, attempts)) {
        expect(seen.insert(*s).second, "strategy repeated for " + profile.tool_name);
        attempts.push_back(failed_attempt(*s));
        expect(attempts.size() <= 10, "runaway retry loop");
      }
      const std::size_t bound = std::min<std::size_t>(max, profile.strategies.size());
      expect(attempts.size() == bound, "attempts bounded by min(max, strategies) for " + profile.tool_name);
    }
  }
}

void test_retry_follows_profile_order() {
  warden::RetryStrategy retry(4);
  std::vector<warden::AttemptRecord> attempts = {failed_attempt("default")};
  expect(retry.next_strategy("write_file", attempts).value_or("") == "encoding", "second is encoding");
  attempts.push_back(failed_attempt("encoding"));
  expect(retry.next_strategy("write_file", attempts).value_or("") == "temp_file", "third is temp_file");
}

void test_retry_stops_after_noncritical_success() {
  warden::RetryStrategy retry(3);
  warden::AttemptRecord ok = failed_attempt("default");
  ok.result.success = true;
  expect(!retry.next_strategy("read_file", {ok}).has_value(), "no retry after success");
}

// ============================================================================
// Phase 6: Environment state tracker
// ============================================================================

void test_tracker_capture_matches_disk() {
  TempDir t("capture");
  warden::Workspace ws(t.ws().string());
  warden::CasStore cas((t.path / "cas").string());
  warden::EnvironmentStateTracker tracker(ws, cas);
  spit(t.ws() / "src" / "main.cpp", "int main() {}\n");
  fs::permissions(t.ws() / "src" / "main.cpp", fs::perms(0640), fs::perm_options::replace);

  const auto st = tracker.capture("src/main.cpp");
  expect(st.exists && !st.is_directory, "file captured");
  expect(st.size == 14, "size captured");
  expect(st.hash == warden::hash_file_blake3_hex((t.ws() / "src" / "main.cpp").string()),
         "captured hash equals independent re-hash");
  expect(st.permissions == "640", "permissions captured as octal");
  expect(!tracker.capture("nope.txt").exists, "absent path captured as absent");

  tracker.capture_workspace();
  expect(tracker.snapshot().file_states.count("src/main.cpp") == 1, "workspace walk records files");
}

void test_tracker_rollback_restores_bytes_and_removes_new_dirs() {
  TempDir t("rollback");
  warden::Workspace ws(t.ws().string());
  warden::CasStore cas((t.path / "cas").string());
  warden::EnvironmentStateTracker tracker(ws, cas);
  spit(t.ws() / "keep.txt", "original");
  fs::permissions(t.ws() / "keep.txt", fs::perms(0600), fs::perm_options::replace);

  const std::string cp = tracker.push_rollback_point("op-1");
  std::string err;
  const auto keep_info = tracker.prepare_rollback("keep.txt", "write_file", &err);
  expect(keep_info.at("keep.txt").rfind("cas:", 0) == 0, "existing file backed up by digest");
  tracker.register_rollback_info("op-1", keep_info);
  const auto new_info = tracker.prepare_rollback("a/b/new.txt", "write_file", &err);
  expect(new_info.at("a") == "absent" && new_info.at("a/b") == "absent" && new_info.at("a/b/new.txt") == "absent",
         "absent ancestors recorded");
  tracker.register_rollback_info("op-1", new_info);

  spit(t.ws() / "keep.txt", "clobbered");
  fs::permissions(t.ws() / "keep.txt", fs::perms(0666), fs::perm_options::replace);
  spit(t.ws() / "a" / "b" / "new.txt", "fresh");

  const auto rb = tracker.rollback_to(cp);
  expect(rb.ok && rb.unrestored.empty(), "full rollback");
  expect(slurp(t.ws() / "keep.txt") == "original", "bytes restored");
  expect(tracker.capture("keep.txt").permissions == "600", "permissions restored");
  expect(!fs::exists(t.ws() / "a"), "created ancestors removed");
  expect(tracker.snapshot().rollback_points.empty(), "rollback point consumed");
}

void test_tracker_rollback_recursive_delete() {
  TempDir t("rbdelete");
  warden::Workspace ws(t.ws().string());
  warden::CasStore cas((t.path / "cas").string());
  warden::EnvironmentStateTracker tracker(ws, cas);
  spit(t.ws() / "docs" / "a.md", "A");
  spit(t.ws() / "docs" / "sub" / "b.md", "B");

  const std::string cp = tracker.push_rollback_point("op-1");
  std::string err;
  const auto info = tracker.prepare_rollback("docs", "delete_file", &err);
  expect(info.at("docs") == "dir" && info.count("docs/sub/b.md") == 1, "nested entries backed up");
  tracker.register_rollback_info("op-1", info);
  fs::remove_all(t.ws() / "docs");

  expect(tracker.rollback_to(cp).ok, "delete rolled back");
  expect(slurp(t.ws() / "docs" / "sub" / "b.md") == "B", "nested file restored");
  expect(slurp(t.ws() / "docs" / "a.md") == "A", "sibling file restored");
}

void test_tracker_rejects_non_regular_backup() {
  TempDir t("fifo");
  warden::Workspace ws(t.ws().string());
  warden::CasStore cas((t.path / "cas").string());
  warden::EnvironmentStateTracker tracker(ws, cas);
  expect(::mkfifo((t.ws() / "pipe").c_str(), 0644) == 0, "mkfifo");
  std::string err;
  const auto info = tracker.prepare_rollback("pipe", "write_file", &err);
  expect(info.empty(), "fifo cannot be backed up");
  expect(err.find("non-regular") != std::string::npos, "reason names non-regular file");
}

void test_tracker_releases_backups_with_journal() {
  TempDir t("prune");
  warden::Workspace ws(t.ws().string());
  warden::CasStore cas((t.path / "cas").string());
  const std::string shared = cas.put("shared bytes");
  spit(t.ws() / "mine.txt", "mine");
  spit(t.ws() / "shared.txt", "shared bytes");
  std::string err;
  {
    warden::EnvironmentStateTracker tracker(ws, cas);
    const std::string cp = tracker.push_rollback_point("op-1");
    const auto info = tracker.prepare_rollback("mine.txt", "write_file", &err);
    tracker.register_rollback_info("op-1", info);
    const std::string mine = digest_of(info.at("mine.txt"));
    expect(cas.contains(mine) && tracker.live_backups() == 1, "backup held while journaled");
    tracker.discard_rollback_point(cp);
    expect(!cas.contains(mine) && tracker.live_backups() == 0, "backup removed with its checkpoint");

    const std::string cp2 = tracker.push_rollback_point("op-2");
    const auto info2 = tracker.prepare_rollback("mine.txt", "write_file", &err);
    tracker.register_rollback_info("op-2", info2);
    const auto info3 = tracker.prepare_rollback("shared.txt", "write_file", &err);
    tracker.register_rollback_info("op-2", info3);
    expect(digest_of(info3.at("shared.txt")) == shared, "identical bytes dedup to the existing object");
    spit(t.ws() / "mine.txt", "changed");
    expect(tracker.rollback_to(cp2).ok && slurp(t.ws() / "mine.txt") == "mine", "rolled back");
    expect(!cas.contains(digest_of(info2.at("mine.txt"))), "own backup removed after rollback");
    expect(cas.contains(shared), "object stored before the session is kept");

    tracker.push_rollback_point("op-3");
    tracker.register_rollback_info("op-3", tracker.prepare_rollback("mine.txt", "write_file", &err));
    expect(cas.size() == 2, "open checkpoint holds a backup");
  }
  expect(cas.size() == 1 && cas.contains(shared), "tracker teardown releases open checkpoints");
}

void test_tracker_symlink_delete_round_trip() {
  TempDir t("linkrb");
  warden::Workspace ws(t.ws().string());
  warden::CasStore cas((t.path / "cas").string());
  warden::EnvironmentStateTracker tracker(ws, cas);
  spit(t.ws() / "target.txt", "T");
  fs::create_symlink("target.txt", t.ws() / "link");
  spit(t.ws() / "dir" / "f.txt", "F");
  fs::create_symlink("f.txt", t.ws() / "dir" / "inner");

  const std::string cp = tracker.push_rollback_point("op-1");
  std::string err;
  const auto info = tracker.prepare_rollback("link", "delete_file", &err);
  expect(info.size() == 1 && info.at("link") == "link:target.txt", "link recorded, not its target");
  tracker.register_rollback_info("op-1", info);
  const auto dir_info = tracker.prepare_rollback("dir", "delete_file", &err);
  expect(dir_info.at("dir/inner") == "link:f.txt", "nested link backed up");
  tracker.register_rollback_info("op-1", dir_info);
  expect(tracker.capture("link").hash.empty(), "captured link has no content hash");

  fs::remove(t.ws() / "link");
  fs::remove_all(t.ws() / "dir");
  expect(tracker.rollback_to(cp).ok, "rolled back");
  expect(fs::is_symlink(fs::symlink_status(t.ws() / "link")) && fs::read_symlink(t.ws() / "link") == "target.txt",
         "link recreated");
  expect(fs::is_symlink(fs::symlink_status(t.ws() / "dir" / "inner")), "nested link recreated");
  expect(slurp(t.ws() / "target.txt") == "T", "target untouched");
}

void test_tracker_nested_checkpoints() {
  TempDir t("nested");
  warden::Workspace ws(t.ws().string());
  warden::CasStore cas((t.path / "cas").string());
  warden::EnvironmentStateTracker tracker(ws, cas);
  std::string err;

  const std::string outer = tracker.push_rollback_point("op-1");
  tracker.register_rollback_info("op-1", tracker.prepare_rollback("one.txt", "write_file", &err));
  spit(t.ws() / "one.txt", "1");
  const std::string inner = tracker.push_rollback_point("op-2");
  tracker.register_rollback_info("op-2", tracker.prepare_rollback("two.txt", "write_file", &err));
  spit(t.ws() / "two.txt", "2");

  expect(tracker.rollback_to(inner).ok, "inner rollback");
  expect(!fs::exists(t.ws() / "two.txt") && fs::exists(t.ws() / "one.txt"), "only inner changes undone");
  expect(tracker.snapshot().rollback_points.size() == 1, "outer point still held");
  expect(tracker.rollback_to(outer).ok && !fs::exists(t.ws() / "one.txt"), "outer rollback");
}

void test_tracker_suggestions() {
  TempDir t("suggest");
  warden::Workspace ws(t.ws().string());
  warden::CasStore cas((t.path / "cas").string());
  warden::EnvironmentStateTracker tracker(ws, cas);
  tracker.note_outcome("src/a.cpp", true, "");
  tracker.note_outcome("src/b.cpp", true, "");
  tracker.note_outcome("docs/x.md", true, "");
  tracker.note_outcome("../x", false, "path_escape");
  tracker.note_outcome("../y", false, "path_escape");
  tracker.note_outcome("z", false, "execution_fault");

  const auto s = tracker.suggestions();
  expect(contains(s, "Consider using these directories: src, docs"), "directories ranked by use");
  expect(contains(s, "Watch out for path_escape errors, seen 2 times"), "repeated error surfaced");
  expect(count_prefix(s, "Watch out for execution_fault") == 0, "single errors not surfaced");
  expect(tracker.stats().successes == 3 && tracker.stats().failures == 3, "stats tallied");
}

// ============================================================================
// Phase 7: Operation executor
// ============================================================================

void test_executor_write_new_file() {
  TempDir t("exwrite");
  Harness h(t);
  const auto rec = h.executor.execute(op("write_file", {"notes/todo.txt", "ship it"}));
  expect(rec.succeeded(), "write succeeds");
  expect(rec.attempts.size() == 1 && rec.attempts[0].strategy_name == "default", "one default attempt");
  expect(slurp(t.ws() / "notes" / "todo.txt") == "ship it", "content on disk");
  expect(rec.post_states.at("notes/todo.txt").hash == warden::blake3_hex("ship it"), "post state hash");
  expect(rec.operation_id == "op-1", "id assigned");
  expect(h.final_states.at("op-1") == warden::FinalState::succeeded, "final state published");
  expect(h.history.records().size() == 1, "record appended to history");
  expect(h.tracker.snapshot().rollback_points.empty(), "checkpoint discarded after success");
  expect(rec.attempts[0].state_changes.at("notes/todo.txt") == "created", "state change recorded");
}

void test_executor_prechecks_never_invoke() {
  TempDir t("exprecheck");
  Harness h(t);
  const auto escape = h.executor.execute(op("write_file", {"../outside.txt", "x"}));
  expect(escape.final_state == warden::FinalState::failed && escape.error_code == "path_escape", "path escape");
  expect(!fs::exists(t.path / "outside.txt"), "nothing written outside");

  const auto unknown = h.executor.execute(op("launch_rocket", {"x"}));
  expect(unknown.error_code == "unknown_tool", "unknown tool");

  const auto missing = h.executor.execute(op("write_file", {"only-path.txt"}));
  expect(missing.error_code == "missing_input", "missing content argument");

  const auto root = h.executor.execute(op("delete_file", {"."}));
  expect(root.error_code == "invalid_path", "workspace root is not a target");

  const auto dep = h.executor.execute(op("read_file", {"a.txt"}, "", {"op-404"}));
  expect(dep.error_code == "dependency_unmet", "unmet dependency");

  expect(h.tools.calls.empty(), "no pre-check failure reaches the primitive");
  for (const auto& r : h.history.records()) expect(r.attempts.empty(), "pre-check failures have no attempts");
}

void test_executor_recovers_from_thrown_fault() {
  TempDir t("exthrow");
  Harness h(t);
  h.tools.throwing = {"default"};
  const auto rec = h.executor.execute(op("write_file", {"a.txt", "payload"}));
  expect(rec.succeeded(), "second strategy succeeds");
  expect(rec.attempts.size() == 2, "two attempts");
  expect(rec.attempts[0].result.diagnostics.count("fault") == 1, "fault captured in diagnostics");
  expect(count_prefix(rec.warnings, "recovered on attempt 2 with strategy encoding after: default: ") == 1,
         "exactly one recovery warning naming the first failure");
}

void test_executor_contains_non_exception_throw() {
  TempDir t("exthrowint");
  Harness h(t);
  h.tools.throwing_ints = {"default"};
  const auto rec = h.executor.execute(op("write_file", {"a.txt", "payload"}));
  expect(rec.succeeded() && rec.attempts.size() == 2, "second strategy succeeds");
  expect(!rec.attempts[0].result.success, "first attempt failed");
  expect(rec.attempts[0].result.diagnostics.at("fault") == "unknown exception", "fault recorded");

  h.tools.throwing_ints = {"default", "encoding", "temp_file"};
  spit(t.ws() / "b.txt", "keep");
  const auto all = h.executor.execute(op("write_file", {"b.txt", "new"}));
  expect(all.final_state == warden::FinalState::rolled_back, "exhausted write rolled back");
  expect(slurp(t.ws() / "b.txt") == "keep", "bytes restored");
  expect(h.tracker.snapshot().rollback_points.empty(), "no checkpoint left behind");
  expect(h.history.records().size() == 2, "both operations recorded");
}

void test_executor_deletes_symlink_not_target() {
  TempDir t("exlink");
  Harness h(t);
  spit(t.ws() / "target.txt", "T");
  fs::create_symlink("target.txt", t.ws() / "link");
  spit(t.path / "outside.txt", "O");
  fs::create_symlink(t.path / "outside.txt", t.ws() / "out");

  const auto rec = h.executor.execute(op("delete_file", {"link"}));
  expect(rec.succeeded(), "link deleted");
  expect(!fs::exists(fs::symlink_status(t.ws() / "link")), "link is gone");
  expect(slurp(t.ws() / "target.txt") == "T", "link target kept");

  const auto out = h.executor.execute(op("delete_file", {"out"}));
  expect(out.succeeded(), "link pointing outside deleted");
  expect(slurp(t.path / "outside.txt") == "O", "file outside the workspace untouched");
}

void test_executor_success_releases_backups() {
  TempDir t("exprune");
  Harness h(t);
  spit(t.ws() / "a.txt", "old");
  const auto rec = h.executor.execute(op("write_file", {"a.txt", "new"}));
  expect(rec.succeeded(), "write succeeded");
  expect(h.tracker.live_backups() == 0 && h.cas.size() == 0, "no backup kept after success");

  h.tools.failing = {"default", "encoding", "temp_file"};
  const auto failed = h.executor.execute(op("write_file", {"a.txt", "newer"}));
  expect(failed.final_state == warden::FinalState::rolled_back, "rolled back");
  expect(h.cas.size() == 0, "no backup kept after rollback");
}

void test_delete_chmod_parent_restores_mode() {
  TempDir t("chmodparent");
  warden::Workspace ws(t.ws().string());
  warden::LocalToolPrimitive tools(ws);
  spit(t.ws() / "locked" / "f.txt", "x");
  const auto ro = fs::perms::owner_read | fs::perms::owner_exec | fs::perms::group_read |
                  fs::perms::group_exec | fs::perms::others_read | fs::perms::others_exec;
  fs::permissions(t.ws() / "locked", ro, fs::perm_options::replace);

  const auto out = tools.invoke("delete_file", {"locked/f.txt"}, "chmod_parent");
  const auto mode = fs::status(t.ws() / "locked").permissions() & fs::perms::mask;
  fs::permissions(t.ws() / "locked", fs::perms::owner_all, fs::perm_options::add);
  expect(out.ok, "removed");
  expect(!fs::exists(t.ws() / "locked" / "f.txt"), "file gone");
  expect(mode == ro, "parent mode put back");
}

void test_delete_rename_then_remove_leaves_no_trash() {
  TempDir t("trash");
  warden::Workspace ws(t.ws().string());
  warden::LocalToolPrimitive tools(ws);
  spit(t.ws() / "tree" / "a.txt", "A");
  const auto out = tools.invoke("delete_file", {"tree"}, "rename_then_remove");
  expect(out.ok && !fs::exists(t.ws() / "tree"), "tree removed");
  expect(trash_entries(t.ws()) == 0, "no trash after success");

  // Root ignores directory modes, so the failing remove only reproduces unprivileged.
  if (::geteuid() == 0) return;
  spit(t.ws() / "stuck" / "sub" / "f.txt", "F");
  fs::permissions(t.ws() / "stuck" / "sub", fs::perms::owner_write, fs::perm_options::remove);
  const auto stuck = tools.invoke("delete_file", {"stuck"}, "rename_then_remove");
  fs::permissions(t.ws() / "stuck" / "sub", fs::perms::owner_write, fs::perm_options::add);
  expect(!stuck.ok, "remove failure reported");
  expect(slurp(t.ws() / "stuck" / "sub" / "f.txt") == "F", "entry moved back to its path");
  expect(trash_entries(t.ws()) == 0, "no trash after failure");
}

void test_executor_read_only_write_recovers_on_third_strategy() {
  TempDir t("exreadonly");
  Harness h(t);
  spit(t.ws() / "config.txt", "old");
  h.tools.failing = {"default", "encoding"};
  const auto rec = h.executor.execute(op("write_file", {"config.txt", "new"}));
  expect(rec.succeeded(), "temp_file strategy succeeds");
  expect(rec.attempts.size() == 3 && rec.attempts.back().strategy_name == "temp_file", "third strategy");
  expect(slurp(t.ws() / "config.txt") == "new", "new content written");
  expect(count_prefix(rec.warnings, "recovered on attempt 3") == 1, "one recovery warning");
  expect(count_prefix(rec.important_warnings, "recovered on attempt 3") == 1, "recovery is user relevant");
}

void test_executor_exhausted_write_rolls_back() {
  TempDir t("exrollback");
  Harness h(t);
  spit(t.ws() / "main.cpp", "int main() { return 0; }\n");
  h.tools.failing = {"default", "encoding", "temp_file", "backup_restore"};
  h.tools.dirty_failures = true;
  const auto rec = h.executor.execute(op("write_file", {"main.cpp", "broken"}));
  expect(rec.final_state == warden::FinalState::rolled_back, "exhausted critical op rolls back");
  expect(rec.attempts.size() == 3, "bounded by max_attempts");
  expect(rec.error_code == "execution_fault", "error code");
  expect(!rec.rollback_partial, "full rollback");
  expect(slurp(t.ws() / "main.cpp") == "int main() { return 0; }\n", "original bytes restored");
  expect(rec.post_states.at("main.cpp").hash == warden::blake3_hex("int main() { return 0; }\n"),
         "tracker reflects restored state");
}

void test_executor_partial_rollback_reported() {
  TempDir t("expartial");
  Harness h(t, /*lossy_backups=*/true);
  spit(t.ws() / "data.txt", "precious");
  h.tools.failing = {"default", "encoding", "temp_file", "backup_restore"};
  h.tools.dirty_failures = true;
  const auto rec = h.executor.execute(op("write_file", {"data.txt", "x"}));
  expect(rec.final_state == warden::FinalState::rolled_back, "still rolled back");
  expect(rec.rollback_partial, "partial rollback flagged");
  expect(rec.error_code == "rollback_partial", "partial rollback error code");
  expect(rec.unrestored_paths.size() == 1 && rec.unrestored_paths[0].rfind("data.txt: ", 0) == 0,
         "unrestored path named");
  expect(count_prefix(rec.important_warnings, "partial rollback") == 1, "partial rollback surfaced");
}

void test_executor_noncritical_failure_is_failed() {
  TempDir t("exread");
  Harness h(t);
  const auto rec = h.executor.execute(op("read_file", {"absent.txt"}));
  expect(rec.final_state == warden::FinalState::failed, "read of missing file fails");
  expect(rec.attempts.size() == 2, "both read strategies tried");
  expect(rec.error_code == "execution_fault", "execution fault");
  expect(rec.checkpoint_id.empty() && h.tracker.snapshot().rollback_points.empty(), "no checkpoint for reads");
}

void test_executor_delete_missing_file_succeeds_with_warning() {
  TempDir t("exdelete");
  Harness h(t);
  const auto rec = h.executor.execute(op("delete_file", {"ghost.txt"}));
  expect(rec.succeeded(), "delete of absent file succeeds");
  expect(contains(rec.important_warnings, "file did not exist prior to deletion."), "absence surfaced");
  const auto entry = h.history.condense(rec);
  expect(contains(entry.important_warnings, "file did not exist prior to deletion."), "warning survives condensation");
}

void test_executor_lenient_json_load() {
  TempDir t("exjson");
  Harness h(t);
  spit(t.ws() / "data.json", std::string("\xEF\xBB\xBF{\"k\": 1}\n\0\0", 14));
  const auto rec = h.executor.execute(op("load_json", {"data.json"}));
  expect(rec.succeeded(), "lenient load succeeds");
  expect(rec.attempts.size() == 2 && rec.attempts[1].strategy_name == "lenient", "lenient second");
}

void test_executor_save_json_schema_warning() {
  TempDir t("exsave");
  Harness h(t);
  const auto rec = h.executor.execute(
      op("save_json", {"cfg.json", "{\"a\":1}", "{\"type\":\"object\",\"required\":[\"b\"]}"}));
  expect(rec.succeeded(), "schema violation is not fatal");
  expect(count_prefix(rec.important_warnings, "schema violations: ") == 1, "schema violation surfaced");
  expect(!warden::jsonlite::validate_strict(slurp(t.ws() / "cfg.json")).has_value(), "saved JSON is valid");
}

// ============================================================================
// Phase 8: Batch coordinator
// ============================================================================

void test_batch_failed_directory_skips_dependents() {
  TempDir t("batchdir");
  Harness h(t);
  spit(t.ws() / "out", "i am a file");
  warden::OperationBatchCoordinator coordinator(h.executor, h.final_states);
  warden::BatchRequest req;
  req.batch_id = "b1";
  req.operations = {op("create_directory", {"out"}), op("write_file", {"out/a.txt", "A"})};
  const auto result = coordinator.run(req);

  expect(result.records.size() == 2, "both members recorded");
  expect(result.records[0].final_state == warden::FinalState::rolled_back, "directory creation rolled back");
  expect(result.records[0].attempts.size() == 3, "all directory strategies tried");
  expect(result.records[1].final_state == warden::FinalState::skipped, "dependent write skipped");
  expect(result.records[1].error_code == "dependency_unmet", "skip reason code");
  expect(result.summary() == "1 rolled back, 1 skipped", "batch summary");
  expect(!result.ok(), "batch not ok");
  expect(slurp(t.ws() / "out") == "i am a file", "pre-existing file intact");
  expect(!fs::exists(t.ws() / "out" / "a.txt"), "no orphan write");
  expect(result.records[1].batch_id == "b1", "batch id stamped");
}

void test_batch_independent_members_still_run() {
  TempDir t("batchindep");
  Harness h(t);
  h.tools.failing = {"default", "encoding", "temp_file", "backup_restore"};
  h.tools.failing_paths = {"a.txt"};
  warden::OperationBatchCoordinator coordinator(h.executor, h.final_states);
  warden::BatchRequest req;
  req.batch_id = "b2";
  req.operations = {op("write_file", {"a.txt", "A"}), op("write_file", {"b.txt", "B"})};
  const auto result = coordinator.run(req);
  expect(result.counts.rolled_back == 1 && result.counts.succeeded == 1, "independent member runs");
  expect(!fs::exists(t.ws() / "a.txt") && slurp(t.ws() / "b.txt") == "B", "only the failed write undone");
  expect(h.tracker.snapshot().rollback_points.empty(), "held checkpoints released at batch end");
}

void test_batch_gate_skips_everything() {
  TempDir t("batchgate");
  Harness h(t);
  warden::OperationBatchCoordinator coordinator(h.executor, h.final_states);
  warden::BatchRequest req;
  req.batch_id = "b3";
  req.dependencies = {"op-never"};
  req.operations = {op("write_file", {"a.txt", "A"}), op("create_directory", {"d"})};
  const auto result = coordinator.run(req);
  expect(result.counts.skipped == 2, "all members skipped");
  expect(h.tools.calls.empty(), "no tool invoked behind a failed gate");
  expect(result.summary() == "2 skipped", "gate summary");
}

void test_batch_start_gate_cuts_off() {
  TempDir t("batchcut");
  Harness h(t);
  warden::OperationBatchCoordinator coordinator(h.executor, h.final_states);
  warden::BatchRequest req;
  req.batch_id = "b4";
  req.operations = {op("write_file", {"1.txt", "1"}), op("write_file", {"2.txt", "2"}),
                    op("write_file", {"3.txt", "3"})};
  int budget = 1;
  const auto result = coordinator.run(req, [&]() { return budget-- > 0; });
  expect(result.counts.succeeded == 1 && result.counts.not_started == 2, "cut off after one start");
  expect(result.summary() == "1 succeeded, 2 not started", "cut-off summary");
  warden::BatchResult empty;
  expect(empty.summary() == "empty batch" && empty.ok(), "empty batch summary");
}

// ============================================================================
// Phase 9: Session loop, review and durable history
// ============================================================================

void test_session_happy_path_review() {
  TempDir t("sessok");
  warden::SessionLoop loop(session_config(t));
  warden::SessionPlan plan;
  plan.goal = "scaffold";
  plan.steps.emplace_back(op("create_directory", {"src"}, "mk"));
  plan.steps.emplace_back(op("write_file", {"src/main.cpp", "int main() { return 0; }\n"}, "w", {"mk"}));
  plan.steps.emplace_back(op("read_file", {"src/main.cpp"}, "r", {"w"}));
  const auto out = loop.run(plan);

  expect(out.termination == warden::TerminationReason::completed, "completed");
  expect(out.all_succeeded, "all succeeded");
  expect(out.review.succeeded == 3 && out.review.planned == 3, "review counts");
  expect(out.review.environment_changes.at("src/main.cpp") == "created", "net change recorded");
  expect(out.review.changes.size() == 3 && out.review.changes[1].verification == "passed", "change lines");
  const std::string json = out.review.to_json();
  expect(!warden::jsonlite::validate_strict(json).has_value(), "review JSON is strict");
  expect(json.find("\"termination\":\"completed\"") != std::string::npos, "termination in JSON");
  expect(contains(out.review.follow_ups, "Consider using these directories: src"), "suggestions included");
}

void test_session_operation_limit() {
  TempDir t("sesslimit");
  auto cfg = session_config(t);
  cfg.max_operations = 2;
  warden::SessionLoop loop(cfg);
  warden::SessionPlan plan;
  for (int i = 0; i < 4; ++i) plan.steps.emplace_back(op("write_file", {std::to_string(i) + ".txt", "x"}));
  const auto out = loop.run(plan);
  expect(out.termination == warden::TerminationReason::operation_limit_reached, "limit reached");
  expect(out.records.size() == 2, "two operations ran");
  expect(out.review.not_started == 2 && out.review.not_started_operations.size() == 2, "rest not started");
  expect(!out.all_succeeded, "limit means not all succeeded");
  expect(!fs::exists(t.ws() / "2.txt"), "third op never ran");
}

warden::CancellationToken* g_cancel = nullptr;

void cancel_on_first_event(const warden::OperationEvent&) {
  if (g_cancel) g_cancel->cancel();
}

void test_session_cancellation_between_operations() {
  TempDir t("sesscancel");
  warden::SessionLoop loop(session_config(t));
  warden::SessionPlan plan;
  for (int i = 0; i < 3; ++i) plan.steps.emplace_back(op("write_file", {std::to_string(i) + ".txt", "x"}));

  warden::CancellationToken pre;
  pre.cancel();
  const auto none = loop.run(plan, &pre);
  expect(none.termination == warden::TerminationReason::cancelled && none.records.empty(), "cancelled upfront");
  expect(none.review.not_started == 3, "everything not started");

  warden::CancellationToken mid;
  g_cancel = &mid;
  warden::set_operation_event_hook(cancel_on_first_event);
  const auto one = loop.run(plan, &mid);
  warden::set_operation_event_hook(nullptr);
  g_cancel = nullptr;
  expect(one.termination == warden::TerminationReason::cancelled, "cancelled mid-session");
  expect(one.records.size() == 1 && one.records[0].succeeded(), "running operation finished");
  expect(one.review.not_started == 2, "remaining operations not started");
}

void test_session_rejects_bad_config() {
  TempDir t("sessreject");
  auto cfg = session_config(t);
  cfg.state_dir = cfg.workspace_root;
  warden::SessionLoop loop(cfg);
  warden::SessionPlan plan;
  plan.steps.emplace_back(op("write_file", {"a.txt", "x"}));
  const auto out = loop.run(plan);
  expect(out.termination == warden::TerminationReason::rejected, "rejected");
  expect(out.records.empty() && !fs::exists(t.ws() / "a.txt"), "nothing ran");
  expect(count_prefix(out.review.warnings, "config_invalid: ") == 1, "reason in review");
}

void test_session_rejects_state_dir_inside_workspace() {
  TempDir t("sessnested");
  auto cfg = session_config(t);
  cfg.state_dir = (t.ws() / ".warden").string();
  warden::SessionLoop loop(cfg);
  warden::SessionPlan plan;
  plan.steps.emplace_back(op("write_file", {"a.txt", "x"}));
  plan.steps.emplace_back(op("delete_file", {".warden"}));
  const auto out = loop.run(plan);
  expect(out.termination == warden::TerminationReason::rejected, "rejected");
  expect(out.records.empty() && !fs::exists(t.ws() / "a.txt"), "nothing ran");
  expect(contains(out.review.warnings, "config_invalid: state_dir must not lie inside workspace_root"),
         "reason in review");
}

void test_session_survives_non_exception_throw() {
  TempDir t("sessthrowint");
  auto cfg = session_config(t);
  warden::Workspace ws(cfg.workspace_root);
  auto scripted = std::make_unique<ScriptedTools>(ws);
  scripted->throwing_ints = {"default", "encoding", "temp_file", "backup_restore"};
  scripted->failing_paths = {"a.txt"};
  warden::SessionLoop loop(cfg, std::move(scripted));

  warden::SessionPlan plan;
  plan.steps.emplace_back(op("write_file", {"a.txt", "A"}));
  plan.steps.emplace_back(op("write_file", {"b.txt", "B"}));
  const auto out = loop.run(plan);
  expect(out.termination == warden::TerminationReason::completed, "session ran to the end");
  expect(out.records.size() == 2, "both operations recorded");
  expect(out.records[0].final_state == warden::FinalState::rolled_back, "faulting write rolled back");
  expect(out.records[1].succeeded() && slurp(t.ws() / "b.txt") == "B", "next operation still ran");
  std::string err;
  const auto entries = warden::load_history(cfg.history_path(), &err);
  expect(entries.has_value() && entries->size() == 2, "both entries in durable history");
}

void test_session_history_matches_records() {
  TempDir t("sesshist");
  auto cfg = session_config(t);
  warden::Workspace ws(cfg.workspace_root);
  auto scripted = std::make_unique<ScriptedTools>(ws);
  scripted->failing = {"default", "encoding"};
  scripted->failing_paths = {"b.txt"};
  warden::SessionLoop loop(cfg, std::move(scripted));

  warden::SessionPlan plan;
  plan.steps.emplace_back(op("write_file", {"a.txt", "A"}));
  plan.steps.emplace_back(op("write_file", {"b.txt", "B"}));
  plan.steps.emplace_back(op("read_file", {"missing.txt"}));
  const auto out = loop.run(plan);
  expect(out.records.size() == 3, "three records");

  std::string err;
  const auto entries = warden::load_history(cfg.history_path(), &err);
  expect(entries.has_value(), "history loads: " + err);
  expect(entries->size() == 3, "one durable entry per operation");
  for (std::size_t i = 0; i < entries->size(); ++i) {
    expect((*entries)[i].attempt_count == out.records[i].attempts.size(), "attempt_count equals attempts");
    expect((*entries)[i].sequence == i + 1, "sequence is monotonic");
  }
  expect((*entries)[1].attempt_count == 3, "recovered write took three attempts");
  expect(count_prefix((*entries)[1].important_warnings, "recovered on attempt 3") == 1, "recovery kept");
  expect((*entries)[2].summary == "read_file missing.txt: failed after 2 attempts (execution_fault)",
         "condensed summary");
  expect(warden::verify_history_chain(cfg.history_path()).ok, "chain verifies");
}

void test_history_resumes_and_detects_tamper() {
  TempDir t("histtamper");
  auto cfg = session_config(t);
  {
    warden::SessionLoop loop(cfg);
    warden::SessionPlan plan;
    plan.steps.emplace_back(op("write_file", {"a.txt", "A"}));
    plan.steps.emplace_back(op("write_file", {"b.txt", "B"}));
    loop.run(plan);
  }
  {
    warden::SessionLoop loop(cfg);
    warden::SessionPlan plan;
    plan.steps.emplace_back(op("delete_file", {"a.txt"}));
    loop.run(plan);
  }
  const auto v = warden::verify_history_chain(cfg.history_path());
  expect(v.ok && v.entries == 3, "chain spans sessions");

  std::string log = slurp(cfg.history_path());
  const auto pos = log.find("a.txt");
  expect(pos != std::string::npos, "entry present");
  log.replace(pos, 5, "z.txt");
  spit(cfg.history_path(), log);
  const auto tampered = warden::verify_history_chain(cfg.history_path());
  expect(!tampered.ok && tampered.first_bad_sequence == 2, "tampered first entry breaks the second link");
}

void test_history_entry_json_and_version() {
  warden::HistoryEntry e;
  e.sequence = 7;
  e.previous_digest = std::string(64, '0');
  e.operation_id = "op-7";
  e.tool_name = "write_file";
  e.summary = "write_file a.txt: succeeded after 1 attempt";
  e.success = true;
  e.final_state = "succeeded";
  e.attempt_count = 1;
  e.state_changes["a.txt"] = "created";
  const auto back = warden::history_entry_from_json(warden::history_entry_to_json(e));
  expect(back.has_value() && back->sequence == 7 && back->state_changes.at("a.txt") == "created",
         "history entry parses back");
  expect(!warden::version::check_history_log_version(warden::version::HISTORY_LOG_VERSION + 1).ok,
         "newer history version rejected");

  warden::FileState absent, file;
  file.exists = true;
  file.hash = "h1";
  warden::FileState changed = file;
  changed.hash = "h2";
  expect(warden::net_state_change(absent, file) == "created", "created");
  expect(warden::net_state_change(file, absent) == "deleted", "deleted");
  expect(warden::net_state_change(file, changed) == "modified", "modified");
  expect(warden::net_state_change(file, file) == "unchanged", "unchanged");
}

void test_session_partial_rollback_in_review() {
  TempDir t("sesspartial");
  auto cfg = session_config(t);
  warden::Workspace ws(cfg.workspace_root);
  spit(t.ws() / "keep.txt", "keep");
  auto scripted = std::make_unique<ScriptedTools>(ws);
  scripted->failing = {"default", "encoding", "temp_file", "backup_restore"};
  scripted->dirty_failures = true;
  LossyBackend lossy((t.path / "lossy").string());
  warden::SessionLoop loop(cfg, std::move(scripted));
  loop.set_backup_store(&lossy);

  warden::SessionPlan plan;
  plan.steps.emplace_back(op("write_file", {"keep.txt", "new"}));
  const auto out = loop.run(plan);
  expect(out.review.rolled_back == 1, "rolled back");
  expect(out.review.partial_rollbacks.size() == 1, "partial rollback listed");
  expect(count_prefix(out.review.follow_ups, "Inspect 1 unrestored path(s)") == 1, "follow-up suggested");
}

void test_concurrent_sessions_serialize() {
  TempDir t("sessconc");
  auto cfg = session_config(t);
  std::atomic<int> succeeded{0};
  auto worker = [&](int n) {
    warden::SessionLoop loop(cfg);
    warden::SessionPlan plan;
    for (int i = 0; i < 5; ++i) {
      plan.steps.emplace_back(op("write_file", {"t" + std::to_string(n) + "_" + std::to_string(i) + ".txt", "x"}));
    }
    if (loop.run(plan).all_succeeded) succeeded.fetch_add(1);
  };
  std::thread a(worker, 1);
  std::thread b(worker, 2);
  a.join();
  b.join();
  expect(succeeded.load() == 2, "both sessions succeed");
  const auto v = warden::verify_history_chain(cfg.history_path());
  expect(v.ok && v.entries == 10, "serialized sessions keep one valid chain");
}

// ============================================================================
// Phase 10: Configuration
// ============================================================================

void test_config_validation() {
  const auto ok = warden::validate_config("{\"config_version\":\"1\",\"max_operations\":5}");
  expect(ok.ok && ok.errors.empty() && ok.warnings.empty(), "minimal config valid");

  const auto unknown = warden::validate_config("{\"config_version\":\"1\",\"colour\":\"blue\"}");
  expect(unknown.ok && unknown.warnings.size() == 1, "unknown key is a warning");

  const auto missing = warden::validate_config("{}");
  expect(missing.ok && missing.config_version == "1" && !missing.warnings.empty(), "missing version warns");

  expect(!warden::validate_config("{\"config_version\":\"2\"}").ok, "future version rejected");
  expect(!warden::validate_config("{\"max_attempts\":0}").ok, "zero attempts rejected");
  expect(!warden::validate_config("{\"max_operations\":\"many\"}").ok, "wrong type rejected");
  expect(!warden::validate_config("{\"backup_compression\":\"lz4\"}").ok, "unknown compression rejected");
  expect(!warden::validate_config("not json").ok, "parse error rejected");
}

void test_config_apply_and_env() {
  warden::SessionConfig c;
  const auto r = warden::apply_config_json("{\"max_attempts\":4,\"state_dir\":\"/tmp/w-state\"}", c);
  expect(r.ok && c.max_attempts == 4 && c.state_dir == "/tmp/w-state", "config applied");
  expect(c.history_path() == "/tmp/w-state/history.ndjson", "history path derived from state dir");
  expect(c.cas_root() == "/tmp/w-state/cas/v2", "cas root derived from state dir");

  warden::SessionConfig untouched;
  expect(!warden::apply_config_json("{\"max_attempts\":99}", untouched).ok, "invalid overlay rejected");
  expect(untouched.max_attempts == 3, "invalid overlay leaves config untouched");

  ::setenv("WARDEN_MAX_ATTEMPTS", "5", 1);
  ::setenv("WARDEN_MAX_OPERATIONS", "abc", 1);
  const auto env = warden::SessionConfig::from_env();
  ::unsetenv("WARDEN_MAX_ATTEMPTS");
  ::unsetenv("WARDEN_MAX_OPERATIONS");
  expect(env.max_attempts == 5, "env overrides default");
  expect(env.max_operations == 25, "malformed env ignored");

  warden::SessionConfig same;
  same.workspace_root = "/tmp/w-same";
  same.state_dir = "/tmp/w-same";
  expect(!warden::check_session_config(same).empty(), "state dir equal to workspace refused");
}

void test_config_state_dir_disjoint_from_workspace() {
  TempDir t("cfgnest");
  warden::SessionConfig c;
  c.workspace_root = (t.path / "ws").string();
  c.state_dir = (t.path / "state").string();
  expect(warden::check_session_config(c).empty(), "sibling directories accepted");

  c.state_dir = (t.path / "ws" / ".warden").string();
  const auto nested = warden::check_session_config(c);
  expect(contains(nested, "state_dir must not lie inside workspace_root"), "state dir inside workspace refused");

  c.state_dir = t.path.string();
  const auto outer = warden::check_session_config(c);
  expect(contains(outer, "workspace_root must not lie inside state_dir"), "workspace inside state dir refused");

  c.state_dir = (t.path / "state").string();
  c.history_log_path = (t.path / "ws" / "logs" / "history.ndjson").string();
  expect(contains(warden::check_session_config(c), "history_log_path must not lie inside workspace_root"),
         "history log inside workspace refused");

  c.history_log_path.clear();
  c.workspace_root = (t.path / "ws-other").string();
  c.state_dir = (t.path / "ws").string();
  expect(warden::check_session_config(c).empty(), "shared name prefix is not nesting");
}

// ============================================================================
// Phase 11: Plan readers
// ============================================================================

void test_parse_plan_json() {
  std::string err;
  const auto plan = warden::parse_plan_json(
      "{\"goal\":\"g\",\"steps\":["
      "{\"id\":\"a\",\"tool\":\"save_json\",\"args\":[\"c.json\",{\"k\":[1,2]}]},"
      "{\"dependencies\":[\"a\"],\"operations\":[{\"tool\":\"create_directory\",\"args\":[\"d\"]}]}]}",
      &err);
  expect(plan.has_value(), "plan parses: " + err);
  expect(plan->goal == "g" && plan->steps.size() == 2, "goal and steps");
  const auto& first = std::get<warden::OperationRequest>(plan->steps[0]);
  expect(first.args[1] == "{\"k\":[1,2]}", "inline JSON arg serialized canonically");
  const auto& batch = std::get<warden::BatchRequest>(plan->steps[1]);
  expect(batch.batch_id == "batch-2" && batch.dependencies.size() == 1, "default batch id and deps");

  expect(!warden::parse_plan_json("{\"goal\":\"g\"}", &err).has_value(), "steps required");
  expect(err.rfind("schema_mismatch: ", 0) == 0, "schema_mismatch error");
  expect(!warden::parse_plan_json("{\"steps\":[{\"args\":[]}]}", &err).has_value(), "tool required");
  expect(!warden::parse_plan_json("{", &err).has_value() && err.rfind("json_parse_error", 0) == 0,
         "parse error code");
}

void test_parse_tool_script() {
  std::string err;
  const auto plan = warden::parse_tool_script(
      "I will create the file.\n"
      "%%tool write_file\n%%path notes.txt\n%%content\n\n  hello world  \n%%end\n"
      "and then read it back\n"
      "%%tool read_file\n%%path notes.txt\n%%end\n",
      "notes", &err);
  expect(plan.has_value() && plan->steps.size() == 2, "two blocks parsed");
  const auto& w = std::get<warden::OperationRequest>(plan->steps[0]);
  expect(w.tool_name == "write_file" && w.args.size() == 2 && w.args[1] == "hello world", "content trimmed");
  const auto& r = std::get<warden::OperationRequest>(plan->steps[1]);
  expect(r.tool_name == "read_file" && r.args.size() == 1, "contentless block");

  expect(!warden::parse_tool_script("just prose", "g", &err).has_value(), "no blocks");
  expect(err.rfind("missing_input: ", 0) == 0, "missing_input error");
  expect(!warden::parse_tool_script("%%tool write_file\n%%path a\n%%content\nx", "g", &err).has_value(),
         "unterminated content rejected");
}

// ============================================================================
// Phase 12: Observability
// ============================================================================

void test_engine_stats_record_and_serialize() {
  warden::EngineStats stats;
  warden::OperationEvent ok;
  ok.final_state = "succeeded";
  ok.ok = true;
  ok.attempts = 3;
  ok.duration_ns = 1500000;
  warden::OperationEvent rb;
  rb.final_state = "rolled_back";
  rb.error_code = "rollback_partial";
  rb.rollback_partial = true;
  rb.attempts = 3;
  stats.record_operation(ok);
  stats.record_operation(rb);
  stats.record_operation(rb);

  expect(stats.total_operations.load() == 3 && stats.succeeded.load() == 1, "operation counters");
  expect(stats.rolled_back.load() == 2 && stats.partial_rollbacks.load() == 2, "rollback counters");
  expect(stats.recovered_by_retry.load() == 1 && stats.total_attempts.load() == 9, "retry counters");
  expect(stats.failure_categories().at("rollback_partial") == 2, "failure categories");
  expect(!warden::jsonlite::validate_strict(stats.to_json()).has_value(), "stats JSON is strict");

  for (int i = 0; i < 300; ++i) stats.record_operation(ok);
  expect(stats.recent_events_snapshot().size() == warden::EngineStats::kMaxRecentEvents, "ring is bounded");
  stats.reset();
  expect(stats.total_operations.load() == 0 && stats.recent_events_snapshot().empty(), "reset clears");
}

void test_event_log_sink() {
  TempDir t("events");
  const std::string log = (t.path / "events.ndjson").string();
  warden::OperationEvent ev;
  ev.session_id = "s-1";
  ev.operation_id = "op-1";
  ev.tool_name = "write_file";
  ev.final_state = "succeeded";
  ev.ok = true;
  ev.attempts = 1;
  warden::emit_operation_event(ev, log);
  warden::emit_operation_event(ev, log);
  const std::string text = slurp(log);
  const auto nl = text.find('\n');
  expect(nl != std::string::npos && text.find('\n', nl + 1) == text.size() - 1, "one line per event");
  expect(!warden::jsonlite::validate_strict(text.substr(0, nl)).has_value(), "event line is strict JSON");
  expect(text.find("\"operation_id\":\"op-1\"") != std::string::npos, "event carries operation id");
}

void test_version_manifest() {
  const auto m = warden::version::current_manifest();
  expect(m.cas_format == 2 && m.history_log == 1, "format versions");
  expect(!warden::jsonlite::validate_strict(warden::version::manifest_to_json(m)).has_value(), "manifest JSON");
}

}  // namespace

int main() {
  std::cout << "=== warden_tests ===\n";

  std::cout << "\n[Phase 1] Core types and hashing\n";
  run_test("BLAKE3 known vectors", test_blake3_known_vectors);
  run_test("hash runtime info", test_hash_runtime_info);
  run_test("domain separation", test_domain_separation);
  run_test("file hash matches bytes", test_file_hash_matches_bytes);
  run_test("enum strings", test_enum_strings);
  run_test("tool result JSON is strict", test_tool_result_json_is_strict);

  std::cout << "\n[Phase 2] Backup store\n";
  run_test("CAS put/get/dedup", test_cas_put_get_dedup);
  run_test("CAS corruption fails closed", test_cas_corruption_fails_closed);
  run_test("CAS index survives reopen", test_cas_index_survives_reopen);
  run_test("CAS remove compacts index", test_cas_remove_compacts_index);
#if defined(WARDEN_WITH_ZSTD)
  run_test("CAS zstd backup", test_cas_zstd_backup);
#endif

  std::cout << "\n[Phase 3] JSON and workspace confinement\n";
  run_test("duplicate key rejected", test_json_duplicate_key_rejected);
  run_test("schema violations", test_json_schema_violations);
  run_test("workspace confinement", test_workspace_confinement);
  run_test("resolve_entry keeps the leaf", test_workspace_resolve_entry_keeps_leaf);

  std::cout << "\n[Phase 4] Verification engine\n";
  run_test("write_file groups", test_verify_write_file_groups);
  run_test("content mismatch is a warning", test_verify_write_file_content_mismatch_is_warning);
  run_test("missing target is critical", test_verify_missing_target_is_critical);
  run_test("quality only for code files", test_verify_quality_only_for_code_files);
  run_test("basic strictness skips security", test_verify_basic_strictness_skips_security);
  run_test("delete of missing file warns", test_verify_delete_missing_warns);
  run_test("binary read needs binary_safe", test_verify_read_binary_needs_binary_strategy);
  run_test("unknown tool fails", test_verify_unknown_tool_fails);

  std::cout << "\n[Phase 5] Retry strategy\n";
  run_test("first strategy is default", test_retry_first_is_default);
  run_test("never repeats, bounded", test_retry_never_repeats_and_is_bounded);
  run_test("follows profile order", test_retry_follows_profile_order);
  run_test("stops after non-critical success", test_retry_stops_after_noncritical_success);

  std::cout << "\n[Phase 6] Environment state tracker\n";
  run_test("capture matches disk", test_tracker_capture_matches_disk);
  run_test("rollback restores bytes, removes new dirs", test_tracker_rollback_restores_bytes_and_removes_new_dirs);
  run_test("rollback of recursive delete", test_tracker_rollback_recursive_delete);
  run_test("non-regular file backup refused", test_tracker_rejects_non_regular_backup);
  run_test("backups released with the journal", test_tracker_releases_backups_with_journal);
  run_test("symlink delete round trip", test_tracker_symlink_delete_round_trip);
  run_test("nested checkpoints", test_tracker_nested_checkpoints);
  run_test("suggestions", test_tracker_suggestions);

  std::cout << "\n[Phase 7] Operation executor\n";
  run_test("write new file", test_executor_write_new_file);
  run_test("pre-checks never invoke", test_executor_prechecks_never_invoke);
  run_test("recovers from thrown fault", test_executor_recovers_from_thrown_fault);
  run_test("contains non-exception throw", test_executor_contains_non_exception_throw);
  run_test("deletes symlink, not target", test_executor_deletes_symlink_not_target);
  run_test("success releases backups", test_executor_success_releases_backups);
  run_test("chmod_parent restores parent mode", test_delete_chmod_parent_restores_mode);
  run_test("rename_then_remove leaves no trash", test_delete_rename_then_remove_leaves_no_trash);
  run_test("read-only write recovers on third strategy", test_executor_read_only_write_recovers_on_third_strategy);
  run_test("exhausted write rolls back", test_executor_exhausted_write_rolls_back);
  run_test("partial rollback reported", test_executor_partial_rollback_reported);
  run_test("non-critical failure is FAILED", test_executor_noncritical_failure_is_failed);
  run_test("delete missing file warns", test_executor_delete_missing_file_succeeds_with_warning);
  run_test("lenient JSON load", test_executor_lenient_json_load);
  run_test("save_json schema warning", test_executor_save_json_schema_warning);

  std::cout << "\n[Phase 8] Batch coordinator\n";
  run_test("failed directory skips dependents", test_batch_failed_directory_skips_dependents);
  run_test("independent members still run", test_batch_independent_members_still_run);
  run_test("gate skips everything", test_batch_gate_skips_everything);
  run_test("start gate cuts off", test_batch_start_gate_cuts_off);

  std::cout << "\n[Phase 9] Session loop and durable history\n";
  run_test("happy path review", test_session_happy_path_review);
  run_test("operation limit", test_session_operation_limit);
  run_test("cancellation between operations", test_session_cancellation_between_operations);
  run_test("bad config rejected", test_session_rejects_bad_config);
  run_test("state dir inside workspace rejected", test_session_rejects_state_dir_inside_workspace);
  run_test("survives non-exception throw", test_session_survives_non_exception_throw);
  run_test("history matches records", test_session_history_matches_records);
  run_test("history resumes and detects tamper", test_history_resumes_and_detects_tamper);
  run_test("history entry JSON and version", test_history_entry_json_and_version);
  run_test("partial rollback in review", test_session_partial_rollback_in_review);
  run_test("concurrent sessions serialize", test_concurrent_sessions_serialize);

  std::cout << "\n[Phase 10] Configuration\n";
  run_test("config validation", test_config_validation);
  run_test("config apply and env", test_config_apply_and_env);
  run_test("state dir disjoint from workspace", test_config_state_dir_disjoint_from_workspace);

  std::cout << "\n[Phase 11] Plan readers\n";
  run_test("plan JSON", test_parse_plan_json);
  run_test("tool script", test_parse_tool_script);

  std::cout << "\n[Phase 12] Observability\n";
  run_test("engine stats", test_engine_stats_record_and_serialize);
  run_test("event log sink", test_event_log_sink);
  run_test("version manifest", test_version_manifest);

  std::cout << "\n=== " << g_tests_passed << "/" << g_tests_run << " tests passed ===\n";
  return g_tests_passed == g_tests_run ? 0 : 1;
}
