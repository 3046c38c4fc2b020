#include <cstdlib>
#include <fstream>
#include <iostream>
#include <string>
#include <vector>

#include "warden/config.hpp"
#include "warden/hash.hpp"
#include "warden/history.hpp"
#include "warden/jsonlite.hpp"
#include "warden/observability.hpp"
#include "warden/operation_types.hpp"
#include "warden/plan.hpp"
#include "warden/session.hpp"
#include "warden/verification.hpp"
#include "warden/version.hpp"
#include "warden/workspace.hpp"

namespace {

constexpr int kExitOk = 0;
constexpr int kExitUsage = 1;
constexpr int kExitIncomplete = 2;

bool read_file(const std::string& path, std::string* out) {
  std::ifstream ifs(path, std::ios::binary);
  if (!ifs) return false;
  out->assign((std::istreambuf_iterator<char>(ifs)), std::istreambuf_iterator<char>());
  return true;
}

std::string arg_value(int argc, char** argv, const std::string& flag, const std::string& def = "") {
  for (int i = 1; i + 1 < argc; ++i) {
    if (argv[i] == flag) return argv[i + 1];
  }
  return def;
}

bool has_flag(int argc, char** argv, const std::string& flag) {
  for (int i = 1; i < argc; ++i) {
    if (argv[i] == flag) return true;
  }
  return false;
}

void print_error(const std::string& code, const std::string& message) {
  std::cerr << "{\"error\":\"" << code << "\",\"message\":\"" << warden::jsonlite::escape(message) << "\"}\n";
}

void usage() {
  std::cerr << "usage: warden <command> [options]\n"
               "  run --plan FILE [--workspace DIR] [--state-dir DIR] [--config FILE]\n"
               "      [--max-operations N] [--max-attempts N]\n"
               "  script --file FILE [--goal TEXT] [same options as run]\n"
               "  verify --tool TOOL --path PATH [--content TEXT] [--workspace DIR]\n"
               "  history [--log FILE] [--state-dir DIR] [--verify]\n"
               "  health | stats | version\n"
               "  config validate --file FILE\n";
}

// Defaults, then WARDEN_* env, then --config, then flags.
bool load_config(int argc, char** argv, warden::SessionConfig* config) {
  *config = warden::SessionConfig::from_env();
  const std::string config_file = arg_value(argc, argv, "--config");
  if (!config_file.empty()) {
    std::string text;
    if (!read_file(config_file, &text)) {
      print_error("config_invalid", "cannot read " + config_file);
      return false;
    }
    const auto r = warden::apply_config_json(text, *config);
    if (!r.ok) {
      print_error("config_invalid", r.errors.empty() ? "invalid config" : r.errors.front());
      return false;
    }
  }
  const std::string ws = arg_value(argc, argv, "--workspace");
  if (!ws.empty()) config->workspace_root = ws;
  const std::string sd = arg_value(argc, argv, "--state-dir");
  if (!sd.empty()) config->state_dir = sd;
  const std::string ev = arg_value(argc, argv, "--event-log");
  if (!ev.empty()) config->event_log_path = ev;
  const std::string max_ops = arg_value(argc, argv, "--max-operations");
  if (!max_ops.empty()) config->max_operations = static_cast<std::uint32_t>(std::strtoul(max_ops.c_str(), nullptr, 10));
  const std::string max_att = arg_value(argc, argv, "--max-attempts");
  if (!max_att.empty()) config->max_attempts = static_cast<std::uint32_t>(std::strtoul(max_att.c_str(), nullptr, 10));

  const auto errors = warden::check_session_config(*config);
  if (!errors.empty()) {
    print_error("config_invalid", errors.front());
    return false;
  }
  return true;
}

int run_plan(const warden::SessionConfig& config, const warden::SessionPlan& plan) {
  warden::SessionLoop loop(config);
  const warden::SessionOutcome outcome = loop.run(plan);
  std::cout << outcome.review.to_json() << "\n";
  return outcome.all_succeeded ? kExitOk : kExitIncomplete;
}

}  // namespace

int main(int argc, char** argv) {
  std::string cmd;
  for (int i = 1; i < argc; ++i) {
    if (std::string(argv[i]).rfind("--", 0) == 0) continue;
    cmd = argv[i];
    break;
  }
  if (cmd.empty()) {
    usage();
    return kExitUsage;
  }

  if (cmd == "health") {
    const auto h = warden::hash_runtime_info();
    std::cout << "{\"hash_primitive\":\"" << h.primitive << "\",\"hash_version\":\"" << h.version
              << "\",\"hash_available\":" << (h.blake3_available ? "true" : "false")
              << ",\"cas_version\":\"v" << warden::version::CAS_FORMAT_VERSION << "\""
              << ",\"compression_capabilities\":[\"identity\"";
#if defined(WARDEN_WITH_ZSTD)
    std::cout << ",\"zstd\"";
#endif
    std::cout << "],\"tools\":[";
    const auto& profiles = warden::operation_profiles();
    for (std::size_t i = 0; i < profiles.size(); ++i) {
      if (i > 0) std::cout << ",";
      std::cout << "\"" << profiles[i].tool_name << "\"";
    }
    std::cout << "]}\n";
    return h.blake3_available ? kExitOk : kExitIncomplete;
  }

  if (cmd == "version") {
    std::cout << warden::version::manifest_to_json(warden::version::current_manifest()) << "\n";
    return kExitOk;
  }

  if (cmd == "stats") {
    std::cout << warden::global_engine_stats().to_json() << "\n";
    return kExitOk;
  }

  if (cmd == "config" && argc >= 3 && std::string(argv[2]) == "validate") {
    const std::string file = arg_value(argc, argv, "--file");
    std::string text;
    if (file.empty() || !read_file(file, &text)) {
      print_error("config_invalid", "--file is required and must be readable");
      return kExitUsage;
    }
    const auto r = warden::validate_config(text);
    std::cout << "{\"ok\":" << (r.ok ? "true" : "false") << ",\"config_version\":\"" << r.config_version
              << "\",\"errors\":[";
    for (std::size_t i = 0; i < r.errors.size(); ++i) {
      std::cout << (i ? "," : "") << "\"" << warden::jsonlite::escape(r.errors[i]) << "\"";
    }
    std::cout << "],\"warnings\":[";
    for (std::size_t i = 0; i < r.warnings.size(); ++i) {
      std::cout << (i ? "," : "") << "\"" << warden::jsonlite::escape(r.warnings[i]) << "\"";
    }
    std::cout << "]}\n";
    return r.ok ? kExitOk : kExitIncomplete;
  }

  if (cmd == "run") {
    const std::string plan_file = arg_value(argc, argv, "--plan");
    std::string text;
    if (plan_file.empty() || !read_file(plan_file, &text)) {
      print_error("missing_input", "--plan is required and must be readable");
      return kExitUsage;
    }
    std::string err;
    const auto plan = warden::parse_plan_json(text, &err);
    if (!plan) {
      print_error("schema_mismatch", err);
      return kExitUsage;
    }
    warden::SessionConfig config;
    if (!load_config(argc, argv, &config)) return kExitUsage;
    return run_plan(config, *plan);
  }

  if (cmd == "script") {
    const std::string file = arg_value(argc, argv, "--file");
    std::string text;
    if (file.empty() || !read_file(file, &text)) {
      print_error("missing_input", "--file is required and must be readable");
      return kExitUsage;
    }
    std::string err;
    const auto plan = warden::parse_tool_script(text, arg_value(argc, argv, "--goal", file), &err);
    if (!plan) {
      print_error("missing_input", err);
      return kExitUsage;
    }
    warden::SessionConfig config;
    if (!load_config(argc, argv, &config)) return kExitUsage;
    return run_plan(config, *plan);
  }

  if (cmd == "verify") {
    const std::string tool = arg_value(argc, argv, "--tool");
    const std::string path = arg_value(argc, argv, "--path");
    const warden::OperationProfile* profile = warden::find_profile(tool);
    if (!profile || path.empty()) {
      print_error(profile ? "missing_input" : "unknown_tool", "--tool must name a known tool and --path is required");
      return kExitUsage;
    }
    warden::SessionConfig config;
    if (!load_config(argc, argv, &config)) return kExitUsage;
    const warden::Workspace workspace(config.workspace_root);
    const warden::VerificationEngine verifier(workspace);

    warden::VerificationInput in;
    in.args.push_back(path);
    if (has_flag(argc, argv, "--content")) in.args.push_back(arg_value(argc, argv, "--content"));
    const auto report = verifier.verify(tool, in, *profile);

    std::cout << "{\"tool\":\"" << tool << "\",\"success\":" << (report.success ? "true" : "false")
              << ",\"verification\":" << warden::verification_to_json(report.to_map()) << ",\"warnings\":[";
    for (std::size_t i = 0; i < report.warnings.size(); ++i) {
      std::cout << (i ? "," : "") << "\"" << warden::jsonlite::escape(report.warnings[i]) << "\"";
    }
    std::cout << "],\"critical_failures\":[";
    for (std::size_t i = 0; i < report.critical_failures.size(); ++i) {
      std::cout << (i ? "," : "") << "\"" << warden::jsonlite::escape(report.critical_failures[i]) << "\"";
    }
    std::cout << "]}\n";
    return report.success ? kExitOk : kExitIncomplete;
  }

  if (cmd == "history") {
    warden::SessionConfig config = warden::SessionConfig::from_env();
    const std::string sd = arg_value(argc, argv, "--state-dir");
    if (!sd.empty()) config.state_dir = sd;
    const std::string log = arg_value(argc, argv, "--log", config.history_path());

    if (has_flag(argc, argv, "--verify")) {
      const auto v = warden::verify_history_chain(log);
      std::cout << "{\"ok\":" << (v.ok ? "true" : "false") << ",\"entries\":" << v.entries
                << ",\"first_bad_sequence\":" << v.first_bad_sequence << ",\"error\":\""
                << warden::jsonlite::escape(v.error) << "\"}\n";
      return v.ok ? kExitOk : kExitIncomplete;
    }

    std::string err;
    const auto entries = warden::load_history(log, &err);
    if (!entries) {
      print_error("json_parse_error", err);
      return kExitIncomplete;
    }
    for (const auto& e : *entries) std::cout << warden::history_entry_to_json(e) << "\n";
    return kExitOk;
  }

  usage();
  return kExitUsage;
}
