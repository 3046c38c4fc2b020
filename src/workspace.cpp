#include "warden/workspace.hpp"

#include <unistd.h>

namespace fs = std::filesystem;

namespace warden {

namespace {
bool starts_with(const std::string& s, const std::string& prefix) {
  return s.size() >= prefix.size() && s.compare(0, prefix.size(), prefix) == 0;
}
}  // namespace

std::string normalize_under(const std::string& workspace, const std::string& p) {
  std::error_code ec;
  const fs::path base = fs::weakly_canonical(fs::path(workspace), ec);
  if (ec) return "";
  const fs::path in = p.empty() ? base : fs::weakly_canonical(base / p, ec);
  if (ec) return "";
  const std::string base_str = base.string();
  const std::string in_str = in.string();
  if (in_str != base_str && !starts_with(in_str, base_str + "/")) return "";
  return in_str;
}

Workspace::Workspace(const std::string& root) {
  std::error_code ec;
  fs::create_directories(root, ec);
  ec.clear();
  root_ = fs::weakly_canonical(fs::absolute(root, ec), ec);
  valid_ = !ec && fs::is_directory(root_, ec);
}

std::optional<fs::path> Workspace::resolve(const std::string& rel) const {
  if (!valid_) return std::nullopt;
  const std::string out = normalize_under(root_.string(), rel);
  if (out.empty()) return std::nullopt;
  return fs::path(out);
}

std::optional<fs::path> Workspace::resolve_entry(const std::string& rel) const {
  if (!valid_) return std::nullopt;
  const fs::path lexical = fs::path(rel).lexically_normal();
  const fs::path leaf = lexical.filename();
  if (leaf.empty() || leaf == "." || leaf == "..") return resolve(rel);
  const auto parent = resolve(lexical.parent_path().generic_string());
  if (!parent) return std::nullopt;
  return *parent / leaf;
}

std::string Workspace::relative(const fs::path& abs) const {
  const fs::path r = abs.lexically_relative(root_);
  if (r.empty()) return abs.generic_string();
  return r.generic_string();
}

bool Workspace::contains(const fs::path& abs) const {
  const std::string base = root_.string();
  const std::string s = abs.string();
  return s == base || starts_with(s, base + "/");
}

WorkspaceState Workspace::state() const {
  WorkspaceState st;
  st.root = root_.string();
  std::error_code ec;
  st.root_valid = valid_ && fs::is_directory(root_, ec);
  if (st.root_valid) {
    const auto sp = fs::space(root_, ec);
    if (!ec) st.free_bytes = static_cast<std::uint64_t>(sp.available);
  }
  st.uid = static_cast<std::uint32_t>(::geteuid());
  st.gid = static_cast<std::uint32_t>(::getegid());
  return st;
}

}  // namespace warden
