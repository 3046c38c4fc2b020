#pragma once

// warden/workspace.hpp: Sandboxed workspace root and path confinement.
//
// Every path a tool touches is resolved through Workspace::resolve(), which
// follows symlinks (weakly_canonical) and rejects anything that lands outside
// the canonical root. Operations on the directory entry itself (delete_file)
// use resolve_entry(), which resolves only the parent so a symlink leaf names
// the link rather than its target. Containment is also reported as a security
// check by the verification engine.

#include <filesystem>
#include <optional>
#include <string>

#include "warden/types.hpp"

namespace warden {

// Resolve `p` under `workspace`. Returns "" if the result escapes the root or
// cannot be canonicalized.
std::string normalize_under(const std::string& workspace, const std::string& p);

class Workspace {
 public:
  // Creates the root directory if it does not exist.
  explicit Workspace(const std::string& root);

  bool valid() const { return valid_; }
  const std::filesystem::path& root() const { return root_; }

  // Absolute canonical path for a workspace-relative (or absolute) path;
  // nullopt on escape.
  std::optional<std::filesystem::path> resolve(const std::string& rel) const;

  // Like resolve(), but the last component is not followed. "." and ".."
  // leaves fall back to resolve().
  std::optional<std::filesystem::path> resolve_entry(const std::string& rel) const;

  // Workspace-relative generic path for an absolute path under the root.
  std::string relative(const std::filesystem::path& abs) const;

  bool contains(const std::filesystem::path& abs) const;

  WorkspaceState state() const;

 private:
  std::filesystem::path root_;
  bool valid_{false};
};

}  // namespace warden
