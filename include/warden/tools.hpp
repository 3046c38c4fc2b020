#pragma once

// warden/tools.hpp: Tool primitive boundary and the local POSIX implementation.
//
// The executor never touches the filesystem to perform an operation; it calls
// IToolPrimitive::invoke() and wraps the RawOutcome into a ToolResult itself.
// A primitive may report failure through RawOutcome or by throwing a
// std::exception subclass; both become a failed attempt, never a session abort.
//
// STRATEGIES (LocalToolPrimitive):
//   write_file [path, content]
//     default         stream write over the target
//     encoding        strip BOM, CRLF -> LF, replace invalid UTF-8, binary write
//     temp_file       write a sibling temp file, rename over the target
//     backup_restore  move the target aside, write fresh, put it back on failure
//   read_file [path]
//     default         text read; refuses content with NUL bytes
//     binary_safe     raw byte read
//   create_directory [path]
//     default         create_directories
//     explicit_mode   mkdir(0755) per missing component
//     via_temp        build in a sibling temp directory, rename into place
//   delete_file [path]
//     default         remove (recursive for directories)
//     rename_then_remove  rename to a sibling trash name, then remove
//     chmod_parent    add owner write to the parent, then remove
//   save_json [path, json, schema?]
//     default         indented (2) stream write
//     temp_file       indented (2) atomic write
//     compact         canonical compact atomic write
//   load_json [path, schema?]
//     default         strict parse
//     lenient         strip BOM and trailing NUL/whitespace, then parse

#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "warden/workspace.hpp"

namespace warden {

struct RawOutcome {
  bool ok{false};
  std::string output;                           // payload or status text
  std::string error;                            // set when ok == false
  std::map<std::string, std::string> details;   // e.g. written_hash, bytes_written
};

class IToolPrimitive {
 public:
  virtual ~IToolPrimitive() = default;

  // args[0] is a workspace-relative path already confined by the executor.
  virtual RawOutcome invoke(const std::string& tool_name,
                            const std::vector<std::string>& args,
                            const std::string& strategy) = 0;
};

class LocalToolPrimitive : public IToolPrimitive {
 public:
  explicit LocalToolPrimitive(const Workspace& workspace) : workspace_(workspace) {}

  RawOutcome invoke(const std::string& tool_name,
                    const std::vector<std::string>& args,
                    const std::string& strategy) override;

 private:
  const Workspace& workspace_;
};

// ---------------------------------------------------------------------------
// Filesystem helpers shared with verification and state tracking.
// ---------------------------------------------------------------------------
std::optional<std::string> read_bytes(const std::filesystem::path& p);
bool is_valid_utf8(std::string_view s);
// Strip a UTF-8 BOM, normalise CRLF to LF, replace invalid sequences with U+FFFD.
std::string normalize_text_encoding(std::string_view s);
// Three octal digits for the owner/group/other bits, e.g. "644".
std::string octal_permissions(std::filesystem::perms p);
// A fresh sibling path "<dir>/.<name>.<tag>-<random>" that does not exist yet.
std::filesystem::path unique_sibling(const std::filesystem::path& target, const std::string& tag);
// Write to a sibling temp file, then rename over `target`.
bool atomic_replace(const std::filesystem::path& target, const std::string& bytes, std::string* error);

}  // namespace warden
