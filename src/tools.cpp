#include "warden/tools.hpp"

#include <cctype>
#include <cerrno>
#include <cstring>
#include <fstream>
#include <random>
#include <stdexcept>

#include <sys/stat.h>
#include <sys/types.h>

#include "warden/hash.hpp"
#include "warden/jsonlite.hpp"
#include "warden/operation_types.hpp"

namespace fs = std::filesystem;

namespace warden {

// ---------------------------------------------------------------------------
// Shared helpers
// ---------------------------------------------------------------------------

std::optional<std::string> read_bytes(const fs::path& p) {
  std::ifstream ifs(p, std::ios::binary);
  if (!ifs) return std::nullopt;
  std::string data((std::istreambuf_iterator<char>(ifs)), std::istreambuf_iterator<char>());
  if (ifs.bad()) return std::nullopt;
  return data;
}

bool is_valid_utf8(std::string_view s) {
  size_t i = 0;
  while (i < s.size()) {
    const auto c = static_cast<unsigned char>(s[i]);
    size_t len = 0;
    std::uint32_t cp = 0;
    if (c < 0x80) { ++i; continue; }
    if ((c & 0xE0) == 0xC0) { len = 2; cp = c & 0x1F; }
    else if ((c & 0xF0) == 0xE0) { len = 3; cp = c & 0x0F; }
    else if ((c & 0xF8) == 0xF0) { len = 4; cp = c & 0x07; }
    else return false;
    if (i + len > s.size()) return false;
    for (size_t k = 1; k < len; ++k) {
      const auto cc = static_cast<unsigned char>(s[i + k]);
      if ((cc & 0xC0) != 0x80) return false;
      cp = (cp << 6) | (cc & 0x3F);
    }
    // Overlong forms, surrogates and out-of-range code points.
    if ((len == 2 && cp < 0x80) || (len == 3 && cp < 0x800) || (len == 4 && cp < 0x10000)) return false;
    if (cp > 0x10FFFF || (cp >= 0xD800 && cp <= 0xDFFF)) return false;
    i += len;
  }
  return true;
}

std::string normalize_text_encoding(std::string_view s) {
  if (s.size() >= 3 && s.substr(0, 3) == "\xEF\xBB\xBF") s.remove_prefix(3);
  std::string out;
  out.reserve(s.size());
  size_t i = 0;
  while (i < s.size()) {
    const auto c = static_cast<unsigned char>(s[i]);
    if (c == '\r' && i + 1 < s.size() && s[i + 1] == '\n') { ++i; continue; }
    if (c < 0x80) { out += static_cast<char>(c); ++i; continue; }
    size_t len = (c & 0xE0) == 0xC0 ? 2 : (c & 0xF0) == 0xE0 ? 3 : (c & 0xF8) == 0xF0 ? 4 : 1;
    if (len > 1 && i + len <= s.size() && is_valid_utf8(s.substr(i, len))) {
      out.append(s.substr(i, len));
      i += len;
    } else {
      out += "\xEF\xBF\xBD";
      ++i;
    }
  }
  return out;
}

std::string octal_permissions(fs::perms p) {
  const auto bits = static_cast<unsigned>(p) & 0777u;
  std::string out(3, '0');
  out[0] = static_cast<char>('0' + ((bits >> 6) & 7u));
  out[1] = static_cast<char>('0' + ((bits >> 3) & 7u));
  out[2] = static_cast<char>('0' + (bits & 7u));
  return out;
}

fs::path unique_sibling(const fs::path& target, const std::string& tag) {
  static thread_local std::mt19937_64 rng(std::random_device{}());
  std::uniform_int_distribution<uint64_t> dist;
  const fs::path dir = target.parent_path();
  const std::string name = target.filename().string();
  std::error_code ec;
  for (;;) {
    fs::path candidate = dir / ("." + name + "." + tag + "-" + std::to_string(dist(rng)));
    if (!fs::exists(fs::symlink_status(candidate, ec))) return candidate;
  }
}

bool atomic_replace(const fs::path& target, const std::string& bytes, std::string* error) {
  const fs::path tmp = unique_sibling(target, "warden-tmp");
  {
    std::ofstream ofs(tmp, std::ios::binary | std::ios::trunc);
    if (!ofs) {
      if (error) *error = "cannot create temp file: " + std::string(std::strerror(errno));
      return false;
    }
    ofs.write(bytes.data(), static_cast<std::streamsize>(bytes.size()));
    ofs.flush();
    if (!ofs) {
      if (error) *error = "short write to temp file";
      std::error_code ec;
      fs::remove(tmp, ec);
      return false;
    }
  }
  std::error_code ec;
  fs::rename(tmp, target, ec);
  if (ec) {
    if (error) *error = "rename into place failed: " + ec.message();
    std::error_code ignored;
    fs::remove(tmp, ignored);
    return false;
  }
  return true;
}

namespace {

RawOutcome fail(const std::string& error) {
  RawOutcome r;
  r.ok = false;
  r.error = error;
  return r;
}

bool stream_write(const fs::path& target, const std::string& bytes, std::ios::openmode mode,
                  std::string* error) {
  std::ofstream ofs(target, mode | std::ios::out | std::ios::trunc);
  if (!ofs) {
    *error = "cannot open for writing: " + std::string(std::strerror(errno));
    return false;
  }
  ofs.write(bytes.data(), static_cast<std::streamsize>(bytes.size()));
  ofs.flush();
  if (!ofs) {
    *error = "write failed: " + std::string(std::strerror(errno));
    return false;
  }
  return true;
}

RawOutcome written(const std::string& bytes) {
  RawOutcome r;
  r.ok = true;
  r.output = "wrote " + std::to_string(bytes.size()) + " bytes";
  r.details["bytes_written"] = std::to_string(bytes.size());
  r.details["written_hash"] = blake3_hex(bytes);
  return r;
}

bool prepare_parent(const fs::path& target, std::string* error) {
  std::error_code ec;
  fs::create_directories(target.parent_path(), ec);
  if (ec) {
    *error = "cannot create parent directory: " + ec.message();
    return false;
  }
  if (fs::is_directory(target, ec)) {
    *error = "target is a directory";
    return false;
  }
  return true;
}

// ---------------------------------------------------------------------------
// write_file
// ---------------------------------------------------------------------------
RawOutcome write_file(const fs::path& target, const std::string& content, const std::string& strategy) {
  std::string err;
  if (!prepare_parent(target, &err)) return fail(err);

  if (strategy == "default") {
    if (!stream_write(target, content, std::ios::out, &err)) return fail(err);
    return written(content);
  }
  if (strategy == "encoding") {
    const std::string bytes = normalize_text_encoding(content);
    if (!stream_write(target, bytes, std::ios::binary, &err)) return fail(err);
    return written(bytes);
  }
  if (strategy == "temp_file") {
    if (!atomic_replace(target, content, &err)) return fail(err);
    return written(content);
  }
  if (strategy == "backup_restore") {
    std::error_code ec;
    const bool had = fs::exists(target, ec);
    fs::path aside;
    if (had) {
      aside = unique_sibling(target, "warden-bak");
      fs::rename(target, aside, ec);
      if (ec) return fail("cannot move original aside: " + ec.message());
    }
    if (!stream_write(target, content, std::ios::binary, &err)) {
      if (had) {
        std::error_code restore_ec;
        fs::remove(target, restore_ec);
        fs::rename(aside, target, restore_ec);
        if (restore_ec) err += "; original left at " + aside.filename().string();
      }
      return fail(err);
    }
    if (had) fs::remove(aside, ec);
    return written(content);
  }
  return fail("unknown strategy: " + strategy);
}

// ---------------------------------------------------------------------------
// read_file
// ---------------------------------------------------------------------------
RawOutcome read_file(const fs::path& target, const std::string& strategy) {
  std::error_code ec;
  if (!fs::exists(target, ec)) return fail("no such file");
  if (fs::is_directory(target, ec)) return fail("target is a directory");

  std::string data;
  if (strategy == "default") {
    std::ifstream ifs(target);
    if (!ifs) return fail("cannot open for reading: " + std::string(std::strerror(errno)));
    data.assign((std::istreambuf_iterator<char>(ifs)), std::istreambuf_iterator<char>());
    if (data.find('\0') != std::string::npos) return fail("binary content in text read");
  } else if (strategy == "binary_safe") {
    auto bytes = read_bytes(target);
    if (!bytes) return fail("cannot open for reading: " + std::string(std::strerror(errno)));
    data = std::move(*bytes);
  } else {
    return fail("unknown strategy: " + strategy);
  }

  RawOutcome r;
  r.ok = true;
  r.details["bytes_read"] = std::to_string(data.size());
  r.details["content_hash"] = blake3_hex(data);
  r.details["encoding"] = is_valid_utf8(data) ? "utf-8" : "binary";
  r.output = std::move(data);
  return r;
}

// ---------------------------------------------------------------------------
// create_directory
// ---------------------------------------------------------------------------
RawOutcome create_directory(const fs::path& target, const std::string& strategy) {
  std::error_code ec;
  const bool existed = fs::is_directory(target, ec);

  if (strategy == "default") {
    fs::create_directories(target, ec);
    if (ec) return fail("create_directories failed: " + ec.message());
  } else if (strategy == "explicit_mode") {
    fs::path cur;
    for (const auto& part : target) {
      cur /= part;
      if (cur == cur.root_path()) continue;
      if (::mkdir(cur.c_str(), 0755) != 0) {
        const int e = errno;
        if (e == EEXIST && fs::is_directory(cur, ec)) continue;
        return fail("mkdir " + cur.filename().string() + ": " + std::strerror(e));
      }
    }
  } else if (strategy == "via_temp") {
    if (!existed) {
      fs::create_directories(target.parent_path(), ec);
      if (ec) return fail("cannot create parent directory: " + ec.message());
      const fs::path tmp = unique_sibling(target, "warden-tmpdir");
      fs::create_directory(tmp, ec);
      if (ec) return fail("cannot create temp directory: " + ec.message());
      fs::rename(tmp, target, ec);
      if (ec) {
        std::error_code ignored;
        fs::remove(tmp, ignored);
        return fail("rename into place failed: " + ec.message());
      }
    }
  } else {
    return fail("unknown strategy: " + strategy);
  }

  if (!fs::is_directory(target, ec)) return fail("path exists and is not a directory");
  RawOutcome r;
  r.ok = true;
  r.output = existed ? "already exists" : "created";
  return r;
}

// ---------------------------------------------------------------------------
// delete_file
// ---------------------------------------------------------------------------
RawOutcome delete_file(const fs::path& target, const std::string& strategy) {
  std::error_code ec;
  if (!fs::exists(fs::symlink_status(target, ec))) {
    RawOutcome r;
    r.ok = true;
    r.output = "already absent";
    r.details["existed"] = "false";
    return r;
  }

  const fs::path parent = target.parent_path();
  fs::path victim = target;
  std::optional<fs::perms> parent_mode;
  if (strategy == "rename_then_remove") {
    victim = unique_sibling(target, "warden-trash");
    fs::rename(target, victim, ec);
    if (ec) return fail("rename to trash failed: " + ec.message());
  } else if (strategy == "chmod_parent") {
    // The parent's mode is put back after the remove, success or not.
    const auto st = fs::status(parent, ec);
    if (ec) return fail("cannot stat parent: " + ec.message());
    parent_mode = st.permissions() & fs::perms::mask;
    fs::permissions(parent, fs::perms::owner_write | fs::perms::owner_exec, fs::perm_options::add, ec);
    if (ec) return fail("cannot make parent writable: " + ec.message());
  } else if (strategy != "default") {
    return fail("unknown strategy: " + strategy);
  }

  const auto removed = fs::remove_all(victim, ec);
  std::string err;
  if (ec) {
    err = "remove failed: " + ec.message();
    if (victim != target) {
      std::error_code back_ec;
      fs::rename(victim, target, back_ec);
      if (back_ec) err += "; trash entry left at " + victim.filename().string();
    }
  }
  if (parent_mode) {
    std::error_code mode_ec;
    fs::permissions(parent, *parent_mode, fs::perm_options::replace, mode_ec);
    if (mode_ec) err += (err.empty() ? "" : "; ") + std::string("cannot restore parent mode: ") + mode_ec.message();
  }
  if (!err.empty()) return fail(err);

  RawOutcome r;
  r.ok = true;
  r.output = "removed " + std::to_string(removed) + " entr" + (removed == 1 ? "y" : "ies");
  r.details["existed"] = "true";
  return r;
}

// ---------------------------------------------------------------------------
// save_json / load_json
// ---------------------------------------------------------------------------
RawOutcome save_json(const fs::path& target, const std::string& text, const std::string& strategy) {
  std::optional<jsonlite::JsonError> jerr;
  const auto doc = jsonlite::parse_value(text, &jerr);
  if (jerr) return fail("invalid JSON document: " + jerr->message);

  std::string err;
  if (!prepare_parent(target, &err)) return fail(err);

  if (strategy == "default") {
    const std::string bytes = jsonlite::to_pretty_json(doc, 2) + "\n";
    if (!stream_write(target, bytes, std::ios::binary, &err)) return fail(err);
    return written(bytes);
  }
  if (strategy == "temp_file") {
    const std::string bytes = jsonlite::to_pretty_json(doc, 2) + "\n";
    if (!atomic_replace(target, bytes, &err)) return fail(err);
    return written(bytes);
  }
  if (strategy == "compact") {
    const std::string bytes = jsonlite::to_json(doc) + "\n";
    if (!atomic_replace(target, bytes, &err)) return fail(err);
    return written(bytes);
  }
  return fail("unknown strategy: " + strategy);
}

RawOutcome load_json(const fs::path& target, const std::string& strategy) {
  std::error_code ec;
  if (!fs::is_regular_file(target, ec)) return fail("no such file");
  auto bytes = read_bytes(target);
  if (!bytes) return fail("cannot open for reading: " + std::string(std::strerror(errno)));

  std::string text = std::move(*bytes);
  if (strategy == "lenient") {
    if (text.size() >= 3 && text.compare(0, 3, "\xEF\xBB\xBF") == 0) text.erase(0, 3);
    while (!text.empty() && (text.back() == '\0' || std::isspace(static_cast<unsigned char>(text.back())))) {
      text.pop_back();
    }
  } else if (strategy != "default") {
    return fail("unknown strategy: " + strategy);
  }

  std::optional<jsonlite::JsonError> jerr;
  const auto doc = jsonlite::parse_value(text, &jerr);
  if (jerr) return fail(jerr->code + ": " + jerr->message);

  RawOutcome r;
  r.ok = true;
  r.output = jsonlite::to_json(doc);
  r.details["data_type"] = jsonlite::type_name(doc);
  r.details["bytes_read"] = std::to_string(text.size());
  return r;
}

}  // namespace

RawOutcome LocalToolPrimitive::invoke(const std::string& tool_name,
                                      const std::vector<std::string>& args,
                                      const std::string& strategy) {
  if (args.empty()) throw std::invalid_argument(tool_name + ": missing path argument");
  const OperationProfile* profile = find_profile(tool_name);
  const auto target = profile && profile->targets_entry ? workspace_.resolve_entry(args[0])
                                                        : workspace_.resolve(args[0]);
  if (!target) throw std::invalid_argument(tool_name + ": path escapes workspace: " + args[0]);

  if (tool_name == "write_file") return write_file(*target, args.size() > 1 ? args[1] : "", strategy);
  if (tool_name == "read_file") return read_file(*target, strategy);
  if (tool_name == "create_directory") return create_directory(*target, strategy);
  if (tool_name == "delete_file") return delete_file(*target, strategy);
  if (tool_name == "save_json") return save_json(*target, args.size() > 1 ? args[1] : "", strategy);
  if (tool_name == "load_json") return load_json(*target, strategy);
  throw std::invalid_argument("unknown tool: " + tool_name);
}

}  // namespace warden
