#include "warden/cas.hpp"

// Backup store. One CasStore per state directory; objects are shared by every
// session that uses the same state directory, which is safe because keys are
// content-addressed.

#include <cstdio>
#include <ctime>
#include <filesystem>
#include <fstream>
#include <random>

#if defined(WARDEN_WITH_ZSTD)
#include <zstd.h>
#endif

#include "warden/hash.hpp"
#include "warden/jsonlite.hpp"

namespace fs = std::filesystem;

namespace warden {

namespace {
#if defined(WARDEN_WITH_ZSTD)
std::string compress_zstd(const std::string& data) {
  std::string out;
  out.resize(ZSTD_compressBound(data.size()));
  size_t n = ZSTD_compress(out.data(), out.size(), data.data(), data.size(), 3);
  if (ZSTD_isError(n)) return {};
  out.resize(n);
  return out;
}

std::optional<std::string> decompress_zstd(const std::string& data, std::size_t original_size) {
  std::string out;
  out.resize(original_size);
  size_t n = ZSTD_decompress(out.data(), out.size(), data.data(), data.size());
  if (ZSTD_isError(n)) return std::nullopt;
  out.resize(n);
  return out;
}
#endif

std::string make_tmp_name(const fs::path& dir) {
  static thread_local std::mt19937_64 rng(std::random_device{}());
  std::uniform_int_distribution<uint64_t> dist;
  return (dir / (".tmp_" + std::to_string(dist(rng)))).string();
}

// Atomic write: temp file in the target directory, then rename into place.
bool atomic_write(const fs::path& target, const std::string& data) {
  std::error_code ec;
  fs::create_directories(target.parent_path(), ec);
  if (ec) return false;
  const std::string tmp = make_tmp_name(target.parent_path());
  {
    std::ofstream ofs(tmp, std::ios::binary | std::ios::trunc);
    if (!ofs) return false;
    ofs.write(data.data(), static_cast<std::streamsize>(data.size()));
    ofs.flush();
    if (!ofs) {
      std::remove(tmp.c_str());
      return false;
    }
  }
  fs::rename(tmp, target, ec);
  if (ec) {
    std::remove(tmp.c_str());
    return false;
  }
  return true;
}

bool valid_digest(const std::string& d) {
  if (d.size() != 64) return false;
  for (char c : d) {
    if (!((c >= '0' && c <= '9') || (c >= 'a' && c <= 'f'))) return false;
  }
  return true;
}

std::optional<std::string> read_all(const fs::path& p) {
  std::ifstream ifs(p, std::ios::binary);
  if (!ifs) return std::nullopt;
  return std::string((std::istreambuf_iterator<char>(ifs)), std::istreambuf_iterator<char>());
}

}  // namespace

std::string cas_object_info_to_json(const CasObjectInfo& info) {
  return "{\"digest\":\"" + info.digest + "\",\"encoding\":\"" + info.encoding +
         "\",\"original_size\":" + std::to_string(info.original_size) +
         ",\"stored_size\":" + std::to_string(info.stored_size) +
         ",\"stored_blob_hash\":\"" + info.stored_blob_hash +
         "\",\"created_at\":" + std::to_string(info.created_at_unix_ts) + "}";
}

std::optional<CasObjectInfo> cas_object_info_from_json(const std::string& line) {
  std::optional<jsonlite::JsonError> err;
  auto obj = jsonlite::parse(line, &err);
  if (err) return std::nullopt;
  CasObjectInfo inf;
  inf.digest = jsonlite::get_string(obj, "digest");
  inf.encoding = jsonlite::get_string(obj, "encoding", "identity");
  inf.original_size = static_cast<std::size_t>(jsonlite::get_u64(obj, "original_size"));
  inf.stored_size = static_cast<std::size_t>(jsonlite::get_u64(obj, "stored_size"));
  inf.stored_blob_hash = jsonlite::get_string(obj, "stored_blob_hash");
  inf.created_at_unix_ts = jsonlite::get_u64(obj, "created_at");
  if (!valid_digest(inf.digest)) return std::nullopt;
  return inf;
}

CasStore::CasStore(std::string root) : root_(std::move(root)) {
  std::error_code ec;
  fs::create_directories(fs::path(root_) / "objects", ec);
}

std::string CasStore::object_path(const std::string& digest) const {
  return (fs::path(root_) / "objects" / digest.substr(0, 2) / digest.substr(2, 2) / digest)
      .string();
}

std::string CasStore::meta_path(const std::string& digest) const {
  return object_path(digest) + ".meta";
}

std::string CasStore::index_path() const {
  return (fs::path(root_) / "index.ndjson").string();
}

void CasStore::load_index() const {
  std::lock_guard<std::mutex> lk(index_mu_);
  if (index_loaded_) return;

  std::ifstream ifs(index_path());
  std::string line;
  while (std::getline(ifs, line)) {
    if (line.empty()) continue;
    // Torn trailing lines from a crash are skipped; the .meta sidecar stays
    // authoritative for info().
    if (auto inf = cas_object_info_from_json(line)) index_[inf->digest] = std::move(*inf);
  }
  index_loaded_ = true;
}

void CasStore::save_index_entry(const CasObjectInfo& info) const {
  const std::string line = cas_object_info_to_json(info) + "\n";
  std::ofstream ofs(index_path(), std::ios::binary | std::ios::app);
  ofs.write(line.data(), static_cast<std::streamsize>(line.size()));
}

std::string CasStore::put(const std::string& data, const std::string& compression) {
  const std::string digest = cas_content_hash(data);
  if (!valid_digest(digest)) return {};

  // Dedup: already stored. Verify the existing object before trusting it.
  const fs::path target = object_path(digest);
  const fs::path meta = meta_path(digest);
  std::error_code ec;
  if (fs::exists(target, ec) && fs::exists(meta, ec)) {
    auto existing = get(digest);
    if (existing.has_value() && *existing == data) return digest;
    // Corrupt object: fall through and overwrite it with good bytes.
  }

  std::string stored = data;
  std::string encoding = "identity";
#if defined(WARDEN_WITH_ZSTD)
  if (compression == "zstd" && !data.empty()) {
    auto c = compress_zstd(data);
    if (!c.empty() && c.size() < data.size()) {
      stored = std::move(c);
      encoding = "zstd";
    }
  }
#else
  (void)compression;
#endif

  if (!atomic_write(target, stored)) return {};

  CasObjectInfo info;
  info.digest = digest;
  info.encoding = encoding;
  info.original_size = data.size();
  info.stored_size = stored.size();
  info.stored_blob_hash = blake3_hex(stored);
  info.created_at_unix_ts = static_cast<uint64_t>(std::time(nullptr));

  if (!atomic_write(meta, cas_object_info_to_json(info))) {
    fs::remove(target, ec);
    return {};
  }

  load_index();
  {
    std::lock_guard<std::mutex> lk(index_mu_);
    index_[digest] = info;
    save_index_entry(info);
  }
  return digest;
}

std::optional<CasObjectInfo> CasStore::info(const std::string& digest) const {
  if (!valid_digest(digest)) return std::nullopt;
  load_index();
  {
    std::lock_guard<std::mutex> lk(index_mu_);
    auto it = index_.find(digest);
    if (it != index_.end()) return it->second;
  }
  // Index lines are advisory; the sidecar is the source of truth.
  auto meta = read_all(meta_path(digest));
  if (!meta) return std::nullopt;
  return cas_object_info_from_json(*meta);
}

std::optional<std::string> CasStore::get(const std::string& digest) const {
  if (!valid_digest(digest)) return std::nullopt;
  auto data = read_all(object_path(digest));
  if (!data) return std::nullopt;

  auto meta = info(digest);
  if (!meta) return std::nullopt;

  // Plain BLAKE3 over the stored blob (no domain prefix).
  if (blake3_hex(*data) != meta->stored_blob_hash) return std::nullopt;

  if (meta->encoding == "zstd") {
#if defined(WARDEN_WITH_ZSTD)
    auto plain = decompress_zstd(*data, meta->original_size);
    if (!plain) return std::nullopt;
    data = std::move(plain);
#else
    return std::nullopt;
#endif
  }

  if (cas_content_hash(*data) != digest) return std::nullopt;
  return data;
}

bool CasStore::remove(const std::string& digest) {
  if (!valid_digest(digest)) return false;

  std::error_code ec;
  fs::remove(object_path(digest), ec);
  if (ec) return false;
  fs::remove(meta_path(digest), ec);
  if (ec) return false;

  load_index();
  std::lock_guard<std::mutex> lk(index_mu_);
  if (index_.erase(digest) == 0) return true;
  // Compact the index so removed objects do not come back on reopen.
  std::string body;
  for (const auto& [d, inf] : index_) body += cas_object_info_to_json(inf) + "\n";
  return atomic_write(index_path(), body);
}

bool CasStore::contains(const std::string& digest) const {
  if (!valid_digest(digest)) return false;
  std::error_code ec;
  return fs::exists(object_path(digest), ec);
}

std::size_t CasStore::size() const {
  load_index();
  std::lock_guard<std::mutex> lk(index_mu_);
  return index_.size();
}

}  // namespace warden
