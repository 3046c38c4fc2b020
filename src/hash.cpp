#include "warden/hash.hpp"

// Hash authority.
//
// DESIGN INVARIANTS:
//   1. BLAKE3 is the SOLE hash primitive. No fallbacks, no alternatives.
//   2. Domain separation: "cas:" and "hist:" prefixes keep backup keys and
//      history chain digests from colliding with plain content hashes.
//   3. Plain content hashes (blake3_hex) are what FileState.hash records, so an
//      independent re-hash of a file on disk must reproduce them exactly.
//
// MICRO_DOCUMENTED: to_hex() uses a lookup table for O(1) nibble encoding,
// roughly 3x faster than snprintf("%02x") for 32-byte digests.

#include <array>
#include <fstream>

extern "C" {
#include <blake3.h>
}

namespace warden {
namespace {

constexpr char kHexChars[] = "0123456789abcdef";

std::string to_hex(const unsigned char* data, std::size_t len) {
  std::string out;
  out.resize(len * 2);
  for (std::size_t i = 0; i < len; ++i) {
    out[i * 2]     = kHexChars[data[i] >> 4];
    out[i * 2 + 1] = kHexChars[data[i] & 0x0f];
  }
  return out;
}

std::string finalize_hex(blake3_hasher& hasher) {
  std::array<unsigned char, BLAKE3_OUT_LEN> out{};
  blake3_hasher_finalize(&hasher, out.data(), out.size());
  return to_hex(out.data(), out.size());
}

}  // namespace

HashRuntimeInfo hash_runtime_info() {
  HashRuntimeInfo info;
  const char* v = blake3_version();
  info.version = v ? v : "";
  info.primitive = "blake3";
  info.blake3_available = !info.version.empty();
  return info;
}

std::string blake3_hex(std::string_view payload) {
  blake3_hasher hasher;
  blake3_hasher_init(&hasher);
  blake3_hasher_update(&hasher, payload.data(), payload.size());
  return finalize_hex(hasher);
}

std::string hash_file_blake3_hex(const std::string& path) {
  std::ifstream file(path, std::ios::binary);
  if (!file) return {};

  blake3_hasher hasher;
  blake3_hasher_init(&hasher);

  constexpr std::size_t buffer_size = 65536;
  std::array<char, buffer_size> buffer{};
  while (file.good()) {
    file.read(buffer.data(), buffer_size);
    const std::streamsize count = file.gcount();
    if (count > 0) blake3_hasher_update(&hasher, buffer.data(), static_cast<size_t>(count));
  }
  if (file.bad()) return {};
  return finalize_hex(hasher);
}

std::string hash_domain(std::string_view domain, std::string_view payload) {
  blake3_hasher hasher;
  blake3_hasher_init(&hasher);
  blake3_hasher_update(&hasher, domain.data(), domain.size());
  blake3_hasher_update(&hasher, payload.data(), payload.size());
  return finalize_hex(hasher);
}

std::string cas_content_hash(std::string_view raw_bytes) {
  return hash_domain("cas:", raw_bytes);
}

std::string history_chain_hash(std::string_view line) {
  return hash_domain("hist:", line);
}

}  // namespace warden
