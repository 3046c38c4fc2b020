#pragma once

#include <string>
#include <string_view>

namespace warden {

struct HashRuntimeInfo {
  std::string primitive;
  std::string version;
  bool blake3_available{false};
};

// Core BLAKE3 hashing. All digests are 64-char lowercase hex.
std::string blake3_hex(std::string_view payload);
HashRuntimeInfo hash_runtime_info();

// Stream-hash a file and return a 64-char hex digest, or "" if unreadable.
// MICRO_OPT: 64 KB read buffer instead of loading the file into RAM. BLAKE3
// yields the same digest whether data arrives in one chunk or many.
std::string hash_file_blake3_hex(const std::string& path);

// Domain-separated hashing. "cas:" keys backup objects, "hist:" chains the
// durable history log. The prefixes are part of the on-disk contract.
std::string hash_domain(std::string_view domain, std::string_view payload);
std::string cas_content_hash(std::string_view raw_bytes);
std::string history_chain_hash(std::string_view line);

}  // namespace warden
