#pragma once

// verso/hash.hpp - BLAKE3 hashing with domain separation.
//
// DESIGN INVARIANTS:
//   1. BLAKE3 is the sole hash primitive.
//   2. Every stored digest is domain separated. The prefixes below are part of
//      the on-disk contract; changing one invalidates existing stores.
//        "doc:"  content digest reported on FileVersion
//        "blob:" key of a content object in the file store
//        "log:"  journal chain digest
//   3. Digests are lowercase 64-char hex.

#include <string>
#include <string_view>

namespace verso {

struct HashRuntimeInfo {
  std::string primitive;
  std::string version;
};

HashRuntimeInfo hash_runtime_info();

// Plain BLAKE3-256, hex encoded.
std::string blake3_hex(std::string_view payload);

// BLAKE3 over domain || payload, hex encoded.
std::string hash_domain(std::string_view domain, std::string_view payload);

std::string content_digest(std::string_view content);
std::string blob_key(std::string_view content);
std::string journal_chain_digest(std::string_view previous, std::string_view line);

// True for a 64-char lowercase hex string.
bool valid_digest(std::string_view digest);

}  // namespace verso
