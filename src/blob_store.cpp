#include "verso/blob_store.hpp"

#include <cstdio>
#include <ctime>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <random>

#if defined(VERSO_WITH_ZSTD)
#include <zstd.h>
#endif

#include "verso/hash.hpp"
#include "verso/jsonlite.hpp"

namespace fs = std::filesystem;

namespace verso {

namespace {

#if defined(VERSO_WITH_ZSTD)
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

std::optional<std::string> read_file(const fs::path& p) {
  std::ifstream ifs(p, std::ios::binary);
  if (!ifs) return std::nullopt;
  std::string data((std::istreambuf_iterator<char>(ifs)), std::istreambuf_iterator<char>());
  if (ifs.bad()) return std::nullopt;
  return data;
}

std::string info_to_json(const BlobInfo& info) {
  jsonlite::Object o;
  o["key"] = jsonlite::Value{info.key};
  o["encoding"] = jsonlite::Value{info.encoding};
  o["original_size"] = jsonlite::Value{static_cast<std::uint64_t>(info.original_size)};
  o["stored_size"] = jsonlite::Value{static_cast<std::uint64_t>(info.stored_size)};
  o["stored_blob_hash"] = jsonlite::Value{info.stored_blob_hash};
  o["created_at"] = jsonlite::Value{static_cast<std::uint64_t>(info.created_at_unix_ts)};
  return jsonlite::to_json(o);
}

}  // namespace

bool atomic_write_file(const std::string& target, const std::string& data) {
  const fs::path t(target);
  std::error_code ec;
  fs::create_directories(t.parent_path(), ec);
  if (ec) return false;
  const std::string tmp = make_tmp_name(t.parent_path());
  {
    std::ofstream ofs(tmp, std::ios::binary | std::ios::trunc);
    if (!ofs) return false;
    ofs.write(data.data(), static_cast<std::streamsize>(data.size()));
    ofs.flush();
    if (!ofs) {
      ofs.close();
      std::remove(tmp.c_str());
      return false;
    }
  }
  fs::rename(tmp, t, ec);
  if (ec) {
    std::remove(tmp.c_str());
    return false;
  }
  return true;
}

BlobStore::BlobStore(std::string root) : root_(std::move(root)) {}

std::string BlobStore::object_path(const std::string& key) const {
  return (fs::path(root_) / "objects" / key.substr(0, 2) / key.substr(2, 2) / key).string();
}

std::string BlobStore::meta_path(const std::string& key) const {
  return object_path(key) + ".meta";
}

std::string BlobStore::put(const std::string& data, const std::string& compression) {
  const std::string key = blob_key(data);
  if (!valid_digest(key)) return {};

  // Dedup: an existing object must still verify before it is trusted. One
  // that fails verification is rewritten in place from the caller's bytes.
  std::error_code ec;
  if (fs::exists(object_path(key), ec) && fs::exists(meta_path(key), ec)) {
    auto existing = get(key);
    if (existing && *existing == data) return key;
  }

  std::string stored = data;
  std::string encoding = "identity";
#if defined(VERSO_WITH_ZSTD)
  if (compression == "zstd") {
    auto c = compress_zstd(data);
    if (!c.empty()) {
      stored = std::move(c);
      encoding = "zstd";
    }
  }
#else
  (void)compression;
#endif

  if (!atomic_write_file(object_path(key), stored)) return {};

  BlobInfo info;
  info.key = key;
  info.encoding = encoding;
  info.original_size = data.size();
  info.stored_size = stored.size();
  info.stored_blob_hash = blake3_hex(stored);
  info.created_at_unix_ts = static_cast<uint64_t>(std::time(nullptr));

  if (!atomic_write_file(meta_path(key), info_to_json(info))) {
    fs::remove(object_path(key), ec);
    return {};
  }
  return key;
}

std::optional<BlobInfo> BlobStore::info(const std::string& key) const {
  if (!valid_digest(key)) return std::nullopt;
  auto text = read_file(meta_path(key));
  if (!text) return std::nullopt;

  std::optional<jsonlite::JsonError> err;
  auto obj = jsonlite::parse(*text, &err);
  if (err) return std::nullopt;

  BlobInfo info;
  info.key = jsonlite::get_string(obj, "key");
  info.encoding = jsonlite::get_string(obj, "encoding", "identity");
  info.original_size = static_cast<std::size_t>(jsonlite::get_u64(obj, "original_size"));
  info.stored_size = static_cast<std::size_t>(jsonlite::get_u64(obj, "stored_size"));
  info.stored_blob_hash = jsonlite::get_string(obj, "stored_blob_hash");
  info.created_at_unix_ts = jsonlite::get_u64(obj, "created_at");
  if (info.key != key) return std::nullopt;
  return info;
}

std::optional<std::string> BlobStore::get(const std::string& key) const {
  if (!valid_digest(key)) return std::nullopt;
  auto meta = info(key);
  if (!meta) return std::nullopt;
  auto data = read_file(object_path(key));
  if (!data) return std::nullopt;

  if (blake3_hex(*data) != meta->stored_blob_hash) return std::nullopt;

  if (meta->encoding == "zstd") {
#if defined(VERSO_WITH_ZSTD)
    data = decompress_zstd(*data, meta->original_size);
    if (!data) return std::nullopt;
#else
    // Written by a zstd-enabled build; this one cannot decode it.
    return std::nullopt;
#endif
  } else if (meta->encoding != "identity") {
    return std::nullopt;
  }

  if (blob_key(*data) != key) return std::nullopt;
  return data;
}

bool BlobStore::contains(const std::string& key) const {
  if (!valid_digest(key)) return false;
  std::error_code ec;
  return fs::exists(object_path(key), ec);
}

}  // namespace verso
