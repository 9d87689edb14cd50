#include "verso/config.hpp"

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <set>
#include <sstream>

#include "verso/jsonlite.hpp"
#include "verso/store.hpp"

namespace verso {

namespace {

using jsonlite::Object;

bool is_u64(const Object& obj, const std::string& key) {
  auto it = obj.find(key);
  return it != obj.end() && std::holds_alternative<std::uint64_t>(it->second.v);
}

bool is_string(const Object& obj, const std::string& key) {
  auto it = obj.find(key);
  return it != obj.end() && std::holds_alternative<std::string>(it->second.v);
}

void warn_unknown_keys(const Object& obj, const std::string& section,
                       const std::set<std::string>& known, ConfigValidationResult* r) {
  for (const auto& [k, _] : obj) {
    if (!known.contains(k)) r->warnings.push_back("unknown key " + section + k);
  }
}

// Read an optional unsigned field. Records an error when present with the
// wrong type or outside [min, max].
void read_u32(const Object& obj, const std::string& section, const std::string& key,
              uint32_t min, uint32_t max, uint32_t* out, ConfigValidationResult* r) {
  if (!jsonlite::has_key(obj, key)) return;
  if (!is_u64(obj, key)) {
    r->errors.push_back(section + key + " must be a non-negative integer");
    return;
  }
  const uint64_t v = jsonlite::get_u64(obj, key);
  if (v < min || v > max) {
    r->errors.push_back(section + key + " must be in [" + std::to_string(min) + ", " +
                        std::to_string(max) + "]");
    return;
  }
  *out = static_cast<uint32_t>(v);
}

void read_size(const Object& obj, const std::string& section, const std::string& key,
               std::size_t min, std::size_t* out, ConfigValidationResult* r) {
  if (!jsonlite::has_key(obj, key)) return;
  if (!is_u64(obj, key)) {
    r->errors.push_back(section + key + " must be a non-negative integer");
    return;
  }
  const uint64_t v = jsonlite::get_u64(obj, key);
  if (v < min) {
    r->errors.push_back(section + key + " must be at least " + std::to_string(min));
    return;
  }
  *out = static_cast<std::size_t>(v);
}

void read_string(const Object& obj, const std::string& section, const std::string& key,
                 const std::set<std::string>& allowed, std::string* out,
                 ConfigValidationResult* r) {
  if (!jsonlite::has_key(obj, key)) return;
  if (!is_string(obj, key)) {
    r->errors.push_back(section + key + " must be a string");
    return;
  }
  std::string v = jsonlite::get_string(obj, key);
  if (!allowed.empty() && !allowed.contains(v)) {
    r->errors.push_back(section + key + " has unsupported value '" + v + "'");
    return;
  }
  if (v.empty()) {
    r->errors.push_back(section + key + " must not be empty");
    return;
  }
  *out = std::move(v);
}

const Object* section_of(const Object& root, const std::string& name, ConfigValidationResult* r) {
  if (!jsonlite::has_key(root, name)) return nullptr;
  const Object* obj = jsonlite::get_object(root, name);
  if (!obj) r->errors.push_back(name + " must be an object");
  return obj;
}

// Validate `json` and, section by section, apply it onto *config.
ConfigValidationResult apply_json(const std::string& json, EngineConfig* config) {
  ConfigValidationResult r;
  std::optional<jsonlite::JsonError> err;
  Object root = jsonlite::parse(json, &err);
  if (err) {
    r.errors.push_back(err->code + ": " + err->message);
    return r;
  }

  warn_unknown_keys(root, "", {"config_version", "store", "diff", "concurrency", "pagination"}, &r);

  if (jsonlite::has_key(root, "config_version")) {
    if (!is_string(root, "config_version")) {
      r.errors.push_back("config_version must be a string");
    } else {
      config->config_version = jsonlite::get_string(root, "config_version");
      if (config->config_version != "1") {
        r.errors.push_back("unsupported config_version '" + config->config_version + "'");
      }
    }
  }
  r.config_version = config->config_version;

  if (const Object* s = section_of(root, "store", &r)) {
    warn_unknown_keys(*s, "store.", {"backend", "root", "compression"}, &r);
    read_string(*s, "store.", "backend", {"memory", "fs"}, &config->store.backend, &r);
    read_string(*s, "store.", "root", {}, &config->store.root, &r);
    read_string(*s, "store.", "compression", {"off", "zstd"}, &config->store.compression, &r);
  }

  if (const Object* d = section_of(root, "diff", &r)) {
    warn_unknown_keys(*d, "diff.", {"max_lines", "max_bytes", "max_edit_distance"}, &r);
    read_size(*d, "diff.", "max_lines", 1, &config->diff.max_lines, &r);
    read_size(*d, "diff.", "max_bytes", 1, &config->diff.max_bytes, &r);
    read_size(*d, "diff.", "max_edit_distance", 1, &config->diff.max_edit_distance, &r);
  }

  if (const Object* c = section_of(root, "concurrency", &r)) {
    warn_unknown_keys(*c, "concurrency.", {"lock_attempts", "lock_timeout_ms", "rollback_attempts"}, &r);
    read_u32(*c, "concurrency.", "lock_attempts", 1, 1000, &config->store.lock_attempts, &r);
    read_u32(*c, "concurrency.", "lock_timeout_ms", 1, 60000, &config->store.lock_timeout_ms, &r);
    read_u32(*c, "concurrency.", "rollback_attempts", 1, 100, &config->rollback_attempts, &r);
  }

  if (const Object* p = section_of(root, "pagination", &r)) {
    warn_unknown_keys(*p, "pagination.", {"default_limit", "max_limit"}, &r);
    read_u32(*p, "pagination.", "default_limit", 1, 100000, &config->store.default_page_limit, &r);
    read_u32(*p, "pagination.", "max_limit", 1, 100000, &config->store.max_page_limit, &r);
  }

  if (config->store.default_page_limit > config->store.max_page_limit) {
    r.errors.push_back("pagination.default_limit exceeds pagination.max_limit");
  }
#if !defined(VERSO_WITH_ZSTD)
  if (config->store.compression == "zstd") {
    r.warnings.push_back("store.compression zstd requested but this build has no zstd; blobs are stored uncompressed");
  }
#endif

  r.ok = r.errors.empty();
  return r;
}

bool env_u64(const char* name, uint64_t* out) {
  const char* e = std::getenv(name);
  if (!e || !e[0]) return false;
  char* end = nullptr;
  const unsigned long long v = std::strtoull(e, &end, 10);
  if (!end || *end != '\0' || e[0] == '-') return false;
  *out = v;
  return true;
}

}  // namespace

ConfigValidationResult validate_config(const std::string& config_json) {
  EngineConfig scratch;
  return apply_json(config_json, &scratch);
}

bool parse_config(const std::string& config_json, EngineConfig* config, std::string* error) {
  EngineConfig candidate = *config;
  ConfigValidationResult r = apply_json(config_json, &candidate);
  if (!r.ok) {
    if (error) *error = r.errors.front();
    return false;
  }
  *config = std::move(candidate);
  return true;
}

bool load_config(const std::string& path, EngineConfig* config, std::string* error) {
  std::error_code ec;
  if (!std::filesystem::exists(path, ec)) return true;

  std::ifstream ifs(path, std::ios::binary);
  if (!ifs) {
    if (error) *error = "cannot open config file " + path;
    return false;
  }
  std::string text((std::istreambuf_iterator<char>(ifs)), std::istreambuf_iterator<char>());
  return parse_config(text, config, error);
}

void apply_env_overrides(EngineConfig* config) {
  if (const char* e = std::getenv("VERSO_STORE_ROOT"); e && e[0]) config->store.root = e;
  if (const char* e = std::getenv("VERSO_BACKEND"); e && e[0]) {
    const std::string v = e;
    if (v == "memory" || v == "fs") config->store.backend = v;
  }
  if (const char* e = std::getenv("VERSO_COMPRESSION"); e && e[0]) {
    const std::string v = e;
    if (v == "off" || v == "zstd") config->store.compression = v;
  }

  uint64_t v = 0;
  if (env_u64("VERSO_MAX_DIFF_LINES", &v) && v > 0) config->diff.max_lines = v;
  if (env_u64("VERSO_MAX_DIFF_BYTES", &v) && v > 0) config->diff.max_bytes = v;
  if (env_u64("VERSO_MAX_EDIT_DISTANCE", &v) && v > 0) config->diff.max_edit_distance = v;
  if (env_u64("VERSO_LOCK_ATTEMPTS", &v) && v > 0 && v <= 1000) {
    config->store.lock_attempts = static_cast<uint32_t>(v);
  }
  if (env_u64("VERSO_LOCK_TIMEOUT_MS", &v) && v > 0 && v <= 60000) {
    config->store.lock_timeout_ms = static_cast<uint32_t>(v);
  }
  if (env_u64("VERSO_PAGE_LIMIT", &v) && v > 0 && v <= 100000) {
    config->store.default_page_limit = static_cast<uint32_t>(v);
  }
  if (env_u64("VERSO_MAX_PAGE_LIMIT", &v) && v > 0 && v <= 100000) {
    config->store.max_page_limit = static_cast<uint32_t>(v);
  }
}

std::string config_to_json(const EngineConfig& config) {
  std::ostringstream o;
  o << "{\"config_version\":" << jsonlite::quote(config.config_version)
    << ",\"store\":{\"backend\":" << jsonlite::quote(config.store.backend)
    << ",\"root\":" << jsonlite::quote(config.store.root)
    << ",\"compression\":" << jsonlite::quote(config.store.compression) << "}"
    << ",\"diff\":{\"max_lines\":" << config.diff.max_lines
    << ",\"max_bytes\":" << config.diff.max_bytes
    << ",\"max_edit_distance\":" << config.diff.max_edit_distance << "}"
    << ",\"concurrency\":{\"lock_attempts\":" << config.store.lock_attempts
    << ",\"lock_timeout_ms\":" << config.store.lock_timeout_ms
    << ",\"rollback_attempts\":" << config.rollback_attempts << "}"
    << ",\"pagination\":{\"default_limit\":" << config.store.default_page_limit
    << ",\"max_limit\":" << config.store.max_page_limit << "}"
    << "}";
  return o.str();
}

std::shared_ptr<IVersionStore> make_store(const EngineConfig& config) {
  if (config.store.backend == "memory") return std::make_shared<MemoryVersionStore>(config.store);
  if (config.store.backend == "fs") return std::make_shared<FsVersionStore>(config.store);
  return nullptr;
}

}  // namespace verso
