#pragma once

// verso/config.hpp - Engine configuration.
//
// Sources, lowest priority first:
//   1. Compiled defaults (EngineConfig member initializers).
//   2. A JSON config file (load_config()).
//   3. VERSO_* environment variables (apply_env_overrides()).
//
// Config file shape (every key optional):
//   {
//     "config_version": "1",
//     "store": {"backend": "fs", "root": ".verso/store", "compression": "off"},
//     "diff": {"max_lines": 20000, "max_bytes": 8388608, "max_edit_distance": 2000},
//     "concurrency": {"lock_attempts": 5, "lock_timeout_ms": 200, "rollback_attempts": 3},
//     "pagination": {"default_limit": 50, "max_limit": 500}
//   }

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include "verso/diff.hpp"
#include "verso/types.hpp"

namespace verso {

class IVersionStore;

struct StoreOptions {
  std::string backend{"memory"};          // "memory" or "fs"
  std::string root{".verso/store"};       // fs backend only
  std::string compression{"off"};         // "off" or "zstd"
  uint32_t lock_attempts{5};
  uint32_t lock_timeout_ms{200};
  uint32_t default_page_limit{50};
  uint32_t max_page_limit{500};
};

struct EngineConfig {
  std::string config_version{"1"};
  StoreOptions store;
  DiffLimits diff;
  uint32_t rollback_attempts{3};
};

struct ConfigValidationResult {
  bool ok{false};
  std::string config_version;
  std::vector<std::string> errors;
  std::vector<std::string> warnings;
};

// Parse and validate a JSON config document.
ConfigValidationResult validate_config(const std::string& config_json);

// Merge a JSON config document into *config. Returns false (and leaves *config
// untouched) when the document does not validate; *error names the problem.
bool parse_config(const std::string& config_json, EngineConfig* config, std::string* error);

// Read a config file. A missing file is not an error: defaults are kept.
bool load_config(const std::string& path, EngineConfig* config, std::string* error);

void apply_env_overrides(EngineConfig* config);

std::string config_to_json(const EngineConfig& config);

// Build the store selected by config.store.backend. Returns nullptr for an
// unknown backend.
std::shared_ptr<IVersionStore> make_store(const EngineConfig& config);

}  // namespace verso
