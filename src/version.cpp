#include "verso/version.hpp"

#include <sstream>

#include "verso/hash.hpp"

#ifndef VERSO_VERSION_STRING
#define VERSO_VERSION_STRING "0.1.0"
#endif

namespace verso {
namespace version {

VersionManifest current_manifest() {
  VersionManifest m;
  m.engine_semver = VERSO_VERSION_STRING;
  m.hash_primitive = hash_runtime_info().primitive;
#if defined(VERSO_WITH_ZSTD)
  m.compression = "zstd";
#else
  m.compression = "identity";
#endif
  m.build_timestamp = std::string(__DATE__) + "T" + std::string(__TIME__);
  return m;
}

std::string manifest_to_json(const VersionManifest& m) {
  std::ostringstream o;
  o << "{"
    << "\"journal_format\":" << m.journal_format
    << ",\"blob_format\":" << m.blob_format
    << ",\"hash_algorithm\":" << m.hash_algorithm
    << ",\"diff_algorithm\":" << m.diff_algorithm
    << ",\"engine_semver\":\"" << m.engine_semver << "\""
    << ",\"hash_primitive\":\"" << m.hash_primitive << "\""
    << ",\"compression\":\"" << m.compression << "\""
    << ",\"build_timestamp\":\"" << m.build_timestamp << "\""
    << "}";
  return o.str();
}

bool journal_format_supported(uint64_t found) {
  return found >= 1 && found <= JOURNAL_FORMAT_VERSION;
}

}  // namespace version
}  // namespace verso
