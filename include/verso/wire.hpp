#pragma once

// verso/wire.hpp - JSON shapes exchanged with callers and printed by the CLI.
//
//   FileVersion      {id, documentId, content, timestamp, author, message|null,
//                     versionNumber, contentDigest, size}
//   DiffEntry        {type, lineNumber, content, oldContent|null}
//   ComparisonResult {additions, deletions, modifications, changed, coarse, diff}
//
// Field names are camelCase on the wire. Keys come out sorted.

#include <string>

#include "verso/report.hpp"
#include "verso/types.hpp"

namespace verso {

// include_content=false omits "content" (listings).
std::string version_to_json(const FileVersion& v, bool include_content = true);
std::string diff_entry_to_json(const DiffEntry& e);
std::string comparison_to_json(const ComparisonResult& c);
std::string page_to_json(const VersionPage& page, bool include_content = false);
std::string stats_to_json(const DocumentStats& s);
std::string side_by_side_to_json(const SideBySideView& view);
std::string error_to_json(ErrorCode code, const std::string& message);

}  // namespace verso
