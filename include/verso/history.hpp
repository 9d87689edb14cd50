#pragma once

// verso/history.hpp - Read-side queries over a version store.
//
// HistoryQuery never mutates the store. Comparisons normalise line endings,
// split into lines and hand off to compare_lines(), so the size ceiling in
// DiffLimits applies to every comparison made through here.

#include <memory>
#include <string>
#include <vector>

#include "verso/diff.hpp"
#include "verso/store.hpp"
#include "verso/types.hpp"

namespace verso {

// Version token that resolves to the document's current head.
inline constexpr const char* kCurrentVersion = "current";

class HistoryQuery {
 public:
  explicit HistoryQuery(std::shared_ptr<IVersionStore> store, DiffLimits limits = {});

  PageResult list_versions(const std::string& document_id, const std::string& cursor = "",
                           uint32_t limit = 0) const;
  VersionResult get_version(const std::string& document_id, const std::string& version_id) const;
  VersionResult current(const std::string& document_id) const;

  // Diff version_a (old side) against version_b (new side). version_b may be
  // kCurrentVersion. A coarse result comes back with ok=true and
  // error=size_limit_exceeded.
  CompareResult compare(const std::string& document_id, const std::string& version_a,
                        const std::string& version_b) const;

  // Diff a stored version against unsaved, already-split draft lines.
  CompareResult compare_with_draft(const std::string& document_id, const std::string& version_a,
                                   const std::vector<std::string>& draft_lines) const;

  StatsResult statistics(const std::string& document_id) const;

  const DiffLimits& limits() const { return limits_; }

 private:
  VersionResult resolve(const std::string& document_id, const std::string& version_id) const;
  CompareResult compare_contents(const std::string& document_id, const std::string& label,
                                 const std::vector<std::string>& old_lines,
                                 const std::vector<std::string>& new_lines) const;

  std::shared_ptr<IVersionStore> store_;
  DiffLimits limits_;
};

}  // namespace verso
