#include "verso/types.hpp"

#include <cstdio>

namespace verso {

std::string to_string(ErrorCode code) {
  switch (code) {
    case ErrorCode::none: return "";
    case ErrorCode::not_found: return "not_found";
    case ErrorCode::invalid_input: return "invalid_input";
    case ErrorCode::concurrency_conflict: return "concurrency_conflict";
    case ErrorCode::size_limit_exceeded: return "size_limit_exceeded";
    case ErrorCode::storage_failed: return "storage_failed";
    case ErrorCode::integrity_failed: return "integrity_failed";
    case ErrorCode::config_invalid: return "config_invalid";
  }
  return "";
}

std::string format_version_id(uint64_t version_number) {
  char buf[32];
  std::snprintf(buf, sizeof(buf), "v%010llu",
                static_cast<unsigned long long>(version_number));
  return buf;
}

uint64_t parse_version_id(const std::string& id) {
  if (id.size() != 11 || id[0] != 'v') return 0;
  uint64_t n = 0;
  for (size_t i = 1; i < id.size(); ++i) {
    const char c = id[i];
    if (c < '0' || c > '9') return 0;
    n = n * 10 + static_cast<uint64_t>(c - '0');
  }
  return n;
}

DiffKind kind_of(const DiffEntry& entry) {
  switch (entry.index()) {
    case 0: return DiffKind::add;
    case 1: return DiffKind::remove;
    case 2: return DiffKind::modify;
    default: return DiffKind::unchanged;
  }
}

std::string to_string(DiffKind kind) {
  switch (kind) {
    case DiffKind::add: return "add";
    case DiffKind::remove: return "delete";
    case DiffKind::modify: return "modify";
    case DiffKind::unchanged: return "unchanged";
  }
  return "";
}

std::size_t display_line(const DiffEntry& entry) {
  if (const auto* a = std::get_if<AddedLine>(&entry)) return a->new_line;
  if (const auto* d = std::get_if<DeletedLine>(&entry)) return d->old_line;
  if (const auto* m = std::get_if<ModifiedLine>(&entry)) return m->new_line;
  return std::get<UnchangedLine>(entry).new_line;
}

const std::string& entry_content(const DiffEntry& entry) {
  return std::visit([](const auto& e) -> const std::string& { return e.content; },
                    entry);
}

}  // namespace verso
