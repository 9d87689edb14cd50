#include <algorithm>
#include <atomic>
#include <cmath>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <iterator>
#include <random>
#include <set>
#include <stdexcept>
#include <string>
#include <thread>
#include <variant>
#include <vector>

#include "verso/blob_store.hpp"
#include "verso/config.hpp"
#include "verso/diff.hpp"
#include "verso/hash.hpp"
#include "verso/history.hpp"
#include "verso/journal.hpp"
#include "verso/jsonlite.hpp"
#include "verso/observability.hpp"
#include "verso/report.hpp"
#include "verso/rollback.hpp"
#include "verso/store.hpp"
#include "verso/types.hpp"
#include "verso/version.hpp"
#include "verso/wire.hpp"

namespace fs = std::filesystem;

namespace {
int g_tests_run = 0;
int g_tests_passed = 0;

void expect(bool condition, const std::string& message) {
  if (!condition) {
    std::cerr << "FAIL: " << message << "\n";
    std::exit(1);
  }
}

void run_test(const std::string& name, void (*fn)()) {
  std::cout << "  " << name << "...";
  fn();
  std::cout << " PASSED\n";
  g_tests_run++;
  g_tests_passed++;
}

using Lines = std::vector<std::string>;

fs::path fresh_dir(const std::string& name) {
  const fs::path p = fs::temp_directory_path() / name;
  fs::remove_all(p);
  fs::create_directories(p);
  return p;
}

verso::StoreOptions fs_options(const fs::path& root) {
  verso::StoreOptions o;
  o.backend = "fs";
  o.root = root.string();
  return o;
}

std::string read_text(const fs::path& p) {
  std::ifstream ifs(p, std::ios::binary);
  return std::string((std::istreambuf_iterator<char>(ifs)), std::istreambuf_iterator<char>());
}

void write_text(const fs::path& p, const std::string& data) {
  std::ofstream ofs(p, std::ios::binary | std::ios::trunc);
  ofs << data;
}

// Reference LCS length by dynamic programming.
std::size_t lcs_length(const Lines& a, const Lines& b) {
  std::vector<std::vector<std::size_t>> t(a.size() + 1, std::vector<std::size_t>(b.size() + 1, 0));
  for (std::size_t i = 1; i <= a.size(); ++i) {
    for (std::size_t j = 1; j <= b.size(); ++j) {
      t[i][j] = a[i - 1] == b[j - 1] ? t[i - 1][j - 1] + 1 : std::max(t[i - 1][j], t[i][j - 1]);
    }
  }
  return t[a.size()][b.size()];
}

Lines random_lines(std::mt19937& rng, std::size_t max_len) {
  static const char* kAlphabet[] = {"a", "b", "c", "d"};
  std::uniform_int_distribution<std::size_t> len(0, max_len);
  std::uniform_int_distribution<int> pick(0, 3);
  Lines out(len(rng));
  for (auto& l : out) l = kAlphabet[pick(rng)];
  return out;
}

// Every old line appears in exactly one Delete/Modify/Unchanged, every new
// line in exactly one Add/Modify/Unchanged, in order.
bool partitions(const Lines& a, const Lines& b, const std::vector<verso::DiffEntry>& d) {
  std::vector<std::size_t> old_seen;
  std::vector<std::size_t> new_seen;
  for (const auto& e : d) {
    if (const auto* x = std::get_if<verso::AddedLine>(&e)) {
      if (x->new_line == 0 || x->new_line > b.size() || b[x->new_line - 1] != x->content) return false;
      new_seen.push_back(x->new_line);
    } else if (const auto* x = std::get_if<verso::DeletedLine>(&e)) {
      if (x->old_line == 0 || x->old_line > a.size() || a[x->old_line - 1] != x->content) return false;
      old_seen.push_back(x->old_line);
    } else if (const auto* x = std::get_if<verso::ModifiedLine>(&e)) {
      if (x->old_line == 0 || x->old_line > a.size() || a[x->old_line - 1] != x->old_content) return false;
      if (x->new_line == 0 || x->new_line > b.size() || b[x->new_line - 1] != x->content) return false;
      old_seen.push_back(x->old_line);
      new_seen.push_back(x->new_line);
    } else {
      const auto& u = std::get<verso::UnchangedLine>(e);
      if (u.old_line == 0 || u.old_line > a.size() || a[u.old_line - 1] != u.content) return false;
      if (u.new_line == 0 || u.new_line > b.size() || b[u.new_line - 1] != u.content) return false;
      old_seen.push_back(u.old_line);
      new_seen.push_back(u.new_line);
    }
  }
  std::sort(old_seen.begin(), old_seen.end());
  std::sort(new_seen.begin(), new_seen.end());
  for (std::size_t i = 0; i < old_seen.size(); ++i) if (old_seen[i] != i + 1) return false;
  for (std::size_t i = 0; i < new_seen.size(); ++i) if (new_seen[i] != i + 1) return false;
  return old_seen.size() == a.size() && new_seen.size() == b.size();
}

// ============================================================================
// Hashing
// ============================================================================

void test_blake3_known_vectors() {
  expect(verso::blake3_hex("") == "af1349b9f5f9a1a6a0404dea36dcc9499bcb25c9adc112b7cc9a93cae41f3262",
         "BLAKE3 empty vector");
  expect(verso::blake3_hex("hello") == "ea8f163db38682925e4491c5e58d4bb3506ef8c14eb78a86e908c5624a67200f",
         "BLAKE3 hello vector");
}

void test_domain_separation() {
  const std::string data = "chapter one";
  expect(verso::content_digest(data) != verso::blob_key(data), "doc and blob domains must differ");
  expect(verso::content_digest(data) == verso::hash_domain("doc:", data), "content digest uses doc: domain");
  expect(verso::blob_key(data) == verso::hash_domain("blob:", data), "blob key uses blob: domain");
  expect(verso::valid_digest(verso::content_digest(data)), "digest must be 64 lowercase hex");
  expect(!verso::valid_digest("ABC"), "short digest rejected");
  expect(verso::journal_chain_digest(verso::kJournalGenesis, "x") !=
             verso::journal_chain_digest(verso::kJournalGenesis, "y"),
         "chain digest covers the line");
}

// ============================================================================
// Text helpers
// ============================================================================

void test_split_lines() {
  expect(verso::split_lines("").empty(), "empty text has no lines");
  expect((verso::split_lines("a\nb") == Lines{"a", "b"}), "two lines");
  expect((verso::split_lines("a\nb\n") == Lines{"a", "b", ""}), "trailing newline keeps a final empty line");
  expect((verso::split_lines("a\n\nb") == Lines{"a", "", "b"}), "blank line kept");
  expect((verso::split_lines("\n") == Lines{"", ""}), "lone newline is two empty lines");
  for (const char* text : {"", "a", "a\n", "\n\n", "a\n\nb\n"}) {
    expect(verso::join_lines(verso::split_lines(text)) == text, "join restores split text");
  }
}

void test_normalize_line_endings() {
  expect(verso::normalize_line_endings("a\r\nb\rc\n") == "a\nb\nc\n", "CRLF and CR become LF");
  expect((verso::split_lines(verso::normalize_line_endings("x\r\ny")) == Lines{"x", "y"}),
         "normalized CRLF splits cleanly");
  expect(verso::join_lines({"a", "b"}) == "a\nb", "join is inverse of split");
}

// ============================================================================
// Diff engine
// ============================================================================

void test_scenario_modify_middle() {
  const Lines a{"A", "B", "C"};
  const Lines b{"A", "X", "C"};
  const auto d = verso::diff(a, b);
  expect(d.size() == 3, "three entries");
  expect(std::holds_alternative<verso::UnchangedLine>(d[0]), "A unchanged");
  const auto* m = std::get_if<verso::ModifiedLine>(&d[1]);
  expect(m != nullptr, "B->X is a modification");
  expect(m->old_content == "B" && m->content == "X", "modification carries both sides");
  expect(m->old_line == 2 && m->new_line == 2, "modification line numbers");
  expect(std::holds_alternative<verso::UnchangedLine>(d[2]), "C unchanged");

  const auto r = verso::report(d);
  expect(r.additions == 0 && r.deletions == 0 && r.modifications == 1, "counts 0/0/1");
  expect(r.changed, "changed");
}

void test_scenario_empty_old() {
  const auto r = verso::report(verso::diff({}, {"A", "B"}));
  expect(r.additions == 2 && r.deletions == 0 && r.modifications == 0, "counts 2/0/0");
  const auto* first = std::get_if<verso::AddedLine>(&r.diff[0]);
  expect(first && first->new_line == 1 && first->content == "A", "first addition");
}

void test_scenario_empty_new() {
  const auto r = verso::report(verso::diff({"A", "B"}, {}));
  expect(r.additions == 0 && r.deletions == 2 && r.modifications == 0, "counts 0/2/0");
  const auto* second = std::get_if<verso::DeletedLine>(&r.diff[1]);
  expect(second && second->old_line == 2 && second->content == "B", "second deletion");
}

void test_scenario_identical() {
  const Lines a{"A", "B", "C"};
  const auto r = verso::report(verso::diff(a, a));
  expect(r.additions == 0 && r.deletions == 0 && r.modifications == 0, "counts 0/0/0");
  expect(r.diff.size() == 3, "three unchanged entries");
  for (const auto& e : r.diff) {
    expect(verso::kind_of(e) == verso::DiffKind::unchanged, "every entry unchanged");
  }
  expect(!r.changed, "not changed");
}

void test_hunk_collapse() {
  // Two deletions and one addition in one hunk: one Modify then one Delete.
  const auto d = verso::diff({"A", "B", "C", "D"}, {"A", "X", "D"});
  const auto r = verso::report(d);
  expect(r.modifications == 1 && r.deletions == 1 && r.additions == 0, "collapse counts 0/1/1");
  expect(verso::kind_of(d[1]) == verso::DiffKind::modify, "modify comes first in the hunk");
  expect(verso::kind_of(d[2]) == verso::DiffKind::remove, "leftover deletion follows");
}

void test_leading_run_preferred() {
  // Duplicate line: the prefix is stripped first, so the leading A stays
  // matched and the trailing one is the addition.
  const auto d = verso::diff({"A"}, {"A", "A"});
  expect(d.size() == 2, "two entries");
  const auto* u = std::get_if<verso::UnchangedLine>(&d[0]);
  expect(u && u->old_line == 1 && u->new_line == 1, "leading line unchanged");
  const auto* a = std::get_if<verso::AddedLine>(&d[1]);
  expect(a && a->new_line == 2, "second line added");
}

void test_self_compare_idempotence() {
  std::mt19937 rng(7);
  for (int i = 0; i < 200; ++i) {
    const Lines a = random_lines(rng, 12);
    const auto r = verso::report(verso::diff(a, a));
    expect(!r.changed && r.diff.size() == a.size(), "self diff must be all unchanged");
  }
}

void test_partition_invariant() {
  std::mt19937 rng(11);
  for (int i = 0; i < 500; ++i) {
    const Lines a = random_lines(rng, 10);
    const Lines b = random_lines(rng, 10);
    expect(partitions(a, b, verso::diff(a, b)), "diff must partition both inputs");
  }
}

void test_count_conservation_under_swap() {
  std::mt19937 rng(23);
  for (int i = 0; i < 500; ++i) {
    const Lines a = random_lines(rng, 10);
    const Lines b = random_lines(rng, 10);
    const auto ab = verso::report(verso::diff(a, b));
    const auto ba = verso::report(verso::diff(b, a));
    expect(ab.additions == ba.deletions, "additions(a->b) == deletions(b->a)");
    expect(ab.deletions == ba.additions, "deletions(a->b) == additions(b->a)");
    expect(ab.modifications == ba.modifications, "modifications symmetric");
  }
}

void test_minimality_against_lcs() {
  std::mt19937 rng(42);
  for (int i = 0; i < 500; ++i) {
    const Lines a = random_lines(rng, 9);
    const Lines b = random_lines(rng, 9);
    const auto r = verso::report(verso::diff(a, b));
    const std::size_t lcs = lcs_length(a, b);
    const std::size_t unchanged = r.diff.size() - r.additions - r.deletions - r.modifications;
    expect(unchanged == lcs, "unchanged count must equal LCS length");
    expect(r.additions + r.deletions + 2 * r.modifications == a.size() + b.size() - 2 * lcs,
           "edit script must be minimal");
  }
}

void test_bounded_diff_truncates() {
  const Lines a{"a", "b", "c", "d"};
  const Lines b{"w", "x", "y", "z"};
  const auto bounded = verso::diff_bounded(a, b, 3);
  expect(bounded.truncated, "distance 8 exceeds bound 3");
  expect(bounded.entries.empty(), "truncated diff has no entries");

  const auto full = verso::diff_bounded(a, b, 8);
  expect(!full.truncated, "bound 8 is enough");
  expect(full.edit_distance == 8, "edit distance counts inserts and deletes");

  // Pure insertions are linear and never truncated.
  const auto inserts = verso::diff_bounded({}, Lines(50, "q"), 1);
  expect(!inserts.truncated && inserts.entries.size() == 50, "pure insertion ignores the bound");
}

// ============================================================================
// Comparison reporter
// ============================================================================

void test_coarse_over_line_ceiling() {
  verso::DiffLimits limits;
  limits.max_lines = 2;
  const auto lc = verso::compare_lines({"a", "b", "c"}, {"a", "b", "d"}, limits);
  expect(lc.status == verso::ErrorCode::size_limit_exceeded, "status size_limit_exceeded");
  expect(lc.result.coarse, "coarse flag set");
  expect(lc.result.changed, "digest test detects the change");
  expect(lc.result.diff.empty(), "coarse diff is empty");
  expect(lc.result.additions + lc.result.deletions + lc.result.modifications == 0, "coarse counts are zero");

  const auto same = verso::compare_lines({"a", "b", "c"}, {"a", "b", "c"}, limits);
  expect(same.result.coarse && !same.result.changed, "coarse identical inputs are unchanged");
}

void test_coarse_over_byte_ceiling() {
  verso::DiffLimits limits;
  limits.max_bytes = 8;
  const auto lc = verso::compare_lines({"0123456789"}, {"0123456789"}, limits);
  expect(lc.result.coarse && !lc.result.changed, "byte ceiling gives coarse unchanged");
}

void test_coarse_over_edit_distance() {
  verso::DiffLimits limits;
  limits.max_edit_distance = 2;
  const auto lc = verso::compare_lines({"a", "b", "c"}, {"x", "y", "z"}, limits);
  expect(lc.result.coarse && lc.result.changed, "edit distance bound gives coarse result");
  expect(lc.status == verso::ErrorCode::size_limit_exceeded, "degraded status reported");
}

void test_zero_edit_distance_uses_default_bound() {
  verso::DiffLimits limits;
  limits.max_edit_distance = 0;
  Lines old_lines;
  Lines new_lines;
  for (int i = 0; i < 3000; ++i) {
    old_lines.push_back("old " + std::to_string(i));
    new_lines.push_back("new " + std::to_string(i));
  }
  const auto lc = verso::compare_lines(old_lines, new_lines, limits);
  expect(lc.status == verso::ErrorCode::size_limit_exceeded, "zero bound still degrades");
  expect(lc.result.coarse && lc.result.changed && lc.result.diff.empty(), "coarse result returned");
  expect(lc.reason.find(std::to_string(verso::kDefaultMaxEditDistance)) != std::string::npos,
         "default bound named in the reason");

  const auto small = verso::compare_lines({"a", "b"}, {"a", "c"}, limits);
  expect(!small.result.coarse && small.result.modifications == 1, "small diffs stay exact");
}

void test_side_by_side_placeholders() {
  const auto d = verso::diff({"A", "B", "C"}, {"A", "X", "C", "D"});
  const auto view = verso::side_by_side(d);
  expect(view.rows.size() == d.size(), "one row per entry");
  expect(view.rows[1].old_side && view.rows[1].new_side, "modification shows both sides");
  expect(view.rows[1].old_side->text == "B" && view.rows[1].new_side->text == "X", "modify texts");
  expect(!view.rows[3].old_side, "addition has an empty old side");
  expect(view.rows[3].new_side->line == 4 && view.rows[3].new_side->kind == verso::DiffKind::add,
         "addition cell");

  const auto del_view = verso::side_by_side(verso::diff({"A", "B"}, {"A"}));
  expect(del_view.rows[1].old_side && !del_view.rows[1].new_side, "deletion has an empty new side");
}

void test_render_unified() {
  const auto text = verso::render_unified(verso::diff({"A", "B"}, {"A", "X", "Y"}));
  expect(text == "  A\n- B\n+ X\n+ Y\n", "unified rendering");
}

// ============================================================================
// Memory store
// ============================================================================

void test_create_and_get() {
  verso::MemoryVersionStore store;
  const auto r = store.create_version("thesis", "intro\nbody", "alice", std::string("first draft"));
  expect(r.ok, "create succeeds");
  expect(r.version.id == "v0000000001", "first id");
  expect(r.version.version_number == 1, "first version number");
  expect(r.version.size_bytes == 10, "size in bytes");
  expect(r.version.content_digest == verso::content_digest("intro\nbody"), "content digest");
  expect(r.version.message && *r.version.message == "first draft", "message kept");

  const auto g = store.get_version("thesis", r.version.id);
  expect(g.ok && g.version.content == "intro\nbody", "get returns the content");

  const auto missing = store.get_version("thesis", "v0000000009");
  expect(!missing.ok && missing.error == verso::ErrorCode::not_found, "unknown version not_found");
  const auto unknown_doc = store.head("nope");
  expect(!unknown_doc.ok && unknown_doc.error == verso::ErrorCode::not_found, "unknown document not_found");
}

void test_invalid_input_rejected() {
  verso::MemoryVersionStore store;
  const auto check = [&](const std::string& doc, const std::string& content, const std::string& author,
                         const std::string& what) {
    const auto r = store.create_version(doc, content, author, std::nullopt);
    expect(!r.ok && r.error == verso::ErrorCode::invalid_input, what);
  };
  check("", "x", "alice", "empty document id");
  check("..", "x", "alice", "dot-dot document id");
  check("a/b", "x", "alice", "slash in document id");
  check(std::string(129, 'a'), "x", "alice", "overlong document id");
  check("doc", "x", "", "empty author");
  check("doc", std::string("a\0b", 3), "alice", "NUL in content");
  check("doc", "\xC3\x28", "alice", "invalid UTF-8");
  check("doc", "\xC0\xAF", "alice", "overlong UTF-8");
  expect(store.list_documents().empty(), "rejected creates leave no document behind");
  expect(store.create_version("doc", "caf\xC3\xA9", "alice", std::nullopt).ok, "valid UTF-8 accepted");
}

void test_monotonic_history() {
  verso::MemoryVersionStore store;
  for (int i = 0; i < 20; ++i) {
    expect(store.create_version("doc", "rev " + std::to_string(i), "alice", std::nullopt).ok, "create");
  }
  const auto page = store.list_versions("doc", "", 100);
  expect(page.ok && page.page.versions.size() == 20, "all versions listed");
  for (std::size_t i = 1; i < page.page.versions.size(); ++i) {
    expect(page.page.versions[i - 1].timestamp_unix_ms > page.page.versions[i].timestamp_unix_ms,
           "listing is strictly most-recent-first");
  }
  expect(page.page.versions.front().id == "v0000000020", "head first");
  expect(page.page.next_cursor.empty(), "no further page");
}

void test_optimistic_conflict() {
  verso::MemoryVersionStore store;
  const auto v1 = store.create_version("doc", "one", "alice", std::nullopt, std::string(""));
  expect(v1.ok, "empty expected head matches a new document");
  const auto stale = store.create_version("doc", "two", "bob", std::nullopt, std::string(""));
  expect(!stale.ok && stale.error == verso::ErrorCode::concurrency_conflict, "stale head rejected");
  const auto fresh = store.create_version("doc", "two", "bob", std::nullopt, v1.version.id);
  expect(fresh.ok && fresh.version.id == "v0000000002", "matching head accepted");
  const auto page = store.list_versions("doc");
  expect(page.page.versions.size() == 2, "conflict left no entry");
}

void test_pagination() {
  verso::StoreOptions opts;
  opts.default_page_limit = 2;
  opts.max_page_limit = 3;
  verso::MemoryVersionStore store(opts);
  for (int i = 0; i < 5; ++i) store.create_version("doc", std::to_string(i), "alice", std::nullopt);

  const auto p1 = store.list_versions("doc");
  expect(p1.ok && p1.page.versions.size() == 2, "default limit");
  expect(p1.page.versions[0].id == "v0000000005" && p1.page.next_cursor == "v0000000004", "page 1");

  // Appends between pages do not shift the cursor.
  store.create_version("doc", "late", "bob", std::nullopt);
  const auto p2 = store.list_versions("doc", p1.page.next_cursor, 0);
  expect(p2.page.versions.size() == 2 && p2.page.versions[0].id == "v0000000003", "page 2");
  const auto p3 = store.list_versions("doc", p2.page.next_cursor, 0);
  expect(p3.page.versions.size() == 1 && p3.page.versions[0].id == "v0000000001", "page 3");
  expect(p3.page.next_cursor.empty(), "exhausted");

  const auto clamped = store.list_versions("doc", "", 100);
  expect(clamped.page.versions.size() == 3, "limit clamped to maximum");

  const auto bad = store.list_versions("doc", "v0000000099", 0);
  expect(!bad.ok && bad.error == verso::ErrorCode::invalid_input, "unknown cursor is invalid_input");
  const auto missing = store.list_versions("ghost");
  expect(!missing.ok && missing.error == verso::ErrorCode::not_found, "unknown document not_found");
}

void test_concurrent_creates() {
  auto store = std::make_shared<verso::MemoryVersionStore>();
  constexpr int kThreads = 4;
  constexpr int kPerThread = 50;
  std::atomic<int> failures{0};
  std::vector<std::thread> threads;
  for (int t = 0; t < kThreads; ++t) {
    threads.emplace_back([&, t] {
      for (int i = 0; i < kPerThread; ++i) {
        auto r = store->create_version("shared", "t" + std::to_string(t) + " i" + std::to_string(i),
                                       "user" + std::to_string(t), std::nullopt);
        if (!r.ok) failures.fetch_add(1);
      }
    });
  }
  for (auto& th : threads) th.join();
  expect(failures.load() == 0, "no create failed");

  const auto page = store->list_versions("shared", "", 500);
  expect(page.page.versions.size() == kThreads * kPerThread, "every create listed");
  std::set<std::string> ids;
  for (std::size_t i = 0; i < page.page.versions.size(); ++i) {
    ids.insert(page.page.versions[i].id);
    if (i > 0) {
      expect(page.page.versions[i - 1].timestamp_unix_ms > page.page.versions[i].timestamp_unix_ms,
             "timestamps strictly ordered");
    }
  }
  expect(ids.size() == kThreads * kPerThread, "ids never collide");
}

void test_documents_isolated() {
  verso::MemoryVersionStore store;
  store.create_version("b-doc", "x", "alice", std::nullopt);
  store.create_version("a-doc", "y", "alice", std::nullopt);
  store.create_version("a-doc", "z", "alice", std::nullopt);
  const auto docs = store.list_documents();
  expect((docs == std::vector<std::string>{"a-doc", "b-doc"}), "documents sorted");
  expect(store.head("b-doc").version.id == "v0000000001", "numbering is per document");
}

// ============================================================================
// File store
// ============================================================================

void test_fs_persistence_across_reopen() {
  const fs::path root = fresh_dir("verso_fs_reopen");
  {
    verso::FsVersionStore store(fs_options(root));
    expect(store.create_version("paper", "alpha\nbeta", "alice", std::string("one")).ok, "create 1");
    expect(store.create_version("paper", "alpha\ngamma", "bob", std::nullopt).ok, "create 2");
  }
  verso::FsVersionStore reopened(fs_options(root));
  const auto page = reopened.list_versions("paper");
  expect(page.ok && page.page.versions.size() == 2, "history survives reopen");
  expect(page.page.versions[0].content == "alpha\ngamma", "content restored from blob");
  expect(page.page.versions[1].message && *page.page.versions[1].message == "one", "message restored");
  expect(!page.page.versions[0].message, "absent message stays absent");

  const auto v3 = reopened.create_version("paper", "delta", "alice", std::nullopt);
  expect(v3.ok && v3.version.id == "v0000000003", "numbering continues after reopen");
  expect(v3.version.timestamp_unix_ms > page.page.versions[0].timestamp_unix_ms,
         "timestamps continue to increase after reopen");
  expect((reopened.list_documents() == std::vector<std::string>{"paper"}), "document listed from disk");
  fs::remove_all(root);
}

void test_fs_blob_dedup() {
  const fs::path root = fresh_dir("verso_fs_dedup");
  verso::FsVersionStore store(fs_options(root));
  store.create_version("a", "same text", "alice", std::nullopt);
  store.create_version("b", "same text", "bob", std::nullopt);
  std::size_t objects = 0;
  for (const auto& e : fs::recursive_directory_iterator(root / "objects")) {
    if (e.is_regular_file() && e.path().extension() != ".meta") ++objects;
  }
  expect(objects == 1, "identical content stored once");
  const auto key = verso::blob_key("same text");
  expect(store.blobs().contains(key), "blob present under its key");
  expect(store.blobs().get(key).value_or("") == "same text", "blob round trip");
  fs::remove_all(root);
}

void test_fs_journal_tamper_detected() {
  const fs::path root = fresh_dir("verso_fs_tamper");
  std::string journal;
  {
    verso::FsVersionStore store(fs_options(root));
    store.create_version("doc", "one", "alice", std::nullopt);
    store.create_version("doc", "two", "alice", std::nullopt);
    journal = store.journal_path("doc");
  }
  std::string text = read_text(journal);
  const auto pos = text.find("\"author\":\"alice\"");
  expect(pos != std::string::npos, "journal holds the author");
  text.replace(pos, 16, "\"author\":\"mallo\"");
  write_text(journal, text);

  verso::FsVersionStore reopened(fs_options(root));
  const auto r = reopened.get_version("doc", "v0000000001");
  expect(!r.ok && r.error == verso::ErrorCode::integrity_failed, "edited journal line detected");
  const auto c = reopened.create_version("doc", "three", "alice", std::nullopt);
  expect(!c.ok && c.error == verso::ErrorCode::integrity_failed, "corrupt document refuses writes");
  fs::remove_all(root);
}

void test_fs_blob_tamper_detected() {
  const fs::path root = fresh_dir("verso_fs_blob_tamper");
  std::string object;
  {
    verso::FsVersionStore store(fs_options(root));
    store.create_version("doc", "original content", "alice", std::nullopt);
    object = store.blobs().object_path(verso::blob_key("original content"));
  }
  write_text(object, "forged content!!");
  verso::FsVersionStore reopened(fs_options(root));
  const auto r = reopened.head("doc");
  expect(!r.ok && r.error == verso::ErrorCode::integrity_failed, "forged blob detected");
  fs::remove_all(root);
}

void test_blob_put_repairs_corrupt_object() {
  const fs::path root = fresh_dir("verso_blob_repair");
  verso::BlobStore blobs(root.string());
  const std::string key = blobs.put("payload");
  expect(!key.empty(), "first put stores the blob");

  write_text(blobs.object_path(key), "garbage");
  expect(!blobs.get(key), "corrupt object fails verification");

  expect(blobs.put("payload") == key, "put with the same bytes succeeds");
  expect(blobs.get(key).value_or("") == "payload", "object rewritten from the caller's bytes");

  {
    verso::FsVersionStore store(fs_options(root / "store"));
    store.create_version("doc", "shared", "alice", std::nullopt);
    write_text(store.blobs().object_path(verso::blob_key("shared")), "rot");
    expect(store.create_version("doc", "shared", "bob", std::nullopt).ok,
           "later create with the same content still succeeds");
  }
  verso::FsVersionStore reopened(fs_options(root / "store"));
  expect(reopened.head("doc").ok, "repaired history replays");
  fs::remove_all(root);
}

void test_journal_replay_rules() {
  const fs::path root = fresh_dir("verso_journal_rules");
  const std::string path = (root / "doc.ndjson").string();

  verso::JournalRecord rec;
  rec.seq = 1;
  rec.prev = verso::kJournalGenesis;
  rec.id = verso::format_version_id(1);
  rec.timestamp_unix_ms = 1000;
  rec.author = "alice";
  rec.content_digest = verso::content_digest("x");
  rec.size_bytes = 1;
  rec.blob = verso::blob_key("x");
  const std::string line = verso::journal_record_to_json(rec);
  expect(verso::append_journal_line(path, line), "append succeeds");

  auto replay = verso::replay_journal(path);
  expect(replay.ok && replay.records.size() == 1, "one record replayed");
  expect(replay.tail == verso::journal_chain_digest(verso::kJournalGenesis, line), "tail chains the line");

  // A record that skips a sequence number breaks the journal.
  rec.seq = 3;
  rec.id = verso::format_version_id(3);
  rec.prev = replay.tail;
  rec.timestamp_unix_ms = 2000;
  expect(verso::append_journal_line(path, verso::journal_record_to_json(rec)), "append gap record");
  replay = verso::replay_journal(path);
  expect(!replay.ok && replay.error.find("sequence") != std::string::npos, "sequence gap reported");

  expect(verso::replay_journal((root / "absent.ndjson").string()).ok, "missing journal is empty");
  fs::remove_all(root);
}

void test_fs_concurrent_creates() {
  const fs::path root = fresh_dir("verso_fs_concurrent");
  auto store = std::make_shared<verso::FsVersionStore>(fs_options(root));
  std::vector<std::thread> threads;
  for (int t = 0; t < 2; ++t) {
    threads.emplace_back([&, t] {
      for (int i = 0; i < 10; ++i) {
        store->create_version("doc", "t" + std::to_string(t) + "-" + std::to_string(i), "u", std::nullopt);
      }
    });
  }
  for (auto& th : threads) th.join();
  verso::FsVersionStore reopened(fs_options(root));
  const auto page = reopened.list_versions("doc", "", 100);
  expect(page.ok && page.page.versions.size() == 20, "journal holds every concurrent create");
  fs::remove_all(root);
}

// ============================================================================
// History queries
// ============================================================================

void test_compare_with_current() {
  auto store = std::make_shared<verso::MemoryVersionStore>();
  store->create_version("doc", "A\nB\nC", "alice", std::nullopt);
  store->create_version("doc", "A\r\nX\r\nC", "bob", std::nullopt);
  verso::HistoryQuery history(store);

  const auto r = history.compare("doc", "v0000000001", verso::kCurrentVersion);
  expect(r.ok && r.error == verso::ErrorCode::none, "compare succeeds");
  expect(r.comparison.modifications == 1 && r.comparison.additions == 0 && r.comparison.deletions == 0,
         "CRLF content normalised before diffing");

  const auto self = history.compare("doc", "v0000000002", verso::kCurrentVersion);
  expect(!self.comparison.changed, "head against current is unchanged");

  const auto missing = history.compare("doc", "v0000000007", verso::kCurrentVersion);
  expect(!missing.ok && missing.error == verso::ErrorCode::not_found, "missing side is not_found");
}

void test_compare_trailing_newline() {
  auto store = std::make_shared<verso::MemoryVersionStore>();
  store->create_version("doc", "a", "alice", std::nullopt);
  store->create_version("doc", "a\n", "alice", std::nullopt);
  verso::HistoryQuery history(store);

  const auto r = history.compare("doc", "v0000000001", "v0000000002");
  expect(r.ok && r.comparison.changed, "added trailing newline is a change");
  expect(r.comparison.additions == 1 && r.comparison.deletions == 0 && r.comparison.modifications == 0,
         "trailing newline shows as one added empty line");
  expect(history.compare("doc", "v0000000002", "v0000000001").comparison.deletions == 1,
         "removing it is one deletion");

  verso::DiffLimits tiny;
  tiny.max_lines = 1;
  const auto coarse = verso::compare_lines(verso::split_lines("a"), verso::split_lines("a\n"), tiny);
  expect(coarse.result.coarse && coarse.result.changed, "coarse digest test sees the newline");
}

void test_compare_with_draft() {
  auto store = std::make_shared<verso::MemoryVersionStore>();
  store->create_version("doc", "A\nB", "alice", std::nullopt);
  verso::HistoryQuery history(store);
  const auto r = history.compare_with_draft("doc", verso::kCurrentVersion, {"A", "B", "C"});
  expect(r.ok && r.comparison.additions == 1, "draft addition counted");
  expect(store->list_versions("doc").page.versions.size() == 1, "draft is never stored");
}

void test_compare_coarse_through_history() {
  auto store = std::make_shared<verso::MemoryVersionStore>();
  store->create_version("doc", "a\nb\nc", "alice", std::nullopt);
  store->create_version("doc", "a\nb\nd", "alice", std::nullopt);
  verso::DiffLimits limits;
  limits.max_lines = 2;
  verso::HistoryQuery history(store, limits);
  const auto r = history.compare("doc", "v0000000001", "v0000000002");
  expect(r.ok, "coarse comparison is not a failure");
  expect(r.error == verso::ErrorCode::size_limit_exceeded, "degraded status carried");
  expect(r.comparison.coarse && r.comparison.changed && r.comparison.diff.empty(), "coarse result shape");
}

void test_statistics() {
  auto store = std::make_shared<verso::MemoryVersionStore>();
  store->create_version("doc", "a\nb", "alice", std::nullopt);
  store->create_version("doc", "a\nc", "bob", std::nullopt);
  store->create_version("doc", "a\nc\nd", "alice", std::nullopt);
  verso::HistoryQuery history(store);

  const auto r = history.statistics("doc");
  expect(r.ok, "statistics succeed");
  expect(r.stats.total_versions == 3, "three versions");
  expect(r.stats.total_changes == 2, "one modification plus one addition");
  expect((r.stats.contributors == std::vector<std::string>{"alice", "bob"}), "contributors in first-seen order");
  expect(std::abs(r.stats.avg_version_size - 11.0 / 3.0) < 1e-9, "average size");
  expect(r.stats.first_timestamp_unix_ms < r.stats.last_timestamp_unix_ms, "timestamp span");

  const auto missing = history.statistics("ghost");
  expect(!missing.ok && missing.error == verso::ErrorCode::not_found, "unknown document not_found");
}

// ============================================================================
// Rollback
// ============================================================================

void test_rollback_round_trip() {
  auto store = std::make_shared<verso::MemoryVersionStore>();
  const auto v1 = store->create_version("doc", "first\ntext", "alice", std::nullopt).version;
  store->create_version("doc", "second", "bob", std::nullopt);

  std::vector<std::pair<std::string, std::string>> notified;
  verso::RollbackCoordinator coordinator(
      store, 3, [&](const std::string& doc, const std::string& id) { notified.emplace_back(doc, id); });
  const auto r = coordinator.rollback("doc", v1.id, "carol");
  expect(r.ok, "rollback succeeds");
  expect(r.version.id == "v0000000003", "rollback appends a new version");
  expect(r.version.content == v1.content, "content equals the target");
  expect(r.version.author == "carol", "rollback author recorded");
  expect(r.version.message && *r.version.message == verso::rollback_message(v1), "auto message");
  expect(notified.size() == 1 && notified[0].first == "doc" && notified[0].second == r.version.id,
         "change sink notified once with the new id");

  verso::HistoryQuery history(store);
  expect(!history.compare("doc", v1.id, verso::kCurrentVersion).comparison.changed,
         "target and new head compare equal");
  expect(store->list_versions("doc").page.versions.size() == 3, "history only grows");
}

void test_rollback_message_format() {
  verso::FileVersion v;
  v.id = "v0000000002";
  v.timestamp_unix_ms = 1700000000123ULL;
  expect(verso::format_iso8601_utc(1700000000123ULL) == "2023-11-14T22:13:20.123Z", "ISO-8601 UTC");
  expect(verso::rollback_message(v) == "Rolled back to version v0000000002 created at 2023-11-14T22:13:20.123Z",
         "rollback message");
}

void test_rollback_not_found() {
  auto store = std::make_shared<verso::MemoryVersionStore>();
  store->create_version("doc", "x", "alice", std::nullopt);
  bool notified = false;
  verso::RollbackCoordinator coordinator(store, 3,
                                         [&](const std::string&, const std::string&) { notified = true; });
  const auto r = coordinator.rollback("doc", "v0000000005", "alice");
  expect(!r.ok && r.error == verso::ErrorCode::not_found, "unknown target not_found");
  expect(!notified, "no notification on failure");
  const auto by_number = coordinator.rollback_to_number("doc", 0, "alice");
  expect(!by_number.ok && by_number.error == verso::ErrorCode::invalid_input, "version number 0 rejected");
  expect(coordinator.rollback_to_number("doc", 1, "alice").ok, "rollback by number");
}

void test_rollback_survives_throwing_sink() {
  auto store = std::make_shared<verso::MemoryVersionStore>();
  store->create_version("doc", "one", "alice", std::nullopt);
  store->create_version("doc", "two", "alice", std::nullopt);

  verso::RollbackCoordinator coordinator(store, 3,
                                         [](const std::string&, const std::string&) { throw 42; });
  const auto r = coordinator.rollback("doc", "v0000000001", "bob");
  expect(r.ok && r.version.id == "v0000000003", "non-standard throw does not fail the rollback");

  coordinator.set_sink([](const std::string&, const std::string&) {
    throw std::runtime_error("sink offline");
  });
  const auto again = coordinator.rollback("doc", "v0000000002", "bob");
  expect(again.ok && again.version.id == "v0000000004", "std exception does not fail the rollback");
  expect(store->head("doc").version.id == "v0000000004", "both rollbacks committed");
}

// Delegating store that lets another writer slip in before each of the
// first `races` optimistic creates.
class RacingStore : public verso::IVersionStore {
 public:
  RacingStore(std::shared_ptr<verso::IVersionStore> inner, int races)
      : inner_(std::move(inner)), races_(races) {}

  verso::VersionResult create_version(const std::string& doc, const std::string& content,
                                      const std::string& author, const std::optional<std::string>& message,
                                      const std::optional<std::string>& expected_head) override {
    if (expected_head && races_ > 0) {
      --races_;
      inner_->create_version(doc, "interloper", "mallory", std::nullopt);
    }
    return inner_->create_version(doc, content, author, message, expected_head);
  }
  verso::PageResult list_versions(const std::string& doc, const std::string& cursor, uint32_t limit) override {
    return inner_->list_versions(doc, cursor, limit);
  }
  verso::VersionResult get_version(const std::string& doc, const std::string& id) override {
    return inner_->get_version(doc, id);
  }
  verso::VersionResult head(const std::string& doc) override { return inner_->head(doc); }
  std::vector<std::string> list_documents() override { return inner_->list_documents(); }
  std::string backend_id() const override { return "racing"; }

 private:
  std::shared_ptr<verso::IVersionStore> inner_;
  int races_;
};

void test_rollback_retries_on_conflict() {
  auto inner = std::make_shared<verso::MemoryVersionStore>();
  inner->create_version("doc", "base", "alice", std::nullopt);
  inner->create_version("doc", "edit", "alice", std::nullopt);

  verso::RollbackCoordinator patient(std::make_shared<RacingStore>(inner, 2), 3);
  const auto ok = patient.rollback("doc", "v0000000001", "alice");
  expect(ok.ok && ok.version.content == "base", "rollback succeeds after two lost races");
  expect(ok.version.id == "v0000000005", "interlopers appended first");

  verso::RollbackCoordinator impatient(std::make_shared<RacingStore>(inner, 5), 2);
  const auto lost = impatient.rollback("doc", "v0000000001", "alice");
  expect(!lost.ok && lost.error == verso::ErrorCode::concurrency_conflict, "bounded retries give up");
}

// ============================================================================
// Configuration
// ============================================================================

void test_config_validation() {
  const auto good = verso::validate_config(
      R"({"config_version":"1","store":{"backend":"fs","root":"/tmp/x"},"diff":{"max_lines":10}})");
  expect(good.ok && good.errors.empty(), "valid config accepted");

  const auto bad = verso::validate_config(R"({"store":{"backend":"s3"},"diff":{"max_lines":0}})");
  expect(!bad.ok && bad.errors.size() == 2, "bad backend and zero max_lines reported");

  const auto unbounded = verso::validate_config(R"({"diff":{"max_edit_distance":0}})");
  expect(!unbounded.ok && unbounded.errors.size() == 1, "zero edit distance bound rejected");

  const auto warn = verso::validate_config(R"({"colour":"blue"})");
  expect(warn.ok && warn.warnings.size() == 1, "unknown key is a warning");

  const auto broken = verso::validate_config("{not json");
  expect(!broken.ok, "malformed JSON rejected");
}

void test_config_parse_and_env() {
  verso::EngineConfig cfg;
  std::string error;
  expect(verso::parse_config(R"({"concurrency":{"lock_attempts":9},"pagination":{"default_limit":5}})",
                             &cfg, &error),
         "parse succeeds");
  expect(cfg.store.lock_attempts == 9 && cfg.store.default_page_limit == 5, "values applied");

  verso::EngineConfig untouched;
  expect(!verso::parse_config(R"({"store":{"compression":"lz4"}})", &untouched, &error), "bad value fails");
  expect(untouched.store.compression == "off" && !error.empty(), "failed parse leaves config alone");

  setenv("VERSO_MAX_DIFF_LINES", "123", 1);
  setenv("VERSO_BACKEND", "fs", 1);
  setenv("VERSO_MAX_EDIT_DISTANCE", "0", 1);
  verso::apply_env_overrides(&cfg);
  unsetenv("VERSO_MAX_DIFF_LINES");
  unsetenv("VERSO_BACKEND");
  unsetenv("VERSO_MAX_EDIT_DISTANCE");
  expect(cfg.diff.max_lines == 123 && cfg.store.backend == "fs", "environment overrides applied");
  expect(cfg.diff.max_edit_distance == verso::kDefaultMaxEditDistance, "zero edit distance override ignored");

  const auto echoed = verso::validate_config(verso::config_to_json(cfg));
  expect(echoed.ok, "config_to_json output validates");

  verso::EngineConfig memory_cfg;
  auto store = verso::make_store(memory_cfg);
  expect(store && store->backend_id() == "memory", "default backend is memory");
  memory_cfg.store.backend = "tape";
  expect(!verso::make_store(memory_cfg), "unknown backend yields nullptr");
}

void test_load_config_missing_file() {
  verso::EngineConfig cfg;
  std::string error;
  expect(verso::load_config("/nonexistent/verso.json", &cfg, &error), "missing file keeps defaults");
  expect(cfg.diff.max_edit_distance == 2000, "default edit distance bound");
}

// ============================================================================
// JSON and wire shapes
// ============================================================================

void test_jsonlite_parse() {
  std::optional<verso::jsonlite::JsonError> err;
  const auto obj = verso::jsonlite::parse(R"({"a":"caf\u00e9","b":[1,2],"c":{"d":true}})", &err);
  expect(!err, "parse ok");
  expect(verso::jsonlite::get_string(obj, "a") == "caf\xC3\xA9", "unicode escape decoded");
  const auto* c = verso::jsonlite::get_object(obj, "c");
  expect(c && verso::jsonlite::get_bool(*c, "d"), "nested object");

  verso::jsonlite::parse(R"({"a":1,"a":2})", &err);
  expect(err && err->code == "json_duplicate_key", "duplicate keys rejected");
  expect(verso::jsonlite::escape("a\"b\n\x01") == "a\\\"b\\n\\u0001", "escaping");
}

void test_wire_shapes() {
  const auto cmp = verso::report(verso::diff({"A", "B", "C"}, {"A", "X", "C"}));
  const std::string json = verso::comparison_to_json(cmp);
  expect(json.find("\"modifications\":1") != std::string::npos, "modification count");
  expect(json.find("\"type\":\"modify\"") != std::string::npos, "modify entry type");
  expect(json.find("\"oldContent\":\"B\"") != std::string::npos, "old content on modify");
  expect(json.find("\"oldContent\":null") != std::string::npos, "null old content elsewhere");
  expect(!verso::jsonlite::validate_strict(json), "comparison JSON is valid");

  verso::FileVersion v;
  v.id = "v0000000001";
  v.document_id = "doc";
  v.content = "hi";
  v.author = "alice";
  const std::string vj = verso::version_to_json(v);
  expect(vj.find("\"message\":null") != std::string::npos, "absent message is null");
  expect(vj.find("\"documentId\":\"doc\"") != std::string::npos, "camelCase keys");
  expect(verso::version_to_json(v, false).find("\"content\"") == std::string::npos, "listing omits content");

  const auto del = verso::diff({"A", "B"}, {"A"});
  expect(verso::diff_entry_to_json(del[1]).find("\"type\":\"delete\"") != std::string::npos, "delete wire name");
  expect(verso::error_to_json(verso::ErrorCode::not_found, "x") == R"({"error":"not_found","message":"x"})",
         "error shape");
}

void test_version_ids() {
  expect(verso::format_version_id(42) == "v0000000042", "zero padded id");
  expect(verso::parse_version_id("v0000000042") == 42, "id parses back");
  expect(verso::parse_version_id("42") == 0 && verso::parse_version_id("v12") == 0, "malformed ids rejected");
  expect(verso::version::journal_format_supported(verso::version::JOURNAL_FORMAT_VERSION), "own format readable");
  expect(!verso::version::journal_format_supported(verso::version::JOURNAL_FORMAT_VERSION + 1),
         "newer format refused");
}

// ============================================================================
// Observability
// ============================================================================

std::atomic<int> g_hook_creates{0};
std::atomic<int> g_hook_compares{0};
std::atomic<int> g_hook_rollbacks{0};

void counting_hook(const verso::EngineEvent& ev) {
  switch (ev.kind) {
    case verso::EventKind::create:   g_hook_creates.fetch_add(1); break;
    case verso::EventKind::compare:  g_hook_compares.fetch_add(1); break;
    case verso::EventKind::rollback: g_hook_rollbacks.fetch_add(1); break;
  }
}

void test_event_hook_and_stats() {
  auto& stats = verso::global_engine_stats();
  const uint64_t created_before = stats.versions_created.load();
  const uint64_t conflicts_before = stats.conflicts.load();

  verso::set_engine_event_hook(&counting_hook);
  auto store = std::make_shared<verso::MemoryVersionStore>();
  store->create_version("doc", "a", "alice", std::nullopt);
  store->create_version("doc", "b", "alice", std::nullopt, std::string("v0000000009"));
  verso::HistoryQuery(store).compare("doc", "v0000000001", verso::kCurrentVersion);
  verso::RollbackCoordinator(store).rollback("doc", "v0000000001", "alice");
  verso::set_engine_event_hook(nullptr);

  // The rollback performs one create of its own.
  expect(g_hook_creates.load() == 3, "create events (one failed, one from rollback)");
  expect(g_hook_compares.load() == 1, "compare event");
  expect(g_hook_rollbacks.load() == 1, "rollback event");
  expect(stats.versions_created.load() == created_before + 2, "successful creates counted");
  expect(stats.conflicts.load() == conflicts_before + 1, "conflict categorised");
  expect(!verso::jsonlite::validate_strict(stats.to_json()), "stats JSON is valid");
}

void test_latency_histogram() {
  verso::LatencyHistogram h;
  expect(h.percentile(0.5) == 0.0, "empty histogram");
  for (int i = 0; i < 100; ++i) h.record(3000);  // 3us lands in [2us, 4us)
  expect(h.count() == 100, "count");
  expect(h.percentile(0.5) == 3.0, "bucket midpoint");
  expect(!verso::jsonlite::validate_strict(h.to_json()), "histogram JSON is valid");
}

}  // namespace

int main() {
  std::cout << "=== Verso Test Suite ===\n";

  std::cout << "\n[Hashing]\n";
  run_test("BLAKE3 known vectors", test_blake3_known_vectors);
  run_test("domain separation", test_domain_separation);

  std::cout << "\n[Text helpers]\n";
  run_test("split lines", test_split_lines);
  run_test("normalize line endings", test_normalize_line_endings);

  std::cout << "\n[Diff engine]\n";
  run_test("modify in the middle", test_scenario_modify_middle);
  run_test("empty old side", test_scenario_empty_old);
  run_test("empty new side", test_scenario_empty_new);
  run_test("identical inputs", test_scenario_identical);
  run_test("hunk collapse", test_hunk_collapse);
  run_test("leading run preferred", test_leading_run_preferred);
  run_test("self compare idempotence", test_self_compare_idempotence);
  run_test("partition invariant (500 pairs)", test_partition_invariant);
  run_test("count conservation under swap (500 pairs)", test_count_conservation_under_swap);
  run_test("minimality against LCS (500 pairs)", test_minimality_against_lcs);
  run_test("bounded diff truncates", test_bounded_diff_truncates);

  std::cout << "\n[Comparison reporter]\n";
  run_test("coarse over line ceiling", test_coarse_over_line_ceiling);
  run_test("coarse over byte ceiling", test_coarse_over_byte_ceiling);
  run_test("coarse over edit distance", test_coarse_over_edit_distance);
  run_test("zero edit distance uses default bound", test_zero_edit_distance_uses_default_bound);
  run_test("side-by-side placeholders", test_side_by_side_placeholders);
  run_test("unified rendering", test_render_unified);

  std::cout << "\n[Memory store]\n";
  run_test("create and get", test_create_and_get);
  run_test("invalid input rejected", test_invalid_input_rejected);
  run_test("monotonic history", test_monotonic_history);
  run_test("optimistic conflict", test_optimistic_conflict);
  run_test("pagination", test_pagination);
  run_test("concurrent creates (4x50)", test_concurrent_creates);
  run_test("documents isolated", test_documents_isolated);

  std::cout << "\n[File store]\n";
  run_test("persistence across reopen", test_fs_persistence_across_reopen);
  run_test("blob dedup", test_fs_blob_dedup);
  run_test("journal tamper detected", test_fs_journal_tamper_detected);
  run_test("blob tamper detected", test_fs_blob_tamper_detected);
  run_test("corrupt blob repaired on put", test_blob_put_repairs_corrupt_object);
  run_test("journal replay rules", test_journal_replay_rules);
  run_test("concurrent creates (2x10)", test_fs_concurrent_creates);

  std::cout << "\n[History]\n";
  run_test("compare with current", test_compare_with_current);
  run_test("compare trailing newline", test_compare_trailing_newline);
  run_test("compare with draft", test_compare_with_draft);
  run_test("coarse compare", test_compare_coarse_through_history);
  run_test("statistics", test_statistics);

  std::cout << "\n[Rollback]\n";
  run_test("round trip", test_rollback_round_trip);
  run_test("message format", test_rollback_message_format);
  run_test("not found", test_rollback_not_found);
  run_test("throwing sink", test_rollback_survives_throwing_sink);
  run_test("retries on conflict", test_rollback_retries_on_conflict);

  std::cout << "\n[Configuration]\n";
  run_test("validation", test_config_validation);
  run_test("parse and environment", test_config_parse_and_env);
  run_test("missing file", test_load_config_missing_file);

  std::cout << "\n[JSON]\n";
  run_test("jsonlite parse", test_jsonlite_parse);
  run_test("wire shapes", test_wire_shapes);
  run_test("version ids", test_version_ids);

  std::cout << "\n[Observability]\n";
  run_test("event hook and stats", test_event_hook_and_stats);
  run_test("latency histogram", test_latency_histogram);

  std::cout << "\n=== " << g_tests_passed << "/" << g_tests_run << " tests passed ===\n";
  return 0;
}
