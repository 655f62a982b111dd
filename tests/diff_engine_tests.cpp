#include "unit_tests.hpp"

#include "diff_engine.hpp"

namespace lansync::test {
namespace {

FileEntry entry(const std::string& path, const std::string& content, int64_t mtime) {
  FileEntry e;
  e.relative_path = path;
  e.size = content.size();
  e.content_hash = sha256_hex(content);
  e.modified_at = mtime;
  return e;
}

Catalog catalog(std::initializer_list<FileEntry> entries) {
  Catalog c;
  for(const auto& e : entries) c.entries.emplace(e.relative_path, e);
  return c;
}

bool mirrored(const std::vector<TransferIntent>& ab, const std::vector<TransferIntent>& ba) {
  if(ab.size() != ba.size()) return false;
  for(std::size_t i = 0; i < ab.size(); ++i) {
    if(ab[i].relative_path != ba[i].relative_path) return false;
    if(ab[i].reason != ba[i].reason) return false;
    if(ab[i].direction == ba[i].direction) return false;
  }
  return true;
}

bool test_missing_both_ways(TestContext& ctx) {
  auto a = catalog({entry("only_a.txt", "a", 1000), entry("shared.txt", "s", 1000)});
  auto b = catalog({entry("only_b.txt", "b", 1000), entry("shared.txt", "s", 1000)});

  auto intents = diff(a, b);
  std::vector<TransferIntent> expected = {
    {"only_a.txt", TransferDirection::Push, TransferReason::Missing},
    {"only_b.txt", TransferDirection::Pull, TransferReason::Missing},
  };
  return expect(ctx, intents == expected, "one push and one pull, ordered by path");
}

bool test_identical_catalogs_are_quiet(TestContext& ctx) {
  auto a = catalog({entry("x.txt", "x", 1000), entry("dir/y.bin", "yy", 2000)});
  bool ok = expect(ctx, diff(a, a).empty(), "diff(a, a) is empty");

  // Same content with a different mtime needs no transfer either.
  auto b = catalog({entry("x.txt", "x", 9999), entry("dir/y.bin", "yy", 2000)});
  ok &= expect(ctx, diff(a, b).empty(), "equal hashes never transfer");
  return ok;
}

bool test_newer_wins(TestContext& ctx) {
  auto a = catalog({entry("doc.txt", "old", 1000)});
  auto b = catalog({entry("doc.txt", "new", 2000)});

  auto ab = diff(a, b);
  bool ok = expect(ctx, ab.size() == 1 && ab[0].direction == TransferDirection::Pull &&
                        ab[0].reason == TransferReason::ConflictNewerWins, "older side pulls");
  auto ba = diff(b, a);
  ok &= expect(ctx, ba.size() == 1 && ba[0].direction == TransferDirection::Push, "newer side pushes");
  return ok;
}

bool test_equal_mtime_tie_break_is_symmetric(TestContext& ctx) {
  auto x = entry("tie.txt", "left", 5000);
  auto y = entry("tie.txt", "right", 5000);
  auto a = catalog({x});
  auto b = catalog({y});

  auto ab = diff(a, b);
  auto ba = diff(b, a);
  bool ok = expect(ctx, ab.size() == 1 && ba.size() == 1, "exactly one intent each way");
  ok &= expect(ctx, mirrored(ab, ba), "both peers agree on the winner");

  bool a_holds_greater = x.content_hash > y.content_hash;
  auto want = a_holds_greater ? TransferDirection::Push : TransferDirection::Pull;
  ok &= expect(ctx, !ab.empty() && ab[0].direction == want, "greater hash wins");
  ok &= expect(ctx, pick_winner(x, y) == (a_holds_greater ? Winner::Local : Winner::Remote), "pick_winner agrees");
  return ok;
}

bool test_symmetry_on_mixed_catalogs(TestContext& ctx) {
  auto a = catalog({
    entry("a/1.txt", "1", 10), entry("a/2.txt", "2", 20), entry("c.txt", "c-old", 30),
    entry("same.txt", "same", 40), entry("z.txt", "z", 50)
  });
  auto b = catalog({
    entry("a/2.txt", "2", 20), entry("b.txt", "b", 15), entry("c.txt", "c-new", 31),
    entry("same.txt", "same", 41)
  });
  auto ab = diff(a, b);
  auto ba = diff(b, a);
  bool ok = expect(ctx, mirrored(ab, ba), "PUSH in one direction is PULL in the other");
  ok &= expect(ctx, ab.size() == 4, "a/1, b, c, z differ");
  ok &= expect(ctx, std::is_sorted(ab.begin(), ab.end(),
    [](const TransferIntent& l, const TransferIntent& r){ return l.relative_path < r.relative_path; }),
    "ordered by relative path");
  return ok;
}

bool test_reason_names(TestContext& ctx) {
  bool ok = expect(ctx, std::string(to_string(TransferReason::Missing)) == "MISSING", "MISSING");
  ok &= expect(ctx, std::string(to_string(TransferReason::Stale)) == "STALE", "STALE");
  ok &= expect(ctx, std::string(to_string(TransferReason::ConflictNewerWins)) == "CONFLICT_NEWER_WINS", "conflict");
  ok &= expect(ctx, std::string(to_string(TransferDirection::Push)) == "PUSH", "PUSH");
  return ok;
}

} // namespace

std::vector<TestCase> diff_engine_tests() {
  return {
    {"diff_missing_both_ways", test_missing_both_ways},
    {"diff_identical_catalogs_are_quiet", test_identical_catalogs_are_quiet},
    {"diff_newer_wins", test_newer_wins},
    {"diff_equal_mtime_tie_break_is_symmetric", test_equal_mtime_tie_break_is_symmetric},
    {"diff_symmetry_on_mixed_catalogs", test_symmetry_on_mixed_catalogs},
    {"diff_reason_names", test_reason_names},
  };
}

} // namespace lansync::test
