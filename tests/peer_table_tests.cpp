#include "unit_tests.hpp"

#include "peer_table.hpp"

namespace lansync::test {
namespace {

using namespace std::chrono_literals;
using Clock = PeerTable::Clock;

const std::string kSelf = "0123456789abcdef0123456789abcdef";
const std::string kOther = "fedcba9876543210fedcba9876543210";

PeerAddress addr(const std::string& host, uint16_t port) {
  PeerAddress a;
  a.host = host;
  a.port = port;
  return a;
}

bool test_announcement_makes_peer_alive(TestContext& ctx) {
  auto logger = std::make_shared<Logger>("peers");
  ctx.logs.attach(logger);
  PeerTable table(kSelf, 15s, 60s, logger);
  auto t0 = Clock::now();

  table.record_announcement(addr("10.0.0.2", 5005), kOther, t0);
  auto alive = table.snapshot_alive_peers();
  bool ok = expect(ctx, alive.size() == 1, "one alive peer");
  ok &= expect(ctx, !alive.empty() && alive[0] == addr("10.0.0.2", 5005), "alive address");
  ok &= expect(ctx, table.known_count() == 1 && table.alive_count() == 1, "counts");
  ok &= expect(ctx, ctx.logs.contains("Discovered peer 10.0.0.2:5005"), "discovery logged");
  return ok;
}

bool test_expiry_then_removal(TestContext& ctx) {
  PeerTable table(kSelf, 15s, 60s);
  auto t0 = Clock::now();
  table.record_announcement(addr("10.0.0.2", 5005), kOther, t0);

  bool ok = expect(ctx, table.sweep_expired(t0 + 15s) == 0, "exactly at the window stays alive");
  ok &= expect(ctx, table.snapshot_alive_peers().size() == 1, "still alive at 15s");

  ok &= expect(ctx, table.sweep_expired(t0 + 16s) == 1, "expired after 16s");
  ok &= expect(ctx, table.snapshot_alive_peers().empty(), "excluded once not-alive");
  ok &= expect(ctx, table.known_count() == 1, "not-alive record retained");

  ok &= expect(ctx, table.sweep_expired(t0 + 16s + 60s) == 0, "kept through the removal window");
  ok &= expect(ctx, table.sweep_expired(t0 + 16s + 61s) == 1, "removed after the window");
  ok &= expect(ctx, table.known_count() == 0, "record gone");
  return ok;
}

bool test_refresh_revives_peer(TestContext& ctx) {
  PeerTable table(kSelf, 15s, 60s);
  auto t0 = Clock::now();
  table.record_announcement(addr("10.0.0.2", 5005), kOther, t0);
  table.sweep_expired(t0 + 20s);
  bool ok = expect(ctx, table.alive_count() == 0, "expired");

  table.record_announcement(addr("10.0.0.2", 5005), kOther, t0 + 21s);
  ok &= expect(ctx, table.alive_count() == 1, "alive again after a fresh announcement");
  ok &= expect(ctx, table.sweep_expired(t0 + 30s) == 0, "refresh restarted the expiry window");
  return ok;
}

bool test_self_is_excluded(TestContext& ctx) {
  PeerTable table(kSelf, 15s, 60s);
  table.set_local_address(addr("10.0.0.1", 5005));
  auto t0 = Clock::now();

  table.record_announcement(addr("10.0.0.9", 7000), kSelf, t0);
  table.record_announcement(addr("10.0.0.1", 5005), t0);
  table.record_announcement(addr("10.0.0.1", 5006), kOther, t0);

  auto alive = table.snapshot_alive_peers();
  bool ok = expect(ctx, alive.size() == 1, "only the foreign peer is alive");
  ok &= expect(ctx, !alive.empty() && alive[0] == addr("10.0.0.1", 5006), "same host, other port is a peer");
  ok &= expect(ctx, table.known_count() == 1, "self records are not counted");
  return ok;
}

bool test_token_change_is_tracked(TestContext& ctx) {
  PeerTable table(kSelf, 15s, 60s);
  auto t0 = Clock::now();
  table.record_announcement(addr("10.0.0.2", 5005), kOther, t0);
  const std::string restarted = "aaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaa";
  table.record_announcement(addr("10.0.0.2", 5005), restarted, t0 + 1s);

  auto records = table.records();
  bool ok = expect(ctx, records.size() == 1, "one record per address");
  ok &= expect(ctx, !records.empty() && records[0].token == restarted, "token follows the latest announcement");
  return ok;
}

} // namespace

std::vector<TestCase> peer_table_tests() {
  return {
    {"peer_table_announcement_makes_peer_alive", test_announcement_makes_peer_alive},
    {"peer_table_expiry_then_removal", test_expiry_then_removal},
    {"peer_table_refresh_revives_peer", test_refresh_revives_peer},
    {"peer_table_self_is_excluded", test_self_is_excluded},
    {"peer_table_token_change_is_tracked", test_token_change_is_tracked},
  };
}

} // namespace lansync::test
