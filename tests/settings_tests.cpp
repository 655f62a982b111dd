#include "unit_tests.hpp"

#include "command_line_parser.hpp"
#include "node_config.hpp"
#include "settings_manager.hpp"

namespace lansync::test {
namespace {

namespace fs = std::filesystem;

bool parse(SettingsManager& settings, std::vector<const char*> args, std::string& error) {
  args.insert(args.begin(), "lansync");
  CommandLineParser parser("lansync");
  return parser.parse(static_cast<int>(args.size()), args.data(), settings, error);
}

bool test_defaults(TestContext& ctx) {
  SettingsManager settings;
  auto config = NodeConfig::from_settings(settings, "/work");
  bool ok = expect(ctx, config.share_root == fs::path("/work/share"), "share under workspace");
  ok &= expect(ctx, config.listen_port == 5005, "listen port");
  ok &= expect(ctx, config.multicast_group == "239.255.255.250" && config.multicast_port == 5007, "group");
  ok &= expect(ctx, config.announce_interval == std::chrono::milliseconds(5000), "announce interval");
  ok &= expect(ctx, config.expiry_window == std::chrono::milliseconds(15000), "expiry is 3x announce");
  ok &= expect(ctx, config.removal_window == std::chrono::milliseconds(60000), "removal window");
  ok &= expect(ctx, config.sync_interval == std::chrono::milliseconds(30000), "sync interval");
  ok &= expect(ctx, config.chunk_size == 65536, "chunk size");
  return ok;
}

bool test_positional_and_options(TestContext& ctx) {
  SettingsManager settings;
  std::string error;
  bool ok = expect(ctx, parse(settings, {"/data/shared", "6000", "--announce=1000", "-v", "--chunk_size", "4096"}, error),
                   "parses: " + error);
  ok &= expect(ctx, settings.get<std::string>("share_dir") == "/data/shared", "positional share dir");
  ok &= expect(ctx, settings.get<int>("listen_port") == 6000, "positional port");
  ok &= expect(ctx, settings.get<int>("announce_interval_ms") == 1000, "alias with inline value");
  ok &= expect(ctx, settings.get<bool>("verbose"), "bare bool flag");
  ok &= expect(ctx, settings.get<int>("chunk_size") == 4096, "long option with separate value");

  auto config = NodeConfig::from_settings(settings, "/work");
  ok &= expect(ctx, config.share_root == fs::path("/data/shared"), "absolute share dir kept");
  ok &= expect(ctx, config.expiry_window == std::chrono::milliseconds(3000), "expiry follows announce");
  return ok;
}

bool test_rejections(TestContext& ctx) {
  std::string error;
  bool ok = true;
  {
    SettingsManager s;
    ok &= expect(ctx, !parse(s, {"--listen_port", "70000"}, error) && !error.empty(), "port above range");
  }
  {
    SettingsManager s;
    ok &= expect(ctx, !parse(s, {"--chunk_size", "12"}, error), "chunk size below minimum");
  }
  {
    SettingsManager s;
    ok &= expect(ctx, !parse(s, {"--no_such_option", "1"}, error), "unknown option");
  }
  {
    SettingsManager s;
    ok &= expect(ctx, !parse(s, {"--listen_port"}, error), "missing value");
  }
  {
    SettingsManager s;
    ok &= expect(ctx, !parse(s, {"a", "5005", "extra"}, error), "too many positionals");
  }
  {
    SettingsManager s;
    ok &= expect(ctx, !parse(s, {"--listen_port", "abc"}, error), "non-numeric port");
  }
  {
    SettingsManager s;
    std::string set_error;
    ok &= expect(ctx, s.set_from_string("multicast_group", "not-an-address", set_error),
                 "strings are stored unchecked");
    bool threw = false;
    try {
      NodeConfig::from_settings(s, "/work");
    } catch(const std::invalid_argument&) {
      threw = true;
    }
    ok &= expect(ctx, threw, "unparseable group throws");
  }
  return ok;
}

bool test_persisted_settings(TestContext& ctx) {
  TempDir dir("settings_persist");
  const auto file = dir / ".config/settings.json";

  SettingsManager first;
  first.set_settings_path(file);
  std::string error;
  bool ok = expect(ctx, parse(first, {"--listen_port", "7100", "--save"}, error), "parses: " + error);
  ok &= expect(ctx, first.save(), "saved");

  auto stored = read_file(file);
  ok &= expect(ctx, stored.has_value(), "file written");
  if(stored) {
    auto doc = nlohmann::json::parse(*stored, nullptr, false);
    ok &= expect(ctx, !doc.is_discarded() && doc.value("listen_port", 0) == 7100, "value persisted");
    ok &= expect(ctx, !doc.contains("save") && !doc.contains("help"), "actions are not persisted");
  }

  SettingsManager second;
  second.set_settings_path(file);
  ok &= expect(ctx, second.load(), "loaded");
  ok &= expect(ctx, second.get<int>("listen_port") == 7100, "value restored");
  return ok;
}

} // namespace

std::vector<TestCase> settings_tests() {
  return {
    {"settings_defaults", test_defaults},
    {"settings_positional_and_options", test_positional_and_options},
    {"settings_rejections", test_rejections},
    {"settings_persisted_settings", test_persisted_settings},
  };
}

} // namespace lansync::test
