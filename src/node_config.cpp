#include "node_config.hpp"

#include <asio.hpp>

#include <stdexcept>

#include "settings_manager.hpp"

namespace {

asio::ip::address parse_address(const std::string& key, const std::string& value) {
  std::error_code ec;
  auto address = asio::ip::make_address(value, ec);
  if(ec) {
    throw std::invalid_argument("Invalid " + key + " '" + value + "': " + ec.message());
  }
  return address;
}

} // namespace

NodeConfig NodeConfig::from_settings(const SettingsManager& settings,
                                     const std::filesystem::path& workspace_root) {
  NodeConfig config;

  std::filesystem::path share = settings.get<std::string>("share_dir");
  if(share.empty()) {
    throw std::invalid_argument("share_dir must not be empty");
  }
  config.share_root = share.is_absolute() ? share : workspace_root / share;
  config.share_root = config.share_root.lexically_normal();

  config.listen_ip = settings.get<std::string>("listen_ip");
  parse_address("listen_ip", config.listen_ip);
  config.listen_port = static_cast<uint16_t>(settings.get<int>("listen_port"));

  config.multicast_group = settings.get<std::string>("multicast_group");
  auto group = parse_address("multicast_group", config.multicast_group);
  if(!group.is_v4()) {
    throw std::invalid_argument("multicast_group must be an IPv4 address");
  }
  config.multicast_port = static_cast<uint16_t>(settings.get<int>("multicast_port"));
  config.multicast_ttl = settings.get<int>("multicast_ttl");
  config.multicast_loopback = settings.get<bool>("multicast_loopback");

  config.announce_interval = std::chrono::milliseconds(settings.get<int>("announce_interval_ms"));
  int expiry = settings.get<int>("expiry_window_ms");
  config.expiry_window = expiry > 0
    ? std::chrono::milliseconds(expiry)
    : config.announce_interval * 3;
  config.removal_window = std::chrono::milliseconds(settings.get<int>("removal_window_ms"));
  config.sync_interval = std::chrono::milliseconds(settings.get<int>("sync_interval_ms"));
  config.chunk_size = static_cast<std::size_t>(settings.get<int>("chunk_size"));
  config.io_timeout = std::chrono::milliseconds(settings.get<int>("io_timeout_ms"));
  config.catalog_cache = std::chrono::milliseconds(settings.get<int>("catalog_cache_ms"));
  config.transfer_log_size = static_cast<std::size_t>(settings.get<int>("transfer_log_size"));
  config.verbose = settings.get<bool>("verbose");
  return config;
}
